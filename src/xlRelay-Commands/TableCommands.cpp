#include <xlrelay/Commands.h>
#include <xlrelay/Arguments.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Throw.h>

using nlohmann::json;

namespace xlrelay
{
  namespace Commands
  {
    void registerTableCommands(CommandDispatcher& dispatcher)
    {
      dispatcher.add("table.list", [](Workbook& workbook, const json&) -> json
      {
        return { { "tables", workbook.tableNames() } };
      }, CommandAccess::Read);

      dispatcher.add("table.read", [](Workbook& workbook, const json& args) -> json
      {
        auto table = Args::requireString(args, "tableName");
        auto grid = workbook.readTable(table);
        json headers = json::array();
        if (!grid.empty())
        {
          headers = toJson(grid.front());
          grid.erase(grid.begin());
        }
        return { { "tableName", table }, { "headers", headers }, { "rows", toJson(grid) } };
      }, CommandAccess::Read);

      dispatcher.add("table.append", [](Workbook& workbook, const json& args) -> json
      {
        auto table = Args::requireString(args, "tableName");
        auto rows = toCellGrid(Args::requireArray(args, "rows"), "rows");
        if (rows.empty())
          XLR_THROW_TYPE(ArgumentError, "Argument 'rows' must contain at least one row");
        auto appended = workbook.appendTableRows(table, rows);
        return { { "tableName", table }, { "appendedRows", appended } };
      });
    }
  }
}
