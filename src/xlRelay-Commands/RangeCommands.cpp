#include <xlrelay/Commands.h>
#include <xlrelay/Arguments.h>

using nlohmann::json;

namespace xlrelay
{
  namespace Commands
  {
    void registerRangeCommands(CommandDispatcher& dispatcher)
    {
      dispatcher.add("range.get-values", [](Workbook& workbook, const json& args) -> json
      {
        auto sheet = Args::requireString(args, "sheetName");
        auto address = Args::requireString(args, "rangeAddress");
        return {
          { "sheetName", sheet },
          { "rangeAddress", address },
          { "values", toJson(workbook.readRange(sheet, address)) }
        };
      }, CommandAccess::Read);

      dispatcher.add("range.set-values", [](Workbook& workbook, const json& args) -> json
      {
        auto sheet = Args::requireString(args, "sheetName");
        auto address = Args::requireString(args, "rangeAddress");
        auto values = toCellGrid(Args::requireArray(args, "values"), "values");
        workbook.writeRange(sheet, address, values);
        return { { "sheetName", sheet }, { "rangeAddress", address }, { "rows", values.size() } };
      });

      dispatcher.add("range.clear", [](Workbook& workbook, const json& args) -> json
      {
        auto sheet = Args::requireString(args, "sheetName");
        auto address = Args::requireString(args, "rangeAddress");
        workbook.clearRange(sheet, address);
        return { { "sheetName", sheet }, { "rangeAddress", address } };
      });
    }
  }
}
