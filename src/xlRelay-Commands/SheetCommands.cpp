#include <xlrelay/Commands.h>
#include <xlrelay/Arguments.h>

using nlohmann::json;

namespace xlrelay
{
  namespace Commands
  {
    void registerSheetCommands(CommandDispatcher& dispatcher)
    {
      dispatcher.add("sheet.list", [](Workbook& workbook, const json&) -> json
      {
        return { { "sheets", workbook.sheetNames() } };
      }, CommandAccess::Read);

      dispatcher.add("sheet.create", [](Workbook& workbook, const json& args) -> json
      {
        auto name = Args::requireString(args, "sheetName");
        workbook.addSheet(name);
        return { { "sheetName", name } };
      });

      dispatcher.add("sheet.delete", [](Workbook& workbook, const json& args) -> json
      {
        auto name = Args::requireString(args, "sheetName");
        workbook.deleteSheet(name);
        return { { "sheetName", name } };
      });
    }
  }
}
