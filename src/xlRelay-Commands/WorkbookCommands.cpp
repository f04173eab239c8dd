#include <xlrelay/Commands.h>
#include <xlrelay/Arguments.h>

using nlohmann::json;

namespace xlrelay
{
  void registerBuiltinCommands(CommandDispatcher& dispatcher)
  {
    Commands::registerWorkbookCommands(dispatcher);
    Commands::registerSheetCommands(dispatcher);
    Commands::registerRangeCommands(dispatcher);
    Commands::registerTableCommands(dispatcher);
    Commands::registerCalculationCommands(dispatcher);
  }

  namespace Commands
  {
    void registerWorkbookCommands(CommandDispatcher& dispatcher)
    {
      dispatcher.add("workbook.info", [](Workbook& workbook, const json&) -> json
      {
        return {
          { "filePath", workbook.path().string() },
          { "sheets", workbook.sheetNames() },
          { "tables", workbook.tableNames() }
        };
      }, CommandAccess::Read);
    }

    void registerCalculationCommands(CommandDispatcher& dispatcher)
    {
      dispatcher.add("calculation.calculate", [](Workbook& workbook, const json&) -> json
      {
        workbook.calculate();
        return { { "calculated", true } };
      });
    }
  }
}
