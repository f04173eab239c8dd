#pragma once
#include <xlrelay/CommandDispatch.h>
#include <xlrelay/Workbook.h>
#include <nlohmann/json.hpp>

namespace xlrelay
{
  /// <summary>
  /// Registers the workbook, sheet, range, table and calculation commands
  /// </summary>
  void registerBuiltinCommands(CommandDispatcher& dispatcher);

  namespace Commands
  {
    void registerWorkbookCommands(CommandDispatcher& dispatcher);
    void registerSheetCommands(CommandDispatcher& dispatcher);
    void registerRangeCommands(CommandDispatcher& dispatcher);
    void registerTableCommands(CommandDispatcher& dispatcher);
    void registerCalculationCommands(CommandDispatcher& dispatcher);
  }

  nlohmann::json toJson(const CellValue& value);
  nlohmann::json toJson(const std::vector<CellValue>& row);
  nlohmann::json toJson(const CellGrid& grid);

  /// <summary>
  /// Converts a JSON array of row arrays. Throws ArgumentError naming `what`
  /// if the shape is wrong or a cell is not a scalar.
  /// </summary>
  CellGrid toCellGrid(const nlohmann::json& rows, const char* what);
}
