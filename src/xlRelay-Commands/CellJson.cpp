#include <xlrelay/Commands.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Throw.h>

using nlohmann::json;

namespace xlrelay
{
  namespace
  {
    struct ToJson
    {
      json operator()(std::monostate) const { return nullptr; }
      json operator()(double x) const { return x; }
      json operator()(bool x) const { return x; }
      json operator()(const std::string& x) const { return x; }
    };
  }

  json toJson(const CellValue& value)
  {
    return std::visit(ToJson(), value);
  }

  json toJson(const std::vector<CellValue>& row)
  {
    auto cells = json::array();
    for (auto& cell : row)
      cells.push_back(toJson(cell));
    return cells;
  }

  json toJson(const CellGrid& grid)
  {
    auto rows = json::array();
    for (auto& row : grid)
      rows.push_back(toJson(row));
    return rows;
  }

  CellGrid toCellGrid(const json& rows, const char* what)
  {
    if (!rows.is_array())
      XLR_THROW_TYPE(ArgumentError, "Argument '{}' must be an array of rows", what);

    CellGrid grid;
    grid.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i)
    {
      auto& row = rows[i];
      if (!row.is_array())
        XLR_THROW_TYPE(ArgumentError, "Argument '{}': row {} is not an array", what, i);

      auto& cells = grid.emplace_back();
      cells.reserve(row.size());
      for (auto& cell : row)
      {
        if (cell.is_null())
          cells.emplace_back(std::monostate());
        else if (cell.is_boolean())
          cells.emplace_back(cell.get<bool>());
        else if (cell.is_number())
          cells.emplace_back(cell.get<double>());
        else if (cell.is_string())
          cells.emplace_back(cell.get<std::string>());
        else
          XLR_THROW_TYPE(ArgumentError, 
            "Argument '{}': row {} contains a value which is not a number, string, boolean or null", what, i);
      }
    }
    return grid;
  }
}
