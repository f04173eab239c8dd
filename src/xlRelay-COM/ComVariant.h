#pragma once
#include <xlrelay/Workbook.h>
#include <comdef.h>

namespace xlrelay
{
  namespace COM
  {
    /// <summary>
    /// Converts a scalar VARIANT. Excel errors become strings such as "#N/A",
    /// dates become their serial number.
    /// </summary>
    CellValue variantToCell(const VARIANT& variant);

    /// <summary>
    /// Converts a Range.Value2 result, which is a scalar for a single cell 
    /// or a 1-based two dimensional SAFEARRAY otherwise.
    /// </summary>
    CellGrid variantToGrid(const VARIANT& variant);

    _variant_t cellToVariant(const CellValue& value);

    /// <summary>
    /// Creates a 1-based rows x columns SAFEARRAY of VARIANT. Short rows are 
    /// padded with empty values.
    /// </summary>
    _variant_t gridToVariant(const CellGrid& grid, size_t columns);

    size_t gridWidth(const CellGrid& grid) noexcept;
  }
}
