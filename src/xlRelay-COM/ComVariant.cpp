#include "ComVariant.h"
#include <xlrelay/Errors.h>
#include <xlrelay/StringUtils.h>
#include <xlrelay/Throw.h>

namespace xlrelay
{
  namespace COM
  {
    namespace
    {
      const char* excelErrorString(SCODE scode)
      {
        // Excel error codes are 0x800A0000 + 2000 + offset
        switch (scode - 0x800A07D0)
        {
        case 0:  return "#NULL!";
        case 7:  return "#DIV/0!";
        case 15: return "#VALUE!";
        case 23: return "#REF!";
        case 29: return "#NAME?";
        case 36: return "#NUM!";
        case 42: return "#N/A";
        case 43: return "#GETTING_DATA";
        default: return "#ERR!";
        }
      }

      class SafeArrayAccessor
      {
      public:
        SafeArrayAccessor(SAFEARRAY* pArr)
          : _ptr(pArr)
          , dimensions(pArr->cDims)
          , cols(dimensions == 1 ? 1 : pArr->rgsabound[0].cElements)
          , rows(pArr->rgsabound[dimensions == 1 ? 0 : 1].cElements)
        {
          if (S_OK != SafeArrayAccessData(pArr, (void**)&_data))
            XLR_THROW_TYPE(AutomationError, "Failed to access SafeArray");
        }
        ~SafeArrayAccessor()
        {
          SafeArrayUnaccessData(_ptr);
        }
        /// Data is column-major
        const VARIANT& operator()(size_t i, size_t j) const
        {
          return _data[j * rows + i];
        }

      private:
        SAFEARRAY* _ptr;
        VARIANT* _data = nullptr;

      public:
        const size_t dimensions;
        const size_t cols;
        const size_t rows;
      };
    }

    CellValue variantToCell(const VARIANT& variant)
    {
      switch (variant.vt)
      {
      case VT_EMPTY:
      case VT_NULL:
        return CellValue();
      case VT_R8:
        return variant.dblVal;
      case VT_R4:
        return (double)variant.fltVal;
      case VT_I2:
        return (double)variant.iVal;
      case VT_I4:
        return (double)variant.lVal;
      case VT_I8:
        return (double)variant.llVal;
      case VT_CY:
        return variant.cyVal.int64 / 10000.0;
      case VT_DATE:
        return variant.date;
      case VT_BOOL:
        return variant.boolVal == VARIANT_TRUE;
      case VT_BSTR:
        return variant.bstrVal ? utf16ToUtf8(variant.bstrVal) : std::string();
      case VT_ERROR:
        return std::string(excelErrorString(variant.scode));
      default:
      {
        _variant_t asString;
        if (SUCCEEDED(VariantChangeType(&asString, &variant, 0, VT_BSTR)))
          return utf16ToUtf8(asString.bstrVal);
        XLR_THROW_TYPE(AutomationError, "Cannot convert VARIANT of type {}", variant.vt);
      }
      }
    }

    CellGrid variantToGrid(const VARIANT& variant)
    {
      if (!(variant.vt & VT_ARRAY))
        return CellGrid{ { variantToCell(variant) } };

      if ((variant.vt & VT_TYPEMASK) != VT_VARIANT)
        XLR_THROW_TYPE(AutomationError, "Expected an array of VARIANT, got type {}", variant.vt);

      SafeArrayAccessor array(variant.parray);
      if (array.dimensions > 2)
        XLR_THROW_TYPE(AutomationError, "Can only convert 1 or 2 dim arrays");

      CellGrid grid(array.rows);
      for (auto i = 0u; i < array.rows; ++i)
      {
        grid[i].reserve(array.cols);
        for (auto j = 0u; j < array.cols; ++j)
          grid[i].push_back(variantToCell(array(i, j)));
      }
      return grid;
    }

    namespace
    {
      struct ToVariant
      {
        _variant_t operator()(std::monostate) const { return _variant_t(); }
        _variant_t operator()(double x) const { return _variant_t(x); }
        _variant_t operator()(bool x) const { return _variant_t(x); }
        _variant_t operator()(const std::string& x) const 
        { 
          return _variant_t(utf8ToUtf16(x).c_str()); 
        }
      };
    }

    _variant_t cellToVariant(const CellValue& value)
    {
      return std::visit(ToVariant(), value);
    }

    size_t gridWidth(const CellGrid& grid) noexcept
    {
      size_t width = 0;
      for (auto& row : grid)
        width = std::max(width, row.size());
      return width;
    }

    _variant_t gridToVariant(const CellGrid& grid, size_t columns)
    {
      SAFEARRAYBOUND bounds[] = { { (ULONG)grid.size(), 1 }, { (ULONG)columns, 1 } };
      auto array = SafeArrayCreate(VT_VARIANT, 2, bounds);
      if (!array)
        XLR_THROW_TYPE(AutomationError, "Failed to create SafeArray of {} x {}", grid.size(), columns);

      for (auto i = 0u; i < grid.size(); ++i)
      {
        for (auto j = 0u; j < grid[i].size() && j < columns; ++j)
        {
          LONG index[] = { (LONG)i + 1, (LONG)j + 1 };
          auto value = cellToVariant(grid[i][j]);
          auto hr = SafeArrayPutElement(array, index, &value);
          if (FAILED(hr))
          {
            SafeArrayDestroy(array);
            XLR_THROW_TYPE(AutomationError, "Failed to write SafeArray element: {:#010x}", (unsigned long)hr);
          }
        }
      }

      VARIANT result;
      VariantInit(&result);
      result.vt = VT_ARRAY | VT_VARIANT;
      result.parray = array;
      return _variant_t(result, false);
    }
  }
}
