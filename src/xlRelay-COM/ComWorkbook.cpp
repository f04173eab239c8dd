#include "ComWorkbook.h"
#include "ComVariant.h"
#include <xlrelay/ComDriver.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Log.h>
#include <xlrelay/StringUtils.h>
#include <xlrelay/Throw.h>

using std::string;
using std::vector;
using std::unique_ptr;
namespace fs = std::filesystem;

namespace xlrelay
{
  namespace COM
  {
    namespace
    {
      // XlFileFormat
      constexpr long xlOpenXMLWorkbook = 51;
      constexpr long xlOpenXMLWorkbookMacroEnabled = 52;

      // Excel's generic "application-defined or object-defined error" and
      // "document not saved". On open and save they mean the file is locked,
      // read-only or was changed by someone else.
      constexpr HRESULT theExcelObjectError = (HRESULT)0x800A03EC;
      constexpr HRESULT theExcelNotSaved = (HRESULT)0x800AC472;

      _variant_t toVariant(const string& str)
      {
        return _variant_t(utf8ToUtf16(str).c_str());
      }

      string toString(const _variant_t& value)
      {
        return value.vt == VT_BSTR && value.bstrVal ? utf16ToUtf8(value.bstrVal) : string();
      }

      long toLong(const _variant_t& value)
      {
        _variant_t converted;
        if (FAILED(VariantChangeType(&converted, &value, 0, VT_I4)))
          XLR_THROW_TYPE(AutomationError, "Expected an integer from Excel");
        return converted.lVal;
      }

      bool isFileConflict(HRESULT hr)
      {
        return hr == theExcelObjectError || hr == theExcelNotSaved;
      }

      template<class F>
      void forEachItem(const Dispatch& collection, F&& func)
      {
        const auto count = toLong(collection.get(L"Count"));
        for (long i = 1; i <= count; ++i)
          func(collection.getObject(L"Item", { _variant_t(i) }));
      }
    }

    ComWorkbook::ComWorkbook(const fs::path& path)
      : _path(path)
      , _app(newApplicationObject())
    {}

    ComWorkbook::~ComWorkbook()
    {
      try
      {
        close();
      }
      catch (const std::exception& e)
      {
        XLR_WARN("Error closing '{}': {}", _path.string(), e.what());
      }
    }

    unique_ptr<ComWorkbook> ComWorkbook::open(const fs::path& path)
    {
      unique_ptr<ComWorkbook> result(new ComWorkbook(path));
      try
      {
        auto workbooks = result->_app.getObject(L"Workbooks");
        result->_workbook = workbooks.getObject(L"Open", { toVariant(path.string()) });
      }
      catch (const ComCallError& e)
      {
        if (isFileConflict(e.hr))
          XLR_THROW_TYPE(SaveConflictError, 
            "Cannot open '{}': the file may be locked by another process or corrupt ({})",
            path.string(), e.what());
        throw;
      }
      XLR_DEBUG("Opened '{}' in Excel", path.string());
      return result;
    }

    unique_ptr<ComWorkbook> ComWorkbook::create(const fs::path& path, bool macroEnabled)
    {
      unique_ptr<ComWorkbook> result(new ComWorkbook(path));
      auto workbooks = result->_app.getObject(L"Workbooks");
      result->_workbook = workbooks.getObject(L"Add");
      try
      {
        result->_workbook.call(L"SaveAs", {
          toVariant(path.string()),
          _variant_t(macroEnabled ? xlOpenXMLWorkbookMacroEnabled : xlOpenXMLWorkbook)
        });
      }
      catch (const ComCallError& e)
      {
        XLR_THROW_TYPE(WorkbookIOError, "Cannot create '{}': {}", path.string(), e.what());
      }
      XLR_DEBUG("Created '{}' in Excel", path.string());
      return result;
    }

    bool ComWorkbook::isAlive() noexcept
    {
      _variant_t name;
      return isApplicationAlive(_app) && SUCCEEDED(_workbook.tryGet(L"Name", name));
    }

    void ComWorkbook::save()
    {
      try
      {
        _workbook.call(L"Save");
      }
      catch (const ComCallError& e)
      {
        if (isFileConflict(e.hr))
          XLR_THROW_TYPE(SaveConflictError,
            "Cannot save '{}': the file is locked, read-only or was modified by another process ({})",
            _path.string(), e.what());
        XLR_THROW_TYPE(WorkbookIOError, "Cannot save '{}': {}", _path.string(), e.what());
      }
    }

    void ComWorkbook::close()
    {
      if (_workbook.valid())
      {
        try
        {
          _workbook.call(L"Close", { _variant_t(false) });
        }
        catch (const std::exception& e)
        {
          XLR_WARN("Failed to close workbook '{}': {}", _path.string(), e.what());
        }
        _workbook.release();
      }
      if (_app.valid())
      {
        try
        {
          _app.call(L"Quit");
        }
        catch (const std::exception& e)
        {
          XLR_WARN("Failed to quit Excel for '{}': {}", _path.string(), e.what());
        }
        _app.release();
      }
    }

    vector<string> ComWorkbook::sheetNames()
    {
      vector<string> result;
      forEachItem(_workbook.getObject(L"Worksheets"), [&](const Dispatch& sheet)
      {
        result.push_back(toString(sheet.get(L"Name")));
      });
      return result;
    }

    Dispatch ComWorkbook::worksheet(const string& name) const
    {
      try
      {
        return _workbook.getObject(L"Worksheets", { toVariant(name) });
      }
      catch (const ComCallError&)
      {
        XLR_THROW_TYPE(ArgumentError, "Sheet '{}' not found in '{}'", name, _path.string());
      }
    }

    Dispatch ComWorkbook::range(const string& sheet, const string& address) const
    {
      auto ws = worksheet(sheet);
      try
      {
        return ws.getObject(L"Range", { toVariant(address) });
      }
      catch (const ComCallError&)
      {
        XLR_THROW_TYPE(ArgumentError, "Invalid range address '{}'", address);
      }
    }

    void ComWorkbook::addSheet(const string& name)
    {
      auto sheets = _workbook.getObject(L"Worksheets");
      auto last = sheets.getObject(L"Item", { sheets.get(L"Count") });
      auto added = sheets.getObject(L"Add", { missingArgument(), _variant_t(last.ptr()) });
      added.put(L"Name", toVariant(name));
    }

    void ComWorkbook::deleteSheet(const string& name)
    {
      worksheet(name).call(L"Delete");
    }

    CellGrid ComWorkbook::readRange(const string& sheet, const string& address)
    {
      return variantToGrid(range(sheet, address).get(L"Value2"));
    }

    void ComWorkbook::writeRange(const string& sheet, const string& address, const CellGrid& values)
    {
      const auto columns = gridWidth(values);
      if (values.empty() || columns == 0)
        return;
      auto topLeft = range(sheet, address).getObject(L"Cells", { _variant_t(1L), _variant_t(1L) });
      auto target = topLeft.getObject(L"Resize", { _variant_t((long)values.size()), _variant_t((long)columns) });
      target.put(L"Value2", gridToVariant(values, columns));
    }

    void ComWorkbook::clearRange(const string& sheet, const string& address)
    {
      range(sheet, address).call(L"ClearContents");
    }

    vector<string> ComWorkbook::tableNames()
    {
      vector<string> result;
      forEachItem(_workbook.getObject(L"Worksheets"), [&](const Dispatch& sheet)
      {
        forEachItem(sheet.getObject(L"ListObjects"), [&](const Dispatch& table)
        {
          result.push_back(toString(table.get(L"Name")));
        });
      });
      return result;
    }

    Dispatch ComWorkbook::findTable(const string& name) const
    {
      const auto wanted = toLower(name);
      Dispatch found;
      forEachItem(_workbook.getObject(L"Worksheets"), [&](const Dispatch& sheet)
      {
        if (found.valid())
          return;
        forEachItem(sheet.getObject(L"ListObjects"), [&](const Dispatch& table)
        {
          if (!found.valid() && toLower(toString(table.get(L"Name"))) == wanted)
            found = table;
        });
      });
      if (!found.valid())
        XLR_THROW_TYPE(ArgumentError, "Table '{}' not found in '{}'", name, _path.string());
      return found;
    }

    CellGrid ComWorkbook::readTable(const string& table)
    {
      return variantToGrid(findTable(table).getObject(L"Range").get(L"Value2"));
    }

    size_t ComWorkbook::appendTableRows(const string& table, const CellGrid& rows)
    {
      auto listObject = findTable(table);
      const auto columns = (size_t)toLong(listObject.getObject(L"ListColumns").get(L"Count"));
      if (gridWidth(rows) > columns)
        XLR_THROW_TYPE(ArgumentError, "Table '{}' has {} columns but a row has {} values",
          table, columns, gridWidth(rows));

      auto listRows = listObject.getObject(L"ListRows");
      for (auto& row : rows)
      {
        auto added = listRows.getObject(L"Add");
        added.getObject(L"Range").put(L"Value2", gridToVariant(CellGrid{ row }, columns));
      }
      return rows.size();
    }

    void ComWorkbook::calculate()
    {
      _app.call(L"Calculate");
    }

    namespace
    {
      class ComWorkbookFactory : public WorkbookFactory
      {
      public:
        unique_ptr<Workbook> open(const fs::path& path) override
        {
          return ComWorkbook::open(path);
        }
        unique_ptr<Workbook> create(const fs::path& path, bool macroEnabled) override
        {
          return ComWorkbook::create(path, macroEnabled);
        }
      };
    }
  }

  std::shared_ptr<WorkbookFactory> makeComWorkbookFactory()
  {
    return std::make_shared<COM::ComWorkbookFactory>();
  }
}
