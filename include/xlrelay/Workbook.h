#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace xlrelay
{
  /// <summary>
  /// A single cell: empty, number, boolean or string. Excel error values are 
  /// represented by their display string, e.g. "#N/A".
  /// </summary>
  using CellValue = std::variant<std::monostate, double, bool, std::string>;

  /// <summary>
  /// Row-major block of cells
  /// </summary>
  using CellGrid = std::vector<std::vector<CellValue>>;

  /// <summary>
  /// A live handle to one open workbook in the native automation library.
  /// 
  /// Implementations have thread affinity: every method, including the 
  /// destructor, must be called on the thread which created the object. 
  /// BatchHandle guarantees this.
  /// 
  /// Methods throw HandleInvalidatedError if the native object has died,
  /// SaveConflictError or WorkbookIOError for file problems and 
  /// AutomationError for other native failures.
  /// </summary>
  class Workbook
  {
  public:
    virtual ~Workbook() = default;

    virtual const std::filesystem::path& path() const = 0;

    /// <summary>
    /// Cheap liveness probe of the native handle. Must not throw.
    /// </summary>
    virtual bool isAlive() noexcept = 0;

    virtual void save() = 0;

    /// <summary>
    /// Closes the workbook without saving and releases the native handle.
    /// Subsequent calls are no-ops.
    /// </summary>
    virtual void close() = 0;

    virtual std::vector<std::string> sheetNames() = 0;
    virtual void addSheet(const std::string& name) = 0;
    virtual void deleteSheet(const std::string& name) = 0;

    /// <summary>
    /// Address is in A1 notation relative to the sheet, e.g. "B2:D10"
    /// </summary>
    virtual CellGrid readRange(const std::string& sheet, const std::string& address) = 0;

    /// <summary>
    /// Writes `values` with its top left corner at the top left of `address`.
    /// </summary>
    virtual void writeRange(
      const std::string& sheet, const std::string& address, const CellGrid& values) = 0;

    virtual void clearRange(const std::string& sheet, const std::string& address) = 0;

    virtual std::vector<std::string> tableNames() = 0;

    /// <summary>
    /// Returns the header row followed by the data rows
    /// </summary>
    virtual CellGrid readTable(const std::string& table) = 0;

    /// <summary>
    /// Appends rows to the end of the table's data body, returns the number added
    /// </summary>
    virtual size_t appendTableRows(const std::string& table, const CellGrid& rows) = 0;

    virtual void calculate() = 0;
  };

  /// <summary>
  /// Creates Workbooks. Both methods are invoked on the affinity thread which 
  /// will own the returned object.
  /// </summary>
  class WorkbookFactory
  {
  public:
    virtual ~WorkbookFactory() = default;

    virtual std::unique_ptr<Workbook> open(const std::filesystem::path& path) = 0;

    /// <summary>
    /// Creates a new empty workbook and saves it to `path`. 
    /// </summary>
    virtual std::unique_ptr<Workbook> create(
      const std::filesystem::path& path, bool macroEnabled) = 0;
  };
}
