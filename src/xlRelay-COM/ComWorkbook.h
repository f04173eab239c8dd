#pragma once
#include "Connect.h"
#include "MessageFilter.h"
#include <xlrelay/Workbook.h>

namespace xlrelay
{
  namespace COM
  {
    /// <summary>
    /// A workbook open in its own hidden Excel instance. Must be created, used
    /// and destroyed on one thread.
    /// </summary>
    class ComWorkbook : public Workbook
    {
    public:
      static std::unique_ptr<ComWorkbook> open(const std::filesystem::path& path);
      static std::unique_ptr<ComWorkbook> create(const std::filesystem::path& path, bool macroEnabled);

      ~ComWorkbook();

      const std::filesystem::path& path() const override { return _path; }
      bool isAlive() noexcept override;
      void save() override;
      void close() override;

      std::vector<std::string> sheetNames() override;
      void addSheet(const std::string& name) override;
      void deleteSheet(const std::string& name) override;

      CellGrid readRange(const std::string& sheet, const std::string& address) override;
      void writeRange(const std::string& sheet, const std::string& address, const CellGrid& values) override;
      void clearRange(const std::string& sheet, const std::string& address) override;

      std::vector<std::string> tableNames() override;
      CellGrid readTable(const std::string& table) override;
      size_t appendTableRows(const std::string& table, const CellGrid& rows) override;

      void calculate() override;

    private:
      ComWorkbook(const std::filesystem::path& path);

      Dispatch worksheet(const std::string& name) const;
      Dispatch range(const std::string& sheet, const std::string& address) const;
      Dispatch findTable(const std::string& name) const;

      // Destroyed in reverse order: the apartment must outlive every COM pointer
      ComApartment _apartment;
      ScopedMessageFilter _filter;
      std::filesystem::path _path;
      Dispatch _app;
      Dispatch _workbook;
    };
  }
}
