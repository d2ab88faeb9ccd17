#pragma once

#include "CompanyData.hpp"
#include "IFinancialDataSource.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// SQLite Data Source (локальное хранилище отчетности)
// ═══════════════════════════════════════════════════════════════════════════════

class SQLiteDataSource : public IFinancialDataSource {
public:
    // ═════════════════════════════════════════════════════════════════════════
    // Конструкторы и деструктор
    // ═════════════════════════════════════════════════════════════════════════

    // Пустой путь - база открывается позже через initializeFromOptions()
    explicit SQLiteDataSource(std::string_view dbPath = "");
    ~SQLiteDataSource() override;

    // Disable copy
    SQLiteDataSource(const SQLiteDataSource&) = delete;
    SQLiteDataSource& operator=(const SQLiteDataSource&) = delete;

    static DataSourceCommandLineOptions commandLineOptions();

    // Опция --sqlite-path
    Result initializeFromOptions(
        const boost::program_options::variables_map& options) override;

    Result open(std::string_view path);

    bool isOpen() const noexcept { return db_ != nullptr; }

    // ═════════════════════════════════════════════════════════════════════════
    // Запись (импорт)
    // ═════════════════════════════════════════════════════════════════════════

    // Сохранить компанию целиком, заменив прежние ряды (одна транзакция)
    Expected<void> saveCompany(const CompanyData& company);

    Expected<std::vector<std::string>> listTickers();

    // ═════════════════════════════════════════════════════════════════════════
    // IFinancialDataSource
    // ═════════════════════════════════════════════════════════════════════════

    Expected<std::vector<SegmentRevenuePoint>> fetchSegmentSeries(
        std::string_view ticker,
        std::string_view segmentName,
        std::size_t periods) override;

    Expected<std::vector<RawStatementPeriod>> fetchStatementSeries(
        std::string_view ticker,
        std::size_t periods) override;

    Expected<MarketSnapshot> fetchMarketSnapshot(
        std::string_view ticker) override;

    Expected<std::vector<std::string>> listSegments(
        std::string_view ticker) override;

private:
    Result createTables();

    Expected<void> ensureOpen() const;
    Expected<sqlite3_int64> findCompanyId(std::string_view ticker);
    Expected<void> execute(const char* sql);

    ValuationError sqliteError(std::string_view what) const;

    sqlite3* db_ = nullptr;
    std::string dbPath_;
};

}  // namespace ipvalue
