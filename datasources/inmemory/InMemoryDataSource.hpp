#pragma once

#include "CompanyData.hpp"
#include "IFinancialDataSource.hpp"
#include <map>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// In-Memory Data Source
// ═══════════════════════════════════════════════════════════════════════════════

class InMemoryDataSource : public IFinancialDataSource {
public:
    InMemoryDataSource() = default;
    ~InMemoryDataSource() override = default;

    // Добавить или заменить компанию; ряды упорядочиваются от нового к старому
    void addCompany(CompanyData company);

    void clear() noexcept { companies_.clear(); }

    std::vector<std::string> tickers() const;

    // Ничего не читает из опций: данные добавляются через addCompany()
    Result initializeFromOptions(
        const boost::program_options::variables_map& options) override;

    // ─────────────────────────────────────────────────────────────────────────
    // IFinancialDataSource
    // ─────────────────────────────────────────────────────────────────────────

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
    Expected<const CompanyData*> findCompany(std::string_view ticker) const;

    std::map<std::string, CompanyData, std::less<>> companies_;
};

}  // namespace ipvalue
