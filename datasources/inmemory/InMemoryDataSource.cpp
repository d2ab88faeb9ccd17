#include "InMemoryDataSource.hpp"

namespace ipvalue {

void InMemoryDataSource::addCompany(CompanyData company) {
    sortNewestFirst(company);
    std::string ticker = company.ticker;
    companies_[ticker] = std::move(company);
}

std::vector<std::string> InMemoryDataSource::tickers() const {
    std::vector<std::string> result;
    result.reserve(companies_.size());
    for (const auto& [ticker, _] : companies_) {
        result.push_back(ticker);
    }
    return result;
}

Result InMemoryDataSource::initializeFromOptions(
    const boost::program_options::variables_map& /*options*/) {
    return {};
}

Expected<const CompanyData*> InMemoryDataSource::findCompany(std::string_view ticker) const {
    auto it = companies_.find(ticker);
    if (it == companies_.end()) {
        return makeError(ErrorCode::DataNotFound,
                         "Unknown ticker: " + std::string(ticker));
    }
    return &it->second;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Получение данных
// ═══════════════════════════════════════════════════════════════════════════════

Expected<std::vector<SegmentRevenuePoint>> InMemoryDataSource::fetchSegmentSeries(
    std::string_view ticker,
    std::string_view segmentName,
    std::size_t periods) {

    auto company = findCompany(ticker);
    if (!company) {
        return std::unexpected(company.error());
    }

    auto it = (*company)->segments.find(std::string(segmentName));
    if (it == (*company)->segments.end()) {
        return makeError(ErrorCode::DataNotFound,
                         "Segment '" + std::string(segmentName) + "' not reported by " +
                         std::string(ticker));
    }

    const auto& points = it->second;
    const std::size_t count = std::min(periods, points.size());
    return std::vector<SegmentRevenuePoint>(points.begin(), points.begin() + count);
}

Expected<std::vector<RawStatementPeriod>> InMemoryDataSource::fetchStatementSeries(
    std::string_view ticker,
    std::size_t periods) {

    auto company = findCompany(ticker);
    if (!company) {
        return std::unexpected(company.error());
    }

    const auto& statements = (*company)->statements;
    const std::size_t count = std::min(periods, statements.size());
    return std::vector<RawStatementPeriod>(statements.begin(), statements.begin() + count);
}

Expected<MarketSnapshot> InMemoryDataSource::fetchMarketSnapshot(std::string_view ticker) {
    auto company = findCompany(ticker);
    if (!company) {
        return std::unexpected(company.error());
    }
    return (*company)->snapshot;
}

Expected<std::vector<std::string>> InMemoryDataSource::listSegments(std::string_view ticker) {
    auto company = findCompany(ticker);
    if (!company) {
        return std::unexpected(company.error());
    }

    std::vector<std::string> labels;
    for (const auto& [label, _] : (*company)->segments) {
        labels.push_back(label);
    }
    return labels;
}

}  // namespace ipvalue
