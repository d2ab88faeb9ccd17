#include "SegmentDataPreparer.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace ipvalue {

std::string foldCase(std::string_view value)
{
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

std::string segmentMatchKey(std::string_view name, SegmentMatchMode mode)
{
    switch (mode) {
        case SegmentMatchMode::Exact:
            return std::string(name);
        case SegmentMatchMode::CaseInsensitive:
            return foldCase(name);
        case SegmentMatchMode::Normalized: {
            std::string key;
            key.reserve(name.size());
            for (char c : name) {
                if (c == ' ' || c == '-') {
                    continue;
                }
                key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            return key;
        }
    }
    return std::string(name);
}

std::string_view toString(SegmentMatchMode mode) noexcept
{
    switch (mode) {
        case SegmentMatchMode::Exact:           return "exact";
        case SegmentMatchMode::CaseInsensitive: return "case-insensitive";
        case SegmentMatchMode::Normalized:      return "normalized";
    }
    return "exact";
}

std::optional<SegmentMatchMode> parseSegmentMatchMode(std::string_view name) noexcept
{
    if (name == "exact") return SegmentMatchMode::Exact;
    if (name == "case-insensitive") return SegmentMatchMode::CaseInsensitive;
    if (name == "normalized") return SegmentMatchMode::Normalized;
    return std::nullopt;
}

bool segmentNamesMatch(
    std::string_view requested,
    std::string_view label,
    SegmentMatchMode mode)
{
    return segmentMatchKey(requested, mode) == segmentMatchKey(label, mode);
}

double proportionalAllocation(
    double companyMetric,
    double segmentRevenue,
    double companyRevenue) noexcept
{
    if (companyRevenue <= 0.0) {
        return 0.0;
    }
    return companyMetric * (segmentRevenue / companyRevenue);
}

// ═══════════════════════════════════════════════════════════════════════════════
// SegmentDataPreparer
// ═══════════════════════════════════════════════════════════════════════════════

SegmentDataPreparer::SegmentDataPreparer(
    SegmentMatchMode matchMode,
    AllocationStrategies strategies)
    : matchMode_(matchMode),
      strategies_(std::move(strategies)) {}

Expected<std::string> SegmentDataPreparer::resolveSegmentName(
    std::string_view requested,
    const std::vector<std::string>& availableLabels) const
{
    // Точное совпадение имеет приоритет в любом режиме
    auto exact = std::find(availableLabels.begin(), availableLabels.end(), requested);
    if (exact != availableLabels.end()) {
        return *exact;
    }

    auto it = std::find_if(availableLabels.begin(), availableLabels.end(),
        [&](const std::string& label) {
            return segmentNamesMatch(requested, label, matchMode_);
        });

    if (it != availableLabels.end()) {
        return *it;
    }

    std::vector<std::string> sorted = availableLabels;
    std::sort(sorted.begin(), sorted.end());

    std::ostringstream oss;
    oss << "Segment '" << requested << "' not found (match mode: "
        << toString(matchMode_) << "). Available segments: [";
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << sorted[i];
    }
    oss << "]";

    return makeError(ErrorCode::DataNotFound, oss.str());
}

Expected<SegmentSeries> SegmentDataPreparer::buildSeries(
    std::string_view segmentName,
    const std::vector<SegmentRevenuePoint>& segmentRevenues,
    const std::vector<RawStatementPeriod>& statements,
    std::size_t periods) const
{
    if (periods == 0) {
        return makeError(ErrorCode::InsufficientData,
                         "Requested zero periods for segment '" + std::string(segmentName) + "'");
    }

    // Индекс отчетности по метке периода
    std::map<std::string, const RawStatementPeriod*> statementByPeriod;
    for (const auto& statement : statements) {
        statementByPeriod.emplace(statement.periodLabel, &statement);
    }

    SegmentSeries series;
    series.segmentName = std::string(segmentName);

    // Идем от нового периода к старому и берем не больше periods точек
    std::vector<std::size_t> used;
    for (std::size_t i = 0; i < segmentRevenues.size() && used.size() < periods; ++i) {
        const auto& point = segmentRevenues[i];

        if (point.revenue < 0.0) {
            return makeError(ErrorCode::ParameterOutOfRange,
                             "Negative revenue for segment '" + std::string(segmentName) +
                             "' in period " + point.periodLabel);
        }

        // Период без отчетности компании не может быть распределен
        if (statementByPeriod.find(point.periodLabel) == statementByPeriod.end()) {
            continue;
        }
        used.push_back(i);
    }

    if (used.empty()) {
        return makeError(ErrorCode::InsufficientData,
                         "No periods with both segment and statement data for segment '" +
                         std::string(segmentName) + "'");
    }

    // Хронологический порядок: последний элемент - последний период
    std::reverse(used.begin(), used.end());

    for (std::size_t index : used) {
        const auto& point = segmentRevenues[index];
        const auto& statement = *statementByPeriod.at(point.periodLabel);

        const double companyRevenue = statement.revenue;
        const double share = companyRevenue > 0.0 ? point.revenue / companyRevenue : 0.0;

        series.periodLabels.push_back(point.periodLabel);
        series.revenues.push_back(point.revenue);
        series.allocationShares.push_back(share);

        series.grossProfits.push_back(
            strategies_.grossProfit(statement.grossProfit, point.revenue, companyRevenue));
        series.rdExpenses.push_back(
            strategies_.researchAndDevelopment(
                statement.researchAndDevelopment, point.revenue, companyRevenue));
        series.operatingIncomes.push_back(
            strategies_.operatingIncome(statement.operatingIncome, point.revenue, companyRevenue));

        series.grossMargins.push_back(
            companyRevenue > 0.0 ? statement.grossProfit / companyRevenue : 0.0);
        series.operatingMargins.push_back(
            companyRevenue > 0.0 ? statement.operatingIncome / companyRevenue : 0.0);
    }

    return series;
}

Expected<SegmentSeries> SegmentDataPreparer::prepare(
    IFinancialDataSource& dataSource,
    std::string_view ticker,
    std::string_view segmentName,
    std::size_t periods) const
{
    auto labels = dataSource.listSegments(ticker);
    if (!labels) {
        return std::unexpected(labels.error());
    }

    auto resolved = resolveSegmentName(segmentName, *labels);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    auto revenues = dataSource.fetchSegmentSeries(ticker, *resolved, periods);
    if (!revenues) {
        return std::unexpected(revenues.error());
    }

    if (revenues->empty()) {
        return makeError(ErrorCode::DataNotFound,
                         "Segment '" + *resolved + "' has no revenue data for " +
                         std::string(ticker));
    }

    auto statements = dataSource.fetchStatementSeries(ticker, periods);
    if (!statements) {
        return std::unexpected(statements.error());
    }

    // Результат хранит имя, под которым сегмент запрошен активом
    auto series = buildSeries(*resolved, *revenues, *statements, periods);
    if (series) {
        series->segmentName = std::string(segmentName);
    }
    return series;
}

}  // namespace ipvalue
