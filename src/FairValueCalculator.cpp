#include "FairValueCalculator.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace ipvalue {

std::string_view toString(FairValueMethod method) noexcept
{
    switch (method) {
        case FairValueMethod::DiscountedCashFlow: return "dcf";
        case FairValueMethod::PriceToEarnings:    return "pe_multiple";
        case FairValueMethod::PriceToSales:       return "ps_multiple";
        case FairValueMethod::EvToEbitda:         return "ev_ebitda";
    }
    return "dcf";
}

FairValueCalculator::FairValueCalculator(MarketParameters market)
    : assumptionCalculator_(std::move(market)) {}

// ═══════════════════════════════════════════════════════════════════════════════
// Рост
// ═══════════════════════════════════════════════════════════════════════════════

double FairValueCalculator::estimateGrowthRate(
    const std::vector<RawStatementPeriod>& statements) const noexcept
{
    double sum = 0.0;
    std::size_t count = 0;

    for (std::size_t i = 0; i + 1 < statements.size(); ++i) {
        const double current = statements[i].revenue;
        const double prior = statements[i + 1].revenue;
        if (prior <= 0.0) {
            continue;
        }
        const double growth = (current - prior) / prior;
        // Выбросы (слияния, смена отчетности) не учитываются
        if (growth > -0.5 && growth < 2.0) {
            sum += growth;
            ++count;
        }
    }

    if (count == 0) {
        return kDefaultGrowth;
    }
    return std::clamp(sum / static_cast<double>(count), kGrowthFloor, kGrowthCeiling);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Методы
// ═══════════════════════════════════════════════════════════════════════════════

Expected<FairValueEstimate> FairValueCalculator::discountedCashFlow(
    const RawStatementPeriod& latest,
    double sharesOutstanding,
    double growthRate,
    const AssumptionSet& assumptions,
    int projectionYears) const
{
    const double freeCashFlow = latest.operatingCashFlow + latest.capitalExpenditure;
    if (freeCashFlow <= 0.0) {
        std::ostringstream oss;
        oss << "Free cash flow is not positive (" << freeCashFlow << ")";
        return makeError(ErrorCode::InsufficientData, oss.str());
    }
    if (sharesOutstanding <= 0.0) {
        return makeError(ErrorCode::DivisionUndefined, "Share count is zero");
    }

    FairValueEstimate estimate;
    estimate.method = FairValueMethod::DiscountedCashFlow;

    const double base = 1.0 + assumptions.wacc;
    double pvCashFlows = 0.0;
    for (int year = 1; year <= projectionYears; ++year) {
        const double projected = freeCashFlow * std::pow(1.0 + growthRate, year);
        estimate.projectedCashFlows.push_back(projected);
        pvCashFlows += projected / std::pow(base, year);
    }

    const double terminalCashFlow =
        estimate.projectedCashFlows.back() * (1.0 + assumptions.terminalGrowth);
    const double terminalValue =
        terminalCashFlow / (assumptions.wacc - assumptions.terminalGrowth);
    const double pvTerminal = terminalValue / std::pow(base, projectionYears);

    const double enterpriseValue = pvCashFlows + pvTerminal;
    const double equityValue = enterpriseValue - latest.totalDebt + latest.cashAndEquivalents;

    estimate.fairValuePerShare = equityValue / sharesOutstanding;
    estimate.details["free_cash_flow"] = freeCashFlow;
    estimate.details["pv_cash_flows"] = pvCashFlows;
    estimate.details["pv_terminal_value"] = pvTerminal;
    estimate.details["enterprise_value"] = enterpriseValue;
    estimate.details["equity_value"] = equityValue;
    return estimate;
}

Expected<FairValueEstimate> FairValueCalculator::priceToEarnings(
    const RawStatementPeriod& latest,
    double sharesOutstanding,
    double multiple) const
{
    if (sharesOutstanding <= 0.0 || latest.netIncome <= 0.0) {
        return makeError(ErrorCode::InsufficientData, "Negative or zero earnings");
    }

    FairValueEstimate estimate;
    estimate.method = FairValueMethod::PriceToEarnings;

    const double eps = latest.netIncome / sharesOutstanding;
    estimate.fairValuePerShare = eps * multiple;
    estimate.details["eps"] = eps;
    estimate.details["multiple"] = multiple;
    return estimate;
}

Expected<FairValueEstimate> FairValueCalculator::priceToSales(
    const RawStatementPeriod& latest,
    double sharesOutstanding,
    double multiple) const
{
    if (sharesOutstanding <= 0.0 || latest.revenue <= 0.0) {
        return makeError(ErrorCode::InsufficientData, "No revenue data");
    }

    FairValueEstimate estimate;
    estimate.method = FairValueMethod::PriceToSales;

    const double revenuePerShare = latest.revenue / sharesOutstanding;
    estimate.fairValuePerShare = revenuePerShare * multiple;
    estimate.details["revenue_per_share"] = revenuePerShare;
    estimate.details["multiple"] = multiple;
    return estimate;
}

Expected<FairValueEstimate> FairValueCalculator::evToEbitda(
    const RawStatementPeriod& latest,
    double sharesOutstanding,
    double multiple) const
{
    // ПРИБЛИЖЕНИЕ: без амортизации EBITDA = операционная прибыль
    const double ebitda = latest.operatingIncome;
    if (ebitda <= 0.0) {
        return makeError(ErrorCode::InsufficientData, "Negative EBITDA");
    }
    if (sharesOutstanding <= 0.0) {
        return makeError(ErrorCode::DivisionUndefined, "Share count is zero");
    }

    FairValueEstimate estimate;
    estimate.method = FairValueMethod::EvToEbitda;

    const double enterpriseValue = ebitda * multiple;
    const double equityValue = enterpriseValue - latest.totalDebt + latest.cashAndEquivalents;
    estimate.fairValuePerShare = equityValue / sharesOutstanding;
    estimate.details["ebitda"] = ebitda;
    estimate.details["multiple"] = multiple;
    estimate.details["enterprise_value"] = enterpriseValue;
    estimate.details["equity_value"] = equityValue;
    return estimate;
}

std::string FairValueCalculator::recommendation(double upsidePercent)
{
    if (upsidePercent > 30.0) {
        return "Strong Buy - Significantly Undervalued";
    } else if (upsidePercent > 15.0) {
        return "Buy - Undervalued";
    } else if (upsidePercent > -10.0) {
        return "Hold - Fairly Valued";
    } else if (upsidePercent > -25.0) {
        return "Sell - Overvalued";
    }
    return "Strong Sell - Significantly Overvalued";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Полный отчет
// ═══════════════════════════════════════════════════════════════════════════════

Expected<FairValueReport> FairValueCalculator::calculate(
    std::string_view ticker,
    const std::vector<RawStatementPeriod>& statements,
    const MarketSnapshot& snapshot,
    const FairValueParameters& parameters) const
{
    if (statements.empty()) {
        return makeError(ErrorCode::InsufficientData,
                         "No financial statements for " + std::string(ticker));
    }
    if (snapshot.price <= 0.0 || snapshot.marketCap <= 0.0) {
        return makeError(ErrorCode::DivisionUndefined,
                         "Share count undetermined: price and market cap must be positive");
    }
    if (parameters.projectionYears < 1) {
        return makeError(ErrorCode::ParameterOutOfRange,
                         "Projection horizon must be at least one year");
    }

    FairValueReport report;
    report.ticker = std::string(ticker);
    report.currentPrice = snapshot.price;
    report.sharesOutstanding = snapshot.marketCap / snapshot.price;

    // Ставка налога в методах не участвует: при заданном WACC она не нужна
    AssumptionSet assumptions;
    if (parameters.wacc) {
        assumptions.wacc = *parameters.wacc;
        assumptions.taxRate = parameters.taxRate.value_or(assumptions.taxRate);
        assumptions.terminalGrowth = parameters.terminalGrowth;
        auto valid = validateAssumptions(assumptions);
        if (!valid) {
            return std::unexpected(valid.error());
        }
        report.waccSource = AssumptionSource::Override;
    } else {
        AssumptionOverrides overrides;
        overrides.taxRate = parameters.taxRate;
        overrides.terminalGrowth = parameters.terminalGrowth;

        auto derivation = assumptionCalculator_.derive(statements, snapshot, {}, overrides);
        if (!derivation) {
            return std::unexpected(derivation.error());
        }
        assumptions = derivation->assumptions;
        report.waccSource = derivation->wacc.source;
    }
    report.wacc = assumptions.wacc;
    report.terminalGrowth = assumptions.terminalGrowth;

    if (parameters.growthRate) {
        report.growthRate = *parameters.growthRate;
    } else {
        report.growthRate = estimateGrowthRate(statements);
        report.growthEstimated = true;
    }

    const RawStatementPeriod& latest = statements.front();
    const double shares = report.sharesOutstanding;
    const auto& multiples = parameters.multiples;

    auto record = [&report](FairValueMethod method, Expected<FairValueEstimate> estimate) {
        if (estimate) {
            report.estimates.push_back(std::move(*estimate));
        } else {
            FairValueEstimate failed;
            failed.method = method;
            failed.failure = estimate.error();
            report.estimates.push_back(std::move(failed));
        }
    };

    record(FairValueMethod::DiscountedCashFlow,
           discountedCashFlow(latest, shares, report.growthRate, assumptions,
                              parameters.projectionYears));
    record(FairValueMethod::PriceToEarnings,
           priceToEarnings(latest, shares, multiples.priceToEarnings));
    record(FairValueMethod::PriceToSales,
           priceToSales(latest, shares, multiples.priceToSales));
    record(FairValueMethod::EvToEbitda,
           evToEbitda(latest, shares, multiples.evToEbitda));

    double sum = 0.0;
    std::size_t count = 0;
    for (const auto& estimate : report.estimates) {
        if (estimate.fairValuePerShare && *estimate.fairValuePerShare > 0.0) {
            sum += *estimate.fairValuePerShare;
            ++count;
        }
    }

    if (count > 0) {
        report.averageFairValue = sum / static_cast<double>(count);
        report.upsidePercent =
            (*report.averageFairValue - report.currentPrice) / report.currentPrice * 100.0;
    }
    report.recommendation = recommendation(report.upsidePercent);

    return report;
}

}  // namespace ipvalue
