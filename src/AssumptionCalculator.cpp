#include "AssumptionCalculator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace ipvalue {

std::string_view toString(AssumptionSource source) noexcept
{
    switch (source) {
        case AssumptionSource::Derived:  return "derived";
        case AssumptionSource::Fallback: return "fallback";
        case AssumptionSource::Override: return "override";
    }
    return "unknown";
}

AssumptionCalculator::AssumptionCalculator(MarketParameters parameters)
    : parameters_(std::move(parameters)) {}

double AssumptionCalculator::estimateBeta(double marketCap) const noexcept
{
    for (const auto& step : parameters_.betaSteps) {
        if (marketCap > step.minMarketCap) {
            return step.beta;
        }
    }
    return parameters_.defaultBeta;
}

double AssumptionCalculator::costOfEquity(double marketCap) const noexcept
{
    return parameters_.riskFreeRate + estimateBeta(marketCap) * parameters_.marketRiskPremium;
}

Expected<double> AssumptionCalculator::costOfDebt(
    double interestExpense,
    double totalDebt) const
{
    if (totalDebt <= 0.0) {
        return makeError(ErrorCode::DivisionUndefined,
                         "Cost of debt is undefined for zero total debt");
    }

    double rate = std::max(interestExpense, 0.0) / totalDebt;
    return std::min(rate, parameters_.maxCostOfDebt);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Эффективная ставка налога
// ═══════════════════════════════════════════════════════════════════════════════

Expected<TaxRateBreakdown> AssumptionCalculator::calculateTaxRate(
    const std::vector<RawStatementPeriod>& statements) const
{
    if (statements.empty()) {
        return makeError(ErrorCode::InsufficientData,
                         "No income statements available for tax rate");
    }

    TaxRateBreakdown breakdown;
    const std::size_t window = std::min(parameters_.taxWindow, statements.size());

    double sum = 0.0;
    for (std::size_t i = 0; i < window; ++i) {
        const auto& statement = statements[i];
        const double pretaxIncome = statement.netIncome + statement.incomeTaxExpense;

        // Убыточный период исказил бы среднее
        if (pretaxIncome <= 0.0) {
            breakdown.periodRates.push_back(std::nullopt);
            continue;
        }

        const double rate = statement.incomeTaxExpense / pretaxIncome;
        if (rate < 0.0 || rate > 1.0) {
            breakdown.periodRates.push_back(std::nullopt);
            continue;
        }

        breakdown.periodRates.push_back(rate);
        sum += rate;
        ++breakdown.periodsUsed;
    }

    if (breakdown.periodsUsed == 0) {
        return makeError(ErrorCode::DivisionUndefined,
                         "Tax rate undetermined: no period in the last " +
                         std::to_string(window) + " has positive pre-tax income");
    }

    breakdown.effectiveTaxRate = sum / static_cast<double>(breakdown.periodsUsed);
    return breakdown;
}

// ═══════════════════════════════════════════════════════════════════════════════
// WACC
// ═══════════════════════════════════════════════════════════════════════════════

Expected<WaccBreakdown> AssumptionCalculator::calculateWacc(
    const std::vector<RawStatementPeriod>& statements,
    const MarketSnapshot& snapshot,
    double taxRate) const
{
    if (statements.empty()) {
        return makeError(ErrorCode::InsufficientData,
                         "No statements available for WACC");
    }

    const auto& latest = statements.front();

    WaccBreakdown breakdown;
    breakdown.totalDebt = std::max(latest.totalDebt, 0.0);
    breakdown.taxRateUsed = taxRate;

    // Рыночная капитализация: снимок -> акции * цена -> балансовая стоимость
    double marketCap = snapshot.marketCap;
    if (marketCap <= 0.0 && latest.sharesOutstanding > 0.0 && snapshot.price > 0.0) {
        marketCap = latest.sharesOutstanding * snapshot.price;
    }
    if (marketCap <= 0.0) {
        marketCap = std::max(latest.shareholdersEquity, 0.0);
        breakdown.marketCapFromBookValue = true;
    }
    breakdown.marketCap = marketCap;

    const double totalValue = marketCap + breakdown.totalDebt;
    if (totalValue <= 0.0) {
        return makeError(ErrorCode::DivisionUndefined,
                         "WACC undefined: market capitalisation plus debt is zero");
    }

    breakdown.equityWeight = marketCap / totalValue;
    breakdown.debtWeight = 1.0 - breakdown.equityWeight;

    breakdown.beta = estimateBeta(marketCap);
    breakdown.costOfEquity = costOfEquity(marketCap);

    auto debtCost = costOfDebt(latest.interestExpense, breakdown.totalDebt);
    if (debtCost) {
        breakdown.costOfDebt = *debtCost;
    } else if (debtCost.error().code == ErrorCode::DivisionUndefined) {
        // Без долга вес долга равен нулю, значение не влияет на WACC
        breakdown.costOfDebt = 0.0;
        breakdown.costOfDebtDefaulted = true;
    } else {
        return std::unexpected(debtCost.error());
    }

    breakdown.wacc = breakdown.equityWeight * breakdown.costOfEquity +
                     breakdown.debtWeight * breakdown.costOfDebt * (1.0 - taxRate);

    return breakdown;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Терминальный рост
// ═══════════════════════════════════════════════════════════════════════════════

Expected<GrowthBreakdown> AssumptionCalculator::calculateTerminalGrowth(
    const std::vector<RawStatementPeriod>& statements) const
{
    GrowthBreakdown breakdown;

    for (std::size_t i = 0; i + 1 < statements.size(); ++i) {
        const double current = statements[i].revenue;
        const double prior = statements[i + 1].revenue;

        if (prior <= 0.0) {
            continue;
        }

        const double growth = (current - prior) / prior;
        if (std::abs(growth) >= parameters_.growthOutlierBound) {
            continue;
        }
        breakdown.growthRates.push_back(growth);
    }

    if (breakdown.growthRates.empty()) {
        return makeError(ErrorCode::InsufficientData,
                         "Terminal growth needs at least two consecutive periods with "
                         "positive prior revenue");
    }

    breakdown.historicalAverage =
        std::accumulate(breakdown.growthRates.begin(), breakdown.growthRates.end(), 0.0) /
        static_cast<double>(breakdown.growthRates.size());

    breakdown.terminalGrowth = std::clamp(
        breakdown.historicalAverage, parameters_.growthFloor, parameters_.growthCeiling);
    breakdown.clamped = breakdown.terminalGrowth != breakdown.historicalAverage;

    return breakdown;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Полный расчет
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

template<typename Breakdown, typename Calculate>
Expected<AssumptionComponent<Breakdown>> resolveComponent(
    Calculate calculate,
    double (*extract)(const Breakdown&),
    const std::optional<double>& fallback,
    const std::optional<double>& override,
    std::string_view name)
{
    AssumptionComponent<Breakdown> component;

    if (override) {
        component.value = *override;
        component.source = AssumptionSource::Override;
        return component;
    }

    Expected<Breakdown> derived = calculate();
    if (derived) {
        component.value = extract(*derived);
        component.source = AssumptionSource::Derived;
        component.breakdown = std::move(*derived);
        return component;
    }

    if (!fallback) {
        return makeError(derived.error().code,
                         std::string(name) + ": " + derived.error().message);
    }

    component.value = *fallback;
    component.source = AssumptionSource::Fallback;
    component.failure = derived.error();
    return component;
}

}  // namespace

Expected<AssumptionDerivation> AssumptionCalculator::derive(
    const std::vector<RawStatementPeriod>& statements,
    const MarketSnapshot& snapshot,
    const AssumptionFallbacks& fallbacks,
    const AssumptionOverrides& overrides) const
{
    AssumptionDerivation derivation;

    auto tax = resolveComponent<TaxRateBreakdown>(
        [&] { return calculateTaxRate(statements); },
        [](const TaxRateBreakdown& b) { return b.effectiveTaxRate; },
        fallbacks.taxRate, overrides.taxRate, "Tax rate");
    if (!tax) {
        return std::unexpected(tax.error());
    }
    derivation.taxRate = std::move(*tax);

    // Налоговый щит долга считается с итоговой ставкой налога
    auto wacc = resolveComponent<WaccBreakdown>(
        [&] { return calculateWacc(statements, snapshot, derivation.taxRate.value); },
        [](const WaccBreakdown& b) { return b.wacc; },
        fallbacks.wacc, overrides.wacc, "WACC");
    if (!wacc) {
        return std::unexpected(wacc.error());
    }
    derivation.wacc = std::move(*wacc);

    auto growth = resolveComponent<GrowthBreakdown>(
        [&] { return calculateTerminalGrowth(statements); },
        [](const GrowthBreakdown& b) { return b.terminalGrowth; },
        fallbacks.terminalGrowth, overrides.terminalGrowth, "Terminal growth");
    if (!growth) {
        return std::unexpected(growth.error());
    }
    derivation.terminalGrowth = std::move(*growth);

    derivation.assumptions = AssumptionSet{
        derivation.wacc.value,
        derivation.taxRate.value,
        derivation.terminalGrowth.value
    };

    auto valid = validateAssumptions(derivation.assumptions);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    return derivation;
}

}  // namespace ipvalue
