#include "ValuationMethods.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <type_traits>
#include <variant>

namespace ipvalue {

namespace {

Expected<void> checkCommonInputs(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions)
{
    auto valid = validateAssumptions(assumptions);
    if (!valid) {
        return valid;
    }

    if (attributedRevenue.empty()) {
        return makeError(ErrorCode::InsufficientData, "Revenue series is empty");
    }

    for (std::size_t i = 0; i < attributedRevenue.size(); ++i) {
        const double revenue = attributedRevenue[i];
        if (!std::isfinite(revenue) || revenue < 0.0) {
            std::ostringstream oss;
            oss << "Attributed revenue for period " << (i + 1)
                << " must be a non-negative number, got " << revenue;
            return makeError(ErrorCode::ParameterOutOfRange, oss.str());
        }
    }

    return {};
}

Expected<double> resolveOperatingMargin(
    const std::optional<double>& explicitMargin,
    const std::optional<double>& segmentMargin)
{
    std::optional<double> margin = explicitMargin ? explicitMargin : segmentMargin;
    if (!margin) {
        return makeError(ErrorCode::ParameterOutOfRange,
                         "Operating margin is neither supplied nor available from segment data");
    }

    if (!std::isfinite(*margin) || *margin < 0.0 || *margin > 1.0) {
        std::ostringstream oss;
        oss << "Operating margin must lie in [0,1], got " << *margin;
        return makeError(ErrorCode::ParameterOutOfRange, oss.str());
    }

    return *margin;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Технологический фактор
// ═══════════════════════════════════════════════════════════════════════════════

Expected<double> technologyFactor(const TechnologyFactorParameters& parameters)
{
    auto valid = validateParameters(MethodParameters{parameters});
    if (!valid) {
        return std::unexpected(valid.error());
    }

    const double lifeFraction =
        static_cast<double>(parameters.remainingLifeYears) /
        static_cast<double>(parameters.totalLifeYears);

    return parameters.innovationScore * TechnologyFactorWeights::innovation +
           parameters.commercialScore * TechnologyFactorWeights::commercial +
           parameters.legalStrengthScore * TechnologyFactorWeights::legal +
           lifeFraction * TechnologyFactorWeights::remainingLife;
}

double technologyDecay(std::size_t period, int remainingLifeYears) noexcept
{
    const double horizon = remainingLifeYears * kTechnologyDecayHorizonMultiplier;
    if (horizon <= 0.0) {
        return kTechnologyDecayFloor;
    }
    const double decay = 1.0 - static_cast<double>(period) / horizon;
    return std::max(decay, kTechnologyDecayFloor);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Общая декомпозиция
// ═══════════════════════════════════════════════════════════════════════════════

Expected<ValuationResult> discountCashFlows(
    ValuationMethod method,
    std::vector<PeriodCashFlow> periods,
    const AssumptionSet& assumptions)
{
    auto valid = validateAssumptions(assumptions);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    if (periods.empty()) {
        return makeError(ErrorCode::InsufficientData, "Cash-flow series is empty");
    }

    ValuationResult result;
    result.method = method;

    const double base = 1.0 + assumptions.wacc;

    for (std::size_t i = 0; i < periods.size(); ++i) {
        auto& row = periods[i];
        row.period = i + 1;
        row.discountFactor = std::pow(base, static_cast<double>(row.period));
        row.presentValue = row.cashFlow / row.discountFactor;
        result.pvExplicit += row.presentValue;
    }

    const double lastCashFlow = periods.back().cashFlow;
    result.terminalCashFlow = lastCashFlow * (1.0 + assumptions.terminalGrowth);
    result.terminalValue =
        result.terminalCashFlow / (assumptions.wacc - assumptions.terminalGrowth);
    result.pvTerminal =
        result.terminalValue / std::pow(base, static_cast<double>(periods.size()));

    result.totalValue = result.pvExplicit + result.pvTerminal;
    result.periods = std::move(periods);

    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Relief-from-Royalty
// ═══════════════════════════════════════════════════════════════════════════════

Expected<ValuationResult> reliefFromRoyalty(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const ReliefFromRoyaltyParameters& parameters)
{
    if (auto check = checkCommonInputs(attributedRevenue, assumptions); !check) {
        return std::unexpected(check.error());
    }
    if (auto check = validateParameters(MethodParameters{parameters}); !check) {
        return std::unexpected(check.error());
    }

    std::vector<PeriodCashFlow> rows;
    rows.reserve(attributedRevenue.size());

    for (double revenue : attributedRevenue) {
        PeriodCashFlow row;
        row.revenue = revenue;
        row.cashFlow = revenue * parameters.royaltyRate * (1.0 - assumptions.taxRate);
        rows.push_back(row);
    }

    auto result = discountCashFlows(ValuationMethod::ReliefFromRoyalty, std::move(rows), assumptions);
    if (result) {
        result->details["royalty_rate"] = parameters.royaltyRate;
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Multi-Period Excess Earnings
// ═══════════════════════════════════════════════════════════════════════════════

Expected<ValuationResult> multiPeriodExcessEarnings(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const ExcessEarningsParameters& parameters,
    std::optional<double> segmentOperatingMargin)
{
    if (auto check = checkCommonInputs(attributedRevenue, assumptions); !check) {
        return std::unexpected(check.error());
    }
    if (auto check = validateParameters(MethodParameters{parameters}); !check) {
        return std::unexpected(check.error());
    }

    auto margin = resolveOperatingMargin(parameters.operatingMargin, segmentOperatingMargin);
    if (!margin) {
        return std::unexpected(margin.error());
    }

    double requiredReturn = 0.0;
    for (const auto& [category, rate] : parameters.contributoryAssets) {
        requiredReturn += rate;
    }

    std::vector<PeriodCashFlow> rows;
    rows.reserve(attributedRevenue.size());

    for (double revenue : attributedRevenue) {
        const double operatingIncome = revenue * *margin;

        // ПРИБЛИЖЕНИЕ: стоимость каждого вспомогательного актива = доля выручки
        const double proxyAssetValue = revenue * parameters.proxyAssetFraction;
        double contributoryCharge = 0.0;
        for (const auto& [category, rate] : parameters.contributoryAssets) {
            contributoryCharge += proxyAssetValue * rate;
        }

        const double excessEarnings = operatingIncome - contributoryCharge;

        PeriodCashFlow row;
        row.revenue = revenue;
        row.cashFlow = excessEarnings * parameters.ipContributionFraction *
                       (1.0 - assumptions.taxRate);
        rows.push_back(row);
    }

    auto result = discountCashFlows(ValuationMethod::ExcessEarnings, std::move(rows), assumptions);
    if (result) {
        result->details["operating_margin"] = *margin;
        result->details["proxy_asset_fraction"] = parameters.proxyAssetFraction;
        result->details["contributory_required_return"] = requiredReturn;
        result->details["ip_contribution_fraction"] = parameters.ipContributionFraction;
        result->notes.push_back(
            "Contributory asset values are approximated as a fixed fraction of revenue, "
            "not allocated from the balance sheet");
        if (!parameters.operatingMargin) {
            result->notes.push_back("Operating margin taken from segment average");
        }
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Technology-Factor-Adjusted Royalty
// ═══════════════════════════════════════════════════════════════════════════════

Expected<ValuationResult> technologyFactorRoyalty(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const TechnologyFactorParameters& parameters)
{
    if (auto check = checkCommonInputs(attributedRevenue, assumptions); !check) {
        return std::unexpected(check.error());
    }

    auto factor = technologyFactor(parameters);
    if (!factor) {
        return std::unexpected(factor.error());
    }

    const double adjustedRoyalty = parameters.baseRoyaltyRate * (1.0 + *factor);

    // Горизонт ограничен оставшимся сроком жизни
    const std::size_t horizon = std::min(
        attributedRevenue.size(),
        static_cast<std::size_t>(parameters.remainingLifeYears));

    std::vector<PeriodCashFlow> rows;
    rows.reserve(horizon);

    for (std::size_t t = 1; t <= horizon; ++t) {
        const double revenue = attributedRevenue[t - 1];

        PeriodCashFlow row;
        row.revenue = revenue;
        row.decayFactor = technologyDecay(t, parameters.remainingLifeYears);
        row.cashFlow = revenue * adjustedRoyalty * (1.0 - assumptions.taxRate) * row.decayFactor;
        rows.push_back(row);
    }

    auto result = discountCashFlows(ValuationMethod::TechnologyFactor, std::move(rows), assumptions);
    if (result) {
        result->details["technology_factor"] = *factor;
        result->details["base_royalty_rate"] = parameters.baseRoyaltyRate;
        result->details["adjusted_royalty_rate"] = adjustedRoyalty;
        result->details["projection_periods"] = static_cast<double>(horizon);
        if (horizon < attributedRevenue.size()) {
            result->notes.push_back("Projection truncated to remaining useful life");
        }
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Incremental Income ("with and without")
// ═══════════════════════════════════════════════════════════════════════════════

Expected<ValuationResult> incrementalIncome(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const IncrementalIncomeParameters& parameters,
    std::optional<double> segmentOperatingMargin)
{
    if (auto check = checkCommonInputs(attributedRevenue, assumptions); !check) {
        return std::unexpected(check.error());
    }
    if (auto check = validateParameters(MethodParameters{parameters}); !check) {
        return std::unexpected(check.error());
    }

    auto margin = resolveOperatingMargin(parameters.operatingMargin, segmentOperatingMargin);
    if (!margin) {
        return std::unexpected(margin.error());
    }

    std::vector<PeriodCashFlow> rows;
    rows.reserve(attributedRevenue.size());

    for (double revenue : attributedRevenue) {
        PeriodCashFlow row;
        row.revenue = revenue;
        row.cashFlow = revenue * parameters.erosionFraction * *margin *
                       (1.0 - assumptions.taxRate);
        rows.push_back(row);
    }

    auto result = discountCashFlows(ValuationMethod::IncrementalIncome, std::move(rows), assumptions);
    if (result) {
        result->details["erosion_fraction"] = parameters.erosionFraction;
        result->details["operating_margin"] = *margin;
        if (!parameters.operatingMargin) {
            result->notes.push_back("Operating margin taken from segment average");
        }
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Диспетчеризация
// ═══════════════════════════════════════════════════════════════════════════════

Expected<ValuationResult> valueRevenueSeries(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const MethodParameters& parameters,
    std::optional<double> segmentOperatingMargin)
{
    return std::visit([&](const auto& p) -> Expected<ValuationResult> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ReliefFromRoyaltyParameters>) {
            return reliefFromRoyalty(attributedRevenue, assumptions, p);
        } else if constexpr (std::is_same_v<T, ExcessEarningsParameters>) {
            return multiPeriodExcessEarnings(attributedRevenue, assumptions, p, segmentOperatingMargin);
        } else if constexpr (std::is_same_v<T, TechnologyFactorParameters>) {
            return technologyFactorRoyalty(attributedRevenue, assumptions, p);
        } else {
            return incrementalIncome(attributedRevenue, assumptions, p, segmentOperatingMargin);
        }
    }, parameters);
}

}  // namespace ipvalue
