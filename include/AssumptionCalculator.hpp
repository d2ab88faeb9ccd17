#pragma once

#include "ValuationTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Рыночные параметры (явная конфигурация вместо глобальных констант)
// ═══════════════════════════════════════════════════════════════════════════════

struct BetaStep {
    double minMarketCap;  // нижняя граница (строго больше)
    double beta;
};

struct MarketParameters {
    double riskFreeRate = 0.045;       // 10-летние казначейские облигации
    double marketRiskPremium = 0.06;

    // ПРИБЛИЖЕНИЕ: бета не раскрывается, оценивается ступенчато по капитализации.
    // Шаги проверяются по порядку, первый подходящий побеждает.
    std::vector<BetaStep> betaSteps = {
        {500e9, 1.0},   // Mega cap
        {100e9, 1.1},   // Large cap
        {10e9, 1.2},    // Mid cap
    };
    double defaultBeta = 1.3;          // Small cap

    double maxCostOfDebt = 0.15;

    double growthFloor = 0.01;
    double growthCeiling = 0.04;       // ВВП + инфляция
    double growthOutlierBound = 0.5;   // |g| >= bound считается ошибкой данных

    std::size_t taxWindow = 3;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Детализация расчета (для аудита и отображения)
// ═══════════════════════════════════════════════════════════════════════════════

enum class AssumptionSource {
    Derived,
    Fallback,
    Override    // значение задано вызывающим, расчет не выполнялся
};

std::string_view toString(AssumptionSource source) noexcept;

struct WaccBreakdown {
    double wacc = 0.0;
    double costOfEquity = 0.0;
    double costOfDebt = 0.0;
    bool costOfDebtDefaulted = false;  // нулевой долг -> 0
    double equityWeight = 0.0;
    double debtWeight = 0.0;
    double marketCap = 0.0;
    bool marketCapFromBookValue = false;
    double totalDebt = 0.0;
    double beta = 0.0;                 // оценка по капитализации
    double taxRateUsed = 0.0;
};

struct TaxRateBreakdown {
    double effectiveTaxRate = 0.0;
    // По периодам окна (от нового к старому); пусто для пропущенного периода
    std::vector<std::optional<double>> periodRates;
    std::size_t periodsUsed = 0;
};

struct GrowthBreakdown {
    double terminalGrowth = 0.0;
    double historicalAverage = 0.0;
    std::vector<double> growthRates;  // от новой пары к старой
    bool clamped = false;
};

struct AssumptionFallbacks {
    std::optional<double> wacc;
    std::optional<double> taxRate;
    std::optional<double> terminalGrowth;
};

// Те же три значения, но заменяющие расчет, а не подстраховывающие его
using AssumptionOverrides = AssumptionFallbacks;

template<typename Breakdown>
struct AssumptionComponent {
    double value = 0.0;
    AssumptionSource source = AssumptionSource::Derived;
    std::optional<Breakdown> breakdown;       // только для Derived
    std::optional<ValuationError> failure;    // причина применения Fallback
};

struct AssumptionDerivation {
    AssumptionSet assumptions;
    AssumptionComponent<WaccBreakdown> wacc;
    AssumptionComponent<TaxRateBreakdown> taxRate;
    AssumptionComponent<GrowthBreakdown> terminalGrowth;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Assumption Calculator
// ═══════════════════════════════════════════════════════════════════════════════

class AssumptionCalculator {
public:
    explicit AssumptionCalculator(MarketParameters parameters = {});

    // ПРИБЛИЖЕНИЕ: ступенчатая функция капитализации, а не регрессионная бета
    double estimateBeta(double marketCap) const noexcept;

    // CAPM: Rf + beta * MRP
    double costOfEquity(double marketCap) const noexcept;

    // interest / debt; DivisionUndefined при нулевом долге
    Expected<double> costOfDebt(double interestExpense, double totalDebt) const;

    /**
     * @brief Средняя эффективная ставка налога за последние taxWindow периодов
     *
     * Период учитывается только при положительной прибыли до налогообложения
     * и ставке в [0,1]. Если ни один период не подходит - DivisionUndefined
     * (TaxRateUndetermined), требуется внешний fallback.
     */
    Expected<TaxRateBreakdown> calculateTaxRate(
        const std::vector<RawStatementPeriod>& statements) const;

    // WACC = E/V * Re + D/V * Rd * (1 - T)
    Expected<WaccBreakdown> calculateWacc(
        const std::vector<RawStatementPeriod>& statements,
        const MarketSnapshot& snapshot,
        double taxRate) const;

    // Средний рост выручки, зажатый в [growthFloor, growthCeiling]
    Expected<GrowthBreakdown> calculateTerminalGrowth(
        const std::vector<RawStatementPeriod>& statements) const;

    /**
     * @brief Полный набор допущений
     *
     * Override заменяет компонент до расчета (WACC считается с итоговой
     * ставкой налога). Fallback применяется только при ошибке расчета.
     * Условие WACC > g проверяется для итогового набора.
     */
    Expected<AssumptionDerivation> derive(
        const std::vector<RawStatementPeriod>& statements,
        const MarketSnapshot& snapshot,
        const AssumptionFallbacks& fallbacks = {},
        const AssumptionOverrides& overrides = {}) const;

    const MarketParameters& parameters() const noexcept { return parameters_; }

private:
    MarketParameters parameters_;
};

}  // namespace ipvalue
