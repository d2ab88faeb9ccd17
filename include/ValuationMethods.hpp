#pragma once

#include "IPAsset.hpp"
#include "ValuationTypes.hpp"
#include <optional>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Методы оценки нематериальных активов
// ═══════════════════════════════════════════════════════════════════════════════
//
// Все методы - чистые функции от (атрибутированная выручка, допущения, параметры).
// Общая декомпозиция:
//   PV_explicit   = Σ CF_t / (1+WACC)^t,  t = 1..n
//   CF_terminal   = CF_n * (1 + g)
//   TerminalValue = CF_terminal / (WACC - g)
//   PV_terminal   = TerminalValue / (1+WACC)^n
//
// Общие ошибки: InvalidAssumptions (WACC <= g), InsufficientData (пустой ряд),
// ParameterOutOfRange (ставка вне [0,1] или отрицательная выручка).

// Веса композитного технологического фактора
struct TechnologyFactorWeights {
    static constexpr double innovation = 0.30;
    static constexpr double commercial = 0.35;
    static constexpr double legal = 0.25;
    static constexpr double remainingLife = 0.10;
};

// Минимальная доля стоимости при затухании к концу срока жизни
inline constexpr double kTechnologyDecayFloor = 0.3;
inline constexpr double kTechnologyDecayHorizonMultiplier = 1.5;

/**
 * @brief Технологический фактор в [0,1]
 *
 * innovation * 0.30 + commercial * 0.35 + legal * 0.25
 * + (remaining_life / total_life) * 0.10
 */
Expected<double> technologyFactor(const TechnologyFactorParameters& parameters);

// max(1 - t / (remaining_life * 1.5), 0.3)
double technologyDecay(std::size_t period, int remainingLifeYears) noexcept;

/**
 * @brief Дисконтирование готовых денежных потоков с терминальной стоимостью
 * @param periods Строки с заполненными revenue, cashFlow, decayFactor
 * @return Результат с PV_explicit, PV_terminal и total
 */
Expected<ValuationResult> discountCashFlows(
    ValuationMethod method,
    std::vector<PeriodCashFlow> periods,
    const AssumptionSet& assumptions);

// CF_t = revenue_t * royalty * (1 - tax)
Expected<ValuationResult> reliefFromRoyalty(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const ReliefFromRoyaltyParameters& parameters);

// CF_t = (revenue_t * margin - Σ proxy_t * r_k) * ip_contribution * (1 - tax).
// segmentOperatingMargin используется, если маржа не задана в параметрах.
Expected<ValuationResult> multiPeriodExcessEarnings(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const ExcessEarningsParameters& parameters,
    std::optional<double> segmentOperatingMargin = std::nullopt);

// CF_t = revenue_t * base_royalty * (1 + tech_factor) * (1 - tax) * decay_t,
// горизонт не длиннее remaining_life периодов
Expected<ValuationResult> technologyFactorRoyalty(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const TechnologyFactorParameters& parameters);

// CF_t = revenue_t * erosion * margin * (1 - tax)
Expected<ValuationResult> incrementalIncome(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const IncrementalIncomeParameters& parameters,
    std::optional<double> segmentOperatingMargin = std::nullopt);

// Диспетчеризация по типу параметров
Expected<ValuationResult> valueRevenueSeries(
    const std::vector<double>& attributedRevenue,
    const AssumptionSet& assumptions,
    const MethodParameters& parameters,
    std::optional<double> segmentOperatingMargin = std::nullopt);

}  // namespace ipvalue
