#pragma once

#include "AssumptionCalculator.hpp"
#include "ValuationTypes.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Справедливая стоимость акции (справочный отчет, не участвует в оценке ИС)
// ═══════════════════════════════════════════════════════════════════════════════

enum class FairValueMethod {
    DiscountedCashFlow,
    PriceToEarnings,
    PriceToSales,
    EvToEbitda
};

std::string_view toString(FairValueMethod method) noexcept;

// ПРИБЛИЖЕНИЕ: фиксированные мультипликаторы, а не отраслевые медианы
struct FairValueMultiples {
    double priceToEarnings = 20.0;
    double priceToSales = 3.0;
    double evToEbitda = 12.0;        // EBITDA ~ операционная прибыль
};

struct FairValueParameters {
    std::optional<double> growthRate;   // рост FCF; пусто - по истории выручки
    std::optional<double> wacc;         // пусто - расчет по отчетности
    std::optional<double> taxRate;      // нужна только для расчета WACC
    double terminalGrowth = 0.025;
    int projectionYears = 5;
    FairValueMultiples multiples;
};

struct FairValueEstimate {
    FairValueMethod method = FairValueMethod::DiscountedCashFlow;
    std::optional<double> fairValuePerShare;  // пусто - метод неприменим
    std::optional<ValuationError> failure;
    std::map<std::string, double> details;
    std::vector<double> projectedCashFlows;   // только DCF
};

struct FairValueReport {
    std::string ticker;
    double currentPrice = 0.0;
    double sharesOutstanding = 0.0;     // капитализация / цена

    double growthRate = 0.0;
    bool growthEstimated = false;
    double terminalGrowth = 0.0;
    double wacc = 0.0;
    AssumptionSource waccSource = AssumptionSource::Derived;

    std::vector<FairValueEstimate> estimates;

    // Среднее по методам с положительной оценкой
    std::optional<double> averageFairValue;
    double upsidePercent = 0.0;
    std::string recommendation;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Fair Value Calculator
// ═══════════════════════════════════════════════════════════════════════════════

class FairValueCalculator {
public:
    static constexpr double kDefaultGrowth = 0.05;
    static constexpr double kGrowthFloor = -0.20;
    static constexpr double kGrowthCeiling = 0.50;

    explicit FairValueCalculator(MarketParameters market = {});

    /**
     * @brief Отчет по всем методам
     *
     * Неприменимый метод (отрицательный FCF, убыток) не прерывает расчет:
     * ошибка сохраняется в FairValueEstimate::failure.
     * @return InsufficientData без отчетности, DivisionUndefined без цены
     *         или капитализации, ошибка расчета WACC
     */
    Expected<FairValueReport> calculate(
        std::string_view ticker,
        const std::vector<RawStatementPeriod>& statements,
        const MarketSnapshot& snapshot,
        const FairValueParameters& parameters = {}) const;

    // Средний рост выручки по парам периодов с ростом в (-0.5, 2.0),
    // зажатый в [kGrowthFloor, kGrowthCeiling]; kDefaultGrowth без данных
    double estimateGrowthRate(const std::vector<RawStatementPeriod>& statements) const noexcept;

    // FCF = операционный поток + capex, прогноз на projectionYears лет
    Expected<FairValueEstimate> discountedCashFlow(
        const RawStatementPeriod& latest,
        double sharesOutstanding,
        double growthRate,
        const AssumptionSet& assumptions,
        int projectionYears) const;

    Expected<FairValueEstimate> priceToEarnings(
        const RawStatementPeriod& latest,
        double sharesOutstanding,
        double multiple) const;

    Expected<FairValueEstimate> priceToSales(
        const RawStatementPeriod& latest,
        double sharesOutstanding,
        double multiple) const;

    Expected<FairValueEstimate> evToEbitda(
        const RawStatementPeriod& latest,
        double sharesOutstanding,
        double multiple) const;

    static std::string recommendation(double upsidePercent);

private:
    AssumptionCalculator assumptionCalculator_;
};

}  // namespace ipvalue
