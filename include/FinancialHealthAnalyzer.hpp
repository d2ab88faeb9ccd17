#pragma once

#include "ValuationTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Отчет о финансовом состоянии (справочный, не участвует в оценке)
// ═══════════════════════════════════════════════════════════════════════════════
//
// Коэффициент с нулевым знаменателем не вычисляется и остается пустым.

struct LiquidityHealth {
    std::optional<double> currentRatio;
    std::optional<double> quickRatio;
    std::optional<double> debtToEquity;
    std::optional<double> interestCoverage;  // пусто при нулевых процентах
    std::optional<double> freeCashFlow;      // пусто без данных движения денег
    std::optional<double> fcfMargin;
    std::string assessment;
};

enum class MarginTrend {
    Improving,
    Declining
};

std::string_view toString(MarginTrend trend) noexcept;

struct ProfitabilityMetrics {
    std::optional<double> grossMargin;
    std::optional<double> operatingMargin;
    std::optional<double> netMargin;
    std::optional<double> returnOnEquity;
    std::optional<double> returnOnAssets;

    // Только при трех и более периодах
    std::optional<MarginTrend> grossMarginTrend;
    std::optional<MarginTrend> operatingMarginTrend;

    std::string ipInsight;
};

struct ResearchAndDevelopmentAnalysis {
    double averageIntensity = 0.0;          // по периодам с R&D > 0
    double latestSpend = 0.0;
    std::optional<double> growthRate;
    std::vector<double> history;            // от нового к старому, до 5 периодов
    std::string ipGenerationPotential;
};

struct CapitalStructure {
    double totalDebt = 0.0;
    double shareholdersEquity = 0.0;
    double marketCap = 0.0;
    std::optional<double> debtToAssets;
    std::optional<double> debtToEquity;
    std::optional<double> equityToAssets;
    std::optional<double> marketToBook;
    std::string leverageAssessment;
};

struct MarketPosition {
    double marketCap = 0.0;
    double price = 0.0;
    double enterpriseValue = 0.0;           // капитализация + долг - денежные средства
    std::optional<double> priceToEarnings;
    std::optional<double> evToRevenue;
    std::optional<double> evToEbitda;       // EBITDA ~ операционная прибыль
    std::string marketInsight;
};

struct RiskIndicators {
    std::optional<double> cashToCurrentLiabilities;
    std::optional<double> solvencyRatio;
    double revenueVolatility = 0.0;         // средний модуль изменения выручки
    std::string riskAssessment;
};

struct FinancialHealthReport {
    std::string ticker;
    std::string latestPeriod;
    LiquidityHealth financialHealth;
    ProfitabilityMetrics profitability;
    ResearchAndDevelopmentAnalysis researchAndDevelopment;
    CapitalStructure capitalStructure;
    MarketPosition marketPosition;
    RiskIndicators risk;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Financial Health Analyzer
// ═══════════════════════════════════════════════════════════════════════════════

class FinancialHealthAnalyzer {
public:
    // Пороги качественных оценок
    static constexpr double kHighResearchIntensity = 0.15;
    static constexpr double kModerateResearchIntensity = 0.08;
    static constexpr double kStrongResearchGrowth = 0.10;

    /**
     * @brief Полный анализ по отчетности (от нового периода к старому)
     * @return InsufficientData при пустой отчетности
     */
    Expected<FinancialHealthReport> analyze(
        std::string_view ticker,
        const std::vector<RawStatementPeriod>& statements,
        const MarketSnapshot& snapshot) const;

    LiquidityHealth analyzeLiquidity(const std::vector<RawStatementPeriod>& statements) const;
    ProfitabilityMetrics analyzeProfitability(const std::vector<RawStatementPeriod>& statements) const;
    ResearchAndDevelopmentAnalysis analyzeResearch(const std::vector<RawStatementPeriod>& statements) const;
    CapitalStructure analyzeCapitalStructure(
        const std::vector<RawStatementPeriod>& statements,
        const MarketSnapshot& snapshot) const;
    MarketPosition analyzeMarketPosition(
        const std::vector<RawStatementPeriod>& statements,
        const MarketSnapshot& snapshot) const;
    RiskIndicators analyzeRisk(const std::vector<RawStatementPeriod>& statements) const;

    // Качественные оценки
    static std::string assessFinancialHealth(
        std::optional<double> currentRatio,
        std::optional<double> debtToEquity,
        std::optional<double> interestCoverage);
    static std::string profitabilityInsight(std::optional<double> grossMargin);
    static std::string assessIpPotential(double researchIntensity, std::optional<double> researchGrowth);
    static std::string assessLeverage(std::optional<double> debtToEquity);
    static std::string marketPositionInsight(std::optional<double> evToRevenue);
    static std::string assessRisk(
        std::optional<double> cashToCurrentLiabilities,
        std::optional<double> solvencyRatio);
};

}  // namespace ipvalue
