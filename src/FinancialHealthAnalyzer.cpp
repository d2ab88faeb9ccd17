#include "FinancialHealthAnalyzer.hpp"
#include <cmath>

namespace ipvalue {

namespace {

// Отношение определено только при положительном знаменателе
std::optional<double> ratio(double numerator, double denominator)
{
    if (denominator <= 0.0) {
        return std::nullopt;
    }
    return numerator / denominator;
}

std::optional<MarginTrend> marginTrend(const std::vector<double>& margins)
{
    if (margins.size() < 2) {
        return std::nullopt;
    }
    return margins[0] > margins[1] ? MarginTrend::Improving : MarginTrend::Declining;
}

}  // namespace

std::string_view toString(MarginTrend trend) noexcept
{
    return trend == MarginTrend::Improving ? "improving" : "declining";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Полный анализ
// ═══════════════════════════════════════════════════════════════════════════════

Expected<FinancialHealthReport> FinancialHealthAnalyzer::analyze(
    std::string_view ticker,
    const std::vector<RawStatementPeriod>& statements,
    const MarketSnapshot& snapshot) const
{
    if (statements.empty()) {
        return makeError(ErrorCode::InsufficientData,
                         "No statements available for financial health analysis of " +
                         std::string(ticker));
    }

    FinancialHealthReport report;
    report.ticker = std::string(ticker);
    report.latestPeriod = statements.front().periodLabel;
    report.financialHealth = analyzeLiquidity(statements);
    report.profitability = analyzeProfitability(statements);
    report.researchAndDevelopment = analyzeResearch(statements);
    report.capitalStructure = analyzeCapitalStructure(statements, snapshot);
    report.marketPosition = analyzeMarketPosition(statements, snapshot);
    report.risk = analyzeRisk(statements);

    return report;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Финансовое здоровье
// ═══════════════════════════════════════════════════════════════════════════════

LiquidityHealth FinancialHealthAnalyzer::analyzeLiquidity(
    const std::vector<RawStatementPeriod>& statements) const
{
    LiquidityHealth health;
    if (statements.empty()) {
        return health;
    }

    const auto& latest = statements.front();

    health.currentRatio = ratio(latest.currentAssets, latest.currentLiabilities);
    health.quickRatio = ratio(latest.cashAndEquivalents + latest.receivables,
                              latest.currentLiabilities);
    health.debtToEquity = ratio(latest.totalDebt, latest.shareholdersEquity);
    health.interestCoverage = ratio(latest.operatingIncome, latest.interestExpense);

    if (latest.operatingCashFlow != 0.0 || latest.capitalExpenditure != 0.0) {
        // capex отрицательный
        health.freeCashFlow = latest.operatingCashFlow + latest.capitalExpenditure;
        health.fcfMargin = ratio(*health.freeCashFlow, latest.revenue);
    }

    health.assessment = assessFinancialHealth(
        health.currentRatio, health.debtToEquity, health.interestCoverage);

    return health;
}

std::string FinancialHealthAnalyzer::assessFinancialHealth(
    std::optional<double> currentRatio,
    std::optional<double> debtToEquity,
    std::optional<double> interestCoverage)
{
    int score = 0;

    if (currentRatio && *currentRatio > 1.5) {
        score += 3;
    } else if (currentRatio && *currentRatio > 1.0) {
        score += 2;
    } else {
        score += 1;
    }

    // Неположительный капитал оценивается как худший случай
    if (debtToEquity && *debtToEquity < 0.5) {
        score += 3;
    } else if (debtToEquity && *debtToEquity < 1.0) {
        score += 2;
    } else {
        score += 1;
    }

    // Без процентных расходов покрытие не ограничено
    if (!interestCoverage || *interestCoverage > 10.0) {
        score += 3;
    } else if (*interestCoverage > 5.0) {
        score += 2;
    } else {
        score += 1;
    }

    if (score >= 8) {
        return "Excellent - Strong financial position supports IP development";
    }
    if (score >= 6) {
        return "Good - Healthy balance sheet for IP investment";
    }
    if (score >= 4) {
        return "Moderate - Some financial constraints on IP spending";
    }
    return "Weak - Financial stress may limit IP development";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Рентабельность
// ═══════════════════════════════════════════════════════════════════════════════

ProfitabilityMetrics FinancialHealthAnalyzer::analyzeProfitability(
    const std::vector<RawStatementPeriod>& statements) const
{
    ProfitabilityMetrics metrics;
    if (statements.empty()) {
        return metrics;
    }

    const auto& latest = statements.front();

    metrics.grossMargin = ratio(latest.grossProfit, latest.revenue);
    metrics.operatingMargin = ratio(latest.operatingIncome, latest.revenue);
    metrics.netMargin = ratio(latest.netIncome, latest.revenue);
    metrics.returnOnEquity = ratio(latest.netIncome, latest.shareholdersEquity);
    metrics.returnOnAssets = ratio(latest.netIncome, latest.totalAssets);

    if (statements.size() >= 3) {
        std::vector<double> grossMargins;
        std::vector<double> operatingMargins;
        for (std::size_t i = 0; i < 3; ++i) {
            const auto& statement = statements[i];
            if (statement.revenue > 0.0) {
                grossMargins.push_back(statement.grossProfit / statement.revenue);
                operatingMargins.push_back(statement.operatingIncome / statement.revenue);
            }
        }
        metrics.grossMarginTrend = marginTrend(grossMargins);
        metrics.operatingMarginTrend = marginTrend(operatingMargins);
    }

    metrics.ipInsight = profitabilityInsight(metrics.grossMargin);
    return metrics;
}

std::string FinancialHealthAnalyzer::profitabilityInsight(std::optional<double> grossMargin)
{
    const double margin = grossMargin.value_or(0.0);
    if (margin > 0.6) {
        return "High gross margins suggest strong IP/brand pricing power";
    }
    if (margin > 0.4) {
        return "Healthy margins indicate IP contributing to competitive advantage";
    }
    return "Lower margins may indicate IP is less differentiated";
}

// ═══════════════════════════════════════════════════════════════════════════════
// R&D
// ═══════════════════════════════════════════════════════════════════════════════

ResearchAndDevelopmentAnalysis FinancialHealthAnalyzer::analyzeResearch(
    const std::vector<RawStatementPeriod>& statements) const
{
    ResearchAndDevelopmentAnalysis analysis;
    if (statements.empty()) {
        return analysis;
    }

    double intensitySum = 0.0;
    std::size_t intensityCount = 0;

    for (const auto& statement : statements) {
        if (analysis.history.size() < 5) {
            analysis.history.push_back(statement.researchAndDevelopment);
        }
        if (statement.revenue > 0.0 && statement.researchAndDevelopment > 0.0) {
            intensitySum += statement.researchAndDevelopment / statement.revenue;
            ++intensityCount;
        }
    }

    if (intensityCount > 0) {
        analysis.averageIntensity = intensitySum / static_cast<double>(intensityCount);
    }

    analysis.latestSpend = statements.front().researchAndDevelopment;

    if (statements.size() >= 2) {
        const double prior = statements[1].researchAndDevelopment;
        analysis.growthRate = ratio(analysis.latestSpend - prior, prior);
    }

    analysis.ipGenerationPotential = assessIpPotential(analysis.averageIntensity, analysis.growthRate);
    return analysis;
}

std::string FinancialHealthAnalyzer::assessIpPotential(
    double researchIntensity,
    std::optional<double> researchGrowth)
{
    if (researchIntensity > kHighResearchIntensity) {
        if (researchGrowth && *researchGrowth > kStrongResearchGrowth) {
            return "Excellent - Heavy R&D investment with growth suggests strong IP pipeline";
        }
        return "Good - Significant R&D spend indicates active IP development";
    }
    if (researchIntensity > kModerateResearchIntensity) {
        return "Moderate - Average R&D investment for IP generation";
    }
    return "Low - Limited R&D suggests less IP-intensive business model";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Структура капитала
// ═══════════════════════════════════════════════════════════════════════════════

CapitalStructure FinancialHealthAnalyzer::analyzeCapitalStructure(
    const std::vector<RawStatementPeriod>& statements,
    const MarketSnapshot& snapshot) const
{
    CapitalStructure structure;
    structure.marketCap = snapshot.marketCap;
    if (statements.empty()) {
        structure.leverageAssessment = assessLeverage(std::nullopt);
        return structure;
    }

    const auto& latest = statements.front();

    structure.totalDebt = latest.totalDebt;
    structure.shareholdersEquity = latest.shareholdersEquity;
    structure.debtToAssets = ratio(latest.totalDebt, latest.totalAssets);
    structure.debtToEquity = ratio(latest.totalDebt, latest.shareholdersEquity);
    structure.equityToAssets = ratio(latest.shareholdersEquity, latest.totalAssets);
    structure.marketToBook = ratio(snapshot.marketCap, latest.shareholdersEquity);
    structure.leverageAssessment = assessLeverage(structure.debtToEquity);

    return structure;
}

std::string FinancialHealthAnalyzer::assessLeverage(std::optional<double> debtToEquity)
{
    if (!debtToEquity) {
        return "Undetermined - Shareholders' equity is not positive";
    }
    if (*debtToEquity < 0.3) {
        return "Conservative - Low debt supports IP investment flexibility";
    }
    if (*debtToEquity < 0.7) {
        return "Moderate - Balanced capital structure";
    }
    if (*debtToEquity < 1.5) {
        return "Elevated - Higher debt may constrain IP spending";
    }
    return "High - Significant leverage limits financial flexibility";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Рыночная позиция
// ═══════════════════════════════════════════════════════════════════════════════

MarketPosition FinancialHealthAnalyzer::analyzeMarketPosition(
    const std::vector<RawStatementPeriod>& statements,
    const MarketSnapshot& snapshot) const
{
    MarketPosition position;
    position.marketCap = snapshot.marketCap;
    position.price = snapshot.price;
    if (statements.empty()) {
        position.marketInsight = marketPositionInsight(std::nullopt);
        return position;
    }

    const auto& latest = statements.front();

    position.enterpriseValue =
        snapshot.marketCap + latest.totalDebt - latest.cashAndEquivalents;

    auto eps = ratio(latest.netIncome, latest.sharesOutstanding);
    if (eps) {
        position.priceToEarnings = ratio(snapshot.price, *eps);
    }

    position.evToRevenue = ratio(position.enterpriseValue, latest.revenue);
    // Упрощение: EBITDA = операционная прибыль
    position.evToEbitda = ratio(position.enterpriseValue, latest.operatingIncome);
    position.marketInsight = marketPositionInsight(position.evToRevenue);

    return position;
}

std::string FinancialHealthAnalyzer::marketPositionInsight(std::optional<double> evToRevenue)
{
    const double multiple = evToRevenue.value_or(0.0);
    if (multiple > 10.0) {
        return "Premium valuation suggests market values IP/intangibles highly";
    }
    if (multiple > 5.0) {
        return "Above-average valuation indicates IP contributes to market value";
    }
    return "Standard valuation multiples";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Риски
// ═══════════════════════════════════════════════════════════════════════════════

RiskIndicators FinancialHealthAnalyzer::analyzeRisk(
    const std::vector<RawStatementPeriod>& statements) const
{
    RiskIndicators risk;
    if (statements.empty()) {
        risk.riskAssessment = assessRisk(std::nullopt, std::nullopt);
        return risk;
    }

    const auto& latest = statements.front();

    risk.cashToCurrentLiabilities = ratio(latest.cashAndEquivalents, latest.currentLiabilities);
    risk.solvencyRatio = ratio(latest.totalAssets - latest.totalLiabilities, latest.totalAssets);

    if (statements.size() >= 3) {
        double changeSum = 0.0;
        std::size_t changeCount = 0;
        for (std::size_t i = 0; i < 2; ++i) {
            const double prior = statements[i + 1].revenue;
            if (prior > 0.0) {
                changeSum += std::abs((statements[i].revenue - prior) / prior);
                ++changeCount;
            }
        }
        if (changeCount > 0) {
            risk.revenueVolatility = changeSum / static_cast<double>(changeCount);
        }
    }

    risk.riskAssessment = assessRisk(risk.cashToCurrentLiabilities, risk.solvencyRatio);
    return risk;
}

std::string FinancialHealthAnalyzer::assessRisk(
    std::optional<double> cashToCurrentLiabilities,
    std::optional<double> solvencyRatio)
{
    const double liquidity = cashToCurrentLiabilities.value_or(0.0);
    const double solvency = solvencyRatio.value_or(0.0);

    if (liquidity > 0.5 && solvency > 0.3) {
        return "Low Risk - Strong financial position supports IP value stability";
    }
    if (liquidity > 0.3 && solvency > 0.2) {
        return "Moderate Risk - Adequate financial cushion";
    }
    return "Higher Risk - Financial constraints may affect IP development/value";
}

}  // namespace ipvalue
