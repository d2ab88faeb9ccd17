#include <gtest/gtest.h>
#include "FairValueCalculator.hpp"
#include <cmath>
#include <vector>

using namespace ipvalue;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class FairValueTest : public ::testing::Test {
protected:
    void SetUp() override {
        RawStatementPeriod latest;
        latest.periodLabel = "2023";
        latest.revenue = 400.0;
        latest.operatingIncome = 120.0;
        latest.netIncome = 100.0;
        latest.incomeTaxExpense = 25.0;
        latest.interestExpense = 4.0;
        latest.totalDebt = 110.0;
        latest.cashAndEquivalents = 30.0;
        latest.operatingCashFlow = 110.0;
        latest.capitalExpenditure = -11.0;

        RawStatementPeriod prior = latest;
        prior.periodLabel = "2022";
        prior.revenue = 390.0;

        RawStatementPeriod oldest = latest;
        oldest.periodLabel = "2021";
        oldest.revenue = 360.0;

        statements = {latest, prior, oldest};

        snapshot.price = 180.0;
        snapshot.marketCap = 2880.0;   // 16 акций

        parameters.wacc = 0.10;
        parameters.growthRate = 0.05;
    }

    // Та же модель, что и в калькуляторе: 5 лет прогноза + терминальная стоимость
    static double expectedDcfPerShare(double fcf, double growth, double wacc,
                                      double terminal, double debt, double cash,
                                      double shares) {
        double pv = 0.0;
        double last = fcf;
        for (int year = 1; year <= 5; ++year) {
            last = fcf * std::pow(1.0 + growth, year);
            pv += last / std::pow(1.0 + wacc, year);
        }
        const double tv = last * (1.0 + terminal) / (wacc - terminal);
        return (pv + tv / std::pow(1.0 + wacc, 5) - debt + cash) / shares;
    }

    FairValueCalculator calculator;
    std::vector<RawStatementPeriod> statements;
    MarketSnapshot snapshot;
    FairValueParameters parameters;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Рост
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(FairValueTest, GrowthAveragedOverRevenuePairs) {
    const double expected = ((400.0 - 390.0) / 390.0 + (390.0 - 360.0) / 360.0) / 2.0;
    EXPECT_NEAR(calculator.estimateGrowthRate(statements), expected, 1e-12);
}

TEST_F(FairValueTest, GrowthOutliersIgnored) {
    statements[1].revenue = 100.0;   // +300% и затем -72%
    EXPECT_DOUBLE_EQ(calculator.estimateGrowthRate(statements),
                     FairValueCalculator::kDefaultGrowth);
}

TEST_F(FairValueTest, GrowthClampedToCeiling) {
    statements[0].revenue = 700.0;
    statements[1].revenue = 400.0;
    statements[2].revenue = 220.0;
    EXPECT_DOUBLE_EQ(calculator.estimateGrowthRate(statements),
                     FairValueCalculator::kGrowthCeiling);
}

TEST_F(FairValueTest, SinglePeriodUsesDefaultGrowth) {
    statements.resize(1);
    EXPECT_DOUBLE_EQ(calculator.estimateGrowthRate(statements),
                     FairValueCalculator::kDefaultGrowth);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Методы
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(FairValueTest, DiscountedCashFlowPerShare) {
    AssumptionSet assumptions{0.10, 0.21, 0.025};
    auto estimate = calculator.discountedCashFlow(statements[0], 16.0, 0.05, assumptions, 5);

    ASSERT_TRUE(estimate.has_value()) << estimate.error().message;
    ASSERT_EQ(estimate->projectedCashFlows.size(), 5u);
    EXPECT_NEAR(estimate->projectedCashFlows.front(), 99.0 * 1.05, 1e-9);
    EXPECT_NEAR(estimate->details.at("free_cash_flow"), 99.0, 1e-12);
    EXPECT_NEAR(*estimate->fairValuePerShare,
                expectedDcfPerShare(99.0, 0.05, 0.10, 0.025, 110.0, 30.0, 16.0), 1e-9);
}

TEST_F(FairValueTest, NegativeFreeCashFlowRejected) {
    statements[0].capitalExpenditure = -150.0;
    AssumptionSet assumptions{0.10, 0.21, 0.025};

    auto estimate = calculator.discountedCashFlow(statements[0], 16.0, 0.05, assumptions, 5);
    ASSERT_FALSE(estimate.has_value());
    EXPECT_EQ(estimate.error().code, ErrorCode::InsufficientData);
}

TEST_F(FairValueTest, MultiplesPerShare) {
    auto pe = calculator.priceToEarnings(statements[0], 16.0, 20.0);
    auto ps = calculator.priceToSales(statements[0], 16.0, 3.0);
    auto ev = calculator.evToEbitda(statements[0], 16.0, 12.0);

    ASSERT_TRUE(pe.has_value());
    ASSERT_TRUE(ps.has_value());
    ASSERT_TRUE(ev.has_value());
    EXPECT_NEAR(*pe->fairValuePerShare, 125.0, 1e-9);
    EXPECT_NEAR(*ps->fairValuePerShare, 75.0, 1e-9);
    EXPECT_NEAR(*ev->fairValuePerShare, (1440.0 - 110.0 + 30.0) / 16.0, 1e-9);
}

TEST_F(FairValueTest, LossMakingCompanyHasNoEarningsValue) {
    statements[0].netIncome = -5.0;
    statements[0].operatingIncome = 0.0;

    EXPECT_FALSE(calculator.priceToEarnings(statements[0], 16.0, 20.0).has_value());
    EXPECT_FALSE(calculator.evToEbitda(statements[0], 16.0, 12.0).has_value());
    EXPECT_TRUE(calculator.priceToSales(statements[0], 16.0, 3.0).has_value());
}

TEST(FairValueRecommendationTest, Thresholds) {
    EXPECT_EQ(FairValueCalculator::recommendation(31.0), "Strong Buy - Significantly Undervalued");
    EXPECT_EQ(FairValueCalculator::recommendation(30.0), "Buy - Undervalued");
    EXPECT_EQ(FairValueCalculator::recommendation(15.0), "Hold - Fairly Valued");
    EXPECT_EQ(FairValueCalculator::recommendation(-10.0), "Sell - Overvalued");
    EXPECT_EQ(FairValueCalculator::recommendation(-25.0), "Strong Sell - Significantly Overvalued");
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Полный отчет
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(FairValueTest, ReportAveragesAllMethods) {
    auto report = calculator.calculate("AAPL", statements, snapshot, parameters);

    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_DOUBLE_EQ(report->sharesOutstanding, 16.0);
    EXPECT_EQ(report->waccSource, AssumptionSource::Override);
    EXPECT_FALSE(report->growthEstimated);
    ASSERT_EQ(report->estimates.size(), 4u);

    const double dcf = expectedDcfPerShare(99.0, 0.05, 0.10, 0.025, 110.0, 30.0, 16.0);
    const double average = (dcf + 125.0 + 75.0 + 85.0) / 4.0;
    ASSERT_TRUE(report->averageFairValue.has_value());
    EXPECT_NEAR(*report->averageFairValue, average, 1e-9);
    EXPECT_NEAR(report->upsidePercent, (average - 180.0) / 180.0 * 100.0, 1e-9);
    EXPECT_EQ(report->recommendation, "Strong Sell - Significantly Overvalued");
}

TEST_F(FairValueTest, FailedMethodRecordedAndExcludedFromAverage) {
    statements[0].operatingCashFlow = 0.0;

    auto report = calculator.calculate("AAPL", statements, snapshot, parameters);
    ASSERT_TRUE(report.has_value());

    const auto& dcf = report->estimates.front();
    EXPECT_EQ(dcf.method, FairValueMethod::DiscountedCashFlow);
    EXPECT_FALSE(dcf.fairValuePerShare.has_value());
    ASSERT_TRUE(dcf.failure.has_value());
    EXPECT_EQ(dcf.failure->code, ErrorCode::InsufficientData);

    EXPECT_NEAR(*report->averageFairValue, (125.0 + 75.0 + 85.0) / 3.0, 1e-9);
}

TEST_F(FairValueTest, NoApplicableMethodLeavesAverageEmpty) {
    for (auto& period : statements) {
        period.revenue = 0.0;
        period.netIncome = -1.0;
        period.operatingIncome = -1.0;
        period.operatingCashFlow = -1.0;
    }

    auto report = calculator.calculate("AAPL", statements, snapshot, parameters);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->averageFairValue.has_value());
    EXPECT_EQ(report->recommendation, "Hold - Fairly Valued");
}

TEST_F(FairValueTest, GrowthEstimatedWhenNotGiven) {
    parameters.growthRate.reset();

    auto report = calculator.calculate("AAPL", statements, snapshot, parameters);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->growthEstimated);
    EXPECT_NEAR(report->growthRate, calculator.estimateGrowthRate(statements), 1e-12);
}

TEST_F(FairValueTest, WaccDerivedWhenNotGiven) {
    parameters.wacc.reset();

    auto report = calculator.calculate("AAPL", statements, snapshot, parameters);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report->waccSource, AssumptionSource::Derived);
    EXPECT_DOUBLE_EQ(report->terminalGrowth, 0.025);
    EXPECT_GT(report->wacc, report->terminalGrowth);
}

TEST_F(FairValueTest, WaccBelowTerminalGrowthRejected) {
    parameters.wacc = 0.02;

    auto report = calculator.calculate("AAPL", statements, snapshot, parameters);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::InvalidAssumptions);
}

TEST_F(FairValueTest, MissingMarketDataRejected) {
    snapshot.price = 0.0;

    auto report = calculator.calculate("AAPL", statements, snapshot, parameters);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::DivisionUndefined);
}

TEST_F(FairValueTest, EmptyStatementsRejected) {
    auto report = calculator.calculate("AAPL", {}, snapshot, parameters);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::InsufficientData);
}
