#include <gtest/gtest.h>
#include "InMemoryDataSource.hpp"
#include "ValuationEngine.hpp"
#include <memory>

using namespace ipvalue;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class ValuationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        CompanyData company;
        company.ticker = "AAPL";
        company.name = "Apple Inc.";
        company.snapshot.price = 180.0;
        company.snapshot.marketCap = 2800e9;

        const double revenues[] = {383.0, 394.0, 365.0, 274.0, 260.0};
        const double iphone[] = {200.0, 205.0, 192.0, 138.0, 142.0};
        const double services[] = {85.0, 78.0, 68.0, 54.0, 46.0};

        for (int i = 0; i < 5; ++i) {
            const std::string period = std::to_string(2023 - i);

            RawStatementPeriod statement;
            statement.periodLabel = period;
            statement.revenue = revenues[i];
            statement.grossProfit = revenues[i] * 0.43;
            statement.operatingIncome = revenues[i] * 0.29;
            statement.incomeTaxExpense = 18.0;
            statement.netIncome = 82.0;
            statement.researchAndDevelopment = revenues[i] * 0.07;
            statement.totalDebt = 110.0;
            statement.interestExpense = 3.9;
            company.statements.push_back(statement);

            company.segments["iPhone"].push_back({period, iphone[i]});
            company.segments["Services"].push_back({period, services[i]});
        }

        dataSource = std::make_shared<InMemoryDataSource>();
        dataSource->addCompany(std::move(company));

        assumptions = AssumptionSet{0.095, 0.21, 0.025};
    }

    IPAsset trademark(const std::string& segment, double fraction) const {
        auto asset = IPAsset::create("TM-" + segment, AssetKind::Trademark, "",
                                     {{segment, fraction}}, ReliefFromRoyaltyParameters{0.05});
        EXPECT_TRUE(asset.has_value());
        return *asset;
    }

    std::shared_ptr<InMemoryDataSource> dataSource;
    AssumptionSet assumptions;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Оценка
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ValuationEngineTest, ValueSingleAsset) {
    ValuationEngine engine(dataSource);

    auto valuation = engine.valueAsset("AAPL", trademark("iPhone", 0.2), assumptions);
    ASSERT_TRUE(valuation.has_value()) << valuation.error().message;

    EXPECT_GT(valuation->totalValue, 0.0);
    ASSERT_EQ(valuation->segments.size(), 1u);
    EXPECT_EQ(valuation->segments[0].periods.size(), 5u);
    // Первая строка - самый старый период (2019: 142 * 0.2)
    EXPECT_NEAR(valuation->segments[0].periods[0].revenue, 28.4, 1e-9);
}

TEST_F(ValuationEngineTest, PeriodsOptionLimitsSeries) {
    EngineOptions options;
    options.periods = 3;
    ValuationEngine engine(dataSource, options);

    auto valuation = engine.valueAsset("AAPL", trademark("iPhone", 0.2), assumptions);
    ASSERT_TRUE(valuation.has_value());
    EXPECT_EQ(valuation->segments[0].periods.size(), 3u);
}

TEST_F(ValuationEngineTest, PortfolioSumsAssets) {
    ValuationEngine engine(dataSource);

    std::vector<IPAsset> assets{trademark("iPhone", 0.2), trademark("Services", 0.3)};
    auto portfolio = engine.valuePortfolio("AAPL", assets, assumptions);
    ASSERT_TRUE(portfolio.has_value()) << portfolio.error().message;

    EXPECT_EQ(portfolio->ticker, "AAPL");
    ASSERT_EQ(portfolio->assets.size(), 2u);
    EXPECT_NEAR(portfolio->totalValue,
                portfolio->assets[0].totalValue + portfolio->assets[1].totalValue, 1e-9);
}

TEST_F(ValuationEngineTest, InvalidAssumptionsRejected) {
    ValuationEngine engine(dataSource);

    auto valuation = engine.valueAsset(
        "AAPL", trademark("iPhone", 0.2), AssumptionSet{0.02, 0.21, 0.025});
    ASSERT_FALSE(valuation.has_value());
    EXPECT_EQ(valuation.error().code, ErrorCode::InvalidAssumptions);
}

TEST_F(ValuationEngineTest, UnknownSegmentFailsStrictPortfolio) {
    ValuationEngine engine(dataSource);

    std::vector<IPAsset> assets{trademark("iPhone", 0.2), trademark("Wearables", 0.3)};
    auto portfolio = engine.valuePortfolio("AAPL", assets, assumptions);
    ASSERT_FALSE(portfolio.has_value());
    EXPECT_EQ(portfolio.error().code, ErrorCode::DataNotFound);
    EXPECT_NE(portfolio.error().message.find("TM-Wearables"), std::string::npos);
}

TEST_F(ValuationEngineTest, BestEffortSkipsUnknownSegment) {
    EngineOptions options;
    options.failureMode = FailureMode::BestEffort;
    ValuationEngine engine(dataSource, options);

    std::vector<IPAsset> assets{trademark("iPhone", 0.2), trademark("Wearables", 0.3)};
    auto portfolio = engine.valuePortfolio("AAPL", assets, assumptions);
    ASSERT_TRUE(portfolio.has_value());

    ASSERT_EQ(portfolio->assets.size(), 1u);
    EXPECT_EQ(portfolio->assets[0].assetId, "TM-iPhone");
    ASSERT_EQ(portfolio->skipped.size(), 1u);
    EXPECT_EQ(portfolio->skipped[0].assetId, "TM-Wearables");
    EXPECT_EQ(portfolio->skipped[0].error.code, ErrorCode::DataNotFound);
}

TEST_F(ValuationEngineTest, MatchModeFromOptions) {
    EngineOptions options;
    options.matchMode = SegmentMatchMode::CaseInsensitive;
    ValuationEngine engine(dataSource, options);

    auto valuation = engine.valueAsset("AAPL", trademark("services", 0.3), assumptions);
    ASSERT_TRUE(valuation.has_value()) << valuation.error().message;
    EXPECT_EQ(valuation->segments[0].segmentName, "services");
}

TEST_F(ValuationEngineTest, UnknownTicker) {
    ValuationEngine engine(dataSource);

    auto valuation = engine.valueAsset("MSFT", trademark("iPhone", 0.2), assumptions);
    ASSERT_FALSE(valuation.has_value());
    EXPECT_EQ(valuation.error().code, ErrorCode::DataNotFound);
}

TEST_F(ValuationEngineTest, MissingDataSource) {
    ValuationEngine engine(nullptr);

    auto segments = engine.listSegments("AAPL");
    ASSERT_FALSE(segments.has_value());
    EXPECT_EQ(segments.error().code, ErrorCode::DataSourceFailure);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Допущения, анализ и чувствительность
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(ValuationEngineTest, DeriveAssumptionsFromSource) {
    ValuationEngine engine(dataSource);

    auto derivation = engine.deriveAssumptions("AAPL");
    ASSERT_TRUE(derivation.has_value()) << derivation.error().message;

    EXPECT_NEAR(derivation->assumptions.taxRate, 0.18, 1e-12);
    EXPECT_GT(derivation->assumptions.wacc, derivation->assumptions.terminalGrowth);
    EXPECT_GE(derivation->assumptions.terminalGrowth, 0.01);
    EXPECT_LE(derivation->assumptions.terminalGrowth, 0.04);
}

TEST_F(ValuationEngineTest, DeriveAssumptionsUnknownTicker) {
    ValuationEngine engine(dataSource);

    auto derivation = engine.deriveAssumptions("MSFT");
    ASSERT_FALSE(derivation.has_value());
    EXPECT_EQ(derivation.error().code, ErrorCode::DataNotFound);
}

TEST_F(ValuationEngineTest, FinancialHealthFromSource) {
    ValuationEngine engine(dataSource);

    auto report = engine.analyzeFinancialHealth("AAPL");
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report->ticker, "AAPL");
    EXPECT_EQ(report->latestPeriod, "2023");
}

TEST_F(ValuationEngineTest, SensitivityThroughEngine) {
    ValuationEngine engine(dataSource);

    std::vector<IPAsset> assets{trademark("iPhone", 0.2)};
    auto rows = engine.analyzeSensitivity("AAPL", assets, assumptions);
    ASSERT_TRUE(rows.has_value()) << rows.error().message;
    ASSERT_EQ(rows->size(), 4u);

    auto portfolio = engine.valuePortfolio("AAPL", assets, assumptions);
    ASSERT_TRUE(portfolio.has_value());
    for (const auto& row : *rows) {
        EXPECT_NEAR(row.baseValue, portfolio->totalValue, 1e-9) << row.driver;
    }
}

TEST_F(ValuationEngineTest, ListSegments) {
    ValuationEngine engine(dataSource);

    auto segments = engine.listSegments("AAPL");
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(segments->size(), 2u);
}
