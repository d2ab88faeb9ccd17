#include <gtest/gtest.h>
#include "AssetAggregator.hpp"
#include "ValuationMethods.hpp"
#include <vector>

using namespace ipvalue;

// ═══════════════════════════════════════════════════════════════════════════════
// Вспомогательные функции
// ═══════════════════════════════════════════════════════════════════════════════

SegmentSeries makeSeries(const std::string& name, std::vector<double> revenues, double margin) {
    SegmentSeries series;
    series.segmentName = name;
    for (std::size_t i = 0; i < revenues.size(); ++i) {
        series.periodLabels.push_back(std::to_string(2019 + i));
        series.operatingMargins.push_back(margin);
        series.grossMargins.push_back(margin + 0.1);
        series.allocationShares.push_back(0.5);
    }
    series.revenues = std::move(revenues);
    return series;
}

IPAsset makeAsset(const std::string& id,
                  std::vector<SegmentAttribution> segments,
                  MethodParameters parameters = ReliefFromRoyaltyParameters{0.05}) {
    auto asset = IPAsset::create(id, AssetKind::Trademark, "", std::move(segments),
                                 std::move(parameters));
    EXPECT_TRUE(asset.has_value()) << asset.error().message;
    return *asset;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class AssetAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        assumptions = AssumptionSet{0.095, 0.21, 0.025};
        seriesMap["iPhone"] = makeSeries("iPhone", {180.0, 192.0, 205.0, 200.0, 201.0}, 0.30);
        seriesMap["Services"] = makeSeries("Services", {60.0, 68.0, 78.0, 85.0, 96.0}, 0.30);
    }

    AssumptionSet assumptions;
    SegmentSeriesMap seriesMap;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Атрибуция выручки
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(AssetAggregatorTest, AttributeRevenueScalesEachPeriod) {
    auto attributed = attributeRevenue(seriesMap["Services"], 0.25);

    ASSERT_EQ(attributed.size(), 5u);
    EXPECT_DOUBLE_EQ(attributed[0], 15.0);
    EXPECT_DOUBLE_EQ(attributed[4], 24.0);
    // Исходный ряд не меняется
    EXPECT_DOUBLE_EQ(seriesMap["Services"].revenues[0], 60.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Оценка актива
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(AssetAggregatorTest, AssetValueIsSumOfSegments) {
    auto asset = makeAsset("TM-1", {{"iPhone", 0.2}, {"Services", 0.4}});

    auto valuation = aggregateAsset(asset, seriesMap, assumptions);
    ASSERT_TRUE(valuation.has_value()) << valuation.error().message;

    ASSERT_EQ(valuation->segments.size(), 2u);
    EXPECT_EQ(valuation->segments[0].segmentName, "iPhone");
    EXPECT_DOUBLE_EQ(valuation->segments[1].attributionFraction, 0.4);

    const double sum = valuation->segments[0].totalValue + valuation->segments[1].totalValue;
    EXPECT_NEAR(valuation->totalValue, sum, 1e-9);
    EXPECT_NEAR(valuation->totalValue, valuation->pvExplicit + valuation->pvTerminal, 1e-9);
    EXPECT_EQ(valuation->assetKind, "trademark");
}

TEST_F(AssetAggregatorTest, SegmentValueMatchesDirectMethodCall) {
    auto asset = makeAsset("TM-1", {{"iPhone", 0.2}});

    auto valuation = aggregateAsset(asset, seriesMap, assumptions);
    ASSERT_TRUE(valuation.has_value());

    auto direct = reliefFromRoyalty(
        attributeRevenue(seriesMap["iPhone"], 0.2), assumptions, ReliefFromRoyaltyParameters{0.05});
    ASSERT_TRUE(direct.has_value());
    EXPECT_NEAR(valuation->totalValue, direct->totalValue, 1e-9);
}

TEST_F(AssetAggregatorTest, ValueGrowsWithAttribution) {
    const std::vector<MethodParameters> methods{
        ReliefFromRoyaltyParameters{0.05},
        ExcessEarningsParameters{},
        TechnologyFactorParameters{},
        IncrementalIncomeParameters{}
    };

    for (const auto& parameters : methods) {
        const auto method = toString(methodOf(parameters));
        double previous = 0.0;
        for (double fraction : {0.1, 0.2, 0.5, 1.0}) {
            auto asset = makeAsset("IP-1", {{"iPhone", fraction}}, parameters);
            auto valuation = aggregateAsset(asset, seriesMap, assumptions);
            ASSERT_TRUE(valuation.has_value()) << method << ": " << valuation.error().message;
            EXPECT_GT(valuation->totalValue, previous) << method << " at " << fraction;
            previous = valuation->totalValue;
        }
    }
}

TEST_F(AssetAggregatorTest, ExcessEarningsUsesSeriesMargin) {
    ExcessEarningsParameters excess;
    auto asset = makeAsset("TS-1", {{"Services", 0.5}}, excess);

    auto valuation = aggregateAsset(asset, seriesMap, assumptions);
    ASSERT_TRUE(valuation.has_value()) << valuation.error().message;
    EXPECT_DOUBLE_EQ(valuation->segments[0].details.at("operating_margin"), 0.30);
}

TEST_F(AssetAggregatorTest, MissingSeriesIsDataNotFound) {
    auto asset = makeAsset("TM-1", {{"Mac", 0.2}});

    auto valuation = aggregateAsset(asset, seriesMap, assumptions);
    ASSERT_FALSE(valuation.has_value());
    EXPECT_EQ(valuation.error().code, ErrorCode::DataNotFound);
    EXPECT_NE(valuation.error().message.find("TM-1"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Портфель
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(AssetAggregatorTest, PortfolioIsSumOfIndependentAssets) {
    // Пересекающиеся атрибуции на iPhone не нормализуются
    std::vector<IPAsset> assets{
        makeAsset("TM-1", {{"iPhone", 0.6}}),
        makeAsset("PAT-1", {{"iPhone", 0.7}, {"Services", 0.1}}, TechnologyFactorParameters{}),
    };

    auto portfolio = aggregatePortfolio(assets, seriesMap, assumptions);
    ASSERT_TRUE(portfolio.has_value()) << portfolio.error().message;

    double independent = 0.0;
    for (const auto& asset : assets) {
        auto valuation = aggregateAsset(asset, seriesMap, assumptions);
        ASSERT_TRUE(valuation.has_value());
        independent += valuation->totalValue;
    }

    EXPECT_NEAR(portfolio->totalValue, independent, 1e-9);
    ASSERT_EQ(portfolio->assets.size(), 2u);
    EXPECT_EQ(portfolio->assets[0].assetId, "TM-1");
    EXPECT_EQ(portfolio->assets[1].assetId, "PAT-1");
    EXPECT_TRUE(portfolio->skipped.empty());
}

TEST_F(AssetAggregatorTest, StrictModeStopsOnFirstFailure) {
    std::vector<IPAsset> assets{
        makeAsset("TM-1", {{"iPhone", 0.6}}),
        makeAsset("TM-BAD", {{"Wearables", 0.5}}),
    };

    auto portfolio = aggregatePortfolio(assets, seriesMap, assumptions, FailureMode::Strict);
    ASSERT_FALSE(portfolio.has_value());
    EXPECT_EQ(portfolio.error().code, ErrorCode::DataNotFound);
}

TEST_F(AssetAggregatorTest, BestEffortSkipsFailedAsset) {
    std::vector<IPAsset> assets{
        makeAsset("TM-1", {{"iPhone", 0.6}}),
        makeAsset("TM-BAD", {{"Services", 0.3}, {"Wearables", 0.5}}),
        makeAsset("TM-2", {{"Services", 0.3}}),
    };

    auto portfolio = aggregatePortfolio(assets, seriesMap, assumptions, FailureMode::BestEffort);
    ASSERT_TRUE(portfolio.has_value());

    ASSERT_EQ(portfolio->assets.size(), 2u);
    EXPECT_EQ(portfolio->assets[1].assetId, "TM-2");
    ASSERT_EQ(portfolio->skipped.size(), 1u);
    EXPECT_EQ(portfolio->skipped[0].assetId, "TM-BAD");
    EXPECT_EQ(portfolio->skipped[0].error.code, ErrorCode::DataNotFound);

    // Частично оцененный актив не попадает в итог
    EXPECT_NEAR(portfolio->totalValue,
                portfolio->assets[0].totalValue + portfolio->assets[1].totalValue, 1e-9);
}

TEST_F(AssetAggregatorTest, InvalidAssumptionsAbortEvenInBestEffort) {
    std::vector<IPAsset> assets{makeAsset("TM-1", {{"iPhone", 0.6}})};

    AssumptionSet invalid{0.02, 0.21, 0.03};
    auto portfolio = aggregatePortfolio(assets, seriesMap, invalid, FailureMode::BestEffort);
    ASSERT_FALSE(portfolio.has_value());
    EXPECT_EQ(portfolio.error().code, ErrorCode::InvalidAssumptions);
}

TEST_F(AssetAggregatorTest, EmptyPortfolioIsZero) {
    auto portfolio = aggregatePortfolio({}, seriesMap, assumptions);
    ASSERT_TRUE(portfolio.has_value());
    EXPECT_DOUBLE_EQ(portfolio->totalValue, 0.0);
    EXPECT_TRUE(portfolio->assets.empty());
}
