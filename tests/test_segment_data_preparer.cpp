#include <gtest/gtest.h>
#include "InMemoryDataSource.hpp"
#include "SegmentDataPreparer.hpp"
#include <memory>

using namespace ipvalue;

// ═══════════════════════════════════════════════════════════════════════════════
// Вспомогательные функции
// ═══════════════════════════════════════════════════════════════════════════════

RawStatementPeriod makeStatement(const std::string& period, double revenue) {
    RawStatementPeriod statement;
    statement.periodLabel = period;
    statement.revenue = revenue;
    statement.grossProfit = revenue * 0.4;
    statement.operatingIncome = revenue * 0.3;
    statement.researchAndDevelopment = revenue * 0.08;
    return statement;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class SegmentDataPreparerTest : public ::testing::Test {
protected:
    void SetUp() override {
        CompanyData company;
        company.ticker = "AAPL";
        company.name = "Apple Inc.";
        company.statements = {
            makeStatement("2021", 365.0),
            makeStatement("2023", 383.0),
            makeStatement("2022", 394.0)
        };
        company.segments["iPhone"] = {
            {"2023", 200.0}, {"2022", 205.0}, {"2021", 192.0}
        };
        company.segments["Wearables, Home and Accessories"] = {
            {"2023", 40.0}, {"2022", 41.0}
        };

        dataSource = std::make_shared<InMemoryDataSource>();
        dataSource->addCompany(std::move(company));
    }

    std::shared_ptr<InMemoryDataSource> dataSource;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Подготовка ряда
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SegmentDataPreparerTest, SeriesIsChronological) {
    SegmentDataPreparer preparer;

    auto series = preparer.prepare(*dataSource, "AAPL", "iPhone", 5);
    ASSERT_TRUE(series.has_value()) << series.error().message;

    ASSERT_EQ(series->periods(), 3u);
    EXPECT_EQ(series->periodLabels.front(), "2021");
    EXPECT_EQ(series->periodLabels.back(), "2023");
    EXPECT_DOUBLE_EQ(series->revenues.back(), 200.0);
}

TEST_F(SegmentDataPreparerTest, ProportionalAllocation) {
    SegmentDataPreparer preparer;

    auto series = preparer.prepare(*dataSource, "AAPL", "iPhone", 5);
    ASSERT_TRUE(series.has_value());

    // 2023: 200 / 383
    const double share = 200.0 / 383.0;
    EXPECT_NEAR(series->allocationShares.back(), share, 1e-12);
    EXPECT_NEAR(series->grossProfits.back(), 383.0 * 0.4 * share, 1e-9);
    EXPECT_NEAR(series->rdExpenses.back(), 383.0 * 0.08 * share, 1e-9);
    EXPECT_NEAR(series->operatingIncomes.back(), 383.0 * 0.3 * share, 1e-9);
    EXPECT_NEAR(series->grossMargins.back(), 0.4, 1e-12);

    auto margin = series->averageOperatingMargin();
    ASSERT_TRUE(margin.has_value());
    EXPECT_NEAR(*margin, 0.3, 1e-12);
}

TEST_F(SegmentDataPreparerTest, PeriodsLimitKeepsLatest) {
    SegmentDataPreparer preparer;

    auto series = preparer.prepare(*dataSource, "AAPL", "iPhone", 2);
    ASSERT_TRUE(series.has_value());

    ASSERT_EQ(series->periods(), 2u);
    EXPECT_EQ(series->periodLabels.front(), "2022");
    EXPECT_EQ(series->periodLabels.back(), "2023");
}

TEST_F(SegmentDataPreparerTest, ZeroCompanyRevenueGivesZeroShare) {
    std::vector<SegmentRevenuePoint> revenues{{"2023", 10.0}};
    std::vector<RawStatementPeriod> statements{makeStatement("2023", 0.0)};

    SegmentDataPreparer preparer;
    auto series = preparer.buildSeries("Services", revenues, statements, 5);
    ASSERT_TRUE(series.has_value());

    EXPECT_DOUBLE_EQ(series->allocationShares[0], 0.0);
    EXPECT_DOUBLE_EQ(series->grossProfits[0], 0.0);
}

TEST_F(SegmentDataPreparerTest, PeriodsWithoutStatementsDropped) {
    std::vector<SegmentRevenuePoint> revenues{{"2024", 12.0}, {"2023", 10.0}};
    std::vector<RawStatementPeriod> statements{makeStatement("2023", 100.0)};

    SegmentDataPreparer preparer;
    auto series = preparer.buildSeries("Services", revenues, statements, 5);
    ASSERT_TRUE(series.has_value());

    ASSERT_EQ(series->periods(), 1u);
    EXPECT_EQ(series->periodLabels[0], "2023");
}

TEST_F(SegmentDataPreparerTest, NoAlignedPeriodsIsInsufficientData) {
    std::vector<SegmentRevenuePoint> revenues{{"2024", 12.0}};
    std::vector<RawStatementPeriod> statements{makeStatement("2023", 100.0)};

    SegmentDataPreparer preparer;
    auto series = preparer.buildSeries("Services", revenues, statements, 5);
    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ErrorCode::InsufficientData);
}

TEST_F(SegmentDataPreparerTest, CustomAllocationStrategy) {
    AllocationStrategies strategies;
    strategies.researchAndDevelopment = [](double, double, double) { return 7.0; };

    SegmentDataPreparer preparer(SegmentMatchMode::Exact, strategies);
    auto series = preparer.prepare(*dataSource, "AAPL", "iPhone", 5);
    ASSERT_TRUE(series.has_value());

    for (double rd : series->rdExpenses) {
        EXPECT_DOUBLE_EQ(rd, 7.0);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Сопоставление имен сегментов
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(SegmentDataPreparerTest, UnknownSegmentIsDataNotFound) {
    SegmentDataPreparer preparer;

    auto series = preparer.prepare(*dataSource, "AAPL", "Vision Pro", 5);
    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ErrorCode::DataNotFound);
    // Сообщение перечисляет доступные сегменты
    EXPECT_NE(series.error().message.find("iPhone"), std::string::npos);
}

TEST_F(SegmentDataPreparerTest, ExactModeIsCaseSensitive) {
    SegmentDataPreparer preparer(SegmentMatchMode::Exact);

    auto series = preparer.prepare(*dataSource, "AAPL", "iphone", 5);
    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ErrorCode::DataNotFound);
}

TEST_F(SegmentDataPreparerTest, CaseInsensitiveMode) {
    SegmentDataPreparer preparer(SegmentMatchMode::CaseInsensitive);

    auto series = preparer.prepare(*dataSource, "AAPL", "IPHONE", 5);
    ASSERT_TRUE(series.has_value());
    // Имя результата - как запрошено активом
    EXPECT_EQ(series->segmentName, "IPHONE");
}

TEST_F(SegmentDataPreparerTest, NormalizedModeIgnoresSpacesAndHyphens) {
    SegmentDataPreparer preparer(SegmentMatchMode::Normalized);

    auto series = preparer.prepare(*dataSource, "AAPL", "i-Phone", 5);
    ASSERT_TRUE(series.has_value());

    auto strict = SegmentDataPreparer(SegmentMatchMode::CaseInsensitive)
        .prepare(*dataSource, "AAPL", "i-Phone", 5);
    EXPECT_FALSE(strict.has_value());
}

TEST_F(SegmentDataPreparerTest, UnknownTickerIsDataNotFound) {
    SegmentDataPreparer preparer;

    auto series = preparer.prepare(*dataSource, "MSFT", "iPhone", 5);
    ASSERT_FALSE(series.has_value());
    EXPECT_EQ(series.error().code, ErrorCode::DataNotFound);
}

TEST(SegmentMatchModeTest, ParseNames) {
    EXPECT_EQ(parseSegmentMatchMode("normalized"), SegmentMatchMode::Normalized);
    EXPECT_EQ(toString(SegmentMatchMode::CaseInsensitive), "case-insensitive");
    EXPECT_FALSE(parseSegmentMatchMode("fuzzy").has_value());
}

TEST(SegmentMatchModeTest, MatchKeysPerMode) {
    EXPECT_EQ(segmentMatchKey("Wearables, Home-and Accessories", SegmentMatchMode::Exact),
              "Wearables, Home-and Accessories");
    EXPECT_EQ(segmentMatchKey("Wearables, Home-and Accessories", SegmentMatchMode::CaseInsensitive),
              "wearables, home-and accessories");
    EXPECT_EQ(segmentMatchKey("Wearables, Home-and Accessories", SegmentMatchMode::Normalized),
              "wearables,homeandaccessories");

    EXPECT_EQ(foldCase("iPhone"), "iphone");
    EXPECT_TRUE(segmentNamesMatch("i-Phone", "IPHONE", SegmentMatchMode::Normalized));
    EXPECT_FALSE(segmentNamesMatch("i-Phone", "IPHONE", SegmentMatchMode::CaseInsensitive));
}
