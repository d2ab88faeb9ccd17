#include <gtest/gtest.h>
#include "JsonCodec.hpp"
#include "JsonFileDataSource.hpp"
#include <filesystem>
#include <fstream>

using namespace ipvalue;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class JsonCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        testFile = std::filesystem::temp_directory_path() / "ipvalue_test_companies.json";
        std::filesystem::remove(testFile);
    }

    void TearDown() override {
        std::filesystem::remove(testFile);
    }

    json companiesJson() const {
        return json::parse(R"({
            "companies": [{
                "ticker": "AAPL",
                "name": "Apple Inc.",
                "snapshot": {"price": 180.0, "market_cap": 2800000000000.0},
                "statements": [
                    {"period": "2022", "revenue": 394.0, "net_income": 99.8},
                    {"period": "2023", "revenue": 383.0, "net_income": 97.0}
                ],
                "segments": [
                    {"period": "2022", "revenues": {"iPhone": 205.0, "Services": 78.0}},
                    {"period": "2023", "revenues": {"iPhone": 200.0, "Services": 85.0}}
                ]
            }]
        })");
    }

    std::filesystem::path testFile;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Определения активов
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(JsonCodecTest, ParseAssetsObject) {
    auto j = json::parse(R"({
        "assets": [
            {
                "id": "TM-IPHONE-001",
                "kind": "trademark",
                "method": "relief_from_royalty",
                "segments": [{"name": "iPhone", "attribution": 0.25}],
                "parameters": {"royalty_rate": 0.06}
            },
            {
                "id": "PAT-CHIP-SHARED-001",
                "kind": "patent",
                "method": "technology_factor",
                "segments": [{"name": "iPhone", "attribution": 0.12}, {"name": "Mac", "attribution": 0.12}],
                "parameters": {"royalty_rate": 0.05, "innovation_score": 0.92, "remaining_life_years": 12}
            }
        ]
    })");

    auto assets = parseAssets(j);
    ASSERT_TRUE(assets.has_value()) << assets.error().message;
    ASSERT_EQ(assets->size(), 2u);

    EXPECT_DOUBLE_EQ(std::get<ReliefFromRoyaltyParameters>((*assets)[0].parameters()).royaltyRate, 0.06);

    const auto& technology = std::get<TechnologyFactorParameters>((*assets)[1].parameters());
    // royalty_rate принимается как базовая ставка
    EXPECT_DOUBLE_EQ(technology.baseRoyaltyRate, 0.05);
    EXPECT_DOUBLE_EQ(technology.innovationScore, 0.92);
    EXPECT_EQ(technology.remainingLifeYears, 12);
    EXPECT_EQ(technology.totalLifeYears, 20);
}

TEST_F(JsonCodecTest, ParseAssetsArrayWithDefaults) {
    auto j = json::parse(R"([{"id": "X", "segments": [{"name": "Mac"}]}])");

    auto assets = parseAssets(j);
    ASSERT_TRUE(assets.has_value());
    EXPECT_EQ((*assets)[0].kind(), AssetKind::Other);
    EXPECT_EQ((*assets)[0].method(), ValuationMethod::ReliefFromRoyalty);
    EXPECT_DOUBLE_EQ((*assets)[0].segments()[0].fraction, 1.0);
}

TEST_F(JsonCodecTest, UnknownMethodRejected) {
    auto j = json::parse(R"([{"id": "X", "method": "dcf", "segments": [{"name": "Mac"}]}])");

    auto assets = parseAssets(j);
    ASSERT_FALSE(assets.has_value());
    EXPECT_EQ(assets.error().code, ErrorCode::ParameterOutOfRange);
}

TEST_F(JsonCodecTest, MissingFieldIsDataSourceFailure) {
    auto j = json::parse(R"({"assets": [{"segments": []}]})");

    auto assets = parseAssets(j);
    ASSERT_FALSE(assets.has_value());
    EXPECT_EQ(assets.error().code, ErrorCode::DataSourceFailure);
}

TEST_F(JsonCodecTest, FractionalLifeYearsRejected) {
    const json j = json::parse(R"([{
        "id": "PAT-X",
        "kind": "patent",
        "method": "technology_factor",
        "segments": [{"name": "Mac", "attribution": 0.1}],
        "parameters": {"base_royalty_rate": 0.05, "remaining_life_years": 12.5}
    }])");

    auto assets = parseAssets(j);
    ASSERT_FALSE(assets.has_value());
    EXPECT_EQ(assets.error().code, ErrorCode::ParameterOutOfRange);
    EXPECT_NE(assets.error().message.find("remaining_life_years"), std::string::npos);
    EXPECT_NE(assets.error().message.find("PAT-X"), std::string::npos);
}

TEST_F(JsonCodecTest, WholeLifeYearsWrittenAsFloatAccepted) {
    const json j = json::parse(R"([{
        "id": "PAT-Y",
        "kind": "patent",
        "method": "technology_factor",
        "segments": [{"name": "Mac", "attribution": 0.1}],
        "parameters": {"remaining_life_years": 8.0, "total_life_years": 20}
    }])");

    auto assets = parseAssets(j);
    ASSERT_TRUE(assets.has_value()) << assets.error().message;
    const auto& technology = std::get<TechnologyFactorParameters>((*assets)[0].parameters());
    EXPECT_EQ(technology.remainingLifeYears, 8);
    EXPECT_EQ(technology.totalLifeYears, 20);
}

TEST_F(JsonCodecTest, AssetSerializationCanBeParsedBack) {
    ExcessEarningsParameters excess;
    excess.ipContributionFraction = 0.4;
    auto asset = IPAsset::create("TS-1", AssetKind::TradeSecret, "Algorithms",
                                 {{"Services", 0.3}}, excess);
    ASSERT_TRUE(asset.has_value());

    // operating_margin не задана и пишется как null
    auto parsed = parseAsset(toJson(*asset));
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;

    const auto& parameters = std::get<ExcessEarningsParameters>(parsed->parameters());
    EXPECT_FALSE(parameters.operatingMargin.has_value());
    EXPECT_DOUBLE_EQ(parameters.ipContributionFraction, 0.4);
    EXPECT_EQ(parameters.contributoryAssets.size(), 3u);
    EXPECT_EQ(parsed->description(), "Algorithms");
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Данные компаний
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(JsonCodecTest, ParseCompaniesSortsNewestFirst) {
    auto companies = parseCompanies(companiesJson());
    ASSERT_TRUE(companies.has_value()) << companies.error().message;
    ASSERT_EQ(companies->size(), 1u);

    const auto& company = (*companies)[0];
    EXPECT_EQ(company.ticker, "AAPL");
    EXPECT_EQ(company.statements[0].periodLabel, "2023");
    EXPECT_DOUBLE_EQ(company.statements[0].netIncome, 97.0);
    EXPECT_DOUBLE_EQ(company.statements[0].totalDebt, 0.0);
    EXPECT_EQ(company.segments.at("iPhone")[0].periodLabel, "2023");
    EXPECT_DOUBLE_EQ(company.snapshot.marketCap, 2800000000000.0);
}

TEST_F(JsonCodecTest, CompanyWithoutTickerRejected) {
    auto companies = parseCompanies(json::parse(R"({"companies": [{"name": "X"}]})"));
    ASSERT_FALSE(companies.has_value());
    EXPECT_EQ(companies.error().code, ErrorCode::DataSourceFailure);
}

TEST_F(JsonCodecTest, JsonFileDataSourceServesSeries) {
    ASSERT_TRUE(writeJsonFile(testFile, companiesJson()).has_value());

    JsonFileDataSource dataSource;
    auto loaded = dataSource.load(testFile);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_TRUE(dataSource.isLoaded());

    auto segments = dataSource.listSegments("AAPL");
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(segments->size(), 2u);

    auto revenues = dataSource.fetchSegmentSeries("AAPL", "Services", 1);
    ASSERT_TRUE(revenues.has_value());
    ASSERT_EQ(revenues->size(), 1u);
    EXPECT_DOUBLE_EQ((*revenues)[0].revenue, 85.0);
}

TEST_F(JsonCodecTest, UnloadedJsonSourceFails) {
    JsonFileDataSource dataSource;

    auto segments = dataSource.listSegments("AAPL");
    ASSERT_FALSE(segments.has_value());
    EXPECT_EQ(segments.error().code, ErrorCode::DataSourceFailure);
}

TEST_F(JsonCodecTest, MalformedFileIsDataSourceFailure) {
    {
        std::ofstream file(testFile);
        file << "{ not json";
    }

    auto j = readJsonFile(testFile);
    ASSERT_FALSE(j.has_value());
    EXPECT_EQ(j.error().code, ErrorCode::DataSourceFailure);

    auto missing = readJsonFile(testFile.string() + ".missing");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::DataSourceFailure);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Результаты
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(JsonCodecTest, PortfolioCsvHasRowPerSegment) {
    PortfolioValuation portfolio;
    portfolio.ticker = "AAPL";

    AssetValuation asset;
    asset.assetId = "PAT-CHIP-SHARED-001";
    asset.assetKind = "patent";
    asset.method = ValuationMethod::TechnologyFactor;

    ValuationResult iphone;
    iphone.segmentName = "iPhone";
    iphone.attributionFraction = 0.12;
    iphone.totalValue = 10.0;
    ValuationResult wearables;
    wearables.segmentName = "Wearables, Home and Accessories";
    wearables.attributionFraction = 0.12;
    wearables.totalValue = 2.0;
    asset.segments = {iphone, wearables};
    portfolio.assets.push_back(asset);

    const std::string csv = toCsv(portfolio);
    EXPECT_EQ(csv.rfind("asset_id,kind,method,segment,attribution,pv_explicit,pv_terminal,total_value\n", 0), 0u);
    EXPECT_NE(csv.find("PAT-CHIP-SHARED-001,patent,technology_factor,iPhone,0.12,0,0,10\n"),
              std::string::npos);
    // Имя с запятой заключено в кавычки
    EXPECT_NE(csv.find("\"Wearables, Home and Accessories\""), std::string::npos);
}

TEST_F(JsonCodecTest, PortfolioJsonCarriesSkippedAssets) {
    PortfolioValuation portfolio;
    portfolio.ticker = "AAPL";
    portfolio.totalValue = 12.5;
    portfolio.skipped.push_back({"TM-X", ValuationError{ErrorCode::DataNotFound, "no segment"}});

    const json j = toJson(portfolio);
    EXPECT_EQ(j.at("ticker").get<std::string>(), "AAPL");
    EXPECT_DOUBLE_EQ(j.at("total_value").get<double>(), 12.5);
    ASSERT_EQ(j.at("skipped").size(), 1u);
    EXPECT_EQ(j.at("skipped")[0].at("error").at("code").get<std::string>(), "DataNotFound");
}

TEST_F(JsonCodecTest, SensitivityRowsSerialized) {
    std::vector<SensitivityRow> rows{{"wacc", 12.0, 10.0, 8.5}};

    const json j = toJson(rows);
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[0].at("driver").get<std::string>(), "wacc");
    EXPECT_DOUBLE_EQ(j[0].at("high").get<double>(), 8.5);
    EXPECT_FALSE(j[0].at("high_capped").get<bool>());

    rows[0].highCapped = true;
    EXPECT_TRUE(toJson(rows)[0].at("high_capped").get<bool>());
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Портфель препаратов и отчеты
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(JsonCodecTest, DrugPortfolioYearFormats) {
    auto portfolio = parseDrugPortfolio(json::parse(R"({
        "ticker": "SRPT",
        "company_name": "Sarepta Therapeutics",
        "drugs": [
            {"name": "Exondys 51", "approval_date": "2016-09-19", "market_exclusivity": 7,
             "patent_expiry": "2031", "peak_sales_estimate": 500000000,
             "current_status": "Approved & Commercial"},
            {"name": "SRP-9003", "approval_date": null, "patent_expiry": 2040,
             "current_status": "Phase 3 Clinical Trials", "approval_probability": 0.4}
        ]
    })"));

    ASSERT_TRUE(portfolio.has_value()) << portfolio.error().message;
    ASSERT_EQ(portfolio->drugs.size(), 2u);
    EXPECT_EQ(portfolio->drugs[0].approvalYear, 2016);
    EXPECT_EQ(portfolio->drugs[0].patentExpiryYear, 2031);
    EXPECT_TRUE(portfolio->drugs[0].approved());
    EXPECT_FALSE(portfolio->drugs[1].approvalYear.has_value());
    EXPECT_EQ(portfolio->drugs[1].patentExpiryYear, 2040);
    EXPECT_EQ(portfolio->drugs[1].approvalProbability, 0.4);
}

TEST_F(JsonCodecTest, DrugPortfolioBadYearRejected) {
    auto portfolio = parseDrugPortfolio(json::parse(R"({
        "ticker": "SRPT",
        "drugs": [{"name": "X", "patent_expiry": "soon"}]
    })"));

    ASSERT_FALSE(portfolio.has_value());
    EXPECT_EQ(portfolio.error().code, ErrorCode::DataSourceFailure);
}

TEST_F(JsonCodecTest, DrugPortfolioWithoutDrugsRejected) {
    auto portfolio = parseDrugPortfolio(json::parse(R"({"ticker": "SRPT"})"));
    ASSERT_FALSE(portfolio.has_value());
    EXPECT_EQ(portfolio.error().code, ErrorCode::DataSourceFailure);
}

TEST_F(JsonCodecTest, FairValueReportKeyedByMethod) {
    FairValueReport report;
    report.ticker = "AAPL";
    report.currentPrice = 180.0;
    report.waccSource = AssumptionSource::Override;

    FairValueEstimate pe;
    pe.method = FairValueMethod::PriceToEarnings;
    pe.fairValuePerShare = 125.0;
    FairValueEstimate dcf;
    dcf.method = FairValueMethod::DiscountedCashFlow;
    dcf.failure = ValuationError{ErrorCode::InsufficientData, "Free cash flow is not positive"};
    report.estimates = {dcf, pe};
    report.averageFairValue = 125.0;

    const json j = toJson(report);
    EXPECT_DOUBLE_EQ(j.at("fair_value_average").get<double>(), 125.0);
    EXPECT_EQ(j.at("assumptions").at("wacc_source").get<std::string>(), "override");
    EXPECT_DOUBLE_EQ(j.at("valuation_methods").at("pe_multiple")
                         .at("fair_value_per_share").get<double>(), 125.0);
    EXPECT_TRUE(j.at("valuation_methods").at("dcf").at("fair_value_per_share").is_null());
    EXPECT_EQ(j.at("valuation_methods").at("dcf").at("error").at("code").get<std::string>(),
              "InsufficientData");
}

TEST_F(JsonCodecTest, BiotechReportSections) {
    BiotechReport report;
    report.ticker = "SRPT";
    report.patentAnalysis.overallRisk = ProtectionRisk::High;
    report.patentAnalysis.patentCliffWarning = "Multiple patents expiring around 2026";
    report.riskAssessment.overallRiskScore = 55;
    report.valuation.totalPortfolioValue = 1e9;
    report.moat.strength = "Weak";

    const json j = toJson(report);
    EXPECT_EQ(j.at("patent_analysis").at("overall_risk").get<std::string>(), "High");
    EXPECT_EQ(j.at("patent_analysis").at("patent_cliff_warning").get<std::string>(),
              "Multiple patents expiring around 2026");
    EXPECT_EQ(j.at("risk_assessment").at("overall_risk_score").get<int>(), 55);
    EXPECT_DOUBLE_EQ(j.at("valuation_breakdown").at("total_portfolio_value").get<double>(), 1e9);
    EXPECT_EQ(j.at("competitive_moat").at("strength").get<std::string>(), "Weak");
}
