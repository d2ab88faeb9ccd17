#include <gtest/gtest.h>
#include "BiotechAnalyzer.hpp"
#include <cmath>
#include <vector>

using namespace ipvalue;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class BiotechAnalyzerTest : public ::testing::Test {
protected:
    static constexpr int kYear = 2024;

    static DrugProduct approvedDrug(std::string name, int approval, int exclusivity,
                                    int patentExpiry, double peakSales) {
        DrugProduct drug;
        drug.name = std::move(name);
        drug.indication = "Duchenne muscular dystrophy";
        drug.modality = "Antisense oligonucleotide";
        drug.approvalYear = approval;
        drug.exclusivityYears = exclusivity;
        drug.patentExpiryYear = patentExpiry;
        drug.peakSalesEstimate = peakSales;
        drug.status = "Approved & Commercial";
        return drug;
    }

    void SetUp() override {
        DrugProduct pipeline;
        pipeline.name = "SRP-9003";
        pipeline.indication = "Limb-girdle muscular dystrophy";
        pipeline.modality = "Gene therapy";
        pipeline.exclusivityYears = 7;
        pipeline.patentExpiryYear = 2040;
        pipeline.peakSalesEstimate = 1e9;
        pipeline.status = "Phase 3 Clinical Trials";
        pipeline.approvalProbability = 0.4;

        portfolio.ticker = "SRPT";
        portfolio.companyName = "Sarepta Therapeutics";
        portfolio.drugs = {
            approvedDrug("Elevidys", 2023, 12, 2035, 2e9),
            approvedDrug("Exondys 51", 2016, 7, 2026, 5e8),
            approvedDrug("Vyondys 53", 2019, 7, 2028, 3e8),
            pipeline
        };
    }

    // Рост до пика за 3 года, затем пик, маржа 30%, ставка 12%
    static double expectedNpv(double peak, int years) {
        double npv = 0.0;
        for (int year = 1; year <= years; ++year) {
            const double revenue = year <= 3 ? peak * year / 3.0 : peak;
            npv += revenue * 0.30 / std::pow(1.12, year);
        }
        return npv;
    }

    BiotechAnalyzer analyzer;
    DrugPortfolio portfolio;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Патентная защита
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BiotechAnalyzerTest, EffectiveProtectionIsLongerOfPatentAndExclusivity) {
    auto patents = analyzer.analyzePatentProtection(portfolio.drugs, kYear);

    ASSERT_EQ(patents.byDrug.size(), 4u);
    EXPECT_EQ(patents.byDrug[0].yearsUntilPatentExpiry, 11);
    EXPECT_EQ(patents.byDrug[0].exclusivityYearsRemaining, 11);
    EXPECT_EQ(patents.byDrug[1].effectiveProtectionYears, 2);
    EXPECT_EQ(patents.byDrug[2].effectiveProtectionYears, 4);

    // До одобрения эксклюзивность не расходуется
    EXPECT_EQ(patents.byDrug[3].exclusivityYearsRemaining, 7);
    EXPECT_EQ(patents.byDrug[3].effectiveProtectionYears, 16);

    EXPECT_DOUBLE_EQ(patents.averageRemainingProtection, (11.0 + 2.0 + 4.0 + 16.0) / 4.0);
    EXPECT_EQ(patents.overallRisk, ProtectionRisk::Moderate);
}

TEST_F(BiotechAnalyzerTest, PatentCliffWarningForTwoNearExpiries) {
    auto patents = analyzer.analyzePatentProtection(portfolio.drugs, kYear);

    EXPECT_EQ(patents.patentCliffYears, (std::vector<int>{2026, 2028}));
    ASSERT_TRUE(patents.patentCliffWarning.has_value());
    EXPECT_EQ(*patents.patentCliffWarning, "Multiple patents expiring around 2026");
}

TEST_F(BiotechAnalyzerTest, SingleNearExpiryGivesNoWarning) {
    portfolio.drugs.erase(portfolio.drugs.begin() + 2);

    auto patents = analyzer.analyzePatentProtection(portfolio.drugs, kYear);
    EXPECT_EQ(patents.patentCliffYears.size(), 1u);
    EXPECT_FALSE(patents.patentCliffWarning.has_value());
}

TEST_F(BiotechAnalyzerTest, DrugsWithoutPatentDateSkipped) {
    portfolio.drugs[0].patentExpiryYear.reset();

    auto patents = analyzer.analyzePatentProtection(portfolio.drugs, kYear);
    EXPECT_EQ(patents.byDrug.size(), 3u);
}

TEST(BiotechRiskLevelTest, ProtectionRiskLabels) {
    EXPECT_EQ(BiotechAnalyzer::protectionRiskLevel(3), "Critical - Generic competition imminent");
    EXPECT_EQ(BiotechAnalyzer::protectionRiskLevel(5), "High - Plan for revenue decline");
    EXPECT_EQ(BiotechAnalyzer::protectionRiskLevel(10), "Moderate - Monitor biosimilar development");
    EXPECT_EQ(BiotechAnalyzer::protectionRiskLevel(11), "Low - Strong protection period");
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Риски
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BiotechAnalyzerTest, PipelineRiskPerClinicalDrug) {
    auto patents = analyzer.analyzePatentProtection(portfolio.drugs, kYear);
    auto risks = analyzer.assessRisks(portfolio.drugs, patents);

    EXPECT_TRUE(risks.patentRisks.empty());
    EXPECT_TRUE(risks.commercialRisks.empty());
    ASSERT_EQ(risks.pipelineRisks.size(), 1u);
    EXPECT_EQ(risks.pipelineRisks[0].severity, "Moderate");
    EXPECT_EQ(risks.pipelineRisks[0].drug, "SRP-9003");
    EXPECT_EQ(risks.pipelineRisks[0].impact, "Potential loss of $1000M peak sales");
    EXPECT_EQ(risks.overallRiskScore, 20);
}

TEST_F(BiotechAnalyzerTest, RiskScoreCappedAtHundred) {
    DrugPortfolio risky;
    risky.drugs = {approvedDrug("Old", 2005, 7, 2025, 1e8)};
    for (int i = 0; i < 4; ++i) {
        DrugProduct candidate = portfolio.drugs[3];
        candidate.name = "Candidate " + std::to_string(i);
        candidate.approvalProbability = 0.1;
        candidate.exclusivityYears = 0;
        candidate.patentExpiryYear = 2026;
        risky.drugs.push_back(candidate);
    }

    auto patents = analyzer.analyzePatentProtection(risky.drugs, kYear);
    auto risks = analyzer.assessRisks(risky.drugs, patents);

    EXPECT_EQ(patents.overallRisk, ProtectionRisk::High);
    EXPECT_EQ(risks.patentRisks.size(), 1u);
    EXPECT_EQ(risks.pipelineRisks.size(), 4u);
    EXPECT_EQ(risks.pipelineRisks[0].severity, "High");
    ASSERT_EQ(risks.commercialRisks.size(), 1u);
    EXPECT_EQ(risks.commercialRisks[0].description, "Revenue dependent on 1 product(s)");
    EXPECT_EQ(risks.overallRiskScore, 100);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Оценка
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BiotechAnalyzerTest, ApprovedDrugValuedOverProtectionPeriod) {
    std::vector<DrugProduct> drugs = {approvedDrug("Exondys 51", 2016, 7, 2030, 100.0)};

    auto valuation = analyzer.valuePortfolio(drugs, kYear);
    ASSERT_EQ(valuation.byDrug.size(), 1u);
    EXPECT_EQ(valuation.byDrug[0].yearsOfProtection, 6);
    EXPECT_DOUBLE_EQ(valuation.byDrug[0].probabilityOfSuccess, 1.0);
    EXPECT_NEAR(valuation.byDrug[0].npv, expectedNpv(100.0, 6), 1e-9);
    EXPECT_NEAR(valuation.approvedProductsValue, expectedNpv(100.0, 6), 1e-9);
    EXPECT_DOUBLE_EQ(valuation.pipelineValue, 0.0);
}

TEST_F(BiotechAnalyzerTest, PipelineDrugRiskAdjusted) {
    DrugProduct candidate = portfolio.drugs[3];
    candidate.peakSalesEstimate = 100.0;
    candidate.patentExpiryYear.reset();
    candidate.approvalProbability.reset();

    auto valuation = analyzer.valuePortfolio({candidate}, kYear);
    const auto& value = valuation.byDrug[0];

    EXPECT_EQ(value.yearsOfProtection, BiotechAnalyzer::kDefaultProtectionYears);
    EXPECT_DOUBLE_EQ(value.probabilityOfSuccess, BiotechAnalyzer::kDefaultApprovalProbability);
    EXPECT_NEAR(value.riskAdjustedValue, expectedNpv(100.0, 10) * 0.3, 1e-9);
    EXPECT_NEAR(valuation.pipelineValue, value.riskAdjustedValue, 1e-12);
}

TEST_F(BiotechAnalyzerTest, LongProtectionProjectionCapped) {
    std::vector<DrugProduct> drugs = {approvedDrug("Elevidys", 2023, 12, 2060, 100.0)};

    auto valuation = analyzer.valuePortfolio(drugs, kYear);
    EXPECT_EQ(valuation.byDrug[0].yearsOfProtection, 36);
    EXPECT_NEAR(valuation.byDrug[0].npv,
                expectedNpv(100.0, BiotechAnalyzer::kMaxProjectionYears), 1e-9);
}

TEST_F(BiotechAnalyzerTest, ExpiredPatentHasNoValue) {
    std::vector<DrugProduct> drugs = {approvedDrug("Exondys 51", 2016, 7, 2020, 100.0)};

    auto valuation = analyzer.valuePortfolio(drugs, kYear);
    EXPECT_EQ(valuation.byDrug[0].yearsOfProtection, -4);
    EXPECT_DOUBLE_EQ(valuation.totalPortfolioValue, 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Конкурентное преимущество
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BiotechAnalyzerTest, MoatStrengthFollowsAverageProtection) {
    PatentProtectionAnalysis patents;

    patents.averageRemainingProtection = 16.0;
    EXPECT_EQ(analyzer.assessMoat(patents).strength, "Very Strong");

    patents.averageRemainingProtection = 12.5;
    auto strong = analyzer.assessMoat(patents);
    EXPECT_EQ(strong.strength, "Strong");
    EXPECT_EQ(strong.durationYears, 12);

    patents.averageRemainingProtection = 3.0;
    patents.overallRisk = ProtectionRisk::High;
    auto weak = analyzer.assessMoat(patents);
    EXPECT_EQ(weak.strength, "Weak");
    EXPECT_EQ(weak.threats.front(), "Limited patent protection (<5 years)");
    EXPECT_EQ(weak.threats[1], "Patent cliff approaching");
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Полный анализ
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(BiotechAnalyzerTest, FullReport) {
    auto report = analyzer.analyze(portfolio, kYear);

    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report->companyName, "Sarepta Therapeutics");
    EXPECT_EQ(report->currentYear, kYear);
    EXPECT_EQ(report->moat.strength, "Moderate");
    EXPECT_EQ(report->moat.durationYears, 8);
    EXPECT_NEAR(report->valuation.totalPortfolioValue,
                report->valuation.approvedProductsValue + report->valuation.pipelineValue, 1e-6);
}

TEST_F(BiotechAnalyzerTest, EmptyPortfolioRejected) {
    portfolio.drugs.clear();

    auto report = analyzer.analyze(portfolio, kYear);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::InsufficientData);
}

TEST_F(BiotechAnalyzerTest, InvalidDrugInputsRejected) {
    portfolio.drugs[0].peakSalesEstimate = -1.0;
    auto negativeSales = analyzer.analyze(portfolio, kYear);
    ASSERT_FALSE(negativeSales.has_value());
    EXPECT_EQ(negativeSales.error().code, ErrorCode::ParameterOutOfRange);

    portfolio.drugs[0].peakSalesEstimate = 1e9;
    portfolio.drugs[3].approvalProbability = 1.5;
    auto badProbability = analyzer.analyze(portfolio, kYear);
    ASSERT_FALSE(badProbability.has_value());
    EXPECT_EQ(badProbability.error().code, ErrorCode::ParameterOutOfRange);
}
