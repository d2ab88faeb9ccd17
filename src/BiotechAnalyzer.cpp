#include "BiotechAnalyzer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ipvalue {

bool DrugProduct::approved() const noexcept
{
    return status.find("Approved") != std::string::npos;
}

bool DrugProduct::inClinicalDevelopment() const noexcept
{
    return status.find("Phase") != std::string::npos ||
           status.find("Clinical") != std::string::npos;
}

std::string_view toString(ProtectionRisk risk) noexcept
{
    switch (risk) {
        case ProtectionRisk::Low:      return "Low";
        case ProtectionRisk::Moderate: return "Moderate";
        case ProtectionRisk::High:     return "High";
    }
    return "Low";
}

std::string BiotechAnalyzer::protectionRiskLevel(int effectiveProtectionYears)
{
    if (effectiveProtectionYears <= 3) {
        return "Critical - Generic competition imminent";
    } else if (effectiveProtectionYears <= 5) {
        return "High - Plan for revenue decline";
    } else if (effectiveProtectionYears <= 10) {
        return "Moderate - Monitor biosimilar development";
    }
    return "Low - Strong protection period";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Патентная защита
// ═══════════════════════════════════════════════════════════════════════════════

PatentProtectionAnalysis BiotechAnalyzer::analyzePatentProtection(
    const std::vector<DrugProduct>& drugs,
    int currentYear) const
{
    PatentProtectionAnalysis analysis;
    int totalProtection = 0;

    for (const auto& drug : drugs) {
        if (!drug.patentExpiryYear) {
            continue;
        }

        DrugProtection protection;
        protection.drug = drug.name;
        protection.patentExpiryYear = *drug.patentExpiryYear;
        protection.yearsUntilPatentExpiry = *drug.patentExpiryYear - currentYear;

        // До одобрения срок эксклюзивности еще не начал течь
        protection.exclusivityYearsRemaining = drug.approvalYear
            ? *drug.approvalYear + drug.exclusivityYears - currentYear
            : drug.exclusivityYears;

        protection.effectiveProtectionYears =
            std::max(protection.yearsUntilPatentExpiry, protection.exclusivityYearsRemaining);
        protection.riskLevel = protectionRiskLevel(protection.effectiveProtectionYears);

        if (protection.effectiveProtectionYears <= kPatentCliffHorizon) {
            analysis.patentCliffYears.push_back(currentYear + protection.effectiveProtectionYears);
        }

        totalProtection += protection.effectiveProtectionYears;
        analysis.byDrug.push_back(std::move(protection));
    }

    if (!analysis.byDrug.empty()) {
        analysis.averageRemainingProtection =
            static_cast<double>(totalProtection) / static_cast<double>(analysis.byDrug.size());
    }

    if (analysis.averageRemainingProtection < 5.0) {
        analysis.overallRisk = ProtectionRisk::High;
    } else if (analysis.averageRemainingProtection < 10.0) {
        analysis.overallRisk = ProtectionRisk::Moderate;
    } else {
        analysis.overallRisk = ProtectionRisk::Low;
    }

    if (analysis.patentCliffYears.size() >= 2) {
        const int earliest = *std::min_element(analysis.patentCliffYears.begin(),
                                               analysis.patentCliffYears.end());
        analysis.patentCliffWarning =
            "Multiple patents expiring around " + std::to_string(earliest);
    }

    return analysis;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Риски
// ═══════════════════════════════════════════════════════════════════════════════

BiotechRiskAssessment BiotechAnalyzer::assessRisks(
    const std::vector<DrugProduct>& drugs,
    const PatentProtectionAnalysis& patents) const
{
    BiotechRiskAssessment risks;

    if (patents.overallRisk == ProtectionRisk::High) {
        risks.patentRisks.push_back({
            "Patent Expiration",
            "High",
            "Multiple key patents expiring within 5 years",
            "Revenue decline from generic competition",
            std::nullopt,
            std::nullopt
        });
    }

    for (const auto& drug : drugs) {
        if (!drug.inClinicalDevelopment()) {
            continue;
        }
        const double probability = drug.approvalProbability.value_or(kDefaultPipelineProbability);

        std::ostringstream impact;
        impact << "Potential loss of $" << std::fixed << std::setprecision(0)
               << drug.peakSalesEstimate / 1e6 << "M peak sales";

        risks.pipelineRisks.push_back({
            "Clinical Development Risk",
            probability < 0.3 ? "High" : "Moderate",
            drug.indication,
            impact.str(),
            drug.name,
            probability
        });
    }

    const auto approvedCount = std::count_if(drugs.begin(), drugs.end(),
        [](const DrugProduct& drug) { return drug.approved(); });

    if (approvedCount <= 2) {
        risks.commercialRisks.push_back({
            "Revenue Concentration",
            "High",
            "Revenue dependent on " + std::to_string(approvedCount) + " product(s)",
            "Single product failure could be catastrophic",
            std::nullopt,
            std::nullopt
        });
    }

    const auto score = risks.patentRisks.size() * 30 +
                       risks.pipelineRisks.size() * 20 +
                       risks.commercialRisks.size() * 25;
    risks.overallRiskScore = static_cast<int>(std::min<std::size_t>(score, 100));

    return risks;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Оценка препаратов
// ═══════════════════════════════════════════════════════════════════════════════

DrugPortfolioValuation BiotechAnalyzer::valuePortfolio(
    const std::vector<DrugProduct>& drugs,
    int currentYear) const
{
    DrugPortfolioValuation valuation;

    for (const auto& drug : drugs) {
        DrugValuation value;
        value.drug = drug.name;
        value.status = drug.status;
        value.peakSalesEstimate = drug.peakSalesEstimate;
        value.yearsOfProtection = drug.patentExpiryYear
            ? *drug.patentExpiryYear - currentYear
            : kDefaultProtectionYears;
        value.probabilityOfSuccess = drug.approved()
            ? 1.0
            : drug.approvalProbability.value_or(kDefaultApprovalProbability);

        // Продажи только в годы защиты: после истечения патента вклад не учитывается
        const int horizon = std::min(value.yearsOfProtection, kMaxProjectionYears);
        for (int year = 1; year <= horizon; ++year) {
            const double revenue = year <= kRampUpYears
                ? drug.peakSalesEstimate * year / kRampUpYears
                : drug.peakSalesEstimate;
            value.npv += revenue * kOperatingMargin / std::pow(1.0 + kDiscountRate, year);
        }

        value.riskAdjustedValue = value.npv * value.probabilityOfSuccess;

        if (drug.approved()) {
            valuation.approvedProductsValue += value.riskAdjustedValue;
        } else {
            valuation.pipelineValue += value.riskAdjustedValue;
        }
        valuation.byDrug.push_back(std::move(value));
    }

    valuation.totalPortfolioValue = valuation.approvedProductsValue + valuation.pipelineValue;
    return valuation;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Конкурентное преимущество
// ═══════════════════════════════════════════════════════════════════════════════

CompetitiveMoat BiotechAnalyzer::assessMoat(const PatentProtectionAnalysis& patents) const
{
    CompetitiveMoat moat;
    const double protection = patents.averageRemainingProtection;

    if (protection > 15.0) {
        moat.strength = "Very Strong";
        moat.sources.push_back("Long patent protection (>15 years)");
    } else if (protection > 10.0) {
        moat.strength = "Strong";
        moat.sources.push_back("Solid patent protection (10-15 years)");
    } else if (protection > 5.0) {
        moat.strength = "Moderate";
        moat.sources.push_back("Moderate patent protection (5-10 years)");
    } else {
        moat.strength = "Weak";
        moat.threats.push_back("Limited patent protection (<5 years)");
    }

    moat.durationYears = static_cast<int>(protection);

    moat.sources.insert(moat.sources.end(), {
        "Orphan drug exclusivity (7-12 years)",
        "Clinical trial data exclusivity",
        "Rare disease focus (limited competition)",
        "Gene therapy complexity (high barriers to entry)"
    });

    if (patents.overallRisk == ProtectionRisk::High) {
        moat.threats.push_back("Patent cliff approaching");
    }

    moat.threats.insert(moat.threats.end(), {
        "Biosimilar development",
        "CRISPR/gene editing alternatives",
        "Payer reimbursement pressure",
        "Manufacturing scale-up challenges"
    });

    return moat;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Полный анализ
// ═══════════════════════════════════════════════════════════════════════════════

Expected<BiotechReport> BiotechAnalyzer::analyze(
    const DrugPortfolio& portfolio,
    int currentYear) const
{
    if (portfolio.drugs.empty()) {
        return makeError(ErrorCode::InsufficientData,
                         "Drug portfolio of " + portfolio.ticker + " is empty");
    }

    for (const auto& drug : portfolio.drugs) {
        if (!std::isfinite(drug.peakSalesEstimate) || drug.peakSalesEstimate < 0.0) {
            return makeError(ErrorCode::ParameterOutOfRange,
                             "Drug '" + drug.name + "': peak sales must be non-negative");
        }
        if (drug.approvalProbability &&
            (*drug.approvalProbability < 0.0 || *drug.approvalProbability > 1.0)) {
            return makeError(ErrorCode::ParameterOutOfRange,
                             "Drug '" + drug.name + "': approval probability must lie in [0,1]");
        }
    }

    BiotechReport report;
    report.ticker = portfolio.ticker;
    report.companyName = portfolio.companyName.empty() ? portfolio.ticker : portfolio.companyName;
    report.currentYear = currentYear;
    report.patentAnalysis = analyzePatentProtection(portfolio.drugs, currentYear);
    report.riskAssessment = assessRisks(portfolio.drugs, report.patentAnalysis);
    report.valuation = valuePortfolio(portfolio.drugs, currentYear);
    report.moat = assessMoat(report.patentAnalysis);
    return report;
}

}  // namespace ipvalue
