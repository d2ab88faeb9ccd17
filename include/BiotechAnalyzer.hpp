#pragma once

#include "ValuationTypes.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Портфель препаратов (биотех / фарма)
// ═══════════════════════════════════════════════════════════════════════════════

struct DrugProduct {
    std::string name;
    std::string indication;
    std::string modality;                   // антисмысловой олигонуклеотид, генная терапия, ...
    std::optional<int> approvalYear;        // пусто - препарат в разработке
    int exclusivityYears = 0;               // рыночная эксклюзивность от даты одобрения
    std::optional<int> patentExpiryYear;
    double peakSalesEstimate = 0.0;
    std::string status;                     // "Approved & Commercial", "Phase 2 Clinical Trials"
    std::optional<double> approvalProbability;

    // Статус содержит "Approved"
    bool approved() const noexcept;
    // Статус содержит "Phase" или "Clinical"
    bool inClinicalDevelopment() const noexcept;
};

struct DrugPortfolio {
    std::string ticker;
    std::string companyName;
    std::vector<DrugProduct> drugs;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Результаты анализа
// ═══════════════════════════════════════════════════════════════════════════════

enum class ProtectionRisk {
    Low,
    Moderate,
    High
};

std::string_view toString(ProtectionRisk risk) noexcept;

struct DrugProtection {
    std::string drug;
    int patentExpiryYear = 0;
    int yearsUntilPatentExpiry = 0;
    int exclusivityYearsRemaining = 0;
    int effectiveProtectionYears = 0;       // большее из патента и эксклюзивности
    std::string riskLevel;
};

struct PatentProtectionAnalysis {
    std::vector<DrugProtection> byDrug;     // только препараты с датой истечения патента
    double averageRemainingProtection = 0.0;
    ProtectionRisk overallRisk = ProtectionRisk::Low;
    std::vector<int> patentCliffYears;      // годы окончания защиты в пределах 5 лет
    std::optional<std::string> patentCliffWarning;
};

struct BiotechRisk {
    std::string type;
    std::string severity;
    std::string description;
    std::string impact;
    std::optional<std::string> drug;
    std::optional<double> probabilityOfSuccess;
};

struct BiotechRiskAssessment {
    std::vector<BiotechRisk> patentRisks;
    std::vector<BiotechRisk> pipelineRisks;
    std::vector<BiotechRisk> commercialRisks;
    int overallRiskScore = 0;               // 0..100
};

struct DrugValuation {
    std::string drug;
    std::string status;
    double peakSalesEstimate = 0.0;
    int yearsOfProtection = 0;
    double probabilityOfSuccess = 1.0;
    double npv = 0.0;
    double riskAdjustedValue = 0.0;
};

struct DrugPortfolioValuation {
    std::vector<DrugValuation> byDrug;
    double approvedProductsValue = 0.0;
    double pipelineValue = 0.0;
    double totalPortfolioValue = 0.0;
};

struct CompetitiveMoat {
    std::string strength;
    int durationYears = 0;
    std::vector<std::string> sources;
    std::vector<std::string> threats;
};

struct BiotechReport {
    std::string ticker;
    std::string companyName;
    int currentYear = 0;
    PatentProtectionAnalysis patentAnalysis;
    BiotechRiskAssessment riskAssessment;
    DrugPortfolioValuation valuation;
    CompetitiveMoat moat;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Biotech Analyzer
// ═══════════════════════════════════════════════════════════════════════════════
//
// Годы считаются относительно currentYear, переданного вызывающим,
// поэтому результат воспроизводим.

class BiotechAnalyzer {
public:
    static constexpr double kDiscountRate = 0.12;       // выше среднего рыночного WACC
    static constexpr double kOperatingMargin = 0.30;
    static constexpr double kDefaultApprovalProbability = 0.30;
    static constexpr double kDefaultPipelineProbability = 0.50;  // для оценки риска
    static constexpr int kDefaultProtectionYears = 10;
    static constexpr int kRampUpYears = 3;
    static constexpr int kMaxProjectionYears = 19;
    static constexpr int kPatentCliffHorizon = 5;

    /**
     * @brief Полный анализ портфеля препаратов
     * @return InsufficientData для пустого портфеля,
     *         ParameterOutOfRange для отрицательных продаж или вероятности вне [0,1]
     */
    Expected<BiotechReport> analyze(const DrugPortfolio& portfolio, int currentYear) const;

    PatentProtectionAnalysis analyzePatentProtection(
        const std::vector<DrugProduct>& drugs,
        int currentYear) const;

    BiotechRiskAssessment assessRisks(
        const std::vector<DrugProduct>& drugs,
        const PatentProtectionAnalysis& patents) const;

    // Риск-скорректированная NPV: рост до пика за kRampUpYears, затем пик
    DrugPortfolioValuation valuePortfolio(
        const std::vector<DrugProduct>& drugs,
        int currentYear) const;

    CompetitiveMoat assessMoat(const PatentProtectionAnalysis& patents) const;

    static std::string protectionRiskLevel(int effectiveProtectionYears);
};

}  // namespace ipvalue
