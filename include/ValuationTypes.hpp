#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ipvalue {

using Result = std::expected<void, std::string>;

// ═══════════════════════════════════════════════════════════════════════════════
// Ошибки движка оценки
// ═══════════════════════════════════════════════════════════════════════════════

enum class ErrorCode {
    DataNotFound,         // Сегмент или тикер отсутствует
    InsufficientData,     // Недостаточно периодов
    InvalidAssumptions,   // WACC <= g или ставка вне [0,1]
    ParameterOutOfRange,  // Параметр актива вне допустимого диапазона
    DivisionUndefined,    // Нулевой знаменатель
    DataSourceFailure     // Ошибка источника данных (файл, SQLite, JSON)
};

struct ValuationError {
    ErrorCode code;
    std::string message;
};

template<typename T>
using Expected = std::expected<T, ValuationError>;

inline std::unexpected<ValuationError> makeError(ErrorCode code, std::string message) {
    return std::unexpected(ValuationError{code, std::move(message)});
}

std::string_view toString(ErrorCode code) noexcept;

// ═══════════════════════════════════════════════════════════════════════════════
// Исходные финансовые данные
// ═══════════════════════════════════════════════════════════════════════════════

// Один отчетный период компании. Все ряды от источника данных
// упорядочены от нового периода к старому (индекс 0 - последний период).
struct RawStatementPeriod {
    std::string periodLabel;

    // Отчет о прибылях и убытках
    double revenue = 0.0;
    double grossProfit = 0.0;
    double operatingIncome = 0.0;
    double netIncome = 0.0;
    double researchAndDevelopment = 0.0;
    double incomeTaxExpense = 0.0;
    double interestExpense = 0.0;

    // Баланс
    double totalDebt = 0.0;
    double totalAssets = 0.0;
    double totalLiabilities = 0.0;
    double shareholdersEquity = 0.0;
    double currentAssets = 0.0;
    double currentLiabilities = 0.0;
    double cashAndEquivalents = 0.0;
    double receivables = 0.0;

    // Движение денежных средств (capex отрицательный для оттока)
    double operatingCashFlow = 0.0;
    double capitalExpenditure = 0.0;

    double sharesOutstanding = 0.0;
};

struct MarketSnapshot {
    double price = 0.0;
    double marketCap = 0.0;
};

struct SegmentRevenuePoint {
    std::string periodLabel;
    double revenue = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Подготовленный ряд сегмента (хронологический порядок: старый -> новый)
// ═══════════════════════════════════════════════════════════════════════════════

struct SegmentSeries {
    std::string segmentName;
    std::vector<std::string> periodLabels;
    std::vector<double> revenues;
    std::vector<double> grossProfits;
    std::vector<double> rdExpenses;
    std::vector<double> operatingIncomes;
    std::vector<double> allocationShares;
    std::vector<double> grossMargins;
    std::vector<double> operatingMargins;

    std::size_t periods() const noexcept { return revenues.size(); }

    // Средняя операционная маржа компании по всем периодам ряда
    std::optional<double> averageOperatingMargin() const noexcept;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Допущения оценки
// ═══════════════════════════════════════════════════════════════════════════════

struct AssumptionSet {
    double wacc = 0.10;
    double taxRate = 0.21;
    double terminalGrowth = 0.02;
};

// Проверка инвариантов: ставки в [0,1], g в (-1,1), WACC > g
Expected<void> validateAssumptions(const AssumptionSet& assumptions);

// ═══════════════════════════════════════════════════════════════════════════════
// Результаты оценки
// ═══════════════════════════════════════════════════════════════════════════════

enum class ValuationMethod {
    ReliefFromRoyalty,
    ExcessEarnings,
    TechnologyFactor,
    IncrementalIncome
};

std::string_view toString(ValuationMethod method) noexcept;
std::optional<ValuationMethod> parseValuationMethod(std::string_view name) noexcept;

struct PeriodCashFlow {
    std::size_t period = 0;       // t = 1..n
    double revenue = 0.0;         // атрибутированная выручка
    double cashFlow = 0.0;        // CF_t
    double decayFactor = 1.0;
    double discountFactor = 1.0;  // (1 + WACC)^t
    double presentValue = 0.0;
};

struct ValuationResult {
    ValuationMethod method = ValuationMethod::ReliefFromRoyalty;
    std::string segmentName;
    double attributionFraction = 1.0;

    std::vector<PeriodCashFlow> periods;
    double terminalCashFlow = 0.0;
    double terminalValue = 0.0;

    double pvExplicit = 0.0;
    double pvTerminal = 0.0;
    double totalValue = 0.0;

    // Значения, специфичные для метода (technology_factor, adjusted_royalty_rate, ...)
    std::map<std::string, double> details;
    std::vector<std::string> notes;
};

struct AssetValuation {
    std::string assetId;
    std::string assetKind;
    std::string description;
    ValuationMethod method = ValuationMethod::ReliefFromRoyalty;
    double totalValue = 0.0;
    double pvExplicit = 0.0;
    double pvTerminal = 0.0;
    std::vector<ValuationResult> segments;  // в порядке атрибуций актива
};

struct SkippedAsset {
    std::string assetId;
    ValuationError error;
};

struct PortfolioValuation {
    std::string ticker;
    AssumptionSet assumptions;
    double totalValue = 0.0;
    std::vector<AssetValuation> assets;  // в порядке входного списка
    std::vector<SkippedAsset> skipped;   // только в режиме BestEffort
};

}  // namespace ipvalue
