#pragma once

#include "IFinancialDataSource.hpp"
#include "ValuationTypes.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Сопоставление имени сегмента
// ═══════════════════════════════════════════════════════════════════════════════

enum class SegmentMatchMode {
    Exact,            // Точное совпадение с учетом регистра (по умолчанию)
    CaseInsensitive,  // Без учета регистра ASCII
    Normalized        // Без учета регистра, пробелов и дефисов
};

std::string_view toString(SegmentMatchMode mode) noexcept;
std::optional<SegmentMatchMode> parseSegmentMatchMode(std::string_view name) noexcept;

// Нижний регистр ASCII
std::string foldCase(std::string_view value);

// Ключ сравнения имени: два имени совпадают в режиме mode,
// если совпадают их ключи
std::string segmentMatchKey(std::string_view name, SegmentMatchMode mode);

bool segmentNamesMatch(
    std::string_view requested,
    std::string_view label,
    SegmentMatchMode mode);

// ═══════════════════════════════════════════════════════════════════════════════
// Стратегии распределения показателей компании на сегмент
// ═══════════════════════════════════════════════════════════════════════════════

// (показатель компании, выручка сегмента, выручка компании) -> доля сегмента.
// Эвристика вместо нераскрытых сегментных данных; заменяется без изменения
// математики оценки.
using AllocationStrategy = std::function<double(
    double companyMetric,
    double segmentRevenue,
    double companyRevenue)>;

// segment_share = segment_revenue / company_revenue; 0 при company_revenue <= 0
double proportionalAllocation(
    double companyMetric,
    double segmentRevenue,
    double companyRevenue) noexcept;

struct AllocationStrategies {
    AllocationStrategy grossProfit = proportionalAllocation;
    AllocationStrategy researchAndDevelopment = proportionalAllocation;
    AllocationStrategy operatingIncome = proportionalAllocation;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Segment Data Preparer
// ═══════════════════════════════════════════════════════════════════════════════

class SegmentDataPreparer {
public:
    explicit SegmentDataPreparer(
        SegmentMatchMode matchMode = SegmentMatchMode::Exact,
        AllocationStrategies strategies = {});

    /**
     * @brief Собрать выровненный ряд сегмента из уже полученных данных
     * @param segmentName Имя сегмента (для результата)
     * @param segmentRevenues Выручка сегмента, от нового периода к старому
     * @param statements Отчетность компании, от нового периода к старому
     * @param periods Максимальное число периодов
     * @return Ряд в хронологическом порядке или InsufficientData
     */
    Expected<SegmentSeries> buildSeries(
        std::string_view segmentName,
        const std::vector<SegmentRevenuePoint>& segmentRevenues,
        const std::vector<RawStatementPeriod>& statements,
        std::size_t periods) const;

    /**
     * @brief Найти сегмент в источнике данных и подготовить его ряд
     *
     * Имя сопоставляется с метками компании в режиме matchMode.
     * Неизвестный сегмент -> DataNotFound со списком доступных меток.
     */
    Expected<SegmentSeries> prepare(
        IFinancialDataSource& dataSource,
        std::string_view ticker,
        std::string_view segmentName,
        std::size_t periods) const;

    // Разрешить запрошенное имя в метку компании
    Expected<std::string> resolveSegmentName(
        std::string_view requested,
        const std::vector<std::string>& availableLabels) const;

    SegmentMatchMode matchMode() const noexcept { return matchMode_; }

private:
    SegmentMatchMode matchMode_;
    AllocationStrategies strategies_;
};

}  // namespace ipvalue
