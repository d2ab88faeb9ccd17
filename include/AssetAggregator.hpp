#pragma once

#include "IPAsset.hpp"
#include "ValuationTypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Режим обработки отказов в портфеле
// ═══════════════════════════════════════════════════════════════════════════════

enum class FailureMode {
    Strict,     // Первая ошибка прерывает расчет портфеля (по умолчанию)
    BestEffort  // Актив с ошибкой пропускается и попадает в skipped
};

std::string_view toString(FailureMode mode) noexcept;

// Подготовленные ряды по имени сегмента (как оно указано в атрибуции актива)
using SegmentSeriesMap = std::map<std::string, SegmentSeries>;

// revenue_t * fraction, период за периодом. Исходный ряд не изменяется.
std::vector<double> attributeRevenue(const SegmentSeries& series, double fraction);

/**
 * @brief Оценка одного актива по всем его сегментам
 *
 * Для каждой пары (сегмент, доля) строится атрибутированный ряд и
 * вызывается метод актива. Итог актива - сумма PV по сегментам.
 * Ошибка любого сегмента - ошибка всего актива.
 */
Expected<AssetValuation> aggregateAsset(
    const IPAsset& asset,
    const SegmentSeriesMap& seriesBySegment,
    const AssumptionSet& assumptions);

/**
 * @brief Оценка портфеля активов
 *
 * Порядок активов в результате совпадает с входным.
 * Strict: первая ошибка возвращается вызывающему.
 * BestEffort: актив с ошибкой попадает в skipped, остальные оцениваются.
 * Некорректные допущения всегда прерывают расчет.
 */
Expected<PortfolioValuation> aggregatePortfolio(
    const std::vector<IPAsset>& assets,
    const SegmentSeriesMap& seriesBySegment,
    const AssumptionSet& assumptions,
    FailureMode failureMode = FailureMode::Strict);

}  // namespace ipvalue
