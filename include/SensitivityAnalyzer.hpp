#pragma once

#include "AssetAggregator.hpp"
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Анализ чувствительности портфеля
// ═══════════════════════════════════════════════════════════════════════════════

struct SensitivityShocks {
    double royaltyScale = 0.40;      // ставки роялти * (1 ± 0.40)
    double attributionScale = 0.25;  // доли атрибуции * (1 ± 0.25)
    double waccShift = 0.02;         // WACC ± 2 п.п.
    double growthShift = 0.01;       // терминальный рост ± 1 п.п.
};

struct SensitivityRow {
    std::string driver;  // royalty_rate, attribution, wacc, terminal_growth
    double lowValue = 0.0;
    double baseValue = 0.0;
    double highValue = 0.0;
    bool highCapped = false;  // в сценарии high доля/ставка ограничена единицей
};

class SensitivityAnalyzer {
public:
    explicit SensitivityAnalyzer(SensitivityShocks shocks = {});

    /**
     * @brief Переоценить портфель, сдвигая по одному фактору
     *
     * low/high соответствуют уменьшению/увеличению фактора.
     * Доли и ставки выше 1 в сценарии high ограничиваются единицей
     * (highCapped). Сценарий с WACC <= g - ошибка вызова.
     */
    Expected<std::vector<SensitivityRow>> analyze(
        const std::vector<IPAsset>& assets,
        const SegmentSeriesMap& seriesBySegment,
        const AssumptionSet& assumptions) const;

    const SensitivityShocks& shocks() const noexcept { return shocks_; }

private:
    SensitivityShocks shocks_;
};

}  // namespace ipvalue
