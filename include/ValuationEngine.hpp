#pragma once

#include "AssetAggregator.hpp"
#include "AssumptionCalculator.hpp"
#include "FairValueCalculator.hpp"
#include "FinancialHealthAnalyzer.hpp"
#include "IFinancialDataSource.hpp"
#include "SegmentDataPreparer.hpp"
#include "SensitivityAnalyzer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Настройки движка
// ═══════════════════════════════════════════════════════════════════════════════

struct EngineOptions {
    std::size_t periods = 5;
    SegmentMatchMode matchMode = SegmentMatchMode::Exact;
    FailureMode failureMode = FailureMode::Strict;
    AllocationStrategies allocation;
    MarketParameters market;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Valuation Engine
// ═══════════════════════════════════════════════════════════════════════════════
//
// Фасад для слоя представления: получает данные из источника и передает
// их чистым функциям оценки. Сам движок ничего не пишет в лог.

class ValuationEngine {
public:
    explicit ValuationEngine(
        std::shared_ptr<IFinancialDataSource> dataSource,
        EngineOptions options = {});

    Expected<AssetValuation> valueAsset(
        std::string_view ticker,
        const IPAsset& asset,
        const AssumptionSet& assumptions);

    /**
     * @brief Оценка портфеля активов одной компании
     *
     * Каждый сегмент готовится один раз и используется всеми активами.
     * В режиме BestEffort актив с ошибкой (в т.ч. ошибкой подготовки
     * сегмента) пропускается целиком и попадает в skipped.
     */
    Expected<PortfolioValuation> valuePortfolio(
        std::string_view ticker,
        const std::vector<IPAsset>& assets,
        const AssumptionSet& assumptions);

    // Допущения из отчетности с раскрытием всех компонентов
    Expected<AssumptionDerivation> deriveAssumptions(
        std::string_view ticker,
        const AssumptionFallbacks& fallbacks = {},
        const AssumptionOverrides& overrides = {});

    Expected<FinancialHealthReport> analyzeFinancialHealth(std::string_view ticker);

    // Справедливая стоимость акции по DCF и мультипликаторам
    Expected<FairValueReport> estimateFairValue(
        std::string_view ticker,
        const FairValueParameters& parameters = {});

    Expected<std::vector<SensitivityRow>> analyzeSensitivity(
        std::string_view ticker,
        const std::vector<IPAsset>& assets,
        const AssumptionSet& assumptions,
        const SensitivityShocks& shocks = {});

    Expected<std::vector<std::string>> listSegments(std::string_view ticker);

    const EngineOptions& options() const noexcept { return options_; }

private:
    struct PreparedSegments {
        SegmentSeriesMap series;
        std::map<std::string, ValuationError> failures;
    };

    // Подготовить все различные сегменты активов. Strict: первая ошибка возвращается.
    Expected<PreparedSegments> prepareSegments(
        std::string_view ticker,
        const std::vector<IPAsset>& assets,
        FailureMode failureMode);

    std::shared_ptr<IFinancialDataSource> dataSource_;
    EngineOptions options_;
    SegmentDataPreparer preparer_;
    AssumptionCalculator assumptionCalculator_;
    FinancialHealthAnalyzer healthAnalyzer_;
    FairValueCalculator fairValueCalculator_;
};

}  // namespace ipvalue
