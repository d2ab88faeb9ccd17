#include "ValuationEngine.hpp"

namespace ipvalue {

ValuationEngine::ValuationEngine(
    std::shared_ptr<IFinancialDataSource> dataSource,
    EngineOptions options)
    : dataSource_(std::move(dataSource)),
      options_(std::move(options)),
      preparer_(options_.matchMode, options_.allocation),
      assumptionCalculator_(options_.market),
      fairValueCalculator_(options_.market) {}

Expected<std::vector<std::string>> ValuationEngine::listSegments(std::string_view ticker)
{
    if (!dataSource_) {
        return makeError(ErrorCode::DataSourceFailure, "Data source is not configured");
    }
    return dataSource_->listSegments(ticker);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Подготовка сегментов
// ═══════════════════════════════════════════════════════════════════════════════

Expected<ValuationEngine::PreparedSegments> ValuationEngine::prepareSegments(
    std::string_view ticker,
    const std::vector<IPAsset>& assets,
    FailureMode failureMode)
{
    if (!dataSource_) {
        return makeError(ErrorCode::DataSourceFailure, "Data source is not configured");
    }

    PreparedSegments prepared;

    for (const auto& asset : assets) {
        for (const auto& attribution : asset.segments()) {
            const auto& name = attribution.segmentName;
            if (prepared.series.count(name) > 0 || prepared.failures.count(name) > 0) {
                continue;
            }

            auto series = preparer_.prepare(*dataSource_, ticker, name, options_.periods);
            if (series) {
                prepared.series.emplace(name, std::move(*series));
                continue;
            }

            if (failureMode == FailureMode::Strict) {
                return makeError(series.error().code,
                                 "Asset '" + asset.id() + "': " + series.error().message);
            }
            prepared.failures.emplace(name, series.error());
        }
    }

    return prepared;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Оценка
// ═══════════════════════════════════════════════════════════════════════════════

Expected<AssetValuation> ValuationEngine::valueAsset(
    std::string_view ticker,
    const IPAsset& asset,
    const AssumptionSet& assumptions)
{
    auto valid = validateAssumptions(assumptions);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    auto prepared = prepareSegments(ticker, {asset}, FailureMode::Strict);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }

    return aggregateAsset(asset, prepared->series, assumptions);
}

Expected<PortfolioValuation> ValuationEngine::valuePortfolio(
    std::string_view ticker,
    const std::vector<IPAsset>& assets,
    const AssumptionSet& assumptions)
{
    auto valid = validateAssumptions(assumptions);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    auto prepared = prepareSegments(ticker, assets, options_.failureMode);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }

    PortfolioValuation portfolio;
    portfolio.ticker = std::string(ticker);
    portfolio.assumptions = assumptions;

    for (const auto& asset : assets) {
        // Актив с неподготовленным сегментом не оценивается частично
        std::optional<ValuationError> segmentFailure;
        for (const auto& attribution : asset.segments()) {
            auto it = prepared->failures.find(attribution.segmentName);
            if (it != prepared->failures.end()) {
                segmentFailure = it->second;
                break;
            }
        }

        if (segmentFailure) {
            portfolio.skipped.push_back(SkippedAsset{asset.id(), *segmentFailure});
            continue;
        }

        auto valuation = aggregateAsset(asset, prepared->series, assumptions);
        if (!valuation) {
            if (options_.failureMode == FailureMode::Strict) {
                return std::unexpected(valuation.error());
            }
            portfolio.skipped.push_back(SkippedAsset{asset.id(), valuation.error()});
            continue;
        }

        portfolio.totalValue += valuation->totalValue;
        portfolio.assets.push_back(std::move(*valuation));
    }

    return portfolio;
}

Expected<std::vector<SensitivityRow>> ValuationEngine::analyzeSensitivity(
    std::string_view ticker,
    const std::vector<IPAsset>& assets,
    const AssumptionSet& assumptions,
    const SensitivityShocks& shocks)
{
    auto prepared = prepareSegments(ticker, assets, FailureMode::Strict);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }

    return SensitivityAnalyzer(shocks).analyze(assets, prepared->series, assumptions);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Допущения и финансовый анализ
// ═══════════════════════════════════════════════════════════════════════════════

Expected<AssumptionDerivation> ValuationEngine::deriveAssumptions(
    std::string_view ticker,
    const AssumptionFallbacks& fallbacks,
    const AssumptionOverrides& overrides)
{
    if (!dataSource_) {
        return makeError(ErrorCode::DataSourceFailure, "Data source is not configured");
    }

    auto statements = dataSource_->fetchStatementSeries(ticker, options_.periods);
    if (!statements) {
        return std::unexpected(statements.error());
    }

    auto snapshot = dataSource_->fetchMarketSnapshot(ticker);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    return assumptionCalculator_.derive(*statements, *snapshot, fallbacks, overrides);
}

Expected<FinancialHealthReport> ValuationEngine::analyzeFinancialHealth(std::string_view ticker)
{
    if (!dataSource_) {
        return makeError(ErrorCode::DataSourceFailure, "Data source is not configured");
    }

    auto statements = dataSource_->fetchStatementSeries(ticker, options_.periods);
    if (!statements) {
        return std::unexpected(statements.error());
    }

    auto snapshot = dataSource_->fetchMarketSnapshot(ticker);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    return healthAnalyzer_.analyze(ticker, *statements, *snapshot);
}

Expected<FairValueReport> ValuationEngine::estimateFairValue(
    std::string_view ticker,
    const FairValueParameters& parameters)
{
    if (!dataSource_) {
        return makeError(ErrorCode::DataSourceFailure, "Data source is not configured");
    }

    auto statements = dataSource_->fetchStatementSeries(ticker, options_.periods);
    if (!statements) {
        return std::unexpected(statements.error());
    }

    auto snapshot = dataSource_->fetchMarketSnapshot(ticker);
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    return fairValueCalculator_.calculate(ticker, *statements, *snapshot, parameters);
}

}  // namespace ipvalue
