#include "AssetAggregator.hpp"
#include "ValuationMethods.hpp"

namespace ipvalue {

std::string_view toString(FailureMode mode) noexcept
{
    return mode == FailureMode::Strict ? "strict" : "best-effort";
}

std::vector<double> attributeRevenue(const SegmentSeries& series, double fraction)
{
    std::vector<double> attributed;
    attributed.reserve(series.revenues.size());
    for (double revenue : series.revenues) {
        attributed.push_back(revenue * fraction);
    }
    return attributed;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Актив
// ═══════════════════════════════════════════════════════════════════════════════

Expected<AssetValuation> aggregateAsset(
    const IPAsset& asset,
    const SegmentSeriesMap& seriesBySegment,
    const AssumptionSet& assumptions)
{
    AssetValuation valuation;
    valuation.assetId = asset.id();
    valuation.assetKind = std::string(toString(asset.kind()));
    valuation.description = asset.description();
    valuation.method = asset.method();

    for (const auto& attribution : asset.segments()) {
        auto it = seriesBySegment.find(attribution.segmentName);
        if (it == seriesBySegment.end()) {
            return makeError(ErrorCode::DataNotFound,
                             "Asset '" + asset.id() + "': no prepared data for segment '" +
                             attribution.segmentName + "'");
        }

        const auto& series = it->second;
        auto result = valueRevenueSeries(
            attributeRevenue(series, attribution.fraction),
            assumptions,
            asset.parameters(),
            series.averageOperatingMargin());

        if (!result) {
            return makeError(result.error().code,
                             "Asset '" + asset.id() + "', segment '" +
                             attribution.segmentName + "': " + result.error().message);
        }

        result->segmentName = attribution.segmentName;
        result->attributionFraction = attribution.fraction;

        valuation.pvExplicit += result->pvExplicit;
        valuation.pvTerminal += result->pvTerminal;
        valuation.totalValue += result->totalValue;
        valuation.segments.push_back(std::move(*result));
    }

    return valuation;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Портфель
// ═══════════════════════════════════════════════════════════════════════════════

Expected<PortfolioValuation> aggregatePortfolio(
    const std::vector<IPAsset>& assets,
    const SegmentSeriesMap& seriesBySegment,
    const AssumptionSet& assumptions,
    FailureMode failureMode)
{
    auto valid = validateAssumptions(assumptions);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    PortfolioValuation portfolio;
    portfolio.assumptions = assumptions;

    for (const auto& asset : assets) {
        auto valuation = aggregateAsset(asset, seriesBySegment, assumptions);

        if (!valuation) {
            if (failureMode == FailureMode::Strict) {
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

}  // namespace ipvalue
