#include "SensitivityAnalyzer.hpp"

namespace ipvalue {

namespace {

Expected<double> portfolioValue(
    const std::vector<IPAsset>& assets,
    const SegmentSeriesMap& seriesBySegment,
    const AssumptionSet& assumptions)
{
    auto portfolio = aggregatePortfolio(assets, seriesBySegment, assumptions, FailureMode::Strict);
    if (!portfolio) {
        return std::unexpected(portfolio.error());
    }
    return portfolio->totalValue;
}

template<typename Scale>
Expected<std::vector<IPAsset>> scaleAssets(
    const std::vector<IPAsset>& assets,
    double factor,
    Scale scale,
    bool& capped)
{
    std::vector<IPAsset> scaled;
    scaled.reserve(assets.size());
    for (const auto& asset : assets) {
        auto copy = scale(asset, factor, &capped);
        if (!copy) {
            return std::unexpected(copy.error());
        }
        scaled.push_back(std::move(*copy));
    }
    return scaled;
}

template<typename Scale>
Expected<SensitivityRow> assetScenario(
    std::string driver,
    const std::vector<IPAsset>& assets,
    const SegmentSeriesMap& seriesBySegment,
    const AssumptionSet& assumptions,
    double baseValue,
    double shock,
    Scale scale)
{
    SensitivityRow row;
    row.driver = std::move(driver);
    row.baseValue = baseValue;

    for (double direction : {-1.0, 1.0}) {
        bool capped = false;
        auto scaled = scaleAssets(assets, 1.0 + direction * shock, scale, capped);
        if (!scaled) {
            return makeError(scaled.error().code,
                             row.driver + " scenario: " + scaled.error().message);
        }
        auto value = portfolioValue(*scaled, seriesBySegment, assumptions);
        if (!value) {
            return makeError(value.error().code,
                             row.driver + " scenario: " + value.error().message);
        }
        if (direction < 0.0) {
            row.lowValue = *value;
        } else {
            row.highValue = *value;
            row.highCapped = capped;
        }
    }

    return row;
}

Expected<SensitivityRow> assumptionScenario(
    std::string driver,
    const std::vector<IPAsset>& assets,
    const SegmentSeriesMap& seriesBySegment,
    const AssumptionSet& assumptions,
    double baseValue,
    double shift,
    double AssumptionSet::*field)
{
    SensitivityRow row;
    row.driver = std::move(driver);
    row.baseValue = baseValue;

    for (double direction : {-1.0, 1.0}) {
        AssumptionSet shifted = assumptions;
        shifted.*field += direction * shift;

        auto value = portfolioValue(assets, seriesBySegment, shifted);
        if (!value) {
            return makeError(value.error().code,
                             row.driver + " scenario: " + value.error().message);
        }
        (direction < 0.0 ? row.lowValue : row.highValue) = *value;
    }

    return row;
}

}  // namespace

SensitivityAnalyzer::SensitivityAnalyzer(SensitivityShocks shocks)
    : shocks_(shocks) {}

Expected<std::vector<SensitivityRow>> SensitivityAnalyzer::analyze(
    const std::vector<IPAsset>& assets,
    const SegmentSeriesMap& seriesBySegment,
    const AssumptionSet& assumptions) const
{
    auto base = portfolioValue(assets, seriesBySegment, assumptions);
    if (!base) {
        return std::unexpected(base.error());
    }

    std::vector<SensitivityRow> rows;

    auto royalty = assetScenario("royalty_rate", assets, seriesBySegment, assumptions,
        *base, shocks_.royaltyScale,
        [](const IPAsset& asset, double factor, bool* capped) {
            return asset.withScaledRoyalty(factor, capped);
        });
    if (!royalty) {
        return std::unexpected(royalty.error());
    }
    rows.push_back(std::move(*royalty));

    auto attribution = assetScenario("attribution", assets, seriesBySegment, assumptions,
        *base, shocks_.attributionScale,
        [](const IPAsset& asset, double factor, bool* capped) {
            return asset.withScaledAttribution(factor, capped);
        });
    if (!attribution) {
        return std::unexpected(attribution.error());
    }
    rows.push_back(std::move(*attribution));

    auto wacc = assumptionScenario("wacc", assets, seriesBySegment, assumptions,
        *base, shocks_.waccShift, &AssumptionSet::wacc);
    if (!wacc) {
        return std::unexpected(wacc.error());
    }
    rows.push_back(std::move(*wacc));

    auto growth = assumptionScenario("terminal_growth", assets, seriesBySegment, assumptions,
        *base, shocks_.growthShift, &AssumptionSet::terminalGrowth);
    if (!growth) {
        return std::unexpected(growth.error());
    }
    rows.push_back(std::move(*growth));

    return rows;
}

}  // namespace ipvalue
