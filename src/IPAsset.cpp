#include "IPAsset.hpp"
#include <cmath>
#include <set>
#include <sstream>
#include <type_traits>

namespace ipvalue {

namespace {

bool inUnitRange(double value) noexcept
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

Expected<void> requireUnitRange(std::string_view name, double value)
{
    if (!inUnitRange(value)) {
        std::ostringstream oss;
        oss << name << " must lie in [0,1], got " << value;
        return makeError(ErrorCode::ParameterOutOfRange, oss.str());
    }
    return {};
}

struct ParameterValidator {
    Expected<void> operator()(const ReliefFromRoyaltyParameters& p) const {
        return requireUnitRange("Royalty rate", p.royaltyRate);
    }

    Expected<void> operator()(const ExcessEarningsParameters& p) const {
        if (p.operatingMargin) {
            if (auto r = requireUnitRange("Operating margin", *p.operatingMargin); !r) {
                return r;
            }
        }
        for (const auto& [category, rate] : p.contributoryAssets) {
            if (auto r = requireUnitRange("Required return of '" + category + "'", rate); !r) {
                return r;
            }
        }
        if (auto r = requireUnitRange("Proxy asset fraction", p.proxyAssetFraction); !r) {
            return r;
        }
        return requireUnitRange("IP contribution fraction", p.ipContributionFraction);
    }

    Expected<void> operator()(const TechnologyFactorParameters& p) const {
        if (auto r = requireUnitRange("Base royalty rate", p.baseRoyaltyRate); !r) return r;
        if (auto r = requireUnitRange("Innovation score", p.innovationScore); !r) return r;
        if (auto r = requireUnitRange("Commercial score", p.commercialScore); !r) return r;
        if (auto r = requireUnitRange("Legal strength score", p.legalStrengthScore); !r) return r;

        if (p.totalLifeYears <= 0) {
            return makeError(ErrorCode::ParameterOutOfRange,
                             "Total statutory life must be positive, got " +
                             std::to_string(p.totalLifeYears));
        }
        if (p.remainingLifeYears < 1 || p.remainingLifeYears > p.totalLifeYears) {
            return makeError(ErrorCode::ParameterOutOfRange,
                             "Remaining life must lie in [1, " +
                             std::to_string(p.totalLifeYears) + "], got " +
                             std::to_string(p.remainingLifeYears));
        }
        return {};
    }

    Expected<void> operator()(const IncrementalIncomeParameters& p) const {
        if (auto r = requireUnitRange("Erosion fraction", p.erosionFraction); !r) {
            return r;
        }
        if (p.operatingMargin) {
            return requireUnitRange("Operating margin", *p.operatingMargin);
        }
        return {};
    }
};

}  // namespace

std::map<std::string, double> defaultContributoryAssets()
{
    return {
        {"working_capital", 0.02},
        {"fixed_assets", 0.10},
        {"other_intangibles", 0.12}
    };
}

ValuationMethod methodOf(const MethodParameters& parameters) noexcept
{
    switch (parameters.index()) {
        case 0: return ValuationMethod::ReliefFromRoyalty;
        case 1: return ValuationMethod::ExcessEarnings;
        case 2: return ValuationMethod::TechnologyFactor;
        default: return ValuationMethod::IncrementalIncome;
    }
}

Expected<void> validateParameters(const MethodParameters& parameters)
{
    return std::visit(ParameterValidator{}, parameters);
}

std::string_view toString(AssetKind kind) noexcept
{
    switch (kind) {
        case AssetKind::Patent:      return "patent";
        case AssetKind::Trademark:   return "trademark";
        case AssetKind::TradeSecret: return "trade_secret";
        case AssetKind::Copyright:   return "copyright";
        case AssetKind::Other:       return "other";
    }
    return "other";
}

std::optional<AssetKind> parseAssetKind(std::string_view name) noexcept
{
    if (name == "patent") return AssetKind::Patent;
    if (name == "trademark") return AssetKind::Trademark;
    if (name == "trade_secret") return AssetKind::TradeSecret;
    if (name == "copyright") return AssetKind::Copyright;
    if (name == "other") return AssetKind::Other;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// IPAsset
// ═══════════════════════════════════════════════════════════════════════════════

IPAsset::IPAsset(
    std::string id,
    AssetKind kind,
    std::string description,
    std::vector<SegmentAttribution> segments,
    MethodParameters parameters)
    : id_(std::move(id)),
      kind_(kind),
      description_(std::move(description)),
      segments_(std::move(segments)),
      parameters_(std::move(parameters)) {}

Expected<IPAsset> IPAsset::create(
    std::string id,
    AssetKind kind,
    std::string description,
    std::vector<SegmentAttribution> segments,
    MethodParameters parameters)
{
    if (id.empty()) {
        return makeError(ErrorCode::ParameterOutOfRange, "Asset id cannot be empty");
    }

    if (segments.empty()) {
        return makeError(ErrorCode::ParameterOutOfRange,
                         "Asset '" + id + "' has no segment attributions");
    }

    std::set<std::string> seen;
    for (const auto& attribution : segments) {
        if (attribution.segmentName.empty()) {
            return makeError(ErrorCode::ParameterOutOfRange,
                             "Asset '" + id + "' has an attribution without segment name");
        }

        // Доля атрибуции в (0, 1]
        if (!std::isfinite(attribution.fraction) ||
            attribution.fraction <= 0.0 || attribution.fraction > 1.0) {
            std::ostringstream oss;
            oss << "Attribution fraction for segment '" << attribution.segmentName
                << "' of asset '" << id << "' must lie in (0,1], got "
                << attribution.fraction;
            return makeError(ErrorCode::ParameterOutOfRange, oss.str());
        }

        if (!seen.insert(attribution.segmentName).second) {
            return makeError(ErrorCode::ParameterOutOfRange,
                             "Segment '" + attribution.segmentName +
                             "' is attributed twice in asset '" + id + "'");
        }
    }

    auto parametersCheck = validateParameters(parameters);
    if (!parametersCheck) {
        return makeError(parametersCheck.error().code,
                         "Asset '" + id + "': " + parametersCheck.error().message);
    }

    return IPAsset(std::move(id), kind, std::move(description),
                   std::move(segments), std::move(parameters));
}

namespace {

double scaleFraction(double fraction, double factor, bool* capped)
{
    double scaled = fraction * factor;
    if (scaled > 1.0) {
        if (capped) {
            *capped = true;
        }
        return 1.0;
    }
    return scaled;
}

}  // namespace

Expected<IPAsset> IPAsset::withScaledAttribution(double factor, bool* capped) const
{
    auto scaled = segments_;
    for (auto& attribution : scaled) {
        attribution.fraction = scaleFraction(attribution.fraction, factor, capped);
    }
    return create(id_, kind_, description_, std::move(scaled), parameters_);
}

Expected<IPAsset> IPAsset::withScaledRoyalty(double factor, bool* capped) const
{
    // Для методов без ставки роялти масштабируется аналогичный драйвер:
    // доля избыточной прибыли (MPEEM) или доля потери выручки (Incremental)
    MethodParameters scaled = parameters_;
    std::visit([factor, capped](auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ReliefFromRoyaltyParameters>) {
            p.royaltyRate = scaleFraction(p.royaltyRate, factor, capped);
        } else if constexpr (std::is_same_v<T, ExcessEarningsParameters>) {
            p.ipContributionFraction = scaleFraction(p.ipContributionFraction, factor, capped);
        } else if constexpr (std::is_same_v<T, TechnologyFactorParameters>) {
            p.baseRoyaltyRate = scaleFraction(p.baseRoyaltyRate, factor, capped);
        } else {
            p.erosionFraction = scaleFraction(p.erosionFraction, factor, capped);
        }
    }, scaled);

    return create(id_, kind_, description_, segments_, std::move(scaled));
}

}  // namespace ipvalue
