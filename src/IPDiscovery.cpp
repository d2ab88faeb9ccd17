#include "IPDiscovery.hpp"
#include "SegmentDataPreparer.hpp"
#include <algorithm>
#include <cctype>
#include <type_traits>

namespace ipvalue {

namespace {

std::string upperCase(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool containsAny(std::string_view text, std::initializer_list<std::string_view> needles)
{
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return text.find(needle) != std::string_view::npos;
    });
}

bool isHardwareKey(std::string_view key)
{
    return containsAny(key, {"phone", "pad", "mac", "watch", "pod"});
}

std::string describe(std::string_view ticker, const std::string& segment, std::string_view what)
{
    std::string text;
    if (!ticker.empty()) {
        text += std::string(ticker) + " ";
    }
    return text + segment + " " + std::string(what);
}

template<typename T>
Expected<void> appendAsset(std::vector<IPAsset>& assets, Expected<T> asset)
{
    if (!asset) {
        return std::unexpected(asset.error());
    }
    if constexpr (std::is_same_v<T, IPAsset>) {
        assets.push_back(std::move(*asset));
    } else {
        for (auto& item : *asset) {
            assets.push_back(std::move(item));
        }
    }
    return {};
}

}  // namespace

IPDiscovery::IPDiscovery()
    : industryRoyaltyRates_{
          {"software", 0.08},
          {"hardware", 0.04},
          {"pharmaceutical", 0.12},
          {"consumer_brand", 0.06},
          {"technology", 0.05},
          {"services", 0.07},
          {"biotech", 0.15},
          {"semiconductor", 0.05},
          {"telecommunications", 0.04},
          {"automotive", 0.03},
      } {}

double IPDiscovery::industryRoyaltyRate(std::string_view industry) const
{
    auto it = industryRoyaltyRates_.find(std::string(industry));
    return it != industryRoyaltyRates_.end() ? it->second : 0.05;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Поиск по сегментам
// ═══════════════════════════════════════════════════════════════════════════════

Expected<std::vector<IPAsset>> IPDiscovery::discoverAssets(
    std::string_view ticker,
    const std::vector<std::string>& segments) const
{
    std::vector<IPAsset> assets;

    for (const auto& segment : segments) {
        const std::string key = segmentMatchKey(segment, SegmentMatchMode::Normalized);

        // Товарный знак для продуктовых сегментов
        if (!containsAny(key, {"service", "other", "corporate"})) {
            if (auto added = appendAsset(assets, createTrademark(ticker, segment, key)); !added) {
                return std::unexpected(added.error());
            }
        }

        if (isHardwareKey(key)) {
            if (auto added = appendAsset(assets, createTechnologyPatents(ticker, segment)); !added) {
                return std::unexpected(added.error());
            }
        }

        if (containsAny(key, {"service", "software", "cloud", "platform"})) {
            if (auto added = appendAsset(assets, createTradeSecret(ticker, segment)); !added) {
                return std::unexpected(added.error());
            }
        }
    }

    return assets;
}

Expected<IPAsset> IPDiscovery::createTrademark(
    std::string_view ticker,
    const std::string& segment,
    const std::string& key) const
{
    double attribution = 0.12;
    if (key.find("iphone") != std::string::npos) {
        attribution = 0.25;
    } else if (containsAny(key, {"ipad", "mac"})) {
        attribution = 0.20;
    } else if (containsAny(key, {"watch", "wearable"})) {
        attribution = 0.15;
    }

    return IPAsset::create(
        "TM-" + upperCase(segment) + "-001",
        AssetKind::Trademark,
        describe(ticker, segment, "brand and trademark"),
        {{segment, attribution}},
        ReliefFromRoyaltyParameters{industryRoyaltyRate("consumer_brand")});
}

Expected<std::vector<IPAsset>> IPDiscovery::createTechnologyPatents(
    std::string_view ticker,
    const std::string& segment) const
{
    std::vector<IPAsset> patents;
    const std::string upper = upperCase(segment);

    TechnologyFactorParameters core;
    core.baseRoyaltyRate = industryRoyaltyRate("technology");
    core.innovationScore = 0.80;
    core.commercialScore = 0.85;
    core.legalStrengthScore = 0.80;
    core.remainingLifeYears = 10;

    auto corePatent = IPAsset::create(
        "PAT-" + upper + "-CORE-001",
        AssetKind::Patent,
        describe(ticker, segment, "core technology patents"),
        {{segment, 0.15}},
        core);
    if (!corePatent) {
        return std::unexpected(corePatent.error());
    }
    patents.push_back(std::move(*corePatent));

    TechnologyFactorParameters design;
    design.baseRoyaltyRate = 0.03;
    design.innovationScore = 0.85;
    design.commercialScore = 0.90;
    design.legalStrengthScore = 0.75;
    design.remainingLifeYears = 12;

    auto designPatent = IPAsset::create(
        "PAT-" + upper + "-DESIGN-001",
        AssetKind::Patent,
        describe(ticker, segment, "industrial design patents"),
        {{segment, 0.08}},
        design);
    if (!designPatent) {
        return std::unexpected(designPatent.error());
    }
    patents.push_back(std::move(*designPatent));

    return patents;
}

Expected<IPAsset> IPDiscovery::createTradeSecret(
    std::string_view ticker,
    const std::string& segment) const
{
    return IPAsset::create(
        "TS-" + upperCase(segment) + "-001",
        AssetKind::TradeSecret,
        describe(ticker, segment, "proprietary algorithms and software"),
        {{segment, 0.30}},
        ReliefFromRoyaltyParameters{industryRoyaltyRate("software")});
}

// ═══════════════════════════════════════════════════════════════════════════════
// Общие активы
// ═══════════════════════════════════════════════════════════════════════════════

Expected<std::vector<IPAsset>> IPDiscovery::suggestSharedAssets(
    const std::vector<std::string>& segments) const
{
    std::vector<IPAsset> shared;

    std::vector<std::string> hardware;
    for (const auto& segment : segments) {
        if (containsAny(foldCase(segment), {"phone", "pad", "mac", "watch"})) {
            hardware.push_back(segment);
        }
    }

    if (hardware.size() < 2) {
        return shared;
    }

    std::vector<SegmentAttribution> chipSegments;
    std::vector<SegmentAttribution> osSegments;
    for (const auto& segment : hardware) {
        chipSegments.push_back({segment, 0.12});
        osSegments.push_back({segment, 0.10});
    }

    TechnologyFactorParameters chip;
    chip.baseRoyaltyRate = 0.05;
    chip.innovationScore = 0.92;
    chip.commercialScore = 0.88;
    chip.legalStrengthScore = 0.90;
    chip.remainingLifeYears = 12;

    auto chipPatent = IPAsset::create(
        "PAT-CHIP-SHARED-001",
        AssetKind::Patent,
        "Proprietary processor/chip architecture",
        std::move(chipSegments),
        chip);
    if (!chipPatent) {
        return std::unexpected(chipPatent.error());
    }
    shared.push_back(std::move(*chipPatent));

    auto operatingSystem = IPAsset::create(
        "TS-OS-SHARED-001",
        AssetKind::TradeSecret,
        "Operating system and software platform",
        std::move(osSegments),
        ReliefFromRoyaltyParameters{0.08});
    if (!operatingSystem) {
        return std::unexpected(operatingSystem.error());
    }
    shared.push_back(std::move(*operatingSystem));

    return shared;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Отраслевые подсказки
// ═══════════════════════════════════════════════════════════════════════════════

IndustryInsights IPDiscovery::industryInsights(const std::vector<std::string>& segments) const
{
    std::string joined;
    for (const auto& segment : segments) {
        joined += foldCase(segment) + " ";
    }

    const bool hasHardware = containsAny(joined, {"phone", "computer", "device", "watch"});
    const bool hasServices = containsAny(joined, {"service", "cloud", "subscription"});
    const bool hasSoftware = containsAny(joined, {"software", "platform", "app"});

    IndustryInsights insights;

    if (hasHardware) {
        insights.primaryIpTypes.insert(insights.primaryIpTypes.end(),
                                       {"Patents", "Design Rights", "Trademarks"});
        insights.keyFocusAreas.push_back("Hardware innovation and industrial design");
        insights.competitiveConsiderations.push_back("Patent portfolio strength vs. competitors");
    }

    if (hasServices) {
        insights.primaryIpTypes.insert(insights.primaryIpTypes.end(),
                                       {"Trade Secrets", "Copyrights"});
        insights.keyFocusAreas.push_back("Platform ecosystem and network effects");
        insights.competitiveConsiderations.push_back("Customer lock-in and switching costs");
    }

    if (hasSoftware) {
        insights.primaryIpTypes.insert(insights.primaryIpTypes.end(),
                                       {"Copyrights", "Trade Secrets"});
        insights.keyFocusAreas.push_back("Algorithm efficiency and user experience");
    }

    if (hasHardware && hasServices) {
        insights.valuationApproach =
            "Hybrid: Technology Factor for patents, Relief from Royalty for brand/platform";
    } else if (hasHardware) {
        insights.valuationApproach = "Technology-focused: Emphasize patent quality and innovation";
    } else if (hasServices) {
        insights.valuationApproach = "Platform-focused: Value network effects and recurring revenue";
    } else {
        insights.valuationApproach = "Standard Relief from Royalty method";
    }

    return insights;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Таблицы атрибуции и ставок
// ═══════════════════════════════════════════════════════════════════════════════

double IPDiscovery::estimateAttribution(std::string_view segmentName, AssetKind kind) const
{
    const std::string lower = foldCase(segmentName);

    switch (kind) {
        case AssetKind::Trademark:
            if (lower.find("iphone") != std::string::npos) return 0.25;
            if (containsAny(lower, {"ipad", "mac"})) return 0.20;
            return 0.15;
        case AssetKind::Patent:
            if (containsAny(lower, {"chip", "processor"})) return 0.15;
            return 0.10;
        case AssetKind::TradeSecret:
            if (containsAny(lower, {"service", "cloud"})) return 0.30;
            return 0.15;
        case AssetKind::Copyright:
            return 0.20;
        case AssetKind::Other:
            return 0.10;
    }
    return 0.10;
}

double IPDiscovery::suggestRoyaltyRate(AssetKind kind, std::string_view industry) const
{
    double rate = 0.05;
    switch (kind) {
        case AssetKind::Patent:      rate = 0.05; break;
        case AssetKind::Trademark:   rate = 0.06; break;
        case AssetKind::Copyright:   rate = 0.08; break;
        case AssetKind::TradeSecret: rate = 0.08; break;
        case AssetKind::Other:       rate = 0.05; break;
    }

    const std::string lower = foldCase(industry);
    if (containsAny(lower, {"pharma", "biotech"})) {
        rate *= 2.0;
    } else if (lower.find("software") != std::string::npos) {
        rate *= 1.3;
    } else if (lower.find("consumer") != std::string::npos) {
        rate *= 1.2;
    }

    return rate;
}

}  // namespace ipvalue
