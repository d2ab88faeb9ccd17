#pragma once

#include "IPAsset.hpp"
#include <map>
#include <string>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Эвристический поиск нематериальных активов по сегментам
// ═══════════════════════════════════════════════════════════════════════════════
//
// Результаты - только подсказки для пользователя. В оценку автоматически
// не передаются.

struct IndustryInsights {
    std::vector<std::string> primaryIpTypes;
    std::vector<std::string> keyFocusAreas;
    std::vector<std::string> competitiveConsiderations;
    std::string valuationApproach;
};

class IPDiscovery {
public:
    IPDiscovery();

    /**
     * @brief Предложить активы для каждого сегмента
     *
     * Товарные сегменты получают товарный знак, аппаратные - патенты на
     * технологию и дизайн (метод технологического фактора), сервисные и
     * программные - коммерческую тайну.
     */
    Expected<std::vector<IPAsset>> discoverAssets(
        std::string_view ticker,
        const std::vector<std::string>& segments) const;

    // Общие для двух и более аппаратных сегментов: патент на чип и ОС
    Expected<std::vector<IPAsset>> suggestSharedAssets(
        const std::vector<std::string>& segments) const;

    IndustryInsights industryInsights(const std::vector<std::string>& segments) const;

    // Типичная доля сегмента для вида актива
    double estimateAttribution(std::string_view segmentName, AssetKind kind) const;

    // Базовая ставка по виду актива с поправкой на отрасль
    double suggestRoyaltyRate(AssetKind kind, std::string_view industry = {}) const;

    // Отраслевая ставка роялти; 0.05 для неизвестной отрасли
    double industryRoyaltyRate(std::string_view industry) const;

    const std::map<std::string, double>& industryRoyaltyRates() const noexcept {
        return industryRoyaltyRates_;
    }

private:
    Expected<IPAsset> createTrademark(
        std::string_view ticker, const std::string& segment, const std::string& key) const;
    Expected<std::vector<IPAsset>> createTechnologyPatents(
        std::string_view ticker, const std::string& segment) const;
    Expected<IPAsset> createTradeSecret(
        std::string_view ticker, const std::string& segment) const;

    std::map<std::string, double> industryRoyaltyRates_;
};

}  // namespace ipvalue
