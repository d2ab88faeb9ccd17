#pragma once

#include "ValuationTypes.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Параметры методов оценки
// ═══════════════════════════════════════════════════════════════════════════════

struct ReliefFromRoyaltyParameters {
    double royaltyRate = 0.05;
};

// Категории вспомогательных активов по умолчанию и их требуемая доходность
std::map<std::string, double> defaultContributoryAssets();

struct ExcessEarningsParameters {
    // Если не задана - средняя операционная маржа сегмента
    std::optional<double> operatingMargin;

    // категория -> требуемая доходность
    std::map<std::string, double> contributoryAssets = defaultContributoryAssets();

    // ПРИБЛИЖЕНИЕ: стоимость вспомогательного актива = доля выручки,
    // а не распределение реального баланса
    double proxyAssetFraction = 0.5;

    // Доля избыточной прибыли, приходящаяся на актив
    double ipContributionFraction = 0.5;
};

struct TechnologyFactorParameters {
    double baseRoyaltyRate = 0.05;
    double innovationScore = 0.7;
    double commercialScore = 0.7;
    double legalStrengthScore = 0.7;
    int remainingLifeYears = 10;
    int totalLifeYears = 20;
};

struct IncrementalIncomeParameters {
    // Ожидаемое падение выручки сегмента без актива
    double erosionFraction = 0.1;

    // Если не задана - средняя операционная маржа сегмента
    std::optional<double> operatingMargin;
};

using MethodParameters = std::variant<
    ReliefFromRoyaltyParameters,
    ExcessEarningsParameters,
    TechnologyFactorParameters,
    IncrementalIncomeParameters>;

ValuationMethod methodOf(const MethodParameters& parameters) noexcept;

// Проверка диапазонов параметров метода (без зажима значений)
Expected<void> validateParameters(const MethodParameters& parameters);

// ═══════════════════════════════════════════════════════════════════════════════
// Нематериальный актив
// ═══════════════════════════════════════════════════════════════════════════════

enum class AssetKind {
    Patent,
    Trademark,
    TradeSecret,
    Copyright,
    Other
};

std::string_view toString(AssetKind kind) noexcept;
std::optional<AssetKind> parseAssetKind(std::string_view name) noexcept;

struct SegmentAttribution {
    std::string segmentName;
    double fraction = 1.0;  // (0, 1]
};

class IPAsset {
public:
    // Создать актив с проверкой всех полей.
    // Атрибуции не нормализуются: разные активы могут пересекаться на одном сегменте.
    static Expected<IPAsset> create(
        std::string id,
        AssetKind kind,
        std::string description,
        std::vector<SegmentAttribution> segments,
        MethodParameters parameters);

    const std::string& id() const noexcept { return id_; }
    AssetKind kind() const noexcept { return kind_; }
    const std::string& description() const noexcept { return description_; }
    const std::vector<SegmentAttribution>& segments() const noexcept { return segments_; }
    const MethodParameters& parameters() const noexcept { return parameters_; }
    ValuationMethod method() const noexcept { return methodOf(parameters_); }

    // Копия с масштабированными долями атрибуции / ставками роялти
    // (для анализа чувствительности). Доли выше 1 ограничиваются единицей,
    // в capped (если передан) выставляется true. Результат проходит ту же проверку.
    Expected<IPAsset> withScaledAttribution(double factor, bool* capped = nullptr) const;
    Expected<IPAsset> withScaledRoyalty(double factor, bool* capped = nullptr) const;

private:
    IPAsset(
        std::string id,
        AssetKind kind,
        std::string description,
        std::vector<SegmentAttribution> segments,
        MethodParameters parameters);

    std::string id_;
    AssetKind kind_;
    std::string description_;
    std::vector<SegmentAttribution> segments_;
    MethodParameters parameters_;
};

}  // namespace ipvalue
