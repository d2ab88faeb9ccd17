#include "JsonCodec.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace ipvalue {

namespace {

json optionalValue(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

template<typename Enum>
json optionalEnum(const std::optional<Enum>& value) {
    return value ? json(std::string(toString(*value))) : json(nullptr);
}

std::string csvField(std::string_view value) {
    if (value.find_first_of(",\"\n") == std::string_view::npos) {
        return std::string(value);
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// ─────────────────────────────────────────────────────────────────────────────
// Параметры методов
// ─────────────────────────────────────────────────────────────────────────────

// Число лет должно быть целым: 12.5 не усекается молча до 12
Expected<int> parseWholeYears(const json& p, const char* key, int fallback) {
    if (!p.contains(key) || p.at(key).is_null()) {
        return fallback;
    }
    const json& value = p.at(key);
    if (!value.is_number()) {
        return makeError(ErrorCode::ParameterOutOfRange,
                         std::string(key) + " must be a number");
    }
    const double years = value.get<double>();
    if (!std::isfinite(years) || std::floor(years) != years ||
        years < static_cast<double>(std::numeric_limits<int>::min()) ||
        years > static_cast<double>(std::numeric_limits<int>::max())) {
        std::ostringstream oss;
        oss << key << " must be a whole number of years, got " << years;
        return makeError(ErrorCode::ParameterOutOfRange, oss.str());
    }
    return static_cast<int>(years);
}

Expected<MethodParameters> parseParameters(ValuationMethod method, const json& p) {
    switch (method) {
        case ValuationMethod::ReliefFromRoyalty: {
            ReliefFromRoyaltyParameters parameters;
            parameters.royaltyRate = p.value("royalty_rate", parameters.royaltyRate);
            return parameters;
        }
        case ValuationMethod::ExcessEarnings: {
            ExcessEarningsParameters parameters;
            if (p.contains("operating_margin") && !p.at("operating_margin").is_null()) {
                parameters.operatingMargin = p.at("operating_margin").get<double>();
            }
            if (p.contains("contributory_assets")) {
                parameters.contributoryAssets =
                    p.at("contributory_assets").get<std::map<std::string, double>>();
            }
            parameters.proxyAssetFraction =
                p.value("proxy_asset_fraction", parameters.proxyAssetFraction);
            parameters.ipContributionFraction =
                p.value("ip_contribution_fraction", parameters.ipContributionFraction);
            return parameters;
        }
        case ValuationMethod::TechnologyFactor: {
            TechnologyFactorParameters parameters;
            // royalty_rate допускается как синоним базовой ставки
            parameters.baseRoyaltyRate = p.value("base_royalty_rate",
                p.value("royalty_rate", parameters.baseRoyaltyRate));
            parameters.innovationScore = p.value("innovation_score", parameters.innovationScore);
            parameters.commercialScore = p.value("commercial_score", parameters.commercialScore);
            parameters.legalStrengthScore =
                p.value("legal_strength_score", parameters.legalStrengthScore);
            auto remaining = parseWholeYears(p, "remaining_life_years",
                                             parameters.remainingLifeYears);
            if (!remaining) {
                return std::unexpected(remaining.error());
            }
            auto total = parseWholeYears(p, "total_life_years", parameters.totalLifeYears);
            if (!total) {
                return std::unexpected(total.error());
            }
            parameters.remainingLifeYears = *remaining;
            parameters.totalLifeYears = *total;
            return parameters;
        }
        case ValuationMethod::IncrementalIncome: {
            IncrementalIncomeParameters parameters;
            parameters.erosionFraction = p.value("erosion_fraction", parameters.erosionFraction);
            if (p.contains("operating_margin") && !p.at("operating_margin").is_null()) {
                parameters.operatingMargin = p.at("operating_margin").get<double>();
            }
            return parameters;
        }
    }
    return MethodParameters{ReliefFromRoyaltyParameters{}};
}

json parametersToJson(const MethodParameters& parameters) {
    return std::visit([](const auto& p) -> json {
        using T = std::decay_t<decltype(p)>;
        json j;
        if constexpr (std::is_same_v<T, ReliefFromRoyaltyParameters>) {
            j["royalty_rate"] = p.royaltyRate;
        } else if constexpr (std::is_same_v<T, ExcessEarningsParameters>) {
            j["operating_margin"] = optionalValue(p.operatingMargin);
            j["contributory_assets"] = p.contributoryAssets;
            j["proxy_asset_fraction"] = p.proxyAssetFraction;
            j["ip_contribution_fraction"] = p.ipContributionFraction;
        } else if constexpr (std::is_same_v<T, TechnologyFactorParameters>) {
            j["base_royalty_rate"] = p.baseRoyaltyRate;
            j["innovation_score"] = p.innovationScore;
            j["commercial_score"] = p.commercialScore;
            j["legal_strength_score"] = p.legalStrengthScore;
            j["remaining_life_years"] = p.remainingLifeYears;
            j["total_life_years"] = p.totalLifeYears;
        } else {
            j["erosion_fraction"] = p.erosionFraction;
            j["operating_margin"] = optionalValue(p.operatingMargin);
        }
        return j;
    }, parameters);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Файлы
// ═══════════════════════════════════════════════════════════════════════════════

Expected<json> readJsonFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return makeError(ErrorCode::DataSourceFailure,
                         "Failed to open JSON file: " + path.string());
    }

    try {
        json j;
        file >> j;
        return j;
    } catch (const json::exception& e) {
        return makeError(ErrorCode::DataSourceFailure,
                         "Failed to parse JSON file " + path.string() + ": " + e.what());
    }
}

Expected<void> writeJsonFile(const std::filesystem::path& path, const json& j) {
    std::ofstream file(path);
    if (!file) {
        return makeError(ErrorCode::DataSourceFailure,
                         "Failed to create file: " + path.string());
    }

    file << j.dump(2) << '\n';
    if (!file) {
        return makeError(ErrorCode::DataSourceFailure,
                         "Failed to write file: " + path.string());
    }
    return {};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Активы
// ═══════════════════════════════════════════════════════════════════════════════

Expected<IPAsset> parseAsset(const json& j) {
    try {
        const std::string id = j.at("id").get<std::string>();

        const std::string kindName = j.value("kind", "other");
        auto kind = parseAssetKind(kindName);
        if (!kind) {
            return makeError(ErrorCode::ParameterOutOfRange,
                             "Asset '" + id + "': unknown kind '" + kindName + "'");
        }

        const std::string methodName = j.value("method", "relief_from_royalty");
        auto method = parseValuationMethod(methodName);
        if (!method) {
            return makeError(ErrorCode::ParameterOutOfRange,
                             "Asset '" + id + "': unknown valuation method '" + methodName + "'");
        }

        std::vector<SegmentAttribution> segments;
        for (const auto& s : j.at("segments")) {
            segments.push_back(SegmentAttribution{
                s.at("name").get<std::string>(),
                s.value("attribution", 1.0)
            });
        }

        auto parameters = parseParameters(*method, j.value("parameters", json::object()));
        if (!parameters) {
            return makeError(parameters.error().code,
                             "Asset '" + id + "': " + parameters.error().message);
        }

        return IPAsset::create(
            id,
            *kind,
            j.value("description", ""),
            std::move(segments),
            std::move(*parameters));
    } catch (const json::exception& e) {
        return makeError(ErrorCode::DataSourceFailure,
                         std::string("Asset definition error: ") + e.what());
    }
}

Expected<std::vector<IPAsset>> parseAssets(const json& j) {
    const json* list = &j;
    if (j.is_object()) {
        if (!j.contains("assets")) {
            return makeError(ErrorCode::DataSourceFailure,
                             "Asset definition error: missing \"assets\" array");
        }
        list = &j.at("assets");
    }

    if (!list->is_array()) {
        return makeError(ErrorCode::DataSourceFailure,
                         "Asset definition error: \"assets\" must be an array");
    }

    std::vector<IPAsset> assets;
    for (const auto& item : *list) {
        auto asset = parseAsset(item);
        if (!asset) {
            return std::unexpected(asset.error());
        }
        assets.push_back(std::move(*asset));
    }
    return assets;
}

Expected<std::vector<IPAsset>> loadAssetsFile(const std::filesystem::path& path) {
    auto j = readJsonFile(path);
    if (!j) {
        return std::unexpected(j.error());
    }
    return parseAssets(*j);
}

json toJson(const IPAsset& asset) {
    json j;
    j["id"] = asset.id();
    j["kind"] = std::string(toString(asset.kind()));
    j["description"] = asset.description();
    j["method"] = std::string(toString(asset.method()));

    json segments = json::array();
    for (const auto& s : asset.segments()) {
        segments.push_back({{"name", s.segmentName}, {"attribution", s.fraction}});
    }
    j["segments"] = segments;
    j["parameters"] = parametersToJson(asset.parameters());
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Данные компаний
// ═══════════════════════════════════════════════════════════════════════════════

Expected<std::vector<CompanyData>> parseCompanies(const json& j) {
    try {
        const json& list = j.is_object() ? j.at("companies") : j;

        std::vector<CompanyData> companies;
        for (const auto& c : list) {
            CompanyData company;
            company.ticker = c.at("ticker").get<std::string>();
            company.name = c.value("name", company.ticker);

            if (c.contains("snapshot")) {
                const auto& snapshot = c.at("snapshot");
                company.snapshot.price = snapshot.value("price", 0.0);
                company.snapshot.marketCap = snapshot.value("market_cap", 0.0);
            }

            for (const auto& s : c.value("statements", json::array())) {
                RawStatementPeriod statement;
                statement.periodLabel = s.at("period").get<std::string>();
                for (const auto& field : kStatementFields) {
                    statement.*field.member = s.value(field.name, 0.0);
                }
                company.statements.push_back(std::move(statement));
            }

            for (const auto& s : c.value("segments", json::array())) {
                const std::string period = s.at("period").get<std::string>();
                for (const auto& item : s.at("revenues").items()) {
                    company.segments[item.key()].push_back(
                        SegmentRevenuePoint{period, item.value().get<double>()});
                }
            }

            sortNewestFirst(company);
            companies.push_back(std::move(company));
        }
        return companies;
    } catch (const json::exception& e) {
        return makeError(ErrorCode::DataSourceFailure,
                         std::string("Company data error: ") + e.what());
    }
}

json toJson(const CompanyData& company) {
    json j;
    j["ticker"] = company.ticker;
    j["name"] = company.name;
    j["snapshot"] = {
        {"price", company.snapshot.price},
        {"market_cap", company.snapshot.marketCap}
    };

    json statements = json::array();
    for (const auto& statement : company.statements) {
        json s;
        s["period"] = statement.periodLabel;
        for (const auto& field : kStatementFields) {
            s[field.name] = statement.*field.member;
        }
        statements.push_back(s);
    }
    j["statements"] = statements;

    // Группировка по периодам, от нового к старому
    std::map<std::string, json, std::greater<>> byPeriod;
    for (const auto& [label, points] : company.segments) {
        for (const auto& point : points) {
            byPeriod[point.periodLabel][label] = point.revenue;
        }
    }

    json segments = json::array();
    for (const auto& [period, revenues] : byPeriod) {
        segments.push_back({{"period", period}, {"revenues", revenues}});
    }
    j["segments"] = segments;

    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Портфель препаратов
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

// Год из числа 2031, строки "2031" или даты "2016-09-19"
std::optional<int> parseYear(const json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    const std::string text = value.get<std::string>();
    if (text.size() < 4 || !std::all_of(text.begin(), text.begin() + 4,
                                        [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("invalid year '" + text + "'");
    }
    return std::stoi(text.substr(0, 4));
}

std::optional<int> optionalYear(const json& d, const char* key) {
    return d.contains(key) ? parseYear(d.at(key)) : std::nullopt;
}

}  // namespace

Expected<DrugPortfolio> parseDrugPortfolio(const json& j) {
    try {
        DrugPortfolio portfolio;
        portfolio.ticker = j.at("ticker").get<std::string>();
        portfolio.companyName = j.value("company_name", portfolio.ticker);

        for (const auto& d : j.at("drugs")) {
            DrugProduct drug;
            drug.name = d.at("name").get<std::string>();
            drug.indication = d.value("indication", "");
            drug.modality = d.value("type", "");
            drug.approvalYear = optionalYear(d, "approval_date");
            drug.exclusivityYears = d.value("market_exclusivity", 0);
            drug.patentExpiryYear = optionalYear(d, "patent_expiry");
            drug.peakSalesEstimate = d.value("peak_sales_estimate", 0.0);
            drug.status = d.value("current_status", "");
            if (d.contains("approval_probability") && !d.at("approval_probability").is_null()) {
                drug.approvalProbability = d.at("approval_probability").get<double>();
            }
            portfolio.drugs.push_back(std::move(drug));
        }
        return portfolio;
    } catch (const json::exception& e) {
        return makeError(ErrorCode::DataSourceFailure,
                         std::string("Drug portfolio error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return makeError(ErrorCode::DataSourceFailure,
                         std::string("Drug portfolio error: ") + e.what());
    }
}

Expected<DrugPortfolio> loadDrugPortfolioFile(const std::filesystem::path& path) {
    auto j = readJsonFile(path);
    if (!j) {
        return std::unexpected(j.error());
    }
    return parseDrugPortfolio(*j);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Результаты оценки
// ═══════════════════════════════════════════════════════════════════════════════

json toJson(const ValuationError& error) {
    return {
        {"code", std::string(toString(error.code))},
        {"message", error.message}
    };
}

json toJson(const AssumptionSet& assumptions) {
    return {
        {"wacc", assumptions.wacc},
        {"tax_rate", assumptions.taxRate},
        {"terminal_growth", assumptions.terminalGrowth}
    };
}

json toJson(const ValuationResult& result) {
    json j;
    j["method"] = std::string(toString(result.method));
    j["segment"] = result.segmentName;
    j["attribution"] = result.attributionFraction;

    json periods = json::array();
    for (const auto& row : result.periods) {
        periods.push_back({
            {"period", row.period},
            {"revenue", row.revenue},
            {"cash_flow", row.cashFlow},
            {"decay_factor", row.decayFactor},
            {"discount_factor", row.discountFactor},
            {"present_value", row.presentValue}
        });
    }
    j["periods"] = periods;

    j["terminal_cash_flow"] = result.terminalCashFlow;
    j["terminal_value"] = result.terminalValue;
    j["pv_explicit"] = result.pvExplicit;
    j["pv_terminal"] = result.pvTerminal;
    j["total_value"] = result.totalValue;
    j["details"] = result.details;
    j["notes"] = result.notes;
    return j;
}

json toJson(const AssetValuation& valuation) {
    json j;
    j["asset_id"] = valuation.assetId;
    j["kind"] = valuation.assetKind;
    j["description"] = valuation.description;
    j["method"] = std::string(toString(valuation.method));
    j["pv_explicit"] = valuation.pvExplicit;
    j["pv_terminal"] = valuation.pvTerminal;
    j["total_value"] = valuation.totalValue;

    json segments = json::array();
    for (const auto& segment : valuation.segments) {
        segments.push_back(toJson(segment));
    }
    j["segments"] = segments;
    return j;
}

json toJson(const PortfolioValuation& portfolio) {
    json j;
    j["ticker"] = portfolio.ticker;
    j["assumptions"] = toJson(portfolio.assumptions);
    j["total_value"] = portfolio.totalValue;

    json assets = json::array();
    for (const auto& asset : portfolio.assets) {
        assets.push_back(toJson(asset));
    }
    j["assets"] = assets;

    json skipped = json::array();
    for (const auto& s : portfolio.skipped) {
        skipped.push_back({{"asset_id", s.assetId}, {"error", toJson(s.error)}});
    }
    j["skipped"] = skipped;
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Допущения
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

template<typename Breakdown, typename Writer>
json componentToJson(const AssumptionComponent<Breakdown>& component, Writer writer) {
    json j;
    j["value"] = component.value;
    j["source"] = std::string(toString(component.source));
    j["breakdown"] = component.breakdown ? writer(*component.breakdown) : json(nullptr);
    j["failure"] = component.failure ? toJson(*component.failure) : json(nullptr);
    return j;
}

}  // namespace

json toJson(const AssumptionDerivation& derivation) {
    json j;
    j["assumptions"] = toJson(derivation.assumptions);

    j["wacc"] = componentToJson(derivation.wacc, [](const WaccBreakdown& b) {
        return json{
            {"wacc", b.wacc},
            {"cost_of_equity", b.costOfEquity},
            {"cost_of_debt", b.costOfDebt},
            {"cost_of_debt_defaulted", b.costOfDebtDefaulted},
            {"equity_weight", b.equityWeight},
            {"debt_weight", b.debtWeight},
            {"market_cap", b.marketCap},
            {"market_cap_from_book_value", b.marketCapFromBookValue},
            {"total_debt", b.totalDebt},
            {"beta", b.beta},
            {"tax_rate_used", b.taxRateUsed}
        };
    });

    j["tax_rate"] = componentToJson(derivation.taxRate, [](const TaxRateBreakdown& b) {
        json rates = json::array();
        for (const auto& rate : b.periodRates) {
            rates.push_back(optionalValue(rate));
        }
        return json{
            {"effective_tax_rate", b.effectiveTaxRate},
            {"period_rates", rates},
            {"periods_used", b.periodsUsed}
        };
    });

    j["terminal_growth"] = componentToJson(derivation.terminalGrowth, [](const GrowthBreakdown& b) {
        return json{
            {"terminal_growth", b.terminalGrowth},
            {"historical_average", b.historicalAverage},
            {"growth_rates", b.growthRates},
            {"clamped", b.clamped}
        };
    });

    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Финансовый анализ и подсказки
// ═══════════════════════════════════════════════════════════════════════════════

json toJson(const FinancialHealthReport& report) {
    json j;
    j["ticker"] = report.ticker;
    j["latest_period"] = report.latestPeriod;

    const auto& h = report.financialHealth;
    j["financial_health"] = {
        {"current_ratio", optionalValue(h.currentRatio)},
        {"quick_ratio", optionalValue(h.quickRatio)},
        {"debt_to_equity", optionalValue(h.debtToEquity)},
        {"interest_coverage", optionalValue(h.interestCoverage)},
        {"free_cash_flow", optionalValue(h.freeCashFlow)},
        {"fcf_margin", optionalValue(h.fcfMargin)},
        {"assessment", h.assessment}
    };

    const auto& p = report.profitability;
    j["profitability"] = {
        {"gross_margin", optionalValue(p.grossMargin)},
        {"operating_margin", optionalValue(p.operatingMargin)},
        {"net_margin", optionalValue(p.netMargin)},
        {"roe", optionalValue(p.returnOnEquity)},
        {"roa", optionalValue(p.returnOnAssets)},
        {"gross_margin_trend", optionalEnum(p.grossMarginTrend)},
        {"operating_margin_trend", optionalEnum(p.operatingMarginTrend)},
        {"ip_insight", p.ipInsight}
    };

    const auto& r = report.researchAndDevelopment;
    j["rd_analysis"] = {
        {"rd_intensity", r.averageIntensity},
        {"latest_rd_spend", r.latestSpend},
        {"rd_growth_rate", optionalValue(r.growthRate)},
        {"rd_history", r.history},
        {"ip_generation_potential", r.ipGenerationPotential}
    };

    const auto& c = report.capitalStructure;
    j["capital_structure"] = {
        {"total_debt", c.totalDebt},
        {"shareholders_equity", c.shareholdersEquity},
        {"market_cap", c.marketCap},
        {"debt_to_assets", optionalValue(c.debtToAssets)},
        {"debt_to_equity", optionalValue(c.debtToEquity)},
        {"equity_to_assets", optionalValue(c.equityToAssets)},
        {"market_to_book", optionalValue(c.marketToBook)},
        {"leverage_assessment", c.leverageAssessment}
    };

    const auto& m = report.marketPosition;
    j["market_position"] = {
        {"market_cap", m.marketCap},
        {"price", m.price},
        {"enterprise_value", m.enterpriseValue},
        {"pe_ratio", optionalValue(m.priceToEarnings)},
        {"ev_revenue", optionalValue(m.evToRevenue)},
        {"ev_ebitda", optionalValue(m.evToEbitda)},
        {"market_insight", m.marketInsight}
    };

    const auto& k = report.risk;
    j["risk_indicators"] = {
        {"cash_to_liabilities", optionalValue(k.cashToCurrentLiabilities)},
        {"solvency_ratio", optionalValue(k.solvencyRatio)},
        {"revenue_volatility", k.revenueVolatility},
        {"risk_assessment", k.riskAssessment}
    };

    return j;
}

json toJson(const IndustryInsights& insights) {
    return {
        {"primary_ip_types", insights.primaryIpTypes},
        {"key_focus_areas", insights.keyFocusAreas},
        {"competitive_considerations", insights.competitiveConsiderations},
        {"valuation_approach", insights.valuationApproach}
    };
}

json toJson(const std::vector<SensitivityRow>& rows) {
    json j = json::array();
    for (const auto& row : rows) {
        j.push_back({
            {"driver", row.driver},
            {"low", row.lowValue},
            {"base", row.baseValue},
            {"high", row.highValue},
            {"high_capped", row.highCapped}
        });
    }
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Справедливая стоимость акции
// ═══════════════════════════════════════════════════════════════════════════════

json toJson(const FairValueReport& report) {
    json j;
    j["ticker"] = report.ticker;
    j["current_price"] = report.currentPrice;
    j["shares_outstanding"] = report.sharesOutstanding;
    j["fair_value_average"] = optionalValue(report.averageFairValue);
    j["upside_downside_pct"] = report.upsidePercent;
    j["recommendation"] = report.recommendation;
    j["assumptions"] = {
        {"growth_rate", report.growthRate},
        {"growth_estimated", report.growthEstimated},
        {"terminal_growth", report.terminalGrowth},
        {"wacc", report.wacc},
        {"wacc_source", std::string(toString(report.waccSource))}
    };

    json methods = json::object();
    for (const auto& estimate : report.estimates) {
        json m;
        m["fair_value_per_share"] = optionalValue(estimate.fairValuePerShare);
        m["error"] = estimate.failure ? toJson(*estimate.failure) : json(nullptr);
        for (const auto& [key, value] : estimate.details) {
            m[key] = value;
        }
        if (!estimate.projectedCashFlows.empty()) {
            m["projected_fcf"] = estimate.projectedCashFlows;
        }
        methods[std::string(toString(estimate.method))] = m;
    }
    j["valuation_methods"] = methods;
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Биотех
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

json risksToJson(const std::vector<BiotechRisk>& risks) {
    json list = json::array();
    for (const auto& risk : risks) {
        json r;
        r["type"] = risk.type;
        r["severity"] = risk.severity;
        r["description"] = risk.description;
        r["impact"] = risk.impact;
        if (risk.drug) {
            r["drug"] = *risk.drug;
        }
        if (risk.probabilityOfSuccess) {
            r["probability_of_success"] = *risk.probabilityOfSuccess;
        }
        list.push_back(r);
    }
    return list;
}

}  // namespace

json toJson(const BiotechReport& report) {
    json j;
    j["ticker"] = report.ticker;
    j["company_name"] = report.companyName;
    j["current_year"] = report.currentYear;

    const auto& p = report.patentAnalysis;
    json byDrug = json::array();
    for (const auto& d : p.byDrug) {
        byDrug.push_back({
            {"drug", d.drug},
            {"patent_expiry_year", d.patentExpiryYear},
            {"years_until_patent_expiry", d.yearsUntilPatentExpiry},
            {"exclusivity_years_remaining", d.exclusivityYearsRemaining},
            {"effective_protection_years", d.effectiveProtectionYears},
            {"risk_level", d.riskLevel}
        });
    }
    j["patent_analysis"] = {
        {"by_drug", byDrug},
        {"overall_risk", std::string(toString(p.overallRisk))},
        {"patent_cliff_years", p.patentCliffYears},
        {"average_remaining_protection", p.averageRemainingProtection},
        {"patent_cliff_warning", p.patentCliffWarning ? json(*p.patentCliffWarning) : json(nullptr)}
    };

    const auto& r = report.riskAssessment;
    j["risk_assessment"] = {
        {"patent_risks", risksToJson(r.patentRisks)},
        {"pipeline_risks", risksToJson(r.pipelineRisks)},
        {"commercial_risks", risksToJson(r.commercialRisks)},
        {"overall_risk_score", r.overallRiskScore}
    };

    const auto& v = report.valuation;
    json drugs = json::array();
    for (const auto& d : v.byDrug) {
        drugs.push_back({
            {"drug", d.drug},
            {"status", d.status},
            {"peak_sales_estimate", d.peakSalesEstimate},
            {"years_of_protection", d.yearsOfProtection},
            {"probability_of_success", d.probabilityOfSuccess},
            {"npv", d.npv},
            {"risk_adjusted_value", d.riskAdjustedValue}
        });
    }
    j["valuation_breakdown"] = {
        {"by_drug", drugs},
        {"approved_products_value", v.approvedProductsValue},
        {"pipeline_value", v.pipelineValue},
        {"total_portfolio_value", v.totalPortfolioValue}
    };

    j["competitive_moat"] = {
        {"strength", report.moat.strength},
        {"duration_years", report.moat.durationYears},
        {"sources", report.moat.sources},
        {"threats", report.moat.threats}
    };
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════════
// CSV
// ═══════════════════════════════════════════════════════════════════════════════

std::string toCsv(const PortfolioValuation& portfolio) {
    std::ostringstream oss;
    oss << std::setprecision(12);
    oss << "asset_id,kind,method,segment,attribution,pv_explicit,pv_terminal,total_value\n";

    for (const auto& asset : portfolio.assets) {
        for (const auto& segment : asset.segments) {
            oss << csvField(asset.assetId) << ','
                << csvField(asset.assetKind) << ','
                << toString(asset.method) << ','
                << csvField(segment.segmentName) << ','
                << segment.attributionFraction << ','
                << segment.pvExplicit << ','
                << segment.pvTerminal << ','
                << segment.totalValue << '\n';
        }
    }

    return oss.str();
}

Expected<void> writeCsvFile(
    const std::filesystem::path& path,
    const PortfolioValuation& portfolio) {

    std::ofstream file(path);
    if (!file) {
        return makeError(ErrorCode::DataSourceFailure,
                         "Failed to create CSV file: " + path.string());
    }

    file << toCsv(portfolio);
    if (!file) {
        return makeError(ErrorCode::DataSourceFailure,
                         "Failed to write CSV file: " + path.string());
    }
    return {};
}

}  // namespace ipvalue
