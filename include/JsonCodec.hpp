#pragma once

#include "AssumptionCalculator.hpp"
#include "BiotechAnalyzer.hpp"
#include "CompanyData.hpp"
#include "FairValueCalculator.hpp"
#include "FinancialHealthAnalyzer.hpp"
#include "IPAsset.hpp"
#include "IPDiscovery.hpp"
#include "SensitivityAnalyzer.hpp"
#include "ValuationTypes.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace ipvalue {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════════
// Чтение и запись файлов
// ═══════════════════════════════════════════════════════════════════════════════

Expected<json> readJsonFile(const std::filesystem::path& path);
Expected<void> writeJsonFile(const std::filesystem::path& path, const json& j);

// ═══════════════════════════════════════════════════════════════════════════════
// Разбор входных данных
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Определения активов
 *
 * Формат: {"assets": [...]} или массив. Каждый актив:
 *   {"id", "kind", "description", "method",
 *    "segments": [{"name", "attribution"}], "parameters": {...}}
 * Ключи parameters зависят от метода (royalty_rate, operating_margin, ...).
 * Неверная структура - DataSourceFailure, недопустимые значения - ParameterOutOfRange.
 */
Expected<std::vector<IPAsset>> parseAssets(const json& j);
Expected<IPAsset> parseAsset(const json& j);

Expected<std::vector<IPAsset>> loadAssetsFile(const std::filesystem::path& path);

/**
 * @brief Данные компаний
 *
 * Формат: {"companies": [{"ticker", "name", "snapshot": {"price", "market_cap"},
 *   "statements": [{"period", "revenue", ...}],
 *   "segments": [{"period", "revenues": {"<segment>": amount}}]}]}
 */
Expected<std::vector<CompanyData>> parseCompanies(const json& j);

/**
 * @brief Портфель препаратов
 *
 * Формат: {"ticker", "company_name", "drugs": [{"name", "indication", "type",
 *   "approval_date" ("YYYY-MM-DD" или null), "market_exclusivity",
 *   "patent_expiry" (год), "peak_sales_estimate", "current_status",
 *   "approval_probability"}]}
 */
Expected<DrugPortfolio> parseDrugPortfolio(const json& j);
Expected<DrugPortfolio> loadDrugPortfolioFile(const std::filesystem::path& path);

// ═══════════════════════════════════════════════════════════════════════════════
// Сериализация результатов
// ═══════════════════════════════════════════════════════════════════════════════

json toJson(const ValuationError& error);
json toJson(const AssumptionSet& assumptions);
json toJson(const IPAsset& asset);
json toJson(const ValuationResult& result);
json toJson(const AssetValuation& valuation);
json toJson(const PortfolioValuation& portfolio);
json toJson(const AssumptionDerivation& derivation);
json toJson(const FinancialHealthReport& report);
json toJson(const IndustryInsights& insights);
json toJson(const std::vector<SensitivityRow>& rows);
json toJson(const FairValueReport& report);
json toJson(const BiotechReport& report);
json toJson(const CompanyData& company);

// Одна строка на пару (актив, сегмент)
std::string toCsv(const PortfolioValuation& portfolio);
Expected<void> writeCsvFile(const std::filesystem::path& path, const PortfolioValuation& portfolio);

}  // namespace ipvalue
