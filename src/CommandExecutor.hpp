#pragma once

#include "CommandLineParser.hpp"
#include "IFinancialDataSource.hpp"
#include "IPDiscovery.hpp"
#include "JsonCodec.hpp"
#include "ValuationEngine.hpp"
#include <expected>
#include <memory>
#include <string>

namespace ipvalue {

class CommandExecutor {
public:
    CommandExecutor() = default;

    std::expected<void, std::string> execute(const ParsedCommand& cmd);

    // ═════════════════════════════════════════════════════════════════════════
    // Построение конфигурации из опций командной строки
    // ═════════════════════════════════════════════════════════════════════════

    static std::expected<EngineOptions, std::string> buildEngineOptions(
        const po::variables_map& options);

    // Значения --wacc, --tax-rate, --terminal-growth (только заданные)
    static AssumptionOverrides buildAssumptionOverrides(const po::variables_map& options);

    // --growth-rate, мультипликаторы, --wacc, --tax-rate, --terminal-growth
    static std::expected<FairValueParameters, std::string> buildFairValueParameters(
        const po::variables_map& options);

    // Источник по --source с инициализацией из его опций
    static std::expected<std::shared_ptr<IFinancialDataSource>, std::string> createDataSource(
        const po::variables_map& options);

    static std::string formatError(const ValuationError& error);

private:
    CommandLineParser parser_;

    // Help & Version
    std::expected<void, std::string> executeHelp(const ParsedCommand& cmd);
    std::expected<void, std::string> executeVersion(const ParsedCommand& cmd);

    void printHelp(std::string_view topic = "");
    void printVersion() const;

    // Команды оценки
    std::expected<void, std::string> executeValue(const ParsedCommand& cmd);
    std::expected<void, std::string> executeAssumptions(const ParsedCommand& cmd);
    std::expected<void, std::string> executeHealth(const ParsedCommand& cmd);
    std::expected<void, std::string> executeDiscover(const ParsedCommand& cmd);
    std::expected<void, std::string> executeSensitivity(const ParsedCommand& cmd);
    std::expected<void, std::string> executeFairValue(const ParsedCommand& cmd);
    std::expected<void, std::string> executeBiotech(const ParsedCommand& cmd);

    // Импорт JSON -> SQLite
    std::expected<void, std::string> executeImport(const ParsedCommand& cmd);

    // Helper methods
    template<typename T>
    std::expected<T, std::string> getRequiredOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;

    std::expected<std::unique_ptr<ValuationEngine>, std::string> createEngine(
        const po::variables_map& options) const;

    // Явно заданные значения имеют приоритет; без всех трех - расчет из отчетности
    std::expected<AssumptionSet, std::string> resolveAssumptions(
        ValuationEngine& engine,
        std::string_view ticker,
        const po::variables_map& options) const;

    std::expected<void, std::string> writeOutput(
        const po::variables_map& options,
        const json& document) const;

    void printPortfolio(const PortfolioValuation& portfolio) const;
    void printDerivation(std::string_view ticker, const AssumptionDerivation& derivation) const;
    void printHealthReport(const FinancialHealthReport& report) const;
    void printDiscovery(
        std::string_view ticker,
        const std::vector<IPAsset>& assets,
        const IndustryInsights& insights) const;
    void printSensitivity(std::string_view ticker, const std::vector<SensitivityRow>& rows) const;
    void printFairValue(const FairValueReport& report) const;
    void printBiotechReport(const BiotechReport& report) const;
};

// ═════════════════════════════════════════════════════════════════════════════
// Template Implementation
// ═════════════════════════════════════════════════════════════════════════════

template<typename T>
std::expected<T, std::string> CommandExecutor::getRequiredOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const {

    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return std::unexpected(
            "Required option '" + optName + "' is missing");
    }

    try {
        return cmd.options.at(optName).as<T>();
    } catch (const std::exception& e) {
        return std::unexpected(
            "Invalid value for option '" + optName + "': " + e.what());
    }
}

}  // namespace ipvalue
