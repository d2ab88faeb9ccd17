#include "CommandExecutor.hpp"
#include "JsonFileDataSource.hpp"
#include "SQLiteDataSource.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ipvalue {

namespace {

std::string percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value * 100.0 << "%";
    return oss.str();
}

std::string percent(const std::optional<double>& value) {
    return value ? percent(*value) : std::string("n/a");
}

std::string ratio(const std::optional<double>& value) {
    if (!value) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << *value;
    return oss.str();
}

std::string money(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << "$" << value;
    return oss.str();
}

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// Dispatch
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::execute(const ParsedCommand& cmd)
{
    if (cmd.command == "help") {
        return executeHelp(cmd);
    } else if (cmd.command == "version") {
        return executeVersion(cmd);
    } else if (cmd.command == "value") {
        return executeValue(cmd);
    } else if (cmd.command == "assumptions") {
        return executeAssumptions(cmd);
    } else if (cmd.command == "health") {
        return executeHealth(cmd);
    } else if (cmd.command == "discover") {
        return executeDiscover(cmd);
    } else if (cmd.command == "sensitivity") {
        return executeSensitivity(cmd);
    } else if (cmd.command == "fair-value") {
        return executeFairValue(cmd);
    } else if (cmd.command == "biotech") {
        return executeBiotech(cmd);
    } else if (cmd.command == "import") {
        return executeImport(cmd);
    }

    return std::unexpected("Unknown command: " + cmd.command);
}

// ═════════════════════════════════════════════════════════════════════════════
// Конфигурация из опций
// ═════════════════════════════════════════════════════════════════════════════

std::string CommandExecutor::formatError(const ValuationError& error)
{
    return "[" + std::string(toString(error.code)) + "] " + error.message;
}

std::expected<EngineOptions, std::string> CommandExecutor::buildEngineOptions(
    const po::variables_map& options)
{
    EngineOptions engineOptions;

    if (options.count("periods")) {
        engineOptions.periods = options.at("periods").as<std::size_t>();
        if (engineOptions.periods == 0) {
            return std::unexpected("Number of periods must be >= 1");
        }
    }

    if (options.count("match")) {
        const auto& name = options.at("match").as<std::string>();
        auto mode = parseSegmentMatchMode(name);
        if (!mode) {
            return std::unexpected(
                "Unknown match mode: " + name +
                ". Available: exact, case-insensitive, normalized");
        }
        engineOptions.matchMode = *mode;
    }

    if (options.count("best-effort") && options.at("best-effort").as<bool>()) {
        engineOptions.failureMode = FailureMode::BestEffort;
    }

    return engineOptions;
}

AssumptionOverrides CommandExecutor::buildAssumptionOverrides(const po::variables_map& options)
{
    AssumptionOverrides overrides;
    if (options.count("wacc")) {
        overrides.wacc = options.at("wacc").as<double>();
    }
    if (options.count("tax-rate")) {
        overrides.taxRate = options.at("tax-rate").as<double>();
    }
    if (options.count("terminal-growth")) {
        overrides.terminalGrowth = options.at("terminal-growth").as<double>();
    }
    return overrides;
}

std::expected<FairValueParameters, std::string> CommandExecutor::buildFairValueParameters(
    const po::variables_map& options)
{
    FairValueParameters parameters;

    if (options.count("growth-rate")) {
        parameters.growthRate = options.at("growth-rate").as<double>();
    }
    if (options.count("wacc")) {
        parameters.wacc = options.at("wacc").as<double>();
    }
    if (options.count("tax-rate")) {
        parameters.taxRate = options.at("tax-rate").as<double>();
    }
    if (options.count("terminal-growth")) {
        parameters.terminalGrowth = options.at("terminal-growth").as<double>();
    }

    if (options.count("projection-years")) {
        parameters.projectionYears = options.at("projection-years").as<int>();
        if (parameters.projectionYears < 1) {
            return std::unexpected("Projection horizon must be >= 1 year");
        }
    }

    auto& multiples = parameters.multiples;
    if (options.count("pe-multiple")) {
        multiples.priceToEarnings = options.at("pe-multiple").as<double>();
    }
    if (options.count("ps-multiple")) {
        multiples.priceToSales = options.at("ps-multiple").as<double>();
    }
    if (options.count("ev-ebitda-multiple")) {
        multiples.evToEbitda = options.at("ev-ebitda-multiple").as<double>();
    }
    if (multiples.priceToEarnings <= 0.0 || multiples.priceToSales <= 0.0 ||
        multiples.evToEbitda <= 0.0) {
        return std::unexpected("Valuation multiples must be positive");
    }

    return parameters;
}

std::expected<std::shared_ptr<IFinancialDataSource>, std::string>
CommandExecutor::createDataSource(const po::variables_map& options)
{
    std::string source = options.count("source")
        ? options.at("source").as<std::string>()
        : std::string("json");

    std::shared_ptr<IFinancialDataSource> dataSource;
    try {
        if (source == "json") {
            dataSource = std::make_shared<JsonFileDataSource>();
        } else if (source == "sqlite") {
            dataSource = std::make_shared<SQLiteDataSource>();
        } else {
            return std::unexpected(
                "Unknown data source: " + source + ". Available: json, sqlite");
        }
    } catch (const std::exception& e) {
        return std::unexpected("Failed to create data source '" + source + "': " + e.what());
    }

    auto initResult = dataSource->initializeFromOptions(options);
    if (!initResult) {
        return std::unexpected(
            "Failed to initialize data source '" + source + "': " + initResult.error());
    }

    return dataSource;
}

std::expected<std::unique_ptr<ValuationEngine>, std::string> CommandExecutor::createEngine(
    const po::variables_map& options) const
{
    auto engineOptions = buildEngineOptions(options);
    if (!engineOptions) {
        return std::unexpected(engineOptions.error());
    }

    auto dataSource = createDataSource(options);
    if (!dataSource) {
        return std::unexpected(dataSource.error());
    }

    return std::make_unique<ValuationEngine>(*dataSource, *engineOptions);
}

std::expected<AssumptionSet, std::string> CommandExecutor::resolveAssumptions(
    ValuationEngine& engine,
    std::string_view ticker,
    const po::variables_map& options) const
{
    auto overrides = buildAssumptionOverrides(options);

    if (overrides.wacc && overrides.taxRate && overrides.terminalGrowth) {
        AssumptionSet assumptions{*overrides.wacc, *overrides.taxRate, *overrides.terminalGrowth};
        auto valid = validateAssumptions(assumptions);
        if (!valid) {
            return std::unexpected(formatError(valid.error()));
        }
        std::cout << "Using assumptions from command line" << std::endl;
        return assumptions;
    }

    // Заданные значения заменяют соответствующие компоненты до расчета
    auto derivation = engine.deriveAssumptions(ticker, {}, overrides);
    if (!derivation) {
        return std::unexpected(
            "Failed to derive assumptions: " + formatError(derivation.error()));
    }

    std::cout << "Assumptions derived from financial statements" << std::endl;
    return derivation->assumptions;
}

std::expected<void, std::string> CommandExecutor::writeOutput(
    const po::variables_map& options,
    const json& document) const
{
    if (!options.count("output")) {
        return {};
    }

    const auto& path = options.at("output").as<std::string>();
    auto written = writeJsonFile(path, document);
    if (!written) {
        return std::unexpected(formatError(written.error()));
    }

    std::cout << "✓ Result written to " << path << std::endl;
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Help & Version
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeHelp(const ParsedCommand& cmd)
{
    // Проверяем, есть ли конкретная тема для справки
    if (!cmd.positional.empty()) {
        printHelp(cmd.positional[0]);
    } else {
        printHelp();
    }
    return {};
}

std::expected<void, std::string> CommandExecutor::executeVersion(const ParsedCommand& /*cmd*/)
{
    printVersion();
    return {};
}

void CommandExecutor::printHelp(std::string_view topic)
{
    if (topic.empty()) {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "IP Valuation Engine" << std::endl;
        std::cout << "Usage: ipvalue <command> [options]" << std::endl << std::endl;

        std::cout << "COMMANDS:" << std::endl;
        std::cout << "  value                   Value a portfolio of IP assets" << std::endl;
        std::cout << "  assumptions             Derive WACC, tax rate and terminal growth" << std::endl;
        std::cout << "  health                  Financial health analysis" << std::endl;
        std::cout << "  discover                Suggest IP assets from company segments" << std::endl;
        std::cout << "  sensitivity             Sensitivity of portfolio value to drivers" << std::endl;
        std::cout << "  fair-value              Fair value per share (DCF and multiples)" << std::endl;
        std::cout << "  biotech                 Drug portfolio protection, risk and value" << std::endl;
        std::cout << "  import                  Import JSON company data into SQLite" << std::endl;
        std::cout << "  help <command>          Show detailed help for a command" << std::endl;
        std::cout << "  version                 Show version information" << std::endl;
        std::cout << std::endl;

        std::cout << "Examples:" << std::endl;
        std::cout << "  ipvalue assumptions -t AAPL --json-file companies.json" << std::endl;
        std::cout << "  ipvalue value -t AAPL -a assets.json --json-file companies.json" << std::endl;
        std::cout << "  ipvalue import --json-file companies.json --sqlite-path ip.db" << std::endl;
        std::cout << "  ipvalue value -t AAPL -a assets.json -s sqlite --sqlite-path ip.db" << std::endl;
        std::cout << std::endl;

        std::cout << "For more information on a specific command, use:" << std::endl;
        std::cout << "  ipvalue help <command>" << std::endl;
        std::cout << std::string(70, '=') << std::endl;
        return;
    }

    auto desc = parser_.optionsFor(topic);
    if (!desc) {
        std::cout << "Unknown help topic: " << topic << std::endl;
        std::cout << "Use 'ipvalue help' to see available commands" << std::endl;
        return;
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "COMMAND: " << topic << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    if (topic == "value") {
        std::cout << "Values every asset of the definitions file and sums the portfolio." << std::endl;
        std::cout << "Assumptions are derived from the statements unless all of" << std::endl;
        std::cout << "--wacc, --tax-rate and --terminal-growth are given." << std::endl;
    } else if (topic == "assumptions") {
        std::cout << "Derives WACC, effective tax rate and terminal growth with breakdown." << std::endl;
        std::cout << "--wacc, --tax-rate, --terminal-growth are used only when a" << std::endl;
        std::cout << "component cannot be derived." << std::endl;
    } else if (topic == "health") {
        std::cout << "Liquidity, profitability, R&D, capital structure, market and risk." << std::endl;
    } else if (topic == "discover") {
        std::cout << "Heuristic IP asset suggestions. Use --output to save them as an" << std::endl;
        std::cout << "asset definitions file for the value command." << std::endl;
    } else if (topic == "sensitivity") {
        std::cout << "Revalues the portfolio with royalty rates, attribution, WACC and" << std::endl;
        std::cout << "terminal growth shocked one at a time." << std::endl;
    } else if (topic == "fair-value") {
        std::cout << "Fair value per share by DCF, P/E, P/S and EV/EBITDA, averaged over" << std::endl;
        std::cout << "the applicable methods. WACC is derived unless --wacc is given." << std::endl;
    } else if (topic == "biotech") {
        std::cout << "Patent protection, risk score, risk-adjusted NPV and competitive" << std::endl;
        std::cout << "moat of a drug portfolio read from --drugs." << std::endl;
    } else if (topic == "import") {
        std::cout << "Copies every company of a JSON data file into a SQLite store." << std::endl;
    }
    std::cout << std::endl;

    std::cout << *desc << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void CommandExecutor::printVersion() const
{
    std::cout << "IP Valuation Engine" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Value
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeValue(const ParsedCommand& cmd)
{
    auto tickerResult = getRequiredOption<std::string>(cmd, "ticker");
    if (!tickerResult) {
        return std::unexpected(tickerResult.error());
    }

    auto assetsPathResult = getRequiredOption<std::string>(cmd, "assets");
    if (!assetsPathResult) {
        return std::unexpected(assetsPathResult.error());
    }

    const std::string& ticker = tickerResult.value();

    auto engine = createEngine(cmd.options);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    auto assets = loadAssetsFile(assetsPathResult.value());
    if (!assets) {
        return std::unexpected("Failed to load assets: " + formatError(assets.error()));
    }
    std::cout << "Loaded " << assets->size() << " asset definition(s)" << std::endl;

    auto assumptions = resolveAssumptions(**engine, ticker, cmd.options);
    if (!assumptions) {
        return std::unexpected(assumptions.error());
    }

    auto portfolio = (*engine)->valuePortfolio(ticker, *assets, *assumptions);
    if (!portfolio) {
        return std::unexpected("Valuation failed: " + formatError(portfolio.error()));
    }

    printPortfolio(*portfolio);

    auto output = writeOutput(cmd.options, toJson(*portfolio));
    if (!output) {
        return std::unexpected(output.error());
    }

    if (cmd.options.count("csv")) {
        const auto& csvPath = cmd.options.at("csv").as<std::string>();
        auto written = writeCsvFile(csvPath, *portfolio);
        if (!written) {
            return std::unexpected(formatError(written.error()));
        }
        std::cout << "✓ Breakdown written to " << csvPath << std::endl;
    }

    return {};
}

void CommandExecutor::printPortfolio(const PortfolioValuation& portfolio) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "IP PORTFOLIO VALUATION: " << portfolio.ticker << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    std::cout << "Assumptions:" << std::endl;
    std::cout << "  WACC:                " << percent(portfolio.assumptions.wacc) << std::endl;
    std::cout << "  Tax Rate:            " << percent(portfolio.assumptions.taxRate) << std::endl;
    std::cout << "  Terminal Growth:     " << percent(portfolio.assumptions.terminalGrowth) << std::endl;
    std::cout << std::endl;

    for (const auto& asset : portfolio.assets) {
        std::cout << std::string(70, '-') << std::endl;
        std::cout << asset.assetId << " (" << asset.assetKind << ", "
                  << toString(asset.method) << ")" << std::endl;
        if (!asset.description.empty()) {
            std::cout << "  " << asset.description << std::endl;
        }
        std::cout << std::endl;

        std::cout << "  " << std::left
                  << std::setw(22) << "Segment"
                  << std::setw(10) << "Share"
                  << std::right
                  << std::setw(14) << "PV Explicit"
                  << std::setw(14) << "PV Terminal"
                  << std::setw(14) << "Total" << std::endl;

        for (const auto& segment : asset.segments) {
            std::cout << "  " << std::left
                      << std::setw(22) << segment.segmentName
                      << std::setw(10) << percent(segment.attributionFraction)
                      << std::right << std::fixed << std::setprecision(2)
                      << std::setw(14) << segment.pvExplicit
                      << std::setw(14) << segment.pvTerminal
                      << std::setw(14) << segment.totalValue << std::endl;

            for (const auto& note : segment.notes) {
                std::cout << "    Note: " << note << std::endl;
            }
        }

        std::cout << std::endl;
        std::cout << "  Asset Value:         " << money(asset.totalValue) << std::endl;
        std::cout << std::endl;
    }

    if (!portfolio.skipped.empty()) {
        std::cout << std::string(70, '-') << std::endl;
        std::cout << "Skipped Assets:" << std::endl;
        for (const auto& skipped : portfolio.skipped) {
            std::cout << "  ✗ " << skipped.assetId << ": "
                      << formatError(skipped.error) << std::endl;
        }
        std::cout << std::endl;
    }

    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Total Portfolio Value: " << money(portfolio.totalValue) << std::endl;
    std::cout << "Assets Valued:         " << portfolio.assets.size() << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Assumptions
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeAssumptions(const ParsedCommand& cmd)
{
    auto tickerResult = getRequiredOption<std::string>(cmd, "ticker");
    if (!tickerResult) {
        return std::unexpected(tickerResult.error());
    }

    auto engine = createEngine(cmd.options);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    // Здесь заданные значения применяются только при ошибке расчета
    auto derivation = (*engine)->deriveAssumptions(
        tickerResult.value(), buildAssumptionOverrides(cmd.options));
    if (!derivation) {
        return std::unexpected(
            "Failed to derive assumptions: " + formatError(derivation.error()));
    }

    printDerivation(tickerResult.value(), *derivation);

    return writeOutput(cmd.options, toJson(*derivation));
}

void CommandExecutor::printDerivation(
    std::string_view ticker,
    const AssumptionDerivation& derivation) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "VALUATION ASSUMPTIONS: " << ticker << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    auto printFailure = [](const auto& component) {
        if (component.failure) {
            std::cout << "  Fallback reason:     " << formatError(*component.failure) << std::endl;
        }
    };

    // WACC
    const auto& wacc = derivation.wacc;
    std::cout << "WACC:                  " << percent(wacc.value)
              << " (" << toString(wacc.source) << ")" << std::endl;
    printFailure(wacc);
    if (wacc.breakdown) {
        const auto& b = *wacc.breakdown;
        std::cout << "  Beta (by market cap): " << std::fixed << std::setprecision(2)
                  << b.beta << std::endl;
        std::cout << "  Cost of Equity:      " << percent(b.costOfEquity) << std::endl;
        std::cout << "  Cost of Debt:        " << percent(b.costOfDebt)
                  << (b.costOfDebtDefaulted ? " (no debt)" : "") << std::endl;
        std::cout << "  Market Cap:          " << money(b.marketCap)
                  << (b.marketCapFromBookValue ? " (book equity)" : "") << std::endl;
        std::cout << "  Total Debt:          " << money(b.totalDebt) << std::endl;
        std::cout << "  Equity Weight:       " << percent(b.equityWeight) << std::endl;
        std::cout << "  Debt Weight:         " << percent(b.debtWeight) << std::endl;
    }
    std::cout << std::endl;

    // Налог
    const auto& tax = derivation.taxRate;
    std::cout << "Effective Tax Rate:    " << percent(tax.value)
              << " (" << toString(tax.source) << ")" << std::endl;
    printFailure(tax);
    if (tax.breakdown) {
        std::cout << "  Periods Used:        " << tax.breakdown->periodsUsed << std::endl;
        for (std::size_t i = 0; i < tax.breakdown->periodRates.size(); ++i) {
            std::cout << "    Period " << i << ":          "
                      << percent(tax.breakdown->periodRates[i]) << std::endl;
        }
    }
    std::cout << std::endl;

    // Рост
    const auto& growth = derivation.terminalGrowth;
    std::cout << "Terminal Growth:       " << percent(growth.value)
              << " (" << toString(growth.source) << ")" << std::endl;
    printFailure(growth);
    if (growth.breakdown) {
        std::cout << "  Historical Average:  " << percent(growth.breakdown->historicalAverage)
                  << (growth.breakdown->clamped ? " (clamped)" : "") << std::endl;
        for (double rate : growth.breakdown->growthRates) {
            std::cout << "    " << percent(rate) << std::endl;
        }
    }

    std::cout << std::string(70, '=') << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Health
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeHealth(const ParsedCommand& cmd)
{
    auto tickerResult = getRequiredOption<std::string>(cmd, "ticker");
    if (!tickerResult) {
        return std::unexpected(tickerResult.error());
    }

    auto engine = createEngine(cmd.options);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    auto report = (*engine)->analyzeFinancialHealth(tickerResult.value());
    if (!report) {
        return std::unexpected("Financial health analysis failed: " + formatError(report.error()));
    }

    printHealthReport(*report);

    return writeOutput(cmd.options, toJson(*report));
}

void CommandExecutor::printHealthReport(const FinancialHealthReport& report) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "FINANCIAL HEALTH: " << report.ticker
              << " (" << report.latestPeriod << ")" << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    const auto& health = report.financialHealth;
    std::cout << "Financial Health:" << std::endl;
    std::cout << "  Current Ratio:       " << ratio(health.currentRatio) << std::endl;
    std::cout << "  Quick Ratio:         " << ratio(health.quickRatio) << std::endl;
    std::cout << "  Debt to Equity:      " << ratio(health.debtToEquity) << std::endl;
    std::cout << "  Interest Coverage:   " << ratio(health.interestCoverage) << std::endl;
    std::cout << "  Free Cash Flow:      " << ratio(health.freeCashFlow) << std::endl;
    std::cout << "  FCF Margin:          " << percent(health.fcfMargin) << std::endl;
    std::cout << "  Assessment:          " << health.assessment << std::endl;
    std::cout << std::endl;

    const auto& profit = report.profitability;
    std::cout << "Profitability:" << std::endl;
    std::cout << "  Gross Margin:        " << percent(profit.grossMargin);
    if (profit.grossMarginTrend) {
        std::cout << " (" << toString(*profit.grossMarginTrend) << ")";
    }
    std::cout << std::endl;
    std::cout << "  Operating Margin:    " << percent(profit.operatingMargin);
    if (profit.operatingMarginTrend) {
        std::cout << " (" << toString(*profit.operatingMarginTrend) << ")";
    }
    std::cout << std::endl;
    std::cout << "  Net Margin:          " << percent(profit.netMargin) << std::endl;
    std::cout << "  Return on Equity:    " << percent(profit.returnOnEquity) << std::endl;
    std::cout << "  Return on Assets:    " << percent(profit.returnOnAssets) << std::endl;
    std::cout << "  IP Insight:          " << profit.ipInsight << std::endl;
    std::cout << std::endl;

    const auto& rd = report.researchAndDevelopment;
    std::cout << "Research & Development:" << std::endl;
    std::cout << "  Average Intensity:   " << percent(rd.averageIntensity) << std::endl;
    std::cout << "  Latest Spend:        " << money(rd.latestSpend) << std::endl;
    std::cout << "  Growth Rate:         " << percent(rd.growthRate) << std::endl;
    std::cout << "  IP Potential:        " << rd.ipGenerationPotential << std::endl;
    std::cout << std::endl;

    const auto& capital = report.capitalStructure;
    std::cout << "Capital Structure:" << std::endl;
    std::cout << "  Debt to Assets:      " << ratio(capital.debtToAssets) << std::endl;
    std::cout << "  Debt to Equity:      " << ratio(capital.debtToEquity) << std::endl;
    std::cout << "  Equity to Assets:    " << ratio(capital.equityToAssets) << std::endl;
    std::cout << "  Market to Book:      " << ratio(capital.marketToBook) << std::endl;
    std::cout << "  Leverage:            " << capital.leverageAssessment << std::endl;
    std::cout << std::endl;

    const auto& market = report.marketPosition;
    std::cout << "Market Position:" << std::endl;
    std::cout << "  Market Cap:          " << money(market.marketCap) << std::endl;
    std::cout << "  Enterprise Value:    " << money(market.enterpriseValue) << std::endl;
    std::cout << "  P/E:                 " << ratio(market.priceToEarnings) << std::endl;
    std::cout << "  EV/Revenue:          " << ratio(market.evToRevenue) << std::endl;
    std::cout << "  EV/EBITDA:           " << ratio(market.evToEbitda) << std::endl;
    std::cout << "  Insight:             " << market.marketInsight << std::endl;
    std::cout << std::endl;

    const auto& risk = report.risk;
    std::cout << "Risk Indicators:" << std::endl;
    std::cout << "  Cash to Current Liab: " << ratio(risk.cashToCurrentLiabilities) << std::endl;
    std::cout << "  Solvency Ratio:      " << ratio(risk.solvencyRatio) << std::endl;
    std::cout << "  Revenue Volatility:  " << percent(risk.revenueVolatility) << std::endl;
    std::cout << "  Assessment:          " << risk.riskAssessment << std::endl;

    std::cout << std::string(70, '=') << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Discover
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeDiscover(const ParsedCommand& cmd)
{
    auto tickerResult = getRequiredOption<std::string>(cmd, "ticker");
    if (!tickerResult) {
        return std::unexpected(tickerResult.error());
    }
    const std::string& ticker = tickerResult.value();

    auto engine = createEngine(cmd.options);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    auto segments = (*engine)->listSegments(ticker);
    if (!segments) {
        return std::unexpected("Failed to list segments: " + formatError(segments.error()));
    }

    IPDiscovery discovery;

    auto assets = discovery.discoverAssets(ticker, *segments);
    if (!assets) {
        return std::unexpected("Discovery failed: " + formatError(assets.error()));
    }

    auto shared = discovery.suggestSharedAssets(*segments);
    if (!shared) {
        return std::unexpected("Discovery failed: " + formatError(shared.error()));
    }
    assets->insert(assets->end(), shared->begin(), shared->end());

    auto insights = discovery.industryInsights(*segments);
    printDiscovery(ticker, *assets, insights);

    if (cmd.options.count("industry")) {
        const auto& industry = cmd.options.at("industry").as<std::string>();
        std::cout << "Industry royalty reference (" << industry << "): "
                  << percent(discovery.industryRoyaltyRate(industry)) << std::endl;
    }

    json document;
    document["ticker"] = ticker;
    document["assets"] = json::array();
    for (const auto& asset : *assets) {
        document["assets"].push_back(toJson(asset));
    }
    document["industry_insights"] = toJson(insights);

    return writeOutput(cmd.options, document);
}

void CommandExecutor::printDiscovery(
    std::string_view ticker,
    const std::vector<IPAsset>& assets,
    const IndustryInsights& insights) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "IP DISCOVERY: " << ticker << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    std::cout << "Suggested Assets (" << assets.size() << "):" << std::endl;
    for (const auto& asset : assets) {
        std::cout << "  " << std::left << std::setw(28) << asset.id()
                  << std::setw(14) << toString(asset.kind())
                  << toString(asset.method()) << std::endl;
        for (const auto& segment : asset.segments()) {
            std::cout << "    - " << segment.segmentName << " ("
                      << percent(segment.fraction) << ")" << std::endl;
        }
    }
    std::cout << std::right << std::endl;

    std::cout << "Industry Insights:" << std::endl;
    std::cout << "  Valuation Approach:  " << insights.valuationApproach << std::endl;
    for (const auto& type : insights.primaryIpTypes) {
        std::cout << "  IP Type:             " << type << std::endl;
    }
    for (const auto& area : insights.keyFocusAreas) {
        std::cout << "  Focus Area:          " << area << std::endl;
    }
    for (const auto& consideration : insights.competitiveConsiderations) {
        std::cout << "  Consideration:       " << consideration << std::endl;
    }

    std::cout << std::string(70, '=') << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Sensitivity
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeSensitivity(const ParsedCommand& cmd)
{
    auto tickerResult = getRequiredOption<std::string>(cmd, "ticker");
    if (!tickerResult) {
        return std::unexpected(tickerResult.error());
    }

    auto assetsPathResult = getRequiredOption<std::string>(cmd, "assets");
    if (!assetsPathResult) {
        return std::unexpected(assetsPathResult.error());
    }

    const std::string& ticker = tickerResult.value();

    auto engine = createEngine(cmd.options);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    auto assets = loadAssetsFile(assetsPathResult.value());
    if (!assets) {
        return std::unexpected("Failed to load assets: " + formatError(assets.error()));
    }

    auto assumptions = resolveAssumptions(**engine, ticker, cmd.options);
    if (!assumptions) {
        return std::unexpected(assumptions.error());
    }

    auto rows = (*engine)->analyzeSensitivity(ticker, *assets, *assumptions);
    if (!rows) {
        return std::unexpected("Sensitivity analysis failed: " + formatError(rows.error()));
    }

    printSensitivity(ticker, *rows);

    return writeOutput(cmd.options, toJson(*rows));
}

void CommandExecutor::printSensitivity(
    std::string_view ticker,
    const std::vector<SensitivityRow>& rows) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "SENSITIVITY ANALYSIS: " << ticker << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    std::cout << std::left << std::setw(18) << "Driver"
              << std::right
              << std::setw(16) << "Low"
              << std::setw(16) << "Base"
              << std::setw(16) << "High" << std::endl;
    std::cout << std::string(66, '-') << std::endl;

    for (const auto& row : rows) {
        std::cout << std::left << std::setw(18) << row.driver
                  << std::right << std::fixed << std::setprecision(2)
                  << std::setw(16) << row.lowValue
                  << std::setw(16) << row.baseValue
                  << std::setw(16) << row.highValue
                  << (row.highCapped ? "  (capped at 1.0)" : "") << std::endl;
    }

    std::cout << std::string(70, '=') << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Fair Value
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeFairValue(const ParsedCommand& cmd)
{
    auto tickerResult = getRequiredOption<std::string>(cmd, "ticker");
    if (!tickerResult) {
        return std::unexpected(tickerResult.error());
    }

    auto parameters = buildFairValueParameters(cmd.options);
    if (!parameters) {
        return std::unexpected(parameters.error());
    }

    auto engine = createEngine(cmd.options);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    auto report = (*engine)->estimateFairValue(tickerResult.value(), *parameters);
    if (!report) {
        return std::unexpected("Fair value failed: " + formatError(report.error()));
    }

    printFairValue(*report);

    return writeOutput(cmd.options, toJson(*report));
}

void CommandExecutor::printFairValue(const FairValueReport& report) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "FAIR VALUE: " << report.ticker << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    std::cout << "Assumptions:" << std::endl;
    std::cout << "  FCF Growth:          " << percent(report.growthRate)
              << (report.growthEstimated ? " (estimated)" : "") << std::endl;
    std::cout << "  Terminal Growth:     " << percent(report.terminalGrowth) << std::endl;
    std::cout << "  WACC:                " << percent(report.wacc)
              << " (" << toString(report.waccSource) << ")" << std::endl;
    std::cout << std::endl;

    for (const auto& estimate : report.estimates) {
        std::cout << "  " << std::left << std::setw(14) << toString(estimate.method);
        if (estimate.fairValuePerShare) {
            std::cout << money(*estimate.fairValuePerShare) << std::endl;
        } else if (estimate.failure) {
            std::cout << "n/a (" << estimate.failure->message << ")" << std::endl;
        }
    }
    std::cout << std::endl;

    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Current Price:         " << money(report.currentPrice) << std::endl;
    if (report.averageFairValue) {
        std::cout << "Average Fair Value:    " << money(*report.averageFairValue) << std::endl;
        std::cout << "Upside/Downside:       " << std::fixed << std::setprecision(1)
                  << report.upsidePercent << "%" << std::endl;
    } else {
        std::cout << "Average Fair Value:    n/a" << std::endl;
    }
    std::cout << "Recommendation:        " << report.recommendation << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Biotech
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeBiotech(const ParsedCommand& cmd)
{
    auto drugsPath = getRequiredOption<std::string>(cmd, "drugs");
    if (!drugsPath) {
        return std::unexpected(drugsPath.error());
    }

    int year = 0;
    if (cmd.options.count("year")) {
        year = cmd.options.at("year").as<int>();
    } else {
        const auto today = std::chrono::year_month_day{
            std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
        year = static_cast<int>(today.year());
    }

    auto portfolio = loadDrugPortfolioFile(drugsPath.value());
    if (!portfolio) {
        return std::unexpected("Failed to load drug portfolio: " + formatError(portfolio.error()));
    }

    BiotechAnalyzer analyzer;
    auto report = analyzer.analyze(*portfolio, year);
    if (!report) {
        return std::unexpected("Biotech analysis failed: " + formatError(report.error()));
    }

    printBiotechReport(*report);

    return writeOutput(cmd.options, toJson(*report));
}

void CommandExecutor::printBiotechReport(const BiotechReport& report) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "BIOTECH IP ANALYSIS: " << report.companyName
              << " (" << report.ticker << "), " << report.currentYear << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    const auto& patents = report.patentAnalysis;
    std::cout << "Patent Protection:" << std::endl;
    for (const auto& drug : patents.byDrug) {
        std::cout << "  " << std::left << std::setw(16) << drug.drug
                  << std::right << std::setw(4) << drug.effectiveProtectionYears << " yrs  "
                  << drug.riskLevel << std::endl;
    }
    std::cout << "  Average Protection:  " << std::fixed << std::setprecision(1)
              << patents.averageRemainingProtection << " yrs ("
              << toString(patents.overallRisk) << " risk)" << std::endl;
    if (patents.patentCliffWarning) {
        std::cout << "  ⚠ " << *patents.patentCliffWarning << std::endl;
    }
    std::cout << std::endl;

    const auto& risks = report.riskAssessment;
    std::cout << "Risk Score:            " << risks.overallRiskScore << "/100" << std::endl;
    for (const auto* group : {&risks.patentRisks, &risks.pipelineRisks, &risks.commercialRisks}) {
        for (const auto& risk : *group) {
            std::cout << "  [" << risk.severity << "] " << risk.type;
            if (risk.drug) {
                std::cout << " - " << *risk.drug;
            }
            std::cout << ": " << risk.impact << std::endl;
        }
    }
    std::cout << std::endl;

    const auto& valuation = report.valuation;
    std::cout << "Risk-Adjusted Value:" << std::endl;
    for (const auto& drug : valuation.byDrug) {
        std::cout << "  " << std::left << std::setw(16) << drug.drug
                  << std::right << std::setw(20) << money(drug.riskAdjustedValue)
                  << "  (p=" << std::setprecision(2) << drug.probabilityOfSuccess << ")" << std::endl;
    }
    std::cout << std::endl;

    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Approved Products:     " << money(valuation.approvedProductsValue) << std::endl;
    std::cout << "Pipeline:              " << money(valuation.pipelineValue) << std::endl;
    std::cout << "Total Portfolio Value: " << money(valuation.totalPortfolioValue) << std::endl;
    std::cout << "Moat:                  " << report.moat.strength
              << " (" << report.moat.durationYears << " yrs)" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Import
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeImport(const ParsedCommand& cmd)
{
    auto jsonPathResult = getRequiredOption<std::string>(cmd, "json-file");
    if (!jsonPathResult) {
        return std::unexpected(jsonPathResult.error());
    }

    auto sqlitePathResult = getRequiredOption<std::string>(cmd, "sqlite-path");
    if (!sqlitePathResult) {
        return std::unexpected(sqlitePathResult.error());
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "Importing Company Data" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Source:   " << jsonPathResult.value() << std::endl;
    std::cout << "Database: " << sqlitePathResult.value() << std::endl;
    std::cout << std::endl;

    auto document = readJsonFile(jsonPathResult.value());
    if (!document) {
        return std::unexpected(formatError(document.error()));
    }

    auto companies = parseCompanies(*document);
    if (!companies) {
        return std::unexpected(formatError(companies.error()));
    }

    SQLiteDataSource store;
    auto opened = store.open(sqlitePathResult.value());
    if (!opened) {
        return std::unexpected("Failed to open database: " + opened.error());
    }

    for (const auto& company : *companies) {
        auto saved = store.saveCompany(company);
        if (!saved) {
            return std::unexpected(
                "Failed to import '" + company.ticker + "': " + formatError(saved.error()));
        }
        std::cout << "  ✓ " << company.ticker << ": "
                  << company.statements.size() << " statement period(s), "
                  << company.segments.size() << " segment(s)" << std::endl;
    }

    std::cout << std::endl;
    std::cout << "✓ Imported " << companies->size() << " company(ies)" << std::endl;
    return {};
}

}  // namespace ipvalue
