#include "CommandLineParser.hpp"
#include "JsonFileDataSource.hpp"
#include "SQLiteDataSource.hpp"

namespace ipvalue {

std::expected<ParsedCommand, std::string> CommandLineParser::parse(
    int argc,
    char* argv[]) {

    if (argc < 2) {
        return std::unexpected(
            "No command specified. Use 'ipvalue help' for usage information.");
    }

    ParsedCommand result;
    result.command = argv[1];

    try {
        // ═════════════════════════════════════════════════════════════════════
        // Проверка глобального help
        // ═════════════════════════════════════════════════════════════════════

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "help" || arg == "--help" || arg == "-h") {
                if (i == 1) {
                    result.command = "help";
                    for (int j = 2; j < argc; ++j) {
                        std::string currentArg = argv[j];
                        if (!currentArg.empty() && currentArg[0] != '-') {
                            result.positional.push_back(currentArg);
                        }
                    }
                } else {
                    // ipvalue value --help -> справка по команде value
                    result.positional.push_back(result.command);
                    result.command = "help";
                }
                return result;
            }
        }

        if (result.command == "version" || result.command == "--version") {
            result.command = "version";
            return result;
        }

        auto desc = optionsFor(result.command);
        if (!desc) {
            return std::unexpected(desc.error());
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        po::store(po::command_line_parser(args).options(*desc).run(),
                  result.options);
        po::notify(result.options);

    } catch (const po::error& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }

    return result;
}

std::expected<po::options_description, std::string> CommandLineParser::optionsFor(
    std::string_view command) const {

    if (command == "value") {
        return createValueOptions();
    } else if (command == "assumptions") {
        return createAssumptionsCommandOptions();
    } else if (command == "health") {
        return createHealthOptions();
    } else if (command == "discover") {
        return createDiscoverOptions();
    } else if (command == "sensitivity") {
        return createSensitivityOptions();
    } else if (command == "fair-value") {
        return createFairValueOptions();
    } else if (command == "biotech") {
        return createBiotechOptions();
    } else if (command == "import") {
        return createImportOptions();
    }

    return std::unexpected("Unknown command: " + std::string(command));
}

// ═════════════════════════════════════════════════════════════════════════════
// Общие группы опций
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createSourceOptions() const {
    po::options_description desc("Data source options");
    desc.add_options()
        ("source,s", po::value<std::string>()->default_value("json"),
         "Data source (json, sqlite)");

    // Опции самих источников
    desc.add(JsonFileDataSource::commandLineOptions().options);
    desc.add(SQLiteDataSource::commandLineOptions().options);

    return desc;
}

po::options_description CommandLineParser::createEngineOptions() const {
    po::options_description desc("Engine options");
    desc.add_options()
        ("ticker,t", po::value<std::string>()->required(),
         "Company ticker")

        ("periods,p", po::value<std::size_t>()->default_value(5),
         "Maximum number of historical periods")

        ("match,m", po::value<std::string>()->default_value("exact"),
         "Segment name matching (exact, case-insensitive, normalized)");

    return desc;
}

po::options_description CommandLineParser::createAssumptionOptions() const {
    po::options_description desc("Assumption options");
    desc.add_options()
        ("wacc", po::value<double>(),
         "Discount rate (decimal, e.g. 0.095)")

        ("tax-rate", po::value<double>(),
         "Tax rate (decimal)")

        ("terminal-growth", po::value<double>(),
         "Terminal growth rate (decimal)");

    return desc;
}

po::options_description CommandLineParser::createOutputOptions() const {
    po::options_description desc("Output options");
    desc.add_options()
        ("output,o", po::value<std::string>(),
         "Write result as JSON to file");

    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Опции команд
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createValueOptions() const {
    po::options_description desc("Value options");
    desc.add_options()
        ("assets,a", po::value<std::string>()->required(),
         "Asset definitions JSON file")

        ("best-effort", po::bool_switch()->default_value(false),
         "Skip failing assets instead of aborting")

        ("csv", po::value<std::string>(),
         "Write per-segment breakdown as CSV to file")

        ("help,h", "Show help message");

    desc.add(createEngineOptions());
    desc.add(createAssumptionOptions());
    desc.add(createSourceOptions());
    desc.add(createOutputOptions());
    return desc;
}

po::options_description CommandLineParser::createAssumptionsCommandOptions() const {
    po::options_description desc("Assumptions options");
    desc.add_options()
        ("help,h", "Show help message");

    // Здесь --wacc, --tax-rate, --terminal-growth - значения на случай
    // ошибки расчета
    desc.add(createEngineOptions());
    desc.add(createAssumptionOptions());
    desc.add(createSourceOptions());
    desc.add(createOutputOptions());
    return desc;
}

po::options_description CommandLineParser::createHealthOptions() const {
    po::options_description desc("Health options");
    desc.add_options()
        ("help,h", "Show help message");

    desc.add(createEngineOptions());
    desc.add(createSourceOptions());
    desc.add(createOutputOptions());
    return desc;
}

po::options_description CommandLineParser::createDiscoverOptions() const {
    po::options_description desc("Discover options");
    desc.add_options()
        ("industry", po::value<std::string>(),
         "Industry for royalty rate reference (e.g. technology, software)")

        ("help,h", "Show help message");

    desc.add(createEngineOptions());
    desc.add(createSourceOptions());
    desc.add(createOutputOptions());
    return desc;
}

po::options_description CommandLineParser::createSensitivityOptions() const {
    po::options_description desc("Sensitivity options");
    desc.add_options()
        ("assets,a", po::value<std::string>()->required(),
         "Asset definitions JSON file")

        ("help,h", "Show help message");

    desc.add(createEngineOptions());
    desc.add(createAssumptionOptions());
    desc.add(createSourceOptions());
    desc.add(createOutputOptions());
    return desc;
}

po::options_description CommandLineParser::createFairValueOptions() const {
    po::options_description desc("Fair value options");
    desc.add_options()
        ("growth-rate", po::value<double>(),
         "Free cash flow growth (decimal); estimated from revenue if omitted")

        ("projection-years", po::value<int>()->default_value(5),
         "DCF projection horizon in years")

        ("pe-multiple", po::value<double>()->default_value(20.0),
         "Fair price to earnings multiple")

        ("ps-multiple", po::value<double>()->default_value(3.0),
         "Fair price to sales multiple")

        ("ev-ebitda-multiple", po::value<double>()->default_value(12.0),
         "Fair EV/EBITDA multiple")

        ("help,h", "Show help message");

    // --terminal-growth по умолчанию 0.025, --wacc без значения - расчет
    desc.add(createEngineOptions());
    desc.add(createAssumptionOptions());
    desc.add(createSourceOptions());
    desc.add(createOutputOptions());
    return desc;
}

po::options_description CommandLineParser::createBiotechOptions() const {
    po::options_description desc("Biotech options");
    desc.add_options()
        ("drugs,d", po::value<std::string>()->required(),
         "Drug portfolio JSON file")

        ("year", po::value<int>(),
         "Reference year for protection periods (default: current year)")

        ("help,h", "Show help message");

    desc.add(createOutputOptions());
    return desc;
}

po::options_description CommandLineParser::createImportOptions() const {
    po::options_description desc("Import options");
    desc.add_options()
        ("help,h", "Show help message");

    // Импорт всегда из JSON в SQLite
    desc.add(JsonFileDataSource::commandLineOptions().options);
    desc.add(SQLiteDataSource::commandLineOptions().options);
    return desc;
}

}  // namespace ipvalue
