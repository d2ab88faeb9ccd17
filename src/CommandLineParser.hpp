#pragma once

#include <boost/program_options.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace po = boost::program_options;

namespace ipvalue {

struct ParsedCommand {
    std::string command;
    po::variables_map options;
    std::vector<std::string> positional;  // Тема справки: ipvalue help value
};

class CommandLineParser {
public:
    CommandLineParser() = default;

    std::expected<ParsedCommand, std::string> parse(int argc, char* argv[]);

    // Полный набор опций команды (используется и в справке)
    std::expected<po::options_description, std::string> optionsFor(
        std::string_view command) const;

    // Методы создания базовых описаний опций
    po::options_description createSourceOptions() const;
    po::options_description createEngineOptions() const;
    po::options_description createAssumptionOptions() const;
    po::options_description createOutputOptions() const;

private:
    po::options_description createValueOptions() const;
    po::options_description createAssumptionsCommandOptions() const;
    po::options_description createHealthOptions() const;
    po::options_description createDiscoverOptions() const;
    po::options_description createSensitivityOptions() const;
    po::options_description createFairValueOptions() const;
    po::options_description createBiotechOptions() const;
    po::options_description createImportOptions() const;
};

}  // namespace ipvalue
