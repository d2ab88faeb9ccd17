#include "JsonFileDataSource.hpp"
#include "JsonCodec.hpp"

namespace ipvalue {

namespace po = boost::program_options;

JsonFileDataSource::JsonFileDataSource(std::filesystem::path filePath)
    : filePath_(std::move(filePath)) {}

DataSourceCommandLineOptions JsonFileDataSource::commandLineOptions() {
    DataSourceCommandLineOptions meta;
    meta.name = "json";
    meta.description = "Company financial data from a local JSON file";
    meta.options.add_options()
        ("json-file", po::value<std::string>(), "Path to company data JSON file");
    return meta;
}

Result JsonFileDataSource::initializeFromOptions(const po::variables_map& options) {
    if (!options.count("json-file")) {
        return std::unexpected(
            "JSON data file not specified.\n"
            "Use --json-file <path>");
    }

    auto loaded = load(options.at("json-file").as<std::string>());
    if (!loaded) {
        return std::unexpected(loaded.error().message);
    }
    return {};
}

Expected<void> JsonFileDataSource::load(const std::filesystem::path& filePath) {
    auto j = readJsonFile(filePath);
    if (!j) {
        return std::unexpected(j.error());
    }

    auto companies = parseCompanies(*j);
    if (!companies) {
        return std::unexpected(companies.error());
    }

    store_.clear();
    for (auto& company : *companies) {
        store_.addCompany(std::move(company));
    }

    filePath_ = filePath;
    loaded_ = true;
    return {};
}

Expected<void> JsonFileDataSource::ensureLoaded() const {
    if (!loaded_) {
        return makeError(ErrorCode::DataSourceFailure,
                         "JSON data source not initialized. Call load() or initializeFromOptions() first.");
    }
    return {};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Делегирование хранилищу в памяти
// ═══════════════════════════════════════════════════════════════════════════════

Expected<std::vector<SegmentRevenuePoint>> JsonFileDataSource::fetchSegmentSeries(
    std::string_view ticker,
    std::string_view segmentName,
    std::size_t periods) {

    if (auto ready = ensureLoaded(); !ready) {
        return std::unexpected(ready.error());
    }
    return store_.fetchSegmentSeries(ticker, segmentName, periods);
}

Expected<std::vector<RawStatementPeriod>> JsonFileDataSource::fetchStatementSeries(
    std::string_view ticker,
    std::size_t periods) {

    if (auto ready = ensureLoaded(); !ready) {
        return std::unexpected(ready.error());
    }
    return store_.fetchStatementSeries(ticker, periods);
}

Expected<MarketSnapshot> JsonFileDataSource::fetchMarketSnapshot(std::string_view ticker) {
    if (auto ready = ensureLoaded(); !ready) {
        return std::unexpected(ready.error());
    }
    return store_.fetchMarketSnapshot(ticker);
}

Expected<std::vector<std::string>> JsonFileDataSource::listSegments(std::string_view ticker) {
    if (auto ready = ensureLoaded(); !ready) {
        return std::unexpected(ready.error());
    }
    return store_.listSegments(ticker);
}

}  // namespace ipvalue
