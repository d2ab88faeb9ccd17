#pragma once

#include "IFinancialDataSource.hpp"
#include "InMemoryDataSource.hpp"
#include <filesystem>
#include <string>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// JSON File Data Source
// ═══════════════════════════════════════════════════════════════════════════════
//
// Загружает файл данных компаний ({"companies": [...]}) целиком и отдает
// ряды из памяти.

class JsonFileDataSource : public IFinancialDataSource {
public:
    JsonFileDataSource() = default;
    explicit JsonFileDataSource(std::filesystem::path filePath);

    // Метаданные опций для CLI
    static DataSourceCommandLineOptions commandLineOptions();

    // Опция --json-file
    Result initializeFromOptions(
        const boost::program_options::variables_map& options) override;

    Expected<void> load(const std::filesystem::path& filePath);

    bool isLoaded() const noexcept { return loaded_; }
    const std::filesystem::path& filePath() const noexcept { return filePath_; }

    Expected<std::vector<SegmentRevenuePoint>> fetchSegmentSeries(
        std::string_view ticker,
        std::string_view segmentName,
        std::size_t periods) override;

    Expected<std::vector<RawStatementPeriod>> fetchStatementSeries(
        std::string_view ticker,
        std::size_t periods) override;

    Expected<MarketSnapshot> fetchMarketSnapshot(
        std::string_view ticker) override;

    Expected<std::vector<std::string>> listSegments(
        std::string_view ticker) override;

private:
    Expected<void> ensureLoaded() const;

    std::filesystem::path filePath_;
    InMemoryDataSource store_;
    bool loaded_ = false;
};

}  // namespace ipvalue
