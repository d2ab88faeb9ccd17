#pragma once

#include "ValuationTypes.hpp"
#include <boost/program_options.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace ipvalue {

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Command Line Metadata
// ═══════════════════════════════════════════════════════════════════════════════

// Метаданные опций командной строки для источника данных
struct DataSourceCommandLineOptions {
    // Имя источника ("json", "sqlite")
    std::string name;

    // Описание опций для boost::program_options
    boost::program_options::options_description options;

    // Краткое описание источника
    std::string description;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Financial Data Source Interface
// ═══════════════════════════════════════════════════════════════════════════════

// Единственная точка контакта движка с внешним поставщиком данных.
// Движок не знает, как данные доставляются, кэшируются и авторизуются.
// Все ряды возвращаются от нового периода к старому.
class IFinancialDataSource {
public:
    virtual ~IFinancialDataSource() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Инициализация с использованием опций командной строки
    // ─────────────────────────────────────────────────────────────────────────

    // Источник извлекает только свои опции (с правильным префиксом)
    virtual Result initializeFromOptions(
        const boost::program_options::variables_map& options) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Контракт получения данных
    // ─────────────────────────────────────────────────────────────────────────

    // Выручка сегмента по периодам: (period_label, revenue_amount).
    // segmentName - точная метка сегмента, как ее отдает listSegments().
    virtual Expected<std::vector<SegmentRevenuePoint>> fetchSegmentSeries(
        std::string_view ticker,
        std::string_view segmentName,
        std::size_t periods) = 0;

    // Финансовая отчетность компании по периодам
    virtual Expected<std::vector<RawStatementPeriod>> fetchStatementSeries(
        std::string_view ticker,
        std::size_t periods) = 0;

    virtual Expected<MarketSnapshot> fetchMarketSnapshot(
        std::string_view ticker) = 0;

    // Все метки сегментов, раскрытые компанией (для сопоставления имен)
    virtual Expected<std::vector<std::string>> listSegments(
        std::string_view ticker) = 0;
};

}  // namespace ipvalue
