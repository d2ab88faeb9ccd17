#include "SQLiteDataSource.hpp"
#include <iterator>
#include <stdexcept>

namespace ipvalue {

namespace po = boost::program_options;

namespace {

// Финализирует подготовленный запрос при выходе из области видимости
class StatementGuard {
public:
    explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementGuard() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;

    sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    sqlite3_stmt* stmt_;
};

std::string statementColumnList() {
    std::string columns;
    for (const auto& field : kStatementFields) {
        columns += ", ";
        columns += field.name;
    }
    return columns;
}

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// Конструктор и деструктор
// ═════════════════════════════════════════════════════════════════════════════

SQLiteDataSource::SQLiteDataSource(std::string_view dbPath) {
    if (!dbPath.empty()) {
        auto result = open(dbPath);
        if (!result) {
            throw std::runtime_error("Failed to initialize database: " + result.error());
        }
    }
}

SQLiteDataSource::~SQLiteDataSource() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

DataSourceCommandLineOptions SQLiteDataSource::commandLineOptions() {
    DataSourceCommandLineOptions meta;
    meta.name = "sqlite";
    meta.description = "Company financial data from a local SQLite store";
    meta.options.add_options()
        ("sqlite-path", po::value<std::string>(), "Path to SQLite database file");
    return meta;
}

// ═════════════════════════════════════════════════════════════════════════════
// Инициализация
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteDataSource::initializeFromOptions(const po::variables_map& options) {
    if (db_) {
        return {};
    }

    if (!options.count("sqlite-path")) {
        return std::unexpected(
            "SQLite database path not specified.\n"
            "Use --sqlite-path <path>");
    }

    return open(options.at("sqlite-path").as<std::string>());
}

Result SQLiteDataSource::open(std::string_view path) {
    if (db_) {
        return {};
    }

    dbPath_ = std::string(path);

    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = "Failed to open database: ";
        if (db_) {
            error += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        } else {
            error += "Out of memory";
        }
        return std::unexpected(error);
    }

    // Включаем поддержку внешних ключей
    sqlite3_exec(db_, "PRAGMA foreign_keys = ON", nullptr, nullptr, nullptr);

    auto createResult = createTables();
    if (!createResult) {
        sqlite3_close(db_);
        db_ = nullptr;
        return createResult;
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// СХЕМА
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteDataSource::createTables() {
    std::string sql = R"(
        -- Компании и рыночный снимок
        CREATE TABLE IF NOT EXISTS companies (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            ticker TEXT NOT NULL UNIQUE,
            name TEXT NOT NULL,
            price REAL NOT NULL DEFAULT 0,
            market_cap REAL NOT NULL DEFAULT 0
        );

        -- Выручка сегментов по периодам
        CREATE TABLE IF NOT EXISTS segment_revenues (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            company_id INTEGER NOT NULL,
            segment TEXT NOT NULL,
            period_label TEXT NOT NULL,
            revenue REAL NOT NULL,
            FOREIGN KEY (company_id) REFERENCES companies(id) ON DELETE CASCADE,
            UNIQUE(company_id, segment, period_label)
        );

        CREATE INDEX IF NOT EXISTS idx_segment_revenues_company ON segment_revenues(company_id);
    )";

    // Отчетность: по одному столбцу REAL на каждое числовое поле
    sql += "CREATE TABLE IF NOT EXISTS statements ("
           "id INTEGER PRIMARY KEY AUTOINCREMENT, "
           "company_id INTEGER NOT NULL, "
           "period_label TEXT NOT NULL";
    for (const auto& field : kStatementFields) {
        sql += ", ";
        sql += field.name;
        sql += " REAL NOT NULL DEFAULT 0";
    }
    sql += ", FOREIGN KEY (company_id) REFERENCES companies(id) ON DELETE CASCADE"
           ", UNIQUE(company_id, period_label));"
           "CREATE INDEX IF NOT EXISTS idx_statements_company ON statements(company_id);";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return std::unexpected("Failed to create tables: " + error);
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Вспомогательные методы
// ═════════════════════════════════════════════════════════════════════════════

ValuationError SQLiteDataSource::sqliteError(std::string_view what) const {
    return ValuationError{
        ErrorCode::DataSourceFailure,
        std::string(what) + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open")
    };
}

Expected<void> SQLiteDataSource::ensureOpen() const {
    if (!db_) {
        return makeError(ErrorCode::DataSourceFailure,
                         "SQLite data source not initialized. Call open() or initializeFromOptions() first.");
    }
    return {};
}

Expected<void> SQLiteDataSource::execute(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return makeError(ErrorCode::DataSourceFailure,
                         std::string("Failed to execute '") + sql + "': " + error);
    }
    return {};
}

Expected<sqlite3_int64> SQLiteDataSource::findCompanyId(std::string_view ticker) {
    if (auto ready = ensureOpen(); !ready) {
        return std::unexpected(ready.error());
    }

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT id FROM companies WHERE ticker = ?", -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare company select"));
    }
    StatementGuard stmt(raw);

    sqlite3_bind_text(stmt.get(), 1, ticker.data(), static_cast<int>(ticker.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return sqlite3_column_int64(stmt.get(), 0);
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to query company"));
    }

    return makeError(ErrorCode::DataNotFound, "Unknown ticker: " + std::string(ticker));
}

// ═════════════════════════════════════════════════════════════════════════════
// Импорт
// ═════════════════════════════════════════════════════════════════════════════

Expected<void> SQLiteDataSource::saveCompany(const CompanyData& company) {
    if (auto ready = ensureOpen(); !ready) {
        return ready;
    }

    if (company.ticker.empty()) {
        return makeError(ErrorCode::DataSourceFailure, "Company ticker cannot be empty");
    }

    if (auto begin = execute("BEGIN TRANSACTION"); !begin) {
        return begin;
    }

    auto write = [&]() -> Expected<void> {
        // Компания
        {
            const char* sql =
                "INSERT INTO companies (ticker, name, price, market_cap) VALUES (?, ?, ?, ?) "
                "ON CONFLICT(ticker) DO UPDATE SET "
                "name = excluded.name, price = excluded.price, market_cap = excluded.market_cap";
            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
                return std::unexpected(sqliteError("Failed to prepare company insert"));
            }
            StatementGuard stmt(raw);

            sqlite3_bind_text(stmt.get(), 1, company.ticker.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, company.name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt.get(), 3, company.snapshot.price);
            sqlite3_bind_double(stmt.get(), 4, company.snapshot.marketCap);

            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                return std::unexpected(sqliteError("Failed to insert company"));
            }
        }

        auto companyId = findCompanyId(company.ticker);
        if (!companyId) {
            return std::unexpected(companyId.error());
        }

        // Прежние ряды заменяются полностью
        for (const char* sql : {"DELETE FROM statements WHERE company_id = ?",
                                "DELETE FROM segment_revenues WHERE company_id = ?"}) {
            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
                return std::unexpected(sqliteError("Failed to prepare delete"));
            }
            StatementGuard stmt(raw);
            sqlite3_bind_int64(stmt.get(), 1, *companyId);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                return std::unexpected(sqliteError("Failed to delete previous rows"));
            }
        }

        // Отчетность
        {
            std::string sql = "INSERT INTO statements (company_id, period_label" +
                              statementColumnList() + ") VALUES (?, ?";
            for (std::size_t i = 0; i < std::size(kStatementFields); ++i) {
                sql += ", ?";
            }
            sql += ")";

            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
                return std::unexpected(sqliteError("Failed to prepare statement insert"));
            }
            StatementGuard stmt(raw);

            for (const auto& statement : company.statements) {
                sqlite3_reset(stmt.get());
                sqlite3_bind_int64(stmt.get(), 1, *companyId);
                sqlite3_bind_text(stmt.get(), 2, statement.periodLabel.c_str(), -1, SQLITE_TRANSIENT);

                int index = 3;
                for (const auto& field : kStatementFields) {
                    sqlite3_bind_double(stmt.get(), index++, statement.*field.member);
                }

                if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                    return std::unexpected(sqliteError(
                        "Failed to insert statement for period " + statement.periodLabel));
                }
            }
        }

        // Сегменты
        {
            const char* sql =
                "INSERT INTO segment_revenues (company_id, segment, period_label, revenue) "
                "VALUES (?, ?, ?, ?)";
            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
                return std::unexpected(sqliteError("Failed to prepare segment insert"));
            }
            StatementGuard stmt(raw);

            for (const auto& [label, points] : company.segments) {
                for (const auto& point : points) {
                    sqlite3_reset(stmt.get());
                    sqlite3_bind_int64(stmt.get(), 1, *companyId);
                    sqlite3_bind_text(stmt.get(), 2, label.c_str(), -1, SQLITE_TRANSIENT);
                    sqlite3_bind_text(stmt.get(), 3, point.periodLabel.c_str(), -1, SQLITE_TRANSIENT);
                    sqlite3_bind_double(stmt.get(), 4, point.revenue);

                    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                        return std::unexpected(sqliteError(
                            "Failed to insert revenue of segment '" + label + "'"));
                    }
                }
            }
        }

        return {};
    };

    auto written = write();
    if (!written) {
        // Ошибка отката не должна скрыть исходную ошибку записи
        auto rollback = execute("ROLLBACK");
        if (!rollback) {
            return makeError(written.error().code,
                             written.error().message + " (rollback failed: " +
                             rollback.error().message + ")");
        }
        return written;
    }

    return execute("COMMIT");
}

Expected<std::vector<std::string>> SQLiteDataSource::listTickers() {
    if (auto ready = ensureOpen(); !ready) {
        return std::unexpected(ready.error());
    }

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT ticker FROM companies ORDER BY ticker", -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare ticker list"));
    }
    StatementGuard stmt(raw);

    std::vector<std::string> tickers;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const unsigned char* ticker = sqlite3_column_text(stmt.get(), 0);
        if (ticker) {
            tickers.emplace_back(reinterpret_cast<const char*>(ticker));
        }
    }
    return tickers;
}

// ═════════════════════════════════════════════════════════════════════════════
// Получение данных
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<SegmentRevenuePoint>> SQLiteDataSource::fetchSegmentSeries(
    std::string_view ticker,
    std::string_view segmentName,
    std::size_t periods) {

    auto companyId = findCompanyId(ticker);
    if (!companyId) {
        return std::unexpected(companyId.error());
    }

    const char* sql =
        "SELECT period_label, revenue FROM segment_revenues "
        "WHERE company_id = ? AND segment = ? AND period_label IS NOT NULL "
        "ORDER BY period_label DESC LIMIT ?";
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare segment select"));
    }
    StatementGuard stmt(raw);

    sqlite3_bind_int64(stmt.get(), 1, *companyId);
    sqlite3_bind_text(stmt.get(), 2, segmentName.data(), static_cast<int>(segmentName.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(periods));

    std::vector<SegmentRevenuePoint> points;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* label = sqlite3_column_text(stmt.get(), 0);
        if (!label) {
            continue;
        }
        SegmentRevenuePoint point;
        point.periodLabel = reinterpret_cast<const char*>(label);
        point.revenue = sqlite3_column_double(stmt.get(), 1);
        points.push_back(std::move(point));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to read segment revenues"));
    }

    if (points.empty() && periods > 0) {
        return makeError(ErrorCode::DataNotFound,
                         "Segment '" + std::string(segmentName) + "' not reported by " +
                         std::string(ticker));
    }

    return points;
}

Expected<std::vector<RawStatementPeriod>> SQLiteDataSource::fetchStatementSeries(
    std::string_view ticker,
    std::size_t periods) {

    auto companyId = findCompanyId(ticker);
    if (!companyId) {
        return std::unexpected(companyId.error());
    }

    const std::string sql = "SELECT period_label" + statementColumnList() +
                            " FROM statements WHERE company_id = ? AND period_label IS NOT NULL "
                            "ORDER BY period_label DESC LIMIT ?";
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare statement select"));
    }
    StatementGuard stmt(raw);

    sqlite3_bind_int64(stmt.get(), 1, *companyId);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(periods));

    std::vector<RawStatementPeriod> statements;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* label = sqlite3_column_text(stmt.get(), 0);
        if (!label) {
            continue;
        }
        RawStatementPeriod statement;
        statement.periodLabel = reinterpret_cast<const char*>(label);

        int column = 1;
        for (const auto& field : kStatementFields) {
            statement.*field.member = sqlite3_column_double(stmt.get(), column++);
        }
        statements.push_back(std::move(statement));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to read statements"));
    }

    return statements;
}

Expected<MarketSnapshot> SQLiteDataSource::fetchMarketSnapshot(std::string_view ticker) {
    if (auto ready = ensureOpen(); !ready) {
        return std::unexpected(ready.error());
    }

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT price, market_cap FROM companies WHERE ticker = ?",
                           -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare snapshot select"));
    }
    StatementGuard stmt(raw);

    sqlite3_bind_text(stmt.get(), 1, ticker.data(), static_cast<int>(ticker.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        MarketSnapshot snapshot;
        snapshot.price = sqlite3_column_double(stmt.get(), 0);
        snapshot.marketCap = sqlite3_column_double(stmt.get(), 1);
        return snapshot;
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to query snapshot"));
    }

    return makeError(ErrorCode::DataNotFound, "Unknown ticker: " + std::string(ticker));
}

Expected<std::vector<std::string>> SQLiteDataSource::listSegments(std::string_view ticker) {
    auto companyId = findCompanyId(ticker);
    if (!companyId) {
        return std::unexpected(companyId.error());
    }

    const char* sql =
        "SELECT DISTINCT segment FROM segment_revenues "
        "WHERE company_id = ? AND segment IS NOT NULL ORDER BY segment";
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare segment list"));
    }
    StatementGuard stmt(raw);

    sqlite3_bind_int64(stmt.get(), 1, *companyId);

    std::vector<std::string> labels;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const unsigned char* segment = sqlite3_column_text(stmt.get(), 0);
        if (segment) {
            labels.emplace_back(reinterpret_cast<const char*>(segment));
        }
    }
    return labels;
}

}  // namespace ipvalue
