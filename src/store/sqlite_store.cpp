#include "../../include/store/sqlite_store.hpp"
#include "../../include/types.hpp"

#include <sqlite3.h>

namespace edgeloop::store {

namespace {

constexpr const char* SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS performance_log (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        market_id TEXT,
        question TEXT,
        category TEXT,
        forecast_prob REAL,
        actual_outcome REAL,
        edge_at_entry REAL,
        confidence TEXT,
        evidence_quality REAL,
        stake_usd REAL,
        entry_price REAL,
        exit_price REAL,
        pnl REAL,
        holding_hours REAL,
        resolved_at TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_performance_resolved ON performance_log(resolved_at);

    CREATE TABLE IF NOT EXISTS model_forecast_log (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        model_name TEXT NOT NULL,
        market_id TEXT,
        category TEXT,
        forecast_prob REAL,
        actual_outcome REAL,
        recorded_at TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_model_forecast_category ON model_forecast_log(category);

    CREATE TABLE IF NOT EXISTS calibration_history (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        forecast_prob REAL,
        actual_outcome REAL,
        recorded_at TEXT,
        market_id TEXT
    );

    CREATE TABLE IF NOT EXISTS engine_state (
        key TEXT PRIMARY KEY,
        value TEXT,
        updated_at REAL
    );

    CREATE TABLE IF NOT EXISTS candidates (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        market_id TEXT,
        implied_prob REAL,
        model_prob REAL,
        edge REAL,
        created_at TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_candidates_created ON candidates(created_at);
)";

/**
 * RAII prepared statement
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bind(int idx, double value) { check(sqlite3_bind_double(stmt_, idx, value)); }
    void bind(int idx, int64_t value) { check(sqlite3_bind_int64(stmt_, idx, value)); }

    /// true while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW)
            return true;
        if (rc == SQLITE_DONE)
            return false;
        throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }
    double real(int col, double fallback = 0.0) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL)
            return fallback;
        return finite_or(sqlite3_column_double(stmt_, col), fallback);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

SqliteStore::SqliteStore(const std::string& path, logging::AsyncLogger& logger)
    : path_(path), logger_(logger), missing_(logger) {
    int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("cannot open database " + path + ": " + msg);
    }
    EL_LOGF_DEBUG(logger_, logging::LogCategory::Store, "store.opened path=%s", path.c_str());
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        throw StoreError("exec failed: " + msg);
    }
}

void SqliteStore::create_schema() {
    exec(SCHEMA_SQL);
    EL_LOGF_INFO(logger_, logging::LogCategory::Store, "store.schema_ready path=%s", path_.c_str());
}

bool SqliteStore::has_table(const std::string& table) const {
    Statement stmt(db_, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bind(1, table);
    return stmt.step();
}

bool SqliteStore::require(const char* table) const {
    if (has_table(table))
        return true;
    missing_.report(table);
    return false;
}

// =============================================================================
// Appends
// =============================================================================

bool SqliteStore::insert_performance(const PerformanceRow& row) {
    if (!require(tables::PERFORMANCE_LOG))
        return false;

    Statement stmt(db_, R"(
        INSERT INTO performance_log
            (market_id, question, category, forecast_prob, actual_outcome, edge_at_entry,
             confidence, evidence_quality, stake_usd, entry_price, exit_price, pnl,
             holding_hours, resolved_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    stmt.bind(1, row.market_id);
    stmt.bind(2, row.question);
    stmt.bind(3, row.category);
    stmt.bind(4, row.forecast_prob);
    stmt.bind(5, row.actual_outcome);
    stmt.bind(6, row.edge_at_entry);
    stmt.bind(7, row.confidence);
    stmt.bind(8, row.evidence_quality);
    stmt.bind(9, row.stake_usd);
    stmt.bind(10, row.entry_price);
    stmt.bind(11, row.exit_price);
    stmt.bind(12, row.pnl);
    stmt.bind(13, row.holding_hours);
    stmt.bind(14, row.resolved_at);
    stmt.step();
    return true;
}

bool SqliteStore::insert_model_forecast(const ModelForecastRow& row) {
    if (!require(tables::MODEL_FORECAST_LOG))
        return false;

    Statement stmt(db_, R"(
        INSERT INTO model_forecast_log
            (model_name, market_id, category, forecast_prob, actual_outcome, recorded_at)
        VALUES (?, ?, ?, ?, ?, ?)
    )");
    stmt.bind(1, row.model_name);
    stmt.bind(2, row.market_id);
    stmt.bind(3, row.category);
    stmt.bind(4, row.forecast_prob);
    stmt.bind(5, row.actual_outcome);
    stmt.bind(6, row.recorded_at);
    stmt.step();
    return true;
}

bool SqliteStore::insert_calibration(const CalibrationRow& row) {
    if (!require(tables::CALIBRATION_HISTORY))
        return false;

    Statement stmt(db_, R"(
        INSERT INTO calibration_history (forecast_prob, actual_outcome, recorded_at, market_id)
        VALUES (?, ?, ?, ?)
    )");
    stmt.bind(1, row.forecast_prob);
    stmt.bind(2, row.actual_outcome);
    stmt.bind(3, row.recorded_at);
    stmt.bind(4, row.market_id);
    stmt.step();
    return true;
}

bool SqliteStore::put_state(const std::string& key, const std::string& value, double updated_at) {
    if (!require(tables::ENGINE_STATE))
        return false;

    Statement stmt(db_, "INSERT OR REPLACE INTO engine_state (key, value, updated_at) VALUES (?, ?, ?)");
    stmt.bind(1, key);
    stmt.bind(2, value);
    stmt.bind(3, updated_at);
    stmt.step();
    return true;
}

bool SqliteStore::insert_candidate(const CandidateRow& row) {
    if (!require(tables::CANDIDATES))
        return false;

    Statement stmt(db_, R"(
        INSERT INTO candidates (market_id, implied_prob, model_prob, edge, created_at)
        VALUES (?, ?, ?, ?, ?)
    )");
    stmt.bind(1, row.market_id);
    stmt.bind(2, row.implied_prob);
    stmt.bind(3, row.model_prob);
    stmt.bind(4, row.edge);
    stmt.bind(5, row.created_at);
    stmt.step();
    return true;
}

// =============================================================================
// Reads
// =============================================================================

std::vector<PerformanceRow> SqliteStore::performance_log(SortOrder order, size_t limit) const {
    if (!require(tables::PERFORMANCE_LOG))
        return {};

    const char* sql_asc = R"(
        SELECT market_id, question, category, forecast_prob, actual_outcome, edge_at_entry,
               confidence, evidence_quality, stake_usd, entry_price, exit_price, pnl,
               holding_hours, resolved_at
        FROM performance_log
        ORDER BY resolved_at ASC, rowid ASC
        LIMIT ?
    )";
    const char* sql_desc = R"(
        SELECT market_id, question, category, forecast_prob, actual_outcome, edge_at_entry,
               confidence, evidence_quality, stake_usd, entry_price, exit_price, pnl,
               holding_hours, resolved_at
        FROM performance_log
        ORDER BY resolved_at DESC, rowid DESC
        LIMIT ?
    )";

    Statement stmt(db_, order == SortOrder::Ascending ? sql_asc : sql_desc);
    stmt.bind(1, limit > 0 ? static_cast<int64_t>(limit) : int64_t{-1});

    std::vector<PerformanceRow> rows;
    while (stmt.step()) {
        PerformanceRow r;
        r.market_id = stmt.text(0);
        r.question = stmt.text(1);
        r.category = stmt.text(2);
        r.forecast_prob = stmt.real(3);
        r.actual_outcome = stmt.real(4);
        r.edge_at_entry = stmt.real(5);
        r.confidence = stmt.text(6);
        r.evidence_quality = stmt.real(7);
        r.stake_usd = stmt.real(8);
        r.entry_price = stmt.real(9);
        r.exit_price = stmt.real(10);
        r.pnl = stmt.real(11);
        r.holding_hours = stmt.real(12);
        r.resolved_at = stmt.text(13);
        rows.push_back(std::move(r));
    }
    return rows;
}

std::vector<ModelForecastRow> SqliteStore::model_forecasts(const std::string& category) const {
    if (!require(tables::MODEL_FORECAST_LOG))
        return {};

    bool all = category == ALL_CATEGORIES;
    Statement stmt(db_, all ? R"(
        SELECT model_name, market_id, category, forecast_prob, actual_outcome, recorded_at
        FROM model_forecast_log
        ORDER BY rowid ASC
    )"
                            : R"(
        SELECT model_name, market_id, category, forecast_prob, actual_outcome, recorded_at
        FROM model_forecast_log
        WHERE category = ?
        ORDER BY rowid ASC
    )");
    if (!all)
        stmt.bind(1, category);

    std::vector<ModelForecastRow> rows;
    while (stmt.step()) {
        ModelForecastRow r;
        r.model_name = stmt.text(0);
        r.market_id = stmt.text(1);
        r.category = stmt.text(2);
        r.forecast_prob = stmt.real(3);
        r.actual_outcome = stmt.real(4);
        r.recorded_at = stmt.text(5);
        rows.push_back(std::move(r));
    }
    return rows;
}

std::vector<std::string> SqliteStore::forecast_categories() const {
    if (!require(tables::MODEL_FORECAST_LOG))
        return {};

    Statement stmt(db_, "SELECT DISTINCT COALESCE(category, '') AS c FROM model_forecast_log ORDER BY c");
    std::vector<std::string> out;
    while (stmt.step())
        out.push_back(stmt.text(0));
    return out;
}

std::vector<CalibrationRow> SqliteStore::calibration_history() const {
    if (!require(tables::CALIBRATION_HISTORY))
        return {};

    Statement stmt(db_, R"(
        SELECT forecast_prob, actual_outcome, recorded_at, market_id
        FROM calibration_history
        ORDER BY recorded_at ASC, rowid ASC
    )");
    std::vector<CalibrationRow> rows;
    while (stmt.step()) {
        CalibrationRow r;
        r.forecast_prob = stmt.real(0);
        r.actual_outcome = stmt.real(1);
        r.recorded_at = stmt.text(2);
        r.market_id = stmt.text(3);
        rows.push_back(std::move(r));
    }
    return rows;
}

std::optional<StateRow> SqliteStore::get_state(const std::string& key) const {
    if (!require(tables::ENGINE_STATE))
        return std::nullopt;

    Statement stmt(db_, "SELECT key, value, updated_at FROM engine_state WHERE key = ?");
    stmt.bind(1, key);
    if (!stmt.step())
        return std::nullopt;
    return StateRow{stmt.text(0), stmt.text(1), stmt.real(2)};
}

std::vector<CandidateRow> SqliteStore::recent_candidates(size_t limit) const {
    if (!require(tables::CANDIDATES))
        return {};

    Statement stmt(db_, R"(
        SELECT market_id, implied_prob, model_prob, edge, created_at
        FROM candidates
        ORDER BY created_at DESC, rowid DESC
        LIMIT ?
    )");
    stmt.bind(1, static_cast<int64_t>(limit));

    std::vector<CandidateRow> rows;
    while (stmt.step()) {
        CandidateRow r;
        r.market_id = stmt.text(0);
        r.implied_prob = stmt.real(1, 0.5);
        r.model_prob = stmt.real(2);
        r.edge = stmt.real(3);
        r.created_at = stmt.text(4);
        rows.push_back(std::move(r));
    }
    return rows;
}

} // namespace edgeloop::store
