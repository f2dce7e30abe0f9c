#pragma once

/**
 * SqliteStore - IStore over a SQLite3 database file
 *
 * Every call checks sqlite_master before touching a table, so a partially
 * migrated database degrades to empty reads instead of "no such table"
 * errors. Any other SQLite failure is raised as StoreError.
 *
 * Usage:
 *   SqliteStore store("edgeloop.db");
 *   store.create_schema();            // fresh databases only
 *   auto rows = store.performance_log(SortOrder::Ascending);
 */

#include "istore.hpp"

#include <string>

struct sqlite3;

namespace edgeloop {
namespace store {

class SqliteStore : public IStore {
public:
    /// Opens (and creates if missing) the database; ":memory:" is allowed
    explicit SqliteStore(const std::string& path, logging::AsyncLogger& logger = logging::default_logger());
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    /// CREATE TABLE IF NOT EXISTS for all five tables
    void create_schema();

    bool insert_candidate(const CandidateRow& row);

    const std::string& path() const { return path_; }

    // IStore
    bool has_table(const std::string& table) const override;

    bool insert_performance(const PerformanceRow& row) override;
    bool insert_model_forecast(const ModelForecastRow& row) override;
    bool insert_calibration(const CalibrationRow& row) override;
    bool put_state(const std::string& key, const std::string& value, double updated_at) override;

    std::vector<PerformanceRow> performance_log(SortOrder order, size_t limit = 0) const override;
    std::vector<ModelForecastRow> model_forecasts(const std::string& category) const override;
    std::vector<std::string> forecast_categories() const override;
    std::vector<CalibrationRow> calibration_history() const override;
    std::optional<StateRow> get_state(const std::string& key) const override;
    std::vector<CandidateRow> recent_candidates(size_t limit) const override;

private:
    bool require(const char* table) const;
    void exec(const char* sql);

    std::string path_;
    sqlite3* db_ = nullptr;
    logging::AsyncLogger& logger_;
    MissingTableReporter missing_;
};

} // namespace store
} // namespace edgeloop
