#pragma once

#include "../logging/async_logger.hpp"
#include "records.hpp"

#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace edgeloop {
namespace store {

/**
 * Raised only for genuine store failures (I/O, corruption, constraint
 * violations). An absent table is never an error.
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SortOrder : uint8_t { Ascending, Descending };

/**
 * IStore - capability-checked access to the shared store
 *
 * Contract for partially migrated stores:
 *   - reads against an absent table return empty results
 *   - writes against an absent table return false and change nothing
 *
 * Timestamps are ISO-8601 strings; "ordered by" means lexicographic order of
 * that column with insertion order breaking ties.
 */
class IStore {
public:
    virtual ~IStore() = default;

    virtual bool has_table(const std::string& table) const = 0;

    // =========================================================================
    // Appends
    // =========================================================================

    virtual bool insert_performance(const PerformanceRow& row) = 0;
    virtual bool insert_model_forecast(const ModelForecastRow& row) = 0;
    virtual bool insert_calibration(const CalibrationRow& row) = 0;

    /// Insert or replace one engine_state entry
    virtual bool put_state(const std::string& key, const std::string& value, double updated_at) = 0;

    // =========================================================================
    // Reads
    // =========================================================================

    /// performance_log ordered by resolved_at; limit 0 = all rows
    virtual std::vector<PerformanceRow> performance_log(SortOrder order, size_t limit = 0) const = 0;

    /// model_forecast_log rows for one category, or every row for "ALL"
    virtual std::vector<ModelForecastRow> model_forecasts(const std::string& category) const = 0;

    /// Distinct categories present in model_forecast_log, sorted
    virtual std::vector<std::string> forecast_categories() const = 0;

    /// calibration_history ordered by recorded_at ascending
    virtual std::vector<CalibrationRow> calibration_history() const = 0;

    virtual std::optional<StateRow> get_state(const std::string& key) const = 0;

    /// Newest candidates first (by created_at)
    virtual std::vector<CandidateRow> recent_candidates(size_t limit) const = 0;
};

/**
 * Logs a missing table once per table for the lifetime of a store instance.
 */
class MissingTableReporter {
public:
    explicit MissingTableReporter(logging::AsyncLogger& logger) : logger_(logger) {}

    void report(const std::string& table) const {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!reported_.insert(table).second)
                return;
        }
        EL_LOGF_WARN(logger_, logging::LogCategory::Store, "store.missing_table table=%s", table.c_str());
    }

    size_t reported_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reported_.size();
    }

private:
    logging::AsyncLogger& logger_;
    mutable std::mutex mutex_;
    mutable std::set<std::string> reported_;
};

} // namespace store
} // namespace edgeloop
