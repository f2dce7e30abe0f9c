#pragma once

/**
 * MemoryStore - in-process IStore
 *
 * Holds every table in vectors behind one mutex. Tables can be dropped and
 * re-created to exercise the missing-schema paths.
 *
 * Usage:
 *   MemoryStore store;                       // all five tables present
 *   MemoryStore legacy(MemoryStore::Schema::Empty);
 *   legacy.create_table(tables::PERFORMANCE_LOG);
 */

#include "istore.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace edgeloop {
namespace store {

class MemoryStore : public IStore {
public:
    enum class Schema { Full, Empty };

    explicit MemoryStore(Schema schema = Schema::Full,
                         logging::AsyncLogger& logger = logging::default_logger());

    void create_table(const std::string& table);
    void drop_table(const std::string& table);

    /// Candidates are written by the ingestion side, not by the core
    bool insert_candidate(const CandidateRow& row);

    size_t row_count(const std::string& table) const;

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
    bool present(const std::string& table) const; // caller holds mutex_

    mutable std::mutex mutex_;
    std::set<std::string> tables_;
    MissingTableReporter missing_;

    std::vector<PerformanceRow> performance_;
    std::vector<ModelForecastRow> model_forecasts_;
    std::vector<CalibrationRow> calibration_;
    std::map<std::string, StateRow> state_;
    std::vector<CandidateRow> candidates_;
};

} // namespace store
} // namespace edgeloop
