#include "../../include/store/memory_store.hpp"
#include "../../include/types.hpp"

#include <algorithm>

namespace edgeloop::store {

namespace {

template <typename Row, typename KeyFn>
std::vector<Row> ordered(const std::vector<Row>& rows, KeyFn key, SortOrder order, size_t limit) {
    std::vector<Row> out = rows;
    std::stable_sort(out.begin(), out.end(), [&](const Row& a, const Row& b) { return key(a) < key(b); });
    if (order == SortOrder::Descending) {
        std::reverse(out.begin(), out.end());
    }
    if (limit > 0 && out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

PerformanceRow sanitized(PerformanceRow row) {
    row.forecast_prob = finite_or(row.forecast_prob);
    row.actual_outcome = finite_or(row.actual_outcome);
    row.edge_at_entry = finite_or(row.edge_at_entry);
    row.evidence_quality = finite_or(row.evidence_quality);
    row.stake_usd = finite_or(row.stake_usd);
    row.entry_price = finite_or(row.entry_price);
    row.exit_price = finite_or(row.exit_price);
    row.pnl = finite_or(row.pnl);
    row.holding_hours = finite_or(row.holding_hours);
    return row;
}

} // namespace

// =============================================================================
// Schema
// =============================================================================

MemoryStore::MemoryStore(Schema schema, logging::AsyncLogger& logger) : missing_(logger) {
    if (schema == Schema::Full) {
        tables_ = {tables::PERFORMANCE_LOG, tables::MODEL_FORECAST_LOG, tables::CALIBRATION_HISTORY,
                   tables::ENGINE_STATE, tables::CANDIDATES};
    }
}

void MemoryStore::create_table(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_.insert(table);
}

void MemoryStore::drop_table(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_.erase(table);
    if (table == tables::PERFORMANCE_LOG)
        performance_.clear();
    else if (table == tables::MODEL_FORECAST_LOG)
        model_forecasts_.clear();
    else if (table == tables::CALIBRATION_HISTORY)
        calibration_.clear();
    else if (table == tables::ENGINE_STATE)
        state_.clear();
    else if (table == tables::CANDIDATES)
        candidates_.clear();
}

bool MemoryStore::has_table(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tables_.count(table) > 0;
}

bool MemoryStore::present(const std::string& table) const {
    if (tables_.count(table) > 0)
        return true;
    missing_.report(table);
    return false;
}

size_t MemoryStore::row_count(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (table == tables::PERFORMANCE_LOG)
        return performance_.size();
    if (table == tables::MODEL_FORECAST_LOG)
        return model_forecasts_.size();
    if (table == tables::CALIBRATION_HISTORY)
        return calibration_.size();
    if (table == tables::ENGINE_STATE)
        return state_.size();
    if (table == tables::CANDIDATES)
        return candidates_.size();
    return 0;
}

// =============================================================================
// Appends
// =============================================================================

bool MemoryStore::insert_performance(const PerformanceRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::PERFORMANCE_LOG))
        return false;
    performance_.push_back(row);
    return true;
}

bool MemoryStore::insert_model_forecast(const ModelForecastRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::MODEL_FORECAST_LOG))
        return false;
    model_forecasts_.push_back(row);
    return true;
}

bool MemoryStore::insert_calibration(const CalibrationRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::CALIBRATION_HISTORY))
        return false;
    calibration_.push_back(row);
    return true;
}

bool MemoryStore::put_state(const std::string& key, const std::string& value, double updated_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::ENGINE_STATE))
        return false;
    state_[key] = StateRow{key, value, updated_at};
    return true;
}

bool MemoryStore::insert_candidate(const CandidateRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::CANDIDATES))
        return false;
    candidates_.push_back(row);
    return true;
}

// =============================================================================
// Reads
// =============================================================================

std::vector<PerformanceRow> MemoryStore::performance_log(SortOrder order, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::PERFORMANCE_LOG))
        return {};
    auto rows = ordered(performance_, [](const PerformanceRow& r) { return r.resolved_at; }, order, limit);
    for (auto& r : rows)
        r = sanitized(std::move(r));
    return rows;
}

std::vector<ModelForecastRow> MemoryStore::model_forecasts(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::MODEL_FORECAST_LOG))
        return {};

    std::vector<ModelForecastRow> out;
    for (const auto& r : model_forecasts_) {
        if (category == ALL_CATEGORIES || r.category == category) {
            ModelForecastRow row = r;
            row.forecast_prob = finite_or(row.forecast_prob);
            row.actual_outcome = finite_or(row.actual_outcome);
            out.push_back(std::move(row));
        }
    }
    return out;
}

std::vector<std::string> MemoryStore::forecast_categories() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::MODEL_FORECAST_LOG))
        return {};

    std::set<std::string> seen;
    for (const auto& r : model_forecasts_)
        seen.insert(r.category);
    return {seen.begin(), seen.end()};
}

std::vector<CalibrationRow> MemoryStore::calibration_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::CALIBRATION_HISTORY))
        return {};
    auto rows = ordered(calibration_, [](const CalibrationRow& r) { return r.recorded_at; }, SortOrder::Ascending, 0);
    for (auto& r : rows) {
        r.forecast_prob = finite_or(r.forecast_prob);
        r.actual_outcome = finite_or(r.actual_outcome);
    }
    return rows;
}

std::optional<StateRow> MemoryStore::get_state(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::ENGINE_STATE))
        return std::nullopt;
    auto it = state_.find(key);
    if (it == state_.end())
        return std::nullopt;
    return it->second;
}

std::vector<CandidateRow> MemoryStore::recent_candidates(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!present(tables::CANDIDATES))
        return {};
    auto rows = ordered(candidates_, [](const CandidateRow& r) { return r.created_at; }, SortOrder::Descending, limit);
    for (auto& r : rows) {
        r.implied_prob = finite_or(r.implied_prob, 0.5);
        r.model_prob = finite_or(r.model_prob);
        r.edge = finite_or(r.edge);
    }
    return rows;
}

} // namespace edgeloop::store
