#pragma once

/**
 * Row types for the store tables.
 *
 * Numeric fields that are NULL in the backing store arrive as 0.0; adapters
 * also replace non-finite values with 0.0 before handing rows out.
 */

#include <cstdint>
#include <map>
#include <string>

namespace edgeloop {
namespace store {

// Table names
namespace tables {
constexpr const char* PERFORMANCE_LOG = "performance_log";
constexpr const char* MODEL_FORECAST_LOG = "model_forecast_log";
constexpr const char* CALIBRATION_HISTORY = "calibration_history";
constexpr const char* ENGINE_STATE = "engine_state";
constexpr const char* CANDIDATES = "candidates";
} // namespace tables

/**
 * One resolved market with the forecast and trade that preceded it.
 */
struct ResolutionRecord {
    std::string market_id;
    std::string question;
    std::string category;
    double forecast_prob = 0.0;
    double actual_outcome = 0.0; // 1.0 = YES resolved, 0.0 = NO resolved
    double edge_at_entry = 0.0;
    std::string confidence;
    double evidence_quality = 0.0;
    double stake_usd = 0.0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double pnl = 0.0;
    double holding_hours = 0.0;
    std::map<std::string, double> model_forecasts; // model name -> forecast probability
    std::string resolved_at;                        // ISO-8601, empty = now
};

struct PerformanceRow {
    std::string market_id;
    std::string question;
    std::string category;
    double forecast_prob = 0.0;
    double actual_outcome = 0.0;
    double edge_at_entry = 0.0;
    std::string confidence;
    double evidence_quality = 0.0;
    double stake_usd = 0.0;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double pnl = 0.0;
    double holding_hours = 0.0;
    std::string resolved_at;
};

struct ModelForecastRow {
    std::string model_name;
    std::string market_id;
    std::string category;
    double forecast_prob = 0.0;
    double actual_outcome = 0.0;
    std::string recorded_at;
};

struct CalibrationRow {
    double forecast_prob = 0.0;
    double actual_outcome = 0.0;
    std::string recorded_at;
    std::string market_id;
};

struct CandidateRow {
    std::string market_id;
    double implied_prob = 0.5;
    double model_prob = 0.0;
    double edge = 0.0;
    std::string created_at;
};

struct StateRow {
    std::string key;
    std::string value; // JSON text
    double updated_at = 0.0;
};

/**
 * Build the performance_log row for a resolution
 */
inline PerformanceRow to_performance_row(const ResolutionRecord& r, const std::string& ts) {
    PerformanceRow row;
    row.market_id = r.market_id;
    row.question = r.question;
    row.category = r.category;
    row.forecast_prob = r.forecast_prob;
    row.actual_outcome = r.actual_outcome;
    row.edge_at_entry = r.edge_at_entry;
    row.confidence = r.confidence;
    row.evidence_quality = r.evidence_quality;
    row.stake_usd = r.stake_usd;
    row.entry_price = r.entry_price;
    row.exit_price = r.exit_price;
    row.pnl = r.pnl;
    row.holding_hours = r.holding_hours;
    row.resolved_at = ts;
    return row;
}

} // namespace store
} // namespace edgeloop
