#pragma once

/**
 * JSON views of analytics results for dashboards and the agent's API layer.
 *
 * Money is rounded to cents, rates and scores to 3-4 decimals, prices to 4.
 * Profit factor is a number, or the string "no_losses".
 *
 * Usage:
 *   nlohmann::json j = tracker.compute();   // via to_json overloads
 *   std::string body = j.dump();
 */

#include "adaptive_weights.hpp"
#include "performance_tracker.hpp"
#include "regime_detector.hpp"
#include "smart_entry.hpp"

#include <nlohmann/json.hpp>

namespace edgeloop {
namespace analytics {

/// Round half away from zero to `digits` decimals
double round_to(double value, int digits);

void to_json(nlohmann::json& j, const ProfitFactor& pf);
void to_json(nlohmann::json& j, const CategoryStats& cs);
void to_json(nlohmann::json& j, const ModelAccuracy& ma);
void to_json(nlohmann::json& j, const EquityPoint& ep);
void to_json(nlohmann::json& j, const LeaderboardEntry& le);
void to_json(nlohmann::json& j, const PerformanceSnapshot& snap);

void to_json(nlohmann::json& j, const ModelWeight& mw);
void to_json(nlohmann::json& j, const AdaptiveWeightResult& result);

void to_json(nlohmann::json& j, const RegimeSignals& signals);
void to_json(nlohmann::json& j, const RegimeState& state);

void to_json(nlohmann::json& j, const EntryLevel& level);
void to_json(nlohmann::json& j, const SmartEntryPlan& plan);

} // namespace analytics
} // namespace edgeloop
