#include "../../include/analytics/json_export.hpp"

#include <cmath>

namespace edgeloop::analytics {

using json = nlohmann::json;

double round_to(double value, int digits) {
    if (!std::isfinite(value))
        return 0.0;
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

// =============================================================================
// Performance
// =============================================================================

void to_json(json& j, const ProfitFactor& pf) {
    if (pf.is_no_losses())
        j = "no_losses";
    else
        j = round_to(pf.value(), 2);
}

void to_json(json& j, const CategoryStats& cs) {
    j = json{
        {"category", cs.category},
        {"total_trades", cs.total_trades},
        {"wins", cs.wins},
        {"losses", cs.losses},
        {"total_pnl", round_to(cs.total_pnl, 2)},
        {"total_staked", round_to(cs.total_staked, 2)},
        {"avg_edge", round_to(cs.avg_edge, 4)},
        {"avg_evidence_quality", round_to(cs.avg_evidence_quality, 3)},
        {"win_rate", round_to(cs.win_rate, 4)},
        {"roi_pct", round_to(cs.roi_pct, 2)},
        {"best_trade_pnl", round_to(cs.best_trade_pnl, 2)},
        {"worst_trade_pnl", round_to(cs.worst_trade_pnl, 2)},
    };
}

void to_json(json& j, const ModelAccuracy& ma) {
    j = json{
        {"model_name", ma.model_name},
        {"category", ma.category},
        {"total_forecasts", ma.total_forecasts},
        {"avg_error", round_to(ma.avg_error, 4)},
        {"brier_score", round_to(ma.brier_score, 4)},
        {"directional_accuracy", round_to(ma.directional_accuracy, 4)},
    };
}

void to_json(json& j, const EquityPoint& ep) {
    j = json{
        {"timestamp", ep.date},
        {"equity", round_to(ep.equity, 2)},
        {"pnl_cumulative", round_to(ep.pnl_cumulative, 2)},
        {"drawdown_pct", round_to(ep.drawdown_pct, 4)},
        {"trade_count", ep.trade_count},
    };
}

void to_json(json& j, const LeaderboardEntry& le) {
    j = json{
        {"rank", le.rank},
        {"category", le.category},
        {"roi_pct", round_to(le.roi_pct, 2)},
        {"win_rate", round_to(le.win_rate, 4)},
        {"total_pnl", round_to(le.total_pnl, 2)},
        {"trades", le.trades},
        {"avg_edge", round_to(le.avg_edge, 4)},
        {"score", round_to(le.score, 3)},
    };
}

void to_json(json& j, const PerformanceSnapshot& s) {
    j = json{
        {"total_trades", s.total_trades},
        {"wins", s.wins},
        {"losses", s.losses},
        {"breakeven", s.breakeven},
        {"win_rate", round_to(s.win_rate, 4)},
        {"total_pnl", round_to(s.total_pnl, 2)},
        {"total_staked", round_to(s.total_staked, 2)},
        {"roi_pct", round_to(s.roi_pct, 2)},
        {"profit_factor", s.profit_factor},
        {"avg_win", round_to(s.avg_win, 2)},
        {"avg_loss", round_to(s.avg_loss, 2)},
        {"largest_win", round_to(s.largest_win, 2)},
        {"largest_loss", round_to(s.largest_loss, 2)},
        {"avg_holding_hours", round_to(s.avg_holding_hours, 1)},
        {"avg_edge_captured", round_to(s.avg_edge_captured, 4)},
        {"sharpe_ratio", round_to(s.sharpe_ratio, 3)},
        {"sortino_ratio", round_to(s.sortino_ratio, 3)},
        {"max_drawdown_pct", round_to(s.max_drawdown_pct, 4)},
        {"calmar_ratio", round_to(s.calmar_ratio, 3)},
        {"brier_score", round_to(s.brier_score, 4)},
        {"calibration_samples", s.calibration_samples},
        {"current_streak", s.current_streak},
        {"best_streak", s.best_streak},
        {"worst_streak", s.worst_streak},
        {"pnl_7d", round_to(s.pnl_7d, 2)},
        {"pnl_30d", round_to(s.pnl_30d, 2)},
        {"win_rate_7d", round_to(s.win_rate_7d, 4)},
        {"win_rate_30d", round_to(s.win_rate_30d, 4)},
        {"trades_7d", s.trades_7d},
        {"trades_30d", s.trades_30d},
        {"category_stats", s.category_stats},
        {"model_accuracy", s.model_accuracy},
        {"equity_curve", s.equity_curve},
        {"leaderboard", s.leaderboard},
    };
}

// =============================================================================
// Weights
// =============================================================================

void to_json(json& j, const ModelWeight& mw) {
    j = json{
        {"model_name", mw.model_name},
        {"weight", round_to(mw.weight, 4)},
        {"source", weight_source_to_string(mw.source)},
        {"brier_score", round_to(mw.brier_score, 4)},
        {"sample_count", mw.sample_count},
        {"confidence", round_to(mw.confidence, 3)},
    };
}

void to_json(json& j, const AdaptiveWeightResult& result) {
    json weights = json::object();
    for (const auto& [model, w] : result.weights)
        weights[model] = round_to(w, 4);

    j = json{
        {"category", result.category},
        {"weights", weights},
        {"details", result.details},
        {"data_available", result.data_available},
        {"blend_factor", round_to(result.blend_factor, 3)},
    };
}

// =============================================================================
// Regime
// =============================================================================

void to_json(json& j, const RegimeSignals& s) {
    j = json{
        {"avg_price_momentum", round_to(s.avg_price_momentum, 4)},
        {"momentum_direction_bias", round_to(s.momentum_direction_bias, 4)},
        {"price_volatility", round_to(s.price_volatility, 4)},
        {"recent_win_rate", round_to(s.recent_win_rate, 4)},
        {"current_streak", s.current_streak},
        {"recent_avg_pnl", round_to(s.recent_avg_pnl, 4)},
        {"recent_trade_count", s.recent_trade_count},
        {"avg_spread", round_to(s.avg_spread, 4)},
        {"markets_active", s.markets_active},
    };
}

void to_json(json& j, const RegimeState& state) {
    j = json{
        {"regime", regime_to_string(state.regime)},
        {"confidence", round_to(state.confidence, 3)},
        {"signals", state.signals},
        {"kelly_multiplier", round_to(state.kelly_multiplier, 3)},
        {"edge_threshold_multiplier", round_to(state.edge_threshold_multiplier, 3)},
        {"size_multiplier", round_to(state.size_multiplier, 3)},
        {"entry_patience", round_to(state.entry_patience, 3)},
        {"explanation", state.explanation},
    };
}

// =============================================================================
// Entry
// =============================================================================

void to_json(json& j, const EntryLevel& level) {
    j = json{
        {"price", round_to(level.price, 4)},
        {"confidence", round_to(level.confidence, 3)},
        {"reason", level.reason},
        {"urgency", urgency_to_string(level.urgency)},
        {"size_fraction", round_to(level.size_fraction, 3)},
    };
}

void to_json(json& j, const SmartEntryPlan& plan) {
    j = json{
        {"market_id", plan.market_id},
        {"side", side_to_string(plan.side)},
        {"current_price", round_to(plan.current_price, 4)},
        {"fair_value", round_to(plan.fair_value, 4)},
        {"entry_levels", plan.entry_levels},
        {"recommended_price", round_to(plan.recommended_price, 4)},
        {"recommended_strategy", entry_strategy_to_string(plan.recommended_strategy)},
        {"expected_improvement_bps", round_to(plan.expected_improvement_bps, 1)},
        {"max_wait_minutes", plan.max_wait_minutes},
        {"vwap_signal", plan.vwap_signal},
        {"depth_signal", plan.depth_signal},
        {"momentum_signal", plan.momentum_signal},
        {"flow_signal", plan.flow_signal},
    };
}

} // namespace edgeloop::analytics
