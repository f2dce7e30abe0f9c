#pragma once

/**
 * PerformanceTracker - read-only trading analytics over the store
 *
 * compute() rebuilds a PerformanceSnapshot from scratch on every call:
 *   - trade metrics (win rate, ROI, profit factor, Sharpe/Sortino, streaks)
 *   - calibration Brier score
 *   - per-category breakdown
 *   - daily equity curve with drawdown and Calmar
 *   - 7 and 30 day rolling windows
 *   - per-model accuracy by category
 *   - category leaderboard
 *
 * Each part is computed independently. A part that throws is logged and
 * left at its zero value; the rest of the snapshot is still filled in.
 *
 * Usage:
 *   PerformanceTracker tracker(store, config.tracker);
 *   PerformanceSnapshot snap = tracker.compute();
 *   if (snap.profit_factor.is_no_losses()) { ... }
 */

#include "../config/engine_config.hpp"
#include "../logging/async_logger.hpp"
#include "../store/istore.hpp"
#include "../types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace edgeloop {
namespace analytics {

/**
 * Gross profit / gross loss. NoLosses stands for a history with profit and
 * no losing trade; an empty or all-breakeven history is Finite(0).
 */
class ProfitFactor {
public:
    enum class Kind : uint8_t { Finite, NoLosses };

    static ProfitFactor finite(double value) { return ProfitFactor(Kind::Finite, value); }
    static ProfitFactor no_losses() { return ProfitFactor(Kind::NoLosses, 0.0); }

    ProfitFactor() = default;

    Kind kind() const { return kind_; }
    bool is_no_losses() const { return kind_ == Kind::NoLosses; }
    double value() const { return value_; } // 0 for NoLosses

    bool operator==(const ProfitFactor& other) const = default;

private:
    ProfitFactor(Kind kind, double value) : kind_(kind), value_(value) {}

    Kind kind_ = Kind::Finite;
    double value_ = 0.0;
};

struct CategoryStats {
    std::string category;
    int total_trades = 0;
    int wins = 0;
    int losses = 0;
    double total_pnl = 0.0;
    double total_staked = 0.0;
    double avg_edge = 0.0;
    double avg_evidence_quality = 0.0;
    double win_rate = 0.0;
    double roi_pct = 0.0;
    double best_trade_pnl = 0.0;
    double worst_trade_pnl = 0.0;
};

struct ModelAccuracy {
    std::string model_name;
    std::string category;
    int total_forecasts = 0;
    double avg_error = 0.0; // mean absolute error vs outcome
    double brier_score = 0.0;
    double directional_accuracy = 0.0; // share of forecasts on the right side of 0.5
};

struct EquityPoint {
    std::string date; // YYYY-MM-DD
    double equity = 0.0;
    double pnl_cumulative = 0.0;
    double drawdown_pct = 0.0; // fraction of peak
    int trade_count = 0;
};

struct LeaderboardEntry {
    int rank = 0;
    std::string category;
    double roi_pct = 0.0;
    double win_rate = 0.0;
    double total_pnl = 0.0;
    int trades = 0;
    double avg_edge = 0.0;
    double score = 0.0;
};

struct PerformanceSnapshot {
    // Overall
    int total_trades = 0;
    int wins = 0;
    int losses = 0;
    int breakeven = 0;
    double win_rate = 0.0;
    double total_pnl = 0.0;
    double total_staked = 0.0;
    double roi_pct = 0.0;
    ProfitFactor profit_factor;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double largest_win = 0.0;
    double largest_loss = 0.0;
    double avg_holding_hours = 0.0;
    double avg_edge_captured = 0.0;

    // Risk-adjusted
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double max_drawdown_pct = 0.0;
    double calmar_ratio = 0.0;

    // Calibration
    double brier_score = 0.0;
    int calibration_samples = 0;

    // Streaks: positive = wins, negative = losses
    int current_streak = 0;
    int best_streak = 0;
    int worst_streak = 0;

    std::vector<CategoryStats> category_stats;
    std::vector<ModelAccuracy> model_accuracy;
    std::vector<EquityPoint> equity_curve;

    // Rolling windows
    double pnl_7d = 0.0;
    double pnl_30d = 0.0;
    double win_rate_7d = 0.0;
    double win_rate_30d = 0.0;
    int trades_7d = 0;
    int trades_30d = 0;

    std::vector<LeaderboardEntry> leaderboard;
};

class PerformanceTracker {
public:
    /// Returns "now" as Unix seconds
    using Clock = std::function<int64_t()>;

    explicit PerformanceTracker(const store::IStore& store, const config::TrackerConfig& config = {},
                                logging::AsyncLogger& logger = logging::default_logger());

    PerformanceSnapshot compute() const;

    /// Replace the wall clock used for the rolling windows
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    double bankroll() const { return config_.bankroll; }

private:
    void compute_trade_metrics(PerformanceSnapshot& snap) const;
    void compute_calibration(PerformanceSnapshot& snap) const;
    void compute_category_breakdown(PerformanceSnapshot& snap) const;
    void compute_equity_curve(PerformanceSnapshot& snap) const;
    void compute_rolling_windows(PerformanceSnapshot& snap) const;
    void compute_model_accuracy(PerformanceSnapshot& snap) const;
    void build_leaderboard(PerformanceSnapshot& snap) const;

    template <typename Fn>
    void isolated(const char* part, Fn&& fn) const;

    const store::IStore& store_;
    config::TrackerConfig config_;
    logging::AsyncLogger& logger_;
    Clock clock_;
};

} // namespace analytics
} // namespace edgeloop
