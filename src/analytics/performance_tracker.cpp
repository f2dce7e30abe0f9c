#include "../../include/analytics/performance_tracker.hpp"
#include "../../include/analytics/stats.hpp"
#include "../../include/types.hpp"
#include "../../include/util/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

namespace edgeloop::analytics {

namespace LogCategory = logging::LogCategory;
namespace perf = config::performance;

PerformanceTracker::PerformanceTracker(const store::IStore& store, const config::TrackerConfig& config,
                                       logging::AsyncLogger& logger)
    : store_(store), config_(config), logger_(logger), clock_([] { return util::wall_clock_seconds(); }) {}

template <typename Fn>
void PerformanceTracker::isolated(const char* part, Fn&& fn) const {
    try {
        fn();
    } catch (const std::exception& e) {
        EL_LOGF_ERROR(logger_, LogCategory::Performance, "performance.compute_error part=%s error=%s", part,
                      e.what());
    }
}

PerformanceSnapshot PerformanceTracker::compute() const {
    PerformanceSnapshot snap;

    isolated("trade_metrics", [&] { compute_trade_metrics(snap); });
    isolated("calibration", [&] { compute_calibration(snap); });
    isolated("category_breakdown", [&] { compute_category_breakdown(snap); });
    isolated("equity_curve", [&] { compute_equity_curve(snap); });
    isolated("rolling_windows", [&] { compute_rolling_windows(snap); });
    isolated("model_accuracy", [&] { compute_model_accuracy(snap); });
    isolated("leaderboard", [&] { build_leaderboard(snap); });

    EL_LOGF_DEBUG(logger_, LogCategory::Performance,
                  "performance.snapshot trades=%d pnl=%.2f win_rate=%.3f categories=%zu", snap.total_trades,
                  snap.total_pnl, snap.win_rate, snap.category_stats.size());
    return snap;
}

// =============================================================================
// Trade metrics
// =============================================================================

void PerformanceTracker::compute_trade_metrics(PerformanceSnapshot& snap) const {
    auto rows = store_.performance_log(store::SortOrder::Ascending);
    if (rows.empty())
        return;

    std::vector<double> pnls;
    pnls.reserve(rows.size());
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    double total_hours = 0.0;
    double total_edge = 0.0;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    StreakTracker streak;

    for (const auto& r : rows) {
        double pnl = finite_or(r.pnl);
        pnls.push_back(pnl);
        snap.total_staked += finite_or(r.stake_usd);
        total_hours += finite_or(r.holding_hours);
        total_edge += finite_or(r.edge_at_entry);

        if (pnl > 0) {
            ++snap.wins;
            gross_profit += pnl;
            win_sum += pnl;
        } else if (pnl < 0) {
            ++snap.losses;
            gross_loss -= pnl;
            loss_sum += pnl;
        } else {
            ++snap.breakeven;
        }
        streak.record(pnl);
    }

    const int n = static_cast<int>(pnls.size());
    const double dn = static_cast<double>(n);

    snap.total_trades = n;
    snap.win_rate = snap.wins / dn;
    for (double p : pnls)
        snap.total_pnl += p;
    snap.roi_pct = snap.total_staked > 0 ? snap.total_pnl / snap.total_staked * 100.0 : 0.0;

    if (gross_loss > 0)
        snap.profit_factor = ProfitFactor::finite(gross_profit / gross_loss);
    else if (gross_profit > 0)
        snap.profit_factor = ProfitFactor::no_losses();

    snap.avg_win = snap.wins > 0 ? win_sum / snap.wins : 0.0;
    snap.avg_loss = snap.losses > 0 ? loss_sum / snap.losses : 0.0;
    snap.largest_win = *std::max_element(pnls.begin(), pnls.end());
    snap.largest_loss = *std::min_element(pnls.begin(), pnls.end());
    snap.avg_holding_hours = total_hours / dn;
    snap.avg_edge_captured = total_edge / dn;

    snap.current_streak = streak.current();
    snap.best_streak = streak.best();
    snap.worst_streak = streak.worst();

    snap.sharpe_ratio = sharpe_ratio(pnls, perf::ANNUALIZATION_DAYS);
    snap.sortino_ratio = sortino_ratio(pnls, perf::ANNUALIZATION_DAYS);
}

// =============================================================================
// Calibration
// =============================================================================

void PerformanceTracker::compute_calibration(PerformanceSnapshot& snap) const {
    auto rows = store_.calibration_history();
    if (rows.size() < perf::MIN_CALIBRATION_SAMPLES)
        return;

    double sum = 0.0;
    for (const auto& r : rows) {
        double err = finite_or(r.forecast_prob) - finite_or(r.actual_outcome);
        sum += err * err;
    }
    snap.calibration_samples = static_cast<int>(rows.size());
    snap.brier_score = sum / static_cast<double>(rows.size());
}

// =============================================================================
// Category breakdown
// =============================================================================

void PerformanceTracker::compute_category_breakdown(PerformanceSnapshot& snap) const {
    struct Accum {
        CategoryStats stats;
        double edge_sum = 0.0;
        double quality_sum = 0.0;
    };
    std::map<std::string, Accum> groups;

    for (const auto& r : store_.performance_log(store::SortOrder::Ascending)) {
        const std::string name = r.category.empty() ? UNKNOWN_CATEGORY : r.category;
        Accum& acc = groups[name];
        CategoryStats& cs = acc.stats;
        double pnl = finite_or(r.pnl);

        if (cs.total_trades == 0) {
            cs.category = name;
            cs.best_trade_pnl = pnl;
            cs.worst_trade_pnl = pnl;
        }
        ++cs.total_trades;
        if (pnl > 0)
            ++cs.wins;
        else if (pnl < 0)
            ++cs.losses;
        cs.total_pnl += pnl;
        cs.total_staked += finite_or(r.stake_usd);
        cs.best_trade_pnl = std::max(cs.best_trade_pnl, pnl);
        cs.worst_trade_pnl = std::min(cs.worst_trade_pnl, pnl);
        acc.edge_sum += finite_or(r.edge_at_entry);
        acc.quality_sum += finite_or(r.evidence_quality);
    }

    for (auto& [name, acc] : groups) {
        CategoryStats& cs = acc.stats;
        double n = static_cast<double>(cs.total_trades);
        cs.avg_edge = acc.edge_sum / n;
        cs.avg_evidence_quality = acc.quality_sum / n;
        cs.win_rate = cs.wins / n;
        cs.roi_pct = cs.total_staked > 0 ? cs.total_pnl / cs.total_staked * 100.0 : 0.0;
        snap.category_stats.push_back(cs);
    }

    std::stable_sort(snap.category_stats.begin(), snap.category_stats.end(),
                     [](const CategoryStats& a, const CategoryStats& b) { return a.total_pnl > b.total_pnl; });
}

// =============================================================================
// Equity curve
// =============================================================================

void PerformanceTracker::compute_equity_curve(PerformanceSnapshot& snap) const {
    std::map<std::string, std::pair<double, int>> daily; // date -> (pnl, trades)
    for (const auto& r : store_.performance_log(store::SortOrder::Ascending)) {
        auto& day = daily[util::calendar_date(r.resolved_at)];
        day.first += finite_or(r.pnl);
        ++day.second;
    }
    if (daily.empty())
        return;

    const double bankroll = config_.bankroll;
    DrawdownTracker drawdown(bankroll);
    double cumulative = 0.0;

    for (const auto& [date, day] : daily) {
        cumulative += day.first;
        double equity = bankroll + cumulative;

        EquityPoint point;
        point.date = date;
        point.equity = equity;
        point.pnl_cumulative = cumulative;
        point.drawdown_pct = drawdown.update(equity);
        point.trade_count = day.second;
        snap.equity_curve.push_back(point);
    }

    snap.max_drawdown_pct = drawdown.max_drawdown();
    if (snap.max_drawdown_pct > 0 && snap.total_pnl > 0) {
        snap.calmar_ratio = (snap.roi_pct / 100.0) / snap.max_drawdown_pct;
    }
}

// =============================================================================
// Rolling windows
// =============================================================================

void PerformanceTracker::compute_rolling_windows(PerformanceSnapshot& snap) const {
    auto rows = store_.performance_log(store::SortOrder::Ascending);
    const int64_t now = clock_();

    auto window = [&](int days, double& pnl, double& win_rate, int& trades) {
        const int64_t cutoff = now - static_cast<int64_t>(days) * 86400;
        int wins = 0;
        for (const auto& r : rows) {
            int64_t ts = 0;
            if (!util::parse_iso8601(r.resolved_at, ts) || ts < cutoff)
                continue;
            double p = finite_or(r.pnl);
            pnl += p;
            ++trades;
            if (p > 0)
                ++wins;
        }
        win_rate = trades > 0 ? static_cast<double>(wins) / trades : 0.0;
    };

    window(perf::SHORT_WINDOW_DAYS, snap.pnl_7d, snap.win_rate_7d, snap.trades_7d);
    window(perf::LONG_WINDOW_DAYS, snap.pnl_30d, snap.win_rate_30d, snap.trades_30d);
}

// =============================================================================
// Model accuracy
// =============================================================================

void PerformanceTracker::compute_model_accuracy(PerformanceSnapshot& snap) const {
    struct Accum {
        int n = 0;
        double abs_error = 0.0;
        double sq_error = 0.0;
        int correct = 0;
    };
    // Keyed by (model, category) so iteration is already in report order
    std::map<std::pair<std::string, std::string>, Accum> groups;

    for (const auto& r : store_.model_forecasts(ALL_CATEGORIES)) {
        std::string model = r.model_name.empty() ? "unknown" : r.model_name;
        std::string category = r.category.empty() ? UNKNOWN_CATEGORY : r.category;
        double p = finite_or(r.forecast_prob);
        double o = finite_or(r.actual_outcome);

        Accum& acc = groups[{model, category}];
        ++acc.n;
        acc.abs_error += std::abs(p - o);
        acc.sq_error += (p - o) * (p - o);
        if ((p > 0.5 && o >= 0.5) || (p < 0.5 && o < 0.5))
            ++acc.correct;
    }

    for (const auto& [key, acc] : groups) {
        ModelAccuracy m;
        m.model_name = key.first;
        m.category = key.second;
        m.total_forecasts = acc.n;
        m.avg_error = acc.abs_error / acc.n;
        m.brier_score = acc.sq_error / acc.n;
        m.directional_accuracy = static_cast<double>(acc.correct) / acc.n;
        snap.model_accuracy.push_back(m);
    }
}

// =============================================================================
// Leaderboard
// =============================================================================

void PerformanceTracker::build_leaderboard(PerformanceSnapshot& snap) const {
    for (const auto& cs : snap.category_stats) {
        if (cs.total_trades < 1)
            continue;

        LeaderboardEntry e;
        e.category = cs.category;
        e.roi_pct = cs.roi_pct;
        e.win_rate = cs.win_rate;
        e.total_pnl = cs.total_pnl;
        e.trades = cs.total_trades;
        e.avg_edge = cs.avg_edge;
        double activity = std::min(cs.total_trades / perf::LEADERBOARD_FULL_ACTIVITY_TRADES, 1.0);
        e.score = cs.roi_pct * perf::LEADERBOARD_ROI_WEIGHT +
                  cs.win_rate * 100.0 * perf::LEADERBOARD_WIN_RATE_WEIGHT +
                  activity * perf::LEADERBOARD_ACTIVITY_SCALE * perf::LEADERBOARD_ACTIVITY_WEIGHT;
        snap.leaderboard.push_back(e);
    }

    std::stable_sort(snap.leaderboard.begin(), snap.leaderboard.end(),
                     [](const LeaderboardEntry& a, const LeaderboardEntry& b) { return a.score > b.score; });
    for (size_t i = 0; i < snap.leaderboard.size(); ++i)
        snap.leaderboard[i].rank = static_cast<int>(i) + 1;
}

} // namespace edgeloop::analytics
