#pragma once

/**
 * Statistical primitives shared by the performance tracker and the regime
 * detector. Everything here works on a full history passed in by value or
 * reference; nothing is incremental.
 */

#include "../config/defaults.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace edgeloop {
namespace analytics {

inline double mean(const std::vector<double>& values) {
    if (values.empty())
        return 0.0;
    double sum = 0.0;
    for (double v : values)
        sum += v;
    return sum / static_cast<double>(values.size());
}

/**
 * Sample standard deviation (n - 1). Zero below two observations.
 */
inline double sample_stddev(const std::vector<double>& values) {
    size_t n = values.size();
    if (n < 2)
        return 0.0;
    double m = mean(values);
    double ss = 0.0;
    for (double v : values)
        ss += (v - m) * (v - m);
    return std::sqrt(ss / static_cast<double>(n - 1));
}

/**
 * Annualised Sharpe = mean / sample_stddev * sqrt(days).
 * Zero below two samples or with zero variance.
 */
inline double sharpe_ratio(const std::vector<double>& pnls,
                           double annualization_days = config::performance::ANNUALIZATION_DAYS) {
    if (pnls.size() < 2)
        return 0.0;
    double sd = sample_stddev(pnls);
    if (sd <= 0.0)
        return 0.0;
    return mean(pnls) / sd * std::sqrt(annualization_days);
}

/**
 * Annualised Sortino. Downside deviation is the RMS of losing trades only,
 * divided by the loser count (not n - 1). Zero below two samples or
 * without losers.
 */
inline double sortino_ratio(const std::vector<double>& pnls,
                            double annualization_days = config::performance::ANNUALIZATION_DAYS) {
    if (pnls.size() < 2)
        return 0.0;
    double sq = 0.0;
    size_t losers = 0;
    for (double p : pnls) {
        if (p < 0) {
            sq += p * p;
            ++losers;
        }
    }
    if (losers == 0)
        return 0.0;
    double down = std::sqrt(sq / static_cast<double>(losers));
    if (down <= 0.0)
        return 0.0;
    return mean(pnls) / down * std::sqrt(annualization_days);
}

/**
 * StreakTracker - signed streak over trades fed oldest to newest
 *
 * current() > 0 is a win streak, < 0 a loss streak. A win after losses
 * restarts at +1, a loss after wins restarts at -1, and a zero-PnL trade
 * leaves everything untouched.
 *
 * Usage:
 *   StreakTracker streak;
 *   for (double pnl : chronological_pnls) streak.record(pnl);
 *   int s = streak.current();
 */
class StreakTracker {
public:
    StreakTracker() = default;

    void record(double pnl) {
        if (pnl > 0) {
            current_ = current_ >= 0 ? current_ + 1 : 1;
            best_ = std::max(best_, current_);
        } else if (pnl < 0) {
            current_ = current_ <= 0 ? current_ - 1 : -1;
            worst_ = std::min(worst_, current_);
        }
    }

    void reset() {
        current_ = 0;
        best_ = 0;
        worst_ = 0;
    }

    int current() const { return current_; }
    int best() const { return best_; }   // longest win streak (>= 0)
    int worst() const { return worst_; } // longest loss streak as a negative count (<= 0)

private:
    int current_ = 0;
    int best_ = 0;
    int worst_ = 0;
};

/**
 * DrawdownTracker - running peak of an equity series
 *
 * The peak starts at the initial bankroll, so an equity curve that only ever
 * loses still reports a drawdown.
 */
class DrawdownTracker {
public:
    explicit DrawdownTracker(double initial_equity) : peak_(initial_equity) {}

    /// Returns the drawdown at this point as a fraction of the peak
    double update(double equity) {
        peak_ = std::max(peak_, equity);
        double dd = peak_ > 0 ? (peak_ - equity) / peak_ : 0.0;
        max_drawdown_ = std::max(max_drawdown_, dd);
        return dd;
    }

    double peak() const { return peak_; }
    double max_drawdown() const { return max_drawdown_; }

private:
    double peak_;
    double max_drawdown_ = 0.0;
};

} // namespace analytics
} // namespace edgeloop
