#include "../../include/analytics/regime_detector.hpp"
#include "../../include/analytics/stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <functional>
#include <vector>

namespace edgeloop::analytics {

namespace LogCategory = logging::LogCategory;

RegimeDetector::RegimeDetector(const store::IStore& store, const config::RegimeConfig& config,
                               logging::AsyncLogger& logger)
    : store_(store), config_(config), logger_(logger) {}

RegimeState RegimeDetector::detect() const {
    RegimeState state = classify(gather_signals());

    EL_LOGF_INFO(logger_, LogCategory::Regime, "regime.detected regime=%s confidence=%.3f kelly=%.3f size=%.3f",
                 regime_to_string(state.regime), state.confidence, state.kelly_multiplier, state.size_multiplier);
    return state;
}

// =============================================================================
// Signals
// =============================================================================

RegimeSignals RegimeDetector::gather_signals() const {
    RegimeSignals s;

    auto trades = store_.performance_log(store::SortOrder::Descending,
                                         static_cast<size_t>(std::max(config_.lookback_trades, 1)));
    if (!trades.empty()) {
        std::vector<double> pnls;
        pnls.reserve(trades.size());
        int wins = 0;
        for (const auto& t : trades) {
            double pnl = finite_or(t.pnl);
            pnls.push_back(pnl);
            if (pnl > 0)
                ++wins;
        }
        s.recent_trade_count = static_cast<int>(pnls.size());
        s.recent_avg_pnl = mean(pnls);
        s.recent_win_rate = static_cast<double>(wins) / pnls.size();
        s.price_volatility = sample_stddev(pnls);

        // Newest first; the run ends at the first trade of the other sign
        int streak = 0;
        for (double pnl : pnls) {
            if (pnl > 0) {
                if (streak < 0)
                    break;
                ++streak;
            } else if (pnl < 0) {
                if (streak > 0)
                    break;
                --streak;
            }
        }
        s.current_streak = streak;
    }

    auto candidates = store_.recent_candidates(static_cast<size_t>(std::max(config_.candidate_lookback, 1)));
    if (!candidates.empty()) {
        std::vector<double> edges;
        std::vector<double> probs;
        std::vector<double> abs_edges;
        for (const auto& c : candidates) {
            double edge = finite_or(c.edge);
            edges.push_back(edge);
            abs_edges.push_back(std::abs(edge));
            probs.push_back(finite_or(c.implied_prob, 0.5));
        }
        s.markets_active = static_cast<int>(candidates.size());
        s.avg_price_momentum = mean(abs_edges);
        s.momentum_direction_bias = mean(edges);
        s.avg_spread = sample_stddev(probs);
    }

    return s;
}

// =============================================================================
// Classification
// =============================================================================

bool RegimeDetector::fires(RegimeTrigger trigger, const RegimeSignals& s) const {
    namespace rc = config::regime;
    switch (trigger) {
    case RegimeTrigger::HighPnlVolatility:
        return s.price_volatility > config_.vol_high_threshold;
    case RegimeTrigger::LongStreak:
        return std::abs(s.current_streak) >= rc::STREAK_TRIGGER;
    case RegimeTrigger::DirectionalBias:
        return std::abs(s.momentum_direction_bias) > config_.momentum_threshold;
    case RegimeTrigger::HighWinRate:
        return s.recent_win_rate > rc::HIGH_WIN_RATE;
    case RegimeTrigger::QuietOscillation:
        return s.price_volatility < config_.vol_low_threshold && s.avg_price_momentum > rc::OSCILLATION_MIN_MOMENTUM;
    case RegimeTrigger::BalancedWinRate:
        return s.recent_win_rate >= rc::BALANCED_WIN_RATE_LOW && s.recent_win_rate <= rc::BALANCED_WIN_RATE_HIGH;
    case RegimeTrigger::FewActiveMarkets:
        return s.markets_active < rc::MIN_ACTIVE_MARKETS;
    case RegimeTrigger::FewRecentTrades:
        return s.recent_trade_count < config_.min_trades_for_signal;
    }
    return false;
}

RegimeState RegimeDetector::classify(const RegimeSignals& signals) const {
    RegimeState state;
    state.signals = signals;

    if (signals.recent_trade_count < config_.min_trades_for_signal) {
        state.regime = Regime::Normal;
        state.confidence = config::regime::INSUFFICIENT_DATA_CONFIDENCE;
        state.explanation = "Insufficient data for regime detection, using defaults";
        apply_multipliers(state);
        EL_LOGF_INFO(logger_, LogCategory::Regime, "regime.insufficient_data trades=%d required=%d",
                     signals.recent_trade_count, config_.min_trades_for_signal);
        return state;
    }

    state.scores.fill(0.0);
    state.scores[regime_index(Regime::Normal)] = config::regime::NORMAL_BASE_SCORE;
    for (const auto& t : REGIME_TRIGGERS) {
        if (fires(t.trigger, signals))
            state.scores[regime_index(t.regime)] += t.weight;
    }

    // First maximum in declaration order wins ties
    size_t best = 0;
    for (size_t i = 1; i < REGIME_COUNT; ++i) {
        if (state.scores[i] > state.scores[best])
            best = i;
    }
    std::array<double, REGIME_COUNT> sorted = state.scores;
    std::sort(sorted.begin(), sorted.end(), std::greater<double>());
    double margin = sorted[0] - sorted[1];

    state.regime = static_cast<Regime>(best);
    state.confidence = std::min(1.0, sorted[0] + margin);
    state.explanation = explain(state.regime, signals);
    apply_multipliers(state);
    return state;
}

void RegimeDetector::apply_multipliers(RegimeState& state) {
    const MultiplierExtremes& m = MULTIPLIER_EXTREMES[regime_index(state.regime)];
    const double c = state.confidence;
    state.kelly_multiplier = 1.0 + m.kelly * c;
    state.edge_threshold_multiplier = 1.0 + m.edge_threshold * c;
    state.size_multiplier = 1.0 + m.size * c;
    state.entry_patience = 1.0 + m.patience * c;
}

std::string RegimeDetector::explain(Regime regime, const RegimeSignals& signals) {
    char buf[128];
    switch (regime) {
    case Regime::Trending:
        std::snprintf(buf, sizeof(buf), "Directional trend detected (bias: %+.3f), lean into momentum",
                      signals.momentum_direction_bias);
        return buf;
    case Regime::MeanReverting:
        return "Low volatility with price oscillation, contrarian entries favored";
    case Regime::HighVolatility:
        std::snprintf(buf, sizeof(buf), "High volatility detected (sigma=%.3f), reducing exposure",
                      signals.price_volatility);
        return buf;
    case Regime::LowActivity:
        return "Low market activity, fewer opportunities available";
    case Regime::Normal:
        break;
    }
    return "Markets operating normally, standard strategy applies";
}

} // namespace edgeloop::analytics
