/**
 * Tests for RegimeDetector: signals, trigger scoring, multipliers
 */

#include "../include/analytics/regime_detector.hpp"
#include "../include/store/memory_store.hpp"
#include "test_helpers.hpp"

using namespace edgeloop;
using namespace edgeloop::analytics;
using namespace edgeloop::store;
using edgeloop::testing::CapturingLogger;
using edgeloop::testing::jan_2026;
using edgeloop::testing::trade;

namespace {

// Trades resolved one hour apart, in the order given (oldest first)
void add_trades(MemoryStore& store, std::initializer_list<double> pnls) {
    int hour = 0;
    for (double pnl : pnls)
        store.insert_performance(trade(pnl, "POLITICS", jan_2026(3, 3600 * hour++)));
}

void add_candidates(MemoryStore& store, int n, double edge, double implied) {
    for (int i = 0; i < n; ++i) {
        CandidateRow c;
        c.market_id = "c" + std::to_string(i);
        c.edge = edge;
        c.implied_prob = implied;
        c.created_at = jan_2026(4, i);
        store.insert_candidate(c);
    }
}

} // namespace

TEST(insufficient_data_defaults_to_normal) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    add_trades(store, {5.0, -5.0, 5.0, -5.0});
    RegimeDetector detector(store, {}, cap.logger);

    RegimeState state = detector.detect();
    ASSERT_EQ_ENUM(state.regime, Regime::Normal);
    ASSERT_NEAR(state.confidence, 0.3, 1e-12);
    ASSERT_EQ(state.explanation, std::string("Insufficient data for regime detection, using defaults"));
    ASSERT_NEAR(state.kelly_multiplier, 1.0, 1e-12);
    ASSERT_NEAR(state.entry_patience, 1.0, 1e-12);
    ASSERT_EQ(state.signals.recent_trade_count, 4);
    ASSERT_EQ(cap.count_containing("regime.insufficient_data trades=4 required=5"), 1u);
}

TEST(missing_tables_default_to_normal) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Empty, cap.logger);
    RegimeState state = RegimeDetector(store, {}, cap.logger).detect();
    ASSERT_EQ_ENUM(state.regime, Regime::Normal);
    ASSERT_NEAR(state.confidence, 0.3, 1e-12);
    ASSERT_NEAR(state.signals.recent_win_rate, 0.5, 1e-12);
}

TEST(signals_from_history) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    add_trades(store, {-1.0, -1.0, -1.0, 2.0, 2.0});
    CandidateRow a{"a", 0.4, 0.5, 0.10, jan_2026(4, 1)};
    CandidateRow b{"b", 0.6, 0.5, -0.04, jan_2026(4, 2)};
    store.insert_candidate(a);
    store.insert_candidate(b);

    RegimeSignals s = RegimeDetector(store, {}, cap.logger).gather_signals();
    ASSERT_EQ(s.recent_trade_count, 5);
    ASSERT_NEAR(s.recent_win_rate, 0.4, 1e-12);
    ASSERT_NEAR(s.recent_avg_pnl, 0.2, 1e-12);
    ASSERT_EQ(s.current_streak, 2);
    ASSERT_TRUE(s.price_volatility > 1.0);

    ASSERT_EQ(s.markets_active, 2);
    ASSERT_NEAR(s.avg_price_momentum, 0.07, 1e-12);
    ASSERT_NEAR(s.momentum_direction_bias, 0.03, 1e-12);
    ASSERT_NEAR(s.avg_spread, std::sqrt(0.02), 1e-12);
}

TEST(streak_skips_breakeven_and_stops_at_flip) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    add_trades(store, {3.0, 3.0, -1.0, 0.0, -1.0, 0.0});
    ASSERT_EQ(RegimeDetector(store, {}, cap.logger).gather_signals().current_streak, -2);
}

TEST(lookback_limits_trades) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    for (int i = 0; i < 30; ++i)
        store.insert_performance(trade(i < 10 ? -1.0 : 1.0, "POLITICS", jan_2026(1, i)));

    config::RegimeConfig cfg;
    RegimeSignals s = RegimeDetector(store, cfg, cap.logger).gather_signals();
    ASSERT_EQ(s.recent_trade_count, 20);
    ASSERT_NEAR(s.recent_win_rate, 1.0, 1e-12);
    ASSERT_EQ(s.current_streak, 20);

    cfg.lookback_trades = 25;
    s = RegimeDetector(store, cfg, cap.logger).gather_signals();
    ASSERT_NEAR(s.recent_win_rate, 0.8, 1e-12);
}

TEST(high_volatility) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    add_trades(store, {10.0, -10.0, 10.0, -10.0, 10.0, -10.0, 10.0, -10.0, 10.0, -10.0});
    RegimeState state = RegimeDetector(store, {}, cap.logger).detect();

    // NORMAL 0.3, MEAN_REVERTING 0.2 (balanced), HIGH_VOLATILITY 0.4, LOW_ACTIVITY 0.3 (no candidates)
    ASSERT_EQ_ENUM(state.regime, Regime::HighVolatility);
    ASSERT_NEAR(state.scores[regime_index(Regime::HighVolatility)], 0.4, 1e-12);
    ASSERT_NEAR(state.scores[regime_index(Regime::LowActivity)], 0.3, 1e-12);
    ASSERT_NEAR(state.confidence, 0.5, 1e-12);
    ASSERT_NEAR(state.kelly_multiplier, 0.8, 1e-12);
    ASSERT_NEAR(state.edge_threshold_multiplier, 1.25, 1e-12);
    ASSERT_NEAR(state.size_multiplier, 0.85, 1e-12);
    ASSERT_NEAR(state.entry_patience, 1.25, 1e-12);
    ASSERT_TRUE(state.explanation.find("High volatility detected (sigma=") == 0);
    ASSERT_EQ(cap.count_containing("regime.detected regime=HIGH_VOLATILITY"), 1u);
}

TEST(trending_from_directional_candidates) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    add_trades(store, {1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0});
    add_candidates(store, 10, 0.12, 0.4);
    RegimeState state = RegimeDetector(store, {}, cap.logger).detect();

    // TRENDING 0.6 (bias + win rate), MEAN_REVERTING 0.3 (quiet), NORMAL 0.3, HIGH_VOLATILITY 0.2 (streak)
    ASSERT_EQ_ENUM(state.regime, Regime::Trending);
    ASSERT_NEAR(state.scores[regime_index(Regime::Trending)], 0.6, 1e-12);
    ASSERT_NEAR(state.scores[regime_index(Regime::MeanReverting)], 0.3, 1e-12);
    ASSERT_NEAR(state.scores[regime_index(Regime::HighVolatility)], 0.2, 1e-12);
    ASSERT_NEAR(state.confidence, 0.9, 1e-12);
    ASSERT_NEAR(state.kelly_multiplier, 1.135, 1e-12);
    ASSERT_NEAR(state.entry_patience, 0.82, 1e-12);
    ASSERT_EQ(state.explanation, std::string("Directional trend detected (bias: +0.120), lean into momentum"));
}

TEST(tie_goes_to_earlier_regime) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    RegimeDetector detector(store, {}, cap.logger);

    RegimeSignals s;
    s.recent_trade_count = 10;
    s.price_volatility = 0.1;
    s.recent_win_rate = 0.7;
    s.markets_active = 3;

    // NORMAL 0.3 ties LOW_ACTIVITY 0.3; TRENDING 0.2
    RegimeState state = detector.classify(s);
    ASSERT_EQ_ENUM(state.regime, Regime::Normal);
    ASSERT_NEAR(state.confidence, 0.3, 1e-12);
    ASSERT_EQ(state.explanation, std::string("Markets operating normally, standard strategy applies"));
}

TEST(trigger_thresholds) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    RegimeDetector detector(store, {}, cap.logger);

    RegimeSignals s;
    s.recent_trade_count = 5;
    s.markets_active = 5;
    s.price_volatility = 0.15;
    s.current_streak = -3;
    s.momentum_direction_bias = -0.09;
    s.recent_win_rate = 0.6;

    ASSERT_FALSE(detector.fires(RegimeTrigger::HighPnlVolatility, s));
    ASSERT_TRUE(detector.fires(RegimeTrigger::LongStreak, s));
    ASSERT_TRUE(detector.fires(RegimeTrigger::DirectionalBias, s));
    ASSERT_FALSE(detector.fires(RegimeTrigger::HighWinRate, s));
    ASSERT_TRUE(detector.fires(RegimeTrigger::BalancedWinRate, s));
    ASSERT_FALSE(detector.fires(RegimeTrigger::FewActiveMarkets, s));
    ASSERT_FALSE(detector.fires(RegimeTrigger::FewRecentTrades, s));

    s.price_volatility = 0.01;
    s.avg_price_momentum = 0.03;
    ASSERT_TRUE(detector.fires(RegimeTrigger::QuietOscillation, s));
    s.avg_price_momentum = 0.02;
    ASSERT_FALSE(detector.fires(RegimeTrigger::QuietOscillation, s));
}

TEST(multipliers_scale_with_confidence) {
    RegimeState state;
    state.regime = Regime::LowActivity;
    state.confidence = 1.0;
    RegimeDetector::apply_multipliers(state);
    ASSERT_NEAR(state.kelly_multiplier, 0.8, 1e-12);
    ASSERT_NEAR(state.edge_threshold_multiplier, 1.3, 1e-12);
    ASSERT_NEAR(state.size_multiplier, 0.8, 1e-12);
    ASSERT_NEAR(state.entry_patience, 1.4, 1e-12);

    state.regime = Regime::MeanReverting;
    state.confidence = 0.5;
    RegimeDetector::apply_multipliers(state);
    ASSERT_NEAR(state.kelly_multiplier, 1.0, 1e-12);
    ASSERT_NEAR(state.entry_patience, 1.15, 1e-12);
}

int main() {
    std::cout << "=== Regime Detector Tests ===\n";

    RUN_TEST(insufficient_data_defaults_to_normal);
    RUN_TEST(missing_tables_default_to_normal);
    RUN_TEST(signals_from_history);
    RUN_TEST(streak_skips_breakeven_and_stops_at_flip);
    RUN_TEST(lookback_limits_trades);
    RUN_TEST(high_volatility);
    RUN_TEST(trending_from_directional_candidates);
    RUN_TEST(tie_goes_to_earlier_regime);
    RUN_TEST(trigger_thresholds);
    RUN_TEST(multipliers_scale_with_confidence);

    std::cout << "\nAll regime detector tests passed!\n";
    return 0;
}
