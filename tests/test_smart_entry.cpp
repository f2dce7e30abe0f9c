/**
 * Tests for SmartEntryCalculator plans and price adjustment
 */

#include "../include/analytics/smart_entry.hpp"
#include "test_helpers.hpp"

#include <limits>

using namespace edgeloop;
using namespace edgeloop::analytics;
using edgeloop::testing::CapturingLogger;

namespace {

EntryRequest base_request(Side side = Side::BuyYes) {
    EntryRequest req;
    req.market_id = "m1";
    req.side = side;
    req.current_price = 0.50;
    req.fair_value = side == Side::BuyYes ? 0.55 : 0.45;
    req.edge = 0.05;
    req.spread = 0.02;
    return req;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TEST(adjust_price_directions_and_clamp) {
    ASSERT_NEAR(adjust_price(0.50, Side::BuyYes, -0.01), 0.49, 1e-12);
    ASSERT_NEAR(adjust_price(0.50, Side::BuyNo, -0.01), 0.51, 1e-12);
    ASSERT_NEAR(adjust_price(0.50, Side::BuyYes, 0.02), 0.52, 1e-12);
    ASSERT_NEAR(adjust_price(0.005, Side::BuyYes, -0.01), MIN_PRICE, 1e-12);
    ASSERT_NEAR(adjust_price(0.985, Side::BuyNo, -0.02), MAX_PRICE, 1e-12);
}

TEST(large_edge_takes_market) {
    CapturingLogger cap;
    SmartEntryCalculator calc({}, cap.logger);

    EntryRequest req = base_request();
    req.edge = 0.12;
    SmartEntryPlan plan = calc.calculate_entry(req);
    ASSERT_EQ_ENUM(plan.recommended_strategy, EntryStrategy::Market);
    ASSERT_EQ(plan.entry_levels.size(), 1u);
    ASSERT_NEAR(plan.recommended_price, 0.50, 1e-12);
    ASSERT_NEAR(plan.entry_levels[0].confidence, 0.9, 1e-12);
    ASSERT_EQ_ENUM(plan.entry_levels[0].urgency, Urgency::Immediate);
    ASSERT_EQ(plan.entry_levels[0].reason, std::string("Large edge (12.0%), take current price"));
    ASSERT_NEAR(plan.expected_improvement_bps, 0.0, 1e-12);
    ASSERT_EQ(plan.max_wait_minutes, 60);
    ASSERT_EQ(cap.count_containing("entry.market_order market=m1"), 1u);

    req.edge = -0.15;
    ASSERT_EQ_ENUM(calc.calculate_entry(req).recommended_strategy, EntryStrategy::Market);

    // The threshold itself is not a large edge
    req.edge = 0.10;
    ASSERT_EQ_ENUM(calc.calculate_entry(req).recommended_strategy, EntryStrategy::Limit);
}

TEST(near_resolution_takes_market) {
    CapturingLogger cap;
    SmartEntryCalculator calc({}, cap.logger);

    EntryRequest req = base_request();
    req.hours_to_resolution = 12.0;
    req.vwap = 0.40; // would otherwise argue for waiting
    SmartEntryPlan plan = calc.calculate_entry(req);
    ASSERT_EQ_ENUM(plan.recommended_strategy, EntryStrategy::Market);
    ASSERT_EQ(plan.entry_levels.size(), 1u);
    ASSERT_NEAR(plan.entry_levels[0].confidence, 0.8, 1e-12);
    ASSERT_TRUE(plan.vwap_signal.empty());
    ASSERT_EQ(cap.count_containing("entry.near_resolution"), 1u);
}

TEST(favourable_signals_enter_aggressively) {
    CapturingLogger cap;
    SmartEntryCalculator calc({}, cap.logger);

    EntryRequest req = base_request();
    req.vwap = 0.52;
    req.bid_depth = 2000.0;
    req.ask_depth = 1000.0;
    SmartEntryPlan plan = calc.calculate_entry(req);

    ASSERT_EQ_ENUM(plan.recommended_strategy, EntryStrategy::Limit);
    ASSERT_EQ(plan.entry_levels.size(), 2u);
    ASSERT_NEAR(plan.entry_levels[0].price, 0.494, 1e-12);
    ASSERT_NEAR(plan.entry_levels[1].price, 0.50, 1e-12);
    ASSERT_NEAR(plan.entry_levels[1].size_fraction, 0.5, 1e-12);
    ASSERT_NEAR(plan.recommended_price, 0.494, 1e-12);
    ASSERT_NEAR(plan.expected_improvement_bps, 60.0, 1e-6);
    ASSERT_EQ(plan.max_wait_minutes, 15);
    ASSERT_EQ(plan.vwap_signal, std::string("Price below VWAP (-3.8%), favorable"));
    ASSERT_EQ(plan.depth_signal, std::string("Strong bid support (2.0x ratio)"));
    ASSERT_TRUE(plan.momentum_signal.empty());
    ASSERT_EQ(cap.count_containing("entry.plan market=m1 strategy=limit"), 1u);
}

TEST(adverse_signals_wait_patiently) {
    CapturingLogger cap;
    SmartEntryCalculator calc({}, cap.logger);

    EntryRequest req = base_request();
    req.vwap = 0.48;
    req.price_momentum = -0.05;
    req.regime_patience = 1.5;
    SmartEntryPlan plan = calc.calculate_entry(req);

    ASSERT_EQ_ENUM(plan.recommended_strategy, EntryStrategy::Patient);
    ASSERT_EQ(plan.entry_levels.size(), 3u);
    // Target improvement min(0.03, spread + 0.005) = 0.025
    ASSERT_NEAR(plan.entry_levels[0].price, 0.475, 1e-12);
    ASSERT_EQ_ENUM(plan.entry_levels[0].urgency, Urgency::Patient);
    ASSERT_NEAR(plan.entry_levels[1].price, 0.4875, 1e-12);
    ASSERT_NEAR(plan.entry_levels[2].price, 0.50, 1e-12);

    // Mid level scores 0.7 * 0.4 = 0.28, ahead of 0.27 and 0.15
    ASSERT_NEAR(plan.recommended_price, 0.4875, 1e-12);
    ASSERT_NEAR(plan.expected_improvement_bps, 125.0, 1e-6);
    ASSERT_EQ(plan.max_wait_minutes, 90);
    ASSERT_TRUE(starts_with(plan.vwap_signal, "Price above VWAP"));
    ASSERT_EQ(plan.momentum_signal, std::string("Momentum against entry (-5.0%), wait"));
}

TEST(patient_target_capped_by_max_improvement) {
    CapturingLogger cap;
    SmartEntryCalculator calc({}, cap.logger);

    EntryRequest req = base_request();
    req.spread = 0.10;
    req.vwap = 0.48;
    req.flow_imbalance = -0.5;
    SmartEntryPlan plan = calc.calculate_entry(req);
    ASSERT_EQ_ENUM(plan.recommended_strategy, EntryStrategy::Patient);
    ASSERT_NEAR(plan.entry_levels[0].price, 0.47, 1e-12);
    ASSERT_TRUE(starts_with(plan.flow_signal, "Flow imbalance (-0.50) against entry"));
}

TEST(neutral_signals_single_limit) {
    CapturingLogger cap;
    SmartEntryCalculator calc({}, cap.logger);

    EntryRequest req = base_request();
    req.spread = 0.05;
    req.price_momentum = 0.005; // inside the deadband
    SmartEntryPlan plan = calc.calculate_entry(req);

    ASSERT_EQ_ENUM(plan.recommended_strategy, EntryStrategy::Limit);
    ASSERT_EQ(plan.entry_levels.size(), 1u);
    ASSERT_NEAR(plan.entry_levels[0].confidence, 0.75, 1e-12);
    ASSERT_NEAR(plan.recommended_price, 0.49, 1e-12);
    ASSERT_NEAR(plan.expected_improvement_bps, 100.0, 1e-6);
    ASSERT_EQ(plan.max_wait_minutes, 30);
    ASSERT_TRUE(plan.momentum_signal.empty());
}

TEST(buy_no_is_mirrored) {
    CapturingLogger cap;
    SmartEntryCalculator calc({}, cap.logger);

    EntryRequest req = base_request(Side::BuyNo);
    req.vwap = 0.48;
    req.bid_depth = 500.0;
    req.ask_depth = 1000.0;
    req.flow_imbalance = -0.3;
    SmartEntryPlan plan = calc.calculate_entry(req);

    ASSERT_EQ_ENUM(plan.side, Side::BuyNo);
    ASSERT_EQ(plan.entry_levels.size(), 2u);
    ASSERT_NEAR(plan.recommended_price, 0.506, 1e-12);
    ASSERT_NEAR(plan.expected_improvement_bps, 60.0, 1e-6);
    ASSERT_TRUE(starts_with(plan.vwap_signal, "Price above VWAP"));
    ASSERT_EQ(plan.depth_signal, std::string("Weak bid side (0.5x ratio) favors NO entry"));
    ASSERT_TRUE(starts_with(plan.flow_signal, "Flow imbalance (-0.30) with entry"));

    // Rising YES price works against a NO entry
    EntryRequest rising = base_request(Side::BuyNo);
    rising.price_momentum = 0.05;
    rising.vwap = 0.52;
    SmartEntryPlan waiting = calc.calculate_entry(rising);
    ASSERT_EQ_ENUM(waiting.recommended_strategy, EntryStrategy::Patient);
    ASSERT_NEAR(waiting.entry_levels[0].price, 0.525, 1e-12);
}

TEST(patience_factor_scales_wait) {
    CapturingLogger cap;
    config::EntryConfig cfg;
    cfg.patience_factor = 0.5;
    SmartEntryCalculator calc(cfg, cap.logger);

    EntryRequest req = base_request();
    req.vwap = 0.52;
    req.bid_depth = 2000.0;
    req.ask_depth = 1000.0;
    ASSERT_EQ(calc.calculate_entry(req).max_wait_minutes, 7);
}

TEST(non_finite_inputs_are_neutral) {
    CapturingLogger cap;
    SmartEntryCalculator calc({}, cap.logger);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    EntryRequest req;
    req.market_id = "bad";
    req.current_price = 0.4;
    req.fair_value = nan;
    req.edge = nan;
    req.vwap = nan;
    req.bid_depth = nan;
    req.ask_depth = nan;
    req.price_momentum = nan;
    req.flow_imbalance = nan;
    req.spread = nan;
    req.hours_to_resolution = nan;
    req.regime_patience = nan;

    SmartEntryPlan plan = calc.calculate_entry(req);
    ASSERT_EQ_ENUM(plan.recommended_strategy, EntryStrategy::Limit);
    ASSERT_EQ(plan.entry_levels.size(), 1u);
    ASSERT_NEAR(plan.recommended_price, 0.4, 1e-12);
    ASSERT_NEAR(plan.fair_value, 0.0, 1e-12);
    ASSERT_EQ(plan.max_wait_minutes, 30);
    ASSERT_TRUE(std::isfinite(plan.expected_improvement_bps));
}

int main() {
    std::cout << "=== Smart Entry Tests ===\n";

    RUN_TEST(adjust_price_directions_and_clamp);
    RUN_TEST(large_edge_takes_market);
    RUN_TEST(near_resolution_takes_market);
    RUN_TEST(favourable_signals_enter_aggressively);
    RUN_TEST(adverse_signals_wait_patiently);
    RUN_TEST(patient_target_capped_by_max_improvement);
    RUN_TEST(neutral_signals_single_limit);
    RUN_TEST(buy_no_is_mirrored);
    RUN_TEST(patience_factor_scales_wait);
    RUN_TEST(non_finite_inputs_are_neutral);

    std::cout << "\nAll smart entry tests passed!\n";
    return 0;
}
