#include "../../include/analytics/smart_entry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace edgeloop::analytics {

namespace LogCategory = logging::LogCategory;
namespace ec = config::entry;

namespace {

// Signal thresholds
constexpr double DEPTH_STRONG_RATIO = 1.5;
constexpr double DEPTH_WEAK_RATIO = 0.7;
constexpr double MOMENTUM_DEADBAND = 0.01;
constexpr double MOMENTUM_TRIGGER = 0.02;
constexpr double FLOW_DEADBAND = 0.1;
constexpr double FLOW_TRIGGER = 0.2;

template <typename... Args>
std::string describe(const char* fmt, Args... args) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), fmt, args...);
    return buf;
}

EntryRequest sanitized(EntryRequest req) {
    req.current_price = finite_or(req.current_price);
    req.fair_value = finite_or(req.fair_value);
    req.edge = finite_or(req.edge);
    req.bid_depth = finite_or(req.bid_depth);
    req.ask_depth = finite_or(req.ask_depth);
    req.vwap = finite_or(req.vwap);
    req.price_momentum = finite_or(req.price_momentum);
    req.flow_imbalance = finite_or(req.flow_imbalance);
    req.spread = finite_or(req.spread);
    req.hours_to_resolution = finite_or(req.hours_to_resolution, ec::DEFAULT_HOURS_TO_RESOLUTION);
    req.regime_patience = finite_or(req.regime_patience, 1.0);
    return req;
}

} // namespace

SmartEntryCalculator::SmartEntryCalculator(const config::EntryConfig& config, logging::AsyncLogger& logger)
    : config_(config), logger_(logger) {}

// =============================================================================
// Signals
// =============================================================================

SmartEntryCalculator::SignalScores SmartEntryCalculator::score_signals(const EntryRequest& req,
                                                                        SmartEntryPlan& plan) const {
    SignalScores s;
    const bool yes = req.side == Side::BuyYes;
    const double price = req.current_price;

    // 1. VWAP
    if (req.vwap > 0) {
        double div_pct = (price - req.vwap) / req.vwap * 100.0;
        bool favourable = yes ? price < req.vwap : price > req.vwap;
        if (favourable) {
            s.vwap = 0.3;
            plan.vwap_signal = describe("Price %s VWAP (%+.1f%%), favorable", yes ? "below" : "above", div_pct);
        } else {
            s.vwap = -0.2;
            plan.vwap_signal = describe("Price %s VWAP (%+.1f%%), wait for %s", yes ? "above" : "below", div_pct,
                                      yes ? "dip" : "bounce");
        }
    }

    // 2. Book depth
    if (req.bid_depth > 0 && req.ask_depth > 0) {
        double ratio = req.bid_depth / req.ask_depth;
        if (yes) {
            if (ratio > DEPTH_STRONG_RATIO) {
                s.depth = 0.2;
                plan.depth_signal = describe("Strong bid support (%.1fx ratio)", ratio);
            } else if (ratio < DEPTH_WEAK_RATIO) {
                s.depth = -0.3;
                plan.depth_signal = describe("Weak bid support (%.1fx ratio), expect dip", ratio);
            }
        } else {
            if (ratio < DEPTH_WEAK_RATIO) {
                s.depth = 0.2;
                plan.depth_signal = describe("Weak bid side (%.1fx ratio) favors NO entry", ratio);
            } else if (ratio > DEPTH_STRONG_RATIO) {
                s.depth = -0.2;
                plan.depth_signal = describe("Strong bid side (%.1fx ratio), price may rise against NO", ratio);
            }
        }
    }

    // 3. Momentum, signed so that positive helps the side
    const double m = req.price_momentum;
    if (std::abs(m) > MOMENTUM_DEADBAND) {
        double toward = yes ? m : -m;
        if (toward < -MOMENTUM_TRIGGER) {
            s.momentum = -0.3;
            plan.momentum_signal = describe("Momentum against entry (%+.1f%%), wait", m * 100.0);
        } else if (toward > MOMENTUM_TRIGGER) {
            s.momentum = 0.2;
            plan.momentum_signal = describe("Momentum with entry (%+.1f%%), enter now", m * 100.0);
        }
    }

    // 4. Order flow, mirrored for NO
    const double f = req.flow_imbalance;
    if (std::abs(f) > FLOW_DEADBAND) {
        double toward = yes ? f : -f;
        if (toward > FLOW_TRIGGER) {
            s.flow = 0.1;
            plan.flow_signal = describe("Flow imbalance (%+.2f) with entry, smart money agrees", f);
        } else if (toward < -FLOW_TRIGGER) {
            s.flow = -0.2;
            plan.flow_signal = describe("Flow imbalance (%+.2f) against entry, wait", f);
        }
    }

    return s;
}

// =============================================================================
// Plan
// =============================================================================

SmartEntryPlan SmartEntryCalculator::calculate_entry(const EntryRequest& request) const {
    const EntryRequest req = sanitized(request);

    SmartEntryPlan plan;
    plan.market_id = req.market_id;
    plan.side = req.side;
    plan.current_price = req.current_price;
    plan.fair_value = req.fair_value;

    const double price = req.current_price;

    if (std::abs(req.edge) > config_.min_edge_for_market_order) {
        plan.recommended_price = price;
        plan.recommended_strategy = EntryStrategy::Market;
        plan.entry_levels.push_back(EntryLevel{
            price, 0.9, describe("Large edge (%.1f%%), take current price", req.edge * 100.0), Urgency::Immediate, 1.0});
        EL_LOGF_INFO(logger_, LogCategory::Entry, "entry.market_order market=%s edge=%.4f", req.market_id.c_str(),
                     req.edge);
        return plan;
    }

    if (req.hours_to_resolution < ec::NEAR_RESOLUTION_HOURS) {
        plan.recommended_price = price;
        plan.recommended_strategy = EntryStrategy::Market;
        plan.entry_levels.push_back(
            EntryLevel{price, 0.8, "Near resolution, take current price", Urgency::Immediate, 1.0});
        EL_LOGF_INFO(logger_, LogCategory::Entry, "entry.near_resolution market=%s hours=%.1f",
                     req.market_id.c_str(), req.hours_to_resolution);
        return plan;
    }

    const double patience = config_.patience_factor * req.regime_patience;
    const SignalScores scores = score_signals(req, plan);
    const double signal_sum = scores.sum();

    if (signal_sum > ec::ENTER_NOW_SIGNAL) {
        double improvement = req.spread * ec::AGGRESSIVE_SPREAD_CAPTURE;
        plan.recommended_strategy = EntryStrategy::Limit;
        plan.max_wait_minutes = static_cast<int>(ec::AGGRESSIVE_WAIT_MINUTES * patience);
        plan.entry_levels.push_back(EntryLevel{adjust_price(price, req.side, -improvement), 0.8,
                                               "Favorable signals, aggressive limit order", Urgency::Normal, 1.0});
        plan.entry_levels.push_back(
            EntryLevel{price, 0.9, "Fallback: take current price", Urgency::Immediate, 0.5});
    } else if (signal_sum < ec::WAIT_SIGNAL) {
        double target = std::min(config_.max_improvement_pct, req.spread + ec::PATIENT_SPREAD_BUFFER);
        plan.recommended_strategy = EntryStrategy::Patient;
        plan.max_wait_minutes = static_cast<int>(ec::PATIENT_WAIT_MINUTES * patience);
        plan.entry_levels.push_back(EntryLevel{adjust_price(price, req.side, -target), 0.5,
                                               "Patient level, best price target", Urgency::Patient, 0.3});
        plan.entry_levels.push_back(EntryLevel{adjust_price(price, req.side, -target * 0.5), 0.7,
                                               "Mid level, moderate improvement", Urgency::Normal, 0.4});
        plan.entry_levels.push_back(EntryLevel{price, 0.9, "Fallback: take current price if levels don't fill",
                                               Urgency::Immediate, 0.3});
    } else {
        double improvement = req.spread * ec::NEUTRAL_SPREAD_CAPTURE;
        plan.recommended_strategy = EntryStrategy::Limit;
        plan.max_wait_minutes = static_cast<int>(ec::NEUTRAL_WAIT_MINUTES * patience);
        plan.entry_levels.push_back(EntryLevel{adjust_price(price, req.side, -improvement), 0.75,
                                               "Neutral signals, standard limit order", Urgency::Normal, 1.0});
    }

    // Highest confidence * size; the first level wins ties
    const EntryLevel* best = &plan.entry_levels.front();
    for (const auto& level : plan.entry_levels) {
        if (level.confidence * level.size_fraction > best->confidence * best->size_fraction)
            best = &level;
    }
    plan.recommended_price = best->price;
    plan.expected_improvement_bps = std::abs(price - plan.recommended_price) * ec::BPS_PER_UNIT;

    EL_LOGF_INFO(logger_, LogCategory::Entry, "entry.plan market=%s strategy=%s improvement_bps=%.1f levels=%zu signal=%.3f",
                 req.market_id.c_str(), entry_strategy_to_string(plan.recommended_strategy),
                 plan.expected_improvement_bps, plan.entry_levels.size(), signal_sum);
    return plan;
}

} // namespace edgeloop::analytics
