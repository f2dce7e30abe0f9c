#pragma once

/**
 * SmartEntryCalculator - tiered limit-order entry plans
 *
 * Large edges and markets close to resolution are entered at the current
 * price. Otherwise four microstructure signals (VWAP, book depth, momentum,
 * order flow) are scored from the side's point of view and summed:
 *
 *   sum >  0.3   aggressive limit inside the spread plus a market fallback
 *   sum < -0.2   patient tiers below the market plus a market fallback
 *   otherwise    one limit slightly inside the spread
 *
 * Prices are YES-token prices in [0.01, 0.99].
 *
 * Usage:
 *   SmartEntryCalculator calc(config.entry);
 *   EntryRequest req;
 *   req.market_id = "0xabc"; req.side = Side::BuyYes;
 *   req.current_price = 0.52; req.fair_value = 0.58; req.edge = 0.06;
 *   req.regime_patience = regime.entry_patience;
 *   SmartEntryPlan plan = calc.calculate_entry(req);
 */

#include "../config/engine_config.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"

#include <string>
#include <vector>

namespace edgeloop {
namespace analytics {

struct EntryLevel {
    double price = 0.0;
    double confidence = 0.0;
    std::string reason;
    Urgency urgency = Urgency::Normal;
    double size_fraction = 1.0;
};

struct EntryRequest {
    std::string market_id;
    Side side = Side::BuyYes;
    double current_price = 0.0;
    double fair_value = 0.0;
    double edge = 0.0;
    double bid_depth = 0.0; // USD
    double ask_depth = 0.0; // USD
    double vwap = 0.0;
    double price_momentum = 0.0;
    double flow_imbalance = 0.0; // -1 .. +1
    double spread = 0.0;
    double hours_to_resolution = config::entry::DEFAULT_HOURS_TO_RESOLUTION;
    double regime_patience = 1.0;
};

struct SmartEntryPlan {
    std::string market_id;
    Side side = Side::BuyYes;
    double current_price = 0.0;
    double fair_value = 0.0;

    std::vector<EntryLevel> entry_levels; // best price first

    double recommended_price = 0.0;
    EntryStrategy recommended_strategy = EntryStrategy::Limit;
    double expected_improvement_bps = 0.0;
    int max_wait_minutes = 60;

    std::string vwap_signal;
    std::string depth_signal;
    std::string momentum_signal;
    std::string flow_signal;
};

/**
 * Move a YES price by `adjustment` in the side's favour direction:
 * BUY_YES adds it, BUY_NO subtracts it. The result is clamped to
 * [MIN_PRICE, MAX_PRICE]. A negative adjustment is a price improvement.
 */
inline double adjust_price(double price, Side side, double adjustment) {
    return clamp_price(side == Side::BuyYes ? price + adjustment : price - adjustment);
}

class SmartEntryCalculator {
public:
    explicit SmartEntryCalculator(const config::EntryConfig& config = {},
                                  logging::AsyncLogger& logger = logging::default_logger());

    SmartEntryPlan calculate_entry(const EntryRequest& request) const;

private:
    struct SignalScores {
        double vwap = 0.0;
        double depth = 0.0;
        double momentum = 0.0;
        double flow = 0.0;

        double sum() const { return vwap + depth + momentum + flow; }
    };

    SignalScores score_signals(const EntryRequest& req, SmartEntryPlan& plan) const;

    config::EntryConfig config_;
    logging::AsyncLogger& logger_;
};

} // namespace analytics
} // namespace edgeloop
