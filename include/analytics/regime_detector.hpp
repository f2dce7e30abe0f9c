#pragma once

/**
 * RegimeDetector - market regime classification from recent history
 *
 * Signals come from the newest resolved trades (bot performance) and the
 * newest scanned candidates (market-wide edge and price dispersion). Each
 * trigger that fires adds its weight to one regime; the highest score wins.
 *
 * The chosen regime scales four strategy knobs:
 *   multiplier = 1 + extreme * confidence
 *
 * Usage:
 *   RegimeDetector detector(store, config.regime);
 *   RegimeState state = detector.detect();
 *   double kelly = base_kelly * state.kelly_multiplier;
 */

#include "../config/engine_config.hpp"
#include "../logging/async_logger.hpp"
#include "../store/istore.hpp"
#include "../types.hpp"

#include <array>
#include <string>

namespace edgeloop {
namespace analytics {

struct RegimeSignals {
    // Market-wide (candidates)
    double avg_price_momentum = 0.0;      // mean |edge|
    double momentum_direction_bias = 0.0; // mean signed edge
    double avg_spread = 0.0;              // stdev of implied probability
    int markets_active = 0;

    // Bot performance (performance_log)
    double price_volatility = 0.0; // stdev of recent PnL
    double recent_win_rate = 0.5;
    int current_streak = 0;
    double recent_avg_pnl = 0.0;
    int recent_trade_count = 0;
};

struct RegimeState {
    Regime regime = Regime::Normal;
    double confidence = 0.5;
    RegimeSignals signals;

    double kelly_multiplier = 1.0;
    double edge_threshold_multiplier = 1.0;
    double size_multiplier = 1.0;
    double entry_patience = 1.0; // >1 = more patient

    std::array<double, REGIME_COUNT> scores{};
    std::string explanation;
};

// =============================================================================
// Regime model tables
// =============================================================================

enum class RegimeTrigger : uint8_t {
    HighPnlVolatility,
    LongStreak,
    DirectionalBias,
    HighWinRate,
    QuietOscillation,
    BalancedWinRate,
    FewActiveMarkets,
    FewRecentTrades
};

struct TriggerWeight {
    RegimeTrigger trigger;
    Regime regime;
    double weight;
};

inline constexpr std::array<TriggerWeight, 8> REGIME_TRIGGERS = {{
    {RegimeTrigger::HighPnlVolatility, Regime::HighVolatility, 0.4},
    {RegimeTrigger::LongStreak, Regime::HighVolatility, 0.2},
    {RegimeTrigger::DirectionalBias, Regime::Trending, 0.4},
    {RegimeTrigger::HighWinRate, Regime::Trending, 0.2},
    {RegimeTrigger::QuietOscillation, Regime::MeanReverting, 0.3},
    {RegimeTrigger::BalancedWinRate, Regime::MeanReverting, 0.2},
    {RegimeTrigger::FewActiveMarkets, Regime::LowActivity, 0.3},
    {RegimeTrigger::FewRecentTrades, Regime::LowActivity, 0.2},
}};

/**
 * Largest adjustment of each knob at confidence 1, indexed by regime.
 */
struct MultiplierExtremes {
    double kelly;
    double edge_threshold;
    double size;
    double patience;
};

inline constexpr std::array<MultiplierExtremes, REGIME_COUNT> MULTIPLIER_EXTREMES = {{
    {0.0, 0.0, 0.0, 0.0},      // Normal
    {0.15, -0.10, 0.10, -0.20}, // Trending
    {0.0, 0.0, 0.0, 0.30},      // MeanReverting
    {-0.40, 0.50, -0.30, 0.50}, // HighVolatility
    {-0.20, 0.30, -0.20, 0.40}, // LowActivity
}};

// =============================================================================
// Detector
// =============================================================================

class RegimeDetector {
public:
    explicit RegimeDetector(const store::IStore& store, const config::RegimeConfig& config = {},
                            logging::AsyncLogger& logger = logging::default_logger());

    /// Gather signals, classify and derive multipliers
    RegimeState detect() const;

    RegimeSignals gather_signals() const;

    /// Classify precomputed signals; multipliers are filled in as well
    RegimeState classify(const RegimeSignals& signals) const;

    bool fires(RegimeTrigger trigger, const RegimeSignals& signals) const;

    static void apply_multipliers(RegimeState& state);
    static std::string explain(Regime regime, const RegimeSignals& signals);

private:
    const store::IStore& store_;
    config::RegimeConfig config_;
    logging::AsyncLogger& logger_;
};

} // namespace analytics
} // namespace edgeloop
