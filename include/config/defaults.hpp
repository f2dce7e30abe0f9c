#pragma once

#include <cstddef>

/**
 * Centralized configuration defaults for the decision layer.
 *
 * All default values are defined here to avoid duplication across the
 * config structs, the components and the tests.
 *
 * Naming:
 * - _PCT suffix: percentage as decimal (0.03 = 3%)
 * - _BPS suffix: basis points (100 bps = 1%)
 * - MIN_ / MAX_ prefix: inclusive bound
 */

namespace edgeloop::config {

// =============================================================================
// Calibration feedback
// =============================================================================
namespace calibration {
// Retrain the calibrator every N recorded resolutions
constexpr int RETRAIN_INTERVAL = 10;

// Minimum (forecast, outcome) pairs for a retrain attempt
constexpr size_t MIN_RETRAIN_SAMPLES = 30;

// Brier floor for inverse-Brier weighting (avoids division by zero)
constexpr double MIN_BRIER = 0.001;

// engine_state keys
constexpr const char* CHECKPOINT_KEY = "calibrator_state";
constexpr const char* COUNTER_KEY = "calibration_retrain_counter";

// Checkpoint schema version written by this build
constexpr int CHECKPOINT_VERSION = 1;

// Logistic fit (Newton-Raphson with L2 penalty, inverse strength C = 1)
constexpr double L2_PENALTY = 1.0;
constexpr int MAX_FIT_ITERATIONS = 100;
constexpr double FIT_TOLERANCE = 1e-8;
} // namespace calibration

// =============================================================================
// Adaptive model weights
// =============================================================================
namespace weights {
// Minimum forecasts per model before its accuracy counts
constexpr size_t MIN_SAMPLES_PER_MODEL = 5;

// Blend factor saturates at 1.0 (fully learned) at this sample count
constexpr double BLEND_FULL_CONFIDENCE_SAMPLES = 50.0;

// Blend at or above this is reported as "learned" rather than "blended"
constexpr double LEARNED_BLEND_THRESHOLD = 0.95;
} // namespace weights

// =============================================================================
// Performance tracking
// =============================================================================
namespace performance {
constexpr double DEFAULT_BANKROLL = 5000.0;

// Trading days per year for Sharpe/Sortino annualisation
constexpr double ANNUALIZATION_DAYS = 252.0;

// Minimum calibration pairs before a Brier score is reported
constexpr size_t MIN_CALIBRATION_SAMPLES = 5;

// Rolling windows
constexpr int SHORT_WINDOW_DAYS = 7;
constexpr int LONG_WINDOW_DAYS = 30;

// Leaderboard score = roi * W_ROI + win_rate * 100 * W_WIN + activity * 30 * W_ACTIVITY
constexpr double LEADERBOARD_ROI_WEIGHT = 0.4;
constexpr double LEADERBOARD_WIN_RATE_WEIGHT = 0.3;
constexpr double LEADERBOARD_ACTIVITY_WEIGHT = 0.3;
constexpr double LEADERBOARD_ACTIVITY_SCALE = 30.0;
constexpr double LEADERBOARD_FULL_ACTIVITY_TRADES = 10.0;
} // namespace performance

// =============================================================================
// Regime detection
// =============================================================================
namespace regime {
constexpr int LOOKBACK_TRADES = 20;
constexpr int CANDIDATE_LOOKBACK = 50;
constexpr int MIN_TRADES_FOR_SIGNAL = 5;

// PnL standard deviation thresholds
constexpr double VOL_HIGH_THRESHOLD = 0.15;
constexpr double VOL_LOW_THRESHOLD = 0.03;

// Average signed edge beyond which the market is considered directional
constexpr double MOMENTUM_THRESHOLD = 0.08;

// Quiet-oscillation trigger: average |edge| must exceed this
constexpr double OSCILLATION_MIN_MOMENTUM = 0.02;

constexpr int STREAK_TRIGGER = 3;
constexpr double HIGH_WIN_RATE = 0.65;
constexpr double BALANCED_WIN_RATE_LOW = 0.4;
constexpr double BALANCED_WIN_RATE_HIGH = 0.6;
constexpr int MIN_ACTIVE_MARKETS = 5;

// NORMAL starts with this score so weak evidence does not flip the regime
constexpr double NORMAL_BASE_SCORE = 0.3;
constexpr double INSUFFICIENT_DATA_CONFIDENCE = 0.3;
} // namespace regime

// =============================================================================
// Smart entry
// =============================================================================
namespace entry {
constexpr double MAX_IMPROVEMENT_PCT = 0.03;
constexpr double MIN_EDGE_FOR_MARKET_ORDER = 0.10;
constexpr double PATIENCE_FACTOR = 1.0;

constexpr double DEFAULT_HOURS_TO_RESOLUTION = 720.0;
constexpr double NEAR_RESOLUTION_HOURS = 24.0;

// Aggregate signal thresholds
constexpr double ENTER_NOW_SIGNAL = 0.3;
constexpr double WAIT_SIGNAL = -0.2;

// Share of the spread to capture per plan type
constexpr double AGGRESSIVE_SPREAD_CAPTURE = 0.3;
constexpr double NEUTRAL_SPREAD_CAPTURE = 0.2;
constexpr double PATIENT_SPREAD_BUFFER = 0.005;

// Wait budgets before patience scaling
constexpr int AGGRESSIVE_WAIT_MINUTES = 15;
constexpr int NEUTRAL_WAIT_MINUTES = 30;
constexpr int PATIENT_WAIT_MINUTES = 60;

constexpr double BPS_PER_UNIT = 10000.0;
} // namespace entry

} // namespace edgeloop::config
