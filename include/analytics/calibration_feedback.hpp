#pragma once

/**
 * CalibrationFeedbackLoop - persists resolutions and keeps the calibrator fresh
 *
 * Every resolution is written to calibration_history, model_forecast_log (one
 * row per ensemble member) and performance_log. After retrain_interval
 * resolutions the calibrator is refitted from the full calibration history
 * and, on success, checkpointed to engine_state.
 *
 * Usage:
 *   store::SqliteStore store("edgeloop.db");
 *   CalibrationFeedbackLoop loop(store, config.feedback);
 *   loop.restore_calibrator();              // pick up the last fit
 *   loop.record_resolution(record);
 *   double p = loop.calibrator().calibrate(raw_prob);
 */

#include "../config/engine_config.hpp"
#include "../logging/async_logger.hpp"
#include "../store/istore.hpp"
#include "../types.hpp"
#include "calibrator.hpp"
#include "checkpoint.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace edgeloop {
namespace analytics {

class CalibrationFeedbackLoop {
public:
    CalibrationFeedbackLoop(store::IStore& store, const config::FeedbackConfig& config = {},
                            std::unique_ptr<ICalibrator> calibrator = nullptr,
                            logging::AsyncLogger& logger = logging::default_logger());

    /**
     * Append one resolution to every table that exists and advance the
     * retrain schedule. The counter resets after every retrain attempt,
     * successful or not.
     */
    void record_resolution(const store::ResolutionRecord& record);

    /**
     * Refit from calibration_history. False (and no mutation) when the table
     * is absent, holds fewer than min_retrain_samples pairs, or the fit fails.
     */
    bool retrain_calibrator();

    /// Normalised inverse-Brier weights over models with enough samples
    std::map<std::string, double> get_model_weights(const std::string& category = ALL_CATEGORIES) const;

    /// Last stored checkpoint of a known version
    std::optional<CalibratorCheckpoint> load_checkpoint() const;

    /// Apply the stored checkpoint; false when there is none
    bool restore_calibrator();

    const ICalibrator& calibrator() const { return *calibrator_; }
    int resolutions_since_retrain() const { return counter_; }

private:
    void load_counter();
    void store_counter();

    store::IStore& store_;
    config::FeedbackConfig config_;
    std::unique_ptr<ICalibrator> calibrator_;
    logging::AsyncLogger& logger_;
    int counter_ = 0;
};

} // namespace analytics
} // namespace edgeloop
