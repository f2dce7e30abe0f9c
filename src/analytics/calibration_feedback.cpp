#include "../../include/analytics/calibration_feedback.hpp"
#include "../../include/analytics/model_scores.hpp"
#include "../../include/util/time_utils.hpp"

#include <nlohmann/json.hpp>

namespace edgeloop::analytics {

namespace LogCategory = logging::LogCategory;

CalibrationFeedbackLoop::CalibrationFeedbackLoop(store::IStore& store, const config::FeedbackConfig& config,
                                                 std::unique_ptr<ICalibrator> calibrator,
                                                 logging::AsyncLogger& logger)
    : store_(store), config_(config), calibrator_(std::move(calibrator)), logger_(logger) {
    if (!calibrator_) {
        calibrator_ = std::make_unique<PlattCalibrator>(config_.min_retrain_samples);
    }
    if (config_.persist_counter) {
        load_counter();
    }
}

// =============================================================================
// Recording
// =============================================================================

void CalibrationFeedbackLoop::record_resolution(const store::ResolutionRecord& record) {
    const std::string ts = record.resolved_at.empty() ? util::utc_now_iso8601() : record.resolved_at;

    store::CalibrationRow pair;
    pair.forecast_prob = record.forecast_prob;
    pair.actual_outcome = record.actual_outcome;
    pair.recorded_at = ts;
    pair.market_id = record.market_id;
    bool calibration_ok = store_.insert_calibration(pair);

    size_t model_rows = 0;
    for (const auto& [model, prob] : record.model_forecasts) {
        store::ModelForecastRow row;
        row.model_name = model;
        row.market_id = record.market_id;
        row.category = record.category;
        row.forecast_prob = prob;
        row.actual_outcome = record.actual_outcome;
        row.recorded_at = ts;
        if (store_.insert_model_forecast(row))
            ++model_rows;
    }

    bool performance_ok = store_.insert_performance(store::to_performance_row(record, ts));

    EL_LOGF_INFO(logger_, LogCategory::Calibration,
                 "calibration.resolution_recorded market=%s outcome=%.0f pnl=%.2f calibration=%d models=%zu perf=%d",
                 record.market_id.c_str(), record.actual_outcome, record.pnl, calibration_ok ? 1 : 0, model_rows,
                 performance_ok ? 1 : 0);

    // Another instance on the same store may have advanced the schedule
    if (config_.persist_counter) {
        load_counter();
    }
    ++counter_;
    if (counter_ >= config_.retrain_interval) {
        retrain_calibrator();
        counter_ = 0;
    }
    if (config_.persist_counter) {
        store_counter();
    }
}

// =============================================================================
// Retraining
// =============================================================================

bool CalibrationFeedbackLoop::retrain_calibrator() {
    auto history = store_.calibration_history();
    if (history.size() < config_.min_retrain_samples) {
        EL_LOGF_INFO(logger_, LogCategory::Calibration, "calibration.retrain_skipped samples=%zu required=%zu",
                     history.size(), config_.min_retrain_samples);
        return false;
    }

    if (!calibrator_->fit(history)) {
        EL_LOGF_WARN(logger_, LogCategory::Calibration, "calibration.fit_failed samples=%zu", history.size());
        return false;
    }

    CalibratorStats stats = calibrator_->stats();
    CalibratorCheckpoint cp;
    cp.n_samples = stats.n_samples;
    cp.brier_score = stats.brier_score;
    cp.a = stats.a;
    cp.b = stats.b;
    cp.fitted_at = util::utc_now_iso8601();

    bool saved = store_.put_state(config::calibration::CHECKPOINT_KEY, encode_checkpoint(cp),
                                  static_cast<double>(util::wall_clock_seconds()));

    EL_LOGF_INFO(logger_, LogCategory::Calibration,
                 "calibration.retrained samples=%zu brier=%.4f a=%.4f b=%.4f checkpoint=%d", stats.n_samples,
                 stats.brier_score, stats.a, stats.b, saved ? 1 : 0);
    return true;
}

// =============================================================================
// Weights and checkpoints
// =============================================================================

std::map<std::string, double> CalibrationFeedbackLoop::get_model_weights(const std::string& category) const {
    return inverse_brier_weights(score_models(store_, category));
}

std::optional<CalibratorCheckpoint> CalibrationFeedbackLoop::load_checkpoint() const {
    auto row = store_.get_state(config::calibration::CHECKPOINT_KEY);
    if (!row)
        return std::nullopt;

    std::string error;
    auto cp = decode_checkpoint(row->value, &error);
    if (!cp) {
        EL_LOGF_WARN(logger_, LogCategory::Calibration, "calibration.checkpoint_rejected reason=%s", error.c_str());
    }
    return cp;
}

bool CalibrationFeedbackLoop::restore_calibrator() {
    auto cp = load_checkpoint();
    if (!cp)
        return false;

    calibrator_->restore(*cp);
    EL_LOGF_INFO(logger_, LogCategory::Calibration, "calibration.restored samples=%zu a=%.4f b=%.4f fitted_at=%s",
                 cp->n_samples, cp->a, cp->b, cp->fitted_at.c_str());
    return true;
}

// =============================================================================
// Persisted retrain counter
// =============================================================================

void CalibrationFeedbackLoop::load_counter() {
    auto row = store_.get_state(config::calibration::COUNTER_KEY);
    if (!row)
        return;

    auto j = nlohmann::json::parse(row->value, nullptr, false);
    if (j.is_number_integer() && j.get<int>() >= 0) {
        counter_ = j.get<int>();
    } else {
        EL_LOGF_WARN(logger_, LogCategory::Calibration, "calibration.counter_invalid value=%s", row->value.c_str());
    }
}

void CalibrationFeedbackLoop::store_counter() {
    store_.put_state(config::calibration::COUNTER_KEY, nlohmann::json(counter_).dump(),
                     static_cast<double>(util::wall_clock_seconds()));
}

} // namespace edgeloop::analytics
