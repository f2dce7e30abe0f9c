#pragma once

#include "../config/defaults.hpp"
#include "../store/records.hpp"
#include "checkpoint.hpp"

#include <cstddef>
#include <vector>

namespace edgeloop {
namespace analytics {

struct CalibratorStats {
    bool fitted = false;
    size_t n_samples = 0;
    double brier_score = 1.0;
    double a = 1.0;
    double b = 0.0;
};

/**
 * ICalibrator - probability recalibration model
 *
 * fit() may fail for lack of data or lack of convergence; both are normal
 * outcomes and leave the previous fit in place.
 */
class ICalibrator {
public:
    virtual ~ICalibrator() = default;

    virtual bool fit(const std::vector<store::CalibrationRow>& history) = 0;
    virtual CalibratorStats stats() const = 0;

    /// Calibrated probability; identity until fitted
    virtual double calibrate(double prob) const = 0;

    /// Adopt a stored fit without refitting
    virtual void restore(const CalibratorCheckpoint& checkpoint) = 0;
};

/**
 * PlattCalibrator - logistic recalibration on the logit scale
 *
 *   calibrated = sigmoid(a * logit(clamp(p)) + b)
 *
 * Fitted by Newton-Raphson on the log-loss with an L2 penalty on the slope
 * only (inverse strength C = 1). Separable or constant outcomes do not
 * converge and are reported as a failed fit.
 */
class PlattCalibrator : public ICalibrator {
public:
    explicit PlattCalibrator(size_t min_samples = config::calibration::MIN_RETRAIN_SAMPLES)
        : min_samples_(min_samples) {}

    bool fit(const std::vector<store::CalibrationRow>& history) override;
    CalibratorStats stats() const override { return stats_; }
    double calibrate(double prob) const override;
    void restore(const CalibratorCheckpoint& checkpoint) override;

    /// Number of Newton iterations used by the last successful fit
    int iterations() const { return iterations_; }

private:
    double apply(double prob) const;

    size_t min_samples_;
    CalibratorStats stats_;
    int iterations_ = 0;
};

} // namespace analytics
} // namespace edgeloop
