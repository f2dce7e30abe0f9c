#include "../../include/analytics/calibrator.hpp"
#include "../../include/types.hpp"

#include <algorithm>
#include <cmath>

namespace edgeloop::analytics {

namespace {

double logit(double p) {
    p = clamp_price(p);
    return std::log(p / (1.0 - p));
}

double sigmoid(double z) {
    if (z >= 0) {
        double e = std::exp(-z);
        return 1.0 / (1.0 + e);
    }
    double e = std::exp(z);
    return e / (1.0 + e);
}

} // namespace

bool PlattCalibrator::fit(const std::vector<store::CalibrationRow>& history) {
    if (history.size() < min_samples_ || history.empty())
        return false;

    std::vector<double> x;
    std::vector<double> y;
    x.reserve(history.size());
    y.reserve(history.size());
    for (const auto& h : history) {
        x.push_back(logit(finite_or(h.forecast_prob, 0.5)));
        y.push_back(std::clamp(finite_or(h.actual_outcome), 0.0, 1.0));
    }

    const double lambda = 1.0 / config::calibration::L2_PENALTY;
    double a = 1.0;
    double b = 0.0;
    bool converged = false;
    int iter = 0;

    for (; iter < config::calibration::MAX_FIT_ITERATIONS; ++iter) {
        double ga = lambda * a, gb = 0.0;
        double haa = lambda, hab = 0.0, hbb = 0.0;

        for (size_t i = 0; i < x.size(); ++i) {
            double s = sigmoid(a * x[i] + b);
            double r = s - y[i];
            double w = s * (1.0 - s);
            ga += r * x[i];
            gb += r;
            haa += w * x[i] * x[i];
            hab += w * x[i];
            hbb += w;
        }

        double det = haa * hbb - hab * hab;
        if (!(det > 1e-12) || !std::isfinite(det))
            return false;

        // Solve H * step = g for the 2x2 system
        double step_a = (hbb * ga - hab * gb) / det;
        double step_b = (haa * gb - hab * ga) / det;
        a -= step_a;
        b -= step_b;

        if (!std::isfinite(a) || !std::isfinite(b))
            return false;
        if (std::abs(step_a) < config::calibration::FIT_TOLERANCE &&
            std::abs(step_b) < config::calibration::FIT_TOLERANCE) {
            converged = true;
            ++iter;
            break;
        }
    }
    if (!converged)
        return false;

    double brier = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double c = sigmoid(a * x[i] + b);
        brier += (c - y[i]) * (c - y[i]);
    }
    brier /= static_cast<double>(x.size());

    stats_.fitted = true;
    stats_.n_samples = history.size();
    stats_.brier_score = brier;
    stats_.a = a;
    stats_.b = b;
    iterations_ = iter;
    return true;
}

double PlattCalibrator::apply(double prob) const {
    return sigmoid(stats_.a * logit(prob) + stats_.b);
}

double PlattCalibrator::calibrate(double prob) const {
    if (!stats_.fitted)
        return prob;
    return clamp_price(apply(finite_or(prob, 0.5)));
}

void PlattCalibrator::restore(const CalibratorCheckpoint& checkpoint) {
    stats_.fitted = true;
    stats_.n_samples = checkpoint.n_samples;
    stats_.brier_score = checkpoint.brier_score;
    stats_.a = checkpoint.a;
    stats_.b = checkpoint.b;
}

} // namespace edgeloop::analytics
