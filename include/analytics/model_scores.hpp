#pragma once

/**
 * Per-model Brier scores over model_forecast_log, shared by the feedback loop
 * and the adaptive weighter.
 */

#include "../config/defaults.hpp"
#include "../store/istore.hpp"
#include "../types.hpp"

#include <algorithm>
#include <map>
#include <string>

namespace edgeloop {
namespace analytics {

struct ModelScore {
    double brier_score = 0.0;
    size_t sample_count = 0;
};

/**
 * Brier score and sample count per model for one category ("ALL" = every
 * row), keeping only models with at least min_samples forecasts.
 */
inline std::map<std::string, ModelScore> score_models(const store::IStore& store, const std::string& category,
                                                      size_t min_samples = config::weights::MIN_SAMPLES_PER_MODEL) {
    std::map<std::string, double> sq_error;
    std::map<std::string, size_t> counts;
    for (const auto& row : store.model_forecasts(category)) {
        double err = finite_or(row.forecast_prob) - finite_or(row.actual_outcome);
        sq_error[row.model_name] += err * err;
        ++counts[row.model_name];
    }

    std::map<std::string, ModelScore> scores;
    for (const auto& [model, n] : counts) {
        if (n < min_samples)
            continue;
        scores[model] = ModelScore{sq_error[model] / static_cast<double>(n), n};
    }
    return scores;
}

/**
 * Normalised inverse-Brier weights: 1 / max(brier, MIN_BRIER), summing to 1.
 */
inline std::map<std::string, double> inverse_brier_weights(const std::map<std::string, ModelScore>& scores) {
    std::map<std::string, double> weights;
    double total = 0.0;
    for (const auto& [model, score] : scores) {
        double w = 1.0 / std::max(score.brier_score, config::calibration::MIN_BRIER);
        weights[model] = w;
        total += w;
    }
    if (total > 0) {
        for (auto& [model, w] : weights)
            w /= total;
    }
    return weights;
}

} // namespace analytics
} // namespace edgeloop
