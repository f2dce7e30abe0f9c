#pragma once

/**
 * AdaptiveModelWeighter - per-category ensemble weights
 *
 * Learned weights are normalised inverse-Brier scores over models with at
 * least MIN_SAMPLES_PER_MODEL forecasts in the category. They are blended
 * with the configured priors by
 *
 *   blend = min(1, min_sample_count / 50)
 *   w     = blend * learned + (1 - blend) * prior
 *
 * and renormalised. Models without learned data keep their prior.
 *
 * Usage:
 *   AdaptiveModelWeighter weighter(store, config.ensemble);
 *   auto result = weighter.get_weights("POLITICS");
 *   double w = result.weights.at("gpt-4o");
 */

#include "../config/engine_config.hpp"
#include "../logging/async_logger.hpp"
#include "../store/istore.hpp"
#include "../types.hpp"

#include <map>
#include <string>
#include <vector>

namespace edgeloop {
namespace analytics {

struct ModelWeight {
    std::string model_name;
    double weight = 0.0;
    WeightSource source = WeightSource::Default;
    double brier_score = 0.0; // 0 when no learned data
    size_t sample_count = 0;
    double confidence = 0.0; // blend factor applied to this model
};

struct AdaptiveWeightResult {
    std::string category;
    std::map<std::string, double> weights;
    std::vector<ModelWeight> details; // one per configured model, config order
    bool data_available = false;
    double blend_factor = 0.0;
};

class AdaptiveModelWeighter {
public:
    explicit AdaptiveModelWeighter(const store::IStore& store, const config::EnsembleConfig& config = {},
                                   logging::AsyncLogger& logger = logging::default_logger());

    /**
     * Blended weights for one category. Without enough data the weights map
     * is the configured weights as given and every detail is a default.
     */
    AdaptiveWeightResult get_weights(const std::string& category = ALL_CATEGORIES) const;

    /// One result per category in model_forecast_log plus "ALL"; empty without the table
    std::map<std::string, AdaptiveWeightResult> get_all_category_weights() const;

    /// Configured prior for a model; 1 / model_count when it has none
    double default_weight(const std::string& model) const;

private:
    const store::IStore& store_;
    config::EnsembleConfig config_;
    logging::AsyncLogger& logger_;
};

} // namespace analytics
} // namespace edgeloop
