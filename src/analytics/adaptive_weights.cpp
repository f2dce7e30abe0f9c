#include "../../include/analytics/adaptive_weights.hpp"
#include "../../include/analytics/model_scores.hpp"

#include <algorithm>

namespace edgeloop::analytics {

namespace LogCategory = logging::LogCategory;

AdaptiveModelWeighter::AdaptiveModelWeighter(const store::IStore& store, const config::EnsembleConfig& config,
                                             logging::AsyncLogger& logger)
    : store_(store), config_(config), logger_(logger) {}

double AdaptiveModelWeighter::default_weight(const std::string& model) const {
    auto it = config_.weights.find(model);
    if (it != config_.weights.end())
        return it->second;
    return config_.models.empty() ? 0.0 : 1.0 / static_cast<double>(config_.models.size());
}

AdaptiveWeightResult AdaptiveModelWeighter::get_weights(const std::string& category) const {
    AdaptiveWeightResult result;
    result.category = category;

    auto scores = score_models(store_, category);

    if (scores.empty()) {
        result.weights = config_.weights;
        for (const auto& model : config_.models)
            result.details.push_back(ModelWeight{model, default_weight(model), WeightSource::Default, 0.0, 0, 0.0});
        EL_LOGF_INFO(logger_, LogCategory::Weights, "weights.no_data category=%s using=defaults", category.c_str());
        return result;
    }

    auto learned = inverse_brier_weights(scores);

    size_t min_count = scores.begin()->second.sample_count;
    for (const auto& [model, score] : scores)
        min_count = std::min(min_count, score.sample_count);

    double blend = std::min(1.0, static_cast<double>(min_count) / config::weights::BLEND_FULL_CONFIDENCE_SAMPLES);

    double total = 0.0;
    for (const auto& model : config_.models) {
        ModelWeight detail;
        detail.model_name = model;
        double prior = default_weight(model);

        auto it = learned.find(model);
        if (it != learned.end()) {
            const ModelScore& score = scores.at(model);
            detail.weight = blend * it->second + (1.0 - blend) * prior;
            detail.source = blend >= config::weights::LEARNED_BLEND_THRESHOLD ? WeightSource::Learned
                                                                              : WeightSource::Blended;
            detail.brier_score = score.brier_score;
            detail.sample_count = score.sample_count;
            detail.confidence = blend;
        } else {
            detail.weight = prior;
            detail.source = WeightSource::Default;
        }
        total += detail.weight;
        result.details.push_back(detail);
    }

    if (total > 0) {
        for (auto& detail : result.details)
            detail.weight /= total;
    }
    for (const auto& detail : result.details)
        result.weights[detail.model_name] = detail.weight;

    result.data_available = true;
    result.blend_factor = blend;

    EL_LOGF_INFO(logger_, LogCategory::Weights, "weights.computed category=%s models=%zu blend=%.2f min_samples=%zu",
                 category.c_str(), scores.size(), blend, min_count);
    return result;
}

std::map<std::string, AdaptiveWeightResult> AdaptiveModelWeighter::get_all_category_weights() const {
    std::map<std::string, AdaptiveWeightResult> results;
    if (!store_.has_table(store::tables::MODEL_FORECAST_LOG)) {
        EL_LOGF_INFO(logger_, LogCategory::Weights, "weights.all_categories_skipped table=%s",
                     store::tables::MODEL_FORECAST_LOG);
        return results;
    }
    for (const auto& category : store_.forecast_categories()) {
        if (category.empty()) {
            auto r = get_weights(category);
            r.category = UNKNOWN_CATEGORY;
            results[UNKNOWN_CATEGORY] = r;
        } else {
            results[category] = get_weights(category);
        }
    }
    results[ALL_CATEGORIES] = get_weights(ALL_CATEGORIES);
    return results;
}

} // namespace edgeloop::analytics
