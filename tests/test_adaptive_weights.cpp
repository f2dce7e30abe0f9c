/**
 * Tests for AdaptiveModelWeighter
 */

#include "../include/analytics/adaptive_weights.hpp"
#include "../include/store/memory_store.hpp"
#include "test_helpers.hpp"

using namespace edgeloop;
using namespace edgeloop::analytics;
using namespace edgeloop::store;
using edgeloop::testing::CapturingLogger;

namespace {

// n forecasts per model: gpt-4o misses by 0.1 (Brier 0.01), gemini by 0.3 (Brier 0.09)
void seed(MemoryStore& store, const std::string& category, int n) {
    for (int i = 0; i < n; ++i) {
        double outcome = i % 2 == 0 ? 1.0 : 0.0;
        store.insert_model_forecast(testing::model_forecast("gpt-4o", category, outcome > 0 ? 0.9 : 0.1, outcome));
        store.insert_model_forecast(
            testing::model_forecast("gemini-1.5-pro", category, outcome > 0 ? 0.7 : 0.3, outcome));
    }
}

double sum(const std::map<std::string, double>& weights) {
    double total = 0.0;
    for (const auto& [model, w] : weights)
        total += w;
    return total;
}

const ModelWeight& detail(const AdaptiveWeightResult& r, const std::string& model) {
    for (const auto& d : r.details) {
        if (d.model_name == model)
            return d;
    }
    throw std::runtime_error("no detail for " + model);
}

} // namespace

TEST(no_data_returns_priors) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    AdaptiveModelWeighter weighter(store, {}, cap.logger);

    auto r = weighter.get_weights("POLITICS");
    ASSERT_FALSE(r.data_available);
    ASSERT_NEAR(r.blend_factor, 0.0, 1e-12);
    ASSERT_EQ(r.weights.size(), 3u);
    ASSERT_NEAR(r.weights.at("gpt-4o"), 0.40, 1e-12);
    ASSERT_NEAR(r.weights.at("claude-3-5-sonnet-20241022"), 0.35, 1e-12);
    ASSERT_NEAR(r.weights.at("gemini-1.5-pro"), 0.25, 1e-12);
    for (const auto& d : r.details)
        ASSERT_EQ_ENUM(d.source, WeightSource::Default);
    ASSERT_EQ(cap.count_containing("weights.no_data category=POLITICS"), 1u);
}

TEST(missing_table_returns_priors) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Empty, cap.logger);
    AdaptiveModelWeighter weighter(store, {}, cap.logger);

    auto r = weighter.get_weights();
    ASSERT_FALSE(r.data_available);
    ASSERT_NEAR(sum(r.weights), 1.0, 1e-12);
}

TEST(no_data_weights_are_configured_weights_verbatim) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    config::EnsembleConfig cfg;
    cfg.models = {"alpha", "beta"};
    cfg.weights = {{"alpha", 0.6}, {"retired", 0.4}};
    AdaptiveModelWeighter weighter(store, cfg, cap.logger);

    auto r = weighter.get_weights("POLITICS");
    ASSERT_TRUE(r.weights == cfg.weights);
    ASSERT_EQ(r.details.size(), 2u);
    ASSERT_NEAR(detail(r, "beta").weight, 0.5, 1e-12);
}

TEST(too_few_samples_count_as_no_data) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    seed(store, "POLITICS", 4);
    AdaptiveModelWeighter weighter(store, {}, cap.logger);
    ASSERT_FALSE(weighter.get_weights("POLITICS").data_available);
}

TEST(partial_blend) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    seed(store, "POLITICS", 10);
    AdaptiveModelWeighter weighter(store, {}, cap.logger);

    auto r = weighter.get_weights("POLITICS");
    ASSERT_TRUE(r.data_available);
    ASSERT_NEAR(r.blend_factor, 0.2, 1e-12);
    ASSERT_NEAR(sum(r.weights), 1.0, 1e-9);

    // Pre-normalisation: gpt 0.2*0.9 + 0.8*0.4 = 0.50, claude 0.35, gemini 0.2*0.1 + 0.8*0.25 = 0.22
    ASSERT_NEAR(r.weights.at("gpt-4o"), 0.50 / 1.07, 1e-9);
    ASSERT_NEAR(r.weights.at("claude-3-5-sonnet-20241022"), 0.35 / 1.07, 1e-9);
    ASSERT_NEAR(r.weights.at("gemini-1.5-pro"), 0.22 / 1.07, 1e-9);

    ASSERT_EQ_ENUM(detail(r, "gpt-4o").source, WeightSource::Blended);
    ASSERT_EQ_ENUM(detail(r, "claude-3-5-sonnet-20241022").source, WeightSource::Default);
    ASSERT_NEAR(detail(r, "gpt-4o").brier_score, 0.01, 1e-9);
    ASSERT_EQ(detail(r, "gemini-1.5-pro").sample_count, 10u);
    ASSERT_NEAR(detail(r, "gemini-1.5-pro").confidence, 0.2, 1e-12);
}

TEST(blend_grows_and_saturates) {
    double previous_blend = 0.0;
    double previous_gpt = 0.0;
    for (int n : {5, 20, 40, 50, 80}) {
        CapturingLogger cap;
        MemoryStore store(MemoryStore::Schema::Full, cap.logger);
        seed(store, "SPORTS", n);
        AdaptiveModelWeighter weighter(store, {}, cap.logger);
        auto r = weighter.get_weights("SPORTS");

        ASSERT_NEAR(r.blend_factor, std::min(1.0, n / 50.0), 1e-12);
        ASSERT_TRUE(r.blend_factor >= previous_blend);
        ASSERT_TRUE(r.weights.at("gpt-4o") >= previous_gpt - 1e-12);
        ASSERT_NEAR(sum(r.weights), 1.0, 1e-9);
        previous_blend = r.blend_factor;
        previous_gpt = r.weights.at("gpt-4o");
    }
    ASSERT_NEAR(previous_blend, 1.0, 1e-12);
}

TEST(fully_learned_weights) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    seed(store, "POLITICS", 50);
    AdaptiveModelWeighter weighter(store, {}, cap.logger);

    auto r = weighter.get_weights("POLITICS");
    ASSERT_NEAR(r.weights.at("gpt-4o"), 0.9 / 1.35, 1e-9);
    ASSERT_EQ_ENUM(detail(r, "gpt-4o").source, WeightSource::Learned);
    ASSERT_EQ_ENUM(detail(r, "gemini-1.5-pro").source, WeightSource::Learned);
}

TEST(unconfigured_prior_is_uniform) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    config::EnsembleConfig cfg;
    cfg.models = {"alpha", "beta", "gamma", "delta"};
    cfg.weights = {{"alpha", 0.7}};
    AdaptiveModelWeighter weighter(store, cfg, cap.logger);

    ASSERT_NEAR(weighter.default_weight("alpha"), 0.7, 1e-12);
    ASSERT_NEAR(weighter.default_weight("beta"), 0.25, 1e-12);
    ASSERT_NEAR(weighter.default_weight("unlisted"), 0.25, 1e-12);
}

TEST(all_categories) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Full, cap.logger);
    seed(store, "POLITICS", 10);
    seed(store, "", 5);
    AdaptiveModelWeighter weighter(store, {}, cap.logger);

    auto all = weighter.get_all_category_weights();
    ASSERT_EQ(all.size(), 3u);
    ASSERT_TRUE(all.count("POLITICS") == 1);
    ASSERT_TRUE(all.count(UNKNOWN_CATEGORY) == 1);
    ASSERT_TRUE(all.count(ALL_CATEGORIES) == 1);
    ASSERT_EQ(all.at(UNKNOWN_CATEGORY).category, std::string(UNKNOWN_CATEGORY));
    ASSERT_NEAR(all.at(UNKNOWN_CATEGORY).blend_factor, 0.1, 1e-12);
    ASSERT_NEAR(all.at(ALL_CATEGORIES).blend_factor, 0.3, 1e-12);
}

TEST(all_categories_empty_without_table) {
    CapturingLogger cap;
    MemoryStore store(MemoryStore::Schema::Empty, cap.logger);
    AdaptiveModelWeighter weighter(store, {}, cap.logger);

    ASSERT_TRUE(weighter.get_all_category_weights().empty());
    ASSERT_EQ(cap.count_containing("weights.all_categories_skipped table=model_forecast_log"), 1u);
}

int main() {
    std::cout << "=== Adaptive Weights Tests ===\n";

    RUN_TEST(no_data_returns_priors);
    RUN_TEST(missing_table_returns_priors);
    RUN_TEST(no_data_weights_are_configured_weights_verbatim);
    RUN_TEST(too_few_samples_count_as_no_data);
    RUN_TEST(partial_blend);
    RUN_TEST(blend_grows_and_saturates);
    RUN_TEST(fully_learned_weights);
    RUN_TEST(unconfigured_prior_is_uniform);
    RUN_TEST(all_categories);
    RUN_TEST(all_categories_empty_without_table);

    std::cout << "\nAll adaptive weight tests passed!\n";
    return 0;
}
