#pragma once

#include "defaults.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace edgeloop {
namespace config {

/**
 * Ensemble models and their prior weights
 */
struct EnsembleConfig {
    std::vector<std::string> models = {"gpt-4o", "claude-3-5-sonnet-20241022", "gemini-1.5-pro"};
    std::map<std::string, double> weights = {
        {"gpt-4o", 0.40}, {"claude-3-5-sonnet-20241022", 0.35}, {"gemini-1.5-pro", 0.25}};
};

struct FeedbackConfig {
    int retrain_interval = calibration::RETRAIN_INTERVAL;
    size_t min_retrain_samples = calibration::MIN_RETRAIN_SAMPLES;
    bool persist_counter = false; // share the retrain schedule through engine_state
};

struct TrackerConfig {
    double bankroll = performance::DEFAULT_BANKROLL;
};

struct RegimeConfig {
    int lookback_trades = regime::LOOKBACK_TRADES;
    int candidate_lookback = regime::CANDIDATE_LOOKBACK;
    double vol_high_threshold = regime::VOL_HIGH_THRESHOLD;
    double vol_low_threshold = regime::VOL_LOW_THRESHOLD;
    double momentum_threshold = regime::MOMENTUM_THRESHOLD;
    int min_trades_for_signal = regime::MIN_TRADES_FOR_SIGNAL;
};

struct EntryConfig {
    double max_improvement_pct = entry::MAX_IMPROVEMENT_PCT;
    double min_edge_for_market_order = entry::MIN_EDGE_FOR_MARKET_ORDER;
    double patience_factor = entry::PATIENCE_FACTOR; // >1 more patient, <1 more aggressive
};

/**
 * Top-level configuration
 */
struct EngineConfig {
    std::string database_path = "edgeloop.db";
    std::string log_level = "info";

    EnsembleConfig ensemble;
    FeedbackConfig feedback;
    TrackerConfig tracker;
    RegimeConfig regime;
    EntryConfig entry;
};

/**
 * JSON config loader.
 *
 * Format (every key optional, missing keys keep their defaults):
 * {
 *   "database_path": "edgeloop.db",
 *   "log_level": "info",
 *   "ensemble": {"models": ["gpt-4o", ...], "weights": {"gpt-4o": 0.4, ...}},
 *   "feedback": {"retrain_interval": 10, "min_retrain_samples": 30, "persist_counter": false},
 *   "tracker": {"bankroll": 5000},
 *   "regime": {"lookback_trades": 20, "vol_high_threshold": 0.15, ...},
 *   "entry": {"max_improvement_pct": 0.03, "min_edge_for_market_order": 0.10, "patience_factor": 1.0}
 * }
 */
class ConfigParser {
public:
    static EngineConfig load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + filename);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str());
    }

    static EngineConfig parse(const std::string& text) {
        EngineConfig config;
        try {
            nlohmann::json root = nlohmann::json::parse(text);
            if (!root.is_object()) {
                throw std::runtime_error("Invalid config: top level must be an object");
            }

            config.database_path = root.value("database_path", config.database_path);
            config.log_level = root.value("log_level", config.log_level);

            if (root.contains("ensemble")) {
                const auto& e = root.at("ensemble");
                config.ensemble.models = e.value("models", config.ensemble.models);
                if (e.contains("weights")) {
                    config.ensemble.weights = e.at("weights").get<std::map<std::string, double>>();
                }
            }
            if (root.contains("feedback")) {
                const auto& f = root.at("feedback");
                config.feedback.retrain_interval = f.value("retrain_interval", config.feedback.retrain_interval);
                config.feedback.min_retrain_samples =
                    f.value("min_retrain_samples", config.feedback.min_retrain_samples);
                config.feedback.persist_counter = f.value("persist_counter", config.feedback.persist_counter);
            }
            if (root.contains("tracker")) {
                config.tracker.bankroll = root.at("tracker").value("bankroll", config.tracker.bankroll);
            }
            if (root.contains("regime")) {
                const auto& r = root.at("regime");
                config.regime.lookback_trades = r.value("lookback_trades", config.regime.lookback_trades);
                config.regime.candidate_lookback = r.value("candidate_lookback", config.regime.candidate_lookback);
                config.regime.vol_high_threshold = r.value("vol_high_threshold", config.regime.vol_high_threshold);
                config.regime.vol_low_threshold = r.value("vol_low_threshold", config.regime.vol_low_threshold);
                config.regime.momentum_threshold = r.value("momentum_threshold", config.regime.momentum_threshold);
                config.regime.min_trades_for_signal =
                    r.value("min_trades_for_signal", config.regime.min_trades_for_signal);
            }
            if (root.contains("entry")) {
                const auto& en = root.at("entry");
                config.entry.max_improvement_pct = en.value("max_improvement_pct", config.entry.max_improvement_pct);
                config.entry.min_edge_for_market_order =
                    en.value("min_edge_for_market_order", config.entry.min_edge_for_market_order);
                config.entry.patience_factor = en.value("patience_factor", config.entry.patience_factor);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid config: ") + e.what());
        }

        validate(config);
        return config;
    }

    static void save(const std::string& filename, const EngineConfig& config) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot create config file: " + filename);
        }
        file << to_json(config).dump(2) << "\n";
    }

    static nlohmann::json to_json(const EngineConfig& config) {
        return {
            {"database_path", config.database_path},
            {"log_level", config.log_level},
            {"ensemble", {{"models", config.ensemble.models}, {"weights", config.ensemble.weights}}},
            {"feedback",
             {{"retrain_interval", config.feedback.retrain_interval},
              {"min_retrain_samples", config.feedback.min_retrain_samples},
              {"persist_counter", config.feedback.persist_counter}}},
            {"tracker", {{"bankroll", config.tracker.bankroll}}},
            {"regime",
             {{"lookback_trades", config.regime.lookback_trades},
              {"candidate_lookback", config.regime.candidate_lookback},
              {"vol_high_threshold", config.regime.vol_high_threshold},
              {"vol_low_threshold", config.regime.vol_low_threshold},
              {"momentum_threshold", config.regime.momentum_threshold},
              {"min_trades_for_signal", config.regime.min_trades_for_signal}}},
            {"entry",
             {{"max_improvement_pct", config.entry.max_improvement_pct},
              {"min_edge_for_market_order", config.entry.min_edge_for_market_order},
              {"patience_factor", config.entry.patience_factor}}},
        };
    }

private:
    static void validate(const EngineConfig& config) {
        if (config.ensemble.models.empty()) {
            throw std::runtime_error("Invalid config: ensemble.models must not be empty");
        }
        if (config.feedback.retrain_interval < 1) {
            throw std::runtime_error("Invalid config: feedback.retrain_interval must be >= 1");
        }
        if (config.regime.lookback_trades < 1 || config.regime.candidate_lookback < 1) {
            throw std::runtime_error("Invalid config: regime lookbacks must be >= 1");
        }
        if (config.tracker.bankroll <= 0) {
            throw std::runtime_error("Invalid config: tracker.bankroll must be positive");
        }
    }
};

} // namespace config
} // namespace edgeloop
