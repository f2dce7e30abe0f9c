#include "../../include/analytics/checkpoint.hpp"

#include <nlohmann/json.hpp>

#include <cmath>

namespace edgeloop::analytics {

using json = nlohmann::json;

std::string encode_checkpoint(const CalibratorCheckpoint& checkpoint) {
    json j = {
        {"version", checkpoint.version},
        {"calibrator", checkpoint.calibrator},
        {"n_samples", checkpoint.n_samples},
        {"brier_score", checkpoint.brier_score},
        {"a", checkpoint.a},
        {"b", checkpoint.b},
        {"fitted_at", checkpoint.fitted_at},
    };
    return j.dump();
}

std::optional<CalibratorCheckpoint> decode_checkpoint(const std::string& text, std::string* error) {
    auto fail = [error](const std::string& reason) -> std::optional<CalibratorCheckpoint> {
        if (error)
            *error = reason;
        return std::nullopt;
    };

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return fail("not a JSON object");

    CalibratorCheckpoint cp;
    try {
        cp.version = j.value("version", 0);
        if (cp.version < 0 || cp.version > config::calibration::CHECKPOINT_VERSION)
            return fail("unsupported checkpoint version " + std::to_string(cp.version));

        if (!j.contains("a") || !j.contains("b"))
            return fail("missing coefficients");

        cp.calibrator = j.value("calibrator", std::string("platt_logistic"));
        cp.n_samples = j.value("n_samples", size_t{0});
        cp.brier_score = j.value("brier_score", 1.0);
        cp.a = j.at("a").get<double>();
        cp.b = j.at("b").get<double>();
        cp.fitted_at = j.value("fitted_at", std::string());
    } catch (const json::exception& e) {
        return fail(e.what());
    }

    if (!std::isfinite(cp.a) || !std::isfinite(cp.b))
        return fail("non-finite coefficients");
    return cp;
}

} // namespace edgeloop::analytics
