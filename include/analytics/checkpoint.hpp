#pragma once

/**
 * CalibratorCheckpoint - typed, versioned calibrator state
 *
 * Stored as JSON in engine_state under "calibrator_state":
 *   {"version": 1, "calibrator": "platt_logistic", "n_samples": 120,
 *    "brier_score": 0.2011, "a": 0.93, "b": -0.04, "fitted_at": "2026-..."}
 *
 * Blobs without a "version" key are the untyped {n_samples, brier_score, a, b}
 * shape written by earlier agents and decode as version 0. Versions newer
 * than CHECKPOINT_VERSION are rejected.
 */

#include "../config/defaults.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace edgeloop {
namespace analytics {

struct CalibratorCheckpoint {
    int version = config::calibration::CHECKPOINT_VERSION;
    std::string calibrator = "platt_logistic";
    size_t n_samples = 0;
    double brier_score = 1.0;
    double a = 1.0; // slope on logit(p)
    double b = 0.0; // intercept
    std::string fitted_at;

    bool operator==(const CalibratorCheckpoint& other) const = default;
};

std::string encode_checkpoint(const CalibratorCheckpoint& checkpoint);

/**
 * Decode a stored checkpoint. On failure returns nullopt and, when error is
 * non-null, a one-line reason.
 */
std::optional<CalibratorCheckpoint> decode_checkpoint(const std::string& text, std::string* error = nullptr);

} // namespace analytics
} // namespace edgeloop
