#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

namespace edgeloop {

// Binary-market prices and probabilities live in [MIN_PRICE, MAX_PRICE]
constexpr double MIN_PRICE = 0.01;
constexpr double MAX_PRICE = 0.99;

// Category name used for "every category" queries
constexpr const char* ALL_CATEGORIES = "ALL";
constexpr const char* UNKNOWN_CATEGORY = "UNKNOWN";

/**
 * Coerce NULL-derived or non-finite numerics to a neutral value.
 */
inline double finite_or(double value, double fallback = 0.0) {
    return std::isfinite(value) ? value : fallback;
}

inline double clamp_price(double price) {
    if (price < MIN_PRICE)
        return MIN_PRICE;
    if (price > MAX_PRICE)
        return MAX_PRICE;
    return price;
}

enum class Side : uint8_t { BuyYes = 0, BuyNo = 1 };

inline const char* side_to_string(Side side) {
    switch (side) {
    case Side::BuyYes:
        return "BUY_YES";
    case Side::BuyNo:
        return "BUY_NO";
    }
    return "BUY_YES";
}

inline bool string_to_side(const std::string& s, Side& out) {
    if (s == "BUY_YES") {
        out = Side::BuyYes;
        return true;
    }
    if (s == "BUY_NO") {
        out = Side::BuyNo;
        return true;
    }
    return false;
}

/**
 * Market regime. Declaration order is the tie-break order for classification.
 */
enum class Regime : uint8_t { Normal = 0, Trending, MeanReverting, HighVolatility, LowActivity };

constexpr size_t REGIME_COUNT = 5;

inline size_t regime_index(Regime regime) {
    return static_cast<size_t>(regime);
}

inline const char* regime_to_string(Regime regime) {
    switch (regime) {
    case Regime::Normal:
        return "NORMAL";
    case Regime::Trending:
        return "TRENDING";
    case Regime::MeanReverting:
        return "MEAN_REVERTING";
    case Regime::HighVolatility:
        return "HIGH_VOLATILITY";
    case Regime::LowActivity:
        return "LOW_ACTIVITY";
    }
    return "NORMAL";
}

// Provenance of an ensemble weight
enum class WeightSource : uint8_t { Learned, Default, Blended };

inline const char* weight_source_to_string(WeightSource source) {
    switch (source) {
    case WeightSource::Learned:
        return "learned";
    case WeightSource::Default:
        return "default";
    case WeightSource::Blended:
        return "blended";
    }
    return "default";
}

enum class Urgency : uint8_t { Immediate, Normal, Patient };

inline const char* urgency_to_string(Urgency urgency) {
    switch (urgency) {
    case Urgency::Immediate:
        return "immediate";
    case Urgency::Normal:
        return "normal";
    case Urgency::Patient:
        return "patient";
    }
    return "normal";
}

enum class EntryStrategy : uint8_t { Market, Limit, Patient };

inline const char* entry_strategy_to_string(EntryStrategy strategy) {
    switch (strategy) {
    case EntryStrategy::Market:
        return "market";
    case EntryStrategy::Limit:
        return "limit";
    case EntryStrategy::Patient:
        return "patient";
    }
    return "limit";
}

} // namespace edgeloop
