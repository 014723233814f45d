#pragma once

#include "deflicker/config/configuration.hpp"

#include <functional>
#include <string>

namespace deflicker::blending {

// Weight of one window member at one pixel. Must be non-negative, and
// non-increasing in both cost and |temporal_distance|.
using WeightFunction = std::function<float(float cost, int temporal_distance)>;

enum class WeightingKind {
    Exponential,
    Degrain,
    Inverse,
};

WeightingKind parse_weighting(const std::string& name);
std::string weighting_to_string(WeightingKind kind);

// exp(-cost / sigma^2)
WeightFunction exponential_weight(float cost_sigma);

// (T - c)(T + c) / (T^2 + c^2) below the threshold T, 0 above it
WeightFunction degrain_weight(float threshold);

// 1 / (1 + cost)
WeightFunction inverse_weight();

// Multiplies `base` by exp(-d^2 / (2 sigma^2)); sigma <= 0 returns `base`.
WeightFunction with_temporal_falloff(WeightFunction base, float temporal_sigma);

WeightFunction make_weight_function(const config::BlendingConfig& cfg);

} // namespace deflicker::blending
