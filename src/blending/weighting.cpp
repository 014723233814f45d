#include "deflicker/blending/weighting.hpp"
#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace deflicker::blending {

WeightingKind parse_weighting(const std::string& name) {
    const std::string n = core::to_lower(core::trim(name));
    if (n == "exponential") return WeightingKind::Exponential;
    if (n == "degrain") return WeightingKind::Degrain;
    if (n == "inverse") return WeightingKind::Inverse;
    throw ConfigurationError("unknown weighting function: '" + name + "'");
}

std::string weighting_to_string(WeightingKind kind) {
    switch (kind) {
        case WeightingKind::Exponential: return "exponential";
        case WeightingKind::Degrain: return "degrain";
        case WeightingKind::Inverse: return "inverse";
    }
    return "exponential";
}

WeightFunction exponential_weight(float cost_sigma) {
    if (!(cost_sigma > 0.0f)) {
        throw ConfigurationError("blending.cost_sigma must be > 0");
    }
    const float denom = cost_sigma * cost_sigma;
    return [denom](float cost, int) -> float {
        if (!std::isfinite(cost)) return 0.0f;
        return std::exp(-std::max(cost, 0.0f) / denom);
    };
}

WeightFunction degrain_weight(float threshold) {
    if (!(threshold > 0.0f)) {
        throw ConfigurationError("blending.degrain_threshold must be > 0");
    }
    const float t2 = threshold * threshold;
    return [threshold, t2](float cost, int) -> float {
        if (!std::isfinite(cost)) return 0.0f;
        const float c = std::max(cost, 0.0f);
        if (c >= threshold) return 0.0f;
        return (threshold - c) * (threshold + c) / (t2 + c * c);
    };
}

WeightFunction inverse_weight() {
    return [](float cost, int) -> float {
        if (!std::isfinite(cost)) return 0.0f;
        return 1.0f / (1.0f + std::max(cost, 0.0f));
    };
}

WeightFunction with_temporal_falloff(WeightFunction base, float temporal_sigma) {
    if (!(temporal_sigma > 0.0f)) {
        return base;
    }
    const float denom = 2.0f * temporal_sigma * temporal_sigma;
    return [base = std::move(base), denom](float cost, int temporal_distance) -> float {
        const float w = base(cost, temporal_distance);
        if (w <= 0.0f) return 0.0f;
        const float d = static_cast<float>(temporal_distance);
        return w * std::exp(-(d * d) / denom);
    };
}

WeightFunction make_weight_function(const config::BlendingConfig& cfg) {
    WeightFunction base;
    switch (parse_weighting(cfg.weighting)) {
        case WeightingKind::Exponential: base = exponential_weight(cfg.cost_sigma); break;
        case WeightingKind::Degrain: base = degrain_weight(cfg.degrain_threshold); break;
        case WeightingKind::Inverse: base = inverse_weight(); break;
    }
    return with_temporal_falloff(std::move(base), cfg.temporal_sigma);
}

} // namespace deflicker::blending
