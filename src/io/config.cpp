#include "deflicker/config/configuration.hpp"
#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace deflicker::config {

static void read_optional_int(const YAML::Node& n, std::optional<int>& out) {
    if (n && !n.IsNull()) {
        out = n.as<int>();
    }
}

static void write_optional_int(YAML::Node node, const char* key, const std::optional<int>& v) {
    if (v) {
        node[key] = *v;
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigurationError("config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["engine"]) {
            auto e = node["engine"];
            if (e["mode"]) cfg.engine.mode = e["mode"].as<std::string>();
            read_optional_int(e["window_size"], cfg.engine.window_size);
            read_optional_int(e["batch_size"], cfg.engine.batch_size);
            read_optional_int(e["num_iter"], cfg.engine.num_iter);
            read_optional_int(e["minimum_patch_size"], cfg.engine.minimum_patch_size);
            read_optional_int(e["pyramid_levels"], cfg.engine.pyramid_levels);
            read_optional_int(e["tracking_window_size"], cfg.engine.tracking_window_size);
            if (e["guide_weight"]) cfg.engine.guide_weight = e["guide_weight"].as<float>();
            if (e["initialize"]) cfg.engine.initialize = e["initialize"].as<std::string>();
            if (e["seed"]) cfg.engine.seed = e["seed"].as<uint64_t>();
        }

        if (node["blending"]) {
            auto b = node["blending"];
            if (b["weighting"]) cfg.blending.weighting = b["weighting"].as<std::string>();
            if (b["cost_sigma"]) cfg.blending.cost_sigma = b["cost_sigma"].as<float>();
            if (b["temporal_sigma"]) cfg.blending.temporal_sigma = b["temporal_sigma"].as<float>();
            if (b["degrain_threshold"]) cfg.blending.degrain_threshold = b["degrain_threshold"].as<float>();
            if (b["window_alignment"]) cfg.blending.window_alignment = b["window_alignment"].as<std::string>();
        }

        if (node["input"]) {
            auto i = node["input"];
            if (i["pattern"]) cfg.input.pattern = i["pattern"].as<std::string>();
            if (i["reject_blank_frames"]) cfg.input.reject_blank_frames = i["reject_blank_frames"].as<bool>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["format"]) cfg.output.format = o["format"].as<std::string>();
            if (o["prefix"]) cfg.output.prefix = o["prefix"].as<std::string>();
        }

        if (node["checkpoint"]) {
            auto c = node["checkpoint"];
            if (c["enabled"]) cfg.checkpoint.enabled = c["enabled"].as<bool>();
            if (c["path"]) cfg.checkpoint.path = c["path"].as<std::string>();
        }

        if (node["runtime_limits"]) {
            auto rl = node["runtime_limits"];
            if (rl["parallel_workers"]) cfg.runtime_limits.parallel_workers = rl["parallel_workers"].as<int>();
            if (rl["memory_budget_mb"]) cfg.runtime_limits.memory_budget_mb = rl["memory_budget_mb"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["engine"]["mode"] = engine.mode;
    write_optional_int(node["engine"], "window_size", engine.window_size);
    write_optional_int(node["engine"], "batch_size", engine.batch_size);
    write_optional_int(node["engine"], "num_iter", engine.num_iter);
    write_optional_int(node["engine"], "minimum_patch_size", engine.minimum_patch_size);
    write_optional_int(node["engine"], "pyramid_levels", engine.pyramid_levels);
    write_optional_int(node["engine"], "tracking_window_size", engine.tracking_window_size);
    node["engine"]["guide_weight"] = engine.guide_weight;
    node["engine"]["initialize"] = engine.initialize;
    node["engine"]["seed"] = engine.seed;

    node["blending"]["weighting"] = blending.weighting;
    node["blending"]["cost_sigma"] = blending.cost_sigma;
    node["blending"]["temporal_sigma"] = blending.temporal_sigma;
    node["blending"]["degrain_threshold"] = blending.degrain_threshold;
    node["blending"]["window_alignment"] = blending.window_alignment;

    node["input"]["pattern"] = input.pattern;
    node["input"]["reject_blank_frames"] = input.reject_blank_frames;

    node["output"]["format"] = output.format;
    node["output"]["prefix"] = output.prefix;

    node["checkpoint"]["enabled"] = checkpoint.enabled;
    node["checkpoint"]["path"] = checkpoint.path;

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;
    node["runtime_limits"]["memory_budget_mb"] = runtime_limits.memory_budget_mb;

    return node;
}

void Config::validate() const {
    // Throws for unknown names.
    core::parse_mode(engine.mode);
    core::parse_init_mode(engine.initialize);

    auto require_positive = [](const std::optional<int>& v, const char* key) {
        if (v && *v < 1) {
            throw ConfigurationError(std::string("engine.") + key + " must be a positive integer");
        }
    };
    require_positive(engine.window_size, "window_size");
    require_positive(engine.batch_size, "batch_size");
    require_positive(engine.num_iter, "num_iter");
    require_positive(engine.minimum_patch_size, "minimum_patch_size");
    require_positive(engine.pyramid_levels, "pyramid_levels");
    if (engine.tracking_window_size && *engine.tracking_window_size < 0) {
        throw ConfigurationError("engine.tracking_window_size must be >= 0");
    }
    if (engine.minimum_patch_size && (*engine.minimum_patch_size % 2) == 0) {
        throw ConfigurationError("engine.minimum_patch_size must be odd");
    }
    if (!(engine.guide_weight >= 0.0f) || !std::isfinite(engine.guide_weight)) {
        throw ConfigurationError("engine.guide_weight must be a finite value >= 0");
    }

    const std::string w = core::to_lower(blending.weighting);
    if (w != "exponential" && w != "degrain" && w != "inverse") {
        throw ConfigurationError("blending.weighting must be 'exponential', 'degrain' or 'inverse'");
    }
    if (!(blending.cost_sigma > 0.0f)) {
        throw ConfigurationError("blending.cost_sigma must be > 0");
    }
    if (!(blending.temporal_sigma >= 0.0f)) {
        throw ConfigurationError("blending.temporal_sigma must be >= 0");
    }
    if (!(blending.degrain_threshold > 0.0f)) {
        throw ConfigurationError("blending.degrain_threshold must be > 0");
    }
    const std::string a = core::to_lower(blending.window_alignment);
    if (a != "centered" && a != "trailing") {
        throw ConfigurationError("blending.window_alignment must be 'centered' or 'trailing'");
    }

    if (core::trim(input.pattern).empty()) {
        throw ConfigurationError("input.pattern must not be empty");
    }

    const std::string f = core::to_lower(output.format);
    if (f != "png" && f != "tiff" && f != "fits") {
        throw ConfigurationError("output.format must be 'png', 'tiff' or 'fits'");
    }

    if (runtime_limits.parallel_workers < 1 || runtime_limits.parallel_workers > 256) {
        throw ConfigurationError("runtime_limits.parallel_workers must be in [1,256]");
    }
    if (runtime_limits.memory_budget_mb < 0) {
        throw ConfigurationError("runtime_limits.memory_budget_mb must be >= 0");
    }
}

core::EngineParams Config::engine_params(const core::ResolutionHint& hint) const {
    core::EngineParams p = core::resolve_mode_profile(engine.mode, hint);

    if (engine.window_size) p.window_size = *engine.window_size;
    if (engine.batch_size) p.batch_size = *engine.batch_size;
    if (engine.num_iter) p.num_iter = *engine.num_iter;
    if (engine.minimum_patch_size) p.minimum_patch_size = *engine.minimum_patch_size;
    if (engine.pyramid_levels) p.pyramid_levels = *engine.pyramid_levels;
    if (engine.tracking_window_size) p.tracking_window_size = *engine.tracking_window_size;
    p.guide_weight = engine.guide_weight;
    p.init = core::parse_init_mode(engine.initialize);
    p.seed = engine.seed;

    core::validate_engine_params(p, hint);
    return p;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "engine": {
      "type": "object",
      "properties": {
        "mode": {"type": "string", "enum": ["fast", "balanced", "accurate"]},
        "window_size": {"type": "integer", "minimum": 1},
        "batch_size": {"type": "integer", "minimum": 1},
        "num_iter": {"type": "integer", "minimum": 1},
        "minimum_patch_size": {"type": "integer", "minimum": 1},
        "pyramid_levels": {"type": "integer", "minimum": 1},
        "tracking_window_size": {"type": "integer", "minimum": 0},
        "guide_weight": {"type": "number", "minimum": 0},
        "initialize": {"type": "string", "enum": ["identity", "random"]},
        "seed": {"type": "integer", "minimum": 0}
      }
    },
    "blending": {
      "type": "object",
      "properties": {
        "weighting": {"type": "string", "enum": ["exponential", "degrain", "inverse"]},
        "cost_sigma": {"type": "number", "exclusiveMinimum": 0},
        "temporal_sigma": {"type": "number", "minimum": 0},
        "degrain_threshold": {"type": "number", "exclusiveMinimum": 0},
        "window_alignment": {"type": "string", "enum": ["centered", "trailing"]}
      }
    },
    "input": {
      "type": "object",
      "properties": {
        "pattern": {"type": "string"},
        "reject_blank_frames": {"type": "boolean"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "format": {"type": "string", "enum": ["png", "tiff", "fits"]},
        "prefix": {"type": "string"}
      }
    },
    "checkpoint": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "path": {"type": "string"}
      }
    },
    "runtime_limits": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 256},
        "memory_budget_mb": {"type": "integer", "minimum": 0}
      }
    }
  }
})";
}

} // namespace deflicker::config
