#pragma once

#include "deflicker/core/mode_profile.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace deflicker::config {

namespace fs = std::filesystem;

// Unset overrides fall back to the mode profile.
struct EngineConfig {
  std::string mode = "balanced"; // fast | balanced | accurate
  std::optional<int> window_size;
  std::optional<int> batch_size;
  std::optional<int> num_iter;
  std::optional<int> minimum_patch_size;
  std::optional<int> pyramid_levels;
  std::optional<int> tracking_window_size;
  float guide_weight = 10.0f;
  std::string initialize = "identity"; // identity | random
  uint64_t seed = 0x5eedULL;
};

struct BlendingConfig {
  std::string weighting = "exponential"; // exponential | degrain | inverse
  float cost_sigma = 10.0f;         // exponential: exp(-cost / sigma^2)
  float temporal_sigma = 0.0f;      // 0 disables the temporal falloff
  float degrain_threshold = 400.0f; // degrain: cost at which weight reaches 0
  std::string window_alignment = "centered"; // centered | trailing
};

struct InputConfig {
  std::string pattern = "*.png;*.jpg;*.jpeg;*.tif;*.tiff;*.fit;*.fits";
  bool reject_blank_frames = true;
};

struct OutputConfig {
  std::string format = "png"; // png | tiff | fits
  std::string prefix = "frame_";
};

struct CheckpointConfig {
  bool enabled = true;
  std::string path; // empty = <output>/checkpoint.json
};

struct RuntimeLimitsConfig {
  int parallel_workers = 4;
  int memory_budget_mb = 0; // 0 = unlimited
};

struct Config {
  EngineConfig engine;
  BlendingConfig blending;
  InputConfig input;
  OutputConfig output;
  CheckpointConfig checkpoint;
  RuntimeLimitsConfig runtime_limits;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Mode profile for the hinted resolution with the overrides applied.
  // Throws ConfigurationError when the result is invalid.
  core::EngineParams engine_params(const core::ResolutionHint &hint) const;
};

std::string get_schema_json();

} // namespace deflicker::config
