#include "deflicker/core/mode_profile.hpp"
#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace deflicker::core {

Mode parse_mode(const std::string &name) {
  const std::string n = to_lower(trim(name));
  if (n == "fast")
    return Mode::Fast;
  if (n == "balanced")
    return Mode::Balanced;
  if (n == "accurate")
    return Mode::Accurate;
  throw ConfigurationError("unknown mode '" + name +
                           "' (expected fast, balanced or accurate)");
}

std::string mode_to_string(Mode mode) {
  switch (mode) {
  case Mode::Fast:
    return "fast";
  case Mode::Balanced:
    return "balanced";
  case Mode::Accurate:
    return "accurate";
  }
  return "unknown";
}

std::string memory_strategy_to_string(MemoryStrategy memory) {
  return memory == MemoryStrategy::ResidentAll ? "resident_all" : "per_batch";
}

InitMode parse_init_mode(const std::string &name) {
  const std::string n = to_lower(trim(name));
  if (n == "identity")
    return InitMode::Identity;
  if (n == "random")
    return InitMode::Random;
  throw ConfigurationError("unknown initialize '" + name +
                           "' (expected identity or random)");
}

std::string init_mode_to_string(InitMode init) {
  return init == InitMode::Identity ? "identity" : "random";
}

int pyramid_levels_for(const ResolutionHint &hint, int level_cap) {
  const int min_side = std::min(hint.width, hint.height);
  int levels = 1;
  if (min_side >= 64) {
    levels = 1 + static_cast<int>(std::floor(
                     std::log2(static_cast<double>(min_side) / 32.0)));
  }
  return std::max(1, std::min(levels, level_cap));
}

EngineParams resolve_mode_profile(Mode mode, const ResolutionHint &hint) {
  EngineParams p;
  p.mode = mode;
  p.minimum_patch_size =
      (std::min(hint.width, hint.height) >= 720) ? 7 : 5;

  int level_cap = 1;
  switch (mode) {
  case Mode::Fast:
    p.num_iter = 3;
    p.window_size = 5;
    p.batch_size = 8;
    p.refinement_passes = 0;
    p.memory = MemoryStrategy::ResidentAll;
    level_cap = 2;
    break;
  case Mode::Balanced:
    p.num_iter = 5;
    p.window_size = 9;
    p.batch_size = 4;
    p.refinement_passes = 0;
    p.memory = MemoryStrategy::PerBatch;
    level_cap = 3;
    break;
  case Mode::Accurate:
    p.num_iter = 10;
    p.window_size = 15;
    p.batch_size = 2;
    p.refinement_passes = 2;
    p.tracking_window_size = 1;
    p.memory = MemoryStrategy::PerBatch;
    level_cap = 4;
    break;
  }
  p.pyramid_levels = pyramid_levels_for(hint, level_cap);
  return p;
}

EngineParams resolve_mode_profile(const std::string &mode_name,
                                  const ResolutionHint &hint) {
  return resolve_mode_profile(parse_mode(mode_name), hint);
}

void validate_engine_params(const EngineParams &params,
                            const ResolutionHint &hint) {
  if (params.num_iter < 1)
    throw ConfigurationError("num_iter must be positive");
  if (params.window_size < 1)
    throw ConfigurationError("window_size must be positive");
  if (params.batch_size < 1)
    throw ConfigurationError("batch_size must be positive");
  if (params.pyramid_levels < 1)
    throw ConfigurationError("pyramid_levels must be positive");
  if (params.refinement_passes < 0)
    throw ConfigurationError("refinement_passes must be >= 0");
  if (params.tracking_window_size < 0)
    throw ConfigurationError("tracking_window_size must be >= 0");
  if (params.minimum_patch_size < 1 || (params.minimum_patch_size % 2) == 0)
    throw ConfigurationError("minimum_patch_size must be a positive odd integer");
  if (!(params.guide_weight >= 0.0f))
    throw ConfigurationError("guide_weight must be >= 0");
  if (hint.width > 0 && hint.height > 0 &&
      (params.minimum_patch_size > hint.width ||
       params.minimum_patch_size > hint.height)) {
    throw ConfigurationError(
        "minimum_patch_size " + std::to_string(params.minimum_patch_size) +
        " exceeds frame size " + std::to_string(hint.width) + "x" +
        std::to_string(hint.height));
  }
}

} // namespace deflicker::core
