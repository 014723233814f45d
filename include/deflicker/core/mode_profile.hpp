#pragma once

#include <cstdint>
#include <string>

namespace deflicker::core {

enum class Mode {
  Fast,
  Balanced,
  Accurate,
};

enum class MemoryStrategy {
  ResidentAll, // every frame of the sequence held at once
  PerBatch,    // batch plus window overlap, evicted between batches
};

enum class InitMode {
  Identity,
  Random,
};

struct ResolutionHint {
  int width = 0;
  int height = 0;
};

struct EngineParams {
  Mode mode = Mode::Balanced;
  int num_iter = 5;
  int window_size = 9;
  int batch_size = 4;
  int minimum_patch_size = 5;
  int pyramid_levels = 1;
  int refinement_passes = 0;
  int tracking_window_size = 0; // warm-start reach between window members
  MemoryStrategy memory = MemoryStrategy::PerBatch;
  InitMode init = InitMode::Identity;
  float guide_weight = 10.0f;
  uint64_t seed = 0x5eedULL;
};

Mode parse_mode(const std::string &name);
std::string mode_to_string(Mode mode);
std::string memory_strategy_to_string(MemoryStrategy memory);

InitMode parse_init_mode(const std::string &name);
std::string init_mode_to_string(InitMode init);

// Pure profile lookup; no I/O, no hidden state.
EngineParams resolve_mode_profile(Mode mode, const ResolutionHint &hint);
EngineParams resolve_mode_profile(const std::string &mode_name,
                                  const ResolutionHint &hint);

int pyramid_levels_for(const ResolutionHint &hint, int level_cap);

// Throws ConfigurationError when a parameter is out of range or the patch
// does not fit into a frame of the hinted resolution.
void validate_engine_params(const EngineParams &params,
                            const ResolutionHint &hint);

} // namespace deflicker::core
