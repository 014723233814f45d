#pragma once

#include "deflicker/core/mode_profile.hpp"
#include "deflicker/core/types.hpp"
#include "deflicker/matching/correspondence_field.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace deflicker::matching {

using Rng = std::mt19937_64;

struct PatchMatchParams {
    int patch_size = 5;         // finest level; grows by 2 per coarser level
    int num_iter = 5;
    int pyramid_levels = 1;
    int refinement_passes = 0;  // extra iterations at the finest level
    float guide_weight = 0.0f;
    core::InitMode init = core::InitMode::Identity;
};

// Random source for one (source, reference) search, independent of
// scheduling order.
uint64_t derive_seed(uint64_t base_seed, int source_index, int reference_index);

// Mean squared difference over the patch footprint and all channels.
// Footprint taps leaving either image are edge-replicated; a match centre
// outside the reference costs +inf.
float patch_cost(const Frame& source, const Frame& reference,
                 const PatchDescriptor& patch, int ref_x, int ref_y);

struct MatchLevel {
    Frame source;
    Frame reference;
    Frame source_guide;    // empty when matching without guides
    Frame reference_guide;
    int patch_size = 5;
};

class PatchMatcher {
public:
    explicit PatchMatcher(const PatchMatchParams& params);

    // Guides are optional; when given, both must be given and share the
    // frames' width and height. Throws ConfigurationError if the reference
    // is smaller than one patch, DataError on geometry mismatch.
    //
    // A non-null `initial` field (same size as source) replaces the pyramid:
    // its offsets seed the finest level, which then runs
    // num_iter + refinement_passes iterations.
    CorrespondenceField match(const Frame& source, const Frame& reference, Rng& rng,
                              const Frame* source_guide = nullptr,
                              const Frame* reference_guide = nullptr,
                              const CorrespondenceField* initial = nullptr) const;

    // Propagation + random search on a single level, starting from `field`.
    void refine(const MatchLevel& level, CorrespondenceField& field, int iterations,
                Rng& rng) const;

    const PatchMatchParams& params() const { return params_; }

private:
    std::vector<MatchLevel> build_pyramid(const Frame& source, const Frame& reference,
                                          const Frame* source_guide,
                                          const Frame* reference_guide, int max_levels) const;
    float evaluate(const MatchLevel& level, int x, int y, int dx, int dy) const;
    CorrespondenceField initialize(const MatchLevel& level, Rng& rng) const;
    void evaluate_warm_start(const MatchLevel& level, CorrespondenceField& field) const;

    PatchMatchParams params_;
};

} // namespace deflicker::matching
