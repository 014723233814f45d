#pragma once

#include "deflicker/blending/weighting.hpp"
#include "deflicker/core/types.hpp"
#include "deflicker/matching/correspondence_field.hpp"
#include "deflicker/matching/patch_match.hpp"

#include <functional>
#include <utility>
#include <string>
#include <vector>

namespace deflicker::blending {

enum class WindowAlignment {
    Centered,
    Trailing, // target is the last member
};

WindowAlignment parse_window_alignment(const std::string& name);
std::string window_alignment_to_string(WindowAlignment alignment);

// Frame indices consulted for one target, ascending, target included.
// Members outside [0, num_frames) are dropped, so windows at the sequence
// ends are shorter than window_size.
struct BlendWindow {
    int target = 0;
    std::vector<int> members;

    int first() const { return members.empty() ? target : members.front(); }
    int last() const { return members.empty() ? target : members.back(); }
};

BlendWindow make_blend_window(int target, int window_size, int num_frames,
                              WindowAlignment alignment);

// Lowest and highest frame index needed to blend every target of `batch`.
std::pair<int, int> window_span(const Batch& batch, int window_size, int num_frames,
                                WindowAlignment alignment);

// Reference pixels pulled onto the source grid. cost is +inf where no
// footprint neighbour voted.
struct RemappedFrame {
    Frame frame;
    Matrix2Df cost;
};

// Patch voting: pixel p averages reference(p + offset(n)) over every
// neighbour n in the patch footprint of p whose correspondence is valid.
RemappedFrame remap_frame(const Frame& reference, const matching::CorrespondenceField& field,
                          int patch_size);

using FrameLookup = std::function<FramePtr(int index)>;

class TemporalBlender {
public:
    TemporalBlender(const matching::PatchMatchParams& match_params, WeightFunction weight,
                    uint64_t seed, int tracking_window_size = 0);

    // Blends window.target from its window members. `guide_at` may be empty;
    // when set it must return a guide frame for every window member.
    //
    // Members are matched outward from the target. With tracking enabled, a
    // member starts from the field of the previous member on the same side
    // when the two are at most tracking_window_size frames apart.
    Frame blend(const BlendWindow& window, const FrameLookup& frame_at,
                const FrameLookup& guide_at = FrameLookup()) const;

    int tracking_window_size() const { return tracking_window_size_; }

private:
    matching::PatchMatcher matcher_;
    WeightFunction weight_;
    uint64_t seed_;
    int tracking_window_size_;
};

} // namespace deflicker::blending
