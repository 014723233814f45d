#include "deflicker/blending/temporal_blend.hpp"
#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace deflicker::blending {

namespace {

using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

void window_extent(int window_size, WindowAlignment alignment, int& before, int& after) {
    if (alignment == WindowAlignment::Trailing) {
        before = window_size - 1;
        after = 0;
    } else {
        before = (window_size - 1) / 2;
        after = window_size - 1 - before;
    }
}

} // namespace

WindowAlignment parse_window_alignment(const std::string& name) {
    const std::string n = core::to_lower(core::trim(name));
    if (n == "centered" || n == "centred") return WindowAlignment::Centered;
    if (n == "trailing") return WindowAlignment::Trailing;
    throw ConfigurationError("unknown window alignment: '" + name + "'");
}

std::string window_alignment_to_string(WindowAlignment alignment) {
    return alignment == WindowAlignment::Trailing ? "trailing" : "centered";
}

BlendWindow make_blend_window(int target, int window_size, int num_frames,
                              WindowAlignment alignment) {
    if (window_size < 1) {
        throw ConfigurationError("window_size must be a positive integer");
    }
    if (target < 0 || target >= num_frames) {
        throw DataError(target, "target index outside sequence of " +
                                    std::to_string(num_frames) + " frames");
    }
    int before = 0;
    int after = 0;
    window_extent(window_size, alignment, before, after);

    BlendWindow window;
    window.target = target;
    const int first = std::max(0, target - before);
    const int last = std::min(num_frames - 1, target + after);
    window.members.reserve(static_cast<size_t>(last - first + 1));
    for (int i = first; i <= last; ++i) {
        window.members.push_back(i);
    }
    return window;
}

std::pair<int, int> window_span(const Batch& batch, int window_size, int num_frames,
                                WindowAlignment alignment) {
    int before = 0;
    int after = 0;
    window_extent(window_size, alignment, before, after);
    return {std::max(0, batch.first_frame - before),
            std::min(num_frames - 1, batch.last_frame + after)};
}

RemappedFrame remap_frame(const Frame& reference, const matching::CorrespondenceField& field,
                          int patch_size) {
    const int rows = field.rows();
    const int cols = field.cols();
    const int rw = reference.width();
    const int rh = reference.height();
    const int nch = reference.num_channels();
    const int r = patch_size / 2;

    RemappedFrame out;
    out.frame.index = reference.index;
    out.frame.channels.assign(static_cast<size_t>(nch), Matrix2Df::Zero(rows, cols));
    out.cost = Matrix2Df::Constant(rows, cols, matching::kInvalidCost);

    std::vector<double> sums(static_cast<size_t>(nch), 0.0);
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            std::fill(sums.begin(), sums.end(), 0.0);
            double cost_sum = 0.0;
            int votes = 0;

            for (int ny = std::max(0, y - r); ny <= std::min(rows - 1, y + r); ++ny) {
                for (int nx = std::max(0, x - r); nx <= std::min(cols - 1, x + r); ++nx) {
                    if (!field.is_valid(ny, nx)) continue;
                    const int qx = x + field.offset_x(ny, nx);
                    const int qy = y + field.offset_y(ny, nx);
                    if (qx < 0 || qy < 0 || qx >= rw || qy >= rh) continue;
                    for (int c = 0; c < nch; ++c) {
                        sums[c] += reference.channels[c](qy, qx);
                    }
                    cost_sum += field.cost(ny, nx);
                    ++votes;
                }
            }

            if (votes > 0) {
                for (int c = 0; c < nch; ++c) {
                    out.frame.channels[c](y, x) = static_cast<float>(sums[c] / votes);
                }
                out.cost(y, x) = static_cast<float>(cost_sum / votes);
            }
        }
    }
    return out;
}

TemporalBlender::TemporalBlender(const matching::PatchMatchParams& match_params,
                                 WeightFunction weight, uint64_t seed,
                                 int tracking_window_size)
    : matcher_(match_params), weight_(std::move(weight)), seed_(seed),
      tracking_window_size_(tracking_window_size) {
    if (!weight_) {
        throw ConfigurationError("blending weight function is not set");
    }
    if (tracking_window_size_ < 0) {
        throw ConfigurationError("tracking_window_size must be >= 0");
    }
}

Frame TemporalBlender::blend(const BlendWindow& window, const FrameLookup& frame_at,
                             const FrameLookup& guide_at) const {
    FramePtr target = frame_at(window.target);
    if (!target) {
        throw DataError(window.target, "frame is not loaded");
    }
    FramePtr target_guide;
    if (guide_at) {
        target_guide = guide_at(window.target);
        if (!target_guide) {
            throw DataError(window.target, "guide frame is not loaded");
        }
    }

    const int rows = target->height();
    const int cols = target->width();
    const int nch = target->num_channels();

    // The target votes for itself through the identity correspondence.
    const double self_weight = std::max(0.0f, weight_(0.0f, 0));
    std::vector<Matrix2Dd> accum;
    accum.reserve(static_cast<size_t>(nch));
    for (int c = 0; c < nch; ++c) {
        accum.push_back(target->channels[c].cast<double>() * self_weight);
    }
    Matrix2Dd weight_sum = Matrix2Dd::Constant(rows, cols, self_weight);

    // Nearest members first; ties keep the earlier frame first.
    std::vector<int> order;
    for (int member : window.members) {
        if (member != window.target) order.push_back(member);
    }
    const int t = window.target;
    std::stable_sort(order.begin(), order.end(), [t](int a, int b) {
        return std::abs(a - t) < std::abs(b - t);
    });

    // Last field computed on each side of the target: [0] before, [1] after.
    matching::CorrespondenceField tracked[2];
    int tracked_member[2] = {-1, -1};

    for (int member : order) {
        FramePtr reference = frame_at(member);
        if (!reference) {
            throw DataError(member, "frame is not loaded");
        }
        FramePtr reference_guide;
        if (target_guide) {
            reference_guide = guide_at(member);
            if (!reference_guide) {
                throw DataError(member, "guide frame is not loaded");
            }
        }

        const int side = member < window.target ? 0 : 1;
        const bool warm = tracking_window_size_ > 0 && tracked_member[side] >= 0 &&
                          std::abs(member - tracked_member[side]) <= tracking_window_size_;

        matching::Rng rng(matching::derive_seed(seed_, window.target, member));
        matching::CorrespondenceField field =
            matcher_.match(*target, *reference, rng, target_guide.get(), reference_guide.get(),
                           warm ? &tracked[side] : nullptr);
        const RemappedFrame remapped =
            remap_frame(*reference, field, matcher_.params().patch_size);
        if (tracking_window_size_ > 0) {
            tracked[side] = std::move(field);
            tracked_member[side] = member;
        }

        const int distance = member - window.target;
        for (int y = 0; y < rows; ++y) {
            for (int x = 0; x < cols; ++x) {
                const float cost = remapped.cost(y, x);
                if (!std::isfinite(cost)) continue;
                const float w = weight_(cost, distance);
                if (!(w > 0.0f)) continue;
                weight_sum(y, x) += w;
                for (int c = 0; c < nch; ++c) {
                    accum[c](y, x) += static_cast<double>(w) * remapped.frame.channels[c](y, x);
                }
            }
        }
    }

    Frame out;
    out.index = target->index;
    out.channels.assign(static_cast<size_t>(nch), Matrix2Df(rows, cols));
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const double ws = weight_sum(y, x);
            for (int c = 0; c < nch; ++c) {
                // No usable weight: pass the target pixel through.
                out.channels[c](y, x) = ws > 0.0
                    ? static_cast<float>(accum[c](y, x) / ws)
                    : target->channels[c](y, x);
            }
        }
    }
    return out;
}

} // namespace deflicker::blending
