#include "deflicker/matching/patch_match.hpp"
#include "deflicker/core/errors.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

namespace deflicker::matching {

namespace {

inline int clamp_index(int v, int hi) {
    return v < 0 ? 0 : (v > hi ? hi : v);
}

Frame downscale_frame(const Frame& frame) {
    Frame out;
    out.index = frame.index;
    out.channels.reserve(frame.channels.size());
    const int cols = frame.width();
    const int rows = frame.height();
    const cv::Size target((cols + 1) / 2, (rows + 1) / 2);
    for (const auto& plane : frame.channels) {
        cv::Mat src(rows, cols, CV_32F, const_cast<float*>(plane.data()));
        cv::Mat dst;
        cv::resize(src, dst, target, 0.0, 0.0, cv::INTER_AREA);
        Matrix2Df result(dst.rows, dst.cols);
        std::memcpy(result.data(), dst.ptr<float>(0),
                    static_cast<size_t>(dst.rows) * static_cast<size_t>(dst.cols) * sizeof(float));
        out.channels.push_back(std::move(result));
    }
    return out;
}

} // namespace

uint64_t derive_seed(uint64_t base_seed, int source_index, int reference_index) {
    uint64_t z = base_seed;
    z ^= static_cast<uint64_t>(static_cast<uint32_t>(source_index)) * 0x9E3779B97F4A7C15ULL;
    z ^= static_cast<uint64_t>(static_cast<uint32_t>(reference_index)) * 0xC2B2AE3D27D4EB4FULL;
    // splitmix64 finalizer
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

float patch_cost(const Frame& source, const Frame& reference,
                 const PatchDescriptor& patch, int ref_x, int ref_y) {
    const int rw = reference.width();
    const int rh = reference.height();
    if (ref_x < 0 || ref_y < 0 || ref_x >= rw || ref_y >= rh) {
        return kInvalidCost;
    }
    const int sw = source.width();
    const int sh = source.height();
    const int r = patch.radius();
    const int nch = std::min(source.num_channels(), reference.num_channels());
    if (nch == 0) {
        return kInvalidCost;
    }

    double sum = 0.0;
    for (int c = 0; c < nch; ++c) {
        const float* s = source.channels[c].data();
        const float* ref = reference.channels[c].data();
        for (int ky = -r; ky <= r; ++ky) {
            const float* srow = s + static_cast<size_t>(clamp_index(patch.y + ky, sh - 1)) * sw;
            const float* rrow = ref + static_cast<size_t>(clamp_index(ref_y + ky, rh - 1)) * rw;
            for (int kx = -r; kx <= r; ++kx) {
                const float d = srow[clamp_index(patch.x + kx, sw - 1)] -
                                rrow[clamp_index(ref_x + kx, rw - 1)];
                sum += static_cast<double>(d) * d;
            }
        }
    }
    const double taps = static_cast<double>(patch.size) * patch.size * nch;
    return static_cast<float>(sum / taps);
}

PatchMatcher::PatchMatcher(const PatchMatchParams& params) : params_(params) {
    if (params_.patch_size < 1 || (params_.patch_size % 2) == 0) {
        throw ConfigurationError("patch size must be a positive odd integer");
    }
    if (params_.num_iter < 1 || params_.pyramid_levels < 1 || params_.refinement_passes < 0) {
        throw ConfigurationError("invalid PatchMatch iteration parameters");
    }
}

float PatchMatcher::evaluate(const MatchLevel& level, int x, int y, int dx, int dy) const {
    const PatchDescriptor patch{x, y, level.patch_size};
    const float c = patch_cost(level.source, level.reference, patch, x + dx, y + dy);
    if (!std::isfinite(c) || level.source_guide.num_channels() == 0) {
        return c;
    }
    const float g = patch_cost(level.source_guide, level.reference_guide, patch, x + dx, y + dy);
    const float gw = params_.guide_weight;
    return (gw * g + c) / (gw + 1.0f);
}

std::vector<MatchLevel> PatchMatcher::build_pyramid(const Frame& source, const Frame& reference,
                                                    const Frame* source_guide,
                                                    const Frame* reference_guide,
                                                    int max_levels) const {
    std::vector<MatchLevel> levels;
    MatchLevel base;
    base.source = source;
    base.reference = reference;
    if (source_guide && reference_guide) {
        base.source_guide = *source_guide;
        base.reference_guide = *reference_guide;
    }
    base.patch_size = params_.patch_size;
    levels.push_back(std::move(base));

    for (int l = 1; l < max_levels; ++l) {
        const MatchLevel& prev = levels.back();
        const int patch = params_.patch_size + 2 * l;
        const int w = (prev.source.width() + 1) / 2;
        const int h = (prev.source.height() + 1) / 2;
        if (std::min(w, h) < patch) {
            break;
        }
        MatchLevel next;
        next.source = downscale_frame(prev.source);
        next.reference = downscale_frame(prev.reference);
        if (prev.source_guide.num_channels() > 0) {
            next.source_guide = downscale_frame(prev.source_guide);
            next.reference_guide = downscale_frame(prev.reference_guide);
        }
        next.patch_size = patch;
        levels.push_back(std::move(next));
    }
    return levels;
}

CorrespondenceField PatchMatcher::initialize(const MatchLevel& level, Rng& rng) const {
    const int rows = level.source.height();
    const int cols = level.source.width();
    CorrespondenceField field = CorrespondenceField::identity(rows, cols);

    if (params_.init == core::InitMode::Random) {
        std::uniform_int_distribution<int> dist_x(0, level.reference.width() - 1);
        std::uniform_int_distribution<int> dist_y(0, level.reference.height() - 1);
        for (int y = 0; y < rows; ++y) {
            for (int x = 0; x < cols; ++x) {
                const int qx = dist_x(rng);
                const int qy = dist_y(rng);
                field.offset_x(y, x) = qx - x;
                field.offset_y(y, x) = qy - y;
            }
        }
    }

    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            field.cost(y, x) = evaluate(level, x, y, field.offset_x(y, x), field.offset_y(y, x));
        }
    }
    return field;
}

void PatchMatcher::evaluate_warm_start(const MatchLevel& level, CorrespondenceField& field) const {
    const int rw = level.reference.width();
    const int rh = level.reference.height();
    for (int y = 0; y < field.rows(); ++y) {
        for (int x = 0; x < field.cols(); ++x) {
            const int qx = x + field.offset_x(y, x);
            const int qy = y + field.offset_y(y, x);
            if (qx < 0 || qy < 0 || qx >= rw || qy >= rh) {
                field.offset_x(y, x) = 0;
                field.offset_y(y, x) = 0;
            }
            field.cost(y, x) = evaluate(level, x, y, field.offset_x(y, x), field.offset_y(y, x));
        }
    }
}

void PatchMatcher::refine(const MatchLevel& level, CorrespondenceField& field, int iterations,
                          Rng& rng) const {
    const int rows = field.rows();
    const int cols = field.cols();
    const int max_radius = std::max(level.reference.width(), level.reference.height());

    // Double buffer: every pixel of iteration t reads only iteration t-1.
    CorrespondenceField next = field;

    for (int it = 0; it < iterations; ++it) {
        const int step = (it % 2 == 0) ? -1 : 1;

        for (int y = 0; y < rows; ++y) {
            for (int x = 0; x < cols; ++x) {
                int best_dx = field.offset_x(y, x);
                int best_dy = field.offset_y(y, x);
                float best_cost = field.cost(y, x);

                auto try_candidate = [&](int dx, int dy) {
                    if (dx == best_dx && dy == best_dy) return;
                    const float c = evaluate(level, x, y, dx, dy);
                    if (c < best_cost) {
                        best_cost = c;
                        best_dx = dx;
                        best_dy = dy;
                    }
                };

                const int nx = x + step;
                if (nx >= 0 && nx < cols) {
                    try_candidate(field.offset_x(y, nx), field.offset_y(y, nx));
                }
                const int ny = y + step;
                if (ny >= 0 && ny < rows) {
                    try_candidate(field.offset_x(ny, x), field.offset_y(ny, x));
                }

                for (int radius = max_radius; radius >= 1; radius /= 2) {
                    std::uniform_int_distribution<int> dist(-radius, radius);
                    const int jx = dist(rng);
                    const int jy = dist(rng);
                    try_candidate(best_dx + jx, best_dy + jy);
                }

                next.offset_x(y, x) = best_dx;
                next.offset_y(y, x) = best_dy;
                next.cost(y, x) = best_cost;
            }
        }
        std::swap(field, next);
    }
}

CorrespondenceField PatchMatcher::match(const Frame& source, const Frame& reference, Rng& rng,
                                        const Frame* source_guide,
                                        const Frame* reference_guide,
                                        const CorrespondenceField* initial) const {
    const int p = params_.patch_size;
    if (reference.width() < p || reference.height() < p) {
        throw ConfigurationError("reference frame " + std::to_string(reference.width()) + "x" +
                                 std::to_string(reference.height()) +
                                 " is smaller than one patch of size " + std::to_string(p));
    }
    if (source.geometry() != reference.geometry()) {
        throw DataError(reference.index, "geometry " + geometry_to_string(reference.geometry()) +
                                             " does not match frame " + std::to_string(source.index) +
                                             " (" + geometry_to_string(source.geometry()) + ")");
    }
    if ((source_guide == nullptr) != (reference_guide == nullptr)) {
        throw ConfigurationError("guide frames must be supplied for both source and reference");
    }
    if (source_guide) {
        for (const Frame* g : {source_guide, reference_guide}) {
            if (g->width() != source.width() || g->height() != source.height() ||
                g->num_channels() != source_guide->num_channels() || g->num_channels() == 0) {
                throw DataError(g->index, "guide frame geometry " + geometry_to_string(g->geometry()) +
                                              " does not match " + geometry_to_string(source.geometry()));
            }
        }
    }

    if (initial) {
        if (initial->rows() != source.height() || initial->cols() != source.width()) {
            throw DeflickerError("initial field " + std::to_string(initial->cols()) + "x" +
                                 std::to_string(initial->rows()) + " does not match frame " +
                                 std::to_string(source.index));
        }
        std::vector<MatchLevel> base =
            build_pyramid(source, reference, source_guide, reference_guide, 1);
        CorrespondenceField field = *initial;
        evaluate_warm_start(base[0], field);
        refine(base[0], field, params_.num_iter + params_.refinement_passes, rng);
        return field;
    }

    std::vector<MatchLevel> pyramid =
        build_pyramid(source, reference, source_guide, reference_guide, params_.pyramid_levels);

    const int coarsest = static_cast<int>(pyramid.size()) - 1;
    CorrespondenceField field = initialize(pyramid[coarsest], rng);
    refine(pyramid[coarsest], field,
           params_.num_iter + (coarsest == 0 ? params_.refinement_passes : 0), rng);

    for (int l = coarsest - 1; l >= 0; --l) {
        const MatchLevel& level = pyramid[l];
        field = upsample_field(field, level.source.height(), level.source.width());
        evaluate_warm_start(level, field);
        refine(level, field, params_.num_iter + (l == 0 ? params_.refinement_passes : 0), rng);
    }
    return field;
}

} // namespace deflicker::matching
