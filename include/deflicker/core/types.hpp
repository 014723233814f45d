#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace deflicker {

namespace fs = std::filesystem;

// Plane types (row-major, matches decoder memory layout)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Di = Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

struct FrameGeometry {
    int width = 0;
    int height = 0;
    int channels = 0;

    bool operator==(const FrameGeometry& o) const {
        return width == o.width && height == o.height && channels == o.channels;
    }
    bool operator!=(const FrameGeometry& o) const { return !(*this == o); }
};

inline std::string geometry_to_string(const FrameGeometry& g) {
    return std::to_string(g.width) + "x" + std::to_string(g.height) + "x" +
           std::to_string(g.channels);
}

// One decoded frame: a float plane per channel, samples on a 0..255 scale.
struct Frame {
    int index = -1;
    std::vector<Matrix2Df> channels;

    int width() const { return channels.empty() ? 0 : static_cast<int>(channels[0].cols()); }
    int height() const { return channels.empty() ? 0 : static_cast<int>(channels[0].rows()); }
    int num_channels() const { return static_cast<int>(channels.size()); }

    FrameGeometry geometry() const { return FrameGeometry{width(), height(), num_channels()}; }

    size_t byte_size() const {
        return static_cast<size_t>(width()) * static_cast<size_t>(height()) *
               channels.size() * sizeof(float);
    }
};

using FramePtr = std::shared_ptr<const Frame>;

// Contiguous slice of target frames, inclusive bounds.
struct Batch {
    int index = 0;
    int first_frame = 0;
    int last_frame = -1;

    int size() const { return last_frame - first_frame + 1; }
};

// Processing phases reported in progress events
enum class Phase {
    LOAD_FRAMES = 0,
    SEARCH_AND_BLEND = 1,
    COMMIT = 2
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_FRAMES: return "LOAD_FRAMES";
        case Phase::SEARCH_AND_BLEND: return "SEARCH_AND_BLEND";
        case Phase::COMMIT: return "COMMIT";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace deflicker
