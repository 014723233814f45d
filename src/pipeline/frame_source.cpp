#include "deflicker/pipeline/frame_source.hpp"
#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"
#include "deflicker/io/frame_io.hpp"

#include <cmath>
#include <system_error>
#include <iomanip>
#include <sstream>
#include <utility>

namespace deflicker::pipeline {

MemoryFrameSource::MemoryFrameSource(std::vector<Frame> frames) : frames_(std::move(frames)) {}

Frame MemoryFrameSource::load(int index) const {
    if (index < 0 || index >= size()) {
        throw DataError(index, "frame index outside sequence of " + std::to_string(size()) +
                                   " frames");
    }
    Frame f = frames_[static_cast<size_t>(index)];
    f.index = index;
    return f;
}

std::string MemoryFrameSource::describe() const {
    return "memory sequence (" + std::to_string(frames_.size()) + " frames)";
}

DirectoryFrameSource::DirectoryFrameSource(const fs::path& dir, const std::string& pattern)
    : dir_(dir) {
    if (!fs::is_directory(dir_)) {
        throw IOError("input directory not found: " + dir_.string());
    }
    paths_ = core::discover_frames(dir_, pattern);
}

Frame DirectoryFrameSource::load(int index) const {
    if (index < 0 || index >= size()) {
        throw DataError(index, "frame index outside sequence of " + std::to_string(size()) +
                                   " frames");
    }
    const fs::path& p = paths_[static_cast<size_t>(index)];
    try {
        return io::read_frame(p, index);
    } catch (const IOError& e) {
        throw DataError(index, "cannot read " + p.filename().string() + ": " + e.what());
    }
}

std::string DirectoryFrameSource::describe() const {
    return dir_.string() + " (" + std::to_string(paths_.size()) + " frames)";
}

void MemoryFrameSink::commit_batch(const Batch& batch, const std::vector<Frame>& frames) {
    if (static_cast<int>(frames.size()) != batch.size()) {
        throw IOError("batch " + std::to_string(batch.index) + " expects " +
                      std::to_string(batch.size()) + " frames, got " +
                      std::to_string(frames.size()));
    }
    for (const auto& f : frames) {
        frames_[f.index] = f;
    }
    committed_.push_back(batch.index);
}

DirectoryFrameSink::DirectoryFrameSink(const fs::path& dir, const std::string& format,
                                       const std::string& prefix)
    : dir_(dir), staging_dir_(dir / ".staging"), extension_(io::extension_for_format(format)),
      prefix_(prefix) {}

fs::path DirectoryFrameSink::output_path(int frame_index) const {
    std::ostringstream name;
    name << prefix_ << std::setw(6) << std::setfill('0') << frame_index << extension_;
    return dir_ / name.str();
}

void DirectoryFrameSink::commit_batch(const Batch& batch, const std::vector<Frame>& frames) {
    if (static_cast<int>(frames.size()) != batch.size()) {
        throw IOError("batch " + std::to_string(batch.index) + " expects " +
                      std::to_string(batch.size()) + " frames, got " +
                      std::to_string(frames.size()));
    }
    fs::create_directories(staging_dir_);

    std::vector<std::pair<fs::path, fs::path>> staged;
    staged.reserve(frames.size());
    auto discard_staged = [&staged]() {
        std::error_code ec;
        for (const auto& s : staged) {
            fs::remove(s.first, ec);
        }
    };

    try {
        for (const auto& f : frames) {
            const fs::path final_path = output_path(f.index);
            const fs::path tmp = staging_dir_ / final_path.filename();
            staged.emplace_back(tmp, final_path);
            io::write_frame(tmp, f);
        }
    } catch (...) {
        discard_staged();
        throw;
    }

    // Every destination must be a replaceable file before anything moves.
    for (const auto& s : staged) {
        std::error_code ec;
        const fs::file_status st = fs::symlink_status(s.second, ec);
        if (fs::exists(st) && !fs::is_regular_file(st)) {
            discard_staged();
            throw IOError("cannot publish " + s.second.string() + ": not a regular file");
        }
    }

    // Prior outputs are moved aside so that a failed publish can restore them.
    std::vector<std::pair<fs::path, fs::path>> backups;
    std::vector<fs::path> published;
    auto roll_back = [&]() {
        std::error_code ec;
        for (const auto& p : published) {
            fs::remove(p, ec);
        }
        for (const auto& b : backups) {
            fs::rename(b.first, b.second, ec);
        }
        discard_staged();
    };

    for (const auto& s : staged) {
        std::error_code ec;
        if (fs::exists(s.second, ec)) {
            fs::path backup = s.first;
            backup += ".prev";
            fs::rename(s.second, backup, ec);
            if (ec) {
                roll_back();
                throw IOError("cannot move aside " + s.second.string() + ": " + ec.message());
            }
            backups.emplace_back(backup, s.second);
        }
        fs::rename(s.first, s.second, ec);
        if (ec) {
            roll_back();
            throw IOError("cannot move " + s.first.string() + " to " + s.second.string() +
                          ": " + ec.message());
        }
        published.push_back(s.second);
    }

    std::error_code ec;
    for (const auto& b : backups) {
        fs::remove(b.first, ec);
    }
}

void validate_frame(const Frame& frame, const FrameGeometry* expected, bool reject_blank) {
    if (frame.num_channels() == 0 || frame.width() == 0 || frame.height() == 0) {
        throw DataError(frame.index, "frame is empty");
    }
    for (const auto& plane : frame.channels) {
        if (plane.rows() != frame.height() || plane.cols() != frame.width()) {
            throw DataError(frame.index, "channel planes differ in size");
        }
    }
    if (expected && frame.geometry() != *expected) {
        throw DataError(frame.index, "geometry " + geometry_to_string(frame.geometry()) +
                                         " does not match sequence geometry " +
                                         geometry_to_string(*expected));
    }

    bool any_nonzero = false;
    for (const auto& plane : frame.channels) {
        const float* p = plane.data();
        for (Eigen::Index i = 0; i < plane.size(); ++i) {
            if (!std::isfinite(p[i])) {
                throw DataError(frame.index, "frame contains non-finite samples");
            }
            if (p[i] != 0.0f) any_nonzero = true;
        }
    }
    if (reject_blank && !any_nonzero) {
        throw DataError(frame.index, "frame is blank (all samples are zero)");
    }
}

} // namespace deflicker::pipeline
