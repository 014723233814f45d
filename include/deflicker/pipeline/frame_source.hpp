#pragma once

#include "deflicker/core/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace deflicker::pipeline {

// Ordered, random-access frame supplier. load() throws DataError naming
// the index when the frame cannot be produced.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual int size() const = 0;
    virtual Frame load(int index) const = 0;
    virtual std::string describe() const = 0;
};

class MemoryFrameSource : public FrameSource {
public:
    explicit MemoryFrameSource(std::vector<Frame> frames);

    int size() const override { return static_cast<int>(frames_.size()); }
    Frame load(int index) const override;
    std::string describe() const override;

private:
    std::vector<Frame> frames_;
};

// Image sequence on disk, ordered by file name.
class DirectoryFrameSource : public FrameSource {
public:
    DirectoryFrameSource(const fs::path& dir, const std::string& pattern);

    int size() const override { return static_cast<int>(paths_.size()); }
    Frame load(int index) const override;
    std::string describe() const override;

    const std::vector<fs::path>& paths() const { return paths_; }

private:
    fs::path dir_;
    std::vector<fs::path> paths_;
};

// Receives the blended frames of one batch. commit_batch is all or nothing:
// when it throws, none of the batch's frames are visible in the output.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual void commit_batch(const Batch& batch, const std::vector<Frame>& frames) = 0;
};

class MemoryFrameSink : public FrameSink {
public:
    void commit_batch(const Batch& batch, const std::vector<Frame>& frames) override;

    const std::map<int, Frame>& frames() const { return frames_; }
    const std::vector<int>& committed_batches() const { return committed_; }

private:
    std::map<int, Frame> frames_;
    std::vector<int> committed_;
};

class DirectoryFrameSink : public FrameSink {
public:
    DirectoryFrameSink(const fs::path& dir, const std::string& format, const std::string& prefix);

    void commit_batch(const Batch& batch, const std::vector<Frame>& frames) override;

    fs::path output_path(int frame_index) const;

private:
    fs::path dir_;
    fs::path staging_dir_;
    std::string extension_;
    std::string prefix_;
};

// Throws DataError for an empty frame, non-finite samples, a geometry that
// differs from `expected` (when given) and, if reject_blank, an all-zero frame.
void validate_frame(const Frame& frame, const FrameGeometry* expected, bool reject_blank);

} // namespace deflicker::pipeline
