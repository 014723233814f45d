#pragma once

#include "deflicker/core/mode_profile.hpp"
#include "deflicker/core/types.hpp"
#include "deflicker/pipeline/frame_source.hpp"

#include <exception>
#include <map>

namespace deflicker::pipeline {

// Working set of decoded, validated frames.
//
// ResidentAll loads the whole sequence on the first prepare() and keeps it;
// a frame that failed to load is reported when a range containing it is
// prepared. PerBatch keeps exactly the prepared range and evicts everything
// else before loading.
class FrameCache {
public:
    FrameCache(const FrameSource& source, core::MemoryStrategy strategy,
               const FrameGeometry& geometry, bool reject_blank);

    FrameCache(const FrameCache&) = delete;
    FrameCache& operator=(const FrameCache&) = delete;

    // Makes [first, last] resident. Throws DataError for the lowest failing
    // index in the range.
    void prepare(int first, int last);

    // nullptr when `index` is not resident.
    FramePtr get(int index) const;

    size_t resident_count() const { return resident_.size(); }
    size_t peak_resident() const { return peak_resident_; }
    size_t resident_bytes() const;

    void clear();

private:
    FramePtr load_validated(int index) const;
    void note_peak();

    const FrameSource& source_;
    core::MemoryStrategy strategy_;
    FrameGeometry geometry_;
    bool reject_blank_;
    bool preloaded_ = false;
    std::map<int, FramePtr> resident_;
    std::map<int, std::exception_ptr> failures_;
    size_t peak_resident_ = 0;
};

} // namespace deflicker::pipeline
