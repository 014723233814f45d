#include "deflicker/pipeline/frame_cache.hpp"
#include "deflicker/core/errors.hpp"

#include <algorithm>

namespace deflicker::pipeline {

FrameCache::FrameCache(const FrameSource& source, core::MemoryStrategy strategy,
                       const FrameGeometry& geometry, bool reject_blank)
    : source_(source), strategy_(strategy), geometry_(geometry), reject_blank_(reject_blank) {}

FramePtr FrameCache::load_validated(int index) const {
    Frame frame = source_.load(index);
    frame.index = index;
    validate_frame(frame, &geometry_, reject_blank_);
    return std::make_shared<const Frame>(std::move(frame));
}

void FrameCache::note_peak() {
    peak_resident_ = std::max(peak_resident_, resident_.size());
}

void FrameCache::prepare(int first, int last) {
    first = std::max(first, 0);
    last = std::min(last, source_.size() - 1);

    if (strategy_ == core::MemoryStrategy::ResidentAll) {
        if (!preloaded_) {
            for (int i = 0; i < source_.size(); ++i) {
                try {
                    resident_[i] = load_validated(i);
                } catch (const DataError&) {
                    failures_[i] = std::current_exception();
                }
            }
            preloaded_ = true;
            note_peak();
        }
        auto failed = failures_.lower_bound(first);
        if (failed != failures_.end() && failed->first <= last) {
            std::rethrow_exception(failed->second);
        }
        return;
    }

    for (auto it = resident_.begin(); it != resident_.end();) {
        if (it->first < first || it->first > last) {
            it = resident_.erase(it);
        } else {
            ++it;
        }
    }
    for (int i = first; i <= last; ++i) {
        if (resident_.count(i) == 0) {
            resident_[i] = load_validated(i);
            note_peak();
        }
    }
}

FramePtr FrameCache::get(int index) const {
    auto it = resident_.find(index);
    return it == resident_.end() ? nullptr : it->second;
}

size_t FrameCache::resident_bytes() const {
    size_t total = 0;
    for (const auto& kv : resident_) {
        total += kv.second->byte_size();
    }
    return total;
}

void FrameCache::clear() {
    resident_.clear();
    failures_.clear();
    preloaded_ = false;
}

} // namespace deflicker::pipeline
