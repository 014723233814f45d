#pragma once

#include "deflicker/blending/temporal_blend.hpp"
#include "deflicker/config/configuration.hpp"
#include "deflicker/core/events.hpp"
#include "deflicker/core/mode_profile.hpp"
#include "deflicker/core/types.hpp"
#include "deflicker/pipeline/checkpoint.hpp"
#include "deflicker/pipeline/frame_cache.hpp"
#include "deflicker/pipeline/frame_source.hpp"

#include <atomic>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace deflicker::pipeline {

enum class SchedulerState {
    NotStarted,
    BatchInFlight,
    BatchCommitted,
    Complete,
    Failed,
};

std::string scheduler_state_to_string(SchedulerState state);

struct RunSummary {
    SchedulerState state = SchedulerState::NotStarted;
    int num_frames = 0;
    int total_batches = 0;
    int skipped_batches = 0;
    int processed_batches = 0;
    int last_committed_batch = -1;
    size_t peak_resident_frames = 0;
    std::string fingerprint;
    core::EngineParams params;
};

// Contiguous batches covering [0, num_frames) without gaps or overlap.
std::vector<Batch> partition_batches(int num_frames, int batch_size);

// Upper estimate of the bytes held while one batch is in flight.
size_t estimate_batch_bytes(const core::EngineParams& params, const FrameGeometry& geometry,
                            int resident_frames, int workers, bool has_guide);

matching::PatchMatchParams make_match_params(const core::EngineParams& params, bool has_guide);

// Drives the batch state machine: resolves the engine parameters from the
// first frame, resumes from the checkpoint, then searches, blends and
// commits one batch at a time. Errors inside a batch leave the checkpoint at
// the previous batch and are rethrown with the batch attached.
class BatchScheduler {
public:
    using BatchCallback = std::function<void(const Batch&)>;

    BatchScheduler(const config::Config& cfg, const FrameSource& frames, FrameSink& sink,
                   CheckpointStore& checkpoint, std::ostream& events,
                   const FrameSource* guides = nullptr, std::string run_id = std::string());

    // Polled at batch start and between frames; setting it yields
    // StopRequested for the batch in flight.
    void set_stop_flag(const std::atomic<bool>* stop) { stop_ = stop; }
    void on_batch_committed(BatchCallback cb) { on_committed_ = std::move(cb); }

    RunSummary run();

    SchedulerState state() const { return state_; }
    int current_batch() const { return current_batch_; }
    const std::string& run_id() const { return run_id_; }

private:
    std::vector<Frame> process_batch(const Batch& batch, FrameCache& cache, FrameCache* guide_cache,
                                     const blending::TemporalBlender& blender);
    void check_memory_budget(const Batch& batch, int first, int last) const;
    void fail_batch(const Batch& batch, const std::string& cause, const std::string& message);
    bool stop_requested() const { return stop_ && stop_->load(); }

    config::Config cfg_;
    const FrameSource& frames_;
    FrameSink& sink_;
    CheckpointStore& checkpoint_;
    std::ostream& events_;
    const FrameSource* guides_;
    std::string run_id_;

    const std::atomic<bool>* stop_ = nullptr;
    BatchCallback on_committed_;

    core::EventEmitter emitter_;
    SchedulerState state_ = SchedulerState::NotStarted;
    int current_batch_ = -1;

    // Resolved at run start.
    core::EngineParams params_;
    FrameGeometry geometry_;
    int num_frames_ = 0;
    blending::WindowAlignment alignment_ = blending::WindowAlignment::Centered;
};

} // namespace deflicker::pipeline
