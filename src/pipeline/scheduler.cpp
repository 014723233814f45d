#include "deflicker/pipeline/scheduler.hpp"
#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"

#include <opencv2/core.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <new>
#include <thread>

namespace deflicker::pipeline {

std::string scheduler_state_to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::NotStarted: return "NotStarted";
        case SchedulerState::BatchInFlight: return "BatchInFlight";
        case SchedulerState::BatchCommitted: return "BatchCommitted";
        case SchedulerState::Complete: return "Complete";
        case SchedulerState::Failed: return "Failed";
        default: return "Unknown";
    }
}

std::vector<Batch> partition_batches(int num_frames, int batch_size) {
    if (batch_size < 1) {
        throw ConfigurationError("batch_size must be a positive integer");
    }
    std::vector<Batch> batches;
    for (int first = 0, idx = 0; first < num_frames; first += batch_size, ++idx) {
        Batch b;
        b.index = idx;
        b.first_frame = first;
        b.last_frame = std::min(num_frames - 1, first + batch_size - 1);
        batches.push_back(b);
    }
    return batches;
}

size_t estimate_batch_bytes(const core::EngineParams& params, const FrameGeometry& geometry,
                            int resident_frames, int workers, bool has_guide) {
    const size_t px = static_cast<size_t>(geometry.width) * static_cast<size_t>(geometry.height);
    const size_t frame_bytes = px * static_cast<size_t>(geometry.channels) * sizeof(float);
    const size_t streams = has_guide ? 2 : 1;

    const size_t resident = static_cast<size_t>(std::max(resident_frames, 0)) * frame_bytes * streams;

    // Source and reference pyramids (level 0 copy plus coarser levels),
    // double-buffered field (plus one tracked field per side), remapped frame
    // and the blend accumulators.
    const size_t pyramid = 2 * streams * frame_bytes * 4 / 3;
    const size_t fields = params.tracking_window_size > 0 ? 4 : 2;
    const size_t field = fields * px * (2 * sizeof(int) + sizeof(float));
    const size_t remap = frame_bytes + px * sizeof(float);
    const size_t accum = px * static_cast<size_t>(geometry.channels) * sizeof(double) +
                         px * sizeof(double);
    const size_t per_worker = pyramid + field + remap + accum;

    const size_t outputs = static_cast<size_t>(std::max(params.batch_size, 0)) * frame_bytes;
    return resident + static_cast<size_t>(std::max(workers, 1)) * per_worker + outputs;
}

matching::PatchMatchParams make_match_params(const core::EngineParams& params, bool has_guide) {
    matching::PatchMatchParams mp;
    mp.patch_size = params.minimum_patch_size;
    mp.num_iter = params.num_iter;
    mp.pyramid_levels = params.pyramid_levels;
    mp.refinement_passes = params.refinement_passes;
    mp.guide_weight = has_guide ? params.guide_weight : 0.0f;
    mp.init = params.init;
    return mp;
}

BatchScheduler::BatchScheduler(const config::Config& cfg, const FrameSource& frames,
                               FrameSink& sink, CheckpointStore& checkpoint,
                               std::ostream& events, const FrameSource* guides,
                               std::string run_id)
    : cfg_(cfg), frames_(frames), sink_(sink), checkpoint_(checkpoint), events_(events),
      guides_(guides), run_id_(run_id.empty() ? core::get_run_id() : std::move(run_id)) {}

void BatchScheduler::fail_batch(const Batch& batch, const std::string& cause,
                                const std::string& message) {
    state_ = SchedulerState::Failed;
    current_batch_ = batch.index;
    std::cerr << "[BATCH] batch " << batch.index << " failed (" << cause << "): " << message
              << std::endl;
    emitter_.batch_failed(run_id_, batch, cause, message, events_);
    emitter_.run_end(run_id_, false, cause, events_);
    checkpoint_.close(false);
}

void BatchScheduler::check_memory_budget(const Batch& batch, int first, int last) const {
    if (cfg_.runtime_limits.memory_budget_mb <= 0) {
        return;
    }
    const size_t budget = static_cast<size_t>(cfg_.runtime_limits.memory_budget_mb) * 1024 * 1024;
    const int resident = params_.memory == core::MemoryStrategy::ResidentAll
                             ? num_frames_
                             : last - first + 1;
    const int workers = core::compute_worker_count(cfg_.runtime_limits.parallel_workers,
                                                   static_cast<size_t>(batch.size()));
    const size_t need = estimate_batch_bytes(params_, geometry_, resident, workers,
                                             guides_ != nullptr);
    if (need > budget) {
        throw ResourceExhaustion(batch.index, params_.batch_size,
                                 "estimated working set of " + std::to_string(need / (1024 * 1024)) +
                                     " MiB exceeds memory_budget_mb=" +
                                     std::to_string(cfg_.runtime_limits.memory_budget_mb),
                                 need, budget);
    }
}

std::vector<Frame> BatchScheduler::process_batch(const Batch& batch, FrameCache& cache,
                                                 FrameCache* guide_cache,
                                                 const blending::TemporalBlender& blender) {
    const auto span = blending::window_span(batch, params_.window_size, num_frames_, alignment_);
    check_memory_budget(batch, span.first, span.second);

    emitter_.phase_progress(run_id_, Phase::LOAD_FRAMES,
                            static_cast<float>(batch.index) / static_cast<float>(
                                std::max(1, (num_frames_ + params_.batch_size - 1) / params_.batch_size)),
                            "frames " + std::to_string(span.first) + "-" +
                                std::to_string(span.second),
                            events_);
    cache.prepare(span.first, span.second);
    if (guide_cache) {
        guide_cache->prepare(span.first, span.second);
    }
    std::cerr << "[BATCH] " << cache.resident_count() << " frames resident ("
              << (cache.resident_bytes() / (1024 * 1024)) << " MiB)" << std::endl;

    const int targets = batch.size();
    std::vector<Frame> outputs(static_cast<size_t>(targets));
    std::vector<std::exception_ptr> errors(static_cast<size_t>(targets));

    const blending::FrameLookup frame_at = [&cache](int i) { return cache.get(i); };
    blending::FrameLookup guide_at;
    if (guide_cache) {
        guide_at = [guide_cache](int i) { return guide_cache->get(i); };
    }

    std::atomic<int> next{0};
    std::mutex events_mutex;
    auto worker = [&]() {
        for (;;) {
            const int t = next.fetch_add(1);
            if (t >= targets) break;
            const int idx = batch.first_frame + t;
            if (stop_requested()) {
                errors[t] = std::make_exception_ptr(StopRequested(batch.index));
                continue;
            }
            try {
                const blending::BlendWindow window = blending::make_blend_window(
                    idx, params_.window_size, num_frames_, alignment_);
                outputs[t] = blender.blend(window, frame_at, guide_at);
                std::lock_guard<std::mutex> lock(events_mutex);
                emitter_.frame_processed(run_id_, Phase::SEARCH_AND_BLEND, idx, num_frames_,
                                         events_);
            } catch (...) {
                errors[t] = std::current_exception();
            }
        }
    };

    const int workers = core::compute_worker_count(cfg_.runtime_limits.parallel_workers,
                                                   static_cast<size_t>(targets));
    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(workers));
        for (int w = 0; w < workers; ++w) {
            pool.emplace_back(worker);
        }
        for (auto& th : pool) {
            th.join();
        }
    }

    // Lowest frame index wins, independent of thread timing.
    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
    return outputs;
}

RunSummary BatchScheduler::run() {
    state_ = SchedulerState::NotStarted;
    current_batch_ = -1;

    cfg_.validate();
    alignment_ = blending::parse_window_alignment(cfg_.blending.window_alignment);

    num_frames_ = frames_.size();
    if (num_frames_ == 0) {
        throw DataError(0, "input sequence contains no frames");
    }

    emitter_.phase_start(run_id_, Phase::LOAD_FRAMES, "geometry", events_);
    try {
        geometry_ = frames_.load(0).geometry();
    } catch (const DataError& e) {
        state_ = SchedulerState::Failed;
        current_batch_ = 0;
        throw DataError(e.frame_index(), e.detail(), 0);
    }
    if (geometry_.width == 0 || geometry_.height == 0 || geometry_.channels == 0) {
        state_ = SchedulerState::Failed;
        current_batch_ = 0;
        throw DataError(0, "frame is empty", 0);
    }

    params_ = cfg_.engine_params(core::ResolutionHint{geometry_.width, geometry_.height});

    const bool has_guide = guides_ != nullptr;
    FrameGeometry guide_geometry;
    if (has_guide) {
        if (guides_->size() != num_frames_) {
            throw ConfigurationError("guide sequence has " + std::to_string(guides_->size()) +
                                     " frames, expected " + std::to_string(num_frames_));
        }
        guide_geometry = guides_->load(0).geometry();
        if (guide_geometry.width != geometry_.width || guide_geometry.height != geometry_.height) {
            throw ConfigurationError("guide geometry " + geometry_to_string(guide_geometry) +
                                     " does not match " + geometry_to_string(geometry_));
        }
    }
    emitter_.phase_end(run_id_, Phase::LOAD_FRAMES, "ok",
                       {{"frames", num_frames_}, {"geometry", geometry_to_string(geometry_)}},
                       events_);

    if (params_.window_size > num_frames_) {
        emitter_.warning(run_id_,
                         "window_size " + std::to_string(params_.window_size) +
                             " exceeds the sequence length " + std::to_string(num_frames_) +
                             "; windows are truncated",
                         events_);
    }

    const std::vector<Batch> batches = partition_batches(num_frames_, params_.batch_size);
    const int total = static_cast<int>(batches.size());

    RunSummary summary;
    summary.num_frames = num_frames_;
    summary.total_batches = total;
    summary.params = params_;
    summary.fingerprint = compute_config_fingerprint(params_, cfg_.blending, geometry_,
                                                     num_frames_, has_guide);

    emitter_.run_start(run_id_,
                       {{"source", frames_.describe()},
                        {"frames", num_frames_},
                        {"batches", total},
                        {"mode", core::mode_to_string(params_.mode)},
                        {"memory", core::memory_strategy_to_string(params_.memory)},
                        {"num_iter", params_.num_iter},
                        {"window_size", params_.window_size},
                        {"batch_size", params_.batch_size},
                        {"patch_size", params_.minimum_patch_size},
                        {"pyramid_levels", params_.pyramid_levels},
                        {"tracking_window_size", params_.tracking_window_size},
                        {"weighting", blending::weighting_to_string(
                                          blending::parse_weighting(cfg_.blending.weighting))},
                        {"window_alignment", blending::window_alignment_to_string(alignment_)},
                        {"fingerprint", summary.fingerprint}},
                       events_);
    std::cerr << "[RUN] " << num_frames_ << " frames " << geometry_to_string(geometry_)
              << ", mode=" << core::mode_to_string(params_.mode) << ", " << total
              << " batches of " << params_.batch_size << std::endl;

    Checkpoint expected;
    expected.fingerprint = summary.fingerprint;
    expected.mode = core::mode_to_string(params_.mode);
    expected.total_batches = total;
    expected.num_frames = num_frames_;
    expected.batch_size = params_.batch_size;

    const ResumeDecision resume = checkpoint_.open(expected);
    if (resume.loaded) {
        emitter_.checkpoint_loaded(run_id_, checkpoint_.path().string(),
                                   checkpoint_.current().last_committed_batch, resume.complete,
                                   events_);
        std::cerr << "[CHECKPOINT] resuming at batch " << resume.start_batch << std::endl;
    } else if (!resume.ignored_reason.empty()) {
        emitter_.checkpoint_ignored(run_id_, checkpoint_.path().string(), resume.ignored_reason,
                                    events_);
    }
    summary.last_committed_batch = std::min(resume.start_batch, total) - 1;

    FrameCache cache(frames_, params_.memory, geometry_, cfg_.input.reject_blank_frames);
    std::unique_ptr<FrameCache> guide_cache;
    if (has_guide) {
        guide_cache = std::make_unique<FrameCache>(*guides_, params_.memory, guide_geometry, false);
    }
    const blending::TemporalBlender blender(make_match_params(params_, has_guide),
                                            blending::make_weight_function(cfg_.blending),
                                            params_.seed, params_.tracking_window_size);

    emitter_.phase_start(run_id_, Phase::SEARCH_AND_BLEND, "search_and_blend", events_);

    for (const Batch& batch : batches) {
        if (batch.index < resume.start_batch) {
            emitter_.batch_skipped(run_id_, batch, events_);
            ++summary.skipped_batches;
            continue;
        }

        current_batch_ = batch.index;
        state_ = SchedulerState::BatchInFlight;
        try {
            if (stop_requested()) {
                throw StopRequested(batch.index);
            }
            emitter_.batch_start(run_id_, batch, total, events_);
            std::cerr << "[BATCH] " << (batch.index + 1) << "/" << total << " frames "
                      << batch.first_frame << "-" << batch.last_frame << std::endl;

            std::vector<Frame> outputs = process_batch(batch, cache, guide_cache.get(), blender);
            if (stop_requested()) {
                throw StopRequested(batch.index);
            }
            sink_.commit_batch(batch, outputs);
            checkpoint_.commit(batch.index);
        } catch (const StopRequested& e) {
            fail_batch(batch, "stopped", e.what());
            throw;
        } catch (const DataError& e) {
            DataError err(e.frame_index(), e.detail(), batch.index);
            fail_batch(batch, "data", err.what());
            throw err;
        } catch (const ResourceExhaustion& e) {
            fail_batch(batch, "resource", e.what());
            throw;
        } catch (const ConfigurationError& e) {
            fail_batch(batch, "configuration", e.what());
            throw;
        } catch (const std::bad_alloc&) {
            ResourceExhaustion err(batch.index, params_.batch_size, "out of memory");
            fail_batch(batch, "resource", err.what());
            throw err;
        } catch (const cv::Exception& e) {
            if (e.code == cv::Error::StsNoMem) {
                ResourceExhaustion err(batch.index, params_.batch_size, e.what());
                fail_batch(batch, "resource", err.what());
                throw err;
            }
            fail_batch(batch, "error", e.what());
            throw;
        } catch (const std::exception& e) {
            fail_batch(batch, "error", e.what());
            throw;
        }

        state_ = SchedulerState::BatchCommitted;
        summary.last_committed_batch = batch.index;
        ++summary.processed_batches;
        emitter_.batch_committed(run_id_, batch, events_);
        emitter_.phase_progress(run_id_, Phase::COMMIT,
                                static_cast<float>(batch.index + 1) / static_cast<float>(total),
                                "batch " + std::to_string(batch.index) + " committed", events_);
        if (on_committed_) {
            on_committed_(batch);
        }
    }

    checkpoint_.close(true);
    state_ = SchedulerState::Complete;
    summary.state = state_;
    summary.peak_resident_frames = cache.peak_resident();

    emitter_.phase_end(run_id_, Phase::SEARCH_AND_BLEND, "ok",
                       {{"processed_batches", summary.processed_batches},
                        {"skipped_batches", summary.skipped_batches},
                        {"peak_resident_frames", summary.peak_resident_frames}},
                       events_);
    emitter_.run_end(run_id_, true, "ok", events_);
    return summary;
}

} // namespace deflicker::pipeline
