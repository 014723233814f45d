#include "deflicker/pipeline/checkpoint.hpp"
#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"

#include <iostream>

namespace deflicker::pipeline {

using json = nlohmann::json;

json Checkpoint::to_json() const {
    return {
        {"fingerprint", fingerprint},
        {"mode", mode},
        {"last_committed_batch", last_committed_batch},
        {"total_batches", total_batches},
        {"num_frames", num_frames},
        {"batch_size", batch_size},
        {"complete", complete},
        {"updated_at", updated_at},
    };
}

Checkpoint Checkpoint::from_json(const json& j) {
    if (!j.is_object()) {
        throw CheckpointCorruption("top-level value is not an object");
    }
    Checkpoint cp;
    try {
        cp.fingerprint = j.at("fingerprint").get<std::string>();
        cp.mode = j.at("mode").get<std::string>();
        cp.last_committed_batch = j.at("last_committed_batch").get<int>();
        cp.total_batches = j.at("total_batches").get<int>();
        cp.num_frames = j.at("num_frames").get<int>();
        cp.batch_size = j.at("batch_size").get<int>();
        cp.complete = j.at("complete").get<bool>();
        cp.updated_at = j.value("updated_at", std::string());
    } catch (const json::exception& e) {
        throw CheckpointCorruption(e.what());
    }
    if (cp.last_committed_batch < -1 || cp.last_committed_batch >= cp.total_batches) {
        throw CheckpointCorruption("last_committed_batch " +
                                   std::to_string(cp.last_committed_batch) +
                                   " outside [-1, " + std::to_string(cp.total_batches) + ")");
    }
    return cp;
}

std::string compute_config_fingerprint(const core::EngineParams& params,
                                       const config::BlendingConfig& blending,
                                       const FrameGeometry& geometry, int num_frames,
                                       bool has_guide) {
    // nlohmann::json objects keep keys sorted, so dump() is canonical.
    json canonical = {
        {"engine",
         {
             {"mode", core::mode_to_string(params.mode)},
             {"num_iter", params.num_iter},
             {"window_size", params.window_size},
             {"batch_size", params.batch_size},
             {"minimum_patch_size", params.minimum_patch_size},
             {"pyramid_levels", params.pyramid_levels},
             {"refinement_passes", params.refinement_passes},
             {"tracking_window_size", params.tracking_window_size},
             {"memory", core::memory_strategy_to_string(params.memory)},
             {"initialize", core::init_mode_to_string(params.init)},
             {"guide_weight", params.guide_weight},
             {"seed", params.seed},
         }},
        {"blending",
         {
             {"weighting", core::to_lower(blending.weighting)},
             {"cost_sigma", blending.cost_sigma},
             {"temporal_sigma", blending.temporal_sigma},
             {"degrain_threshold", blending.degrain_threshold},
             {"window_alignment", core::to_lower(blending.window_alignment)},
         }},
        {"geometry",
         {{"width", geometry.width}, {"height", geometry.height}, {"channels", geometry.channels}}},
        {"num_frames", num_frames},
        {"guide", has_guide},
    };
    return core::sha256_string(canonical.dump());
}

CheckpointStore::CheckpointStore(fs::path path, bool enabled)
    : path_(std::move(path)), enabled_(enabled) {}

std::optional<Checkpoint> CheckpointStore::read() const {
    if (!enabled_ || !fs::exists(path_)) {
        return std::nullopt;
    }
    std::string text;
    try {
        text = core::read_text(path_);
    } catch (const IOError& e) {
        throw CheckpointCorruption("cannot read " + path_.string() + ": " + e.what());
    }
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw CheckpointCorruption("cannot parse " + path_.string());
    }
    return Checkpoint::from_json(j);
}

ResumeDecision CheckpointStore::open(const Checkpoint& expected) {
    ResumeDecision decision;
    current_ = expected;
    current_.last_committed_batch = -1;
    current_.complete = false;
    open_ = true;

    if (!enabled_) {
        return decision;
    }

    std::optional<Checkpoint> existing;
    try {
        existing = read();
    } catch (const CheckpointCorruption& e) {
        std::cerr << "[CHECKPOINT] ignoring " << path_.string() << ": " << e.what() << std::endl;
        decision.ignored_reason = e.what();
        return decision;
    }
    if (!existing) {
        return decision;
    }

    if (existing->fingerprint != expected.fingerprint ||
        existing->total_batches != expected.total_batches ||
        existing->num_frames != expected.num_frames ||
        existing->batch_size != expected.batch_size) {
        std::cerr << "[CHECKPOINT] configuration changed, restarting from batch 0" << std::endl;
        decision.ignored_reason = "configuration fingerprint mismatch";
        return decision;
    }

    current_.last_committed_batch = existing->last_committed_batch;
    current_.complete = existing->complete;
    current_.updated_at = existing->updated_at;
    decision.loaded = true;
    decision.complete = existing->complete;
    decision.start_batch = existing->complete ? existing->total_batches
                                              : existing->next_batch();
    return decision;
}

void CheckpointStore::write(const Checkpoint& cp) const {
    if (!enabled_) return;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path());
    }
    core::write_text_atomic(path_, cp.to_json().dump(2) + "\n");
}

void CheckpointStore::commit(int batch_index) {
    if (!open_) {
        throw DeflickerError("checkpoint store is not open");
    }
    if (batch_index != current_.last_committed_batch + 1) {
        throw DeflickerError("checkpoint commit out of order: batch " +
                             std::to_string(batch_index) + " after " +
                             std::to_string(current_.last_committed_batch));
    }
    Checkpoint next = current_;
    next.last_committed_batch = batch_index;
    next.updated_at = core::get_iso_timestamp();
    write(next);
    current_ = next;
}

void CheckpointStore::close(bool complete) {
    if (!open_) return;
    if (complete && !current_.complete) {
        Checkpoint next = current_;
        next.complete = true;
        next.updated_at = core::get_iso_timestamp();
        write(next);
        current_ = next;
    }
    open_ = false;
}

void CheckpointStore::clear() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        throw IOError("cannot remove checkpoint " + path_.string() + ": " + ec.message());
    }
    current_.last_committed_batch = -1;
    current_.complete = false;
}

} // namespace deflicker::pipeline
