#include "deflicker/core/events.hpp"
#include "deflicker/core/utils.hpp"

namespace deflicker::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

json EventEmitter::batch_event(const std::string& type, const std::string& run_id,
                               const Batch& batch) {
    json event = base_event(type, run_id);
    event["batch"] = batch.index;
    event["first_frame"] = batch.first_frame;
    event["last_frame"] = batch.last_frame;
    return event;
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase,
                               const std::string& name, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = name;
    emit(event, out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, float progress,
                                  const std::string& message, std::ostream& out) {
    json event = base_event("phase_progress", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = static_cast<int>(progress * 100);
    event["total"] = 100;
    event["progress"] = progress;
    event["substep"] = message;
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::batch_start(const std::string& run_id, const Batch& batch,
                               int total_batches, std::ostream& out) {
    json event = batch_event("batch_start", run_id, batch);
    event["total_batches"] = total_batches;
    emit(event, out);
}

void EventEmitter::batch_skipped(const std::string& run_id, const Batch& batch,
                                 std::ostream& out) {
    emit(batch_event("batch_skipped", run_id, batch), out);
}

void EventEmitter::batch_committed(const std::string& run_id, const Batch& batch,
                                   std::ostream& out) {
    emit(batch_event("batch_committed", run_id, batch), out);
}

void EventEmitter::batch_failed(const std::string& run_id, const Batch& batch,
                                const std::string& cause, const std::string& message,
                                std::ostream& out) {
    json event = batch_event("batch_failed", run_id, batch);
    event["cause"] = cause;
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::checkpoint_loaded(const std::string& run_id, const std::string& path,
                                     int last_committed_batch, bool complete,
                                     std::ostream& out) {
    json event = base_event("checkpoint_loaded", run_id);
    event["path"] = path;
    event["last_committed_batch"] = last_committed_batch;
    event["complete"] = complete;
    emit(event, out);
}

void EventEmitter::checkpoint_ignored(const std::string& run_id, const std::string& path,
                                      const std::string& reason, std::ostream& out) {
    json event = base_event("checkpoint_ignored", run_id);
    event["path"] = path;
    event["reason"] = reason;
    emit(event, out);
}

void EventEmitter::frame_processed(const std::string& run_id, Phase phase, int frame_idx,
                                   int total_frames, std::ostream& out) {
    json event = base_event("frame_processed", run_id);
    event["phase"] = phase_to_int(phase);
    event["frame_idx"] = frame_idx;
    event["total_frames"] = total_frames;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace deflicker::core
