#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace deflicker::core {

using json = nlohmann::json;

class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, const std::string& name, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, float progress,
                        const std::string& message, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void batch_start(const std::string& run_id, const Batch& batch, int total_batches, std::ostream& out);
    void batch_skipped(const std::string& run_id, const Batch& batch, std::ostream& out);
    void batch_committed(const std::string& run_id, const Batch& batch, std::ostream& out);
    void batch_failed(const std::string& run_id, const Batch& batch, const std::string& cause,
                      const std::string& message, std::ostream& out);

    void checkpoint_loaded(const std::string& run_id, const std::string& path,
                           int last_committed_batch, bool complete, std::ostream& out);
    void checkpoint_ignored(const std::string& run_id, const std::string& path,
                            const std::string& reason, std::ostream& out);

    void frame_processed(const std::string& run_id, Phase phase, int frame_idx,
                         int total_frames, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
    json batch_event(const std::string& type, const std::string& run_id, const Batch& batch);
};

} // namespace deflicker::core
