#pragma once

#include "deflicker/config/configuration.hpp"
#include "deflicker/core/mode_profile.hpp"
#include "deflicker/core/types.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace deflicker::pipeline {

struct Checkpoint {
    std::string fingerprint;
    std::string mode;
    int last_committed_batch = -1; // -1: nothing committed yet
    int total_batches = 0;
    int num_frames = 0;
    int batch_size = 0;
    bool complete = false;
    std::string updated_at;

    int next_batch() const { return last_committed_batch + 1; }

    nlohmann::json to_json() const;
    // Throws CheckpointCorruption on missing or ill-typed fields.
    static Checkpoint from_json(const nlohmann::json& j);
};

// SHA-256 over the canonical JSON of everything that changes the output.
std::string compute_config_fingerprint(const core::EngineParams& params,
                                       const config::BlendingConfig& blending,
                                       const FrameGeometry& geometry, int num_frames,
                                       bool has_guide);

struct ResumeDecision {
    int start_batch = 0;
    bool complete = false;
    bool loaded = false;        // a matching checkpoint was found
    std::string ignored_reason; // set when an existing file was not used
};

// File-backed progress record: open() once at run start, commit() after
// each batch, close() at the end. Every write replaces the file atomically.
class CheckpointStore {
public:
    explicit CheckpointStore(fs::path path, bool enabled = true);

    const fs::path& path() const { return path_; }
    bool enabled() const { return enabled_; }

    // std::nullopt when no file exists; throws CheckpointCorruption when the
    // file cannot be parsed.
    std::optional<Checkpoint> read() const;

    // `expected` carries the fingerprint and shape of the current run. A
    // missing, corrupt or foreign checkpoint yields start_batch 0.
    ResumeDecision open(const Checkpoint& expected);

    void commit(int batch_index);
    void close(bool complete);
    void clear();

    bool is_open() const { return open_; }
    const Checkpoint& current() const { return current_; }

private:
    void write(const Checkpoint& cp) const;

    fs::path path_;
    bool enabled_;
    bool open_ = false;
    Checkpoint current_;
};

} // namespace deflicker::pipeline
