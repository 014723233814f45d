#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace deflicker {

class DeflickerError : public std::runtime_error {
public:
    explicit DeflickerError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigurationError : public DeflickerError {
public:
    explicit ConfigurationError(const std::string& message)
        : DeflickerError("Configuration error: " + message) {}
};

class IOError : public DeflickerError {
public:
    explicit IOError(const std::string& message)
        : DeflickerError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Missing or corrupt input frame, or a frame whose geometry does not match
// the sequence. batch_index is -1 until the scheduler attaches it.
class DataError : public DeflickerError {
public:
    DataError(int frame_index, const std::string& detail, int batch_index = -1)
        : DeflickerError(format(frame_index, detail, batch_index)),
          frame_index_(frame_index), batch_index_(batch_index), detail_(detail) {}

    int frame_index() const { return frame_index_; }
    int batch_index() const { return batch_index_; }
    const std::string& detail() const { return detail_; }

private:
    static std::string format(int frame_index, const std::string& detail, int batch_index) {
        std::string msg = "Data error: frame " + std::to_string(frame_index);
        if (batch_index >= 0) {
            msg += " (batch " + std::to_string(batch_index) + ")";
        }
        return msg + ": " + detail;
    }

    int frame_index_;
    int batch_index_;
    std::string detail_;
};

class ResourceExhaustion : public DeflickerError {
public:
    ResourceExhaustion(int batch_index, int batch_size, const std::string& detail,
                       size_t required_bytes = 0, size_t limit_bytes = 0)
        : DeflickerError("Resource exhaustion in batch " + std::to_string(batch_index) +
                         " (batch_size=" + std::to_string(batch_size) + "): " + detail +
                         "; lower batch_size and rerun"),
          batch_index_(batch_index), batch_size_(batch_size),
          required_bytes_(required_bytes), limit_bytes_(limit_bytes) {}

    int batch_index() const { return batch_index_; }
    int batch_size() const { return batch_size_; }
    size_t required_bytes() const { return required_bytes_; }
    size_t limit_bytes() const { return limit_bytes_; }

private:
    int batch_index_;
    int batch_size_;
    size_t required_bytes_;
    size_t limit_bytes_;
};

class CheckpointCorruption : public DeflickerError {
public:
    explicit CheckpointCorruption(const std::string& message)
        : DeflickerError("Checkpoint corruption: " + message) {}
};

class StopRequested : public DeflickerError {
public:
    explicit StopRequested(int batch_index)
        : DeflickerError("Stop requested during batch " + std::to_string(batch_index)),
          batch_index_(batch_index) {}

    int batch_index() const { return batch_index_; }

private:
    int batch_index_;
};

} // namespace deflicker
