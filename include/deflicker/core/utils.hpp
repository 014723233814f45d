#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace deflicker::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_frames(const fs::path& input_dir, const std::string& pattern = "*.png");
std::vector<fs::path> discover_sequences(const fs::path& source_dir);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Writes to a sibling temporary file, fsyncs it and renames it over `path`.
void write_text_atomic(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_string(const std::string& text);

// Parallelism
int compute_worker_count(int requested_workers, size_t task_count);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string safe_file_stem(const std::string& name);

// Glob pattern matching
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace deflicker::core
