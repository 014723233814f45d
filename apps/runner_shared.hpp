#pragma once

#include "deflicker/config/configuration.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <streambuf>
#include <string>

namespace deflicker::runner {

enum ExitCode : int {
  kExitOk = 0,
  kExitFailure = 1,
  kExitConfiguration = 2,
  kExitData = 3,
  kExitResource = 4,
  kExitStopped = 130,
};

// Set by SIGINT/SIGTERM, polled by the scheduler.
extern std::atomic<bool> g_stop_requested;

void install_stop_handlers();

std::string format_bytes(uint64_t bytes);

// Must be called from inside a catch block; maps the active exception to an
// exit code and reports it on stderr and as an `error` event.
int report_active_exception(const std::string &run_id, std::ostream &events);

struct SequenceJob {
  std::filesystem::path input_dir;
  std::filesystem::path output_dir;
  std::filesystem::path guide_dir;       // empty: no guide
  std::filesystem::path checkpoint_path; // empty: config or <output>/checkpoint.json
};

int run_sequence(const config::Config &cfg, const SequenceJob &job);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace deflicker::runner
