#include "runner_shared.hpp"

#include "deflicker/core/errors.hpp"
#include "deflicker/core/events.hpp"
#include "deflicker/core/utils.hpp"
#include "deflicker/pipeline/checkpoint.hpp"
#include "deflicker/pipeline/frame_source.hpp"
#include "deflicker/pipeline/scheduler.hpp"

#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace deflicker::runner {

namespace fs = std::filesystem;

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int) { g_stop_requested.store(true); }

void install_stop_handlers() {
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
}

std::string format_bytes(uint64_t bytes) {
  static const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < (sizeof(kUnits) / sizeof(kUnits[0]))) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << value << " "
      << kUnits[unit];
  return oss.str();
}

int report_active_exception(const std::string &run_id, std::ostream &events) {
  core::EventEmitter emitter;
  try {
    throw;
  } catch (const StopRequested &e) {
    std::cerr << "Stopped: " << e.what()
              << " (rerun the same command to resume)" << std::endl;
    emitter.warning(run_id, e.what(), events);
    return kExitStopped;
  } catch (const ConfigurationError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), events);
    return kExitConfiguration;
  } catch (const DataError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), events);
    return kExitData;
  } catch (const ResourceExhaustion &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    if (e.required_bytes() > 0) {
      std::cerr << "  estimated " << format_bytes(e.required_bytes())
                << ", budget " << format_bytes(e.limit_bytes()) << std::endl;
    }
    emitter.error(run_id, e.what(), events);
    return kExitResource;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), events);
    return kExitFailure;
  }
}

int run_sequence(const config::Config &cfg, const SequenceJob &job) {
  const std::string run_id = core::get_run_id();

  // An unusable output directory fails this sequence only; events go to
  // stdout since the log file cannot exist.
  std::ofstream event_log_file;
  try {
    const fs::path log_dir = job.output_dir / "logs";
    fs::create_directories(log_dir);
    event_log_file.open(log_dir / "run_events.jsonl",
                        std::ios::out | std::ios::app);
    if (!event_log_file) {
      throw IOError("cannot open " + (log_dir / "run_events.jsonl").string());
    }
  } catch (const std::exception &) {
    return report_active_exception(run_id, std::cout);
  }

  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_stream(&tee_buf);

  try {
    pipeline::DirectoryFrameSource frames(job.input_dir, cfg.input.pattern);
    if (frames.size() == 0) {
      throw DataError(0, "no frames matching '" + cfg.input.pattern + "' in " +
                             job.input_dir.string());
    }

    std::unique_ptr<pipeline::DirectoryFrameSource> guides;
    if (!job.guide_dir.empty()) {
      guides = std::make_unique<pipeline::DirectoryFrameSource>(
          job.guide_dir, cfg.input.pattern);
    }

    fs::path checkpoint_path = job.checkpoint_path;
    if (checkpoint_path.empty()) {
      checkpoint_path = cfg.checkpoint.path.empty()
                            ? job.output_dir / "checkpoint.json"
                            : fs::path(cfg.checkpoint.path);
    }

    pipeline::DirectoryFrameSink sink(job.output_dir, cfg.output.format,
                                      cfg.output.prefix);
    pipeline::CheckpointStore store(checkpoint_path, cfg.checkpoint.enabled);
    pipeline::BatchScheduler scheduler(cfg, frames, sink, store, log_stream,
                                       guides.get(), run_id);
    scheduler.set_stop_flag(&g_stop_requested);

    const pipeline::RunSummary summary = scheduler.run();
    std::cerr << "[DONE] " << job.input_dir.filename().string() << ": "
              << pipeline::scheduler_state_to_string(summary.state) << ", "
              << summary.processed_batches << " batches processed, "
              << summary.skipped_batches << " skipped, peak "
              << summary.peak_resident_frames << " resident frames" << std::endl;
    return kExitOk;
  } catch (const std::exception &) {
    return report_active_exception(run_id, log_stream);
  }
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace deflicker::runner
