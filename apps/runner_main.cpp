#include "runner_checkpoints.hpp"
#include "runner_shared.hpp"

#include "deflicker/config/configuration.hpp"
#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using deflicker::config::Config;

// Loads and validates the YAML config; a --mode value overrides engine.mode.
// Returns false after printing the error.
bool load_config(const std::string &config_path, const std::string &mode,
                 Config &cfg) {
  try {
    if (!fs::exists(config_path)) {
      throw deflicker::ConfigurationError("config file not found: " +
                                          config_path);
    }
    cfg = Config::load(config_path);
    if (!mode.empty()) {
      cfg.engine.mode = mode;
    }
    cfg.validate();
  } catch (const deflicker::ConfigurationError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return false;
  }
  return true;
}

int run_command(const std::string &config_path, const std::string &input_dir,
                const std::string &output_dir, const std::string &guide_dir,
                const std::string &checkpoint_path, const std::string &mode) {
  using namespace deflicker;

  if (!fs::is_directory(input_dir)) {
    std::cerr << "Error: Input directory not found: " << input_dir << std::endl;
    return runner::kExitData;
  }
  Config cfg;
  if (!load_config(config_path, mode, cfg)) {
    return runner::kExitConfiguration;
  }

  runner::SequenceJob job;
  job.input_dir = input_dir;
  job.output_dir = output_dir;
  job.guide_dir = guide_dir;
  job.checkpoint_path = checkpoint_path;
  return runner::run_sequence(cfg, job);
}

int run_all_command(const std::string &config_path,
                    const std::string &source_dir,
                    const std::string &output_dir,
                    const std::string &checkpoint_dir,
                    const std::string &mode) {
  using namespace deflicker;

  if (!fs::is_directory(source_dir)) {
    std::cerr << "Error: Source directory not found: " << source_dir
              << std::endl;
    return runner::kExitData;
  }
  Config cfg;
  if (!load_config(config_path, mode, cfg)) {
    return runner::kExitConfiguration;
  }

  const std::vector<fs::path> sequences = core::discover_sequences(source_dir);
  if (sequences.empty()) {
    std::cerr << "Error: No sequence directories in " << source_dir
              << std::endl;
    return runner::kExitData;
  }

  const fs::path ckpt_dir = checkpoint_dir.empty()
                                ? fs::path(output_dir) / "checkpoints"
                                : fs::path(checkpoint_dir);

  std::vector<std::pair<std::string, int>> failures;
  int succeeded = 0;
  bool stopped = false;
  for (size_t i = 0; i < sequences.size(); ++i) {
    const std::string name = sequences[i].filename().string();
    std::cerr << "[SEQUENCE] " << (i + 1) << "/" << sequences.size() << " "
              << name << std::endl;

    runner::SequenceJob job;
    job.input_dir = sequences[i];
    job.output_dir = fs::path(output_dir) / name;
    job.checkpoint_path = ckpt_dir / (core::safe_file_stem(name) + ".json");

    const int rc = runner::run_sequence(cfg, job);
    if (rc == runner::kExitOk) {
      ++succeeded;
    } else if (rc == runner::kExitStopped) {
      stopped = true;
      break;
    } else {
      failures.emplace_back(name, rc);
    }
  }

  std::cerr << "[SUMMARY] " << succeeded << "/" << sequences.size()
            << " sequences completed" << std::endl;
  for (const auto &f : failures) {
    std::cerr << "  failed: " << f.first << " (exit " << f.second << ")"
              << std::endl;
  }
  if (stopped) {
    return runner::kExitStopped;
  }
  return failures.empty() ? runner::kExitOk : runner::kExitFailure;
}

} // namespace

int main(int argc, char *argv[]) {
  deflicker::runner::install_stop_handlers();

  CLI::App app{"Deflicker Runner"};

  std::string config_path, input_dir, output_dir, guide_dir, checkpoint_path;
  std::string source_dir, checkpoint_dir, mode;

  auto run_cmd = app.add_subcommand("run", "Deflicker one frame sequence");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--input-dir", input_dir, "Input frame directory")
      ->required();
  run_cmd->add_option("--output-dir", output_dir, "Output frame directory")
      ->required();
  run_cmd->add_option("--guide-dir", guide_dir,
                      "Guide frames driving the correspondence search");
  run_cmd->add_option("--checkpoint", checkpoint_path,
                      "Checkpoint file (default: <output-dir>/checkpoint.json)");
  run_cmd->add_option("--mode", mode, "fast | balanced | accurate");

  auto run_all_cmd = app.add_subcommand(
      "run-all", "Deflicker every sequence directory below --source-dir");
  run_all_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();
  run_all_cmd->add_option("--source-dir", source_dir, "Directory of sequences")
      ->required();
  run_all_cmd->add_option("--output-dir", output_dir, "Output root")
      ->required();
  run_all_cmd->add_option("--checkpoint-dir", checkpoint_dir,
                          "Checkpoint directory (default: <output-dir>/checkpoints)");
  run_all_cmd->add_option("--mode", mode, "fast | balanced | accurate");

  auto status_cmd =
      app.add_subcommand("status", "Show the state of every checkpoint");
  status_cmd->add_option("--checkpoint-dir", checkpoint_dir,
                         "Checkpoint directory")
      ->required();

  auto clear_cmd = app.add_subcommand("clear", "Delete all checkpoints");
  clear_cmd->add_option("--checkpoint-dir", checkpoint_dir,
                        "Checkpoint directory")
      ->required();

  app.require_subcommand(1);

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(config_path, input_dir, output_dir, guide_dir,
                       checkpoint_path, mode);
  }
  if (run_all_cmd->parsed()) {
    return run_all_command(config_path, source_dir, output_dir, checkpoint_dir,
                           mode);
  }
  if (status_cmd->parsed()) {
    return deflicker::runner::status_command(checkpoint_dir);
  }
  if (clear_cmd->parsed()) {
    return deflicker::runner::clear_command(checkpoint_dir);
  }

  std::cerr << app.help() << std::endl;
  return deflicker::runner::kExitFailure;
}
