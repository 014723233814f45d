#include "runner_checkpoints.hpp"
#include "runner_shared.hpp"

#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"
#include "deflicker/pipeline/checkpoint.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <vector>

namespace deflicker::runner {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> list_checkpoint_files(const fs::path &dir) {
  std::vector<fs::path> files;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file())
      continue;
    const std::string name = entry.path().filename().string();
    if (core::ends_with(name, ".json") ||
        core::ends_with(name, ".json.tmp")) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

int status_command(const std::string &checkpoint_dir) {
  fs::path dir(checkpoint_dir);
  if (!fs::is_directory(dir)) {
    std::cout << "No checkpoints in " << checkpoint_dir << std::endl;
    return kExitOk;
  }

  int count = 0;
  for (const auto &path : list_checkpoint_files(dir)) {
    if (core::ends_with(path.filename().string(), ".tmp"))
      continue;
    ++count;
    std::cout << path.stem().string() << ": ";
    try {
      std::optional<pipeline::Checkpoint> cp =
          pipeline::CheckpointStore(path).read();
      if (!cp) {
        std::cout << "missing" << std::endl;
      } else if (cp->complete) {
        std::cout << "complete (" << cp->total_batches << " batches, mode "
                  << cp->mode << ", " << cp->updated_at << ")" << std::endl;
      } else {
        std::cout << "in progress, " << cp->next_batch() << "/"
                  << cp->total_batches << " batches committed (mode "
                  << cp->mode << ", batch_size " << cp->batch_size << ", "
                  << cp->updated_at << ")" << std::endl;
      }
    } catch (const CheckpointCorruption &e) {
      std::cout << "unreadable, next run restarts from batch 0 (" << e.what()
                << ")" << std::endl;
    }
  }
  if (count == 0) {
    std::cout << "No checkpoints in " << checkpoint_dir << std::endl;
  }
  return kExitOk;
}

int clear_command(const std::string &checkpoint_dir) {
  fs::path dir(checkpoint_dir);
  if (!fs::is_directory(dir)) {
    std::cout << "No checkpoints in " << checkpoint_dir << std::endl;
    return kExitOk;
  }

  int removed = 0;
  for (const auto &path : list_checkpoint_files(dir)) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
      std::cerr << "Error: cannot remove " << path.string() << ": "
                << ec.message() << std::endl;
      return kExitFailure;
    }
    ++removed;
  }
  std::cout << "Removed " << removed << " checkpoint file(s) from "
            << checkpoint_dir << std::endl;
  return kExitOk;
}

} // namespace deflicker::runner
