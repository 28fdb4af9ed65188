#pragma once

#include "src/ini_merge.h"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace statefile {

  std::mutex &state_mutex();

  struct sync_state_t {
    std::string last_sync;  ///< ISO-8601 UTC, empty if no sync was recorded.
    std::size_t sync_count = 0;
    std::size_t targets_written = 0;
    std::size_t targets_failed = 0;
    std::vector<std::string> failed_targets;
    std::string last_error;
  };

  /**
   * @brief Persist the outcome of a sync under the `root` node of the state file.
   * @param path State file location. Nothing is written when empty.
   * @param report Result of the sync.
   *
   * Other keys already present in the file are kept.
   */
  void record_sync(const std::filesystem::path &path, const livesync::ini::sync_report_t &report);

  /**
   * @brief Load the last recorded sync.
   * @return Default values if the file is missing or unreadable.
   */
  sync_state_t load_sync_state(const std::filesystem::path &path);

}  // namespace statefile
