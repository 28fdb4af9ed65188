/**
 * @file src/commands.h
 * @brief Command-line commands of the live sync tool.
 */
#pragma once

#include "src/live_sync.h"
#include "src/paths.h"
#include "src/state_storage.h"
#include "src/user_info_writer.h"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace commands {
  struct resume_args_t {
    std::optional<std::chrono::duration<double>> delay;
    bool trigger_sync = true;
  };

  /**
   * @brief Parse `[--delay[=<s>]] [--no-trigger]`.
   * @param default_delay Used for a bare `--delay`.
   * @return `std::nullopt` on unknown arguments or a malformed delay.
   */
  std::optional<resume_args_t> parse_resume_args(const std::vector<std::string> &args, std::chrono::duration<double> default_delay);

  /**
   * @brief Parse `Key=Value` arguments of `set-info`.
   * @return `std::nullopt` if an argument has no `=` or an empty key.
   */
  std::optional<livesync::value_map_t> parse_info_args(const std::vector<std::string> &args);

  livesync::LiveSyncManager::options_t make_options();

  nlohmann::json status_json(const paths::layout_t &layout, bool paused, std::optional<bool> game_running, const statefile::sync_state_t &state);

  /**
   * @brief Replace `values` in the work file in place.
   * @return Number of replaced lines. Throws `std::runtime_error` if the file cannot be written.
   */
  std::size_t update_work_file(const paths::layout_t &layout, const livesync::value_map_t &values);

  int run(const paths::layout_t &layout);
  int sync(const paths::layout_t &layout);
  int pause(const paths::layout_t &layout);
  int resume(const paths::layout_t &layout, const std::vector<std::string> &args);
  int status(const paths::layout_t &layout);
  int set_info(const paths::layout_t &layout, const std::vector<std::string> &args);

  /**
   * @brief Dispatch `config::livesync.cmd`.
   */
  int dispatch(const paths::layout_t &layout);
}  // namespace commands
