/**
 * @file src/config.h
 * @brief Declarations for the configuration of the live sync tool.
 */
#pragma once

// standard includes
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace config {
  struct sync_t {
    bool enabled;  ///< Master switch for the poll loop.
    bool pre_game_sync;  ///< Keep syncing (slowly) while the game is not running.

    std::chrono::milliseconds pre_game_interval;
    std::chrono::milliseconds active_interval;
    std::chrono::milliseconds idle_interval;
    std::chrono::seconds game_start_delay;  ///< Grace period after the game process appears.

    std::string game_process;  ///< Executable name, matched case-sensitively.
    std::string merge_marker;  ///< First section that gets synchronized, e.g. "[Global]".

    // Fields that are meant to survive an in-game sync; see DESIGN.md for how they are honoured.
    std::vector<std::string> excluded_fields;

    std::chrono::duration<double> resume_delay;
    std::chrono::milliseconds write_debounce;
  };

  struct livesync_t {
    int min_log_level;
    std::string log_file;
    std::string file_state;

    // Root of the game's Saved/Config tree. Empty means derive it from LOCALAPPDATA.
    std::string config_root;

    std::string config_file;

    struct cmd_t {
      std::string name;
      std::vector<std::string> args;
    } cmd;
  };

  extern sync_t sync;
  extern livesync_t livesync;

  /**
   * @brief Restore every option to its default value.
   */
  void reset_defaults();

  /**
   * @brief Parse the command line and the configuration file into `sync` and `livesync`.
   * @return 0 on success, 1 when the process should exit with an error, -1 when it should exit successfully.
   */
  int parse(int argc, char *argv[]);

  /**
   * @brief Split `name = value` lines into a map. Comments start with `#`.
   */
  std::unordered_map<std::string, std::string> parse_config(const std::string_view &file_content);

  /**
   * @brief Apply the parsed values. Consumed keys are erased, unknown keys are logged.
   */
  void apply_config(std::unordered_map<std::string, std::string> &&vars);

  int parse_log_level(const std::string &value, int fallback);
}  // namespace config
