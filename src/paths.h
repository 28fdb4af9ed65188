/**
 * @file src/paths.h
 * @brief Locations of the work file, the difficulty files and the pause flag.
 */
#pragma once

#include <array>
#include <filesystem>
#include <string>

namespace paths {
  namespace fs = std::filesystem;

  constexpr std::array<const char *, 3> k_target_names {
    "CasualDifficulty.ini",
    "HardDifficulty.ini",
    "StandardDifficulty.ini",
  };

  constexpr const char *k_pause_flag_name = "LiveSync.PAUSE";

  struct layout_t {
    fs::path config_root;  ///< <LOCALAPPDATA>/ReadyOrNot/Saved/Config
    fs::path difficulties_dir;
    fs::path disabled_dir;  ///< Legacy location of a deactivated mod.
    fs::path work_file;
    fs::path pause_flag;
    fs::path user_mod_files;
    fs::path mirror_file;
    std::array<fs::path, 3> targets;
  };

  /**
   * @brief Default config root derived from the environment.
   *
   * Uses LOCALAPPDATA, falling back to `<home>/AppData/Local` when it is unset.
   */
  fs::path default_config_root();

  /**
   * @brief Build the layout below `config_root`, or below `default_config_root()` when it is empty.
   */
  layout_t resolve(const fs::path &config_root = {});

  bool is_mod_installed(const layout_t &layout);
  bool is_mod_deactivated(const layout_t &layout);
}  // namespace paths
