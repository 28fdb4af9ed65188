/**
 * @file src/paths.cpp
 * @brief Definitions for the install layout.
 */
#include "src/paths.h"

#include <cstdlib>
#include <system_error>

namespace paths {
  namespace {
    fs::path env_path(const char *name) {
      const char *value = std::getenv(name);
      if (!value || !*value) {
        return {};
      }
      return fs::path(value);
    }

    fs::path home_directory() {
      auto home = env_path("USERPROFILE");
      if (home.empty()) {
        home = env_path("HOME");
      }
      return home;
    }
  }  // namespace

  fs::path default_config_root() {
    auto base = env_path("LOCALAPPDATA");
    if (base.empty()) {
      base = home_directory() / "AppData" / "Local";
    }
    return base / "ReadyOrNot" / "Saved" / "Config";
  }

  layout_t resolve(const fs::path &config_root) {
    layout_t layout;
    layout.config_root = config_root.empty() ? default_config_root() : config_root;
    layout.difficulties_dir = layout.config_root / "Difficulties";
    layout.disabled_dir = layout.config_root / "Difficulties.disabled";
    layout.work_file = layout.config_root / "StrategoAI_Live_Mod" / "Work" / "work.ini";
    layout.pause_flag = layout.difficulties_dir / k_pause_flag_name;
    layout.user_mod_files = layout.config_root / "my_AImod_files";
    layout.mirror_file = layout.user_mod_files / "user_mission_info.json";
    for (std::size_t i = 0; i < k_target_names.size(); ++i) {
      layout.targets[i] = layout.difficulties_dir / k_target_names[i];
    }
    return layout;
  }

  bool is_mod_installed(const layout_t &layout) {
    std::error_code ec;
    return fs::exists(layout.difficulties_dir, ec);
  }

  bool is_mod_deactivated(const layout_t &layout) {
    std::error_code ec;
    return fs::exists(layout.disabled_dir, ec);
  }
}  // namespace paths
