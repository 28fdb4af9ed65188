/**
 * @file src/commands.cpp
 * @brief Definitions for the command-line commands.
 */
#include "src/commands.h"

#include "src/config.h"
#include "src/event_loop.h"
#include "src/game_presence.h"
#include "src/ini_merge.h"
#include "src/logging.h"
#include "src/pause_coordinator.h"
#include "src/platform/common.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace std::literals;

namespace commands {
  namespace {
    std::atomic<bool> shutdown_requested {false};

    void on_shutdown_signal(int) {
      shutdown_requested.store(true);
    }

    void watch_shutdown(livesync::EventLoop &loop) {
      loop.schedule_once(200ms, [&loop]() {
        if (shutdown_requested.load()) {
          BOOST_LOG(info) << "Interrupt received, shutting down"sv;
          loop.stop();
          return;
        }
        watch_shutdown(loop);
      });
    }

    void record_if_synced(const livesync::ini::sync_report_t &report) {
      if (report.source_has_marker) {
        statefile::record_sync(config::livesync.file_state, report);
      }
    }
  }  // namespace

  std::optional<resume_args_t> parse_resume_args(const std::vector<std::string> &args, std::chrono::duration<double> default_delay) {
    resume_args_t parsed;
    for (const auto &arg : args) {
      if (arg == "--no-trigger"sv) {
        parsed.trigger_sync = false;
      } else if (arg == "--delay"sv) {
        parsed.delay = default_delay;
      } else if (arg.starts_with("--delay="sv)) {
        const auto value = arg.substr("--delay="sv.size());
        try {
          std::size_t consumed = 0;
          const double seconds = std::stod(value, &consumed);
          if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
          }
          parsed.delay = std::chrono::duration<double> {seconds};
        } catch (const std::exception &) {
          BOOST_LOG(error) << "resume: invalid delay "sv << logging::bracket(value);
          return std::nullopt;
        }
      } else {
        BOOST_LOG(error) << "resume: unknown argument "sv << logging::bracket(arg);
        return std::nullopt;
      }
    }
    return parsed;
  }

  std::optional<livesync::value_map_t> parse_info_args(const std::vector<std::string> &args) {
    livesync::value_map_t values;
    for (const auto &arg : args) {
      const auto eq = arg.find('=');
      if (eq == std::string::npos || eq == 0) {
        BOOST_LOG(error) << "set-info: expected Key=Value, got "sv << logging::bracket(arg);
        return std::nullopt;
      }
      values[arg.substr(0, eq)] = arg.substr(eq + 1);
    }
    return values;
  }

  livesync::LiveSyncManager::options_t make_options() {
    livesync::LiveSyncManager::options_t options;
    options.enabled = config::sync.enabled;
    options.pre_game_sync = config::sync.pre_game_sync;
    options.pre_game_interval = config::sync.pre_game_interval;
    options.active_interval = config::sync.active_interval;
    options.idle_interval = config::sync.idle_interval;
    options.game_start_delay = config::sync.game_start_delay;
    options.marker = config::sync.merge_marker;
    options.excluded_fields = config::sync.excluded_fields;
    return options;
  }

  nlohmann::json status_json(const paths::layout_t &layout, bool paused, std::optional<bool> game_running, const statefile::sync_state_t &state) {
    nlohmann::json out;
    out["paths"] = {
      {"config_root", layout.config_root.string()},
      {"work_file", layout.work_file.string()},
      {"difficulties_dir", layout.difficulties_dir.string()},
      {"pause_flag", layout.pause_flag.string()},
      {"mirror_file", layout.mirror_file.string()},
    };
    auto &targets = out["paths"]["targets"] = nlohmann::json::array();
    for (const auto &target : layout.targets) {
      targets.push_back(target.string());
    }

    out["installed"] = paths::is_mod_installed(layout);
    out["deactivated"] = paths::is_mod_deactivated(layout);
    out["paused"] = paused;
    out["game_running"] = game_running ? nlohmann::json(*game_running) : nlohmann::json();

    out["last_sync"] = {
      {"time", state.last_sync},
      {"sync_count", state.sync_count},
      {"targets_written", state.targets_written},
      {"targets_failed", state.targets_failed},
      {"failed_targets", state.failed_targets},
      {"last_error", state.last_error},
    };
    return out;
  }

  std::size_t update_work_file(const paths::layout_t &layout, const livesync::value_map_t &values) {
    std::error_code ec;
    auto text = livesync::ini::read_file(layout.work_file, ec);
    if (!text) {
      BOOST_LOG(debug) << "set-info: work file not available: "sv << ec.message();
      return 0;
    }

    std::size_t replaced = 0;
    auto updated = livesync::ini::replace_values(*text, values, replaced);
    if (replaced == 0) {
      return 0;
    }
    if (auto err = livesync::ini::write_file(layout.work_file, updated); !err.empty()) {
      throw std::runtime_error(layout.work_file.string() + ": " + err);
    }
    BOOST_LOG(info) << "set-info: updated "sv << replaced << " value(s) in "sv << layout.work_file.filename().string();
    return replaced;
  }

  int run(const paths::layout_t &layout) {
    livesync::EventLoop loop;
    livesync::GamePresenceDetector detector(config::sync.game_process);

    livesync::LiveSyncManager manager(make_options(), layout, loop, loop, {
      .game_running = [&detector]() {
        return detector.is_game_running();
      },
      .on_synced = record_if_synced,
    });

    if (!config::sync.enabled) {
      BOOST_LOG(warning) << "LiveSync is disabled in the configuration, nothing to do"sv;
      return 0;
    }

    shutdown_requested.store(false);
    std::signal(SIGINT, on_shutdown_signal);
    std::signal(SIGTERM, on_shutdown_signal);

    manager.force_sync_now();
    manager.start();
    watch_shutdown(loop);
    loop.run();
    manager.stop();
    return 0;
  }

  int sync(const paths::layout_t &layout) {
    livesync::EventLoop loop;
    livesync::LiveSyncManager manager(make_options(), layout, loop, loop, {
      .game_running = []() {
        return true;
      },
      .on_synced = record_if_synced,
    });

    if (!manager.force_sync_now()) {
      BOOST_LOG(warning) << "sync: no difficulty file was written"sv;
    }
    return 0;
  }

  int pause(const paths::layout_t &layout) {
    livesync::PauseCoordinator coordinator(layout);
    coordinator.pause();
    return 0;
  }

  int resume(const paths::layout_t &layout, const std::vector<std::string> &args) {
    auto parsed = parse_resume_args(args, config::sync.resume_delay);
    if (!parsed) {
      return 1;
    }

    livesync::PauseCoordinator coordinator(layout);
    if (parsed->delay) {
      coordinator.resume_after(*parsed->delay, parsed->trigger_sync);
      coordinator.wait_idle();
    } else {
      coordinator.resume(parsed->trigger_sync);
    }
    return 0;
  }

  int status(const paths::layout_t &layout) {
    std::error_code ec;
    const bool paused = std::filesystem::exists(layout.pause_flag, ec);
    auto running = platf::process_running(config::sync.game_process);
    auto state = statefile::load_sync_state(config::livesync.file_state);

    std::cout << status_json(layout, paused, running, state).dump(2) << std::endl;
    return 0;
  }

  int set_info(const paths::layout_t &layout, const std::vector<std::string> &args) {
    auto values = parse_info_args(args);
    if (!values || values->empty()) {
      BOOST_LOG(error) << "set-info: expected at least one Key=Value"sv;
      return 1;
    }

    livesync::MirrorStore mirror(layout.mirror_file);
    livesync::UserInfoWriter writer(config::sync.write_debounce, {
      .write_work = [&layout](const livesync::value_map_t &v) {
        update_work_file(layout, v);
      },
      .write_mirror = [&mirror](const livesync::value_map_t &v) {
        return mirror.merge(v);
      },
    });
    writer.enqueue(std::move(*values), true, true);
    writer.flush();
    writer.stop();
    return 0;
  }

  int dispatch(const paths::layout_t &layout) {
    const auto &cmd = config::livesync.cmd;
    if (cmd.name == "run"sv) {
      return run(layout);
    }
    if (cmd.name == "sync"sv) {
      return sync(layout);
    }
    if (cmd.name == "pause"sv) {
      return pause(layout);
    }
    if (cmd.name == "resume"sv) {
      return resume(layout, cmd.args);
    }
    if (cmd.name == "status"sv) {
      return status(layout);
    }
    if (cmd.name == "set-info"sv) {
      return set_info(layout, cmd.args);
    }

    BOOST_LOG(error) << "Unknown command "sv << logging::bracket(cmd.name);
    return 1;
  }
}  // namespace commands
