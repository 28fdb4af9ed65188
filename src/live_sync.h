/**
 * @file src/live_sync.h
 * @brief Poll loop that keeps the difficulty files in step with the work file.
 */
#pragma once

#include "src/event_loop.h"
#include "src/game_state.h"
#include "src/ini_merge.h"
#include "src/paths.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace livesync {
  struct SyncSession {
    std::optional<std::filesystem::file_time_type> last_source_modified;
    bool is_idle = true;
    bool game_running = false;
    bool sync_armed = false;
    bool initial_probe_done = false;
    std::optional<std::chrono::steady_clock::time_point> game_started_at;
  };

  class LiveSyncManager {
  public:
    struct options_t {
      bool enabled = true;
      bool pre_game_sync = true;
      std::chrono::milliseconds pre_game_interval {10000};
      std::chrono::milliseconds active_interval {1000};
      std::chrono::milliseconds idle_interval {3000};
      std::chrono::milliseconds game_start_delay {10000};
      std::string marker = "[Global]";
      std::vector<std::string> excluded_fields;
    };

    struct Hooks {
      std::function<bool()> game_running;
      std::function<void(const ini::sync_report_t &)> on_synced;
      ini::file_io_t io;
    };

    struct health_t {
      std::string last_error;
      std::optional<std::chrono::system_clock::time_point> last_sync;
      std::size_t sync_count = 0;
      std::size_t failed_writes = 0;
    };

    LiveSyncManager(options_t options, paths::layout_t layout, ITimerScheduler &timer, IClock &clock, Hooks hooks);
    ~LiveSyncManager();

    LiveSyncManager(const LiveSyncManager &) = delete;
    LiveSyncManager &operator=(const LiveSyncManager &) = delete;

    /**
     * @brief Schedule the first tick. Does nothing when disabled or already started.
     */
    void start();

    /**
     * @brief Cancel the pending tick and forget the session.
     */
    void stop();

    bool started() const {
      return pending_.has_value();
    }

    /**
     * @brief Poll right away, then continue on the normal cadence.
     */
    void refresh_now();

    /**
     * @brief Merge the work file into every target, ignoring game state, pause and mtime.
     * @return True when at least one target was written.
     */
    bool force_sync_now();

    /**
     * @brief One poll without rescheduling.
     */
    void poll();

    /**
     * @brief Delay before the next tick, derived from the current session.
     */
    std::chrono::milliseconds next_interval() const;

    SyncSession session() const {
      return session_;
    }

    health_t health() const {
      return health_;
    }

    GameStateTracker::phase_e game_phase() const {
      return tracker_.phase();
    }

  private:
    void tick();
    void schedule_next();
    ini::sync_report_t sync_all(bool preserve_excluded);

    options_t options_;
    paths::layout_t layout_;
    ITimerScheduler &timer_;
    IClock &clock_;
    Hooks hooks_;

    GameStateTracker tracker_;
    SyncSession session_;
    health_t health_;
    std::optional<timer_id_t> pending_;
  };
}  // namespace livesync
