/**
 * @file src/live_sync.cpp
 * @brief Definitions for the live sync poll loop.
 */
#include "src/live_sync.h"

#include "src/logging.h"

#include <boost/algorithm/string/join.hpp>
#include <exception>
#include <system_error>
#include <utility>

using namespace std::literals;

namespace livesync {
  namespace fs = std::filesystem;

  LiveSyncManager::LiveSyncManager(options_t options, paths::layout_t layout, ITimerScheduler &timer, IClock &clock, Hooks hooks)
    : options_(std::move(options)),
      layout_(std::move(layout)),
      timer_(timer),
      clock_(clock),
      hooks_(std::move(hooks)),
      tracker_(options_.game_start_delay) {
    if (!hooks_.game_running) {
      BOOST_LOG(warning) << "LiveSync: no game presence probe, assuming the game is running"sv;
    }
  }

  LiveSyncManager::~LiveSyncManager() {
    if (pending_) {
      timer_.cancel(*pending_);
    }
  }

  void LiveSyncManager::start() {
    if (!options_.enabled) {
      BOOST_LOG(info) << "LiveSync: disabled, not starting"sv;
      return;
    }
    if (pending_) {
      return;
    }
    BOOST_LOG(info) << "LiveSync: watching "sv << layout_.work_file.string();
    pending_ = timer_.schedule_once(0ms, [this]() {
      tick();
    });
  }

  void LiveSyncManager::stop() {
    if (pending_) {
      timer_.cancel(*pending_);
      pending_.reset();
      BOOST_LOG(info) << "LiveSync: stopped"sv;
    }
    tracker_.reset();
    session_ = SyncSession {};
  }

  void LiveSyncManager::refresh_now() {
    if (!pending_) {
      return;
    }
    timer_.cancel(*pending_);
    tick();
  }

  bool LiveSyncManager::force_sync_now() {
    std::error_code ec;
    if (!fs::exists(layout_.work_file, ec)) {
      BOOST_LOG(debug) << "LiveSync: nothing to force sync, "sv << layout_.work_file.string() << " missing"sv;
      return false;
    }

    fs::create_directories(layout_.difficulties_dir, ec);
    if (ec) {
      BOOST_LOG(warning) << "LiveSync: unable to create "sv << layout_.difficulties_dir.string() << ": "sv << ec.message();
    }

    try {
      return sync_all(true).written_count() > 0;
    } catch (const std::exception &e) {
      BOOST_LOG(error) << "LiveSync: forced sync failed: "sv << e.what();
      health_.last_error = e.what();
      return false;
    }
  }

  void LiveSyncManager::poll() {
    std::error_code ec;
    if (!fs::exists(layout_.work_file, ec)) {
      session_.is_idle = true;
      session_.last_source_modified.reset();
      return;
    }

    const bool running = hooks_.game_running ? hooks_.game_running() : true;
    const bool game_sync_allowed = tracker_.evaluate(running, clock_.now());
    session_.game_running = tracker_.game_running();
    session_.sync_armed = tracker_.sync_armed();
    session_.initial_probe_done = tracker_.initial_probe_done();
    session_.game_started_at = tracker_.game_started_at();

    const bool pre_game = options_.pre_game_sync && !game_sync_allowed;
    if (!game_sync_allowed && !pre_game) {
      session_.is_idle = true;
      return;
    }

    if (fs::exists(layout_.pause_flag, ec)) {
      // Keep up with edits made while paused so resuming does not replay them.
      auto modified = hooks_.io.modified_time(layout_.work_file, ec);
      if (ec) {
        session_.last_source_modified.reset();
      } else {
        session_.last_source_modified = modified;
      }
      session_.is_idle = false;
      return;
    }

    auto modified = hooks_.io.modified_time(layout_.work_file, ec);
    if (ec) {
      BOOST_LOG(debug) << "LiveSync: unable to stat "sv << layout_.work_file.string() << ": "sv << ec.message();
      session_.is_idle = true;
      session_.last_source_modified.reset();
      return;
    }

    if (!session_.last_source_modified || modified > *session_.last_source_modified) {
      session_.last_source_modified = modified;
      sync_all(game_sync_allowed);
    }
    session_.is_idle = false;
  }

  std::chrono::milliseconds LiveSyncManager::next_interval() const {
    if (options_.pre_game_sync && !session_.game_running) {
      return options_.pre_game_interval;
    }
    return session_.is_idle ? options_.idle_interval : options_.active_interval;
  }

  void LiveSyncManager::tick() {
    pending_.reset();
    try {
      poll();
    } catch (const std::exception &e) {
      BOOST_LOG(error) << "LiveSync: poll failed: "sv << e.what();
      health_.last_error = e.what();
    }
    schedule_next();
  }

  void LiveSyncManager::schedule_next() {
    if (!options_.enabled) {
      return;
    }
    pending_ = timer_.schedule_once(next_interval(), [this]() {
      tick();
    });
  }

  ini::sync_report_t LiveSyncManager::sync_all(bool preserve_excluded) {
    auto report = ini::sync_targets(layout_.work_file, layout_.targets, options_.marker, preserve_excluded, hooks_.io);
    if (preserve_excluded && !options_.excluded_fields.empty()) {
      report.excluded_fields = options_.excluded_fields;
      BOOST_LOG(debug) << "LiveSync: excluded fields are synced like any other: "sv << boost::algorithm::join(options_.excluded_fields, ", ");
    }

    if (!report.source_read) {
      health_.last_error = report.source_error;
    } else if (report.source_has_marker) {
      ++health_.sync_count;
      health_.failed_writes += report.failed_count();
      if (report.written_count() > 0) {
        health_.last_sync = std::chrono::system_clock::now();
      }
      health_.last_error.clear();
      for (const auto &target : report.targets) {
        if (!target.written) {
          health_.last_error = target.path.filename().string() + ": " + target.error;
          break;
        }
      }
    }

    if (hooks_.on_synced) {
      hooks_.on_synced(report);
    }
    return report;
  }
}  // namespace livesync
