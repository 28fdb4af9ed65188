/**
 * @file src/game_state.cpp
 * @brief Definitions for the game lifecycle tracker.
 */
#include "src/game_state.h"

#include "src/logging.h"

using namespace std::literals;

namespace livesync {
  GameStateTracker::GameStateTracker(std::chrono::milliseconds start_delay)
    : start_delay_(start_delay) {}

  bool GameStateTracker::evaluate(bool game_running, clock_t::time_point now) {
    if (!initial_probe_done_) {
      initial_probe_done_ = true;
      if (game_running) {
        game_running_ = true;
        sync_armed_ = true;
        BOOST_LOG(info) << "Game detection: game already running at startup, sync enabled immediately"sv;
        return true;
      }
    }

    if (game_running && !game_running_) {
      game_running_ = true;
      game_started_at_ = now;
      sync_armed_ = false;
      BOOST_LOG(info) << "Game detection: game started, waiting "sv
                      << std::chrono::duration_cast<std::chrono::seconds>(start_delay_).count() << "s before sync"sv;
      return false;
    }

    if (!game_running && game_running_) {
      game_running_ = false;
      game_started_at_.reset();
      sync_armed_ = false;
      BOOST_LOG(info) << "Game detection: game stopped, in-game sync disabled"sv;
      return false;
    }

    if (!game_running) {
      return false;
    }

    if (sync_armed_) {
      return true;
    }

    if (game_started_at_ && now - *game_started_at_ >= start_delay_) {
      sync_armed_ = true;
      game_started_at_.reset();
      BOOST_LOG(info) << "Game detection: grace period over, in-game sync enabled"sv;
      return true;
    }
    return false;
  }

  void GameStateTracker::reset() {
    game_running_ = false;
    sync_armed_ = false;
    initial_probe_done_ = false;
    game_started_at_.reset();
  }

  GameStateTracker::phase_e GameStateTracker::phase() const {
    if (!game_running_) {
      return phase_e::not_running;
    }
    return sync_armed_ ? phase_e::running : phase_e::starting;
  }

  const char *to_string(GameStateTracker::phase_e phase) {
    switch (phase) {
      case GameStateTracker::phase_e::not_running:
        return "not_running";
      case GameStateTracker::phase_e::starting:
        return "starting";
      case GameStateTracker::phase_e::running:
        return "running";
    }
    return "unknown";
  }
}  // namespace livesync
