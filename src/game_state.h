/**
 * @file src/game_state.h
 * @brief Tracks the game's lifecycle and decides when in-game sync is armed.
 */
#pragma once

#include <chrono>
#include <optional>

namespace livesync {
  /**
   * @brief Start-up gating for in-game synchronization.
   *
   * The game rewrites its difficulty files while it starts, so syncing is held
   * back for a grace period after the process appears. A game that was already
   * running when watching began is armed immediately.
   */
  class GameStateTracker {
  public:
    using clock_t = std::chrono::steady_clock;

    enum class phase_e {
      not_running,
      starting,  ///< Process seen, grace period not over yet.
      running,  ///< Sync armed.
    };

    explicit GameStateTracker(std::chrono::milliseconds start_delay);

    /**
     * @brief Feed one presence observation.
     * @param game_running Result of the presence probe for this tick.
     * @param now Current time.
     * @return Whether in-game sync is allowed on this tick.
     */
    bool evaluate(bool game_running, clock_t::time_point now);

    void reset();

    phase_e phase() const;

    bool game_running() const {
      return game_running_;
    }

    bool sync_armed() const {
      return sync_armed_;
    }

    bool initial_probe_done() const {
      return initial_probe_done_;
    }

    std::optional<clock_t::time_point> game_started_at() const {
      return game_started_at_;
    }

    std::chrono::milliseconds start_delay() const {
      return start_delay_;
    }

  private:
    std::chrono::milliseconds start_delay_;
    bool game_running_ = false;
    bool sync_armed_ = false;
    bool initial_probe_done_ = false;
    std::optional<clock_t::time_point> game_started_at_;
  };

  const char *to_string(GameStateTracker::phase_e phase);
}  // namespace livesync
