/**
 * @file src/game_presence.h
 * @brief Declarations for detecting whether the game process is running.
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace livesync {
  /**
   * @brief Reports whether the game is running, failing open.
   *
   * When the process table cannot be read the detector answers `true`, so the
   * tool keeps syncing as if the game were up instead of silently stopping.
   * Callers must not treat the answer as authoritative.
   */
  class GamePresenceDetector {
  public:
    using probe_fn = std::function<std::optional<bool>(std::string_view)>;

    /**
     * @param process_name Executable name, matched case-sensitively.
     * @param probe Process table lookup. Defaults to `platf::process_running`.
     */
    explicit GamePresenceDetector(std::string process_name, probe_fn probe = {});

    bool is_game_running();

    const std::string &process_name() const {
      return process_name_;
    }

  private:
    std::string process_name_;
    probe_fn probe_;
    bool warned_unavailable_ = false;
  };
}  // namespace livesync
