/**
 * @file src/game_presence.cpp
 * @brief Definitions for detecting whether the game process is running.
 */
#include "src/game_presence.h"

#include "src/logging.h"
#include "src/platform/common.h"

#include <utility>

using namespace std::literals;

namespace livesync {
  GamePresenceDetector::GamePresenceDetector(std::string process_name, probe_fn probe)
    : process_name_(std::move(process_name)),
      probe_(probe ? std::move(probe) : probe_fn(&platf::process_running)) {}

  bool GamePresenceDetector::is_game_running() {
    std::optional<bool> running;
    try {
      running = probe_(process_name_);
    } catch (const std::exception &e) {
      BOOST_LOG(debug) << "Game detection: probe threw: "sv << e.what();
    }

    if (!running) {
      if (!warned_unavailable_) {
        BOOST_LOG(warning) << "Game detection: process list unavailable, assuming "sv << process_name_ << " is running"sv;
        warned_unavailable_ = true;
      } else {
        BOOST_LOG(debug) << "Game detection: process list still unavailable"sv;
      }
      return true;
    }

    if (warned_unavailable_) {
      BOOST_LOG(info) << "Game detection: process list available again"sv;
      warned_unavailable_ = false;
    }
    return *running;
  }
}  // namespace livesync
