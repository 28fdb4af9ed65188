/**
 * @file tests/unit/test_game_presence.cpp
 * @brief Unit tests for game presence detection.
 */
#include "../tests_common.h"

#include "src/game_presence.h"
#include "src/platform/common.h"

#include <deque>
#include <stdexcept>
#include <vector>

using livesync::GamePresenceDetector;

namespace {
  struct ProbeHarness {
    std::deque<std::optional<bool>> results;
    std::vector<std::string> names;
    bool throw_next = false;

    GamePresenceDetector::probe_fn probe() {
      return [this](std::string_view name) -> std::optional<bool> {
        names.emplace_back(name);
        if (throw_next) {
          throw_next = false;
          throw std::runtime_error("snapshot failed");
        }
        if (results.empty()) {
          return false;
        }
        auto result = results.front();
        results.pop_front();
        return result;
      };
    }
  };
}  // namespace

TEST(GamePresenceDetector, ReportsProbeResult) {
  ProbeHarness harness;
  harness.results = {true, false};
  GamePresenceDetector detector("ReadyOrNotSteam-Win64-Shipping.exe", harness.probe());

  EXPECT_TRUE(detector.is_game_running());
  EXPECT_FALSE(detector.is_game_running());
  ASSERT_EQ(harness.names.size(), 2u);
  EXPECT_EQ(harness.names[0], "ReadyOrNotSteam-Win64-Shipping.exe");
}

TEST(GamePresenceDetector, FailsOpenWhenProcessListUnavailable) {
  ProbeHarness harness;
  harness.results = {std::nullopt, std::nullopt, false};
  GamePresenceDetector detector("Game.exe", harness.probe());

  EXPECT_TRUE(detector.is_game_running());
  EXPECT_TRUE(detector.is_game_running());
  EXPECT_FALSE(detector.is_game_running());
}

TEST(GamePresenceDetector, FailsOpenWhenProbeThrows) {
  ProbeHarness harness;
  harness.throw_next = true;
  GamePresenceDetector detector("Game.exe", harness.probe());

  EXPECT_TRUE(detector.is_game_running());
  EXPECT_FALSE(detector.is_game_running());
}

TEST(GamePresenceDetector, DefaultsToPlatformProbe) {
  GamePresenceDetector detector("livesync-no-such-process-1f3a9c.exe");

  EXPECT_EQ(detector.process_name(), "livesync-no-such-process-1f3a9c.exe");
  const auto direct = platf::process_running(detector.process_name());
  // Without a readable process table the detector answers true, otherwise false.
  EXPECT_EQ(detector.is_game_running(), !direct.has_value());
}
