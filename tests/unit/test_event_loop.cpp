/**
 * @file tests/unit/test_event_loop.cpp
 * @brief Unit tests for the single-threaded event loop.
 */
#include "../tests_common.h"

#include "src/event_loop.h"

#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(EventLoop, RunsTimersInDeadlineOrder) {
  livesync::EventLoop loop;
  std::vector<int> order;

  loop.schedule_once(30ms, [&]() {
    order.push_back(3);
    loop.stop();
  });
  loop.schedule_once(10ms, [&]() { order.push_back(1); });
  loop.schedule_once(20ms, [&]() { order.push_back(2); });

  loop.run();

  EXPECT_EQ(order, (std::vector<int> {1, 2, 3}));
}

TEST(EventLoop, EqualDeadlinesFireInSchedulingOrder) {
  livesync::EventLoop loop;
  std::vector<int> order;

  // Negative delays are clamped to zero.
  loop.schedule_once(-5ms, [&]() { order.push_back(1); });
  loop.schedule_once(-5ms, [&]() { order.push_back(2); });
  loop.schedule_once(50ms, [&]() { loop.stop(); });

  loop.run();

  ASSERT_EQ(order.size(), 2u);
  EXPECT_EQ(order[0], 1);
  EXPECT_EQ(order[1], 2);
}

TEST(EventLoop, CancelledTimerNeverFires) {
  livesync::EventLoop loop;
  bool fired = false;

  const auto id = loop.schedule_once(10ms, [&]() { fired = true; });
  loop.schedule_once(40ms, [&]() { loop.stop(); });
  loop.cancel(id);
  loop.cancel(id);
  loop.cancel(12345);

  loop.run();

  EXPECT_FALSE(fired);
  EXPECT_EQ(loop.pending(), 0u);
}

TEST(EventLoop, PostedCallbacksRunFirst) {
  livesync::EventLoop loop;
  std::vector<int> order;

  loop.schedule_once(0ms, [&]() {
    order.push_back(2);
    loop.stop();
  });
  loop.post([&]() { order.push_back(1); });

  loop.run();

  EXPECT_EQ(order, (std::vector<int> {1, 2}));
}

TEST(EventLoop, StopFromAnotherThread) {
  livesync::EventLoop loop;
  loop.schedule_once(10s, []() {});

  std::jthread stopper([&loop]() {
    std::this_thread::sleep_for(50ms);
    loop.stop();
  });

  loop.run();

  EXPECT_TRUE(loop.stopped());
  EXPECT_EQ(loop.pending(), 1u);
}

TEST(EventLoop, StopBeforeRunIsKept) {
  livesync::EventLoop loop;
  bool fired = false;
  loop.schedule_once(0ms, [&]() { fired = true; });

  loop.stop();
  loop.run();

  EXPECT_FALSE(fired);
  EXPECT_TRUE(loop.stopped());
  EXPECT_EQ(loop.pending(), 1u);
}

TEST(EventLoop, ThrowingCallbackDoesNotStopTheLoop) {
  livesync::EventLoop loop;
  bool reached = false;

  loop.schedule_once(0ms, []() { throw std::runtime_error("boom"); });
  loop.schedule_once(10ms, [&]() {
    reached = true;
    loop.stop();
  });

  loop.run();

  EXPECT_TRUE(reached);
}

TEST(EventLoop, CallbacksMayScheduleMoreTimers) {
  livesync::EventLoop loop;
  int ticks = 0;

  std::function<void()> tick = [&]() {
    if (++ticks == 3) {
      loop.stop();
      return;
    }
    loop.schedule_once(1ms, tick);
  };
  loop.schedule_once(0ms, tick);

  loop.run();

  EXPECT_EQ(ticks, 3);
}

TEST(EventLoop, NowAdvances) {
  livesync::EventLoop loop;
  const auto a = loop.now();
  std::this_thread::sleep_for(5ms);
  EXPECT_GT(loop.now(), a);
}
