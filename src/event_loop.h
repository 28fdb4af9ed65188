/**
 * @file src/event_loop.h
 * @brief Timer scheduling interfaces and a single-threaded event loop implementing them.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace livesync {
  using timer_id_t = std::uint64_t;

  class IClock {
  public:
    virtual ~IClock() = default;

    virtual std::chrono::steady_clock::time_point now() = 0;
  };

  /**
   * @brief One-shot timers. Callbacks of one scheduler never run concurrently.
   */
  class ITimerScheduler {
  public:
    virtual ~ITimerScheduler() = default;

    virtual timer_id_t schedule_once(std::chrono::milliseconds delay, std::function<void()> callback) = 0;

    /**
     * @brief Cancel a timer that has not fired yet. Unknown or fired ids are ignored.
     */
    virtual void cancel(timer_id_t id) = 0;
  };

  class SteadyClock final: public IClock {
  public:
    std::chrono::steady_clock::time_point now() override {
      return std::chrono::steady_clock::now();
    }
  };

  /**
   * @brief Runs timers and posted callbacks on the thread that calls `run()`.
   *
   * `schedule_once`, `cancel`, `post` and `stop` may be called from any thread.
   * Timers with the same deadline fire in the order they were scheduled.
   */
  class EventLoop final: public ITimerScheduler, public IClock {
  public:
    EventLoop() = default;
    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    timer_id_t schedule_once(std::chrono::milliseconds delay, std::function<void()> callback) override;
    void cancel(timer_id_t id) override;
    std::chrono::steady_clock::time_point now() override;

    void post(std::function<void()> callback);

    /**
     * @brief Process timers until `stop()` is called.
     */
    void run();

    /**
     * @brief Stop the loop. Sticky: a `run()` that starts afterwards returns right away.
     */
    void stop();

    bool stopped() const;

    std::size_t pending() const;

  private:
    using key_t = std::pair<std::chrono::steady_clock::time_point, timer_id_t>;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<key_t, std::function<void()>> timers_;
    std::map<timer_id_t, std::chrono::steady_clock::time_point> deadlines_;
    std::deque<std::function<void()>> posted_;
    timer_id_t next_id_ = 1;
    bool stop_requested_ = false;
  };
}  // namespace livesync
