/**
 * @file src/event_loop.cpp
 * @brief Definitions for the single-threaded event loop.
 */
#include "src/event_loop.h"

#include "src/logging.h"

using namespace std::literals;

namespace livesync {
  timer_id_t EventLoop::schedule_once(std::chrono::milliseconds delay, std::function<void()> callback) {
    if (delay < 0ms) {
      delay = 0ms;
    }
    timer_id_t id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      id = next_id_++;
      const auto deadline = std::chrono::steady_clock::now() + delay;
      timers_.emplace(key_t {deadline, id}, std::move(callback));
      deadlines_.emplace(id, deadline);
    }
    cv_.notify_one();
    return id;
  }

  void EventLoop::cancel(timer_id_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) {
      return;
    }
    timers_.erase(key_t {it->second, id});
    deadlines_.erase(it);
  }

  std::chrono::steady_clock::time_point EventLoop::now() {
    return std::chrono::steady_clock::now();
  }

  void EventLoop::post(std::function<void()> callback) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      posted_.push_back(std::move(callback));
    }
    cv_.notify_one();
  }

  void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
      std::function<void()> task;
      if (!posted_.empty()) {
        task = std::move(posted_.front());
        posted_.pop_front();
      } else if (!timers_.empty()) {
        auto it = timers_.begin();
        if (it->first.first > std::chrono::steady_clock::now()) {
          cv_.wait_until(lock, it->first.first);
          continue;
        }
        task = std::move(it->second);
        deadlines_.erase(it->first.second);
        timers_.erase(it);
      } else {
        cv_.wait(lock);
        continue;
      }

      lock.unlock();
      if (task) {
        try {
          task();
        } catch (const std::exception &e) {
          BOOST_LOG(error) << "Event loop: callback threw: "sv << e.what();
        }
      }
      lock.lock();
    }
  }

  void EventLoop::stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_requested_ = true;
    }
    cv_.notify_all();
  }

  bool EventLoop::stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_requested_;
  }

  std::size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size() + posted_.size();
  }
}  // namespace livesync
