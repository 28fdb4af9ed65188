/**
 * @file src/pause_coordinator.cpp
 * @brief Definitions for the live sync pause coordinator.
 */
#include "src/pause_coordinator.h"

#include "src/logging.h"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

using namespace std::literals;

namespace livesync {
  namespace fs = std::filesystem;

  PauseCoordinator::PauseCoordinator(paths::layout_t layout)
    : layout_(std::move(layout)),
      worker_([this](std::stop_token st) {
        worker_loop(st);
      }) {}

  PauseCoordinator::~PauseCoordinator() {
    if (worker_.joinable()) {
      worker_.request_stop();
      cv_.notify_all();
      worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!deferred_.empty()) {
      BOOST_LOG(debug) << "LiveSync pause: dropping "sv << deferred_.size() << " deferred resume(s)"sv;
    }
  }

  void PauseCoordinator::pause() {
    std::error_code ec;
    if (!fs::is_directory(layout_.difficulties_dir, ec)) {
      BOOST_LOG(debug) << "LiveSync pause: "sv << layout_.difficulties_dir.string() << " missing, nothing to pause"sv;
      return;
    }

    std::ofstream out(layout_.pause_flag, std::ios::binary | std::ios::trunc);
    if (!out) {
      BOOST_LOG(warning) << "LiveSync pause: unable to create "sv << layout_.pause_flag.string();
      return;
    }
    out << "paused"sv;
    out.flush();
    if (!out) {
      BOOST_LOG(warning) << "LiveSync pause: failed writing "sv << layout_.pause_flag.string();
      return;
    }
    BOOST_LOG(info) << "LiveSync paused"sv;
  }

  void PauseCoordinator::resume(bool trigger_sync) {
    std::error_code ec;
    if (!fs::is_directory(layout_.difficulties_dir, ec)) {
      BOOST_LOG(debug) << "LiveSync resume: "sv << layout_.difficulties_dir.string() << " missing, nothing to resume"sv;
      return;
    }

    if (fs::exists(layout_.pause_flag, ec)) {
      fs::remove(layout_.pause_flag, ec);
      if (ec) {
        BOOST_LOG(warning) << "LiveSync resume: unable to remove "sv << layout_.pause_flag.string() << ": "sv << ec.message();
      }
    }

    if (trigger_sync) {
      std::error_code touch_ec;
      if (fs::exists(layout_.work_file, touch_ec)) {
        fs::last_write_time(layout_.work_file, fs::file_time_type::clock::now(), touch_ec);
        if (touch_ec) {
          BOOST_LOG(warning) << "LiveSync resume: unable to touch "sv << layout_.work_file.string() << ": "sv << touch_ec.message();
        }
      }
    }
    BOOST_LOG(info) << "LiveSync resumed"sv << (trigger_sync ? " (sync requested)"sv : ""sv);
  }

  void PauseCoordinator::resume_after(std::chrono::duration<double> delay, bool trigger_sync) {
    if (delay.count() < 0.0) {
      delay = 0s;
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      deferred_.emplace(deadline, trigger_sync);
    }
    cv_.notify_one();
    BOOST_LOG(debug) << "LiveSync pause: resume scheduled in "sv << delay.count() << 's';
  }

  bool PauseCoordinator::is_paused() const {
    std::error_code ec;
    return fs::exists(layout_.pause_flag, ec);
  }

  void PauseCoordinator::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() {
      return deferred_.empty() && !running_task_;
    });
  }

  void PauseCoordinator::worker_loop(std::stop_token st) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!st.stop_requested()) {
      if (deferred_.empty()) {
        cv_.wait(lock, st, [this]() {
          return !deferred_.empty();
        });
        continue;
      }

      auto next = deferred_.begin();
      if (next->first > std::chrono::steady_clock::now()) {
        const auto deadline = next->first;
        cv_.wait_until(lock, st, deadline, [this, deadline]() {
          return !deferred_.empty() && deferred_.begin()->first < deadline;
        });
        continue;
      }

      const bool trigger_sync = next->second;
      deferred_.erase(next);
      running_task_ = true;
      lock.unlock();
      resume(trigger_sync);
      lock.lock();
      running_task_ = false;
      idle_cv_.notify_all();
    }
  }
}  // namespace livesync
