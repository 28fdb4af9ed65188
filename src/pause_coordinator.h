/**
 * @file src/pause_coordinator.h
 * @brief File-flag based suspension of live sync around bulk file operations.
 */
#pragma once

#include "src/paths.h"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace livesync {
  /**
   * @brief Creates and removes the pause flag next to the difficulty files.
   *
   * Every operation is best effort: I/O failures are logged and never reach the
   * caller. Nothing happens while the difficulties directory is missing, since
   * creating it would make the mod look installed.
   */
  class PauseCoordinator {
  public:
    explicit PauseCoordinator(paths::layout_t layout);
    ~PauseCoordinator();

    PauseCoordinator(const PauseCoordinator &) = delete;
    PauseCoordinator &operator=(const PauseCoordinator &) = delete;

    void pause();

    /**
     * @brief Remove the pause flag.
     * @param trigger_sync Touch the work file so the next poll sees a change and syncs.
     */
    void resume(bool trigger_sync);

    /**
     * @brief Resume after `delay` without blocking the caller.
     *
     * The flag stays in place for the whole delay. Deferred resumes that have not
     * fired when the coordinator is destroyed are dropped.
     */
    void resume_after(std::chrono::duration<double> delay, bool trigger_sync);

    bool is_paused() const;

    /**
     * @brief Block until every deferred resume has run.
     */
    void wait_idle();

  private:
    void worker_loop(std::stop_token st);

    paths::layout_t layout_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::condition_variable idle_cv_;
    std::multimap<std::chrono::steady_clock::time_point, bool> deferred_;
    bool running_task_ = false;
    std::jthread worker_;
  };
}  // namespace livesync
