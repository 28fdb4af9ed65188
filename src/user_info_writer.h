/**
 * @file src/user_info_writer.h
 * @brief Mirror of the user's mod info and the debounced background writer feeding it.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace livesync {
  using value_map_t = std::map<std::string, std::string>;

  /**
   * @brief Turn CRLF, CR and LF into the two characters `\n`.
   */
  std::string encode_multiline(std::string_view value);

  std::string decode_multiline(std::string_view value);

  /**
   * @brief `key=value` store backing `user_mission_info.json`.
   *
   * Despite the extension the file is not JSON; the game tooling only ever
   * wrote one pair per line.
   */
  class MirrorStore {
  public:
    explicit MirrorStore(std::filesystem::path path);

    const std::filesystem::path &path() const {
      return path_;
    }

    bool exists() const;

    /**
     * @brief Read every pair. Lines without `=` are skipped, keys are trimmed.
     */
    value_map_t read() const;

    /**
     * @brief Merge `values` into the stored pairs and rewrite the file.
     * @return False when the file could not be written.
     */
    bool merge(const value_map_t &values);

    bool remove();

    /**
     * @brief Order in which keys are written: UI keys, code mapping keys, then the rest sorted.
     */
    static std::vector<std::string> ordered_keys(const value_map_t &values);

  private:
    std::filesystem::path path_;
  };

  /**
   * @brief Map `Modname`, `Version`, `Date` and `Notes` (any case) to their `UI_` mirror keys.
   *
   * Notes are multiline-encoded, every other key is dropped.
   */
  value_map_t to_mirror_values(const value_map_t &values);

  /**
   * @brief Single consumer that coalesces bursts of user info edits into one write.
   *
   * Requests are queued without blocking. The consumer keeps only the newest
   * value map, OR-ing the requested destinations, and writes once no request has
   * arrived for the debounce window.
   */
  class UserInfoWriter {
  public:
    static constexpr std::size_t k_queue_capacity = 64;

    struct Hooks {
      std::function<void(const value_map_t &)> write_work;
      std::function<bool(const value_map_t &)> write_mirror;  ///< Receives the `UI_` values only.
    };

    UserInfoWriter(std::chrono::milliseconds debounce, Hooks hooks);
    ~UserInfoWriter();

    UserInfoWriter(const UserInfoWriter &) = delete;
    UserInfoWriter &operator=(const UserInfoWriter &) = delete;

    void enqueue(value_map_t values, bool write_work, bool write_mirror);

    /**
     * @brief Write whatever is pending now and wait for it.
     */
    void flush();

    /**
     * @brief Flush and join the consumer. Later requests are dropped.
     */
    void stop();

    std::size_t writes_performed() const;

  private:
    struct request_t {
      value_map_t values;
      bool write_work = false;
      bool write_mirror = false;
    };

    void worker_loop(std::stop_token st);
    void coalesce_locked();
    void perform_write(const request_t &request);

    std::chrono::milliseconds debounce_;
    Hooks hooks_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::condition_variable idle_cv_;
    std::deque<request_t> queue_;
    std::optional<request_t> pending_;
    std::chrono::steady_clock::time_point deadline_;
    bool flush_requested_ = false;
    bool writing_ = false;
    bool stopped_ = false;
    std::size_t writes_ = 0;
    std::jthread worker_;
  };
}  // namespace livesync
