/**
 * @file src/user_info_writer.cpp
 * @brief Definitions for the user info mirror and its background writer.
 */
#include "src/user_info_writer.h"

#include "src/ini_merge.h"
#include "src/logging.h"

#include <algorithm>
#include <array>
#include <boost/algorithm/string.hpp>
#include <set>
#include <system_error>
#include <utility>

using namespace std::literals;

namespace livesync {
  namespace fs = std::filesystem;

  namespace {
    constexpr std::array<std::string_view, 4> k_ui_keys {
      "UI_Modname"sv,
      "UI_Version"sv,
      "UI_Date"sv,
      "UI_Notes"sv,
    };

    constexpr std::array<std::string_view, 7> k_mapping_keys {
      "CodePrefix"sv,
      "CodeNumber"sv,
      "DifficultyNameKey"sv,
      "DifficultySubtextKey"sv,
      "DifficultyGameplayTag"sv,
      "GameplayTag"sv,
      "DifficultyFlavorKey"sv,
    };
  }  // namespace

  std::string encode_multiline(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
      const char ch = value[i];
      if (ch == '\r') {
        if (i + 1 < value.size() && value[i + 1] == '\n') {
          ++i;
        }
        out += "\\n"sv;
      } else if (ch == '\n') {
        out += "\\n"sv;
      } else {
        out.push_back(ch);
      }
    }
    return out;
  }

  std::string decode_multiline(std::string_view value) {
    std::string out(value);
    boost::replace_all(out, "\\n", "\n");
    return out;
  }

  MirrorStore::MirrorStore(fs::path path)
    : path_(std::move(path)) {}

  bool MirrorStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
  }

  value_map_t MirrorStore::read() const {
    value_map_t values;
    std::error_code ec;
    auto text = ini::read_file(path_, ec);
    if (!text) {
      if (ec != std::errc::no_such_file_or_directory) {
        BOOST_LOG(warning) << "User info: unable to read "sv << path_.string() << ": "sv << ec.message();
      }
      return values;
    }

    std::vector<std::string> lines;
    boost::split(lines, *text, boost::is_any_of("\n"));
    for (auto &line : lines) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      const auto eq = line.find('=');
      if (eq == std::string::npos) {
        continue;
      }
      auto key = boost::trim_copy(line.substr(0, eq));
      values[key] = line.substr(eq + 1);
    }
    return values;
  }

  std::vector<std::string> MirrorStore::ordered_keys(const value_map_t &values) {
    std::vector<std::string> keys;
    keys.reserve(values.size());

    std::set<std::string_view> fixed;
    auto take = [&](std::string_view key) {
      fixed.insert(key);
      if (values.count(std::string(key))) {
        keys.emplace_back(key);
      }
    };
    std::for_each(k_ui_keys.begin(), k_ui_keys.end(), take);
    std::for_each(k_mapping_keys.begin(), k_mapping_keys.end(), take);

    // std::map iterates in sorted order already.
    for (const auto &[key, _] : values) {
      if (!fixed.count(key)) {
        keys.push_back(key);
      }
    }
    return keys;
  }

  bool MirrorStore::merge(const value_map_t &values) {
    auto current = read();
    for (const auto &[key, value] : values) {
      current[key] = value;
    }

    std::string content;
    for (const auto &key : ordered_keys(current)) {
      content += key;
      content.push_back('=');
      content += current[key];
      content.push_back('\n');
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
      fs::create_directories(path_.parent_path(), ec);
      if (ec) {
        BOOST_LOG(warning) << "User info: unable to create "sv << path_.parent_path().string() << ": "sv << ec.message();
        return false;
      }
    }

    auto tmp = path_;
    tmp += ".tmp";
    if (auto err = ini::write_file(tmp, content); !err.empty()) {
      BOOST_LOG(warning) << "User info: "sv << tmp.string() << ": "sv << err;
      fs::remove(tmp, ec);
      return false;
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
      BOOST_LOG(warning) << "User info: unable to replace "sv << path_.string() << ": "sv << ec.message();
      std::error_code rm_ec;
      fs::remove(tmp, rm_ec);
      return false;
    }
    return true;
  }

  bool MirrorStore::remove() {
    std::error_code ec;
    const bool removed = fs::remove(path_, ec);
    if (ec) {
      BOOST_LOG(warning) << "User info: unable to delete "sv << path_.string() << ": "sv << ec.message();
      return false;
    }
    if (removed) {
      BOOST_LOG(info) << "User info: mirror removed"sv;
    }
    return true;
  }

  value_map_t to_mirror_values(const value_map_t &values) {
    value_map_t out;
    for (const auto &[key, value] : values) {
      if (boost::iequals(key, "modname")) {
        out["UI_Modname"] = value;
      } else if (boost::iequals(key, "version")) {
        out["UI_Version"] = value;
      } else if (boost::iequals(key, "date")) {
        out["UI_Date"] = value;
      } else if (boost::iequals(key, "notes")) {
        out["UI_Notes"] = encode_multiline(value);
      }
    }
    return out;
  }

  UserInfoWriter::UserInfoWriter(std::chrono::milliseconds debounce, Hooks hooks)
    : debounce_(debounce),
      hooks_(std::move(hooks)),
      worker_([this](std::stop_token st) {
        worker_loop(st);
      }) {}

  UserInfoWriter::~UserInfoWriter() {
    stop();
  }

  void UserInfoWriter::enqueue(value_map_t values, bool write_work, bool write_mirror) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopped_) {
        BOOST_LOG(warning) << "User info: writer stopped, dropping request"sv;
        return;
      }
      if (queue_.size() >= k_queue_capacity) {
        queue_.pop_front();
        BOOST_LOG(debug) << "User info: queue full, dropped the oldest request"sv;
      }
      queue_.push_back(request_t {std::move(values), write_work, write_mirror});
    }
    cv_.notify_one();
  }

  void UserInfoWriter::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopped_ || (queue_.empty() && !pending_ && !writing_)) {
      return;
    }
    flush_requested_ = true;
    cv_.notify_one();
    idle_cv_.wait(lock, [this]() {
      return queue_.empty() && !pending_ && !writing_;
    });
  }

  void UserInfoWriter::stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopped_) {
        return;
      }
      stopped_ = true;
    }
    if (worker_.joinable()) {
      worker_.request_stop();
      cv_.notify_all();
      worker_.join();
    }
  }

  std::size_t UserInfoWriter::writes_performed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
  }

  void UserInfoWriter::coalesce_locked() {
    request_t merged = pending_ ? std::move(*pending_) : request_t {};
    while (!queue_.empty()) {
      auto &next = queue_.front();
      merged.values = std::move(next.values);
      merged.write_work = merged.write_work || next.write_work;
      merged.write_mirror = merged.write_mirror || next.write_mirror;
      queue_.pop_front();
    }
    pending_ = std::move(merged);
    deadline_ = std::chrono::steady_clock::now() + debounce_;
  }

  void UserInfoWriter::worker_loop(std::stop_token st) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      if (!queue_.empty()) {
        coalesce_locked();
      }

      const bool stopping = st.stop_requested();
      if (pending_ && (stopping || flush_requested_ || std::chrono::steady_clock::now() >= deadline_)) {
        auto request = std::move(*pending_);
        pending_.reset();
        writing_ = true;
        lock.unlock();
        perform_write(request);
        lock.lock();
        writing_ = false;
        ++writes_;
        continue;
      }

      if (!pending_) {
        flush_requested_ = false;
        idle_cv_.notify_all();
        if (stopping) {
          break;
        }
        cv_.wait(lock, st, [this]() {
          return !queue_.empty() || flush_requested_;
        });
        continue;
      }

      cv_.wait_until(lock, st, deadline_, [this]() {
        return !queue_.empty() || flush_requested_;
      });
    }
  }

  void UserInfoWriter::perform_write(const request_t &request) {
    if (request.write_work && hooks_.write_work) {
      try {
        hooks_.write_work(request.values);
      } catch (const std::exception &e) {
        BOOST_LOG(error) << "User info: work file update failed: "sv << e.what();
      }
    }

    if (request.write_mirror && hooks_.write_mirror) {
      auto mirror_values = to_mirror_values(request.values);
      if (mirror_values.empty()) {
        return;
      }
      try {
        if (!hooks_.write_mirror(mirror_values)) {
          BOOST_LOG(warning) << "User info: mirror update failed"sv;
        }
      } catch (const std::exception &e) {
        BOOST_LOG(error) << "User info: mirror update failed: "sv << e.what();
      }
    }
  }
}  // namespace livesync
