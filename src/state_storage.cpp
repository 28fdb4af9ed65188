#include "src/state_storage.h"

#include "src/logging.h"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <chrono>
#include <ctime>
#include <string>

using namespace std::literals;

namespace statefile {
  namespace {
    namespace fs = std::filesystem;
    namespace pt = boost::property_tree;

    pt::ptree &ensure_root(pt::ptree &tree) {
      auto it = tree.find("root");
      if (it == tree.not_found()) {
        auto inserted = tree.insert(tree.end(), std::make_pair(std::string("root"), pt::ptree {}));
        return inserted->second;
      }
      return it->second;
    }

    bool load_tree_if_exists(const fs::path &path, pt::ptree &out) {
      std::error_code ec;
      if (!fs::exists(path, ec)) {
        return false;
      }
      try {
        pt::read_json(path.string(), out);
        return true;
      } catch (const std::exception &e) {
        BOOST_LOG(warning) << "statefile: failed to read "sv << path.string() << ": "sv << e.what();
        out.clear();
        return false;
      }
    }

    void write_tree(const fs::path &path, const pt::ptree &tree) {
      try {
        auto dir = path.parent_path();
        if (!dir.empty() && !fs::exists(dir)) {
          fs::create_directories(dir);
        }
        pt::write_json(path.string(), tree);
      } catch (const std::exception &e) {
        BOOST_LOG(error) << "statefile: failed to write "sv << path.string() << ": "sv << e.what();
      }
    }

    std::string utc_timestamp(std::chrono::system_clock::time_point tp) {
      const auto tt = std::chrono::system_clock::to_time_t(tp);
      std::tm tm {};
#ifdef _WIN32
      gmtime_s(&tm, &tt);
#else
      gmtime_r(&tt, &tm);
#endif
      char buf[32];
      const auto len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
      return std::string(buf, len);
    }
  }  // namespace

  std::mutex &state_mutex() {
    static std::mutex mutex;
    return mutex;
  }

  void record_sync(const fs::path &path, const livesync::ini::sync_report_t &report) {
    if (path.empty()) {
      return;
    }

    std::lock_guard<std::mutex> guard(state_mutex());

    pt::ptree tree;
    (void) load_tree_if_exists(path, tree);
    auto &root = ensure_root(tree);

    const auto written = report.written_count();
    const auto failed = report.failed_count();

    root.put("sync_count", root.get<std::size_t>("sync_count", 0) + 1);
    root.put("targets_written", written);
    root.put("targets_failed", failed);
    if (written > 0) {
      root.put("last_sync", utc_timestamp(std::chrono::system_clock::now()));
    }

    pt::ptree failed_pt;
    std::string last_error = report.source_error;
    for (const auto &target : report.targets) {
      if (target.written) {
        continue;
      }
      pt::ptree item;
      item.put_value(target.path.filename().string());
      failed_pt.push_back({"", item});
      if (last_error.empty()) {
        last_error = target.path.filename().string() + ": " + target.error;
      }
    }
    root.put_child("failed_targets", failed_pt);
    root.put("last_error", last_error);

    write_tree(path, tree);
  }

  sync_state_t load_sync_state(const fs::path &path) {
    sync_state_t state;
    if (path.empty()) {
      return state;
    }

    std::lock_guard<std::mutex> guard(state_mutex());

    pt::ptree tree;
    if (!load_tree_if_exists(path, tree)) {
      return state;
    }

    try {
      auto root_opt = tree.get_child_optional("root");
      if (!root_opt) {
        return state;
      }
      state.last_sync = root_opt->get<std::string>("last_sync", "");
      state.sync_count = root_opt->get<std::size_t>("sync_count", 0);
      state.targets_written = root_opt->get<std::size_t>("targets_written", 0);
      state.targets_failed = root_opt->get<std::size_t>("targets_failed", 0);
      state.last_error = root_opt->get<std::string>("last_error", "");
      if (auto failed_opt = root_opt->get_child_optional("failed_targets")) {
        for (const auto &item : *failed_opt) {
          auto name = item.second.get_value<std::string>("");
          if (!name.empty()) {
            state.failed_targets.push_back(std::move(name));
          }
        }
      }
    } catch (const std::exception &e) {
      BOOST_LOG(warning) << "statefile: failed to parse sync state: "sv << e.what();
    }
    return state;
  }

}  // namespace statefile
