/**
 * @file src/config.cpp
 * @brief Definitions for the configuration of the live sync tool.
 */
#include "src/config.h"

#include "src/logging.h"
#include "version.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::literals;

namespace config {

  sync_t sync;
  livesync_t livesync;

  namespace {
    const std::vector<std::string> k_default_excluded_fields {
      "DifficultyGameplayTag",
      "DifficultyNameKey",
      "DifficultySubtextKey",
      "DifficultyDescriptionKey",
      "DifficultyFlavorKey",
      "DifficultyBackground",
      "StackupLevel",
      "GameplayTagList",
    };

    std::string trim_copy(std::string s) {
      s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
                return !std::isspace(ch);
              }));
      s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
                return !std::isspace(ch);
              }).base(),
              s.end());
      return s;
    }

    std::string to_lower_copy(std::string s) {
      std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
      });
      return s;
    }

    bool to_bool(std::string s) {
      s = to_lower_copy(std::move(s));
      return s == "true" || s == "yes" || s == "enable" || s == "enabled" || s == "on" || s == "1";
    }

    void erase_take(std::unordered_map<std::string, std::string> &vars, const std::string &name, std::string &out) {
      auto it = vars.find(name);
      if (it == vars.end()) {
        return;
      }
      out = std::move(it->second);
      vars.erase(it);
    }

    void string_f(std::unordered_map<std::string, std::string> &vars, const std::string &name, std::string &out) {
      std::string tmp;
      erase_take(vars, name, tmp);
      if (!tmp.empty()) {
        out = std::move(tmp);
      }
    }

    void bool_f(std::unordered_map<std::string, std::string> &vars, const std::string &name, bool &out) {
      std::string tmp;
      erase_take(vars, name, tmp);
      if (!tmp.empty()) {
        out = to_bool(tmp);
      }
    }

    template<class Duration>
    void duration_f(std::unordered_map<std::string, std::string> &vars, const std::string &name, Duration &out) {
      std::string tmp;
      erase_take(vars, name, tmp);
      if (tmp.empty()) {
        return;
      }
      try {
        std::size_t consumed = 0;
        auto value = std::stoll(tmp, &consumed);
        if (consumed != tmp.size() || value < 0) {
          throw std::invalid_argument("not a non-negative integer");
        }
        out = Duration(static_cast<typename Duration::rep>(value));
      } catch (const std::exception &) {
        BOOST_LOG(warning) << "config: invalid value for "sv << name << ": "sv << tmp << ", keeping "sv << out.count();
      }
    }

    void seconds_f(std::unordered_map<std::string, std::string> &vars, const std::string &name, std::chrono::duration<double> &out) {
      std::string tmp;
      erase_take(vars, name, tmp);
      if (tmp.empty()) {
        return;
      }
      try {
        std::size_t consumed = 0;
        auto value = std::stod(tmp, &consumed);
        if (consumed != tmp.size() || value < 0.0) {
          throw std::invalid_argument("not a non-negative number");
        }
        out = std::chrono::duration<double> {value};
      } catch (const std::exception &) {
        BOOST_LOG(warning) << "config: invalid value for "sv << name << ": "sv << tmp << ", keeping "sv << out.count();
      }
    }

    // Accepts a JSON array of strings or a comma separated list.
    void list_f(std::unordered_map<std::string, std::string> &vars, const std::string &name, std::vector<std::string> &out) {
      std::string raw;
      erase_take(vars, name, raw);
      if (raw.empty()) {
        return;
      }
      try {
        auto j = nlohmann::json::parse(raw);
        if (j.is_array()) {
          out.clear();
          for (auto &el : j) {
            if (el.is_string() && !el.get<std::string>().empty()) {
              out.emplace_back(el.get<std::string>());
            }
          }
          return;
        }
      } catch (const nlohmann::json::exception &) {
        // not JSON, try CSV below
      }
      out.clear();
      std::string item;
      std::stringstream ss(raw);
      while (std::getline(ss, item, ',')) {
        item = trim_copy(std::move(item));
        if (!item.empty()) {
          out.push_back(std::move(item));
        }
      }
    }

    void log_level_f(std::unordered_map<std::string, std::string> &vars, const std::string &name, int &out) {
      std::string tmp;
      erase_take(vars, name, tmp);
      if (!tmp.empty()) {
        out = parse_log_level(tmp, out);
      }
    }
  }  // namespace

  int parse_log_level(const std::string &value, int fallback) {
    const auto v = to_lower_copy(value);
    if (v == "verbose"sv) {
      return 0;
    }
    if (v == "debug"sv) {
      return 1;
    }
    if (v == "info"sv) {
      return 2;
    }
    if (v == "warning"sv) {
      return 3;
    }
    if (v == "error"sv) {
      return 4;
    }
    if (v == "fatal"sv) {
      return 5;
    }
    if (v == "none"sv) {
      return 6;
    }
    if (v.size() == 1 && v[0] >= '0' && v[0] <= '6') {
      return v[0] - '0';
    }
    return fallback;
  }

  void reset_defaults() {
    sync.enabled = true;
    sync.pre_game_sync = true;
    sync.pre_game_interval = 10s;
    sync.active_interval = 1000ms;
    sync.idle_interval = 3000ms;
    sync.game_start_delay = 10s;
    sync.game_process = "ReadyOrNotSteam-Win64-Shipping.exe";
    sync.merge_marker = "[Global]";
    sync.excluded_fields = k_default_excluded_fields;
    sync.resume_delay = 3s;
    sync.write_debounce = 300ms;

    livesync.min_log_level = 2;
    livesync.log_file = "livesync.log";
    livesync.file_state = "livesync_state.json";
    livesync.config_root.clear();
    livesync.config_file = "livesync.conf";
    livesync.cmd = {};
  }

  std::unordered_map<std::string, std::string> parse_config(const std::string_view &file_content) {
    std::unordered_map<std::string, std::string> vars;

    std::string content(file_content);
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
      auto comment = line.find('#');
      if (comment != std::string::npos) {
        line.erase(comment);
      }
      auto eq = line.find('=');
      if (eq == std::string::npos) {
        if (!trim_copy(line).empty()) {
          BOOST_LOG(warning) << "config: ignoring line without '=': "sv << trim_copy(line);
        }
        continue;
      }
      auto name = trim_copy(line.substr(0, eq));
      auto value = trim_copy(line.substr(eq + 1));
      if (name.empty()) {
        continue;
      }
      vars[std::move(name)] = std::move(value);
    }

    return vars;
  }

  void apply_config(std::unordered_map<std::string, std::string> &&vars) {
    bool_f(vars, "enabled", sync.enabled);
    bool_f(vars, "pre_game_sync", sync.pre_game_sync);
    duration_f(vars, "pre_game_interval", sync.pre_game_interval);
    duration_f(vars, "active_interval", sync.active_interval);
    duration_f(vars, "idle_interval", sync.idle_interval);
    duration_f(vars, "game_start_delay", sync.game_start_delay);
    string_f(vars, "game_process", sync.game_process);
    string_f(vars, "merge_marker", sync.merge_marker);
    list_f(vars, "excluded_fields", sync.excluded_fields);
    seconds_f(vars, "resume_delay", sync.resume_delay);
    duration_f(vars, "write_debounce", sync.write_debounce);

    string_f(vars, "config_root", livesync.config_root);
    string_f(vars, "log_path", livesync.log_file);
    string_f(vars, "file_state", livesync.file_state);
    log_level_f(vars, "min_log_level", livesync.min_log_level);

    for (auto &[name, value] : vars) {
      BOOST_LOG(warning) << "config: unrecognized option "sv << logging::bracket(name) << " = "sv << value;
    }
  }

  int parse(int argc, char *argv[]) {
    reset_defaults();

    std::unordered_map<std::string, std::string> cmd_vars;
    bool explicit_config = false;

    for (int x = 1; x < argc; ++x) {
      const std::string_view arg {argv[x]};

      if (!livesync.cmd.name.empty()) {
        livesync.cmd.args.emplace_back(arg);
        continue;
      }

      if (arg == "--help"sv || arg == "-h"sv) {
        logging::print_help(argv[0]);
        return -1;
      }
      if (arg == "--version"sv) {
        std::cout << PROJECT_NAME << " version: v"sv << PROJECT_VER << std::endl;
        return -1;
      }
      if (arg == "--config"sv) {
        if (x + 1 >= argc) {
          std::cerr << "--config requires a file name"sv << std::endl;
          return 1;
        }
        livesync.config_file = argv[++x];
        explicit_config = true;
        continue;
      }
      if (arg.starts_with("--"sv)) {
        std::cerr << "Unknown option: "sv << arg << std::endl;
        logging::print_help(argv[0]);
        return 1;
      }

      auto eq = arg.find('=');
      if (eq != std::string_view::npos) {
        cmd_vars[trim_copy(std::string {arg.substr(0, eq)})] = trim_copy(std::string {arg.substr(eq + 1)});
        continue;
      }

      livesync.cmd.name = arg;
    }

    if (livesync.cmd.name.empty()) {
      livesync.cmd.name = "run";
    }

    std::unordered_map<std::string, std::string> vars;
    std::error_code ec;
    if (fs::exists(livesync.config_file, ec)) {
      std::ifstream in(livesync.config_file, std::ios::binary);
      if (!in) {
        std::cerr << "Unable to read configuration file "sv << logging::bracket(livesync.config_file) << std::endl;
        return 1;
      }
      std::string content {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
      vars = parse_config(content);
    } else if (explicit_config) {
      std::cerr << "Configuration file "sv << logging::bracket(livesync.config_file) << " does not exist"sv << std::endl;
      return 1;
    }

    // Command line overrides the configuration file
    for (auto &[name, value] : cmd_vars) {
      vars[name] = std::move(value);
    }

    apply_config(std::move(vars));
    return 0;
  }
}  // namespace config
