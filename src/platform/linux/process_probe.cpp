/**
 * @file src/platform/linux/process_probe.cpp
 * @brief Process table lookup by scanning /proc.
 *
 * Games started through Wine or Proton show up with a Windows path as argv[0],
 * so both separators are accepted when taking the basename.
 */
#include "src/logging.h"
#include "src/platform/common.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace platf {
  namespace {
    bool is_pid_directory(const fs::path &path) {
      const auto name = path.filename().string();
      if (name.empty()) {
        return false;
      }
      for (unsigned char ch : name) {
        if (!std::isdigit(ch)) {
          return false;
        }
      }
      return true;
    }

    std::string argv0_basename(const fs::path &pid_dir) {
      std::ifstream in(pid_dir / "cmdline", std::ios::binary);
      if (!in) {
        return {};
      }
      std::string argv0;
      std::getline(in, argv0, '\0');
      auto sep = argv0.find_last_of("/\\");
      if (sep != std::string::npos) {
        argv0.erase(0, sep + 1);
      }
      return argv0;
    }
  }  // namespace

  std::optional<bool> process_running(std::string_view exe_name) {
    if (exe_name.empty()) {
      return false;
    }

    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec) {
      BOOST_LOG(debug) << "Process probe: unable to read /proc: " << ec.message();
      return std::nullopt;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
      if (ec) {
        BOOST_LOG(debug) << "Process probe: /proc enumeration failed: " << ec.message();
        return std::nullopt;
      }
      if (!is_pid_directory(it->path())) {
        continue;
      }
      // Processes may exit between listing and reading; an empty cmdline just does not match.
      if (argv0_basename(it->path()) == exe_name) {
        return true;
      }
    }
    return false;
  }
}  // namespace platf
