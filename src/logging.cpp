/**
 * @file src/logging.cpp
 * @brief Definitions for logging related functions.
 */
#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

// lib includes
#include <boost/core/null_deleter.hpp>
#include <boost/format.hpp>
#include <boost/make_shared.hpp>
#include <boost/log/common.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sources/severity_logger.hpp>

// local includes
#include "src/logging.h"
#include "version.h"

using namespace std::literals;

namespace bl = boost::log;

boost::shared_ptr<text_sink> sink;
boost::shared_ptr<file_sink> log_file_sink;

bl::sources::severity_logger<int> verbose(0);  // Dominating output
bl::sources::severity_logger<int> debug(1);  // Follow what is happening
bl::sources::severity_logger<int> info(2);  // Should be informed about
bl::sources::severity_logger<int> warning(3);  // Strange events
bl::sources::severity_logger<int> error(4);  // Recoverable errors
bl::sources::severity_logger<int> fatal(5);  // Unrecoverable errors
#ifdef LIVESYNC_TESTS
bl::sources::severity_logger<int> tests(10);  // Automatic tests output
#endif

namespace logging {
  namespace {
    constexpr std::uintmax_t k_rotation_size = 2ull * 1024ull * 1024ull;
    constexpr std::size_t k_max_rollovers = 10;
    constexpr std::array<unsigned char, 3> k_utf8_bom {0xEF, 0xBB, 0xBF};

    std::string_view level_name(int level) {
      static constexpr std::array<std::string_view, 6> names {
        "Verbose: "sv,
        "Debug: "sv,
        "Info: "sv,
        "Warning: "sv,
        "Error: "sv,
        "Fatal: "sv,
      };
      if (level >= 0 && level < static_cast<int>(names.size())) {
        return names[level];
      }
#ifdef LIVESYNC_TESTS
      if (level == 10) {
        return "Tests: "sv;
      }
#endif
      return {};
    }

    /**
     * @brief Rotating file sink; rolled files are kept next to the log as `<name>.<n>`.
     */
    boost::shared_ptr<file_sink> make_file_sink(const std::filesystem::path &path, bool append) {
      std::error_code ec;
      auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::current_path(ec);
      if (path.has_parent_path()) {
        std::filesystem::create_directories(dir, ec);
      }

      auto mode = std::ios_base::out | (append ? std::ios_base::app : std::ios_base::trunc);
      auto backend = boost::make_shared<bl::sinks::text_file_backend>(
        bl::keywords::file_name = path.string(),
        bl::keywords::target_file_name = path.filename().string() + ".%N",
        bl::keywords::open_mode = mode,
        bl::keywords::rotation_size = k_rotation_size,
        bl::keywords::auto_flush = true
      );

      // A new file gets a UTF-8 BOM; an appended one is left as it is.
      backend->set_open_handler([path](std::ostream &os) {
        std::error_code size_ec;
        if (std::filesystem::file_size(path, size_ec) == 0 && !size_ec) {
          os.write(reinterpret_cast<const char *>(k_utf8_bom.data()), k_utf8_bom.size());
        }
      });
      backend->set_file_collector(bl::sinks::file::make_collector(
        bl::keywords::target = dir.string(),
        bl::keywords::max_files = k_max_rollovers
      ));
      backend->scan_for_files();

      return boost::make_shared<file_sink>(backend);
    }

    std::unique_ptr<deinit_t> install(int min_log_level, const std::string &log_file, bool append) {
      if (sink || log_file_sink) {
        deinit();
      }

      sink = boost::make_shared<text_sink>();
#ifndef LIVESYNC_TESTS
      sink->locked_backend()->add_stream(boost::shared_ptr<std::ostream> {&std::cout, boost::null_deleter()});
#endif
      sink->locked_backend()->auto_flush(true);
      sink->set_filter(severity >= min_log_level);
      sink->set_formatter(&formatter);
      bl::core::get()->add_sink(sink);

      if (log_file.empty()) {
        return std::make_unique<deinit_t>();
      }

      try {
        log_file_sink = make_file_sink(log_file, append);
        log_file_sink->set_filter(severity >= min_log_level);
        log_file_sink->set_formatter(&formatter);
        bl::core::get()->add_sink(log_file_sink);
      } catch (const std::exception &e) {
        log_file_sink.reset();
        BOOST_LOG(warning) << "Unable to open log file "sv << bracket(log_file) << ", logging to console only: "sv << e.what();
      }
      return std::make_unique<deinit_t>();
    }
  }  // namespace

  deinit_t::~deinit_t() {
    deinit();
  }

  void deinit() {
    log_flush();
    auto core = bl::core::get();
    if (sink) {
      core->remove_sink(sink);
      sink->stop();
      sink.reset();
    }
    if (log_file_sink) {
      core->remove_sink(log_file_sink);
      log_file_sink->stop();
      log_file_sink.reset();
    }
  }

  void formatter(const boost::log::record_view &view, boost::log::formatting_ostream &os) {
    const auto level = view.attribute_values()["Severity"].extract<int>().get();

    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto t = std::chrono::system_clock::to_time_t(now);
    const auto lt = *std::localtime(&t);

    os << "["sv << std::put_time(&lt, "%Y-%m-%d %H:%M:%S.") << boost::format("%03u") % ms.count() << "]: "sv
       << level_name(level) << view.attribute_values()["Message"].extract<std::string>();
  }

  [[nodiscard]] std::unique_ptr<deinit_t> init(int min_log_level, const std::string &log_file) {
    return install(min_log_level, log_file, false);
  }

  [[nodiscard]] std::unique_ptr<deinit_t> init(int min_log_level, const std::filesystem::path &log_file) {
    return init(min_log_level, log_file.string());
  }

  [[nodiscard]] std::unique_ptr<deinit_t> init_append(int min_log_level, const std::string &log_file) {
    return install(min_log_level, log_file, true);
  }

  [[nodiscard]] std::unique_ptr<deinit_t> init_append(int min_log_level, const std::filesystem::path &log_file) {
    return init_append(min_log_level, log_file.string());
  }

  void reconfigure_min_log_level(int min_log_level) {
    if (sink) {
      sink->set_filter(severity >= min_log_level);
    }
    if (log_file_sink) {
      log_file_sink->set_filter(severity >= min_log_level);
    }
  }

  void log_flush() {
    if (sink) {
      sink->flush();
    }
    if (log_file_sink) {
      log_file_sink->flush();
    }
  }

  void print_help(const char *name) {
    std::cout
      << "Usage: "sv << name << " [options] [name=value ...] [command] [args]"sv << std::endl
      << "    Any configurable option can be overwritten with: \"name=value\""sv << std::endl
      << std::endl
      << "    --help                    | print help"sv << std::endl
      << "    --version                 | print the version of "sv << PROJECT_NAME << std::endl
      << "    --config <file>           | read options from <file> instead of livesync.conf"sv << std::endl
      << std::endl
      << "    commands"sv << std::endl
      << "        run                              | keep the difficulty files in sync (default)"sv << std::endl
      << "        sync                             | copy work.ini into the difficulty files once"sv << std::endl
      << "        pause                            | suspend live sync"sv << std::endl
      << "        resume [--delay=<s>] [--no-trigger]"sv << std::endl
      << "                                         | lift the pause, optionally after a delay"sv << std::endl
      << "        status                           | print the current state as JSON"sv << std::endl
      << "        set-info Key=Value ...           | store mod info in the user info mirror"sv << std::endl
      << std::endl;
  }

  std::string bracket(const std::string &input) {
    return "["s + input + "]"s;
  }
}  // namespace logging
