/**
 * @file src/logging.h
 * @brief Declarations for logging related functions.
 */
#pragma once

// standard includes
#include <filesystem>
#include <memory>
#include <string>

// lib includes
#include <boost/log/common.hpp>
#include <boost/log/sinks.hpp>

using text_sink = boost::log::sinks::asynchronous_sink<boost::log::sinks::text_ostream_backend>;
using file_sink = boost::log::sinks::asynchronous_sink<boost::log::sinks::text_file_backend>;

extern boost::log::sources::severity_logger<int> verbose;
extern boost::log::sources::severity_logger<int> debug;
extern boost::log::sources::severity_logger<int> info;
extern boost::log::sources::severity_logger<int> warning;
extern boost::log::sources::severity_logger<int> error;
extern boost::log::sources::severity_logger<int> fatal;
#ifdef LIVESYNC_TESTS
extern boost::log::sources::severity_logger<int> tests;
#endif

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", int)

namespace logging {
  class deinit_t {
  public:
    ~deinit_t();
  };

  void deinit();

  void formatter(const boost::log::record_view &view, boost::log::formatting_ostream &os);

  /**
   * @brief Initialize the logging system.
   * @param min_log_level The minimum log level to output.
   * @param log_file The log file to write to. Rolled over once it grows past 2 MiB, keeping ten old files.
   * @return An object that will deinitialize the logging system when it goes out of scope.
   * @examples
   * log_init(2, "livesync.log");
   * @examples_end
   */
  [[nodiscard]] std::unique_ptr<deinit_t> init(int min_log_level, const std::string &log_file);
  [[nodiscard]] std::unique_ptr<deinit_t> init(int min_log_level, const std::filesystem::path &log_file);

  /**
   * @brief Initialize logging in append mode.
   *
   * One-shot commands use this so they never truncate the log of a running `livesync run`.
   */
  [[nodiscard]] std::unique_ptr<deinit_t> init_append(int min_log_level, const std::string &log_file);
  [[nodiscard]] std::unique_ptr<deinit_t> init_append(int min_log_level, const std::filesystem::path &log_file);

  void reconfigure_min_log_level(int min_log_level);

  /**
   * @brief Flush the log.
   */
  void log_flush();

  /**
   * @brief Print help to stdout.
   * @param name The name of the program.
   */
  void print_help(const char *name);

  /**
   * @brief Wrap a string in brackets.
   * @param input The string to wrap.
   * @return The wrapped string.
   */
  std::string bracket(const std::string &input);
}  // namespace logging
