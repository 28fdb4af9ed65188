/**
 * @file src/ini_merge.h
 * @brief Section-preserving merge of the work file into the difficulty files.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace livesync::ini {
  namespace fs = std::filesystem;

  /**
   * @brief Find the first line whose trimmed content equals `marker`, ignoring case.
   * @return Offset of the start of that line, or `std::nullopt`.
   */
  std::optional<std::size_t> find_marker(std::string_view text, std::string_view marker);

  /**
   * @brief Merge the synchronized body of `source` into `target`.
   *
   * Everything in the target before the marker line is kept verbatim; everything
   * from the marker on is replaced by the source's body. A target without the
   * marker gets the body appended once. A source without the marker changes nothing.
   *
   * @param source Work file content.
   * @param target Current target content, `std::nullopt` when the target does not exist.
   * @param marker Section header that starts the synchronized body, e.g. "[Global]".
   * @return The new target content.
   */
  std::string merge_section(std::string_view source, std::optional<std::string_view> target, std::string_view marker);

  /**
   * @brief Extract the parameter name of a `Key=Value` (or bare `Key`) line.
   * @return `std::nullopt` for blank lines, comments and section headers.
   */
  std::optional<std::string> parse_param_name(std::string_view line);

  /**
   * @brief Replace the value of every existing `Key=Value` line whose key is in `values`.
   *
   * Keys are matched exactly. Keys absent from the text are not added.
   *
   * @param replaced Receives the number of lines changed.
   */
  std::string replace_values(std::string_view text, const std::map<std::string, std::string> &values, std::size_t &replaced);

  struct target_result_t {
    fs::path path;
    bool written {false};
    std::string error;
  };

  struct sync_report_t {
    bool source_read {false};
    bool source_has_marker {false};
    bool preserve_excluded {false};
    std::vector<std::string> excluded_fields;  ///< Fields meant to survive in-game syncs; reported, not enforced.
    std::string source_error;
    std::vector<target_result_t> targets;

    std::size_t written_count() const;
    std::size_t failed_count() const;
  };

  /**
   * @brief Read the whole file. Never throws.
   * @return The content, or `std::nullopt` with `ec` set.
   */
  std::optional<std::string> read_file(const fs::path &path, std::error_code &ec);

  /**
   * @brief Overwrite `path` with `content` in place.
   * @return Empty string on success, a description of the failure otherwise.
   */
  std::string write_file(const fs::path &path, std::string_view content);

  /**
   * @brief File access used by the sync, replaceable in tests.
   */
  struct file_io_t {
    std::function<std::optional<std::string>(const fs::path &, std::error_code &)> read = read_file;
    std::function<std::string(const fs::path &, std::string_view)> write = write_file;
    std::function<fs::file_time_type(const fs::path &, std::error_code &)> modified_time = [](const fs::path &path, std::error_code &ec) {
      return fs::last_write_time(path, ec);
    };
  };

  /**
   * @brief Merge `source_file` into every target.
   *
   * Each target is handled on its own: a failure on one is recorded in the report
   * and the remaining targets are still attempted. Missing targets and missing
   * parent directories are created.
   *
   * @param preserve_excluded True while in game. Header preservation applies either way.
   */
  sync_report_t sync_targets(const fs::path &source_file, std::span<const fs::path> targets, std::string_view marker, bool preserve_excluded, const file_io_t &io = {});
}  // namespace livesync::ini
