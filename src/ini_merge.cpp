/**
 * @file src/ini_merge.cpp
 * @brief Definitions for the section-preserving INI merge.
 */
#include "src/ini_merge.h"

#include "src/logging.h"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <cctype>
#include <fstream>
#include <ios>
#include <sstream>
#include <system_error>

using namespace std::literals;

namespace livesync::ini {
  namespace {
    std::string_view trim_left(std::string_view s) {
      auto it = std::find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !std::isspace(ch);
      });
      s.remove_prefix(static_cast<std::size_t>(it - s.begin()));
      return s;
    }

    std::string_view trim_right(std::string_view s) {
      while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
      }
      return s;
    }
  }  // namespace

  std::optional<std::size_t> find_marker(std::string_view text, std::string_view marker) {
    const auto wanted = trim_right(trim_left(marker));
    if (wanted.empty()) {
      return std::nullopt;
    }

    std::size_t line_start = 0;
    while (line_start <= text.size()) {
      auto line_end = text.find('\n', line_start);
      auto line = text.substr(line_start, line_end == std::string_view::npos ? std::string_view::npos : line_end - line_start);
      if (boost::iequals(trim_right(trim_left(line)), wanted)) {
        return line_start;
      }
      if (line_end == std::string_view::npos) {
        break;
      }
      line_start = line_end + 1;
    }
    return std::nullopt;
  }

  std::string merge_section(std::string_view source, std::optional<std::string_view> target, std::string_view marker) {
    auto src_pos = find_marker(source, marker);
    if (!src_pos) {
      return target ? std::string(*target) : std::string();
    }

    const auto body = trim_left(source.substr(*src_pos));
    if (!target || target->empty()) {
      return std::string(body);
    }

    std::string result;
    if (auto tgt_pos = find_marker(*target, marker)) {
      if (*tgt_pos == 0) {
        return std::string(body);
      }
      const auto header = trim_right(target->substr(0, *tgt_pos));
      result.reserve(header.size() + 1 + body.size());
      result.append(header);
      result.push_back('\n');
      result.append(body);
      return result;
    }

    result.reserve(target->size() + 1 + body.size());
    result.append(*target);
    if (result.back() != '\n') {
      result.push_back('\n');
    }
    result.append(body);
    return result;
  }

  std::optional<std::string> parse_param_name(std::string_view line) {
    auto stripped = trim_right(trim_left(line));
    if (stripped.empty() || stripped.front() == '#' || stripped.front() == ';' || stripped.front() == '[') {
      return std::nullopt;
    }
    auto eq = stripped.find('=');
    if (eq != std::string_view::npos) {
      stripped = trim_right(stripped.substr(0, eq));
    }
    if (stripped.empty()) {
      return std::nullopt;
    }
    return std::string(stripped);
  }

  std::string replace_values(std::string_view text, const std::map<std::string, std::string> &values, std::size_t &replaced) {
    replaced = 0;
    std::string out;
    out.reserve(text.size());

    std::size_t line_start = 0;
    while (line_start < text.size()) {
      auto line_end = text.find('\n', line_start);
      const bool last = line_end == std::string_view::npos;
      auto line = text.substr(line_start, last ? std::string_view::npos : line_end - line_start);
      const bool had_cr = !line.empty() && line.back() == '\r';
      if (had_cr) {
        line.remove_suffix(1);
      }

      auto name = line.find('=') != std::string_view::npos ? parse_param_name(line) : std::nullopt;
      auto it = name ? values.find(*name) : values.end();
      if (it != values.end()) {
        out.append(trim_right(line.substr(0, line.find('='))));
        out.push_back('=');
        out.append(it->second);
        ++replaced;
      } else {
        out.append(line);
      }
      if (had_cr) {
        out.push_back('\r');
      }
      if (last) {
        break;
      }
      out.push_back('\n');
      line_start = line_end + 1;
    }
    return out;
  }

  std::size_t sync_report_t::written_count() const {
    return static_cast<std::size_t>(std::count_if(targets.begin(), targets.end(), [](const target_result_t &t) {
      return t.written;
    }));
  }

  std::size_t sync_report_t::failed_count() const {
    return targets.size() - written_count();
  }

  std::optional<std::string> read_file(const fs::path &path, std::error_code &ec) {
    ec.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      ec = fs::exists(path, ec) ? std::make_error_code(std::errc::permission_denied) : std::make_error_code(std::errc::no_such_file_or_directory);
      return std::nullopt;
    }
    // A failed underflow (EIO, a directory) must not escape; libstdc++ throws for it regardless of the mask.
    try {
      std::ostringstream content;
      content << in.rdbuf();
      if (content.fail()) {
        // Nothing was inserted: either an empty file or a read error.
        std::error_code size_ec;
        if (fs::file_size(path, size_ec) == 0 && !size_ec) {
          return std::string();
        }
        ec = std::make_error_code(std::errc::io_error);
        return std::nullopt;
      }
      return content.str();
    } catch (const std::ios_base::failure &) {
      ec = std::make_error_code(std::errc::io_error);
      return std::nullopt;
    }
  }

  std::string write_file(const fs::path &path, std::string_view content) {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      return "unable to open for writing";
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      return "write failed";
    }
    return {};
  }

  namespace {
    target_result_t sync_target(std::string_view source, const fs::path &target, std::string_view marker, const file_io_t &io) {
      target_result_t result;
      result.path = target;

      std::error_code dir_ec;
      fs::create_directories(target.parent_path(), dir_ec);
      if (dir_ec) {
        result.error = dir_ec.message();
        BOOST_LOG(warning) << "LiveSync: failed to create "sv << target.parent_path().string() << ": "sv << result.error;
        return result;
      }

      std::error_code read_ec;
      auto current = io.read(target, read_ec);
      if (!current && read_ec != std::errc::no_such_file_or_directory) {
        BOOST_LOG(debug) << "LiveSync: treating unreadable "sv << target.filename().string() << " as missing: "sv << read_ec.message();
      }

      std::optional<std::string_view> current_view;
      if (current) {
        current_view = *current;
      }
      result.error = io.write(target, merge_section(source, current_view, marker));
      result.written = result.error.empty();
      if (!result.written) {
        BOOST_LOG(warning) << "LiveSync: failed to sync "sv << target.filename().string() << ": "sv << result.error;
      }
      return result;
    }
  }  // namespace

  sync_report_t sync_targets(const fs::path &source_file, std::span<const fs::path> targets, std::string_view marker, bool preserve_excluded, const file_io_t &io) {
    sync_report_t report;
    report.preserve_excluded = preserve_excluded;

    std::error_code ec;
    auto source = io.read(source_file, ec);
    if (!source) {
      report.source_error = ec.message();
      BOOST_LOG(warning) << "LiveSync: unable to read "sv << source_file.string() << ": "sv << report.source_error;
      return report;
    }
    report.source_read = true;
    report.source_has_marker = find_marker(*source, marker).has_value();
    if (!report.source_has_marker) {
      // Without the marker there is nothing to synchronize; never touch the targets.
      BOOST_LOG(debug) << "LiveSync: "sv << source_file.filename().string() << " has no "sv << marker << " section, skipping"sv;
      return report;
    }

    for (const auto &target : targets) {
      try {
        report.targets.push_back(sync_target(*source, target, marker, io));
      } catch (const std::exception &e) {
        BOOST_LOG(warning) << "LiveSync: failed to sync "sv << target.filename().string() << ": "sv << e.what();
        report.targets.push_back({target, false, e.what()});
      }
    }

    BOOST_LOG(info) << "LiveSync: synced "sv << report.written_count() << '/' << report.targets.size() << " difficulty files"sv
                    << (preserve_excluded ? " (in game)"sv : " (pre-game)"sv);
    return report;
  }
}  // namespace livesync::ini
