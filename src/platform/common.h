/**
 * @file src/platform/common.h
 * @brief Declarations for common platform specific utilities.
 */
#pragma once

// standard includes
#include <optional>
#include <string_view>

namespace platf {
  /**
   * @brief Check whether a process with the given executable name is running.
   * @param exe_name Executable file name, compared case-sensitively (e.g. "Game-Win64-Shipping.exe").
   * @return `true`/`false` when the process table could be read, `std::nullopt` otherwise.
   */
  std::optional<bool> process_running(std::string_view exe_name);
}  // namespace platf
