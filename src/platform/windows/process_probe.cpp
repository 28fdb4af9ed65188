/**
 * @file src/platform/windows/process_probe.cpp
 * @brief Process table lookup using the ToolHelp32 snapshot API.
 */
// clang-format off
#include <windows.h>
#include <tlhelp32.h>
// clang-format on

#include "src/logging.h"
#include "src/platform/common.h"

#include <string>

namespace platf {
  namespace {
    std::wstring widen(std::string_view value) {
      if (value.empty()) {
        return {};
      }
      const int len = MultiByteToWideChar(CP_UTF8, 0, value.data(), static_cast<int>(value.size()), nullptr, 0);
      if (len <= 0) {
        return {};
      }
      std::wstring out(static_cast<std::size_t>(len), L'\0');
      MultiByteToWideChar(CP_UTF8, 0, value.data(), static_cast<int>(value.size()), out.data(), len);
      return out;
    }
  }  // namespace

  std::optional<bool> process_running(std::string_view exe_name) {
    const auto wide_name = widen(exe_name);
    if (wide_name.empty()) {
      return false;
    }

    HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot == INVALID_HANDLE_VALUE) {
      DWORD err = GetLastError();
      BOOST_LOG(debug) << "Process probe: failed to snapshot processes (winerr=" << err << ").";
      return std::nullopt;
    }

    PROCESSENTRY32W entry {};
    entry.dwSize = sizeof(entry);
    bool running = false;
    if (Process32FirstW(snapshot, &entry)) {
      do {
        if (wide_name == entry.szExeFile) {
          running = true;
          break;
        }
      } while (Process32NextW(snapshot, &entry));
    } else {
      DWORD err = GetLastError();
      if (err != ERROR_NO_MORE_FILES) {
        BOOST_LOG(debug) << "Process probe: process enumeration failed (winerr=" << err << ").";
        CloseHandle(snapshot);
        return std::nullopt;
      }
    }

    CloseHandle(snapshot);
    return running;
  }
}  // namespace platf
