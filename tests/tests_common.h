/**
 * @file tests/tests_common.h
 * @brief Common includes and fixtures for the unit tests.
 */
#pragma once

#include <gtest/gtest.h>

#include "src/logging.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

/**
 * @brief Fixture owning a scratch directory below the system temp path.
 */
class TempDirTest: public ::testing::Test {
protected:
  void SetUp() override {
    static std::atomic<int> counter {0};
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    root = std::filesystem::temp_directory_path() /
           ("livesync_" + std::string(info->test_suite_name()) + "_" + std::string(info->name()) + "_" +
            std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(root);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  static void write(const std::filesystem::path &path, std::string_view content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
  }

  static std::string read(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  }

  std::filesystem::path root;
};
