/**
 * @file tests/unit/test_config.cpp
 * @brief Unit tests for configuration parsing.
 */
#include "../tests_common.h"

#include "src/config.h"

#include <vector>

using namespace std::chrono_literals;

namespace {
  class ConfigTest: public TempDirTest {
  protected:
    void SetUp() override {
      TempDirTest::SetUp();
      config::reset_defaults();
    }

    void TearDown() override {
      config::reset_defaults();
      TempDirTest::TearDown();
    }

    int parse(std::vector<std::string> args) {
      args.insert(args.begin(), "livesync");
      std::vector<char *> argv;
      for (auto &arg : args) {
        argv.push_back(arg.data());
      }
      return config::parse(static_cast<int>(argv.size()), argv.data());
    }

    std::string missing_config() const {
      return (root / "absent.conf").string();
    }
  };
}  // namespace

TEST_F(ConfigTest, Defaults) {
  EXPECT_TRUE(config::sync.enabled);
  EXPECT_TRUE(config::sync.pre_game_sync);
  EXPECT_EQ(config::sync.pre_game_interval, 10000ms);
  EXPECT_EQ(config::sync.active_interval, 1000ms);
  EXPECT_EQ(config::sync.idle_interval, 3000ms);
  EXPECT_EQ(config::sync.game_start_delay, 10s);
  EXPECT_EQ(config::sync.game_process, "ReadyOrNotSteam-Win64-Shipping.exe");
  EXPECT_EQ(config::sync.merge_marker, "[Global]");
  EXPECT_EQ(config::sync.excluded_fields.size(), 8u);
  EXPECT_DOUBLE_EQ(config::sync.resume_delay.count(), 3.0);
  EXPECT_EQ(config::sync.write_debounce, 300ms);
  EXPECT_EQ(config::livesync.min_log_level, 2);
  EXPECT_EQ(config::livesync.log_file, "livesync.log");
  EXPECT_EQ(config::livesync.file_state, "livesync_state.json");
  EXPECT_TRUE(config::livesync.config_root.empty());
}

TEST_F(ConfigTest, ParsesNameValueLines) {
  const auto vars = config::parse_config(
    "# comment\n"
    "enabled = false\n"
    "\n"
    "active_interval=500   # trailing comment\n"
    "garbage line\n"
    " = no name\n"
  );

  EXPECT_EQ(vars.size(), 2u);
  EXPECT_EQ(vars.at("enabled"), "false");
  EXPECT_EQ(vars.at("active_interval"), "500");
}

TEST_F(ConfigTest, AppliesValues) {
  config::apply_config({
    {"enabled", "No"},
    {"pre_game_sync", "ON"},
    {"pre_game_interval", "20000"},
    {"game_start_delay", "4"},
    {"game_process", "Game.exe"},
    {"merge_marker", "[Settings]"},
    {"resume_delay", "1.5"},
    {"config_root", "/tmp/ron"},
    {"min_log_level", "debug"},
    {"unknown_option", "1"},
  });

  EXPECT_FALSE(config::sync.enabled);
  EXPECT_TRUE(config::sync.pre_game_sync);
  EXPECT_EQ(config::sync.pre_game_interval, 20000ms);
  EXPECT_EQ(config::sync.game_start_delay, 4s);
  EXPECT_EQ(config::sync.game_process, "Game.exe");
  EXPECT_EQ(config::sync.merge_marker, "[Settings]");
  EXPECT_DOUBLE_EQ(config::sync.resume_delay.count(), 1.5);
  EXPECT_EQ(config::livesync.config_root, "/tmp/ron");
  EXPECT_EQ(config::livesync.min_log_level, 1);
}

TEST_F(ConfigTest, InvalidNumbersKeepDefaults) {
  config::apply_config({
    {"active_interval", "fast"},
    {"idle_interval", "-1"},
    {"resume_delay", "soon"},
  });

  EXPECT_EQ(config::sync.active_interval, 1000ms);
  EXPECT_EQ(config::sync.idle_interval, 3000ms);
  EXPECT_DOUBLE_EQ(config::sync.resume_delay.count(), 3.0);
}

TEST_F(ConfigTest, ExcludedFieldsAcceptJsonAndCsv) {
  config::apply_config({{"excluded_fields", R"(["A", "", "B"])"}});
  EXPECT_EQ(config::sync.excluded_fields, (std::vector<std::string> {"A", "B"}));

  config::apply_config({{"excluded_fields", " C , D,,E "}});
  EXPECT_EQ(config::sync.excluded_fields, (std::vector<std::string> {"C", "D", "E"}));
}

TEST_F(ConfigTest, LogLevels) {
  EXPECT_EQ(config::parse_log_level("verbose", 2), 0);
  EXPECT_EQ(config::parse_log_level("WARNING", 2), 3);
  EXPECT_EQ(config::parse_log_level("none", 2), 6);
  EXPECT_EQ(config::parse_log_level("5", 2), 5);
  EXPECT_EQ(config::parse_log_level("7", 2), 2);
  EXPECT_EQ(config::parse_log_level("loud", 4), 4);
}

TEST_F(ConfigTest, CommandLineDefaultsToRun) {
  EXPECT_EQ(parse({"--config", missing_config()}), 1);

  config::reset_defaults();
  EXPECT_EQ(parse({}), 0);
  EXPECT_EQ(config::livesync.cmd.name, "run");
  EXPECT_TRUE(config::livesync.cmd.args.empty());
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
  const auto conf = root / "livesync.conf";
  write(conf, "idle_interval = 4000\nactive_interval = 700\n");

  EXPECT_EQ(parse({"--config", conf.string(), "idle_interval=5000", "resume", "--delay=2", "--no-trigger"}), 0);

  EXPECT_EQ(config::sync.idle_interval, 5000ms);
  EXPECT_EQ(config::sync.active_interval, 700ms);
  EXPECT_EQ(config::livesync.cmd.name, "resume");
  EXPECT_EQ(config::livesync.cmd.args, (std::vector<std::string> {"--delay=2", "--no-trigger"}));
}

TEST_F(ConfigTest, ArgumentsAfterCommandBelongToIt) {
  EXPECT_EQ(parse({"set-info", "Modname=Foo", "Version=2"}), 0);

  EXPECT_EQ(config::livesync.cmd.name, "set-info");
  EXPECT_EQ(config::livesync.cmd.args, (std::vector<std::string> {"Modname=Foo", "Version=2"}));
}

TEST_F(ConfigTest, UnknownOptionIsAnError) {
  EXPECT_EQ(parse({"--frobnicate"}), 1);
}

TEST_F(ConfigTest, HelpAndVersionExitSuccessfully) {
  EXPECT_EQ(parse({"--help"}), -1);
  EXPECT_EQ(parse({"--version"}), -1);
}
