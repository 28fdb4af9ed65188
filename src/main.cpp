/**
 * @file src/main.cpp
 * @brief Entry point of the live sync tool.
 */
#include "src/commands.h"
#include "src/config.h"
#include "src/logging.h"
#include "src/paths.h"
#include "version.h"

using namespace std::literals;

int main(int argc, char *argv[]) {
  const int rc = config::parse(argc, argv);
  if (rc == -1) {
    return 0;
  }
  if (rc != 0) {
    return 1;
  }

  const auto &cmd = config::livesync.cmd.name;
  auto log_guard = cmd == "run"sv ?
                     logging::init(config::livesync.min_log_level, config::livesync.log_file) :
                     logging::init_append(config::livesync.min_log_level, config::livesync.log_file);

  if (cmd == "run"sv) {
    BOOST_LOG(info) << PROJECT_NAME << " version: v"sv << PROJECT_VER;
  }

  const auto layout = paths::resolve(config::livesync.config_root);
  BOOST_LOG(debug) << "Config root: "sv << layout.config_root.string();

  const int result = commands::dispatch(layout);
  logging::log_flush();
  return result;
}
