#include "benchdock/cli/commands.hpp"
#include "benchdock/config/config.hpp"
#include "benchdock/util/log.hpp"

#include <filesystem>
#include <print>

namespace benchdock::cli {

auto load_config(const CommonOptions& common) -> Result<SystemConfig> {
  SystemConfig config;
  if (!common.config_file.empty()) {
    std::error_code ec;
    if (!std::filesystem::exists(common.config_file, ec)) {
      std::println(stderr, "Error: Config file not found: {}",
                   common.config_file);
      return fail(Error::FileNotFound);
    }
    auto loaded = ConfigLoader::load_from_file(common.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config: {}",
                   loaded.error().message());
      return fail(loaded.error());
    }
    config = std::move(*loaded);
  }

  if (!common.log_level.empty()) {
    config.logging.level = common.log_level;
  }
  if (!common.db_file.empty()) {
    config.storage.db_file = common.db_file;
  }
  return ok(std::move(config));
}

auto setup_logging(const LoggingConfig& logging) -> void {
  log::set_level(logging.level);
  if (!logging.file.empty() && !log::set_file(logging.file)) {
    std::println(stderr, "Warning: cannot open log file {}", logging.file);
  }
  log::start();
}

}  // namespace benchdock::cli
