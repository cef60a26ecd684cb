#pragma once

#include "benchdock/config/system_config.hpp"
#include "benchdock/core/error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace benchdock::cli {

// Flags shared by every command; each one overrides the matching config
// value when set.
struct CommonOptions {
  std::string config_file;
  std::string log_level;
  std::string db_file;
};

struct BenchmarkOptions {
  CommonOptions common;
  std::string framework;
  std::string benchmark;
  std::string task;
  std::vector<int> folds;
  std::optional<int> parallel_jobs;
  std::string setup_mode{"auto"};
  bool upload{false};
  std::string input_dir;
  std::string output_dir;
  bool save_scores{false};
  std::string results_json;
};

struct ListOptions {
  CommonOptions common;
  std::string benchmark;
  std::optional<int> parallel_jobs;
};

struct RunsOptions {
  CommonOptions common;
  // Empty lists every saved run.
  std::string run_id;
};

// Loads `common.config_file` (defaults when empty) and applies the overrides.
[[nodiscard]] auto load_config(const CommonOptions& common)
    -> Result<SystemConfig>;

// Configures the level and file sink, then starts the writer thread.
auto setup_logging(const LoggingConfig& logging) -> void;

[[nodiscard]] auto cmd_benchmark(const BenchmarkOptions& opts) -> int;
[[nodiscard]] auto cmd_list(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_runs(const RunsOptions& opts) -> int;

}  // namespace benchdock::cli
