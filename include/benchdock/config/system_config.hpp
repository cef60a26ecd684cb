#pragma once

#include "benchdock/core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace benchdock {

// Granularity of jobs when a whole benchmark runs in parallel.
enum class PartitionPolicy : std::uint8_t { ByTask, ByFold };

[[nodiscard]] constexpr auto to_string_view(PartitionPolicy policy) noexcept
    -> std::string_view {
  switch (policy) {
    case PartitionPolicy::ByTask: return "task";
    case PartitionPolicy::ByFold: return "fold";
  }
  return "fold";
}

[[nodiscard]] inline auto parse_partition_policy(std::string_view s)
    -> Result<PartitionPolicy> {
  if (s == "task")
    return PartitionPolicy::ByTask;
  if (s == "fold")
    return PartitionPolicy::ByFold;
  return fail(Error::InvalidArgument);
}

struct LoggingConfig {
  std::string level{"info"};
  std::string file;
};

struct RunConfiguration {
  std::string input_dir{"./input"};
  std::string output_dir{"./results"};
  int parallel_jobs{1};
  int max_parallel_jobs{10};
  std::string script{"runbenchmark.py"};
  PartitionPolicy partition{PartitionPolicy::ByFold};
};

struct DockerConfig {
  std::string binary{"docker"};
  std::string build_context{"."};
  std::string frameworks_dir{"frameworks"};
  std::string descriptor{"Dockerfile"};
};

struct StorageConfig {
  std::string db_file{"benchdock.db"};
};

struct DefinitionsConfig {
  std::string frameworks_file{"resources/frameworks.yaml"};
  std::string benchmarks_dir{"resources/benchmarks"};
};

struct SystemConfig {
  LoggingConfig logging;
  RunConfiguration run;
  DockerConfig docker;
  StorageConfig storage;
  DefinitionsConfig definitions;
};

}  // namespace benchdock
