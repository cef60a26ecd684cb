#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace benchdock {

struct DockerImage {
  std::string author{"automlbenchmark"};
  std::optional<std::string> image;
  std::string tag{"latest"};
};

struct FrameworkDefinition {
  std::string name;
  // Directory under the frameworks dir; empty means `name`.
  std::string module;
  // Dockerfile commands injected after the core dependencies are installed.
  std::string setup_commands;
  DockerImage docker_image;

  [[nodiscard]] auto module_dir() const -> std::string_view {
    return module.empty() ? std::string_view{name} : std::string_view{module};
  }
};

struct TaskDefinition {
  std::string name;
  int folds{10};
  std::optional<std::int64_t> openml_task_id;
  std::optional<int> max_runtime_seconds;
};

struct BenchmarkDefinition {
  std::string name;
  std::vector<TaskDefinition> tasks;

  [[nodiscard]] auto find_task(std::string_view task_name) const
      -> const TaskDefinition*;
};

}  // namespace benchdock
