#pragma once

#include "benchdock/config/definitions.hpp"
#include "benchdock/config/system_config.hpp"
#include "benchdock/core/error.hpp"
#include "benchdock/docker/container_engine.hpp"
#include "benchdock/docker/image_manager.hpp"
#include "benchdock/job/job_factory.hpp"
#include "benchdock/results/scoreboard.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace benchdock {

// Runs one framework on one benchmark inside the framework's container image.
// The configuration is copied at construction; parallel_jobs is clamped to
// the configured ceiling there, before any job exists.
class DockerBenchmark {
public:
  DockerBenchmark(FrameworkDefinition framework, BenchmarkDefinition benchmark,
                  const SystemConfig& config, docker::IContainerEngine& engine,
                  ResultMerger& merger);

  [[nodiscard]] auto setup(docker::SetupMode mode, bool upload = false)
      -> Result<docker::SetupReport>;

  [[nodiscard]] auto run(bool save_scores = false) -> Result<Scoreboard>;

  // An empty fold list runs every fold of the task.
  [[nodiscard]] auto run_one(std::string_view task_name,
                             const std::vector<int>& folds,
                             bool save_scores = false) -> Result<Scoreboard>;

  [[nodiscard]] auto image() const -> std::string;
  [[nodiscard]] auto parallel_jobs() const noexcept -> int {
    return parallel_jobs_;
  }

private:
  [[nodiscard]] auto run_jobs(const std::vector<Job>& jobs,
                              std::optional<std::string_view> task_name,
                              bool save_scores) -> Result<Scoreboard>;

  FrameworkDefinition framework_;
  SystemConfig config_;
  docker::IContainerEngine& engine_;
  ResultMerger& merger_;
  docker::ImageManager images_;
  JobFactory factory_;
  int parallel_jobs_;
};

}  // namespace benchdock
