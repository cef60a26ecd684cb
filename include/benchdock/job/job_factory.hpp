#pragma once

#include "benchdock/config/definitions.hpp"
#include "benchdock/config/system_config.hpp"
#include "benchdock/core/error.hpp"
#include "benchdock/job/job.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace benchdock {

// Values outside [1, max_parallel_jobs] are replaced by the ceiling, with a
// warning; never rejected. A ceiling below 1 counts as 1.
[[nodiscard]] auto clamp_parallel_jobs(int requested, int max_parallel_jobs)
    -> int;

class JobFactory {
public:
  JobFactory(std::string framework, BenchmarkDefinition benchmark,
             PartitionPolicy partition = PartitionPolicy::ByFold);

  // parallel_jobs == 1: a single job for the whole benchmark. Otherwise one
  // job per task or per task and fold, depending on the partition policy.
  [[nodiscard]] auto jobs_for_benchmark(int parallel_jobs) const
      -> std::vector<Job>;

  // An empty fold list selects every fold of the task. Sequential runs of
  // several folds share one job; anything else gets one job per fold.
  [[nodiscard]] auto jobs_for_task(std::string_view task_name,
                                   const std::vector<int>& folds,
                                   int parallel_jobs) const
      -> Result<std::vector<Job>>;

  [[nodiscard]] auto benchmark() const noexcept -> const BenchmarkDefinition& {
    return benchmark_;
  }

private:
  [[nodiscard]] auto fold_jobs(const TaskDefinition& task,
                               const std::vector<int>& folds) const
      -> std::vector<Job>;

  std::string framework_;
  BenchmarkDefinition benchmark_;
  PartitionPolicy partition_;
};

}  // namespace benchdock
