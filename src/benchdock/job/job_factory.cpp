#include "benchdock/job/job_factory.hpp"

#include "benchdock/util/log.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>

namespace benchdock {

namespace {

auto all_folds(const TaskDefinition& task) -> std::vector<int> {
  std::vector<int> folds(static_cast<std::size_t>(task.folds));
  std::iota(folds.begin(), folds.end(), 0);
  return folds;
}

// Drops repeated folds, keeping first occurrences in order, so that job ids
// stay unique.
auto unique_folds(const std::vector<int>& folds) -> std::vector<int> {
  std::vector<int> out;
  out.reserve(folds.size());
  for (int f : folds) {
    if (std::ranges::find(out, f) == out.end()) {
      out.push_back(f);
    }
  }
  return out;
}

}  // namespace

auto clamp_parallel_jobs(int requested, int max_parallel_jobs) -> int {
  const int ceiling = std::max(max_parallel_jobs, 1);
  if (requested < 1 || requested > ceiling) {
    log::warn("Forcing parallelization to its upper limit: {}", ceiling);
    return ceiling;
  }
  return requested;
}

JobFactory::JobFactory(std::string framework, BenchmarkDefinition benchmark,
                       PartitionPolicy partition)
    : framework_(std::move(framework)),
      benchmark_(std::move(benchmark)),
      partition_(partition) {}

auto JobFactory::fold_jobs(const TaskDefinition& task,
                           const std::vector<int>& folds) const
    -> std::vector<Job> {
  std::vector<Job> jobs;
  jobs.reserve(folds.size());
  for (int fold : folds) {
    jobs.emplace_back(framework_, benchmark_.name,
                      TaskSelection{.task = task.name, .folds = {fold}});
  }
  return jobs;
}

auto JobFactory::jobs_for_benchmark(int parallel_jobs) const
    -> std::vector<Job> {
  std::vector<Job> jobs;
  if (parallel_jobs == 1) {
    jobs.emplace_back(framework_, benchmark_.name, WholeBenchmark{});
    return jobs;
  }

  for (const auto& task : benchmark_.tasks) {
    if (partition_ == PartitionPolicy::ByTask) {
      jobs.emplace_back(framework_, benchmark_.name,
                        TaskSelection{.task = task.name, .folds = {}});
    } else {
      std::ranges::move(fold_jobs(task, all_folds(task)),
                        std::back_inserter(jobs));
    }
  }
  log::debug("Benchmark {} split into {} job(s) ({} partition)",
             benchmark_.name, jobs.size(), to_string_view(partition_));
  return jobs;
}

auto JobFactory::jobs_for_task(std::string_view task_name,
                               const std::vector<int>& folds,
                               int parallel_jobs) const
    -> Result<std::vector<Job>> {
  const auto* task = benchmark_.find_task(task_name);
  if (!task) {
    log::error("Task '{}' is not part of benchmark '{}'", task_name,
               benchmark_.name);
    return fail(Error::NotFound);
  }

  auto selected = unique_folds(folds);
  for (int fold : selected) {
    if (fold < 0 || fold >= task->folds) {
      log::error("Fold {} is out of range for task '{}' ({} folds)", fold,
                 task->name, task->folds);
      return fail(Error::InvalidArgument);
    }
  }

  std::vector<Job> jobs;
  if (parallel_jobs == 1 && (selected.empty() || selected.size() > 1)) {
    jobs.emplace_back(framework_, benchmark_.name,
                      TaskSelection{.task = task->name, .folds = selected});
    return ok(std::move(jobs));
  }

  return ok(fold_jobs(*task, selected.empty() ? all_folds(*task) : selected));
}

}  // namespace benchdock
