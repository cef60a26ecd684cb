#pragma once

#include "benchdock/job/job.hpp"

#include <functional>
#include <span>
#include <vector>

namespace benchdock {

using JobAction = std::function<JobOutcome(const Job&)>;

// Runs a batch of jobs on a pool of at most `parallel_jobs` worker threads.
// Every job runs to completion even when siblings fail.
class JobRunner {
public:
  explicit JobRunner(int parallel_jobs);

  // Outcomes come back in job order.
  [[nodiscard]] auto run(std::span<const Job> jobs,
                         const JobAction& action) const
      -> std::vector<JobOutcome>;

  [[nodiscard]] auto parallel_jobs() const noexcept -> int {
    return parallel_jobs_;
  }

private:
  int parallel_jobs_;
};

}  // namespace benchdock
