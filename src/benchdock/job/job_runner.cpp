#include "benchdock/job/job_runner.hpp"

#include "benchdock/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <format>
#include <thread>

namespace benchdock {

namespace {

auto run_guarded(const Job& job, const JobAction& action) -> JobOutcome {
  try {
    return action(job);
  } catch (const std::exception& e) {
    log::error("Job {} raised: {}", job.id(), e.what());
    return job.failed_outcome(std::format("job raised: {}", e.what()));
  } catch (...) {
    log::error("Job {} raised an unknown exception", job.id());
    return job.failed_outcome("job raised an unknown exception");
  }
}

}  // namespace

JobRunner::JobRunner(int parallel_jobs)
    : parallel_jobs_(std::max(parallel_jobs, 1)) {}

auto JobRunner::run(std::span<const Job> jobs, const JobAction& action) const
    -> std::vector<JobOutcome> {
  std::vector<JobOutcome> outcomes(jobs.size());
  if (jobs.empty()) {
    return outcomes;
  }

  auto workers = std::min<std::size_t>(
      static_cast<std::size_t>(parallel_jobs_), jobs.size());
  log::info("Running {} job(s) with {} worker(s)", jobs.size(), workers);

  if (workers == 1) {
    for (std::size_t i = 0; i < jobs.size(); ++i) {
      outcomes[i] = run_guarded(jobs[i], action);
    }
  } else {
    std::atomic<std::size_t> next{0};
    {
      std::vector<std::jthread> pool;
      pool.reserve(workers);
      for (std::size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&] {
          for (auto i = next.fetch_add(1, std::memory_order_relaxed);
               i < jobs.size();
               i = next.fetch_add(1, std::memory_order_relaxed)) {
            outcomes[i] = run_guarded(jobs[i], action);
          }
        });
      }
    }  // jthreads join here
  }

  auto failed = std::ranges::count_if(
      outcomes, [](const JobOutcome& o) { return !o.succeeded(); });
  if (failed > 0) {
    log::warn("{} of {} job(s) failed", failed, jobs.size());
  } else {
    log::info("All {} job(s) succeeded", jobs.size());
  }
  return outcomes;
}

}  // namespace benchdock
