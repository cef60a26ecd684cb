#include "benchdock/cli/commands.hpp"
#include "benchdock/config/definition_resolver.hpp"
#include "benchdock/job/job_factory.hpp"
#include "benchdock/util/log.hpp"
#include "benchdock/util/util.hpp"

#include <format>
#include <print>

namespace benchdock::cli {

auto cmd_list(const ListOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    return 1;
  }
  if (opts.parallel_jobs) {
    config->run.parallel_jobs = *opts.parallel_jobs;
  }
  setup_logging(config->logging);

  FileDefinitionResolver resolver(config->definitions.frameworks_file,
                                  config->definitions.benchmarks_dir);
  auto benchmark = resolver.benchmark(opts.benchmark);
  if (!benchmark) {
    std::println(stderr, "Error: Cannot load benchmark '{}': {}",
                 opts.benchmark, benchmark.error().message());
    log::stop();
    return 1;
  }

  std::println("{:<30} {:>6} {:>12}", "TASK", "FOLDS", "MAX_RUNTIME");
  for (const auto& task : benchmark->tasks) {
    std::println("{:<30} {:>6} {:>12}", task.name, task.folds,
                 task.max_runtime_seconds
                     ? std::format("{}s", *task.max_runtime_seconds)
                     : std::string{"-"});
  }

  int parallel = clamp_parallel_jobs(config->run.parallel_jobs,
                                     config->run.max_parallel_jobs);
  JobFactory factory("<framework>", std::move(*benchmark),
                     config->run.partition);
  auto jobs = factory.jobs_for_benchmark(parallel);

  std::println("");
  std::println("{} job(s) with parallel_jobs={} ({} partition):", jobs.size(),
               parallel, to_string_view(config->run.partition));
  for (const auto& job : jobs) {
    std::println("  {:<50} {}", job.id(), join(job.command_line(), " "));
  }
  log::stop();
  return 0;
}

}  // namespace benchdock::cli
