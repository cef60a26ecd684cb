#include "benchdock/app/docker_benchmark.hpp"

#include "benchdock/docker/container_invoker.hpp"
#include "benchdock/docker/image.hpp"
#include "benchdock/job/job_runner.hpp"
#include "benchdock/util/id.hpp"
#include "benchdock/util/log.hpp"

namespace benchdock {

DockerBenchmark::DockerBenchmark(FrameworkDefinition framework,
                                 BenchmarkDefinition benchmark,
                                 const SystemConfig& config,
                                 docker::IContainerEngine& engine,
                                 ResultMerger& merger)
    : framework_(std::move(framework)),
      config_(config),
      engine_(engine),
      merger_(merger),
      images_(engine_, config_.docker, config_.run),
      factory_(framework_.name, std::move(benchmark), config_.run.partition),
      parallel_jobs_(clamp_parallel_jobs(config_.run.parallel_jobs,
                                         config_.run.max_parallel_jobs)) {}

auto DockerBenchmark::image() const -> std::string {
  return docker::image_reference(framework_);
}

auto DockerBenchmark::setup(docker::SetupMode mode, bool upload)
    -> Result<docker::SetupReport> {
  auto report = images_.setup(framework_, mode, upload);
  if (!report) {
    log::error("Setup of {} failed: {}", framework_.name,
               report.error().message());
    return report;
  }
  log::info("Setup of {} ({} mode): image {} {}", framework_.name,
            to_string_view(mode), report->image, to_string_view(report->state));
  return report;
}

auto DockerBenchmark::run(bool save_scores) -> Result<Scoreboard> {
  auto jobs = factory_.jobs_for_benchmark(parallel_jobs_);
  return run_jobs(jobs, std::nullopt, save_scores);
}

auto DockerBenchmark::run_one(std::string_view task_name,
                              const std::vector<int>& folds, bool save_scores)
    -> Result<Scoreboard> {
  auto jobs = factory_.jobs_for_task(task_name, folds, parallel_jobs_);
  if (!jobs) {
    return fail(jobs.error());
  }
  return run_jobs(*jobs, task_name, save_scores);
}

auto DockerBenchmark::run_jobs(const std::vector<Job>& jobs,
                               std::optional<std::string_view> task_name,
                               bool save_scores) -> Result<Scoreboard> {
  docker::ContainerInvoker invoker(engine_, image(), config_.run);
  JobRunner runner(parallel_jobs_);

  auto outcomes = runner.run(
      jobs, [&invoker](const Job& job) { return job.execute(invoker); });
  log::debug("Results from docker run (not merged into global scores yet): "
             "{} outcome(s)",
             outcomes.size());

  auto run_id = generate_run_id(framework_.name, factory_.benchmark().name);
  return merger_.merge(run_id, framework_.name, factory_.benchmark().name,
                       outcomes, task_name, save_scores);
}

}  // namespace benchdock
