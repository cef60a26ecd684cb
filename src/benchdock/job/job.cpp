#include "benchdock/job/job.hpp"

#include "benchdock/docker/container_engine.hpp"
#include "benchdock/docker/container_invoker.hpp"
#include "benchdock/util/log.hpp"
#include "benchdock/util/util.hpp"

#include <format>

namespace benchdock {

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

}  // namespace

auto make_job_id(std::string_view framework, std::string_view benchmark,
                 const JobTarget& target) -> JobId {
  return std::visit(
      overloaded{
          [&](const WholeBenchmark&) {
            return JobId{std::format("docker_{}__{}", benchmark, framework)};
          },
          [&](const TaskSelection& sel) {
            return JobId{std::format("docker_{}_{}_{}", sel.task,
                                     join(sel.folds, ":"), framework)};
          },
      },
      target);
}

Job::Job(std::string framework, std::string benchmark, JobTarget target)
    : framework_(std::move(framework)),
      benchmark_(std::move(benchmark)),
      target_(std::move(target)),
      id_(make_job_id(framework_, benchmark_, target_)) {}

auto Job::task() const -> std::string_view {
  if (const auto* sel = std::get_if<TaskSelection>(&target_)) {
    return sel->task;
  }
  return {};
}

auto Job::folds() const -> std::vector<int> {
  if (const auto* sel = std::get_if<TaskSelection>(&target_)) {
    return sel->folds;
  }
  return {};
}

auto Job::command_line() const -> std::vector<std::string> {
  std::vector<std::string> args{framework_, benchmark_};

  if (const auto* sel = std::get_if<TaskSelection>(&target_)) {
    args.emplace_back("-t");
    args.push_back(sel->task);
    if (!sel->folds.empty()) {
      args.emplace_back("-f");
      for (int fold : sel->folds) {
        args.push_back(std::to_string(fold));
      }
    }
  }

  args.emplace_back("-i");
  args.emplace_back(docker::kContainerInputDir);
  args.emplace_back("-o");
  args.emplace_back(docker::kContainerOutputDir);
  args.emplace_back("-s");
  args.emplace_back("skip");
  return args;
}

auto Job::failed_outcome(std::string error) const -> JobOutcome {
  return JobOutcome{
      .job_id = id_,
      .framework = framework_,
      .benchmark = benchmark_,
      .task = std::string{task()},
      .folds = folds(),
      .state = JobState::Failed,
      .exit_code = -1,
      .output = {},
      .error = std::move(error),
      .started_at = std::chrono::system_clock::now(),
      .duration = std::chrono::milliseconds{0},
  };
}

auto Job::execute(const docker::ContainerInvoker& invoker) const
    -> JobOutcome {
  log::info("Starting job {}", id_);
  auto started_at = std::chrono::system_clock::now();
  auto start = std::chrono::steady_clock::now();

  auto run = invoker.run(command_line());

  JobOutcome outcome{
      .job_id = id_,
      .framework = framework_,
      .benchmark = benchmark_,
      .task = std::string{task()},
      .folds = folds(),
      .state = run.succeeded() ? JobState::Success : JobState::Failed,
      .exit_code = run.exit_code,
      .output = std::move(run.output),
      .error = std::move(run.error),
      .started_at = started_at,
      .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start),
  };

  if (outcome.succeeded()) {
    log::info("Job {} completed in {}", id_, outcome.duration);
  } else {
    log::error("Job {} failed after {}: {}", id_, outcome.duration,
               outcome.error);
  }
  return outcome;
}

}  // namespace benchdock
