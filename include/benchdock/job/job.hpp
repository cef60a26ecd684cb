#pragma once

#include "benchdock/util/id.hpp"

#include <array>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace benchdock {

namespace docker {
class ContainerInvoker;
}

enum class JobState : std::uint8_t {
  Pending,
  Running,
  Success,
  Failed,
};

namespace detail {
constexpr std::array<std::string_view, 4> kJobStateNames = {
    "pending",
    "running",
    "success",
    "failed",
};
}  // namespace detail

[[nodiscard]] constexpr auto to_string_view(JobState state) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(state);
  return idx < detail::kJobStateNames.size() ? detail::kJobStateNames[idx]
                                             : "unknown";
}

[[nodiscard]] constexpr auto parse_job_state(std::string_view name) noexcept
    -> JobState {
  auto it = std::ranges::find(detail::kJobStateNames, name);
  if (it != detail::kJobStateNames.end()) {
    return static_cast<JobState>(
        std::ranges::distance(detail::kJobStateNames.begin(), it));
  }
  return JobState::Pending;
}

// The in-container process resolves every task of the benchmark itself.
struct WholeBenchmark {};

// One task; an empty fold list lets the in-container process run all folds.
struct TaskSelection {
  std::string task;
  std::vector<int> folds;
};

using JobTarget = std::variant<WholeBenchmark, TaskSelection>;

struct JobOutcome {
  JobId job_id;
  std::string framework;
  std::string benchmark;
  std::string task;
  std::vector<int> folds;
  JobState state{JobState::Pending};
  int exit_code{-1};
  std::string output;
  std::string error;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::milliseconds duration{0};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return state == JobState::Success;
  }
};

// One container invocation. Immutable once built; jobs are created per run
// and never reused.
class Job {
public:
  Job(std::string framework, std::string benchmark, JobTarget target);

  [[nodiscard]] auto id() const noexcept -> const JobId& { return id_; }
  [[nodiscard]] auto framework() const noexcept -> const std::string& {
    return framework_;
  }
  [[nodiscard]] auto benchmark() const noexcept -> const std::string& {
    return benchmark_;
  }
  [[nodiscard]] auto target() const noexcept -> const JobTarget& {
    return target_;
  }

  // Empty for whole-benchmark jobs.
  [[nodiscard]] auto task() const -> std::string_view;
  [[nodiscard]] auto folds() const -> std::vector<int>;

  // <framework> <benchmark> [-t <task>] [-f <fold>...] -i /input -o /output -s skip
  [[nodiscard]] auto command_line() const -> std::vector<std::string>;

  // Never throws on container failure: the failure is the outcome.
  [[nodiscard]] auto execute(const docker::ContainerInvoker& invoker) const
      -> JobOutcome;

  // Outcome for a job that never reached the container.
  [[nodiscard]] auto failed_outcome(std::string error) const -> JobOutcome;

private:
  std::string framework_;
  std::string benchmark_;
  JobTarget target_;
  JobId id_;
};

// docker_{task or benchmark}_{folds joined by ':'}_{framework}
[[nodiscard]] auto make_job_id(std::string_view framework,
                               std::string_view benchmark,
                               const JobTarget& target) -> JobId;

}  // namespace benchdock
