#pragma once

#include "benchdock/core/error.hpp"
#include "benchdock/job/job.hpp"
#include "benchdock/util/id.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace benchdock {

class ScoreStore;

struct ScoreRow {
  std::string job_id;
  std::string task;
  std::vector<int> folds;
  JobState state{JobState::Pending};
  int exit_code{-1};
  std::int64_t duration_ms{0};
  std::string error;
  std::chrono::system_clock::time_point started_at{};
};

struct Scoreboard {
  RunId run_id;
  std::string framework;
  std::string benchmark;
  std::optional<std::string> task;
  std::vector<ScoreRow> rows;

  [[nodiscard]] auto succeeded_count() const -> std::size_t;
  [[nodiscard]] auto failed_count() const -> std::size_t;
  [[nodiscard]] auto failed_jobs() const -> std::vector<std::string>;
  [[nodiscard]] auto all_succeeded() const -> bool {
    return failed_count() == 0;
  }

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

// Combines the outcomes of one run into a scoreboard, one row per job in job
// order. The run's framework and benchmark are given by the caller, so a run
// without outcomes still carries them. No scoring happens here.
class ResultMerger {
public:
  virtual ~ResultMerger() = default;

  [[nodiscard]] virtual auto merge(const RunId& run_id,
                                   std::string_view framework,
                                   std::string_view benchmark,
                                   std::span<const JobOutcome> outcomes,
                                   std::optional<std::string_view> task_name,
                                   bool save_scores) -> Result<Scoreboard> = 0;
};

// Merges outcomes and, when asked to, persists the scoreboard in `store`.
class ScoreboardMerger : public ResultMerger {
public:
  explicit ScoreboardMerger(ScoreStore* store = nullptr);

  [[nodiscard]] auto merge(const RunId& run_id, std::string_view framework,
                           std::string_view benchmark,
                           std::span<const JobOutcome> outcomes,
                           std::optional<std::string_view> task_name,
                           bool save_scores) -> Result<Scoreboard> override;

private:
  ScoreStore* store_;
};

}  // namespace benchdock
