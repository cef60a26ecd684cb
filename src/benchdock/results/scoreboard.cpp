#include "benchdock/results/scoreboard.hpp"

#include "benchdock/storage/score_store.hpp"
#include "benchdock/util/log.hpp"
#include "benchdock/util/util.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace benchdock {

using json = nlohmann::json;

auto Scoreboard::succeeded_count() const -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count_if(
      rows, [](const ScoreRow& r) { return r.state == JobState::Success; }));
}

auto Scoreboard::failed_count() const -> std::size_t {
  return rows.size() - succeeded_count();
}

auto Scoreboard::failed_jobs() const -> std::vector<std::string> {
  std::vector<std::string> ids;
  for (const auto& row : rows) {
    if (row.state != JobState::Success) {
      ids.push_back(row.job_id);
    }
  }
  return ids;
}

auto Scoreboard::to_json() const -> json {
  json j;
  j["run_id"] = run_id.str();
  j["framework"] = framework;
  j["benchmark"] = benchmark;
  j["task"] = task ? json(*task) : json(nullptr);

  json jobs = json::array();
  for (const auto& row : rows) {
    jobs.push_back({
        {"job_id", row.job_id},
        {"task", row.task},
        {"folds", row.folds},
        {"state", to_string_view(row.state)},
        {"exit_code", row.exit_code},
        {"duration_ms", row.duration_ms},
        {"started_at", format_timestamp(row.started_at)},
        {"error", row.error},
    });
  }
  j["jobs"] = std::move(jobs);
  j["summary"] = {
      {"total", rows.size()},
      {"succeeded", succeeded_count()},
      {"failed", failed_count()},
      {"failed_jobs", failed_jobs()},
  };
  return j;
}

ScoreboardMerger::ScoreboardMerger(ScoreStore* store) : store_(store) {}

auto ScoreboardMerger::merge(const RunId& run_id, std::string_view framework,
                             std::string_view benchmark,
                             std::span<const JobOutcome> outcomes,
                             std::optional<std::string_view> task_name,
                             bool save_scores) -> Result<Scoreboard> {
  Scoreboard board;
  board.run_id = run_id;
  board.framework = std::string{framework};
  board.benchmark = std::string{benchmark};
  if (task_name) {
    board.task = std::string{*task_name};
  }

  board.rows.reserve(outcomes.size());
  for (const auto& o : outcomes) {
    board.rows.push_back(ScoreRow{
        .job_id = o.job_id.str(),
        .task = o.task,
        .folds = o.folds,
        .state = o.state,
        .exit_code = o.exit_code,
        .duration_ms = o.duration.count(),
        .error = o.error,
        .started_at = o.started_at,
    });
  }

  log::debug("Merged {} job result(s) into run {}", board.rows.size(), run_id);

  if (save_scores) {
    if (!store_) {
      log::error("Scores of run {} cannot be saved: no score store", run_id);
      return fail(Error::InvalidArgument);
    }
    if (auto r = store_->save_scoreboard(board); !r) {
      return fail(r.error());
    }
  }
  return ok(std::move(board));
}

}  // namespace benchdock
