#include "benchdock/cli/commands.hpp"
#include "benchdock/storage/score_store.hpp"

#include <nlohmann/json.hpp>

#include <print>

namespace benchdock::cli {

namespace {

auto show_run(ScoreStore& store, const std::string& run_id) -> int {
  auto board = store.load_run(run_id);
  if (!board) {
    std::println(stderr, "Error: Run '{}': {}", run_id,
                 board.error().message());
    return 1;
  }
  std::println("{}", board->to_json().dump(2));
  return 0;
}

}  // namespace

auto cmd_runs(const RunsOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    return 1;
  }

  ScoreStore store(config->storage.db_file);
  if (auto r = store.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  if (!opts.run_id.empty()) {
    return show_run(store, opts.run_id);
  }

  auto runs = store.list_runs();
  if (!runs) {
    std::println(stderr, "Error: {}", runs.error().message());
    return 1;
  }
  if (runs->empty()) {
    std::println("No saved runs.");
    return 0;
  }

  std::println("{:<45} {:<15} {:<15} {:>5} {:>7}", "RUN_ID", "FRAMEWORK",
               "BENCHMARK", "JOBS", "FAILED");
  for (const auto& run : *runs) {
    std::println("{:<45} {:<15} {:<15} {:>5} {:>7}", run.run_id,
                 run.framework, run.benchmark, run.jobs, run.failed);
  }
  return 0;
}

}  // namespace benchdock::cli
