#include "benchdock/app/docker_benchmark.hpp"
#include "benchdock/cli/commands.hpp"
#include "benchdock/config/definition_resolver.hpp"
#include "benchdock/docker/container_engine.hpp"
#include "benchdock/storage/score_store.hpp"
#include "benchdock/util/log.hpp"
#include "benchdock/util/util.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <print>

namespace benchdock::cli {

namespace {

auto print_scoreboard(const Scoreboard& board) -> void {
  std::println("Run {}: {}/{} job(s) succeeded", board.run_id,
               board.succeeded_count(), board.rows.size());
  std::println("{:<50} {:<8} {:>5} {:>10}", "JOB_ID", "STATE", "EXIT",
               "DURATION");
  for (const auto& row : board.rows) {
    std::println("{:<50} {:<8} {:>5} {:>8}ms", row.job_id,
                 to_string_view(row.state), row.exit_code, row.duration_ms);
  }
  if (!board.all_succeeded()) {
    std::println(stderr, "Failed jobs: {}", join(board.failed_jobs(), ", "));
  }
}

auto write_results_json(const Scoreboard& board, const std::string& path)
    -> Result<void> {
  std::ofstream out(path);
  if (!out) {
    log::error("Cannot open results file {}", path);
    return fail(Error::FileOpenFailed);
  }
  out << board.to_json().dump(2) << '\n';
  if (!out) {
    log::error("Cannot write results file {}", path);
    return fail(Error::FileWriteFailed);
  }
  return ok();
}

auto run_benchmark(const BenchmarkOptions& opts, const SystemConfig& config)
    -> int {
  auto mode = parse_setup_mode(opts.setup_mode);
  if (!mode) {
    std::println(stderr, "Error: Invalid setup mode '{}'", opts.setup_mode);
    return 1;
  }

  FileDefinitionResolver resolver(config.definitions.frameworks_file,
                                  config.definitions.benchmarks_dir);
  auto framework = resolver.framework(opts.framework);
  if (!framework) {
    std::println(stderr, "Error: Unknown framework '{}': {}", opts.framework,
                 framework.error().message());
    if (auto names = resolver.list_frameworks(); names && !names->empty()) {
      std::println(stderr, "Available frameworks: {}", join(*names, ", "));
    }
    return 1;
  }
  auto benchmark = resolver.benchmark(opts.benchmark);
  if (!benchmark) {
    std::println(stderr, "Error: Cannot load benchmark '{}': {}",
                 opts.benchmark, benchmark.error().message());
    return 1;
  }

  ScoreStore store(config.storage.db_file);
  if (opts.save_scores) {
    if (auto r = store.open(); !r) {
      std::println(stderr, "Error: Failed to open database: {}",
                   r.error().message());
      return 1;
    }
  }
  ScoreboardMerger merger(opts.save_scores ? &store : nullptr);
  docker::DockerCliEngine engine(config.docker.binary);

  DockerBenchmark bench(std::move(*framework), std::move(*benchmark), config,
                        engine, merger);

  auto report = bench.setup(*mode, opts.upload);
  if (!report) {
    std::println(stderr, "Error: Setup failed: {}", report.error().message());
    return 1;
  }
  if (*mode == docker::SetupMode::Only) {
    std::println("Image {} is ready", report->image);
    return 0;
  }

  auto board = opts.task.empty()
                   ? bench.run(opts.save_scores)
                   : bench.run_one(opts.task, opts.folds, opts.save_scores);
  if (!board) {
    std::println(stderr, "Error: Benchmark run failed: {}",
                 board.error().message());
    return 1;
  }

  print_scoreboard(*board);

  if (!opts.results_json.empty()) {
    if (auto r = write_results_json(*board, opts.results_json); !r) {
      std::println(stderr, "Error: {}", r.error().message());
      return 1;
    }
  }
  return board->all_succeeded() ? 0 : 1;
}

}  // namespace

auto cmd_benchmark(const BenchmarkOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    return 1;
  }
  if (!opts.input_dir.empty()) {
    config->run.input_dir = opts.input_dir;
  }
  if (!opts.output_dir.empty()) {
    config->run.output_dir = opts.output_dir;
  }
  if (opts.parallel_jobs) {
    config->run.parallel_jobs = *opts.parallel_jobs;
  }

  setup_logging(config->logging);
  log::info("Running {} on benchmark {}", opts.framework, opts.benchmark);
  int rc = run_benchmark(opts, *config);
  log::stop();
  return rc;
}

}  // namespace benchdock::cli
