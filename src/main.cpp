#include "benchdock/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("benchdock - run benchmark frameworks inside docker containers");
  std::println("Usage: {} <framework> <benchmark> [OPTIONS]", prog);
  std::println("       {} --list <benchmark> [OPTIONS]", prog);
  std::println("       {} --runs | --show <run_id> [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -t, --task <name>         Run a single task of the benchmark");
  std::println("  -f, --fold <n>...         Folds of the task (default: all)");
  std::println("  -p, --parallel <n>        Number of containers run at once");
  std::println(
      "  -s, --setup <mode>        auto|skip|force|only (default: auto)");
  std::println("  -u, --upload              Push the image after building it");
  std::println("  -c, --config <file>       YAML config file");
  std::println("  -i, --input <dir>         Host input dir, mounted at /input");
  std::println(
      "  -o, --output <dir>        Host output dir, mounted at /output");
  std::println("  --db <file>               Score database file");
  std::println("  --save-scores             Save job results to the database");
  std::println("  --results-json <file>     Write the scoreboard as JSON");
  std::println("  --log-level <level>       trace|debug|info|warn|error");
  std::println("  -v, --version             Show version and exit");
  std::println("  -h, --help                Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} h2o small -s force             # rebuild, then run",
               prog);
  std::println("  {} h2o test -t iris -f 0 1 -p 2   # two folds in parallel",
               prog);
}

void print_version() {
  std::println("benchdock v0.1.0");
}

enum class Command { Benchmark, List, Runs };

struct Options {
  Command command = Command::Benchmark;
  benchdock::cli::BenchmarkOptions bench;
  std::string list_benchmark;
  std::string run_id;
};

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  print_usage(prog);
  std::exit(1);
}

auto parse_int(std::string_view s) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;
  auto& bench = opts.bench;
  std::vector<std::string> positional;

  auto value_of = [&](int& i, std::string_view flag) -> std::string {
    if (++i >= argc) {
      usage_error(argv[0], std::format("{} requires an argument", flag));
    }
    return argv[i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-t" || arg == "--task") {
      bench.task = value_of(i, arg);
    } else if (arg == "-f" || arg == "--fold") {
      // Consumes every following integer.
      bool any = false;
      while (i + 1 < argc) {
        auto fold = parse_int(argv[i + 1]);
        if (!fold) {
          break;
        }
        bench.folds.push_back(*fold);
        any = true;
        ++i;
      }
      if (!any) {
        usage_error(argv[0], "--fold requires at least one integer");
      }
    } else if (arg == "-p" || arg == "--parallel") {
      auto n = parse_int(value_of(i, arg));
      if (!n) {
        usage_error(argv[0], "--parallel requires an integer");
      }
      bench.parallel_jobs = *n;
    } else if (arg == "-s" || arg == "--setup") {
      bench.setup_mode = value_of(i, arg);
    } else if (arg == "-u" || arg == "--upload") {
      bench.upload = true;
    } else if (arg == "-c" || arg == "--config") {
      bench.common.config_file = value_of(i, arg);
    } else if (arg == "-i" || arg == "--input") {
      bench.input_dir = value_of(i, arg);
    } else if (arg == "-o" || arg == "--output") {
      bench.output_dir = value_of(i, arg);
    } else if (arg == "--db") {
      bench.common.db_file = value_of(i, arg);
    } else if (arg == "--save-scores") {
      bench.save_scores = true;
    } else if (arg == "--results-json") {
      bench.results_json = value_of(i, arg);
    } else if (arg == "--log-level") {
      bench.common.log_level = value_of(i, arg);
    } else if (arg == "--list") {
      opts.command = Command::List;
      opts.list_benchmark = value_of(i, arg);
    } else if (arg == "--runs") {
      opts.command = Command::Runs;
    } else if (arg == "--show") {
      opts.command = Command::Runs;
      opts.run_id = value_of(i, arg);
    } else if (arg.starts_with("-")) {
      usage_error(argv[0], std::format("Unknown option: {}", arg));
    } else {
      positional.emplace_back(arg);
    }
  }

  if (opts.command == Command::Benchmark) {
    if (positional.size() != 2) {
      usage_error(argv[0], "expected <framework> <benchmark>");
    }
    bench.framework = positional[0];
    bench.benchmark = positional[1];
    if (!bench.folds.empty() && bench.task.empty()) {
      usage_error(argv[0], "--fold requires --task");
    }
  } else if (!positional.empty()) {
    usage_error(argv[0], std::format("Unexpected argument: {}", positional[0]));
  }
  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  switch (opts.command) {
    case Command::List:
      return benchdock::cli::cmd_list({
          .common = opts.bench.common,
          .benchmark = opts.list_benchmark,
          .parallel_jobs = opts.bench.parallel_jobs,
      });
    case Command::Runs:
      return benchdock::cli::cmd_runs({
          .common = opts.bench.common,
          .run_id = opts.run_id,
      });
    case Command::Benchmark:
      break;
  }
  return benchdock::cli::cmd_benchmark(opts.bench);
}
