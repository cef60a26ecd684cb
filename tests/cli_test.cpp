#include "benchdock/cli/commands.hpp"
#include "benchdock/storage/score_store.hpp"

#include "test_utils.hpp"

#include <format>

#include "gtest/gtest.h"

using namespace benchdock;

class CliTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_.write("frameworks.yaml", "h2o:\n  module: H2OAutoML\n");
    dir_.write("benchmarks/test.yaml",
               "- name: kc2\n  folds: 2\n- name: iris\n  folds: 2\n");
    config_file_ = dir_.write(
        "config.yaml",
        std::format("logging:\n  level: error\n"
                    "storage:\n  db_file: {0}/scores.db\n"
                    "definitions:\n  frameworks_file: {0}/frameworks.yaml\n"
                    "  benchmarks_dir: {0}/benchmarks\n",
                    dir_.path().string()));
  }

  test::TempDir dir_;
  std::filesystem::path config_file_;
};

TEST_F(CliTest, LoadConfig_NoFileGivesDefaults) {
  auto config = cli::load_config({});

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->storage.db_file, "benchdock.db");
}

TEST_F(CliTest, LoadConfig_MissingFile) {
  auto config = cli::load_config({.config_file = "/nonexistent/config.yaml",
                                  .log_level = {},
                                  .db_file = {}});

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error(), make_error_code(Error::FileNotFound));
}

TEST_F(CliTest, LoadConfig_FlagsOverrideFile) {
  auto config = cli::load_config({.config_file = config_file_.string(),
                                  .log_level = "debug",
                                  .db_file = "other.db"});

  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->logging.level, "debug");
  EXPECT_EQ(config->storage.db_file, "other.db");
  EXPECT_EQ(config->definitions.frameworks_file,
            (dir_.path() / "frameworks.yaml").string());
}

TEST_F(CliTest, List_KnownBenchmark) {
  cli::ListOptions opts{.common = {.config_file = config_file_.string(),
                                   .log_level = {},
                                   .db_file = {}},
                        .benchmark = "test",
                        .parallel_jobs = 2};

  EXPECT_EQ(cli::cmd_list(opts), 0);
}

TEST_F(CliTest, List_UnknownBenchmark) {
  cli::ListOptions opts{.common = {.config_file = config_file_.string(),
                                   .log_level = {},
                                   .db_file = {}},
                        .benchmark = "missing",
                        .parallel_jobs = std::nullopt};

  EXPECT_EQ(cli::cmd_list(opts), 1);
}

TEST_F(CliTest, Runs_EmptyDatabase) {
  cli::RunsOptions opts{.common = {.config_file = config_file_.string(),
                                   .log_level = {},
                                   .db_file = {}},
                        .run_id = {}};

  EXPECT_EQ(cli::cmd_runs(opts), 0);
}

TEST_F(CliTest, Runs_ShowUnknownRun) {
  cli::RunsOptions opts{.common = {.config_file = config_file_.string(),
                                   .log_level = {},
                                   .db_file = {}},
                        .run_id = "nope"};

  EXPECT_EQ(cli::cmd_runs(opts), 1);
}

TEST_F(CliTest, Benchmark_UnknownFramework) {
  cli::BenchmarkOptions opts;
  opts.common.config_file = config_file_.string();
  opts.framework = "autosklearn";
  opts.benchmark = "test";
  opts.setup_mode = "skip";

  EXPECT_EQ(cli::cmd_benchmark(opts), 1);
}

TEST_F(CliTest, Benchmark_InvalidSetupMode) {
  cli::BenchmarkOptions opts;
  opts.common.config_file = config_file_.string();
  opts.framework = "h2o";
  opts.benchmark = "test";
  opts.setup_mode = "sometimes";

  EXPECT_EQ(cli::cmd_benchmark(opts), 1);
}

// Drives a whole run through a fake docker binary; a failing fold makes the
// command exit non-zero and the saved run records it.
TEST_F(CliTest, Benchmark_FailedJobGivesNonZeroExit) {
  auto binary = dir_.write_script(
      "fake-docker",
      "case \"$*\" in *\"-f 1\"*) exit 3 ;; esac\nexit 0\n");
  auto config_file = dir_.write(
      "config-docker.yaml",
      std::format("logging:\n  level: error\n"
                  "docker:\n  binary: {0}\n"
                  "storage:\n  db_file: {1}/scores.db\n"
                  "definitions:\n  frameworks_file: {1}/frameworks.yaml\n"
                  "  benchmarks_dir: {1}/benchmarks\n",
                  binary.string(), dir_.path().string()));
  auto results = dir_.path() / "results.json";

  cli::BenchmarkOptions opts;
  opts.common.config_file = config_file.string();
  opts.framework = "h2o";
  opts.benchmark = "test";
  opts.task = "kc2";
  opts.parallel_jobs = 2;
  opts.setup_mode = "skip";
  opts.save_scores = true;
  opts.results_json = results.string();

  EXPECT_EQ(cli::cmd_benchmark(opts), 1);
  EXPECT_TRUE(std::filesystem::exists(results));

  ScoreStore store((dir_.path() / "scores.db").string());
  ASSERT_TRUE(store.open().has_value());
  auto runs = store.list_runs();
  ASSERT_TRUE(runs.has_value());
  ASSERT_EQ(runs->size(), 1u);
  EXPECT_EQ((*runs)[0].jobs, 2u);
  EXPECT_EQ((*runs)[0].failed, 1u);
}
