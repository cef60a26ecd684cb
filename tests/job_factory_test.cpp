#include "benchdock/job/job_factory.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <set>

#include "gtest/gtest.h"

using namespace benchdock;

namespace {

auto has_arg_pair(const std::vector<std::string>& args, std::string_view flag,
                  std::string_view value) -> bool {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag && args[i + 1] == value) {
      return true;
    }
  }
  return false;
}

auto contains(const std::vector<std::string>& args, std::string_view arg)
    -> bool {
  return std::ranges::find(args, arg) != args.end();
}

}  // namespace

class JobFactoryTest : public ::testing::Test {
protected:
  BenchmarkDefinition bench_ = test::make_benchmark(
      "test", {test::make_task("t1", 2), test::make_task("t2", 3)});
};

TEST(ClampParallelJobsTest, InRangeKept) {
  EXPECT_EQ(clamp_parallel_jobs(1, 10), 1);
  EXPECT_EQ(clamp_parallel_jobs(4, 10), 4);
  EXPECT_EQ(clamp_parallel_jobs(10, 10), 10);
}

TEST(ClampParallelJobsTest, OutOfRangeForcedToCeiling) {
  EXPECT_EQ(clamp_parallel_jobs(0, 10), 10);
  EXPECT_EQ(clamp_parallel_jobs(-3, 10), 10);
  EXPECT_EQ(clamp_parallel_jobs(11, 10), 10);
  EXPECT_EQ(clamp_parallel_jobs(500, 4), 4);
}

TEST(ClampParallelJobsTest, CeilingBelowOneCountsAsOne) {
  EXPECT_EQ(clamp_parallel_jobs(5, 0), 1);
  EXPECT_EQ(clamp_parallel_jobs(0, 0), 1);
  EXPECT_EQ(clamp_parallel_jobs(1, -2), 1);
}

TEST_F(JobFactoryTest, Sequential_SingleWholeBenchmarkJob) {
  JobFactory factory("h2o", bench_);

  auto jobs = factory.jobs_for_benchmark(1);

  ASSERT_EQ(jobs.size(), 1u);
  EXPECT_EQ(jobs[0].id().str(), "docker_test__h2o");
  EXPECT_TRUE(jobs[0].task().empty());
  auto args = jobs[0].command_line();
  EXPECT_EQ(args, (std::vector<std::string>{"h2o", "test", "-i", "/input",
                                            "-o", "/output", "-s", "skip"}));
}

TEST_F(JobFactoryTest, Parallel_ByFold_OneJobPerTaskFold) {
  JobFactory factory("h2o", bench_, PartitionPolicy::ByFold);

  auto jobs = factory.jobs_for_benchmark(4);

  ASSERT_EQ(jobs.size(), 5u);
  EXPECT_EQ(jobs[0].id().str(), "docker_t1_0_h2o");
  EXPECT_EQ(jobs[1].id().str(), "docker_t1_1_h2o");
  EXPECT_EQ(jobs[4].id().str(), "docker_t2_2_h2o");
  EXPECT_TRUE(has_arg_pair(jobs[4].command_line(), "-t", "t2"));
  EXPECT_TRUE(has_arg_pair(jobs[4].command_line(), "-f", "2"));
}

TEST_F(JobFactoryTest, Parallel_ByTask_OneJobPerTask) {
  JobFactory factory("h2o", bench_, PartitionPolicy::ByTask);

  auto jobs = factory.jobs_for_benchmark(2);

  ASSERT_EQ(jobs.size(), 2u);
  EXPECT_EQ(jobs[0].id().str(), "docker_t1__h2o");
  EXPECT_TRUE(has_arg_pair(jobs[0].command_line(), "-t", "t1"));
  EXPECT_FALSE(contains(jobs[0].command_line(), "-f"));
}

TEST_F(JobFactoryTest, JobIdsAreUniqueWithinRun) {
  JobFactory factory("h2o", bench_);

  auto jobs = factory.jobs_for_benchmark(10);

  std::set<std::string> ids;
  for (const auto& job : jobs) {
    ids.insert(job.id().str());
  }
  EXPECT_EQ(ids.size(), jobs.size());
}

TEST_F(JobFactoryTest, Task_SingleFoldCarriesFoldFlag) {
  JobFactory factory("h2o", bench_);

  auto jobs = factory.jobs_for_task("t1", {0}, 1);

  ASSERT_TRUE(jobs.has_value());
  ASSERT_EQ(jobs->size(), 1u);
  const auto& args = (*jobs)[0].command_line();
  EXPECT_TRUE(has_arg_pair(args, "-t", "t1"));
  EXPECT_TRUE(has_arg_pair(args, "-f", "0"));
  EXPECT_TRUE(has_arg_pair(args, "-s", "skip"));
}

TEST_F(JobFactoryTest, Task_DifferentFoldsHaveDifferentIds) {
  JobFactory factory("h2o", bench_);

  auto fold0 = factory.jobs_for_task("t1", {0}, 1);
  auto fold1 = factory.jobs_for_task("t1", {1}, 1);

  ASSERT_TRUE(fold0.has_value());
  ASSERT_TRUE(fold1.has_value());
  EXPECT_NE((*fold0)[0].id(), (*fold1)[0].id());
}

TEST_F(JobFactoryTest, Task_SequentialAllFoldsIsOneJob) {
  JobFactory factory("h2o", bench_);

  auto jobs = factory.jobs_for_task("t2", {}, 1);

  ASSERT_TRUE(jobs.has_value());
  ASSERT_EQ(jobs->size(), 1u);
  EXPECT_EQ((*jobs)[0].id().str(), "docker_t2__h2o");
  EXPECT_FALSE(contains((*jobs)[0].command_line(), "-f"));
}

TEST_F(JobFactoryTest, Task_SequentialSeveralFoldsShareOneJob) {
  JobFactory factory("h2o", bench_);

  auto jobs = factory.jobs_for_task("t2", {0, 2}, 1);

  ASSERT_TRUE(jobs.has_value());
  ASSERT_EQ(jobs->size(), 1u);
  EXPECT_EQ((*jobs)[0].id().str(), "docker_t2_0:2_h2o");
  EXPECT_EQ((*jobs)[0].folds(), (std::vector<int>{0, 2}));
}

TEST_F(JobFactoryTest, Task_ParallelSplitsPerFold) {
  JobFactory factory("h2o", bench_);

  auto jobs = factory.jobs_for_task("t2", {}, 3);

  ASSERT_TRUE(jobs.has_value());
  ASSERT_EQ(jobs->size(), 3u);
  EXPECT_EQ((*jobs)[2].folds(), (std::vector<int>{2}));
}

TEST_F(JobFactoryTest, Task_DuplicateFoldsCollapsed) {
  JobFactory factory("h2o", bench_);

  auto jobs = factory.jobs_for_task("t2", {1, 1, 0}, 2);

  ASSERT_TRUE(jobs.has_value());
  ASSERT_EQ(jobs->size(), 2u);
  EXPECT_EQ((*jobs)[0].id().str(), "docker_t2_1_h2o");
  EXPECT_EQ((*jobs)[1].id().str(), "docker_t2_0_h2o");
}

TEST_F(JobFactoryTest, Task_FoldOutOfRange) {
  JobFactory factory("h2o", bench_);

  auto jobs = factory.jobs_for_task("t1", {2}, 1);

  ASSERT_FALSE(jobs.has_value());
  EXPECT_EQ(jobs.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(JobFactoryTest, Task_Unknown) {
  JobFactory factory("h2o", bench_);

  auto jobs = factory.jobs_for_task("t9", {}, 1);

  ASSERT_FALSE(jobs.has_value());
  EXPECT_EQ(jobs.error(), make_error_code(Error::NotFound));
}

TEST(JobTest, StateStrings) {
  EXPECT_EQ(to_string_view(JobState::Success), "success");
  EXPECT_EQ(parse_job_state("failed"), JobState::Failed);
  EXPECT_EQ(parse_job_state("garbage"), JobState::Pending);
}

TEST(JobTest, FailedOutcomeCarriesJobIdentity) {
  Job job("h2o", "test", TaskSelection{.task = "t1", .folds = {3}});

  auto outcome = job.failed_outcome("spawn failed");

  EXPECT_EQ(outcome.job_id, job.id());
  EXPECT_EQ(outcome.task, "t1");
  EXPECT_EQ(outcome.folds, std::vector<int>{3});
  EXPECT_EQ(outcome.state, JobState::Failed);
  EXPECT_EQ(outcome.error, "spawn failed");
  EXPECT_FALSE(outcome.succeeded());
}
