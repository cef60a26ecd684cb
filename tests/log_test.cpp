#include "benchdock/util/log.hpp"

#include "test_utils.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace benchdock;

TEST(LogTest, ParseLevel) {
  EXPECT_EQ(log::parse_level("trace"), log::Level::Trace);
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("warn"), log::Level::Warn);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_EQ(log::parse_level("info"), log::Level::Info);
  EXPECT_EQ(log::parse_level("verbose"), log::Level::Info);
}

TEST(LogTest, FileSinkReceivesRecordsWithoutColour) {
  test::TempDir dir;
  auto path = dir.path() / "benchdock.log";
  log::set_level(log::Level::Info);
  ASSERT_TRUE(log::set_file(path.string()));
  log::start();

  log::info("job {} started", "docker_t1_0_h2o");
  log::debug("filtered out");
  log::warn("clamped to {}", 10);
  log::stop();
  ASSERT_TRUE(log::set_file(""));

  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  auto text = ss.str();
  EXPECT_NE(text.find("[info] "), std::string::npos);
  EXPECT_NE(text.find("job docker_t1_0_h2o started"), std::string::npos);
  EXPECT_NE(text.find("[warn] "), std::string::npos);
  EXPECT_NE(text.find("clamped to 10"), std::string::npos);
  EXPECT_EQ(text.find("filtered out"), std::string::npos);
  EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST(LogTest, LoggingWhileStoppedIsSynchronous) {
  test::TempDir dir;
  auto path = dir.path() / "sync.log";
  log::stop();
  ASSERT_TRUE(log::set_file(path.string()));

  log::error("written immediately");

  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  EXPECT_NE(ss.str().find("written immediately"), std::string::npos);
  ASSERT_TRUE(log::set_file(""));
}

TEST(LogTest, BurstFromWorkersLosesNoRecords) {
  constexpr int kWorkers = 3;
  constexpr int kPerWorker = 4000;
  test::TempDir dir;
  auto path = dir.path() / "burst.log";
  log::set_level(log::Level::Info);
  ASSERT_TRUE(log::set_file(path.string()));
  log::start();

  {
    std::vector<std::jthread> workers;
    for (int w = 0; w < kWorkers; ++w) {
      workers.emplace_back([w] {
        for (int i = 0; i < kPerWorker; ++i) {
          log::info("worker {} line {}", w, i);
        }
      });
    }
  }
  log::stop();
  ASSERT_TRUE(log::set_file(""));

  std::ifstream in(path);
  int lines = 0;
  for (std::string line; std::getline(in, line);) {
    if (line.find("worker ") != std::string::npos) {
      ++lines;
    }
  }
  EXPECT_EQ(lines, kWorkers * kPerWorker);
}
