#include "benchdock/config/definition_resolver.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace benchdock;

namespace {

constexpr std::string_view kFrameworks = R"(
constantpredictor:
  module: constantpredictor
H2O:
  module: H2OAutoML
  setup_commands: RUN $PIP install h2o
  docker_image:
    author: org
    image: h2o
    tag: stable
bare:
)";

constexpr std::string_view kSmall = R"(
- name: kc2
  openml_task_id: 3913
  max_runtime_seconds: 60
- name: iris
  folds: 3
)";

class DefinitionResolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    frameworks_ = dir_.write("frameworks.yaml", kFrameworks);
    dir_.write("benchmarks/small.yaml", kSmall);
    dir_.write("benchmarks/other.yml", "- name: t1\n");
  }

  auto resolver() -> FileDefinitionResolver {
    return FileDefinitionResolver(frameworks_, dir_.path() / "benchmarks");
  }

  test::TempDir dir_;
  std::filesystem::path frameworks_;
};

}  // namespace

TEST_F(DefinitionResolverTest, Framework_CaseInsensitiveLookup) {
  auto r = resolver();
  auto fw = r.framework("h2o");

  ASSERT_TRUE(fw.has_value());
  EXPECT_EQ(fw->name, "H2O");
  EXPECT_EQ(fw->module, "H2OAutoML");
  EXPECT_EQ(fw->setup_commands, "RUN $PIP install h2o");
  EXPECT_EQ(fw->docker_image.author, "org");
  EXPECT_EQ(fw->docker_image.image, "h2o");
  EXPECT_EQ(fw->docker_image.tag, "stable");
}

TEST_F(DefinitionResolverTest, Framework_ImageDefaults) {
  auto r = resolver();
  auto fw = r.framework("bare");

  ASSERT_TRUE(fw.has_value());
  EXPECT_EQ(fw->module_dir(), "bare");
  EXPECT_EQ(fw->docker_image.author, "automlbenchmark");
  EXPECT_FALSE(fw->docker_image.image.has_value());
  EXPECT_EQ(fw->docker_image.tag, "latest");
}

TEST_F(DefinitionResolverTest, Framework_Unknown) {
  auto r = resolver();
  auto fw = r.framework("autosklearn");

  ASSERT_FALSE(fw.has_value());
  EXPECT_EQ(fw.error(), make_error_code(Error::NotFound));
}

TEST_F(DefinitionResolverTest, Framework_MissingFile) {
  FileDefinitionResolver r(dir_.path() / "nope.yaml", dir_.path());
  auto fw = r.framework("h2o");

  ASSERT_FALSE(fw.has_value());
  EXPECT_EQ(fw.error(), make_error_code(Error::FileNotFound));
}

TEST_F(DefinitionResolverTest, ListFrameworks) {
  auto r = resolver();
  auto names = r.list_frameworks();

  ASSERT_TRUE(names.has_value());
  EXPECT_EQ(names->size(), 3u);
}

TEST_F(DefinitionResolverTest, Benchmark_LoadsTasks) {
  auto r = resolver();
  auto bench = r.benchmark("small");

  ASSERT_TRUE(bench.has_value());
  EXPECT_EQ(bench->name, "small");
  ASSERT_EQ(bench->tasks.size(), 2u);
  EXPECT_EQ(bench->tasks[0].name, "kc2");
  EXPECT_EQ(bench->tasks[0].folds, 10);
  EXPECT_EQ(bench->tasks[0].openml_task_id, 3913);
  EXPECT_EQ(bench->tasks[0].max_runtime_seconds, 60);
  EXPECT_EQ(bench->tasks[1].folds, 3);
  EXPECT_FALSE(bench->tasks[1].openml_task_id.has_value());
}

TEST_F(DefinitionResolverTest, Benchmark_YmlExtension) {
  auto r = resolver();
  auto bench = r.benchmark("other");

  ASSERT_TRUE(bench.has_value());
  ASSERT_EQ(bench->tasks.size(), 1u);
  EXPECT_EQ(bench->tasks[0].name, "t1");
}

TEST_F(DefinitionResolverTest, Benchmark_Unknown) {
  auto r = resolver();
  auto bench = r.benchmark("large");

  ASSERT_FALSE(bench.has_value());
  EXPECT_EQ(bench.error(), make_error_code(Error::NotFound));
}

TEST_F(DefinitionResolverTest, FindTask) {
  auto r = resolver();
  auto bench = r.benchmark("small");
  ASSERT_TRUE(bench.has_value());

  ASSERT_NE(bench->find_task("iris"), nullptr);
  EXPECT_EQ(bench->find_task("iris")->folds, 3);
  EXPECT_EQ(bench->find_task("Iris"), nullptr);
}

TEST(DefinitionParseTest, Benchmark_RejectsDuplicateTasks) {
  auto bench = FileDefinitionResolver::parse_benchmark(
      "dup", "- name: a\n- name: a\n");

  ASSERT_FALSE(bench.has_value());
  EXPECT_EQ(bench.error(), make_error_code(Error::ParseError));
}

TEST(DefinitionParseTest, Benchmark_RejectsZeroFolds) {
  auto bench =
      FileDefinitionResolver::parse_benchmark("zero", "- name: a\n  folds: 0\n");

  ASSERT_FALSE(bench.has_value());
  EXPECT_EQ(bench.error(), make_error_code(Error::ParseError));
}

TEST(DefinitionParseTest, Benchmark_RejectsUnnamedTask) {
  auto bench = FileDefinitionResolver::parse_benchmark("anon", "- folds: 2\n");

  ASSERT_FALSE(bench.has_value());
}

TEST(DefinitionParseTest, Benchmark_MustBeSequence) {
  auto bench = FileDefinitionResolver::parse_benchmark("map", "a: 1\n");

  ASSERT_FALSE(bench.has_value());
  EXPECT_EQ(bench.error(), make_error_code(Error::ParseError));
}

TEST(DefinitionParseTest, Benchmark_RejectsEmptyTaskList) {
  auto bench = FileDefinitionResolver::parse_benchmark("empty", "[]\n");

  ASSERT_FALSE(bench.has_value());
  EXPECT_EQ(bench.error(), make_error_code(Error::ParseError));
}

TEST(DefinitionParseTest, Frameworks_MustBeMap) {
  auto fws = FileDefinitionResolver::parse_frameworks("- a\n- b\n");

  ASSERT_FALSE(fws.has_value());
  EXPECT_EQ(fws.error(), make_error_code(Error::ParseError));
}
