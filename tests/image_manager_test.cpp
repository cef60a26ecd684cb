#include "benchdock/docker/image_manager.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace benchdock;
using namespace benchdock::docker;

class ImageManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    docker_.frameworks_dir = dir_.path().string();
    std::filesystem::create_directories(dir_.path() / "H2OAutoML");
    framework_ = FrameworkDefinition{
        .name = "h2o",
        .module = "H2OAutoML",
        .setup_commands = "RUN $PIP install h2o",
        .docker_image = {.author = "org", .image = "h2o", .tag = "stable"},
    };
  }

  auto manager() -> ImageManager { return ImageManager(engine_, docker_, run_); }

  test::TempDir dir_;
  test::FakeContainerEngine engine_;
  DockerConfig docker_;
  RunConfiguration run_;
  FrameworkDefinition framework_;
};

TEST_F(ImageManagerTest, Skip_NeverTouchesEngine) {
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Skip);

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state, ImageState::Skipped);
  EXPECT_FALSE(report->built);
  EXPECT_TRUE(engine_.checked.empty());
  EXPECT_TRUE(engine_.builds.empty());
  EXPECT_FALSE(std::filesystem::exists(dir_.path() / "H2OAutoML/Dockerfile"));
}

TEST_F(ImageManagerTest, Skip_IgnoresUpload) {
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Skip, true);

  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(engine_.pushes.empty());
}

TEST_F(ImageManagerTest, Auto_ExistingImageIsNotRebuilt) {
  engine_.image_exists = true;
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Auto);

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->image, "org/h2o:stable");
  EXPECT_EQ(report->state, ImageState::Done);
  EXPECT_FALSE(report->built);
  ASSERT_EQ(engine_.checked.size(), 1u);
  EXPECT_EQ(engine_.checked[0], "org/h2o:stable");
  EXPECT_TRUE(engine_.builds.empty());
}

TEST_F(ImageManagerTest, Auto_MissingImageIsBuiltWithCache) {
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Auto);

  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->built);
  EXPECT_EQ(report->state, ImageState::Done);
  ASSERT_EQ(engine_.builds.size(), 1u);
  EXPECT_TRUE(engine_.builds[0].cache);
  EXPECT_EQ(engine_.builds[0].image, "org/h2o:stable");
  EXPECT_EQ(engine_.builds[0].descriptor,
            dir_.path() / "H2OAutoML" / "Dockerfile");
  EXPECT_TRUE(std::filesystem::exists(dir_.path() / "H2OAutoML/Dockerfile"));
  EXPECT_TRUE(engine_.pushes.empty());
}

TEST_F(ImageManagerTest, Force_AlwaysBuildsWithoutCache) {
  engine_.image_exists = true;
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Force);

  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(engine_.checked.empty());
  ASSERT_EQ(engine_.builds.size(), 1u);
  EXPECT_FALSE(engine_.builds[0].cache);
}

TEST_F(ImageManagerTest, Only_BuildsWithCache) {
  engine_.image_exists = true;
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Only);

  ASSERT_TRUE(report.has_value());
  ASSERT_EQ(engine_.builds.size(), 1u);
  EXPECT_TRUE(engine_.builds[0].cache);
}

TEST_F(ImageManagerTest, Upload_PublishesAfterBuild) {
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Force, true);

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state, ImageState::Published);
  ASSERT_EQ(engine_.pushes.size(), 1u);
  EXPECT_EQ(engine_.pushes[0], "org/h2o:stable");
}

TEST_F(ImageManagerTest, Upload_NotDoneWhenImageExists) {
  engine_.image_exists = true;
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Auto, true);

  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(engine_.pushes.empty());
}

TEST_F(ImageManagerTest, BuildFailure_Propagates) {
  engine_.fail_build = true;
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Auto, true);

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::ImageBuildFailed));
  EXPECT_TRUE(engine_.pushes.empty());
}

TEST_F(ImageManagerTest, PushFailure_Propagates) {
  engine_.fail_push = true;
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Force, true);

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::ImagePushFailed));
  EXPECT_EQ(engine_.builds.size(), 1u);
}

TEST_F(ImageManagerTest, DescriptorWriteFailure_AbortsBeforeBuild) {
  framework_.module = "NoSuchDir";
  auto m = manager();

  auto report = m.setup(framework_, SetupMode::Force);

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::FileWriteFailed));
  EXPECT_TRUE(engine_.builds.empty());
}

TEST(SetupModeTest, Parse) {
  EXPECT_EQ(parse_setup_mode("auto"), SetupMode::Auto);
  EXPECT_EQ(parse_setup_mode("skip"), SetupMode::Skip);
  EXPECT_EQ(parse_setup_mode("force"), SetupMode::Force);
  EXPECT_EQ(parse_setup_mode("only"), SetupMode::Only);
  EXPECT_FALSE(parse_setup_mode("always").has_value());
}
