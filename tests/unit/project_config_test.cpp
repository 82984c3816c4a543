#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "hailstone/common/diagnostic.hpp"
#include "hailstone/config/project_config.hpp"

namespace hailstone::config {
namespace {

namespace fs = std::filesystem;

class ProjectConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("hailstone_config_" +
            std::string(::testing::UnitTest::GetInstance()
                            ->current_test_info()
                            ->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    fs::remove_all(dir_);
  }

  auto Write(const std::string& content) -> fs::path {
    fs::path path = dir_ / kConfigFileName;
    std::ofstream out(path);
    out << content;
    return path;
  }

  fs::path dir_;
};

TEST_F(ProjectConfigTest, StarterConfigLoads) {
  auto config = LoadConfig(Write(StarterConfig()));
  ASSERT_TRUE(config.has_value()) << config.error().primary.message;

  EXPECT_EQ(config->rule, "m3a1");
  EXPECT_EQ(config->total, 1000);
  EXPECT_FALSE(config->probability.has_value());
  EXPECT_FALSE(config->seed.has_value());
  EXPECT_FALSE(config->max_iterations.has_value());
  EXPECT_EQ(config->root_dir, dir_);
  EXPECT_EQ(config->store_path, dir_ / "db" / "orbit_info.db");
}

TEST_F(ProjectConfigTest, OptionalBatchFields) {
  auto config = LoadConfig(
      Write(
          "[batch]\n"
          "rule = \"probabilistic\"\n"
          "total = 500\n"
          "probability = 0.25\n"
          "seed = 17\n"
          "max_iterations = 300\n"));
  ASSERT_TRUE(config.has_value()) << config.error().primary.message;

  EXPECT_EQ(config->probability, 0.25);
  EXPECT_EQ(config->seed, 17);
  EXPECT_EQ(config->max_iterations, 300);
  EXPECT_FALSE(config->store_path.has_value());
}

TEST_F(ProjectConfigTest, AbsoluteStorePathKept) {
  auto config = LoadConfig(
      Write(
          "[batch]\nrule = \"m3a1\"\ntotal = 5\n"
          "[store]\npath = \"/x.db\"\n"));
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->store_path, fs::path("/x.db"));
}

TEST_F(ProjectConfigTest, MissingRule) {
  auto config = LoadConfig(Write("[batch]\ntotal = 5\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().primary.kind, DiagKind::kHostError);
  EXPECT_NE(
      config.error().primary.message.find("'batch.rule'"), std::string::npos);
}

TEST_F(ProjectConfigTest, NegativeTotal) {
  auto config = LoadConfig(Write("[batch]\nrule = \"m3a1\"\ntotal = -4\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(
      config.error().primary.message.find("must not be negative"),
      std::string::npos);
}

TEST_F(ProjectConfigTest, ZeroMaxIterations) {
  auto config = LoadConfig(
      Write("[batch]\nrule = \"m3a5\"\ntotal = 5\nmax_iterations = 0\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(
      config.error().primary.message.find("at least 1"), std::string::npos);
}

TEST_F(ProjectConfigTest, NegativeSeed) {
  auto config =
      LoadConfig(Write("[batch]\nrule = \"m3a1\"\ntotal = 5\nseed = -1\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(
      config.error().primary.message.find("'batch.seed'"), std::string::npos);
}

TEST_F(ProjectConfigTest, FindConfigWalksUp) {
  Write(StarterConfig());
  fs::create_directories(dir_ / "a" / "b");

  auto found = FindConfig(dir_ / "a" / "b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, dir_ / kConfigFileName);
}

TEST_F(ProjectConfigTest, FindConfigMissing) {
  // Assumes no hailstone.toml above the temp directory.
  EXPECT_FALSE(FindConfig(dir_).has_value());
}

}  // namespace
}  // namespace hailstone::config
