#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "emrun/common/diagnostic.hpp"
#include "emrun/config/runner_config.hpp"

namespace emrun::config {
namespace {

namespace fs = std::filesystem;

class RunnerConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() / "emrun_config_test";
    fs::remove_all(root_);
    fs::create_directories(root_);
  }

  void TearDown() override {
    fs::remove_all(root_);
  }

  auto WriteConfig(const std::string& text) -> fs::path {
    auto path = root_ / kConfigFileName;
    std::ofstream out(path);
    out << text;
    return path;
  }

  fs::path root_;
};

TEST_F(RunnerConfigTest, EmptyFileKeepsDefaults) {
  auto config = LoadConfig(WriteConfig(""));
  ASSERT_TRUE(config.has_value()) << config.error().primary.message;

  EXPECT_EQ(config->capture.host, "127.0.0.1");
  EXPECT_EQ(config->capture.rtt_port, stream::kDefaultRttPort);
  EXPECT_EQ(config->capture.read_timeout, std::chrono::milliseconds(2000));
  EXPECT_EQ(config->capture.max_frame_len, 4096);
  EXPECT_EQ(config->coverage.output_dir, fs::path(".embedded/coverage"));
  EXPECT_FALSE(config->coverage.run_name.has_value());
  EXPECT_FALSE(config->external.has_value());
  EXPECT_EQ(config->log_level, "info");
  EXPECT_EQ(config->root_dir, root_);
}

TEST_F(RunnerConfigTest, ReadsEverySection) {
  auto config = LoadConfig(WriteConfig(R"(
[capture]
host = "10.0.0.7"
rtt_port = 2331
read_timeout_ms = 250
max_frame_len = 512

[coverage]
output_dir = "out/cov"
run_name = "nightly"

[external]
format = "lcov"
path = "build/lcov.info"

[log]
level = "warn"
)"));
  ASSERT_TRUE(config.has_value()) << config.error().primary.message;

  EXPECT_EQ(config->capture.host, "10.0.0.7");
  EXPECT_EQ(config->capture.rtt_port, 2331);
  EXPECT_EQ(config->capture.read_timeout, std::chrono::milliseconds(250));
  EXPECT_EQ(config->capture.max_frame_len, 512);
  EXPECT_EQ(config->coverage.output_dir, root_ / "out/cov");
  EXPECT_EQ(config->coverage.run_name, "nightly");
  ASSERT_TRUE(config->external.has_value());
  EXPECT_EQ(config->external->format, "lcov");
  EXPECT_EQ(config->external->path, root_ / "build/lcov.info");
  EXPECT_EQ(config->log_level, "warn");
}

TEST_F(RunnerConfigTest, AbsolutePathsStayAsGiven) {
  auto config = LoadConfig(WriteConfig(R"(
[coverage]
output_dir = "/var/tmp/cov"
)"));
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->coverage.output_dir, fs::path("/var/tmp/cov"));
}

TEST_F(RunnerConfigTest, RejectsPortOutOfRange) {
  auto config = LoadConfig(WriteConfig("[capture]\nrtt_port = 70000\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().primary.kind, DiagKind::kHostError);
  EXPECT_NE(
      config.error().primary.message.find("capture.rtt_port"),
      std::string::npos);
}

TEST_F(RunnerConfigTest, RejectsWrongTypes) {
  EXPECT_FALSE(LoadConfig(WriteConfig("[capture]\nhost = 5\n")));
  EXPECT_FALSE(LoadConfig(WriteConfig("[capture]\nread_timeout_ms = 0\n")));
  EXPECT_FALSE(LoadConfig(WriteConfig("[coverage]\nrun_name = true\n")));
}

TEST_F(RunnerConfigTest, RejectsUnknownLogLevel) {
  auto config = LoadConfig(WriteConfig("[log]\nlevel = \"loud\"\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(
      config.error().primary.message.find("log.level"), std::string::npos);
}

TEST_F(RunnerConfigTest, ExternalNeedsFormatAndPath) {
  auto config = LoadConfig(WriteConfig("[external]\nformat = \"json\"\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(
      config.error().primary.message.find("[external]"), std::string::npos);
}

TEST_F(RunnerConfigTest, SyntaxErrorIsReported) {
  auto config = LoadConfig(WriteConfig("[capture\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(
      config.error().primary.message.rfind("failed to parse", 0), 0);
}

TEST_F(RunnerConfigTest, FindConfigWalksUp) {
  auto path = WriteConfig("");
  auto nested = root_ / "a" / "b";
  fs::create_directories(nested);

  auto found = FindConfig(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, path);
}

}  // namespace
}  // namespace emrun::config
