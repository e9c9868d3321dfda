#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "emrun/common/diagnostic.hpp"
#include "emrun/stream/tcp_byte_source.hpp"

namespace emrun::config {

inline constexpr std::string_view kConfigFileName = "emrun.toml";

struct CaptureConfig {
  std::string host = "127.0.0.1";
  uint16_t rtt_port = stream::kDefaultRttPort;
  std::chrono::milliseconds read_timeout{2000};
  size_t max_frame_len = 4096;
};

struct CoverageConfig {
  std::filesystem::path output_dir = ".embedded/coverage";
  std::optional<std::string> run_name;
};

struct ExternalConfig {
  std::string format;
  std::filesystem::path path;
};

struct RunnerConfig {
  CaptureConfig capture;
  CoverageConfig coverage;
  std::optional<ExternalConfig> external;
  std::string log_level = "info";

  // Directory where emrun.toml was found; empty when running on defaults
  std::filesystem::path root_dir;
};

// Search for emrun.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse emrun.toml. Every field is optional; relative paths resolve against
// the file's directory. Returns a host error on parse or type errors.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<RunnerConfig>;

}  // namespace emrun::config
