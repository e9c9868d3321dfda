#include "emrun/config/runner_config.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include <toml++/toml.hpp>

#include "emrun/common/diagnostic.hpp"

namespace emrun::config {

namespace fs = std::filesystem;

namespace {

auto FieldError(
    const fs::path& config_path, std::string_view field,
    std::string_view expected) -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::HostError(
          std::format(
              "{}: '{}' must be {}", config_path.string(), field, expected)));
}

auto IsLogLevel(std::string_view level) -> bool {
  static constexpr std::array<std::string_view, 7> kLevels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  for (std::string_view name : kLevels) {
    if (name == level) {
      return true;
    }
  }
  return false;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<RunnerConfig> {
  RunnerConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [capture] section (optional)
  if (auto capture = tbl["capture"]) {
    if (auto node = capture["host"]) {
      auto host = node.value<std::string>();
      if (!host || host->empty()) {
        return FieldError(config_path, "capture.host", "a non-empty string");
      }
      config.capture.host = *host;
    }
    if (auto node = capture["rtt_port"]) {
      auto port = node.value<int64_t>();
      if (!port || *port < 1 || *port > 65535) {
        return FieldError(
            config_path, "capture.rtt_port", "an integer in 1..65535");
      }
      config.capture.rtt_port = static_cast<uint16_t>(*port);
    }
    if (auto node = capture["read_timeout_ms"]) {
      auto timeout = node.value<int64_t>();
      if (!timeout || *timeout <= 0) {
        return FieldError(
            config_path, "capture.read_timeout_ms", "a positive integer");
      }
      config.capture.read_timeout = std::chrono::milliseconds(*timeout);
    }
    if (auto node = capture["max_frame_len"]) {
      auto len = node.value<int64_t>();
      if (!len || *len <= 0) {
        return FieldError(
            config_path, "capture.max_frame_len", "a positive integer");
      }
      config.capture.max_frame_len = static_cast<size_t>(*len);
    }
  }

  // [coverage] section (optional)
  if (auto coverage = tbl["coverage"]) {
    if (auto node = coverage["output_dir"]) {
      auto dir = node.value<std::string>();
      if (!dir) {
        return FieldError(config_path, "coverage.output_dir", "a string");
      }
      fs::path out_dir = *dir;
      if (out_dir.is_relative()) {
        out_dir = config.root_dir / out_dir;
      }
      config.coverage.output_dir = out_dir;
    }
    if (auto node = coverage["run_name"]) {
      auto name = node.value<std::string>();
      if (!name) {
        return FieldError(config_path, "coverage.run_name", "a string");
      }
      config.coverage.run_name = *name;
    }
  }

  // [external] section (optional, but format and path go together)
  if (auto external = tbl["external"]) {
    auto format = external["format"].value<std::string>();
    auto path = external["path"].value<std::string>();
    if (!format || !path) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "{}: [external] needs both 'format' and 'path' strings",
                  config_path.string())));
    }
    fs::path artifact = *path;
    if (artifact.is_relative()) {
      artifact = config.root_dir / artifact;
    }
    config.external = ExternalConfig{.format = *format, .path = artifact};
  }

  // [log] section (optional)
  if (auto log = tbl["log"]) {
    if (auto node = log["level"]) {
      auto level = node.value<std::string>();
      if (!level || !IsLogLevel(*level)) {
        return FieldError(
            config_path, "log.level",
            "one of trace, debug, info, warn, error, critical, off");
      }
      config.log_level = *level;
    }
  }

  return config;
}

}  // namespace emrun::config
