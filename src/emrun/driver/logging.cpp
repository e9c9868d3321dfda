#include "logging.hpp"

#include <cstdlib>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace emrun::driver {

namespace {

auto ResolveLevel(const std::string& level) -> std::string {
  if (const char* env = std::getenv("EMRUN_LOG_LEVEL")) {
    return env;
  }
  return level.empty() ? std::string("info") : level;
}

auto ResolvePattern() -> std::string {
  if (const char* pattern = std::getenv("EMRUN_LOG_PATTERN")) {
    return pattern;
  }
  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

}  // namespace

void InitializeLogging(const std::string& level) {
  auto logger = spdlog::get("emrun");
  if (!logger) {
    logger = spdlog::stderr_color_mt("emrun");
  }
  logger->set_pattern(ResolvePattern());
  logger->set_level(spdlog::level::from_str(ResolveLevel(level)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

}  // namespace emrun::driver
