#include "emrun/pipeline/run_id.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace emrun::pipeline {

namespace {

auto RandomSuffix() -> uint32_t {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return static_cast<uint32_t>(rng());
}

auto SanitizeName(std::string_view source_name) -> std::string {
  std::string name(source_name);
  for (char& c : name) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && c != '_' && c != '.' && c != '-') {
      c = '-';
    }
  }
  return name.empty() ? std::string("run") : name;
}

}  // namespace

auto GenerateRunId(
    std::string_view source_name, std::chrono::system_clock::time_point now)
    -> std::string {
  auto seconds = std::chrono::floor<std::chrono::seconds>(now);
  return std::format(
      "{}-{:%Y%m%dT%H%M%S}Z-{:08x}", SanitizeName(source_name), seconds,
      RandomSuffix());
}

auto ResolveRunId(
    const std::optional<std::string>& explicit_id,
    const std::optional<std::string>& configured_name,
    std::string_view source_name, std::chrono::system_clock::time_point now)
    -> std::string {
  if (explicit_id) {
    return *explicit_id;
  }
  return GenerateRunId(configured_name.value_or(std::string(source_name)), now);
}

}  // namespace emrun::pipeline
