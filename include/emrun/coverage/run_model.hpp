#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "emrun/decode/log_record.hpp"

namespace emrun::coverage {

// test_name given to evidence seen while no test is running.
inline constexpr std::string_view kUntrackedTest = "<untracked>";
// Failure reason for tests still running when the stream ended.
inline constexpr std::string_view kIncompleteReason = "incomplete";

struct Passed {
  auto operator==(const Passed&) const -> bool = default;
};
struct Failed {
  std::string reason;
  auto operator==(const Failed&) const -> bool = default;
};
struct Ignored {
  auto operator==(const Ignored&) const -> bool = default;
};

using TestResult = std::variant<Passed, Failed, Ignored>;

auto ResultName(const TestResult& result) -> std::string_view;

struct TestOutcome {
  std::string test_name;
  TestResult result;
  std::optional<std::chrono::microseconds> duration;

  auto operator==(const TestOutcome&) const -> bool = default;
};

struct RequirementEvidence {
  std::string requirement_id;
  std::string test_name;
  std::optional<decode::SourceLocation> location;
  uint64_t sequence_number = 0;

  auto operator==(const RequirementEvidence&) const -> bool = default;
};

// External artifact stored verbatim; format and origin tag where it came from.
struct OpaquePayload {
  std::string format;
  std::string origin;
  std::string content;

  auto operator==(const OpaquePayload&) const -> bool = default;
};

struct StreamStats {
  uint64_t records = 0;
  uint64_t frames_lost = 0;
  uint64_t bytes_lost = 0;
  uint64_t malformed = 0;
  uint64_t unknown_symbols = 0;

  auto operator==(const StreamStats&) const -> bool = default;

  auto operator+=(const StreamStats& other) -> StreamStats& {
    records += other.records;
    frames_lost += other.frames_lost;
    bytes_lost += other.bytes_lost;
    malformed += other.malformed;
    unknown_symbols += other.unknown_symbols;
    return *this;
  }
};

struct RunCoverageModel {
  std::string run_id;
  // Keyed by test_name, which keeps test names unique within a run.
  std::map<std::string, TestOutcome> outcomes;
  // Observation order (ascending sequence_number).
  std::vector<RequirementEvidence> evidence;
  std::optional<OpaquePayload> external_meta;
  StreamStats stream_stats;
};

}  // namespace emrun::coverage
