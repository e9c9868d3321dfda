#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "emrun/coverage/run_model.hpp"
#include "emrun/decode/log_record.hpp"

namespace emrun::coverage {

// Reserved field keys that mark structured records.
inline constexpr std::string_view kTestStartKey = "test.start";
inline constexpr std::string_view kTestEndKey = "test.end";
inline constexpr std::string_view kReqCoverKey = "req.cover";
inline constexpr std::string_view kTraceRootKey = "trace.root";

struct TestStart {
  std::string test_name;
};

struct TestEnd {
  std::string test_name;
  TestResult result;
};

struct RequirementCover {
  std::string requirement_id;
};

// An empty origin returns to unqualified requirement ids.
struct TraceRoot {
  std::string origin;
};

// Ordinary log output; carries no coverage meaning.
struct PassThrough {};

using RecordKind =
    std::variant<TestStart, TestEnd, RequirementCover, TraceRoot, PassThrough>;

// Decides the shape of a record. Records that carry a reserved key but lack
// its required companion fields fall back to PassThrough.
auto ClassifyRecord(const decode::LogRecord& record) -> RecordKind;

// "passed" | "failed" | "ignored"; reason only applies to failed.
auto ParseTestResult(std::string_view text, std::string reason)
    -> std::optional<TestResult>;

}  // namespace emrun::coverage
