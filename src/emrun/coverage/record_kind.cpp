#include "emrun/coverage/record_kind.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "emrun/coverage/run_model.hpp"
#include "emrun/decode/log_record.hpp"

namespace emrun::coverage {

namespace {

// Named companion field first, then the reserved key's own value.
auto FieldOrKeyValue(
    const decode::LogRecord& record, std::string_view field,
    const std::string& key_value) -> std::string {
  if (const std::string* v = record.Find(field); v != nullptr && !v->empty()) {
    return *v;
  }
  return key_value;
}

}  // namespace

auto ResultName(const TestResult& result) -> std::string_view {
  if (std::holds_alternative<Passed>(result)) {
    return "passed";
  }
  if (std::holds_alternative<Failed>(result)) {
    return "failed";
  }
  return "ignored";
}

auto ParseTestResult(std::string_view text, std::string reason)
    -> std::optional<TestResult> {
  if (text == "passed") {
    return Passed{};
  }
  if (text == "failed") {
    return Failed{.reason = std::move(reason)};
  }
  if (text == "ignored" || text == "skipped") {
    return Ignored{};
  }
  return std::nullopt;
}

auto ClassifyRecord(const decode::LogRecord& record) -> RecordKind {
  for (const auto& field : record.fields) {
    if (field.key == kTestStartKey) {
      auto name = FieldOrKeyValue(record, "test_name", field.value);
      if (name.empty()) {
        return PassThrough{};
      }
      return TestStart{.test_name = std::move(name)};
    }

    if (field.key == kTestEndKey) {
      auto name = FieldOrKeyValue(record, "test_name", field.value);
      const std::string* result_text = record.Find("result");
      if (name.empty() || result_text == nullptr) {
        return PassThrough{};
      }
      const std::string* reason = record.Find("reason");
      auto result = ParseTestResult(
          *result_text, reason != nullptr ? *reason : std::string{});
      if (!result) {
        return PassThrough{};
      }
      return TestEnd{
          .test_name = std::move(name),
          .result = std::move(*result),
      };
    }

    if (field.key == kReqCoverKey) {
      auto id = FieldOrKeyValue(record, "requirement_id", field.value);
      if (id.empty()) {
        return PassThrough{};
      }
      return RequirementCover{.requirement_id = std::move(id)};
    }

    if (field.key == kTraceRootKey) {
      return TraceRoot{.origin = FieldOrKeyValue(record, "path", field.value)};
    }
  }
  return PassThrough{};
}

}  // namespace emrun::coverage
