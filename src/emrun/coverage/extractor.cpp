#include "emrun/coverage/extractor.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>

#include "emrun/common/overloaded.hpp"
#include "emrun/coverage/record_kind.hpp"
#include "emrun/coverage/run_model.hpp"
#include "emrun/decode/log_record.hpp"
#include "emrun/stream/frame_reader.hpp"

namespace emrun::coverage {

CoverageExtractor::CoverageExtractor(std::string run_id) {
  model_.run_id = std::move(run_id);
}

void CoverageExtractor::Observe(const decode::LogRecord& record) {
  ++model_.stream_stats.records;

  RecordKind kind = ClassifyRecord(record);
  std::visit(
      Overloaded{
          [&](TestStart& s) { StartTest(std::move(s.test_name), record); },
          [&](TestEnd& e) {
            EndTest(std::move(e.test_name), std::move(e.result), record);
          },
          [&](RequirementCover& c) { Cover(c.requirement_id, record); },
          [&](TraceRoot& t) { origin_ = std::move(t.origin); },
          [](PassThrough&) {},
      },
      kind);
}

void CoverageExtractor::ObserveLoss(const stream::FrameLoss& loss) {
  ++model_.stream_stats.frames_lost;
  model_.stream_stats.bytes_lost += loss.bytes_discarded;
}

void CoverageExtractor::CountMalformed() {
  ++model_.stream_stats.malformed;
}

void CoverageExtractor::CountUnknownSymbol() {
  ++model_.stream_stats.unknown_symbols;
}

void CoverageExtractor::AttachExternal(OpaquePayload payload) {
  model_.external_meta = std::move(payload);
}

auto CoverageExtractor::Finish() && -> RunCoverageModel {
  for (auto& test : active_) {
    model_.outcomes.insert_or_assign(
        test.name,
        TestOutcome{
            .test_name = test.name,
            .result = Failed{.reason = std::string(kIncompleteReason)},
            .duration = std::nullopt,
        });
  }
  active_.clear();
  return std::move(model_);
}

void CoverageExtractor::StartTest(
    std::string name, const decode::LogRecord& record) {
  std::erase_if(
      active_, [&](const ActiveTest& t) { return t.name == name; });
  active_.push_back(
      ActiveTest{.name = std::move(name), .started_at = record.timestamp});
}

void CoverageExtractor::EndTest(
    std::string name, TestResult result, const decode::LogRecord& record) {
  std::optional<std::chrono::microseconds> duration;

  auto it = std::ranges::find(active_, name, &ActiveTest::name);
  if (it != active_.end()) {
    if (it->started_at && record.timestamp &&
        *record.timestamp >= *it->started_at) {
      duration = *record.timestamp - *it->started_at;
    }
    active_.erase(it);
  }

  model_.outcomes.insert_or_assign(
      name, TestOutcome{
                .test_name = name,
                .result = std::move(result),
                .duration = duration,
            });
}

void CoverageExtractor::Cover(
    const std::string& requirement_id, const decode::LogRecord& record) {
  std::string test_name = active_.empty() ? std::string(kUntrackedTest)
                                          : active_.back().name;
  std::string qualified =
      origin_.empty() ? requirement_id : origin_ + "::" + requirement_id;

  model_.evidence.push_back(
      RequirementEvidence{
          .requirement_id = std::move(qualified),
          .test_name = std::move(test_name),
          .location = record.location,
          .sequence_number = record.sequence_number,
      });
}

auto ExtractCoverage(
    std::string run_id, std::span<const decode::LogRecord> records)
    -> RunCoverageModel {
  CoverageExtractor extractor(std::move(run_id));
  for (const auto& record : records) {
    extractor.Observe(record);
  }
  return std::move(extractor).Finish();
}

}  // namespace emrun::coverage
