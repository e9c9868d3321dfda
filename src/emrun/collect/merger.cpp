#include "emrun/collect/merger.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "emrun/coverage/run_model.hpp"
#include "emrun/schema/document.hpp"

namespace emrun::collect {

namespace {

// Bookkeeping for one folded run while inputs are consumed.
struct RunSlot {
  size_t index = 0;  // position in AggregateDocument::runs
  std::set<std::string> test_names;
};

// Documents number their records from 0, so a folded run can repeat a
// sequence number. Ties are broken on the remaining fields, which keeps the
// order independent of which input came first.
auto EvidenceKey(const coverage::RequirementEvidence& e) {
  return std::make_tuple(
      e.sequence_number, std::string_view(e.test_name),
      std::string_view(e.requirement_id), e.location.has_value(),
      e.location ? std::string_view(e.location->file) : std::string_view{},
      e.location ? e.location->line : uint32_t{0});
}

auto DuplicateRun(size_t input_index, std::string run_id, std::string detail)
    -> std::unexpected<MergeError> {
  return std::unexpected(
      MergeError{
          .kind = MergeErrorKind::kDuplicateRun,
          .input_index = input_index,
          .run_id = std::move(run_id),
          .detail = std::move(detail),
      });
}

}  // namespace

auto ToString(MergeErrorKind kind) -> std::string_view {
  switch (kind) {
    case MergeErrorKind::kSchemaVersionMismatch:
      return "schema version mismatch";
    case MergeErrorKind::kDuplicateRun:
      return "duplicate run";
  }
  return "unknown";
}

auto Merge(std::span<const schema::CoverageDocument> documents)
    -> std::expected<schema::AggregateDocument, MergeError> {
  schema::AggregateDocument aggregate;
  aggregate.schema_version = schema::kSchemaVersion;

  // Every input must carry the version of the first one, and that version
  // must be the one this build writes.
  if (!documents.empty()) {
    int expected_version = documents.front().schema_version;
    for (size_t i = 0; i < documents.size(); ++i) {
      const auto& doc = documents[i];
      if (doc.schema_version != expected_version ||
          doc.schema_version != schema::kSchemaVersion) {
        return std::unexpected(
            MergeError{
                .kind = MergeErrorKind::kSchemaVersionMismatch,
                .input_index = i,
                .run_id = doc.run_id,
                .detail = std::format(
                    "schema_version {} (expected {})", doc.schema_version,
                    schema::kSchemaVersion),
            });
      }
    }
  }

  std::unordered_map<std::string, RunSlot> slots;

  for (size_t i = 0; i < documents.size(); ++i) {
    const auto& doc = documents[i];

    auto [it, inserted] = slots.try_emplace(doc.run_id);
    RunSlot& slot = it->second;
    if (inserted) {
      slot.index = aggregate.runs.size();
      aggregate.runs.push_back(schema::AggregateRun{.run_id = doc.run_id});
    }
    schema::AggregateRun& run = aggregate.runs[slot.index];

    for (const auto& outcome : doc.outcomes) {
      if (!slot.test_names.insert(outcome.test_name).second) {
        return DuplicateRun(
            i, doc.run_id,
            std::format(
                "test '{}' reported more than once", outcome.test_name));
      }
      run.outcomes.push_back(outcome);
    }

    run.evidence.insert(
        run.evidence.end(), doc.evidence.begin(), doc.evidence.end());

    run.stream_stats += doc.stream_stats;

    if (doc.external_meta) {
      aggregate.external_meta.push_back(
          schema::RunPayload{
              .run_id = doc.run_id,
              .payload = *doc.external_meta,
          });
    }
  }

  for (auto& run : aggregate.runs) {
    std::ranges::sort(run.outcomes, {}, &coverage::TestOutcome::test_name);
    std::ranges::sort(run.evidence, {}, EvidenceKey);
  }

  return aggregate;
}

}  // namespace emrun::collect
