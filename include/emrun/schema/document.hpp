#pragma once

#include <optional>
#include <string>
#include <vector>

#include "emrun/coverage/run_model.hpp"

namespace emrun::schema {

// Bump on any incompatible change to the persisted layout. Documents with
// different versions are never merged.
inline constexpr int kSchemaVersion = 1;

// Canonical form of one run. outcomes are sorted by test_name, evidence is
// in observation order.
struct CoverageDocument {
  int schema_version = kSchemaVersion;
  std::string run_id;
  std::vector<coverage::TestOutcome> outcomes;
  std::vector<coverage::RequirementEvidence> evidence;
  std::optional<coverage::OpaquePayload> external_meta;
  coverage::StreamStats stream_stats;

  auto operator==(const CoverageDocument&) const -> bool = default;
};

struct AggregateRun {
  std::string run_id;
  std::vector<coverage::TestOutcome> outcomes;
  std::vector<coverage::RequirementEvidence> evidence;
  coverage::StreamStats stream_stats;

  auto operator==(const AggregateRun&) const -> bool = default;
};

struct RunPayload {
  std::string run_id;
  coverage::OpaquePayload payload;

  auto operator==(const RunPayload&) const -> bool = default;
};

struct AggregateDocument {
  int schema_version = kSchemaVersion;
  std::vector<AggregateRun> runs;  // first-appearance order of run_id
  std::vector<RunPayload> external_meta;

  auto operator==(const AggregateDocument&) const -> bool = default;
};

}  // namespace emrun::schema
