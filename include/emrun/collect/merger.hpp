#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "emrun/schema/document.hpp"

namespace emrun::collect {

enum class MergeErrorKind : uint8_t {
  kSchemaVersionMismatch,
  kDuplicateRun,
};

auto ToString(MergeErrorKind kind) -> std::string_view;

// input_index and run_id name the first input that could not be merged.
struct MergeError {
  MergeErrorKind kind;
  size_t input_index = 0;
  std::string run_id;
  std::string detail;
};

// Combines finished documents into one aggregate.
//
// Documents sharing a run_id fold into one run entry whose outcomes are
// sorted by test_name, whose evidence is ordered by sequence_number and
// whose stream stats are summed. A test_name reported twice for one run is
// kDuplicateRun; evidence is never deduplicated. Runs appear in the order
// their run_id is first seen, so the output depends on input order while
// each run's content does not. Inputs are left untouched and nothing is
// produced on error.
auto Merge(std::span<const schema::CoverageDocument> documents)
    -> std::expected<schema::AggregateDocument, MergeError>;

}  // namespace emrun::collect
