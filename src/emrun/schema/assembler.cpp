#include "emrun/schema/assembler.hpp"

#include <algorithm>

#include "emrun/coverage/run_model.hpp"
#include "emrun/schema/document.hpp"

namespace emrun::schema {

auto Assemble(const coverage::RunCoverageModel& model) -> CoverageDocument {
  CoverageDocument doc;
  doc.schema_version = kSchemaVersion;
  doc.run_id = model.run_id;

  // std::map iterates in byte-wise test_name order.
  doc.outcomes.reserve(model.outcomes.size());
  for (const auto& [name, outcome] : model.outcomes) {
    doc.outcomes.push_back(outcome);
  }

  doc.evidence = model.evidence;
  std::ranges::stable_sort(
      doc.evidence, {}, &coverage::RequirementEvidence::sequence_number);

  doc.external_meta = model.external_meta;
  doc.stream_stats = model.stream_stats;
  return doc;
}

}  // namespace emrun::schema
