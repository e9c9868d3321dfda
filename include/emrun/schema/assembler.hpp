#pragma once

#include "emrun/coverage/run_model.hpp"
#include "emrun/schema/document.hpp"

namespace emrun::schema {

// Total and deterministic: every model, however sparse, has a document.
auto Assemble(const coverage::RunCoverageModel& model) -> CoverageDocument;

}  // namespace emrun::schema
