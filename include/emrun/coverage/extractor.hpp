#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "emrun/coverage/run_model.hpp"
#include "emrun/decode/log_record.hpp"
#include "emrun/stream/frame_reader.hpp"

namespace emrun::coverage {

// Folds one run's records, in sequence order, into a RunCoverageModel.
//
// - A repeated test.start for a running test replaces it (retries).
// - req.cover is credited to the most recently started test still running,
//   or to "<untracked>" when none is.
// - trace.root sets the origin prefix ("<origin>::<id>") for every later
//   req.cover until the next trace.root.
// - Finish() closes tests that never ended as Failed("incomplete"), so a
//   cancelled run still yields a complete model.
class CoverageExtractor {
 public:
  explicit CoverageExtractor(std::string run_id);

  void Observe(const decode::LogRecord& record);
  void ObserveLoss(const stream::FrameLoss& loss);
  void CountMalformed();
  void CountUnknownSymbol();
  void AttachExternal(OpaquePayload payload);

  [[nodiscard]] auto ActiveTests() const -> size_t {
    return active_.size();
  }

  auto Finish() && -> RunCoverageModel;

 private:
  struct ActiveTest {
    std::string name;
    std::optional<std::chrono::microseconds> started_at;
  };

  void StartTest(std::string name, const decode::LogRecord& record);
  void EndTest(
      std::string name, TestResult result, const decode::LogRecord& record);
  void Cover(
      const std::string& requirement_id, const decode::LogRecord& record);

  RunCoverageModel model_;
  std::vector<ActiveTest> active_;  // start order, most recent last
  std::string origin_;
};

// Convenience for an already collected record sequence.
auto ExtractCoverage(
    std::string run_id, std::span<const decode::LogRecord> records)
    -> RunCoverageModel;

}  // namespace emrun::coverage
