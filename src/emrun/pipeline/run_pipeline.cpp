#include "emrun/pipeline/run_pipeline.hpp"

#include <cstddef>
#include <expected>
#include <format>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "emrun/common/internal_error.hpp"
#include "emrun/common/overloaded.hpp"
#include "emrun/coverage/extractor.hpp"
#include "emrun/decode/frame_decoder.hpp"
#include "emrun/external/importer.hpp"
#include "emrun/schema/assembler.hpp"
#include "emrun/stream/frame_reader.hpp"

namespace emrun::pipeline {

auto ToString(RunErrorKind kind) -> std::string_view {
  switch (kind) {
    case RunErrorKind::kVersionMismatch:
      return "encoding version mismatch";
  }
  return "unknown";
}

auto RunPipeline(
    stream::ByteSource& source, const decode::SymbolTable& symbols,
    const decode::WireDecoder& wire, const RunOptions& options,
    std::stop_token stop)
    -> std::expected<schema::CoverageDocument, RunError> {
  const std::string& run_id = options.run_id;
  spdlog::info("run '{}': reading from {}", run_id, source.Describe());

  stream::FrameReader reader(source, stop, options.reader);
  decode::FrameDecoder decoder(wire);
  coverage::CoverageExtractor extractor(run_id);

  while (true) {
    auto event = reader.Next();
    if (!event) {
      // A dead transport ends the run like the end of the stream does.
      spdlog::warn(
          "run '{}': source failed, keeping partial coverage: {}", run_id,
          event.error().message);
      break;
    }
    if (!*event) {
      break;
    }

    std::optional<RunError> fatal;
    std::visit(
        Overloaded{
            [&](const stream::FrameLoss& loss) {
              spdlog::warn(
                  "run '{}': dropped {} bytes at offset {} ({})", run_id,
                  loss.bytes_discarded, loss.stream_offset,
                  stream::ToString(loss.reason));
              extractor.ObserveLoss(loss);
            },
            [&](const stream::FrameCandidate& frame) {
              auto record = decoder.Decode(frame, symbols);
              if (record) {
                extractor.Observe(*record);
                return;
              }
              const auto& error = record.error();
              switch (error.kind) {
                case decode::DecodeErrorKind::kMalformed:
                  spdlog::warn(
                      "run '{}': skipping malformed frame at offset {}: {}",
                      run_id, frame.stream_offset, error.detail);
                  extractor.CountMalformed();
                  break;
                case decode::DecodeErrorKind::kUnknownSymbol:
                  spdlog::warn("run '{}': {}", run_id, error.detail);
                  extractor.CountUnknownSymbol();
                  if (!error.fallback) {
                    common::ThrowInternalError(
                        "RunPipeline", "unknown symbol without fallback");
                  }
                  extractor.Observe(*error.fallback);
                  break;
                case decode::DecodeErrorKind::kVersionMismatch:
                  fatal = RunError{
                      .kind = RunErrorKind::kVersionMismatch,
                      .run_id = run_id,
                      .detail = error.detail,
                  };
                  break;
              }
            },
        },
        **event);

    if (fatal) {
      spdlog::error("run '{}': {}", run_id, fatal->detail);
      return std::unexpected(std::move(*fatal));
    }
  }

  if (stop.stop_requested()) {
    spdlog::info("run '{}': stopped, flushing partial coverage", run_id);
  }
  if (extractor.ActiveTests() > 0) {
    spdlog::warn(
        "run '{}': {} test(s) still running at end of stream", run_id,
        extractor.ActiveTests());
  }

  if (options.external) {
    auto payload = external::ImportFile(
        options.external->path, options.external->format);
    if (payload) {
      extractor.AttachExternal(std::move(*payload));
    } else {
      spdlog::warn(
          "run '{}': external coverage ignored: {}", run_id,
          payload.error().detail);
    }
  }

  auto document = schema::Assemble(std::move(extractor).Finish());
  spdlog::info(
      "run '{}': {} records, {} outcomes, {} evidence entries", run_id,
      document.stream_stats.records, document.outcomes.size(),
      document.evidence.size());
  return document;
}

auto RunMatrix(
    std::vector<MatrixEntry> entries, const decode::SymbolTable& symbols,
    const decode::WireDecoder& wire, std::stop_token stop)
    -> std::vector<std::expected<schema::CoverageDocument, RunError>> {
  // One slot per run, each written by exactly one worker.
  std::vector<std::optional<std::expected<schema::CoverageDocument, RunError>>>
      slots(entries.size());

  {
    std::vector<std::jthread> workers;
    workers.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
      workers.emplace_back([&, i] {
        slots[i] = RunPipeline(
            *entries[i].source, symbols, wire, entries[i].options, stop);
      });
    }
  }

  std::vector<std::expected<schema::CoverageDocument, RunError>> results;
  results.reserve(slots.size());
  for (auto& slot : slots) {
    if (!slot) {
      common::ThrowInternalError("RunMatrix", "worker produced no result");
    }
    results.push_back(std::move(*slot));
  }
  return results;
}

}  // namespace emrun::pipeline
