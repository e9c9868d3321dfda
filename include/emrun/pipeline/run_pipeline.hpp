#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "emrun/decode/symbol_table.hpp"
#include "emrun/decode/wire_decoder.hpp"
#include "emrun/schema/document.hpp"
#include "emrun/stream/byte_source.hpp"
#include "emrun/stream/frame_reader.hpp"

namespace emrun::pipeline {

enum class RunErrorKind : uint8_t {
  kVersionMismatch,  // target speaks an encoding this build cannot decode
};

auto ToString(RunErrorKind kind) -> std::string_view;

struct RunError {
  RunErrorKind kind;
  std::string run_id;
  std::string detail;
};

struct ExternalArtifact {
  std::filesystem::path path;
  std::string format;
};

struct RunOptions {
  std::string run_id;
  stream::ReaderOptions reader;
  std::optional<ExternalArtifact> external;
};

// Reads, decodes and correlates one run, then assembles its document.
//
// Per-frame problems (lost frames, malformed payloads, unknown symbols) and
// a rejected external artifact are logged, counted in stream_stats and
// skipped. A stop request, a failing source or the end of the stream closes
// the run; the document is still produced and marks unfinished tests as
// incomplete. Only an encoding version mismatch fails the run.
auto RunPipeline(
    stream::ByteSource& source, const decode::SymbolTable& symbols,
    const decode::WireDecoder& wire, const RunOptions& options,
    std::stop_token stop = {})
    -> std::expected<schema::CoverageDocument, RunError>;

struct MatrixEntry {
  std::unique_ptr<stream::ByteSource> source;
  RunOptions options;
};

// Runs every entry on its own thread. Each run owns its source and model;
// the symbol table and wire decoder are shared read-only. Results come back
// in entry order.
auto RunMatrix(
    std::vector<MatrixEntry> entries, const decode::SymbolTable& symbols,
    const decode::WireDecoder& wire, std::stop_token stop = {})
    -> std::vector<std::expected<schema::CoverageDocument, RunError>>;

}  // namespace emrun::pipeline
