#include "commands.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include "emrun/collect/manifest.hpp"
#include "emrun/collect/merger.hpp"
#include "emrun/common/diagnostic.hpp"
#include "emrun/config/runner_config.hpp"
#include "emrun/decode/symbol_table.hpp"
#include "emrun/decode/wire_decoder.hpp"
#include "emrun/pipeline/run_id.hpp"
#include "emrun/pipeline/run_pipeline.hpp"
#include "emrun/schema/document.hpp"
#include "emrun/schema/json_codec.hpp"
#include "emrun/stream/byte_source.hpp"
#include "emrun/stream/tcp_byte_source.hpp"
#include "print.hpp"
#include "stop_watch.hpp"
#include "verbose_logger.hpp"

namespace emrun::driver {

namespace fs = std::filesystem;

namespace {

auto ToDiagnostic(const stream::SourceError& error) -> Diagnostic {
  return Diagnostic::HostError(error.message);
}

auto ToDiagnostic(const pipeline::RunError& error) -> Diagnostic {
  return Diagnostic::Error(
             std::format(
                 "run '{}' failed: {}", error.run_id,
                 pipeline::ToString(error.kind)))
      .WithNote(error.detail);
}

auto ToDiagnostic(const collect::MergeError& error, const fs::path& input)
    -> Diagnostic {
  return Diagnostic::Error(
             std::format(
                 "cannot merge input #{} (run '{}'): {}", error.input_index,
                 error.run_id, collect::ToString(error.kind)))
      .WithNote(error.detail)
      .WithNote(
          std::format("input #{} is '{}'", error.input_index, input.string()));
}

auto MakeReaderOptions(const config::RunnerConfig& config)
    -> stream::ReaderOptions {
  return stream::ReaderOptions{
      .max_frame_len = config.capture.max_frame_len,
  };
}

auto LoadSymbols(const argparse::ArgumentParser& cmd, VerboseLogger& logger)
    -> std::optional<decode::SymbolTable> {
  PhaseTimer timer(logger, "symbols");
  auto table = decode::LoadSymbolTable(cmd.get<std::string>("--symbols"));
  if (!table) {
    PrintDiagnostic(table.error());
    return std::nullopt;
  }
  spdlog::debug("loaded {} symbols", table->Size());
  return std::move(*table);
}

// Writes the document and records it for the next collect.
auto StoreDocument(
    const schema::CoverageDocument& document, const fs::path& output,
    const config::RunnerConfig& config) -> bool {
  auto written =
      schema::WriteDocumentFile(output, schema::DumpDocument(document));
  if (!written) {
    PrintDiagnostic(written.error());
    return false;
  }
  auto recorded = collect::AppendToManifest(
      collect::ManifestPath(config.coverage.output_dir), fs::absolute(output));
  if (!recorded) {
    PrintDiagnostic(recorded.error());
    return false;
  }
  std::cout << std::format(
      "wrote coverage for run '{}' to {}\n", document.run_id,
      output.string());
  return true;
}

auto DocumentPath(const config::RunnerConfig& config, const std::string& run_id)
    -> fs::path {
  return config.coverage.output_dir / (run_id + ".json");
}

}  // namespace

auto RunCommand(
    const argparse::ArgumentParser& cmd, const config::RunnerConfig& config,
    VerboseLogger& logger) -> int {
  auto capture = cmd.present<std::string>("--capture");
  auto port = cmd.present<int>("--port");
  if (capture && port) {
    PrintError("--capture and --port are mutually exclusive");
    return 1;
  }
  if (port && (*port < 1 || *port > 65535)) {
    PrintError(std::format("invalid port {}", *port));
    return 1;
  }

  auto format = cmd.present<std::string>("--external-format");
  auto external_path = cmd.present<std::string>("--external");
  if (external_path.has_value() != format.has_value()) {
    PrintError("--external and --external-format must be given together");
    return 1;
  }

  auto symbols = LoadSymbols(cmd, logger);
  if (!symbols) {
    return 1;
  }

  std::unique_ptr<stream::ByteSource> source;
  std::string source_name;
  if (capture) {
    auto file = stream::FileByteSource::Open(*capture);
    if (!file) {
      PrintDiagnostic(ToDiagnostic(file.error()));
      return 1;
    }
    source = std::move(*file);
    source_name = fs::path(*capture).stem().string();
  } else {
    uint16_t rtt_port =
        port ? static_cast<uint16_t>(*port) : config.capture.rtt_port;
    auto tcp = stream::TcpByteSource::Connect(
        config.capture.host, rtt_port, config.capture.read_timeout);
    if (!tcp) {
      PrintDiagnostic(ToDiagnostic(tcp.error()));
      return 1;
    }
    source = std::move(*tcp);
    source_name = std::format("rtt-{}", rtt_port);
  }

  pipeline::RunOptions options;
  options.run_id = pipeline::ResolveRunId(
      cmd.present<std::string>("--run-id"), config.coverage.run_name,
      source_name);
  options.reader = MakeReaderOptions(config);
  if (external_path) {
    options.external =
        pipeline::ExternalArtifact{.path = *external_path, .format = *format};
  } else if (config.external) {
    options.external = pipeline::ExternalArtifact{
        .path = config.external->path,
        .format = config.external->format,
    };
  }

  std::optional<std::chrono::seconds> timeout;
  if (auto seconds = cmd.present<int>("--timeout")) {
    if (*seconds <= 0) {
      PrintError("--timeout must be a positive number of seconds");
      return 1;
    }
    timeout = std::chrono::seconds(*seconds);
  }

  std::expected<schema::CoverageDocument, pipeline::RunError> document;
  {
    StopWatch stop_watch(timeout);
    PhaseTimer timer(logger, "capture", true);
    document = pipeline::RunPipeline(
        *source, *symbols, decode::ReferenceWireDecoder{}, options,
        stop_watch.Token());
  }
  if (!document) {
    PrintDiagnostic(ToDiagnostic(document.error()));
    return 1;
  }

  fs::path output = cmd.present<std::string>("--output")
                        .transform([](const std::string& p) {
                          return fs::path(p);
                        })
                        .value_or(DocumentPath(config, options.run_id));

  PhaseTimer timer(logger, "write");
  return StoreDocument(*document, output, config) ? 0 : 1;
}

auto MatrixCommand(
    const argparse::ArgumentParser& cmd, const config::RunnerConfig& config,
    VerboseLogger& logger) -> int {
  auto captures = cmd.present<std::vector<std::string>>("captures")
                      .value_or(std::vector<std::string>{});
  if (captures.empty()) {
    PrintError("no capture files");
    return 1;
  }

  auto symbols = LoadSymbols(cmd, logger);
  if (!symbols) {
    return 1;
  }

  std::vector<pipeline::MatrixEntry> entries;
  entries.reserve(captures.size());
  for (const auto& capture : captures) {
    auto file = stream::FileByteSource::Open(capture);
    if (!file) {
      PrintDiagnostic(ToDiagnostic(file.error()));
      return 1;
    }
    entries.push_back(
        pipeline::MatrixEntry{
            .source = std::move(*file),
            .options =
                pipeline::RunOptions{
                    .run_id = pipeline::GenerateRunId(
                        fs::path(capture).stem().string()),
                    .reader = MakeReaderOptions(config),
                    .external = std::nullopt,
                },
        });
  }

  std::vector<std::expected<schema::CoverageDocument, pipeline::RunError>>
      results;
  {
    StopWatch stop_watch(std::nullopt);
    PhaseTimer timer(logger, "capture", true);
    results = pipeline::RunMatrix(
        std::move(entries), *symbols, decode::ReferenceWireDecoder{},
        stop_watch.Token());
  }

  PhaseTimer timer(logger, "write");
  int exit_code = 0;
  for (const auto& result : results) {
    if (!result) {
      PrintDiagnostic(ToDiagnostic(result.error()));
      exit_code = 1;
      continue;
    }
    if (!StoreDocument(*result, DocumentPath(config, result->run_id), config)) {
      exit_code = 1;
    }
  }
  return exit_code;
}

auto CollectCommand(
    const argparse::ArgumentParser& cmd, const config::RunnerConfig& config,
    VerboseLogger& logger) -> int {
  PhaseTimer timer(logger, "collect");

  fs::path manifest = collect::ManifestPath(config.coverage.output_dir);
  std::vector<fs::path> inputs;
  bool from_manifest = false;

  auto explicit_inputs =
      cmd.present<std::vector<std::string>>("documents")
          .value_or(std::vector<std::string>{});
  if (!explicit_inputs.empty()) {
    inputs.assign(explicit_inputs.begin(), explicit_inputs.end());
  } else {
    auto listed = collect::ReadManifest(manifest);
    if (!listed) {
      PrintDiagnostic(listed.error());
      return 1;
    }
    inputs = std::move(*listed);
    from_manifest = true;
  }

  std::vector<schema::CoverageDocument> documents;
  std::vector<fs::path> document_paths;
  for (const auto& path : inputs) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      spdlog::error("missing coverage file '{}'", path.string());
      continue;
    }
    auto document = schema::ReadCoverageDocument(path);
    if (!document) {
      PrintDiagnostic(document.error());
      return 1;
    }
    documents.push_back(std::move(*document));
    document_paths.push_back(path);
  }

  if (documents.empty()) {
    spdlog::info("no coverage to collect");
    return 0;
  }

  auto aggregate = collect::Merge(documents);
  if (!aggregate) {
    PrintDiagnostic(
        ToDiagnostic(
            aggregate.error(), document_paths[aggregate.error().input_index]));
    return 1;
  }

  fs::path output = cmd.get<std::string>("--output");
  auto written =
      schema::WriteDocumentFile(output, schema::DumpDocument(*aggregate));
  if (!written) {
    PrintDiagnostic(written.error());
    return 1;
  }
  std::cout << std::format(
      "collected {} document(s) into {}\n", documents.size(), output.string());

  // Only documents created after this collect are picked up next time.
  if (from_manifest) {
    auto removed = collect::RemoveManifest(manifest);
    if (!removed) {
      PrintDiagnostic(removed.error());
      return 1;
    }
  }
  return 0;
}

}  // namespace emrun::driver
