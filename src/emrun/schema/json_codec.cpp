#include "emrun/schema/json_codec.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "emrun/common/diagnostic.hpp"
#include "emrun/coverage/record_kind.hpp"
#include "emrun/coverage/run_model.hpp"
#include "emrun/decode/log_record.hpp"
#include "emrun/schema/document.hpp"

namespace emrun::schema {

namespace {

using Json = nlohmann::ordered_json;

auto ToJson(const coverage::TestOutcome& outcome) -> Json {
  Json j;
  j["test_name"] = outcome.test_name;
  j["result"] = std::string(coverage::ResultName(outcome.result));
  if (const auto* failed = std::get_if<coverage::Failed>(&outcome.result)) {
    j["reason"] = failed->reason;
  }
  if (outcome.duration) {
    j["duration_us"] = outcome.duration->count();
  }
  return j;
}

auto ToJson(const coverage::RequirementEvidence& evidence) -> Json {
  Json j;
  j["sequence_number"] = evidence.sequence_number;
  j["requirement_id"] = evidence.requirement_id;
  j["test_name"] = evidence.test_name;
  if (evidence.location) {
    j["location"] = Json{
        {"file", evidence.location->file},
        {"line", evidence.location->line},
    };
  }
  return j;
}

auto ToJson(const coverage::OpaquePayload& payload) -> Json {
  Json j;
  j["format"] = payload.format;
  j["origin"] = payload.origin;
  j["content"] = payload.content;
  return j;
}

auto ToJson(const coverage::StreamStats& stats) -> Json {
  Json j;
  j["records"] = stats.records;
  j["frames_lost"] = stats.frames_lost;
  j["bytes_lost"] = stats.bytes_lost;
  j["malformed"] = stats.malformed;
  j["unknown_symbols"] = stats.unknown_symbols;
  return j;
}

template <typename T>
auto ToJsonArray(const std::vector<T>& items) -> Json {
  Json array = Json::array();
  for (const auto& item : items) {
    array.push_back(ToJson(item));
  }
  return array;
}

auto Render(const Json& j) -> std::string {
  return j.dump(2, ' ', false, Json::error_handler_t::replace) + "\n";
}

// Field readers throw nlohmann::json exceptions on type errors; the public
// entry points turn those into diagnostics.
auto RequireField(const Json& j, std::string_view key, std::string_view where)
    -> const Json& {
  auto it = j.find(std::string(key));
  if (it == j.end()) {
    throw std::invalid_argument(
        std::format("{}: missing field '{}'", where, key));
  }
  return *it;
}

auto OutcomeFromJson(const Json& j) -> coverage::TestOutcome {
  coverage::TestOutcome outcome;
  outcome.test_name =
      RequireField(j, "test_name", "outcome").get<std::string>();
  auto result_name = RequireField(j, "result", "outcome").get<std::string>();
  auto result =
      coverage::ParseTestResult(result_name, j.value("reason", std::string{}));
  if (!result) {
    throw std::invalid_argument(
        std::format(
            "outcome '{}': unknown result '{}'", outcome.test_name,
            result_name));
  }
  outcome.result = std::move(*result);
  if (j.contains("duration_us")) {
    outcome.duration =
        std::chrono::microseconds(j["duration_us"].get<int64_t>());
  }
  return outcome;
}

auto EvidenceFromJson(const Json& j) -> coverage::RequirementEvidence {
  coverage::RequirementEvidence evidence;
  evidence.sequence_number =
      RequireField(j, "sequence_number", "evidence").get<uint64_t>();
  evidence.requirement_id =
      RequireField(j, "requirement_id", "evidence").get<std::string>();
  evidence.test_name =
      RequireField(j, "test_name", "evidence").get<std::string>();
  if (j.contains("location")) {
    const auto& loc = j["location"];
    evidence.location = decode::SourceLocation{
        .file = RequireField(loc, "file", "evidence location")
                    .get<std::string>(),
        .line = loc.value("line", uint32_t{0}),
    };
  }
  return evidence;
}

auto PayloadFromJson(const Json& j) -> coverage::OpaquePayload {
  return coverage::OpaquePayload{
      .format = RequireField(j, "format", "external_meta").get<std::string>(),
      .origin = RequireField(j, "origin", "external_meta").get<std::string>(),
      .content =
          RequireField(j, "content", "external_meta").get<std::string>(),
  };
}

auto StatsFromJson(const Json& j) -> coverage::StreamStats {
  return coverage::StreamStats{
      .records = j.value("records", uint64_t{0}),
      .frames_lost = j.value("frames_lost", uint64_t{0}),
      .bytes_lost = j.value("bytes_lost", uint64_t{0}),
      .malformed = j.value("malformed", uint64_t{0}),
      .unknown_symbols = j.value("unknown_symbols", uint64_t{0}),
  };
}

template <typename T, typename F>
auto ArrayFromJson(const Json& j, std::string_view key, F&& convert)
    -> std::vector<T> {
  std::vector<T> items;
  auto it = j.find(std::string(key));
  if (it == j.end()) {
    return items;
  }
  if (!it->is_array()) {
    throw std::invalid_argument(std::format("'{}' must be an array", key));
  }
  items.reserve(it->size());
  for (const auto& item : *it) {
    items.push_back(convert(item));
  }
  return items;
}

auto ParseRoot(std::string_view text) -> Result<Json> {
  Json j = Json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    return std::unexpected(Diagnostic::Error("document is not valid JSON"));
  }
  if (!j.is_object()) {
    return std::unexpected(
        Diagnostic::Error("document root must be a JSON object"));
  }
  auto version = j.find("schema_version");
  if (version == j.end() || !version->is_number_integer()) {
    return std::unexpected(
        Diagnostic::Error("document has no numeric 'schema_version'"));
  }
  return j;
}

}  // namespace

auto DumpDocument(const CoverageDocument& doc) -> std::string {
  Json j;
  j["schema_version"] = doc.schema_version;
  j["run_id"] = doc.run_id;
  j["outcomes"] = ToJsonArray(doc.outcomes);
  j["evidence"] = ToJsonArray(doc.evidence);
  if (doc.external_meta) {
    j["external_meta"] = ToJson(*doc.external_meta);
  }
  j["stream_stats"] = ToJson(doc.stream_stats);
  return Render(j);
}

auto DumpDocument(const AggregateDocument& doc) -> std::string {
  Json runs = Json::array();
  for (const auto& run : doc.runs) {
    Json r;
    r["run_id"] = run.run_id;
    r["outcomes"] = ToJsonArray(run.outcomes);
    r["evidence"] = ToJsonArray(run.evidence);
    r["stream_stats"] = ToJson(run.stream_stats);
    runs.push_back(std::move(r));
  }

  Json meta = Json::array();
  for (const auto& entry : doc.external_meta) {
    Json m;
    m["run_id"] = entry.run_id;
    m["format"] = entry.payload.format;
    m["origin"] = entry.payload.origin;
    m["content"] = entry.payload.content;
    meta.push_back(std::move(m));
  }

  Json j;
  j["schema_version"] = doc.schema_version;
  j["runs"] = std::move(runs);
  j["external_meta"] = std::move(meta);
  return Render(j);
}

auto ParseCoverageDocument(std::string_view text) -> Result<CoverageDocument> {
  auto root = ParseRoot(text);
  if (!root) {
    return std::unexpected(std::move(root.error()));
  }
  const Json& j = *root;

  CoverageDocument doc;
  try {
    doc.schema_version = j["schema_version"].get<int>();
    doc.run_id = RequireField(j, "run_id", "document").get<std::string>();
    if (doc.schema_version != kSchemaVersion) {
      return doc;
    }

    doc.outcomes =
        ArrayFromJson<coverage::TestOutcome>(j, "outcomes", OutcomeFromJson);
    doc.evidence = ArrayFromJson<coverage::RequirementEvidence>(
        j, "evidence", EvidenceFromJson);
    if (j.contains("external_meta") && !j["external_meta"].is_null()) {
      doc.external_meta = PayloadFromJson(j["external_meta"]);
    }
    if (j.contains("stream_stats")) {
      doc.stream_stats = StatsFromJson(j["stream_stats"]);
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(
        Diagnostic::Error(std::format("malformed document: {}", e.what())));
  } catch (const std::invalid_argument& e) {
    return std::unexpected(
        Diagnostic::Error(std::format("malformed document: {}", e.what())));
  }
  return doc;
}

auto ParseAggregateDocument(std::string_view text)
    -> Result<AggregateDocument> {
  auto root = ParseRoot(text);
  if (!root) {
    return std::unexpected(std::move(root.error()));
  }
  const Json& j = *root;

  AggregateDocument doc;
  try {
    doc.schema_version = j["schema_version"].get<int>();
    if (doc.schema_version != kSchemaVersion) {
      return std::unexpected(
          Diagnostic::Error(
              std::format(
                  "aggregate document has schema_version {}, expected {}",
                  doc.schema_version, kSchemaVersion)));
    }

    doc.runs = ArrayFromJson<AggregateRun>(j, "runs", [](const Json& r) {
      AggregateRun run;
      run.run_id = RequireField(r, "run_id", "run").get<std::string>();
      run.outcomes =
          ArrayFromJson<coverage::TestOutcome>(r, "outcomes", OutcomeFromJson);
      run.evidence = ArrayFromJson<coverage::RequirementEvidence>(
          r, "evidence", EvidenceFromJson);
      if (r.contains("stream_stats")) {
        run.stream_stats = StatsFromJson(r["stream_stats"]);
      }
      return run;
    });

    doc.external_meta =
        ArrayFromJson<RunPayload>(j, "external_meta", [](const Json& m) {
          return RunPayload{
              .run_id =
                  RequireField(m, "run_id", "external_meta").get<std::string>(),
              .payload = PayloadFromJson(m),
          };
        });
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(
        Diagnostic::Error(
            std::format("malformed aggregate document: {}", e.what())));
  } catch (const std::invalid_argument& e) {
    return std::unexpected(
        Diagnostic::Error(
            std::format("malformed aggregate document: {}", e.what())));
  }
  return doc;
}

auto ReadCoverageDocument(const std::filesystem::path& path)
    -> Result<CoverageDocument> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open coverage document '{}'", path.string())));
  }
  std::ostringstream content;
  content << in.rdbuf();

  auto doc = ParseCoverageDocument(content.str());
  if (!doc) {
    return std::unexpected(
        std::move(doc.error())
            .WithNote(std::format("while reading '{}'", path.string())));
  }
  return doc;
}

auto WriteDocumentFile(const std::filesystem::path& path, std::string_view text)
    -> Result<void> {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "cannot create directory '{}': {}",
                  path.parent_path().string(), ec.message())));
    }
  }

  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format("cannot write '{}'", tmp.string())));
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format("write to '{}' failed", tmp.string())));
    }
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    auto reason = ec.message();
    std::filesystem::remove(tmp, ec);
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot replace '{}': {}", path.string(), reason)));
  }
  return {};
}

}  // namespace emrun::schema
