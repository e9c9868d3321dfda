#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "emrun/coverage/run_model.hpp"
#include "emrun/decode/log_record.hpp"
#include "emrun/schema/document.hpp"
#include "emrun/schema/json_codec.hpp"

namespace emrun::schema {
namespace {

auto SampleDocument() -> CoverageDocument {
  CoverageDocument doc;
  doc.run_id = "board-a-20260101T000000Z-0000beef";
  doc.outcomes = {
      coverage::TestOutcome{
          .test_name = "adc_reads",
          .result = coverage::Failed{.reason = "timeout"},
          .duration = std::chrono::microseconds(420),
      },
      coverage::TestOutcome{
          .test_name = "boot",
          .result = coverage::Passed{},
          .duration = std::nullopt,
      },
  };
  doc.evidence = {
      coverage::RequirementEvidence{
          .requirement_id = "sensor::REQ-1",
          .test_name = "adc_reads",
          .location = decode::SourceLocation{.file = "src/lib.rs", .line = 42},
          .sequence_number = 3,
      },
  };
  doc.external_meta = coverage::OpaquePayload{
      .format = "lcov",
      .origin = "lcov.info",
      .content = "SF:a.rs\nend_of_record\n",
  };
  doc.stream_stats = coverage::StreamStats{
      .records = 10,
      .frames_lost = 1,
      .bytes_lost = 17,
      .malformed = 0,
      .unknown_symbols = 2,
  };
  return doc;
}

TEST(JsonCodecTest, FixedKeyOrderAndTrailingNewline) {
  auto text = DumpDocument(SampleDocument());
  ASSERT_FALSE(text.empty());
  EXPECT_EQ(text.back(), '\n');

  auto version = text.find("\"schema_version\"");
  auto run_id = text.find("\"run_id\"");
  auto outcomes = text.find("\"outcomes\"");
  auto evidence = text.find("\"evidence\"");
  auto meta = text.find("\"external_meta\"");
  auto stats = text.find("\"stream_stats\"");
  EXPECT_LT(version, run_id);
  EXPECT_LT(run_id, outcomes);
  EXPECT_LT(outcomes, evidence);
  EXPECT_LT(evidence, meta);
  EXPECT_LT(meta, stats);
}

TEST(JsonCodecTest, OptionalFieldsOnlyWhenKnown) {
  auto j = nlohmann::json::parse(DumpDocument(SampleDocument()));
  const auto& failed = j["outcomes"][0];
  EXPECT_EQ(failed["result"], "failed");
  EXPECT_EQ(failed["reason"], "timeout");
  EXPECT_EQ(failed["duration_us"], 420);

  const auto& passed = j["outcomes"][1];
  EXPECT_EQ(passed["result"], "passed");
  EXPECT_FALSE(passed.contains("reason"));
  EXPECT_FALSE(passed.contains("duration_us"));

  EXPECT_EQ(j["evidence"][0]["location"]["line"], 42);

  CoverageDocument bare;
  bare.run_id = "r";
  auto k = nlohmann::json::parse(DumpDocument(bare));
  EXPECT_FALSE(k.contains("external_meta"));
  EXPECT_TRUE(k["outcomes"].is_array());
}

TEST(JsonCodecTest, ParsesWhatItWrites) {
  auto doc = SampleDocument();
  auto parsed = ParseCoverageDocument(DumpDocument(doc));
  ASSERT_TRUE(parsed.has_value()) << parsed.error().primary.message;
  EXPECT_EQ(*parsed, doc);
}

TEST(JsonCodecTest, InvalidUtf8IsReplaced) {
  CoverageDocument doc;
  doc.run_id = "r";
  doc.external_meta = coverage::OpaquePayload{
      .format = "json", .origin = "x", .content = std::string("\xff\xfe")};
  auto text = DumpDocument(doc);
  EXPECT_TRUE(nlohmann::json::accept(text));
}

TEST(JsonCodecTest, RejectsDocumentsWithoutVersion) {
  EXPECT_FALSE(ParseCoverageDocument(R"({"run_id": "r"})"));
  EXPECT_FALSE(ParseCoverageDocument(R"({"schema_version": "1"})"));
  EXPECT_FALSE(ParseCoverageDocument("[]"));
  EXPECT_FALSE(ParseCoverageDocument("not json"));
}

TEST(JsonCodecTest, RejectsMalformedFields) {
  EXPECT_FALSE(ParseCoverageDocument(
      R"({"schema_version": 1, "run_id": "r",
          "outcomes": [{"test_name": "t", "result": "maybe"}]})"));
  EXPECT_FALSE(ParseCoverageDocument(
      R"({"schema_version": 1, "run_id": "r",
          "evidence": [{"requirement_id": "R1"}]})"));
  EXPECT_FALSE(ParseCoverageDocument(
      R"({"schema_version": 1, "run_id": "r", "outcomes": {}})"));
}

TEST(JsonCodecTest, OtherSchemaVersionKeepsOnlyIdentity) {
  auto parsed = ParseCoverageDocument(
      R"({"schema_version": 7, "run_id": "future",
          "outcomes": "a layout we do not know"})");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->schema_version, 7);
  EXPECT_EQ(parsed->run_id, "future");
  EXPECT_TRUE(parsed->outcomes.empty());
}

TEST(JsonCodecTest, AggregateParsesWhatItWrites) {
  AggregateDocument aggregate;
  aggregate.runs.push_back(
      AggregateRun{
          .run_id = "r1",
          .outcomes = SampleDocument().outcomes,
          .evidence = SampleDocument().evidence,
          .stream_stats = SampleDocument().stream_stats,
      });
  aggregate.external_meta.push_back(
      RunPayload{.run_id = "r1", .payload = *SampleDocument().external_meta});

  auto text = DumpDocument(aggregate);
  auto parsed = ParseAggregateDocument(text);
  ASSERT_TRUE(parsed.has_value()) << parsed.error().primary.message;
  EXPECT_EQ(*parsed, aggregate);

  auto j = nlohmann::json::parse(text);
  EXPECT_EQ(j["external_meta"][0]["run_id"], "r1");
  EXPECT_EQ(j["external_meta"][0]["format"], "lcov");
}

TEST(JsonCodecTest, WriteThenReadFile) {
  auto path = std::filesystem::temp_directory_path() / "emrun_codec" /
              "nested" / "doc.json";
  std::filesystem::remove_all(path.parent_path().parent_path());

  auto doc = SampleDocument();
  auto written = WriteDocumentFile(path, DumpDocument(doc));
  ASSERT_TRUE(written.has_value()) << written.error().primary.message;
  EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

  auto read = ReadCoverageDocument(path);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, doc);

  std::filesystem::remove_all(path.parent_path().parent_path());
}

TEST(JsonCodecTest, ReadingMissingFileIsHostError) {
  auto read = ReadCoverageDocument("/nonexistent/emrun/doc.json");
  ASSERT_FALSE(read.has_value());
  EXPECT_EQ(read.error().primary.kind, DiagKind::kHostError);
}

}  // namespace
}  // namespace emrun::schema
