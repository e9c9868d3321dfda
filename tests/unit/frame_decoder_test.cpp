#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "common/frame_builder.hpp"
#include "emrun/decode/frame_decoder.hpp"
#include "emrun/decode/log_record.hpp"
#include "emrun/decode/symbol_table.hpp"
#include "emrun/decode/wire_decoder.hpp"
#include "emrun/stream/byte_source.hpp"
#include "emrun/stream/frame_reader.hpp"

namespace emrun::decode {
namespace {

using Bytes = std::vector<uint8_t>;

auto Candidate(Bytes payload) -> stream::FrameCandidate {
  return stream::FrameCandidate{
      .payload = std::move(payload),
      .stream_offset = 0,
  };
}

class FrameDecoderTest : public ::testing::Test {
 protected:
  SymbolTable symbols_ = test::FirmwareSymbols();
  ReferenceWireDecoder wire_;
  FrameDecoder decoder_{wire_};
};

TEST_F(FrameDecoderTest, ResolvesStatementIntoFields) {
  auto record = decoder_.Decode(
      Candidate(test::Payload(test::kPlainAddr, {"21"})), symbols_);
  ASSERT_TRUE(record.has_value());

  EXPECT_EQ(record->sequence_number, 0);
  EXPECT_EQ(record->level, Level::kInfo);
  ASSERT_TRUE(record->location.has_value());
  EXPECT_EQ(record->location->file, "src/sensor.rs");
  ASSERT_EQ(record->fields.size(), 2);
  EXPECT_EQ(record->fields[0], (LogField{.key = "temperature", .value = "21"}));
  EXPECT_EQ(record->fields[1], (LogField{.key = "unit", .value = "C"}));
}

TEST_F(FrameDecoderTest, CarriesTimestampAndLevelFromFrame) {
  RawFrame raw{
      .version = kEncodingVersion,
      .address = test::kPlainAddr,
      .timestamp = std::chrono::microseconds(1500),
      .level = Level::kError,
      .args = {"99"},
  };
  auto record = decoder_.Decode(Candidate(EncodeRawFrame(raw)), symbols_);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->timestamp, std::chrono::microseconds(1500));
  EXPECT_EQ(record->level, Level::kError);
}

TEST_F(FrameDecoderTest, SequenceNumbersCountFramesFromZero) {
  auto bytes = test::StreamBuilder()
                   .Add(test::StartFrame("boot"))
                   .Add(test::CoverFrame("REQ-1"))
                   .Add(test::Frame(test::kPlainAddr, {"20"}))
                   .Add(test::EndFrame("boot", "passed"))
                   .Bytes();
  stream::MemoryByteSource source(bytes);
  stream::FrameReader reader(source, {});

  std::vector<uint64_t> sequence;
  while (true) {
    auto event = reader.Next();
    ASSERT_TRUE(event.has_value());
    if (!*event) {
      break;
    }
    auto record = decoder_.Decode(
        std::get<stream::FrameCandidate>(**event), symbols_);
    ASSERT_TRUE(record.has_value());
    sequence.push_back(record->sequence_number);
  }
  EXPECT_EQ(sequence, (std::vector<uint64_t>{0, 1, 2, 3}));
  EXPECT_EQ(decoder_.NextSequence(), 4);
}

TEST_F(FrameDecoderTest, UnknownSymbolKeepsRawPayloadAndConsumesSequence) {
  auto payload = test::Payload(0xDEAD, {"x"});
  auto result = decoder_.Decode(Candidate(payload), symbols_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DecodeErrorKind::kUnknownSymbol);
  EXPECT_FALSE(result.error().IsFatal());

  ASSERT_TRUE(result.error().fallback.has_value());
  const LogRecord& fallback = *result.error().fallback;
  EXPECT_EQ(fallback.sequence_number, 0);
  EXPECT_FALSE(fallback.location.has_value());
  ASSERT_NE(fallback.Find("address"), nullptr);
  EXPECT_EQ(*fallback.Find("address"), "0x0000dead");
  ASSERT_NE(fallback.Find("raw"), nullptr);
  EXPECT_EQ(*fallback.Find("raw"), ToHex(payload));

  auto next = decoder_.Decode(
      Candidate(test::Payload(test::kPlainAddr, {"1"})), symbols_);
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->sequence_number, 1);
}

TEST_F(FrameDecoderTest, TruncatedPayloadIsMalformed) {
  auto payload = test::Payload(test::kPlainAddr, {"21"});
  payload.resize(payload.size() - 1);
  auto result = decoder_.Decode(Candidate(payload), symbols_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DecodeErrorKind::kMalformed);
  EXPECT_FALSE(result.error().fallback.has_value());
  EXPECT_EQ(decoder_.NextSequence(), 0);
}

TEST_F(FrameDecoderTest, OtherEncodingVersionIsFatal) {
  auto payload = test::Payload(test::kPlainAddr, {"21"});
  payload[0] = kEncodingVersion + 1;
  auto result = decoder_.Decode(Candidate(payload), symbols_);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DecodeErrorKind::kVersionMismatch);
  EXPECT_TRUE(result.error().IsFatal());
}

TEST(RenderFieldsTest, BindsPlaceholdersInOrder) {
  auto fields = RenderFields(
      "test.end test_name={} result={} reason={}",
      {"adc_reads", "failed", "timeout"});
  ASSERT_EQ(fields.size(), 4);
  EXPECT_EQ(fields[0], (LogField{.key = "test.end", .value = ""}));
  EXPECT_EQ(fields[1], (LogField{.key = "test_name", .value = "adc_reads"}));
  EXPECT_EQ(fields[2], (LogField{.key = "result", .value = "failed"}));
  EXPECT_EQ(fields[3], (LogField{.key = "reason", .value = "timeout"}));
}

TEST(RenderFieldsTest, BarePlaceholdersAndSurplusArgsBecomeArgN) {
  auto fields = RenderFields("value {}", {"1", "2"});
  ASSERT_EQ(fields.size(), 3);
  EXPECT_EQ(fields[0], (LogField{.key = "value", .value = ""}));
  EXPECT_EQ(fields[1], (LogField{.key = "arg0", .value = "1"}));
  EXPECT_EQ(fields[2], (LogField{.key = "arg1", .value = "2"}));
}

TEST(RenderFieldsTest, MissingArgumentsRenderEmpty) {
  auto fields = RenderFields("req.cover requirement_id={}", {});
  ASSERT_EQ(fields.size(), 2);
  EXPECT_EQ(fields[1], (LogField{.key = "requirement_id", .value = ""}));
}

}  // namespace
}  // namespace emrun::decode
