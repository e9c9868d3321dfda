#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "emrun/decode/log_record.hpp"
#include "emrun/decode/symbol_table.hpp"
#include "emrun/decode/wire_decoder.hpp"
#include "emrun/stream/cobs.hpp"

namespace emrun::test {

// Addresses of the statements in FirmwareSymbols().
inline constexpr uint32_t kTestStartAddr = 0x100;
inline constexpr uint32_t kTestEndAddr = 0x104;
inline constexpr uint32_t kReqCoverAddr = 0x108;
inline constexpr uint32_t kTraceRootAddr = 0x10c;
inline constexpr uint32_t kPlainAddr = 0x110;

// The statements a test harness on the target would intern.
inline auto FirmwareSymbols() -> decode::SymbolTable {
  std::vector<decode::SymbolEntry> entries = {
      {.address = kTestStartAddr,
       .location = decode::SourceLocation{.file = "src/harness.rs", .line = 10},
       .format = "test.start test_name={}",
       .level = decode::Level::kInfo},
      {.address = kTestEndAddr,
       .location = decode::SourceLocation{.file = "src/harness.rs", .line = 20},
       .format = "test.end test_name={} result={} reason={}",
       .level = decode::Level::kInfo},
      {.address = kReqCoverAddr,
       .location = decode::SourceLocation{.file = "src/lib.rs", .line = 42},
       .format = "req.cover requirement_id={}",
       .level = decode::Level::kDebug},
      {.address = kTraceRootAddr,
       .location = std::nullopt,
       .format = "trace.root path={}",
       .level = decode::Level::kDebug},
      {.address = kPlainAddr,
       .location = decode::SourceLocation{.file = "src/sensor.rs", .line = 7},
       .format = "temperature={} unit=C",
       .level = decode::Level::kInfo},
  };
  return *decode::SymbolTable::FromEntries(std::move(entries));
}

// Wire payload for one statement, without framing.
inline auto Payload(
    uint32_t address, std::vector<std::string> args,
    std::optional<std::chrono::microseconds> timestamp = std::nullopt)
    -> std::vector<uint8_t> {
  return decode::EncodeRawFrame(
      decode::RawFrame{
          .version = decode::kEncodingVersion,
          .address = address,
          .timestamp = timestamp,
          .level = std::nullopt,
          .args = std::move(args),
      });
}

// Fully framed statement, ready to append to a byte stream.
inline auto Frame(
    uint32_t address, std::vector<std::string> args,
    std::optional<std::chrono::microseconds> timestamp = std::nullopt)
    -> std::vector<uint8_t> {
  return stream::EncodeFrame(Payload(address, std::move(args), timestamp));
}

inline auto StartFrame(
    const std::string& test,
    std::optional<std::chrono::microseconds> ts = std::nullopt)
    -> std::vector<uint8_t> {
  return Frame(kTestStartAddr, {test}, ts);
}

inline auto EndFrame(
    const std::string& test, const std::string& result,
    const std::string& reason = {},
    std::optional<std::chrono::microseconds> ts = std::nullopt)
    -> std::vector<uint8_t> {
  return Frame(kTestEndAddr, {test, result, reason}, ts);
}

inline auto CoverFrame(const std::string& requirement)
    -> std::vector<uint8_t> {
  return Frame(kReqCoverAddr, {requirement});
}

// Appends every frame into one stream.
class StreamBuilder {
 public:
  auto Add(const std::vector<uint8_t>& bytes) -> StreamBuilder& {
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
    return *this;
  }

  auto Bytes() const -> const std::vector<uint8_t>& {
    return bytes_;
  }

 private:
  std::vector<uint8_t> bytes_;
};

// Record as the decoder would produce it, for extractor-level tests.
inline auto Record(uint64_t seq, std::vector<decode::LogField> fields)
    -> decode::LogRecord {
  return decode::LogRecord{
      .sequence_number = seq,
      .timestamp = std::nullopt,
      .level = decode::Level::kInfo,
      .location = std::nullopt,
      .fields = std::move(fields),
  };
}

}  // namespace emrun::test
