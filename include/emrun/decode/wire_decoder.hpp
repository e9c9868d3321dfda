#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "emrun/decode/log_record.hpp"

namespace emrun::decode {

inline constexpr uint8_t kEncodingVersion = 1;

// Frame body as the wire primitive sees it, before symbol resolution.
struct RawFrame {
  uint8_t version = kEncodingVersion;
  uint32_t address = 0;
  std::optional<std::chrono::microseconds> timestamp;
  std::optional<Level> level;
  std::vector<std::string> args;
};

enum class WireErrorKind : uint8_t {
  kTruncated,    // payload ends before a declared field
  kInvalid,      // field value out of range, trailing bytes
  kBadVersion,   // encoding version this decoder does not speak
};

struct WireError {
  WireErrorKind kind;
  std::string detail;
};

// The wire-format-aware decode primitive. Implementations are stateless; the
// adapter in frame_decoder.hpp owns sequencing and symbol lookup.
class WireDecoder {
 public:
  virtual ~WireDecoder() = default;

  [[nodiscard]] virtual auto Decode(std::span<const uint8_t> payload) const
      -> std::expected<RawFrame, WireError> = 0;
};

// Layout (little-endian):
//   u8 version, u32 address, u8 flags (bit0 timestamp, bit1 level),
//   [u64 timestamp_us], [u8 level], u8 argc, argc x (u16 len, bytes)
class ReferenceWireDecoder final : public WireDecoder {
 public:
  [[nodiscard]] auto Decode(std::span<const uint8_t> payload) const
      -> std::expected<RawFrame, WireError> override;
};

// Inverse of ReferenceWireDecoder::Decode; firmware-side encoding for
// emulators and tests.
auto EncodeRawFrame(const RawFrame& frame) -> std::vector<uint8_t>;

}  // namespace emrun::decode
