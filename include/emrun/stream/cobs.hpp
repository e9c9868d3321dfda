#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace emrun::stream {

// Wire framing: COBS(payload || crc16_be(payload)) followed by a single 0x00
// delimiter. 0x00 never appears inside an encoded frame.
inline constexpr uint8_t kFrameDelimiter = 0x00;
inline constexpr size_t kCrcSize = 2;

// CRC-16/CCITT: polynomial 0x1021, init 0x0000, no reflection, no final xor.
auto Crc16Ccitt(std::span<const uint8_t> data) -> uint16_t;

// Consistent Overhead Byte Stuffing. The encoded form carries no delimiter.
auto CobsEncode(std::span<const uint8_t> data) -> std::vector<uint8_t>;

// Returns nullopt if a code byte is zero or points past the end of input.
auto CobsDecode(std::span<const uint8_t> encoded)
    -> std::optional<std::vector<uint8_t>>;

// Full on-wire frame for payload, including CRC and trailing delimiter.
auto EncodeFrame(std::span<const uint8_t> payload) -> std::vector<uint8_t>;

}  // namespace emrun::stream
