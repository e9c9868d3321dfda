#include "emrun/stream/cobs.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace emrun::stream {

auto Crc16Ccitt(std::span<const uint8_t> data) -> uint16_t {
  uint16_t crc = 0x0000;
  for (uint8_t byte : data) {
    crc ^= static_cast<uint16_t>(byte) << 8;
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc & 0x8000) != 0 ? static_cast<uint16_t>((crc << 1) ^ 0x1021)
                                : static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

auto CobsEncode(std::span<const uint8_t> data) -> std::vector<uint8_t> {
  std::vector<uint8_t> out;
  out.reserve(data.size() + (data.size() / 254) + 1);

  size_t code_idx = 0;
  out.push_back(0);  // placeholder for the first code byte
  uint8_t code = 1;

  for (uint8_t byte : data) {
    if (byte != 0x00) {
      out.push_back(byte);
      if (++code == 0xFF) {
        out[code_idx] = code;
        code_idx = out.size();
        out.push_back(0);
        code = 1;
      }
    } else {
      out[code_idx] = code;
      code_idx = out.size();
      out.push_back(0);
      code = 1;
    }
  }
  out[code_idx] = code;
  return out;
}

auto CobsDecode(std::span<const uint8_t> encoded)
    -> std::optional<std::vector<uint8_t>> {
  std::vector<uint8_t> out;
  out.reserve(encoded.size());

  size_t i = 0;
  while (i < encoded.size()) {
    uint8_t code = encoded[i++];
    if (code == 0x00) {
      return std::nullopt;
    }
    for (uint8_t j = 1; j < code; ++j) {
      if (i >= encoded.size() || encoded[i] == 0x00) {
        return std::nullopt;
      }
      out.push_back(encoded[i++]);
    }
    // A maximal block (0xFF) carries no implied zero; neither does the last.
    if (code < 0xFF && i < encoded.size()) {
      out.push_back(0x00);
    }
  }
  return out;
}

auto EncodeFrame(std::span<const uint8_t> payload) -> std::vector<uint8_t> {
  std::vector<uint8_t> raw(payload.begin(), payload.end());
  uint16_t crc = Crc16Ccitt(payload);
  raw.push_back(static_cast<uint8_t>(crc >> 8));
  raw.push_back(static_cast<uint8_t>(crc & 0xFF));

  auto frame = CobsEncode(raw);
  frame.push_back(kFrameDelimiter);
  return frame;
}

}  // namespace emrun::stream
