#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "emrun/decode/log_record.hpp"
#include "emrun/decode/symbol_table.hpp"
#include "emrun/decode/wire_decoder.hpp"
#include "emrun/stream/frame_reader.hpp"

namespace emrun::decode {

enum class DecodeErrorKind : uint8_t {
  kMalformed,        // skip the frame, keep going
  kUnknownSymbol,    // keep going; fallback record carries the raw payload
  kVersionMismatch,  // abort the run, later frames cannot be trusted
};

auto ToString(DecodeErrorKind kind) -> std::string_view;

struct DecodeError {
  DecodeErrorKind kind;
  std::string detail;
  // Set only for kUnknownSymbol: a record without location whose fields
  // hold the address and the payload as hex.
  std::optional<LogRecord> fallback;

  [[nodiscard]] auto IsFatal() const -> bool {
    return kind == DecodeErrorKind::kVersionMismatch;
  }
};

// Adapts the wire primitive to LogRecords. Owns the run's sequence counter:
// numbers start at 0 and advance by one for every record handed out
// (including unknown-symbol fallbacks), whatever the frame itself encodes.
class FrameDecoder {
 public:
  explicit FrameDecoder(const WireDecoder& wire) : wire_(wire) {
  }

  auto Decode(const stream::FrameCandidate& frame, const SymbolTable& table)
      -> std::expected<LogRecord, DecodeError>;

  [[nodiscard]] auto NextSequence() const -> uint64_t {
    return next_sequence_;
  }

 private:
  const WireDecoder& wire_;
  uint64_t next_sequence_ = 0;
};

// Turns a format string and its arguments into ordered fields.
// "key={}" binds the next argument, "key=text" is literal, a bare "{}"
// becomes argN, any other word becomes a key with an empty value.
// Arguments left over become argN fields.
auto RenderFields(std::string_view format, const std::vector<std::string>& args)
    -> std::vector<LogField>;

auto ToHex(std::span<const uint8_t> bytes) -> std::string;

}  // namespace emrun::decode
