#include "emrun/decode/frame_decoder.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "emrun/decode/log_record.hpp"
#include "emrun/decode/symbol_table.hpp"
#include "emrun/decode/wire_decoder.hpp"
#include "emrun/stream/frame_reader.hpp"

namespace emrun::decode {

namespace {

auto SplitWords(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> words;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) {
      ++i;
    }
    size_t start = i;
    while (i < text.size() && text[i] != ' ' && text[i] != '\t') {
      ++i;
    }
    if (i > start) {
      words.push_back(text.substr(start, i - start));
    }
  }
  return words;
}

}  // namespace

auto ToString(DecodeErrorKind kind) -> std::string_view {
  switch (kind) {
    case DecodeErrorKind::kMalformed:
      return "malformed";
    case DecodeErrorKind::kUnknownSymbol:
      return "unknown symbol";
    case DecodeErrorKind::kVersionMismatch:
      return "version mismatch";
  }
  return "malformed";
}

auto ToHex(std::span<const uint8_t> bytes) -> std::string {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[(b >> 4) & 0x0F]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

auto RenderFields(std::string_view format, const std::vector<std::string>& args)
    -> std::vector<LogField> {
  std::vector<LogField> fields;
  size_t next_arg = 0;

  auto take_arg = [&]() -> std::string {
    if (next_arg < args.size()) {
      return args[next_arg++];
    }
    ++next_arg;
    return {};
  };

  for (std::string_view word : SplitWords(format)) {
    if (word == "{}") {
      size_t index = next_arg;
      fields.push_back(
          LogField{.key = std::format("arg{}", index), .value = take_arg()});
      continue;
    }

    size_t eq = word.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      fields.push_back(LogField{.key = std::string(word), .value = {}});
      continue;
    }

    std::string key(word.substr(0, eq));
    std::string_view rhs = word.substr(eq + 1);
    if (rhs == "{}") {
      fields.push_back(LogField{.key = std::move(key), .value = take_arg()});
    } else {
      fields.push_back(
          LogField{.key = std::move(key), .value = std::string(rhs)});
    }
  }

  for (; next_arg < args.size(); ++next_arg) {
    fields.push_back(
        LogField{
            .key = std::format("arg{}", next_arg),
            .value = args[next_arg],
        });
  }
  return fields;
}

auto FrameDecoder::Decode(
    const stream::FrameCandidate& frame, const SymbolTable& table)
    -> std::expected<LogRecord, DecodeError> {
  auto raw = wire_.Decode(frame.payload);
  if (!raw) {
    DecodeErrorKind kind = raw.error().kind == WireErrorKind::kBadVersion
                               ? DecodeErrorKind::kVersionMismatch
                               : DecodeErrorKind::kMalformed;
    return std::unexpected(
        DecodeError{
            .kind = kind,
            .detail = std::format(
                "frame at offset {}: {}", frame.stream_offset,
                raw.error().detail),
            .fallback = std::nullopt,
        });
  }

  const SymbolEntry* entry = table.Lookup(raw->address);
  if (entry == nullptr) {
    LogRecord fallback{
        .sequence_number = next_sequence_++,
        .timestamp = raw->timestamp,
        .level = raw->level.value_or(Level::kInfo),
        .location = std::nullopt,
        .fields =
            {
                LogField{
                    .key = "address",
                    .value = std::format("0x{:08x}", raw->address),
                },
                LogField{.key = "raw", .value = ToHex(frame.payload)},
            },
    };
    return std::unexpected(
        DecodeError{
            .kind = DecodeErrorKind::kUnknownSymbol,
            .detail = std::format(
                "address 0x{:08x} not in symbol table", raw->address),
            .fallback = std::move(fallback),
        });
  }

  return LogRecord{
      .sequence_number = next_sequence_++,
      .timestamp = raw->timestamp,
      .level = raw->level.value_or(entry->level),
      .location = entry->location,
      .fields = RenderFields(entry->format, raw->args),
  };
}

}  // namespace emrun::decode
