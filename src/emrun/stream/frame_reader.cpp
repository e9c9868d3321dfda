#include "emrun/stream/frame_reader.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <stop_token>
#include <string_view>
#include <utility>
#include <vector>

#include "emrun/stream/byte_source.hpp"
#include "emrun/stream/cobs.hpp"

namespace emrun::stream {

auto ToString(LossReason reason) -> std::string_view {
  switch (reason) {
    case LossReason::kCorrupt:
      return "corrupt";
    case LossReason::kOversized:
      return "oversized";
    case LossReason::kTruncated:
      return "truncated";
  }
  return "corrupt";
}

FrameReader::FrameReader(
    ByteSource& source, std::stop_token stop, ReaderOptions options)
    : source_(source),
      stop_(std::move(stop)),
      options_(options),
      buffer_(options.read_chunk == 0 ? 1024 : options.read_chunk) {
}

auto FrameReader::Next()
    -> std::expected<std::optional<FrameEvent>, SourceError> {
  while (!done_) {
    while (buffer_pos_ < buffer_len_) {
      uint8_t byte = buffer_[buffer_pos_++];
      uint64_t at = offset_++;

      if (byte == kFrameDelimiter) {
        if (discarding_) {
          FrameLoss loss{
              .reason = LossReason::kOversized,
              .bytes_discarded = discarded_,
              .stream_offset = pending_start_,
          };
          discarding_ = false;
          discarded_ = 0;
          return std::optional<FrameEvent>(loss);
        }
        if (pending_.empty()) {
          // Consecutive delimiters are idle fill.
          continue;
        }
        return CloseFrame();
      }

      if (discarding_) {
        ++discarded_;
        continue;
      }
      if (pending_.empty()) {
        pending_start_ = at;
      }
      pending_.push_back(byte);
      if (pending_.size() > options_.max_frame_len) {
        discarding_ = true;
        discarded_ = pending_.size();
        pending_.clear();
      }
    }

    if (source_ended_ || stop_.stop_requested()) {
      done_ = true;
      return FlushAtEnd();
    }

    auto chunk = source_.Read(std::span<uint8_t>(buffer_));
    if (!chunk) {
      return std::unexpected(std::move(chunk.error()));
    }
    buffer_pos_ = 0;
    buffer_len_ = chunk->count;
    if (chunk->end_of_stream) {
      source_ended_ = true;
    }
  }
  return std::nullopt;
}

auto FrameReader::CloseFrame() -> std::optional<FrameEvent> {
  std::vector<uint8_t> encoded = std::move(pending_);
  pending_.clear();

  auto corrupt = [&]() -> std::optional<FrameEvent> {
    return FrameLoss{
        .reason = LossReason::kCorrupt,
        .bytes_discarded = encoded.size(),
        .stream_offset = pending_start_,
    };
  };

  auto decoded = CobsDecode(encoded);
  if (!decoded || decoded->size() < kCrcSize) {
    return corrupt();
  }

  size_t body_len = decoded->size() - kCrcSize;
  std::span<const uint8_t> body(decoded->data(), body_len);
  auto expected_crc = static_cast<uint16_t>(
      (static_cast<uint16_t>((*decoded)[body_len]) << 8) |
      (*decoded)[body_len + 1]);
  if (Crc16Ccitt(body) != expected_crc) {
    return corrupt();
  }

  decoded->resize(body_len);
  return FrameCandidate{
      .payload = std::move(*decoded),
      .stream_offset = pending_start_,
  };
}

auto FrameReader::FlushAtEnd() -> std::optional<FrameEvent> {
  if (discarding_) {
    discarding_ = false;
    return FrameLoss{
        .reason = LossReason::kOversized,
        .bytes_discarded = discarded_,
        .stream_offset = pending_start_,
    };
  }
  if (!pending_.empty()) {
    size_t partial = pending_.size();
    pending_.clear();
    return FrameLoss{
        .reason = LossReason::kTruncated,
        .bytes_discarded = partial,
        .stream_offset = pending_start_,
    };
  }
  return std::nullopt;
}

}  // namespace emrun::stream
