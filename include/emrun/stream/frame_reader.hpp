#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string_view>
#include <variant>
#include <vector>

#include "emrun/stream/byte_source.hpp"

namespace emrun::stream {

// Decoded frame body (COBS removed, CRC verified and stripped).
struct FrameCandidate {
  std::vector<uint8_t> payload;
  uint64_t stream_offset;  // offset of the frame's first encoded byte
};

enum class LossReason : uint8_t {
  kCorrupt,    // bad COBS structure or CRC mismatch
  kOversized,  // no delimiter within max_frame_len bytes
  kTruncated,  // stream ended inside a frame
};

// Synthetic marker for bytes dropped while resynchronizing.
struct FrameLoss {
  LossReason reason;
  size_t bytes_discarded;
  uint64_t stream_offset;
};

using FrameEvent = std::variant<FrameCandidate, FrameLoss>;

auto ToString(LossReason reason) -> std::string_view;

struct ReaderOptions {
  size_t max_frame_len = 4096;
  size_t read_chunk = 1024;
};

// Pull-based framing over one ByteSource. Each byte is consumed exactly once;
// restarting means constructing a new reader over a fresh source.
//
// Resynchronization: a frame that fails COBS or CRC validation is dropped as
// a whole and reading resumes after its delimiter. A run of more than
// max_frame_len bytes without a delimiter is dropped up to the next
// delimiter. Each dropped range yields exactly one FrameLoss.
class FrameReader {
 public:
  FrameReader(
      ByteSource& source, std::stop_token stop, ReaderOptions options = {});

  // Next frame event, or nullopt once the source has ended or stop was
  // requested and any buffered partial frame has been reported.
  auto Next() -> std::expected<std::optional<FrameEvent>, SourceError>;

  [[nodiscard]] auto Done() const -> bool {
    return done_;
  }

 private:
  auto CloseFrame() -> std::optional<FrameEvent>;
  auto FlushAtEnd() -> std::optional<FrameEvent>;

  ByteSource& source_;
  std::stop_token stop_;
  ReaderOptions options_;

  std::vector<uint8_t> buffer_;
  size_t buffer_pos_ = 0;
  size_t buffer_len_ = 0;

  std::vector<uint8_t> pending_;
  uint64_t pending_start_ = 0;
  bool discarding_ = false;
  size_t discarded_ = 0;

  uint64_t offset_ = 0;
  bool source_ended_ = false;
  bool done_ = false;
};

}  // namespace emrun::stream
