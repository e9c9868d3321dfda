#include "emrun/decode/wire_decoder.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "emrun/decode/log_record.hpp"

namespace emrun::decode {

namespace {

constexpr uint8_t kFlagTimestamp = 0x01;
constexpr uint8_t kFlagLevel = 0x02;
constexpr uint8_t kKnownFlags = kFlagTimestamp | kFlagLevel;

// Bounds-checked little-endian cursor over a frame payload.
class Cursor {
 public:
  explicit Cursor(std::span<const uint8_t> data) : data_(data) {
  }

  auto Remaining() const -> size_t {
    return data_.size() - pos_;
  }

  template <typename T>
  auto ReadLe() -> std::expected<T, WireError> {
    if (Remaining() < sizeof(T)) {
      return std::unexpected(
          WireError{
              .kind = WireErrorKind::kTruncated,
              .detail = std::format(
                  "need {} bytes at offset {}, have {}", sizeof(T), pos_,
                  Remaining()),
          });
    }
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
      value |= static_cast<T>(static_cast<T>(data_[pos_ + i]) << (8 * i));
    }
    pos_ += sizeof(T);
    return value;
  }

  auto ReadString(size_t len) -> std::expected<std::string, WireError> {
    if (Remaining() < len) {
      return std::unexpected(
          WireError{
              .kind = WireErrorKind::kTruncated,
              .detail = std::format(
                  "argument of {} bytes at offset {} overruns frame", len,
                  pos_),
          });
    }
    std::string out(
        reinterpret_cast<const char*>(data_.data() + pos_),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
        len);
    pos_ += len;
    return out;
  }

 private:
  std::span<const uint8_t> data_;
  size_t pos_ = 0;
};

template <typename T>
void AppendLe(std::vector<uint8_t>& out, T value) {
  for (size_t i = 0; i < sizeof(T); ++i) {
    out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

}  // namespace

auto ReferenceWireDecoder::Decode(std::span<const uint8_t> payload) const
    -> std::expected<RawFrame, WireError> {
  Cursor cur(payload);
  RawFrame frame;

  auto version = cur.ReadLe<uint8_t>();
  if (!version) {
    return std::unexpected(version.error());
  }
  if (*version != kEncodingVersion) {
    return std::unexpected(
        WireError{
            .kind = WireErrorKind::kBadVersion,
            .detail = std::format(
                "frame uses encoding version {}, decoder supports {}",
                *version, kEncodingVersion),
        });
  }
  frame.version = *version;

  auto address = cur.ReadLe<uint32_t>();
  if (!address) {
    return std::unexpected(address.error());
  }
  frame.address = *address;

  auto flags = cur.ReadLe<uint8_t>();
  if (!flags) {
    return std::unexpected(flags.error());
  }
  if ((*flags & ~kKnownFlags) != 0) {
    return std::unexpected(
        WireError{
            .kind = WireErrorKind::kInvalid,
            .detail = std::format("unknown flag bits 0x{:02x}", *flags),
        });
  }

  if ((*flags & kFlagTimestamp) != 0) {
    auto ts = cur.ReadLe<uint64_t>();
    if (!ts) {
      return std::unexpected(ts.error());
    }
    frame.timestamp = std::chrono::microseconds(static_cast<int64_t>(*ts));
  }

  if ((*flags & kFlagLevel) != 0) {
    auto level = cur.ReadLe<uint8_t>();
    if (!level) {
      return std::unexpected(level.error());
    }
    if (*level > static_cast<uint8_t>(Level::kError)) {
      return std::unexpected(
          WireError{
              .kind = WireErrorKind::kInvalid,
              .detail = std::format("level {} out of range", *level),
          });
    }
    frame.level = static_cast<Level>(*level);
  }

  auto argc = cur.ReadLe<uint8_t>();
  if (!argc) {
    return std::unexpected(argc.error());
  }
  frame.args.reserve(*argc);
  for (uint8_t i = 0; i < *argc; ++i) {
    auto len = cur.ReadLe<uint16_t>();
    if (!len) {
      return std::unexpected(len.error());
    }
    auto arg = cur.ReadString(*len);
    if (!arg) {
      return std::unexpected(arg.error());
    }
    frame.args.push_back(std::move(*arg));
  }

  if (cur.Remaining() != 0) {
    return std::unexpected(
        WireError{
            .kind = WireErrorKind::kInvalid,
            .detail = std::format("{} trailing bytes", cur.Remaining()),
        });
  }
  return frame;
}

auto EncodeRawFrame(const RawFrame& frame) -> std::vector<uint8_t> {
  std::vector<uint8_t> out;
  out.push_back(frame.version);
  AppendLe<uint32_t>(out, frame.address);

  uint8_t flags = 0;
  if (frame.timestamp) {
    flags |= kFlagTimestamp;
  }
  if (frame.level) {
    flags |= kFlagLevel;
  }
  out.push_back(flags);

  if (frame.timestamp) {
    AppendLe<uint64_t>(out, static_cast<uint64_t>(frame.timestamp->count()));
  }
  if (frame.level) {
    out.push_back(static_cast<uint8_t>(*frame.level));
  }

  out.push_back(static_cast<uint8_t>(frame.args.size()));
  for (const auto& arg : frame.args) {
    AppendLe<uint16_t>(out, static_cast<uint16_t>(arg.size()));
    out.insert(out.end(), arg.begin(), arg.end());
  }
  return out;
}

}  // namespace emrun::decode
