#include "emrun/stream/byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <span>

namespace emrun::stream {

auto MemoryByteSource::Read(std::span<uint8_t> buffer)
    -> std::expected<ReadChunk, SourceError> {
  if (cursor_ >= bytes_.size()) {
    return ReadChunk{.count = 0, .end_of_stream = true};
  }
  size_t n = std::min(buffer.size(), bytes_.size() - cursor_);
  if (max_chunk_ != 0) {
    n = std::min(n, max_chunk_);
  }
  std::memcpy(buffer.data(), bytes_.data() + cursor_, n);
  cursor_ += n;
  return ReadChunk{.count = n, .end_of_stream = false};
}

auto FileByteSource::Open(const std::filesystem::path& path)
    -> std::expected<std::unique_ptr<FileByteSource>, SourceError> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        SourceError{
            .kind = SourceErrorKind::kOpen,
            .message = std::format("cannot open capture '{}'", path.string()),
        });
  }
  return std::make_unique<FileByteSource>(OpenTag{}, path, std::move(in));
}

auto FileByteSource::Read(std::span<uint8_t> buffer)
    -> std::expected<ReadChunk, SourceError> {
  in_.read(
      reinterpret_cast<char*>(buffer.data()),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
      static_cast<std::streamsize>(buffer.size()));
  auto n = static_cast<size_t>(in_.gcount());
  if (in_.bad()) {
    return std::unexpected(
        SourceError{
            .kind = SourceErrorKind::kRead,
            .message = std::format("read error on '{}'", path_.string()),
        });
  }
  if (n == 0 && in_.eof()) {
    return ReadChunk{.count = 0, .end_of_stream = true};
  }
  // A short read at EOF still delivers its bytes; the next call reports end.
  return ReadChunk{.count = n, .end_of_stream = false};
}

}  // namespace emrun::stream
