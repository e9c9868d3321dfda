#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace emrun::stream {

enum class SourceErrorKind : uint8_t {
  kOpen,     // capture file could not be opened
  kConnect,  // transport endpoint refused or unreachable
  kRead,     // I/O failure after the stream was established
};

struct SourceError {
  SourceErrorKind kind;
  std::string message;
};

// Outcome of one Read call. count == 0 with end_of_stream == false means the
// source's own read timeout elapsed and the caller may poll its stop signal.
struct ReadChunk {
  size_t count = 0;
  bool end_of_stream = false;
};

// One debug session's byte stream. The core only ever holds a read cursor
// into it; how the bytes are produced belongs to the transport.
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  virtual auto Read(std::span<uint8_t> buffer)
      -> std::expected<ReadChunk, SourceError> = 0;

  // Human-readable origin, used in logs and generated run ids.
  [[nodiscard]] virtual auto Describe() const -> std::string = 0;
};

// Serves a fixed byte vector. max_chunk bounds how many bytes a single Read
// hands out, which lets tests split frames across reads.
class MemoryByteSource final : public ByteSource {
 public:
  explicit MemoryByteSource(
      std::vector<uint8_t> bytes, size_t max_chunk = 0,
      std::string name = "memory")
      : bytes_(std::move(bytes)),
        max_chunk_(max_chunk),
        name_(std::move(name)) {
  }

  auto Read(std::span<uint8_t> buffer)
      -> std::expected<ReadChunk, SourceError> override;

  [[nodiscard]] auto Describe() const -> std::string override {
    return name_;
  }

 private:
  std::vector<uint8_t> bytes_;
  size_t cursor_ = 0;
  size_t max_chunk_;
  std::string name_;
};

// Reads a raw capture previously written to disk by the transport.
class FileByteSource final : public ByteSource {
  struct OpenTag {
    explicit OpenTag() = default;
  };

 public:
  static auto Open(const std::filesystem::path& path)
      -> std::expected<std::unique_ptr<FileByteSource>, SourceError>;

  // Reachable only through Open.
  FileByteSource(OpenTag /*tag*/, std::filesystem::path path, std::ifstream in)
      : path_(std::move(path)), in_(std::move(in)) {
  }

  auto Read(std::span<uint8_t> buffer)
      -> std::expected<ReadChunk, SourceError> override;

  [[nodiscard]] auto Describe() const -> std::string override {
    return path_.string();
  }

 private:
  std::filesystem::path path_;
  std::ifstream in_;
};

}  // namespace emrun::stream
