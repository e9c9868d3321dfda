#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <utility>

#include "emrun/stream/byte_source.hpp"

namespace emrun::stream {

// Default port of the RTT server started by the debug session.
inline constexpr uint16_t kDefaultRttPort = 19021;

// Client side of the transport's TCP channel. Each Read waits at most
// read_timeout so the pipeline can observe its stop signal between reads.
class TcpByteSource final : public ByteSource {
  struct ConnectTag {
    explicit ConnectTag() = default;
  };

 public:
  static auto Connect(
      const std::string& host, uint16_t port,
      std::chrono::milliseconds read_timeout)
      -> std::expected<std::unique_ptr<TcpByteSource>, SourceError>;

  // Reachable only through Connect; takes ownership of fd.
  TcpByteSource(ConnectTag /*tag*/, int fd, std::string endpoint)
      : fd_(fd), endpoint_(std::move(endpoint)) {
  }
  ~TcpByteSource() override;

  TcpByteSource(const TcpByteSource&) = delete;
  auto operator=(const TcpByteSource&) -> TcpByteSource& = delete;
  TcpByteSource(TcpByteSource&&) = delete;
  auto operator=(TcpByteSource&&) -> TcpByteSource& = delete;

  auto Read(std::span<uint8_t> buffer)
      -> std::expected<ReadChunk, SourceError> override;

  [[nodiscard]] auto Describe() const -> std::string override {
    return endpoint_;
  }

 private:
  int fd_;
  std::string endpoint_;
};

}  // namespace emrun::stream
