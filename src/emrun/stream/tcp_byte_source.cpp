#include "emrun/stream/tcp_byte_source.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <expected>
#include <format>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <span>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace emrun::stream {

auto TcpByteSource::Connect(
    const std::string& host, uint16_t port,
    std::chrono::milliseconds read_timeout)
    -> std::expected<std::unique_ptr<TcpByteSource>, SourceError> {
  std::string endpoint = std::format("{}:{}", host, port);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  std::string port_str = std::to_string(port);
  int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
  if (gai != 0) {
    return std::unexpected(
        SourceError{
            .kind = SourceErrorKind::kConnect,
            .message = std::format(
                "cannot resolve '{}': {}", endpoint, gai_strerror(gai)),
        });
  }

  int fd = -1;
  std::string last_error = "no usable address";
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd == -1) {
      last_error = strerror(errno);
      continue;
    }
    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    last_error = strerror(errno);
    close(fd);
    fd = -1;
  }
  freeaddrinfo(results);

  if (fd == -1) {
    return std::unexpected(
        SourceError{
            .kind = SourceErrorKind::kConnect,
            .message =
                std::format("cannot connect to '{}': {}", endpoint, last_error),
        });
  }

  auto secs = std::chrono::duration_cast<std::chrono::seconds>(read_timeout);
  auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(
      read_timeout - secs);
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(secs.count());
  tv.tv_usec = static_cast<suseconds_t>(usecs.count());
  if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    std::string err = strerror(errno);
    close(fd);
    return std::unexpected(
        SourceError{
            .kind = SourceErrorKind::kConnect,
            .message = std::format(
                "cannot set read timeout on '{}': {}", endpoint, err),
        });
  }

  return std::make_unique<TcpByteSource>(
      ConnectTag{}, fd, std::move(endpoint));
}

TcpByteSource::~TcpByteSource() {
  if (fd_ != -1) {
    close(fd_);
  }
}

auto TcpByteSource::Read(std::span<uint8_t> buffer)
    -> std::expected<ReadChunk, SourceError> {
  ssize_t n = recv(fd_, buffer.data(), buffer.size(), 0);
  if (n > 0) {
    return ReadChunk{.count = static_cast<size_t>(n), .end_of_stream = false};
  }
  if (n == 0) {
    return ReadChunk{.count = 0, .end_of_stream = true};
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
    return ReadChunk{.count = 0, .end_of_stream = false};
  }
  return std::unexpected(
      SourceError{
          .kind = SourceErrorKind::kRead,
          .message =
              std::format("recv from '{}': {}", endpoint_, strerror(errno)),
      });
}

}  // namespace emrun::stream
