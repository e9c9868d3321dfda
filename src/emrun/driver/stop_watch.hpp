#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace emrun::driver {

// Owns the stop signal handed to running pipelines. Stop is requested on
// SIGINT/SIGTERM or once the optional timeout has elapsed, whichever comes
// first. Only one StopWatch may exist at a time.
class StopWatch {
 public:
  explicit StopWatch(std::optional<std::chrono::seconds> timeout);
  ~StopWatch();

  StopWatch(const StopWatch&) = delete;
  StopWatch& operator=(const StopWatch&) = delete;
  StopWatch(StopWatch&&) = delete;
  StopWatch& operator=(StopWatch&&) = delete;

  auto Token() const -> std::stop_token {
    return source_.get_token();
  }

  // True once the stop came from a signal rather than the timeout.
  auto Interrupted() const -> bool;

 private:
  void WatchLoop(std::stop_token own_token);

  std::optional<std::chrono::seconds> timeout_;
  std::stop_source source_;
  std::mutex mutex_;
  std::condition_variable_any cv_;
  std::jthread watcher_;
};

}  // namespace emrun::driver
