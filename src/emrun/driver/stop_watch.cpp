#include "stop_watch.hpp"

#include <chrono>
#include <csignal>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace emrun::driver {

namespace {

volatile std::sig_atomic_t g_signalled = 0;

void HandleSignal(int /*signal*/) {
  g_signalled = 1;
}

constexpr auto kPollInterval = std::chrono::milliseconds(100);

}  // namespace

StopWatch::StopWatch(std::optional<std::chrono::seconds> timeout)
    : timeout_(timeout) {
  g_signalled = 0;
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
  watcher_ =
      std::jthread([this](std::stop_token st) { WatchLoop(std::move(st)); });
}

StopWatch::~StopWatch() {
  watcher_.request_stop();
  cv_.notify_all();
  watcher_.join();
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

auto StopWatch::Interrupted() const -> bool {
  return g_signalled != 0;
}

void StopWatch::WatchLoop(std::stop_token own_token) {
  auto deadline = timeout_ ? std::optional(
                                 std::chrono::steady_clock::now() + *timeout_)
                           : std::nullopt;

  std::unique_lock lock(mutex_);
  while (!own_token.stop_requested()) {
    if (g_signalled != 0) {
      spdlog::info("interrupted, stopping capture");
      source_.request_stop();
      return;
    }
    if (deadline && std::chrono::steady_clock::now() >= *deadline) {
      spdlog::info(
          "timeout of {}s reached, stopping capture", timeout_->count());
      source_.request_stop();
      return;
    }
    cv_.wait_for(lock, own_token, kPollInterval, [] { return false; });
  }
}

}  // namespace emrun::driver
