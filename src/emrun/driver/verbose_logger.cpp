#include "verbose_logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iterator>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace emrun::driver {

void VerboseLogger::Record(std::string_view phase, Seconds elapsed) {
  auto it = std::ranges::find(phases_, phase, &PhaseRecord::name);
  if (it == phases_.end()) {
    phases_.push_back(PhaseRecord{.name = std::string(phase)});
    it = std::prev(phases_.end());
  }
  it->total += elapsed;
  ++it->runs;

  if (verbose_) {
    spdlog::debug("{} took {:.2f}s", phase, elapsed.count());
  }
}

void VerboseLogger::Waiting(std::string_view phase, Seconds elapsed) const {
  if (verbose_) {
    spdlog::info(
        "{}: still waiting on the target after {:.0f}s", phase,
        elapsed.count());
  }
}

void VerboseLogger::PrintPhaseSummary(FILE* sink) const {
  std::string line = "emrun: phases:";
  const char* separator = " ";
  for (const auto& phase : phases_) {
    line += fmt::format(
        "{}{} {:.2f}s", separator, phase.name, phase.total.count());
    if (phase.runs > 1) {
      line += fmt::format(" (x{})", phase.runs);
    }
    separator = ", ";
  }
  fmt::print(sink, "{}\n", line);
  std::fflush(sink);
}

PhaseTimer::PhaseTimer(
    VerboseLogger& logger, std::string phase, bool watch_target)
    : logger_(logger),
      phase_(std::move(phase)),
      start_(std::chrono::steady_clock::now()) {
  spdlog::debug("{} started", phase_);
  if (watch_target && logger_.Verbose()) {
    watcher_ = std::jthread([this](std::stop_token stop) { Watch(stop); });
  }
}

PhaseTimer::~PhaseTimer() {
  if (watcher_.joinable()) {
    watcher_.request_stop();
    watcher_.join();
  }
  logger_.Record(phase_, std::chrono::steady_clock::now() - start_);
}

void PhaseTimer::Watch(std::stop_token stop) {
  constexpr auto kInterval = std::chrono::seconds(10);

  std::unique_lock lock(mutex_);
  while (!wake_.wait_for(lock, stop, kInterval, [] { return false; })) {
    if (stop.stop_requested()) {
      return;
    }
    logger_.Waiting(phase_, std::chrono::steady_clock::now() - start_);
  }
}

}  // namespace emrun::driver
