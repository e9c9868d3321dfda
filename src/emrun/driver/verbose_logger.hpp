#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdio>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace emrun::driver {

using Seconds = std::chrono::duration<double>;

// Wall time spent in one named step of a command. A step that runs more than
// once (one capture per matrix entry, say) is folded into a single entry.
struct PhaseRecord {
  std::string name;
  Seconds total{0};
  size_t runs = 0;
};

// Collects phase timings for every command; only --verbose prints them.
class VerboseLogger {
 public:
  explicit VerboseLogger(bool verbose) : verbose_(verbose) {
  }

  [[nodiscard]] auto Verbose() const -> bool {
    return verbose_;
  }

  void Record(std::string_view phase, Seconds elapsed);
  void Waiting(std::string_view phase, Seconds elapsed) const;

  // "emrun: phases: symbols 0.01s, capture 4.20s (x2), write 0.00s"
  void PrintPhaseSummary(FILE* sink = stderr) const;

  [[nodiscard]] auto Phases() const -> const std::vector<PhaseRecord>& {
    return phases_;
  }

 private:
  bool verbose_;
  std::vector<PhaseRecord> phases_;
};

// Times the enclosing scope as one phase. With watch_target set, a verbose
// run also logs every 10s while the phase is still waiting on the target.
class PhaseTimer {
 public:
  PhaseTimer(
      VerboseLogger& logger, std::string phase, bool watch_target = false);
  ~PhaseTimer();

  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;
  PhaseTimer(PhaseTimer&&) = delete;
  PhaseTimer& operator=(PhaseTimer&&) = delete;

 private:
  void Watch(std::stop_token stop);

  VerboseLogger& logger_;
  std::string phase_;
  std::chrono::steady_clock::time_point start_;

  std::mutex mutex_;
  std::condition_variable_any wake_;
  std::jthread watcher_;
};

}  // namespace emrun::driver
