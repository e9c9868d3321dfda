#pragma once

#include <format>
#include <stdexcept>
#include <string_view>

namespace emrun::common {

// A pipeline stage broke one of its own invariants. Never raised for bad
// captures, documents or configuration; those travel as expected errors.
class InternalError : public std::logic_error {
 public:
  InternalError(std::string_view stage, std::string_view detail)
      : std::logic_error(
            std::format(
                "emrun internal error in {}: {} (please file a bug with the "
                "capture that triggered it)",
                stage, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    std::string_view stage, std::string_view detail) {
  throw InternalError(stage, detail);
}

}  // namespace emrun::common
