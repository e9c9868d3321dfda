#include "emrun/decode/log_record.hpp"

#include <optional>
#include <string_view>

namespace emrun::decode {

auto ToString(Level level) -> std::string_view {
  switch (level) {
    case Level::kTrace:
      return "trace";
    case Level::kDebug:
      return "debug";
    case Level::kInfo:
      return "info";
    case Level::kWarn:
      return "warn";
    case Level::kError:
      return "error";
  }
  return "info";
}

auto ParseLevel(std::string_view text) -> std::optional<Level> {
  if (text == "trace") {
    return Level::kTrace;
  }
  if (text == "debug") {
    return Level::kDebug;
  }
  if (text == "info") {
    return Level::kInfo;
  }
  if (text == "warn" || text == "warning") {
    return Level::kWarn;
  }
  if (text == "error") {
    return Level::kError;
  }
  return std::nullopt;
}

}  // namespace emrun::decode
