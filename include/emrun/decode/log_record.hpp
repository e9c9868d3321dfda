#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace emrun::decode {

enum class Level : uint8_t { kTrace, kDebug, kInfo, kWarn, kError };

auto ToString(Level level) -> std::string_view;
auto ParseLevel(std::string_view text) -> std::optional<Level>;

struct SourceLocation {
  std::string file;
  uint32_t line = 0;

  auto operator==(const SourceLocation&) const -> bool = default;
};

struct LogField {
  std::string key;
  std::string value;

  auto operator==(const LogField&) const -> bool = default;
};

// One decoded log statement. sequence_number is the only ordering key;
// timestamp is whatever the target reported and may be missing.
struct LogRecord {
  uint64_t sequence_number = 0;
  std::optional<std::chrono::microseconds> timestamp;
  Level level = Level::kInfo;
  std::optional<SourceLocation> location;
  std::vector<LogField> fields;

  // First field with the given key, if any.
  [[nodiscard]] auto Find(std::string_view key) const
      -> const std::string* {
    for (const auto& field : fields) {
      if (field.key == key) {
        return &field.value;
      }
    }
    return nullptr;
  }

  [[nodiscard]] auto Has(std::string_view key) const -> bool {
    return Find(key) != nullptr;
  }
};

}  // namespace emrun::decode
