#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "emrun/common/diagnostic.hpp"
#include "emrun/decode/log_record.hpp"

namespace emrun::decode {

struct SymbolEntry {
  uint32_t address = 0;
  std::optional<SourceLocation> location;
  std::string format;
  Level level = Level::kInfo;
};

// Address -> interned log statement, built once per binary by the symbol
// resolver. Immutable after construction and always passed explicitly, so
// runs against different binaries never share one.
class SymbolTable {
 public:
  SymbolTable() = default;

  // Duplicate addresses are rejected.
  static auto FromEntries(std::vector<SymbolEntry> entries)
      -> Result<SymbolTable>;

  [[nodiscard]] auto Lookup(uint32_t address) const -> const SymbolEntry*;

  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

 private:
  std::unordered_map<uint32_t, SymbolEntry> entries_;
};

// Parse the resolver's JSON output:
//   {"entries": [{"address": 1, "file": "src/lib.rs", "line": 10,
//                 "format": "test.start test_name={}", "level": "info"}]}
// file/line/level are optional.
auto ParseSymbolTable(std::string_view json_text) -> Result<SymbolTable>;

auto LoadSymbolTable(const std::filesystem::path& path) -> Result<SymbolTable>;

}  // namespace emrun::decode
