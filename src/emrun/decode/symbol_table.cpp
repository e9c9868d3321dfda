#include "emrun/decode/symbol_table.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "emrun/common/diagnostic.hpp"
#include "emrun/decode/log_record.hpp"

namespace emrun::decode {

auto SymbolTable::FromEntries(std::vector<SymbolEntry> entries)
    -> Result<SymbolTable> {
  SymbolTable table;
  table.entries_.reserve(entries.size());
  for (auto& entry : entries) {
    uint32_t address = entry.address;
    auto [it, inserted] = table.entries_.emplace(address, std::move(entry));
    if (!inserted) {
      return std::unexpected(
          Diagnostic::Error(
              std::format(
                  "symbol table lists address 0x{:x} more than once",
                  address)));
    }
  }
  return table;
}

auto SymbolTable::Lookup(uint32_t address) const -> const SymbolEntry* {
  auto it = entries_.find(address);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto ParseSymbolTable(std::string_view json_text) -> Result<SymbolTable> {
  std::vector<SymbolEntry> entries;
  try {
    nlohmann::json j = nlohmann::json::parse(json_text);
    if (!j.is_object() || !j.contains("entries") || !j["entries"].is_array()) {
      return std::unexpected(
          Diagnostic::Error("symbol table: missing 'entries' array"));
    }

    for (const auto& item : j["entries"]) {
      if (!item.contains("address") || !item.contains("format")) {
        return std::unexpected(
            Diagnostic::Error(
                "symbol table: every entry needs 'address' and 'format'"));
      }

      const auto& address = item["address"];
      if (!address.is_number_integer() || address.get<int64_t>() < 0 ||
          address.get<int64_t>() > std::numeric_limits<uint32_t>::max()) {
        return std::unexpected(
            Diagnostic::Error(
                std::format(
                    "symbol table: address {} is not a 32-bit unsigned "
                    "integer",
                    address.dump())));
      }

      SymbolEntry entry;
      entry.address = static_cast<uint32_t>(address.get<int64_t>());
      entry.format = item["format"].get<std::string>();

      if (item.contains("file")) {
        entry.location = SourceLocation{
            .file = item["file"].get<std::string>(),
            .line = item.value("line", uint32_t{0}),
        };
      }

      if (item.contains("level")) {
        auto name = item["level"].get<std::string>();
        auto level = ParseLevel(name);
        if (!level) {
          return std::unexpected(
              Diagnostic::Error(
                  std::format(
                      "symbol table: unknown level '{}' at address 0x{:x}",
                      name, entry.address)));
        }
        entry.level = *level;
      }

      entries.push_back(std::move(entry));
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(
        Diagnostic::Error(std::format("symbol table: {}", e.what())));
  }

  return SymbolTable::FromEntries(std::move(entries));
}

auto LoadSymbolTable(const std::filesystem::path& path)
    -> Result<SymbolTable> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open symbol table '{}'", path.string())));
  }
  std::ostringstream content;
  content << in.rdbuf();

  auto table = ParseSymbolTable(content.str());
  if (!table) {
    return std::unexpected(
        std::move(table.error())
            .WithNote(std::format("while loading '{}'", path.string())));
  }
  return table;
}

}  // namespace emrun::decode
