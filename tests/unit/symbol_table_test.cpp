#include <gtest/gtest.h>

#include <string>

#include "emrun/common/diagnostic.hpp"
#include "emrun/decode/log_record.hpp"
#include "emrun/decode/symbol_table.hpp"

namespace emrun::decode {
namespace {

TEST(SymbolTableTest, ParsesResolverOutput) {
  auto table = ParseSymbolTable(R"({
    "entries": [
      {"address": 256, "file": "src/lib.rs", "line": 12,
       "format": "req.cover requirement_id={}", "level": "debug"},
      {"address": 260, "format": "boot"}
    ]
  })");
  ASSERT_TRUE(table.has_value()) << table.error().primary.message;
  EXPECT_EQ(table->Size(), 2);

  const SymbolEntry* cover = table->Lookup(256);
  ASSERT_NE(cover, nullptr);
  EXPECT_EQ(cover->format, "req.cover requirement_id={}");
  EXPECT_EQ(cover->level, Level::kDebug);
  ASSERT_TRUE(cover->location.has_value());
  EXPECT_EQ(cover->location->file, "src/lib.rs");
  EXPECT_EQ(cover->location->line, 12);

  const SymbolEntry* boot = table->Lookup(260);
  ASSERT_NE(boot, nullptr);
  EXPECT_FALSE(boot->location.has_value());
  EXPECT_EQ(boot->level, Level::kInfo);

  EXPECT_EQ(table->Lookup(999), nullptr);
}

TEST(SymbolTableTest, RejectsDuplicateAddresses) {
  auto table = ParseSymbolTable(R"({
    "entries": [
      {"address": 1, "format": "a"},
      {"address": 1, "format": "b"}
    ]
  })");
  ASSERT_FALSE(table.has_value());
  EXPECT_NE(
      table.error().primary.message.find("more than once"), std::string::npos);
}

TEST(SymbolTableTest, RejectsEntriesWithoutFormat) {
  EXPECT_FALSE(ParseSymbolTable(R"({"entries": [{"address": 1}]})"));
}

TEST(SymbolTableTest, RejectsUnknownLevel) {
  EXPECT_FALSE(ParseSymbolTable(
      R"({"entries": [{"address": 1, "format": "x", "level": "loud"}]})"));
}

TEST(SymbolTableTest, RejectsAddressesOutside32Bits) {
  for (const char* address : {"-1", "4294967296", "1.5", "\"0x10\""}) {
    auto table = ParseSymbolTable(
        std::string(R"({"entries": [{"address": )") + address +
        R"(, "format": "x"}]})");
    ASSERT_FALSE(table.has_value()) << address;
    EXPECT_EQ(table.error().primary.kind, DiagKind::kError);
    EXPECT_NE(
        table.error().primary.message.find("32-bit"), std::string::npos);
  }
}

TEST(SymbolTableTest, AcceptsTheHighestAddress) {
  auto table = ParseSymbolTable(
      R"({"entries": [{"address": 4294967295, "format": "x"}]})");
  ASSERT_TRUE(table.has_value()) << table.error().primary.message;
  EXPECT_NE(table->Lookup(0xffffffff), nullptr);
}

TEST(SymbolTableTest, RejectsInvalidJson) {
  EXPECT_FALSE(ParseSymbolTable("{not json"));
  EXPECT_FALSE(ParseSymbolTable(R"({"symbols": []})"));
}

TEST(SymbolTableTest, MissingFileIsHostError) {
  auto table = LoadSymbolTable("/nonexistent/emrun/symbols.json");
  ASSERT_FALSE(table.has_value());
  EXPECT_EQ(table.error().primary.kind, DiagKind::kHostError);
}

}  // namespace
}  // namespace emrun::decode
