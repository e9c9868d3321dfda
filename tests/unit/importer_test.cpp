#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "emrun/coverage/run_model.hpp"
#include "emrun/external/importer.hpp"

namespace emrun::external {
namespace {

constexpr const char* kLcov =
    "TN:\n"
    "SF:src/adc.rs\n"
    "FN:10,adc::read\n"
    "FNDA:3,adc::read\n"
    "DA:10,3\n"
    "DA:11,0\n"
    "LF:2\n"
    "LH:1\n"
    "end_of_record\n";

TEST(ImporterTest, LcovIsStoredVerbatim) {
  auto payload = Import(kLcov, "lcov", "coverage/lcov.info");
  ASSERT_TRUE(payload.has_value()) << payload.error().detail;
  EXPECT_EQ(payload->format, "lcov");
  EXPECT_EQ(payload->origin, "coverage/lcov.info");
  EXPECT_EQ(payload->content, kLcov);
}

TEST(ImporterTest, JsonIsStoredVerbatim) {
  std::string doc = R"({"tool": "probe", "hits": [1, 2, 3]})";
  auto payload = Import(doc, "json", "meta.json");
  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(payload->format, "json");
  EXPECT_EQ(payload->content, doc);
}

TEST(ImporterTest, UnknownTagIsUnsupported) {
  auto payload = Import("<coverage/>", "cobertura", "cov.xml");
  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().kind, ImportErrorKind::kUnsupportedFormat);
}

TEST(ImporterTest, InvalidJsonIsMalformed) {
  auto payload = Import("{\"open\": ", "json", "meta.json");
  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().kind, ImportErrorKind::kMalformed);
}

TEST(ImporterTest, LcovWithoutEndOfRecordIsMalformed) {
  auto payload = Import("SF:a.rs\nDA:1,1\n", "lcov", "lcov.info");
  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().kind, ImportErrorKind::kMalformed);
}

TEST(ImporterTest, LcovWithNonNumericHitsIsMalformed) {
  auto payload =
      Import("SF:a.rs\nDA:1,many\nend_of_record\n", "lcov", "lcov.info");
  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().kind, ImportErrorKind::kMalformed);
}

TEST(ImporterTest, LcovAcceptsCrlfAndChecksums) {
  auto payload = Import(
      "SF:a.rs\r\nDA:1,1,abc123\r\nend_of_record\r\n", "lcov", "lcov.info");
  EXPECT_TRUE(payload.has_value());
}

TEST(ImporterTest, EmptyLcovIsMalformed) {
  EXPECT_FALSE(Import("", "lcov", "lcov.info").has_value());
}

TEST(ImporterTest, ImportFileUsesPathAsOrigin) {
  auto path = std::filesystem::temp_directory_path() / "emrun_importer.info";
  {
    std::ofstream out(path);
    out << kLcov;
  }
  auto payload = ImportFile(path, "lcov");
  std::filesystem::remove(path);

  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(payload->origin, path.string());
  EXPECT_EQ(payload->content, kLcov);
}

TEST(ImporterTest, MissingFileIsUnreadable) {
  auto payload = ImportFile("/nonexistent/emrun/lcov.info", "lcov");
  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().kind, ImportErrorKind::kUnreadable);
}

TEST(ImporterTest, UnsupportedTagWinsOverMissingFile) {
  auto payload = ImportFile("/nonexistent/emrun/cov.xml", "cobertura");
  ASSERT_FALSE(payload.has_value());
  EXPECT_EQ(payload.error().kind, ImportErrorKind::kUnsupportedFormat);
}

}  // namespace
}  // namespace emrun::external
