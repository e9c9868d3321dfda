#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "emrun/coverage/run_model.hpp"

namespace emrun::external {

enum class ExternalFormat : uint8_t {
  kJson,  // free-form metadata document
  kLcov,  // LCOV tracefile (SF:/DA:/end_of_record)
};

auto ToString(ExternalFormat format) -> std::string_view;
auto ParseFormatTag(std::string_view tag) -> std::optional<ExternalFormat>;

enum class ImportErrorKind : uint8_t {
  kUnsupportedFormat,
  kMalformed,
  kUnreadable,
};

struct ImportError {
  ImportErrorKind kind;
  std::string detail;
};

// Validates artifact_bytes with the parser for format_tag and wraps them
// verbatim. The content is never rewritten or interpreted past validation.
auto Import(
    std::string_view artifact_bytes, std::string_view format_tag,
    std::string origin)
    -> std::expected<coverage::OpaquePayload, ImportError>;

// Reads path and imports its bytes; origin is the path as given.
auto ImportFile(const std::filesystem::path& path, std::string_view format_tag)
    -> std::expected<coverage::OpaquePayload, ImportError>;

}  // namespace emrun::external
