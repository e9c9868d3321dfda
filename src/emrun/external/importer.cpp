#include "emrun/external/importer.hpp"

#include <array>
#include <cctype>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "emrun/coverage/run_model.hpp"

namespace emrun::external {

namespace {

auto IsDigits(std::string_view text) -> bool {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

auto ValidateJson(std::string_view bytes) -> std::optional<std::string> {
  if (!nlohmann::json::accept(bytes)) {
    return "not a valid JSON document";
  }
  return std::nullopt;
}

// Structural check of an LCOV tracefile: known record tags only, DA lines
// numeric, every file section opened by SF: and closed by end_of_record.
auto ValidateLcov(std::string_view bytes) -> std::optional<std::string> {
  static constexpr std::array<std::string_view, 14> kTags = {
      "TN", "SF", "FN", "FNDA", "FNF", "FNH", "FNL",
      "FNA", "DA", "LF", "LH", "BRDA", "BRF", "BRH"};

  bool in_file = false;
  size_t files = 0;
  size_t line_no = 0;
  size_t pos = 0;

  while (pos <= bytes.size()) {
    size_t end = bytes.find('\n', pos);
    if (end == std::string_view::npos) {
      end = bytes.size();
    }
    std::string_view line = bytes.substr(pos, end - pos);
    pos = end + 1;
    ++line_no;

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      continue;
    }

    if (line == "end_of_record") {
      if (!in_file) {
        return std::format("line {}: end_of_record without SF", line_no);
      }
      in_file = false;
      continue;
    }

    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      return std::format("line {}: expected '<TAG>:<data>'", line_no);
    }
    std::string_view tag = line.substr(0, colon);
    std::string_view data = line.substr(colon + 1);

    bool known = false;
    for (std::string_view t : kTags) {
      known = known || t == tag;
    }
    if (!known && tag != "VER") {
      return std::format("line {}: unknown record '{}'", line_no, tag);
    }

    if (tag == "SF") {
      if (in_file) {
        return std::format("line {}: SF before end_of_record", line_no);
      }
      in_file = true;
      ++files;
    } else if (tag == "DA") {
      if (!in_file) {
        return std::format("line {}: DA outside a file section", line_no);
      }
      size_t comma = data.find(',');
      if (comma == std::string_view::npos) {
        return std::format("line {}: DA needs '<line>,<count>'", line_no);
      }
      std::string_view count = data.substr(comma + 1);
      count = count.substr(0, count.find(','));
      if (!IsDigits(data.substr(0, comma)) || !IsDigits(count)) {
        return std::format("line {}: DA fields must be numeric", line_no);
      }
    }
  }

  if (in_file) {
    return "last file section is missing end_of_record";
  }
  if (files == 0) {
    return "no SF records";
  }
  return std::nullopt;
}

}  // namespace

auto ToString(ExternalFormat format) -> std::string_view {
  switch (format) {
    case ExternalFormat::kJson:
      return "json";
    case ExternalFormat::kLcov:
      return "lcov";
  }
  return "json";
}

auto ParseFormatTag(std::string_view tag) -> std::optional<ExternalFormat> {
  if (tag == "json") {
    return ExternalFormat::kJson;
  }
  if (tag == "lcov") {
    return ExternalFormat::kLcov;
  }
  return std::nullopt;
}

auto Import(
    std::string_view artifact_bytes, std::string_view format_tag,
    std::string origin)
    -> std::expected<coverage::OpaquePayload, ImportError> {
  auto format = ParseFormatTag(format_tag);
  if (!format) {
    return std::unexpected(
        ImportError{
            .kind = ImportErrorKind::kUnsupportedFormat,
            .detail = std::format(
                "unsupported external coverage format '{}'", format_tag),
        });
  }

  std::optional<std::string> problem;
  switch (*format) {
    case ExternalFormat::kJson:
      problem = ValidateJson(artifact_bytes);
      break;
    case ExternalFormat::kLcov:
      problem = ValidateLcov(artifact_bytes);
      break;
  }
  if (problem) {
    return std::unexpected(
        ImportError{
            .kind = ImportErrorKind::kMalformed,
            .detail = std::format(
                "{} artifact '{}': {}", ToString(*format), origin, *problem),
        });
  }

  return coverage::OpaquePayload{
      .format = std::string(ToString(*format)),
      .origin = std::move(origin),
      .content = std::string(artifact_bytes),
  };
}

auto ImportFile(const std::filesystem::path& path, std::string_view format_tag)
    -> std::expected<coverage::OpaquePayload, ImportError> {
  if (!ParseFormatTag(format_tag)) {
    return Import({}, format_tag, path.string());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        ImportError{
            .kind = ImportErrorKind::kUnreadable,
            .detail = std::format("cannot open '{}'", path.string()),
        });
  }
  std::ostringstream content;
  content << in.rdbuf();
  return Import(content.str(), format_tag, path.string());
}

}  // namespace emrun::external
