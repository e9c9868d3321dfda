#include "emrun/collect/manifest.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "emrun/common/diagnostic.hpp"

namespace emrun::collect {

auto ManifestPath(const std::filesystem::path& output_dir)
    -> std::filesystem::path {
  return output_dir / kManifestFileName;
}

auto AppendToManifest(
    const std::filesystem::path& manifest,
    const std::filesystem::path& document) -> Result<void> {
  std::error_code ec;
  if (manifest.has_parent_path()) {
    std::filesystem::create_directories(manifest.parent_path(), ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "cannot create directory '{}': {}",
                  manifest.parent_path().string(), ec.message())));
    }
  }

  // A document rewritten in place is listed once, or collect would read it
  // twice.
  auto listed = ReadManifest(manifest);
  if (!listed) {
    return std::unexpected(std::move(listed.error()));
  }
  if (std::ranges::find(*listed, document) != listed->end()) {
    return {};
  }

  std::ofstream out(manifest, std::ios::app);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open manifest '{}'", manifest.string())));
  }
  out << document.string() << '\n';
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("write to manifest '{}' failed", manifest.string())));
  }
  return {};
}

auto ReadManifest(const std::filesystem::path& manifest)
    -> Result<std::vector<std::filesystem::path>> {
  std::vector<std::filesystem::path> documents;
  std::error_code ec;
  if (!std::filesystem::exists(manifest, ec)) {
    return documents;
  }

  std::ifstream in(manifest);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot read manifest '{}'", manifest.string())));
  }
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      documents.emplace_back(line);
    }
  }
  return documents;
}

auto RemoveManifest(const std::filesystem::path& manifest) -> Result<void> {
  std::error_code ec;
  std::filesystem::remove(manifest, ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "cannot remove manifest '{}': {}", manifest.string(),
                ec.message())));
  }
  return {};
}

}  // namespace emrun::collect
