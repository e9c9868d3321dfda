#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "emrun/common/diagnostic.hpp"

namespace emrun::collect {

// Newline-separated list of documents written since the last collect.
inline constexpr std::string_view kManifestFileName = "coverages.txt";

auto ManifestPath(const std::filesystem::path& output_dir)
    -> std::filesystem::path;

// Adds document unless the manifest already lists it.
auto AppendToManifest(
    const std::filesystem::path& manifest,
    const std::filesystem::path& document) -> Result<void>;

// A manifest that does not exist yet reads as empty. Blank lines are skipped.
auto ReadManifest(const std::filesystem::path& manifest)
    -> Result<std::vector<std::filesystem::path>>;

auto RemoveManifest(const std::filesystem::path& manifest) -> Result<void>;

}  // namespace emrun::collect
