#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "emrun/common/diagnostic.hpp"
#include "emrun/schema/document.hpp"

namespace emrun::schema {

// Canonical text: 2-space indented JSON, fixed key order, trailing newline.
// Invalid UTF-8 captured from the target is replaced, never rejected.
auto DumpDocument(const CoverageDocument& doc) -> std::string;
auto DumpDocument(const AggregateDocument& doc) -> std::string;

// A document whose schema_version differs from kSchemaVersion is returned
// with only schema_version and run_id filled in; its other fields follow a
// layout this build does not know, and the merger rejects it anyway.
auto ParseCoverageDocument(std::string_view text) -> Result<CoverageDocument>;
auto ParseAggregateDocument(std::string_view text) -> Result<AggregateDocument>;

auto ReadCoverageDocument(const std::filesystem::path& path)
    -> Result<CoverageDocument>;

// Writes via a sibling temporary file and a rename, so readers never see a
// half-written document.
auto WriteDocumentFile(const std::filesystem::path& path, std::string_view text)
    -> Result<void>;

}  // namespace emrun::schema
