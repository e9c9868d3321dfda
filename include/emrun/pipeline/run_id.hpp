#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace emrun::pipeline {

// "<name>-<YYYYmmddTHHMMSS>Z-<8 hex digits>" in UTC. Characters of name
// outside [A-Za-z0-9_.-] become '-'; an empty name becomes "run".
auto GenerateRunId(
    std::string_view source_name,
    std::chrono::system_clock::time_point now =
        std::chrono::system_clock::now()) -> std::string;

// Run id for one capture. An explicit id is used as given. Otherwise an id
// is generated from the configured run name, or from source_name when none
// is configured, so repeated runs never share a document.
auto ResolveRunId(
    const std::optional<std::string>& explicit_id,
    const std::optional<std::string>& configured_name,
    std::string_view source_name,
    std::chrono::system_clock::time_point now =
        std::chrono::system_clock::now()) -> std::string;

}  // namespace emrun::pipeline
