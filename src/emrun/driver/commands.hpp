#pragma once

#include <argparse/argparse.hpp>

#include "emrun/config/runner_config.hpp"
#include "verbose_logger.hpp"

namespace emrun::driver {

// Capture one run and write its coverage document.
auto RunCommand(
    const argparse::ArgumentParser& cmd, const config::RunnerConfig& config,
    VerboseLogger& logger) -> int;

// Decode several capture files in parallel, one document each.
auto MatrixCommand(
    const argparse::ArgumentParser& cmd, const config::RunnerConfig& config,
    VerboseLogger& logger) -> int;

// Merge documents (or the manifest's entries) into one aggregate.
auto CollectCommand(
    const argparse::ArgumentParser& cmd, const config::RunnerConfig& config,
    VerboseLogger& logger) -> int;

}  // namespace emrun::driver
