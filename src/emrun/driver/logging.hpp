#pragma once

#include <string>

namespace emrun::driver {

// Installs the stderr logger used by the pipeline. EMRUN_LOG_LEVEL wins over
// the level passed in, which the caller resolves from --verbose and the
// config file.
void InitializeLogging(const std::string& level);

void ShutdownLogging();

}  // namespace emrun::driver
