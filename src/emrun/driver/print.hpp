#pragma once

#include <string_view>

#include "emrun/common/diagnostic.hpp"

namespace emrun::driver {

// All CLI output for failures goes to stderr as "emrun: <kind>: <message>".
void PrintError(std::string_view message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace emrun::driver
