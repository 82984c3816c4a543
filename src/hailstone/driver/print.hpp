#pragma once

#include <string>

#include "hailstone/common/diagnostic.hpp"

namespace hailstone::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace hailstone::driver
