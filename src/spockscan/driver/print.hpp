#pragma once

#include <string>

#include "spockscan/common/diagnostic.hpp"

namespace spockscan::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);
void PrintDiagnostics(const DiagnosticSink& sink);

}  // namespace spockscan::driver
