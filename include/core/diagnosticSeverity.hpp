#pragma once

#include <string_view>

namespace luxer {

enum class DiagnosticSeverity { Error, Warning };

std::string_view severityToString(DiagnosticSeverity severity);

} // namespace luxer
