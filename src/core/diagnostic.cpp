#include "core/diagnostic.hpp"

namespace luxer {

std::string Diagnostic::toString() const {
  std::string where;
  if (!origin.empty()) {
    where = origin + ":" + std::to_string(location.line) + ":" +
            std::to_string(location.column);
  } else {
    where = "line " + std::to_string(location.line) + ", column " +
            std::to_string(location.column);
  }

  return std::string(severityToString(severity)) + " at " + where + ": " +
         message;
}

std::string_view severityToString(DiagnosticSeverity severity) {
  switch (severity) {
  case DiagnosticSeverity::Error:
    return "Error";
  case DiagnosticSeverity::Warning:
    return "Warning";
  }
  return "Error";
}

} // namespace luxer
