#pragma once

#include "core/diagnosticSeverity.hpp"
#include "core/sourceLocation.hpp"

#include <string>

namespace luxer {

struct Diagnostic {
  std::string message;
  std::string origin; // file name, "<pattern>" or empty
  SourceLocation location;
  DiagnosticSeverity severity;

  Diagnostic(std::string msg, SourceLocation loc = {}, std::string from = "",
             DiagnosticSeverity sev = DiagnosticSeverity::Error)
      : message(std::move(msg)), origin(std::move(from)), location(loc),
        severity(sev) {}

  std::string toString() const;
};

} // namespace luxer
