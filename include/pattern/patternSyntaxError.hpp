#pragma once

#include "core/diagnostic.hpp"

#include <stdexcept>

namespace luxer {

/**
 * Thrown by the pattern compiler. The offset is a position in the pattern
 * text, never in the source being matched.
 */
class PatternSyntaxError : public std::runtime_error {
public:
  explicit PatternSyntaxError(Diagnostic diag)
      : std::runtime_error(diag.toString()), diagnostic(std::move(diag)) {}

  const Diagnostic &getDiagnostic() const { return diagnostic; }
  size_t offset() const { return diagnostic.location.offset; }
  const std::string &message() const { return diagnostic.message; }

private:
  Diagnostic diagnostic;
};

} // namespace luxer
