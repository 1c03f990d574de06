#pragma once

#include "core/diagnostic.hpp"

#include <stdexcept>

namespace luxer {

/**
 * Thrown for an unterminated string, template, regex or block comment.
 * The location is the start of the offending literal.
 */
class LexError : public std::runtime_error {
public:
  explicit LexError(Diagnostic diag)
      : std::runtime_error(diag.toString()), diagnostic(std::move(diag)) {}

  const Diagnostic &getDiagnostic() const { return diagnostic; }
  const SourceLocation &location() const { return diagnostic.location; }

private:
  Diagnostic diagnostic;
};

} // namespace luxer
