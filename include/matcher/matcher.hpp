#pragma once

#include "lexer/token.hpp"
#include "matcher/tokenMatch.hpp"
#include "matcher/tokenRange.hpp"
#include "pattern/compiledPattern.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace luxer {

struct Program;

/**
 * Executes a compiled pattern against token sequences.
 *
 * The pattern tree is lowered once into a small instruction program that a
 * backtracking machine runs with an explicit choice stack. Native recursion
 * only happens for lookarounds, so stack use is bounded by the pattern's
 * nesting, never by the length of the input.
 */
class Matcher {
public:
  explicit Matcher(std::shared_ptr<const CompiledPattern> pattern);
  explicit Matcher(std::string_view patternText);
  ~Matcher();

  Matcher(const Matcher &) = default;
  Matcher(Matcher &&) noexcept = default;
  Matcher &operator=(const Matcher &) = default;
  Matcher &operator=(Matcher &&) noexcept = default;

  // Match anchored at `start`; nullopt when the pattern does not match
  std::optional<TokenMatch> match(std::span<const Token> tokens,
                                  size_t start) const;
  std::optional<TokenMatch> match(std::span<const Token> tokens, size_t start,
                                  TokenRange window) const;

  // Every non-empty match, left to right
  std::vector<TokenMatch> findAll(std::span<const Token> tokens,
                                  bool overlapping = false) const;
  std::optional<TokenMatch> findFirst(std::span<const Token> tokens,
                                      size_t from = 0) const;

  const CompiledPattern &pattern() const { return *compiled; }
  std::shared_ptr<const CompiledPattern> sharedPattern() const {
    return compiled;
  }

private:
  std::shared_ptr<const CompiledPattern> compiled;
  std::shared_ptr<const Program> program;
};

std::optional<TokenMatch> tryMatch(const CompiledPattern &pattern,
                                   std::span<const Token> tokens,
                                   size_t startIndex);

// Nesting delta of one token, used by `@N` depth constraints
int depthDelta(const Token &token);

} // namespace luxer
