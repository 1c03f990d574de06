#pragma once

#include "lexer/token.hpp"
#include "matcher/capture.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace luxer {

/**
 * Result of a successful match. Capture 0 is the full match; groups are
 * 1..captureCount(). The match refers to the token sequence it was produced
 * from, which must outlive it.
 */
class TokenMatch {
public:
  TokenMatch(std::span<const Token> tokens, std::vector<Capture> captures);

  size_t start() const { return captures.front().start; }
  size_t end() const { return captures.front().end; }
  size_t length() const { return end() - start(); }
  const std::string &value() const { return captures.front().value; }

  size_t captureCount() const { return captures.size() - 1; }

  // Out of range indices and unknown names yield an absent capture
  const Capture &captureAt(size_t index) const;
  const Capture &namedCapture(std::string_view name) const;
  const Capture &fullMatch() const { return captures.front(); }

  std::span<const Token> matchedTokens() const;
  std::span<const Token> tokensOf(const Capture &capture) const;

  const std::vector<Capture> &allCaptures() const { return captures; }
  std::span<const Token> sequence() const { return tokens; }

private:
  std::span<const Token> tokens;
  std::vector<Capture> captures;
};

} // namespace luxer
