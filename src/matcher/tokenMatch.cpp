#include "matcher/tokenMatch.hpp"

namespace luxer {

TokenMatch::TokenMatch(std::span<const Token> tokens,
                       std::vector<Capture> captures)
    : tokens(tokens), captures(std::move(captures)) {
  if (this->captures.empty()) {
    this->captures.emplace_back();
  }
}

const Capture &TokenMatch::captureAt(size_t index) const {
  static const Capture absent;
  return index < captures.size() ? captures[index] : absent;
}

const Capture &TokenMatch::namedCapture(std::string_view name) const {
  static const Capture absent;
  for (size_t i = 1; i < captures.size(); i++) {
    if (!captures[i].name.empty() && captures[i].name == name) {
      return captures[i];
    }
  }
  return absent;
}

std::span<const Token> TokenMatch::matchedTokens() const {
  return tokensOf(captures.front());
}

std::span<const Token> TokenMatch::tokensOf(const Capture &capture) const {
  if (!capture.matched || capture.end > tokens.size()) {
    return {};
  }
  return tokens.subspan(capture.start, capture.length());
}

} // namespace luxer
