#pragma once

#include "lexer/tokenType.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace luxer {

struct Token {
  // Offset value used by tokens that did not come from the source text
  static constexpr size_t npos = static_cast<size_t>(-1);

  TokenType type{TokenType::Unknown};
  std::string value; // exact source substring
  size_t start{};    // byte offset of the first character
  size_t end{};      // byte offset one past the last character
  size_t line{1};
  size_t column{1};

  size_t length() const { return end - start; }
  bool isSynthetic() const { return start == npos; }

  // Checks the kind and, when given, the exact value
  bool is(TokenType kind) const { return type == kind; }
  bool is(TokenType kind, std::string_view text) const {
    return type == kind && value == text;
  }

  std::string toString() const;

  /**
   * Create a token that has no position in the source, used for insertions
   * and replacements through TokenEditor.
   */
  static Token synthetic(TokenType kind, std::string text);
};

} // namespace luxer
