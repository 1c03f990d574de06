#include "lexer/token.hpp"

namespace luxer {

std::optional<TokenType> tokenTypeFromString(std::string_view name) {
  for (int i = 0; i <= static_cast<int>(TokenType::Unknown); i++) {
    auto type = static_cast<TokenType>(i);
    if (tokenTypeToString(type) == name) {
      return type;
    }
  }
  return std::nullopt;
}

std::string Token::toString() const {
  std::string result(tokenTypeToString(type));
  result += "(\"";
  for (char c : value) {
    switch (c) {
    case '\n':
      result += "\\n";
      break;
    case '\t':
      result += "\\t";
      break;
    case '\r':
      result += "\\r";
      break;
    case '"':
      result += "\\\"";
      break;
    default:
      result += c;
    }
  }
  result += "\")";
  if (!isSynthetic()) {
    result += " @" + std::to_string(line) + ":" + std::to_string(column);
  }
  return result;
}

Token Token::synthetic(TokenType kind, std::string text) {
  Token token;
  token.type = kind;
  token.value = std::move(text);
  token.start = npos;
  token.end = npos;
  token.line = 0;
  token.column = 0;
  return token;
}

} // namespace luxer
