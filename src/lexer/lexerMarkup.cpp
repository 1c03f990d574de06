#include "lexer/lexer.hpp"

#include <cctype>

namespace luxer {

static bool isBlank(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// `<` followed by a name or `>` (fragment)
bool Lexer::markupStarts() const {
  char next = peek(1);
  return isIdentifierStart(next) || next == '>';
}

Token Lexer::startTag() {
  SourceLocation from = here();
  advance();
  readTagName();
  Token token = makeToken(TokenType::TagOpen, from);

  ModeFrame tag;
  tag.mode = LexMode::MarkupTag;
  modeStack.push_back(tag);
  return token;
}

// Tag and attribute names: `div`, `my-element`, `Foo.Bar`, `xlink:href`
std::string Lexer::readTagName() {
  size_t begin = pos;
  while (!atEnd() && (isIdentifierPart(peek()) || peek() == '-' ||
                      peek() == '.' || peek() == ':')) {
    advance();
  }
  return std::string(source.substr(begin, pos - begin));
}

std::optional<Token> Lexer::nextMarkupTagToken() {
  SourceLocation from = here();
  char c = peek();

  if (isBlank(c)) {
    return readWhitespace();
  }
  if (c == '/' && peek(1) == '>') {
    advance();
    advance();
    popMode();
    return makeToken(TokenType::SelfClose, from);
  }
  if (c == '>') {
    advance();
    frame().mode = LexMode::MarkupText;
    return makeToken(TokenType::TagEnd, from);
  }
  if (c == '{') {
    advance();
    ModeFrame script;
    script.closesOnBrace = true;
    modeStack.push_back(script);
    return makeToken(TokenType::ExpressionStart, from);
  }
  if (isIdentifierStart(c)) {
    readTagName();
    return makeToken(TokenType::AttributeName, from);
  }
  if (c == '=') {
    advance();
    return makeToken(TokenType::Operator, from);
  }
  if (c == '"' || c == '\'') {
    // Attribute values may span lines
    char quote = advance();
    while (!atEnd() && peek() != quote) {
      advance();
    }
    if (atEnd()) {
      fail("Unterminated string literal", from);
    }
    advance();
    return makeToken(TokenType::AttributeValue, from);
  }

  advance();
  return makeToken(TokenType::Unknown, from);
}

std::optional<Token> Lexer::nextMarkupTextToken() {
  SourceLocation from = here();
  char c = peek();

  if (c == '<' && peek(1) == '/') {
    advance();
    advance();
    readTagName();
    frame().mode = LexMode::MarkupCloseTag;
    return makeToken(TokenType::TagClose, from);
  }
  if (c == '<' && markupStarts()) {
    return startTag();
  }
  if (c == '{') {
    advance();
    ModeFrame script;
    script.closesOnBrace = true;
    modeStack.push_back(script);
    return makeToken(TokenType::ExpressionStart, from);
  }
  if (isBlank(c)) {
    return readWhitespace();
  }

  // Text runs to the next tag or expression; trailing whitespace is left for
  // a separate whitespace token
  size_t textEnd = pos;
  for (size_t i = pos; i < source.size(); i++) {
    char ch = source[i];
    char next = i + 1 < source.size() ? source[i + 1] : '\0';
    if (ch == '{' ||
        (ch == '<' && (next == '/' || next == '>' || isIdentifierStart(next)))) {
      break;
    }
    if (!isBlank(ch)) {
      textEnd = i + 1;
    }
  }
  while (pos < textEnd) {
    advance();
  }
  return makeToken(TokenType::Text, from);
}

std::optional<Token> Lexer::nextMarkupCloseTagToken() {
  SourceLocation from = here();
  char c = peek();
  if (isBlank(c)) {
    return readWhitespace();
  }
  advance();
  if (c == '>') {
    popMode();
    return makeToken(TokenType::TagEnd, from);
  }
  return makeToken(TokenType::Unknown, from);
}

} // namespace luxer
