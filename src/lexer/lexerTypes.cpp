#include "lexer/lexer.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace luxer {

static const std::unordered_set<std::string_view> builtinTypes = {
    "string", "number", "boolean", "void",   "null",  "undefined",
    "any",    "unknown", "never",  "object", "symbol", "bigint"};

static const std::unordered_set<std::string_view> typeOperators = {
    "typeof", "keyof", "infer", "readonly"};

// Words that keep their keyword meaning inside a type
static const std::unordered_set<std::string_view> typeKeywords = {
    "as", "is", "asserts", "unique", "new", "this", "true", "false"};

static bool isBlank(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/**
 * Lex one token inside a type annotation. Returns nullopt after popping the
 * frame when the current character ends the annotation; the enclosing mode
 * then lexes that character again.
 */
std::optional<Token> Lexer::nextTypeToken() {
  ModeFrame &typeFrame = frame();
  char c = peek();

  if (isBlank(c)) {
    bool endsType = typeDepthZero(typeFrame) && typeComplete(typeFrame);
    Token whitespace = readWhitespace();
    // Automatic semicolon insertion ends a complete annotation at a newline
    if (endsType && whitespace.value.find('\n') != std::string::npos &&
        !continuesType(pos)) {
      popMode();
    }
    return whitespace;
  }
  if (c == '/' && (peek(1) == '/' || peek(1) == '*')) {
    return readComment();
  }

  bool topLevel = typeDepthZero(typeFrame);
  bool assertion = typeFrame.typeContext == TypeContext::Assertion;
  SourceLocation from = here();

  switch (c) {
  case '=':
    if (peek(1) == '>') {
      if (topLevel && typeFrame.typeContext == TypeContext::ReturnType) {
        popMode();
        return std::nullopt;
      }
      advance();
      advance();
      return makeToken(TokenType::Arrow, from);
    }
    if (topLevel || peek(1) == '=') {
      popMode();
      return std::nullopt;
    }
    advance();
    return makeToken(TokenType::Operator, from);
  case ';':
    if (typeFrame.braceDepth > 0) {
      advance();
      return makeToken(TokenType::Punctuation, from);
    }
    popMode();
    return std::nullopt;
  case ',':
    if (!topLevel) {
      advance();
      return makeToken(TokenType::Punctuation, from);
    }
    popMode();
    return std::nullopt;
  case '{':
    if (objectTypeAllowed(typeFrame)) {
      typeFrame.braceDepth++;
      advance();
      return makeToken(TokenType::Punctuation, from);
    }
    popMode();
    return std::nullopt;
  case '}':
    if (typeFrame.braceDepth > 0) {
      typeFrame.braceDepth--;
      advance();
      return makeToken(TokenType::Punctuation, from);
    }
    popMode();
    return std::nullopt;
  case '(':
    typeFrame.parenDepth++;
    advance();
    return makeToken(TokenType::Punctuation, from);
  case ')':
    if (typeFrame.parenDepth > 0) {
      typeFrame.parenDepth--;
      advance();
      return makeToken(TokenType::Punctuation, from);
    }
    popMode();
    return std::nullopt;
  case '[':
    advance();
    if (peek() == ']') {
      advance();
      return makeToken(TokenType::Punctuation, from);
    }
    typeFrame.bracketDepth++;
    return makeToken(TokenType::TupleOpen, from);
  case ']':
    if (typeFrame.bracketDepth > 0) {
      typeFrame.bracketDepth--;
      advance();
      return makeToken(TokenType::TupleClose, from);
    }
    popMode();
    return std::nullopt;
  case '<':
    typeFrame.genericDepth++;
    advance();
    return makeToken(TokenType::GenericOpen, from);
  case '>':
    if (typeFrame.genericDepth > 0) {
      typeFrame.genericDepth--;
      advance();
      Token token = makeToken(TokenType::GenericClose, from);
      if (typeFrame.typeContext == TypeContext::TypeArguments &&
          typeFrame.genericDepth == 0) {
        popMode();
      }
      return token;
    }
    popMode();
    return std::nullopt;
  case '|':
  case '&':
    if (peek(1) == c) {
      // `||` and `&&` only appear once the expression resumes
      popMode();
      return std::nullopt;
    }
    advance();
    return makeToken(TokenType::Operator, from);
  case '?':
  case ':':
    // A ternary after `x as T` belongs to the expression
    if (assertion && topLevel) {
      popMode();
      return std::nullopt;
    }
    advance();
    return makeToken(c == '?' ? TokenType::QuestionMark : TokenType::Colon,
                     from);
  case '+':
  case '-':
    advance();
    return makeToken(TokenType::Operator, from);
  case '.':
    if (peek(1) == '.' && peek(2) == '.') {
      advance();
      advance();
      advance();
      return makeToken(TokenType::Operator, from);
    }
    advance();
    return makeToken(TokenType::Punctuation, from);
  case '"':
  case '\'':
    return readString();
  case '`':
    return readTemplate();
  default:
    break;
  }

  if (std::isdigit(static_cast<unsigned char>(c))) {
    return readNumber();
  }
  if (isIdentifierStart(c)) {
    return readTypeWord();
  }

  popMode();
  return std::nullopt;
}

Token Lexer::readTypeWord() {
  SourceLocation from = here();
  while (!atEnd() && isIdentifierPart(peek())) {
    advance();
  }
  Token token = makeToken(TokenType::TypeName, from);
  const std::string &word = token.value;
  ModeFrame &typeFrame = frame();

  if (word == "const" && typeFrame.typeContext == TypeContext::Assertion &&
      !typeFrame.typeStarted) {
    token.type = TokenType::AsConst;
    popMode();
    return token;
  }
  if (typeOperators.count(word)) {
    token.type = TokenType::TypeOperator;
    return token;
  }
  if (word == "extends") {
    token.type = TokenType::Extends;
    return token;
  }
  if (word == "in") {
    token.type = TokenType::MappedIn;
    return token;
  }
  if (builtinTypes.count(word)) {
    return token;
  }
  if (typeKeywords.count(word)) {
    token.type = TokenType::Keyword;
    return token;
  }

  // Qualifier of a dotted name: `React.ReactNode`
  if (peek() == '.' && isIdentifierStart(peek(1))) {
    token.type = TokenType::Identifier;
    return token;
  }

  // Property key or parameter name: `{ name: T }`, `(value: T) => U`
  if (typeFrame.braceDepth > 0 || typeFrame.parenDepth > 0) {
    size_t next = pos;
    while (next < source.size() && isBlank(source[next])) {
      next++;
    }
    char after = next < source.size() ? source[next] : '\0';
    char afterNext = next + 1 < source.size() ? source[next + 1] : '\0';
    if (after == ':' || (after == '?' && afterNext == ':') ||
        (after == '(' && typeFrame.braceDepth > 0)) {
      token.type = TokenType::Identifier;
    }
  }
  return token;
}

bool Lexer::typeDepthZero(const ModeFrame &typeFrame) const {
  return typeFrame.genericDepth == 0 && typeFrame.parenDepth == 0 &&
         typeFrame.braceDepth == 0 && typeFrame.bracketDepth == 0;
}

// `{` opens an object type unless a complete type precedes it
bool Lexer::objectTypeAllowed(const ModeFrame &typeFrame) const {
  if (!typeFrame.typeStarted) {
    return true;
  }
  switch (typeFrame.lastTypeToken) {
  case TokenType::Colon:
  case TokenType::Operator:
  case TokenType::Arrow:
  case TokenType::GenericOpen:
  case TokenType::TupleOpen:
  case TokenType::QuestionMark:
  case TokenType::Extends:
  case TokenType::TypeOperator:
    return true;
  case TokenType::Punctuation:
    return typeFrame.lastTypeValue == "(" || typeFrame.lastTypeValue == "," ||
           typeFrame.lastTypeValue == "{" || typeFrame.lastTypeValue == ";";
  default:
    return false;
  }
}

bool Lexer::typeComplete(const ModeFrame &typeFrame) const {
  if (!typeFrame.typeStarted) {
    return false;
  }
  switch (typeFrame.lastTypeToken) {
  case TokenType::TypeName:
  case TokenType::Identifier:
  case TokenType::Keyword:
  case TokenType::GenericClose:
  case TokenType::TupleClose:
  case TokenType::String:
  case TokenType::Number:
  case TokenType::TemplateString:
    return true;
  case TokenType::Punctuation:
    return typeFrame.lastTypeValue == ")" || typeFrame.lastTypeValue == "}" ||
           typeFrame.lastTypeValue == "[]";
  default:
    return false;
  }
}

// Union, intersection or `extends` on the next line keeps the type open
bool Lexer::continuesType(size_t at) const {
  while (at < source.size() && isBlank(source[at])) {
    at++;
  }
  if (at >= source.size()) {
    return false;
  }
  char c = source[at];
  if (c == '|' || c == '&') {
    return true;
  }
  std::string_view rest = source.substr(at);
  return rest.starts_with("extends") &&
         (rest.size() == 7 || !isIdentifierPart(rest[7]));
}

/**
 * Bounded lookahead for `name<...>(`. Only characters that can appear in type
 * arguments are allowed before the matching `>`.
 */
bool Lexer::looksLikeGenericCall() const {
  const size_t limit = std::min(source.size(), pos + 256);
  int depth = 1;
  size_t i = pos + 1;
  while (i < limit) {
    char c = source[i];
    char next = i + 1 < source.size() ? source[i + 1] : '\0';
    if (c == '<') {
      depth++;
    } else if (c == '>') {
      if (--depth == 0) {
        i++;
        while (i < source.size() && isBlank(source[i])) {
          i++;
        }
        return i < source.size() && source[i] == '(';
      }
    } else if (c == '"' || c == '\'') {
      size_t close = source.find(c, i + 1);
      if (close == std::string_view::npos || close >= limit) {
        return false;
      }
      i = close;
    } else if (c == '=') {
      if (next != '>') {
        return false;
      }
      i++;
    } else if ((c == '&' || c == '|') && next == c) {
      return false;
    } else if (!isIdentifierPart(c) && !isBlank(c) &&
               std::string_view(",.[]|&()?:{};").find(c) ==
                   std::string_view::npos) {
      return false;
    }
    i++;
  }
  return false;
}

// `<T,` or `<T extends` opens the type parameters of a generic arrow function
bool Lexer::looksLikeGenericArrow() const {
  size_t i = pos + 1;
  while (i < source.size() && isBlank(source[i])) {
    i++;
  }
  if (i >= source.size() || !isIdentifierStart(source[i])) {
    return false;
  }
  while (i < source.size() && isIdentifierPart(source[i])) {
    i++;
  }
  while (i < source.size() && isBlank(source[i])) {
    i++;
  }
  if (i >= source.size()) {
    return false;
  }
  if (source[i] == ',') {
    return true;
  }
  std::string_view rest = source.substr(i);
  return rest.starts_with("extends") && rest.size() > 7 &&
         !isIdentifierPart(rest[7]);
}

// The name after class/interface/type/function, or any name in a class or
// interface heading (`extends Base<T>`)
bool Lexer::genericDeclarationContext() const {
  if (modeStack.back().brackets.back().pendingTypeBody) {
    return true;
  }
  if (previous.type != TokenType::Keyword) {
    return false;
  }
  return previous.value == "class" || previous.value == "interface" ||
         previous.value == "type" || previous.value == "function";
}

} // namespace luxer
