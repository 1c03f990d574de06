#include "lexer/lexer.hpp"

#include <cctype>
#include <unordered_set>

namespace luxer {

static const std::unordered_set<std::string_view> keywords = {
    "break",      "case",      "catch",    "class",     "const",
    "continue",   "debugger",  "default",  "delete",    "do",
    "else",       "enum",      "export",   "extends",   "false",
    "finally",    "for",       "function", "if",        "import",
    "in",         "instanceof", "let",     "new",       "null",
    "return",     "static",    "super",    "switch",    "this",
    "throw",      "true",      "try",      "typeof",    "undefined",
    "var",        "void",      "while",    "with",      "yield",
    "async",      "await",     "implements", "interface", "package",
    "private",    "protected", "public",   "as",        "from",
    "type",       "namespace", "module",   "declare",   "readonly"};

// Keywords that end an operand rather than expect one
static const std::unordered_set<std::string_view> valueKeywords = {
    "this", "true", "false", "null", "undefined", "super"};

// Ordered so that the longest operator is tried first
static const std::string_view operators[] = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=",
    "??=",  "==",  "!=",  "<=",  ">=",  "&&",  "||",  "??",  "?.",  "++",
    "--",   "+=",  "-=",  "*=",  "/=",  "%=",  "&=",  "|=",  "^=",  "**",
    "<<",   ">>",  "+",   "-",   "*",   "/",   "%",   "=",   "<",   ">",
    "!",    "&",   "|",   "^",   "~",   "?",   ":"};

static bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool isDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static bool isOneOf(char c, std::string_view set) {
  return c != '\0' && set.find(c) != std::string_view::npos;
}

bool isIdentifierStart(char character) {
  auto c = static_cast<unsigned char>(character);
  return std::isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

bool isIdentifierPart(char character) {
  return isIdentifierStart(character) || isDigit(character);
}

bool isKeyword(std::string_view word) { return keywords.count(word) > 0; }

Lexer::Lexer(std::string_view source, LexerOptions options, std::string origin)
    : source(source), options(options), origin(std::move(origin)) {
  modeStack.push_back(ModeFrame{});
}

std::vector<Token> Lexer::tokenizeAll() {
  std::vector<Token> tokens;
  while (!atEnd()) {
    std::optional<Token> token = nextToken();
    if (token) {
      emit(std::move(*token), tokens);
    }
  }

  Token end;
  end.type = TokenType::EndOfInput;
  end.start = pos;
  end.end = pos;
  end.line = line;
  end.column = column;
  tokens.push_back(end);
  return tokens;
}

std::optional<Token> Lexer::nextToken() {
  switch (frame().mode) {
  case LexMode::Normal: {
    std::optional<Token> token = nextNormalToken();
    if (token) {
      trackAlias(*token);
    }
    return token;
  }
  case LexMode::TypeAnnotation: {
    size_t depth = modeStack.size();
    std::optional<Token> token = nextTypeToken();
    if (token && modeStack.size() == depth &&
        token->type != TokenType::Whitespace &&
        token->type != TokenType::Comment) {
      frame().typeStarted = true;
      frame().lastTypeToken = token->type;
      frame().lastTypeValue = token->value;
    }
    return token;
  }
  case LexMode::MarkupTag:
    return nextMarkupTagToken();
  case LexMode::MarkupText:
    return nextMarkupTextToken();
  case LexMode::MarkupCloseTag:
    return nextMarkupCloseTagToken();
  }
  return std::nullopt;
}

void Lexer::emit(Token token, std::vector<Token> &tokens) {
  if (token.type == TokenType::Whitespace) {
    if (options.includeWhitespace) {
      tokens.push_back(std::move(token));
    }
    return;
  }
  if (token.type == TokenType::Comment) {
    if (options.includeComments) {
      tokens.push_back(std::move(token));
    }
    return;
  }
  previous = std::move(last);
  last = {token.type, token.value};
  haveLast = true;
  tokens.push_back(std::move(token));
}

char Lexer::peek(size_t ahead) const {
  if (pos + ahead >= source.size()) {
    return '\0';
  }
  return source[pos + ahead];
}

char Lexer::advance() {
  char c = source[pos++];
  if (c == '\n') {
    line++;
    column = 1;
  } else {
    column++;
  }
  return c;
}

Token Lexer::makeToken(TokenType type, const SourceLocation &from) const {
  Token token;
  token.type = type;
  token.value = std::string(source.substr(from.offset, pos - from.offset));
  token.start = from.offset;
  token.end = pos;
  token.line = from.line;
  token.column = from.column;
  return token;
}

void Lexer::fail(const std::string &message, const SourceLocation &from) const {
  throw LexError(Diagnostic(message, from, origin));
}

std::optional<Token> Lexer::nextNormalToken() {
  char c = peek();

  if (isSpace(c)) {
    return readWhitespace();
  }
  if (c == '/' && (peek(1) == '/' || peek(1) == '*')) {
    return readComment();
  }
  if (c == '@' && isIdentifierStart(peek(1))) {
    SourceLocation from = here();
    advance();
    while (!atEnd() && isIdentifierPart(peek())) {
      advance();
    }
    return makeToken(TokenType::Decorator, from);
  }
  if (c == '"' || c == '\'') {
    return readString();
  }
  if (c == '`') {
    return readTemplate();
  }
  if (isDigit(c) || (c == '.' && isDigit(peek(1)))) {
    return readNumber();
  }
  if (isIdentifierStart(c)) {
    return readWord();
  }
  if (c == '/') {
    return expressionExpected() ? readRegex() : readOperator();
  }
  if (c == '<') {
    return readLess();
  }
  if (c == ':') {
    return readColon();
  }
  if (c == '?') {
    return readQuestion();
  }
  if (c == '=' && peek(1) == '>') {
    SourceLocation from = here();
    advance();
    advance();
    return makeToken(TokenType::Arrow, from);
  }
  if (isOneOf(c, "(){}[];,.")) {
    return readPunctuation();
  }
  if (isOneOf(c, "+-*%=<>!&|^~")) {
    return readOperator();
  }

  SourceLocation from = here();
  advance();
  return makeToken(TokenType::Unknown, from);
}

Token Lexer::readWhitespace() {
  SourceLocation from = here();
  while (!atEnd() && isSpace(peek())) {
    advance();
  }
  return makeToken(TokenType::Whitespace, from);
}

Token Lexer::readComment() {
  SourceLocation from = here();
  advance();
  if (advance() == '/') {
    while (!atEnd() && peek() != '\n') {
      advance();
    }
    return makeToken(TokenType::Comment, from);
  }

  while (!atEnd()) {
    if (peek() == '*' && peek(1) == '/') {
      advance();
      advance();
      return makeToken(TokenType::Comment, from);
    }
    advance();
  }
  fail("Unterminated block comment", from);
}

Token Lexer::readString() {
  SourceLocation from = here();
  char quote = advance();
  while (true) {
    if (atEnd() || peek() == '\n') {
      fail("Unterminated string literal", from);
    }
    char c = advance();
    if (c == '\\') {
      if (!atEnd()) {
        advance();
      }
    } else if (c == quote) {
      break;
    }
  }
  return makeToken(TokenType::String, from);
}

/**
 * Template literals are one opaque token. Interpolations may contain nested
 * templates, strings and braces, so the scan keeps its own stack of open
 * template and interpolation levels.
 */
Token Lexer::readTemplate() {
  SourceLocation from = here();
  advance();

  // -1 marks template text; any other value is the brace depth inside `${}`
  std::vector<int> levels{-1};
  while (!levels.empty()) {
    if (atEnd()) {
      fail("Unterminated template literal", from);
    }
    char c = peek();
    int &level = levels.back();

    if (level < 0) {
      if (c == '\\') {
        advance();
        if (!atEnd()) {
          advance();
        }
      } else if (c == '`') {
        advance();
        levels.pop_back();
      } else if (c == '$' && peek(1) == '{') {
        advance();
        advance();
        levels.push_back(0);
      } else {
        advance();
      }
      continue;
    }

    if (c == '"' || c == '\'') {
      char quote = advance();
      while (!atEnd() && peek() != quote) {
        if (advance() == '\\' && !atEnd()) {
          advance();
        }
      }
      if (atEnd()) {
        fail("Unterminated template literal", from);
      }
      advance();
    } else if (c == '`') {
      advance();
      levels.push_back(-1);
    } else if (c == '{') {
      advance();
      level++;
    } else if (c == '}') {
      advance();
      if (level == 0) {
        levels.pop_back();
      } else {
        level--;
      }
    } else {
      advance();
    }
  }
  return makeToken(TokenType::TemplateString, from);
}

Token Lexer::readNumber() {
  SourceLocation from = here();
  char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1))));
  if (peek() == '0' && (prefix == 'x' || prefix == 'o' || prefix == 'b')) {
    advance();
    advance();
    while (!atEnd() &&
           (std::isxdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
      advance();
    }
  } else {
    while (!atEnd() && (isDigit(peek()) || peek() == '_')) {
      advance();
    }
    if (peek() == '.' && isDigit(peek(1))) {
      advance();
      while (!atEnd() && (isDigit(peek()) || peek() == '_')) {
        advance();
      }
    }
    if ((peek() == 'e' || peek() == 'E') &&
        (isDigit(peek(1)) ||
         ((peek(1) == '+' || peek(1) == '-') && isDigit(peek(2))))) {
      advance();
      advance();
      while (!atEnd() && isDigit(peek())) {
        advance();
      }
    }
  }
  if (peek() == 'n') {
    advance();
  }
  return makeToken(TokenType::Number, from);
}

Token Lexer::readRegex() {
  SourceLocation from = here();
  advance();
  bool inClass = false;
  while (true) {
    if (atEnd() || peek() == '\n') {
      fail("Unterminated regex literal", from);
    }
    char c = advance();
    if (c == '\\') {
      if (!atEnd() && peek() != '\n') {
        advance();
      }
    } else if (c == '[') {
      inClass = true;
    } else if (c == ']') {
      inClass = false;
    } else if (c == '/' && !inClass) {
      break;
    }
  }
  while (!atEnd() && isIdentifierPart(peek())) {
    advance();
  }
  return makeToken(TokenType::Regex, from);
}

Token Lexer::readOperator() {
  SourceLocation from = here();
  std::string_view rest = source.substr(pos);
  for (std::string_view op : operators) {
    if (!rest.starts_with(op)) {
      continue;
    }
    // `a?.5:b` is a ternary, not optional chaining
    if (op == "?." && rest.size() > 2 && isDigit(rest[2])) {
      continue;
    }
    for (size_t i = 0; i < op.size(); i++) {
      advance();
    }
    return makeToken(TokenType::Operator, from);
  }
  advance();
  return makeToken(TokenType::Unknown, from);
}

Token Lexer::readPunctuation() {
  SourceLocation from = here();
  if (peek() == '.' && peek(1) == '.' && peek(2) == '.') {
    advance();
    advance();
    advance();
    return makeToken(TokenType::Operator, from);
  }

  char c = advance();
  ModeFrame &current = frame();
  switch (c) {
  case '(':
  case '[': {
    BracketFrame inner;
    inner.open = c;
    current.brackets.push_back(inner);
    break;
  }
  case '{': {
    BracketFrame inner;
    inner.open = c;
    inner.typeBody = current.brackets.back().pendingTypeBody;
    current.brackets.back().pendingTypeBody = false;
    current.brackets.push_back(inner);
    break;
  }
  case ')':
  case ']':
  case '}':
    if (current.brackets.size() > 1) {
      current.brackets.pop_back();
    } else if (c == '}' && current.closesOnBrace) {
      popMode();
      return makeToken(TokenType::ExpressionEnd, from);
    }
    break;
  case ';': {
    BracketFrame &level = current.brackets.back();
    level.declaration = false;
    level.pendingTypeBody = false;
    level.ternaryDepth = 0;
    moduleClause = false;
    break;
  }
  default:
    break;
  }
  return makeToken(TokenType::Punctuation, from);
}

Token Lexer::readWord() {
  SourceLocation from = here();
  while (!atEnd() && isIdentifierPart(peek())) {
    advance();
  }
  Token token = makeToken(TokenType::Identifier, from);

  // Property names may be spelled like keywords
  bool afterDot = haveLast && (last.type == TokenType::Punctuation ||
                               last.type == TokenType::Operator) &&
                  (last.value == "." || last.value == "?.");
  if (afterDot || !isKeyword(token.value)) {
    return token;
  }

  token.type = TokenType::Keyword;
  const std::string &word = token.value;
  if (word == "let" || word == "const" || word == "var") {
    bracket().declaration = true;
    moduleClause = false;
  } else if (word == "class" || word == "interface") {
    bracket().pendingTypeBody = true;
    moduleClause = false;
  } else if (word == "import" || word == "export") {
    moduleClause = true;
  } else if (word == "from" || word == "function" || word == "default") {
    moduleClause = false;
  } else if (word == "as" && !moduleClause && operandBefore()) {
    pushType(TypeContext::Assertion);
  }
  return token;
}

Token Lexer::readColon() {
  SourceLocation from = here();
  advance();

  BracketFrame &level = bracket();
  if (level.ternaryDepth > 0) {
    level.ternaryDepth--;
    return makeToken(TokenType::Operator, from);
  }
  if (!haveLast) {
    return makeToken(TokenType::Operator, from);
  }

  bool annotated = false;
  TypeContext context = TypeContext::Binding;
  bool bindingLevel = level.open == '(' || level.declaration;
  if (last.type == TokenType::Punctuation && last.value == ")") {
    annotated = true;
    context = TypeContext::ReturnType;
  } else if (last.type == TokenType::Identifier ||
             last.type == TokenType::QuestionMark ||
             (last.type == TokenType::Keyword && last.value == "this") ||
             (last.type == TokenType::Punctuation && last.value == "]")) {
    annotated = bindingLevel || level.typeBody;
  } else if (last.type == TokenType::Punctuation && last.value == "}") {
    // Destructured parameter or declaration
    annotated = bindingLevel;
  }

  if (!annotated) {
    return makeToken(TokenType::Operator, from);
  }
  pushType(context);
  return makeToken(TokenType::Colon, from);
}

Token Lexer::readQuestion() {
  SourceLocation from = here();
  char next = peek(1);

  bool optionalMarker =
      haveLast &&
      (last.type == TokenType::Identifier || last.type == TokenType::Keyword ||
       (last.type == TokenType::Punctuation && last.value == "]")) &&
      (next == ':' || (next == '(' && bracket().typeBody));
  if (optionalMarker) {
    advance();
    return makeToken(TokenType::QuestionMark, from);
  }
  if (next == '?' || next == '.') {
    Token token = readOperator();
    if (token.value != "?") {
      return token;
    }
    bracket().ternaryDepth++;
    return token;
  }
  advance();
  bracket().ternaryDepth++;
  return makeToken(TokenType::Operator, from);
}

Token Lexer::readLess() {
  if (haveLast && last.type == TokenType::Identifier &&
      (genericDeclarationContext() || looksLikeGenericCall())) {
    SourceLocation from = here();
    advance();
    pushType(TypeContext::TypeArguments, 1);
    return makeToken(TokenType::GenericOpen, from);
  }
  if (expressionExpected()) {
    if (looksLikeGenericArrow()) {
      SourceLocation from = here();
      advance();
      pushType(TypeContext::TypeArguments, 1);
      return makeToken(TokenType::GenericOpen, from);
    }
    if (markupStarts()) {
      return startTag();
    }
  }
  return readOperator();
}

// True where an operand (and therefore a regex, markup or generic arrow) may
// start, false after something that completes an operand
bool Lexer::expressionExpected() const {
  if (!haveLast) {
    return true;
  }
  switch (last.type) {
  case TokenType::Operator:
  case TokenType::Arrow:
  case TokenType::Colon:
  case TokenType::QuestionMark:
  case TokenType::ExpressionStart:
    return true;
  case TokenType::Keyword:
    return valueKeywords.count(last.value) == 0;
  case TokenType::Punctuation:
    return last.value != ")" && last.value != "]" && last.value != "}";
  default:
    return false;
  }
}

bool Lexer::operandBefore() const {
  if (!haveLast) {
    return false;
  }
  switch (last.type) {
  case TokenType::Identifier:
  case TokenType::String:
  case TokenType::Number:
  case TokenType::TemplateString:
  case TokenType::Regex:
  case TokenType::TypeName:
  case TokenType::GenericClose:
  case TokenType::TagEnd:
  case TokenType::SelfClose:
    return true;
  case TokenType::Keyword:
    return valueKeywords.count(last.value) > 0;
  case TokenType::Punctuation:
    return last.value == ")" || last.value == "]" || last.value == "}";
  default:
    return false;
  }
}

bool Lexer::statementStart() const {
  if (!haveLast) {
    return true;
  }
  if (last.type == TokenType::Punctuation) {
    return last.value == ";" || last.value == "{" || last.value == "}";
  }
  return last.type == TokenType::Keyword &&
         (last.value == "export" || last.value == "declare");
}

void Lexer::pushType(TypeContext context, int genericDepth) {
  ModeFrame typeFrame;
  typeFrame.mode = LexMode::TypeAnnotation;
  typeFrame.typeContext = context;
  typeFrame.genericDepth = genericDepth;
  modeStack.push_back(typeFrame);
}

void Lexer::popMode() {
  if (modeStack.size() > 1) {
    modeStack.pop_back();
  }
}

// `type Name<...> =` switches to a type annotation after the `=`
void Lexer::trackAlias(const Token &token) {
  if (token.type == TokenType::Whitespace || token.type == TokenType::Comment) {
    return;
  }
  if (token.is(TokenType::Keyword, "type")) {
    aliasState = statementStart() ? 1 : 0;
    return;
  }
  if (aliasState == 1 && token.type == TokenType::Identifier) {
    aliasState = 2;
    return;
  }
  if (aliasState == 2 && token.type == TokenType::GenericOpen) {
    return;
  }
  if (aliasState == 2 && token.is(TokenType::Operator, "=")) {
    pushType(TypeContext::Alias);
  }
  aliasState = 0;
}

std::vector<Token> tokenize(std::string_view source,
                            const LexerOptions &options) {
  Lexer lexer(source, options);
  return lexer.tokenizeAll();
}

std::vector<Diagnostic> unknownTokenWarnings(std::span<const Token> tokens,
                                             const std::string &origin) {
  std::vector<Diagnostic> warnings;
  for (const Token &token : tokens) {
    if (token.type != TokenType::Unknown) {
      continue;
    }
    SourceLocation location;
    location.offset = token.start;
    location.line = token.line;
    location.column = token.column;
    warnings.emplace_back("Unrecognized character '" + token.value + "'",
                          location, origin, DiagnosticSeverity::Warning);
  }
  return warnings;
}

std::vector<Token> tokenize(std::string_view source, bool includeWhitespace,
                            bool includeComments) {
  LexerOptions options;
  options.includeWhitespace = includeWhitespace;
  options.includeComments = includeComments;
  return tokenize(source, options);
}

} // namespace luxer
