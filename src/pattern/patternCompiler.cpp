#include "pattern/patternCompiler.hpp"
#include "pattern/shorthands.hpp"

#include <cctype>

namespace luxer {

static bool isLetter(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

static bool isDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static bool isLower(const std::string_view &code) {
  for (char c : code) {
    if (!std::islower(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

static bool isUpper(const std::string_view &code) {
  for (char c : code) {
    if (!std::isupper(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

static std::string toLower(std::string_view code) {
  std::string result(code);
  for (char &c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

PatternCompiler::PatternCompiler(std::string_view text) : text(text) {}

CompiledPattern PatternCompiler::compile() {
  std::string source(text);
  PatternNodePtr root = parseAlternation();
  skipWhitespace();
  if (!atEnd()) {
    if (peek() == ')') {
      fail("Unbalanced ')' without matching '('", pos);
    }
    if (peek() == ']') {
      fail("Unbalanced ']' without matching '['", pos);
    }
    fail(std::string("Unexpected character '") + peek() + "'", pos);
  }
  resolveReferences();
  return CompiledPattern(std::move(source), std::move(root),
                         std::move(captureNames));
}

PatternNodePtr PatternCompiler::parseAlternation() {
  size_t start = pos;
  PatternNodePtr first = parseSequence();
  skipWhitespace();
  if (peek() != '|') {
    return first;
  }

  PatternNodePtr alternation = makeNode(PatternNodeType::Alternation, start);
  alternation->children.push_back(std::move(first));
  while (peek() == '|') {
    pos++;
    alternation->children.push_back(parseSequence());
    skipWhitespace();
  }
  return alternation;
}

PatternNodePtr PatternCompiler::parseSequence() {
  PatternNodePtr sequence = makeNode(PatternNodeType::Sequence, pos);
  while (true) {
    skipWhitespace();
    if (atEnd() || peek() == ')' || peek() == ']' || peek() == '|') {
      break;
    }
    sequence->children.push_back(parseElement());
  }
  if (sequence->children.size() == 1) {
    return std::move(sequence->children.front());
  }
  return sequence;
}

PatternNodePtr PatternCompiler::parseElement() {
  PatternNodePtr atom = parseAtom();
  return parseQuantifier(std::move(atom));
}

PatternNodePtr PatternCompiler::parseAtom() {
  size_t start = pos;
  char c = peek();
  switch (c) {
  case '(':
    return parseGroup();
  case '[':
    return parseBracketAlternation();
  case '\\':
    return parseEscape();
  case '.':
    pos++;
    return makeNode(PatternNodeType::Any, start);
  case '"': {
    PatternNodePtr literal = makeNode(PatternNodeType::Literal, start);
    literal->value = parseLiteralValue();
    return literal;
  }
  case '<':
    return parseMarkupShorthand();
  case '*':
  case '+':
  case '?':
  case '{':
    fail(std::string("Quantifier '") + c + "' has nothing to repeat", start);
  default:
    fail(std::string("Unexpected character '") + c + "'", start);
  }
}

PatternNodePtr PatternCompiler::parseGroup() {
  size_t start = pos;
  pos++; // (

  PatternNodePtr group = makeNode(PatternNodeType::Group, start);
  if (peek() == '?') {
    pos++;
    char kind = peek();
    if (kind == ':') {
      pos++;
    } else if (kind == '=' || kind == '!') {
      pos++;
      group->type = PatternNodeType::Lookaround;
      group->ahead = true;
      group->positive = kind == '=';
    } else if (kind == '<' && (peek(1) == '=' || peek(1) == '!')) {
      group->type = PatternNodeType::Lookaround;
      group->ahead = false;
      group->positive = peek(1) == '=';
      pos += 2;
    } else if (kind == '<') {
      pos++;
      size_t nameStart = pos;
      std::string name = readName();
      if (name.empty()) {
        fail("Expected a group name after '(?<'", nameStart);
      }
      expect('>', "Expected '>' after group name", pos);
      for (const std::string &existing : captureNames) {
        if (existing == name) {
          fail("Duplicate capture name '" + name + "'", nameStart);
        }
      }
      group->captureIndex = captureNames.size();
      group->captureName = name;
      captureNames.push_back(name);
    } else {
      fail("Unknown group construct '(?" + std::string(1, kind) + "'", start);
    }
  } else {
    group->captureIndex = captureNames.size();
    captureNames.emplace_back();
  }

  group->children.push_back(parseAlternation());
  skipWhitespace();
  if (peek() != ')') {
    fail("Unbalanced '(' without matching ')'", start);
  }
  pos++;
  return group;
}

// `[a|b|c]` is a non-capturing alternation
PatternNodePtr PatternCompiler::parseBracketAlternation() {
  size_t start = pos;
  pos++; // [
  skipWhitespace();
  if (peek() == ']') {
    fail("Empty alternative set '[]'", start);
  }

  PatternNodePtr group = makeNode(PatternNodeType::Group, start);
  group->children.push_back(parseAlternation());
  skipWhitespace();
  if (peek() != ']') {
    fail("Unbalanced '[' without matching ']'", start);
  }
  pos++;
  return group;
}

PatternNodePtr PatternCompiler::parseEscape() {
  size_t start = pos;
  pos++; // backslash
  if (atEnd()) {
    fail("Pattern ends with an unfinished escape", start);
  }
  char c = peek();

  if (isDigit(c) || (c == 'k' && peek(1) == '<')) {
    return parseBackreference(start);
  }

  if (c == 'J' && peek(1) == 'e') {
    pos += 2;
    return makeNode(PatternNodeType::MarkupElement, start);
  }

  if (c == 'B') {
    pos++;
    char kind = peek();
    if (!atEnd()) {
      pos++;
    }
    PatternNodePtr node = makeNode(PatternNodeType::Balanced, start);
    switch (kind) {
    case 'p':
      node->openValue = "(";
      node->closeValue = ")";
      break;
    case 'b':
      node->openValue = "{";
      node->closeValue = "}";
      break;
    case 'k':
      node->openValue = "[";
      node->closeValue = "]";
      break;
    case 'a':
      node->openValue = "<";
      node->closeValue = ">";
      break;
    case 'c':
      node->type = PatternNodeType::BalancedUntil;
      node->stopValues = {","};
      node->closerValues = {"}", "]", ")"};
      break;
    case 's':
      node->type = PatternNodeType::BalancedUntil;
      node->stopValues = {";"};
      node->closerValues = {"}"};
      break;
    default:
      fail(std::string("Unknown balanced type '\\B") + kind +
               "', expected one of p b k a c s",
           start);
    }
    return node;
  }

  size_t letters = 0;
  while (isLetter(peek(letters))) {
    letters++;
  }
  std::string_view word = text.substr(pos, letters);

  if (letters > 1) {
    if (auto expansion = macroExpansion(word)) {
      pos += letters;
      return parseMacro(*expansion, start);
    }
  }

  std::optional<TokenType> type;
  bool negated = false;
  if (letters >= 2) {
    std::string_view code = word.substr(0, 2);
    if (isLower(code) || isUpper(code)) {
      type = twoLetterShorthand(toLower(code));
      if (type) {
        negated = isUpper(code);
        pos += 2;
      }
    }
  }
  if (!type && letters >= 1) {
    std::string code = toLower(word.substr(0, 1));
    type = singleLetterShorthand(code[0]);
    if (type) {
      negated = isUpper(word.substr(0, 1));
      pos += 1;
    }
  }
  if (!type) {
    fail("Unknown shorthand '\\" + std::string(letters > 0 ? word : text.substr(pos, 1)) + "'",
         start);
  }

  PatternNodePtr node = makeNode(PatternNodeType::TokenClass, start);
  node->tokenType = *type;
  node->negated = negated;
  if (peek() == '"') {
    node->value = parseLiteralValue();
  }
  return node;
}

// `\N`, `\k<name>`, each with an optional `@depth` suffix
PatternNodePtr PatternCompiler::parseBackreference(size_t start) {
  PatternNodePtr node = makeNode(PatternNodeType::Backreference, start);
  if (peek() == 'k') {
    pos += 2; // k<
    size_t nameStart = pos;
    std::string name = readName();
    if (name.empty()) {
      fail("Expected a group name after '\\k<'", nameStart);
    }
    expect('>', "Expected '>' after backreference name", pos);
    namedReferences.push_back({node.get(), name, start});
  } else {
    size_t digitsStart = pos;
    node->referencedGroup = readCount();
    if (node->referencedGroup == 0) {
      fail("Backreference group numbers start at 1", digitsStart);
    }
    node->offset = start;
    positionalReferences.push_back(node.get());
  }
  node->depth = parseDepthSuffix();
  return node;
}

std::optional<DepthConstraint> PatternCompiler::parseDepthSuffix() {
  if (peek() != '@') {
    return std::nullopt;
  }
  size_t start = pos;
  pos++;

  DepthConstraint constraint;
  int sign = 1;
  if (peek() == '+' || peek() == '-') {
    constraint.relative = true;
    sign = peek() == '-' ? -1 : 1;
    pos++;
  }
  if (!isDigit(peek())) {
    fail("Expected a depth after '@'", start);
  }
  constraint.depth = sign * static_cast<int>(readCount());
  return constraint;
}

/**
 * Markup shorthands:
 *   <name          opening tag `<name`
 *   </name>        closing tag `</name` followed by its `>`
 *   </\1@0>        closing tag whose name equals capture 1
 */
PatternNodePtr PatternCompiler::parseMarkupShorthand() {
  size_t start = pos;
  pos++; // <

  if (peek() != '/') {
    std::string name = readName();
    if (name.empty()) {
      fail("Expected a tag name after '<'", start);
    }
    PatternNodePtr open = makeNode(PatternNodeType::TokenClass, start);
    open->tokenType = TokenType::TagOpen;
    open->value = "<" + name;
    return open;
  }

  pos++; // /
  if (peek() == '\\') {
    size_t escape = pos;
    pos++;
    if (!isDigit(peek()) && !(peek() == 'k' && peek(1) == '<')) {
      fail("Expected a backreference in closing tag shorthand", escape);
    }
    PatternNodePtr reference = parseBackreference(escape);
    reference->offset = start;
    reference->closeTag = true;
    expect('>', "Expected '>' to end closing tag shorthand", pos);
    return reference;
  }

  std::string name = readName();
  expect('>', "Expected '>' to end closing tag shorthand", pos);

  PatternNodePtr sequence = makeNode(PatternNodeType::Sequence, start);
  PatternNodePtr close = makeNode(PatternNodeType::TokenClass, start);
  close->tokenType = TokenType::TagClose;
  close->value = "</" + name;
  PatternNodePtr end = makeNode(PatternNodeType::TokenClass, start);
  end->tokenType = TokenType::TagEnd;
  end->value = ">";
  sequence->children.push_back(std::move(close));
  sequence->children.push_back(std::move(end));

  PatternNodePtr group = makeNode(PatternNodeType::Group, start);
  group->children.push_back(std::move(sequence));
  return group;
}

// Macros compile in place; every node they produce reports the macro's offset
PatternNodePtr PatternCompiler::parseMacro(std::string_view expansion,
                                           size_t start) {
  std::string_view savedText = text;
  size_t savedPos = pos;
  std::optional<size_t> savedOffset = macroOffset;
  if (!macroOffset) {
    macroOffset = start;
  }

  text = expansion;
  pos = 0;
  PatternNodePtr body = parseAlternation();
  if (!atEnd()) {
    fail("Malformed macro expansion", start);
  }

  text = savedText;
  pos = savedPos;
  macroOffset = savedOffset;

  PatternNodePtr group = makeNode(PatternNodeType::Group, start);
  group->children.push_back(std::move(body));
  return group;
}

PatternNodePtr PatternCompiler::parseQuantifier(PatternNodePtr atom) {
  skipWhitespace();
  size_t start = pos;
  size_t minCount = 0;
  std::optional<size_t> maxCount;

  switch (peek()) {
  case '*':
    pos++;
    break;
  case '+':
    pos++;
    minCount = 1;
    break;
  case '?':
    pos++;
    maxCount = 1;
    break;
  case '{': {
    pos++;
    if (!isDigit(peek())) {
      fail("Malformed quantifier range", start);
    }
    minCount = readCount();
    if (peek() == ',') {
      pos++;
      if (isDigit(peek())) {
        maxCount = readCount();
      }
    } else {
      maxCount = minCount;
    }
    if (peek() != '}') {
      fail("Malformed quantifier range", start);
    }
    pos++;
    if (maxCount && *maxCount < minCount) {
      fail("Quantifier minimum " + std::to_string(minCount) +
               " is greater than maximum " + std::to_string(*maxCount),
           start);
    }
    break;
  }
  default:
    return atom;
  }

  PatternNodePtr quantifier = makeNode(PatternNodeType::Quantifier, start);
  quantifier->minCount = minCount;
  quantifier->maxCount = maxCount;
  if (peek() == '?') {
    pos++;
    quantifier->greedy = false;
  }
  quantifier->children.push_back(std::move(atom));
  return quantifier;
}

// Quoted value; `\"` and `\\` are the only escapes
std::string PatternCompiler::parseLiteralValue() {
  size_t start = pos;
  pos++; // opening quote
  std::string value;
  while (true) {
    if (atEnd()) {
      fail("Unterminated literal", start);
    }
    char c = text[pos++];
    if (c == '"') {
      break;
    }
    if (c == '\\' && !atEnd() && (peek() == '"' || peek() == '\\')) {
      c = text[pos++];
    }
    value += c;
  }
  return value;
}

std::string PatternCompiler::readName() {
  size_t begin = pos;
  while (!atEnd() && (std::isalnum(static_cast<unsigned char>(peek())) ||
                      peek() == '_' || peek() == '-' || peek() == '$')) {
    pos++;
  }
  return std::string(text.substr(begin, pos - begin));
}

size_t PatternCompiler::readCount() {
  size_t value = 0;
  while (isDigit(peek())) {
    value = value * 10 + static_cast<size_t>(peek() - '0');
    pos++;
  }
  return value;
}

void PatternCompiler::resolveReferences() {
  for (PatternNode *reference : positionalReferences) {
    if (reference->referencedGroup >= captureNames.size()) {
      fail("Backreference \\" + std::to_string(reference->referencedGroup) +
               " refers to a group that does not exist",
           reference->offset);
    }
  }
  for (const NamedReference &reference : namedReferences) {
    bool found = false;
    for (size_t i = 1; i < captureNames.size(); i++) {
      if (captureNames[i] == reference.name) {
        reference.node->referencedGroup = i;
        found = true;
        break;
      }
    }
    if (!found) {
      fail("Backreference to undeclared group '" + reference.name + "'",
           reference.offset);
    }
  }
}

PatternNodePtr PatternCompiler::makeNode(PatternNodeType type,
                                         size_t at) const {
  return std::make_unique<PatternNode>(type, macroOffset.value_or(at));
}

char PatternCompiler::peek(size_t ahead) const {
  return pos + ahead < text.size() ? text[pos + ahead] : '\0';
}

void PatternCompiler::skipWhitespace() {
  while (!atEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
    pos++;
  }
}

void PatternCompiler::expect(char c, const char *message, size_t at) {
  if (peek() != c) {
    fail(message, at);
  }
  pos++;
}

void PatternCompiler::fail(const std::string &message, size_t at) const {
  size_t offset = macroOffset.value_or(at);
  SourceLocation location{offset, 1, offset + 1};
  throw PatternSyntaxError(Diagnostic(message, location, "<pattern>"));
}

CompiledPattern compilePattern(std::string_view text) {
  PatternCompiler compiler(text);
  return compiler.compile();
}

} // namespace luxer
