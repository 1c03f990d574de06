#pragma once

#include "pattern/compiledPattern.hpp"
#include "pattern/patternSyntaxError.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace luxer {

/**
 * Recursive descent compiler for the token pattern language.
 *
 *   pattern     = alternative ('|' alternative)*
 *   alternative = (atom quantifier?)*
 *   atom        = shorthand | literal | '.' | group | '[' pattern ']'
 *               | backreference | balanced | markup
 *   quantifier  = ('*' | '+' | '?' | '{' n (',' m?)? '}') '?'?
 *
 * Whitespace between atoms is ignored.
 */
class PatternCompiler {
public:
  explicit PatternCompiler(std::string_view text);

  CompiledPattern compile();

private:
  struct NamedReference {
    PatternNode *node;
    std::string name;
    size_t offset;
  };

  std::string_view text;
  size_t pos = 0;
  std::vector<std::string> captureNames{""};
  std::vector<NamedReference> namedReferences;
  std::vector<PatternNode *> positionalReferences;

  // Offset reported for nodes produced by a macro expansion
  std::optional<size_t> macroOffset;

  PatternNodePtr parseAlternation();
  PatternNodePtr parseSequence();
  PatternNodePtr parseElement();
  PatternNodePtr parseAtom();
  PatternNodePtr parseGroup();
  PatternNodePtr parseBracketAlternation();
  PatternNodePtr parseEscape();
  PatternNodePtr parseBackreference(size_t start);
  PatternNodePtr parseMarkupShorthand();
  PatternNodePtr parseMacro(std::string_view expansion, size_t start);
  PatternNodePtr parseQuantifier(PatternNodePtr atom);
  std::optional<DepthConstraint> parseDepthSuffix();
  std::string parseLiteralValue();
  std::string readName();
  size_t readCount();
  void resolveReferences();

  PatternNodePtr makeNode(PatternNodeType type, size_t at) const;
  char peek(size_t ahead = 0) const;
  bool atEnd() const { return pos >= text.size(); }
  void skipWhitespace();
  void expect(char c, const char *message, size_t at);
  [[noreturn]] void fail(const std::string &message, size_t at) const;
};

// Compile pattern text; throws PatternSyntaxError
CompiledPattern compilePattern(std::string_view text);

} // namespace luxer
