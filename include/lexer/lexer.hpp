#pragma once

#include "lexer/lexError.hpp"
#include "lexer/lexerOptions.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace luxer {

/**
 * Contextual lexer for script, type annotations and embedded markup.
 *
 * The lexer is a state machine driven by an explicit mode stack. Markup and
 * script can nest into each other to any depth: a `{` inside markup pushes a
 * script frame, a `<tag` in expression position pushes a markup frame.
 */
class Lexer {
public:
  explicit Lexer(std::string_view source, LexerOptions options = {},
                 std::string origin = "");

  // Tokenize the entire source; the result always ends with EndOfInput
  std::vector<Token> tokenizeAll();

private:
  enum class LexMode {
    Normal,
    TypeAnnotation,
    MarkupTag,
    MarkupText,
    MarkupCloseTag
  };

  // What opened a TypeAnnotation frame; decides how the frame ends
  enum class TypeContext { Binding, ReturnType, Alias, Assertion, TypeArguments };

  // One open bracket in script code. The entry at index 0 is the statement
  // level and is never popped.
  struct BracketFrame {
    char open = '\0';
    bool typeBody = false;        // class or interface body
    bool declaration = false;     // after let/const/var at this level
    bool pendingTypeBody = false; // saw class/interface, body not opened yet
    int ternaryDepth = 0;
  };

  struct ModeFrame {
    LexMode mode = LexMode::Normal;

    // Normal
    std::vector<BracketFrame> brackets{BracketFrame{}};
    bool closesOnBrace = false; // script embedded in markup: `{ ... }`

    // TypeAnnotation
    TypeContext typeContext = TypeContext::Binding;
    int genericDepth = 0;
    int parenDepth = 0;
    int braceDepth = 0;
    int bracketDepth = 0;
    bool typeStarted = false;
    TokenType lastTypeToken = TokenType::Unknown;
    std::string lastTypeValue;
  };

  struct Significant {
    TokenType type = TokenType::Unknown;
    std::string value;
  };

  std::string_view source;
  LexerOptions options;
  std::string origin;
  size_t pos = 0;
  size_t line = 1;
  size_t column = 1;

  std::vector<ModeFrame> modeStack;
  Significant last;     // last emitted non-trivia token
  Significant previous; // the one before it
  bool haveLast = false;
  int aliasState = 0;        // 1 after `type`, 2 after `type Name`
  bool moduleClause = false; // inside an import/export clause

  // Mode dispatch
  std::optional<Token> nextToken();
  std::optional<Token> nextNormalToken();
  std::optional<Token> nextTypeToken();
  std::optional<Token> nextMarkupTagToken();
  std::optional<Token> nextMarkupTextToken();
  std::optional<Token> nextMarkupCloseTagToken();
  void emit(Token token, std::vector<Token> &tokens);

  // Character access
  char peek(size_t ahead = 0) const;
  char advance();
  bool atEnd() const { return pos >= source.size(); }
  SourceLocation here() const { return {pos, line, column}; }
  Token makeToken(TokenType type, const SourceLocation &from) const;
  [[noreturn]] void fail(const std::string &message,
                         const SourceLocation &from) const;

  // Script literals
  Token readWhitespace();
  Token readComment();
  Token readString();
  Token readTemplate();
  Token readNumber();
  Token readRegex();
  Token readOperator();
  Token readPunctuation();
  Token readWord();
  Token readColon();
  Token readQuestion();
  Token readLess();

  // Context decisions
  ModeFrame &frame() { return modeStack.back(); }
  BracketFrame &bracket() { return frame().brackets.back(); }
  bool expressionExpected() const;
  bool operandBefore() const;
  bool statementStart() const;
  void pushType(TypeContext context, int genericDepth = 0);
  void popMode();
  void trackAlias(const Token &token);

  // Type annotations (lexerTypes.cpp)
  Token readTypeWord();
  bool typeDepthZero(const ModeFrame &typeFrame) const;
  bool objectTypeAllowed(const ModeFrame &typeFrame) const;
  bool typeComplete(const ModeFrame &typeFrame) const;
  bool continuesType(size_t at) const;
  bool looksLikeGenericCall() const;
  bool looksLikeGenericArrow() const;
  bool genericDeclarationContext() const;

  // Markup (lexerMarkup.cpp)
  bool markupStarts() const;
  Token startTag();
  std::string readTagName();
};

// Convenience wrapper around Lexer
std::vector<Token> tokenize(std::string_view source,
                            const LexerOptions &options = {});
std::vector<Token> tokenize(std::string_view source, bool includeWhitespace,
                            bool includeComments);

// One warning per Unknown token; the lexer itself never fails on them
std::vector<Diagnostic> unknownTokenWarnings(std::span<const Token> tokens,
                                             const std::string &origin = "");

bool isIdentifierStart(char character);
bool isIdentifierPart(char character);
bool isKeyword(std::string_view word);

} // namespace luxer
