#include "pattern/shorthands.hpp"

#include <string>
#include <unordered_map>

namespace luxer {

static const std::unordered_map<char, TokenType> singleLetter = {
    {'k', TokenType::Keyword},     {'i', TokenType::Identifier},
    {'s', TokenType::String},      {'n', TokenType::Number},
    {'o', TokenType::Operator},    {'p', TokenType::Punctuation},
    {'c', TokenType::Comment},     {'w', TokenType::Whitespace},
    {'t', TokenType::TemplateString},
};

static const std::unordered_map<std::string_view, TokenType> twoLetter = {
    // Type context
    {"tn", TokenType::TypeName},
    {"cl", TokenType::Colon},
    {"co", TokenType::Colon},
    {"go", TokenType::GenericOpen},
    {"gc", TokenType::GenericClose},
    {"qm", TokenType::QuestionMark},
    {"fa", TokenType::Arrow},
    {"op", TokenType::TypeOperator},
    {"xt", TokenType::Extends},
    {"tl", TokenType::TupleOpen},
    {"tr", TokenType::TupleClose},
    {"mn", TokenType::MappedIn},
    {"ac", TokenType::AsConst},
    {"dc", TokenType::Decorator},
    // Markup
    {"jo", TokenType::TagOpen},
    {"jc", TokenType::TagClose},
    {"js", TokenType::SelfClose},
    {"je", TokenType::TagEnd},
    {"ja", TokenType::AttributeName},
    {"jv", TokenType::AttributeValue},
    {"jt", TokenType::Text},
    {"jx", TokenType::ExpressionStart},
    {"jy", TokenType::ExpressionEnd},
    // Other
    {"re", TokenType::Regex},
    {"ef", TokenType::EndOfInput},
};

// Every macro expands to a non-capturing sub-pattern
static const std::unordered_map<std::string_view, std::string_view> macros = {
    {"la", R"m([ "(" .*? ")" | \i ] "=>")m"},
    {"lambda", R"m([ "(" .*? ")" | \i ] "=>")m"},
    {"ty", R"m(":" \i (?: "<" .*? ">")?)m"},
    {"type", R"m(":" \i (?: "<" .*? ">")?)m"},
    {"ge", R"m("<" \i (?: "," \i)* ">")m"},
    {"generic", R"m("<" \i (?: "," \i)* ">")m"},
    {"fc", R"m(\i "(" .*? ")")m"},
    {"call", R"m(\i "(" .*? ")")m"},
    {"ax", R"m("[" .*? "]")m"},
    {"array", R"m("[" .*? "]")m"},
    {"bl", R"m("{" .*? "}")m"},
    {"block", R"m("{" .*? "}")m"},
    {"pa", R"m("(" .*? ")")m"},
    {"parens", R"m("(" .*? ")")m"},
    {"de", R"m(\dc (?: "(" .*? ")")?)m"},
    {"decorator", R"m(\dc (?: "(" .*? ")")?)m"},
    {"pr", R"m((?: "." \i)+)m"},
    {"prop", R"m((?: "." \i)+)m"},
    {"oc", R"m("?." \i)m"},
    {"optchain", R"m("?." \i)m"},
    {"sp", R"m("..." \i)m"},
    {"spread", R"m("..." \i)m"},
    {"da", R"m("[" \i (?: "," \i)* "]")m"},
    {"destarray", R"m("[" \i (?: "," \i)* "]")m"},
    {"do", R"m("{" \i (?: "," \i)* "}")m"},
    {"destobj", R"m("{" \i (?: "," \i)* "}")m"},
    {"te", R"m("?" .*? ":")m"},
    {"ternary", R"m("?" .*? ":")m"},
    {"im", R"m(\k"import" .*? \k"from" \s)m"},
    {"import", R"m(\k"import" .*? \k"from" \s)m"},
    {"ex", R"m(\k"export" (?: \k"default")?)m"},
    {"export", R"m(\k"export" (?: \k"default")?)m"},
    {"af", R"m(\k"async" [ \k"function" | [ "(" .*? ")" | \i ] "=>" ])m"},
    {"async", R"m(\k"async" [ \k"function" | [ "(" .*? ")" | \i ] "=>" ])m"},
    {"aw", R"m(\k"await" [ \fc | \i ])m"},
    {"await", R"m(\k"await" [ \fc | \i ])m"},
};

std::optional<TokenType> singleLetterShorthand(char code) {
  auto it = singleLetter.find(code);
  if (it == singleLetter.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<TokenType> twoLetterShorthand(std::string_view code) {
  auto it = twoLetter.find(code);
  if (it == twoLetter.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string_view> macroExpansion(std::string_view name) {
  auto it = macros.find(name);
  if (it == macros.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string_view shorthandFor(TokenType type) {
  // Precomputed so the returned views stay valid
  static const std::unordered_map<TokenType, std::string> spellings = [] {
    std::unordered_map<TokenType, std::string> result;
    for (const auto &[code, kind] : singleLetter) {
      result[kind] = std::string("\\") + code;
    }
    for (const auto &[code, kind] : twoLetter) {
      auto &spelling = result[kind];
      // `\cl` and `\co` both name Colon; keep the alphabetically first
      if (spelling.empty() || (spelling.size() == 3 && code < spelling.substr(1))) {
        spelling = "\\" + std::string(code);
      }
    }
    return result;
  }();

  auto it = spellings.find(type);
  if (it == spellings.end()) {
    return {};
  }
  return it->second;
}

} // namespace luxer
