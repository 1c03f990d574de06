#pragma once

#include <optional>
#include <string_view>

namespace luxer {

/**
 * @brief Token kinds produced by the Lexer
 *
 * The script kinds come first, followed by the kinds that only appear while
 * the lexer is inside a type annotation and the kinds produced inside markup.
 * Each kind has a pattern shorthand (see pattern/shorthands.hpp).
 */
enum class TokenType {
  // Script
  Keyword,
  Identifier,
  String,
  Number,
  Operator,
  Punctuation,
  Comment,
  Whitespace,
  TemplateString,
  Regex,
  Decorator,
  EndOfInput,

  // Type context
  Colon,
  GenericOpen,
  GenericClose,
  TypeName,
  QuestionMark,
  Arrow,
  TypeOperator,
  Extends,
  TupleOpen,
  TupleClose,
  MappedIn,
  AsConst,

  // Markup
  TagOpen,
  TagClose,
  SelfClose,
  TagEnd,
  AttributeName,
  AttributeValue,
  Text,
  ExpressionStart,
  ExpressionEnd,

  Unknown
};

// Convert token type to string for debugging
constexpr std::string_view tokenTypeToString(TokenType type) {
  switch (type) {
  case TokenType::Keyword:
    return "Keyword";
  case TokenType::Identifier:
    return "Identifier";
  case TokenType::String:
    return "String";
  case TokenType::Number:
    return "Number";
  case TokenType::Operator:
    return "Operator";
  case TokenType::Punctuation:
    return "Punctuation";
  case TokenType::Comment:
    return "Comment";
  case TokenType::Whitespace:
    return "Whitespace";
  case TokenType::TemplateString:
    return "TemplateString";
  case TokenType::Regex:
    return "Regex";
  case TokenType::Decorator:
    return "Decorator";
  case TokenType::EndOfInput:
    return "EndOfInput";
  case TokenType::Colon:
    return "Colon";
  case TokenType::GenericOpen:
    return "GenericOpen";
  case TokenType::GenericClose:
    return "GenericClose";
  case TokenType::TypeName:
    return "TypeName";
  case TokenType::QuestionMark:
    return "QuestionMark";
  case TokenType::Arrow:
    return "Arrow";
  case TokenType::TypeOperator:
    return "TypeOperator";
  case TokenType::Extends:
    return "Extends";
  case TokenType::TupleOpen:
    return "TupleOpen";
  case TokenType::TupleClose:
    return "TupleClose";
  case TokenType::MappedIn:
    return "MappedIn";
  case TokenType::AsConst:
    return "AsConst";
  case TokenType::TagOpen:
    return "TagOpen";
  case TokenType::TagClose:
    return "TagClose";
  case TokenType::SelfClose:
    return "SelfClose";
  case TokenType::TagEnd:
    return "TagEnd";
  case TokenType::AttributeName:
    return "AttributeName";
  case TokenType::AttributeValue:
    return "AttributeValue";
  case TokenType::Text:
    return "Text";
  case TokenType::ExpressionStart:
    return "ExpressionStart";
  case TokenType::ExpressionEnd:
    return "ExpressionEnd";
  case TokenType::Unknown:
    return "Unknown";
  default:
    return "Unknown";
  }
}

std::optional<TokenType> tokenTypeFromString(std::string_view name);

} // namespace luxer
