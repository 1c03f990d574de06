#include "pattern/patternNode.hpp"
#include "pattern/shorthands.hpp"

namespace luxer {

static std::string quoted(const std::string &value) {
  std::string result = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') {
      result += '\\';
    }
    result += c;
  }
  return result + "\"";
}

std::string PatternNode::describe(int indent) const {
  std::string line(static_cast<size_t>(indent) * 2, ' ');

  switch (type) {
  case PatternNodeType::TokenClass:
    line += negated ? "NotTokenClass " : "TokenClass ";
    line += std::string(tokenTypeToString(tokenType));
    if (std::string_view spelling = shorthandFor(tokenType); !spelling.empty()) {
      line += " (" + std::string(spelling) + ")";
    }
    if (value) {
      line += " " + quoted(*value);
    }
    break;
  case PatternNodeType::Literal:
    line += "Literal " + quoted(value.value_or(""));
    break;
  case PatternNodeType::Any:
    line += "Any";
    break;
  case PatternNodeType::Sequence:
    line += "Sequence";
    break;
  case PatternNodeType::Alternation:
    line += "Alternation";
    break;
  case PatternNodeType::Group:
    if (captureIndex == 0) {
      line += "Group (non-capturing)";
    } else {
      line += "Group #" + std::to_string(captureIndex);
      if (!captureName.empty()) {
        line += " <" + captureName + ">";
      }
    }
    break;
  case PatternNodeType::Quantifier:
    line += "Quantifier {" + std::to_string(minCount) + "," +
            (maxCount ? std::to_string(*maxCount) : std::string("inf")) + "}";
    line += greedy ? " greedy" : " lazy";
    break;
  case PatternNodeType::Lookaround:
    line += positive ? "Positive" : "Negative";
    line += ahead ? "Lookahead" : "Lookbehind";
    break;
  case PatternNodeType::Backreference:
    line += closeTag ? "CloseTagReference #" : "Backreference #";
    line += std::to_string(referencedGroup);
    if (depth) {
      line += " @";
      if (depth->relative && depth->depth >= 0) {
        line += "+";
      }
      line += std::to_string(depth->depth);
    }
    break;
  case PatternNodeType::Balanced:
    line += "Balanced " + quoted(openValue) + " " + quoted(closeValue);
    break;
  case PatternNodeType::BalancedUntil:
    line += "BalancedUntil";
    for (const std::string &stop : stopValues) {
      line += " " + quoted(stop);
    }
    break;
  case PatternNodeType::MarkupElement:
    line += "MarkupElement";
    break;
  }
  line += "\n";

  for (const auto &child : children) {
    line += child->describe(indent + 1);
  }
  return line;
}

} // namespace luxer
