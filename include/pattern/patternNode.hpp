#pragma once

#include "lexer/tokenType.hpp"
#include "pattern/patternNodeType.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace luxer {

// `@N` suffix of a backreference: the nesting depth at the reference,
// counted from the group start, or from the group end for `@+N`/`@-N`
struct DepthConstraint {
  int depth = 0;
  bool relative = false;
};

/**
 * A node of the compiled pattern tree. One struct serves every node kind;
 * only the fields listed for a kind are meaningful.
 */
struct PatternNode {
  PatternNodeType type;
  size_t offset = 0; // position in the pattern text

  // TokenClass, Literal
  TokenType tokenType = TokenType::Unknown;
  bool negated = false;
  std::optional<std::string> value;

  // Group (captureIndex 0 means non-capturing)
  size_t captureIndex = 0;
  std::string captureName;

  // Quantifier (maxCount empty means unbounded)
  size_t minCount = 0;
  std::optional<size_t> maxCount;
  bool greedy = true;

  // Lookaround
  bool ahead = true;
  bool positive = true;

  // Backreference
  size_t referencedGroup = 0;
  std::optional<DepthConstraint> depth;
  bool closeTag = false; // `</\1>`: matches the closing tag of the captured name

  // Balanced, BalancedUntil
  std::string openValue;
  std::string closeValue;
  std::vector<std::string> stopValues;   // separators that end the region at depth 0
  std::vector<std::string> closerValues; // unmatched closers that end the region

  std::vector<std::unique_ptr<PatternNode>> children;

  PatternNode(PatternNodeType kind, size_t at) : type(kind), offset(at) {}

  // Render this node and its children, one node per line
  std::string describe(int indent = 0) const;
};

using PatternNodePtr = std::unique_ptr<PatternNode>;

} // namespace luxer
