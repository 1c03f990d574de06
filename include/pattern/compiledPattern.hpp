#pragma once

#include "pattern/patternNode.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace luxer {

/**
 * An immutable pattern tree together with its capture table. Groups are
 * numbered from 1 in the order of their opening parenthesis.
 */
class CompiledPattern {
public:
  CompiledPattern(std::string text, PatternNodePtr root,
                  std::vector<std::string> captureNames);

  const std::string &source() const { return text; }
  const PatternNode &root() const { return *rootNode; }

  // Number of capturing groups, not counting the full match
  size_t captureCount() const { return names.size() - 1; }

  // Name of group `index`, empty for unnamed groups
  const std::string &captureName(size_t index) const;
  std::optional<size_t> captureIndex(std::string_view name) const;

  std::string describe() const;

private:
  std::string text;
  PatternNodePtr rootNode;
  std::vector<std::string> names; // index 0 is the full match
};

} // namespace luxer
