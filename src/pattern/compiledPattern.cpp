#include "pattern/compiledPattern.hpp"

namespace luxer {

CompiledPattern::CompiledPattern(std::string text, PatternNodePtr root,
                                 std::vector<std::string> captureNames)
    : text(std::move(text)), rootNode(std::move(root)),
      names(std::move(captureNames)) {
  if (names.empty()) {
    names.emplace_back();
  }
}

const std::string &CompiledPattern::captureName(size_t index) const {
  static const std::string none;
  return index < names.size() ? names[index] : none;
}

std::optional<size_t> CompiledPattern::captureIndex(std::string_view name) const {
  for (size_t i = 1; i < names.size(); i++) {
    if (names[i] == name) {
      return i;
    }
  }
  return std::nullopt;
}

std::string CompiledPattern::describe() const {
  std::string result = "Pattern " + text + "\n";
  result += "Captures: " + std::to_string(captureCount()) + "\n";
  result += rootNode->describe();
  return result;
}

} // namespace luxer
