#pragma once

#include "lexer/token.hpp"

#include <span>
#include <string>
#include <vector>

namespace luxer {

enum class OutlineKind { Import, Function, Component, Element };

std::string_view outlineKindToString(OutlineKind kind);

/**
 * One entry of a source outline. Components carry the markup elements of
 * their body as children; elements are listed in source order, nested ones
 * included.
 */
struct OutlineItem {
  OutlineKind kind{OutlineKind::Function};
  std::string name;
  std::string detail; // import list, parameter list or attribute names
  size_t line{};
  size_t column{};
  std::vector<OutlineItem> children;
};

/**
 * Outline of top-level declarations: imports, functions and components.
 * Function bodies are skipped, so declarations nested in them are not
 * reported. Expects tokens without whitespace and comments.
 */
std::vector<OutlineItem> buildOutline(std::span<const Token> tokens,
                                      bool debug = false);

} // namespace luxer
