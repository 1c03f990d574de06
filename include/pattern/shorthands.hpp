#pragma once

#include "lexer/tokenType.hpp"

#include <optional>
#include <string_view>

namespace luxer {

// `\i` style shorthands; the code is the lower-case spelling
std::optional<TokenType> singleLetterShorthand(char code);
std::optional<TokenType> twoLetterShorthand(std::string_view code);

// Pattern text for `\la`, `\lambda` and the other macros
std::optional<std::string_view> macroExpansion(std::string_view name);

// Shortest shorthand spelling for a token kind, e.g. "\i" or "\tn"
std::string_view shorthandFor(TokenType type);

} // namespace luxer
