#pragma once

#include "lexer/token.hpp"

#include <cstddef>
#include <vector>

namespace luxer {

enum class TokenEditKind { Insert, Replace, Remove };

/**
 * One recorded edit over the token indices [first, last) of the original
 * sequence. Insertions have first == last. `offset` is the source offset the
 * edit applies at and orders edits when they are applied.
 */
struct TokenEdit {
  TokenEditKind kind{TokenEditKind::Insert};
  size_t first{};
  size_t last{};
  size_t offset{};
  size_t sequence{}; // recording order, breaks offset ties
  std::vector<Token> tokens;
};

} // namespace luxer
