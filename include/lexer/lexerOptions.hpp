#pragma once

namespace luxer {

/**
 * Controls which trivia the lexer keeps in the token stream. Both are elided
 * by default; the lexer still recognises them.
 */
struct LexerOptions {
  bool includeWhitespace = false;
  bool includeComments = false;
};

} // namespace luxer
