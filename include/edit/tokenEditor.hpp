#pragma once

#include "edit/tokenEdit.hpp"
#include "lexer/token.hpp"
#include "matcher/tokenMatch.hpp"

#include <optional>
#include <string>
#include <vector>

namespace luxer {

/**
 * Collects edits against a lexed source and applies them in one pass.
 *
 * Edits are recorded append-only and applied in source offset order, ties
 * in recording order. An edit starting inside a region that an earlier
 * applied edit already replaced or removed is dropped. Unedited regions are
 * copied from the source text, so formatting between tokens survives.
 *
 * Edit methods return false when the token is not part of the sequence.
 */
class TokenEditor {
public:
  TokenEditor(std::string source, std::vector<Token> tokens);

  bool insertBefore(const Token &anchor, std::vector<Token> inserted);
  bool insertAfter(const Token &anchor, std::vector<Token> inserted);

  bool replace(const Token &target, std::vector<Token> replacement);
  // Replace the token indices [first, last)
  bool replace(size_t first, size_t last, std::vector<Token> replacement);
  bool replace(const TokenMatch &match, std::vector<Token> replacement);

  bool remove(const Token &target);
  bool remove(const TokenMatch &match);

  // Source text with all applicable edits applied
  std::string reconstruct() const;
  // Token sequence with all applicable edits applied
  std::vector<Token> modifiedTokens() const;

  bool hasEdits() const { return !edits.empty(); }
  const std::vector<TokenEdit> &recordedEdits() const { return edits; }
  const std::vector<Token> &originalTokens() const { return tokens; }
  const std::string &originalSource() const { return source; }

private:
  std::string source;
  std::vector<Token> tokens;
  std::vector<TokenEdit> edits;

  std::optional<size_t> indexOf(const Token &token) const;
  size_t offsetOf(size_t index) const;
  size_t endOffsetOf(size_t index) const;
  void record(TokenEditKind kind, size_t first, size_t last, size_t offset,
              std::vector<Token> inserted);
  std::vector<const TokenEdit *> applicableEdits() const;
};

} // namespace luxer
