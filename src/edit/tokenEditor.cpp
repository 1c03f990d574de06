#include "edit/tokenEditor.hpp"

#include <algorithm>

namespace luxer {

TokenEditor::TokenEditor(std::string source, std::vector<Token> tokens)
    : source(std::move(source)), tokens(std::move(tokens)) {}

// Tokens of this editor are found by address, copies by their source span
std::optional<size_t> TokenEditor::indexOf(const Token &token) const {
  if (!tokens.empty() && &token >= tokens.data() &&
      &token < tokens.data() + tokens.size()) {
    return static_cast<size_t>(&token - tokens.data());
  }
  if (token.isSynthetic()) {
    return std::nullopt;
  }
  for (size_t i = 0; i < tokens.size(); i++) {
    if (tokens[i].start == token.start && tokens[i].end == token.end &&
        tokens[i].type == token.type) {
      return i;
    }
  }
  return std::nullopt;
}

size_t TokenEditor::offsetOf(size_t index) const {
  if (index >= tokens.size()) {
    return source.size();
  }
  return std::min(tokens[index].start, source.size());
}

size_t TokenEditor::endOffsetOf(size_t index) const {
  if (index >= tokens.size()) {
    return source.size();
  }
  return std::min(tokens[index].end, source.size());
}

void TokenEditor::record(TokenEditKind kind, size_t first, size_t last,
                         size_t offset, std::vector<Token> inserted) {
  TokenEdit edit;
  edit.kind = kind;
  edit.first = first;
  edit.last = last;
  edit.offset = offset;
  edit.sequence = edits.size();
  edit.tokens = std::move(inserted);
  edits.push_back(std::move(edit));
}

bool TokenEditor::insertBefore(const Token &anchor,
                               std::vector<Token> inserted) {
  std::optional<size_t> index = indexOf(anchor);
  if (!index) {
    return false;
  }
  record(TokenEditKind::Insert, *index, *index, offsetOf(*index),
         std::move(inserted));
  return true;
}

bool TokenEditor::insertAfter(const Token &anchor,
                              std::vector<Token> inserted) {
  std::optional<size_t> index = indexOf(anchor);
  if (!index) {
    return false;
  }
  record(TokenEditKind::Insert, *index + 1, *index + 1, endOffsetOf(*index),
         std::move(inserted));
  return true;
}

bool TokenEditor::replace(const Token &target,
                          std::vector<Token> replacement) {
  std::optional<size_t> index = indexOf(target);
  if (!index) {
    return false;
  }
  return replace(*index, *index + 1, std::move(replacement));
}

bool TokenEditor::replace(size_t first, size_t last,
                          std::vector<Token> replacement) {
  if (first > last || last > tokens.size()) {
    return false;
  }
  record(first == last ? TokenEditKind::Insert : TokenEditKind::Replace, first,
         last, offsetOf(first), std::move(replacement));
  return true;
}

bool TokenEditor::replace(const TokenMatch &match,
                          std::vector<Token> replacement) {
  return replace(match.start(), match.end(), std::move(replacement));
}

bool TokenEditor::remove(const Token &target) {
  std::optional<size_t> index = indexOf(target);
  if (!index) {
    return false;
  }
  record(TokenEditKind::Remove, *index, *index + 1, offsetOf(*index), {});
  return true;
}

bool TokenEditor::remove(const TokenMatch &match) {
  if (match.start() >= match.end() || match.end() > tokens.size()) {
    return false;
  }
  record(TokenEditKind::Remove, match.start(), match.end(),
         offsetOf(match.start()), {});
  return true;
}

/**
 * Edits in application order with the overlapping ones left out. A replace
 * or remove may not start before the end of the last covered region; an
 * insertion may sit at either boundary of it but not inside.
 */
std::vector<const TokenEdit *> TokenEditor::applicableEdits() const {
  std::vector<const TokenEdit *> ordered;
  ordered.reserve(edits.size());
  for (const TokenEdit &edit : edits) {
    ordered.push_back(&edit);
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const TokenEdit *a, const TokenEdit *b) {
                     if (a->offset != b->offset) {
                       return a->offset < b->offset;
                     }
                     return a->sequence < b->sequence;
                   });

  std::vector<const TokenEdit *> applicable;
  size_t regionFirst = 0;
  size_t regionLast = 0;
  for (const TokenEdit *edit : ordered) {
    if (edit->kind == TokenEditKind::Insert) {
      if (edit->first > regionFirst && edit->first < regionLast) {
        continue;
      }
    } else {
      if (edit->first < regionLast) {
        continue;
      }
      regionFirst = edit->first;
      regionLast = edit->last;
    }
    applicable.push_back(edit);
  }
  return applicable;
}

std::string TokenEditor::reconstruct() const {
  std::string result;
  result.reserve(source.size());
  size_t cursor = 0;
  for (const TokenEdit *edit : applicableEdits()) {
    if (edit->offset > cursor) {
      result.append(source, cursor, edit->offset - cursor);
      cursor = edit->offset;
    }
    for (const Token &token : edit->tokens) {
      result += token.value;
    }
    if (edit->kind != TokenEditKind::Insert) {
      cursor = std::max(cursor, endOffsetOf(edit->last - 1));
    }
  }
  if (cursor < source.size()) {
    result.append(source, cursor, std::string::npos);
  }
  return result;
}

std::vector<Token> TokenEditor::modifiedTokens() const {
  std::vector<Token> result;
  result.reserve(tokens.size());
  size_t cursor = 0;
  for (const TokenEdit *edit : applicableEdits()) {
    while (cursor < edit->first) {
      result.push_back(tokens[cursor++]);
    }
    result.insert(result.end(), edit->tokens.begin(), edit->tokens.end());
    cursor = std::max(cursor, edit->last);
  }
  while (cursor < tokens.size()) {
    result.push_back(tokens[cursor++]);
  }
  return result;
}

} // namespace luxer
