#include "matcher/matcher.hpp"
#include "pattern/patternCompiler.hpp"
#include "program.h"

namespace luxer {

static TokenMatch buildMatch(const CompiledPattern &pattern,
                             std::span<const Token> tokens,
                             const MatchState &state) {
  std::vector<Capture> captures(pattern.captureCount() + 1);
  for (size_t i = 0; i < captures.size(); i++) {
    Capture &capture = captures[i];
    capture.name = pattern.captureName(i);
    size_t start = state.slots[i * 2];
    size_t end = state.slots[i * 2 + 1];
    if (start == unsetSlot || end == unsetSlot || end < start) {
      continue;
    }
    capture.matched = true;
    capture.start = start;
    capture.end = end;
    for (size_t t = start; t < end; t++) {
      capture.value += tokens[t].value;
    }
  }
  return TokenMatch(tokens, std::move(captures));
}

static std::optional<TokenMatch> execute(const Program &program,
                                         const CompiledPattern &pattern,
                                         std::span<const Token> tokens,
                                         size_t start, TokenRange window) {
  std::vector<size_t> slots(program.slotCount, unsetSlot);
  std::optional<MatchState> state =
      runProgram(program, tokens, window, start, std::move(slots));
  if (!state) {
    return std::nullopt;
  }
  return buildMatch(pattern, tokens, *state);
}

Matcher::Matcher(std::shared_ptr<const CompiledPattern> pattern)
    : compiled(std::move(pattern)),
      program(std::make_shared<const Program>(lowerPattern(*compiled))) {}

Matcher::Matcher(std::string_view patternText)
    : Matcher(std::make_shared<const CompiledPattern>(
          compilePattern(patternText))) {}

Matcher::~Matcher() = default;

std::optional<TokenMatch> Matcher::match(std::span<const Token> tokens,
                                         size_t start) const {
  return match(tokens, start, TokenRange{});
}

std::optional<TokenMatch> Matcher::match(std::span<const Token> tokens,
                                         size_t start,
                                         TokenRange window) const {
  return execute(*program, *compiled, tokens, start, window);
}

std::vector<TokenMatch> Matcher::findAll(std::span<const Token> tokens,
                                         bool overlapping) const {
  std::vector<TokenMatch> matches;
  size_t index = 0;
  while (index < tokens.size()) {
    std::optional<TokenMatch> found = match(tokens, index);
    if (!found || found->length() == 0) {
      index++;
      continue;
    }
    size_t end = found->end();
    matches.push_back(std::move(*found));
    index = overlapping ? index + 1 : end;
  }
  return matches;
}

std::optional<TokenMatch> Matcher::findFirst(std::span<const Token> tokens,
                                             size_t from) const {
  for (size_t index = from; index < tokens.size(); index++) {
    std::optional<TokenMatch> found = match(tokens, index);
    if (found && found->length() > 0) {
      return found;
    }
  }
  return std::nullopt;
}

std::optional<TokenMatch> tryMatch(const CompiledPattern &pattern,
                                   std::span<const Token> tokens,
                                   size_t startIndex) {
  Program program = lowerPattern(pattern);
  return execute(program, pattern, tokens, startIndex, TokenRange{});
}

} // namespace luxer
