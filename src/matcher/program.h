#pragma once

#include "lexer/tokenType.hpp"
#include "lexer/token.hpp"
#include "matcher/tokenRange.hpp"
#include "pattern/compiledPattern.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace luxer {

enum class OpCode {
  Token,         // consume one token that passes the test
  Split,         // try `target`, on failure resume at `alternative`
  Jump,          // continue at `target`
  Save,          // record the position in capture slot `slot`
  CounterInit,   // reset repetition counter `counter`
  RepeatBranch,  // decide whether to run one more iteration
  RepeatEnd,     // count an iteration and loop back to `target`
  Lookaround,    // run subprogram `subprogram` without consuming
  Backreference, // tokens equal to capture `group`
  Balanced,      // bracket region from `open` to its matching `close`
  BalancedUntil, // tokens up to a separator or closer at depth zero
  MarkupElement, // a complete element from its opening tag
  Match          // success
};

struct Instruction {
  OpCode op;

  // Token
  TokenType tokenType = TokenType::Unknown;
  bool anyType = false;
  bool negated = false;
  std::optional<std::string> value;

  // Split, Jump, RepeatBranch, RepeatEnd
  size_t target = 0;
  size_t alternative = 0;

  // Save
  size_t slot = 0;

  // CounterInit, RepeatBranch, RepeatEnd
  size_t counter = 0;
  size_t mark = 0;
  size_t minCount = 0;
  std::optional<size_t> maxCount;
  bool greedy = true;

  // Lookaround
  size_t subprogram = 0;
  bool ahead = true;
  bool positive = true;

  // Backreference
  size_t group = 0;
  std::optional<DepthConstraint> depth;
  bool closeTag = false;

  // Balanced, BalancedUntil
  std::string open;
  std::string close;
  std::vector<std::string> stops;
  std::vector<std::string> closers;

  explicit Instruction(OpCode code) : op(code) {}
};

struct Program {
  std::vector<Instruction> code;
  std::vector<Program> subprograms; // lookaround bodies
  size_t registerCount = 0;
  size_t slotCount = 0; // two per capture, full match included
};

// Lower a pattern tree into an executable program
Program lowerPattern(const CompiledPattern &pattern);

struct MatchState {
  size_t position = 0;
  std::vector<size_t> slots;
};

/**
 * Run `program` from `start`. When `requiredEnd` is set, a match only counts
 * if it ends exactly there (lookbehind).
 */
std::optional<MatchState> runProgram(const Program &program,
                                     std::span<const Token> tokens,
                                     TokenRange window, size_t start,
                                     std::vector<size_t> slots,
                                     std::optional<size_t> requiredEnd = {});

constexpr size_t unsetSlot = static_cast<size_t>(-1);

} // namespace luxer
