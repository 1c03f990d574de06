#include "matcher/matcher.hpp"
#include "program.h"

#include <algorithm>

namespace luxer {

// Token kinds whose values are never brackets, even if they spell one
static bool isOpaque(TokenType type) {
  switch (type) {
  case TokenType::String:
  case TokenType::TemplateString:
  case TokenType::Comment:
  case TokenType::Regex:
  case TokenType::Text:
  case TokenType::AttributeValue:
    return true;
  default:
    return false;
  }
}

int depthDelta(const Token &token) {
  switch (token.type) {
  case TokenType::TagOpen:
  case TokenType::ExpressionStart:
    return 1;
  case TokenType::TagClose:
  case TokenType::SelfClose:
  case TokenType::ExpressionEnd:
    return -1;
  case TokenType::Punctuation:
    if (token.value == "(" || token.value == "[" || token.value == "{") {
      return 1;
    }
    if (token.value == ")" || token.value == "]" || token.value == "}") {
      return -1;
    }
    return 0;
  default:
    return 0;
  }
}

// Tag name without `<`, `</` and `>`
static std::string_view tagName(std::string_view value) {
  if (value.starts_with("</")) {
    value.remove_prefix(2);
  } else if (value.starts_with("<")) {
    value.remove_prefix(1);
  }
  if (value.ends_with(">")) {
    value.remove_suffix(1);
  }
  return value;
}

static bool contains(const std::vector<std::string> &values,
                     const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

namespace {

struct Thread {
  size_t pc = 0;
  size_t position = 0;
  std::vector<size_t> slots;
  std::vector<size_t> registers;
};

class Machine {
public:
  Machine(const Program &program, std::span<const Token> tokens,
          TokenRange window)
      : program(program), tokens(tokens), window(window) {}

  std::optional<MatchState> run(size_t start, std::vector<size_t> slots,
                                std::optional<size_t> requiredEnd) {
    std::vector<Thread> choices;
    choices.push_back(Thread{0, start, std::move(slots),
                             std::vector<size_t>(program.registerCount, 0)});

    while (!choices.empty()) {
      Thread thread = std::move(choices.back());
      choices.pop_back();
      if (std::optional<MatchState> result =
              step(thread, choices, requiredEnd)) {
        return result;
      }
    }
    return std::nullopt;
  }

private:
  const Program &program;
  std::span<const Token> tokens;
  TokenRange window;

  // Run one thread until it matches or fails; choice points push the
  // alternative onto `choices`
  std::optional<MatchState> step(Thread &thread, std::vector<Thread> &choices,
                                 std::optional<size_t> requiredEnd) {
    while (true) {
      const Instruction &instruction = program.code[thread.pc];
      switch (instruction.op) {
      case OpCode::Token:
        if (thread.position >= window.end ||
            !tokenPasses(instruction, tokens[thread.position])) {
          return std::nullopt;
        }
        thread.position++;
        thread.pc++;
        break;
      case OpCode::Split:
        choices.push_back(Thread{instruction.alternative, thread.position,
                                 thread.slots, thread.registers});
        thread.pc = instruction.target;
        break;
      case OpCode::Jump:
        thread.pc = instruction.target;
        break;
      case OpCode::Save:
        thread.slots[instruction.slot] = thread.position;
        thread.pc++;
        break;
      case OpCode::CounterInit:
        thread.registers[instruction.counter] = 0;
        thread.pc++;
        break;
      case OpCode::RepeatBranch: {
        size_t count = thread.registers[instruction.counter];
        if (count < instruction.minCount) {
          thread.registers[instruction.mark] = thread.position;
          thread.pc = instruction.target;
          break;
        }
        if (instruction.maxCount && count >= *instruction.maxCount) {
          thread.pc = instruction.alternative;
          break;
        }
        Thread other{0, thread.position, thread.slots, thread.registers};
        if (instruction.greedy) {
          other.pc = instruction.alternative;
          thread.registers[instruction.mark] = thread.position;
          thread.pc = instruction.target;
        } else {
          other.pc = instruction.target;
          other.registers[instruction.mark] = thread.position;
          thread.pc = instruction.alternative;
        }
        choices.push_back(std::move(other));
        break;
      }
      case OpCode::RepeatEnd: {
        size_t count = ++thread.registers[instruction.counter];
        // An empty iteration past the minimum can never make progress
        if (thread.position == thread.registers[instruction.mark] &&
            count > instruction.minCount) {
          return std::nullopt;
        }
        thread.pc = instruction.target;
        break;
      }
      case OpCode::Lookaround:
        if (lookaround(instruction, thread) != instruction.positive) {
          return std::nullopt;
        }
        thread.pc++;
        break;
      case OpCode::Backreference: {
        std::optional<size_t> next = backreference(instruction, thread);
        if (!next) {
          return std::nullopt;
        }
        thread.position = *next;
        thread.pc++;
        break;
      }
      case OpCode::Balanced: {
        std::optional<size_t> next = balanced(instruction, thread.position);
        if (!next) {
          return std::nullopt;
        }
        thread.position = *next;
        thread.pc++;
        break;
      }
      case OpCode::BalancedUntil: {
        std::optional<size_t> next = balancedUntil(instruction, thread.position);
        if (!next) {
          return std::nullopt;
        }
        thread.position = *next;
        thread.pc++;
        break;
      }
      case OpCode::MarkupElement: {
        std::optional<size_t> next = markupElement(thread.position);
        if (!next) {
          return std::nullopt;
        }
        thread.position = *next;
        thread.pc++;
        break;
      }
      case OpCode::Match:
        if (requiredEnd && thread.position != *requiredEnd) {
          return std::nullopt;
        }
        return MatchState{thread.position, std::move(thread.slots)};
      }
    }
  }

  bool tokenPasses(const Instruction &test, const Token &token) const {
    // Only an explicit `\ef` matches the end of input
    if (token.type == TokenType::EndOfInput &&
        !(test.tokenType == TokenType::EndOfInput && !test.anyType &&
          !test.negated)) {
      return false;
    }
    if (!test.anyType) {
      bool sameType = token.type == test.tokenType;
      if (sameType == test.negated) {
        return false;
      }
    }
    return !test.value || token.value == *test.value;
  }

  bool lookaround(const Instruction &instruction, const Thread &thread) const {
    const Program &body = program.subprograms[instruction.subprogram];
    if (instruction.ahead) {
      return runProgram(body, tokens, window, thread.position, thread.slots)
          .has_value();
    }
    // Closest start first; the body must end exactly at the current position
    for (size_t start = thread.position + 1; start-- > window.begin;) {
      if (runProgram(body, tokens, window, start, thread.slots,
                     thread.position)) {
        return true;
      }
    }
    return false;
  }

  int depthBetween(size_t from, size_t to) const {
    int depth = 0;
    for (size_t i = from; i < to && i < tokens.size(); i++) {
      depth += depthDelta(tokens[i]);
    }
    return depth;
  }

  // Absolute depths count from the referenced group's start, relative
  // depths from its end
  bool depthSatisfied(const Instruction &instruction, const Thread &thread,
                      size_t point) const {
    if (!instruction.depth) {
      return true;
    }
    size_t start = thread.slots[instruction.group * 2];
    size_t end = thread.slots[instruction.group * 2 + 1];
    size_t from = instruction.depth->relative ? end : start;
    return depthBetween(from, point) == instruction.depth->depth;
  }

  std::optional<size_t> backreference(const Instruction &instruction,
                                      const Thread &thread) const {
    size_t start = thread.slots[instruction.group * 2];
    size_t end = thread.slots[instruction.group * 2 + 1];
    if (start == unsetSlot || end == unsetSlot) {
      return std::nullopt;
    }

    size_t position = thread.position;
    if (instruction.closeTag) {
      if (position >= window.end ||
          tokens[position].type != TokenType::TagClose) {
        return std::nullopt;
      }
      std::string name;
      for (size_t i = start; i < end; i++) {
        name += tokens[i].value;
      }
      if (tagName(tokens[position].value) != tagName(name)) {
        return std::nullopt;
      }
      // The depth is taken after the closing tag
      if (!depthSatisfied(instruction, thread, position + 1)) {
        return std::nullopt;
      }
      size_t next = position + 1;
      while (next < window.end && (tokens[next].type == TokenType::Whitespace ||
                                   tokens[next].type == TokenType::Comment)) {
        next++;
      }
      if (next >= window.end || tokens[next].type != TokenType::TagEnd) {
        return std::nullopt;
      }
      return next + 1;
    }

    if (!depthSatisfied(instruction, thread, position)) {
      return std::nullopt;
    }
    size_t length = end - start;
    if (position + length > window.end) {
      return std::nullopt;
    }
    for (size_t i = 0; i < length; i++) {
      if (tokens[position + i].value != tokens[start + i].value) {
        return std::nullopt;
      }
    }
    return position + length;
  }

  std::optional<size_t> balanced(const Instruction &instruction,
                                 size_t position) const {
    if (position >= window.end || isOpaque(tokens[position].type) ||
        tokens[position].value != instruction.open) {
      return std::nullopt;
    }
    int depth = 0;
    for (size_t i = position; i < window.end; i++) {
      const Token &token = tokens[i];
      if (isOpaque(token.type)) {
        continue;
      }
      if (token.value == instruction.open) {
        depth++;
      } else if (token.value == instruction.close) {
        if (--depth == 0) {
          return i + 1;
        }
      }
    }
    return std::nullopt;
  }

  std::optional<size_t> balancedUntil(const Instruction &instruction,
                                      size_t position) const {
    int depth = 0;
    size_t i = position;
    for (; i < window.end; i++) {
      const Token &token = tokens[i];
      if (token.type == TokenType::EndOfInput) {
        break;
      }
      if (isOpaque(token.type)) {
        continue;
      }
      const std::string &value = token.value;
      if (depth == 0 && contains(instruction.stops, value)) {
        break;
      }
      if (value == "(" || value == "[" || value == "{") {
        depth++;
      } else if (value == ")" || value == "]" || value == "}") {
        if (depth == 0) {
          if (contains(instruction.closers, value)) {
            break;
          }
          return std::nullopt;
        }
        depth--;
      }
    }
    return i;
  }

  // From an opening tag to the end of its matching close or self-close
  std::optional<size_t> markupElement(size_t position) const {
    if (position >= window.end ||
        tokens[position].type != TokenType::TagOpen) {
      return std::nullopt;
    }
    int depth = 0;
    for (size_t i = position; i < window.end; i++) {
      switch (tokens[i].type) {
      case TokenType::TagOpen:
        depth++;
        break;
      case TokenType::SelfClose:
        if (--depth == 0) {
          return i + 1;
        }
        break;
      case TokenType::TagClose:
        if (--depth == 0) {
          for (size_t j = i + 1; j < window.end; j++) {
            if (tokens[j].type == TokenType::TagEnd) {
              return j + 1;
            }
            if (tokens[j].type != TokenType::Whitespace &&
                tokens[j].type != TokenType::Comment) {
              break;
            }
          }
          return std::nullopt;
        }
        break;
      default:
        break;
      }
    }
    return std::nullopt;
  }
};

} // namespace

std::optional<MatchState> runProgram(const Program &program,
                                     std::span<const Token> tokens,
                                     TokenRange window, size_t start,
                                     std::vector<size_t> slots,
                                     std::optional<size_t> requiredEnd) {
  window = window.clamp(tokens.size());
  if (start < window.begin || start > window.end) {
    return std::nullopt;
  }
  Machine machine(program, tokens, window);
  return machine.run(start, std::move(slots), requiredEnd);
}

} // namespace luxer
