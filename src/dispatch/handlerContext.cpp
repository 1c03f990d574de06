#include "dispatch/handlerContext.hpp"
#include "dispatch/dispatcher.hpp"

#include <algorithm>

namespace luxer {

namespace {

// Keeps the caller on the stack for the duration of a nested traversal
struct CallerScope {
  std::vector<std::string> &stack;

  CallerScope(std::vector<std::string> &callStack, const std::string &caller)
      : stack(callStack) {
    stack.push_back(caller);
  }
  ~CallerScope() { stack.pop_back(); }
};

} // namespace

HandlerContext::HandlerContext(Dispatcher &dispatcher,
                               const Registration &registration,
                               const TokenMatch &match,
                               std::span<const Token> tokens,
                               TokenRange window, size_t index,
                               DispatchContext &context)
    : dispatcher(dispatcher), registration(registration), tokenMatch(match),
      sequence(tokens), window(window), position(index), context(context) {}

const Capture &HandlerContext::captureAt(size_t index) const {
  return tokenMatch.captureAt(index);
}

const Capture &HandlerContext::namedCapture(std::string_view name) const {
  return tokenMatch.namedCapture(name);
}

std::span<const Token> HandlerContext::tokensOf(const Capture &capture) const {
  return tokenMatch.tokensOf(capture);
}

void HandlerContext::traverse(TokenRange range,
                              const std::vector<std::string> &names) {
  CallerScope scope(context.callStack, registration.handlerId);
  dispatcher.traverse(sequence, range, names, context);
}

// An absent capture has nothing to traverse
void HandlerContext::traverse(const Capture &capture,
                              const std::vector<std::string> &names) {
  if (!capture.matched) {
    return;
  }
  traverse(TokenRange{capture.start, capture.end}, names);
}

void HandlerContext::skipTo(const Token &token) {
  // Tokens of this sequence are found by address, copies by source offset
  if (!sequence.empty() && &token >= sequence.data() &&
      &token < sequence.data() + sequence.size()) {
    skipToIndex(static_cast<size_t>(&token - sequence.data()) + 1);
    return;
  }
  for (size_t i = position; i < sequence.size(); i++) {
    if (sequence[i].start == token.start && sequence[i].type == token.type) {
      skipToIndex(i + 1);
      return;
    }
  }
}

void HandlerContext::skipToIndex(size_t index) {
  skip = std::min(index, window.end);
}

bool HandlerContext::skipBalanced(std::string_view open,
                                  std::string_view close) {
  auto region = findBalanced(open, close, position);
  if (!region) {
    return false;
  }
  skipToIndex(region->second + 1);
  return true;
}

std::optional<TokenRange>
HandlerContext::extractBalanced(std::string_view open,
                                std::string_view close, size_t offset) const {
  auto region = findBalanced(open, close, position + offset);
  if (!region) {
    return std::nullopt;
  }
  return TokenRange{region->first + 1, region->second};
}

std::optional<std::pair<size_t, size_t>>
HandlerContext::findBalanced(std::string_view open, std::string_view close,
                             size_t from) const {
  size_t first = from;
  while (first < window.end && sequence[first].value != open) {
    first++;
  }
  if (first >= window.end) {
    return std::nullopt;
  }

  int depth = 0;
  for (size_t i = first; i < window.end; i++) {
    const Token &token = sequence[i];
    if (token.type == TokenType::String ||
        token.type == TokenType::TemplateString ||
        token.type == TokenType::Comment || token.type == TokenType::Regex ||
        token.type == TokenType::Text ||
        token.type == TokenType::AttributeValue) {
      continue;
    }
    if (token.value == open) {
      depth++;
    } else if (token.value == close && --depth == 0) {
      return std::make_pair(first, i);
    }
  }
  return std::nullopt;
}

std::string_view HandlerContext::caller() const {
  if (context.callStack.empty()) {
    return {};
  }
  return context.callStack.back();
}

} // namespace luxer
