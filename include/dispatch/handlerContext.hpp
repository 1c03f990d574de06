#pragma once

#include "dispatch/dispatchContext.hpp"
#include "dispatch/registration.hpp"
#include "matcher/tokenMatch.hpp"
#include "matcher/tokenRange.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace luxer {

class Dispatcher;

/**
 * Everything a handler can see and do while it runs: read the match, share
 * values, start nested traversals and move the cursor.
 */
class HandlerContext {
public:
  HandlerContext(Dispatcher &dispatcher, const Registration &registration,
                 const TokenMatch &match, std::span<const Token> tokens,
                 TokenRange window, size_t index, DispatchContext &context);

  // Match access
  const TokenMatch &match() const { return tokenMatch; }
  const Capture &captureAt(size_t index) const;
  const Capture &namedCapture(std::string_view name) const;
  const Capture &fullMatch() const { return tokenMatch.fullMatch(); }
  std::span<const Token> tokensOf(const Capture &capture) const;
  std::span<const Token> tokens() const { return sequence; }
  size_t index() const { return position; }

  // Shared state
  ContextStore &store() { return context.store; }
  ResultStore &results() { return context.results; }
  DispatchContext &dispatchContext() { return context; }
  TokenEditor *editor() const { return context.editor; }

  template <typename T>
  std::optional<T> lastResult(const std::string &handlerId) const {
    return context.results.last<T>(handlerId);
  }
  template <typename T>
  std::vector<T> allResults(const std::string &handlerId) const {
    return context.results.all<T>(handlerId);
  }

  // Nested traversal restricted to `names`; this handler is the caller
  void traverse(TokenRange range, const std::vector<std::string> &names);
  void traverse(const Capture &capture, const std::vector<std::string> &names);

  // Cursor control, applied after the handler returns. skipTo resumes after
  // the given token, skipToIndex at the given index.
  void skipTo(const Token &token);
  void skipToIndex(size_t index);
  bool skipBalanced(std::string_view open, std::string_view close);

  // Inner range of the first balanced `open`..`close` region found `offset`
  // tokens or more past the cursor
  std::optional<TokenRange> extractBalanced(std::string_view open,
                                            std::string_view close,
                                            size_t offset = 0) const;
  std::optional<size_t> skipTarget() const { return skip; }

  // Handler that started the traversal this handler runs in; empty at the
  // top level
  std::string_view caller() const;
  const std::vector<std::string> &callStack() const { return context.callStack; }
  const std::string &handlerId() const { return registration.handlerId; }

private:
  Dispatcher &dispatcher;
  const Registration &registration;
  const TokenMatch &tokenMatch;
  std::span<const Token> sequence;
  TokenRange window;
  size_t position;
  DispatchContext &context;
  std::optional<size_t> skip;

  // Indices of the first `open` at or after `from` and of its closer
  std::optional<std::pair<size_t, size_t>>
  findBalanced(std::string_view open, std::string_view close,
               size_t from) const;
};

} // namespace luxer
