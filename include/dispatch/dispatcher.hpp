#pragma once

#include "dispatch/dispatchContext.hpp"
#include "dispatch/handlerContext.hpp"
#include "dispatch/registration.hpp"
#include "matcher/tokenRange.hpp"

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace luxer {

/**
 * Walks a token sequence left to right and, at each position, fires the
 * first registration whose pattern matches.
 *
 * Candidates are tried by descending priority, then registration order.
 * A plain visit() uses the unscoped registrations (no name, no allow-list);
 * a handler narrows nested traversals to registrations it names.
 */
class Dispatcher {
public:
  using BeginHook =
      std::function<void(std::span<const Token>, DispatchContext &)>;
  using EndHook = std::function<void(DispatchContext &)>;
  using UnmatchedHook =
      std::function<void(const Token &, size_t, DispatchContext &)>;

  // Throws PatternSyntaxError, prefixed with the handler id
  void registerHandler(std::string handlerId, std::string_view pattern,
                       Handler handler, RegistrationOptions options = {});

  void onBegin(BeginHook hook) { beginHook = std::move(hook); }
  void onEnd(EndHook hook) { endHook = std::move(hook); }
  void onUnmatched(UnmatchedHook hook) { unmatchedHook = std::move(hook); }

  // Top-level traversal with a fresh context
  void visit(std::span<const Token> tokens);
  void visit(std::span<const Token> tokens, DispatchContext &context);

  // Traversal restricted to the registrations answering to `names`
  void traverse(std::span<const Token> tokens,
                const std::vector<std::string> &names,
                DispatchContext &context);
  void traverse(std::span<const Token> tokens, TokenRange range,
                const std::vector<std::string> &names,
                DispatchContext &context);

  const std::vector<Registration> &registrations() const {
    return registrationTable;
  }

  // Enable debug mode (writes logs to stderr)
  void setDebug(bool debug) { debugMode = debug; }

private:
  std::vector<Registration> registrationTable;
  BeginHook beginHook;
  EndHook endHook;
  UnmatchedHook unmatchedHook;
  bool debugMode{};

  std::vector<const Registration *> unscopedCandidates() const;
  std::vector<const Registration *>
  namedCandidates(const std::vector<std::string> &names) const;
  void run(std::span<const Token> tokens, TokenRange range,
           std::vector<const Registration *> candidates,
           DispatchContext &context);
  void log(const std::string &message) const;
};

} // namespace luxer
