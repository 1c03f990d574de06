#include "dispatch/dispatcher.hpp"
#include "pattern/patternCompiler.hpp"

#include <algorithm>
#include <iostream>

namespace luxer {

static std::string joinNames(const std::vector<std::string> &names) {
  std::string result;
  for (const std::string &name : names) {
    if (!result.empty()) {
      result += ", ";
    }
    result += name;
  }
  return result;
}

void Dispatcher::registerHandler(std::string handlerId,
                                 std::string_view pattern, Handler handler,
                                 RegistrationOptions options) {
  std::shared_ptr<const CompiledPattern> compiled;
  try {
    compiled = std::make_shared<const CompiledPattern>(compilePattern(pattern));
  } catch (const PatternSyntaxError &e) {
    Diagnostic diagnostic = e.getDiagnostic();
    diagnostic.message = handlerId + ": " + diagnostic.message;
    throw PatternSyntaxError(diagnostic);
  }

  Registration registration{std::move(handlerId),
                            std::move(options.name),
                            Matcher(std::move(compiled)),
                            std::move(handler),
                            options.priority,
                            options.consumes,
                            std::move(options.allowedCallers),
                            registrationTable.size()};
  log("Registered " + registration.displayName() + " (priority " +
      std::to_string(registration.priority) + "): " +
      registration.matcher.pattern().source());
  registrationTable.push_back(std::move(registration));
}

void Dispatcher::visit(std::span<const Token> tokens) {
  DispatchContext context;
  visit(tokens, context);
}

void Dispatcher::visit(std::span<const Token> tokens,
                       DispatchContext &context) {
  log("Visit over " + std::to_string(tokens.size()) + " tokens");
  if (beginHook) {
    beginHook(tokens, context);
  }
  run(tokens, TokenRange{0, tokens.size()}, unscopedCandidates(), context);
  if (endHook) {
    endHook(context);
  }
}

void Dispatcher::traverse(std::span<const Token> tokens,
                          const std::vector<std::string> &names,
                          DispatchContext &context) {
  traverse(tokens, TokenRange{0, tokens.size()}, names, context);
}

void Dispatcher::traverse(std::span<const Token> tokens, TokenRange range,
                          const std::vector<std::string> &names,
                          DispatchContext &context) {
  TokenRange window = range.clamp(tokens.size());
  log("Traverse [" + joinNames(names) + "] over tokens " +
      std::to_string(window.begin) + ".." + std::to_string(window.end) +
      (context.callStack.empty() ? std::string()
                                 : " from " + context.callStack.back()));
  run(tokens, window, namedCandidates(names), context);
}

std::vector<const Registration *> Dispatcher::unscopedCandidates() const {
  std::vector<const Registration *> candidates;
  for (const Registration &registration : registrationTable) {
    if (!registration.scoped()) {
      candidates.push_back(&registration);
    }
  }
  return candidates;
}

std::vector<const Registration *>
Dispatcher::namedCandidates(const std::vector<std::string> &names) const {
  std::vector<const Registration *> candidates;
  for (const Registration &registration : registrationTable) {
    for (const std::string &name : names) {
      if (registration.answersTo(name)) {
        candidates.push_back(&registration);
        break;
      }
    }
  }
  return candidates;
}

void Dispatcher::run(std::span<const Token> tokens, TokenRange range,
                     std::vector<const Registration *> candidates,
                     DispatchContext &context) {
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Registration *a, const Registration *b) {
                     if (a->priority != b->priority) {
                       return a->priority > b->priority;
                     }
                     return a->order < b->order;
                   });

  TokenRange window = range.clamp(tokens.size());
  size_t index = window.begin;
  while (index < window.end) {
    if (tokens[index].type == TokenType::EndOfInput) {
      break;
    }

    bool fired = false;
    for (const Registration *registration : candidates) {
      if (!registration->allows(context.callStack)) {
        if (debugMode && registration->matcher.match(tokens, index, window)) {
          log("Skipped " + registration->displayName() + " at token " +
              std::to_string(index) + ": caller not allowed");
        }
        continue;
      }

      std::optional<TokenMatch> match =
          registration->matcher.match(tokens, index, window);
      if (!match) {
        continue;
      }

      log("Matched " + registration->displayName() + " at token " +
          std::to_string(index) + ": " + match->value());
      HandlerContext handlerContext(*this, *registration, *match, tokens,
                                    window, index, context);
      std::any result = registration->handler(handlerContext);
      if (result.has_value()) {
        context.results.add(registration->handlerId, std::move(result));
      }

      std::optional<size_t> skip = handlerContext.skipTarget();
      if (skip && *skip > index) {
        index = *skip;
      } else if (registration->consumes) {
        index = std::max(match->end(), index + 1);
      } else {
        index++;
      }
      fired = true;
      break;
    }

    if (!fired) {
      if (unmatchedHook) {
        unmatchedHook(tokens[index], index, context);
      }
      index++;
    }
  }
}

void Dispatcher::log(const std::string &message) const {
  if (debugMode) {
    std::cerr << "[luxer] " << message << std::endl;
  }
}

} // namespace luxer
