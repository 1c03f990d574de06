#pragma once

#include "matcher/matcher.hpp"

#include <any>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace luxer {

class HandlerContext;

// A handler returns the value to record for it, or an empty std::any
using Handler = std::function<std::any(HandlerContext &)>;

struct RegistrationOptions {
  std::string name;  // display and scope name; empty means the handler id
  int priority = 0;  // higher is tried first
  bool consumes = true;
  std::vector<std::string> allowedCallers; // empty means any caller
};

/**
 * One entry of the dispatch table
 */
struct Registration {
  std::string handlerId;
  std::string name;
  Matcher matcher;
  Handler handler;
  int priority = 0;
  bool consumes = true;
  std::vector<std::string> allowedCallers;
  size_t order = 0; // registration order, breaks priority ties

  // Unscoped registrations take part in a plain visit()
  bool scoped() const { return !name.empty() || !allowedCallers.empty(); }

  bool answersTo(std::string_view requested) const {
    return handlerId == requested || (!name.empty() && name == requested);
  }

  // Registrations with an allow-list only fire inside a nested traversal
  // started by one of the listed handlers
  bool allows(const std::vector<std::string> &callStack) const {
    if (allowedCallers.empty()) {
      return true;
    }
    if (callStack.empty()) {
      return false;
    }
    for (const std::string &caller : allowedCallers) {
      if (caller == callStack.back()) {
        return true;
      }
    }
    return false;
  }

  const std::string &displayName() const {
    return name.empty() ? handlerId : name;
  }
};

} // namespace luxer
