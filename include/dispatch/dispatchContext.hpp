#pragma once

#include "dispatch/contextStore.hpp"
#include "dispatch/resultStore.hpp"

#include <string>
#include <vector>

namespace luxer {

class TokenEditor;

/**
 * State of one top-level traversal, passed by reference to every nested
 * traversal it starts.
 */
struct DispatchContext {
  ContextStore store;
  ResultStore results;

  // Handlers that started the active nested traversals, innermost last
  std::vector<std::string> callStack;

  // Optional edit collector handed to handlers; not owned
  TokenEditor *editor = nullptr;

  void setEditor(TokenEditor *tokenEditor) { editor = tokenEditor; }
};

} // namespace luxer
