#pragma once

#include <cstddef>
#include <string>

namespace luxer {

/**
 * A captured token sub-range. A group that did not take part in the match
 * is a Capture with matched == false, which is different from a group that
 * matched zero tokens.
 */
struct Capture {
  bool matched = false;
  size_t start = 0; // first token index
  size_t end = 0;   // one past the last token index
  std::string value; // concatenated token values
  std::string name;  // empty for unnamed groups

  size_t length() const { return end - start; }
  bool empty() const { return start == end; }
  explicit operator bool() const { return matched; }
};

} // namespace luxer
