#pragma once

#include <cstddef>
#include <limits>

namespace luxer {

// Half-open window of token indices; matching never reads outside it
struct TokenRange {
  static constexpr size_t unbounded = std::numeric_limits<size_t>::max();

  size_t begin = 0;
  size_t end = unbounded;

  bool contains(size_t index) const { return index >= begin && index < end; }
  size_t size() const { return end > begin ? end - begin : 0; }

  // Clamp the window to a sequence of `count` tokens
  TokenRange clamp(size_t count) const {
    TokenRange result{begin, end < count ? end : count};
    if (result.begin > result.end) {
      result.begin = result.end;
    }
    return result;
  }
};

} // namespace luxer
