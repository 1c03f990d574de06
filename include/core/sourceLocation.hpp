#pragma once

#include <cstddef>

namespace luxer {

/**
 * A position in a text buffer. offset is 0-based, line and column are 1-based.
 */
struct SourceLocation {
  size_t offset{};
  size_t line{1};
  size_t column{1};
};

} // namespace luxer
