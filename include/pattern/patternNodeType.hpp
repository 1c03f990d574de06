#pragma once

namespace luxer {

/**
 * Node kinds of a compiled pattern tree
 */
enum class PatternNodeType {
  TokenClass,    // \i, \k"const", negated \I; optional exact value
  Literal,       // "value", any token kind
  Any,           // .
  Sequence,      // children matched one after another
  Alternation,   // children tried in written order
  Group,         // capturing, named capturing or non-capturing
  Quantifier,    // one child repeated minCount..maxCount times
  Lookaround,    // (?=...) (?!...) (?<=...) (?<!...)
  Backreference, // \1, \k<name>, </\1@0>
  Balanced,      // \Bp \Bb \Bk \Ba
  BalancedUntil, // \Bc \Bs
  MarkupElement  // \Je
};

} // namespace luxer
