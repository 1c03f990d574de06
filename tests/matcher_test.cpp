#include "lexer/lexer.hpp"
#include "matcher/matcher.hpp"
#include "pattern/patternCompiler.hpp"

#include <gtest/gtest.h>

using namespace luxer;

namespace {

std::optional<TokenMatch> matchAt(std::string_view pattern,
                                  const std::vector<Token> &tokens,
                                  size_t start = 0) {
  Matcher matcher(pattern);
  return matcher.match(tokens, start);
}

} // namespace

TEST(MatcherTest, GreedyTakesAsMuchAsTheContinuationAllows) {
  auto tokens = tokenize("a b c ;");
  auto match = matchAt(R"((.*) ";")", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "abc");
  EXPECT_EQ(match->end(), 4u);
}

TEST(MatcherTest, LazyStopsAtTheFirstTerminator) {
  auto tokens = tokenize("x ; y ;");
  auto match = matchAt(R"((.*?) ";")", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "x");
  EXPECT_EQ(match->end(), 2u);
}

TEST(MatcherTest, LazyPlusTakesTheMinimumThatStillMatches) {
  auto tokens = tokenize("a b ;");
  auto match = matchAt(R"((.+?) ";")", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "ab");
}

TEST(MatcherTest, QuantifiersGiveBackTokens) {
  auto tokens = tokenize("a b c d");
  auto match = matchAt(R"((\i+) (\i) (\i))", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "ab");
  EXPECT_EQ(match->captureAt(2).value, "c");
  EXPECT_EQ(match->captureAt(3).value, "d");
}

TEST(MatcherTest, CountedRepetition) {
  auto tokens = tokenize("a b c");
  EXPECT_EQ(matchAt(R"(\i{2})", tokens)->end(), 2u);
  EXPECT_EQ(matchAt(R"(\i{2,})", tokens)->end(), 3u);
  EXPECT_EQ(matchAt(R"(\i{1,2})", tokens)->end(), 2u);
  EXPECT_FALSE(matchAt(R"(\i{4,})", tokens));
}

TEST(MatcherTest, AlternationTriesBranchesInOrder) {
  auto tokens = tokenize("let a; const b;");
  Matcher matcher(R"([\k"let" | \k"const"] (\i))");
  auto first = matcher.match(tokens, 0);
  auto second = matcher.match(tokens, 3);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->captureAt(1).value, "a");
  EXPECT_EQ(second->captureAt(1).value, "b");

  // The first branch that lets the rest of the pattern succeed wins
  auto call = tokenize("f(x)");
  auto branch = matchAt(R"(([\i | \i "("]) \i)", call);
  ASSERT_TRUE(branch);
  EXPECT_EQ(branch->captureAt(1).value, "f(");
}

TEST(MatcherTest, BalancedRegion) {
  auto tokens = tokenize("foo(a, (b + c))");
  auto match = matchAt(R"(\i \Bp)", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->value(), "foo(a,(b+c))");
  EXPECT_EQ(match->end(), tokens.size() - 1);

  auto unterminated = tokenize("foo(a, b");
  EXPECT_FALSE(matchAt(R"(\i \Bp)", unterminated));
}

TEST(MatcherTest, BalancedIgnoresBracketsInStrings) {
  auto tokens = tokenize(R"src(f(")", x))src");
  auto match = matchAt(R"(\i (\Bp))", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->end(), tokens.size() - 1);
}

TEST(MatcherTest, BalancedUntilStopsAtSeparators) {
  auto tokens = tokenize("f(a, g(b, c), d)");
  auto match = matchAt(R"p(\i "(" (\Bc) "," (\Bc) "," (\Bc) ")")p", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "a");
  EXPECT_EQ(match->captureAt(2).value, "g(b,c)");
  EXPECT_EQ(match->captureAt(3).value, "d");
}

TEST(MatcherTest, BalancedBraces) {
  auto tokens = tokenize("if (a) { b; { c; } } d");
  auto match = matchAt(R"(\k"if" \Bp (\Bb))", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "{b;{c;}}");
  EXPECT_EQ(match->end(), 12u);

  EXPECT_FALSE(matchAt(R"(\k"if" \Bp (\Bb))", tokenize("if (a) b;")));
}

TEST(MatcherTest, BalancedBrackets) {
  auto tokens = tokenize("x = [1, [2, 3]];");
  auto match = matchAt(R"("=" (\Bk) ";")", tokens, 1);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "[1,[2,3]]");

  EXPECT_FALSE(matchAt(R"("=" (\Bk) ";")", tokenize("x = y;"), 1));
}

TEST(MatcherTest, BalancedAngles) {
  auto tokens = tokenize("useState<string>(init)");
  auto match = matchAt(R"(\i (\Ba) \Bp)", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "<string>");
  EXPECT_EQ(match->end(), 7u);

  EXPECT_FALSE(matchAt(R"(\i \Ba)", tokenize("a < b")));
}

TEST(MatcherTest, BalancedUntilStatementEnd) {
  auto tokens = tokenize("{ x = g(a, b); y }");
  auto match = matchAt(R"("{" (\Bs) ";" (\Bs) "}")", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "x=g(a,b)");
  EXPECT_EQ(match->captureAt(2).value, "y");

  // Stops before the unmatched brace, so no semicolon follows
  EXPECT_FALSE(matchAt(R"("{" (\Bs) ";")", tokenize("{ x }")));
}

TEST(MatcherTest, CallAndLambdaMacros) {
  auto call = matchAt(R"(\fc ";")", tokenize("foo(a, b); x"));
  ASSERT_TRUE(call);
  EXPECT_EQ(call->end(), 7u);
  EXPECT_EQ(call->captureCount(), 0u);
  EXPECT_TRUE(matchAt(R"(\call ";")", tokenize("foo(a, b); x")));
  EXPECT_FALSE(matchAt(R"(\fc)", tokenize("foo; x")));

  auto lambda = matchAt(R"(\la)", tokenize("(a, b) => a"));
  ASSERT_TRUE(lambda);
  EXPECT_EQ(lambda->end(), 6u);
  auto single = matchAt(R"(\lambda)", tokenize("x => x"));
  ASSERT_TRUE(single);
  EXPECT_EQ(single->end(), 2u);
  EXPECT_FALSE(matchAt(R"(\la)", tokenize("(a, b) + 1")));
}

TEST(MatcherTest, ModuleMacros) {
  auto imported = matchAt(R"(\im ";")", tokenize("import { a } from \"m\";"));
  ASSERT_TRUE(imported);
  EXPECT_EQ(imported->end(), 7u);
  EXPECT_FALSE(matchAt(R"(\im)", tokenize("import a;")));

  auto exported = matchAt(R"(\ex \k"function")",
                          tokenize("export default function f() {}"));
  ASSERT_TRUE(exported);
  EXPECT_EQ(exported->end(), 3u);
  EXPECT_FALSE(matchAt(R"(\ex)", tokenize("default function f() {}")));
}

TEST(MatcherTest, ExpressionMacros) {
  auto awaitCall = matchAt(R"(\aw ";")", tokenize("await load(x);"));
  ASSERT_TRUE(awaitCall);
  EXPECT_EQ(awaitCall->end(), 6u);
  auto awaitName = matchAt(R"(\await ";")", tokenize("await value;"));
  ASSERT_TRUE(awaitName);
  EXPECT_EQ(awaitName->end(), 3u);
  EXPECT_FALSE(matchAt(R"(\aw)", tokenize("value;")));

  auto ternary = matchAt(R"(\te \i)", tokenize("a ? b : c"), 1);
  ASSERT_TRUE(ternary);
  EXPECT_EQ(ternary->end(), 5u);
  EXPECT_FALSE(matchAt(R"(\te)", tokenize("a ? b"), 1));

  auto spread = matchAt(R"p(\sp ")")p", tokenize("f(...args)"), 2);
  ASSERT_TRUE(spread);
  EXPECT_EQ(spread->end(), 5u);
  auto chain = matchAt(R"(\i \oc)", tokenize("a?.b"));
  ASSERT_TRUE(chain);
  EXPECT_EQ(chain->end(), 3u);
  EXPECT_FALSE(matchAt(R"(\i \oc)", tokenize("a.b")));

  auto destructured = matchAt(R"(\k"const" \da "=")", tokenize("const [a, b] = t;"));
  ASSERT_TRUE(destructured);
  EXPECT_EQ(destructured->end(), 7u);
  EXPECT_FALSE(matchAt(R"(\k"const" \da)", tokenize("const [a, 1] = t;")));
}

TEST(MatcherTest, BackreferenceEquality) {
  Matcher matcher(R"(\k"const" (?<v>\i) "=" \k<v>)");
  EXPECT_TRUE(matcher.match(tokenize("const foo = foo;"), 0));
  EXPECT_FALSE(matcher.match(tokenize("const foo = bar;"), 0));
}

TEST(MatcherTest, BackreferenceDepthCountsFromGroupStartOrEnd) {
  auto tokens = tokenize("a ( a ( ) )");
  // The group `a (` itself opens one level
  auto sameLevel = matchAt(R"p((\i "(") \1@+0)p", tokens);
  ASSERT_TRUE(sameLevel);
  EXPECT_EQ(sameLevel->end(), 4u);
  EXPECT_FALSE(matchAt(R"p((\i "(") \1@+1)p", tokens));

  auto sinceOpened = matchAt(R"p((\i "(") \1@1)p", tokens);
  ASSERT_TRUE(sinceOpened);
  EXPECT_EQ(sinceOpened->end(), 4u);
  EXPECT_FALSE(matchAt(R"p((\i "(") \1@0)p", tokens));
}

TEST(MatcherTest, BackreferenceToAbsentGroupFails) {
  auto tokens = tokenize("a a");
  EXPECT_FALSE(matchAt(R"((\n)? \i \1)", tokens));
}

TEST(MatcherTest, LookaheadDoesNotConsume) {
  auto tokens = tokenize("foo(x)");
  auto match = matchAt(R"((\i)(?="("))", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->captureAt(1).value, "foo");
  EXPECT_EQ(match->end(), 1u);

  EXPECT_FALSE(matchAt(R"(\i (?!"("))", tokens));
  EXPECT_TRUE(matchAt(R"(\i (?!"("))", tokens, 2));
}

TEST(MatcherTest, Lookbehind) {
  auto tokens = tokenize("x = y");
  Matcher matcher(R"((?<="=") \i)");
  EXPECT_FALSE(matcher.match(tokens, 0));
  auto match = matcher.match(tokens, 2);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->start(), 2u);
  EXPECT_EQ(match->value(), "y");

  Matcher negative(R"((?<!"=") \i)");
  EXPECT_TRUE(negative.match(tokens, 0));
  EXPECT_FALSE(negative.match(tokens, 2));
}

TEST(MatcherTest, LookaroundCapturesStayLocal) {
  auto tokens = tokenize("a b");
  auto match = matchAt(R"((?=(\i)) \i (\i))", tokens);
  ASSERT_TRUE(match);
  EXPECT_FALSE(match->captureAt(1).matched);
  EXPECT_EQ(match->captureAt(2).value, "b");
}

TEST(MatcherTest, AnyNeverMatchesEndOfInput) {
  auto tokens = tokenize("a b");
  auto all = matchAt(".*", tokens);
  ASSERT_TRUE(all);
  EXPECT_EQ(all->end(), 2u);

  auto negated = matchAt(R"(\N*)", tokens);
  ASSERT_TRUE(negated);
  EXPECT_EQ(negated->end(), 2u);

  EXPECT_TRUE(matchAt(R"(\i \i \ef)", tokens));
}

TEST(MatcherTest, UnboundCapturesAreAbsent) {
  auto tokens = tokenize("function foo() {}");
  auto match = matchAt(R"((\k"export")? \k"function" (?<name>\i))", tokens);
  ASSERT_TRUE(match);
  EXPECT_FALSE(match->captureAt(1).matched);
  EXPECT_FALSE(match->captureAt(99).matched);
  EXPECT_FALSE(match->namedCapture("missing").matched);
  EXPECT_TRUE(match->tokensOf(match->captureAt(1)).empty());
  EXPECT_EQ(match->namedCapture("name").value, "foo");
  EXPECT_EQ(match->captureAt(0).value, "functionfoo");
}

TEST(MatcherTest, CloseTagReferenceHonoursDepth) {
  auto tokens = tokenize("x = <div><div>a</div></div>;");
  // x = <div > <div > a </div > </div > ;
  auto match = matchAt(R"((?<tag>\jo) .*? </\k<tag>@0>)", tokens, 2);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->start(), 2u);
  EXPECT_EQ(match->end(), 11u);

  // Without the depth constraint the inner close ends the match
  auto shallow = matchAt(R"((?<tag>\jo) .*? </\k<tag>>)", tokens, 2);
  ASSERT_TRUE(shallow);
  EXPECT_EQ(shallow->end(), 9u);
}

TEST(MatcherTest, CloseTagReferenceRequiresSameName) {
  auto tokens = tokenize("x = <a><b></b></a>;");
  auto match = matchAt(R"((\jo) \je (\jo) .*? </\1>)", tokens, 2);
  ASSERT_TRUE(match);
  EXPECT_EQ(tokens[match->end() - 2].value, "</a");
}

TEST(MatcherTest, MarkupElement) {
  auto tokens = tokenize("x = <ul><li>a</li><Item /></ul>;");
  auto match = matchAt(R"(\Je)", tokens, 2);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->start(), 2u);
  EXPECT_EQ(tokens[match->end()].value, ";");
  EXPECT_FALSE(matchAt(R"(\Je)", tokens, 0));
}

TEST(MatcherTest, MarkupShorthands) {
  auto tokens = tokenize("x = <div>hi</div>;");
  EXPECT_TRUE(matchAt(R"(<div \je \jt </div>)", tokens, 2));
  EXPECT_FALSE(matchAt(R"(<span)", tokens, 2));
}

TEST(MatcherTest, WindowLimitsMatching) {
  auto tokens = tokenize("a b c");
  Matcher matcher(R"(\i+)");
  auto match = matcher.match(tokens, 0, TokenRange{0, 2});
  ASSERT_TRUE(match);
  EXPECT_EQ(match->end(), 2u);
  EXPECT_FALSE(matcher.match(tokens, 2, TokenRange{0, 2}));

  // Lookbehind cannot see before the window
  Matcher behind(R"((?<=\i) \i)");
  EXPECT_TRUE(behind.match(tokens, 1));
  EXPECT_FALSE(behind.match(tokens, 1, TokenRange{1, 3}));
}

TEST(MatcherTest, FindAllSkipsEmptyMatches) {
  auto tokens = tokenize("+ a - b c");
  Matcher matcher(R"(\i*)");
  auto matches = matcher.findAll(tokens);
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].value(), "a");
  EXPECT_EQ(matches[1].value(), "bc");

  auto overlapping = matcher.findAll(tokens, true);
  EXPECT_EQ(overlapping.size(), 3u);

  auto first = matcher.findFirst(tokens, 2);
  ASSERT_TRUE(first);
  EXPECT_EQ(first->value(), "bc");
}

TEST(MatcherTest, DeterministicAcrossCalls) {
  auto tokens = tokenize("f(a, [b, {c}]) ; g(h)");
  CompiledPattern pattern = compilePattern(R"((\i) (\Bp) (.*?) (\i)? )");
  auto first = tryMatch(pattern, tokens, 0);
  auto second = tryMatch(pattern, tokens, 0);
  ASSERT_TRUE(first && second);
  ASSERT_EQ(first->captureCount(), second->captureCount());
  for (size_t i = 0; i <= first->captureCount(); i++) {
    EXPECT_EQ(first->captureAt(i).matched, second->captureAt(i).matched);
    EXPECT_EQ(first->captureAt(i).start, second->captureAt(i).start);
    EXPECT_EQ(first->captureAt(i).end, second->captureAt(i).end);
  }
}

TEST(MatcherTest, NestedQuantifiersTerminate) {
  auto tokens = tokenize("a b c ;");
  auto match = matchAt(R"((\i*)* ";")", tokens);
  ASSERT_TRUE(match);
  EXPECT_EQ(match->end(), 4u);
}

TEST(MatcherTest, DepthDelta) {
  auto tokens = tokenize("x = <a>{(b)}</a>;");
  int depth = 0;
  for (const Token &token : tokens) {
    depth += depthDelta(token);
  }
  EXPECT_EQ(depth, 0);
  EXPECT_EQ(depthDelta(Token::synthetic(TokenType::Punctuation, "[")), 1);
  EXPECT_EQ(depthDelta(Token::synthetic(TokenType::String, "\"(\"")), 0);
}
