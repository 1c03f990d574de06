#include "edit/tokenEditor.hpp"
#include "lexer/lexer.hpp"
#include "matcher/matcher.hpp"

#include <gtest/gtest.h>

using namespace luxer;

namespace {

TokenEditor editorFor(const std::string &source) {
  return TokenEditor(source, tokenize(source));
}

Token identifier(std::string text) {
  return Token::synthetic(TokenType::Identifier, std::move(text));
}

} // namespace

TEST(TokenEditorTest, NoEditsReproducesSourceExactly) {
  std::string source = "const  x = f( a,\n\tb ); // keep\n";
  TokenEditor editor = editorFor(source);
  EXPECT_FALSE(editor.hasEdits());
  EXPECT_EQ(editor.reconstruct(), source);
  EXPECT_EQ(editor.modifiedTokens().size(), editor.originalTokens().size());
}

TEST(TokenEditorTest, ReplaceKeepsSurroundingFormatting) {
  std::string source = "let  value =\n  old;";
  TokenEditor editor = editorFor(source);
  const Token &old = editor.originalTokens()[3];
  ASSERT_EQ(old.value, "old");
  EXPECT_TRUE(editor.replace(old, {identifier("fresh")}));
  EXPECT_EQ(editor.reconstruct(), "let  value =\n  fresh;");
}

TEST(TokenEditorTest, InsertBeforeAndAfter) {
  TokenEditor editor = editorFor("f(a)");
  const std::vector<Token> &tokens = editor.originalTokens();
  EXPECT_TRUE(editor.insertBefore(tokens[0], {identifier("await ")}));
  EXPECT_TRUE(editor.insertAfter(tokens[2],
                                 {Token::synthetic(TokenType::Punctuation, ","),
                                  identifier(" b")}));
  EXPECT_EQ(editor.reconstruct(), "await f(a, b)");

  std::vector<Token> modified = editor.modifiedTokens();
  ASSERT_EQ(modified.size(), tokens.size() + 3);
  EXPECT_EQ(modified[0].value, "await ");
  EXPECT_TRUE(modified[0].isSynthetic());
  EXPECT_EQ(modified[4].value, ",");
}

TEST(TokenEditorTest, RemoveToken) {
  TokenEditor editor = editorFor("a + b");
  const std::vector<Token> &tokens = editor.originalTokens();
  EXPECT_TRUE(editor.remove(tokens[1]));
  EXPECT_TRUE(editor.remove(tokens[2]));
  EXPECT_EQ(editor.reconstruct(), "a  ");
  EXPECT_EQ(editor.modifiedTokens().size(), 2u);
}

TEST(TokenEditorTest, ReplaceAndRemoveMatches) {
  std::string source = "x = foo(1, 2);\ny = bar;";
  TokenEditor editor = editorFor(source);
  Matcher call(R"(\i \Bp)");
  auto match = call.match(editor.originalTokens(), 2);
  ASSERT_TRUE(match);
  EXPECT_TRUE(editor.replace(*match, {identifier("call()")}));

  Matcher assignment(R"(\i"y" "=" \i ";")");
  auto second = assignment.match(editor.originalTokens(), 9);
  ASSERT_TRUE(second);
  EXPECT_TRUE(editor.remove(*second));
  EXPECT_EQ(editor.reconstruct(), "x = call();\n");
}

TEST(TokenEditorTest, EditsApplyInSourceOrder) {
  TokenEditor editor = editorFor("a b c");
  const std::vector<Token> &tokens = editor.originalTokens();
  editor.replace(tokens[2], {identifier("C")});
  editor.replace(tokens[0], {identifier("A")});
  editor.insertAfter(tokens[0], {identifier("1")});
  editor.insertAfter(tokens[0], {identifier("2")});
  EXPECT_EQ(editor.reconstruct(), "A12 b C");
}

TEST(TokenEditorTest, OverlappingEditsAreDropped) {
  TokenEditor editor = editorFor("a b c d");
  const std::vector<Token> &tokens = editor.originalTokens();
  EXPECT_TRUE(editor.replace(0, 3, {identifier("X")}));
  EXPECT_TRUE(editor.replace(tokens[1], {identifier("Y")}));
  EXPECT_TRUE(editor.insertBefore(tokens[2], {identifier("Z")}));
  EXPECT_EQ(editor.reconstruct(), "X d");

  std::vector<Token> modified = editor.modifiedTokens();
  ASSERT_EQ(modified.size(), 3u);
  EXPECT_EQ(modified[0].value, "X");
  EXPECT_EQ(modified[1].value, "d");
}

TEST(TokenEditorTest, TokensFromElsewhereAreRejected) {
  TokenEditor editor = editorFor("a b");
  EXPECT_FALSE(editor.remove(identifier("a")));
  EXPECT_FALSE(editor.replace(2, 1, {}));
  EXPECT_FALSE(editor.replace(0, 99, {}));

  // A copy of a token is found by its source span
  Token copy = editor.originalTokens()[1];
  EXPECT_TRUE(editor.replace(copy, {identifier("B")}));
  EXPECT_EQ(editor.reconstruct(), "a B");
}
