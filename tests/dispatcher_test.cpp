#include "dispatch/dispatcher.hpp"
#include "edit/tokenEditor.hpp"
#include "lexer/lexer.hpp"
#include "pattern/patternSyntaxError.hpp"

#include <gtest/gtest.h>

using namespace luxer;

namespace {

// Records the handler id and first capture of every invocation
Handler recordTo(std::vector<std::string> &log, std::string label) {
  return [&log, label](HandlerContext &ctx) -> std::any {
    log.push_back(label + ":" + ctx.captureAt(1).value);
    return {};
  };
}

} // namespace

TEST(DispatcherTest, FirstMatchByPriorityThenOrder) {
  auto tokens = tokenize("a b");
  std::vector<std::string> log;
  Dispatcher dispatcher;
  dispatcher.registerHandler("low", R"((\i))", recordTo(log, "low"));
  dispatcher.registerHandler("first", R"((\i))", recordTo(log, "first"),
                             {.priority = 5});
  dispatcher.registerHandler("second", R"((\i))", recordTo(log, "second"),
                             {.priority = 5});
  dispatcher.visit(tokens);
  EXPECT_EQ(log, (std::vector<std::string>{"first:a", "first:b"}));
}

TEST(DispatcherTest, ConsumingAndNonConsumingAdvance) {
  auto tokens = tokenize("a b c");
  std::vector<std::string> consuming;
  Dispatcher eager;
  eager.registerHandler("pair", R"((\i \i))", recordTo(consuming, "pair"));
  eager.visit(tokens);
  EXPECT_EQ(consuming, (std::vector<std::string>{"pair:ab"}));

  std::vector<std::string> peeking;
  Dispatcher lazy;
  lazy.registerHandler("pair", R"((\i \i))", recordTo(peeking, "pair"),
                       {.consumes = false});
  lazy.visit(tokens);
  EXPECT_EQ(peeking, (std::vector<std::string>{"pair:ab", "pair:bc"}));
}

TEST(DispatcherTest, ZeroLengthConsumingMatchStillAdvances) {
  auto tokens = tokenize("a b");
  int calls = 0;
  Dispatcher dispatcher;
  dispatcher.registerHandler("empty", R"(\n*)", [&](HandlerContext &) {
    calls++;
    return std::any{};
  });
  dispatcher.visit(tokens);
  EXPECT_EQ(calls, 2);
}

TEST(DispatcherTest, UnmatchedHookAndLifecycle) {
  auto tokens = tokenize("a + b");
  std::vector<std::string> events;
  Dispatcher dispatcher;
  dispatcher.registerHandler("id", R"(\i)", [&](HandlerContext &ctx) {
    events.push_back("id " + ctx.fullMatch().value);
    return std::any{};
  });
  dispatcher.onBegin([&](std::span<const Token> seen, DispatchContext &) {
    events.push_back("begin " + std::to_string(seen.size()));
  });
  dispatcher.onUnmatched([&](const Token &token, size_t index,
                             DispatchContext &) {
    events.push_back("unmatched " + token.value + " " + std::to_string(index));
  });
  dispatcher.onEnd([&](DispatchContext &) { events.push_back("end"); });
  dispatcher.visit(tokens);
  EXPECT_EQ(events, (std::vector<std::string>{"begin 4", "id a",
                                              "unmatched + 1", "id b",
                                              "end"}));
}

TEST(DispatcherTest, ScopedRegistrationFiresOnlyForItsCaller) {
  auto tokens = tokenize("outer { x } other { y } z");
  std::vector<std::string> log;
  Dispatcher dispatcher;

  auto block = [&](HandlerContext &ctx) -> std::any {
    std::optional<TokenRange> body = ctx.extractBalanced("{", "}");
    if (body) {
      ctx.traverse(*body, {"inner", "fallback"});
      ctx.skipToIndex(body->end + 1);
    }
    return {};
  };
  dispatcher.registerHandler("A", R"(\i"outer")", block, {.priority = 1});
  dispatcher.registerHandler("B", R"(\i"other")", block, {.priority = 1});

  dispatcher.registerHandler(
      "inner", R"((\i))", recordTo(log, "inner"),
      {.priority = 1, .allowedCallers = {"A"}});
  dispatcher.registerHandler("fallback", R"((\i))", recordTo(log, "fallback"),
                             {.name = "fallback"});
  dispatcher.registerHandler("top", R"((\i))", recordTo(log, "top"));

  dispatcher.visit(tokens);
  EXPECT_EQ(log, (std::vector<std::string>{"inner:x", "fallback:y", "top:z"}));
}

TEST(DispatcherTest, ScopedRegistrationNeverFiresAtTopLevel) {
  auto tokens = tokenize("x");
  std::vector<std::string> log;
  size_t unmatched = 0;
  Dispatcher dispatcher;
  dispatcher.registerHandler("inner", R"((\i))", recordTo(log, "inner"),
                             {.allowedCallers = {"A"}});
  dispatcher.onUnmatched(
      [&](const Token &, size_t, DispatchContext &) { unmatched++; });
  DispatchContext context;
  dispatcher.traverse(tokens, {"inner"}, context);
  EXPECT_TRUE(log.empty());
  EXPECT_EQ(unmatched, 1u);
}

TEST(DispatcherTest, SkipBalancedHidesInnerDeclarations) {
  auto tokens = tokenize(
      "const a = 1; function f() { const b = 2; } const c = 3;");
  std::vector<std::string> log;
  Dispatcher dispatcher;
  dispatcher.registerHandler("function", R"(\k"function" (\i) \Bp)",
                             [](HandlerContext &ctx) {
                               ctx.skipBalanced("{", "}");
                               return std::any{};
                             });
  dispatcher.registerHandler("const", R"(\k"const" (\i))",
                             recordTo(log, "const"));
  dispatcher.visit(tokens);
  EXPECT_EQ(log, (std::vector<std::string>{"const:a", "const:c"}));
}

TEST(DispatcherTest, SkipToResumesAfterToken) {
  auto tokens = tokenize("start a b ; c");
  std::vector<std::string> log;
  Dispatcher dispatcher;
  dispatcher.registerHandler("start", R"(\i"start")", [](HandlerContext &ctx) {
    for (const Token &token : ctx.tokens()) {
      if (token.value == ";") {
        ctx.skipTo(token);
        break;
      }
    }
    return std::any{};
  });
  dispatcher.registerHandler("id", R"((\i))", recordTo(log, "id"));
  dispatcher.visit(tokens);
  EXPECT_EQ(log, (std::vector<std::string>{"id:c"}));
}

TEST(DispatcherTest, ResultsAndContextAreShared) {
  auto tokens = tokenize("let a; let b; use");
  Dispatcher dispatcher;
  dispatcher.registerHandler("let", R"(\k"let" (?<name>\i))",
                             [](HandlerContext &ctx) -> std::any {
                               ctx.store().append(
                                   "names", ctx.namedCapture("name").value);
                               return ctx.namedCapture("name").value;
                             });

  std::optional<std::string> lastSeen;
  std::vector<std::string> allSeen;
  dispatcher.registerHandler("use", R"(\i"use")", [&](HandlerContext &ctx) {
    lastSeen = ctx.lastResult<std::string>("let");
    allSeen = ctx.allResults<std::string>("let");
    return std::any{};
  });

  DispatchContext context;
  dispatcher.visit(tokens, context);
  EXPECT_EQ(lastSeen, "b");
  EXPECT_EQ(allSeen, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(context.store.list<std::string>("names"),
            (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(context.results.count("let"), 2u);
  EXPECT_EQ(context.results.count("use"), 0u);
  EXPECT_EQ(context.results.lastOfType<std::string>(), "b");
  EXPECT_FALSE(context.results.lastOfType<int>().has_value());
}

TEST(DispatcherTest, CallerIsVisibleToNestedHandlers) {
  auto tokens = tokenize("wrap ( x )");
  std::string seenCaller;
  size_t depth = 0;
  Dispatcher dispatcher;
  dispatcher.registerHandler("wrap", R"(\i"wrap" (\Bp))",
                             [](HandlerContext &ctx) {
                               EXPECT_TRUE(ctx.caller().empty());
                               const Capture &args = ctx.captureAt(1);
                               ctx.traverse(TokenRange{args.start + 1,
                                                       args.end - 1},
                                            {"leaf"});
                               return std::any{};
                             });
  dispatcher.registerHandler("leaf", R"(\i)",
                             [&](HandlerContext &ctx) {
                               seenCaller = std::string(ctx.caller());
                               depth = ctx.callStack().size();
                               return std::any{};
                             },
                             {.name = "leaf"});
  DispatchContext context;
  dispatcher.visit(tokens, context);
  EXPECT_EQ(seenCaller, "wrap");
  EXPECT_EQ(depth, 1u);
  EXPECT_TRUE(context.callStack.empty());
}

TEST(DispatcherTest, NestedTraversalStaysInsideItsRange) {
  auto tokens = tokenize("( a ) b");
  std::vector<std::string> log;
  Dispatcher dispatcher;
  dispatcher.registerHandler("group", R"p("(" (\i) ")")p",
                             [](HandlerContext &ctx) {
                               ctx.traverse(ctx.captureAt(1), {"all"});
                               return std::any{};
                             });
  dispatcher.registerHandler("all", R"((\i+))", recordTo(log, "all"),
                             {.name = "all"});
  dispatcher.visit(tokens);
  EXPECT_EQ(log, (std::vector<std::string>{"all:a"}));
}

TEST(DispatcherTest, InvalidPatternNamesTheHandler) {
  Dispatcher dispatcher;
  try {
    dispatcher.registerHandler("broken", "(\\i", [](HandlerContext &) {
      return std::any{};
    });
    FAIL() << "expected PatternSyntaxError";
  } catch (const PatternSyntaxError &e) {
    EXPECT_EQ(e.message().rfind("broken: ", 0), 0u);
    EXPECT_EQ(e.offset(), 0u);
  }
  EXPECT_TRUE(dispatcher.registrations().empty());
}

TEST(DispatcherTest, RegistrationsAreListed) {
  Dispatcher dispatcher;
  dispatcher.registerHandler("a", R"(\i)", [](HandlerContext &) {
    return std::any{};
  });
  dispatcher.registerHandler("b", R"(\n)",
                             [](HandlerContext &) { return std::any{}; },
                             {.name = "numbers", .priority = 2});
  ASSERT_EQ(dispatcher.registrations().size(), 2u);
  EXPECT_FALSE(dispatcher.registrations()[0].scoped());
  EXPECT_TRUE(dispatcher.registrations()[1].scoped());
  EXPECT_EQ(dispatcher.registrations()[1].displayName(), "numbers");
  EXPECT_EQ(dispatcher.registrations()[1].order, 1u);
}

TEST(DispatcherTest, HandlersEditThroughTheAttachedEditor) {
  std::string source = "var a = 1;\nvar b = a;";
  auto tokens = tokenize(source);
  TokenEditor editor(source, tokens);
  Dispatcher dispatcher;
  dispatcher.registerHandler(
      "var", R"(\k"var")", [](HandlerContext &ctx) -> std::any {
        ctx.editor()->replace(ctx.tokens()[ctx.index()],
                              {Token::synthetic(TokenType::Keyword, "let")});
        return {};
      });

  DispatchContext context;
  context.setEditor(&editor);
  dispatcher.visit(tokens, context);
  EXPECT_EQ(editor.reconstruct(), "let a = 1;\nlet b = a;");
}

TEST(ContextStoreTest, TypedAccess) {
  ContextStore store;
  store.set("count", 3);
  EXPECT_EQ(*store.get<int>("count"), 3);
  EXPECT_EQ(store.get<std::string>("count"), nullptr);
  EXPECT_EQ(store.getOr<int>("missing", 7), 7);
  EXPECT_EQ(store.getOrAdd<int>("fresh", [] { return 9; }), 9);
  EXPECT_TRUE(store.has("fresh"));
  EXPECT_TRUE(store.remove("fresh"));
  EXPECT_FALSE(store.has("fresh"));
  store.clear();
  EXPECT_EQ(store.size(), 0u);
}
