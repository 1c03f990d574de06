#include "outline/outline.hpp"
#include "dispatch/dispatcher.hpp"

#include <cctype>

namespace luxer {

static const char *const elementsKey = "outline.elements";

// Declarations exported or not; the name is captured as `name`
static const char *const functionPattern =
    R"((?:\k"export" (?:\k"default")?)? (?:\k"async")? \k"function" )"
    R"((?<name>\i) (?:\go .*? \gc)? (?<params>\Bp))";

static const char *const arrowPattern =
    R"((?:\k"export")? [\k"const" | \k"let"] (?<name>\i) )"
    R"((?:\cl [\tn | \i | \s | "." | "|" | \go | \gc | "," | \tl | \tr | \op | "[]"]*)? )"
    R"("=" (?:\k"async")? (?<params>[\Bp | \i]) \fa)";

static const char *const importPattern =
    R"(\k"import" (?<names>.*?) \k"from" (?<module>\s))";

// Well-formed elements only; nested ones are visited too
static const char *const elementPattern = R"((?=\Je) (?<tag>\jo))";

std::string_view outlineKindToString(OutlineKind kind) {
  switch (kind) {
  case OutlineKind::Import:
    return "import";
  case OutlineKind::Function:
    return "function";
  case OutlineKind::Component:
    return "component";
  case OutlineKind::Element:
    return "element";
  }
  return "unknown";
}

static std::string unquote(const std::string &value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

static std::string joinValues(std::span<const Token> tokens) {
  std::string result;
  for (const Token &token : tokens) {
    if (!result.empty() && token.value != "," && result.back() != '{' &&
        token.value != "}") {
      result += ' ';
    }
    result += token.value;
  }
  return result;
}

static OutlineItem itemAt(OutlineKind kind, std::string name,
                          const Token &token) {
  OutlineItem item;
  item.kind = kind;
  item.name = std::move(name);
  item.line = token.line;
  item.column = token.column;
  return item;
}

/**
 * Shared by both declaration forms. Capitalized names are components, whose
 * body is searched for markup; the body is skipped afterwards.
 */
static std::any declaration(HandlerContext &ctx) {
  const Capture &name = ctx.namedCapture("name");
  bool component =
      !name.value.empty() &&
      std::isupper(static_cast<unsigned char>(name.value.front())) != 0;

  OutlineItem item = itemAt(component ? OutlineKind::Component
                                      : OutlineKind::Function,
                            name.value, ctx.tokens()[name.start]);
  item.detail = ctx.namedCapture("params").value;

  size_t bodyOffset = ctx.match().length();
  std::optional<TokenRange> body;
  const std::span<const Token> tokens = ctx.tokens();
  size_t next = ctx.match().end();
  if (next < tokens.size()) {
    if (tokens[next].value == "{") {
      body = ctx.extractBalanced("{", "}", bodyOffset);
    } else if (tokens[next].value == "(") {
      body = ctx.extractBalanced("(", ")", bodyOffset);
    } else if (tokens[next].type == TokenType::Colon) {
      // Return type annotation before the body
      body = ctx.extractBalanced("{", "}", bodyOffset);
    }
  }

  if (body) {
    if (component) {
      ctx.traverse(*body, {"element"});
      item.children = ctx.store().list<OutlineItem>(elementsKey);
      ctx.store().remove(elementsKey);
    }
    ctx.skipToIndex(body->end + 1);
  }
  return item;
}

std::vector<OutlineItem> buildOutline(std::span<const Token> tokens,
                                      bool debug) {
  Dispatcher dispatcher;
  dispatcher.setDebug(debug);

  dispatcher.registerHandler(
      "import", importPattern, [](HandlerContext &ctx) -> std::any {
        OutlineItem item = itemAt(OutlineKind::Import,
                                  unquote(ctx.namedCapture("module").value),
                                  ctx.tokens()[ctx.index()]);
        item.detail = joinValues(ctx.tokensOf(ctx.namedCapture("names")));
        return item;
      });
  dispatcher.registerHandler("function", functionPattern, declaration,
                             {.priority = 1});
  dispatcher.registerHandler("arrow", arrowPattern, declaration);

  // Only reachable from a component body
  dispatcher.registerHandler(
      "element", elementPattern,
      [](HandlerContext &ctx) -> std::any {
        const Capture &tag = ctx.namedCapture("tag");
        std::string name = tag.value.substr(1);
        OutlineItem item =
            itemAt(OutlineKind::Element, name.empty() ? "fragment" : name,
                   ctx.tokens()[tag.start]);
        for (size_t i = tag.end; i < ctx.tokens().size(); i++) {
          const Token &token = ctx.tokens()[i];
          if (token.type == TokenType::TagEnd ||
              token.type == TokenType::SelfClose) {
            break;
          }
          if (token.type == TokenType::AttributeName) {
            item.detail += item.detail.empty() ? token.value
                                               : " " + token.value;
          }
        }
        ctx.store().append(elementsKey, std::move(item));
        return {};
      },
      {.name = "element", .consumes = false, .allowedCallers = {"function", "arrow"}});

  DispatchContext context;
  dispatcher.visit(tokens, context);
  return context.results.allOfType<OutlineItem>();
}

} // namespace luxer
