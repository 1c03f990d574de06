#include "cli/cliJson.h"
#include "lexer/lexer.hpp"
#include "matcher/matcher.hpp"
#include "outline/outline.hpp"
#include "pattern/patternCompiler.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

using namespace luxer;

namespace {

struct CliOptions {
  std::string command;
  std::vector<std::string> arguments;
  bool whitespace = false;
  bool comments = false;
  bool json = false;
  bool all = false;
  bool debug = false;
};

void printUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " tokens  <file> [--whitespace] [--comments] [--json]\n";
  std::cerr << "       " << program << " compile <pattern> [--json]\n";
  std::cerr << "       " << program
            << " match   <pattern> <file> [--all] [--json]\n";
  std::cerr << "       " << program << " outline <file> [--json] [--debug]\n";
  std::cerr << "\nOptions:\n";
  std::cerr << "  --whitespace  Keep whitespace tokens\n";
  std::cerr << "  --comments    Keep comment tokens\n";
  std::cerr << "  --json        Print JSON instead of text\n";
  std::cerr << "  --all         Report every match instead of the first\n";
  std::cerr << "  --debug       Enable dispatcher logging on stderr\n";
}

std::string readFile(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    throw std::runtime_error("Cannot open file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// Unknown characters are reported on stderr and kept as tokens
std::vector<Token> lexFile(const std::string &path, LexerOptions options) {
  std::string source = readFile(path);
  Lexer lexer(source, options, path);
  std::vector<Token> tokens = lexer.tokenizeAll();
  for (const Diagnostic &warning : unknownTokenWarnings(tokens, path)) {
    std::cerr << warning.toString() << "\n";
  }
  return tokens;
}

// Under --json, lex and pattern errors are printed as an object on stdout
int reportError(const Diagnostic &diagnostic, const CliOptions &options) {
  if (options.json) {
    std::cout << Json{{"error", diagnostic}}.dump(2) << "\n";
  } else {
    std::cerr << "Error: " << diagnostic.toString() << "\n";
  }
  return 1;
}

void requireArguments(const CliOptions &options, size_t count) {
  if (options.arguments.size() != count) {
    throw std::runtime_error("'" + options.command + "' expects " +
                             std::to_string(count) + " argument" +
                             (count == 1 ? "" : "s"));
  }
}

int runTokens(const CliOptions &options) {
  requireArguments(options, 1);
  LexerOptions lexerOptions;
  lexerOptions.includeWhitespace = options.whitespace;
  lexerOptions.includeComments = options.comments;
  std::vector<Token> tokens = lexFile(options.arguments[0], lexerOptions);

  if (options.json) {
    std::cout << Json(tokens).dump(2) << "\n";
    return 0;
  }
  for (const Token &token : tokens) {
    std::cout << token.toString() << "\n";
  }
  return 0;
}

int runCompile(const CliOptions &options) {
  requireArguments(options, 1);
  CompiledPattern pattern = compilePattern(options.arguments[0]);
  if (options.json) {
    std::cout << patternJson(pattern).dump(2) << "\n";
    return 0;
  }
  std::cout << pattern.describe();
  std::cout << "groups: " << pattern.captureCount() << "\n";
  return 0;
}

void printMatch(const TokenMatch &match, std::span<const Token> tokens) {
  const Token &first = tokens[match.start()];
  std::cout << first.line << ":" << first.column << " [" << match.start()
            << ", " << match.end() << ") " << match.value() << "\n";
  for (size_t i = 1; i <= match.captureCount(); i++) {
    const Capture &capture = match.captureAt(i);
    std::cout << "  " << i;
    if (!capture.name.empty()) {
      std::cout << " <" << capture.name << ">";
    }
    if (capture.matched) {
      std::cout << ": " << capture.value << "\n";
    } else {
      std::cout << ": (unmatched)\n";
    }
  }
}

int runMatch(const CliOptions &options) {
  requireArguments(options, 2);
  Matcher matcher(options.arguments[0]);
  std::vector<Token> tokens = lexFile(options.arguments[1], {});

  std::vector<TokenMatch> matches;
  if (options.all) {
    matches = matcher.findAll(tokens);
  } else if (std::optional<TokenMatch> match = matcher.findFirst(tokens)) {
    matches.push_back(std::move(*match));
  }

  if (options.json) {
    std::cout << Json(matches).dump(2) << "\n";
  } else {
    for (const TokenMatch &match : matches) {
      printMatch(match, tokens);
    }
  }
  // grep-style exit status
  return matches.empty() ? 1 : 0;
}

void printOutline(const std::vector<OutlineItem> &items, int indent) {
  for (const OutlineItem &item : items) {
    std::cout << std::string(indent * 2, ' ') << outlineKindToString(item.kind)
              << " " << item.name;
    if (!item.detail.empty()) {
      std::cout << " " << item.detail;
    }
    std::cout << " (" << item.line << ":" << item.column << ")\n";
    printOutline(item.children, indent + 1);
  }
}

int runOutline(const CliOptions &options) {
  requireArguments(options, 1);
  std::vector<Token> tokens = lexFile(options.arguments[0], {});
  std::vector<OutlineItem> outline = buildOutline(tokens, options.debug);
  if (options.json) {
    std::cout << Json(outline).dump(2) << "\n";
  } else {
    printOutline(outline, 0);
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  CliOptions options;
  for (int argIndex = 1; argIndex < argc; argIndex++) {
    std::string arg = argv[argIndex];
    if (arg == "--whitespace") {
      options.whitespace = true;
    } else if (arg == "--comments") {
      options.comments = true;
    } else if (arg == "--json") {
      options.json = true;
    } else if (arg == "--all") {
      options.all = true;
    } else if (arg == "--debug") {
      options.debug = true;
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else if (options.command.empty()) {
      options.command = arg;
    } else {
      options.arguments.push_back(arg);
    }
  }

  try {
    if (options.command == "tokens") {
      return runTokens(options);
    }
    if (options.command == "compile") {
      return runCompile(options);
    }
    if (options.command == "match") {
      return runMatch(options);
    }
    if (options.command == "outline") {
      return runOutline(options);
    }
    std::cerr << "Error: Unknown command '" << options.command << "'\n";
    printUsage(argv[0]);
    return 1;
  } catch (const LexError &e) {
    return reportError(e.getDiagnostic(), options);
  } catch (const PatternSyntaxError &e) {
    return reportError(e.getDiagnostic(), options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
