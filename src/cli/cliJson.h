#pragma once
#include "core/diagnostic.hpp"
#include "lexer/token.hpp"
#include "matcher/tokenMatch.hpp"
#include "outline/outline.hpp"
#include "pattern/compiledPattern.hpp"

#include <nlohmann/json.hpp>
#include <string>

using Json = nlohmann::json;

namespace luxer {

inline void to_json(Json &j, const Token &t) {
  j = Json{{"type", std::string(tokenTypeToString(t.type))},
           {"value", t.value},
           {"start", t.start},
           {"end", t.end},
           {"line", t.line},
           {"column", t.column}};
}

inline void to_json(Json &j, const Capture &c) {
  if (!c.matched) {
    j = nullptr;
    return;
  }
  j = Json{{"start", c.start}, {"end", c.end}, {"value", c.value}};
  if (!c.name.empty()) {
    j["name"] = c.name;
  }
}

inline void to_json(Json &j, const TokenMatch &m) {
  j = Json{{"start", m.start()},
           {"end", m.end()},
           {"value", m.value()},
           {"captures", m.allCaptures()}};
}

inline void to_json(Json &j, const OutlineItem &item) {
  j = Json{{"kind", std::string(outlineKindToString(item.kind))},
           {"name", item.name},
           {"line", item.line},
           {"column", item.column}};
  if (!item.detail.empty()) {
    j["detail"] = item.detail;
  }
  if (!item.children.empty()) {
    j["children"] = item.children;
  }
}

inline void to_json(Json &j, const Diagnostic &d) {
  j = Json{{"severity", std::string(severityToString(d.severity))},
           {"message", d.message},
           {"offset", d.location.offset},
           {"line", d.location.line},
           {"column", d.location.column}};
  if (!d.origin.empty()) {
    j["origin"] = d.origin;
  }
}

// Summary of a compiled pattern: groups and the rendered tree
inline Json patternJson(const CompiledPattern &pattern) {
  Json groups = Json::array();
  for (size_t i = 1; i <= pattern.captureCount(); i++) {
    Json group{{"index", i}};
    if (!pattern.captureName(i).empty()) {
      group["name"] = pattern.captureName(i);
    }
    groups.push_back(group);
  }
  return Json{{"pattern", pattern.source()},
              {"captureCount", pattern.captureCount()},
              {"groups", groups},
              {"tree", pattern.describe()}};
}

} // namespace luxer
