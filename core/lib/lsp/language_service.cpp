// awkls/lsp/language_service.cpp - Editor query implementation
#include "awkls/lsp/language_service.hpp"

#include <algorithm>
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <vector>

#include "awkls/syntax/builtins.hpp"

namespace awkls::lsp
{

namespace
{

using json = nlohmann::json;

json position_to_json(Position p) { return json{{"line", p.line}, {"character", p.character}}; }

json range_to_json(const Range & r)
{
  return json{{"start", position_to_json(r.start)}, {"end", position_to_json(r.end)}};
}

json location_to_json(const std::string & uri, const Range & r)
{
  return json{{"uri", uri}, {"range", range_to_json(r)}};
}

std::string builtin_hover(const syntax::BuiltinSymbol & b)
{
  if (!b.is_function) {
    return "built-in variable: " + b.description;
  }
  return "built-in function: " + b.signature() + ": " + b.description;
}

const char * kind_name(SymbolType type)
{
  return from_define_type(type) == SymbolType::Func ? "Function" : "Variable";
}

}  // namespace

std::string left_align(std::string_view doc_comment)
{
  std::vector<std::string_view> lines;
  size_t begin = 0;
  while (true) {
    const size_t nl = doc_comment.find('\n', begin);
    if (nl == std::string_view::npos) {
      lines.push_back(doc_comment.substr(begin));
      break;
    }
    lines.push_back(doc_comment.substr(begin, nl - begin));
    begin = nl + 1;
  }

  // Length of `##[ \t]*` on each line; lines without the marker count as 2
  size_t strip = 2;
  for (const auto line : lines) {
    size_t len = 2;
    if (line.size() >= 2 && line[0] == '#' && line[1] == '#') {
      while (len < line.size() && (line[len] == ' ' || line[len] == '\t')) {
        ++len;
      }
    }
    strip = std::min(strip, len);
  }

  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out += '\n';
    }
    if (lines[i].size() > strip) {
      out.append(lines[i].substr(strip));
    }
  }
  return out;
}

const Document * LanguageService::document(std::string_view uri) const
{
  return workspace_.find_document(std::string(uri));
}

std::optional<SymbolUsage> LanguageService::symbol_at(std::string_view uri, Position position) const
{
  const Document * doc = document(uri);
  if (doc == nullptr) {
    return std::nullopt;
  }
  const SymbolUsage * usage = doc->find_usage_at(position);
  if (usage == nullptr) {
    return std::nullopt;
  }
  SymbolUsage result = *usage;
  result.type = from_define_type(result.type);
  return result;
}

// ============================================================================
// Hover
// ============================================================================

std::string LanguageService::hover_json(std::string_view uri, Position position) const
{
  json out;
  out["uri"] = std::string(uri);
  out["contents"] = json::array();
  out["range"] = nullptr;

  const auto usage = symbol_at(uri, position);
  if (!usage) {
    return out.dump();
  }
  out["range"] = range_to_json(usage->range());

  const auto & settings = workspace_.settings();
  const syntax::BuiltinSymbol * builtin = nullptr;
  if (usage->type == SymbolType::Func) {
    builtin = syntax::find_builtin_function(usage->name);
  } else if (usage->type == SymbolType::GlobalVariable) {
    builtin = syntax::find_builtin_variable(usage->name);
  }
  if (builtin != nullptr && (settings.stylistic_warnings.compatibility || builtin->posix)) {
    out["contents"].push_back(builtin_hover(*builtin));
    return out.dump();
  }

  for (const Document * doc : workspace_.documents()) {
    for (const SymbolDefinition * def : doc->find_definitions(usage->name, usage->type)) {
      std::string text;
      switch (def->type()) {
        case SymbolType::Func:
          text = "function " + def->signature();
          break;
        case SymbolType::Parameter:
          text = "parameter";
          break;
        case SymbolType::LocalVariable:
          text = "local variable";
          break;
        default:
          break;
      }
      if (!def->doc_comment().empty()) {
        if (!text.empty()) {
          text += '\n';
        }
        text += left_align(def->doc_comment());
      }
      if (!text.empty()) {
        out["contents"].push_back(std::move(text));
      }
    }
  }

  if (out["contents"].empty()) {
    if (usage->type == SymbolType::Func) {
      out["contents"].push_back("undeclared function");
    } else if (usage->type == SymbolType::GlobalVariable) {
      out["contents"].push_back("global variable");
    }
  }
  return out.dump();
}

// ============================================================================
// Definition / References
// ============================================================================

std::string LanguageService::definition_json(std::string_view uri, Position position) const
{
  json out;
  out["uri"] = std::string(uri);
  out["locations"] = json::array();

  const auto usage = symbol_at(uri, position);
  if (!usage) {
    return out.dump();
  }
  for (const Document * doc : workspace_.documents()) {
    for (const SymbolDefinition * def : doc->find_definitions(usage->name, usage->type)) {
      if (def->is_implicit()) {
        continue;
      }
      out["locations"].push_back(location_to_json(doc->uri(), def->name_range()));
    }
  }
  return out.dump();
}

std::string LanguageService::references_json(
  std::string_view uri, Position position, bool include_declaration) const
{
  json out;
  out["uri"] = std::string(uri);
  out["locations"] = json::array();

  const auto usage = symbol_at(uri, position);
  if (!usage) {
    return out.dump();
  }
  const auto docs = workspace_.documents();
  if (include_declaration) {
    for (const Document * doc : docs) {
      for (const SymbolDefinition * def : doc->find_definitions(usage->name, usage->type)) {
        out["locations"].push_back(location_to_json(doc->uri(), def->name_range()));
      }
    }
  }
  for (const Document * doc : docs) {
    for (const SymbolUsage & u : doc->usages()) {
      if (u.name == usage->name && u.type == usage->type) {
        out["locations"].push_back(location_to_json(doc->uri(), u.range()));
      }
    }
  }
  return out.dump();
}

// ============================================================================
// Completion
// ============================================================================

std::string LanguageService::completion_json(std::string_view uri, Position position) const
{
  json out;
  out["uri"] = std::string(uri);
  out["items"] = json::array();

  const auto usage = symbol_at(uri, position);

  // name -> (kind, doc comments)
  std::map<std::string, std::pair<SymbolType, std::set<std::string>>> symbols;
  for (const Document * doc : workspace_.documents()) {
    for (size_t t = 0; t < k_define_type_offset; ++t) {
      const auto type = static_cast<SymbolType>(t);
      if (usage && usage->type != type) {
        continue;
      }
      for (const auto & [name, defs] : doc->definitions(type)) {
        auto & entry = symbols.try_emplace(name, type, std::set<std::string>{}).first->second;
        for (const SymbolDefinition * def : defs) {
          if (!def->doc_comment().empty()) {
            entry.second.insert(left_align(def->doc_comment()));
          }
        }
      }
    }
  }

  for (const auto & [name, entry] : symbols) {
    if (syntax::find_builtin(name) != nullptr) {
      continue;
    }
    if (entry.second.empty()) {
      out["items"].push_back(json{{"label", name}, {"kind", kind_name(entry.first)}});
      continue;
    }
    for (const auto & doc_comment : entry.second) {
      out["items"].push_back(
        json{{"label", name}, {"kind", kind_name(entry.first)}, {"documentation", doc_comment}});
    }
  }

  const bool gawk = workspace_.settings().gawk;
  for (const auto & b : syntax::all_builtins()) {
    if (!gawk && !b.posix) {
      continue;
    }
    json item{
      {"label", b.name},
      {"kind", b.is_function ? "Function" : "Variable"},
      {"documentation", b.description}};
    if (b.is_function) {
      item["detail"] = b.signature();
    }
    out["items"].push_back(std::move(item));
  }
  return out.dump();
}

// ============================================================================
// Symbols
// ============================================================================

std::string LanguageService::document_symbols_json(std::string_view uri) const
{
  json out;
  out["uri"] = std::string(uri);
  out["symbols"] = json::array();

  const Document * doc = document(uri);
  if (doc == nullptr) {
    return out.dump();
  }
  std::vector<const SymbolDefinition *> functions;
  for (const auto & [name, defs] : doc->definitions(SymbolType::Func)) {
    if (!defs.empty()) {
      functions.push_back(defs.front());
    }
  }
  std::sort(functions.begin(), functions.end(), [](const auto * a, const auto * b) {
    return a->position() < b->position();
  });
  for (const SymbolDefinition * def : functions) {
    out["symbols"].push_back(
      json{{"name", def->name()}, {"kind", "Function"}, {"range", range_to_json(def->name_range())}});
  }
  return out.dump();
}

std::string LanguageService::workspace_symbols_json(std::string_view query) const
{
  json out;
  out["symbols"] = json::array();

  for (const Document * doc : workspace_.documents()) {
    std::vector<const SymbolDefinition *> matches;
    for (const auto & [name, defs] : doc->definitions(SymbolType::Func)) {
      if (name.compare(0, query.size(), query) != 0) {
        continue;
      }
      matches.insert(matches.end(), defs.begin(), defs.end());
    }
    std::sort(matches.begin(), matches.end(), [](const auto * a, const auto * b) {
      return a->position() < b->position();
    });
    for (const SymbolDefinition * def : matches) {
      out["symbols"].push_back(json{
        {"name", def->name()},
        {"kind", "Function"},
        {"uri", doc->uri()},
        {"range", range_to_json(def->name_range())}});
    }
  }
  return out.dump();
}

// ============================================================================
// Signature / Context
// ============================================================================

std::string LanguageService::signature_json(std::string_view uri, Position position) const
{
  json out;
  out["uri"] = std::string(uri);
  out["signature"] = nullptr;

  const Document * doc = document(uri);
  if (doc == nullptr) {
    return out.dump();
  }
  const ParameterUsage * last = doc->find_parameter_usage_at(position);
  if (last == nullptr) {
    return out.dump();
  }

  struct OpenCall
  {
    std::string function;
    int32_t active = 0;
  };
  std::vector<OpenCall> stack;
  const auto & usages = doc->parameter_usages();
  const auto count = static_cast<size_t>(last - usages.data()) + 1;
  for (size_t i = 0; i < count; ++i) {
    const ParameterUsage & u = usages[i];
    if (u.is_call_boundary()) {
      if (u.start) {
        stack.push_back({u.function, 0});
      } else if (u.position < position && !stack.empty()) {
        stack.pop_back();
      }
    } else if (u.start && !stack.empty()) {
      stack.back().active = u.parameter;
    }
  }
  if (stack.empty()) {
    return out.dump();
  }

  const OpenCall & call = stack.back();
  std::vector<std::string> parameters;
  std::string label;
  if (const auto * builtin = syntax::find_builtin_function(call.function)) {
    parameters = builtin->parameters;
    label = builtin->signature();
  } else {
    const SymbolDefinition * def = nullptr;
    for (const Document * d : workspace_.documents()) {
      auto defs = d->find_definitions(call.function, SymbolType::Func);
      if (!defs.empty()) {
        def = defs[0];
        break;
      }
    }
    if (def == nullptr) {
      return out.dump();
    }
    for (const auto & p : def->parameters()) {
      parameters.push_back(p->name());
    }
    label = def->signature();
  }

  out["signature"] = json{
    {"function", call.function},
    {"label", label},
    {"parameters", parameters},
    {"activeParameter", call.active}};
  return out.dump();
}

std::string LanguageService::context_json(std::string_view uri, Position position) const
{
  json out;
  out["uri"] = std::string(uri);
  out["path"] = json::array();

  if (const Document * doc = document(uri)) {
    for (auto & segment : doc->position_tree().context_at(position)) {
      out["path"].push_back(std::move(segment));
    }
  }
  return out.dump();
}

}  // namespace awkls::lsp
