// awkls/syntax/parse_events.hpp - Events produced by the parser
//
// The parser does not know about documents. It appends a flat, ordered
// sequence of events which the document model and the workspace replay.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "awkls/basic/diagnostic.hpp"
#include "awkls/basic/source_manager.hpp"
#include "awkls/syntax/symbol_type.hpp"

namespace awkls::syntax
{

enum class MessageCategory : uint8_t {
  Syntax,
  MissingSemicolon,
  Compatibility,
  Structure,
  Include,
  Internal,
};

/// A declaration. `type` is the use type (Func, Parameter, ...)
struct DefineEvent
{
  SymbolType type = SymbolType::GlobalVariable;
  std::string scope;  ///< enclosing function name, empty for globals
  std::string name;
  Position position;
  std::string doc_comment;
  bool implicit = false;
};

struct UseEvent
{
  SymbolType type = SymbolType::GlobalVariable;
  std::string scope;
  std::string name;
  Position position;
};

struct MessageEvent
{
  Severity severity = Severity::Error;
  MessageCategory category = MessageCategory::Syntax;
  std::string text;
  Position position;
  uint32_t length = 0;
};

struct IncludeEvent
{
  std::string path;
  bool relative = true;
  Position position;
  uint32_t length = 0;
};

/// Opening (start = true) or closing boundary of a call argument list
struct CallBoundaryEvent
{
  std::string callee;
  bool start = true;
  Position position;
};

struct ParameterBoundaryEvent
{
  int32_t index = 0;
  bool start = true;
  Position position;
};

struct PathBeginEvent
{
  std::vector<std::string> path;
  Position position;
};

struct PathEndEvent
{
  std::vector<std::string> path;
  Position position;
};

struct EmbeddingBeginEvent
{
  std::vector<std::string> path;
  Position position;
};

struct EmbeddingEndEvent
{
  std::vector<std::string> path;
  Position position;
};

using ParseEvent = std::variant<
  DefineEvent, UseEvent, MessageEvent, IncludeEvent, CallBoundaryEvent, ParameterBoundaryEvent,
  PathBeginEvent, PathEndEvent, EmbeddingBeginEvent, EmbeddingEndEvent>;

[[nodiscard]] constexpr std::string_view to_string(MessageCategory c) noexcept
{
  switch (c) {
    case MessageCategory::Syntax:
      return "syntax";
    case MessageCategory::MissingSemicolon:
      return "missing-semicolon";
    case MessageCategory::Compatibility:
      return "compatibility";
    case MessageCategory::Structure:
      return "structure";
    case MessageCategory::Include:
      return "include";
    case MessageCategory::Internal:
      return "internal";
  }
  return "";
}

}  // namespace awkls::syntax
