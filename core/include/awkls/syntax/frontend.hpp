// awkls/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <string_view>
#include <vector>

#include "awkls/basic/source_manager.hpp"
#include "awkls/syntax/parse_events.hpp"
#include "awkls/syntax/parser.hpp"

namespace awkls::syntax
{

struct ParseResult
{
  std::vector<ParseEvent> events;
  /// Position just past the end of the text
  Position end_position;
  /// Mode the document was parsed in, after any `#!` override
  bool extended_mode = true;
  /// True when the parser failed internally; `events` then holds what was produced before
  bool crashed = false;
};

/// Length of the synthetic diagnostic reported for an internal parser failure
inline constexpr uint32_t k_crash_diagnostic_length = 100;

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (events)
//
// Never throws. An internal parser failure becomes a single "parser crash"
// error at the token the parser was looking at.
[[nodiscard]] ParseResult parse_document(std::string_view text, ParseOptions options);

}  // namespace awkls::syntax
