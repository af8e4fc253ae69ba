// awkls/syntax/frontend.cpp - High-level parse pipeline
#include "awkls/syntax/frontend.hpp"

#include <exception>
#include <string>

#include "awkls/syntax/lexer.hpp"

namespace awkls::syntax
{

ParseResult parse_document(std::string_view text, ParseOptions options)
{
  ParseResult result;

  Lexer lexer(text, options.gawk);
  std::vector<Token> tokens = lexer.lex_all();
  result.end_position = lexer.end_position();

  Parser parser(std::move(tokens), lexer.doc_comments(), lexer.shebang(), options, result.events);
  result.extended_mode = parser.extended_mode();

  try {
    parser.parse_program();
  } catch (const std::exception & e) {
    result.crashed = true;
    MessageEvent m;
    m.severity = Severity::Error;
    m.category = MessageCategory::Internal;
    m.text = std::string("parser crash: ") + e.what();
    m.position = parser.last_token().position;
    m.length = k_crash_diagnostic_length;
    result.events.emplace_back(std::move(m));
  }

  return result;
}

}  // namespace awkls::syntax
