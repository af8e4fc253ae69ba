// awkls/syntax/parser.hpp - Recursive-descent AWK parser producing parse events
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "awkls/syntax/expr_tree.hpp"
#include "awkls/syntax/parse_events.hpp"
#include "awkls/syntax/token.hpp"

namespace awkls::syntax
{

/// Maximum nesting of statements and expressions before the parser gives up
inline constexpr uint32_t k_max_nesting_depth = 256;

struct ParseOptions
{
  /// Extended (gawk) mode. A `#!` line naming gawk or awk overrides it.
  bool gawk = true;
};

/**
 * LL(1) parser for one AWK document.
 *
 * All results are appended to the event list given at construction, in text
 * order. The parser holds no reference to any document. It may throw
 * std::runtime_error when the nesting limit is exceeded; events appended
 * before that point stay valid.
 */
class Parser
{
public:
  Parser(
    std::vector<Token> tokens, const std::vector<std::string> & doc_comments,
    std::string_view shebang, ParseOptions options, std::vector<ParseEvent> & events);

  void parse_program();

  /// The token consumed most recently (the first token before any is consumed)
  [[nodiscard]] const Token & last_token() const { return prev(); }

  [[nodiscard]] bool extended_mode() const noexcept { return gawk_; }

private:
  struct FunctionScope
  {
    std::string name;
    std::unordered_map<std::string, bool> variables;  // name -> is parameter
  };

  class DepthGuard
  {
  public:
    explicit DepthGuard(Parser & p);
    ~DepthGuard() { --parser_.depth_; }
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard & operator=(const DepthGuard &) = delete;

  private:
    Parser & parser_;
  };

  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const { return cur().kind == k; }
  [[nodiscard]] bool at_eof() const { return at(TokenKind::Eof); }
  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);
  void skip_newlines();
  void skip_terminators();
  void synchronize_to_stmt();

  [[nodiscard]] static bool can_start_expression(TokenKind k) noexcept;
  [[nodiscard]] static bool can_start_concat_operand(TokenKind k) noexcept;
  [[nodiscard]] std::string doc_of(const Token & t) const;

  // Events
  void emit(ParseEvent ev) { events_.push_back(std::move(ev)); }
  void message(
    Severity severity, MessageCategory category, std::string text, Position position,
    uint32_t length);
  void error_at(const Token & t, std::string text);
  void unexpected(const Token & t);
  void compat(const Token & t, std::string_view construct);
  void define(SymbolType type, const Token & name, std::string doc, bool implicit = false);
  void use_variable(const Token & name);
  void begin_path(std::string segment, Position position);
  void end_path(Position position);
  void regex_embedding(const Token & t);

  // Top level
  void parse_item();
  void parse_function();
  void parse_rule_block(std::string segment);
  void parse_pattern_rule();
  void parse_directive();

  // Statements
  void parse_statement();
  void parse_statement_list();
  void parse_block();
  void parse_if();
  void parse_while();
  void parse_do();
  void parse_for();
  void parse_switch();
  void parse_loop_body();
  void parse_simple_statement();
  void parse_terminator();
  void parse_print();
  void parse_delete();

  // Expressions
  [[nodiscard]] ExprPtr parse_expr();
  [[nodiscard]] ExprPtr parse_ternary();
  [[nodiscard]] ExprPtr parse_or();
  [[nodiscard]] ExprPtr parse_and();
  [[nodiscard]] ExprPtr parse_in();
  [[nodiscard]] ExprPtr parse_match();
  [[nodiscard]] ExprPtr parse_relational();
  [[nodiscard]] ExprPtr parse_pipe_getline();
  [[nodiscard]] ExprPtr parse_concatenation();
  [[nodiscard]] ExprPtr parse_additive();
  [[nodiscard]] ExprPtr parse_multiplicative();
  [[nodiscard]] ExprPtr parse_unary();
  [[nodiscard]] ExprPtr parse_power();
  [[nodiscard]] ExprPtr parse_postfix();
  [[nodiscard]] ExprPtr parse_field();
  [[nodiscard]] ExprPtr parse_primary();
  [[nodiscard]] ExprPtr parse_grouping();
  [[nodiscard]] ExprPtr parse_variable();
  [[nodiscard]] ExprPtr parse_user_call();
  [[nodiscard]] ExprPtr parse_builtin_call();
  [[nodiscard]] ExprPtr parse_indirect_call();
  [[nodiscard]] ExprPtr parse_simple_getline();
  [[nodiscard]] ExprPtr parse_getline_target();
  void parse_subscripts();
  /// Argument list of a call; emits call and parameter boundaries when `callee` is set
  void parse_call_arguments(const Token * callee);

  std::vector<Token> tokens_;
  const std::vector<std::string> & doc_comments_;
  std::vector<ParseEvent> & events_;
  size_t idx_ = 0;

  bool gawk_ = true;
  uint32_t depth_ = 0;
  uint32_t loop_depth_ = 0;
  uint32_t switch_depth_ = 0;

  /// Inside print/printf arguments outside any parentheses: `>` redirects and
  /// a parenthesized list is an argument list.
  bool print_context_ = false;

  std::optional<FunctionScope> function_;
  std::unordered_set<std::string> declared_functions_;  ///< every name after `function`
  std::unordered_set<std::string> defined_functions_;
  std::unordered_set<std::string> defined_globals_;
  std::vector<std::string> path_;
};

}  // namespace awkls::syntax
