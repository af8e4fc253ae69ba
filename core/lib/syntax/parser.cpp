// awkls/syntax/parser.cpp - Recursive-descent AWK parser
#include "awkls/syntax/parser.hpp"

#include <stdexcept>
#include <utility>

#include "awkls/syntax/builtins.hpp"
#include "awkls/syntax/lexer.hpp"

namespace awkls::syntax
{
namespace
{

std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Eof:
      return "end of file";
    case TokenKind::Newline:
      return "newline";
    default:
      return "'" + std::string(t.text) + "'";
  }
}

std::string unquote(std::string_view text)
{
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    text = text.substr(1, text.size() - 2);
  }
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\' && i + 1 < text.size()) {
      ++i;
      switch (text[i]) {
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        default:
          out.push_back(text[i]);
          break;
      }
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

}  // namespace

// ============================================================================
// Construction and token helpers
// ============================================================================

Parser::DepthGuard::DepthGuard(Parser & p) : parser_(p)
{
  if (++parser_.depth_ > k_max_nesting_depth) {
    --parser_.depth_;
    throw std::runtime_error("nesting too deep");
  }
}

Parser::Parser(
  std::vector<Token> tokens, const std::vector<std::string> & doc_comments,
  std::string_view shebang, ParseOptions options, std::vector<ParseEvent> & events)
: tokens_(std::move(tokens)), doc_comments_(doc_comments), events_(events), gawk_(options.gawk)
{
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    eof.kind = TokenKind::Eof;
    if (!tokens_.empty()) {
      eof.position = tokens_.back().end_position();
    }
    tokens_.push_back(eof);
  }
  if (const auto forced = mode_from_shebang(shebang)) {
    gawk_ = *forced;
  }

  // Functions may be called before their definition
  for (size_t i = 0; i + 1 < tokens_.size(); ++i) {
    if (tokens_[i].kind == TokenKind::KwFunction) {
      declared_functions_.insert(std::string(tokens_[i + 1].text));
    }
  }
}

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return idx_ > 0 ? tokens_[idx_ - 1] : tokens_.front(); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(prev(), "syntax error: expected " + std::string(what) + ", found " + describe(cur()));
  return false;
}

void Parser::skip_newlines()
{
  while (at(TokenKind::Newline)) {
    advance();
  }
}

void Parser::skip_terminators()
{
  while (at(TokenKind::Newline) || at(TokenKind::Semicolon)) {
    advance();
  }
}

void Parser::synchronize_to_stmt()
{
  int brace_depth = 0;
  while (!at_eof()) {
    const TokenKind k = cur().kind;
    if (brace_depth == 0 && (k == TokenKind::Newline || k == TokenKind::Semicolon)) {
      advance();
      return;
    }
    if (k == TokenKind::RBrace) {
      if (brace_depth == 0) {
        return;
      }
      --brace_depth;
    } else if (k == TokenKind::LBrace) {
      ++brace_depth;
    }
    advance();
  }
}

bool Parser::can_start_expression(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Identifier:
    case TokenKind::FuncName:
    case TokenKind::Builtin:
    case TokenKind::Number:
    case TokenKind::String:
    case TokenKind::Regex:
    case TokenKind::Dollar:
    case TokenKind::Not:
    case TokenKind::Minus:
    case TokenKind::Plus:
    case TokenKind::LParen:
    case TokenKind::Incr:
    case TokenKind::Decr:
    case TokenKind::At:
    case TokenKind::KwGetline:
      return true;
    default:
      return false;
  }
}

bool Parser::can_start_concat_operand(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Identifier:
    case TokenKind::FuncName:
    case TokenKind::Builtin:
    case TokenKind::Number:
    case TokenKind::String:
    case TokenKind::Dollar:
    case TokenKind::LParen:
    case TokenKind::At:
      return true;
    default:
      return false;
  }
}

std::string Parser::doc_of(const Token & t) const
{
  if (t.doc_index < 0 || static_cast<size_t>(t.doc_index) >= doc_comments_.size()) {
    return {};
  }
  return doc_comments_[static_cast<size_t>(t.doc_index)];
}

// ============================================================================
// Event helpers
// ============================================================================

void Parser::message(
  Severity severity, MessageCategory category, std::string text, Position position,
  uint32_t length)
{
  MessageEvent m;
  m.severity = severity;
  m.category = category;
  m.text = std::move(text);
  m.position = position;
  m.length = length;
  emit(std::move(m));
}

void Parser::error_at(const Token & t, std::string text)
{
  message(
    Severity::Error, MessageCategory::Syntax, std::move(text), t.position,
    t.length == 0 ? 1 : t.length);
}

void Parser::unexpected(const Token & t)
{
  if (t.kind == TokenKind::Unknown && !t.text.empty()) {
    if (t.text.front() == '"') {
      error_at(t, "syntax error: unterminated string");
      return;
    }
    if (t.text.front() == '/') {
      error_at(t, "syntax error: unterminated regular expression");
      return;
    }
    error_at(t, "syntax error: unexpected character " + describe(t));
    return;
  }
  error_at(prev(), "syntax error: unexpected " + describe(t));
}

void Parser::compat(const Token & t, std::string_view construct)
{
  if (gawk_) {
    message(
      Severity::Warning, MessageCategory::Compatibility,
      std::string(construct) + " is a gawk extension", t.position, t.length);
  } else {
    message(
      Severity::Error, MessageCategory::Compatibility,
      std::string(construct) + " is not supported in awk mode", t.position, t.length);
  }
}

void Parser::define(SymbolType type, const Token & name, std::string doc, bool implicit)
{
  DefineEvent d;
  d.type = type;
  if (function_ && type != SymbolType::Func && type != SymbolType::GlobalVariable) {
    d.scope = function_->name;
  }
  d.name = std::string(name.text);
  d.position = name.position;
  d.doc_comment = std::move(doc);
  d.implicit = implicit;
  emit(std::move(d));
}

void Parser::use_variable(const Token & name)
{
  const std::string id(name.text);

  UseEvent u;
  u.name = id;
  u.position = name.position;

  if (function_) {
    auto it = function_->variables.find(id);
    if (it != function_->variables.end()) {
      u.type = it->second ? SymbolType::Parameter : SymbolType::LocalVariable;
      u.scope = function_->name;
      emit(std::move(u));
      return;
    }
  }

  u.type = SymbolType::GlobalVariable;
  if (find_builtin_variable(id) == nullptr && defined_globals_.insert(id).second) {
    define(SymbolType::GlobalVariable, name, doc_of(name), true);
  }
  emit(std::move(u));
}

void Parser::begin_path(std::string segment, Position position)
{
  path_.push_back(std::move(segment));
  emit(PathBeginEvent{path_, position});
}

void Parser::end_path(Position position)
{
  emit(PathEndEvent{path_, position});
  path_.pop_back();
}

void Parser::regex_embedding(const Token & t)
{
  auto path = path_;
  path.emplace_back("regex");
  emit(EmbeddingBeginEvent{path, t.position.offset(1)});
  emit(EmbeddingEndEvent{std::move(path), t.position.offset(t.length > 0 ? t.length - 1 : 0)});
}

// ============================================================================
// Top level
// ============================================================================

void Parser::parse_program()
{
  skip_terminators();
  while (!at_eof()) {
    const size_t before = idx_;
    parse_item();
    if (idx_ == before) {
      advance();
    }
    skip_terminators();
  }
}

void Parser::parse_item()
{
  switch (cur().kind) {
    case TokenKind::KwFunction:
      parse_function();
      return;
    case TokenKind::KwBegin:
    case TokenKind::KwEnd:
    case TokenKind::KwBeginFile:
    case TokenKind::KwEndFile: {
      const Token & kw = advance();
      if (kw.kind == TokenKind::KwBeginFile || kw.kind == TokenKind::KwEndFile) {
        compat(kw, std::string(kw.text));
      }
      if (!at(TokenKind::LBrace)) {
        error_at(cur(), std::string(kw.text) + " requires an action");
        synchronize_to_stmt();
        return;
      }
      parse_rule_block(std::string(kw.text));
      return;
    }
    case TokenKind::DirInclude:
    case TokenKind::DirLoad:
    case TokenKind::DirNamespace:
      parse_directive();
      return;
    case TokenKind::LBrace:
      parse_rule_block("action");
      return;
    default:
      parse_pattern_rule();
      return;
  }
}

void Parser::parse_function()
{
  const Token & kw = advance();
  if (kw.text == "func") {
    compat(kw, "func");
  }
  if (function_) {
    error_at(kw, "syntax error: nested function definition");
  }

  const Token & name = cur();
  if (name.kind != TokenKind::FuncName && name.kind != TokenKind::Identifier &&
      name.kind != TokenKind::Builtin) {
    error_at(name, "syntax error: function name expected, found " + describe(name));
    synchronize_to_stmt();
    return;
  }
  // In awk mode gawk-only names arrive as plain identifiers
  if (const BuiltinSymbol * b = find_builtin_function(name.text)) {
    if (b->posix) {
      message(
        Severity::Error, MessageCategory::Structure,
        "cannot redefine built-in function " + std::string(name.text), name.position,
        name.length);
    } else {
      message(
        Severity::Warning, MessageCategory::Compatibility,
        "function " + std::string(name.text) + " redefines a gawk built-in", name.position,
        name.length);
    }
  }
  advance();

  const std::string fname(name.text);
  if (!defined_functions_.insert(fname).second) {
    message(
      Severity::Error, MessageCategory::Structure, "function " + fname + " is already defined",
      name.position, name.length);
  }

  std::string doc = doc_of(kw);
  if (doc.empty()) {
    doc = doc_of(name);
  }
  define(SymbolType::Func, name, std::move(doc));

  function_ = FunctionScope{fname, {}};

  if (!expect(TokenKind::LParen, "'('")) {
    function_.reset();
    synchronize_to_stmt();
    return;
  }

  bool locals = false;
  skip_newlines();
  while (!at(TokenKind::RParen) && !at_eof()) {
    const Token & param = cur();
    if (param.kind != TokenKind::Identifier) {
      error_at(param, "syntax error: parameter name expected, found " + describe(param));
      break;
    }
    // More than one blank (or a line break) before a name starts the locals.
    if (param.leading_ws > 1 || param.preceded_by_newline) {
      locals = true;
    }
    const std::string pname(param.text);
    if (find_builtin_variable(pname) != nullptr) {
      error_at(param, "cannot use built-in variable " + pname + " as a parameter");
    } else if (function_->variables.count(pname) != 0) {
      error_at(param, "duplicate parameter " + pname);
    } else {
      function_->variables.emplace(pname, !locals);
      define(locals ? SymbolType::LocalVariable : SymbolType::Parameter, param, {});
    }
    advance();
    if (!match(TokenKind::Comma)) {
      break;
    }
    skip_newlines();
  }

  if (!expect(TokenKind::RParen, "')'")) {
    synchronize_to_stmt();
  }
  skip_newlines();
  if (!at(TokenKind::LBrace)) {
    error_at(cur(), "syntax error: function body expected, found " + describe(cur()));
    function_.reset();
    return;
  }
  parse_rule_block("function " + fname);
  function_.reset();
}

void Parser::parse_rule_block(std::string segment)
{
  const Token & lbrace = advance();
  begin_path(std::move(segment), lbrace.end_position());
  parse_statement_list();
  const Position end = prev().kind == TokenKind::RBrace ? prev().position : cur().position;
  end_path(end);
}

void Parser::parse_pattern_rule()
{
  begin_path("pattern", cur().position);
  ExprPtr pattern = parse_expr();
  if (match(TokenKind::Comma)) {
    skip_newlines();
    ExprPtr range_end = parse_expr();
  }
  end_path(prev().end_position());

  if (at(TokenKind::LBrace)) {
    parse_rule_block("action");
    return;
  }
  if (at(TokenKind::Newline) || at(TokenKind::Semicolon) || at_eof()) {
    return;
  }
  unexpected(cur());
  synchronize_to_stmt();
}

void Parser::parse_directive()
{
  const Token & kw = advance();
  compat(kw, std::string(kw.text));

  if (!at(TokenKind::String)) {
    error_at(cur(), "syntax error: " + std::string(kw.text) + " requires a quoted name");
    synchronize_to_stmt();
    return;
  }
  const Token & str = advance();

  if (kw.kind == TokenKind::DirInclude) {
    IncludeEvent inc;
    inc.path = unquote(str.text);
    inc.relative = inc.path.empty() || inc.path.front() != '/';
    inc.position = str.position;
    inc.length = str.length;
    if (inc.path.empty()) {
      error_at(str, "empty include path");
      return;
    }
    emit(std::move(inc));
  }
}

// ============================================================================
// Statements
// ============================================================================

void Parser::parse_statement_list()
{
  while (true) {
    skip_terminators();
    if (at(TokenKind::RBrace) || at_eof()) {
      break;
    }
    const size_t before = idx_;
    parse_statement();
    if (idx_ == before) {
      advance();
    }
  }
  if (!match(TokenKind::RBrace)) {
    error_at(cur(), "syntax error: missing '}'");
  }
}

void Parser::parse_block()
{
  advance();  // {
  parse_statement_list();
}

void Parser::parse_statement()
{
  const DepthGuard guard(*this);

  switch (cur().kind) {
    case TokenKind::LBrace:
      parse_block();
      return;
    case TokenKind::Semicolon:
      advance();
      return;
    case TokenKind::KwIf:
      parse_if();
      return;
    case TokenKind::KwWhile:
      parse_while();
      return;
    case TokenKind::KwDo:
      parse_do();
      return;
    case TokenKind::KwFor:
      parse_for();
      return;
    case TokenKind::KwSwitch:
      parse_switch();
      return;
    case TokenKind::KwFunction:
      error_at(cur(), "syntax error: function definition inside an action");
      synchronize_to_stmt();
      return;
    case TokenKind::KwElse:
      error_at(cur(), "syntax error: else without if");
      advance();
      return;
    default:
      parse_simple_statement();
      parse_terminator();
      return;
  }
}

void Parser::parse_terminator()
{
  switch (cur().kind) {
    case TokenKind::Semicolon:
      advance();
      return;
    case TokenKind::Newline:
      message(
        Severity::Warning, MessageCategory::MissingSemicolon, "missing semicolon",
        prev().end_position(), 1);
      return;
    case TokenKind::RBrace:
    case TokenKind::Eof:
      return;
    case TokenKind::KwElse:
      if (gawk_) {
        message(
          Severity::Warning, MessageCategory::MissingSemicolon, "missing semicolon before else",
          prev().end_position(), 1);
      } else {
        message(
          Severity::Error, MessageCategory::MissingSemicolon,
          "';' or newline required before else", prev().end_position(), 1);
      }
      return;
    default:
      unexpected(cur());
      synchronize_to_stmt();
      return;
  }
}

void Parser::parse_if()
{
  advance();  // if
  expect(TokenKind::LParen, "'('");
  ExprPtr cond = parse_expr();
  expect(TokenKind::RParen, "')'");
  skip_newlines();
  parse_statement();

  size_t look = 0;
  while (cur(look).kind == TokenKind::Newline) {
    ++look;
  }
  if (cur(look).kind == TokenKind::KwElse) {
    skip_newlines();
    advance();  // else
    skip_newlines();
    parse_statement();
  }
}

void Parser::parse_loop_body()
{
  if (match(TokenKind::Semicolon)) {
    return;
  }
  ++loop_depth_;
  parse_statement();
  --loop_depth_;
}

void Parser::parse_while()
{
  advance();  // while
  expect(TokenKind::LParen, "'('");
  ExprPtr cond = parse_expr();
  expect(TokenKind::RParen, "')'");
  if (at(TokenKind::Newline)) {
    skip_newlines();
  }
  parse_loop_body();
}

void Parser::parse_do()
{
  advance();  // do
  skip_newlines();
  ++loop_depth_;
  parse_statement();
  --loop_depth_;
  skip_terminators();
  if (!expect(TokenKind::KwWhile, "'while'")) {
    synchronize_to_stmt();
    return;
  }
  expect(TokenKind::LParen, "'('");
  ExprPtr cond = parse_expr();
  expect(TokenKind::RParen, "')'");
  parse_terminator();
}

void Parser::parse_for()
{
  advance();  // for
  expect(TokenKind::LParen, "'('");

  ExprPtr init;
  if (!at(TokenKind::Semicolon)) {
    init = parse_expr();
  }

  if (at(TokenKind::RParen)) {
    if (!init || !is_for_in_clause(*init)) {
      error_at(prev(), "syntax error: expected 'for (name in array)'");
    }
    advance();
    skip_newlines();
    parse_loop_body();
    return;
  }

  if (init && is_membership(*init)) {
    message(
      Severity::Warning, MessageCategory::Structure,
      "membership test used as loop initialization", init->position, 1);
  }
  if (!expect(TokenKind::Semicolon, "';'")) {
    synchronize_to_stmt();
    return;
  }
  skip_newlines();
  if (!at(TokenKind::Semicolon)) {
    ExprPtr cond = parse_expr();
  }
  expect(TokenKind::Semicolon, "';'");
  skip_newlines();
  if (!at(TokenKind::RParen)) {
    ExprPtr step = parse_expr();
  }
  expect(TokenKind::RParen, "')'");
  skip_newlines();
  parse_loop_body();
}

void Parser::parse_switch()
{
  const Token & kw = advance();
  compat(kw, "switch");
  expect(TokenKind::LParen, "'('");
  ExprPtr subject = parse_expr();
  expect(TokenKind::RParen, "')'");
  skip_newlines();
  if (!expect(TokenKind::LBrace, "'{'")) {
    synchronize_to_stmt();
    return;
  }

  ++switch_depth_;
  while (true) {
    skip_terminators();
    if (at(TokenKind::RBrace) || at_eof()) {
      break;
    }
    if (match(TokenKind::KwCase)) {
      if (at(TokenKind::Minus) || at(TokenKind::Plus)) {
        advance();
      }
      if (at(TokenKind::Regex)) {
        regex_embedding(advance());
      } else if (at(TokenKind::Number) || at(TokenKind::String)) {
        advance();
      } else {
        error_at(cur(), "syntax error: case value must be a constant or regular expression");
      }
      expect(TokenKind::Colon, "':'");
      continue;
    }
    if (match(TokenKind::KwDefault)) {
      expect(TokenKind::Colon, "':'");
      continue;
    }
    const size_t before = idx_;
    parse_statement();
    if (idx_ == before) {
      advance();
    }
  }
  --switch_depth_;
  if (!match(TokenKind::RBrace)) {
    error_at(cur(), "syntax error: missing '}'");
  }
}

void Parser::parse_simple_statement()
{
  switch (cur().kind) {
    case TokenKind::KwPrint:
    case TokenKind::KwPrintf:
      parse_print();
      return;
    case TokenKind::KwDelete:
      parse_delete();
      return;
    case TokenKind::KwNext:
    case TokenKind::KwNextFile: {
      const Token & kw = advance();
      if (path_.empty() || path_.front() == "BEGIN" || path_.front() == "END") {
        error_at(kw, std::string(kw.text) + " used in BEGIN or END action");
      }
      return;
    }
    case TokenKind::KwBreak:
      if (loop_depth_ == 0 && switch_depth_ == 0) {
        error_at(cur(), "break is not allowed outside a loop or switch");
      }
      advance();
      return;
    case TokenKind::KwContinue:
      if (loop_depth_ == 0) {
        error_at(cur(), "continue is not allowed outside a loop");
      }
      advance();
      return;
    case TokenKind::KwExit:
      advance();
      if (can_start_expression(cur().kind)) {
        ExprPtr status = parse_expr();
      }
      return;
    case TokenKind::KwReturn:
      if (!function_) {
        error_at(cur(), "return used outside function context");
      }
      advance();
      if (can_start_expression(cur().kind)) {
        ExprPtr value = parse_expr();
      }
      return;
    default:
      break;
  }

  if (!can_start_expression(cur().kind)) {
    unexpected(cur());
    return;
  }
  ExprPtr e = parse_expr();
}

void Parser::parse_print()
{
  const Token & kw = advance();
  const bool is_printf = kw.kind == TokenKind::KwPrintf;

  const bool saved = print_context_;
  print_context_ = true;

  size_t arg_count = 0;
  if (can_start_expression(cur().kind)) {
    ExprPtr first = parse_expr();
    arg_count = first->kind == ExprKind::List ? first->children.size() : 1;
    while (match(TokenKind::Comma)) {
      skip_newlines();
      ExprPtr next = parse_expr();
      ++arg_count;
    }
  }

  if (is_printf && arg_count == 0) {
    error_at(kw, "syntax error: printf requires a format argument");
  }

  if (at(TokenKind::Gt) || at(TokenKind::Append) || at(TokenKind::Pipe) ||
      at(TokenKind::PipeAmp)) {
    const Token & redirect = advance();
    if (redirect.kind == TokenKind::PipeAmp) {
      compat(redirect, "|&");
    }
    ExprPtr target = parse_concatenation();
  }

  print_context_ = saved;
}

void Parser::parse_delete()
{
  advance();  // delete
  const bool parenthesized = match(TokenKind::LParen);
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "syntax error: array name expected after delete");
    return;
  }
  use_variable(advance());
  if (at(TokenKind::LBracket)) {
    parse_subscripts();
  }
  if (parenthesized) {
    expect(TokenKind::RParen, "')'");
  }
}

// ============================================================================
// Expressions
// ============================================================================

ExprPtr Parser::parse_expr()
{
  const DepthGuard guard(*this);

  ExprPtr lhs = parse_ternary();
  if (!is_assignment_op(cur().kind)) {
    return lhs;
  }

  const Token & op = advance();
  if (op.kind == TokenKind::StarStarAssign) {
    compat(op, "**=");
  }
  if (!is_lvalue(*lhs) && lhs->kind != ExprKind::Missing) {
    error_at(op, "syntax error: invalid assignment target");
  }
  skip_newlines();
  ExprPtr rhs = parse_expr();
  return make_expr(ExprKind::Assignment, op.text, op.position, std::move(lhs), std::move(rhs));
}

ExprPtr Parser::parse_ternary()
{
  ExprPtr cond = parse_or();
  if (!at(TokenKind::Question)) {
    return cond;
  }
  const Token & q = advance();
  skip_newlines();
  ExprPtr then_expr = parse_expr();
  skip_newlines();
  expect(TokenKind::Colon, "':'");
  skip_newlines();
  ExprPtr else_expr = parse_expr();

  auto e = make_expr(ExprKind::Conditional, q.text, q.position, std::move(cond), std::move(then_expr));
  e->children.push_back(std::move(else_expr));
  return e;
}

ExprPtr Parser::parse_or()
{
  ExprPtr lhs = parse_and();
  while (at(TokenKind::OrOr)) {
    const Token & op = advance();
    skip_newlines();
    ExprPtr rhs = parse_and();
    lhs = make_expr(ExprKind::Binary, op.text, op.position, std::move(lhs), std::move(rhs));
  }
  return lhs;
}

ExprPtr Parser::parse_and()
{
  ExprPtr lhs = parse_in();
  while (at(TokenKind::AndAnd)) {
    const Token & op = advance();
    skip_newlines();
    ExprPtr rhs = parse_in();
    lhs = make_expr(ExprKind::Binary, op.text, op.position, std::move(lhs), std::move(rhs));
  }
  return lhs;
}

ExprPtr Parser::parse_in()
{
  ExprPtr lhs = parse_match();
  while (at(TokenKind::KwIn)) {
    const Token & op = advance();
    if (!at(TokenKind::Identifier)) {
      error_at(cur(), "syntax error: array name expected after 'in'");
      const Position start = lhs->position;
      return make_expr(ExprKind::Membership, op.text, start, std::move(lhs));
    }
    ExprPtr array = parse_variable();
    const Position start = lhs->position;
    lhs = make_expr(ExprKind::Membership, op.text, start, std::move(lhs), std::move(array));
  }
  return lhs;
}

ExprPtr Parser::parse_match()
{
  ExprPtr lhs = parse_relational();
  while (at(TokenKind::Match) || at(TokenKind::NoMatch)) {
    const Token & op = advance();
    ExprPtr rhs = parse_relational();
    lhs = make_expr(ExprKind::Binary, op.text, op.position, std::move(lhs), std::move(rhs));
  }
  return lhs;
}

ExprPtr Parser::parse_relational()
{
  ExprPtr lhs = parse_pipe_getline();
  const TokenKind k = cur().kind;
  const bool relational = k == TokenKind::Lt || k == TokenKind::Le || k == TokenKind::Ne ||
                          k == TokenKind::Eq || k == TokenKind::Ge ||
                          (k == TokenKind::Gt && !print_context_);
  if (!relational) {
    return lhs;
  }
  const Token & op = advance();
  ExprPtr rhs = parse_pipe_getline();
  return make_expr(ExprKind::Binary, op.text, op.position, std::move(lhs), std::move(rhs));
}

ExprPtr Parser::parse_pipe_getline()
{
  ExprPtr lhs = parse_concatenation();
  while ((at(TokenKind::Pipe) || at(TokenKind::PipeAmp)) && cur(1).kind == TokenKind::KwGetline) {
    const Token & op = advance();
    if (op.kind == TokenKind::PipeAmp) {
      compat(op, "|&");
    }
    advance();  // getline
    ExprPtr target = parse_getline_target();
    lhs = make_expr(ExprKind::Getline, op.text, op.position, std::move(lhs), std::move(target));
  }
  return lhs;
}

ExprPtr Parser::parse_concatenation()
{
  ExprPtr lhs = parse_additive();
  while (can_start_concat_operand(cur().kind)) {
    ExprPtr rhs = parse_additive();
    const Position start = lhs->position;
    lhs = make_expr(ExprKind::Concatenation, {}, start, std::move(lhs), std::move(rhs));
  }
  return lhs;
}

ExprPtr Parser::parse_additive()
{
  ExprPtr lhs = parse_multiplicative();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const Token & op = advance();
    ExprPtr rhs = parse_multiplicative();
    lhs = make_expr(ExprKind::Binary, op.text, op.position, std::move(lhs), std::move(rhs));
  }
  return lhs;
}

ExprPtr Parser::parse_multiplicative()
{
  ExprPtr lhs = parse_unary();
  while (at(TokenKind::Star) || at(TokenKind::Slash) || at(TokenKind::Percent)) {
    const Token & op = advance();
    ExprPtr rhs = parse_unary();
    lhs = make_expr(ExprKind::Binary, op.text, op.position, std::move(lhs), std::move(rhs));
  }
  return lhs;
}

ExprPtr Parser::parse_unary()
{
  if (at(TokenKind::Not) || at(TokenKind::Minus) || at(TokenKind::Plus)) {
    const DepthGuard guard(*this);
    const Token & op = advance();
    ExprPtr operand = parse_unary();
    return make_expr(ExprKind::Unary, op.text, op.position, std::move(operand));
  }
  return parse_power();
}

ExprPtr Parser::parse_power()
{
  ExprPtr base = parse_postfix();
  if (!at(TokenKind::Caret) && !at(TokenKind::StarStar)) {
    return base;
  }
  const Token & op = advance();
  if (op.kind == TokenKind::StarStar) {
    compat(op, "**");
  }
  // Right associative; the exponent may carry its own sign.
  ExprPtr exponent = parse_unary();
  return make_expr(ExprKind::Binary, op.text, op.position, std::move(base), std::move(exponent));
}

ExprPtr Parser::parse_postfix()
{
  if (at(TokenKind::Incr) || at(TokenKind::Decr)) {
    const DepthGuard guard(*this);
    const Token & op = advance();
    ExprPtr operand = parse_postfix();
    if (!is_lvalue(*operand) && operand->kind != ExprKind::Missing) {
      error_at(op, "syntax error: " + std::string(op.text) + " requires a variable");
    }
    return make_expr(ExprKind::IncDec, op.text, op.position, std::move(operand));
  }

  ExprPtr e = parse_field();
  if ((at(TokenKind::Incr) || at(TokenKind::Decr)) && is_lvalue(*e)) {
    const Token & op = advance();
    return make_expr(ExprKind::IncDec, op.text, op.position, std::move(e));
  }
  return e;
}

ExprPtr Parser::parse_field()
{
  if (!at(TokenKind::Dollar)) {
    return parse_primary();
  }
  const DepthGuard guard(*this);
  const Token & dollar = advance();
  ExprPtr operand;
  if (at(TokenKind::Incr) || at(TokenKind::Decr)) {
    operand = parse_postfix();
  } else if (at(TokenKind::Minus) || at(TokenKind::Plus) || at(TokenKind::Not)) {
    const Token & op = advance();
    operand = make_expr(ExprKind::Unary, op.text, op.position, parse_field());
  } else {
    operand = parse_field();
  }
  return make_expr(ExprKind::Field, dollar.text, dollar.position, std::move(operand));
}

ExprPtr Parser::parse_primary()
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::Number:
    case TokenKind::String:
      advance();
      return make_expr(ExprKind::Literal, t.text, t.position);
    case TokenKind::Regex:
      advance();
      regex_embedding(t);
      return make_expr(ExprKind::Regex, t.text, t.position);
    case TokenKind::LParen:
      return parse_grouping();
    case TokenKind::FuncName:
      return parse_user_call();
    case TokenKind::Builtin:
      return parse_builtin_call();
    case TokenKind::Identifier:
      return parse_variable();
    case TokenKind::At:
      return parse_indirect_call();
    case TokenKind::KwGetline:
      return parse_simple_getline();
    default:
      unexpected(t);
      return make_expr(ExprKind::Missing, {}, t.position);
  }
}

ExprPtr Parser::parse_grouping()
{
  const bool list_allowed = print_context_;
  const Token & lparen = advance();
  const bool saved = print_context_;
  print_context_ = false;

  skip_newlines();
  auto e = make_expr(ExprKind::Grouping, lparen.text, lparen.position, parse_expr());
  while (match(TokenKind::Comma)) {
    skip_newlines();
    e->kind = ExprKind::List;
    e->children.push_back(parse_expr());
  }
  skip_newlines();
  expect(TokenKind::RParen, "')'");
  print_context_ = saved;

  if (e->kind == ExprKind::List && !at(TokenKind::KwIn) && !list_allowed) {
    error_at(cur(), "syntax error: expected 'in' after parenthesized list");
  }
  return e;
}

ExprPtr Parser::parse_variable()
{
  const Token & name = advance();
  use_variable(name);
  if (at(TokenKind::LBracket)) {
    parse_subscripts();
    return make_expr(ExprKind::ArrayElement, name.text, name.position);
  }
  return make_expr(ExprKind::Variable, name.text, name.position);
}

void Parser::parse_subscripts()
{
  const bool saved = print_context_;
  print_context_ = false;
  bool chained = false;
  while (at(TokenKind::LBracket)) {
    const Token & open = advance();
    if (chained) {
      compat(open, "array of arrays");
    }
    skip_newlines();
    ExprPtr first = parse_expr();
    while (match(TokenKind::Comma)) {
      skip_newlines();
      ExprPtr next = parse_expr();
    }
    skip_newlines();
    if (!expect(TokenKind::RBracket, "']'")) {
      break;
    }
    chained = true;
  }
  print_context_ = saved;
}

ExprPtr Parser::parse_user_call()
{
  const Token & name = advance();
  if (!gawk_ && declared_functions_.count(std::string(name.text)) == 0) {
    if (const BuiltinSymbol * b = find_builtin_function(name.text); b != nullptr && !b->posix) {
      compat(name, "built-in function " + std::string(name.text));
    }
  }

  UseEvent u;
  u.type = SymbolType::Func;
  u.name = std::string(name.text);
  u.position = name.position;
  emit(std::move(u));

  parse_call_arguments(&name);
  return make_expr(ExprKind::Call, name.text, name.position);
}

ExprPtr Parser::parse_builtin_call()
{
  const Token & name = advance();
  const BuiltinSymbol * b = find_builtin_function(name.text);
  if (b != nullptr && !b->posix) {
    compat(name, "built-in function " + std::string(name.text));
  }

  UseEvent u;
  u.type = SymbolType::Func;
  u.name = std::string(name.text);
  u.position = name.position;
  emit(std::move(u));

  if (at(TokenKind::LParen)) {
    parse_call_arguments(&name);
  } else if (name.text != "length") {
    error_at(cur(), "syntax error: expected '(' after " + std::string(name.text));
  }
  return make_expr(ExprKind::Call, name.text, name.position);
}

ExprPtr Parser::parse_indirect_call()
{
  const Token & at_sign = advance();
  compat(at_sign, "indirect function call");
  if (!at(TokenKind::FuncName) && !at(TokenKind::Identifier)) {
    error_at(cur(), "syntax error: function name expected after '@'");
    return make_expr(ExprKind::Missing, {}, at_sign.position);
  }
  const Token & name = advance();
  use_variable(name);
  if (!at(TokenKind::LParen)) {
    error_at(cur(), "syntax error: expected '(' in indirect call");
    return make_expr(ExprKind::Missing, {}, at_sign.position);
  }
  parse_call_arguments(nullptr);
  return make_expr(ExprKind::Call, name.text, name.position);
}

void Parser::parse_call_arguments(const Token * callee)
{
  const Token & lparen = advance();
  const bool saved = print_context_;
  print_context_ = false;

  const std::string name = callee != nullptr ? std::string(callee->text) : std::string();
  if (callee != nullptr) {
    emit(CallBoundaryEvent{name, true, callee->position});
    begin_path(name, lparen.end_position());
  }

  skip_newlines();
  int32_t index = 0;
  while (!at(TokenKind::RParen) && !at_eof()) {
    if (callee != nullptr) {
      emit(ParameterBoundaryEvent{index, true, cur().position});
    }
    ExprPtr arg = parse_expr();
    if (callee != nullptr) {
      emit(ParameterBoundaryEvent{index, false, prev().end_position()});
    }
    skip_newlines();
    if (!match(TokenKind::Comma)) {
      break;
    }
    skip_newlines();
    if (at(TokenKind::RParen)) {
      error_at(cur(), "syntax error: argument expected after ','");
      break;
    }
    ++index;
  }

  const Position close = cur().position;
  if (callee != nullptr) {
    end_path(close);
    emit(CallBoundaryEvent{name, false, close});
  }
  expect(TokenKind::RParen, "')'");
  print_context_ = saved;
}

ExprPtr Parser::parse_simple_getline()
{
  const Token & kw = advance();
  ExprPtr target = parse_getline_target();
  if (at(TokenKind::Lt)) {
    advance();
    ExprPtr file = parse_field();
    auto e = make_expr(ExprKind::Getline, kw.text, kw.position, std::move(target));
    e->children.push_back(std::move(file));
    return e;
  }
  return make_expr(ExprKind::Getline, kw.text, kw.position, std::move(target));
}

ExprPtr Parser::parse_getline_target()
{
  if (at(TokenKind::Identifier)) {
    return parse_variable();
  }
  if (at(TokenKind::Dollar)) {
    return parse_field();
  }
  return nullptr;
}

}  // namespace awkls::syntax
