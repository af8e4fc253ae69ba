// awkls/syntax/lexer.cpp - AWK tokenizer
#include "awkls/syntax/lexer.hpp"

#include <cctype>

#include "awkls/syntax/builtins.hpp"
#include "awkls/syntax/keywords.hpp"

namespace awkls::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool is_hex_digit(unsigned char c)
{
  return (std::isdigit(c) != 0) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

struct OperatorSpelling
{
  std::string_view text;
  TokenKind kind;
};

// Longest spellings first
constexpr OperatorSpelling k_operators[] = {
  {"**=", TokenKind::StarStarAssign},
  {"**", TokenKind::StarStar},
  {"*=", TokenKind::StarAssign},
  {"^=", TokenKind::CaretAssign},
  {"+=", TokenKind::PlusAssign},
  {"++", TokenKind::Incr},
  {"-=", TokenKind::MinusAssign},
  {"--", TokenKind::Decr},
  {"/=", TokenKind::SlashAssign},
  {"%=", TokenKind::PercentAssign},
  {"==", TokenKind::Eq},
  {"!=", TokenKind::Ne},
  {"!~", TokenKind::NoMatch},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
  {">>", TokenKind::Append},
  {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},
  {"|&", TokenKind::PipeAmp},
  {"*", TokenKind::Star},
  {"^", TokenKind::Caret},
  {"+", TokenKind::Plus},
  {"-", TokenKind::Minus},
  {"/", TokenKind::Slash},
  {"%", TokenKind::Percent},
  {"=", TokenKind::Assign},
  {"!", TokenKind::Not},
  {"<", TokenKind::Lt},
  {">", TokenKind::Gt},
  {"|", TokenKind::Pipe},
  {"~", TokenKind::Match},
  {"?", TokenKind::Question},
  {":", TokenKind::Colon},
  {",", TokenKind::Comma},
  {";", TokenKind::Semicolon},
  {"{", TokenKind::LBrace},
  {"}", TokenKind::RBrace},
  {"(", TokenKind::LParen},
  {")", TokenKind::RParen},
  {"[", TokenKind::LBracket},
  {"]", TokenKind::RBracket},
  {"$", TokenKind::Dollar},
};

}  // namespace

std::optional<bool> mode_from_shebang(std::string_view shebang)
{
  if (shebang.find("gawk") != std::string_view::npos) {
    return true;
  }
  if (shebang.find("awk") != std::string_view::npos) {
    return false;
  }
  return std::nullopt;
}

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::advance(size_t n) noexcept
{
  for (size_t i = 0; i < n && pos_ < src_.size(); ++i) {
    if (src_[pos_] == '\n') {
      ++line_;
      column_ = 0;
    } else {
      ++column_;
    }
    ++pos_;
  }
}

uint32_t Lexer::skip_ignored()
{
  uint32_t count = 0;
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
      advance(1);
      ++count;
      continue;
    }
    if (c == '\\' && peek(1) == '\n') {
      advance(2);
      count += 2;
      continue;
    }
    if (c == '\\' && peek(1) == '\r' && peek(2) == '\n') {
      advance(3);
      count += 3;
      continue;
    }
    if (c == '#') {
      const size_t start = pos_;
      read_comment();
      count += static_cast<uint32_t>(pos_ - start);
      continue;
    }
    break;
  }
  return count;
}

void Lexer::read_comment()
{
  const size_t start = pos_;
  const uint32_t line = line_;
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  std::string_view text = src_.substr(start, pos_ - start);
  if (!text.empty() && text.back() == '\r') {
    text.remove_suffix(1);
  }

  if (start == 0 && text.size() >= 2 && text[1] == '!') {
    shebang_ = text.substr(2);
    if (const auto forced = mode_from_shebang(shebang_)) {
      gawk_ = *forced;
    }
    return;
  }

  if (text.size() >= 2 && text[1] == '#') {
    // Only directly consecutive doc lines form one doc comment.
    if (!pending_doc_.empty() && doc_line_ + 1 != line) {
      pending_doc_.clear();
    }
    if (!pending_doc_.empty()) {
      pending_doc_ += '\n';
    }
    pending_doc_.append(text.data(), text.size());
    doc_line_ = line;
    return;
  }

  pending_doc_.clear();
}

Token Lexer::make_token(TokenKind kind, size_t start, Position at) const noexcept
{
  Token t;
  t.kind = kind;
  t.text = src_.substr(start, pos_ - start);
  t.position = at;
  t.length = static_cast<uint32_t>(pos_ - start);
  return t;
}

Token Lexer::lex_word()
{
  const size_t start = pos_;
  const Position at{line_, column_};

  if (peek() == '@') {
    advance(1);
    if (is_ident_start(static_cast<unsigned char>(peek()))) {
      size_t end = pos_;
      while (end < src_.size() && is_ident_continue(static_cast<unsigned char>(src_[end]))) {
        ++end;
      }
      const std::string_view word = src_.substr(start, end - start);
      if (const auto kw = keyword_kind(word)) {
        advance(end - pos_);
        return make_token(*kw, start, at);
      }
    }
    return make_token(TokenKind::At, start, at);
  }

  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  const std::string_view word = src_.substr(start, pos_ - start);

  if (const auto kw = keyword_kind(word)) {
    return make_token(*kw, start, at);
  }
  if (const BuiltinSymbol * b = find_builtin_function(word); b != nullptr && (gawk_ || b->posix)) {
    return make_token(TokenKind::Builtin, start, at);
  }
  if (peek() == '(') {
    return make_token(TokenKind::FuncName, start, at);
  }
  return make_token(TokenKind::Identifier, start, at);
}

Token Lexer::lex_number()
{
  const size_t start = pos_;
  const Position at{line_, column_};

  if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X') &&
      is_hex_digit(static_cast<unsigned char>(peek(2)))) {
    advance(2);
    while (!eof() && is_hex_digit(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    return make_token(TokenKind::Number, start, at);
  }

  while (!eof() && is_digit(peek())) {
    advance(1);
  }
  if (peek() == '.') {
    advance(1);
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    const size_t sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
    if (is_digit(peek(1 + sign))) {
      advance(1 + sign);
      while (!eof() && is_digit(peek())) {
        advance(1);
      }
    }
  }
  return make_token(TokenKind::Number, start, at);
}

Token Lexer::lex_string()
{
  const size_t start = pos_;
  const Position at{line_, column_};
  advance(1);  // opening quote

  while (!eof()) {
    const char c = peek();
    if (c == '"') {
      advance(1);
      return make_token(TokenKind::String, start, at);
    }
    if (c == '\n') {
      break;
    }
    if (c == '\\') {
      // Escapes include an escaped newline, which continues the string.
      advance(2);
      continue;
    }
    advance(1);
  }

  return make_token(TokenKind::Unknown, start, at);
}

Token Lexer::lex_regex()
{
  const size_t start = pos_;
  const Position at{line_, column_};
  advance(1);  // opening slash

  bool in_bracket = false;
  while (!eof()) {
    const char c = peek();
    if (c == '\n') {
      break;
    }
    if (c == '\\') {
      if (peek(1) == '\n') {
        break;
      }
      advance(2);
      continue;
    }
    if (in_bracket) {
      if (c == ']') {
        in_bracket = false;
      }
      advance(1);
      continue;
    }
    if (c == '[') {
      in_bracket = true;
      advance(1);
      // A ']' right after '[' or '[^' is a literal member of the set.
      if (peek() == '^') {
        advance(1);
      }
      if (peek() == ']') {
        advance(1);
      }
      continue;
    }
    if (c == '/') {
      advance(1);
      return make_token(TokenKind::Regex, start, at);
    }
    advance(1);
  }

  return make_token(TokenKind::Unknown, start, at);
}

Token Lexer::lex_operator()
{
  const size_t start = pos_;
  const Position at{line_, column_};
  for (const auto & op : k_operators) {
    if (starts_with(op.text)) {
      advance(op.text.size());
      return make_token(op.kind, start, at);
    }
  }
  advance(1);
  return make_token(TokenKind::Unknown, start, at);
}

Token Lexer::next_token()
{
  const uint32_t ignored = skip_ignored();

  Token t;
  if (eof()) {
    t.kind = TokenKind::Eof;
    t.position = {line_, column_};
    t.leading_ws = ignored;
    return t;
  }

  const char c = peek();
  const auto uc = static_cast<unsigned char>(c);

  if (c == '\n') {
    const size_t start = pos_;
    const Position at{line_, column_};
    advance(1);
    t = make_token(TokenKind::Newline, start, at);
  } else if (is_ident_start(uc) || c == '@') {
    t = lex_word();
  } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
    t = lex_number();
  } else if (c == '"') {
    t = lex_string();
  } else if (c == '/' && !ends_operand(last_significant_)) {
    t = lex_regex();
  } else {
    t = lex_operator();
  }

  t.leading_ws = ignored;
  return t;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  bool after_newline = false;
  while (true) {
    Token t = next_token();
    t.preceded_by_newline = after_newline;

    if (t.kind != TokenKind::Newline && t.kind != TokenKind::Eof && !pending_doc_.empty()) {
      t.doc_index = static_cast<int32_t>(docs_.size());
      docs_.push_back(std::move(pending_doc_));
      pending_doc_.clear();
    }

    after_newline = (t.kind == TokenKind::Newline);
    last_significant_ = t.kind;
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace awkls::syntax
