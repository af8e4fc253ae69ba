// awkls/syntax/token.hpp - AWK token kinds
#pragma once

#include <cstdint>
#include <string_view>

#include "awkls/basic/source_manager.hpp"

namespace awkls::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,  // stray character, unterminated string or regex

  Newline,

  Identifier,
  FuncName,  // identifier immediately followed by '('
  Builtin,   // built-in function name
  Number,
  String,  // token.text includes the quotes
  Regex,   // token.text includes the slashes

  // Keywords
  KwBegin,
  KwEnd,
  KwBeginFile,
  KwEndFile,
  KwFunction,  // `function` or `func`
  KwIf,
  KwElse,
  KwWhile,
  KwFor,
  KwDo,
  KwBreak,
  KwContinue,
  KwNext,
  KwNextFile,
  KwExit,
  KwReturn,
  KwDelete,
  KwIn,
  KwGetline,
  KwPrint,
  KwPrintf,
  KwSwitch,
  KwCase,
  KwDefault,

  // Directives
  DirInclude,
  DirLoad,
  DirNamespace,
  At,  // indirect call marker

  // Punctuation
  LBrace,
  RBrace,
  LParen,
  RParen,
  LBracket,
  RBracket,
  Semicolon,
  Comma,

  // Operators
  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Caret,
  StarStar,
  Assign,
  PlusAssign,
  MinusAssign,
  StarAssign,
  SlashAssign,
  PercentAssign,
  CaretAssign,
  StarStarAssign,
  Incr,
  Decr,
  Eq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
  Append,  // >>
  Match,   // ~
  NoMatch,  // !~
  Not,
  AndAnd,
  OrOr,
  Question,
  Colon,
  Pipe,
  PipeAmp,  // |&
  Dollar,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  std::string_view text;
  Position position;
  uint32_t length = 0;

  /// Number of ignored characters (blanks, continuations) directly before the token
  uint32_t leading_ws = 0;
  /// True when a newline token directly precedes this token
  bool preceded_by_newline = false;
  /// Index into the lexer's doc-comment list, or -1
  int32_t doc_index = -1;

  [[nodiscard]] Range range() const noexcept { return make_range(position, length); }
  [[nodiscard]] Position end_position() const noexcept { return position.offset(length); }
};

[[nodiscard]] constexpr bool is_assignment_op(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Assign:
    case TokenKind::PlusAssign:
    case TokenKind::MinusAssign:
    case TokenKind::StarAssign:
    case TokenKind::SlashAssign:
    case TokenKind::PercentAssign:
    case TokenKind::CaretAssign:
    case TokenKind::StarStarAssign:
      return true;
    default:
      return false;
  }
}

/// Tokens after which a '/' is a division operator rather than the start of a regex
[[nodiscard]] constexpr bool ends_operand(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Identifier:
    case TokenKind::Builtin:
    case TokenKind::Number:
    case TokenKind::String:
    case TokenKind::Regex:
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::Incr:
    case TokenKind::Decr:
    case TokenKind::KwGetline:
      return true;
    default:
      return false;
  }
}

[[nodiscard]] std::string_view to_string(TokenKind k) noexcept;

}  // namespace awkls::syntax
