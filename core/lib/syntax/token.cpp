// awkls/syntax/token.cpp - Token kind names
#include "awkls/syntax/token.hpp"

namespace awkls::syntax
{

std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "eof";
    case TokenKind::Unknown:
      return "unknown";
    case TokenKind::Newline:
      return "newline";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::FuncName:
      return "funcname";
    case TokenKind::Builtin:
      return "builtin";
    case TokenKind::Number:
      return "number";
    case TokenKind::String:
      return "string";
    case TokenKind::Regex:
      return "regex";
    case TokenKind::KwBegin:
      return "BEGIN";
    case TokenKind::KwEnd:
      return "END";
    case TokenKind::KwBeginFile:
      return "BEGINFILE";
    case TokenKind::KwEndFile:
      return "ENDFILE";
    case TokenKind::KwFunction:
      return "function";
    case TokenKind::KwIf:
      return "if";
    case TokenKind::KwElse:
      return "else";
    case TokenKind::KwWhile:
      return "while";
    case TokenKind::KwFor:
      return "for";
    case TokenKind::KwDo:
      return "do";
    case TokenKind::KwBreak:
      return "break";
    case TokenKind::KwContinue:
      return "continue";
    case TokenKind::KwNext:
      return "next";
    case TokenKind::KwNextFile:
      return "nextfile";
    case TokenKind::KwExit:
      return "exit";
    case TokenKind::KwReturn:
      return "return";
    case TokenKind::KwDelete:
      return "delete";
    case TokenKind::KwIn:
      return "in";
    case TokenKind::KwGetline:
      return "getline";
    case TokenKind::KwPrint:
      return "print";
    case TokenKind::KwPrintf:
      return "printf";
    case TokenKind::KwSwitch:
      return "switch";
    case TokenKind::KwCase:
      return "case";
    case TokenKind::KwDefault:
      return "default";
    case TokenKind::DirInclude:
      return "@include";
    case TokenKind::DirLoad:
      return "@load";
    case TokenKind::DirNamespace:
      return "@namespace";
    case TokenKind::At:
      return "@";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Caret:
      return "^";
    case TokenKind::StarStar:
      return "**";
    case TokenKind::Assign:
      return "=";
    case TokenKind::PlusAssign:
      return "+=";
    case TokenKind::MinusAssign:
      return "-=";
    case TokenKind::StarAssign:
      return "*=";
    case TokenKind::SlashAssign:
      return "/=";
    case TokenKind::PercentAssign:
      return "%=";
    case TokenKind::CaretAssign:
      return "^=";
    case TokenKind::StarStarAssign:
      return "**=";
    case TokenKind::Incr:
      return "++";
    case TokenKind::Decr:
      return "--";
    case TokenKind::Eq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::Append:
      return ">>";
    case TokenKind::Match:
      return "~";
    case TokenKind::NoMatch:
      return "!~";
    case TokenKind::Not:
      return "!";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Question:
      return "?";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::PipeAmp:
      return "|&";
    case TokenKind::Dollar:
      return "$";
  }
  return "unknown";
}

}  // namespace awkls::syntax
