// awkls/syntax/keywords.hpp - Reserved words and directives
#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "awkls/syntax/token.hpp"

namespace awkls::syntax
{

struct KeywordInfo
{
  std::string_view text;
  TokenKind kind;
  bool gawk_only;
};

inline constexpr std::array<KeywordInfo, 26> k_keywords = {{
  {"BEGIN", TokenKind::KwBegin, false},
  {"END", TokenKind::KwEnd, false},
  {"BEGINFILE", TokenKind::KwBeginFile, true},
  {"ENDFILE", TokenKind::KwEndFile, true},
  {"function", TokenKind::KwFunction, false},
  {"func", TokenKind::KwFunction, true},
  {"if", TokenKind::KwIf, false},
  {"else", TokenKind::KwElse, false},
  {"while", TokenKind::KwWhile, false},
  {"for", TokenKind::KwFor, false},
  {"do", TokenKind::KwDo, false},
  {"break", TokenKind::KwBreak, false},
  {"continue", TokenKind::KwContinue, false},
  {"next", TokenKind::KwNext, false},
  {"nextfile", TokenKind::KwNextFile, false},
  {"exit", TokenKind::KwExit, false},
  {"return", TokenKind::KwReturn, false},
  {"delete", TokenKind::KwDelete, false},
  {"in", TokenKind::KwIn, false},
  {"getline", TokenKind::KwGetline, false},
  {"print", TokenKind::KwPrint, false},
  {"printf", TokenKind::KwPrintf, false},
  {"switch", TokenKind::KwSwitch, true},
  {"case", TokenKind::KwCase, true},
  {"default", TokenKind::KwDefault, true},
  {"@include", TokenKind::DirInclude, true},
}};

inline constexpr std::array<KeywordInfo, 2> k_directives = {{
  {"@load", TokenKind::DirLoad, true},
  {"@namespace", TokenKind::DirNamespace, true},
}};

/// Keyword or directive kind for `text`, including the leading '@' for directives
[[nodiscard]] constexpr std::optional<TokenKind> keyword_kind(std::string_view text) noexcept
{
  for (const auto & kw : k_keywords) {
    if (kw.text == text) {
      return kw.kind;
    }
  }
  for (const auto & kw : k_directives) {
    if (kw.text == text) {
      return kw.kind;
    }
  }
  return std::nullopt;
}

}  // namespace awkls::syntax
