// awkls/syntax/lexer.hpp - AWK tokenizer
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "awkls/syntax/token.hpp"

namespace awkls::syntax
{

/// Mode named by an interpreter directive: true for gawk, false for other awks
[[nodiscard]] std::optional<bool> mode_from_shebang(std::string_view shebang);

/**
 * Splits AWK source text into tokens.
 *
 * Comments and line continuations are dropped. A run of `##` comment lines is
 * collected as a doc comment and attached to the next significant token.
 * Whether '/' starts a regex literal is decided by the previous significant
 * token. In awk mode gawk-only built-in names are plain identifiers; a
 * `#!` line naming an interpreter overrides the mode given here.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src, bool gawk = true) : src_(src), gawk_(gawk) {}

  [[nodiscard]] std::vector<Token> lex_all();

  /// Doc comments referenced by Token::doc_index
  [[nodiscard]] const std::vector<std::string> & doc_comments() const noexcept { return docs_; }

  /// The interpreter directive on the first line (without "#!"), if any
  [[nodiscard]] std::string_view shebang() const noexcept { return shebang_; }

  /// Position just past the last character
  [[nodiscard]] Position end_position() const noexcept { return {line_, column_}; }

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept;

  /// Skip blanks, continuations and comments; returns the number of ignored characters
  uint32_t skip_ignored();
  void read_comment();

  [[nodiscard]] Token lex_word();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_regex();
  [[nodiscard]] Token lex_operator();

  [[nodiscard]] Token make_token(TokenKind kind, size_t start, Position at) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
  uint32_t line_ = 0;
  uint32_t column_ = 0;

  TokenKind last_significant_ = TokenKind::Newline;
  std::vector<std::string> docs_;
  std::string pending_doc_;
  uint32_t doc_line_ = 0;
  std::string_view shebang_;
  bool gawk_;
};

}  // namespace awkls::syntax
