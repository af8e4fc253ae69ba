#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "awkls/syntax/lexer.hpp"
#include "awkls/syntax/token.hpp"

using awkls::syntax::Lexer;
using awkls::syntax::Token;
using awkls::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds_of(std::string_view src)
{
  Lexer lex(src);
  std::vector<TokenKind> out;
  for (const auto & t : lex.lex_all()) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, BeginBlockTokens)
{
  const auto kinds = kinds_of("BEGIN { x = 1 }");
  const std::vector<TokenKind> expected{
    TokenKind::KwBegin, TokenKind::LBrace, TokenKind::Identifier, TokenKind::Assign,
    TokenKind::Number,  TokenKind::RBrace, TokenKind::Eof};
  EXPECT_EQ(kinds, expected);
}

TEST(SyntaxLexer, FunctionNameNeedsAdjacentParen)
{
  {
    Lexer lex("f(x)");
    const auto toks = lex.lex_all();
    ASSERT_FALSE(toks.empty());
    EXPECT_EQ(toks[0].kind, TokenKind::FuncName);
    EXPECT_EQ(toks[0].text, "f");
  }
  {
    Lexer lex("f (x)");
    const auto toks = lex.lex_all();
    ASSERT_FALSE(toks.empty());
    EXPECT_EQ(toks[0].kind, TokenKind::Identifier);
  }
}

TEST(SyntaxLexer, BuiltinFunctionsAreRecognized)
{
  Lexer lex("substr(s, 1)");
  const auto toks = lex.lex_all();
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks[0].kind, TokenKind::Builtin);
}

TEST(SyntaxLexer, GawkOnlyBuiltinsArePlainNamesInAwkMode)
{
  {
    Lexer lex("and(a, 1)");
    const auto toks = lex.lex_all();
    ASSERT_FALSE(toks.empty());
    EXPECT_EQ(toks[0].kind, TokenKind::Builtin);
  }
  {
    Lexer lex("and(a, 1) substr(s, 1)", false);
    const auto toks = lex.lex_all();
    ASSERT_GE(toks.size(), 7U);
    EXPECT_EQ(toks[0].kind, TokenKind::FuncName);
    EXPECT_EQ(toks[6].kind, TokenKind::Builtin);
  }
  {
    // The interpreter line overrides the requested mode
    Lexer lex("#!/usr/bin/awk -f\nasort(a)\n", true);
    const auto toks = lex.lex_all();
    ASSERT_GE(toks.size(), 2U);
    EXPECT_EQ(toks[0].kind, TokenKind::Newline);
    EXPECT_EQ(toks[1].kind, TokenKind::FuncName);
    EXPECT_EQ(toks[1].text, "asort");
  }
}

TEST(SyntaxLexer, SlashAfterOperandIsDivision)
{
  const auto kinds = kinds_of("a / b");
  ASSERT_GE(kinds.size(), 3U);
  EXPECT_EQ(kinds[1], TokenKind::Slash);
}

TEST(SyntaxLexer, SlashAfterOperatorStartsRegex)
{
  Lexer lex("$0 ~ /ab+c/");
  const auto toks = lex.lex_all();
  bool saw = false;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Regex) {
      EXPECT_EQ(t.text, "/ab+c/");
      saw = true;
    }
  }
  EXPECT_TRUE(saw);
}

TEST(SyntaxLexer, PositionsAreZeroBased)
{
  Lexer lex("BEGIN {\n  foo = 1\n}");
  const auto toks = lex.lex_all();
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Identifier) {
      EXPECT_EQ(t.position.line, 1U);
      EXPECT_EQ(t.position.character, 2U);
      EXPECT_EQ(t.length, 3U);
    }
  }
}

TEST(SyntaxLexer, CommentsAreDropped)
{
  const auto kinds = kinds_of("# plain comment\nx");
  const std::vector<TokenKind> expected{TokenKind::Newline, TokenKind::Identifier, TokenKind::Eof};
  EXPECT_EQ(kinds, expected);
}

TEST(SyntaxLexer, DocCommentAttachesToNextToken)
{
  Lexer lex("## adds two numbers\n## returns the sum\nfunction add(a, b) { return a + b }\n");
  const auto toks = lex.lex_all();

  ASSERT_EQ(lex.doc_comments().size(), 1U);
  EXPECT_NE(lex.doc_comments()[0].find("adds two numbers"), std::string::npos);
  EXPECT_NE(lex.doc_comments()[0].find("returns the sum"), std::string::npos);

  const Token * kw = nullptr;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::KwFunction) {
      kw = &t;
      break;
    }
  }
  ASSERT_NE(kw, nullptr);
  EXPECT_EQ(kw->doc_index, 0);
}

TEST(SyntaxLexer, SeparatedDocCommentLinesDoNotMerge)
{
  Lexer lex("## first\n\n## second\nx\n");
  (void)lex.lex_all();
  ASSERT_EQ(lex.doc_comments().size(), 1U);
  EXPECT_EQ(lex.doc_comments()[0].find("first"), std::string::npos);
}

TEST(SyntaxLexer, ShebangIsCaptured)
{
  Lexer lex("#!/usr/bin/gawk -f\nBEGIN { }\n");
  (void)lex.lex_all();
  EXPECT_EQ(lex.shebang(), "/usr/bin/gawk -f");
}

TEST(SyntaxLexer, LeadingWhitespaceIsCounted)
{
  Lexer lex("function f(a,  b) { }");
  const auto toks = lex.lex_all();
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Identifier && t.text == "b") {
      EXPECT_EQ(t.leading_ws, 2U);
    }
  }
}

TEST(SyntaxLexer, TokenNames)
{
  EXPECT_EQ(awkls::syntax::to_string(TokenKind::LBrace), "{");
  EXPECT_EQ(awkls::syntax::to_string(TokenKind::PipeAmp), "|&");
}
