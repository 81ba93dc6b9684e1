// rapter/tests/unit/syntax/test_lexer.cpp - Lexer tests
//
#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "rapter/basic/diagnostic.hpp"
#include "rapter/syntax/lexer.hpp"
#include "rapter/syntax/token.hpp"

using rapter::DiagnosticBag;
using rapter::ErrorKind;
using rapter::FileId;
using rapter::syntax::Lexer;
using rapter::syntax::Token;
using rapter::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src, DiagnosticBag * diags = nullptr)
{
  Lexer lexer(FileId{0}, src, diags);
  return lexer.lex_all();
}

std::vector<TokenKind> kinds(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  out.reserve(toks.size());
  for (const auto & t : toks) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, SkipsCommentsAndEndsWithEof)
{
  const std::string_view src =
    "// line\n"
    "/* block */\n"
    "let x = 1; // trailing\n"
    "let y = /* inline */ 2;\n";

  const auto toks = lex(src);
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);

  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Identifier, TokenKind::Eq, TokenKind::IntLiteral,
    TokenKind::Semicolon,  TokenKind::Identifier, TokenKind::Identifier, TokenKind::Eq,
    TokenKind::IntLiteral, TokenKind::Semicolon,  TokenKind::Eof,
  };
  EXPECT_EQ(kinds(toks), expected);
}

TEST(SyntaxLexer, EmptySourceIsJustEof)
{
  const auto toks = lex("");
  ASSERT_EQ(toks.size(), 1U);
  EXPECT_EQ(toks[0].kind, TokenKind::Eof);
  EXPECT_EQ(toks[0].range.get_begin().offset(), 0U);
}

TEST(SyntaxLexer, KeywordsAreIdentifiers)
{
  const auto toks = lex("fn match export");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_TRUE(toks[0].is_keyword("fn"));
  EXPECT_TRUE(toks[1].is_keyword("match"));
  EXPECT_TRUE(toks[2].is_keyword("export"));
  EXPECT_TRUE(rapter::syntax::is_reserved_word("struct"));
  EXPECT_FALSE(rapter::syntax::is_reserved_word("Option"));
}

TEST(SyntaxLexer, LongestPunctuationWins)
{
  const auto toks = lex("... .. :: -> => && || == != <= >= ? ! &");
  const std::vector<TokenKind> expected = {
    TokenKind::Ellipsis, TokenKind::DotDot, TokenKind::ColonColon, TokenKind::Arrow,
    TokenKind::FatArrow, TokenKind::AndAnd, TokenKind::OrOr,       TokenKind::EqEq,
    TokenKind::Ne,       TokenKind::Le,     TokenKind::Ge,         TokenKind::Question,
    TokenKind::Bang,     TokenKind::Amp,    TokenKind::Eof,
  };
  EXPECT_EQ(kinds(toks), expected);
}

TEST(SyntaxLexer, RangeIsNotAFloat)
{
  const auto toks = lex("0..10");
  const std::vector<TokenKind> expected = {
    TokenKind::IntLiteral, TokenKind::DotDot, TokenKind::IntLiteral, TokenKind::Eof};
  EXPECT_EQ(kinds(toks), expected);
  EXPECT_EQ(toks[0].text, "0");
  EXPECT_EQ(toks[2].text, "10");
}

TEST(SyntaxLexer, NumberLiterals)
{
  const auto toks = lex("42 3.25");
  ASSERT_EQ(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::IntLiteral);
  EXPECT_EQ(toks[0].text, "42");
  EXPECT_EQ(toks[1].kind, TokenKind::FloatLiteral);
  EXPECT_EQ(toks[1].text, "3.25");
}

TEST(SyntaxLexer, StringAndCharPayloadExcludesQuotes)
{
  DiagnosticBag diags;
  const auto toks = lex(R"("hi\n" 'a' '\t')", &diags);
  EXPECT_TRUE(diags.empty());
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[0].text, "hi\\n");
  EXPECT_EQ(toks[1].kind, TokenKind::CharLiteral);
  EXPECT_EQ(toks[1].text, "a");
  EXPECT_EQ(toks[2].kind, TokenKind::CharLiteral);
  EXPECT_EQ(toks[2].text, "\\t");
}

// ============================================================================
// Lexical errors
// ============================================================================

TEST(SyntaxLexer, UnexpectedCharacterReportsE001)
{
  DiagnosticBag diags;
  const auto toks = lex("let x = 1 @ 2;", &diags);
  EXPECT_TRUE(diags.has_error(ErrorKind::UnexpectedCharacter));
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].code, "E001");

  // Lexing continues past the bad character
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
  int unknown = 0;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Unknown) ++unknown;
  }
  EXPECT_EQ(unknown, 1);
}

TEST(SyntaxLexer, UnterminatedStringReportsE002)
{
  DiagnosticBag diags;
  const auto toks = lex("let s = \"abc\nlet t = 1;", &diags);
  EXPECT_TRUE(diags.has_error(ErrorKind::UnterminatedString));
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, MalformedNumbersReportE003)
{
  for (const std::string_view src : {"1.", "12abc", "0x"}) {
    DiagnosticBag diags;
    const auto toks = lex(src, &diags);
    EXPECT_TRUE(diags.has_error(ErrorKind::InvalidNumber)) << src;
    ASSERT_GE(toks.size(), 2U);
    EXPECT_EQ(toks[0].kind, TokenKind::Unknown) << src;
  }
}

TEST(SyntaxLexer, InvalidEscapeReportsE004)
{
  DiagnosticBag diags;
  const auto toks = lex(R"("a\qb")", &diags);
  EXPECT_TRUE(diags.has_error(ErrorKind::InvalidEscapeSequence));
  ASSERT_GE(toks.size(), 1U);
  EXPECT_EQ(toks[0].kind, TokenKind::Unknown);
}

TEST(SyntaxLexer, NoDiagnosticsWithoutBag)
{
  // A missing bag only silences reporting
  const auto toks = lex("@");
  ASSERT_EQ(toks.size(), 2U);
  EXPECT_EQ(toks[0].kind, TokenKind::Unknown);
}
