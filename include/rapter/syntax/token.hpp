// rapter/syntax/token.hpp - Token kinds produced by the lexer
//
#pragma once

#include <cstdint>
#include <string_view>

#include "rapter/basic/source_manager.hpp"

namespace rapter::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,  // keywords are identifiers too; the parser recognises them
  IntLiteral,
  FloatLiteral,
  CharLiteral,    // token.text is the raw contents (without quotes)
  StringLiteral,  // token.text is the raw contents (without quotes)

  // Delimiters
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  ColonColon,
  Semicolon,
  Dot,
  DotDot,
  Ellipsis,
  Arrow,     // ->
  FatArrow,  // =>

  Bang,
  Question,

  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Amp,

  AndAnd,
  OrOr,

  Eq,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes)
  std::string_view text;  // slice view (for string/char literals: interior)

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }

  [[nodiscard]] bool is_keyword(std::string_view kw) const noexcept
  {
    return kind == TokenKind::Identifier && text == kw;
  }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::CharLiteral:
      return "char";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonColon:
      return "::";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::DotDot:
      return "..";
    case TokenKind::Ellipsis:
      return "...";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::FatArrow:
      return "=>";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Question:
      return "?";
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
    case TokenKind::Amp:
      return "&";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
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
  }
  return "";
}

/// Reserved words of the language (lexed as identifiers).
[[nodiscard]] bool is_reserved_word(std::string_view word) noexcept;

}  // namespace rapter::syntax
