// rapter/syntax/lexer.cpp - Lexer implementation
//
#include "rapter/syntax/lexer.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

#include <fmt/format.h>

namespace rapter::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

constexpr std::string_view k_reserved[] = {
  "fn",     "let",     "const",  "mut",    "if",       "else",     "while",  "for",
  "in",     "return",  "break",  "continue", "match",  "struct",   "enum",   "class",
  "public", "private", "protected", "new", "delete",   "import",   "as",     "export",
  "extern", "int",     "float",  "bool",   "char",     "string",   "true",   "false",
};

struct Punct
{
  std::string_view text;
  TokenKind kind;
};

// Longest spellings first
constexpr Punct k_puncts[] = {
  {"...", TokenKind::Ellipsis}, {"..", TokenKind::DotDot},  {"::", TokenKind::ColonColon},
  {"->", TokenKind::Arrow},     {"=>", TokenKind::FatArrow}, {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},      {"==", TokenKind::EqEq},    {"!=", TokenKind::Ne},
  {"<=", TokenKind::Le},        {">=", TokenKind::Ge},      {"(", TokenKind::LParen},
  {")", TokenKind::RParen},     {"{", TokenKind::LBrace},   {"}", TokenKind::RBrace},
  {"[", TokenKind::LBracket},   {"]", TokenKind::RBracket}, {",", TokenKind::Comma},
  {":", TokenKind::Colon},      {";", TokenKind::Semicolon}, {".", TokenKind::Dot},
  {"!", TokenKind::Bang},       {"?", TokenKind::Question}, {"+", TokenKind::Plus},
  {"-", TokenKind::Minus},      {"*", TokenKind::Star},     {"/", TokenKind::Slash},
  {"%", TokenKind::Percent},    {"&", TokenKind::Amp},      {"=", TokenKind::Eq},
  {"<", TokenKind::Lt},         {">", TokenKind::Gt},
};

}  // namespace

bool is_reserved_word(std::string_view word) noexcept
{
  return std::find(std::begin(k_reserved), std::end(k_reserved), word) != std::end(k_reserved);
}

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::report(ErrorKind kind, SourceRange range, std::string message, std::string help)
{
  if (!diags_) return;
  auto builder = diags_->report_error(kind, range, std::move(message));
  if (!help.empty()) {
    builder.with_help(std::move(help));
  }
}

void Lexer::skip_whitespace_and_comments()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance(1);
      continue;
    }

    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }

    if (starts_with("/*")) {
      // Unterminated block comments run to EOF
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance(1);
      }
      if (starts_with("*/")) {
        advance(2);
      }
      continue;
    }

    break;
  }
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  while (!eof() && is_digit(peek())) {
    advance(1);
  }

  bool is_float = false;
  bool invalid = false;

  // Fractional part; `1..5` is a range, not a float
  if (peek() == '.' && peek(1) != '.') {
    advance(1);
    if (!is_digit(peek())) {
      invalid = true;
    }
    is_float = true;
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
  }

  // Letters glued to the literal (`12abc`, `0x`) make it malformed
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    invalid = true;
    advance(1);
  }

  Token t = make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
  if (invalid) {
    report(
      ErrorKind::InvalidNumber, t.range, fmt::format("invalid number literal '{}'", t.text),
      is_float ? "write a digit after the decimal point (e.g. 1.0)"
               : "integer literals contain only decimal digits (e.g. 42)");
    t.kind = TokenKind::Unknown;
  }
  return t;
}

void Lexer::scan_escape(bool & invalid)
{
  // pos_ is at the backslash
  const auto esc_start = static_cast<uint32_t>(pos_);
  advance(1);
  if (eof()) {
    return;
  }
  const char e = peek();
  advance(1);
  switch (e) {
    case 'n':
    case 't':
    case 'r':
    case '0':
    case '\\':
    case '"':
    case '\'':
      return;
    default:
      break;
  }
  invalid = true;
  report(
    ErrorKind::InvalidEscapeSequence, make_range(esc_start, static_cast<uint32_t>(pos_)),
    fmt::format("unknown escape sequence '\\{}'", e),
    "supported escapes are \\n, \\t, \\r, \\0, \\\\, \\\" and \\'");
}

Token Lexer::lex_quoted(char quote)
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // opening quote
  const auto payload_start = static_cast<uint32_t>(pos_);

  bool invalid = false;
  bool terminated = false;

  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      terminated = true;
      break;
    }
    // Raw newlines end the literal
    if (c == '\n') {
      break;
    }
    if (c == '\\') {
      scan_escape(invalid);
      continue;
    }
    advance(1);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  if (terminated) {
    advance(1);  // closing quote
  }
  const auto end = static_cast<uint32_t>(pos_);

  Token t;
  t.range = make_range(start, end);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  t.kind = quote == '"' ? TokenKind::StringLiteral : TokenKind::CharLiteral;

  if (!terminated) {
    const bool is_char = quote == '\'';
    report(
      ErrorKind::UnterminatedString, t.range,
      is_char ? "unterminated char literal" : "unterminated string literal",
      is_char ? "add a closing single quote (') to complete the char literal"
              : "add a closing double quote (\") to complete the string");
    t.kind = TokenKind::Unknown;
    return t;
  }

  if (invalid) {
    t.kind = TokenKind::Unknown;
    return t;
  }

  if (quote == '\'') {
    // Exactly one character or one escape
    const bool single = t.text.size() == 1 && t.text[0] != '\\';
    const bool escape = t.text.size() == 2 && t.text[0] == '\\';
    if (!single && !escape) {
      report(
        ErrorKind::InvalidSyntax, t.range,
        fmt::format("char literal must contain exactly one character, found '{}'", t.text),
        "use double quotes for strings");
      t.kind = TokenKind::Unknown;
    }
  }
  return t;
}

Token Lexer::next_token()
{
  skip_whitespace_and_comments();

  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    return {TokenKind::Eof, make_range(at, at), {}};
  }

  const char c = peek();

  if (is_ident_start(static_cast<unsigned char>(c))) {
    return lex_identifier();
  }
  if (is_digit(c)) {
    return lex_number();
  }
  if (c == '"' || c == '\'') {
    return lex_quoted(c);
  }

  const auto start = static_cast<uint32_t>(pos_);
  for (const auto & p : k_puncts) {
    if (starts_with(p.text)) {
      advance(p.text.size());
      return make_token(p.kind, start);
    }
  }

  // Consume one UTF-8 sequence so multi-byte characters produce one error
  advance(1);
  while (!eof() && (static_cast<unsigned char>(peek()) & 0xC0U) == 0x80U) {
    advance(1);
  }
  Token t = make_token(TokenKind::Unknown, start);
  report(
    ErrorKind::UnexpectedCharacter, t.range, fmt::format("unexpected character '{}'", t.text),
    "remove or replace the unexpected character with valid Rapter syntax");
  return t;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace rapter::syntax
