// rapter/syntax/lexer.hpp - Source text to token stream
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "rapter/basic/diagnostic.hpp"
#include "rapter/syntax/token.hpp"

namespace rapter::syntax
{

/**
 * Hand-written lexer.
 *
 * Lexical errors are reported into the optional DiagnosticBag and the lexer
 * keeps going, emitting an Unknown token for the offending text so the parser
 * can resynchronise. Comments are skipped.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src, DiagnosticBag * diags = nullptr)
  : file_id_(file_id), src_(src), diags_(diags)
  {
  }

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace_and_comments();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_quoted(char quote);

  /// Validate one escape after a backslash at pos_; advances past it.
  void scan_escape(bool & invalid);

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept
  {
    const auto end = static_cast<uint32_t>(pos_);
    return {kind, make_range(start, end), src_.substr(start, end - start)};
  }

  [[nodiscard]] SourceRange make_range(uint32_t start, uint32_t end) const noexcept
  {
    return {file_id_, start, end};
  }

  void report(ErrorKind kind, SourceRange range, std::string message, std::string help = "");

  FileId file_id_;
  std::string_view src_;
  DiagnosticBag * diags_;
  size_t pos_ = 0;
};

}  // namespace rapter::syntax
