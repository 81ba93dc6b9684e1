// rapter/syntax/frontend.cpp - High-level parse pipeline
#include "rapter/syntax/frontend.hpp"

#include "rapter/syntax/lexer.hpp"
#include "rapter/syntax/parser.hpp"

namespace rapter
{

std::vector<syntax::Token> tokenize(
  const SourceRegistry & sources, FileId file_id, DiagnosticBag & diags)
{
  const SourceFile * file = sources.get_file(file_id);
  if (file == nullptr) {
    return {};
  }
  syntax::Lexer lexer(file_id, file->content(), &diags);
  return lexer.lex_all();
}

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, TypeContext & types, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = sources.register_file(path, std::move(source_text));
  const SourceFile * file = sources.get_file(out.file_id);

  auto tokens = tokenize(sources, out.file_id, diags);
  syntax::Parser parser(ast, types, out.file_id, *file, diags, std::move(tokens));
  out.program = parser.parse_program();
  return out;
}

}  // namespace rapter
