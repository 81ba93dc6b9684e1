// rapter/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "rapter/ast/ast.hpp"
#include "rapter/ast/ast_context.hpp"
#include "rapter/basic/diagnostic.hpp"
#include "rapter/basic/source_manager.hpp"
#include "rapter/sema/types/type.hpp"
#include "rapter/syntax/token.hpp"

namespace rapter
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Program * program = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, TypeContext & types, DiagnosticBag & diags);

/// Lex a registered file; errors go to `diags`.
[[nodiscard]] std::vector<syntax::Token> tokenize(
  const SourceRegistry & sources, FileId file_id, DiagnosticBag & diags);

}  // namespace rapter
