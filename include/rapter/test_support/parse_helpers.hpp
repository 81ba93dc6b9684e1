// rapter/test_support/parse_helpers.hpp - helpers for unit tests
//
// These helpers provide lightweight in-memory pipelines for tests: a
// single-file parse, and a parse plus type check of an entry module and its
// imports.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rapter/ast/ast_context.hpp"
#include "rapter/basic/diagnostic.hpp"
#include "rapter/basic/source_manager.hpp"
#include "rapter/sema/resolution/module_graph.hpp"
#include "rapter/sema/resolution/module_resolver.hpp"
#include "rapter/sema/types/type_checker.hpp"
#include "rapter/syntax/frontend.hpp"

namespace rapter::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  std::unique_ptr<TypeContext> types;
  DiagnosticBag diags;
  Program * program = nullptr;

  [[nodiscard]] const SourceFile * source_file() const noexcept
  {
    return sources.get_file(file_id);
  }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.rapt")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();
  out.types = std::make_unique<TypeContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, *out.types, out.diags);
  out.file_id = parsed.file_id;
  out.program = parsed.program;
  return out;
}

/// Result of resolving and checking an in-memory entry module.
struct TestCheckUnit
{
  std::unique_ptr<ModuleGraph> graph;
  ModuleInfo * entry = nullptr;

  /// Lexer, parser and module loader diagnostics
  DiagnosticBag diags;

  /// First checker failure, if any
  std::optional<CompileError> error;

  [[nodiscard]] bool ok() const { return !diags.has_errors() && !error; }

  [[nodiscard]] std::optional<ErrorKind> error_kind() const
  {
    if (error) return error->kind();
    for (const auto & d : diags) {
      if (d.severity == Severity::Error && d.kind) return d.kind;
    }
    return std::nullopt;
  }

  [[nodiscard]] std::string message() const
  {
    if (error) return error->diagnostic().message;
    for (const auto & d : diags) {
      if (d.severity == Severity::Error) return d.message;
    }
    return {};
  }
};

/**
 * Parse `src` as the entry module and type check it.
 *
 * Imports are searched next to `virtual_path` and in `module_paths`. The
 * checker only runs when loading produced no errors.
 */
[[nodiscard]] inline TestCheckUnit check(
  std::string src, const std::filesystem::path & virtual_path = "main.rapt",
  std::vector<std::filesystem::path> module_paths = {})
{
  TestCheckUnit out;
  out.graph = std::make_unique<ModuleGraph>();

  ModuleResolver resolver(*out.graph, out.diags, std::move(module_paths));
  out.entry = resolver.resolve_source(virtual_path, std::move(src));
  if (!out.entry || out.diags.has_errors()) return out;

  try {
    TypeChecker(*out.graph).check_all();
  } catch (const CompileError & e) {
    out.error = e;
  }
  return out;
}

}  // namespace rapter::test_support
