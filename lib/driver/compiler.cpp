// rapter/driver/compiler.cpp - Compiler driver implementation
//
#include "rapter/driver/compiler.hpp"

#include <fstream>

#include "rapter/codegen/c_generator.hpp"
#include "rapter/sema/resolution/module_resolver.hpp"
#include "rapter/sema/types/type_checker.hpp"

namespace rapter
{

namespace
{

std::filesystem::path default_output(const std::filesystem::path & source)
{
  std::filesystem::path out = source;
  out.replace_extension(".c");
  return out;
}

}  // namespace

CompileResult Compiler::compile_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  CompileResult result;
  result.module_graph = std::make_unique<ModuleGraph>();

  ModuleResolver resolver(*result.module_graph, result.diagnostics, options.module_paths);
  if (!resolver.resolve(file)) {
    return result;
  }

  run_pipeline(result, options, options.output.value_or(default_output(file)));
  return result;
}

CompileResult Compiler::compile_source(
  std::string source, const CompileOptions & options,
  const std::filesystem::path & virtual_path)
{
  CompileResult result;
  result.module_graph = std::make_unique<ModuleGraph>();

  ModuleResolver resolver(*result.module_graph, result.diagnostics, options.module_paths);
  if (!resolver.resolve_source(virtual_path, std::move(source))) {
    return result;
  }

  run_pipeline(result, options, options.output);
  return result;
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;
  result.module_graph = std::make_unique<ModuleGraph>();

  if (config.compiler.entry.empty()) {
    result.diagnostics.report_error(
      ErrorKind::ModuleNotFound, SourceRange{}, "no entry module defined in project configuration");
    return result;
  }

  std::vector<std::filesystem::path> module_paths = config.resolved_module_paths();
  module_paths.insert(module_paths.end(), options.module_paths.begin(), options.module_paths.end());

  ModuleResolver resolver(*result.module_graph, result.diagnostics, std::move(module_paths));
  if (!resolver.resolve(config.entry_path())) {
    return result;
  }

  run_pipeline(result, options, options.output.value_or(config.output_path()));
  return result;
}

void Compiler::run_pipeline(
  CompileResult & result, const CompileOptions & options,
  const std::optional<std::filesystem::path> & output_path)
{
  // Parse and import errors were reported by the resolver
  if (result.diagnostics.has_errors()) {
    return;
  }

  if (!run_semantic_analysis(*result.module_graph, result.diagnostics)) {
    return;
  }

  if (options.mode == CompileMode::Build) {
    if (!generate_c(*result.module_graph, result.c_source, result.diagnostics)) {
      return;
    }
    if (output_path && !options.in_memory) {
      if (!write_output(*output_path, result.c_source, result.diagnostics)) {
        return;
      }
      result.generated_files.push_back(*output_path);
    }
  }

  result.success = !result.diagnostics.has_errors();
}

bool Compiler::run_semantic_analysis(ModuleGraph & graph, DiagnosticBag & diags)
{
  try {
    TypeChecker checker(graph);
    checker.check_all();
  } catch (const CompileError & e) {
    diags.add(e.diagnostic());
    return false;
  } catch (const std::exception & e) {
    diags.report_error(
      ErrorKind::InternalError, SourceRange{}, std::string("type checking failed: ") + e.what());
    return false;
  }
  return true;
}

bool Compiler::generate_c(ModuleGraph & graph, std::string & out, DiagnosticBag & diags)
{
  try {
    CGenerator generator(graph);
    out = generator.generate();
  } catch (const CompileError & e) {
    diags.add(e.diagnostic());
    return false;
  } catch (const std::exception & e) {
    diags.report_error(
      ErrorKind::InternalError, SourceRange{}, std::string("code generation failed: ") + e.what());
    return false;
  }
  return true;
}

bool Compiler::write_output(
  const std::filesystem::path & path, const std::string & text, DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      diags.report_error(
        ErrorKind::InternalError, SourceRange{},
        "cannot create output directory " + path.parent_path().string() + ": " + ec.message());
      return false;
    }
  }

  std::ofstream file(path, std::ios::binary);
  if (!file) {
    diags.report_error(
      ErrorKind::InternalError, SourceRange{}, "cannot open output file: " + path.string());
    return false;
  }
  file << text;
  if (!file) {
    diags.report_error(
      ErrorKind::InternalError, SourceRange{}, "failed to write output file: " + path.string());
    return false;
  }
  return true;
}

}  // namespace rapter
