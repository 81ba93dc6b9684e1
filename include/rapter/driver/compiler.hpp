// rapter/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and by the end-to-end tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rapter/basic/diagnostic.hpp"
#include "rapter/project/project_config.hpp"
#include "rapter/sema/resolution/module_graph.hpp"

namespace rapter
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Parsing and type checking only (no codegen)
  Build,  ///< Full build including C generation
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  /// Output C file (overrides the project config and the default path)
  std::optional<std::filesystem::path> output;

  /// Extra module search directories, searched after the importer's directory
  std::vector<std::filesystem::path> module_paths;

  /// Skip writing the generated C to disk; it is still returned in c_source
  bool in_memory = false;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Collected diagnostics; at most one checker or codegen error
  DiagnosticBag diagnostics;

  /// Files written (Build mode only)
  std::vector<std::filesystem::path> generated_files;

  /// Generated translation unit (Build mode only)
  std::string c_source;

  /// Module graph (owns sources and ASTs referenced by diagnostics)
  std::unique_ptr<ModuleGraph> module_graph;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full compilation pipeline.
 *
 * The pipeline consists of:
 * 1. Module resolution (parsing the entry and every import)
 * 2. Type checking of every module, imports first (stops at the first error)
 * 3. C generation for the whole program (Build mode only)
 * 4. Writing `<stem>.c` or the requested output file
 */
class Compiler
{
public:
  /**
   * Compile a single source file.
   *
   * Without an explicit output the C file is written beside the source.
   */
  [[nodiscard]] static CompileResult compile_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Compile an in-memory entry module.
   *
   * Imports resolve relative to `virtual_path`'s directory. Nothing is
   * written unless `options.output` is set.
   */
  [[nodiscard]] static CompileResult compile_source(
    std::string source, const CompileOptions & options,
    const std::filesystem::path & virtual_path = "main.rapt");

  /**
   * Compile the project described by a rapter.yaml configuration.
   *
   * Configured module paths come before those in `options`.
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

private:
  /// Check and (in Build mode) generate; records the outcome in `result`.
  static void run_pipeline(
    CompileResult & result, const CompileOptions & options,
    const std::optional<std::filesystem::path> & output_path);

  static bool run_semantic_analysis(ModuleGraph & graph, DiagnosticBag & diags);

  static bool generate_c(ModuleGraph & graph, std::string & out, DiagnosticBag & diags);

  static bool write_output(
    const std::filesystem::path & path, const std::string & text, DiagnosticBag & diags);
};

}  // namespace rapter
