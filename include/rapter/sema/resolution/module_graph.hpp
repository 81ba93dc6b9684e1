// rapter/sema/resolution/module_graph.hpp - Module dependency graph
//
// Owns every module of a compilation together with the shared source registry
// and type context.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "rapter/ast/ast.hpp"
#include "rapter/ast/ast_context.hpp"
#include "rapter/basic/diagnostic.hpp"
#include "rapter/basic/source_manager.hpp"
#include "rapter/sema/types/type.hpp"

namespace rapter
{

struct ModuleInfo;

// ============================================================================
// Module Info
// ============================================================================

/// One resolved `import` of a module.
struct ImportEdge
{
  const ImportDecl * decl = nullptr;
  ModuleInfo * module = nullptr;
  /// Explicit alias or the last path segment
  std::string_view alias;
};

/**
 * Information about a single module (source file).
 */
struct ModuleInfo
{
  /// Dotted module name (`utils.math`); the entry module uses its file stem
  std::string name;

  /// Source file id (owned by ModuleGraph::sources())
  FileId file_id = FileId::invalid();

  /// Parsed AST context (non-movable, owned by this module)
  std::unique_ptr<AstContext> ast;

  /// Diagnostics produced during parsing
  DiagnosticBag parse_diags;

  /// Parsed program root (owned by ast)
  Program * program = nullptr;

  /// Direct imports in source order
  std::vector<ImportEdge> imports;

  /// Names listed by `export`
  std::unordered_set<std::string_view> exports;

  /// Set once the checker accepted the module
  bool checked = false;

  [[nodiscard]] bool is_exported(std::string_view item) const
  {
    return exports.count(item) > 0;
  }

  [[nodiscard]] const FunctionDecl * find_function(std::string_view fn) const;
  [[nodiscard]] const StructDecl * find_struct(std::string_view st) const;
  [[nodiscard]] const EnumDecl * find_enum(std::string_view en) const;

  /// True when the module defines an item (function, struct or enum) with this name.
  [[nodiscard]] bool defines(std::string_view item) const
  {
    return find_function(item) || find_struct(item) || find_enum(item);
  }
};

// ============================================================================
// Module Graph
// ============================================================================

/**
 * Graph of all modules in a compilation.
 *
 * Modules are stored by FileId and additionally cached by dotted name, so
 * asking for the same module twice yields the same ModuleInfo.
 */
class ModuleGraph
{
public:
  ModuleGraph() = default;

  ModuleGraph(const ModuleGraph &) = delete;
  ModuleGraph & operator=(const ModuleGraph &) = delete;

  [[nodiscard]] SourceRegistry & sources() noexcept { return sources_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }

  [[nodiscard]] TypeContext & types() noexcept { return types_; }
  [[nodiscard]] const TypeContext & types() const noexcept { return types_; }

  // ===========================================================================
  // Module Management
  // ===========================================================================

  /**
   * Add a new module to the graph.
   *
   * If a module for the same FileId already exists, returns existing.
   */
  ModuleInfo * add_module(FileId file_id);

  [[nodiscard]] ModuleInfo * get_module(FileId file_id) const;
  [[nodiscard]] ModuleInfo * get_module(const std::filesystem::path & path) const;

  /// Module cached under a dotted name (nullptr when never loaded).
  [[nodiscard]] ModuleInfo * find_by_name(std::string_view name) const;
  void cache_name(const std::string & name, ModuleInfo * module);

  [[nodiscard]] size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  // ===========================================================================
  // Compilation Order
  // ===========================================================================

  void set_entry(ModuleInfo * entry) noexcept { entry_ = entry; }
  [[nodiscard]] ModuleInfo * entry() const noexcept { return entry_; }

  /**
   * Modules reachable from the entry, every module after its imports.
   *
   * The entry module comes last.
   */
  [[nodiscard]] std::vector<ModuleInfo *> dependency_order() const;

private:
  SourceRegistry sources_;
  TypeContext types_;
  std::vector<std::unique_ptr<ModuleInfo>> modules_;  // indexed by FileId::value
  std::unordered_map<std::string, ModuleInfo *> by_name_;
  ModuleInfo * entry_ = nullptr;
};

}  // namespace rapter
