// rapter/sema/resolution/module_resolver.hpp - Module loading and import resolution
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "rapter/basic/diagnostic.hpp"
#include "rapter/sema/resolution/module_graph.hpp"

namespace rapter
{

/**
 * Loads the entry module and, transitively, everything it imports.
 *
 * `import a.b` is looked up as `a/b.rapt` relative to the importing file's
 * directory first, then under each configured module path. Each module name
 * is loaded once; later imports of the same name reuse the cached module.
 *
 * Reported errors:
 * - E301 module not found (searched paths listed as suggestions)
 * - E302 unreadable module file, or parse errors inside it
 * - E303 `export` of a name the module does not define
 * - E304 circular import
 * - E306 two imports of one module binding the same alias
 */
class ModuleResolver
{
public:
  ModuleResolver(
    ModuleGraph & graph, DiagnosticBag & diags,
    std::vector<std::filesystem::path> module_paths = {})
  : graph_(graph), diags_(diags), module_paths_(std::move(module_paths))
  {
  }

  /**
   * Resolve the entry file and all of its imports.
   *
   * @return the entry module, or nullptr when the file cannot be read
   */
  ModuleInfo * resolve(const std::filesystem::path & entry_point);

  /**
   * Resolve an in-memory entry module.
   *
   * Imports are searched relative to `virtual_path`'s directory.
   */
  ModuleInfo * resolve_source(const std::filesystem::path & virtual_path, std::string source);

  /**
   * Load a module by dotted name.
   *
   * @return the cached or freshly loaded module; nullptr after an error
   */
  ModuleInfo * load(
    std::string_view name, const std::filesystem::path & importer_dir, SourceRange import_range);

  /// Candidate files for `name`, in search order.
  [[nodiscard]] std::vector<std::filesystem::path> candidate_paths(
    std::string_view name, const std::filesystem::path & importer_dir) const;

  /// Relative file path of a dotted module name (`a.b` -> `a/b.rapt`).
  [[nodiscard]] static std::filesystem::path module_file_name(std::string_view name);

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }

private:
  ModuleInfo * parse_module(
    const std::filesystem::path & path, std::string name, std::string source);
  void collect_exports(ModuleInfo & module);
  void process_imports(ModuleInfo & module, const std::filesystem::path & base_dir);

  [[nodiscard]] std::string describe_cycle(std::string_view closing) const;

  DiagnosticBuilder report(ErrorKind kind, SourceRange range, std::string message);

  ModuleGraph & graph_;
  DiagnosticBag & diags_;
  std::vector<std::filesystem::path> module_paths_;

  /// Modules currently being loaded, outermost first
  std::vector<std::string> loading_;
  size_t error_count_ = 0;
};

}  // namespace rapter
