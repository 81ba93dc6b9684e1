// rapter/sema/resolution/module_resolver.cpp - Module resolution implementation
//
#include "rapter/sema/resolution/module_resolver.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_map>

#include "rapter/syntax/frontend.hpp"

namespace rapter
{

namespace
{

std::optional<std::string> read_file(const std::filesystem::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

bool file_exists(const std::filesystem::path & path)
{
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

}  // namespace

// ============================================================================
// Entry Point
// ============================================================================

ModuleInfo * ModuleResolver::resolve(const std::filesystem::path & entry_point)
{
  std::filesystem::path abs_path;
  try {
    abs_path = std::filesystem::absolute(entry_point);
    abs_path = std::filesystem::weakly_canonical(abs_path);
  } catch (const std::filesystem::filesystem_error & e) {
    report(
      ErrorKind::ModuleLoadError, SourceRange{},
      "cannot resolve path '" + entry_point.string() + "': " + e.what());
    return nullptr;
  }

  if (!file_exists(abs_path)) {
    report(ErrorKind::ModuleNotFound, SourceRange{}, "file not found: " + abs_path.string());
    return nullptr;
  }

  std::optional<std::string> text = read_file(abs_path);
  if (!text) {
    report(ErrorKind::ModuleLoadError, SourceRange{}, "cannot read file: " + abs_path.string());
    return nullptr;
  }

  return resolve_source(abs_path, std::move(*text));
}

ModuleInfo * ModuleResolver::resolve_source(
  const std::filesystem::path & virtual_path, std::string source)
{
  const std::string name = virtual_path.stem().string();
  ModuleInfo * module = parse_module(virtual_path, name, std::move(source));
  graph_.set_entry(module);
  graph_.cache_name(name, module);

  loading_.push_back(name);
  collect_exports(*module);
  process_imports(*module, virtual_path.parent_path());
  loading_.pop_back();
  return module;
}

// ============================================================================
// Module Loading
// ============================================================================

std::filesystem::path ModuleResolver::module_file_name(std::string_view name)
{
  std::string rel(name);
  std::replace(rel.begin(), rel.end(), '.', '/');
  return std::filesystem::path(rel + ".rapt");
}

std::vector<std::filesystem::path> ModuleResolver::candidate_paths(
  std::string_view name, const std::filesystem::path & importer_dir) const
{
  const std::filesystem::path rel = module_file_name(name);
  std::vector<std::filesystem::path> result;
  result.reserve(module_paths_.size() + 1);
  result.push_back(importer_dir / rel);
  for (const auto & dir : module_paths_) {
    result.push_back(dir / rel);
  }
  return result;
}

ModuleInfo * ModuleResolver::load(
  std::string_view name, const std::filesystem::path & importer_dir, SourceRange import_range)
{
  const std::string key(name);

  if (ModuleInfo * cached = graph_.find_by_name(key)) {
    if (std::find(loading_.begin(), loading_.end(), key) != loading_.end()) {
      report(ErrorKind::CircularImport, import_range, "circular import: " + describe_cycle(key))
        .with_help("break the cycle by moving the shared items into a separate module");
      return nullptr;
    }
    return cached;
  }

  const std::vector<std::filesystem::path> candidates = candidate_paths(name, importer_dir);
  const auto found = std::find_if(candidates.begin(), candidates.end(), file_exists);
  if (found == candidates.end()) {
    auto diag = report(ErrorKind::ModuleNotFound, import_range, "module '" + key + "' not found");
    for (const auto & path : candidates) {
      diag.with_suggestion("searched " + path.string());
    }
    diag.with_help("add the directory containing '" + module_file_name(name).string() +
                   "' to the module paths (-I)");
    return nullptr;
  }

  std::optional<std::string> text = read_file(*found);
  if (!text) {
    report(
      ErrorKind::ModuleLoadError, import_range,
      "cannot read module '" + key + "' from " + found->string());
    return nullptr;
  }

  ModuleInfo * module = parse_module(*found, key, std::move(*text));
  graph_.cache_name(key, module);
  if (module->parse_diags.has_errors()) {
    report(ErrorKind::ModuleLoadError, import_range, "module '" + key + "' has syntax errors");
    return nullptr;
  }

  loading_.push_back(key);
  collect_exports(*module);
  process_imports(*module, found->parent_path());
  loading_.pop_back();
  return module;
}

// ============================================================================
// File Parsing
// ============================================================================

ModuleInfo * ModuleResolver::parse_module(
  const std::filesystem::path & path, std::string name, std::string source)
{
  auto ast = std::make_unique<AstContext>();
  DiagnosticBag parse_diags;

  const ParseOutput out = parse_source(
    graph_.sources(), path, std::move(source), *ast, graph_.types(), parse_diags);

  ModuleInfo * module = graph_.add_module(out.file_id);
  module->name = std::move(name);
  module->ast = std::move(ast);
  module->program = out.program;
  module->parse_diags = std::move(parse_diags);

  if (!module->parse_diags.empty()) {
    diags_.merge(module->parse_diags);
    error_count_ += module->parse_diags.errors().size();
  }
  return module;
}

// ============================================================================
// Exports and Imports
// ============================================================================

void ModuleResolver::collect_exports(ModuleInfo & module)
{
  if (!module.program) return;

  for (const auto * exp : module.program->exports) {
    if (!module.defines(exp->name)) {
      report(
        ErrorKind::ModuleExportError, exp->get_range(),
        "module '" + module.name + "' exports '" + std::string(exp->name) +
          "', which it does not define");
      continue;
    }
    module.exports.insert(exp->name);
  }
}

void ModuleResolver::process_imports(ModuleInfo & module, const std::filesystem::path & base_dir)
{
  if (!module.program) return;

  std::unordered_map<std::string_view, const ImportDecl *> aliases;
  for (const auto * import_decl : module.program->imports) {
    const std::string_view alias = import_decl->effective_alias();

    auto [it, inserted] = aliases.emplace(alias, import_decl);
    if (!inserted) {
      report(
        ErrorKind::ImportConflict, import_decl->get_range(),
        "import alias '" + std::string(alias) + "' is already bound")
        .with_secondary_label(it->second->get_range(), "first bound here")
        .with_suggestion(
          "rename one of the imports", "import " + std::string(import_decl->modulePath) + " as " +
                                         std::string(alias) + "2;");
      continue;
    }

    ModuleInfo * imported = load(import_decl->modulePath, base_dir, import_decl->get_range());
    if (imported) {
      module.imports.push_back(ImportEdge{import_decl, imported, alias});
    }
  }
}

// ============================================================================
// Error Reporting
// ============================================================================

std::string ModuleResolver::describe_cycle(std::string_view closing) const
{
  auto it = std::find(loading_.begin(), loading_.end(), closing);
  std::string chain;
  for (; it != loading_.end(); ++it) {
    chain += *it;
    chain += " -> ";
  }
  chain += closing;
  return chain;
}

DiagnosticBuilder ModuleResolver::report(ErrorKind kind, SourceRange range, std::string message)
{
  ++error_count_;
  return diags_.report_error(kind, range, std::move(message));
}

}  // namespace rapter
