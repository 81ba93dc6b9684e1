// rapter/sema/resolution/module_graph.cpp - Module dependency graph
//
#include "rapter/sema/resolution/module_graph.hpp"

#include <functional>

namespace rapter
{

// ============================================================================
// ModuleInfo
// ============================================================================

const FunctionDecl * ModuleInfo::find_function(std::string_view fn) const
{
  if (!program) return nullptr;
  for (const auto * decl : program->functions) {
    if (decl->name == fn) return decl;
  }
  return nullptr;
}

const StructDecl * ModuleInfo::find_struct(std::string_view st) const
{
  if (!program) return nullptr;
  for (const auto * decl : program->structs) {
    if (decl->name == st) return decl;
  }
  return nullptr;
}

const EnumDecl * ModuleInfo::find_enum(std::string_view en) const
{
  if (!program) return nullptr;
  for (const auto * decl : program->enums) {
    if (decl->name == en) return decl;
  }
  return nullptr;
}

// ============================================================================
// ModuleGraph
// ============================================================================

ModuleInfo * ModuleGraph::add_module(FileId file_id)
{
  if (!file_id.is_valid()) {
    return nullptr;
  }

  const auto idx = static_cast<size_t>(file_id.value);
  if (modules_.size() <= idx) {
    modules_.resize(idx + 1);
  }
  if (!modules_[idx]) {
    auto info = std::make_unique<ModuleInfo>();
    info->file_id = file_id;
    modules_[idx] = std::move(info);
  }
  return modules_[idx].get();
}

ModuleInfo * ModuleGraph::get_module(FileId file_id) const
{
  if (!file_id.is_valid()) {
    return nullptr;
  }
  const auto idx = static_cast<size_t>(file_id.value);
  if (idx >= modules_.size()) {
    return nullptr;
  }
  return modules_[idx].get();
}

ModuleInfo * ModuleGraph::get_module(const std::filesystem::path & path) const
{
  const std::optional<FileId> id = sources_.find_by_path(path);
  if (!id) {
    return nullptr;
  }
  return get_module(*id);
}

ModuleInfo * ModuleGraph::find_by_name(std::string_view name) const
{
  auto it = by_name_.find(std::string(name));
  return it == by_name_.end() ? nullptr : it->second;
}

void ModuleGraph::cache_name(const std::string & name, ModuleInfo * module)
{
  by_name_[name] = module;
}

size_t ModuleGraph::size() const noexcept
{
  size_t count = 0;
  for (const auto & m : modules_) {
    if (m) ++count;
  }
  return count;
}

std::vector<ModuleInfo *> ModuleGraph::dependency_order() const
{
  std::vector<ModuleInfo *> order;
  if (!entry_) return order;

  std::unordered_set<const ModuleInfo *> visited;
  const std::function<void(ModuleInfo *)> visit = [&](ModuleInfo * module) {
    if (!visited.insert(module).second) return;
    for (const auto & edge : module->imports) {
      if (edge.module) visit(edge.module);
    }
    order.push_back(module);
  };
  visit(entry_);
  return order;
}

}  // namespace rapter
