// rapter/sema/resolution/type_environment.cpp - Scoped symbols and layout tables
//
#include "rapter/sema/resolution/type_environment.hpp"

namespace rapter
{

std::string_view to_string(SymbolRole role)
{
  switch (role) {
    case SymbolRole::Function:
      return "function";
    case SymbolRole::ExternFunction:
      return "extern function";
    case SymbolRole::Struct:
      return "struct";
    case SymbolRole::Enum:
      return "enum";
    case SymbolRole::Variable:
      return "variable";
    case SymbolRole::Parameter:
      return "parameter";
    case SymbolRole::Module:
      return "module";
  }
  return "symbol";
}

TypeEnvironment::TypeEnvironment() { scopes_.emplace_back(); }

void TypeEnvironment::push_scope() { scopes_.emplace_back(); }

void TypeEnvironment::pop_scope()
{
  // The module scope lives as long as the environment
  if (scopes_.size() > 1) {
    scopes_.pop_back();
  }
}

bool TypeEnvironment::define(Symbol symbol)
{
  symbol.name = intern(symbol.name);
  auto [it, inserted] = scopes_.back().emplace(symbol.name, symbol);
  return inserted;
}

bool TypeEnvironment::define_global(Symbol symbol)
{
  symbol.name = intern(symbol.name);
  auto [it, inserted] = scopes_.front().emplace(symbol.name, symbol);
  return inserted;
}

const Symbol * TypeEnvironment::lookup(std::string_view name) const
{
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    if (auto found = it->find(name); found != it->end()) {
      return &found->second;
    }
  }
  return nullptr;
}

const Symbol * TypeEnvironment::lookup_local(std::string_view name) const
{
  const auto & scope = scopes_.back();
  auto it = scope.find(name);
  return it != scope.end() ? &it->second : nullptr;
}

const Symbol * TypeEnvironment::lookup_global(std::string_view name) const
{
  const auto & scope = scopes_.front();
  auto it = scope.find(name);
  return it != scope.end() ? &it->second : nullptr;
}

void TypeEnvironment::define_struct(std::string_view key, StructLayout layout)
{
  structs_.insert_or_assign(intern(key), std::move(layout));
}

void TypeEnvironment::define_enum(std::string_view key, EnumLayout layout)
{
  enums_.insert_or_assign(intern(key), std::move(layout));
}

void TypeEnvironment::define_function(std::string_view key, FunctionSignature sig)
{
  functions_.insert_or_assign(intern(key), std::move(sig));
}

const StructLayout * TypeEnvironment::find_struct(std::string_view key) const
{
  auto it = structs_.find(key);
  return it != structs_.end() ? &it->second : nullptr;
}

const EnumLayout * TypeEnvironment::find_enum(std::string_view key) const
{
  auto it = enums_.find(key);
  return it != enums_.end() ? &it->second : nullptr;
}

const FunctionSignature * TypeEnvironment::find_function(std::string_view key) const
{
  auto it = functions_.find(key);
  return it != functions_.end() ? &it->second : nullptr;
}

std::string_view TypeEnvironment::qualify(std::string_view alias, std::string_view name)
{
  std::string joined;
  joined.reserve(alias.size() + 1 + name.size());
  joined.append(alias).append(".").append(name);
  return intern(joined);
}

std::string_view TypeEnvironment::intern(std::string_view s)
{
  auto [it, inserted] = names_.emplace(s);
  return *it;
}

}  // namespace rapter
