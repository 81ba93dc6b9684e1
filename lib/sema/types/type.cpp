// rapter/sema/types/type.cpp - Type context implementation
//
#include "rapter/sema/types/type.hpp"

#include <algorithm>
#include <cstring>

namespace rapter
{

namespace
{

bool same_args(gsl::span<const Type * const> a, gsl::span<const Type * const> b)
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
}

}  // namespace

TypeContext::TypeContext()
{
  int_ = Type{TypeKind::Int};
  float_ = Type{TypeKind::Float};
  bool_ = Type{TypeKind::Bool};
  char_ = Type{TypeKind::Char};
  string_ = Type{TypeKind::String};
  void_ = Type{TypeKind::Void};
}

std::string_view TypeContext::intern_name(std::string_view name)
{
  if (auto it = names_.find(name); it != names_.end()) {
    return *it;
  }
  char * const ptr = static_cast<char *>(arena_.allocate(name.empty() ? 1 : name.size(), 1));
  std::memcpy(ptr, name.data(), name.size());
  const std::string_view stored(ptr, name.size());
  names_.insert(stored);
  return stored;
}

const Type * TypeContext::intern(const Type & candidate)
{
  // Search for existing
  for (const auto & t : composite_types_) {
    if (
      t.kind == candidate.kind && t.element_type == candidate.element_type &&
      t.name == candidate.name && same_args(t.type_args, candidate.type_args)) {
      return &t;
    }
  }

  // Create new; names and argument lists are copied into the arena
  Type stored = candidate;
  if (!candidate.name.empty()) {
    stored.name = intern_name(candidate.name);
  }
  if (!candidate.type_args.empty()) {
    auto * args = static_cast<const Type **>(
      arena_.allocate(sizeof(const Type *) * candidate.type_args.size(), alignof(const Type *)));
    std::copy(candidate.type_args.begin(), candidate.type_args.end(), args);
    stored.type_args = gsl::span<const Type * const>(args, candidate.type_args.size());
  }
  composite_types_.push_back(stored);
  return &composite_types_.back();
}

const Type * TypeContext::get_pointer_type(const Type * pointee)
{
  Type t{TypeKind::Pointer};
  t.element_type = pointee;
  return intern(t);
}

const Type * TypeContext::get_array_type(const Type * element_type)
{
  Type t{TypeKind::Array};
  t.element_type = element_type;
  return intern(t);
}

const Type * TypeContext::get_dynamic_array_type(const Type * element_type)
{
  Type t{TypeKind::DynamicArray};
  t.element_type = element_type;
  return intern(t);
}

const Type * TypeContext::get_struct_type(std::string_view name)
{
  Type t{TypeKind::Struct};
  t.name = name;
  return intern(t);
}

const Type * TypeContext::get_enum_type(std::string_view name)
{
  Type t{TypeKind::Enum};
  t.name = name;
  return intern(t);
}

const Type * TypeContext::get_generic_type(
  std::string_view family, const std::vector<const Type *> & args)
{
  Type t{TypeKind::Generic};
  t.name = family;
  t.type_args = gsl::span<const Type * const>(args.data(), args.size());
  return intern(t);
}

const Type * TypeContext::get_type_param(std::string_view name)
{
  Type t{TypeKind::TypeParam};
  t.name = name;
  return intern(t);
}

const Type * TypeContext::lookup_builtin(std::string_view name) const
{
  if (name == "int") return &int_;
  if (name == "float") return &float_;
  if (name == "bool") return &bool_;
  if (name == "char") return &char_;
  if (name == "string") return &string_;
  if (name == "void") return &void_;
  return nullptr;
}

}  // namespace rapter
