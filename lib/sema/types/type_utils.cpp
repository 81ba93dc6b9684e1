// rapter/sema/types/type_utils.cpp - Shared type utilities implementation
//
#include "rapter/sema/types/type_utils.hpp"

namespace rapter
{

// ============================================================================
// Names
// ============================================================================

bool is_qualified_name(std::string_view name) noexcept
{
  return name.find('.') != std::string_view::npos;
}

std::string_view unqualified_name(std::string_view name) noexcept
{
  const auto dot = name.rfind('.');
  return dot == std::string_view::npos ? name : name.substr(dot + 1);
}

// ============================================================================
// Type Compatibility
// ============================================================================

namespace
{

bool is_named_kind(TypeKind k) { return k == TypeKind::Struct || k == TypeKind::Enum; }

/// `mod.n` against `n` where exactly one side is qualified.
bool qualified_alias_of(std::string_view a, std::string_view b)
{
  const bool qa = is_qualified_name(a);
  const bool qb = is_qualified_name(b);
  if (qa == qb) return false;
  const std::string_view q = qa ? a : b;
  const std::string_view n = qa ? b : a;
  return unqualified_name(q) == n;
}

}  // namespace

bool compatible(const Type * a, const Type * b)
{
  if (!a || !b) return false;

  // Identity (interned, so structural equality)
  if (a == b) return true;

  // Struct(n) vs Enum(n)
  if (
    is_named_kind(a->kind) && is_named_kind(b->kind) && a->kind != b->kind &&
    a->name == b->name) {
    return true;
  }

  // String vs the `str` alias
  if (a->is_string() && b->is_string()) return true;

  // Element-wise descent
  if (
    a->kind == b->kind && (a->kind == TypeKind::Pointer || a->kind == TypeKind::Array ||
                           a->kind == TypeKind::DynamicArray)) {
    return compatible(a->element_type, b->element_type);
  }

  // Qualified vs unqualified struct name
  if (a->kind == TypeKind::Struct && b->kind == TypeKind::Struct) {
    return qualified_alias_of(a->name, b->name);
  }

  return false;
}

std::string to_string(const Type * type)
{
  if (!type) return "<unknown>";

  switch (type->kind) {
    case TypeKind::Int:
      return "int";
    case TypeKind::Float:
      return "float";
    case TypeKind::Bool:
      return "bool";
    case TypeKind::Char:
      return "char";
    case TypeKind::String:
      return "string";
    case TypeKind::Void:
      return "void";
    case TypeKind::Pointer:
      return "*" + to_string(type->element_type);
    case TypeKind::Array:
      return "[" + to_string(type->element_type) + "]";
    case TypeKind::DynamicArray:
      return "DynamicArray[" + to_string(type->element_type) + "]";
    case TypeKind::Struct:
    case TypeKind::Enum:
    case TypeKind::TypeParam:
      return std::string(type->name);
    case TypeKind::Generic: {
      std::string result(type->name);
      result += "<";
      for (size_t i = 0; i < type->type_args.size(); ++i) {
        if (i > 0) result += ", ";
        result += to_string(type->type_args[i]);
      }
      result += ">";
      return result;
    }
  }
  return "<unknown>";
}

// ============================================================================
// Arithmetic
// ============================================================================

const Type * common_numeric_type(TypeContext & types, const Type * lhs, const Type * rhs)
{
  if (!lhs || !rhs || !lhs->is_numeric() || !rhs->is_numeric()) return nullptr;
  if (lhs->is_float() || rhs->is_float()) return types.float_type();
  return types.int_type();
}

bool contains_type_param(const Type * type)
{
  if (!type) return false;
  switch (type->kind) {
    case TypeKind::TypeParam:
      return true;
    case TypeKind::Pointer:
    case TypeKind::Array:
    case TypeKind::DynamicArray:
      return contains_type_param(type->element_type);
    case TypeKind::Generic:
      for (const Type * arg : type->type_args) {
        if (contains_type_param(arg)) return true;
      }
      return false;
    default:
      return false;
  }
}

}  // namespace rapter
