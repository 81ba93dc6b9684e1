// rapter/codegen/name_mangler.cpp - C spellings of Rapter types
//
#include "rapter/codegen/name_mangler.hpp"

#include <cctype>

#include "rapter/basic/diagnostic.hpp"
#include "rapter/sema/types/type_utils.hpp"

namespace rapter
{

namespace
{

[[noreturn]] void unresolved(const Type * type)
{
  throw CompileError(
    ErrorKind::InternalError, SourceRange{},
    "type parameter `" + std::string(type->name) + "` reached code generation");
}

std::string upper(std::string_view text)
{
  std::string out(text);
  for (char & c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

std::string lower(std::string_view text)
{
  std::string out(text);
  for (char & c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

}  // namespace

std::string mangle(const Type * type)
{
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
      return "ptr_" + mangle(type->element_type);
    case TypeKind::Array:
      return "arr_" + mangle(type->element_type);
    case TypeKind::DynamicArray:
      return "vec_" + mangle(type->element_type);
    case TypeKind::Struct:
    case TypeKind::Enum:
      if (type->is_string()) return "string";
      return std::string(unqualified_name(type->name));
    case TypeKind::Generic: {
      std::string out(type->name);
      for (const Type * arg : type->type_args) {
        out += '_';
        out += mangle(arg);
      }
      return out;
    }
    case TypeKind::TypeParam:
      unresolved(type);
  }
  return {};
}

bool is_primitive_dynamic_array(const Type * element)
{
  switch (element->kind) {
    case TypeKind::Int:
    case TypeKind::Bool:
    case TypeKind::Float:
    case TypeKind::Char:
    case TypeKind::String:
      return true;
    default:
      return element->is_string();
  }
}

std::string dynamic_array_name(const Type * element)
{
  switch (element->kind) {
    case TypeKind::Int:
    case TypeKind::Bool:
      return "DynamicArray_int";
    case TypeKind::Float:
      return "DynamicArray_double";
    case TypeKind::Char:
      return "DynamicArray_char";
    default:
      if (element->is_string()) return "DynamicArray_charptr";
      return "DynamicArray_" + mangle(element);
  }
}

std::string c_type(const Type * type)
{
  switch (type->kind) {
    case TypeKind::Int:
    case TypeKind::Bool:
      return "int";
    case TypeKind::Float:
      return "double";
    case TypeKind::Char:
      return "char";
    case TypeKind::String:
      return "char*";
    case TypeKind::Void:
      return "void";
    case TypeKind::Pointer:
    case TypeKind::Array:
      return c_type(type->element_type) + "*";
    case TypeKind::DynamicArray:
      return dynamic_array_name(type->element_type);
    case TypeKind::Struct:
    case TypeKind::Enum:
      if (type->is_string()) return "char*";
      return std::string(unqualified_name(type->name));
    case TypeKind::Generic:
      return mangle(type);
    case TypeKind::TypeParam:
      unresolved(type);
  }
  return {};
}

std::string enum_constant(std::string_view enum_name, std::string_view variant)
{
  return upper(unqualified_name(enum_name)) + "_" + upper(variant);
}

std::string variant_tag(const Type * generic, std::string_view variant)
{
  return mangle(generic) + "_" + std::string(variant);
}

std::string variant_field(std::string_view variant)
{
  return lower(variant) + "_value";
}

std::string variant_macro(const Type * generic, std::string_view variant)
{
  return mangle(generic) + "_" + upper(variant);
}

}  // namespace rapter
