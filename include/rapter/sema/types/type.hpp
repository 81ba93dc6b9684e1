// rapter/sema/types/type.hpp - Semantic type representation
//
// Types are interned by TypeContext: two structurally equal types are the
// same pointer, so identity comparison is structural equality.
//
#pragma once

#include <cstdint>
#include <deque>
#include <gsl/span>
#include <memory_resource>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rapter
{

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  // Primitive types
  Int,
  Float,
  Bool,
  Char,
  String,
  Void,

  // Composite types
  Pointer,       ///< *T
  Array,         ///< [T]
  DynamicArray,  ///< DynamicArray[T]

  // Named types
  Struct,  ///< product type (or any unresolved `Name` annotation)
  Enum,    ///< sum type referenced via `Name::Variant`

  // Parametric
  Generic,    ///< Option<T>, Result<T, E>
  TypeParam,  ///< unresolved placeholder; never valid in lowering
};

// ============================================================================
// Type
// ============================================================================

struct Type
{
  TypeKind kind;

  /// Pointer/Array/DynamicArray: pointee or element type
  const Type * element_type = nullptr;

  /// Struct/Enum/Generic/TypeParam: name (possibly qualified, `mod.Name`)
  std::string_view name;

  /// Generic: type arguments in declaration order
  gsl::span<const Type * const> type_args;

  [[nodiscard]] bool is_int() const noexcept { return kind == TypeKind::Int; }
  [[nodiscard]] bool is_float() const noexcept { return kind == TypeKind::Float; }
  [[nodiscard]] bool is_numeric() const noexcept { return is_int() || is_float(); }
  [[nodiscard]] bool is_bool() const noexcept { return kind == TypeKind::Bool; }
  [[nodiscard]] bool is_char() const noexcept { return kind == TypeKind::Char; }
  [[nodiscard]] bool is_void() const noexcept { return kind == TypeKind::Void; }
  [[nodiscard]] bool is_pointer() const noexcept { return kind == TypeKind::Pointer; }
  [[nodiscard]] bool is_generic() const noexcept { return kind == TypeKind::Generic; }

  /// String proper, or the `str` struct alias
  [[nodiscard]] bool is_string() const noexcept
  {
    return kind == TypeKind::String || (kind == TypeKind::Struct && name == "str");
  }

  /// Fixed or growable array
  [[nodiscard]] bool is_array_like() const noexcept
  {
    return kind == TypeKind::Array || kind == TypeKind::DynamicArray;
  }

  /// Struct or Enum: a user type referenced by name
  [[nodiscard]] bool is_named() const noexcept
  {
    return kind == TypeKind::Struct || kind == TypeKind::Enum;
  }

  /// Generic instantiation of the given family
  [[nodiscard]] bool is_generic_of(std::string_view family) const noexcept
  {
    return kind == TypeKind::Generic && name == family;
  }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Interning factory for semantic types.
 *
 * One TypeContext is shared by every module of a compilation, so types built
 * while parsing different files compare by pointer.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * int_type() const noexcept { return &int_; }
  [[nodiscard]] const Type * float_type() const noexcept { return &float_; }
  [[nodiscard]] const Type * bool_type() const noexcept { return &bool_; }
  [[nodiscard]] const Type * char_type() const noexcept { return &char_; }
  [[nodiscard]] const Type * string_type() const noexcept { return &string_; }
  [[nodiscard]] const Type * void_type() const noexcept { return &void_; }

  // ===========================================================================
  // Composite Type Creation (Interned)
  // ===========================================================================

  const Type * get_pointer_type(const Type * pointee);
  const Type * get_array_type(const Type * element_type);
  const Type * get_dynamic_array_type(const Type * element_type);
  const Type * get_struct_type(std::string_view name);
  const Type * get_enum_type(std::string_view name);
  const Type * get_generic_type(std::string_view family, const std::vector<const Type *> & args);
  const Type * get_type_param(std::string_view name);

  /// Look up a primitive by its source spelling (`int`, `string`...), nullptr otherwise.
  [[nodiscard]] const Type * lookup_builtin(std::string_view name) const;

  [[nodiscard]] size_t composite_count() const noexcept { return composite_types_.size(); }

private:
  const Type * intern(const Type & candidate);
  std::string_view intern_name(std::string_view name);

  Type int_, float_, bool_, char_, string_, void_;

  // Arena for composite types, names and generic argument lists
  std::pmr::monotonic_buffer_resource arena_{4096};
  // Interned types are referenced everywhere; the deque keeps addresses stable.
  std::pmr::deque<Type> composite_types_{&arena_};
  std::pmr::unordered_set<std::string_view> names_{&arena_};
};

}  // namespace rapter
