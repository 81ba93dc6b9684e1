// rapter/codegen/name_mangler.hpp - C spellings of Rapter types
//
// Mapping from checked types to C type names and to the mangled identifiers
// used for generic instantiations and growable arrays. Both are
// deterministic and context-free: the same type always yields the same text.
//
#pragma once

#include <string>
#include <string_view>

#include "rapter/sema/types/type.hpp"

namespace rapter
{

/**
 * Mangled identifier of a type.
 *
 * `int float bool char string`, `ptr_X`, `arr_X`, `vec_X`, `Family_a_b`;
 * struct and enum names use their last segment.
 *
 * @throws CompileError (E500) for an unresolved type parameter
 */
[[nodiscard]] std::string mangle(const Type * type);

/**
 * C type spelling of a type.
 *
 * `float` lowers to `double`, `bool` to `int`, `string` to `char*`, arrays
 * and pointers to `T*`, growable arrays to `DynamicArray_<suffix>`, and
 * generics to their mangled name.
 *
 * @throws CompileError (E500) for an unresolved type parameter
 */
[[nodiscard]] std::string c_type(const Type * type);

/// Name of the growable-array struct holding `element` values.
[[nodiscard]] std::string dynamic_array_name(const Type * element);

/// True when DynamicArray[element] maps to one of the fixed helper types.
[[nodiscard]] bool is_primitive_dynamic_array(const Type * element);

/// C enumerator of a user enum variant (`COLOR_RED`).
[[nodiscard]] std::string enum_constant(std::string_view enum_name, std::string_view variant);

/// Tag enumerator of a generic variant (`Option_int_Some`).
[[nodiscard]] std::string variant_tag(const Type * generic, std::string_view variant);

/// Union member holding a variant payload (`some_value`).
[[nodiscard]] std::string variant_field(std::string_view variant);

/// Constructor macro of a payload-free variant (`Option_int_NONE`).
[[nodiscard]] std::string variant_macro(const Type * generic, std::string_view variant);

}  // namespace rapter
