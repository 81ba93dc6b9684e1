// rapter/sema/types/type_utils.hpp - Shared type utilities
//
// Compatibility, rendering and numeric promotion helpers used by the checker
// and the code generator.
//
#pragma once

#include <string>
#include <string_view>

#include "rapter/sema/types/type.hpp"

namespace rapter
{

// ============================================================================
// Type Compatibility
// ============================================================================

/**
 * Check whether two types may be used interchangeably.
 *
 * The relation is reflexive and symmetric but NOT transitive. Rules, in order:
 * - identical types
 * - Struct(n) vs Enum(n): the parser cannot tell a struct name from an enum name
 * - String vs Struct("str")
 * - Pointer/Array/DynamicArray pairs descend into their element types
 * - Struct("m.n") vs Struct("n"): exactly one side module-qualified
 *
 * Generic instantiations are compatible only when identical (interning makes
 * that a pointer comparison).
 */
[[nodiscard]] bool compatible(const Type * a, const Type * b);

/**
 * Render a type in source syntax.
 *
 * @return e.g. "int", "*int", "[string]", "DynamicArray[int]", "Option<int>"
 */
[[nodiscard]] std::string to_string(const Type * type);

// ============================================================================
// Arithmetic
// ============================================================================

/**
 * Result type of an arithmetic operator on two numeric operands.
 *
 * int op int yields int; any float operand promotes the result to float.
 *
 * @return nullptr when either operand is not numeric
 */
[[nodiscard]] const Type * common_numeric_type(
  TypeContext & types, const Type * lhs, const Type * rhs);

// ============================================================================
// Names
// ============================================================================

/// True when `name` carries a module qualifier (`mod.Name`).
[[nodiscard]] bool is_qualified_name(std::string_view name) noexcept;

/// Last segment of a qualified name (`a.b.Name` -> `Name`).
[[nodiscard]] std::string_view unqualified_name(std::string_view name) noexcept;

/// True when the type (or any type nested inside it) is a TypeParam.
[[nodiscard]] bool contains_type_param(const Type * type);

}  // namespace rapter
