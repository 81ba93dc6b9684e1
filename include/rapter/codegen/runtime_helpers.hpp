// rapter/codegen/runtime_helpers.hpp - C runtime support emitted into every unit
//
#pragma once

#include <string_view>

namespace rapter::runtime
{

/// `#include` lines every generated unit starts with.
[[nodiscard]] std::string_view headers();

/// Growable-array structs for int, double, char and char* elements.
[[nodiscard]] std::string_view primitive_dynamic_arrays();

/**
 * Static helper functions used by the lowering of string methods, string
 * concatenation, `pop`, file I/O and command-line access.
 *
 * Requires the primitive growable-array structs to be declared first.
 */
[[nodiscard]] std::string_view helper_functions();

}  // namespace rapter::runtime
