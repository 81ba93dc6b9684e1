// rapter/sema/types/intrinsics.hpp - C library functions callable without a declaration
//
#pragma once

#include <string_view>

namespace rapter
{

/**
 * True when `name` is a C standard library function that programs may call
 * without an `extern fn` declaration (malloc, strlen, printf, sqrt...).
 *
 * Calls to intrinsics type as `int` unless an extern declaration with the
 * same name is in scope. The code generator never emits prototypes for them
 * since the standard headers already declare them.
 */
[[nodiscard]] bool is_intrinsic(std::string_view name) noexcept;

/**
 * True when `name` is one of the runtime helpers emitted into every
 * translation unit (rapter_concat, rapter_read_all...).
 */
[[nodiscard]] bool is_runtime_helper(std::string_view name) noexcept;

}  // namespace rapter
