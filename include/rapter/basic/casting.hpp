// rapter/basic/casting.hpp - LLVM-style isa/cast/dyn_cast
//
// Works with any hierarchy whose classes provide `static bool classof(const Base *)`.
// The AST uses it for node dispatch:
//
//   if (auto * call = dyn_cast<CallExpr>(expr)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace rapter
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True when `node` is non-null and of dynamic kind T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::HasClassof<T, From>::value, "Target type must have a classof() method");
  return node != nullptr && T::classof(node);
}

/// Checked downcast. The caller guarantees the kind.
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of the wrong kind");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of the wrong kind");
  return static_cast<const T *>(node);
}

/// Downcast returning nullptr when the kind does not match (or node is null).
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node)) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace rapter
