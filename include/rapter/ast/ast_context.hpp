// rapter/ast/ast_context.hpp - AST arena allocator and string pool
//
// AstContext owns all AST nodes and interned strings of one module.
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace rapter
{

class AstNode;

// ============================================================================
// AstContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Context that owns all AST nodes and interned strings.
 *
 * Nodes are valid as long as the context is alive; nothing is freed
 * individually. Nodes must therefore be trivially destructible.
 *
 * @code
 *   AstContext ctx;
 *   auto * lit = ctx.create<IntLiteralExpr>(42);
 *   std::string_view name = ctx.intern("foo");
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~AstContext() = default;

  // PMR resources are not movable
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a new AST node of type T in the arena.
   *
   *   auto * bin = ctx.create<BinaryExpr>(lhs, BinaryOp::Add, rhs, range);
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST nodes live in the arena and must be trivially destructible; "
      "use std::string_view and gsl::span instead of owning containers.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /// Intern a string; equal strings share the same storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (auto it = stringPool_.find(s); it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /// Copy a vector into arena storage and return a span over the copy.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> stringPool_;
};

}  // namespace rapter
