// rapter/codegen/instantiation_collector.hpp - Generic instantiation discovery
//
#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "rapter/ast/ast.hpp"
#include "rapter/sema/resolution/module_graph.hpp"
#include "rapter/sema/types/type.hpp"

namespace rapter
{

/**
 * Collects every distinct generic instantiation and growable-array type a
 * checked program uses.
 *
 * Types are found in signatures, struct fields, globals, locals, loop
 * variables and every checked expression type, including types nested inside
 * other types. The result lists each type after the types it is built from,
 * so `Option<Option<int>>` follows `Option<int>`.
 *
 * Growable arrays of the primitive element types are not listed; the
 * generator emits those helper structs unconditionally.
 */
class InstantiationCollector
{
public:
  InstantiationCollector() = default;

  /// Walk every module of the graph.
  void collect(const ModuleGraph & graph);

  /// Walk one checked program.
  void collect(const Program & program);

  /// Record a type and everything nested in it.
  void add(const Type * type);

  /// Generic and growable-array types, dependencies first.
  [[nodiscard]] const std::vector<const Type *> & types() const noexcept { return types_; }

private:
  std::vector<const Type *> types_;
  std::unordered_set<std::string> seen_;  // by mangled name
};

}  // namespace rapter
