// rapter/sema/resolution/type_environment.hpp - Scoped symbols and layout tables
//
// The checker owns one TypeEnvironment per compilation. Scopes are pushed on
// entry to a function body and to every block, and popped on exit.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "rapter/ast/ast.hpp"
#include "rapter/sema/types/type.hpp"

namespace rapter
{

// ============================================================================
// Symbol Types
// ============================================================================

enum class SymbolRole : uint8_t {
  Function,
  ExternFunction,
  Struct,
  Enum,
  Variable,
  Parameter,
  Module,  ///< import alias
};

[[nodiscard]] std::string_view to_string(SymbolRole role);

struct Symbol
{
  std::string_view name;
  SymbolRole role = SymbolRole::Variable;
  const Type * type = nullptr;
  bool isMutable = false;
  SourceRange definitionRange;

  /// Declaring node (nullptr for synthesized symbols)
  const AstNode * decl = nullptr;

  [[nodiscard]] bool is_callable() const noexcept
  {
    return role == SymbolRole::Function || role == SymbolRole::ExternFunction;
  }

  [[nodiscard]] bool is_value() const noexcept
  {
    return role == SymbolRole::Variable || role == SymbolRole::Parameter;
  }

  [[nodiscard]] bool is_type() const noexcept
  {
    return role == SymbolRole::Struct || role == SymbolRole::Enum;
  }
};

/// Callable signature recorded for argument checking.
struct FunctionSignature
{
  std::vector<const Type *> params;
  const Type * returnType = nullptr;
  bool isVariadic = false;
  bool isExtern = false;
};

/// Ordered field list of a struct.
struct StructLayout
{
  std::string_view name;
  std::vector<std::pair<std::string_view, const Type *>> fields;

  [[nodiscard]] const Type * field_type(std::string_view field) const
  {
    for (const auto & [n, t] : fields) {
      if (n == field) return t;
    }
    return nullptr;
  }
};

/// Ordered variant list of an enum with resolved discriminants.
struct EnumLayout
{
  std::string_view name;
  std::vector<std::pair<std::string_view, int64_t>> variants;

  [[nodiscard]] std::optional<int64_t> discriminant(std::string_view variant) const
  {
    for (const auto & [n, v] : variants) {
      if (n == variant) return v;
    }
    return std::nullopt;
  }
};

// ============================================================================
// TypeEnvironment
// ============================================================================

/**
 * Stack of lexical scopes plus whole-program layout tables.
 *
 * The outermost scope holds module-level items (functions, types, globals and
 * imported symbols); lookups walk from the innermost scope outward, so inner
 * definitions shadow outer ones. Redefinition within one scope is rejected.
 */
class TypeEnvironment
{
public:
  TypeEnvironment();

  TypeEnvironment(const TypeEnvironment &) = delete;
  TypeEnvironment & operator=(const TypeEnvironment &) = delete;

  // ===========================================================================
  // Scopes
  // ===========================================================================

  void push_scope();
  void pop_scope();

  [[nodiscard]] size_t depth() const noexcept { return scopes_.size(); }

  /// RAII scope guard
  class ScopeGuard
  {
  public:
    explicit ScopeGuard(TypeEnvironment & env) : env_(env) { env_.push_scope(); }
    ~ScopeGuard() { env_.pop_scope(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard & operator=(const ScopeGuard &) = delete;

  private:
    TypeEnvironment & env_;
  };

  // ===========================================================================
  // Symbols
  // ===========================================================================

  /**
   * Define a symbol in the innermost scope.
   *
   * @return false if the name already exists in that scope
   */
  bool define(Symbol symbol);

  /// Define in the outermost (module) scope.
  bool define_global(Symbol symbol);

  [[nodiscard]] const Symbol * lookup(std::string_view name) const;
  [[nodiscard]] const Symbol * lookup_local(std::string_view name) const;
  [[nodiscard]] const Symbol * lookup_global(std::string_view name) const;

  // ===========================================================================
  // Layout Tables
  // ===========================================================================

  void define_struct(std::string_view key, StructLayout layout);
  void define_enum(std::string_view key, EnumLayout layout);
  void define_function(std::string_view key, FunctionSignature sig);

  [[nodiscard]] const StructLayout * find_struct(std::string_view key) const;
  [[nodiscard]] const EnumLayout * find_enum(std::string_view key) const;
  [[nodiscard]] const FunctionSignature * find_function(std::string_view key) const;

  /// `alias.name`, stored with the environment's lifetime.
  [[nodiscard]] std::string_view qualify(std::string_view alias, std::string_view name);

  /// Copy a transient string into environment-owned storage.
  [[nodiscard]] std::string_view intern(std::string_view s);

private:
  using ScopeMap = std::unordered_map<std::string_view, Symbol>;

  std::vector<ScopeMap> scopes_;
  std::unordered_map<std::string_view, StructLayout> structs_;
  std::unordered_map<std::string_view, EnumLayout> enums_;
  std::unordered_map<std::string_view, FunctionSignature> functions_;
  // node-based: element addresses are stable
  std::unordered_set<std::string> names_;
};

}  // namespace rapter
