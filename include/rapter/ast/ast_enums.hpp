// rapter/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and the resolved-operation tags the checker attaches
// to call nodes.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace rapter
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "rapter/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "rapter/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "rapter/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "rapter/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "rapter/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical
  And,  ///< &&
  Or,   ///< ||
};

enum class UnaryOp : uint8_t {
  Neg,        ///< -
  Not,        ///< !
  Deref,      ///< *
  AddressOf,  ///< &
};

[[nodiscard]] constexpr bool is_arithmetic(BinaryOp op) noexcept
{
  return op == BinaryOp::Add || op == BinaryOp::Sub || op == BinaryOp::Mul ||
         op == BinaryOp::Div || op == BinaryOp::Mod;
}

[[nodiscard]] constexpr bool is_comparison(BinaryOp op) noexcept
{
  return op == BinaryOp::Eq || op == BinaryOp::Ne || op == BinaryOp::Lt || op == BinaryOp::Le ||
         op == BinaryOp::Gt || op == BinaryOp::Ge;
}

// ============================================================================
// Resolved call shapes
// ============================================================================

/// How the checker resolved a call expression.
enum class CallKind : uint8_t {
  Unresolved,
  Function,        ///< user function or declared extern
  Intrinsic,       ///< C library function from the allowlist
  Print,           ///< print(x)
  Println,         ///< println([x])
  Len,             ///< len(s)
  Method,          ///< receiver.method(...) on a builtin type
  ModuleFunction,  ///< alias.function(...)
  VariantCtor,     ///< Option::Some(x), Result::Err(e)
};

/**
 * Built-in method resolved from a receiver capability.
 * Set on the call node by the checker and consumed by the C generator.
 */
enum class BuiltinMethod : uint8_t {
  None,
  StringLength,
  StringSubstring,
  StringContains,
  StringTrim,
  StringSplit,
  ArrayPush,
  ArrayPop,
  ArrayLength,
};

/// Pattern forms accepted in match arms.
enum class PatternKind : uint8_t {
  Wildcard,  ///< _
  Variant,   ///< Enum::Variant or Enum::Variant(binding)
  Literal,   ///< 42, 'a', "s", true
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Deref:
      return "*";
    case UnaryOp::AddressOf:
      return "&";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BuiltinMethod m) noexcept
{
  switch (m) {
    case BuiltinMethod::None:
      return "none";
    case BuiltinMethod::StringLength:
    case BuiltinMethod::ArrayLength:
      return "length";
    case BuiltinMethod::StringSubstring:
      return "substring";
    case BuiltinMethod::StringContains:
      return "contains";
    case BuiltinMethod::StringTrim:
      return "trim";
    case BuiltinMethod::StringSplit:
      return "split";
    case BuiltinMethod::ArrayPush:
      return "push";
    case BuiltinMethod::ArrayPop:
      return "pop";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::IntLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::MissingExpr;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Let;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::For;

inline constexpr NodeKind k_first_decl_kind = NodeKind::Import;
inline constexpr NodeKind k_last_decl_kind = NodeKind::GlobalVar;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace rapter
