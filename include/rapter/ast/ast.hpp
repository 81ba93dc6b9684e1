// rapter/ast/ast.hpp - AST node class definitions for Rapter
//
// This header contains all AST node class definitions following the
// LLVM/Clang style with classof() for RTTI support.
//
// Type annotations are stored as resolved `const Type *` values created by the
// parser through the compilation's TypeContext; name validation of struct and
// enum references happens in the checker.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "rapter/ast/ast_enums.hpp"
#include "rapter/basic/casting.hpp"
#include "rapter/basic/source_manager.hpp"

namespace rapter
{

struct Type;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has a NodeKind for RTTI and a SourceRange. Nodes are
 * non-copyable and owned by an AstContext arena.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

class Expr : public AstNode
{
public:
  /// Type computed by the checker (nullptr before checking)
  const Type * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;
  std::string_view spelling;  ///< source text, reused when emitting C

  FloatLiteralExpr(double v, std::string_view text, SourceRange r = {})
  : NodeBase(r), value(v), spelling(text)
  {
  }
};

class CharLiteralExpr : public NodeBase<CharLiteralExpr, Expr, NodeKind::CharLiteral>
{
public:
  char value;

  explicit CharLiteralExpr(char v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// String literal; `value` holds the unescaped contents.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class VarRefExpr : public NodeBase<VarRefExpr, Expr, NodeKind::VarRef>
{
public:
  std::string_view name;

  explicit VarRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/**
 * Call expression.
 *
 * The callee is a VarRefExpr (`f(x)`), a FieldAccessExpr (`m.f(x)` or
 * `s.length()`) or an EnumAccessExpr (`Option::Some(x)`). The checker decides
 * which shape applies and records it in `callKind`.
 */
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  CallKind callKind = CallKind::Unresolved;
  BuiltinMethod method = BuiltinMethod::None;
  /// Name of the called C function for Function/ModuleFunction/Intrinsic calls.
  std::string_view targetName;

  CallExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

/// Member access `base.field`, or `base->field` when isArrow is set.
class FieldAccessExpr : public NodeBase<FieldAccessExpr, Expr, NodeKind::FieldAccess>
{
public:
  Expr * base;
  std::string_view field;
  bool isArrow = false;

  FieldAccessExpr(Expr * b, std::string_view f, bool arrow, SourceRange r = {})
  : NodeBase(r), base(b), field(f), isArrow(arrow)
  {
  }
};

class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::Index>
{
public:
  Expr * base;
  Expr * index;

  IndexExpr(Expr * b, Expr * i, SourceRange r = {}) : NodeBase(r), base(b), index(i) {}
};

/// `Enum::Variant` reference (a user enum constant or a builtin generic variant).
class EnumAccessExpr : public NodeBase<EnumAccessExpr, Expr, NodeKind::EnumAccess>
{
public:
  std::string_view enumName;
  std::string_view variant;

  EnumAccessExpr(std::string_view e, std::string_view v, SourceRange r = {})
  : NodeBase(r), enumName(e), variant(v)
  {
  }
};

class FieldInit : public NodeBase<FieldInit, AstNode, NodeKind::FieldInit>
{
public:
  std::string_view name;
  Expr * value;

  FieldInit(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

/// `Name { field: value, ... }`
class StructLiteralExpr : public NodeBase<StructLiteralExpr, Expr, NodeKind::StructLiteral>
{
public:
  std::string_view typeName;
  gsl::span<FieldInit *> fields;

  StructLiteralExpr(std::string_view n, gsl::span<FieldInit *> f, SourceRange r = {})
  : NodeBase(r), typeName(n), fields(f)
  {
  }
};

class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

/**
 * Heap allocation.
 *
 * - `new T`: uninitialised allocation of a named or builtin type
 * - `new expr`: allocation initialised with a value (`new Point { x: 1, y: 2 }`)
 * - `new [T]()`: empty growable array (not a pointer)
 */
class NewExpr : public NodeBase<NewExpr, Expr, NodeKind::New>
{
public:
  const Type * allocType = nullptr;  ///< `new T` and `new [T]()` forms
  Expr * initializer = nullptr;      ///< `new expr` form
  bool isGrowableArray = false;

  NewExpr(const Type * t, bool growable, SourceRange r = {})
  : NodeBase(r), allocType(t), isGrowableArray(growable)
  {
  }

  explicit NewExpr(Expr * init, SourceRange r = {}) : NodeBase(r), initializer(init) {}
};

class DeleteExpr : public NodeBase<DeleteExpr, Expr, NodeKind::Delete>
{
public:
  Expr * operand;

  explicit DeleteExpr(Expr * e, SourceRange r = {}) : NodeBase(r), operand(e) {}
};

class CastExpr : public NodeBase<CastExpr, Expr, NodeKind::Cast>
{
public:
  Expr * expr;
  const Type * targetType;

  CastExpr(Expr * e, const Type * t, SourceRange r = {}) : NodeBase(r), expr(e), targetType(t) {}
};

class TernaryExpr : public NodeBase<TernaryExpr, Expr, NodeKind::Ternary>
{
public:
  Expr * condition;
  Expr * thenExpr;
  Expr * elseExpr;

  TernaryExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenExpr(t), elseExpr(e)
  {
  }
};

/// `start..end`, only meaningful as a `for` iterable.
class RangeExpr : public NodeBase<RangeExpr, Expr, NodeKind::Range>
{
public:
  Expr * start;
  Expr * end;

  RangeExpr(Expr * s, Expr * e, SourceRange r = {}) : NodeBase(r), start(s), end(e) {}
};

class MatchPattern : public NodeBase<MatchPattern, AstNode, NodeKind::Pattern>
{
public:
  PatternKind patternKind;
  std::string_view enumName;  ///< Variant patterns
  std::string_view variant;   ///< Variant patterns
  std::string_view binding;   ///< Variant patterns with a payload binding; empty otherwise
  Expr * literal = nullptr;   ///< Literal patterns

  explicit MatchPattern(PatternKind k, SourceRange r = {}) : NodeBase(r), patternKind(k) {}

  [[nodiscard]] bool has_binding() const noexcept { return !binding.empty(); }
};

class MatchArm : public NodeBase<MatchArm, AstNode, NodeKind::MatchArm>
{
public:
  MatchPattern * pattern;
  Expr * body;

  MatchArm(MatchPattern * p, Expr * b, SourceRange r = {}) : NodeBase(r), pattern(p), body(b) {}
};

class MatchExpr : public NodeBase<MatchExpr, Expr, NodeKind::Match>
{
public:
  Expr * scrutinee;
  gsl::span<MatchArm *> arms;

  MatchExpr(Expr * s, gsl::span<MatchArm *> a, SourceRange r = {})
  : NodeBase(r), scrutinee(s), arms(a)
  {
  }
};

/// Error propagation `expr?`.
class TryExpr : public NodeBase<TryExpr, Expr, NodeKind::Try>
{
public:
  Expr * operand;
  /// Declared return type of the enclosing function (set by the checker)
  const Type * functionReturnType = nullptr;

  explicit TryExpr(Expr * e, SourceRange r = {}) : NodeBase(r), operand(e) {}
};

/// Parser recovery placeholder.
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `let [mut] x[: T] [= e];` or `const x: T = e;`
class LetStmt : public NodeBase<LetStmt, Stmt, NodeKind::Let>
{
public:
  std::string_view name;
  const Type * declaredType = nullptr;  ///< nullptr when inferred
  SourceRange typeRange;
  Expr * initializer = nullptr;
  bool isMutable = false;
  bool isConst = false;

  /// Final variable type (set by the checker)
  const Type * varType = nullptr;

  explicit LetStmt(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::Assign>
{
public:
  Expr * target;
  Expr * value;

  AssignStmt(Expr * t, Expr * v, SourceRange r = {}) : NodeBase(r), target(t), value(v) {}
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::Return>
{
public:
  Expr * value = nullptr;

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::Break>
{
public:
  explicit BreakStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::Continue>
{
public:
  explicit ContinueStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// `if` statement; `else if` chains nest a single IfStmt in elseBody.
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::If>
{
public:
  Expr * condition;
  gsl::span<Stmt *> thenBody;
  gsl::span<Stmt *> elseBody;
  bool hasElse = false;

  explicit IfStmt(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::While>
{
public:
  Expr * condition;
  gsl::span<Stmt *> body;

  WhileStmt(Expr * c, gsl::span<Stmt *> b, SourceRange r = {})
  : NodeBase(r), condition(c), body(b)
  {
  }
};

class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::For>
{
public:
  std::string_view varName;
  Expr * iterable;
  gsl::span<Stmt *> body;

  /// Loop variable type (set by the checker)
  const Type * elementType = nullptr;

  ForStmt(std::string_view v, Expr * it, gsl::span<Stmt *> b, SourceRange r = {})
  : NodeBase(r), varName(v), iterable(it), body(b)
  {
  }
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// `import a.b [as alias];`
class ImportDecl : public NodeBase<ImportDecl, Decl, NodeKind::Import>
{
public:
  std::string_view modulePath;  ///< dotted path, e.g. "utils.math"
  std::string_view alias;       ///< explicit alias, empty when absent

  ImportDecl(std::string_view p, std::string_view a, SourceRange r = {})
  : NodeBase(r), modulePath(p), alias(a)
  {
  }

  /// Alias used for qualified access (explicit alias or last path segment).
  [[nodiscard]] std::string_view effective_alias() const noexcept
  {
    if (!alias.empty()) return alias;
    const auto dot = modulePath.rfind('.');
    return dot == std::string_view::npos ? modulePath : modulePath.substr(dot + 1);
  }
};

/// An exported item name (`export fn f`, `export struct S`, or `export name;`).
class ExportDecl : public NodeBase<ExportDecl, Decl, NodeKind::Export>
{
public:
  std::string_view name;

  explicit ExportDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class ParamDecl : public NodeBase<ParamDecl, AstNode, NodeKind::Param>
{
public:
  std::string_view name;
  const Type * type;
  SourceRange typeRange;

  ParamDecl(std::string_view n, const Type * t, SourceRange r = {})
  : NodeBase(r), name(n), type(t)
  {
  }
};

class ExternFunctionDecl : public NodeBase<ExternFunctionDecl, Decl, NodeKind::ExternFunction>
{
public:
  std::string_view name;
  gsl::span<ParamDecl *> params;
  const Type * returnType = nullptr;  ///< Void when omitted
  bool isVariadic = false;

  explicit ExternFunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::Function>
{
public:
  std::string_view name;
  gsl::span<ParamDecl *> params;
  const Type * returnType = nullptr;  ///< Void when omitted
  SourceRange returnTypeRange;
  gsl::span<Stmt *> body;
  bool isExported = false;

  explicit FunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class FieldDecl : public NodeBase<FieldDecl, AstNode, NodeKind::Field>
{
public:
  std::string_view name;
  const Type * type;
  SourceRange typeRange;

  FieldDecl(std::string_view n, const Type * t, SourceRange r = {})
  : NodeBase(r), name(n), type(t)
  {
  }
};

class StructDecl : public NodeBase<StructDecl, Decl, NodeKind::Struct>
{
public:
  std::string_view name;
  gsl::span<FieldDecl *> fields;
  bool isExported = false;

  explicit StructDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class EnumVariantDecl : public NodeBase<EnumVariantDecl, AstNode, NodeKind::EnumVariant>
{
public:
  std::string_view name;
  bool hasValue = false;
  int64_t value = 0;

  explicit EnumVariantDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class EnumDecl : public NodeBase<EnumDecl, Decl, NodeKind::Enum>
{
public:
  std::string_view name;
  gsl::span<EnumVariantDecl *> variants;
  bool isExported = false;

  explicit EnumDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Top-level `let [mut]` / `const`.
class GlobalVarDecl : public NodeBase<GlobalVarDecl, Decl, NodeKind::GlobalVar>
{
public:
  std::string_view name;
  const Type * declaredType = nullptr;
  SourceRange typeRange;
  Expr * initializer = nullptr;
  bool isMutable = false;
  bool isConst = false;

  /// Final variable type (set by the checker)
  const Type * varType = nullptr;

  explicit GlobalVarDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<ImportDecl *> imports;
  gsl::span<ExportDecl *> exports;
  gsl::span<ExternFunctionDecl *> externFunctions;
  gsl::span<FunctionDecl *> functions;
  gsl::span<StructDecl *> structs;
  gsl::span<EnumDecl *> enums;
  gsl::span<GlobalVarDecl *> globals;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace rapter
