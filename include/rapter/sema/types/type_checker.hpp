// rapter/sema/types/type_checker.hpp - Type inference and checking
//
// Fail-fast checking pass that annotates every expression with its resolved
// type and resolves calls to their concrete shape for the code generator.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "rapter/ast/ast.hpp"
#include "rapter/basic/diagnostic.hpp"
#include "rapter/sema/resolution/module_graph.hpp"
#include "rapter/sema/resolution/type_environment.hpp"
#include "rapter/sema/types/type.hpp"

namespace rapter
{

/**
 * Type checker for Rapter modules.
 *
 * ## Algorithm
 *
 * 1. **Declarations**: imported items, extern functions, functions, structs,
 *    enums and globals of a module are entered into the outermost scope and
 *    the layout tables before any body is looked at.
 *
 * 2. **Bottom-up inference**: every expression gets a type computed from its
 *    operands (`check_expr`).
 *
 * 3. **Expected-type hints**: where a type is already known (typed `let`,
 *    `return`, call arguments, struct fields) `check_expr_with_expected`
 *    resolves `Option::None` and `Result::Ok(v)` to exactly that
 *    instantiation instead of deriving one from the payload.
 *
 * Checking stops at the first violation by throwing CompileError.
 *
 * ## Usage
 * ```cpp
 * TypeChecker checker(graph);
 * checker.check_all();  // throws CompileError
 * // After this, all Expr::resolvedType fields are set
 * ```
 */
class TypeChecker
{
public:
  explicit TypeChecker(ModuleGraph & graph);

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /// Check every module reachable from the entry, imports first.
  void check_all();

  /**
   * Check one module.
   *
   * The module's imports must already be resolved in the graph.
   */
  void check_module(ModuleInfo & module);

private:
  // ===========================================================================
  // Declarations
  // ===========================================================================

  void declare_imports(const ModuleInfo & module);
  void declare_module_items(const Program & program);
  void define_or_fail(const Symbol & symbol);

  /// Bind an imported item under `alias.name` and, unless shadowed, its plain name.
  void import_symbol(const Symbol & symbol, const ImportEdge & edge);

  /// True when the current module itself declares `name` at top level.
  [[nodiscard]] bool defines_locally(std::string_view name) const;

  void check_global(GlobalVarDecl * decl);
  void check_function(FunctionDecl * decl);

  /// Reject unknown struct/enum names and malformed generic instantiations.
  void validate_type(const Type * type, SourceRange range);

  [[nodiscard]] StructLayout make_struct_layout(const StructDecl & decl) const;
  [[nodiscard]] static EnumLayout make_enum_layout(const EnumDecl & decl);

  // ===========================================================================
  // Statements
  // ===========================================================================

  void check_block(gsl::span<Stmt *> body);
  void check_stmt(Stmt * stmt);
  void check_let(LetStmt * node);
  void check_assign(AssignStmt * node);
  void check_return(ReturnStmt * node);
  void check_if(IfStmt * node);
  void check_while(WhileStmt * node);
  void check_for(ForStmt * node);

  void check_condition(Expr * cond, std::string_view construct);
  void check_assignable(const Expr * target);

  /// True when every path through `body` ends in a `return`.
  [[nodiscard]] static bool block_returns(gsl::span<Stmt * const> body);

  // ===========================================================================
  // Expressions
  // ===========================================================================

  const Type * check_expr(Expr * expr);
  const Type * check_expr_with_expected(Expr * expr, const Type * expected);
  const Type * infer(Expr * expr, const Type * expected);

  const Type * infer_var_ref(VarRefExpr * node);
  const Type * infer_binary(BinaryExpr * node);
  const Type * infer_unary(UnaryExpr * node);
  const Type * infer_field_access(FieldAccessExpr * node);
  const Type * infer_index(IndexExpr * node);
  const Type * infer_enum_access(EnumAccessExpr * node, const Type * expected);
  const Type * infer_struct_literal(StructLiteralExpr * node);
  const Type * infer_array_literal(ArrayLiteralExpr * node, const Type * expected);
  const Type * infer_new(NewExpr * node);
  const Type * infer_delete(DeleteExpr * node);
  const Type * infer_cast(CastExpr * node);
  const Type * infer_ternary(TernaryExpr * node, const Type * expected);
  const Type * infer_match(MatchExpr * node, const Type * expected);
  /// Check one pattern against the scrutinee; returns the binding type, if any.
  const Type * check_pattern(MatchPattern * pattern, const Type * scrutinee);
  const Type * infer_try(TryExpr * node);

  // Calls
  const Type * infer_call(CallExpr * node, const Type * expected);
  const Type * check_named_call(CallExpr * node, VarRefExpr * callee);
  const Type * check_member_call(CallExpr * node, FieldAccessExpr * callee);
  const Type * check_variant_ctor(CallExpr * node, EnumAccessExpr * callee, const Type * expected);
  const Type * check_method_call(CallExpr * node, FieldAccessExpr * callee);
  void check_call_args(
    CallExpr * node, const FunctionSignature & sig, std::string_view display_name);

  // ===========================================================================
  // Lookup Helpers
  // ===========================================================================

  /// Struct layout for a Struct type (nullptr for enums and other kinds).
  [[nodiscard]] const StructLayout * struct_layout_of(const Type * type) const;

  /// Enum layout for an Enum type, or a Struct type naming an enum.
  [[nodiscard]] const EnumLayout * enum_layout_of(const Type * type) const;

  /// Import edge bound to `alias` in the current module.
  [[nodiscard]] const ImportEdge * find_import(std::string_view alias) const;

  /// Throw E305 when `alias.name` names an item its module does not export.
  void reject_unexported(std::string_view alias, std::string_view name, SourceRange range) const;

  [[nodiscard]] const Type * normalize(const Type * type) const;

  [[noreturn]] static void fail(ErrorKind kind, SourceRange range, std::string message);

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  ModuleGraph & graph_;
  TypeContext & types_;

  /// Environment of the module being checked
  std::unique_ptr<TypeEnvironment> env_;
  const ModuleInfo * module_ = nullptr;

  /// Declared return type of the function being checked (nullptr outside functions)
  const Type * current_return_ = nullptr;
  int loop_depth_ = 0;
};

}  // namespace rapter
