// rapter/codegen/c_generator.hpp - Lower checked modules to one C translation unit
//
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "rapter/ast/ast.hpp"
#include "rapter/basic/diagnostic.hpp"
#include "rapter/codegen/instantiation_collector.hpp"
#include "rapter/sema/resolution/module_graph.hpp"

namespace rapter
{

/**
 * C code generator.
 *
 * Emits every module of a checked graph into a single C99 + GNU translation
 * unit (statement expressions are used for `match`, `?` and `push`). All
 * modules share one C namespace, so item names must be unique across the
 * program.
 *
 * Output order:
 * 1. headers, then the primitive growable-array structs
 * 2. enums
 * 3. struct typedefs, then struct, generic and growable-array definitions,
 *    each after the types it holds by value
 * 4. runtime helpers
 * 5. forward declarations of externs and functions
 * 6. globals, then function bodies
 * 7. the `main` trampoline when the entry module defines `main`
 *
 * Constructs without a lowering rule raise CompileError (E401); nothing is
 * emitted as a placeholder.
 *
 * ## Usage
 * ```cpp
 * TypeChecker(graph).check_all();
 * const std::string c = CGenerator(graph).generate();  // throws CompileError
 * ```
 */
class CGenerator
{
public:
  explicit CGenerator(ModuleGraph & graph);

  /// Generate the translation unit. Requires a fully checked graph.
  [[nodiscard]] std::string generate();

private:
  // ===========================================================================
  // Program Structure
  // ===========================================================================

  void check_name_collisions();
  void emit_enums();
  void emit_type_definitions();
  void emit_forward_declarations();
  void emit_globals();
  void emit_functions();
  void emit_main_trampoline();

  [[nodiscard]] std::string function_signature(const FunctionDecl & fn) const;
  [[nodiscard]] std::string extern_signature(const ExternFunctionDecl & fn) const;

  // ===========================================================================
  // Type Definitions
  // ===========================================================================

  /// Emit the definition of a type held by value, if it needs one.
  void require_complete(const Type * type, SourceRange range);
  /// Make a type nameable behind a pointer.
  void require_declared(const Type * type, SourceRange range);

  void emit_struct(const StructDecl & decl);
  void emit_generic(const Type * type, SourceRange range);
  void emit_dynamic_array(const Type * type, SourceRange range);

  // ===========================================================================
  // Statements
  // ===========================================================================

  void emit_block(gsl::span<Stmt * const> body);
  void emit_stmt(const Stmt * stmt);
  void emit_let(const LetStmt & node);
  void emit_if(const IfStmt & node, bool chained);
  void emit_for(const ForStmt & node);

  // ===========================================================================
  // Expressions
  // ===========================================================================

  [[nodiscard]] std::string expr(const Expr * e);
  [[nodiscard]] std::string binary(const BinaryExpr & node);
  [[nodiscard]] std::string call(const CallExpr & node);
  [[nodiscard]] std::string print_call(const CallExpr & node, bool newline);
  [[nodiscard]] std::string method_call(const CallExpr & node);
  [[nodiscard]] std::string variant_ctor(const CallExpr & node);
  [[nodiscard]] std::string match(const MatchExpr & node);
  [[nodiscard]] std::string match_switch(
    const MatchExpr & node, const std::string & scrutinee, const std::string & result);
  [[nodiscard]] std::string match_chain(
    const MatchExpr & node, const std::string & scrutinee, const std::string & result);
  [[nodiscard]] std::string arm_body(const MatchArm & arm, const std::string & result);
  [[nodiscard]] std::string try_expr(const TryExpr & node);
  [[nodiscard]] std::string args(gsl::span<Expr * const> list);

  /// Initializer of a global; must be a C constant expression.
  [[nodiscard]] std::string constant_initializer(const GlobalVarDecl & decl);

  // ===========================================================================
  // Helpers
  // ===========================================================================

  [[nodiscard]] bool is_enum(const Type * type) const;
  /// printf conversion for a scalar type; empty when the type has none.
  [[nodiscard]] std::string_view format_spec(const Type * type) const;
  [[nodiscard]] bool is_sized_array(std::string_view name) const;
  void declare_local(std::string_view name, bool sized_array);
  [[nodiscard]] std::string temp(std::string_view prefix);

  void line(std::string_view text);

  [[nodiscard]] static CompileError unsupported(SourceRange range, std::string message);

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  ModuleGraph & graph_;
  std::vector<ModuleInfo *> modules_;  // dependency order
  InstantiationCollector collector_;

  std::unordered_map<std::string_view, const StructDecl *> structs_;
  std::unordered_set<std::string_view> enums_;
  std::unordered_set<std::string> emitted_;
  std::unordered_set<std::string> in_progress_;

  /// Local names bound to arrays initialized from a literal, innermost scope last
  std::vector<std::unordered_map<std::string_view, bool>> array_scopes_;

  std::string out_;
  int indent_ = 0;
  int temp_counter_ = 0;
};

}  // namespace rapter
