// rapter/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// AstVisitor dispatches on NodeKind without virtual calls; RecursiveAstVisitor
// additionally walks every child.
//
#pragma once

#include <type_traits>

#include "rapter/ast/ast.hpp"
#include "rapter/ast/ast_enums.hpp"
#include "rapter/basic/casting.hpp"

namespace rapter
{

namespace detail
{

/// Propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements `visit_<snake_name>` for the nodes it cares
 * about; every other node falls back to its category method and finally to
 * visit_node().
 *
 * @code
 *   class CallCounter : public ConstAstVisitor<CallCounter, void> {
 *   public:
 *     void visit_call_expr(const CallExpr *) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_DISPATCH(Class, Kind, Snake) \
  case NodeKind::Kind:                        \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR AST_NODE_DISPATCH
#define AST_NODE_STMT AST_NODE_DISPATCH
#define AST_NODE_DECL AST_NODE_DISPATCH
#define AST_NODE_SUPPORT AST_NODE_DISPATCH
#define AST_NODE_TOP AST_NODE_DISPATCH
#include "rapter/ast/ast_nodes.def"
#undef AST_NODE_DISPATCH
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from the X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#include "rapter/ast/ast_nodes.def"

#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#include "rapter/ast/ast_nodes.def"

#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#include "rapter/ast/ast_nodes.def"

#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP AST_NODE_SUPPORT
#include "rapter/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that traverses child nodes in source order.
 *
 * Override a visit method and call the base implementation to keep walking,
 * or skip it to prune the subtree. Returning false stops the traversal.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Leaves and anything without children
  bool visit_node(NodePtrT /*node*/) { return true; }

  template <typename Range>
  bool visit_all(const Range & nodes)
  {
    for (auto * n : nodes) {
      if (!get_derived().visit(n)) return false;
    }
    return true;
  }

  // === Expressions ===

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    return get_derived().visit(node->callee) && visit_all(node->args);
  }

  bool visit_field_access_expr(NodePtr<FieldAccessExpr> node)
  {
    return get_derived().visit(node->base);
  }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    return get_derived().visit(node->base) && get_derived().visit(node->index);
  }

  bool visit_struct_literal_expr(NodePtr<StructLiteralExpr> node)
  {
    return visit_all(node->fields);
  }

  bool visit_field_init(NodePtr<FieldInit> node) { return get_derived().visit(node->value); }

  bool visit_array_literal_expr(NodePtr<ArrayLiteralExpr> node)
  {
    return visit_all(node->elements);
  }

  bool visit_new_expr(NodePtr<NewExpr> node)
  {
    return !node->initializer || get_derived().visit(node->initializer);
  }

  bool visit_delete_expr(NodePtr<DeleteExpr> node) { return get_derived().visit(node->operand); }

  bool visit_cast_expr(NodePtr<CastExpr> node) { return get_derived().visit(node->expr); }

  bool visit_ternary_expr(NodePtr<TernaryExpr> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->thenExpr) &&
           get_derived().visit(node->elseExpr);
  }

  bool visit_range_expr(NodePtr<RangeExpr> node)
  {
    return get_derived().visit(node->start) && get_derived().visit(node->end);
  }

  bool visit_match_expr(NodePtr<MatchExpr> node)
  {
    return get_derived().visit(node->scrutinee) && visit_all(node->arms);
  }

  bool visit_match_arm(NodePtr<MatchArm> node)
  {
    return get_derived().visit(node->pattern) && get_derived().visit(node->body);
  }

  bool visit_match_pattern(NodePtr<MatchPattern> node)
  {
    return !node->literal || get_derived().visit(node->literal);
  }

  bool visit_try_expr(NodePtr<TryExpr> node) { return get_derived().visit(node->operand); }

  // === Statements ===

  bool visit_let_stmt(NodePtr<LetStmt> node)
  {
    return !node->initializer || get_derived().visit(node->initializer);
  }

  bool visit_assign_stmt(NodePtr<AssignStmt> node)
  {
    return get_derived().visit(node->target) && get_derived().visit(node->value);
  }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expr); }

  bool visit_return_stmt(NodePtr<ReturnStmt> node)
  {
    return !node->value || get_derived().visit(node->value);
  }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->thenBody) &&
           visit_all(node->elseBody);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->body);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    return get_derived().visit(node->iterable) && visit_all(node->body);
  }

  // === Declarations ===

  bool visit_extern_function_decl(NodePtr<ExternFunctionDecl> node)
  {
    return visit_all(node->params);
  }

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    return visit_all(node->params) && visit_all(node->body);
  }

  bool visit_struct_decl(NodePtr<StructDecl> node) { return visit_all(node->fields); }

  bool visit_enum_decl(NodePtr<EnumDecl> node) { return visit_all(node->variants); }

  bool visit_global_var_decl(NodePtr<GlobalVarDecl> node)
  {
    return !node->initializer || get_derived().visit(node->initializer);
  }

  bool visit_program(NodePtr<Program> node)
  {
    return visit_all(node->imports) && visit_all(node->exports) &&
           visit_all(node->externFunctions) && visit_all(node->structs) &&
           visit_all(node->enums) && visit_all(node->globals) && visit_all(node->functions);
  }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace rapter
