// rapter/codegen/instantiation_collector.cpp - Generic instantiation discovery
//
#include "rapter/codegen/instantiation_collector.hpp"

#include "rapter/ast/visitor.hpp"
#include "rapter/codegen/name_mangler.hpp"

namespace rapter
{

namespace
{

class TypeWalker : public ConstRecursiveAstVisitor<TypeWalker>
{
  using Base = ConstRecursiveAstVisitor<TypeWalker>;

public:
  explicit TypeWalker(InstantiationCollector & out) : out_(out) {}

  bool visit(const AstNode * node)
  {
    if (const auto * expr = dyn_cast<Expr>(node)) out_.add(expr->resolvedType);
    return Base::visit(node);
  }

  bool visit_let_stmt(const LetStmt * node)
  {
    out_.add(node->varType);
    return Base::visit_let_stmt(node);
  }

  bool visit_for_stmt(const ForStmt * node)
  {
    out_.add(node->elementType);
    return Base::visit_for_stmt(node);
  }

  bool visit_global_var_decl(const GlobalVarDecl * node)
  {
    out_.add(node->varType);
    return Base::visit_global_var_decl(node);
  }

  bool visit_param_decl(const ParamDecl * node)
  {
    out_.add(node->type);
    return true;
  }

  bool visit_field_decl(const FieldDecl * node)
  {
    out_.add(node->type);
    return true;
  }

  bool visit_function_decl(const FunctionDecl * node)
  {
    out_.add(node->returnType);
    return Base::visit_function_decl(node);
  }

  bool visit_extern_function_decl(const ExternFunctionDecl * node)
  {
    out_.add(node->returnType);
    return Base::visit_extern_function_decl(node);
  }

  bool visit_new_expr(const NewExpr * node)
  {
    out_.add(node->allocType);
    return Base::visit_new_expr(node);
  }

  bool visit_cast_expr(const CastExpr * node)
  {
    out_.add(node->targetType);
    return Base::visit_cast_expr(node);
  }

private:
  InstantiationCollector & out_;
};

}  // namespace

void InstantiationCollector::collect(const ModuleGraph & graph)
{
  for (const ModuleInfo * module : graph.dependency_order()) {
    if (module->program) collect(*module->program);
  }
}

void InstantiationCollector::collect(const Program & program)
{
  TypeWalker walker(*this);
  walker.visit(&program);
}

void InstantiationCollector::add(const Type * type)
{
  if (!type) return;

  switch (type->kind) {
    case TypeKind::Pointer:
    case TypeKind::Array:
      add(type->element_type);
      return;

    case TypeKind::DynamicArray:
      add(type->element_type);
      if (is_primitive_dynamic_array(type->element_type)) return;
      break;

    case TypeKind::Generic:
      for (const Type * arg : type->type_args) add(arg);
      break;

    default:
      return;
  }

  if (seen_.insert(mangle(type)).second) {
    types_.push_back(type);
  }
}

}  // namespace rapter
