// rapter/ast/json_visitor.cpp - JSON serialization implementation
//
#include "rapter/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "rapter/ast/ast.hpp"
#include "rapter/ast/ast_enums.hpp"
#include "rapter/basic/casting.hpp"
#include "rapter/basic/source_manager.hpp"
#include "rapter/sema/types/type_utils.hpp"

namespace rapter
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

json j_type(const Type * t)
{
  if (!t) return nullptr;
  return to_string(t);
}

// Forward declarations
json j_expr(const Expr * e);
json j_stmt(const Stmt * s);
json j_decl(const Decl * d);

template <typename T, typename F>
json j_list(gsl::span<T *> items, F && fn)
{
  json out = json::array();
  for (const auto * item : items) {
    out.push_back(fn(item));
  }
  return out;
}

json j_block(gsl::span<Stmt *> body) { return j_list(body, j_stmt); }

// ============================================================================
// Supporting nodes
// ============================================================================

json j_pattern(const MatchPattern * p)
{
  json j{{"type", "MatchPattern"}, {"range", j_range(p->get_range())}};
  switch (p->patternKind) {
    case PatternKind::Wildcard:
      j["kind"] = "wildcard";
      break;
    case PatternKind::Variant:
      j["kind"] = "variant";
      j["enum"] = std::string(p->enumName);
      j["variant"] = std::string(p->variant);
      if (p->has_binding()) {
        j["binding"] = std::string(p->binding);
      }
      break;
    case PatternKind::Literal:
      j["kind"] = "literal";
      j["literal"] = j_expr(p->literal);
      break;
  }
  return j;
}

json j_param(const ParamDecl * p)
{
  return json{
    {"type", "ParamDecl"},
    {"range", j_range(p->get_range())},
    {"name", std::string(p->name)},
    {"paramType", j_type(p->type)}};
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  json j;

  switch (e->get_kind()) {
    case NodeKind::MissingExpr:
      j = json{{"type", "MissingExpr"}};
      break;
    case NodeKind::IntLiteral:
      j = json{{"type", "IntLiteralExpr"}, {"value", cast<IntLiteralExpr>(e)->value}};
      break;
    case NodeKind::FloatLiteral:
      j = json{{"type", "FloatLiteralExpr"}, {"value", cast<FloatLiteralExpr>(e)->value}};
      break;
    case NodeKind::CharLiteral:
      j = json{
        {"type", "CharLiteralExpr"}, {"value", std::string(1, cast<CharLiteralExpr>(e)->value)}};
      break;
    case NodeKind::StringLiteral:
      j = json{
        {"type", "StringLiteralExpr"}, {"value", std::string(cast<StringLiteralExpr>(e)->value)}};
      break;
    case NodeKind::BoolLiteral:
      j = json{{"type", "BoolLiteralExpr"}, {"value", cast<BoolLiteralExpr>(e)->value}};
      break;
    case NodeKind::VarRef:
      j = json{{"type", "VarRefExpr"}, {"name", std::string(cast<VarRefExpr>(e)->name)}};
      break;
    case NodeKind::Binary: {
      const auto * b = cast<BinaryExpr>(e);
      j = json{
        {"type", "BinaryExpr"},
        {"op", std::string(to_string(b->op))},
        {"lhs", j_expr(b->lhs)},
        {"rhs", j_expr(b->rhs)}};
      break;
    }
    case NodeKind::Unary: {
      const auto * u = cast<UnaryExpr>(e);
      j = json{
        {"type", "UnaryExpr"}, {"op", std::string(to_string(u->op))}, {"operand", j_expr(u->operand)}};
      break;
    }
    case NodeKind::Call: {
      const auto * c = cast<CallExpr>(e);
      j = json{
        {"type", "CallExpr"}, {"callee", j_expr(c->callee)}, {"args", j_list(c->args, j_expr)}};
      if (c->method != BuiltinMethod::None) {
        j["method"] = std::string(to_string(c->method));
      }
      break;
    }
    case NodeKind::FieldAccess: {
      const auto * f = cast<FieldAccessExpr>(e);
      j = json{
        {"type", "FieldAccessExpr"},
        {"base", j_expr(f->base)},
        {"field", std::string(f->field)},
        {"arrow", f->isArrow}};
      break;
    }
    case NodeKind::Index: {
      const auto * idx = cast<IndexExpr>(e);
      j = json{{"type", "IndexExpr"}, {"base", j_expr(idx->base)}, {"index", j_expr(idx->index)}};
      break;
    }
    case NodeKind::EnumAccess: {
      const auto * a = cast<EnumAccessExpr>(e);
      j = json{
        {"type", "EnumAccessExpr"},
        {"enum", std::string(a->enumName)},
        {"variant", std::string(a->variant)}};
      break;
    }
    case NodeKind::StructLiteral: {
      const auto * s = cast<StructLiteralExpr>(e);
      json fields = json::array();
      for (const auto * f : s->fields) {
        fields.push_back(json{{"name", std::string(f->name)}, {"value", j_expr(f->value)}});
      }
      j = json{{"type", "StructLiteralExpr"}, {"name", std::string(s->typeName)}, {"fields", fields}};
      break;
    }
    case NodeKind::ArrayLiteral:
      j = json{
        {"type", "ArrayLiteralExpr"}, {"elements", j_list(cast<ArrayLiteralExpr>(e)->elements, j_expr)}};
      break;
    case NodeKind::New: {
      const auto * n = cast<NewExpr>(e);
      j = json{{"type", "NewExpr"}, {"growable", n->isGrowableArray}};
      if (n->initializer) {
        j["initializer"] = j_expr(n->initializer);
      } else {
        j["allocType"] = j_type(n->allocType);
      }
      break;
    }
    case NodeKind::Delete:
      j = json{{"type", "DeleteExpr"}, {"operand", j_expr(cast<DeleteExpr>(e)->operand)}};
      break;
    case NodeKind::Cast: {
      const auto * c = cast<CastExpr>(e);
      j = json{{"type", "CastExpr"}, {"expr", j_expr(c->expr)}, {"targetType", j_type(c->targetType)}};
      break;
    }
    case NodeKind::Ternary: {
      const auto * t = cast<TernaryExpr>(e);
      j = json{
        {"type", "TernaryExpr"},
        {"condition", j_expr(t->condition)},
        {"then", j_expr(t->thenExpr)},
        {"else", j_expr(t->elseExpr)}};
      break;
    }
    case NodeKind::Range: {
      const auto * r = cast<RangeExpr>(e);
      j = json{{"type", "RangeExpr"}, {"start", j_expr(r->start)}, {"end", j_expr(r->end)}};
      break;
    }
    case NodeKind::Match: {
      const auto * m = cast<MatchExpr>(e);
      json arms = json::array();
      for (const auto * arm : m->arms) {
        arms.push_back(json{
          {"type", "MatchArm"},
          {"range", j_range(arm->get_range())},
          {"pattern", j_pattern(arm->pattern)},
          {"body", j_expr(arm->body)}});
      }
      j = json{{"type", "MatchExpr"}, {"scrutinee", j_expr(m->scrutinee)}, {"arms", arms}};
      break;
    }
    case NodeKind::Try:
      j = json{{"type", "TryExpr"}, {"operand", j_expr(cast<TryExpr>(e)->operand)}};
      break;
    default:
      j = json{{"type", "UnknownExpr"}};
      break;
  }

  j["range"] = j_range(e->get_range());
  if (e->resolvedType) {
    j["resolvedType"] = j_type(e->resolvedType);
  }
  return j;
}

// ============================================================================
// Statement serialization
// ============================================================================

json j_stmt(const Stmt * s)
{
  if (!s) return json{{"type", "MissingStmt"}, {"range", j_range({})}};

  if (const auto * let = dyn_cast<LetStmt>(s)) {
    json j{
      {"type", "LetStmt"},
      {"range", j_range(let->get_range())},
      {"name", std::string(let->name)},
      {"mutable", let->isMutable},
      {"const", let->isConst},
      {"declaredType", j_type(let->declaredType)}};
    if (let->initializer) j["initializer"] = j_expr(let->initializer);
    return j;
  }

  if (const auto * a = dyn_cast<AssignStmt>(s)) {
    return json{
      {"type", "AssignStmt"},
      {"range", j_range(a->get_range())},
      {"target", j_expr(a->target)},
      {"value", j_expr(a->value)}};
  }

  if (const auto * es = dyn_cast<ExprStmt>(s)) {
    return json{{"type", "ExprStmt"}, {"range", j_range(es->get_range())}, {"expr", j_expr(es->expr)}};
  }

  if (const auto * r = dyn_cast<ReturnStmt>(s)) {
    json j{{"type", "ReturnStmt"}, {"range", j_range(r->get_range())}};
    if (r->value) j["value"] = j_expr(r->value);
    return j;
  }

  if (isa<BreakStmt>(s)) {
    return json{{"type", "BreakStmt"}, {"range", j_range(s->get_range())}};
  }
  if (isa<ContinueStmt>(s)) {
    return json{{"type", "ContinueStmt"}, {"range", j_range(s->get_range())}};
  }

  if (const auto * i = dyn_cast<IfStmt>(s)) {
    json j{
      {"type", "IfStmt"},
      {"range", j_range(i->get_range())},
      {"condition", j_expr(i->condition)},
      {"then", j_block(i->thenBody)}};
    if (i->hasElse) j["else"] = j_block(i->elseBody);
    return j;
  }

  if (const auto * w = dyn_cast<WhileStmt>(s)) {
    return json{
      {"type", "WhileStmt"},
      {"range", j_range(w->get_range())},
      {"condition", j_expr(w->condition)},
      {"body", j_block(w->body)}};
  }

  if (const auto * f = dyn_cast<ForStmt>(s)) {
    return json{
      {"type", "ForStmt"},
      {"range", j_range(f->get_range())},
      {"var", std::string(f->varName)},
      {"iterable", j_expr(f->iterable)},
      {"body", j_block(f->body)}};
  }

  return json{{"type", "UnknownStmt"}, {"range", j_range(s->get_range())}};
}

// ============================================================================
// Declaration serialization
// ============================================================================

json j_decl(const Decl * d)
{
  if (!d) return json{{"type", "MissingDecl"}, {"range", j_range({})}};

  if (const auto * imp = dyn_cast<ImportDecl>(d)) {
    json j{
      {"type", "ImportDecl"}, {"range", j_range(imp->get_range())}, {"path", std::string(imp->modulePath)}};
    if (!imp->alias.empty()) j["alias"] = std::string(imp->alias);
    return j;
  }

  if (const auto * exp = dyn_cast<ExportDecl>(d)) {
    return json{
      {"type", "ExportDecl"}, {"range", j_range(exp->get_range())}, {"name", std::string(exp->name)}};
  }

  if (const auto * ext = dyn_cast<ExternFunctionDecl>(d)) {
    return json{
      {"type", "ExternFunctionDecl"},
      {"range", j_range(ext->get_range())},
      {"name", std::string(ext->name)},
      {"params", j_list(ext->params, j_param)},
      {"returnType", j_type(ext->returnType)},
      {"variadic", ext->isVariadic}};
  }

  if (const auto * fn = dyn_cast<FunctionDecl>(d)) {
    return json{
      {"type", "FunctionDecl"},
      {"range", j_range(fn->get_range())},
      {"name", std::string(fn->name)},
      {"params", j_list(fn->params, j_param)},
      {"returnType", j_type(fn->returnType)},
      {"exported", fn->isExported},
      {"body", j_block(fn->body)}};
  }

  if (const auto * st = dyn_cast<StructDecl>(d)) {
    json fields = json::array();
    for (const auto * f : st->fields) {
      fields.push_back(json{
        {"type", "FieldDecl"},
        {"range", j_range(f->get_range())},
        {"name", std::string(f->name)},
        {"fieldType", j_type(f->type)}});
    }
    return json{
      {"type", "StructDecl"},
      {"range", j_range(st->get_range())},
      {"name", std::string(st->name)},
      {"exported", st->isExported},
      {"fields", fields}};
  }

  if (const auto * en = dyn_cast<EnumDecl>(d)) {
    json variants = json::array();
    for (const auto * v : en->variants) {
      json jv{{"name", std::string(v->name)}, {"range", j_range(v->get_range())}};
      if (v->hasValue) jv["value"] = v->value;
      variants.push_back(jv);
    }
    return json{
      {"type", "EnumDecl"},
      {"range", j_range(en->get_range())},
      {"name", std::string(en->name)},
      {"exported", en->isExported},
      {"variants", variants}};
  }

  if (const auto * g = dyn_cast<GlobalVarDecl>(d)) {
    json j{
      {"type", "GlobalVarDecl"},
      {"range", j_range(g->get_range())},
      {"name", std::string(g->name)},
      {"mutable", g->isMutable},
      {"const", g->isConst},
      {"declaredType", j_type(g->declaredType)}};
    if (g->initializer) j["initializer"] = j_expr(g->initializer);
    return j;
  }

  return json{{"type", "UnknownDecl"}, {"range", j_range(d->get_range())}};
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<Program>(node)) {
    return to_json(cast<Program>(node));
  }
  if (isa<Decl>(node)) {
    return j_decl(cast<Decl>(node));
  }
  if (isa<Stmt>(node)) {
    return j_stmt(cast<Stmt>(node));
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }

  // Supporting nodes
  if (isa<ParamDecl>(node)) {
    return j_param(cast<ParamDecl>(node));
  }
  if (isa<MatchPattern>(node)) {
    return j_pattern(cast<MatchPattern>(node));
  }

  return nlohmann::json{{"type", "UnknownNode"}, {"range", j_range(node->get_range())}};
}

nlohmann::json to_json(const Program * program)
{
  if (!program) return nlohmann::json{{"type", "Program"}, {"range", j_range({})}};

  return nlohmann::json{
    {"type", "Program"},
    {"range", j_range(program->get_range())},
    {"imports", j_list(program->imports, j_decl)},
    {"exports", j_list(program->exports, j_decl)},
    {"externFunctions", j_list(program->externFunctions, j_decl)},
    {"structs", j_list(program->structs, j_decl)},
    {"enums", j_list(program->enums, j_decl)},
    {"globals", j_list(program->globals, j_decl)},
    {"functions", j_list(program->functions, j_decl)}};
}

}  // namespace rapter
