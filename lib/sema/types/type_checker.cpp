// rapter/sema/types/type_checker.cpp - Type inference and checking
//
#include "rapter/sema/types/type_checker.hpp"

#include <fmt/format.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "rapter/basic/casting.hpp"
#include "rapter/sema/types/builtin_generics.hpp"
#include "rapter/sema/types/intrinsics.hpp"
#include "rapter/sema/types/method_table.hpp"
#include "rapter/sema/types/type_utils.hpp"

namespace rapter
{

namespace
{

CompileError mismatch(SourceRange range, const Type * expected, const Type * found)
{
  return CompileError(
    ErrorKind::TypeMismatch, range,
    fmt::format("mismatched types: expected `{}`, found `{}`", to_string(expected), to_string(found)));
}

bool is_zero_literal(const Expr * expr)
{
  if (const auto * u = dyn_cast<UnaryExpr>(expr); u && u->op == UnaryOp::Neg) {
    return is_zero_literal(u->operand);
  }
  if (const auto * i = dyn_cast<IntLiteralExpr>(expr)) return i->value == 0;
  if (const auto * f = dyn_cast<FloatLiteralExpr>(expr)) return f->value == 0.0;
  return false;
}

/// Identity of a literal or variant pattern; two arms with the same key overlap.
std::string pattern_key(const MatchPattern * pattern)
{
  if (pattern->patternKind == PatternKind::Variant) return std::string(pattern->variant);

  const Expr * lit = pattern->literal;
  if (const auto * i = dyn_cast<IntLiteralExpr>(lit)) return fmt::format("i{}", i->value);
  if (const auto * f = dyn_cast<FloatLiteralExpr>(lit)) return fmt::format("f{}", f->value);
  if (const auto * c = dyn_cast<CharLiteralExpr>(lit)) return fmt::format("c{}", int(c->value));
  if (const auto * b = dyn_cast<BoolLiteralExpr>(lit)) return b->value ? "true" : "false";
  if (const auto * str = dyn_cast<StringLiteralExpr>(lit)) return fmt::format("s{}", str->value);
  return fmt::format("@{}", lit->get_range().get_begin().offset());
}

std::optional<int64_t> negative_literal(const Expr * expr)
{
  if (const auto * i = dyn_cast<IntLiteralExpr>(expr)) {
    if (i->value < 0) return i->value;
    return std::nullopt;
  }
  if (const auto * u = dyn_cast<UnaryExpr>(expr); u && u->op == UnaryOp::Neg) {
    if (const auto * i = dyn_cast<IntLiteralExpr>(u->operand); i && i->value > 0) {
      return -i->value;
    }
  }
  return std::nullopt;
}

bool is_scalar(const Type * t)
{
  return t->is_int() || t->is_float() || t->is_char();
}

bool is_valid_cast(const Type * from, const Type * to)
{
  if (is_scalar(from) && is_scalar(to)) {
    // char only converts to and from int
    return !(from->is_float() && to->is_char()) && !(from->is_char() && to->is_float());
  }
  if (from->is_pointer() && to->is_pointer()) return true;
  if (from->is_pointer() && to->is_int()) return true;
  if (from->is_int() && to->is_pointer()) return true;
  return from->is_string() && to->is_pointer() && to->element_type->is_char();
}

/// Types whose values C can compare with `==` directly.
bool is_equatable(const Type * t)
{
  switch (t->kind) {
    case TypeKind::Int:
    case TypeKind::Float:
    case TypeKind::Bool:
    case TypeKind::Char:
    case TypeKind::String:
    case TypeKind::Pointer:
    case TypeKind::Enum:
      return true;
    default:
      return false;
  }
}

bool is_ordered(const Type * t)
{
  return t->is_numeric() || t->is_char() || t->is_string();
}

std::string join_names(const std::vector<std::string_view> & names)
{
  std::string out;
  for (const auto name : names) {
    if (!out.empty()) out += ", ";
    out += name;
  }
  return out;
}

}  // namespace

TypeChecker::TypeChecker(ModuleGraph & graph) : graph_(graph), types_(graph.types()) {}

// ============================================================================
// Entry Points
// ============================================================================

void TypeChecker::check_all()
{
  for (ModuleInfo * module : graph_.dependency_order()) {
    if (!module->checked) check_module(*module);
  }
}

void TypeChecker::check_module(ModuleInfo & module)
{
  if (!module.program) return;

  env_ = std::make_unique<TypeEnvironment>();
  module_ = &module;
  current_return_ = nullptr;
  loop_depth_ = 0;

  // Imports first so local signatures may name imported types; local
  // declarations take precedence over imported plain names.
  declare_imports(module);
  declare_module_items(*module.program);

  for (auto * global : module.program->globals) {
    check_global(global);
  }
  for (auto * fn : module.program->functions) {
    check_function(fn);
  }

  module.checked = true;
  module_ = nullptr;
}

// ============================================================================
// Declarations
// ============================================================================

bool TypeChecker::defines_locally(std::string_view name) const
{
  if (module_->defines(name)) return true;
  for (const auto * ext : module_->program->externFunctions) {
    if (ext->name == name) return true;
  }
  for (const auto * global : module_->program->globals) {
    if (global->name == name) return true;
  }
  return false;
}

void TypeChecker::define_or_fail(const Symbol & symbol)
{
  if (env_->define(symbol)) return;

  CompileError err(
    ErrorKind::DuplicateDefinition, symbol.definitionRange,
    fmt::format("the name `{}` is defined multiple times", symbol.name));
  if (const Symbol * previous = env_->lookup_local(symbol.name)) {
    Diagnostic note;
    note.severity = Severity::Info;
    note.message = fmt::format("previous definition of `{}` here", symbol.name);
    note.labels.push_back(Label{previous->definitionRange, "previous definition"});
    err.with_related(std::move(note));
  }
  throw err;
}

void TypeChecker::import_symbol(const Symbol & symbol, const ImportEdge & edge)
{
  Symbol qualified = symbol;
  qualified.name = env_->qualify(edge.alias, symbol.name);
  env_->define_global(qualified);

  if (defines_locally(symbol.name)) return;
  if (env_->define_global(symbol)) return;

  // The same module imported under two aliases binds the same item twice
  const Symbol * previous = env_->lookup_global(symbol.name);
  if (previous && previous->decl == symbol.decl) return;

  throw CompileError(
    ErrorKind::ImportConflict, edge.decl->get_range(),
    fmt::format("`{}` is imported by more than one module", symbol.name))
    .with_suggestion(
      "refer to the item through its module alias",
      fmt::format("{}.{}", edge.alias, symbol.name));
}

void TypeChecker::declare_imports(const ModuleInfo & module)
{
  for (const auto & edge : module.imports) {
    define_or_fail(Symbol{
      edge.alias, SymbolRole::Module, nullptr, false, edge.decl->get_range(), edge.decl});

    const ModuleInfo & dep = *edge.module;
    if (!dep.program) continue;

    // Layouts of every imported struct and enum are visible so values of
    // imported types can be inspected; only exported names can be written.
    for (const auto * st : dep.program->structs) {
      StructLayout layout = make_struct_layout(*st);
      if (dep.is_exported(st->name)) {
        env_->define_struct(env_->qualify(edge.alias, st->name), layout);
        import_symbol(
          Symbol{
            st->name, SymbolRole::Struct, types_.get_struct_type(st->name), false, st->get_range(),
            st},
          edge);
      }
      if (!defines_locally(st->name) && !env_->find_struct(st->name)) {
        env_->define_struct(st->name, std::move(layout));
      }
    }

    for (const auto * en : dep.program->enums) {
      EnumLayout layout = make_enum_layout(*en);
      if (dep.is_exported(en->name)) {
        env_->define_enum(env_->qualify(edge.alias, en->name), layout);
        import_symbol(
          Symbol{
            en->name, SymbolRole::Enum, types_.get_enum_type(en->name), false, en->get_range(), en},
          edge);
      }
      if (!defines_locally(en->name) && !env_->find_enum(en->name)) {
        env_->define_enum(en->name, std::move(layout));
      }
    }

    for (const auto * fn : dep.program->functions) {
      if (!dep.is_exported(fn->name)) continue;

      FunctionSignature sig;
      for (const auto * param : fn->params) sig.params.push_back(normalize(param->type));
      sig.returnType = fn->returnType ? normalize(fn->returnType) : types_.void_type();

      env_->define_function(env_->qualify(edge.alias, fn->name), sig);
      if (!defines_locally(fn->name)) env_->define_function(fn->name, sig);
      import_symbol(
        Symbol{fn->name, SymbolRole::Function, sig.returnType, false, fn->get_range(), fn}, edge);
    }
  }
}

void TypeChecker::declare_module_items(const Program & program)
{
  // Type names first: fields and signatures may refer to any of them
  for (const auto * st : program.structs) {
    define_or_fail(Symbol{
      st->name, SymbolRole::Struct, types_.get_struct_type(st->name), false, st->get_range(), st});
  }

  for (const auto * en : program.enums) {
    define_or_fail(Symbol{
      en->name, SymbolRole::Enum, types_.get_enum_type(en->name), false, en->get_range(), en});

    std::unordered_set<std::string_view> seen;
    for (const auto * variant : en->variants) {
      if (!seen.insert(variant->name).second) {
        fail(
          ErrorKind::DuplicateDefinition, variant->get_range(),
          fmt::format("variant `{}` is declared more than once in enum `{}`", variant->name, en->name));
      }
    }
    env_->define_enum(en->name, make_enum_layout(*en));
  }

  for (const auto * st : program.structs) {
    std::unordered_set<std::string_view> seen;
    for (const auto * field : st->fields) {
      if (!seen.insert(field->name).second) {
        fail(
          ErrorKind::DuplicateDefinition, field->get_range(),
          fmt::format("field `{}` is declared more than once in struct `{}`", field->name, st->name));
      }
      validate_type(field->type, field->typeRange);
    }
    env_->define_struct(st->name, make_struct_layout(*st));
  }

  for (const auto * ext : program.externFunctions) {
    FunctionSignature sig;
    for (const auto * param : ext->params) {
      validate_type(param->type, param->typeRange);
      sig.params.push_back(normalize(param->type));
    }
    sig.returnType = ext->returnType ? normalize(ext->returnType) : types_.void_type();
    sig.isVariadic = ext->isVariadic;
    sig.isExtern = true;

    define_or_fail(Symbol{
      ext->name, SymbolRole::ExternFunction, sig.returnType, false, ext->get_range(), ext});
    env_->define_function(ext->name, std::move(sig));
  }

  for (const auto * fn : program.functions) {
    FunctionSignature sig;
    for (const auto * param : fn->params) {
      validate_type(param->type, param->typeRange);
      sig.params.push_back(normalize(param->type));
    }
    if (fn->returnType) validate_type(fn->returnType, fn->returnTypeRange);
    sig.returnType = fn->returnType ? normalize(fn->returnType) : types_.void_type();

    define_or_fail(
      Symbol{fn->name, SymbolRole::Function, sig.returnType, false, fn->get_range(), fn});
    env_->define_function(fn->name, std::move(sig));
  }
}

StructLayout TypeChecker::make_struct_layout(const StructDecl & decl) const
{
  StructLayout layout;
  layout.name = decl.name;
  for (const auto * field : decl.fields) {
    layout.fields.emplace_back(field->name, normalize(field->type));
  }
  return layout;
}

EnumLayout TypeChecker::make_enum_layout(const EnumDecl & decl)
{
  EnumLayout layout;
  layout.name = decl.name;
  int64_t next = 0;
  for (const auto * variant : decl.variants) {
    const int64_t value = variant->hasValue ? variant->value : next;
    layout.variants.emplace_back(variant->name, value);
    next = value + 1;
  }
  return layout;
}

void TypeChecker::validate_type(const Type * type, SourceRange range)
{
  if (!type) return;

  switch (type->kind) {
    case TypeKind::Pointer:
    case TypeKind::Array:
    case TypeKind::DynamicArray:
      validate_type(type->element_type, range);
      return;

    case TypeKind::Struct:
    case TypeKind::Enum: {
      if (type->is_string()) return;
      const std::string_view name = type->name;
      if (BuiltinGenerics::instance().is_builtin(name)) {
        throw CompileError(
          ErrorKind::WrongArgumentCount, range,
          fmt::format("generic type `{}` requires type arguments", name))
          .with_suggestion(
            "spell out the instantiation",
            name == BuiltinGenerics::k_option ? "Option<int>" : "Result<int, string>");
      }
      const Symbol * sym = env_->lookup_global(name);
      if (sym && sym->is_type()) return;
      if (is_qualified_name(name)) {
        const auto dot = name.find('.');
        reject_unexported(name.substr(0, dot), name.substr(dot + 1), range);
      }
      fail(ErrorKind::UndefinedType, range, fmt::format("cannot find type `{}` in this scope", name));
    }

    case TypeKind::Generic: {
      const auto & generics = BuiltinGenerics::instance();
      if (!generics.lookup(type->name)) {
        throw CompileError(
          ErrorKind::UndefinedType, range, fmt::format("unknown generic type `{}`", type->name))
          .with_help("the only generic types are Option<T> and Result<T, E>");
      }
      const std::vector<const Type *> args(type->type_args.begin(), type->type_args.end());
      const SubstituteResult result = generics.substitute(types_, type->name, args);
      if (!result) {
        const ArityMismatch & err = result.error();
        fail(
          ErrorKind::WrongArgumentCount, range,
          fmt::format(
            "`{}` expects {} type argument{}, found {}", err.family, err.expected,
            err.expected == 1 ? "" : "s", err.actual));
      }
      for (const Type * arg : type->type_args) validate_type(arg, range);
      return;
    }

    case TypeKind::TypeParam:
      fail(
        ErrorKind::UndefinedType, range,
        fmt::format("unresolved type parameter `{}`", type->name));

    default:
      return;
  }
}

// ============================================================================
// Globals and Functions
// ============================================================================

void TypeChecker::check_global(GlobalVarDecl * decl)
{
  if (decl->declaredType) validate_type(decl->declaredType, decl->typeRange);
  if (!decl->declaredType && !decl->initializer) {
    throw CompileError(
      ErrorKind::InvalidSyntax, decl->get_range(),
      fmt::format("global `{}` needs a type annotation or an initializer", decl->name))
      .with_suggestion("add a type annotation", fmt::format("let {}: int = 0;", decl->name));
  }

  const Type * type = normalize(decl->declaredType);
  if (decl->initializer) {
    const Type * init = check_expr_with_expected(decl->initializer, type);
    if (type && !compatible(type, init)) {
      throw mismatch(decl->initializer->get_range(), type, init)
        .with_secondary_label(decl->typeRange, "expected due to this");
    }
    if (!type) type = init;
  }
  if (type->is_void()) {
    fail(
      ErrorKind::TypeMismatch, decl->get_range(),
      fmt::format("global `{}` cannot have type `void`", decl->name));
  }

  decl->varType = type;
  define_or_fail(Symbol{
    decl->name, SymbolRole::Variable, type, decl->isMutable && !decl->isConst, decl->get_range(),
    decl});
}

void TypeChecker::check_function(FunctionDecl * decl)
{
  const Type * ret = decl->returnType ? normalize(decl->returnType) : types_.void_type();

  // Parameters and the top-level body statements share one scope
  TypeEnvironment::ScopeGuard scope(*env_);
  for (const auto * param : decl->params) {
    define_or_fail(Symbol{
      param->name, SymbolRole::Parameter, normalize(param->type), true, param->get_range(),
      param});
  }

  current_return_ = ret;
  loop_depth_ = 0;
  for (auto * stmt : decl->body) {
    check_stmt(stmt);
  }
  current_return_ = nullptr;

  if (!ret->is_void() && !block_returns(decl->body)) {
    const SourceRange where =
      decl->returnTypeRange.is_valid() ? decl->returnTypeRange : decl->get_range();
    throw CompileError(
      ErrorKind::MissingReturnType, where,
      fmt::format(
        "function `{}` returns `{}` but not every path ends in a `return`", decl->name,
        to_string(ret)))
      .with_suggestion("add a `return` at the end of the function body");
  }
}

// ============================================================================
// Statements
// ============================================================================

void TypeChecker::check_block(gsl::span<Stmt *> body)
{
  TypeEnvironment::ScopeGuard scope(*env_);
  for (auto * stmt : body) {
    check_stmt(stmt);
  }
}

void TypeChecker::check_stmt(Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::Let:
      check_let(cast<LetStmt>(stmt));
      return;
    case NodeKind::Assign:
      check_assign(cast<AssignStmt>(stmt));
      return;
    case NodeKind::ExprStmt:
      check_expr(cast<ExprStmt>(stmt)->expr);
      return;
    case NodeKind::Return:
      check_return(cast<ReturnStmt>(stmt));
      return;
    case NodeKind::Break:
    case NodeKind::Continue:
      if (loop_depth_ == 0) {
        fail(
          ErrorKind::InvalidOperation, stmt->get_range(),
          fmt::format(
            "`{}` outside of a loop", stmt->get_kind() == NodeKind::Break ? "break" : "continue"));
      }
      return;
    case NodeKind::If:
      check_if(cast<IfStmt>(stmt));
      return;
    case NodeKind::While:
      check_while(cast<WhileStmt>(stmt));
      return;
    case NodeKind::For:
      check_for(cast<ForStmt>(stmt));
      return;
    default:
      fail(ErrorKind::InternalError, stmt->get_range(), "unexpected statement node");
  }
}

void TypeChecker::check_let(LetStmt * node)
{
  if (node->declaredType) validate_type(node->declaredType, node->typeRange);
  if (!node->declaredType && !node->initializer) {
    throw CompileError(
      ErrorKind::InvalidSyntax, node->get_range(),
      fmt::format("variable `{}` needs a type annotation or an initializer", node->name))
      .with_suggestion("add a type annotation", fmt::format("let {}: int = 0;", node->name));
  }
  if (node->isConst && !node->initializer) {
    fail(
      ErrorKind::InvalidSyntax, node->get_range(),
      fmt::format("constant `{}` needs an initializer", node->name));
  }

  const Type * type = normalize(node->declaredType);
  if (node->initializer) {
    const Type * init = check_expr_with_expected(node->initializer, type);
    if (type) {
      if (!compatible(type, init)) {
        throw mismatch(node->initializer->get_range(), type, init)
          .with_secondary_label(node->typeRange, "expected due to this");
      }
    } else {
      if (init->is_void()) {
        fail(
          ErrorKind::TypeMismatch, node->initializer->get_range(),
          fmt::format("cannot bind `{}` to a value of type `void`", node->name));
      }
      type = init;
    }
  }

  node->varType = type;
  define_or_fail(Symbol{
    node->name, SymbolRole::Variable, type, node->isMutable && !node->isConst, node->get_range(),
    node});
}

void TypeChecker::check_assign(AssignStmt * node)
{
  const Type * target = check_expr(node->target);
  check_assignable(node->target);

  const Type * value = check_expr_with_expected(node->value, target);
  if (!compatible(target, value)) {
    throw mismatch(node->value->get_range(), target, value);
  }
}

void TypeChecker::check_assignable(const Expr * target)
{
  const Expr * e = target;
  while (true) {
    if (const auto * ref = dyn_cast<VarRefExpr>(e)) {
      const Symbol * sym = env_->lookup(ref->name);
      if (!sym || !sym->is_value()) {
        fail(
          ErrorKind::InvalidOperation, target->get_range(),
          fmt::format("cannot assign to `{}`", ref->name));
      }
      if (!sym->isMutable) {
        throw CompileError(
          ErrorKind::ImmutableAssignment, target->get_range(),
          fmt::format("cannot assign twice to immutable variable `{}`", ref->name))
          .with_secondary_label(sym->definitionRange, "first defined here")
          .with_suggestion("make the variable mutable", fmt::format("let mut {} = ...;", ref->name));
      }
      return;
    }
    if (const auto * field = dyn_cast<FieldAccessExpr>(e)) {
      if (field->isArrow) return;
      e = field->base;
      continue;
    }
    if (const auto * index = dyn_cast<IndexExpr>(e)) {
      if (index->base->resolvedType && index->base->resolvedType->is_pointer()) return;
      e = index->base;
      continue;
    }
    if (const auto * unary = dyn_cast<UnaryExpr>(e); unary && unary->op == UnaryOp::Deref) {
      return;
    }
    fail(ErrorKind::InvalidOperation, target->get_range(), "invalid left-hand side of assignment");
  }
}

void TypeChecker::check_return(ReturnStmt * node)
{
  const Type * ret = current_return_;
  if (ret->is_void()) {
    if (node->value) {
      const Type * found = check_expr(node->value);
      throw CompileError(
        ErrorKind::TypeMismatch, node->value->get_range(),
        fmt::format(
          "mismatched types: cannot return `{}` from a function returning `void`",
          to_string(found)))
        .with_suggestion("remove the returned value or declare a return type");
    }
    return;
  }

  if (!node->value) {
    fail(
      ErrorKind::MissingReturnType, node->get_range(),
      fmt::format("`return` without a value in a function returning `{}`", to_string(ret)));
  }
  const Type * found = check_expr_with_expected(node->value, ret);
  if (!compatible(ret, found)) {
    throw mismatch(node->value->get_range(), ret, found);
  }
}

void TypeChecker::check_condition(Expr * cond, std::string_view construct)
{
  const Type * type = check_expr(cond);
  if (!type->is_bool()) {
    throw CompileError(
      ErrorKind::TypeMismatch, cond->get_range(),
      fmt::format("`{}` condition must be `bool`, found `{}`", construct, to_string(type)))
      .with_suggestion("compare explicitly", "x != 0");
  }
}

void TypeChecker::check_if(IfStmt * node)
{
  check_condition(node->condition, "if");
  check_block(node->thenBody);
  if (node->hasElse) check_block(node->elseBody);
}

void TypeChecker::check_while(WhileStmt * node)
{
  check_condition(node->condition, "while");
  ++loop_depth_;
  check_block(node->body);
  --loop_depth_;
}

void TypeChecker::check_for(ForStmt * node)
{
  TypeEnvironment::ScopeGuard scope(*env_);

  const Type * element = nullptr;
  if (auto * range = dyn_cast<RangeExpr>(node->iterable)) {
    for (Expr * bound : {range->start, range->end}) {
      const Type * t = check_expr(bound);
      if (!t->is_int()) throw mismatch(bound->get_range(), types_.int_type(), t);
    }
    range->resolvedType = types_.int_type();
    element = types_.int_type();
  } else {
    const Type * iterable = check_expr(node->iterable);
    if (!iterable->is_array_like()) {
      throw CompileError(
        ErrorKind::TypeMismatch, node->iterable->get_range(),
        fmt::format("cannot iterate over type `{}`", to_string(iterable)))
        .with_suggestion("iterate over a range, an array or a DynamicArray", "for i in 0..n { }");
    }
    element = iterable->element_type;
  }

  node->elementType = element;
  define_or_fail(
    Symbol{node->varName, SymbolRole::Variable, element, false, node->get_range(), node});

  ++loop_depth_;
  check_block(node->body);
  --loop_depth_;
}

bool TypeChecker::block_returns(gsl::span<Stmt * const> body)
{
  for (const Stmt * stmt : body) {
    if (isa<ReturnStmt>(stmt)) return true;
    if (const auto * branch = dyn_cast<IfStmt>(stmt)) {
      if (branch->hasElse && block_returns(branch->thenBody) && block_returns(branch->elseBody)) {
        return true;
      }
    }
  }
  return false;
}

// ============================================================================
// Expressions
// ============================================================================

const Type * TypeChecker::check_expr(Expr * expr)
{
  return check_expr_with_expected(expr, nullptr);
}

const Type * TypeChecker::check_expr_with_expected(Expr * expr, const Type * expected)
{
  const Type * type = normalize(infer(expr, normalize(expected)));
  expr->resolvedType = type;
  return type;
}

const Type * TypeChecker::infer(Expr * expr, const Type * expected)
{
  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
      return types_.int_type();
    case NodeKind::FloatLiteral:
      return types_.float_type();
    case NodeKind::CharLiteral:
      return types_.char_type();
    case NodeKind::StringLiteral:
      return types_.string_type();
    case NodeKind::BoolLiteral:
      return types_.bool_type();
    case NodeKind::VarRef:
      return infer_var_ref(cast<VarRefExpr>(expr));
    case NodeKind::Binary:
      return infer_binary(cast<BinaryExpr>(expr));
    case NodeKind::Unary:
      return infer_unary(cast<UnaryExpr>(expr));
    case NodeKind::Call:
      return infer_call(cast<CallExpr>(expr), expected);
    case NodeKind::FieldAccess:
      return infer_field_access(cast<FieldAccessExpr>(expr));
    case NodeKind::Index:
      return infer_index(cast<IndexExpr>(expr));
    case NodeKind::EnumAccess:
      return infer_enum_access(cast<EnumAccessExpr>(expr), expected);
    case NodeKind::StructLiteral:
      return infer_struct_literal(cast<StructLiteralExpr>(expr));
    case NodeKind::ArrayLiteral:
      return infer_array_literal(cast<ArrayLiteralExpr>(expr), expected);
    case NodeKind::New:
      return infer_new(cast<NewExpr>(expr));
    case NodeKind::Delete:
      return infer_delete(cast<DeleteExpr>(expr));
    case NodeKind::Cast:
      return infer_cast(cast<CastExpr>(expr));
    case NodeKind::Ternary:
      return infer_ternary(cast<TernaryExpr>(expr), expected);
    case NodeKind::Range:
      throw CompileError(
        ErrorKind::InvalidOperation, expr->get_range(),
        "range expressions are only allowed as the iterable of a `for` loop")
        .with_suggestion("iterate over the range", "for i in 0..10 { }");
    case NodeKind::Match:
      return infer_match(cast<MatchExpr>(expr), expected);
    case NodeKind::Try:
      return infer_try(cast<TryExpr>(expr));
    case NodeKind::MissingExpr:
      fail(ErrorKind::InternalError, expr->get_range(), "malformed expression reached the checker");
    default:
      fail(ErrorKind::InternalError, expr->get_range(), "unexpected expression node");
  }
}

const Type * TypeChecker::infer_var_ref(VarRefExpr * node)
{
  const Symbol * sym = env_->lookup(node->name);
  if (!sym) {
    fail(
      ErrorKind::UndefinedVariable, node->get_range(),
      fmt::format("cannot find value `{}` in this scope", node->name));
  }
  if (!sym->is_value()) {
    fail(
      ErrorKind::InvalidOperation, node->get_range(),
      fmt::format("`{}` is a {}, not a value", node->name, to_string(sym->role)));
  }
  return sym->type;
}

const Type * TypeChecker::infer_binary(BinaryExpr * node)
{
  const Type * lhs = check_expr(node->lhs);
  const Type * rhs = check_expr(node->rhs);
  const std::string_view op = to_string(node->op);

  if (is_arithmetic(node->op)) {
    if ((node->op == BinaryOp::Div || node->op == BinaryOp::Mod) && is_zero_literal(node->rhs)) {
      throw CompileError(
        ErrorKind::InvalidOperation, node->get_range(),
        node->op == BinaryOp::Div ? "division by zero" : "remainder by zero")
        .with_secondary_label(node->rhs->get_range(), "this is zero");
    }

    if (lhs->is_string() || rhs->is_string()) {
      if (node->op == BinaryOp::Add && lhs->is_string() && rhs->is_string()) {
        return types_.string_type();
      }
      throw CompileError(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("cannot apply `{}` to `{}` and `{}`", op, to_string(lhs), to_string(rhs)))
        .with_help("only `+` is defined on strings, and both operands must be strings");
    }

    const Type * result = common_numeric_type(types_, lhs, rhs);
    if (!result) {
      throw CompileError(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("cannot apply `{}` to `{}` and `{}`", op, to_string(lhs), to_string(rhs)))
        .with_help("arithmetic operators require `int` or `float` operands");
    }
    if (node->op == BinaryOp::Mod && !result->is_int()) {
      fail(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("`%` requires `int` operands, found `{}`", to_string(result)));
    }
    return result;
  }

  if (is_comparison(node->op)) {
    if (!compatible(lhs, rhs)) {
      throw CompileError(
        ErrorKind::TypeMismatch, node->get_range(),
        fmt::format("cannot compare `{}` with `{}`", to_string(lhs), to_string(rhs)));
    }
    const bool equality = node->op == BinaryOp::Eq || node->op == BinaryOp::Ne;
    const bool equatable = is_equatable(lhs) || enum_layout_of(lhs) != nullptr;
    if (equality ? !equatable : !is_ordered(lhs)) {
      fail(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("`{}` cannot be applied to values of type `{}`", op, to_string(lhs)));
    }
    return types_.bool_type();
  }

  // && and ||
  for (const auto & [operand, type] : {std::pair{node->lhs, lhs}, std::pair{node->rhs, rhs}}) {
    if (!type->is_bool()) {
      throw CompileError(
        ErrorKind::TypeMismatch, operand->get_range(),
        fmt::format("`{}` requires `bool` operands, found `{}`", op, to_string(type)));
    }
  }
  return types_.bool_type();
}

const Type * TypeChecker::infer_unary(UnaryExpr * node)
{
  const Type * operand = check_expr(node->operand);
  switch (node->op) {
    case UnaryOp::Neg:
      if (operand->is_numeric()) return operand;
      break;
    case UnaryOp::Not:
      if (operand->is_bool()) return operand;
      break;
    case UnaryOp::Deref:
      if (operand->is_pointer()) return operand->element_type;
      fail(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("cannot dereference a value of type `{}`", to_string(operand)));
    case UnaryOp::AddressOf:
      return types_.get_pointer_type(operand);
  }
  fail(
    ErrorKind::InvalidOperation, node->get_range(),
    fmt::format("cannot apply unary `{}` to `{}`", to_string(node->op), to_string(operand)));
}

const Type * TypeChecker::infer_field_access(FieldAccessExpr * node)
{
  if (const auto * ref = dyn_cast<VarRefExpr>(node->base); ref && !node->isArrow) {
    const Symbol * sym = env_->lookup(ref->name);
    if (sym && sym->role == SymbolRole::Module) {
      reject_unexported(ref->name, node->field, node->get_range());
      if (env_->lookup_global(env_->qualify(ref->name, node->field))) {
        fail(
          ErrorKind::InvalidOperation, node->get_range(),
          fmt::format("`{}.{}` is not a value", ref->name, node->field));
      }
      fail(
        ErrorKind::UndefinedVariable, node->get_range(),
        fmt::format("module `{}` has no item named `{}`", ref->name, node->field));
    }
  }

  const Type * base = check_expr(node->base);
  const Type * target = base;
  if (node->isArrow) {
    if (!base->is_pointer() || !struct_layout_of(base->element_type)) {
      fail(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("`->` requires a pointer to a struct, found `{}`", to_string(base)));
    }
    target = base->element_type;
  }

  if (const StructLayout * layout = struct_layout_of(target)) {
    if (const Type * field = layout->field_type(node->field)) return field;

    std::vector<std::string_view> names;
    for (const auto & entry : layout->fields) names.push_back(entry.first);
    throw CompileError(
      ErrorKind::UndefinedVariable, node->get_range(),
      fmt::format("struct `{}` has no field `{}`", layout->name, node->field))
      .with_help(fmt::format("available fields: {}", join_names(names)));
  }

  if (target->is_pointer() && struct_layout_of(target->element_type)) {
    throw CompileError(
      ErrorKind::InvalidOperation, node->get_range(),
      fmt::format("cannot access field `{}` through a pointer with `.`", node->field))
      .with_suggestion("use `->`", fmt::format("p->{}", node->field));
  }
  fail(
    ErrorKind::InvalidOperation, node->get_range(),
    fmt::format("type `{}` has no fields", to_string(target)));
}

const Type * TypeChecker::infer_index(IndexExpr * node)
{
  const Type * base = check_expr(node->base);
  const Type * index = check_expr(node->index);
  if (!index->is_int()) {
    throw mismatch(node->index->get_range(), types_.int_type(), index);
  }
  if (const auto negative = negative_literal(node->index)) {
    fail(
      ErrorKind::InvalidOperation, node->index->get_range(),
      fmt::format("index cannot be negative (found {})", *negative));
  }

  switch (base->kind) {
    case TypeKind::Array:
    case TypeKind::DynamicArray:
    case TypeKind::Pointer:
      return base->element_type;
    default:
      if (base->is_string()) return types_.char_type();
      fail(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("cannot index into a value of type `{}`", to_string(base)));
  }
}

const Type * TypeChecker::infer_enum_access(EnumAccessExpr * node, const Type * expected)
{
  const auto & generics = BuiltinGenerics::instance();
  if (const BuiltinGenericType * family = generics.lookup(node->enumName)) {
    const BuiltinVariant * variant = family->find_variant(node->variant);
    if (!variant) {
      throw CompileError(
        ErrorKind::UndefinedType, node->get_range(),
        fmt::format("`{}` has no variant `{}`", family->name, node->variant))
        .with_help(fmt::format(
          "valid variants: {}", join_names(generics.variant_names(family->name))));
    }
    if (variant->has_value) {
      throw CompileError(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("`{}::{}` carries a value", family->name, variant->name))
        .with_suggestion(
          "construct it with a value", fmt::format("{}::{}(value)", family->name, variant->name));
    }
    if (expected && expected->is_generic_of(family->name)) return expected;

    throw CompileError(
      ErrorKind::TypeMismatch, node->get_range(),
      fmt::format("cannot use `{}::{}` without type parameters", family->name, variant->name))
      .with_suggestion(
        "add a type annotation",
        fmt::format("let x: {}<int> = {}::{};", family->name, family->name, variant->name));
  }

  const Symbol * sym = env_->lookup_global(node->enumName);
  if (!sym) {
    fail(
      ErrorKind::UndefinedType, node->get_range(),
      fmt::format("cannot find enum `{}` in this scope", node->enumName));
  }
  const EnumLayout * layout = sym->role == SymbolRole::Enum ? env_->find_enum(node->enumName) : nullptr;
  if (!layout) {
    fail(
      ErrorKind::TypeMismatch, node->get_range(),
      fmt::format("`{}` is a {}, not an enum", node->enumName, to_string(sym->role)));
  }
  if (!layout->discriminant(node->variant)) {
    std::vector<std::string_view> names;
    for (const auto & entry : layout->variants) names.push_back(entry.first);
    throw CompileError(
      ErrorKind::UndefinedType, node->get_range(),
      fmt::format("enum `{}` has no variant `{}`", node->enumName, node->variant))
      .with_help(fmt::format("valid variants: {}", join_names(names)));
  }
  return types_.get_enum_type(node->enumName);
}

const Type * TypeChecker::infer_struct_literal(StructLiteralExpr * node)
{
  const Symbol * sym = env_->lookup_global(node->typeName);
  if (!sym || sym->role != SymbolRole::Struct) {
    if (is_qualified_name(node->typeName)) {
      const auto dot = node->typeName.find('.');
      reject_unexported(
        node->typeName.substr(0, dot), node->typeName.substr(dot + 1), node->get_range());
    }
    fail(
      ErrorKind::UndefinedType, node->get_range(),
      fmt::format("cannot find struct `{}` in this scope", node->typeName));
  }
  const StructLayout * layout = env_->find_struct(node->typeName);
  if (!layout) {
    fail(
      ErrorKind::InternalError, node->get_range(),
      fmt::format("struct `{}` has no registered layout", node->typeName));
  }

  std::unordered_set<std::string_view> seen;
  for (FieldInit * init : node->fields) {
    if (!seen.insert(init->name).second) {
      fail(
        ErrorKind::DuplicateDefinition, init->get_range(),
        fmt::format("field `{}` specified more than once", init->name));
    }
    const Type * field = layout->field_type(init->name);
    if (!field) {
      fail(
        ErrorKind::UndefinedVariable, init->get_range(),
        fmt::format("struct `{}` has no field `{}`", node->typeName, init->name));
    }
    const Type * value = check_expr_with_expected(init->value, field);
    if (!compatible(field, value)) {
      throw mismatch(init->value->get_range(), field, value);
    }
  }
  return types_.get_struct_type(node->typeName);
}

const Type * TypeChecker::infer_array_literal(ArrayLiteralExpr * node, const Type * expected)
{
  const Type * hint = expected && expected->is_array_like() ? expected->element_type : nullptr;

  if (node->elements.empty()) {
    if (expected && expected->kind == TypeKind::Array) return expected;
    throw CompileError(
      ErrorKind::InvalidSyntax, node->get_range(),
      "cannot infer the element type of an empty array literal")
      .with_suggestion("add an array type annotation", "let xs: [int] = [];");
  }

  const Type * first = check_expr_with_expected(node->elements[0], hint);
  for (size_t i = 1; i < node->elements.size(); ++i) {
    Expr * element = node->elements[i];
    const Type * t = check_expr_with_expected(element, hint ? hint : first);
    if (!compatible(first, t)) {
      throw mismatch(element->get_range(), first, t)
        .with_help("all elements of an array literal must have the same type");
    }
  }

  if (expected && expected->kind == TypeKind::Array && compatible(expected->element_type, first)) {
    return expected;
  }
  return types_.get_array_type(first);
}

const Type * TypeChecker::infer_new(NewExpr * node)
{
  if (node->allocType) {
    validate_type(node->allocType, node->get_range());
    const Type * alloc = normalize(node->allocType);
    if (node->isGrowableArray) return alloc;
    if (alloc->is_void()) {
      fail(ErrorKind::InvalidOperation, node->get_range(), "cannot allocate a value of type `void`");
    }
    return types_.get_pointer_type(alloc);
  }

  const Type * init = check_expr(node->initializer);
  if (init->is_void()) {
    fail(ErrorKind::InvalidOperation, node->get_range(), "cannot allocate a value of type `void`");
  }
  return types_.get_pointer_type(init);
}

const Type * TypeChecker::infer_delete(DeleteExpr * node)
{
  const Type * operand = check_expr(node->operand);
  if (!operand->is_pointer() && !operand->is_string()) {
    fail(
      ErrorKind::InvalidOperation, node->get_range(),
      fmt::format("`delete` requires a pointer, found `{}`", to_string(operand)));
  }
  return types_.void_type();
}

const Type * TypeChecker::infer_cast(CastExpr * node)
{
  validate_type(node->targetType, node->get_range());
  const Type * target = normalize(node->targetType);
  const Type * from = check_expr(node->expr);
  if (!is_valid_cast(from, target)) {
    throw CompileError(
      ErrorKind::InvalidOperation, node->get_range(),
      fmt::format("cannot cast `{}` to `{}`", to_string(from), to_string(target)))
      .with_help(
        "casts convert between numeric types, between pointers, between pointers and `int`, "
        "and from `string` to `*char`");
  }
  return target;
}

const Type * TypeChecker::infer_ternary(TernaryExpr * node, const Type * expected)
{
  check_condition(node->condition, "ternary");
  const Type * then_type = check_expr_with_expected(node->thenExpr, expected);
  const Type * else_type =
    check_expr_with_expected(node->elseExpr, expected ? expected : then_type);
  if (!compatible(then_type, else_type)) {
    throw mismatch(node->elseExpr->get_range(), then_type, else_type)
      .with_secondary_label(node->thenExpr->get_range(), "expected because of this branch");
  }
  return then_type;
}

const Type * TypeChecker::check_pattern(MatchPattern * pattern, const Type * scrutinee)
{
  switch (pattern->patternKind) {
    case PatternKind::Wildcard:
      return nullptr;

    case PatternKind::Literal: {
      const Type * lit = check_expr(pattern->literal);
      if (!compatible(scrutinee, lit)) throw mismatch(pattern->get_range(), scrutinee, lit);
      return nullptr;
    }

    case PatternKind::Variant:
      break;
  }

  const auto & generics = BuiltinGenerics::instance();
  if (const BuiltinGenericType * family = generics.lookup(pattern->enumName)) {
    const BuiltinVariant * variant = family->find_variant(pattern->variant);
    if (!variant) {
      throw CompileError(
        ErrorKind::UndefinedType, pattern->get_range(),
        fmt::format("`{}` has no variant `{}`", family->name, pattern->variant))
        .with_help(fmt::format(
          "valid variants: {}", join_names(generics.variant_names(family->name))));
    }
    if (variant->has_value != pattern->has_binding()) {
      throw CompileError(
        ErrorKind::InvalidOperation, pattern->get_range(),
        variant->has_value
          ? fmt::format("pattern `{}::{}` must bind its value", family->name, variant->name)
          : fmt::format("`{}::{}` carries no value to bind", family->name, variant->name))
        .with_suggestion(
          "match the variant's shape",
          variant->has_value ? fmt::format("{}::{}(v) => ...", family->name, variant->name)
                             : fmt::format("{}::{} => ...", family->name, variant->name));
    }
    if (!scrutinee->is_generic_of(family->name)) {
      fail(
        ErrorKind::TypeMismatch, pattern->get_range(),
        fmt::format(
          "pattern `{}::{}` cannot match a value of type `{}`", family->name, variant->name,
          to_string(scrutinee)));
    }
    if (!variant->has_value) return nullptr;
    const auto payload =
      generics.variant_value_type(family->name, variant->name, scrutinee->type_args);
    if (!payload) {
      fail(
        ErrorKind::InternalError, pattern->get_range(),
        fmt::format("no payload type for `{}::{}`", family->name, variant->name));
    }
    return *payload;
  }

  const Symbol * sym = env_->lookup_global(pattern->enumName);
  const EnumLayout * layout =
    sym && sym->role == SymbolRole::Enum ? env_->find_enum(pattern->enumName) : nullptr;
  if (!layout) {
    fail(
      ErrorKind::UndefinedType, pattern->get_range(),
      fmt::format("cannot find enum `{}` in this scope", pattern->enumName));
  }
  const Type * pattern_type = types_.get_enum_type(pattern->enumName);
  if (!compatible(scrutinee, pattern_type)) {
    throw mismatch(pattern->get_range(), scrutinee, pattern_type);
  }
  if (!layout->discriminant(pattern->variant)) {
    fail(
      ErrorKind::UndefinedType, pattern->get_range(),
      fmt::format("enum `{}` has no variant `{}`", pattern->enumName, pattern->variant));
  }
  if (pattern->has_binding()) {
    fail(
      ErrorKind::InvalidOperation, pattern->get_range(),
      fmt::format(
        "variant `{}::{}` carries no value to bind", pattern->enumName, pattern->variant));
  }
  return nullptr;
}

const Type * TypeChecker::infer_match(MatchExpr * node, const Type * expected)
{
  if (node->arms.empty()) {
    fail(ErrorKind::InvalidSyntax, node->get_range(), "`match` needs at least one arm");
  }

  const Type * scrutinee = check_expr(node->scrutinee);

  const Type * result = nullptr;
  const MatchPattern * wildcard = nullptr;
  std::unordered_set<std::string_view> covered;
  std::unordered_map<std::string, const MatchPattern *> seen;

  for (MatchArm * arm : node->arms) {
    MatchPattern * pattern = arm->pattern;
    const Type * binding = check_pattern(pattern, scrutinee);

    // Arms are tried in order; anything after `_` or a repeated pattern never runs
    if (wildcard) {
      throw CompileError(
        ErrorKind::InvalidOperation, pattern->get_range(), "unreachable pattern")
        .with_secondary_label(wildcard->get_range(), "matches any value")
        .with_help("move the wildcard arm to the end of the match");
    }
    if (pattern->patternKind == PatternKind::Wildcard) {
      wildcard = pattern;
    } else {
      const auto [prev, inserted] = seen.emplace(pattern_key(pattern), pattern);
      if (!inserted) {
        throw CompileError(
          ErrorKind::InvalidOperation, pattern->get_range(), "unreachable pattern")
          .with_secondary_label(prev->second->get_range(), "already matched here");
      }
    }
    if (pattern->patternKind == PatternKind::Variant) covered.insert(pattern->variant);

    TypeEnvironment::ScopeGuard scope(*env_);
    if (pattern->has_binding()) {
      define_or_fail(Symbol{
        pattern->binding, SymbolRole::Variable, binding, false, pattern->get_range(), pattern});
    }

    const Type * hint = expected ? expected : result;
    const Type * body = check_expr_with_expected(arm->body, hint);
    if (!result) {
      result = body;
    } else if (!compatible(result, body)) {
      throw mismatch(arm->body->get_range(), result, body)
        .with_secondary_label(node->arms[0]->body->get_range(), "first arm has this type");
    }
  }

  // Exhaustiveness is enforced for user enums only
  if (const EnumLayout * layout = enum_layout_of(scrutinee); layout && !wildcard) {
    std::vector<std::string_view> missing;
    for (const auto & entry : layout->variants) {
      if (!covered.count(entry.first)) missing.push_back(entry.first);
    }
    if (!missing.empty()) {
      throw CompileError(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("non-exhaustive match: missing variants {}", join_names(missing)))
        .with_suggestion("add the missing arms or a wildcard arm", "_ => ...");
    }
  }

  return result;
}

const Type * TypeChecker::infer_try(TryExpr * node)
{
  if (!current_return_) {
    fail(ErrorKind::InvalidOperation, node->get_range(), "`?` can only be used inside a function");
  }

  const Type * operand = check_expr(node->operand);
  const bool is_option = operand->is_generic_of(BuiltinGenerics::k_option);
  const bool is_result = operand->is_generic_of(BuiltinGenerics::k_result);
  if (!is_option && !is_result) {
    fail(
      ErrorKind::TypeMismatch, node->get_range(),
      fmt::format("`?` requires an Option or Result operand, found `{}`", to_string(operand)));
  }

  const Type * ret = current_return_;
  if (!ret->is_generic_of(operand->name)) {
    throw CompileError(
      ErrorKind::TypeMismatch, node->get_range(),
      fmt::format(
        "`?` on `{}` requires the function to return `{}`, but it returns `{}`",
        to_string(operand), operand->name, to_string(ret)));
  }
  if (is_result && !compatible(ret->type_args[1], operand->type_args[1])) {
    throw mismatch(node->get_range(), ret->type_args[1], operand->type_args[1])
      .with_help("the error type of the operand must match the function's error type");
  }

  node->functionReturnType = ret;
  return operand->type_args[0];
}

// ============================================================================
// Calls
// ============================================================================

const Type * TypeChecker::infer_call(CallExpr * node, const Type * expected)
{
  if (auto * ref = dyn_cast<VarRefExpr>(node->callee)) {
    return check_named_call(node, ref);
  }
  if (auto * member = dyn_cast<FieldAccessExpr>(node->callee)) {
    return check_member_call(node, member);
  }
  if (auto * variant = dyn_cast<EnumAccessExpr>(node->callee)) {
    return check_variant_ctor(node, variant, expected);
  }
  fail(ErrorKind::InvalidOperation, node->callee->get_range(), "expression is not callable");
}

const Type * TypeChecker::check_named_call(CallExpr * node, VarRefExpr * callee)
{
  const std::string_view name = callee->name;
  const size_t argc = node->args.size();

  if (name == "print" || name == "println") {
    const bool line = name == "println";
    if (line ? argc > 1 : argc != 1) {
      fail(
        ErrorKind::WrongArgumentCount, node->get_range(),
        fmt::format(
          "`{}` takes {} argument, found {}", name, line ? "at most 1" : "exactly 1", argc));
    }
    for (Expr * arg : node->args) {
      const Type * t = check_expr(arg);
      if (t->is_void()) {
        fail(ErrorKind::TypeMismatch, arg->get_range(), "cannot print a value of type `void`");
      }
    }
    node->callKind = line ? CallKind::Println : CallKind::Print;
    return types_.void_type();
  }

  if (name == "len") {
    if (argc != 1) {
      fail(
        ErrorKind::WrongArgumentCount, node->get_range(),
        fmt::format("`len` takes exactly 1 argument, found {}", argc));
    }
    const Type * t = check_expr(node->args[0]);
    if (!t->is_string()) throw mismatch(node->args[0]->get_range(), types_.string_type(), t);
    node->callKind = CallKind::Len;
    return types_.int_type();
  }

  if (const Symbol * sym = env_->lookup(name)) {
    const FunctionSignature * sig = sym->is_callable() ? env_->find_function(name) : nullptr;
    if (!sig) {
      fail(
        ErrorKind::InvalidOperation, callee->get_range(),
        fmt::format("`{}` is a {}, not a function", name, to_string(sym->role)));
    }
    check_call_args(node, *sig, name);
    node->callKind = CallKind::Function;
    node->targetName = name;
    return sig->returnType;
  }

  if (is_intrinsic(name)) {
    for (Expr * arg : node->args) check_expr(arg);
    node->callKind = CallKind::Intrinsic;
    node->targetName = name;
    return types_.int_type();
  }

  throw CompileError(
    ErrorKind::UndefinedFunction, callee->get_range(),
    fmt::format("cannot find function `{}` in this scope", name))
    .with_help("declare it with `fn` or `extern fn`, or import a module that exports it");
}

const Type * TypeChecker::check_member_call(CallExpr * node, FieldAccessExpr * callee)
{
  if (const auto * ref = dyn_cast<VarRefExpr>(callee->base); ref && !callee->isArrow) {
    const Symbol * sym = env_->lookup(ref->name);
    if (!sym) {
      throw CompileError(
        ErrorKind::UndefinedModule, ref->get_range(),
        fmt::format("cannot find module or value `{}`", ref->name))
        .with_suggestion("import the module", fmt::format("import {};", ref->name));
    }
    if (sym->role == SymbolRole::Module) {
      const std::string_view qualified = env_->qualify(ref->name, callee->field);
      const Symbol * fn = env_->lookup_global(qualified);
      if (!fn) {
        reject_unexported(ref->name, callee->field, callee->get_range());
        fail(
          ErrorKind::UndefinedFunction, callee->get_range(),
          fmt::format("cannot find function `{}` in module `{}`", callee->field, ref->name));
      }
      const FunctionSignature * sig = fn->is_callable() ? env_->find_function(qualified) : nullptr;
      if (!sig) {
        fail(
          ErrorKind::InvalidOperation, callee->get_range(),
          fmt::format("`{}` is a {}, not a function", qualified, to_string(fn->role)));
      }
      check_call_args(node, *sig, qualified);
      node->callKind = CallKind::ModuleFunction;
      node->targetName = callee->field;
      return sig->returnType;
    }
  }
  return check_method_call(node, callee);
}

const Type * TypeChecker::check_method_call(CallExpr * node, FieldAccessExpr * callee)
{
  const Type * receiver = check_expr(callee->base);
  if (callee->isArrow) {
    fail(
      ErrorKind::InvalidOperation, callee->get_range(),
      fmt::format("method `{}` cannot be called through `->`", callee->field));
  }

  const MethodTable & table = MethodTable::instance();
  const MethodSignature * sig = table.resolve(receiver, callee->field);
  if (!sig) {
    if (const auto capability = table.capability_for(callee->field)) {
      fail(
        ErrorKind::InvalidOperation, callee->get_range(),
        fmt::format(
          "type `{}` does not support `.{}()` (requires {})", to_string(receiver), callee->field,
          to_string(*capability)));
    }
    fail(
      ErrorKind::UndefinedFunction, callee->get_range(),
      fmt::format("no method named `{}` found for type `{}`", callee->field, to_string(receiver)));
  }

  if (node->args.size() != sig->params.size()) {
    fail(
      ErrorKind::WrongArgumentCount, node->get_range(),
      fmt::format(
        "method `{}` expects {} argument{}, found {}", callee->field, sig->params.size(),
        sig->params.size() == 1 ? "" : "s", node->args.size()));
  }

  for (size_t i = 0; i < sig->params.size(); ++i) {
    Expr * arg = node->args[i];
    switch (sig->params[i]) {
      case MethodParam::Int: {
        const Type * t = check_expr(arg);
        if (!t->is_int()) throw mismatch(arg->get_range(), types_.int_type(), t);
        break;
      }
      case MethodParam::String: {
        const Type * t = check_expr(arg);
        if (!t->is_string()) throw mismatch(arg->get_range(), types_.string_type(), t);
        break;
      }
      case MethodParam::StringOrChar: {
        const Type * t = check_expr(arg);
        if (!t->is_string() && !t->is_char()) {
          fail(
            ErrorKind::TypeMismatch, arg->get_range(),
            fmt::format("mismatched types: expected `string` or `char`, found `{}`", to_string(t)));
        }
        break;
      }
      case MethodParam::Element: {
        const Type * element = receiver->element_type;
        const Type * t = check_expr_with_expected(arg, element);
        if (!compatible(element, t)) throw mismatch(arg->get_range(), element, t);
        break;
      }
    }
  }

  if (sig->mutates_receiver) {
    const Expr * base = callee->base;
    const bool is_place = isa<VarRefExpr>(base) || isa<FieldAccessExpr>(base) ||
                          isa<IndexExpr>(base) ||
                          (isa<UnaryExpr>(base) && cast<UnaryExpr>(base)->op == UnaryOp::Deref);
    if (!is_place) {
      fail(
        ErrorKind::InvalidOperation, base->get_range(),
        fmt::format("`.{}()` needs a variable or field to modify", callee->field));
    }
    check_assignable(base);
  }

  node->callKind = CallKind::Method;
  node->method = sig->method;
  return table.result_type(types_, *sig, receiver);
}

const Type * TypeChecker::check_variant_ctor(
  CallExpr * node, EnumAccessExpr * callee, const Type * expected)
{
  const auto & generics = BuiltinGenerics::instance();
  const BuiltinGenericType * family = generics.lookup(callee->enumName);
  if (!family) {
    if (env_->find_enum(callee->enumName)) {
      throw CompileError(
        ErrorKind::InvalidOperation, node->get_range(),
        fmt::format("variants of enum `{}` do not carry values", callee->enumName))
        .with_suggestion(
          "drop the parentheses", fmt::format("{}::{}", callee->enumName, callee->variant));
    }
    fail(
      ErrorKind::UndefinedType, callee->get_range(),
      fmt::format("cannot find type `{}` in this scope", callee->enumName));
  }

  const BuiltinVariant * variant = family->find_variant(callee->variant);
  if (!variant) {
    throw CompileError(
      ErrorKind::UndefinedType, callee->get_range(),
      fmt::format("`{}` has no variant `{}`", family->name, callee->variant))
      .with_help(fmt::format(
        "valid variants: {}", join_names(generics.variant_names(family->name))));
  }
  if (!variant->has_value) {
    throw CompileError(
      ErrorKind::InvalidOperation, node->get_range(),
      fmt::format("`{}::{}` does not take a value", family->name, variant->name))
      .with_suggestion(
        "drop the parentheses", fmt::format("{}::{}", family->name, variant->name));
  }
  if (node->args.size() != 1) {
    fail(
      ErrorKind::WrongArgumentCount, node->get_range(),
      fmt::format(
        "`{}::{}` expects 1 argument, found {}", family->name, variant->name, node->args.size()));
  }

  node->callKind = CallKind::VariantCtor;
  Expr * arg = node->args[0];

  if (expected && expected->is_generic_of(family->name)) {
    const auto payload = generics.variant_value_type(family->name, variant->name, expected->type_args);
    if (!payload) {
      fail(
        ErrorKind::InternalError, node->get_range(),
        fmt::format("no payload type for `{}::{}`", family->name, variant->name));
    }
    const Type * found = check_expr_with_expected(arg, *payload);
    if (!compatible(*payload, found)) throw mismatch(arg->get_range(), *payload, found);
    return expected;
  }

  // Without a hint only the payload's own type parameter is known
  const Type * found = check_expr(arg);
  const SubstituteResult result = generics.substitute(types_, family->name, {found});
  if (!result) {
    const ArityMismatch & err = result.error();
    throw CompileError(
      ErrorKind::WrongArgumentCount, node->get_range(),
      fmt::format(
        "cannot infer all {} type arguments of `{}` from `{}::{}`", err.expected, err.family,
        family->name, variant->name))
      .with_suggestion(
        "add a type annotation",
        fmt::format("let r: {}<int, string> = {}::{}(...);", family->name, family->name,
                    variant->name));
  }
  return result.type();
}

void TypeChecker::check_call_args(
  CallExpr * node, const FunctionSignature & sig, std::string_view display_name)
{
  const size_t argc = node->args.size();
  const size_t expected = sig.params.size();
  if (sig.isVariadic ? argc < expected : argc != expected) {
    fail(
      ErrorKind::WrongArgumentCount, node->get_range(),
      fmt::format(
        "function `{}` expects {}{} argument{}, found {}", display_name,
        sig.isVariadic ? "at least " : "", expected, expected == 1 ? "" : "s", argc));
  }

  for (size_t i = 0; i < argc; ++i) {
    Expr * arg = node->args[i];
    if (i >= expected) {
      check_expr(arg);
      continue;
    }
    const Type * param = sig.params[i];
    const Type * found = check_expr_with_expected(arg, param);
    if (!compatible(param, found)) {
      throw mismatch(arg->get_range(), param, found)
        .with_help(fmt::format("argument {} of `{}`", i + 1, display_name));
    }
  }
}

// ============================================================================
// Lookup Helpers
// ============================================================================

const StructLayout * TypeChecker::struct_layout_of(const Type * type) const
{
  if (!type || type->kind != TypeKind::Struct) return nullptr;
  return env_->find_struct(type->name);
}

const EnumLayout * TypeChecker::enum_layout_of(const Type * type) const
{
  if (!type || !type->is_named()) return nullptr;
  return env_->find_enum(type->name);
}

const ImportEdge * TypeChecker::find_import(std::string_view alias) const
{
  for (const auto & edge : module_->imports) {
    if (edge.alias == alias) return &edge;
  }
  return nullptr;
}

void TypeChecker::reject_unexported(
  std::string_view alias, std::string_view name, SourceRange range) const
{
  const ImportEdge * edge = find_import(alias);
  if (!edge || !edge->module->defines(name) || edge->module->is_exported(name)) return;

  throw CompileError(
    ErrorKind::ExportNotFound, range,
    fmt::format("`{}` is not exported by module `{}`", name, edge->module->name))
    .with_suggestion(
      fmt::format("export it from `{}`", edge->module->name), fmt::format("export {};", name));
}

const Type * TypeChecker::normalize(const Type * type) const
{
  if (type && type->kind == TypeKind::Struct && type->name == "str") {
    return types_.string_type();
  }
  return type;
}

void TypeChecker::fail(ErrorKind kind, SourceRange range, std::string message)
{
  throw CompileError(kind, range, std::move(message));
}

}  // namespace rapter
