// rapter/codegen/c_generator.cpp - Lower checked modules to one C translation unit
//
#include "rapter/codegen/c_generator.hpp"

#include <fmt/format.h>

#include <utility>

#include "rapter/basic/casting.hpp"
#include "rapter/codegen/name_mangler.hpp"
#include "rapter/codegen/runtime_helpers.hpp"
#include "rapter/sema/types/builtin_generics.hpp"
#include "rapter/sema/types/intrinsics.hpp"
#include "rapter/sema/types/type_utils.hpp"

namespace rapter
{

namespace
{

// C keywords that are valid Rapter identifiers
constexpr std::string_view k_c_keywords[] = {
  "auto",     "case",   "default", "do",       "double",   "float",  "goto",
  "inline",   "long",   "register", "restrict", "short",    "signed", "sizeof",
  "static",   "switch", "typedef", "union",    "unsigned", "volatile", "char",
  "int",      "void",   "extern",  "struct",   "enum",
};

std::string ident(std::string_view name)
{
  for (const std::string_view keyword : k_c_keywords) {
    if (keyword == name) return std::string(name) + "_";
  }
  return std::string(name);
}

std::string escape(char c, char quote)
{
  switch (c) {
    case '\n':
      return "\\n";
    case '\t':
      return "\\t";
    case '\r':
      return "\\r";
    case '\\':
      return "\\\\";
    default:
      break;
  }
  if (c == quote) return std::string("\\") + c;
  const auto byte = static_cast<unsigned char>(c);
  if (byte < 0x20 || byte == 0x7f) return fmt::format("\\{:03o}", byte);
  return std::string(1, c);
}

std::string c_string(std::string_view text)
{
  std::string out = "\"";
  for (const char c : text) out += escape(c, '"');
  out += '"';
  return out;
}

std::string c_char(char c)
{
  return "'" + escape(c, '\'') + "'";
}

const Type * payload_type(const Type * generic, std::string_view variant)
{
  const auto payload =
    BuiltinGenerics::instance().variant_value_type(generic->name, variant, generic->type_args);
  return payload ? *payload : nullptr;
}

std::string join(const std::vector<std::string> & parts, std::string_view sep)
{
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

/// True when `e` lowers to a C constant expression.
bool is_constant_expr(const Expr * e)
{
  switch (e->get_kind()) {
    case NodeKind::IntLiteral:
    case NodeKind::FloatLiteral:
    case NodeKind::CharLiteral:
    case NodeKind::StringLiteral:
    case NodeKind::BoolLiteral:
      return true;
    case NodeKind::Unary: {
      const auto * node = cast<UnaryExpr>(e);
      return (node->op == UnaryOp::Neg || node->op == UnaryOp::Not) &&
             is_constant_expr(node->operand);
    }
    case NodeKind::Binary: {
      const auto * node = cast<BinaryExpr>(e);
      // string concatenation and comparison go through runtime calls
      if (node->lhs->resolvedType && node->lhs->resolvedType->is_string()) return false;
      return is_constant_expr(node->lhs) && is_constant_expr(node->rhs);
    }
    case NodeKind::Cast:
      return is_constant_expr(cast<CastExpr>(e)->expr);
    case NodeKind::Ternary: {
      const auto * node = cast<TernaryExpr>(e);
      return is_constant_expr(node->condition) && is_constant_expr(node->thenExpr) &&
             is_constant_expr(node->elseExpr);
    }
    case NodeKind::EnumAccess:
      return e->resolvedType && !e->resolvedType->is_generic();
    default:
      return false;
  }
}

bool is_aggregate(const Type * type)
{
  switch (type->kind) {
    case TypeKind::Struct:
      return !type->is_string();
    case TypeKind::Generic:
    case TypeKind::DynamicArray:
      return true;
    default:
      return false;
  }
}

}  // namespace

CGenerator::CGenerator(ModuleGraph & graph) : graph_(graph) {}

// ============================================================================
// Program Structure
// ============================================================================

std::string CGenerator::generate()
{
  out_.clear();
  structs_.clear();
  enums_.clear();
  emitted_.clear();
  in_progress_.clear();
  array_scopes_.assign(1, {});
  indent_ = 0;
  temp_counter_ = 0;
  collector_ = InstantiationCollector{};

  modules_ = graph_.dependency_order();
  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    for (const StructDecl * decl : module->program->structs) structs_.emplace(decl->name, decl);
    for (const EnumDecl * decl : module->program->enums) enums_.insert(decl->name);
  }

  check_name_collisions();
  collector_.collect(graph_);

  out_ += runtime::headers();
  out_ += '\n';
  out_ += runtime::primitive_dynamic_arrays();
  out_ += '\n';
  emit_enums();
  emit_type_definitions();
  out_ += runtime::helper_functions();
  out_ += '\n';
  emit_forward_declarations();
  emit_globals();
  emit_functions();
  emit_main_trampoline();

  std::string result;
  result.swap(out_);
  return result;
}

void CGenerator::check_name_collisions()
{
  std::unordered_map<std::string_view, const ModuleInfo *> owners;

  auto claim = [&](std::string_view name, SourceRange range, const ModuleInfo * module) {
    if (is_runtime_helper(name)) {
      throw CompileError(
        ErrorKind::DuplicateDefinition, range,
        fmt::format("`{}` is reserved by the Rapter runtime", name))
        .with_help("rename the item");
    }
    const auto [it, inserted] = owners.emplace(name, module);
    if (inserted || it->second == module) return;
    throw CompileError(
      ErrorKind::DuplicateDefinition, range,
      fmt::format(
        "`{}` is defined in both module `{}` and module `{}`", name, it->second->name,
        module->name))
      .with_help("all modules share one C namespace; rename one of the definitions");
  };

  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    const Program & program = *module->program;
    for (const StructDecl * decl : program.structs) claim(decl->name, decl->get_range(), module);
    for (const EnumDecl * decl : program.enums) claim(decl->name, decl->get_range(), module);
    for (const FunctionDecl * decl : program.functions) {
      claim(decl->name, decl->get_range(), module);
    }
    for (const GlobalVarDecl * decl : program.globals) {
      claim(decl->name, decl->get_range(), module);
    }
  }
}

void CGenerator::emit_enums()
{
  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    for (const EnumDecl * decl : module->program->enums) {
      if (decl->variants.empty()) {
        throw unsupported(decl->get_range(), fmt::format("enum `{}` has no variants", decl->name));
      }
      out_ += "typedef enum {\n";
      int64_t next = 0;
      for (size_t i = 0; i < decl->variants.size(); ++i) {
        const EnumVariantDecl * variant = decl->variants[i];
        const int64_t value = variant->hasValue ? variant->value : next;
        next = value + 1;
        out_ += fmt::format(
          "    {} = {}{}\n", enum_constant(decl->name, variant->name), value,
          i + 1 < decl->variants.size() ? "," : "");
      }
      out_ += fmt::format("}} {};\n\n", decl->name);
    }
  }
}

void CGenerator::emit_type_definitions()
{
  bool any_struct = false;
  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    for (const StructDecl * decl : module->program->structs) {
      out_ += fmt::format("typedef struct {0} {0};\n", decl->name);
      any_struct = true;
    }
  }
  if (any_struct) out_ += '\n';

  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    for (const StructDecl * decl : module->program->structs) emit_struct(*decl);
  }

  // every struct gets a growable-array companion
  TypeContext & types = graph_.types();
  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    for (const StructDecl * decl : module->program->structs) {
      emit_dynamic_array(
        types.get_dynamic_array_type(types.get_struct_type(decl->name)), decl->get_range());
    }
  }

  for (const Type * type : collector_.types()) require_complete(type, SourceRange{});
}

void CGenerator::emit_forward_declarations()
{
  std::unordered_set<std::string_view> externs;
  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    for (const ExternFunctionDecl * decl : module->program->externFunctions) {
      if (is_intrinsic(decl->name) || is_runtime_helper(decl->name)) continue;
      if (!externs.insert(decl->name).second) continue;
      out_ += extern_signature(*decl) + ";\n";
    }
  }
  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    for (const FunctionDecl * decl : module->program->functions) {
      out_ += function_signature(*decl) + ";\n";
    }
  }
  out_ += '\n';
}

void CGenerator::emit_globals()
{
  bool any = false;
  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    for (const GlobalVarDecl * decl : module->program->globals) {
      any = true;
      const Type * type = decl->varType;
      const std::string_view qual = decl->isConst ? "const " : "";
      const std::string name = ident(decl->name);

      const auto * array = dyn_cast<ArrayLiteralExpr>(decl->initializer);
      if (type->kind == TypeKind::Array && array && !array->elements.empty()) {
        for (const Expr * element : array->elements) {
          if (!is_constant_expr(element)) {
            throw unsupported(
              element->get_range(),
              fmt::format("initializer of global `{}` is not a constant expression", decl->name));
          }
        }
        out_ += fmt::format(
          "static {}{} {}[] = {{ {} }};\n", qual, c_type(type->element_type), name,
          args(array->elements));
        array_scopes_.front()[decl->name] = true;
        continue;
      }

      array_scopes_.front()[decl->name] = false;
      if (!decl->initializer) {
        out_ += fmt::format("static {}{} {}{};\n", qual, c_type(type), name,
                            is_aggregate(type) ? " = {0}" : "");
        continue;
      }
      out_ += fmt::format(
        "static {}{} {} = {};\n", qual, c_type(type), name, constant_initializer(*decl));
    }
  }
  if (any) out_ += '\n';
}

void CGenerator::emit_functions()
{
  for (const ModuleInfo * module : modules_) {
    if (!module->program) continue;
    for (const FunctionDecl * decl : module->program->functions) {
      array_scopes_.emplace_back();
      for (const ParamDecl * param : decl->params) declare_local(param->name, false);

      out_ += function_signature(*decl) + " {\n";
      indent_ = 1;
      for (const Stmt * stmt : decl->body) emit_stmt(stmt);
      indent_ = 0;
      out_ += "}\n\n";

      array_scopes_.pop_back();
    }
  }
}

void CGenerator::emit_main_trampoline()
{
  const ModuleInfo * entry = graph_.entry();
  const FunctionDecl * main_fn = entry ? entry->find_function("main") : nullptr;
  if (!main_fn) return;

  const size_t param_count = main_fn->params.size();
  if (param_count != 0 && param_count != 2) {
    throw unsupported(
      main_fn->get_range(), "`main` must take no parameters or exactly two (argc, argv)");
  }

  const std::string call =
    param_count == 2 ? "rapter_main(argc, argv)" : "rapter_main()";
  out_ += "int main(int argc, char* argv[]) {\n";
  out_ += "    __rapter_argc = argc;\n";
  out_ += "    __rapter_argv = argv;\n";
  if (main_fn->returnType && main_fn->returnType->is_int()) {
    out_ += fmt::format("    return {};\n", call);
  } else {
    out_ += fmt::format("    {};\n", call);
    out_ += "    return 0;\n";
  }
  out_ += "}\n";
}

std::string CGenerator::function_signature(const FunctionDecl & fn) const
{
  std::vector<std::string> params;
  for (const ParamDecl * param : fn.params) {
    params.push_back(fmt::format("{} {}", c_type(param->type), ident(param->name)));
  }
  const std::string name = fn.name == "main" ? "rapter_main" : std::string(fn.name);
  return fmt::format(
    "{} {}({})", c_type(fn.returnType), name, params.empty() ? "void" : join(params, ", "));
}

std::string CGenerator::extern_signature(const ExternFunctionDecl & fn) const
{
  std::vector<std::string> params;
  for (const ParamDecl * param : fn.params) {
    params.push_back(fmt::format("{} {}", c_type(param->type), ident(param->name)));
  }
  if (fn.isVariadic) {
    if (params.empty()) {
      throw unsupported(
        fn.get_range(),
        fmt::format("variadic extern `{}` needs at least one named parameter", fn.name));
    }
    params.emplace_back("...");
  }
  return fmt::format(
    "{} {}({})", c_type(fn.returnType), fn.name, params.empty() ? "void" : join(params, ", "));
}

// ============================================================================
// Type Definitions
// ============================================================================

void CGenerator::require_complete(const Type * type, SourceRange range)
{
  switch (type->kind) {
    case TypeKind::Struct: {
      if (type->is_string() || is_enum(type)) return;
      const auto it = structs_.find(unqualified_name(type->name));
      if (it == structs_.end()) {
        throw CompileError(
          ErrorKind::InternalError, range,
          fmt::format("no declaration found for struct `{}`", type->name));
      }
      emit_struct(*it->second);
      return;
    }
    case TypeKind::Generic:
      emit_generic(type, range);
      return;
    case TypeKind::DynamicArray:
      if (!is_primitive_dynamic_array(type->element_type)) emit_dynamic_array(type, range);
      return;
    case TypeKind::Pointer:
    case TypeKind::Array:
      require_declared(type->element_type, range);
      return;
    case TypeKind::TypeParam:
      throw CompileError(
        ErrorKind::InternalError, range,
        fmt::format("unresolved type parameter `{}` reached code generation", type->name));
    default:
      return;
  }
}

void CGenerator::require_declared(const Type * type, SourceRange range)
{
  switch (type->kind) {
    case TypeKind::Pointer:
    case TypeKind::Array:
      require_declared(type->element_type, range);
      return;
    case TypeKind::Generic:
    case TypeKind::DynamicArray:
    case TypeKind::TypeParam:
      require_complete(type, range);
      return;
    default:
      // structs have forward typedefs, enums are already complete
      return;
  }
}

void CGenerator::emit_struct(const StructDecl & decl)
{
  const std::string key = "struct " + std::string(decl.name);
  if (emitted_.count(key) > 0) return;
  if (!in_progress_.insert(key).second) {
    throw unsupported(
      decl.get_range(), fmt::format("struct `{}` contains itself by value", decl.name))
      .with_help("store the recursive field behind a pointer");
  }

  for (const FieldDecl * field : decl.fields) {
    if (field->type->is_void()) {
      throw unsupported(
        field->get_range(), fmt::format("field `{}` cannot have type `void`", field->name));
    }
    require_complete(field->type, field->get_range());
  }

  std::string text = fmt::format("struct {} {{\n", decl.name);
  for (const FieldDecl * field : decl.fields) {
    text += fmt::format("    {} {};\n", c_type(field->type), ident(field->name));
  }
  text += "};\n\n";
  out_ += text;

  in_progress_.erase(key);
  emitted_.insert(key);
}

void CGenerator::emit_generic(const Type * type, SourceRange range)
{
  const std::string name = mangle(type);
  if (emitted_.count(name) > 0) return;
  if (!in_progress_.insert(name).second) {
    throw unsupported(range, fmt::format("type `{}` contains itself by value", to_string(type)));
  }

  const BuiltinGenericType * family = BuiltinGenerics::instance().lookup(type->name);
  if (!family) {
    throw CompileError(
      ErrorKind::InternalError, range,
      fmt::format("`{}` is not a builtin generic family", type->name));
  }

  std::vector<std::pair<const BuiltinVariant *, const Type *>> payloads;
  for (const BuiltinVariant & variant : family->variants) {
    if (!variant.has_value) continue;
    const Type * payload = payload_type(type, variant.name);
    if (!payload || payload->is_void()) {
      throw unsupported(
        range, fmt::format(
                 "`{}` cannot carry a `void` payload in variant `{}`", to_string(type),
                 variant.name));
    }
    require_complete(payload, range);
    payloads.emplace_back(&variant, payload);
  }

  std::vector<std::string> tags;
  for (const BuiltinVariant & variant : family->variants) {
    tags.push_back(variant_tag(type, variant.name));
  }

  std::string text = fmt::format("typedef enum {{ {} }} {}_Tag;\n", join(tags, ", "), name);
  text += "typedef struct {\n";
  text += fmt::format("    {}_Tag tag;\n", name);
  if (!payloads.empty()) {
    text += "    union {\n";
    for (const auto & [variant, payload] : payloads) {
      text += fmt::format("        {} {};\n", c_type(payload), variant_field(variant->name));
    }
    text += "    } data;\n";
  }
  text += fmt::format("}} {};\n", name);
  for (const BuiltinVariant & variant : family->variants) {
    if (variant.has_value) continue;
    text += fmt::format(
      "#define {} (({}){{ .tag = {} }})\n", variant_macro(type, variant.name), name,
      variant_tag(type, variant.name));
  }
  text += '\n';
  out_ += text;

  in_progress_.erase(name);
  emitted_.insert(name);
}

void CGenerator::emit_dynamic_array(const Type * type, SourceRange range)
{
  const std::string name = c_type(type);
  if (emitted_.count(name) > 0) return;
  require_declared(type->element_type, range);
  out_ += fmt::format(
    "typedef struct {{ {}* data; size_t size; size_t capacity; }} {};\n\n",
    c_type(type->element_type), name);
  emitted_.insert(name);
}

// ============================================================================
// Statements
// ============================================================================

void CGenerator::emit_block(gsl::span<Stmt * const> body)
{
  array_scopes_.emplace_back();
  for (const Stmt * stmt : body) emit_stmt(stmt);
  array_scopes_.pop_back();
}

void CGenerator::emit_stmt(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::Let:
      emit_let(*cast<LetStmt>(stmt));
      return;

    case NodeKind::Assign: {
      const auto * node = cast<AssignStmt>(stmt);
      if (const auto * ref = dyn_cast<VarRefExpr>(node->target);
          ref && is_sized_array(ref->name)) {
        throw unsupported(
          node->get_range(),
          fmt::format("cannot reassign array `{}` initialized from a literal", ref->name))
          .with_help("use a DynamicArray for a sequence that changes");
      }
      line(fmt::format("{} = {};", expr(node->target), expr(node->value)));
      return;
    }

    case NodeKind::ExprStmt:
      line(expr(cast<ExprStmt>(stmt)->expr) + ";");
      return;

    case NodeKind::Return: {
      const auto * node = cast<ReturnStmt>(stmt);
      line(node->value ? fmt::format("return {};", expr(node->value)) : "return;");
      return;
    }

    case NodeKind::Break:
      line("break;");
      return;

    case NodeKind::Continue:
      line("continue;");
      return;

    case NodeKind::If:
      emit_if(*cast<IfStmt>(stmt), false);
      return;

    case NodeKind::While: {
      const auto * node = cast<WhileStmt>(stmt);
      line(fmt::format("while ({}) {{", expr(node->condition)));
      ++indent_;
      emit_block(node->body);
      --indent_;
      line("}");
      return;
    }

    case NodeKind::For:
      emit_for(*cast<ForStmt>(stmt));
      return;

    default:
      throw CompileError(
        ErrorKind::InternalError, stmt->get_range(), "unexpected statement node");
  }
}

void CGenerator::emit_let(const LetStmt & node)
{
  const Type * type = node.varType;
  const std::string name = ident(node.name);
  const std::string_view qual = node.isConst ? "const " : "";

  if (const auto * array = dyn_cast<ArrayLiteralExpr>(node.initializer);
      array && type->kind == TypeKind::Array) {
    if (array->elements.empty()) {
      line(fmt::format("{}{} {} = NULL;", qual, c_type(type), name));
      declare_local(node.name, false);
      return;
    }
    line(fmt::format(
      "{}{} {}[] = {{ {} }};", qual, c_type(type->element_type), name, args(array->elements)));
    declare_local(node.name, true);
    return;
  }

  if (!node.initializer) {
    line(fmt::format("{}{} {}{};", qual, c_type(type), name, is_aggregate(type) ? " = {0}" : ""));
  } else {
    line(fmt::format("{}{} {} = {};", qual, c_type(type), name, expr(node.initializer)));
  }
  declare_local(node.name, false);
}

void CGenerator::emit_if(const IfStmt & node, bool chained)
{
  const std::string head = fmt::format("if ({}) {{", expr(node.condition));
  line(chained ? "} else " + head : head);
  ++indent_;
  emit_block(node.thenBody);
  --indent_;

  if (node.hasElse) {
    if (node.elseBody.size() == 1 && isa<IfStmt>(node.elseBody[0])) {
      emit_if(*cast<IfStmt>(node.elseBody[0]), true);
      return;
    }
    line("} else {");
    ++indent_;
    emit_block(node.elseBody);
    --indent_;
  }
  line("}");
}

void CGenerator::emit_for(const ForStmt & node)
{
  const std::string var = ident(node.varName);

  auto emit_body = [&]() {
    array_scopes_.emplace_back();
    declare_local(node.varName, false);
    emit_block(node.body);
    array_scopes_.pop_back();
  };

  if (const auto * range = dyn_cast<RangeExpr>(node.iterable)) {
    const std::string end = temp("end");
    line(fmt::format(
      "for (int {0} = {1}, {2} = {3}; {0} < {2}; {0}++) {{", var, expr(range->start), end,
      expr(range->end)));
    ++indent_;
    emit_body();
    --indent_;
    line("}");
    return;
  }

  const Type * iterable = node.iterable->resolvedType;
  const std::string elem_type = c_type(node.elementType);
  const std::string index = temp("i");

  if (iterable->kind == TypeKind::DynamicArray) {
    const std::string seq = temp("iter");
    line("{");
    ++indent_;
    line(fmt::format("{} {} = {};", c_type(iterable), seq, expr(node.iterable)));
    line(fmt::format("for (size_t {0} = 0; {0} < {1}.size; {0}++) {{", index, seq));
    ++indent_;
    line(fmt::format("{} {} = {}.data[{}];", elem_type, var, seq, index));
    emit_body();
    --indent_;
    line("}");
    --indent_;
    line("}");
    return;
  }

  // fixed arrays need a length known to the C compiler
  std::string seq;
  bool wrapped = false;
  const auto * ref = dyn_cast<VarRefExpr>(node.iterable);
  const auto * literal = dyn_cast<ArrayLiteralExpr>(node.iterable);
  if (ref && is_sized_array(ref->name)) {
    seq = ident(ref->name);
  } else if (literal && !literal->elements.empty()) {
    seq = temp("arr");
    line("{");
    ++indent_;
    line(fmt::format("{} {}[] = {{ {} }};", elem_type, seq, args(literal->elements)));
    wrapped = true;
  } else {
    throw unsupported(node.iterable->get_range(), "cannot iterate over an array of unknown length")
      .with_help("iterate over a DynamicArray or an index range instead");
  }

  line(fmt::format(
    "for (size_t {0} = 0; {0} < sizeof({1}) / sizeof({1}[0]); {0}++) {{", index, seq));
  ++indent_;
  line(fmt::format("{} {} = {}[{}];", elem_type, var, seq, index));
  emit_body();
  --indent_;
  line("}");
  if (wrapped) {
    --indent_;
    line("}");
  }
}

// ============================================================================
// Expressions
// ============================================================================

std::string CGenerator::expr(const Expr * e)
{
  switch (e->get_kind()) {
    case NodeKind::IntLiteral:
      return std::to_string(cast<IntLiteralExpr>(e)->value);

    case NodeKind::FloatLiteral: {
      const auto * node = cast<FloatLiteralExpr>(e);
      if (!node->spelling.empty()) return std::string(node->spelling);
      return fmt::format("{:#}", node->value);
    }

    case NodeKind::CharLiteral:
      return c_char(cast<CharLiteralExpr>(e)->value);

    case NodeKind::StringLiteral:
      return c_string(cast<StringLiteralExpr>(e)->value);

    case NodeKind::BoolLiteral:
      return cast<BoolLiteralExpr>(e)->value ? "1" : "0";

    case NodeKind::VarRef:
      return ident(cast<VarRefExpr>(e)->name);

    case NodeKind::Binary:
      return binary(*cast<BinaryExpr>(e));

    case NodeKind::Unary: {
      const auto * node = cast<UnaryExpr>(e);
      return fmt::format("({}{})", to_string(node->op), expr(node->operand));
    }

    case NodeKind::Call:
      return call(*cast<CallExpr>(e));

    case NodeKind::FieldAccess: {
      const auto * node = cast<FieldAccessExpr>(e);
      return fmt::format("{}{}{}", expr(node->base), node->isArrow ? "->" : ".", ident(node->field));
    }

    case NodeKind::Index: {
      const auto * node = cast<IndexExpr>(e);
      const Type * base = node->base->resolvedType;
      const bool growable = base && base->kind == TypeKind::DynamicArray;
      return fmt::format("{}{}[{}]", expr(node->base), growable ? ".data" : "", expr(node->index));
    }

    case NodeKind::EnumAccess: {
      const auto * node = cast<EnumAccessExpr>(e);
      if (e->resolvedType && e->resolvedType->is_generic()) {
        return variant_macro(e->resolvedType, node->variant);
      }
      return enum_constant(node->enumName, node->variant);
    }

    case NodeKind::StructLiteral: {
      const auto * node = cast<StructLiteralExpr>(e);
      if (node->fields.empty()) return fmt::format("(({}){{0}})", c_type(e->resolvedType));
      std::vector<std::string> parts;
      for (const FieldInit * field : node->fields) {
        parts.push_back(fmt::format(".{} = {}", ident(field->name), expr(field->value)));
      }
      return fmt::format("(({}){{ {} }})", c_type(e->resolvedType), join(parts, ", "));
    }

    case NodeKind::ArrayLiteral: {
      const auto * node = cast<ArrayLiteralExpr>(e);
      if (node->elements.empty()) return "NULL";
      return fmt::format(
        "(({}[]){{ {} }})", c_type(e->resolvedType->element_type), args(node->elements));
    }

    case NodeKind::New: {
      const auto * node = cast<NewExpr>(e);
      if (node->isGrowableArray) return fmt::format("(({}){{ NULL, 0, 0 }})", c_type(e->resolvedType));
      if (!node->initializer) {
        return fmt::format("(({0}*)malloc(sizeof({0})))", c_type(e->resolvedType->element_type));
      }
      const std::string type = c_type(node->initializer->resolvedType);
      const std::string ptr = temp("new");
      return fmt::format(
        "({{ {0}* {1} = ({0}*)malloc(sizeof({0})); *{1} = {2}; {1}; }})", type, ptr,
        expr(node->initializer));
    }

    case NodeKind::Delete:
      return fmt::format("free({})", expr(cast<DeleteExpr>(e)->operand));

    case NodeKind::Cast:
      return fmt::format("(({}){})", c_type(e->resolvedType), expr(cast<CastExpr>(e)->expr));

    case NodeKind::Ternary: {
      const auto * node = cast<TernaryExpr>(e);
      return fmt::format(
        "({} ? {} : {})", expr(node->condition), expr(node->thenExpr), expr(node->elseExpr));
    }

    case NodeKind::Range:
      throw unsupported(e->get_range(), "a range can only be used as a `for` iterable");

    case NodeKind::Match:
      return match(*cast<MatchExpr>(e));

    case NodeKind::Try:
      return try_expr(*cast<TryExpr>(e));

    case NodeKind::MissingExpr:
      throw CompileError(
        ErrorKind::InternalError, e->get_range(), "malformed expression reached code generation");

    default:
      break;
  }
  throw CompileError(ErrorKind::InternalError, e->get_range(), "unexpected expression node");
}

std::string CGenerator::binary(const BinaryExpr & node)
{
  const Type * lhs_type = node.lhs->resolvedType;
  const std::string lhs = expr(node.lhs);
  const std::string rhs = expr(node.rhs);

  if (lhs_type && lhs_type->is_string()) {
    if (node.op == BinaryOp::Add) return fmt::format("rapter_concat({}, {})", lhs, rhs);
    if (is_comparison(node.op)) {
      return fmt::format("(strcmp({}, {}) {} 0)", lhs, rhs, to_string(node.op));
    }
  }
  return fmt::format("({} {} {})", lhs, to_string(node.op), rhs);
}

std::string CGenerator::call(const CallExpr & node)
{
  switch (node.callKind) {
    case CallKind::Print:
      return print_call(node, false);
    case CallKind::Println:
      return print_call(node, true);
    case CallKind::Len:
      return fmt::format("((int)strlen({}))", expr(node.args[0]));
    case CallKind::Function:
    case CallKind::ModuleFunction: {
      const std::string name =
        node.targetName == "main" ? "rapter_main" : std::string(node.targetName);
      return fmt::format("{}({})", name, args(node.args));
    }
    case CallKind::Intrinsic:
      return fmt::format("{}({})", node.targetName, args(node.args));
    case CallKind::Method:
      return method_call(node);
    case CallKind::VariantCtor:
      return variant_ctor(node);
    case CallKind::Unresolved:
      break;
  }
  throw CompileError(
    ErrorKind::InternalError, node.get_range(), "call was not resolved by the type checker");
}

std::string CGenerator::print_call(const CallExpr & node, bool newline)
{
  const std::string_view nl = newline ? "\\n" : "";
  if (node.args.empty()) return fmt::format("printf(\"{}\")", nl);

  const Expr * arg = node.args[0];
  const Type * type = arg->resolvedType;

  if (const std::string_view spec = format_spec(type); !spec.empty()) {
    if (type->is_pointer()) return fmt::format("printf(\"%p{}\", (void*){})", nl, expr(arg));
    return fmt::format("printf(\"{}{}\", {})", spec, nl, expr(arg));
  }

  if (type->is_array_like()) {
    const Type * element = type->element_type;
    const std::string_view spec = format_spec(element);
    if (spec.empty() || element->is_pointer()) {
      throw unsupported(
        arg->get_range(), fmt::format("cannot print elements of type `{}`", to_string(element)));
    }

    std::string prologue;
    std::string data;
    std::string count;
    const auto * ref = dyn_cast<VarRefExpr>(arg);
    const auto * literal = dyn_cast<ArrayLiteralExpr>(arg);
    if (type->kind == TypeKind::DynamicArray) {
      const std::string seq = temp("seq");
      prologue = fmt::format("{} {} = {}; ", c_type(type), seq, expr(arg));
      data = seq + ".data";
      count = seq + ".size";
    } else if (ref && is_sized_array(ref->name)) {
      data = ident(ref->name);
      count = fmt::format("sizeof({0}) / sizeof({0}[0])", data);
    } else if (literal && !literal->elements.empty()) {
      data = temp("arr");
      prologue = fmt::format("{} {}[] = {{ {} }}; ", c_type(element), data, args(literal->elements));
      count = fmt::format("sizeof({0}) / sizeof({0}[0])", data);
    } else {
      throw unsupported(arg->get_range(), "cannot print an array of unknown length");
    }

    const std::string i = temp("i");
    return fmt::format(
      "({{ {0}printf(\"[\"); for (size_t {1} = 0; {1} < {2}; {1}++) {{ if ({1}) printf(\", \"); "
      "printf(\"{3}\", {4}[{1}]); }} printf(\"]{5}\"); }})",
      prologue, i, count, spec, data, nl);
  }

  throw unsupported(
    arg->get_range(), fmt::format("cannot print a value of type `{}`", to_string(type)));
}

std::string CGenerator::method_call(const CallExpr & node)
{
  const auto * callee = cast<FieldAccessExpr>(node.callee);
  const std::string receiver = expr(callee->base);

  switch (node.method) {
    case BuiltinMethod::StringLength:
      return fmt::format("((int)strlen({}))", receiver);
    case BuiltinMethod::StringSubstring:
      return fmt::format(
        "rapter_substring({}, {}, {})", receiver, expr(node.args[0]), expr(node.args[1]));
    case BuiltinMethod::StringContains:
      return fmt::format("rapter_contains({}, {})", receiver, expr(node.args[0]));
    case BuiltinMethod::StringTrim:
      return fmt::format("rapter_trim({})", receiver);
    case BuiltinMethod::StringSplit: {
      const Expr * delim = node.args[0];
      const std::string text = delim->resolvedType && delim->resolvedType->is_char()
                                 ? fmt::format("((char[]){{ {}, 0 }})", expr(delim))
                                 : expr(delim);
      return fmt::format("rapter_split({}, {})", receiver, text);
    }
    case BuiltinMethod::ArrayLength:
      return fmt::format("((int){}.size)", receiver);
    case BuiltinMethod::ArrayPush: {
      const std::string vec = temp("vec");
      return fmt::format(
        "({{ {0}* {1} = &{2}; if ({1}->size == {1}->capacity) {{ {1}->capacity = "
        "{1}->capacity ? {1}->capacity * 2 : 4; {1}->data = realloc({1}->data, "
        "{1}->capacity * sizeof(*{1}->data)); }} {1}->data[{1}->size++] = {3}; }})",
        c_type(callee->base->resolvedType), vec, receiver, expr(node.args[0]));
    }
    case BuiltinMethod::ArrayPop:
      return fmt::format("{0}.data[rapter_pop_index(&{0}.size)]", receiver);
    case BuiltinMethod::None:
      break;
  }
  throw CompileError(
    ErrorKind::InternalError, node.get_range(), "method call was not resolved by the type checker");
}

std::string CGenerator::variant_ctor(const CallExpr & node)
{
  const Type * type = node.resolvedType;
  const auto * callee = cast<EnumAccessExpr>(node.callee);
  return fmt::format(
    "(({0}){{ .tag = {1}, .data = {{ .{2} = {3} }} }})", c_type(type),
    variant_tag(type, callee->variant), variant_field(callee->variant), expr(node.args[0]));
}

std::string CGenerator::match(const MatchExpr & node)
{
  const Type * scrutinee_type = node.scrutinee->resolvedType;
  const Type * result_type = node.resolvedType;

  const std::string scrutinee = temp("match");
  const std::string result =
    result_type && !result_type->is_void() ? temp("result") : std::string();

  std::string text =
    fmt::format("({{ {} {} = {}; ", c_type(scrutinee_type), scrutinee, expr(node.scrutinee));
  if (!result.empty()) text += fmt::format("{} {}; ", c_type(result_type), result);

  const bool use_switch = scrutinee_type->is_generic() || scrutinee_type->is_int() ||
                          scrutinee_type->is_char() || is_enum(scrutinee_type);
  text += use_switch ? match_switch(node, scrutinee, result) : match_chain(node, scrutinee, result);

  if (!result.empty()) text += fmt::format(" {};", result);
  text += " })";
  return text;
}

std::string CGenerator::match_switch(
  const MatchExpr & node, const std::string & scrutinee, const std::string & result)
{
  const Type * type = node.scrutinee->resolvedType;
  std::string text = fmt::format("switch ({}{}) {{", scrutinee, type->is_generic() ? ".tag" : "");

  for (const MatchArm * arm : node.arms) {
    const MatchPattern & pattern = *arm->pattern;
    switch (pattern.patternKind) {
      case PatternKind::Wildcard:
        text += " default: {";
        break;
      case PatternKind::Literal:
        text += fmt::format(" case {}: {{", expr(pattern.literal));
        break;
      case PatternKind::Variant:
        if (type->is_generic()) {
          text += fmt::format(" case {}: {{", variant_tag(type, pattern.variant));
          if (pattern.has_binding()) {
            text += fmt::format(
              " {} {} = {}.data.{};", c_type(payload_type(type, pattern.variant)),
              ident(pattern.binding), scrutinee, variant_field(pattern.variant));
          }
        } else {
          text += fmt::format(" case {}: {{", enum_constant(pattern.enumName, pattern.variant));
        }
        break;
    }
    text += arm_body(*arm, result);
    text += " break; }";
  }

  text += " }";
  return text;
}

std::string CGenerator::match_chain(
  const MatchExpr & node, const std::string & scrutinee, const std::string & result)
{
  const Type * type = node.scrutinee->resolvedType;
  std::string text;
  bool first = true;

  for (const MatchArm * arm : node.arms) {
    const MatchPattern & pattern = *arm->pattern;
    if (pattern.patternKind == PatternKind::Wildcard) {
      text += first ? "{" : " else {";
      text += arm_body(*arm, result);
      text += " }";
      return text;
    }
    if (pattern.patternKind != PatternKind::Literal) {
      throw CompileError(
        ErrorKind::InternalError, pattern.get_range(),
        fmt::format("variant pattern on a value of type `{}`", to_string(type)));
    }

    const std::string condition =
      type->is_string() ? fmt::format("strcmp({}, {}) == 0", scrutinee, expr(pattern.literal))
                        : fmt::format("{} == {}", scrutinee, expr(pattern.literal));
    text += fmt::format("{}if ({}) {{", first ? "" : " else ", condition);
    text += arm_body(*arm, result);
    text += " }";
    first = false;
  }
  return text;
}

std::string CGenerator::arm_body(const MatchArm & arm, const std::string & result)
{
  if (result.empty()) return fmt::format(" {};", expr(arm.body));
  return fmt::format(" {} = {};", result, expr(arm.body));
}

std::string CGenerator::try_expr(const TryExpr & node)
{
  const Type * operand = node.operand->resolvedType;
  const Type * fn_return = node.functionReturnType;
  const bool is_result = operand->is_generic_of(BuiltinGenerics::k_result);
  const std::string_view success = is_result ? "Ok" : "Some";
  const std::string tmp = temp("try");

  const std::string early_return =
    is_result ? fmt::format(
                  "return (({0}){{ .tag = {1}, .data = {{ .{2} = {3}.data.{2} }} }});",
                  c_type(fn_return), variant_tag(fn_return, "Err"), variant_field("Err"), tmp)
              : fmt::format("return {};", variant_macro(fn_return, "None"));

  return fmt::format(
    "({{ {0} {1} = {2}; if ({1}.tag != {3}) {4} {1}.data.{5}; }})", c_type(operand), tmp,
    expr(node.operand), variant_tag(operand, success), early_return, variant_field(success));
}

std::string CGenerator::args(gsl::span<Expr * const> list)
{
  std::vector<std::string> parts;
  parts.reserve(list.size());
  for (const Expr * e : list) parts.push_back(expr(e));
  return join(parts, ", ");
}

std::string CGenerator::constant_initializer(const GlobalVarDecl & decl)
{
  const Expr * init = decl.initializer;
  auto not_constant = [&](const Expr * e) {
    return unsupported(
             e->get_range(),
             fmt::format("initializer of global `{}` is not a constant expression", decl.name))
      .with_help("assign the value at the start of `main` instead");
  };

  if (const auto * literal = dyn_cast<StructLiteralExpr>(init)) {
    if (literal->fields.empty()) return "{0}";
    std::vector<std::string> parts;
    for (const FieldInit * field : literal->fields) {
      if (!is_constant_expr(field->value)) throw not_constant(field->value);
      parts.push_back(fmt::format(".{} = {}", ident(field->name), expr(field->value)));
    }
    return fmt::format("{{ {} }}", join(parts, ", "));
  }

  if (!is_constant_expr(init)) throw not_constant(init);
  return expr(init);
}

// ============================================================================
// Helpers
// ============================================================================

bool CGenerator::is_enum(const Type * type) const
{
  if (!type) return false;
  if (type->kind == TypeKind::Enum) return true;
  return type->kind == TypeKind::Struct && enums_.count(unqualified_name(type->name)) > 0;
}

std::string_view CGenerator::format_spec(const Type * type) const
{
  switch (type->kind) {
    case TypeKind::Int:
    case TypeKind::Bool:
    case TypeKind::Enum:
      return "%d";
    case TypeKind::Float:
      return "%f";
    case TypeKind::Char:
      return "%c";
    case TypeKind::String:
      return "%s";
    case TypeKind::Pointer:
      return "%p";
    case TypeKind::Struct:
      if (type->is_string()) return "%s";
      return is_enum(type) ? "%d" : "";
    default:
      return "";
  }
}

bool CGenerator::is_sized_array(std::string_view name) const
{
  for (auto it = array_scopes_.rbegin(); it != array_scopes_.rend(); ++it) {
    const auto found = it->find(name);
    if (found != it->end()) return found->second;
  }
  return false;
}

void CGenerator::declare_local(std::string_view name, bool sized_array)
{
  array_scopes_.back()[name] = sized_array;
}

std::string CGenerator::temp(std::string_view prefix)
{
  return fmt::format("__rapter_{}_{}", prefix, temp_counter_++);
}

void CGenerator::line(std::string_view text)
{
  out_.append(static_cast<size_t>(indent_) * 4, ' ');
  out_ += text;
  out_ += '\n';
}

CompileError CGenerator::unsupported(SourceRange range, std::string message)
{
  return CompileError(ErrorKind::UnsupportedFeature, range, std::move(message));
}

}  // namespace rapter
