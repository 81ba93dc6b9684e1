// rapter/syntax/parser.cpp - Recursive-descent parser implementation
//
#include "rapter/syntax/parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <system_error>

#include <fmt/format.h>

namespace rapter::syntax
{
namespace
{

SourceRange join_ranges(SourceRange a, SourceRange b)
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Eof:
      return "end of file";
    case TokenKind::StringLiteral:
      return fmt::format("string literal \"{}\"", t.text);
    case TokenKind::CharLiteral:
      return fmt::format("char literal '{}'", t.text);
    default:
      break;
  }
  if (t.kind == TokenKind::Identifier && is_reserved_word(t.text)) {
    return fmt::format("keyword `{}`", t.text);
  }
  return fmt::format("`{}`", t.text);
}

bool starts_uppercase(std::string_view name)
{
  return !name.empty() && std::isupper(static_cast<unsigned char>(name.front())) != 0;
}

// Statement keywords that end error recovery
bool is_stmt_keyword(const Token & t)
{
  return t.is_keyword("let") || t.is_keyword("const") || t.is_keyword("return") ||
         t.is_keyword("if") || t.is_keyword("while") || t.is_keyword("for") ||
         t.is_keyword("break") || t.is_keyword("continue");
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::match_kw(std::string_view kw)
{
  if (at_kw(kw)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what, RecoverySet recovery)
{
  if (match(k)) {
    return true;
  }

  if (k == TokenKind::Semicolon) {
    // Report at the end of the previous token so the caret sits where `;` belongs
    const Token & before = prev();
    const SourceRange insert_at(file_id_, before.end(), before.end());
    const auto prev_lc = source_.get_line_column(before.end());
    const auto cur_lc = source_.get_line_column(cur().begin());
    const SourceRange primary = (cur_lc.line > prev_lc.line || at_eof()) ? insert_at : cur().range;
    if (cur().kind != TokenKind::Unknown) {
      diags_
        .report_error(
          ErrorKind::MissingSemicolon, primary,
          fmt::format("expected {}, found {}", what, describe(cur())), "expected `;`")
        .with_fixit(insert_at, ";");
    }
  } else {
    error_at(cur(), ErrorKind::ExpectedToken, fmt::format("expected {}, found {}", what, describe(cur())));
  }

  if (recovery != RecoverySet::None) {
    while (!at_eof()) {
      if (at(k)) {
        advance();
        return true;
      }

      const TokenKind kind = cur().kind;
      if (kind == TokenKind::Semicolon) {
        advance();
        return false;
      }
      if (
        kind == TokenKind::RBrace &&
        (recovery & RecoverySet::Block || recovery & RecoverySet::Argument)) {
        return false;
      }
      if (kind == TokenKind::RParen && (recovery & RecoverySet::Argument)) {
        return false;
      }
      if (kind == TokenKind::LBrace && (recovery & RecoverySet::Argument)) {
        return false;
      }
      if (is_stmt_keyword(cur()) || is_item_start(cur())) {
        return false;
      }
      advance();
    }
  }

  return false;
}

bool Parser::expect_closing(TokenKind k, const Token & opener, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  if (at_eof()) {
    diags_
      .report_error(
        ErrorKind::UnclosedDelimiter, cur().range,
        fmt::format("unclosed delimiter `{}`", opener.text), fmt::format("expected {}", what))
      .with_secondary_label(opener.range, "unclosed delimiter opened here");
    return false;
  }
  error_at(cur(), ErrorKind::ExpectedToken, fmt::format("expected {}, found {}", what, describe(cur())));
  return false;
}

void Parser::error_at(const Token & t, ErrorKind kind, std::string_view msg)
{
  // The lexer already reported malformed tokens
  if (t.kind == TokenKind::Unknown) {
    return;
  }
  diags_.report_error(kind, t.range, std::string(msg));
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace) || is_stmt_keyword(cur())) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_to_item()
{
  int depth = 0;
  while (!at_eof()) {
    if (depth == 0 && is_item_start(cur())) {
      return;
    }
    if (at(TokenKind::LBrace)) {
      ++depth;
    } else if (at(TokenKind::RBrace) && depth > 0) {
      --depth;
    }
    advance();
  }
}

bool Parser::is_item_start(const Token & t)
{
  return t.is_keyword("fn") || t.is_keyword("struct") || t.is_keyword("enum") ||
         t.is_keyword("import") || t.is_keyword("export") || t.is_keyword("extern");
}

bool Parser::can_start_expr(const Token & t)
{
  switch (t.kind) {
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::CharLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::LParen:
    case TokenKind::LBracket:
    case TokenKind::Minus:
    case TokenKind::Bang:
    case TokenKind::Star:
    case TokenKind::Amp:
      return true;
    case TokenKind::Identifier:
      if (!is_reserved_word(t.text)) return true;
      return t.text == "true" || t.text == "false" || t.text == "new" || t.text == "delete" ||
             t.text == "match";
    default:
      return false;
  }
}

std::optional<std::string_view> Parser::expect_identifier(std::string_view what)
{
  if (at(TokenKind::Identifier) && !is_reserved_word(cur().text)) {
    return ast_.intern(advance().text);
  }
  if (at(TokenKind::Identifier)) {
    diags_
      .report_error(
        ErrorKind::ExpectedToken, cur().range,
        fmt::format("expected {}, found {}", what, describe(cur())))
      .with_help(fmt::format("`{}` is a reserved word and cannot be used as a name", cur().text));
    return std::nullopt;
  }
  error_at(cur(), ErrorKind::ExpectedToken, fmt::format("expected {}, found {}", what, describe(cur())));
  return std::nullopt;
}

Expr * Parser::make_missing_expr_at(const Token & t) { return ast_.create<MissingExpr>(t.range); }

std::string Parser::unescape(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }
    const char e = raw[++i];
    switch (e) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '0':
        out.push_back('\0');
        break;
      default:
        // \\ \" \' (others were rejected by the lexer)
        out.push_back(e);
        break;
    }
  }
  return out;
}

// ============================================================================
// Program
// ============================================================================

Program * Parser::parse_program()
{
  std::vector<ImportDecl *> imports;
  std::vector<ExportDecl *> exports;
  std::vector<ExternFunctionDecl *> externs;
  std::vector<FunctionDecl *> functions;
  std::vector<StructDecl *> structs;
  std::vector<EnumDecl *> enums;
  std::vector<GlobalVarDecl *> globals;

  const Token first = cur();

  while (!at_eof()) {
    const size_t before = idx_;
    bool ok = true;

    if (at_kw("import")) {
      auto * d = parse_import_decl();
      ok = d != nullptr;
      if (d) imports.push_back(d);
    } else if (at_kw("export")) {
      const size_t errors_before = diags_.size();
      parse_export(exports, functions, structs, enums);
      ok = diags_.size() == errors_before;
    } else if (at_kw("extern")) {
      auto * d = parse_extern_fn();
      ok = d != nullptr;
      if (d) externs.push_back(d);
    } else if (at_kw("fn")) {
      auto * d = parse_function();
      ok = d != nullptr;
      if (d) functions.push_back(d);
    } else if (at_kw("struct")) {
      auto * d = parse_struct();
      ok = d != nullptr;
      if (d) structs.push_back(d);
    } else if (at_kw("enum")) {
      auto * d = parse_enum();
      ok = d != nullptr;
      if (d) enums.push_back(d);
    } else if (at_kw("let") || at_kw("const")) {
      auto * d = parse_global_var();
      ok = d != nullptr;
      if (d) globals.push_back(d);
    } else {
      if (cur().kind != TokenKind::Unknown) {
        diags_
          .report_error(
            ErrorKind::UnexpectedToken, cur().range,
            fmt::format("unexpected token {} at top level", describe(cur())))
          .with_help(
            "expected a top-level declaration like `fn`, `struct`, `enum`, `import` or `export`");
      }
      ok = false;
    }

    if (!ok) {
      if (idx_ == before) {
        advance();
      }
      synchronize_to_item();
    }
  }

  auto * program = ast_.create<Program>(join_ranges(first.range, cur().range));
  program->imports = ast_.copy_to_arena(imports);
  program->exports = ast_.copy_to_arena(exports);
  program->externFunctions = ast_.copy_to_arena(externs);
  program->functions = ast_.copy_to_arena(functions);
  program->structs = ast_.copy_to_arena(structs);
  program->enums = ast_.copy_to_arena(enums);
  program->globals = ast_.copy_to_arena(globals);
  return program;
}

// ============================================================================
// Declarations
// ============================================================================

ImportDecl * Parser::parse_import_decl()
{
  const Token kw = advance();  // import

  // Segments may spell type keywords (`import std.string`)
  std::string path;
  do {
    if (!at(TokenKind::Identifier)) {
      error_at(
        cur(), ErrorKind::ExpectedToken,
        fmt::format("expected module path segment, found {}", describe(cur())));
      return nullptr;
    }
    if (!path.empty()) path.push_back('.');
    path.append(advance().text);
  } while (match(TokenKind::Dot));

  std::string_view alias;
  if (match_kw("as")) {
    auto name = expect_identifier("import alias");
    if (!name) return nullptr;
    alias = *name;
  }
  match(TokenKind::Semicolon);

  return ast_.create<ImportDecl>(ast_.intern(path), alias, join_ranges(kw.range, prev().range));
}

void Parser::parse_export(
  std::vector<ExportDecl *> & exports, std::vector<FunctionDecl *> & functions,
  std::vector<StructDecl *> & structs, std::vector<EnumDecl *> & enums)
{
  const Token kw = advance();  // export

  if (at_kw("fn")) {
    if (auto * fn = parse_function()) {
      fn->isExported = true;
      functions.push_back(fn);
      exports.push_back(ast_.create<ExportDecl>(fn->name, join_ranges(kw.range, fn->get_range())));
    }
    return;
  }
  if (at_kw("struct")) {
    if (auto * s = parse_struct()) {
      s->isExported = true;
      structs.push_back(s);
      exports.push_back(ast_.create<ExportDecl>(s->name, join_ranges(kw.range, s->get_range())));
    }
    return;
  }
  if (at_kw("enum")) {
    if (auto * e = parse_enum()) {
      e->isExported = true;
      enums.push_back(e);
      exports.push_back(ast_.create<ExportDecl>(e->name, join_ranges(kw.range, e->get_range())));
    }
    return;
  }

  if (at(TokenKind::Identifier) && !is_reserved_word(cur().text)) {
    const Token name_tok = advance();
    match(TokenKind::Semicolon);
    exports.push_back(ast_.create<ExportDecl>(ast_.intern(name_tok.text), name_tok.range));
    return;
  }

  if (cur().kind == TokenKind::Unknown) {
    return;
  }
  diags_
    .report_error(
      ErrorKind::ExpectedToken, cur().range,
      fmt::format("expected `fn`, `struct` or `enum` after `export`, found {}", describe(cur())))
    .with_suggestion(
      "try exporting a function, struct or enum", "export fn area(w: int, h: int) -> int { ... }");
}

std::vector<ParamDecl *> Parser::parse_params(bool allow_variadic, bool & variadic)
{
  std::vector<ParamDecl *> params;
  if (at(TokenKind::RParen)) {
    return params;
  }

  while (true) {
    if (allow_variadic && match(TokenKind::Ellipsis)) {
      variadic = true;
      break;
    }

    const Token name_tok = cur();
    auto name = expect_identifier("parameter name");
    SourceRange type_range;
    const Type * type = nullptr;
    if (name && expect(TokenKind::Colon, "`:` after parameter name")) {
      type = parse_type(type_range);
    }
    if (!type) {
      // Skip the rest of the list; the closing `)` is checked by the caller
      while (!at_eof() && !at(TokenKind::RParen) && !at(TokenKind::LBrace) &&
             !at(TokenKind::Semicolon)) {
        advance();
      }
      break;
    }

    auto * param = ast_.create<ParamDecl>(*name, type, join_ranges(name_tok.range, type_range));
    param->typeRange = type_range;
    params.push_back(param);

    if (!match(TokenKind::Comma) || at(TokenKind::RParen)) {
      break;
    }
  }
  return params;
}

ExternFunctionDecl * Parser::parse_extern_fn()
{
  const Token kw = advance();  // extern
  if (!match_kw("fn")) {
    error_at(
      cur(), ErrorKind::ExpectedToken, fmt::format("expected `fn` after `extern`, found {}", describe(cur())));
    return nullptr;
  }

  auto name = expect_identifier("function name");
  if (!name) return nullptr;

  auto * decl = ast_.create<ExternFunctionDecl>(*name, kw.range);

  const Token open = cur();
  if (!expect(TokenKind::LParen, "`(`")) return nullptr;
  bool variadic = false;
  auto params = parse_params(true, variadic);
  if (!expect_closing(TokenKind::RParen, open, "`)`")) return nullptr;

  decl->params = ast_.copy_to_arena(params);
  decl->isVariadic = variadic;
  decl->returnType = types_.void_type();

  if (match(TokenKind::Arrow)) {
    SourceRange rt_range;
    const Type * rt = parse_type(rt_range);
    if (!rt) return nullptr;
    decl->returnType = rt;
  }

  expect(TokenKind::Semicolon, "`;` after extern declaration");
  decl->range_ = join_ranges(kw.range, prev().range);
  return decl;
}

FunctionDecl * Parser::parse_function()
{
  const Token kw = advance();  // fn
  auto name = expect_identifier("function name");
  if (!name) return nullptr;

  auto * fn = ast_.create<FunctionDecl>(*name, kw.range);

  const Token open = cur();
  if (!expect(TokenKind::LParen, "`(` after function name")) return nullptr;
  bool variadic = false;
  auto params = parse_params(false, variadic);
  if (!expect_closing(TokenKind::RParen, open, "`)`")) return nullptr;
  fn->params = ast_.copy_to_arena(params);

  fn->returnType = types_.void_type();
  if (match(TokenKind::Arrow)) {
    SourceRange rt_range;
    const Type * rt = parse_type(rt_range);
    if (!rt) return nullptr;
    fn->returnType = rt;
    fn->returnTypeRange = rt_range;
  }

  if (!at(TokenKind::LBrace)) {
    error_at(
      cur(), ErrorKind::ExpectedToken,
      fmt::format("expected `{{` to begin the body of `{}`, found {}", fn->name, describe(cur())));
    return nullptr;
  }
  fn->body = parse_block();
  fn->range_ = join_ranges(kw.range, prev().range);
  return fn;
}

StructDecl * Parser::parse_struct()
{
  const Token kw = advance();  // struct
  auto name = expect_identifier("struct name");
  if (!name) return nullptr;

  auto * decl = ast_.create<StructDecl>(*name, kw.range);
  const Token open = cur();
  if (!expect(TokenKind::LBrace, "`{` after struct name")) return nullptr;

  std::vector<FieldDecl *> fields;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token name_tok = cur();
    auto field = expect_identifier("field name");
    SourceRange type_range;
    const Type * type = nullptr;
    if (field && expect(TokenKind::Colon, "`:` after field name")) {
      type = parse_type(type_range);
    }
    if (!type) {
      while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::Semicolon) &&
             !at(TokenKind::RBrace)) {
        advance();
      }
    } else {
      auto * f = ast_.create<FieldDecl>(*field, type, join_ranges(name_tok.range, type_range));
      f->typeRange = type_range;
      fields.push_back(f);
    }
    if (!match(TokenKind::Comma) && !match(TokenKind::Semicolon)) {
      break;
    }
  }

  expect_closing(TokenKind::RBrace, open, "`}` to close the struct");
  decl->fields = ast_.copy_to_arena(fields);
  decl->range_ = join_ranges(kw.range, prev().range);
  return decl;
}

EnumDecl * Parser::parse_enum()
{
  const Token kw = advance();  // enum
  auto name = expect_identifier("enum name");
  if (!name) return nullptr;

  auto * decl = ast_.create<EnumDecl>(*name, kw.range);
  const Token open = cur();
  if (!expect(TokenKind::LBrace, "`{` after enum name")) return nullptr;

  std::vector<EnumVariantDecl *> variants;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token name_tok = cur();
    auto variant = expect_identifier("variant name");
    if (!variant) {
      while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::RBrace)) {
        advance();
      }
    } else {
      auto * v = ast_.create<EnumVariantDecl>(*variant, name_tok.range);
      if (match(TokenKind::Eq)) {
        const bool negative = match(TokenKind::Minus);
        if (at(TokenKind::IntLiteral)) {
          const Token lit = advance();
          int64_t value = 0;
          std::from_chars(lit.text.data(), lit.text.data() + lit.text.size(), value);
          v->hasValue = true;
          v->value = negative ? -value : value;
          v->range_ = join_ranges(name_tok.range, lit.range);
        } else {
          error_at(
            cur(), ErrorKind::ExpectedToken,
            fmt::format("expected integer literal after `=` in enum variant, found {}", describe(cur())));
        }
      }
      variants.push_back(v);
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  expect_closing(TokenKind::RBrace, open, "`}` to close the enum");
  decl->variants = ast_.copy_to_arena(variants);
  decl->range_ = join_ranges(kw.range, prev().range);
  return decl;
}

GlobalVarDecl * Parser::parse_global_var()
{
  const Token kw = advance();  // let / const
  const bool is_const = kw.text == "const";
  const bool is_mut = !is_const && match_kw("mut");

  const Token name_tok = cur();
  auto name = expect_identifier("variable name");
  if (!name) return nullptr;

  auto * decl = ast_.create<GlobalVarDecl>(*name, kw.range);
  decl->isConst = is_const;
  decl->isMutable = is_mut;

  if (match(TokenKind::Colon)) {
    decl->declaredType = parse_type(decl->typeRange);
    if (!decl->declaredType) return nullptr;
  }
  if (match(TokenKind::Eq)) {
    decl->initializer = parse_expr();
  }

  if (!decl->declaredType && !decl->initializer) {
    diags_
      .report_error(
        ErrorKind::InvalidSyntax, name_tok.range,
        fmt::format("global `{}` needs a type annotation or an initializer", decl->name))
      .with_suggestion("add a type or a value", fmt::format("let {}: int = 0;", decl->name));
  }

  expect(TokenKind::Semicolon, "`;` after global declaration", RecoverySet::Statement);
  decl->range_ = join_ranges(kw.range, prev().range);
  return decl;
}

// ============================================================================
// Types
// ============================================================================

const Type * Parser::parse_type(SourceRange & range)
{
  const Type * type = parse_type_base(range);
  if (!type) {
    return nullptr;
  }

  // `T*` only when the star run is not a multiplication (`x as int * 2`)
  size_t stars = 0;
  while (cur(stars).kind == TokenKind::Star) {
    ++stars;
  }
  if (stars > 0 && !can_start_expr(cur(stars))) {
    for (size_t i = 0; i < stars; ++i) {
      advance();
      type = types_.get_pointer_type(type);
    }
    range = join_ranges(range, prev().range);
  }
  return type;
}

const Type * Parser::parse_type_base(SourceRange & range)
{
  const Token first = cur();

  if (at(TokenKind::LBracket)) {
    advance();
    SourceRange inner;
    const Type * elem = parse_type(inner);
    if (!elem) return nullptr;
    // `[T; N]`: the size is not part of the type
    if (match(TokenKind::Semicolon)) {
      match(TokenKind::IntLiteral);
    }
    if (!expect_closing(TokenKind::RBracket, first, "`]`")) return nullptr;
    range = join_ranges(first.range, prev().range);
    return types_.get_array_type(elem);
  }

  if (at(TokenKind::Amp) || at(TokenKind::Star)) {
    advance();
    SourceRange inner;
    const Type * pointee = parse_type(inner);
    if (!pointee) return nullptr;
    range = join_ranges(first.range, inner);
    return types_.get_pointer_type(pointee);
  }

  if (at(TokenKind::Identifier)) {
    if (const Type * builtin = types_.lookup_builtin(first.text)) {
      advance();
      range = first.range;
      return builtin;
    }
    if (!is_reserved_word(first.text)) {
      advance();
      std::string name(first.text);

      // `mod.Name` and `mod::Name`
      if (
        (at(TokenKind::Dot) || at(TokenKind::ColonColon)) &&
        cur(1).kind == TokenKind::Identifier && !is_reserved_word(cur(1).text)) {
        advance();
        name.append(".").append(advance().text);
      }

      if (at(TokenKind::Lt)) {
        const Token open = advance();
        std::vector<const Type *> args;
        do {
          SourceRange arg_range;
          const Type * arg = parse_type(arg_range);
          if (!arg) return nullptr;
          args.push_back(arg);
        } while (match(TokenKind::Comma));
        if (!expect_closing(TokenKind::Gt, open, "`>` to close the type arguments")) return nullptr;
        range = join_ranges(first.range, prev().range);
        return types_.get_generic_type(name, args);
      }

      if (name == "DynamicArray" && at(TokenKind::LBracket)) {
        const Token open = advance();
        SourceRange inner;
        const Type * elem = parse_type(inner);
        if (!elem) return nullptr;
        if (!expect_closing(TokenKind::RBracket, open, "`]`")) return nullptr;
        range = join_ranges(first.range, prev().range);
        return types_.get_dynamic_array_type(elem);
      }

      range = join_ranges(first.range, prev().range);
      return types_.get_struct_type(name);
    }
  }

  if (first.kind != TokenKind::Unknown) {
    diags_
      .report_error(
        ErrorKind::InvalidSyntax, first.range, fmt::format("expected type, found {}", describe(first)))
      .with_suggestion("valid types include", "int, float, bool, char, string, [int], *int, MyStruct");
  }
  return nullptr;
}

// ============================================================================
// Statements
// ============================================================================

gsl::span<Stmt *> Parser::parse_block()
{
  const Token open = cur();
  if (!expect(TokenKind::LBrace, "`{`")) {
    return {};
  }

  std::vector<Stmt *> stmts;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const size_t before = idx_;
    if (Stmt * s = parse_stmt()) {
      stmts.push_back(s);
    } else {
      synchronize_to_stmt();
    }
    if (idx_ == before && !at(TokenKind::RBrace)) {
      advance();
    }
  }

  expect_closing(TokenKind::RBrace, open, "`}`");
  return ast_.copy_to_arena(stmts);
}

Stmt * Parser::parse_stmt()
{
  if (at_kw("let") || at_kw("const")) {
    return parse_let_stmt();
  }
  if (at_kw("return")) {
    return parse_return_stmt();
  }
  if (at_kw("break") || at_kw("continue")) {
    const Token kw = advance();
    expect(TokenKind::Semicolon, fmt::format("`;` after `{}`", kw.text), RecoverySet::Statement);
    const SourceRange r = join_ranges(kw.range, prev().range);
    if (kw.text == "break") {
      return ast_.create<BreakStmt>(r);
    }
    return ast_.create<ContinueStmt>(r);
  }
  if (at_kw("if")) {
    return parse_if_stmt();
  }
  if (at_kw("while")) {
    return parse_while_stmt();
  }
  if (at_kw("for")) {
    return parse_for_stmt();
  }

  const Token first = cur();
  Expr * e = parse_expr();
  if (isa<MissingExpr>(e)) {
    return nullptr;
  }

  if (match(TokenKind::Eq)) {
    Expr * value = parse_expr();
    if (isa<MissingExpr>(value)) {
      return nullptr;
    }
    expect(TokenKind::Semicolon, "`;` after assignment", RecoverySet::Statement);
    return ast_.create<AssignStmt>(e, value, join_ranges(first.range, prev().range));
  }

  expect(TokenKind::Semicolon, "`;` after expression", RecoverySet::Statement);
  return ast_.create<ExprStmt>(e, join_ranges(first.range, prev().range));
}

LetStmt * Parser::parse_let_stmt()
{
  const Token kw = advance();  // let / const
  const bool is_const = kw.text == "const";
  const bool is_mut = !is_const && match_kw("mut");

  const Token name_tok = cur();
  auto name = expect_identifier("variable name");
  if (!name) return nullptr;

  auto * stmt = ast_.create<LetStmt>(*name, kw.range);
  stmt->isConst = is_const;
  stmt->isMutable = is_mut;

  if (match(TokenKind::Colon)) {
    stmt->declaredType = parse_type(stmt->typeRange);
    if (!stmt->declaredType) return nullptr;
  }
  if (match(TokenKind::Eq)) {
    stmt->initializer = parse_expr();
    if (isa<MissingExpr>(stmt->initializer)) return nullptr;
  }

  if (!stmt->declaredType && !stmt->initializer) {
    diags_
      .report_error(
        ErrorKind::InvalidSyntax, name_tok.range,
        fmt::format("`{}` needs a type annotation or an initializer", stmt->name))
      .with_suggestion("add a type or a value", fmt::format("let {}: int = 0;", stmt->name));
  }

  expect(TokenKind::Semicolon, "`;` after variable declaration", RecoverySet::Statement);
  stmt->range_ = join_ranges(kw.range, prev().range);
  return stmt;
}

ReturnStmt * Parser::parse_return_stmt()
{
  const Token kw = advance();  // return
  Expr * value = nullptr;
  if (!at(TokenKind::Semicolon) && !at(TokenKind::RBrace)) {
    value = parse_expr();
    if (isa<MissingExpr>(value)) return nullptr;
  }
  expect(TokenKind::Semicolon, "`;` after return", RecoverySet::Statement);
  return ast_.create<ReturnStmt>(value, join_ranges(kw.range, prev().range));
}

IfStmt * Parser::parse_if_stmt()
{
  const Token kw = advance();  // if
  Expr * cond = parse_header_expr();
  auto * stmt = ast_.create<IfStmt>(cond, kw.range);
  stmt->thenBody = parse_block();

  if (match_kw("else")) {
    stmt->hasElse = true;
    if (at_kw("if")) {
      if (IfStmt * nested = parse_if_stmt()) {
        stmt->elseBody = ast_.copy_to_arena(std::vector<Stmt *>{nested});
      }
    } else {
      stmt->elseBody = parse_block();
    }
  }
  stmt->range_ = join_ranges(kw.range, prev().range);
  return stmt;
}

WhileStmt * Parser::parse_while_stmt()
{
  const Token kw = advance();  // while
  Expr * cond = parse_header_expr();
  auto body = parse_block();
  return ast_.create<WhileStmt>(cond, body, join_ranges(kw.range, prev().range));
}

ForStmt * Parser::parse_for_stmt()
{
  const Token kw = advance();  // for
  auto var = expect_identifier("loop variable name");
  if (!var) return nullptr;

  if (!match(TokenKind::Colon) && !match_kw("in")) {
    error_at(
      cur(), ErrorKind::ExpectedToken,
      fmt::format("expected `:` or `in` after loop variable, found {}", describe(cur())));
    return nullptr;
  }

  Expr * iterable = parse_header_expr();
  auto body = parse_block();
  return ast_.create<ForStmt>(*var, iterable, body, join_ranges(kw.range, prev().range));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_ternary(); }

Expr * Parser::parse_header_expr()
{
  const bool saved = no_struct_literal_;
  no_struct_literal_ = true;
  Expr * e = parse_expr();
  no_struct_literal_ = saved;
  return e;
}

bool Parser::question_is_try() const
{
  if (!can_start_expr(cur(1))) {
    return true;
  }

  int depth = 0;
  for (size_t i = 1;; ++i) {
    const Token & t = cur(i);
    switch (t.kind) {
      case TokenKind::Eof:
      case TokenKind::Semicolon:
        return true;
      case TokenKind::Colon:
        if (depth == 0) return false;
        break;
      case TokenKind::LParen:
      case TokenKind::LBracket:
        ++depth;
        break;
      case TokenKind::LBrace:
        if (depth == 0) return true;
        ++depth;
        break;
      case TokenKind::RParen:
      case TokenKind::RBracket:
      case TokenKind::RBrace:
        if (depth == 0) return true;
        --depth;
        break;
      case TokenKind::Comma:
        if (depth == 0) return true;
        break;
      default:
        break;
    }
  }
}

Expr * Parser::parse_ternary()
{
  Expr * cond = parse_range();
  if (!at(TokenKind::Question)) {
    return cond;
  }

  advance();  // ?
  Expr * then_expr = parse_expr();
  if (!expect(TokenKind::Colon, "`:` in conditional expression")) {
    return then_expr;
  }
  Expr * else_expr = parse_ternary();
  return ast_.create<TernaryExpr>(
    cond, then_expr, else_expr, join_ranges(cond->get_range(), else_expr->get_range()));
}

Expr * Parser::parse_range()
{
  Expr * start = parse_or();
  if (match(TokenKind::DotDot)) {
    Expr * end = parse_or();
    return ast_.create<RangeExpr>(start, end, join_ranges(start->get_range(), end->get_range()));
  }
  return start;
}

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (match(TokenKind::OrOr)) {
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_equality();
  while (match(TokenKind::AndAnd)) {
    Expr * rhs = parse_equality();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  Expr * lhs = parse_comparison();
  while (at(TokenKind::EqEq) || at(TokenKind::Ne)) {
    const BinaryOp op = advance().kind == TokenKind::EqEq ? BinaryOp::Eq : BinaryOp::Ne;
    Expr * rhs = parse_comparison();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_add();
  while (true) {
    BinaryOp op{};
    if (at(TokenKind::Lt)) {
      op = BinaryOp::Lt;
    } else if (at(TokenKind::Le)) {
      op = BinaryOp::Le;
    } else if (at(TokenKind::Gt)) {
      op = BinaryOp::Gt;
    } else if (at(TokenKind::Ge)) {
      op = BinaryOp::Ge;
    } else {
      break;
    }
    advance();
    Expr * rhs = parse_add();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
    Expr * rhs = parse_mul();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_unary();
  while (at(TokenKind::Star) || at(TokenKind::Slash) || at(TokenKind::Percent)) {
    const TokenKind k = advance().kind;
    const BinaryOp op =
      k == TokenKind::Star ? BinaryOp::Mul : (k == TokenKind::Slash ? BinaryOp::Div : BinaryOp::Mod);
    Expr * rhs = parse_unary();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  const Token first = cur();

  if (at_kw("new")) {
    advance();

    // new [T]()
    if (at(TokenKind::LBracket)) {
      const Token open = advance();
      SourceRange inner;
      const Type * elem = parse_type(inner);
      if (!elem) return make_missing_expr_at(first);
      if (!expect_closing(TokenKind::RBracket, open, "`]`")) return make_missing_expr_at(first);
      const Token paren = cur();
      if (!expect(TokenKind::LParen, "`()` after growable array type")) {
        return make_missing_expr_at(first);
      }
      if (!expect_closing(TokenKind::RParen, paren, "`)`")) return make_missing_expr_at(first);
      return ast_.create<NewExpr>(
        types_.get_dynamic_array_type(elem), true, join_ranges(first.range, prev().range));
    }

    // new T: a builtin type keyword, or a type name not continued as an expression
    if (at(TokenKind::Identifier)) {
      const TokenKind next = cur(1).kind;
      const bool continues = next == TokenKind::LBrace || next == TokenKind::LParen ||
                             next == TokenKind::ColonColon || next == TokenKind::Dot ||
                             next == TokenKind::LBracket || next == TokenKind::Lt;
      const bool builtin = types_.lookup_builtin(cur().text) != nullptr;
      if (builtin || (starts_uppercase(cur().text) && !continues)) {
        SourceRange type_range;
        const Type * t = parse_type(type_range);
        if (!t) return make_missing_expr_at(first);
        return ast_.create<NewExpr>(t, false, join_ranges(first.range, type_range));
      }
    }

    Expr * init = parse_unary();
    return ast_.create<NewExpr>(init, join_ranges(first.range, init->get_range()));
  }

  if (at_kw("delete")) {
    advance();
    Expr * operand = parse_unary();
    return ast_.create<DeleteExpr>(operand, join_ranges(first.range, operand->get_range()));
  }

  UnaryOp op{};
  switch (first.kind) {
    case TokenKind::Minus:
      op = UnaryOp::Neg;
      break;
    case TokenKind::Bang:
      op = UnaryOp::Not;
      break;
    case TokenKind::Star:
      op = UnaryOp::Deref;
      break;
    case TokenKind::Amp:
      op = UnaryOp::AddressOf;
      break;
    default:
      return parse_postfix();
  }
  advance();
  Expr * operand = parse_unary();
  return ast_.create<UnaryExpr>(op, operand, join_ranges(first.range, operand->get_range()));
}

gsl::span<Expr *> Parser::parse_call_args()
{
  const Token open = advance();  // (
  const bool saved = no_struct_literal_;
  no_struct_literal_ = false;

  std::vector<Expr *> args;
  while (!at(TokenKind::RParen) && !at_eof()) {
    Expr * arg = parse_expr();
    args.push_back(arg);
    if (isa<MissingExpr>(arg)) {
      // Skip to the end of the argument list
      while (!at_eof() && !at(TokenKind::RParen) && !at(TokenKind::Semicolon) &&
             !at(TokenKind::LBrace)) {
        advance();
      }
      break;
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  no_struct_literal_ = saved;
  expect_closing(TokenKind::RParen, open, "`)` to close the argument list");
  return ast_.copy_to_arena(args);
}

Expr * Parser::parse_postfix()
{
  Expr * e = parse_primary();
  if (isa<MissingExpr>(e)) {
    return e;
  }

  while (true) {
    if (at(TokenKind::LParen)) {
      auto args = parse_call_args();
      e = ast_.create<CallExpr>(e, args, join_ranges(e->get_range(), prev().range));
    } else if (at(TokenKind::Dot) || at(TokenKind::Arrow)) {
      const bool arrow = advance().kind == TokenKind::Arrow;
      auto field = expect_identifier("field or method name");
      if (!field) return e;
      e = ast_.create<FieldAccessExpr>(e, *field, arrow, join_ranges(e->get_range(), prev().range));
    } else if (at(TokenKind::LBracket)) {
      const Token open = advance();
      const bool saved = no_struct_literal_;
      no_struct_literal_ = false;
      Expr * index = parse_expr();
      no_struct_literal_ = saved;
      expect_closing(TokenKind::RBracket, open, "`]`");
      e = ast_.create<IndexExpr>(e, index, join_ranges(e->get_range(), prev().range));
    } else if (at_kw("as")) {
      advance();
      SourceRange type_range;
      const Type * target = parse_type(type_range);
      if (!target) return e;
      e = ast_.create<CastExpr>(e, target, join_ranges(e->get_range(), type_range));
    } else if (at(TokenKind::Question) && question_is_try()) {
      advance();
      e = ast_.create<TryExpr>(e, join_ranges(e->get_range(), prev().range));
    } else {
      break;
    }
  }
  return e;
}

bool Parser::at_struct_literal() const
{
  if (!at(TokenKind::Identifier) || !starts_uppercase(cur().text)) {
    return false;
  }
  if (cur(1).kind != TokenKind::LBrace) {
    return false;
  }
  return cur(2).kind == TokenKind::RBrace ||
         (cur(2).kind == TokenKind::Identifier && cur(3).kind == TokenKind::Colon);
}

Expr * Parser::parse_struct_literal(const Token & name_tok)
{
  advance();  // name
  const Token open = advance();  // {

  const bool saved = no_struct_literal_;
  no_struct_literal_ = false;

  std::vector<FieldInit *> fields;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token field_tok = cur();
    auto field = expect_identifier("field name");
    if (!field || !expect(TokenKind::Colon, "`:` after field name")) {
      break;
    }
    Expr * value = parse_expr();
    fields.push_back(
      ast_.create<FieldInit>(*field, value, join_ranges(field_tok.range, value->get_range())));
    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  no_struct_literal_ = saved;
  expect_closing(TokenKind::RBrace, open, "`}` to close the struct literal");
  return ast_.create<StructLiteralExpr>(
    ast_.intern(name_tok.text), ast_.copy_to_arena(fields), join_ranges(name_tok.range, prev().range));
}

Expr * Parser::parse_primary()
{
  const Token t = cur();

  switch (t.kind) {
    case TokenKind::IntLiteral: {
      advance();
      int64_t value = 0;
      const auto result = std::from_chars(t.text.data(), t.text.data() + t.text.size(), value);
      if (result.ec != std::errc{}) {
        diags_.report_error(
          ErrorKind::InvalidNumber, t.range,
          fmt::format("integer literal `{}` is out of range", t.text));
      }
      return ast_.create<IntLiteralExpr>(value, t.range);
    }
    case TokenKind::FloatLiteral: {
      advance();
      const std::string spelling(t.text);
      return ast_.create<FloatLiteralExpr>(std::strtod(spelling.c_str(), nullptr), t.text, t.range);
    }
    case TokenKind::CharLiteral: {
      advance();
      const std::string value = unescape(t.text);
      return ast_.create<CharLiteralExpr>(value.empty() ? '\0' : value.front(), t.range);
    }
    case TokenKind::StringLiteral:
      advance();
      return ast_.create<StringLiteralExpr>(ast_.intern(unescape(t.text)), t.range);

    case TokenKind::LParen: {
      advance();
      const bool saved = no_struct_literal_;
      no_struct_literal_ = false;
      Expr * inner = parse_expr();
      no_struct_literal_ = saved;
      expect_closing(TokenKind::RParen, t, "`)`");
      return inner;
    }

    case TokenKind::LBracket: {
      advance();
      const bool saved = no_struct_literal_;
      no_struct_literal_ = false;
      std::vector<Expr *> elems;
      while (!at(TokenKind::RBracket) && !at_eof()) {
        Expr * e = parse_expr();
        elems.push_back(e);
        if (isa<MissingExpr>(e) || !match(TokenKind::Comma)) {
          break;
        }
      }
      no_struct_literal_ = saved;
      expect_closing(TokenKind::RBracket, t, "`]` to close the array literal");
      return ast_.create<ArrayLiteralExpr>(
        ast_.copy_to_arena(elems), join_ranges(t.range, prev().range));
    }

    case TokenKind::Identifier: {
      if (t.text == "true" || t.text == "false") {
        advance();
        return ast_.create<BoolLiteralExpr>(t.text == "true", t.range);
      }
      if (t.text == "match") {
        return parse_match();
      }
      if (is_reserved_word(t.text)) {
        break;
      }

      // Enum::Variant
      if (cur(1).kind == TokenKind::ColonColon) {
        advance();
        advance();
        auto variant = expect_identifier("variant name");
        if (!variant) return make_missing_expr_at(t);
        return ast_.create<EnumAccessExpr>(
          ast_.intern(t.text), *variant, join_ranges(t.range, prev().range));
      }

      if (!no_struct_literal_ && at_struct_literal()) {
        return parse_struct_literal(t);
      }

      advance();
      return ast_.create<VarRefExpr>(ast_.intern(t.text), t.range);
    }

    default:
      break;
  }

  if (t.kind != TokenKind::Unknown) {
    diags_
      .report_error(
        ErrorKind::UnexpectedToken, t.range, fmt::format("expected expression, found {}", describe(t)))
      .with_suggestion(
        "valid expressions include", "42, \"hello\", true, [1, 2, 3], my_variable, func_call()");
  }
  return make_missing_expr_at(t);
}

Expr * Parser::parse_match()
{
  const Token kw = advance();  // match
  Expr * scrutinee = parse_header_expr();

  const Token open = cur();
  if (!expect(TokenKind::LBrace, "`{` after match scrutinee")) {
    return make_missing_expr_at(kw);
  }

  const bool saved = no_struct_literal_;
  no_struct_literal_ = false;

  std::vector<MatchArm *> arms;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    MatchPattern * pattern = parse_pattern();
    if (!pattern || !expect(TokenKind::FatArrow, "`=>` after match pattern")) {
      while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::RBrace)) {
        advance();
      }
      if (!match(TokenKind::Comma)) break;
      continue;
    }
    Expr * body = parse_expr();
    arms.push_back(
      ast_.create<MatchArm>(pattern, body, join_ranges(pattern->get_range(), body->get_range())));
    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  no_struct_literal_ = saved;
  expect_closing(TokenKind::RBrace, open, "`}` to close the match");
  return ast_.create<MatchExpr>(
    scrutinee, ast_.copy_to_arena(arms), join_ranges(kw.range, prev().range));
}

MatchPattern * Parser::parse_pattern()
{
  const Token t = cur();

  if (t.kind == TokenKind::Identifier) {
    if (t.text == "_") {
      advance();
      return ast_.create<MatchPattern>(PatternKind::Wildcard, t.range);
    }
    if (t.text == "true" || t.text == "false") {
      advance();
      auto * p = ast_.create<MatchPattern>(PatternKind::Literal, t.range);
      p->literal = ast_.create<BoolLiteralExpr>(t.text == "true", t.range);
      return p;
    }
    if (cur(1).kind == TokenKind::ColonColon) {
      advance();
      advance();
      auto variant = expect_identifier("variant name");
      if (!variant) return nullptr;
      auto * p = ast_.create<MatchPattern>(PatternKind::Variant, t.range);
      p->enumName = ast_.intern(t.text);
      p->variant = *variant;
      if (at(TokenKind::LParen)) {
        const Token open = advance();
        auto binding = expect_identifier("binding name");
        if (!binding) return nullptr;
        p->binding = *binding;
        if (!expect_closing(TokenKind::RParen, open, "`)`")) return nullptr;
      }
      p->range_ = join_ranges(t.range, prev().range);
      return p;
    }
    diags_
      .report_error(
        ErrorKind::InvalidSyntax, t.range, fmt::format("unexpected identifier `{}` in pattern", t.text))
      .with_help("patterns must be enum variants (Enum::Variant), literals, or the wildcard `_`");
    return nullptr;
  }

  if (t.kind == TokenKind::Minus && cur(1).kind == TokenKind::IntLiteral) {
    advance();
    const Token lit = advance();
    int64_t value = 0;
    std::from_chars(lit.text.data(), lit.text.data() + lit.text.size(), value);
    const SourceRange r = join_ranges(t.range, lit.range);
    auto * p = ast_.create<MatchPattern>(PatternKind::Literal, r);
    p->literal = ast_.create<IntLiteralExpr>(-value, r);
    return p;
  }

  if (
    t.kind == TokenKind::IntLiteral || t.kind == TokenKind::CharLiteral ||
    t.kind == TokenKind::StringLiteral) {
    auto * p = ast_.create<MatchPattern>(PatternKind::Literal, t.range);
    p->literal = parse_primary();
    return p;
  }

  if (t.kind != TokenKind::Unknown) {
    diags_
      .report_error(
        ErrorKind::ExpectedToken, t.range, fmt::format("expected pattern, found {}", describe(t)))
      .with_suggestion("valid patterns include", "Enum::Variant, 42, 'a', \"hello\", true, _");
  }
  return nullptr;
}

}  // namespace rapter::syntax
