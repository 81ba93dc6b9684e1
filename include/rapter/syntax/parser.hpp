// rapter/syntax/parser.hpp - Recursive-descent parser
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rapter/ast/ast.hpp"
#include "rapter/ast/ast_context.hpp"
#include "rapter/basic/diagnostic.hpp"
#include "rapter/basic/source_manager.hpp"
#include "rapter/sema/types/type.hpp"
#include "rapter/syntax/token.hpp"

namespace rapter::syntax
{

enum class RecoverySet : uint32_t {
  None = 0,
  Statement = 1 << 0,  // ;
  Block = 1 << 1,      // } or ;
  Argument = 1 << 2,   // ) or ; or {
};

inline RecoverySet operator|(RecoverySet a, RecoverySet b)
{
  return static_cast<RecoverySet>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(RecoverySet a, RecoverySet b)
{
  return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

/**
 * Parser for `.rapt` modules.
 *
 * Errors are collected into the DiagnosticBag; the parser resynchronises at
 * statement and item boundaries and always returns a Program. Type
 * annotations are built directly as semantic types in the shared TypeContext.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, TypeContext & types, FileId file_id, const SourceFile & source,
    DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast),
    types_(types),
    file_id_(file_id),
    source_(source),
    diags_(diags),
    tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw) const { return cur().is_keyword(kw); }

  const Token & advance();
  bool match(TokenKind k);
  bool match_kw(std::string_view kw);
  bool expect(TokenKind k, std::string_view what, RecoverySet recovery = RecoverySet::None);
  bool expect_closing(TokenKind k, const Token & opener, std::string_view what);

  void error_at(const Token & t, ErrorKind kind, std::string_view msg);
  void synchronize_to_stmt();
  void synchronize_to_item();

  [[nodiscard]] static bool is_item_start(const Token & t);
  [[nodiscard]] static bool can_start_expr(const Token & t);

  /// Consume an identifier that is not a reserved word; returns the interned name.
  std::optional<std::string_view> expect_identifier(std::string_view what);

  // Top-level
  [[nodiscard]] ImportDecl * parse_import_decl();
  void parse_export(
    std::vector<ExportDecl *> & exports, std::vector<FunctionDecl *> & functions,
    std::vector<StructDecl *> & structs, std::vector<EnumDecl *> & enums);
  [[nodiscard]] ExternFunctionDecl * parse_extern_fn();
  [[nodiscard]] FunctionDecl * parse_function();
  [[nodiscard]] StructDecl * parse_struct();
  [[nodiscard]] EnumDecl * parse_enum();
  [[nodiscard]] GlobalVarDecl * parse_global_var();

  [[nodiscard]] std::vector<ParamDecl *> parse_params(bool allow_variadic, bool & variadic);

  // Types
  [[nodiscard]] const Type * parse_type(SourceRange & range);
  [[nodiscard]] const Type * parse_type_base(SourceRange & range);

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] gsl::span<Stmt *> parse_block();
  [[nodiscard]] LetStmt * parse_let_stmt();
  [[nodiscard]] IfStmt * parse_if_stmt();
  [[nodiscard]] WhileStmt * parse_while_stmt();
  [[nodiscard]] ForStmt * parse_for_stmt();
  [[nodiscard]] ReturnStmt * parse_return_stmt();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_header_expr();  // condition of if/while/for/match
  [[nodiscard]] Expr * parse_ternary();
  [[nodiscard]] Expr * parse_range();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_struct_literal(const Token & name_tok);
  [[nodiscard]] Expr * parse_match();
  [[nodiscard]] MatchPattern * parse_pattern();
  [[nodiscard]] gsl::span<Expr *> parse_call_args();

  /// Postfix `?` is a try unless a ternary `:` follows at the same nesting level.
  [[nodiscard]] bool question_is_try() const;
  [[nodiscard]] bool at_struct_literal() const;

  [[nodiscard]] Expr * make_missing_expr_at(const Token & t);

  [[nodiscard]] static std::string unescape(std::string_view raw);

  AstContext & ast_;
  TypeContext & types_;
  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
  bool no_struct_literal_ = false;
};

}  // namespace rapter::syntax
