// rapter/tests/unit/syntax/test_parser.cpp - Parser tests
//
#include <gtest/gtest.h>

#include <string>

#include "rapter/ast/ast.hpp"
#include "rapter/sema/types/type.hpp"
#include "rapter/test_support/parse_helpers.hpp"

using namespace rapter;
using rapter::test_support::parse;

namespace
{

/// Body of the only function in `src`.
gsl::span<Stmt *> body_of(test_support::TestParseUnit & unit)
{
  EXPECT_EQ(unit.program->functions.size(), 1U);
  return unit.program->functions[0]->body;
}

Expr * first_expr(test_support::TestParseUnit & unit)
{
  auto body = body_of(unit);
  if (body.empty()) return nullptr;
  if (auto * let = dyn_cast<LetStmt>(body[0])) return let->initializer;
  if (auto * es = dyn_cast<ExprStmt>(body[0])) return es->expr;
  return nullptr;
}

}  // namespace

// ============================================================================
// Items
// ============================================================================

TEST(SyntaxParser, ParsesEveryTopLevelItem)
{
  auto unit = parse(R"(
import utils.math as m;
extern fn printf(fmt: string, ...) -> int;
struct Point { x: int, y: int }
enum Color { Red, Green = 5, Blue }
let mut counter: int = 0;
const LIMIT: int = 10;
export fn area(p: Point) -> int { return p.x * p.y; }
fn main() -> int { return 0; }
export Color;
)");

  ASSERT_FALSE(unit.diags.has_errors());
  const Program * p = unit.program;
  ASSERT_NE(p, nullptr);

  ASSERT_EQ(p->imports.size(), 1U);
  EXPECT_EQ(p->imports[0]->modulePath, "utils.math");
  EXPECT_EQ(p->imports[0]->effective_alias(), "m");

  ASSERT_EQ(p->externFunctions.size(), 1U);
  EXPECT_TRUE(p->externFunctions[0]->isVariadic);
  EXPECT_EQ(p->externFunctions[0]->params.size(), 1U);
  EXPECT_TRUE(p->externFunctions[0]->returnType->is_int());

  ASSERT_EQ(p->structs.size(), 1U);
  EXPECT_EQ(p->structs[0]->fields.size(), 2U);

  ASSERT_EQ(p->enums.size(), 1U);
  const auto variants = p->enums[0]->variants;
  ASSERT_EQ(variants.size(), 3U);
  EXPECT_FALSE(variants[0]->hasValue);
  EXPECT_TRUE(variants[1]->hasValue);
  EXPECT_EQ(variants[1]->value, 5);

  ASSERT_EQ(p->globals.size(), 2U);
  EXPECT_TRUE(p->globals[0]->isMutable);
  EXPECT_TRUE(p->globals[1]->isConst);

  ASSERT_EQ(p->functions.size(), 2U);
  EXPECT_TRUE(p->functions[0]->isExported);
  EXPECT_FALSE(p->functions[1]->isExported);

  // `export fn area` plus `export Color;`
  ASSERT_EQ(p->exports.size(), 2U);
  EXPECT_EQ(p->exports[0]->name, "area");
  EXPECT_EQ(p->exports[1]->name, "Color");
}

TEST(SyntaxParser, ImportAliasDefaultsToLastSegment)
{
  auto unit = parse("import utils.math;");
  ASSERT_FALSE(unit.diags.has_errors());
  ASSERT_EQ(unit.program->imports.size(), 1U);
  EXPECT_TRUE(unit.program->imports[0]->alias.empty());
  EXPECT_EQ(unit.program->imports[0]->effective_alias(), "math");
}

TEST(SyntaxParser, OmittedReturnTypeIsVoid)
{
  auto unit = parse("fn f() { }");
  ASSERT_FALSE(unit.diags.has_errors());
  ASSERT_EQ(unit.program->functions.size(), 1U);
  EXPECT_TRUE(unit.program->functions[0]->returnType->is_void());
}

TEST(SyntaxParser, TypeSyntax)
{
  auto unit = parse(R"(
fn f(a: *int, b: [float], c: DynamicArray[string], d: Result<int, string>, e: m.Point, g: int*) { }
)");
  ASSERT_FALSE(unit.diags.has_errors());
  const auto params = unit.program->functions[0]->params;
  ASSERT_EQ(params.size(), 6U);

  EXPECT_EQ(params[0]->type->kind, TypeKind::Pointer);
  EXPECT_TRUE(params[0]->type->element_type->is_int());
  EXPECT_EQ(params[1]->type->kind, TypeKind::Array);
  EXPECT_EQ(params[2]->type->kind, TypeKind::DynamicArray);
  EXPECT_TRUE(params[2]->type->element_type->is_string());
  ASSERT_TRUE(params[3]->type->is_generic_of("Result"));
  EXPECT_EQ(params[3]->type->type_args.size(), 2U);
  EXPECT_EQ(params[4]->type->kind, TypeKind::Struct);
  EXPECT_EQ(params[4]->type->name, "m.Point");
  EXPECT_EQ(params[5]->type->kind, TypeKind::Pointer);
}

// ============================================================================
// Expressions
// ============================================================================

TEST(SyntaxParser, BinaryPrecedence)
{
  auto unit = parse("fn f() { let x = 1 + 2 * 3 == 7 && true; }");
  ASSERT_FALSE(unit.diags.has_errors());

  auto * and_expr = dyn_cast<BinaryExpr>(first_expr(unit));
  ASSERT_NE(and_expr, nullptr);
  EXPECT_EQ(and_expr->op, BinaryOp::And);

  auto * eq = dyn_cast<BinaryExpr>(and_expr->lhs);
  ASSERT_NE(eq, nullptr);
  EXPECT_EQ(eq->op, BinaryOp::Eq);

  auto * add = dyn_cast<BinaryExpr>(eq->lhs);
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, BinaryOp::Add);
  auto * mul = dyn_cast<BinaryExpr>(add->rhs);
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOp::Mul);
}

TEST(SyntaxParser, QuestionWithoutColonIsTry)
{
  auto unit = parse("fn f() -> Option<int> { let v = g()?; return Option::Some(v); }");
  ASSERT_FALSE(unit.diags.has_errors());
  auto * t = dyn_cast<TryExpr>(first_expr(unit));
  ASSERT_NE(t, nullptr);
  EXPECT_TRUE(isa<CallExpr>(t->operand));
}

TEST(SyntaxParser, QuestionFollowedByColonIsTernary)
{
  auto unit = parse("fn f(c: bool) { let v = c ? 1 : 2; }");
  ASSERT_FALSE(unit.diags.has_errors());
  auto * t = dyn_cast<TernaryExpr>(first_expr(unit));
  ASSERT_NE(t, nullptr);
  EXPECT_TRUE(isa<VarRefExpr>(t->condition));
}

TEST(SyntaxParser, TryInsideCallArgumentsStopsAtComma)
{
  auto unit = parse("fn f() { h(g()?, 1); }");
  ASSERT_FALSE(unit.diags.has_errors());
  auto * call = dyn_cast<CallExpr>(first_expr(unit));
  ASSERT_NE(call, nullptr);
  ASSERT_EQ(call->args.size(), 2U);
  EXPECT_TRUE(isa<TryExpr>(call->args[0]));
}

TEST(SyntaxParser, IfHeaderDoesNotStartStructLiteral)
{
  auto unit = parse("fn f(x: int) { if x == Y { return; } }");
  ASSERT_FALSE(unit.diags.has_errors());
  auto body = body_of(unit);
  ASSERT_EQ(body.size(), 1U);
  auto * if_stmt = dyn_cast<IfStmt>(body[0]);
  ASSERT_NE(if_stmt, nullptr);
  auto * cond = dyn_cast<BinaryExpr>(if_stmt->condition);
  ASSERT_NE(cond, nullptr);
  EXPECT_TRUE(isa<VarRefExpr>(cond->rhs));
  EXPECT_EQ(if_stmt->thenBody.size(), 1U);
}

TEST(SyntaxParser, StructLiteralOutsideHeaders)
{
  auto unit = parse("fn f() { let p = Point { x: 1, y: 2 }; let q = Empty {}; }");
  ASSERT_FALSE(unit.diags.has_errors());
  auto body = body_of(unit);
  ASSERT_EQ(body.size(), 2U);

  auto * p = dyn_cast<StructLiteralExpr>(cast<LetStmt>(body[0])->initializer);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->typeName, "Point");
  EXPECT_EQ(p->fields.size(), 2U);

  auto * q = dyn_cast<StructLiteralExpr>(cast<LetStmt>(body[1])->initializer);
  ASSERT_NE(q, nullptr);
  EXPECT_TRUE(q->fields.empty());
}

TEST(SyntaxParser, CastStarIsMultiplicationWhenFollowedByOperand)
{
  auto unit = parse("fn f(x: float) { let a = x as int * 2; }");
  ASSERT_FALSE(unit.diags.has_errors());
  auto * mul = dyn_cast<BinaryExpr>(first_expr(unit));
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOp::Mul);
  auto * c = dyn_cast<CastExpr>(mul->lhs);
  ASSERT_NE(c, nullptr);
  EXPECT_TRUE(c->targetType->is_int());
}

TEST(SyntaxParser, MatchArmsAndPatterns)
{
  auto unit = parse(R"(
fn f(o: Option<int>) -> int {
  return match o {
    Option::Some(v) => v,
    Option::None => 0,
  };
}
)");
  ASSERT_FALSE(unit.diags.has_errors());
  auto body = body_of(unit);
  auto * ret = dyn_cast<ReturnStmt>(body[0]);
  ASSERT_NE(ret, nullptr);
  auto * m = dyn_cast<MatchExpr>(ret->value);
  ASSERT_NE(m, nullptr);
  ASSERT_EQ(m->arms.size(), 2U);

  const MatchPattern * some = m->arms[0]->pattern;
  EXPECT_EQ(some->patternKind, PatternKind::Variant);
  EXPECT_EQ(some->enumName, "Option");
  EXPECT_EQ(some->variant, "Some");
  EXPECT_EQ(some->binding, "v");

  EXPECT_FALSE(m->arms[1]->pattern->has_binding());
}

TEST(SyntaxParser, ForLoopAcceptsColonOrIn)
{
  auto unit = parse("fn f() { for i in 0..10 { } for j: 0..3 { } }");
  ASSERT_FALSE(unit.diags.has_errors());
  auto body = body_of(unit);
  ASSERT_EQ(body.size(), 2U);
  auto * loop = dyn_cast<ForStmt>(body[0]);
  ASSERT_NE(loop, nullptr);
  EXPECT_EQ(loop->varName, "i");
  EXPECT_TRUE(isa<RangeExpr>(loop->iterable));
}

TEST(SyntaxParser, ElseIfNestsOneIf)
{
  auto unit = parse("fn f(x: int) { if x < 0 { } else if x == 0 { } else { } }");
  ASSERT_FALSE(unit.diags.has_errors());
  auto * outer = dyn_cast<IfStmt>(body_of(unit)[0]);
  ASSERT_NE(outer, nullptr);
  ASSERT_TRUE(outer->hasElse);
  ASSERT_EQ(outer->elseBody.size(), 1U);
  auto * inner = dyn_cast<IfStmt>(outer->elseBody[0]);
  ASSERT_NE(inner, nullptr);
  EXPECT_TRUE(inner->hasElse);
}

TEST(SyntaxParser, NewForms)
{
  auto unit = parse(R"(
fn f() {
  let a = new int;
  let b = new [int]();
  let c = new Point { x: 1, y: 2 };
}
)");
  ASSERT_FALSE(unit.diags.has_errors());
  auto body = body_of(unit);
  ASSERT_EQ(body.size(), 3U);

  auto * a = dyn_cast<NewExpr>(cast<LetStmt>(body[0])->initializer);
  ASSERT_NE(a, nullptr);
  EXPECT_TRUE(a->allocType->is_int());
  EXPECT_FALSE(a->isGrowableArray);

  auto * b = dyn_cast<NewExpr>(cast<LetStmt>(body[1])->initializer);
  ASSERT_NE(b, nullptr);
  EXPECT_TRUE(b->isGrowableArray);

  auto * c = dyn_cast<NewExpr>(cast<LetStmt>(body[2])->initializer);
  ASSERT_NE(c, nullptr);
  EXPECT_TRUE(isa<StructLiteralExpr>(c->initializer));
}

// ============================================================================
// Errors
// ============================================================================

TEST(SyntaxParser, MissingSemicolonHasFixIt)
{
  auto unit = parse("fn f() {\n  let x = 1\n  let y = 2;\n}\n");
  ASSERT_TRUE(unit.diags.has_error(ErrorKind::MissingSemicolon));

  bool saw_fixit = false;
  for (const auto & d : unit.diags) {
    if (d.kind == ErrorKind::MissingSemicolon) {
      EXPECT_EQ(d.code, "E103");
      ASSERT_FALSE(d.fixits.empty());
      EXPECT_EQ(d.fixits[0].replacement_text, ";");
      saw_fixit = true;
    }
  }
  EXPECT_TRUE(saw_fixit);

  // Recovery keeps the second statement
  ASSERT_EQ(unit.program->functions.size(), 1U);
  EXPECT_EQ(unit.program->functions[0]->body.size(), 2U);
}

TEST(SyntaxParser, LetWithoutTypeOrInitializerIsInvalidSyntax)
{
  auto unit = parse("fn f() { let x; }");
  EXPECT_TRUE(unit.diags.has_error(ErrorKind::InvalidSyntax));
}

TEST(SyntaxParser, UnclosedBraceAtEof)
{
  auto unit = parse("fn f() {\n  let x = 1;\n");
  EXPECT_TRUE(unit.diags.has_error(ErrorKind::UnclosedDelimiter));
}

TEST(SyntaxParser, MissingExpressionIsUnexpectedToken)
{
  auto unit = parse("fn f() { let x = ; }");
  EXPECT_TRUE(unit.diags.has_error(ErrorKind::UnexpectedToken));
}

TEST(SyntaxParser, GarbageAtTopLevelRecoversToNextItem)
{
  auto unit = parse("42;\nfn ok() { }\n");
  EXPECT_TRUE(unit.diags.has_error(ErrorKind::UnexpectedToken));
  ASSERT_EQ(unit.program->functions.size(), 1U);
  EXPECT_EQ(unit.program->functions[0]->name, "ok");
}

TEST(SyntaxParser, ForWithoutSeparatorIsExpectedToken)
{
  auto unit = parse("fn f() { for i 0..3 { } }");
  EXPECT_TRUE(unit.diags.has_error(ErrorKind::ExpectedToken));
}
