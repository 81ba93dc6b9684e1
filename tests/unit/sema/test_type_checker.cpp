// rapter/tests/unit/sema/test_type_checker.cpp - Type checker tests
//
#include <gtest/gtest.h>

#include <string>

#include "rapter/ast/ast.hpp"
#include "rapter/sema/types/type_utils.hpp"
#include "rapter/test_support/parse_helpers.hpp"

using namespace rapter;
using rapter::test_support::check;
using rapter::test_support::TestCheckUnit;

namespace
{

/// Type bound by the `index`-th statement (a `let`) of function `fn_name`.
const Type * let_type(const TestCheckUnit & unit, std::string_view fn_name, size_t index)
{
  for (const FunctionDecl * fn : unit.entry->program->functions) {
    if (fn->name != fn_name) continue;
    if (index >= fn->body.size()) return nullptr;
    const auto * let = dyn_cast<LetStmt>(fn->body[index]);
    return let ? let->varType : nullptr;
  }
  return nullptr;
}

void expect_error(const TestCheckUnit & unit, ErrorKind kind, std::string_view fragment = {})
{
  ASSERT_FALSE(unit.ok());
  ASSERT_TRUE(unit.error_kind().has_value());
  EXPECT_EQ(*unit.error_kind(), kind) << unit.message();
  if (!fragment.empty()) {
    EXPECT_NE(unit.message().find(fragment), std::string::npos) << unit.message();
  }
}

}  // namespace

// ============================================================================
// Arithmetic and operators
// ============================================================================

TEST(TypeChecker, IntPlusFloatIsFloat)
{
  auto unit = check(R"(
fn main() -> int {
  let x = 1;
  let y = x + 2.0;
  let z = x * 3;
  return 0;
}
)");
  ASSERT_TRUE(unit.ok()) << unit.message();
  EXPECT_TRUE(let_type(unit, "main", 0)->is_int());
  EXPECT_TRUE(let_type(unit, "main", 1)->is_float());
  EXPECT_TRUE(let_type(unit, "main", 2)->is_int());
}

TEST(TypeChecker, StringPlusIntIsInvalidOperation)
{
  auto unit = check(R"(
fn main() -> int {
  let s = "a" + 2;
  return 0;
}
)");
  expect_error(unit, ErrorKind::InvalidOperation, "cannot apply `+`");
}

TEST(TypeChecker, StringConcatenation)
{
  auto unit = check(R"(
fn greet(name: string) -> string {
  let s = "hello " + name;
  return s;
}
)");
  ASSERT_TRUE(unit.ok()) << unit.message();
  EXPECT_TRUE(let_type(unit, "greet", 0)->is_string());
}

TEST(TypeChecker, DivisionByLiteralZero)
{
  expect_error(
    check("fn f() -> int { return 4 / 0; }"), ErrorKind::InvalidOperation, "division by zero");
  expect_error(
    check("fn f() -> int { return 4 % 0; }"), ErrorKind::InvalidOperation, "remainder by zero");
}

TEST(TypeChecker, DivisionByNegatedZero)
{
  expect_error(
    check("fn f() -> int { return 4 / -0; }"), ErrorKind::InvalidOperation, "division by zero");
  expect_error(
    check("fn f() -> float { return 1.5 / -0.0; }"), ErrorKind::InvalidOperation,
    "division by zero");
}

TEST(TypeChecker, RemainderRequiresInts)
{
  expect_error(check("fn f() -> float { return 4.0 % 2.0; }"), ErrorKind::InvalidOperation);
}

TEST(TypeChecker, ComparisonOfIncompatibleTypes)
{
  expect_error(
    check("fn f() -> bool { return 1 == \"one\"; }"), ErrorKind::TypeMismatch, "cannot compare");
}

TEST(TypeChecker, LogicalOperatorsRequireBool)
{
  expect_error(check("fn f() -> bool { return 1 && true; }"), ErrorKind::TypeMismatch);
}

TEST(TypeChecker, ConditionMustBeBool)
{
  expect_error(check("fn f() { if 1 { } }"), ErrorKind::TypeMismatch, "condition must be `bool`");
}

// ============================================================================
// Names and declarations
// ============================================================================

TEST(TypeChecker, UndefinedVariable)
{
  expect_error(check("fn f() -> int { return y; }"), ErrorKind::UndefinedVariable);
}

TEST(TypeChecker, UndefinedFunction)
{
  expect_error(check("fn f() { nope(1); }"), ErrorKind::UndefinedFunction);
}

TEST(TypeChecker, UndefinedType)
{
  expect_error(check("fn f(p: Missing) { }"), ErrorKind::UndefinedType);
}

TEST(TypeChecker, DuplicateDefinition)
{
  expect_error(check("fn f() { let a = 1; let a = 2; }"), ErrorKind::DuplicateDefinition);
  expect_error(check("fn f() { }\nfn f() { }"), ErrorKind::DuplicateDefinition);
}

TEST(TypeChecker, WrongArgumentCount)
{
  expect_error(
    check("fn add(a: int, b: int) -> int { return a + b; }\nfn f() -> int { return add(1); }"),
    ErrorKind::WrongArgumentCount);
}

TEST(TypeChecker, GenericArity)
{
  expect_error(check("fn f(o: Option<int, int>) { }"), ErrorKind::WrongArgumentCount);
  expect_error(check("fn f(o: Option) { }"), ErrorKind::WrongArgumentCount);
}

TEST(TypeChecker, ImmutableAssignment)
{
  expect_error(check("fn f() { let a = 1; a = 2; }"), ErrorKind::ImmutableAssignment);
  EXPECT_TRUE(check("fn f() { let mut a = 1; a = 2; }").ok());
}

TEST(TypeChecker, PushOnImmutableArray)
{
  expect_error(
    check("fn f() { let xs = new [int](); xs.push(1); }"), ErrorKind::ImmutableAssignment,
    "immutable variable `xs`");
  expect_error(
    check("fn f() -> int { let xs = new [int](); return xs.pop(); }"),
    ErrorKind::ImmutableAssignment);
  // Reading through an immutable binding is fine
  EXPECT_TRUE(check("fn f() -> int { let xs = new [int](); return xs.length(); }").ok());
}

TEST(TypeChecker, BreakOutsideLoop)
{
  expect_error(check("fn f() { break; }"), ErrorKind::InvalidOperation, "outside of a loop");
}

TEST(TypeChecker, StructFieldsAndLiterals)
{
  auto unit = check(R"(
struct Point { x: int, y: float }
fn f() -> float {
  let p = Point { x: 1, y: 2.5 };
  let q: *Point = new Point { x: 3, y: 4.0 };
  return p.y + q->y;
}
)");
  ASSERT_TRUE(unit.ok()) << unit.message();
  EXPECT_EQ(to_string(let_type(unit, "f", 0)), "Point");
  EXPECT_EQ(to_string(let_type(unit, "f", 1)), "*Point");
}

// ============================================================================
// Return paths
// ============================================================================

TEST(TypeChecker, MissingReturnPath)
{
  expect_error(
    check("fn f(x: int) -> int { if x > 0 { return 1; } }"), ErrorKind::MissingReturnType);
}

TEST(TypeChecker, ReturnOnlyInsideWhileIsMissing)
{
  auto unit = check(R"(
fn f(x: int) -> int {
  while x > 0 {
    return 1;
  }
}
)");
  expect_error(unit, ErrorKind::MissingReturnType, "not every path");
}

TEST(TypeChecker, IfElseBothReturning)
{
  EXPECT_TRUE(check("fn f(x: int) -> int { if x > 0 { return 1; } else { return 2; } }").ok());
}

TEST(TypeChecker, ReturnValueFromVoidFunction)
{
  expect_error(check("fn f() { return 1; }"), ErrorKind::TypeMismatch);
}

// ============================================================================
// Match
// ============================================================================

TEST(TypeChecker, NonExhaustiveEnumMatch)
{
  auto unit = check(R"(
enum Color { Red, Green, Blue }
fn f(c: Color) -> int {
  return match c {
    Color::Red => 1,
  };
}
)");
  expect_error(unit, ErrorKind::InvalidOperation, "missing variants Green, Blue");
}

TEST(TypeChecker, WildcardMakesMatchExhaustive)
{
  auto unit = check(R"(
enum Color { Red, Green, Blue }
fn f(c: Color) -> int {
  return match c {
    Color::Red => 1,
    _ => 0,
  };
}

TEST(TypeChecker, AllVariantsCoveredIsExhaustive)
{
  auto unit = check(R"(
enum Color { Red, Green, Blue }
fn f(c: Color) -> int {
  return match c {
    Color::Red => 1,
    Color::Green => 2,
    Color::Blue => 3,
  };
}
)");
  EXPECT_TRUE(unit.ok()) << unit.message();
}

TEST(TypeChecker, DuplicateLiteralArmIsUnreachable)
{
  auto unit = check(R"(
fn f(x: int) -> int {
  return match x {
    1 => 10,
    1 => 20,
    _ => 0,
  };
}
)");
  expect_error(unit, ErrorKind::InvalidOperation, "unreachable pattern");

  expect_error(
    check(R"(fn f(s: string) -> int { return match s { "a" => 1, "a" => 2, _ => 0 }; })"),
    ErrorKind::InvalidOperation, "unreachable pattern");
}

TEST(TypeChecker, DuplicateVariantArmIsUnreachable)
{
  auto unit = check(R"(
fn f(o: Option<int>) -> int {
  return match o {
    Option::Some(a) => a,
    Option::Some(b) => b,
    Option::None => 0,
  };
}
)");
  expect_error(unit, ErrorKind::InvalidOperation, "unreachable pattern");
}

TEST(TypeChecker, ArmAfterWildcardIsUnreachable)
{
  expect_error(
    check("fn f(x: int) -> int { return match x { _ => 0, 1 => 5 }; }"),
    ErrorKind::InvalidOperation, "unreachable pattern");
  expect_error(
    check("fn f(x: int) -> int { return match x { _ => 0, _ => 1 }; }"),
    ErrorKind::InvalidOperation, "unreachable pattern");
  // Distinct literals before the wildcard are fine
  EXPECT_TRUE(check("fn f(x: int) -> int { return match x { 1 => 5, -1 => 6, _ => 0 }; }").ok());
}
)");
  EXPECT_TRUE(unit.ok()) << unit.message();
}

TEST(TypeChecker, MatchBindingHasPayloadType)
{
  auto unit = check(R"(
fn f(r: Result<int, string>) -> int {
  let v = match r {
    Result::Ok(n) => n,
    Result::Err(e) => e.length(),
  };
  return v;
}
)");
  ASSERT_TRUE(unit.ok()) << unit.message();
  EXPECT_TRUE(let_type(unit, "f", 0)->is_int());
}

TEST(TypeChecker, MatchArmsMustAgree)
{
  auto unit = check(R"(
fn f(o: Option<int>) -> int {
  let v = match o {
    Option::Some(n) => n,
    Option::None => "none",
  };
  return 0;
}
)");
  expect_error(unit, ErrorKind::TypeMismatch);
}

TEST(TypeChecker, PatternMustBindPayload)
{
  auto unit = check(R"(
fn f(o: Option<int>) -> int {
  return match o {
    Option::Some => 1,
    Option::None => 0,
  };
}
)");
  expect_error(unit, ErrorKind::InvalidOperation, "must bind its value");
}

TEST(TypeChecker, EmptyMatchIsInvalidSyntax)
{
  expect_error(check("fn f(x: int) -> int { return match x { }; }"), ErrorKind::InvalidSyntax);
}

// ============================================================================
// Option / Result and `?`
// ============================================================================

TEST(TypeChecker, ExpectedTypeResolvesNone)
{
  auto unit = check(R"(
fn f() -> Option<int> {
  let a: Option<int> = Option::None;
  let b = Option::Some(3);
  return a;
}
)");
  ASSERT_TRUE(unit.ok()) << unit.message();
  EXPECT_EQ(to_string(let_type(unit, "f", 0)), "Option<int>");
  EXPECT_EQ(to_string(let_type(unit, "f", 1)), "Option<int>");
}

TEST(TypeChecker, ResultNeedsBothTypeArguments)
{
  expect_error(
    check("fn f() { let r = Result::Ok(1); }"), ErrorKind::WrongArgumentCount,
    "cannot infer all 2 type arguments");
}

TEST(TypeChecker, TryUnwrapsOkType)
{
  auto unit = check(R"(
fn parse(s: string) -> Result<int, string> {
  return Result::Ok(s.length());
}
fn twice(s: string) -> Result<int, string> {
  let n = parse(s)?;
  return Result::Ok(n * 2);
}
)");
  ASSERT_TRUE(unit.ok()) << unit.message();
  EXPECT_TRUE(let_type(unit, "twice", 0)->is_int());
}

TEST(TypeChecker, TryRequiresMatchingFamily)
{
  auto unit = check(R"(
fn get() -> Option<int> { return Option::Some(1); }
fn f() -> Result<int, string> {
  let n = get()?;
  return Result::Ok(n);
}
)");
  expect_error(unit, ErrorKind::TypeMismatch, "requires the function to return `Option`");
}

TEST(TypeChecker, TryRequiresOptionOrResult)
{
  expect_error(
    check("fn f() -> Option<int> { let n = 3?; return Option::Some(n); }"),
    ErrorKind::TypeMismatch, "requires an Option or Result operand");
}

TEST(TypeChecker, TryErrorTypesMustAgree)
{
  auto unit = check(R"(
fn get() -> Result<int, int> { return Result::Err(1); }
fn f() -> Result<int, string> {
  let n = get()?;
  return Result::Ok(n);
}
)");
  expect_error(unit, ErrorKind::TypeMismatch);
}

// ============================================================================
// Methods and loops
// ============================================================================

TEST(TypeChecker, DynamicArrayMethods)
{
  auto unit = check(R"(
fn f() -> int {
  let mut xs = new [int]();
  xs.push(1);
  xs.push(2);
  let last = xs.pop();
  let n = xs.length();
  for x in xs { println(x); }
  return last + n;
}
)");
  ASSERT_TRUE(unit.ok()) << unit.message();
  EXPECT_EQ(to_string(let_type(unit, "f", 0)), "DynamicArray[int]");
  EXPECT_TRUE(let_type(unit, "f", 3)->is_int());
  EXPECT_TRUE(let_type(unit, "f", 4)->is_int());
}

TEST(TypeChecker, PushElementTypeMismatch)
{
  expect_error(
    check("fn f() { let mut xs = new [int](); xs.push(\"a\"); }"), ErrorKind::TypeMismatch);
}

TEST(TypeChecker, RangeLoopVariableIsInt)
{
  EXPECT_TRUE(check("fn f() { for i in 0..10 { println(i + 1); } }").ok());
  expect_error(check("fn f() { for i in 0..2.5 { } }"), ErrorKind::TypeMismatch);
}

TEST(TypeChecker, CannotIterateOverInt)
{
  expect_error(check("fn f() { for i in 5 { } }"), ErrorKind::TypeMismatch, "cannot iterate");
}

TEST(TypeChecker, StringMethods)
{
  auto unit = check(R"(
fn f(s: string) -> int {
  let t = s.trim();
  let parts = s.split(',');
  let has = s.contains("x");
  let sub = s.substring(0, 2);
  return t.length();
}
)");
  ASSERT_TRUE(unit.ok()) << unit.message();
  EXPECT_TRUE(let_type(unit, "f", 0)->is_string());
  EXPECT_EQ(to_string(let_type(unit, "f", 1)), "DynamicArray[string]");
  EXPECT_TRUE(let_type(unit, "f", 2)->is_bool());
  EXPECT_TRUE(let_type(unit, "f", 3)->is_string());
}
