// rapter/tests/unit/codegen/test_c_generator.cpp - C generation tests
//
#include <gtest/gtest.h>

#include <string>

#include "rapter/driver/compiler.hpp"

using namespace rapter;

namespace
{

CompileResult build(std::string src)
{
  CompileOptions options;
  options.mode = CompileMode::Build;
  options.in_memory = true;
  return Compiler::compile_source(std::move(src), options);
}

size_t count(const std::string & haystack, std::string_view needle)
{
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

std::string first_error(const CompileResult & r)
{
  for (const auto & d : r.diagnostics) {
    if (d.severity == Severity::Error) return d.code + ": " + d.message;
  }
  return {};
}

bool has_error(const CompileResult & r, ErrorKind kind)
{
  return r.diagnostics.has_error(kind);
}

}  // namespace

// ============================================================================
// Program layout
// ============================================================================

TEST(CGenerator, HeadersHelpersAndTrampoline)
{
  const auto r = build("fn main() -> int { println(\"hi\"); return 0; }");
  ASSERT_TRUE(r.success) << first_error(r);
  const std::string & c = r.c_source;

  EXPECT_EQ(c.find("#include <stdio.h>"), 0U);
  EXPECT_NE(c.find("typedef struct { int* data; size_t size; size_t capacity; } DynamicArray_int;"),
            std::string::npos);
  EXPECT_NE(c.find("static inline char* rapter_concat("), std::string::npos);
  EXPECT_NE(c.find("int rapter_main(void);"), std::string::npos);
  EXPECT_NE(c.find("printf(\"%s\\n\", \"hi\")"), std::string::npos);
  EXPECT_NE(c.find("int main(int argc, char* argv[]) {"), std::string::npos);
  EXPECT_NE(c.find("return rapter_main();"), std::string::npos);

  // Helpers come before the user functions that call them
  EXPECT_LT(c.find("rapter_concat("), c.find("int rapter_main(void) {"));
}

TEST(CGenerator, VoidMainReturnsZero)
{
  const auto r = build("fn main() { }");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_NE(r.c_source.find("    rapter_main();\n    return 0;\n"), std::string::npos);
}

TEST(CGenerator, MainWithArguments)
{
  const auto r = build("fn main(argc: int, argv: **char) -> int { return argc; }");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_NE(r.c_source.find("return rapter_main(argc, argv);"), std::string::npos);
}

TEST(CGenerator, NoTrampolineWithoutMain)
{
  const auto r = build("fn helper() -> int { return 1; }");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_EQ(r.c_source.find("int main("), std::string::npos);
}

TEST(CGenerator, MainWithOneParameterIsUnsupported)
{
  const auto r = build("fn main(x: int) -> int { return x; }");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(has_error(r, ErrorKind::UnsupportedFeature));
}

// ============================================================================
// Types
// ============================================================================

TEST(CGenerator, EnumsAndStructs)
{
  const auto r = build(R"(
enum Color { Red, Green = 5, Blue }
struct Point { x: int, y: float }
fn main() -> int {
  let p = Point { x: 1, y: 2.0 };
  let c = Color::Blue;
  return p.x;
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  const std::string & c = r.c_source;

  EXPECT_NE(c.find("typedef enum {\n    COLOR_RED = 0,\n    COLOR_GREEN = 5,\n    COLOR_BLUE = 6\n} Color;"),
            std::string::npos);
  EXPECT_NE(c.find("typedef struct Point Point;"), std::string::npos);
  EXPECT_NE(c.find("struct Point {\n    int x;\n    double y;\n};"), std::string::npos);
  EXPECT_NE(c.find("DynamicArray_Point;"), std::string::npos);
  EXPECT_NE(c.find("((Point){ .x = 1, .y = 2.0 })"), std::string::npos);
  EXPECT_NE(c.find("Color c = COLOR_BLUE;"), std::string::npos);
}

TEST(CGenerator, GenericDefinedOnceAcrossUses)
{
  const auto r = build(R"(
fn parse(s: string) -> Result<int, string> {
  if s.length() == 0 {
    return Result::Err("empty");
  }
  return Result::Ok(s.length());
}
fn main() -> int {
  let a: Result<int, string> = parse("abc");
  let b = parse("");
  return 0;
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  const std::string & c = r.c_source;

  EXPECT_EQ(count(c, "} Result_int_string;"), 1U);
  EXPECT_EQ(count(c, "typedef enum { Result_int_string_Ok, Result_int_string_Err } Result_int_string_Tag;"), 1U);
  EXPECT_NE(c.find("        int ok_value;\n        char* err_value;\n"), std::string::npos);
  EXPECT_NE(
    c.find("((Result_int_string){ .tag = Result_int_string_Err, .data = { .err_value = \"empty\" } })"),
    std::string::npos);
}

TEST(CGenerator, OptionUsedTwiceEmitsOneDefinition)
{
  const auto r = build(R"(
fn first(xs: DynamicArray[int]) -> Option<int> {
  if xs.length() == 0 {
    return Option::None;
  }
  return Option::Some(xs[0]);
}
fn main() -> int {
  let xs = new [int]();
  let a = first(xs);
  let b: Option<int> = Option::Some(2);
  return 0;
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  const std::string & c = r.c_source;

  EXPECT_EQ(count(c, "} Option_int;"), 1U);
  EXPECT_EQ(count(c, "#define Option_int_NONE ((Option_int){ .tag = Option_int_None })"), 1U);
  EXPECT_NE(c.find("return Option_int_NONE;"), std::string::npos);
  EXPECT_NE(c.find("xs.data[0]"), std::string::npos);
}

TEST(CGenerator, NestedGenericFollowsItsArgument)
{
  const auto r = build(R"(
fn wrap(x: int) -> Option<Option<int>> {
  return Option::Some(Option::Some(x));
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  const std::string & c = r.c_source;
  const auto inner = c.find("} Option_int;");
  const auto outer = c.find("} Option_Option_int;");
  ASSERT_NE(inner, std::string::npos);
  ASSERT_NE(outer, std::string::npos);
  EXPECT_LT(inner, outer);
}

// ============================================================================
// Match and `?`
// ============================================================================

TEST(CGenerator, MatchOnOptionUsesSwitchWithBinding)
{
  const auto r = build(R"(
fn get(o: Option<int>) -> int {
  return match o {
    Option::Some(v) => v + 1,
    Option::None => 0,
  };
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  const std::string & c = r.c_source;

  EXPECT_NE(c.find("switch (__rapter_match_"), std::string::npos);
  EXPECT_NE(c.find("case Option_int_Some:"), std::string::npos);
  EXPECT_NE(c.find("int v = __rapter_match_"), std::string::npos);
  EXPECT_NE(c.find(".data.some_value;"), std::string::npos);
  EXPECT_NE(c.find("case Option_int_None:"), std::string::npos);
}

TEST(CGenerator, MatchOnStringUsesStrcmpChain)
{
  const auto r = build(R"(
fn code(s: string) -> int {
  return match s {
    "a" => 1,
    "b" => 2,
    _ => 0,
  };
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  const std::string & c = r.c_source;
  EXPECT_NE(c.find("strcmp(__rapter_match_"), std::string::npos);
  EXPECT_EQ(c.find("switch (__rapter_match_"), std::string::npos);
}

TEST(CGenerator, MatchOnEnumUsesEnumConstants)
{
  const auto r = build(R"(
enum Dir { Up, Down }
fn sign(d: Dir) -> int {
  return match d {
    Dir::Up => 1,
    Dir::Down => -1,
  };
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_NE(r.c_source.find("case DIR_UP:"), std::string::npos);
  EXPECT_NE(r.c_source.find("case DIR_DOWN:"), std::string::npos);
}

TEST(CGenerator, TryOnResultReturnsErrEarly)
{
  const auto r = build(R"(
fn parse(s: string) -> Result<int, string> {
  return Result::Ok(s.length());
}
fn twice(s: string) -> Result<int, string> {
  let n = parse(s)?;
  return Result::Ok(n * 2);
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  const std::string & c = r.c_source;
  EXPECT_NE(c.find("Result_int_string __rapter_try_"), std::string::npos);
  EXPECT_NE(c.find(".tag != Result_int_string_Ok) return ((Result_int_string){ .tag = Result_int_string_Err"),
            std::string::npos);
  EXPECT_NE(c.find(".data.ok_value; })"), std::string::npos);
}

TEST(CGenerator, TryOnOptionReturnsNone)
{
  const auto r = build(R"(
fn get() -> Option<int> { return Option::Some(1); }
fn f() -> Option<int> {
  let n = get()?;
  return Option::Some(n);
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_NE(r.c_source.find(".tag != Option_int_Some) return Option_int_NONE;"), std::string::npos);
}

// ============================================================================
// Statements and expressions
// ============================================================================

TEST(CGenerator, StringOperators)
{
  const auto r = build(R"(
fn f(a: string, b: string) -> bool {
  let c = a + b;
  return c == a;
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_NE(r.c_source.find("char* c = rapter_concat(a, b);"), std::string::npos);
  EXPECT_NE(r.c_source.find("(strcmp(c, a) == 0)"), std::string::npos);
}

TEST(CGenerator, RangeLoop)
{
  const auto r = build("fn f() { for i in 0..10 { println(i); } }");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_NE(r.c_source.find("for (int i = 0, __rapter_end_"), std::string::npos);
  EXPECT_NE(r.c_source.find("printf(\"%d\\n\", i);"), std::string::npos);
}

TEST(CGenerator, DynamicArrayPushAndPop)
{
  const auto r = build(R"(
fn f() -> int {
  let mut xs = new [int]();
  xs.push(7);
  return xs.pop();
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  const std::string & c = r.c_source;
  EXPECT_NE(c.find("DynamicArray_int xs = ((DynamicArray_int){ NULL, 0, 0 });"), std::string::npos);
  EXPECT_NE(c.find("realloc("), std::string::npos);
  EXPECT_NE(c.find("xs.data[rapter_pop_index(&xs.size)]"), std::string::npos);
}

TEST(CGenerator, CKeywordsAreRenamed)
{
  const auto r = build("fn f(double: int) -> int { let short = double; return short; }");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_NE(r.c_source.find("int f(int double_)"), std::string::npos);
  EXPECT_NE(r.c_source.find("int short_ = double_;"), std::string::npos);
}

TEST(CGenerator, ExternsAreForwardDeclaredOnce)
{
  const auto r = build(R"(
extern fn abs_diff(a: int, b: int) -> int;
extern fn strlen(s: string) -> int;
fn f() -> int { return abs_diff(3, 1) + strlen("x"); }
)");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_EQ(count(r.c_source, "int abs_diff(int a, int b);"), 1U);
  // libc functions come from the headers
  EXPECT_EQ(r.c_source.find("int strlen(char* s);"), std::string::npos);
}

TEST(CGenerator, ExternRuntimeHelperIsNotRedeclared)
{
  const auto r = build(R"(
extern fn rapter_read_all(path: string) -> string;
fn f() -> int {
  let text = rapter_read_all("in.txt");
  return text.length();
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  // Only the inline definition from the runtime prelude
  EXPECT_EQ(count(r.c_source, "rapter_read_all(char* path)"), 1U);
  EXPECT_EQ(r.c_source.find("char* rapter_read_all(char* path);"), std::string::npos);
}

TEST(CGenerator, ConstantGlobals)
{
  const auto r = build(R"(
const LIMIT: int = 10;
let names = ["a", "b"];
fn main() -> int {
  for n in names { println(n); }
  return LIMIT;
}
)");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_NE(r.c_source.find("static const int LIMIT = 10;"), std::string::npos);
  EXPECT_NE(r.c_source.find("static char* names[] = { \"a\", \"b\" };"), std::string::npos);
  EXPECT_NE(r.c_source.find("sizeof(names) / sizeof(names[0])"), std::string::npos);
}

// ============================================================================
// Unsupported constructs
// ============================================================================

TEST(CGenerator, NonConstantGlobalInitializerIsUnsupported)
{
  const auto r = build(R"(
fn seed() -> int { return 4; }
let g = seed();
fn main() -> int { return g; }
)");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(has_error(r, ErrorKind::UnsupportedFeature));
}

TEST(CGenerator, StructContainingItselfIsUnsupported)
{
  const auto r = build("struct Node { next: Node }\nfn main() { }");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(has_error(r, ErrorKind::UnsupportedFeature));
}

TEST(CGenerator, SelfReferenceThroughPointerIsFine)
{
  const auto r = build("struct Node { value: int, next: *Node }\nfn main() { }");
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_NE(r.c_source.find("    Node* next;\n"), std::string::npos);
}

TEST(CGenerator, RuntimeHelperNameIsReserved)
{
  const auto r = build("fn rapter_concat() { }");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(has_error(r, ErrorKind::DuplicateDefinition));
}

TEST(CGenerator, CheckModeSkipsGeneration)
{
  CompileOptions options;
  options.mode = CompileMode::Check;
  const auto r = Compiler::compile_source("fn main() -> int { return 0; }", options);
  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_TRUE(r.c_source.empty());
  EXPECT_TRUE(r.generated_files.empty());
}
