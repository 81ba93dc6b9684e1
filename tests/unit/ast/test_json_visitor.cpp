// test_json_visitor.cpp - Unit tests for AST JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "rapter/ast/ast.hpp"
#include "rapter/ast/json_visitor.hpp"
#include "rapter/test_support/parse_helpers.hpp"

using nlohmann::json;

namespace rapter
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  static json parse_and_serialize(const std::string & source)
  {
    auto unit = test_support::parse(source);
    EXPECT_NE(unit.program, nullptr);
    EXPECT_FALSE(unit.diags.has_errors());
    return to_json(unit.program);
  }
};

TEST_F(JsonVisitorTest, EmptyProgram)
{
  auto j = parse_and_serialize("");
  EXPECT_EQ(j["type"], "Program");
  for (const char * key :
       {"imports", "exports", "externFunctions", "structs", "enums", "globals", "functions"}) {
    ASSERT_TRUE(j[key].is_array()) << key;
    EXPECT_EQ(j[key].size(), 0U) << key;
  }
}

TEST_F(JsonVisitorTest, FunctionSignature)
{
  auto j = parse_and_serialize("fn add(a: int, b: float) -> Option<int> { return None; }");

  ASSERT_EQ(j["functions"].size(), 1U);
  const json & fn = j["functions"][0];
  EXPECT_EQ(fn["type"], "FunctionDecl");
  EXPECT_EQ(fn["name"], "add");
  EXPECT_EQ(fn["returnType"], "Option<int>");
  ASSERT_EQ(fn["params"].size(), 2U);
  EXPECT_EQ(fn["params"][0]["name"], "a");
  EXPECT_EQ(fn["params"][0]["paramType"], "int");
  EXPECT_EQ(fn["params"][1]["paramType"], "float");
  EXPECT_EQ(fn["body"][0]["type"], "ReturnStmt");
}

TEST_F(JsonVisitorTest, VoidFunctionHasNullReturnType)
{
  auto j = parse_and_serialize("fn f() {}");
  EXPECT_TRUE(j["functions"][0]["returnType"].is_null());
  EXPECT_TRUE(j["functions"][0]["body"].empty());
}

TEST_F(JsonVisitorTest, LetStatementAndLiterals)
{
  auto j = parse_and_serialize("fn f() { let mut x: int = 1 + 2; }");

  const json & let = j["functions"][0]["body"][0];
  EXPECT_EQ(let["type"], "LetStmt");
  EXPECT_EQ(let["name"], "x");
  EXPECT_EQ(let["mutable"], true);
  EXPECT_EQ(let["const"], false);
  EXPECT_EQ(let["declaredType"], "int");

  const json & init = let["initializer"];
  EXPECT_EQ(init["type"], "BinaryExpr");
  EXPECT_EQ(init["op"], "+");
  EXPECT_EQ(init["lhs"]["type"], "IntLiteralExpr");
  EXPECT_EQ(init["lhs"]["value"], 1);
  EXPECT_EQ(init["rhs"]["value"], 2);
  EXPECT_FALSE(init.contains("resolvedType"));
}

TEST_F(JsonVisitorTest, RangesAreByteOffsets)
{
  const std::string src = "fn f() { let x = 42; }";
  auto j = parse_and_serialize(src);

  const json & lit = j["functions"][0]["body"][0]["initializer"];
  const size_t at = src.find("42");
  EXPECT_EQ(lit["range"]["start"], at);
  EXPECT_EQ(lit["range"]["end"], at + 2);
}

TEST_F(JsonVisitorTest, DeclarationsOfEveryKind)
{
  auto j = parse_and_serialize(R"(
import utils.math as m;
export Point;
extern fn printf(fmt: string, ...) -> int;
struct Point { x: int, y: int }
enum Color { Red, Green = 5 }
const LIMIT: int = 10;
)");

  EXPECT_EQ(j["imports"][0]["path"], "utils.math");
  EXPECT_EQ(j["imports"][0]["alias"], "m");
  EXPECT_EQ(j["exports"][0]["name"], "Point");
  EXPECT_EQ(j["externFunctions"][0]["variadic"], true);
  EXPECT_EQ(j["structs"][0]["fields"][1]["name"], "y");
  EXPECT_EQ(j["structs"][0]["fields"][1]["fieldType"], "int");
  EXPECT_FALSE(j["enums"][0]["variants"][0].contains("value"));
  EXPECT_EQ(j["enums"][0]["variants"][1]["value"], 5);
  EXPECT_EQ(j["globals"][0]["name"], "LIMIT");
  EXPECT_EQ(j["globals"][0]["const"], true);
}

TEST_F(JsonVisitorTest, MatchArmsAndPatterns)
{
  auto j = parse_and_serialize(R"(
fn f(o: Option<int>) -> int {
  return match o { Option::Some(v) => v, _ => 0 };
}
)");

  const json & m = j["functions"][0]["body"][0]["value"];
  EXPECT_EQ(m["type"], "MatchExpr");
  ASSERT_EQ(m["arms"].size(), 2U);
  EXPECT_EQ(m["arms"][0]["pattern"]["kind"], "variant");
  EXPECT_EQ(m["arms"][0]["pattern"]["enum"], "Option");
  EXPECT_EQ(m["arms"][0]["pattern"]["variant"], "Some");
  EXPECT_EQ(m["arms"][0]["pattern"]["binding"], "v");
  EXPECT_EQ(m["arms"][1]["pattern"]["kind"], "wildcard");
}

TEST_F(JsonVisitorTest, CheckedTreeCarriesResolvedTypes)
{
  const auto unit = test_support::check("fn main() -> int { let x = 1 + 2.5; return 0; }");
  ASSERT_TRUE(unit.ok()) << unit.message();
  ASSERT_NE(unit.entry, nullptr);

  const json j = to_json(unit.entry->program);
  const json & init = j["functions"][0]["body"][0]["initializer"];
  EXPECT_EQ(init["resolvedType"], "float");
  EXPECT_EQ(init["lhs"]["resolvedType"], "int");
}

TEST(JsonVisitor, NullNode)
{
  const json j = to_json(static_cast<const AstNode *>(nullptr));
  EXPECT_EQ(j["type"], "null");
  EXPECT_TRUE(j["range"]["start"].is_null());
}

}  // namespace rapter
