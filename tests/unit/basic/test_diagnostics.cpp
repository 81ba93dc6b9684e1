// rapter/tests/unit/basic/test_diagnostics.cpp - Diagnostic bag and printer tests
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "rapter/basic/diagnostic.hpp"
#include "rapter/basic/diagnostic_printer.hpp"
#include "rapter/basic/source_manager.hpp"

using namespace rapter;

namespace
{

const char * k_source = "fn main() {\n  let x: int = \"hi\";\n}\n";

class DiagnosticsTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    file_ = sources_.register_file("src/main.rapt", k_source);
    const auto at = static_cast<uint32_t>(std::string(k_source).find("\"hi\""));
    literal_ = SourceRange(file_, at, at + 4);
  }

  SourceRegistry sources_;
  FileId file_ = FileId::invalid();
  SourceRange literal_;
};

}  // namespace

TEST_F(DiagnosticsTest, BagTracksKindsAndCodes)
{
  DiagnosticBag bag;
  bag.report_warning(literal_, "unused value");
  EXPECT_FALSE(bag.has_errors());

  bag.report_error(ErrorKind::TypeMismatch, literal_, "mismatched types", "expected `int`");
  ASSERT_EQ(bag.size(), 2U);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_error(ErrorKind::TypeMismatch));
  EXPECT_FALSE(bag.has_error(ErrorKind::UndefinedVariable));
  EXPECT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.errors()[0].code, "E206");
}

TEST_F(DiagnosticsTest, CompileErrorCarriesDiagnostic)
{
  const CompileError err =
    CompileError(ErrorKind::UnsupportedFeature, literal_, "not lowered").with_help("rewrite it");

  EXPECT_EQ(err.kind(), ErrorKind::UnsupportedFeature);
  EXPECT_EQ(err.diagnostic().code, "E401");
  ASSERT_TRUE(err.diagnostic().help_message.has_value());
  EXPECT_EQ(*err.diagnostic().help_message, "rewrite it");
  EXPECT_STREQ(err.what(), "E401: not lowered");
}

TEST_F(DiagnosticsTest, PrintsRustStyleText)
{
  DiagnosticBag bag;
  bag
    .report_error(
      ErrorKind::TypeMismatch, literal_, "type mismatch in let statement", "expected `int`")
    .with_help("change the annotation")
    .with_suggestion("parse the string", "let x: int = parse(\"hi\");");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(bag, sources_);
  const std::string text = out.str();

  EXPECT_NE(text.find("error[E206]: type mismatch in let statement\n"), std::string::npos);
  EXPECT_NE(text.find(":2:16\n"), std::string::npos);
  EXPECT_NE(text.find("    2 |   let x: int = \"hi\";\n"), std::string::npos);
  EXPECT_NE(
    text.find("      | " + std::string(15, ' ') + "^^^^ expected `int`\n"), std::string::npos);
  EXPECT_NE(text.find("   = help: change the annotation\n"), std::string::npos);
  EXPECT_NE(text.find("   = suggestion: parse the string\n"), std::string::npos);
  EXPECT_NE(text.find("       let x: int = parse(\"hi\");\n"), std::string::npos);
}

TEST_F(DiagnosticsTest, PrintsFixitAndSecondaryLabel)
{
  const auto stmt_end = static_cast<uint32_t>(std::string(k_source).find(';'));
  DiagnosticBag bag;
  bag.report_error(ErrorKind::MissingSemicolon, SourceRange(file_, stmt_end, stmt_end), "expected `;`")
    .with_fixit(SourceRange(file_, stmt_end, stmt_end), ";")
    .with_secondary_label(literal_, "statement ends here");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(bag, sources_);
  const std::string text = out.str();

  EXPECT_NE(text.find("help: add `;` here"), std::string::npos);
  EXPECT_NE(text.find("---- statement ends here"), std::string::npos);
}

TEST_F(DiagnosticsTest, PrintsJson)
{
  DiagnosticBag bag;
  bag.report_error(ErrorKind::UndefinedVariable, literal_, "cannot find value `y`", "not found")
    .with_suggestion("declare it first");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_json(bag, sources_);
  const nlohmann::json j = nlohmann::json::parse(out.str());

  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 1U);
  EXPECT_EQ(j[0]["severity"], "error");
  EXPECT_EQ(j[0]["code"], "E201");
  EXPECT_EQ(j[0]["message"], "cannot find value `y`");
  EXPECT_EQ(j[0]["range"]["start"]["line"], 2);
  EXPECT_EQ(j[0]["range"]["start"]["column"], 16);
  EXPECT_EQ(j[0]["labels"][0]["primary"], true);
  EXPECT_EQ(j[0]["suggestions"][0]["message"], "declare it first");
  EXPECT_TRUE(j[0]["related"].empty());
}
