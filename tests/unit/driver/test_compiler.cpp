// rapter/tests/unit/driver/test_compiler.cpp - Compiler driver tests
//
#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include "rapter/driver/compiler.hpp"
#include "rapter/project/project_config.hpp"
#include "rapter/test_support/temp_dir.hpp"

using namespace rapter;
using rapter::test_support::TempDir;

namespace
{

const char * k_hello = "fn main() -> int {\n  println(\"hello\");\n  return 0;\n}\n";

std::string read_text(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string first_error(const CompileResult & r)
{
  for (const auto & d : r.diagnostics) {
    if (d.severity == Severity::Error) return d.message;
  }
  return {};
}

bool have_c_compiler()
{
  return std::system("cc --version > /dev/null 2>&1") == 0;
}

}  // namespace

TEST(DriverCompiler, CompileSourceInMemory)
{
  CompileOptions opts;
  const CompileResult r = Compiler::compile_source(k_hello, opts);

  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_TRUE(r.generated_files.empty());
  EXPECT_NE(r.c_source.find("int rapter_main(void)"), std::string::npos);
  ASSERT_NE(r.module_graph, nullptr);
  EXPECT_EQ(r.module_graph->size(), 1U);
}

TEST(DriverCompiler, CompileFileWritesBesideSource)
{
  TempDir dir("driver_default_output");
  const auto source = dir.write("hello.rapt", k_hello);

  const CompileResult r = Compiler::compile_file(source, CompileOptions{});

  ASSERT_TRUE(r.success) << first_error(r);
  ASSERT_EQ(r.generated_files.size(), 1U);
  EXPECT_EQ(r.generated_files[0], dir.path / "hello.c");
  EXPECT_EQ(read_text(dir.path / "hello.c"), r.c_source);
}

TEST(DriverCompiler, ExplicitOutputCreatesDirectories)
{
  TempDir dir("driver_explicit_output");
  const auto source = dir.write("hello.rapt", k_hello);

  CompileOptions opts;
  opts.output = dir.path / "build" / "out.c";
  const CompileResult r = Compiler::compile_file(source, opts);

  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_TRUE(std::filesystem::exists(dir.path / "build" / "out.c"));
  EXPECT_FALSE(std::filesystem::exists(dir.path / "hello.c"));
}

TEST(DriverCompiler, CheckModeWritesNothing)
{
  TempDir dir("driver_check_mode");
  const auto source = dir.write("hello.rapt", k_hello);

  CompileOptions opts;
  opts.mode = CompileMode::Check;
  const CompileResult r = Compiler::compile_file(source, opts);

  ASSERT_TRUE(r.success) << first_error(r);
  EXPECT_TRUE(r.c_source.empty());
  EXPECT_TRUE(r.generated_files.empty());
  EXPECT_FALSE(std::filesystem::exists(dir.path / "hello.c"));
}

TEST(DriverCompiler, MissingFile)
{
  TempDir dir("driver_missing_file");
  const CompileResult r = Compiler::compile_file(dir.path / "nope.rapt", CompileOptions{});

  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_error(ErrorKind::ModuleNotFound));
}

TEST(DriverCompiler, ParseErrorsStopBeforeChecking)
{
  const CompileResult r = Compiler::compile_source("fn main() -> int { let x = 1 return y; }", {});

  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_error(ErrorKind::MissingSemicolon));
  // `y` is undefined, but the checker never ran
  EXPECT_FALSE(r.diagnostics.has_error(ErrorKind::UndefinedVariable));
  EXPECT_TRUE(r.c_source.empty());
}

TEST(DriverCompiler, CheckerStopsAtFirstError)
{
  const CompileResult r = Compiler::compile_source(
    "fn main() -> int { let a = x; let b = y; return 0; }", CompileOptions{});

  EXPECT_FALSE(r.success);
  ASSERT_EQ(r.diagnostics.size(), 1U);
  EXPECT_TRUE(r.diagnostics.has_error(ErrorKind::UndefinedVariable));
}

TEST(DriverCompiler, CompileProjectUsesConfiguredPaths)
{
  TempDir dir("driver_project");
  dir.write(
    "lib/mathx.rapt", "export twice;\nfn twice(n: int) -> int {\n  return n * 2;\n}\n");
  dir.write(
    "src/app.rapt", "import mathx;\nfn main() -> int {\n  return mathx.twice(21) - 42;\n}\n");
  const auto config_path = dir.write(
    "rapter.yaml",
    "package:\n  name: app\ncompiler:\n  entry: src/app.rapt\n  output: out/app.c\n"
    "  module_paths:\n    - lib\n");

  const ConfigLoadResult loaded = load_project_config(config_path);
  ASSERT_TRUE(loaded.success) << loaded.error;

  const CompileResult r = Compiler::compile_project(loaded.config, CompileOptions{});
  ASSERT_TRUE(r.success) << first_error(r);
  ASSERT_EQ(r.generated_files.size(), 1U);
  EXPECT_EQ(r.generated_files[0], loaded.config.project_root / "out" / "app.c");
  EXPECT_NE(r.c_source.find("int twice(int n)"), std::string::npos);
  EXPECT_EQ(r.module_graph->size(), 2U);
}

TEST(DriverCompiler, CompileProjectWithoutEntry)
{
  ProjectConfig config;
  const CompileResult r = Compiler::compile_project(config, CompileOptions{});
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_error(ErrorKind::ModuleNotFound));
}

// ============================================================================
// Generated programs
// ============================================================================

TEST(DriverCompiler, DynamicArrayPopsInReverseOrder)
{
  TempDir dir("driver_push_pop");
  const auto source = dir.write("stack.rapt", R"(
fn main() -> int {
  let mut xs = new [int]();
  for i in 0..5 {
    xs.push(i * 10);
  }
  while xs.length() > 0 {
    println(xs.pop());
  }
  println(xs.length());
  return 0;
}
)");

  const CompileResult r = Compiler::compile_file(source, CompileOptions{});
  ASSERT_TRUE(r.success) << first_error(r);

  if (!have_c_compiler()) {
    GTEST_SKIP() << "no C compiler available";
  }

  const auto exe = dir.path / "stack";
  const auto out = dir.path / "stack.out";
  const std::string build =
    "cc -std=gnu11 -o \"" + exe.string() + "\" \"" + (dir.path / "stack.c").string() + "\"";
  ASSERT_EQ(std::system(build.c_str()), 0) << r.c_source;

  const std::string run = "\"" + exe.string() + "\" > \"" + out.string() + "\"";
  ASSERT_EQ(std::system(run.c_str()), 0);
  EXPECT_EQ(read_text(out), "40\n30\n20\n10\n0\n0\n");
}
