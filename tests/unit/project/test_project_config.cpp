// rapter/tests/unit/project/test_project_config.cpp - rapter.yaml loading tests
//
#include <gtest/gtest.h>

#include <string>

#include "rapter/project/project_config.hpp"
#include "rapter/test_support/temp_dir.hpp"

using namespace rapter;
using rapter::test_support::TempDir;

TEST(ProjectConfig, LoadsFullConfiguration)
{
  TempDir dir("config_full");
  const auto path = dir.write(
    "rapter.yaml",
    "package:\n"
    "  name: demo\n"
    "  version: 0.1.0\n"
    "compiler:\n"
    "  entry: src/main.rapt\n"
    "  output: build/demo.c\n"
    "  module_paths:\n"
    "    - lib\n"
    "    - /opt/rapter/lib\n");

  const ConfigLoadResult result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & cfg = result.config;
  EXPECT_EQ(cfg.package.name, "demo");
  EXPECT_EQ(cfg.package.version, "0.1.0");
  EXPECT_EQ(cfg.project_root, std::filesystem::absolute(dir.path));
  EXPECT_EQ(cfg.entry_path(), cfg.project_root / "src" / "main.rapt");
  EXPECT_EQ(cfg.output_path(), cfg.project_root / "build" / "demo.c");

  const auto dirs = cfg.resolved_module_paths();
  ASSERT_EQ(dirs.size(), 2U);
  EXPECT_EQ(dirs[0], cfg.project_root / "lib");
  EXPECT_EQ(dirs[1], std::filesystem::path("/opt/rapter/lib"));
}

TEST(ProjectConfig, DefaultOutputSitsBesideEntry)
{
  TempDir dir("config_default_output");
  const auto path = dir.write("rapter.yaml", "compiler:\n  entry: app.rapt\n");

  const ConfigLoadResult result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_FALSE(result.config.compiler.output.has_value());
  EXPECT_EQ(result.config.output_path(), result.config.project_root / "app.c");
  EXPECT_TRUE(result.config.resolved_module_paths().empty());
}

TEST(ProjectConfig, MissingFile)
{
  TempDir dir("config_missing");
  const ConfigLoadResult result = load_project_config(dir.path / "rapter.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(ProjectConfig, RejectsMalformedFiles)
{
  TempDir dir("config_malformed");

  struct Case
  {
    const char * file;
    const char * text;
    const char * error;
  };
  const Case cases[] = {
    {"no_compiler.yaml", "package:\n  name: demo\n", "missing 'compiler' section"},
    {"no_entry.yaml", "compiler:\n  output: out.c\n", "compiler.entry is required"},
    {"wrong_ext.yaml", "compiler:\n  entry: main.txt\n", "compiler.entry must name a .rapt file"},
    {"paths_scalar.yaml", "compiler:\n  entry: main.rapt\n  module_paths: lib\n",
     "compiler.module_paths must be a list"},
    {"compiler_list.yaml", "compiler:\n  - entry\n", "compiler must be a map"},
    {"root_list.yaml", "- a\n- b\n", "configuration root must be a map"},
    {"bad_yaml.yaml", "compiler: [unclosed\n", "failed to parse YAML"},
  };

  for (const auto & c : cases) {
    const ConfigLoadResult result = load_project_config(dir.write(c.file, c.text));
    EXPECT_FALSE(result.success) << c.file;
    EXPECT_NE(result.error.find(c.error), std::string::npos) << c.file << ": " << result.error;
  }
}

TEST(ProjectConfig, FindSearchesUpward)
{
  TempDir dir("config_find");
  const auto config = dir.write("rapter.yaml", "compiler:\n  entry: main.rapt\n");
  const auto source = dir.write("src/deep/main.rapt", "fn main() {}\n");

  const auto from_dir = find_project_config(dir.path / "src" / "deep");
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(*from_dir, std::filesystem::absolute(config));

  const auto from_file = find_project_config(source);
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(*from_file, std::filesystem::absolute(config));
}
