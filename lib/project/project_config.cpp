// rapter/project/project_config.cpp - Project configuration implementation
//
#include "rapter/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace rapter
{

namespace
{

constexpr const char * k_source_extension = ".rapt";

/// Parse the 'compiler' section into `out`. Returns an error message on failure.
std::optional<std::string> parse_compiler(const YAML::Node & comp, CompilerConfig & out)
{
  if (!comp.IsMap()) {
    return std::string("compiler must be a map");
  }

  if (!comp["entry"]) {
    return std::string("compiler.entry is required");
  }
  out.entry = comp["entry"].as<std::string>();
  if (out.entry.extension() != k_source_extension) {
    return "compiler.entry must name a " + std::string(k_source_extension) +
           " file: '" + out.entry.string() + "'";
  }

  if (comp["output"]) {
    out.output = comp["output"].as<std::string>();
  }

  if (comp["module_paths"]) {
    if (!comp["module_paths"].IsSequence()) {
      return std::string("compiler.module_paths must be a list");
    }
    for (const auto & dir : comp["module_paths"]) {
      out.module_paths.emplace_back(dir.as<std::string>());
    }
  }

  return std::nullopt;
}

}  // namespace

std::filesystem::path ProjectConfig::output_path() const
{
  if (compiler.output) return project_root / *compiler.output;
  std::filesystem::path out = entry_path();
  out.replace_extension(".c");
  return out;
}

std::vector<std::filesystem::path> ProjectConfig::resolved_module_paths() const
{
  std::vector<std::filesystem::path> dirs;
  dirs.reserve(compiler.module_paths.size());
  for (const auto & dir : compiler.module_paths) {
    dirs.push_back(dir.is_absolute() ? dir : project_root / dir);
  }
  return dirs;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    if (!root["compiler"]) {
      return ConfigLoadResult::fail("missing 'compiler' section");
    }
    if (auto error = parse_compiler(root["compiler"], config.compiler)) {
      return ConfigLoadResult::fail(std::move(*error));
    }
  } catch (const YAML::Exception & e) {
    // scalar conversions (e.g. a map where a path is expected)
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace rapter
