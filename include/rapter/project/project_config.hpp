// rapter/project/project_config.hpp - Project configuration (rapter.yaml)
//
// Parses and validates rapter.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rapter
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Entry module, relative to the project root
  std::filesystem::path entry;

  /// Output C file; `<entry stem>.c` beside the entry when unset
  std::optional<std::filesystem::path> output;

  /// Extra module search directories, relative to the project root
  std::vector<std::filesystem::path> module_paths;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (rapter.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;

  /// Directory containing rapter.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  [[nodiscard]] std::filesystem::path entry_path() const { return project_root / compiler.entry; }

  /// Absolute output path; falls back to the entry with a `.c` extension.
  [[nodiscard]] std::filesystem::path output_path() const;

  /// Module search directories resolved against the project root.
  [[nodiscard]] std::vector<std::filesystem::path> resolved_module_paths() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a rapter.yaml file.
 *
 * Malformed files produce a failed result; nothing is thrown.
 *
 * @param config_path Path to rapter.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to rapter.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Default name of the project configuration file.
inline constexpr const char * k_project_config_file_name = "rapter.yaml";

}  // namespace rapter
