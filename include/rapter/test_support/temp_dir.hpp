// rapter/test_support/temp_dir.hpp - scratch directories for file-based tests
//
#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

namespace rapter::test_support
{

/// Directory under the system temp dir, removed with its contents on destruction.
struct TempDir
{
  std::filesystem::path path;

  explicit TempDir(std::string_view tag)
  : path(std::filesystem::temp_directory_path() / ("rapter_test_" + std::string(tag)))
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  /// Write `content` to `relative`, creating parent directories.
  std::filesystem::path write(const std::filesystem::path & relative, std::string_view content) const
  {
    const std::filesystem::path full = path / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary);
    out << content;
    return full;
  }
};

}  // namespace rapter::test_support
