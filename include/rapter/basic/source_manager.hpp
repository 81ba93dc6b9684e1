// rapter/basic/source_manager.hpp - Source files, locations and ranges
//
// Locations are byte offsets into a registered file. Line/column pairs are
// computed lazily from a per-file line table.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rapter
{

namespace fs = std::filesystem;

// ============================================================================
// FileId
// ============================================================================

/**
 * Small handle identifying a file registered in a SourceRegistry.
 */
struct FileId
{
  static constexpr uint16_t k_invalid = 0xFFFF;

  uint16_t value = k_invalid;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }
  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }

  friend constexpr bool operator==(FileId a, FileId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(FileId a, FileId b) noexcept { return a.value != b.value; }
  friend constexpr bool operator<(FileId a, FileId b) noexcept { return a.value < b.value; }
};

// ============================================================================
// SourceLocation / SourceRange
// ============================================================================

class SourceLocation
{
public:
  constexpr SourceLocation() = default;
  constexpr SourceLocation(FileId file, uint32_t offset) : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return file_.is_valid(); }

  friend constexpr bool operator<(SourceLocation a, SourceLocation b) noexcept
  {
    if (a.file_ != b.file_) return a.file_ < b.file_;
    return a.offset_ < b.offset_;
  }
  friend constexpr bool operator==(SourceLocation a, SourceLocation b) noexcept
  {
    return a.file_ == b.file_ && a.offset_ == b.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = 0;
};

/// Half-open byte range [begin, end) inside a single file.
class SourceRange
{
public:
  constexpr SourceRange() = default;
  constexpr SourceRange(SourceLocation begin, SourceLocation end) : begin_(begin), end_(end) {}
  constexpr SourceRange(FileId file, uint32_t begin, uint32_t end)
  : begin_(file, begin), end_(file, end)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return begin_.file_id(); }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return begin_.is_valid(); }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

struct LineColumn
{
  uint32_t line = 0;    // 1-based, 0 = unknown
  uint32_t column = 0;  // 1-based, 0 = unknown
};

/// Range resolved to line/column pairs plus the raw byte offsets.
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line != 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;
  /// Text of a 0-based line without its terminating newline.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Owns every source file of a compilation.
 *
 * Files are keyed by their normalized path: registering the same path twice
 * returns the same FileId.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  FileId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_path(const fs::path & path) const;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  static std::string normalize_key(const fs::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace rapter
