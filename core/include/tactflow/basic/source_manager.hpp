// tactflow/basic/source_manager.hpp - Source files, locations and ranges
//
// Locations are (file id, byte offset) pairs. Line and column information
// is computed on demand from the SourceRegistry that owns the file content.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tactflow
{

namespace fs = std::filesystem;

// ============================================================================
// FileId - Handle into a SourceRegistry
// ============================================================================

struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  constexpr FileId() noexcept = default;
  constexpr explicit FileId(uint16_t v) noexcept : value(v) {}

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Stores the owning file and a byte offset into it. An IR produced without
 * position information uses the default-constructed (invalid) location.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;

  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }
  /// Orders by file first, then by offset
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_.value != other.file_.value) {
      return file_.value < other.file_.value;
    }
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A half-open range [start, end) within a single file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(file, start_offset), end_(file, end_offset)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return start_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (!is_valid()) return 0;
    return end_.offset() - start_.offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/// Both ends of a SourceRange as lines and columns
struct FullSourceRange
{
  LineColumn start;
  LineColumn end;

  [[nodiscard]] bool is_valid() const noexcept { return start.is_valid(); }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Read-only text of one file of a loaded IR with its line table.
 *
 * Offsets come from the frontend and are not trusted: lookups clamp them
 * to the content.
 */
class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  [[nodiscard]] LineColumn locate(uint32_t offset) const noexcept;

  /// Content of a line (0-indexed) without its terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_starts_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Files of a CompilationUnit, numbered in the order the IR lists them.
 *
 * Ranges whose file is not registered resolve to nothing.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Add a file; returns an invalid id once every FileId is taken
  FileId add_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] FullSourceRange resolve(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  /// `path:line:column` of the start of `range`, relative to `base` when possible
  [[nodiscard]] std::optional<std::string> describe(
    SourceRange range, const fs::path & base = {}) const;

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
};

}  // namespace tactflow
