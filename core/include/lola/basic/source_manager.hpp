// lola/basic/source_manager.hpp - Source locations, ranges and line lookup
//
// The analysis core only ever stores byte offsets. Line/column information is
// computed on demand by SourceManager when diagnostics are rendered.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lola
{

// ============================================================================
// SourceLocation
// ============================================================================

/**
 * A byte offset into the specification source.
 */
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation o) const noexcept
  {
    return offset_ == o.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation o) const noexcept
  {
    return offset_ != o.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation o) const noexcept
  {
    return offset_ < o.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Half-open byte range [begin, end).
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }

  constexpr SourceRange(uint32_t begin_offset, uint32_t end_offset) noexcept
  : begin_(SourceLocation(begin_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_.get_offset() - begin_.get_offset() : 0;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange o) const noexcept
  {
    return begin_ == o.begin_ && end_ == o.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange o) const noexcept { return !(*this == o); }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// 1-indexed line/column; 0 means unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceManager
// ============================================================================

/**
 * Owns the text of one specification file and maps offsets to lines.
 *
 * The AST may come from an external parser; the manager is only needed when
 * the original text is available for rendering.
 */
class SourceManager
{
public:
  SourceManager() = default;

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept
  {
    return file_path_;
  }
  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;

  /// Line content without its terminator (0-indexed line).
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace lola
