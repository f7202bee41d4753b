// lola/basic/source_manager.cpp - Offset to line/column mapping
#include "lola/basic/source_manager.hpp"

#include <algorithm>

namespace lola
{

LineColumn SourceManager::get_line_column(SourceLocation loc) const noexcept
{
  if (loc.is_invalid() || line_offsets_.empty()) {
    return {};
  }

  const uint32_t offset = std::min(loc.get_offset(), static_cast<uint32_t>(source_.size()));
  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  --it;  // line_offsets_[0] == 0, so upper_bound never returns begin()

  const auto line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  return {line, offset - *it + 1};
}

std::string_view SourceManager::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(source_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1] - 1;
  }
  if (end > start && source_[end - 1] == '\r') {
    --end;
  }
  return std::string_view(source_).substr(start, end - start);
}

std::string_view SourceManager::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }
  const uint32_t start = range.get_begin().get_offset();
  if (start >= source_.size()) {
    return {};
  }
  const uint32_t end =
    std::min(range.get_end().get_offset(), static_cast<uint32_t>(source_.size()));
  return std::string_view(source_).substr(start, end > start ? end - start : 0);
}

FullSourceRange SourceManager::get_full_range(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }
  const LineColumn begin = get_line_column(range.get_begin());
  const LineColumn end = get_line_column(range.get_end());

  FullSourceRange result;
  result.start_line = begin.line;
  result.start_column = begin.column;
  result.end_line = end.line;
  result.end_column = end.column;
  return result;
}

void SourceManager::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);
  for (size_t i = 0; i < source_.size(); ++i) {
    if (source_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace lola
