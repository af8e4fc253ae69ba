// awkls/basic/source_manager.cpp - Line table implementation
#include "awkls/basic/source_manager.hpp"

#include <algorithm>

namespace awkls
{

std::string_view SourceManager::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(source_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && source_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && source_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(source_).substr(start, end - start);
}

uint32_t SourceManager::get_offset(Position p) const noexcept
{
  if (p.line >= line_offsets_.size()) {
    return static_cast<uint32_t>(source_.size());
  }
  const uint32_t line_start = line_offsets_[p.line];
  const uint32_t next_line_start = (p.line + 1 < line_offsets_.size())
                                     ? line_offsets_[p.line + 1]
                                     : static_cast<uint32_t>(source_.size());
  const uint32_t line_len = next_line_start - line_start;
  return line_start + std::min(p.character, line_len);
}

Position SourceManager::get_position(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }
  if (offset > source_.size()) {
    offset = static_cast<uint32_t>(source_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {0, offset};
  }
  --it;

  const auto line = static_cast<uint32_t>(it - line_offsets_.begin());
  return {line, offset - *it};
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

}  // namespace awkls
