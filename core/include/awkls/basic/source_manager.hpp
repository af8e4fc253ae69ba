// awkls/basic/source_manager.hpp - Source positions, ranges and line tables
//
// Positions are 0-based (line, character) pairs, matching what the editor
// protocol uses. Characters are counted in bytes.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace awkls
{

// ============================================================================
// Position - Line/character pair
// ============================================================================

/**
 * A position in a document.
 *
 * Both components are 0-based. Positions are totally ordered by line first,
 * then by character.
 */
struct Position
{
  uint32_t line = 0;
  uint32_t character = 0;

  /// Return a position `n` characters further on the same line
  [[nodiscard]] constexpr Position offset(uint32_t n) const noexcept
  {
    return {line, character + n};
  }

  [[nodiscard]] constexpr bool operator==(Position other) const noexcept
  {
    return line == other.line && character == other.character;
  }
  [[nodiscard]] constexpr bool operator!=(Position other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(Position other) const noexcept
  {
    return line != other.line ? line < other.line : character < other.character;
  }
  [[nodiscard]] constexpr bool operator<=(Position other) const noexcept
  {
    return !(other < *this);
  }
  [[nodiscard]] constexpr bool operator>(Position other) const noexcept { return other < *this; }
  [[nodiscard]] constexpr bool operator>=(Position other) const noexcept
  {
    return !(*this < other);
  }
};

/// Three-way comparison: negative, zero or positive
[[nodiscard]] constexpr int compare_positions(Position a, Position b) noexcept
{
  if (a.line != b.line) {
    return a.line < b.line ? -1 : 1;
  }
  if (a.character != b.character) {
    return a.character < b.character ? -1 : 1;
  }
  return 0;
}

// ============================================================================
// Range - Start and end positions
// ============================================================================

/**
 * A range of text defined by start and end positions.
 *
 * The range follows the half-open interval convention [start, end).
 */
struct Range
{
  Position start;
  Position end;

  /// Check if a position is contained within this range
  [[nodiscard]] constexpr bool contains(Position p) const noexcept
  {
    return p >= start && p < end;
  }

  [[nodiscard]] constexpr bool operator==(const Range & other) const noexcept
  {
    return start == other.start && end == other.end;
  }
  [[nodiscard]] constexpr bool operator!=(const Range & other) const noexcept
  {
    return !(*this == other);
  }
};

/// Range covering `length` characters from `start` on a single line
[[nodiscard]] constexpr Range make_range(Position start, uint32_t length) noexcept
{
  return {start, start.offset(length)};
}

// ============================================================================
// SourceManager - Line table over a document's text
// ============================================================================

/**
 * Holds a document's text and a table of line start offsets.
 *
 * Used where diagnostics are rendered with source context.
 */
class SourceManager
{
public:
  SourceManager() = default;

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  void set_source(std::string source)
  {
    source_ = std::move(source);
    build_line_table();
  }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }

  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Get the content of a specific line (0-indexed), without its line terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Convert a position to a byte offset, clamped to the text size
  [[nodiscard]] uint32_t get_offset(Position p) const noexcept;

  /// Convert a byte offset to a position
  [[nodiscard]] Position get_position(uint32_t offset) const noexcept;

private:
  void build_line_table();

  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace awkls
