// awkls/sema/position_tree.hpp - Position index over nested attribute paths
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <vector>

#include "awkls/basic/source_manager.hpp"

namespace awkls
{

struct PathPositionNode
{
  std::string name;
  Position start;                      ///< first position inside the segment
  std::optional<Position> value_start;  ///< start of embedded content (regex literals)
  std::optional<Position> end;
  std::vector<uint32_t> children;  ///< indices into the arena, in creation order
};

/**
 * Ordered forest keyed by attribute paths.
 *
 * Nodes live in an arena and refer to their children by index. Siblings are
 * kept in creation order, which is text order because the parser emits paths
 * left to right. This lets context_at() binary search each level.
 */
class PathPositionTree
{
public:
  using Path = gsl::span<const std::string>;

  /// Open a new node for `path`. Missing ancestors are created on the way.
  uint32_t begin_path(Path path, Position position);

  /// Close the most recent node for `path` unless it already has an end
  void end_path(Path path, Position position);

  /// Open a node whose embedded content starts at `position`
  uint32_t begin_embedding(Path path, Position position);

  /// Close an embedding node; this always overwrites the end
  void end_embedding(Path path, Position position);

  /// Most recently created node for `path`
  [[nodiscard]] std::optional<uint32_t> find(Path path) const;

  /// Give every node without an end its parent's end, or `document_end` at the top
  void finish(Position document_end);

  /// Names of the nested nodes containing `position`, outermost first
  [[nodiscard]] std::vector<std::string> context_at(Position position) const;

  [[nodiscard]] const PathPositionNode & node(uint32_t index) const { return nodes_.at(index); }
  [[nodiscard]] const std::vector<uint32_t> & roots() const noexcept { return roots_; }
  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

  void clear() noexcept
  {
    nodes_.clear();
    roots_.clear();
  }

private:
  [[nodiscard]] std::optional<uint32_t> last_named(
    const std::vector<uint32_t> & level, const std::string & name) const;
  uint32_t append(std::vector<uint32_t> * level, const std::string & name, Position position);
  void fill_ends(uint32_t index, Position parent_end);

  std::vector<PathPositionNode> nodes_;
  std::vector<uint32_t> roots_;
};

}  // namespace awkls
