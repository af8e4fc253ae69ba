// awkls/sema/position_tree.cpp - Position index over nested attribute paths
#include "awkls/sema/position_tree.hpp"

#include <algorithm>
#include <iterator>

namespace awkls
{

std::optional<uint32_t> PathPositionTree::last_named(
  const std::vector<uint32_t> & level, const std::string & name) const
{
  for (auto it = level.rbegin(); it != level.rend(); ++it) {
    if (nodes_[*it].name == name) {
      return *it;
    }
  }
  return std::nullopt;
}

uint32_t PathPositionTree::append(
  std::vector<uint32_t> * level, const std::string & name, Position position)
{
  const auto index = static_cast<uint32_t>(nodes_.size());
  PathPositionNode n;
  n.name = name;
  n.start = position;
  nodes_.push_back(std::move(n));
  level->push_back(index);
  return index;
}

uint32_t PathPositionTree::begin_path(Path path, Position position)
{
  if (path.empty()) {
    return 0;
  }

  // `level` is re-fetched after every append: the arena may reallocate.
  std::optional<uint32_t> parent;
  for (size_t i = 0; i + 1 < path.size(); ++i) {
    const auto & level = parent ? nodes_[*parent].children : roots_;
    auto found = last_named(level, path[i]);
    if (!found) {
      auto * target = parent ? &nodes_[*parent].children : &roots_;
      found = append(target, path[i], position);
    }
    parent = found;
  }

  auto * target = parent ? &nodes_[*parent].children : &roots_;
  return append(target, path.back(), position);
}

void PathPositionTree::end_path(Path path, Position position)
{
  if (const auto index = find(path)) {
    auto & n = nodes_[*index];
    if (!n.end) {
      n.end = position;
    }
  }
}

uint32_t PathPositionTree::begin_embedding(Path path, Position position)
{
  const uint32_t index = begin_path(path, position);
  if (!path.empty()) {
    nodes_[index].value_start = position;
  }
  return index;
}

void PathPositionTree::end_embedding(Path path, Position position)
{
  if (const auto index = find(path)) {
    nodes_[*index].end = position;
  }
}

std::optional<uint32_t> PathPositionTree::find(Path path) const
{
  if (path.empty()) {
    return std::nullopt;
  }
  const std::vector<uint32_t> * level = &roots_;
  std::optional<uint32_t> found;
  for (const auto & segment : path) {
    found = last_named(*level, segment);
    if (!found) {
      return std::nullopt;
    }
    level = &nodes_[*found].children;
  }
  return found;
}

void PathPositionTree::fill_ends(uint32_t index, Position parent_end)
{
  if (!nodes_[index].end) {
    nodes_[index].end = parent_end;
  }
  const Position end = *nodes_[index].end;
  for (const uint32_t child : nodes_[index].children) {
    fill_ends(child, end);
  }
}

void PathPositionTree::finish(Position document_end)
{
  for (const uint32_t root : roots_) {
    fill_ends(root, document_end);
  }
}

std::vector<std::string> PathPositionTree::context_at(Position position) const
{
  std::vector<std::string> result;
  const std::vector<uint32_t> * level = &roots_;
  while (!level->empty()) {
    // Last sibling starting at or before the position.
    auto it = std::upper_bound(
      level->begin(), level->end(), position,
      [this](Position p, uint32_t index) { return p < nodes_[index].start; });
    if (it == level->begin()) {
      break;
    }
    const PathPositionNode & n = nodes_[*std::prev(it)];
    if (n.end && *n.end < position) {
      break;
    }
    result.push_back(n.name);
    level = &n.children;
  }
  return result;
}

}  // namespace awkls
