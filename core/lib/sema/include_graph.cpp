// awkls/sema/include_graph.cpp - Include closure and unreachable-document sweep
#include "awkls/sema/include_graph.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

namespace awkls
{

namespace
{

template <typename Edges>
std::vector<const Document *> closure(const Document & start, Edges edges)
{
  std::vector<const Document *> result;
  std::unordered_set<const Document *> visited{&start};
  std::deque<const Document *> pending{&start};

  while (!pending.empty()) {
    const Document * doc = pending.front();
    pending.pop_front();
    for (const auto & entry : edges(*doc)) {
      const Document * next = entry.first;
      if (visited.insert(next).second) {
        result.push_back(next);
        pending.push_back(next);
      }
    }
  }
  return result;
}

}  // namespace

std::vector<const Document *> include_closure(const Document & doc)
{
  return closure(doc, [](const Document & d) -> const IncludeMap & { return d.includes(); });
}

std::vector<const Document *> includer_closure(const Document & doc)
{
  return closure(doc, [](const Document & d) -> const IncludeMap & { return d.included_by(); });
}

std::vector<std::string> sweep_unreachable(
  DocumentRegistry & registry, const Document & root, DiagnosticSink & sink)
{
  std::vector<std::string> removed;
  auto remove = [&](const std::vector<std::string> & uris) {
    for (const auto & uri : uris) {
      auto it = registry.find(uri);
      if (it == registry.end()) {
        continue;
      }
      it->second->close(sink);
      registry.erase(it);
      removed.push_back(uri);
    }
  };

  bool found = true;
  while (found) {
    std::vector<std::string> orphans;
    for (const auto & [uri, doc] : registry) {
      if (!doc->is_included()) {
        orphans.push_back(uri);
      }
    }
    std::sort(orphans.begin(), orphans.end());
    remove(orphans);
    found = !orphans.empty();
  }

  // Whatever is left but not reachable from the root sits on an include cycle
  const auto reachable_list = include_closure(root);
  const std::unordered_set<const Document *> reachable(
    reachable_list.begin(), reachable_list.end());
  std::vector<std::string> cyclic;
  for (const auto & [uri, doc] : registry) {
    if (reachable.count(doc.get()) == 0) {
      cyclic.push_back(uri);
    }
  }
  std::sort(cyclic.begin(), cyclic.end());
  remove(cyclic);
  return removed;
}

}  // namespace awkls
