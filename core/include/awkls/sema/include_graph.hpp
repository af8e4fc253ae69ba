// awkls/sema/include_graph.hpp - Traversals over the include relation
#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "awkls/sema/collaborators.hpp"
#include "awkls/sema/document.hpp"

namespace awkls
{

/// Registry of live documents keyed by URI
using DocumentRegistry = std::unordered_map<std::string, std::unique_ptr<Document>>;

/**
 * Documents reachable from `doc` by following include edges, excluding `doc`.
 *
 * Terminates on cycles: a document already visited is not expanded again.
 * The result is in breadth-first order.
 */
[[nodiscard]] std::vector<const Document *> include_closure(const Document & doc);

/// Documents that reach `doc` through include edges, excluding `doc`
[[nodiscard]] std::vector<const Document *> includer_closure(const Document & doc);

/**
 * Remove every registered document that `root` does not reach.
 *
 * Documents nothing includes go first, then whatever only they included,
 * until a fixed point. Unreachable include cycles are removed as a whole.
 * Removed documents are closed through `sink`.
 *
 * @return URIs of the removed documents, in removal order
 */
std::vector<std::string> sweep_unreachable(
  DocumentRegistry & registry, const Document & root, DiagnosticSink & sink);

}  // namespace awkls
