// awkls/lsp/language_service.hpp - Editor queries over the analysed workspace
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "awkls/basic/source_manager.hpp"
#include "awkls/sema/symbols.hpp"
#include "awkls/sema/workspace.hpp"

namespace awkls::lsp
{

/**
 * Read-only LSP-style queries.
 *
 * Results are JSON documents. Positions and ranges use the editor protocol's
 * shape: {"line", "character"} and {"start", "end"}, 0-based.
 *
 * The service never triggers analysis; it answers from whatever the
 * workspace currently holds.
 */
class LanguageService
{
public:
  explicit LanguageService(const Workspace & workspace) : workspace_(workspace) {}

  /// {"uri", "contents": [..], "range": range|null}
  std::string hover_json(std::string_view uri, Position position) const;

  /// {"uri", "locations": [{"uri", "range"}]}
  std::string definition_json(std::string_view uri, Position position) const;

  /// {"uri", "locations": [{"uri", "range"}]}
  std::string references_json(
    std::string_view uri, Position position, bool include_declaration) const;

  /// {"uri", "items": [{"label", "kind", "detail", "documentation"}]}
  std::string completion_json(std::string_view uri, Position position) const;

  /// {"uri", "symbols": [{"name", "kind", "range"}]}
  std::string document_symbols_json(std::string_view uri) const;

  /// {"symbols": [{"name", "kind", "uri", "range"}]}
  std::string workspace_symbols_json(std::string_view query) const;

  /// {"uri", "signature": {"function", "label", "parameters", "activeParameter"}|null}
  std::string signature_json(std::string_view uri, Position position) const;

  /// {"uri", "path": [..]}
  std::string context_json(std::string_view uri, Position position) const;

  /// The symbol at `position`, with definition types mapped to their use types
  [[nodiscard]] std::optional<SymbolUsage> symbol_at(std::string_view uri, Position position) const;

private:
  [[nodiscard]] const Document * document(std::string_view uri) const;

  const Workspace & workspace_;
};

/// Strip the common `##` marker and following blanks from each doc-comment line
[[nodiscard]] std::string left_align(std::string_view doc_comment);

}  // namespace awkls::lsp
