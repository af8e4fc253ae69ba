// awkls/sema/document.hpp - Per-file analysis results
#pragma once

#include <array>
#include <cstdint>
#include <gsl/span>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "awkls/basic/diagnostic.hpp"
#include "awkls/sema/collaborators.hpp"
#include "awkls/sema/position_tree.hpp"
#include "awkls/sema/symbols.hpp"
#include "awkls/syntax/parse_events.hpp"

namespace awkls
{

/// Range of the include directive that created an edge. Shared by both ends.
struct IncludeEdge
{
  Range range;
};

using IncludeMap = std::map<Document *, std::shared_ptr<IncludeEdge>>;
using DefinitionTable = std::unordered_map<std::string, std::vector<SymbolDefinition *>>;
using FunctionParameterCounts = std::unordered_map<std::string, uint32_t>;

/**
 * Analysis results for one file.
 *
 * A Document is filled by replaying the parser's events through apply().
 * It owns every SymbolDefinition it lists. Include edges are kept in both
 * directions: when A includes B, B's included_by() holds A with the same
 * IncludeEdge object.
 *
 * Parse diagnostics only change through apply(), add_parse_diagnostic()
 * and clear(). Analysis diagnostics are owned by the function checker.
 */
class Document
{
public:
  explicit Document(std::string uri);
  ~Document();

  Document(const Document &) = delete;
  Document & operator=(const Document &) = delete;

  [[nodiscard]] const std::string & uri() const noexcept { return uri_; }
  [[nodiscard]] std::string_view short_name() const noexcept;

  // ==========================================================================
  // Symbols
  // ==========================================================================

  /// Register a definition under its type and `name`. Redefinition is allowed.
  void add_definition(const std::string & name, SymbolDefinition * definition);

  /// Take ownership of a top-level definition and register it
  SymbolDefinition * add_definition(std::unique_ptr<SymbolDefinition> definition);

  /// Usages must be added in non-decreasing position order
  void add_usage(SymbolUsage usage);

  [[nodiscard]] bool is_defined(const std::string & name, SymbolType type) const;

  [[nodiscard]] const DefinitionTable & definitions(SymbolType type) const
  {
    return definitions_[index_of(from_define_type(type))];
  }

  /// Definitions of `name` with `type`, in declaration order; empty when none
  [[nodiscard]] gsl::span<SymbolDefinition * const> find_definitions(
    const std::string & name, SymbolType type) const;

  [[nodiscard]] const std::vector<SymbolUsage> & usages() const noexcept { return usages_; }

  /// Usage whose name span contains `position`
  [[nodiscard]] const SymbolUsage * find_usage_at(Position position) const;

  [[nodiscard]] const std::vector<ParameterUsage> & parameter_usages() const noexcept
  {
    return parameter_usages_;
  }

  /// Last parameter usage at or before `position`
  [[nodiscard]] const ParameterUsage * find_parameter_usage_at(Position position) const;

  [[nodiscard]] const PathPositionTree & position_tree() const noexcept { return position_tree_; }

  // ==========================================================================
  // Event replay
  // ==========================================================================

  /// Apply one parser event. Include events are ignored here; the workspace resolves them.
  void apply(const syntax::ParseEvent & event);
  void apply(gsl::span<const syntax::ParseEvent> events);

  /// Close open position-tree nodes at the end of the text
  void finish_parse(Position end_position);

  void register_function_call(const std::string & callee, bool start, Position position);
  void register_function_call_parameter(int32_t index, bool start, Position position);

  // ==========================================================================
  // Includes
  // ==========================================================================

  /// Record that this document includes `target`. A repeated include is warned about.
  void add_include(Document & target, Range range);

  /// Remove the edge to `target`; returns whether there was one
  bool remove_include(Document & target);

  [[nodiscard]] const IncludeMap & includes() const noexcept { return includes_; }
  [[nodiscard]] const IncludeMap & included_by() const noexcept { return included_by_; }
  [[nodiscard]] bool is_included() const noexcept { return !included_by_.empty(); }

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  /**
   * Reset everything derived from a parse, analysis diagnostics included.
   *
   * Outgoing include edges are removed from their targets first. The
   * previous function parameter count snapshot is kept.
   *
   * @return true if any include edge was removed
   */
  bool clear();

  /// clear() and publish an empty diagnostic list for this document
  bool close(DiagnosticSink & sink);

  // ==========================================================================
  // Diagnostics
  // ==========================================================================

  /// Adds unless a diagnostic at the same start position was the last one added
  void add_parse_diagnostic(Diagnostic diagnostic);
  void add_analysis_diagnostic(Diagnostic diagnostic);
  void reset_analysis_diagnostics();

  [[nodiscard]] const DiagnosticBag & parse_diagnostics() const noexcept { return parse_diags_; }
  [[nodiscard]] const DiagnosticBag & analysis_diagnostics() const noexcept
  {
    return analysis_diags_;
  }

  [[nodiscard]] bool diagnostics_changed() const noexcept { return diagnostics_changed_; }
  void mark_diagnostics_changed() noexcept { diagnostics_changed_ = true; }

  /**
   * All diagnostics, at most `max_count` of them.
   *
   * When over the cap, the least severe are dropped; the result is ordered
   * by position.
   */
  [[nodiscard]] std::vector<Diagnostic> collect_diagnostics(size_t max_count) const;

  /// Publish when changed since the last send; returns whether it published
  bool send_diagnostics(DiagnosticSink & sink, size_t max_count);

  // ==========================================================================
  // Function calls
  // ==========================================================================

  /// Declared parameter count per function defined in this document
  [[nodiscard]] const FunctionParameterCounts & function_parameter_counts() const noexcept
  {
    return param_counts_;
  }
  [[nodiscard]] const FunctionParameterCounts & previous_function_parameter_counts() const noexcept
  {
    return previous_param_counts_;
  }
  [[nodiscard]] bool function_parameter_counts_changed() const
  {
    return param_counts_ != previous_param_counts_;
  }

  /// Make the current counts the snapshot later parses are compared against
  void snapshot_function_parameter_counts() { previous_param_counts_ = param_counts_; }

  /// Second pass: check call sites against this document and its includes
  void check_function_calls();

private:
  void on_event(const syntax::DefineEvent & ev);
  void on_event(const syntax::UseEvent & ev);
  void on_event(const syntax::MessageEvent & ev);
  void on_event(const syntax::IncludeEvent &) {}
  void on_event(const syntax::CallBoundaryEvent & ev);
  void on_event(const syntax::ParameterBoundaryEvent & ev);
  void on_event(const syntax::PathBeginEvent & ev);
  void on_event(const syntax::PathEndEvent & ev);
  void on_event(const syntax::EmbeddingBeginEvent & ev);
  void on_event(const syntax::EmbeddingEndEvent & ev);

  bool clear_includes();

  std::string uri_;

  std::vector<std::unique_ptr<SymbolDefinition>> owned_;
  std::array<DefinitionTable, k_define_type_offset> definitions_;
  std::vector<SymbolUsage> usages_;
  PathPositionTree position_tree_;

  IncludeMap includes_;
  IncludeMap included_by_;

  DiagnosticBag parse_diags_;
  DiagnosticBag analysis_diags_;
  bool diagnostics_changed_ = false;

  SymbolDefinition * current_function_ = nullptr;
  std::vector<std::string> call_stack_;
  std::vector<ParameterUsage> parameter_usages_;
  FunctionParameterCounts param_counts_;
  FunctionParameterCounts previous_param_counts_;
};

}  // namespace awkls
