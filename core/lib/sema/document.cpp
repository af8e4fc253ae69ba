// awkls/sema/document.cpp - Document model implementation
#include "awkls/sema/document.hpp"

#include <algorithm>
#include <iterator>
#include <utility>
#include <variant>

#include "awkls/basic/uri.hpp"
#include "awkls/sema/function_checker.hpp"

namespace awkls
{

namespace
{

/// Order of a usage relative to `pos`: negative when the usage lies before it
int compare_usage(const SymbolUsage & usage, Position pos)
{
  if (usage.position.line != pos.line) {
    return usage.position.line < pos.line ? -1 : 1;
  }
  const uint32_t start = usage.position.character;
  const auto length = static_cast<uint32_t>(usage.name.size());
  if (length == 0) {
    return compare_positions(usage.position, pos);
  }
  if (pos.character >= start + length) {
    return -1;
  }
  if (pos.character < start) {
    return 1;
  }
  return 0;
}

}  // namespace

Document::Document(std::string uri) : uri_(std::move(uri)) {}

Document::~Document()
{
  for (auto & [target, edge] : includes_) {
    target->included_by_.erase(this);
  }
  for (auto & [includer, edge] : included_by_) {
    includer->includes_.erase(this);
  }
}

std::string_view Document::short_name() const noexcept { return uri_short_name(uri_); }

// ============================================================================
// Symbols
// ============================================================================

void Document::add_definition(const std::string & name, SymbolDefinition * definition)
{
  definitions_[index_of(from_define_type(definition->type()))][name].push_back(definition);
}

SymbolDefinition * Document::add_definition(std::unique_ptr<SymbolDefinition> definition)
{
  owned_.push_back(std::move(definition));
  SymbolDefinition * def = owned_.back().get();
  add_definition(def->name(), def);
  return def;
}

void Document::add_usage(SymbolUsage usage)
{
  if (usages_.empty() || usages_.back().position <= usage.position) {
    usages_.push_back(std::move(usage));
    return;
  }
  auto it = std::upper_bound(
    usages_.begin(), usages_.end(), usage.position,
    [](Position p, const SymbolUsage & u) { return p < u.position; });
  usages_.insert(it, std::move(usage));
}

bool Document::is_defined(const std::string & name, SymbolType type) const
{
  const auto & table = definitions(type);
  auto it = table.find(name);
  return it != table.end() && !it->second.empty();
}

gsl::span<SymbolDefinition * const> Document::find_definitions(
  const std::string & name, SymbolType type) const
{
  const auto & table = definitions(type);
  auto it = table.find(name);
  if (it == table.end()) {
    return {};
  }
  return {it->second.data(), it->second.size()};
}

const SymbolUsage * Document::find_usage_at(Position position) const
{
  size_t lo = 0;
  size_t hi = usages_.size();
  while (lo < hi) {
    const size_t mid = lo + (hi - lo) / 2;
    const int c = compare_usage(usages_[mid], position);
    if (c == 0) {
      return &usages_[mid];
    }
    if (c < 0) {
      lo = mid + 1;
    } else {
      hi = mid;
    }
  }
  return nullptr;
}

const ParameterUsage * Document::find_parameter_usage_at(Position position) const
{
  auto it = std::upper_bound(
    parameter_usages_.begin(), parameter_usages_.end(), position,
    [](Position p, const ParameterUsage & u) { return p < u.position; });
  if (it == parameter_usages_.begin()) {
    return nullptr;
  }
  return &*std::prev(it);
}

// ============================================================================
// Event replay
// ============================================================================

void Document::apply(const syntax::ParseEvent & event)
{
  std::visit([this](const auto & ev) { on_event(ev); }, event);
}

void Document::apply(gsl::span<const syntax::ParseEvent> events)
{
  for (const auto & ev : events) {
    apply(ev);
  }
}

void Document::finish_parse(Position end_position)
{
  position_tree_.finish(end_position);
  current_function_ = nullptr;
  call_stack_.clear();
}

void Document::on_event(const syntax::DefineEvent & ev)
{
  const SymbolType type = from_define_type(ev.type);
  switch (type) {
    case SymbolType::Func: {
      current_function_ = add_definition(
        std::make_unique<SymbolDefinition>(this, ev.name, type, ev.position, ev.doc_comment));
      param_counts_[ev.name] = 0;
      add_usage({ev.name, SymbolType::DefineFunc, ev.position});
      break;
    }
    case SymbolType::Parameter:
    case SymbolType::LocalVariable: {
      const bool in_function = current_function_ != nullptr && current_function_->name() == ev.scope;
      auto def = std::make_unique<SymbolDefinition>(
        this, ev.name, type, ev.position, ev.doc_comment, in_function ? current_function_ : nullptr);
      if (in_function) {
        SymbolDefinition * raw = type == SymbolType::Parameter
                                   ? current_function_->add_parameter(std::move(def))
                                   : current_function_->add_local(std::move(def));
        add_definition(ev.name, raw);
      } else {
        add_definition(std::move(def));
      }
      if (type == SymbolType::Parameter) {
        ++param_counts_[ev.scope];
      }
      add_usage({ev.name, to_define_type(type), ev.position});
      break;
    }
    case SymbolType::GlobalVariable:
    default: {
      add_definition(std::make_unique<SymbolDefinition>(
        this, ev.name, SymbolType::GlobalVariable, ev.position, ev.doc_comment, nullptr,
        ev.implicit));
      if (!ev.implicit) {
        add_usage({ev.name, SymbolType::DefineGlobalVariable, ev.position});
      }
      break;
    }
  }
}

void Document::on_event(const syntax::UseEvent & ev)
{
  add_usage({ev.name, from_define_type(ev.type), ev.position});
}

void Document::on_event(const syntax::MessageEvent & ev)
{
  Diagnostic d;
  d.severity = ev.severity;
  d.range = make_range(ev.position, ev.length);
  d.message = ev.text;
  d.code = std::string(syntax::to_string(ev.category));
  add_parse_diagnostic(std::move(d));
}

void Document::on_event(const syntax::CallBoundaryEvent & ev)
{
  register_function_call(ev.callee, ev.start, ev.position);
}

void Document::on_event(const syntax::ParameterBoundaryEvent & ev)
{
  register_function_call_parameter(ev.index, ev.start, ev.position);
}

void Document::on_event(const syntax::PathBeginEvent & ev)
{
  position_tree_.begin_path(ev.path, ev.position);
}

void Document::on_event(const syntax::PathEndEvent & ev)
{
  position_tree_.end_path(ev.path, ev.position);
}

void Document::on_event(const syntax::EmbeddingBeginEvent & ev)
{
  position_tree_.begin_embedding(ev.path, ev.position);
}

void Document::on_event(const syntax::EmbeddingEndEvent & ev)
{
  position_tree_.end_embedding(ev.path, ev.position);
}

void Document::register_function_call(const std::string & callee, bool start, Position position)
{
  if (start) {
    call_stack_.push_back(callee);
    parameter_usages_.push_back({callee, k_call_boundary_index, true, position});
    return;
  }
  if (call_stack_.empty()) {
    return;
  }
  std::string name = std::move(call_stack_.back());
  call_stack_.pop_back();
  parameter_usages_.push_back({std::move(name), k_call_boundary_index, false, position});
}

void Document::register_function_call_parameter(int32_t index, bool start, Position position)
{
  if (call_stack_.empty()) {
    return;
  }
  parameter_usages_.push_back({call_stack_.back(), index, start, position});
}

// ============================================================================
// Includes
// ============================================================================

void Document::add_include(Document & target, Range range)
{
  auto it = includes_.find(&target);
  if (it != includes_.end()) {
    Diagnostic d;
    d.severity = Severity::Warning;
    d.range = range;
    d.message = "repeated include of " + std::string(target.short_name());
    d.code = std::string(syntax::to_string(syntax::MessageCategory::Structure));
    add_parse_diagnostic(std::move(d));
    it->second->range = range;
    return;
  }
  auto edge = std::make_shared<IncludeEdge>(IncludeEdge{range});
  includes_.emplace(&target, edge);
  target.included_by_.emplace(this, std::move(edge));
}

bool Document::remove_include(Document & target)
{
  if (includes_.erase(&target) == 0) {
    return false;
  }
  target.included_by_.erase(this);
  return true;
}

bool Document::clear_includes()
{
  const bool changed = !includes_.empty();
  for (auto & [target, edge] : includes_) {
    target->included_by_.erase(this);
  }
  includes_.clear();
  return changed;
}

// ============================================================================
// Lifecycle
// ============================================================================

bool Document::clear()
{
  const bool changed = clear_includes();

  for (auto & table : definitions_) {
    table.clear();
  }
  owned_.clear();
  usages_.clear();
  position_tree_.clear();

  parse_diags_.clear();
  analysis_diags_.clear();
  diagnostics_changed_ = true;

  current_function_ = nullptr;
  call_stack_.clear();
  parameter_usages_.clear();
  param_counts_.clear();
  return changed;
}

bool Document::close(DiagnosticSink & sink)
{
  const bool changed = clear();
  sink.publish(uri_, {});
  diagnostics_changed_ = false;
  return changed;
}

// ============================================================================
// Diagnostics
// ============================================================================

void Document::add_parse_diagnostic(Diagnostic diagnostic)
{
  if (!parse_diags_.empty() && parse_diags_.back().range.start == diagnostic.range.start) {
    return;
  }
  parse_diags_.add(std::move(diagnostic));
  diagnostics_changed_ = true;
}

void Document::add_analysis_diagnostic(Diagnostic diagnostic)
{
  analysis_diags_.add(std::move(diagnostic));
  diagnostics_changed_ = true;
}

void Document::reset_analysis_diagnostics()
{
  if (!analysis_diags_.empty()) {
    analysis_diags_.clear();
    diagnostics_changed_ = true;
  }
}

std::vector<Diagnostic> Document::collect_diagnostics(size_t max_count) const
{
  std::vector<Diagnostic> all(parse_diags_.begin(), parse_diags_.end());
  all.insert(all.end(), analysis_diags_.begin(), analysis_diags_.end());

  if (all.size() > max_count) {
    std::stable_sort(all.begin(), all.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.severity < b.severity;
    });
    all.resize(max_count);
  }
  std::stable_sort(all.begin(), all.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.range.start < b.range.start;
  });
  return all;
}

bool Document::send_diagnostics(DiagnosticSink & sink, size_t max_count)
{
  if (!diagnostics_changed_) {
    return false;
  }
  sink.publish(uri_, collect_diagnostics(max_count));
  diagnostics_changed_ = false;
  return true;
}

// ============================================================================
// Function calls
// ============================================================================

void Document::check_function_calls() { ::awkls::check_function_calls(*this); }

}  // namespace awkls
