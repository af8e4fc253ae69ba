// awkls/sema/workspace.cpp - Workspace implementation
#include "awkls/sema/workspace.hpp"

#include <algorithm>
#include <utility>
#include <variant>

#include "awkls/basic/uri.hpp"
#include "awkls/syntax/frontend.hpp"

namespace awkls
{

namespace
{

/// Range of the synthetic include edge from the editor root
constexpr Range k_editor_edge_range{{0, 0}, {1, 0}};

const std::string k_code_include(syntax::to_string(syntax::MessageCategory::Include));

std::set<std::string> include_targets(const Document & doc)
{
  std::set<std::string> out;
  for (const auto & [target, edge] : doc.includes()) {
    out.insert(target->uri());
  }
  return out;
}

}  // namespace

Workspace::Workspace(
  FileSystem & fs, DiagnosticSink & sink, Settings settings,
  std::shared_ptr<spdlog::logger> logger)
: fs_(fs),
  sink_(sink),
  settings_(std::move(settings)),
  logger_(std::move(logger)),
  root_(std::make_unique<Document>(k_editor_root_uri)),
  alive_(std::make_shared<bool>(true))
{
}

Workspace::~Workspace() = default;

// ============================================================================
// Registry
// ============================================================================

Document * Workspace::find_document(const std::string & uri)
{
  auto it = documents_.find(uri);
  return it != documents_.end() ? it->second.get() : nullptr;
}

const Document * Workspace::find_document(const std::string & uri) const
{
  auto it = documents_.find(uri);
  return it != documents_.end() ? it->second.get() : nullptr;
}

std::vector<const Document *> Workspace::documents() const
{
  std::vector<const Document *> out;
  out.reserve(documents_.size());
  for (const auto & [uri, doc] : documents_) {
    out.push_back(doc.get());
  }
  std::sort(out.begin(), out.end(), [](const Document * a, const Document * b) {
    return a->uri() < b->uri();
  });
  return out;
}

Document & Workspace::get_or_create(const std::string & uri)
{
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    it = documents_.emplace(uri, std::make_unique<Document>(uri)).first;
    logger_->debug("new document {}", uri);
  }
  return *it->second;
}

// ============================================================================
// Editor events
// ============================================================================

void Workspace::change_document(const std::string & uri, std::string text)
{
  Document & doc = get_or_create(uri);
  if (root_->includes().count(&doc) == 0) {
    root_->add_include(doc, k_editor_edge_range);
  }
  editor_texts_[uri] = text;
  enqueue(uri, std::move(text));
  process_queue();
}

void Workspace::close_document(const std::string & uri)
{
  editor_texts_.erase(uri);
  Document * doc = find_document(uri);
  if (doc == nullptr) {
    return;
  }
  root_->remove_include(*doc);

  // Still included elsewhere: analyse what is on disk instead of the editor buffer
  if (doc->is_included()) {
    if (auto path = file_uri_to_path(uri); path && fs_.file_exists(*path)) {
      request_read(uri, *path);
    }
  }
  process_queue();
}

bool Workspace::update_settings(Settings settings)
{
  const bool reparse = settings.requires_reparse(settings_);
  const bool recap = settings.max_number_of_problems != settings_.max_number_of_problems;
  settings_ = std::move(settings);
  if (!reparse && !recap) {
    return false;
  }

  logger_->info(
    "settings changed: mode {}, max problems {}, include path {} entries",
    settings_.gawk ? "gawk" : "awk", settings_.max_number_of_problems,
    settings_.include_path.size());

  if (reparse) {
    for (const auto & [uri, text] : editor_texts_) {
      enqueue(uri, text);
    }
  } else {
    for (auto & [uri, doc] : documents_) {
      doc->mark_diagnostics_changed();
    }
  }
  process_queue();
  return reparse;
}

// ============================================================================
// Processing queue
// ============================================================================

void Workspace::enqueue(std::string uri, std::string text)
{
  queue_.push_back({std::move(uri), std::move(text)});
}

void Workspace::process_queue()
{
  if (draining_) {
    return;
  }
  draining_ = true;
  while (pending_reads_ == 0 && !queue_.empty()) {
    const QueueItem item = std::move(queue_.front());
    queue_.pop_front();
    parse(item);
  }
  draining_ = false;

  if (pending_reads_ > 0) {
    logger_->debug("queue halted: {} read(s) outstanding", pending_reads_);
    return;
  }
  finish_cycle();
}

void Workspace::parse(const QueueItem & item)
{
  Document * doc = find_document(item.uri);
  if (doc == nullptr) {
    return;
  }

  ++parse_level_;
  if (parse_level_ != 1) {
    logger_->error("parse level {} while parsing {}", parse_level_, item.uri);
  }

  const auto previous_includes = include_targets(*doc);
  doc->clear();
  syntax::ParseOptions options;
  options.gawk = settings_.gawk;
  const auto result = syntax::parse_document(item.text, options);
  if (result.crashed) {
    logger_->error("parser crash in {}", item.uri);
  }

  for (const auto & ev : result.events) {
    if (const auto * msg = std::get_if<syntax::MessageEvent>(&ev)) {
      if (accepts(*msg)) {
        doc->apply(ev);
      }
    } else if (const auto * inc = std::get_if<syntax::IncludeEvent>(&ev)) {
      resolve_include(*doc, *inc);
    } else {
      doc->apply(ev);
    }
  }
  doc->finish_parse(result.end_position);
  parsed_this_cycle_.insert(item.uri);
  if (include_targets(*doc) != previous_includes) {
    includes_changed_this_cycle_.insert(item.uri);
  }

  --parse_level_;
}

bool Workspace::accepts(const syntax::MessageEvent & msg) const
{
  if (msg.severity != Severity::Warning) {
    return true;
  }
  switch (msg.category) {
    case syntax::MessageCategory::MissingSemicolon:
      return settings_.stylistic_warnings.missing_semicolon;
    case syntax::MessageCategory::Compatibility:
      return settings_.stylistic_warnings.compatibility;
    default:
      return true;
  }
}

void Workspace::finish_cycle()
{
  for (const auto & uri : sweep_unreachable(documents_, *root_, sink_)) {
    logger_->debug("dropped unreachable document {}", uri);
    parsed_this_cycle_.erase(uri);
    includes_changed_this_cycle_.erase(uri);
  }

  std::set<std::string> to_check;
  for (const auto & uri : parsed_this_cycle_) {
    Document * doc = find_document(uri);
    if (doc == nullptr) {
      continue;
    }
    to_check.insert(uri);
    // Includers see a different set of definitions
    if (
      doc->function_parameter_counts_changed() || includes_changed_this_cycle_.count(uri) != 0) {
      for (const Document * includer : includer_closure(*doc)) {
        if (includer != root_.get()) {
          to_check.insert(includer->uri());
        }
      }
    }
    doc->snapshot_function_parameter_counts();
  }
  parsed_this_cycle_.clear();
  includes_changed_this_cycle_.clear();

  for (const auto & uri : to_check) {
    Document * doc = find_document(uri);
    if (doc == nullptr) {
      continue;
    }
    if (settings_.stylistic_warnings.function_calls) {
      doc->check_function_calls();
    } else {
      doc->reset_analysis_diagnostics();
    }
  }

  for (const Document * cdoc : documents()) {
    Document * doc = find_document(cdoc->uri());
    doc->send_diagnostics(sink_, settings_.max_number_of_problems);
  }
}

// ============================================================================
// Includes
// ============================================================================

void Workspace::resolve_include(Document & includer, const syntax::IncludeEvent & inc)
{
  const Range range = make_range(inc.position, inc.length);
  const auto candidates =
    fs_.resolve_include_path(includer.uri(), inc.path, inc.relative, settings_.include_path);
  auto found = std::find_if(candidates.begin(), candidates.end(), [this](const std::string & p) {
    return fs_.file_exists(p);
  });
  DiagnosticBag diags;
  if (found == candidates.end()) {
    diags.report_error(range, "no such file: " + inc.path).with_code(k_code_include);
    includer.add_parse_diagnostic(diags.back());
    return;
  }

  const std::string uri = path_to_file_uri(*found);
  if (uri == includer.uri()) {
    diags.report_warning(range, "file includes itself").with_code(k_code_include);
    includer.add_parse_diagnostic(diags.back());
    return;
  }

  if (Document * target = find_document(uri)) {
    includer.add_include(*target, range);
    return;
  }
  Document & target = get_or_create(uri);
  includer.add_include(target, range);
  request_read(uri, *found);
}

void Workspace::request_read(const std::string & uri, const std::string & path)
{
  ++pending_reads_;
  std::weak_ptr<bool> alive = alive_;
  fs_.read_file(path, [this, alive, uri](std::optional<std::string> text) {
    if (alive.expired()) {
      return;
    }
    on_read_complete(uri, std::move(text));
  });
}

void Workspace::on_read_complete(const std::string & uri, std::optional<std::string> text)
{
  --pending_reads_;
  Document * doc = find_document(uri);
  if (doc != nullptr && !is_open(uri)) {
    if (text) {
      enqueue(uri, std::move(*text));
    } else {
      logger_->warn("cannot read {}", uri);
      DiagnosticBag diags;
      diags.report_error(make_range({0, 0}, 0), "cannot read file").with_code(k_code_include);
      doc->add_parse_diagnostic(diags.back());
    }
  }
  process_queue();
}

}  // namespace awkls
