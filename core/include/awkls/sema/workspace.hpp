// awkls/sema/workspace.hpp - Document registry, include coordinator and processing queue
#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "awkls/config/settings.hpp"
#include "awkls/sema/collaborators.hpp"
#include "awkls/sema/document.hpp"
#include "awkls/sema/include_graph.hpp"
#include "awkls/syntax/parse_events.hpp"

namespace awkls
{

/**
 * All documents known to the analysis, and the work still to be done on them.
 *
 * Work runs on the caller's thread. Parse requests go through a FIFO queue
 * that is only drained while no include read is outstanding, so a document
 * found through @include is linked into the graph before anything else is
 * parsed. When the queue is empty and no reads are outstanding, the
 * workspace sweeps unreachable documents, runs the function checker where
 * needed and publishes changed diagnostics.
 *
 * Documents open in the editor are included by a synthetic root document
 * (k_editor_root_uri), which is not part of the registry.
 */
class Workspace
{
public:
  static constexpr const char * k_editor_root_uri = "editor://";

  Workspace(
    FileSystem & fs, DiagnosticSink & sink, Settings settings = {},
    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  /// Open a document in the editor, or replace its text
  void change_document(const std::string & uri, std::string text);

  /// The editor closed `uri`. It stays only while another document includes it.
  void close_document(const std::string & uri);

  /**
   * Replace the settings.
   *
   * @return true when open documents were queued for parsing again
   */
  bool update_settings(Settings settings);

  [[nodiscard]] const Settings & settings() const noexcept { return settings_; }

  [[nodiscard]] Document * find_document(const std::string & uri);
  [[nodiscard]] const Document * find_document(const std::string & uri) const;

  /// Live documents, ordered by URI
  [[nodiscard]] std::vector<const Document *> documents() const;

  [[nodiscard]] const Document & editor_root() const noexcept { return *root_; }

  [[nodiscard]] bool is_open(const std::string & uri) const
  {
    return editor_texts_.count(uri) != 0;
  }

  /// True when nothing is queued and no read is outstanding
  [[nodiscard]] bool is_idle() const noexcept { return queue_.empty() && pending_reads_ == 0; }

  [[nodiscard]] uint32_t pending_reads() const noexcept { return pending_reads_; }
  [[nodiscard]] size_t queued() const noexcept { return queue_.size(); }

private:
  struct QueueItem
  {
    std::string uri;
    std::string text;
  };

  Document & get_or_create(const std::string & uri);

  void enqueue(std::string uri, std::string text);
  void process_queue();
  void parse(const QueueItem & item);
  void finish_cycle();

  [[nodiscard]] bool accepts(const syntax::MessageEvent & msg) const;
  void resolve_include(Document & includer, const syntax::IncludeEvent & inc);
  void request_read(const std::string & uri, const std::string & path);
  void on_read_complete(const std::string & uri, std::optional<std::string> text);

  FileSystem & fs_;
  DiagnosticSink & sink_;
  Settings settings_;
  std::shared_ptr<spdlog::logger> logger_;

  DocumentRegistry documents_;
  std::unique_ptr<Document> root_;
  std::map<std::string, std::string> editor_texts_;

  std::deque<QueueItem> queue_;
  uint32_t pending_reads_ = 0;
  bool draining_ = false;
  int parse_level_ = 0;
  std::set<std::string> parsed_this_cycle_;
  std::set<std::string> includes_changed_this_cycle_;

  /// Cleared on destruction so that late read callbacks become no-ops
  std::shared_ptr<bool> alive_;
};

}  // namespace awkls
