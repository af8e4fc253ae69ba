// awkls/test_support/workspace_fakes.hpp - in-memory collaborators for unit tests
//
// FakeFileSystem serves files from a map and holds every read until the test
// completes it, so tests control exactly when include texts arrive.
// RecordingSink keeps every publication in order.
//
#pragma once

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "awkls/basic/diagnostic.hpp"
#include "awkls/basic/uri.hpp"
#include "awkls/sema/collaborators.hpp"
#include "awkls/sema/document.hpp"
#include "awkls/syntax/frontend.hpp"

namespace awkls::test_support
{

class RecordingSink : public DiagnosticSink
{
public:
  struct Publication
  {
    std::string uri;
    std::vector<Diagnostic> diagnostics;
  };

  void publish(const std::string & uri, const std::vector<Diagnostic> & diagnostics) override
  {
    publications.push_back({uri, diagnostics});
  }

  /// Diagnostics of the most recent publication for `uri`
  [[nodiscard]] std::optional<std::vector<Diagnostic>> latest(const std::string & uri) const
  {
    for (auto it = publications.rbegin(); it != publications.rend(); ++it) {
      if (it->uri == uri) {
        return it->diagnostics;
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] size_t count(const std::string & uri) const
  {
    size_t n = 0;
    for (const auto & p : publications) {
      if (p.uri == uri) {
        ++n;
      }
    }
    return n;
  }

  std::vector<Publication> publications;
};

class FakeFileSystem : public FileSystem
{
public:
  void add_file(std::string path, std::string text) { files_[std::move(path)] = std::move(text); }
  void remove_file(const std::string & path) { files_.erase(path); }

  void read_file(const std::string & path, ReadCallback callback) override
  {
    reads_.emplace_back(path, std::move(callback));
  }

  [[nodiscard]] bool file_exists(const std::string & path) const override
  {
    return files_.count(path) != 0;
  }

  /// Relative names resolve against the includer's directory, then the search path
  [[nodiscard]] std::vector<std::string> resolve_include_path(
    const std::string & source_uri, const std::string & raw_path, bool relative,
    const std::vector<std::string> & search_path) const override
  {
    if (!relative) {
      return {raw_path};
    }
    std::vector<std::string> out;
    if (auto source = file_uri_to_path(source_uri)) {
      const auto slash = source->rfind('/');
      out.push_back(source->substr(0, slash + 1) + raw_path);
    }
    for (const auto & dir : search_path) {
      out.push_back(dir + "/" + raw_path);
    }
    return out;
  }

  [[nodiscard]] size_t pending() const noexcept { return reads_.size(); }

  [[nodiscard]] std::vector<std::string> pending_paths() const
  {
    std::vector<std::string> out;
    for (const auto & r : reads_) {
      out.push_back(r.first);
    }
    return out;
  }

  /// Complete the oldest outstanding read; returns false when none is outstanding
  bool complete_next()
  {
    if (reads_.empty()) {
      return false;
    }
    auto [path, callback] = std::move(reads_.front());
    reads_.pop_front();
    auto it = files_.find(path);
    callback(it != files_.end() ? std::optional<std::string>(it->second) : std::nullopt);
    return true;
  }

  /// Complete reads until none is outstanding, including those issued meanwhile
  void complete_all()
  {
    while (complete_next()) {
    }
  }

private:
  std::map<std::string, std::string> files_;
  std::deque<std::pair<std::string, ReadCallback>> reads_;
};

/// Parse `text` in gawk mode and replay every event into `doc`
inline void parse_into(Document & doc, std::string_view text)
{
  syntax::ParseOptions options;
  const auto result = syntax::parse_document(text, options);
  doc.apply(result.events);
  doc.finish_parse(result.end_position);
}

[[nodiscard]] inline std::vector<const Diagnostic *> with_code(
  const std::vector<Diagnostic> & diagnostics, std::string_view code)
{
  std::vector<const Diagnostic *> out;
  for (const auto & d : diagnostics) {
    if (d.code == code) {
      out.push_back(&d);
    }
  }
  return out;
}

}  // namespace awkls::test_support
