// awkls/lsp/local_file_system.hpp - FileSystem backed by the local disk
#pragma once

#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "awkls/sema/collaborators.hpp"

namespace awkls::lsp
{

/**
 * Reads files from disk.
 *
 * read_file() only queues the request; poll() performs the queued reads and
 * runs their callbacks. The host calls poll() from its event loop, so a read
 * never completes while the workspace is parsing.
 */
class LocalFileSystem : public FileSystem
{
public:
  void read_file(const std::string & path, ReadCallback callback) override;

  [[nodiscard]] bool file_exists(const std::string & path) const override;

  /**
   * Candidates for an include directive.
   *
   * An absolute path is used as is. A relative one is tried in the including
   * file's directory, then in each search path entry. A name without the
   * `.awk` suffix is also tried with it.
   */
  [[nodiscard]] std::vector<std::string> resolve_include_path(
    const std::string & source_uri, const std::string & raw_path, bool relative,
    const std::vector<std::string> & search_path) const override;

  /// Complete queued reads, including those queued by the callbacks. Returns the count.
  size_t poll();

  [[nodiscard]] bool has_pending() const noexcept { return !pending_.empty(); }

private:
  std::deque<std::pair<std::string, ReadCallback>> pending_;
};

}  // namespace awkls::lsp
