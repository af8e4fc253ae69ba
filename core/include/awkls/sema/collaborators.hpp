// awkls/sema/collaborators.hpp - Interfaces the analysis core needs from its host
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "awkls/basic/diagnostic.hpp"

namespace awkls
{

/**
 * File access used for include resolution.
 *
 * read_file() may complete later (the host decides when). Several reads may
 * be outstanding at once; each callback is invoked exactly once.
 */
class FileSystem
{
public:
  /// Receives the file text, or nullopt when it could not be read
  using ReadCallback = std::function<void(std::optional<std::string>)>;

  virtual ~FileSystem() = default;

  virtual void read_file(const std::string & path, ReadCallback callback) = 0;

  [[nodiscard]] virtual bool file_exists(const std::string & path) const = 0;

  /// Candidate absolute paths for an include directive, most preferred first
  [[nodiscard]] virtual std::vector<std::string> resolve_include_path(
    const std::string & source_uri, const std::string & raw_path, bool relative,
    const std::vector<std::string> & search_path) const = 0;
};

/// Receives the current diagnostics of a document; an empty list clears them
class DiagnosticSink
{
public:
  virtual ~DiagnosticSink() = default;

  virtual void publish(const std::string & uri, const std::vector<Diagnostic> & diagnostics) = 0;
};

}  // namespace awkls
