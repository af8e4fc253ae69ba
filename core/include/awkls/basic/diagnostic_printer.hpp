// awkls/basic/diagnostic_printer.hpp
//
// Prints diagnostics with the offending source line and a marker under the
// reported range, in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "awkls/basic/diagnostic.hpp"
#include "awkls/basic/source_manager.hpp"

namespace awkls
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[include]: no such file: lib.awk
 *     --> scripts/main.awk:3:1
 *      |
 *    3 | @include "lib.awk"
 *      | ^^^^^^^^^^^^^^^^^^
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print one diagnostic of the file `filename`, whose text is held by `source`
  void print(const Diagnostic & diag, std::string_view filename, const SourceManager & source);

  /// Print diagnostics ordered by start position
  void print_all(
    const std::vector<Diagnostic> & diags, std::string_view filename,
    const SourceManager & source);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_source_line(const SourceManager & source, const Range & range);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace awkls
