// awkls/basic/diagnostic.hpp - Diagnostic types for parsing and analysis
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "awkls/basic/source_manager.hpp"

namespace awkls
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 *
 * The numeric order is significant: lower values are more severe, and the
 * diagnostic cap drops the highest values first.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

[[nodiscard]] constexpr std::string_view to_string(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

struct Diagnostic
{
  Severity severity = Severity::Error;
  Range range;
  std::string message;
  std::string code;  // e.g., "syntax", "undeclared-function"

  [[nodiscard]] bool operator==(const Diagnostic & other) const noexcept
  {
    return severity == other.severity && range == other.range && message == other.message &&
           code == other.code;
  }
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to the bag when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(Range range, std::string message);
  DiagnosticBuilder report_warning(Range range, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  void clear() noexcept { diagnostics_.clear(); }

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }
  [[nodiscard]] const Diagnostic & back() const { return diagnostics_.back(); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace awkls
