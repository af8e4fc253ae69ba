// awkls/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "awkls/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace awkls
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(
  const Diagnostic & diag, std::string_view filename, const SourceManager & source)
{
  print_severity_header(diag);

  fmt::print(
    os_, "{} {}:{}:{}\n", gutter_arrow(), filename, diag.range.start.line + 1,
    diag.range.start.character + 1);
  fmt::print(os_, "{}\n", gutter_pipe());

  print_source_line(source, diag.range);

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(
  const std::vector<Diagnostic> & diags, std::string_view filename, const SourceManager & source)
{
  std::vector<Diagnostic> sorted_diags = diags;
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.range.start < b.range.start;
    });

  for (const auto & d : sorted_diags) {
    print(d, filename, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (!use_color_) {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", to_string(diag.severity), diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", to_string(diag.severity), diag.message);
    }
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << to_string(diag.severity);
  if (!diag.code.empty()) {
    os_ << "[" << diag.code << "]";
  }
  os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_source_line(const SourceManager & source, const Range & range)
{
  if (range.start.line >= source.get_line_count()) {
    return;
  }
  const std::string_view line = source.get_line(range.start.line);
  if (line.empty()) {
    return;
  }

  // Tabs are shown as four spaces; the marker follows the same expansion
  std::string cleaned_line;
  std::string marker_prefix;
  cleaned_line.reserve(line.size());
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    const bool before_marker = i < range.start.character;
    if (c == '\t') {
      cleaned_line += "    ";
      if (before_marker) {
        marker_prefix += "    ";
      }
    } else if (c != '\r') {
      cleaned_line += c;
      if (before_marker) {
        marker_prefix += ' ';
      }
    }
  }

  const uint32_t line_num = range.start.line + 1;
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  // Multi-line and empty ranges get a single-character marker
  size_t marker_len = 1;
  if (range.end.line == range.start.line && range.end.character > range.start.character) {
    marker_len = range.end.character - range.start.character;
  }

  fmt::print(os_, "      {} {}", gutter_pipe_only(), marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", std::string(marker_len, '^'));
  }
  fmt::print(os_, "\n");
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace awkls
