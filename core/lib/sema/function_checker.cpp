// awkls/sema/function_checker.cpp - Function call checker
#include "awkls/sema/function_checker.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "awkls/sema/document.hpp"
#include "awkls/sema/include_graph.hpp"
#include "awkls/syntax/builtins.hpp"

namespace awkls
{

namespace
{

constexpr const char * k_code_undeclared = "undeclared-function";
constexpr const char * k_code_arity = "argument-count";
constexpr const char * k_code_duplicate = "duplicate-function";

struct PendingCall
{
  const ParameterUsage * open = nullptr;
  std::optional<syntax::ArityRange> arity;  ///< nullopt for unknown callees
  uint32_t arguments = 0;
};

Range callee_range(const ParameterUsage & open)
{
  return make_range(open.position, static_cast<uint32_t>(open.function.size()));
}

std::string expected_text(const syntax::ArityRange & arity)
{
  if (!arity.max) {
    return fmt::format("at least {}", arity.min);
  }
  if (*arity.max == arity.min) {
    return fmt::format("{}", arity.min);
  }
  return fmt::format("{} to {}", arity.min, *arity.max);
}

/// Counts of this document merged with those of its include closure
FunctionParameterCounts merge_counts(const Document & doc, DiagnosticBag & diags)
{
  FunctionParameterCounts combined = doc.function_parameter_counts();
  for (const Document * inc : include_closure(doc)) {
    for (const auto & [name, count] : inc->function_parameter_counts()) {
      if (doc.function_parameter_counts().count(name) != 0) {
        for (const SymbolDefinition * def : doc.find_definitions(name, SymbolType::Func)) {
          diags
            .report_error(
              def->name_range(),
              fmt::format("function {} is also defined in {}", name, inc->short_name()))
            .with_code(k_code_duplicate);
        }
        continue;
      }
      combined.emplace(name, count);
    }
  }
  return combined;
}

}  // namespace

void check_function_calls(Document & doc)
{
  doc.reset_analysis_diagnostics();

  const auto & usages = doc.parameter_usages();
  if (usages.empty()) {
    return;
  }

  DiagnosticBag diags;
  const FunctionParameterCounts combined = merge_counts(doc, diags);

  std::vector<PendingCall> stack;
  for (const ParameterUsage & usage : usages) {
    if (usage.is_call_boundary() && usage.start) {
      PendingCall call;
      call.open = &usage;
      if (auto it = combined.find(usage.function); it != combined.end()) {
        call.arity = syntax::ArityRange{it->second, it->second};
      } else if (const auto * builtin = syntax::find_builtin_function(usage.function)) {
        call.arity = builtin->arity();
      } else {
        diags.report_error(callee_range(usage), "undeclared function " + usage.function)
          .with_code(k_code_undeclared);
      }
      stack.push_back(call);
      continue;
    }

    if (stack.empty()) {
      continue;
    }

    if (!usage.is_call_boundary()) {
      if (usage.start) {
        auto & top = stack.back();
        top.arguments = std::max(top.arguments, static_cast<uint32_t>(usage.parameter) + 1);
      }
      continue;
    }

    const PendingCall call = stack.back();
    stack.pop_back();
    if (!call.arity) {
      continue;
    }
    const auto & arity = *call.arity;
    if (call.arguments < arity.min) {
      diags
        .report_error(
          callee_range(*call.open),
          fmt::format(
            "not enough arguments in call to {} (expected {}, got {})", call.open->function,
            expected_text(arity), call.arguments))
        .with_code(k_code_arity);
    } else if (arity.max && call.arguments > *arity.max) {
      diags
        .report_error(
          callee_range(*call.open),
          fmt::format(
            "too many arguments in call to {} (expected {}, got {})", call.open->function,
            expected_text(arity), call.arguments))
        .with_code(k_code_arity);
    }
  }

  for (const Diagnostic & d : diags) {
    doc.add_analysis_diagnostic(d);
  }
}

}  // namespace awkls
