// tests/unit/sema/test_document.cpp - Unit tests for the per-file document model
//
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "awkls/sema/document.hpp"
#include "awkls/test_support/workspace_fakes.hpp"

using namespace awkls;
using awkls::test_support::parse_into;
using awkls::test_support::RecordingSink;

namespace
{

Diagnostic make_diag(Severity severity, Position start, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.range = make_range(start, 1);
  d.message = std::move(message);
  return d;
}

}  // namespace

// ============================================================================
// Event replay
// ============================================================================

TEST(SemaDocument, FunctionDefinitionIsRecorded)
{
  Document doc("file:///w/lib.awk");
  parse_into(doc, "## joins two words\nfunction join(a, b,  sep) { sep = \" \"; return a sep b }\n");

  const auto defs = doc.find_definitions("join", SymbolType::Func);
  ASSERT_EQ(defs.size(), 1U);
  const SymbolDefinition * join = defs[0];
  EXPECT_EQ(join->signature(), "join(a, b)");
  EXPECT_EQ(join->parameters().size(), 2U);
  EXPECT_EQ(join->locals().size(), 1U);
  EXPECT_NE(join->doc_comment().find("joins two words"), std::string::npos);

  ASSERT_EQ(doc.function_parameter_counts().count("join"), 1U);
  EXPECT_EQ(doc.function_parameter_counts().at("join"), 2U);

  // Parameters are found through their use type, and scoped to the function
  const auto params = doc.find_definitions("a", SymbolType::DefineParameter);
  ASSERT_EQ(params.size(), 1U);
  EXPECT_EQ(params[0]->scope(), join);
}

TEST(SemaDocument, ImplicitGlobalsAddNoDefinitionUsage)
{
  Document doc("file:///w/a.awk");
  parse_into(doc, "BEGIN { count = 1 }\n");

  EXPECT_TRUE(doc.is_defined("count", SymbolType::GlobalVariable));
  for (const auto & u : doc.usages()) {
    EXPECT_NE(u.type, SymbolType::DefineGlobalVariable);
  }
  ASSERT_EQ(doc.usages().size(), 1U);
  EXPECT_EQ(doc.usages()[0].type, SymbolType::GlobalVariable);
}

TEST(SemaDocument, ParseMessagesBecomeDiagnostics)
{
  Document doc("file:///w/a.awk");
  parse_into(doc, "BEGIN { x = }\n");

  ASSERT_FALSE(doc.parse_diagnostics().empty());
  EXPECT_EQ(doc.parse_diagnostics().all()[0].code, "syntax");
  EXPECT_TRUE(doc.diagnostics_changed());
}

TEST(SemaDocument, CallBoundariesAreRecorded)
{
  Document doc("file:///w/a.awk");
  parse_into(doc, "BEGIN { f(1, 2) }\n");

  const auto & pu = doc.parameter_usages();
  ASSERT_EQ(pu.size(), 6U);
  EXPECT_TRUE(pu.front().is_call_boundary());
  EXPECT_TRUE(pu.front().start);
  EXPECT_EQ(pu.front().function, "f");
  EXPECT_TRUE(pu.back().is_call_boundary());
  EXPECT_FALSE(pu.back().start);

  // Inside the second argument
  const ParameterUsage * at = doc.find_parameter_usage_at({0, 13});
  ASSERT_NE(at, nullptr);
  EXPECT_EQ(at->parameter, 1);
  EXPECT_TRUE(at->start);

  EXPECT_EQ(doc.find_parameter_usage_at({0, 0}), nullptr);
}

// ============================================================================
// Usage lookup
// ============================================================================

TEST(SemaDocument, UsageLookupCoversHalfOpenSpan)
{
  Document doc("file:///w/a.awk");
  doc.add_usage({"abc", SymbolType::GlobalVariable, {0, 10}});
  doc.add_usage({"z", SymbolType::GlobalVariable, {0, 2}});

  EXPECT_EQ(doc.find_usage_at({0, 9}), nullptr);
  ASSERT_NE(doc.find_usage_at({0, 10}), nullptr);
  EXPECT_EQ(doc.find_usage_at({0, 10})->name, "abc");
  ASSERT_NE(doc.find_usage_at({0, 12}), nullptr);
  EXPECT_EQ(doc.find_usage_at({0, 13}), nullptr);
  EXPECT_EQ(doc.find_usage_at({1, 10}), nullptr);

  // Out of order insertion keeps the list sorted
  ASSERT_EQ(doc.usages().size(), 2U);
  EXPECT_EQ(doc.usages()[0].name, "z");
  ASSERT_NE(doc.find_usage_at({0, 2}), nullptr);
}

TEST(SemaDocument, ZeroLengthUsageMatchesOnlyItsPosition)
{
  Document doc("file:///w/a.awk");
  doc.add_usage({"", SymbolType::GlobalVariable, {2, 4}});

  EXPECT_NE(doc.find_usage_at({2, 4}), nullptr);
  EXPECT_EQ(doc.find_usage_at({2, 5}), nullptr);
  EXPECT_EQ(doc.find_usage_at({2, 3}), nullptr);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST(SemaDocument, ClearIsIdempotent)
{
  Document a("file:///w/a.awk");
  Document b("file:///w/b.awk");
  parse_into(a, "function f(x) { return x }\nBEGIN { f(1) }\n");
  a.add_include(b, make_range({0, 0}, 5));

  EXPECT_TRUE(a.clear());
  EXPECT_FALSE(a.clear());

  EXPECT_TRUE(a.usages().empty());
  EXPECT_TRUE(a.parameter_usages().empty());
  EXPECT_TRUE(a.definitions(SymbolType::Func).empty());
  EXPECT_TRUE(a.function_parameter_counts().empty());
  EXPECT_TRUE(a.parse_diagnostics().empty());
  EXPECT_TRUE(a.position_tree().empty());
  EXPECT_TRUE(a.includes().empty());
  EXPECT_FALSE(b.is_included());
  EXPECT_TRUE(a.diagnostics_changed());
}

TEST(SemaDocument, ClosePublishesEmptyDiagnostics)
{
  RecordingSink sink;
  Document doc("file:///w/a.awk");
  parse_into(doc, "BEGIN { x = }\n");

  doc.close(sink);
  ASSERT_EQ(sink.publications.size(), 1U);
  EXPECT_EQ(sink.publications[0].uri, "file:///w/a.awk");
  EXPECT_TRUE(sink.publications[0].diagnostics.empty());
  EXPECT_FALSE(doc.diagnostics_changed());
}

TEST(SemaDocument, ParameterCountSnapshot)
{
  Document doc("file:///w/lib.awk");
  parse_into(doc, "function f(a) { }\n");
  EXPECT_TRUE(doc.function_parameter_counts_changed());
  doc.snapshot_function_parameter_counts();
  EXPECT_FALSE(doc.function_parameter_counts_changed());

  doc.clear();
  parse_into(doc, "function f(a) { }\n");
  EXPECT_FALSE(doc.function_parameter_counts_changed());

  doc.clear();
  parse_into(doc, "function f(a, b) { }\n");
  EXPECT_TRUE(doc.function_parameter_counts_changed());
  EXPECT_EQ(doc.previous_function_parameter_counts().at("f"), 1U);
}

// ============================================================================
// Includes
// ============================================================================

TEST(SemaDocument, IncludeEdgeIsSharedBothWays)
{
  Document a("file:///w/a.awk");
  Document b("file:///w/b.awk");
  a.add_include(b, make_range({0, 9}, 7));

  ASSERT_EQ(a.includes().count(&b), 1U);
  ASSERT_EQ(b.included_by().count(&a), 1U);
  EXPECT_EQ(a.includes().at(&b).get(), b.included_by().at(&a).get());
  EXPECT_TRUE(b.is_included());

  EXPECT_TRUE(a.remove_include(b));
  EXPECT_FALSE(a.remove_include(b));
  EXPECT_FALSE(b.is_included());
}

TEST(SemaDocument, RepeatedIncludeWarnsAndMovesRange)
{
  Document a("file:///w/a.awk");
  Document b("file:///w/b.awk");
  a.add_include(b, make_range({0, 9}, 7));
  a.add_include(b, make_range({3, 9}, 7));

  ASSERT_EQ(a.parse_diagnostics().size(), 1U);
  const Diagnostic & d = a.parse_diagnostics().all()[0];
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.message, "repeated include of b.awk");
  EXPECT_EQ(a.includes().at(&b)->range.start.line, 3U);
}

TEST(SemaDocument, DestructorSeversEdges)
{
  Document a("file:///w/a.awk");
  {
    Document b("file:///w/b.awk");
    a.add_include(b, make_range({0, 0}, 1));
    b.add_include(a, make_range({0, 0}, 1));
    EXPECT_TRUE(a.is_included());
  }
  EXPECT_TRUE(a.includes().empty());
  EXPECT_FALSE(a.is_included());
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(SemaDocument, ParseDiagnosticsAtSameStartAreDeduplicated)
{
  Document doc("file:///w/a.awk");
  doc.add_parse_diagnostic(make_diag(Severity::Error, {1, 2}, "first"));
  doc.add_parse_diagnostic(make_diag(Severity::Error, {1, 2}, "second"));
  doc.add_parse_diagnostic(make_diag(Severity::Error, {1, 3}, "third"));

  ASSERT_EQ(doc.parse_diagnostics().size(), 2U);
  EXPECT_EQ(doc.parse_diagnostics().all()[0].message, "first");
}

TEST(SemaDocument, CapKeepsMostSevereInTextOrder)
{
  Document doc("file:///w/a.awk");
  doc.add_parse_diagnostic(make_diag(Severity::Warning, {0, 0}, "w1"));
  doc.add_parse_diagnostic(make_diag(Severity::Warning, {1, 0}, "w2"));
  doc.add_analysis_diagnostic(make_diag(Severity::Error, {2, 0}, "e1"));

  const auto capped = doc.collect_diagnostics(2);
  ASSERT_EQ(capped.size(), 2U);
  EXPECT_EQ(capped[0].message, "w1");
  EXPECT_EQ(capped[1].message, "e1");

  const auto all = doc.collect_diagnostics(100);
  ASSERT_EQ(all.size(), 3U);
  EXPECT_EQ(all[1].message, "w2");
}

TEST(SemaDocument, SendOnlyWhenChanged)
{
  RecordingSink sink;
  Document doc("file:///w/a.awk");
  doc.add_parse_diagnostic(make_diag(Severity::Error, {0, 0}, "e"));

  EXPECT_TRUE(doc.send_diagnostics(sink, 100));
  EXPECT_FALSE(doc.send_diagnostics(sink, 100));
  EXPECT_EQ(sink.publications.size(), 1U);

  doc.reset_analysis_diagnostics();  // nothing to reset
  EXPECT_FALSE(doc.diagnostics_changed());
  doc.mark_diagnostics_changed();
  EXPECT_TRUE(doc.send_diagnostics(sink, 100));
  EXPECT_EQ(sink.publications.size(), 2U);
}
