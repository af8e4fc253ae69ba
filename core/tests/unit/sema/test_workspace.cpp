// tests/unit/sema/test_workspace.cpp - Unit tests for the workspace coordinator
//
#include <gtest/gtest.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

#include "awkls/sema/workspace.hpp"
#include "awkls/test_support/workspace_fakes.hpp"

using namespace awkls;
using awkls::test_support::FakeFileSystem;
using awkls::test_support::RecordingSink;
using awkls::test_support::with_code;

namespace
{

const std::string k_main = "file:///w/main.awk";
const std::string k_lib = "file:///w/lib.awk";

class WorkspaceTest : public ::testing::Test
{
protected:
  WorkspaceTest()
  : logger_(std::make_shared<spdlog::logger>(
      "workspace-test", std::make_shared<spdlog::sinks::null_sink_mt>())),
    workspace_(fs_, sink_, Settings{}, logger_)
  {
  }

  [[nodiscard]] std::vector<Diagnostic> latest(const std::string & uri) const
  {
    auto d = sink_.latest(uri);
    return d ? *d : std::vector<Diagnostic>{};
  }

  FakeFileSystem fs_;
  RecordingSink sink_;
  std::shared_ptr<spdlog::logger> logger_;
  Workspace workspace_;
};

}  // namespace

// ============================================================================
// Single document
// ============================================================================

TEST_F(WorkspaceTest, OpenDocumentIsAnalysedAndPublished)
{
  workspace_.change_document(k_main, "BEGIN { nope(1) }\n");

  EXPECT_TRUE(workspace_.is_idle());
  EXPECT_TRUE(workspace_.is_open(k_main));
  ASSERT_NE(workspace_.find_document(k_main), nullptr);

  const auto diags = latest(k_main);
  const auto undeclared = with_code(diags, "undeclared-function");
  ASSERT_EQ(undeclared.size(), 1U);
  EXPECT_EQ(undeclared[0]->message, "undeclared function nope");
}

TEST_F(WorkspaceTest, ReparseReplacesPreviousResults)
{
  workspace_.change_document(k_main, "BEGIN { nope(1) }\n");
  workspace_.change_document(k_main, "function nope(x) { }\nBEGIN { nope(1) }\n");

  EXPECT_TRUE(latest(k_main).empty());
  EXPECT_EQ(sink_.count(k_main), 2U);
}

TEST_F(WorkspaceTest, FunctionCallCheckCanBeDisabled)
{
  Settings s;
  s.stylistic_warnings.function_calls = false;
  workspace_.update_settings(s);

  workspace_.change_document(k_main, "BEGIN { nope(1) }\n");
  EXPECT_TRUE(with_code(latest(k_main), "undeclared-function").empty());
}

// ============================================================================
// Includes
// ============================================================================

TEST_F(WorkspaceTest, QueueWaitsForIncludeReads)
{
  fs_.add_file("/w/lib.awk", "function helper(a, b) { return a b }\n");
  workspace_.change_document(k_main, "@include \"lib.awk\"\nBEGIN { helper(1) }\n");

  // Nothing is published while the include is outstanding
  EXPECT_FALSE(workspace_.is_idle());
  EXPECT_EQ(workspace_.pending_reads(), 1U);
  EXPECT_TRUE(sink_.publications.empty());
  ASSERT_EQ(fs_.pending_paths(), (std::vector<std::string>{"/w/lib.awk"}));

  fs_.complete_all();
  EXPECT_TRUE(workspace_.is_idle());

  const Document * lib = workspace_.find_document(k_lib);
  ASSERT_NE(lib, nullptr);
  EXPECT_TRUE(lib->is_defined("helper", SymbolType::Func));
  EXPECT_FALSE(workspace_.is_open(k_lib));

  const auto arity = with_code(latest(k_main), "argument-count");
  ASSERT_EQ(arity.size(), 1U);
  EXPECT_EQ(arity[0]->message, "not enough arguments in call to helper (expected 2, got 1)");
}

TEST_F(WorkspaceTest, NestedIncludesAreReadInTurn)
{
  fs_.add_file("/w/lib.awk", "@include \"deep.awk\"\n");
  fs_.add_file("/w/deep.awk", "function deep() { return 1 }\n");
  workspace_.change_document(k_main, "@include \"lib.awk\"\nBEGIN { deep() }\n");

  ASSERT_TRUE(fs_.complete_next());
  EXPECT_FALSE(workspace_.is_idle());
  EXPECT_EQ(fs_.pending(), 1U);
  ASSERT_TRUE(fs_.complete_next());
  EXPECT_TRUE(workspace_.is_idle());

  EXPECT_EQ(workspace_.documents().size(), 3U);
  EXPECT_TRUE(with_code(latest(k_main), "undeclared-function").empty());
}

TEST_F(WorkspaceTest, MissingIncludeIsReported)
{
  workspace_.change_document(k_main, "@include \"nope.awk\"\n");

  EXPECT_TRUE(workspace_.is_idle());
  const auto include = with_code(latest(k_main), "include");
  ASSERT_EQ(include.size(), 1U);
  EXPECT_EQ(include[0]->message, "no such file: nope.awk");
  EXPECT_EQ(include[0]->range.start, (Position{0, 9}));
}

TEST_F(WorkspaceTest, SelfIncludeIsIgnored)
{
  fs_.add_file("/w/main.awk", "");
  workspace_.change_document(k_main, "@include \"main.awk\"\n");

  EXPECT_TRUE(workspace_.is_idle());
  const auto include = with_code(latest(k_main), "include");
  ASSERT_EQ(include.size(), 1U);
  EXPECT_EQ(include[0]->severity, Severity::Warning);
  EXPECT_EQ(include[0]->message, "file includes itself");
  EXPECT_TRUE(workspace_.find_document(k_main)->includes().empty());
}

TEST_F(WorkspaceTest, UnreadableIncludeIsReported)
{
  fs_.add_file("/w/lib.awk", "function f() { }\n");
  workspace_.change_document(k_main, "@include \"lib.awk\"\n");
  fs_.remove_file("/w/lib.awk");
  fs_.complete_all();

  EXPECT_TRUE(workspace_.is_idle());
  const auto diags = latest(k_lib);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].message, "cannot read file");
}

TEST_F(WorkspaceTest, ParameterCountChangeRechecksIncluders)
{
  fs_.add_file("/w/lib.awk", "");
  workspace_.change_document(k_lib, "function f(a) { }\n");
  workspace_.change_document(k_main, "@include \"lib.awk\"\nBEGIN { f(1) }\n");
  EXPECT_TRUE(workspace_.is_idle());
  EXPECT_TRUE(with_code(latest(k_main), "argument-count").empty());

  workspace_.change_document(k_lib, "function f(a, b) { }\n");
  const auto arity = with_code(latest(k_main), "argument-count");
  ASSERT_EQ(arity.size(), 1U);
  EXPECT_EQ(arity[0]->message, "not enough arguments in call to f (expected 2, got 1)");
}

TEST_F(WorkspaceTest, IncludeChangeRechecksIncluders)
{
  const std::string mid = "file:///w/mid.awk";
  fs_.add_file("/w/lib.awk", "");
  fs_.add_file("/w/mid.awk", "");
  workspace_.change_document(k_lib, "function g(a) { }\n");
  workspace_.change_document(mid, "function h() { }\n");
  workspace_.change_document(k_main, "@include \"mid.awk\"\nBEGIN { g(1) }\n");
  ASSERT_TRUE(workspace_.is_idle());
  ASSERT_EQ(with_code(latest(k_main), "undeclared-function").size(), 1U);

  // mid keeps its functions but now pulls in lib
  workspace_.change_document(mid, "@include \"lib.awk\"\nfunction h() { }\n");
  EXPECT_TRUE(workspace_.is_idle());
  EXPECT_TRUE(with_code(latest(k_main), "undeclared-function").empty());

  // and dropping the include brings the error back
  workspace_.change_document(mid, "function h() { }\n");
  EXPECT_EQ(with_code(latest(k_main), "undeclared-function").size(), 1U);
}

TEST_F(WorkspaceTest, EditorTextWinsOverDiskRead)
{
  fs_.add_file("/w/lib.awk", "function f(a, b) { }\n");
  workspace_.change_document(k_main, "@include \"lib.awk\"\nBEGIN { f(1) }\n");
  workspace_.change_document(k_lib, "function f(a) { }\n");
  EXPECT_FALSE(workspace_.is_idle());

  fs_.complete_all();
  EXPECT_TRUE(workspace_.is_idle());
  EXPECT_TRUE(with_code(latest(k_main), "argument-count").empty());
}

// ============================================================================
// Closing
// ============================================================================

TEST_F(WorkspaceTest, ClosingDropsUnreachableDocuments)
{
  fs_.add_file("/w/lib.awk", "function f() { }\n");
  workspace_.change_document(k_main, "@include \"lib.awk\"\nBEGIN { x = }\n");
  fs_.complete_all();
  ASSERT_EQ(workspace_.documents().size(), 2U);

  workspace_.close_document(k_main);
  EXPECT_TRUE(workspace_.documents().empty());
  EXPECT_FALSE(workspace_.is_open(k_main));

  // Closed documents publish an empty list
  auto last = sink_.latest(k_main);
  ASSERT_TRUE(last.has_value());
  EXPECT_TRUE(last->empty());
}

TEST_F(WorkspaceTest, ClosingIncludedDocumentRereadsDisk)
{
  fs_.add_file("/w/lib.awk", "function f(a) { }\n");
  workspace_.change_document(k_lib, "function f(a, b) { }\n");
  workspace_.change_document(k_main, "@include \"lib.awk\"\nBEGIN { f(1) }\n");
  ASSERT_EQ(with_code(latest(k_main), "argument-count").size(), 1U);

  workspace_.close_document(k_lib);
  EXPECT_EQ(workspace_.pending_reads(), 1U);
  fs_.complete_all();

  ASSERT_NE(workspace_.find_document(k_lib), nullptr);
  EXPECT_TRUE(with_code(latest(k_main), "argument-count").empty());
}

// ============================================================================
// Settings
// ============================================================================

TEST_F(WorkspaceTest, StylisticWarningToggleReparses)
{
  workspace_.change_document(k_main, "BEGIN {\n  x = 1\n}\n");
  EXPECT_TRUE(with_code(latest(k_main), "missing-semicolon").empty());

  Settings s = workspace_.settings();
  s.stylistic_warnings.missing_semicolon = true;
  EXPECT_TRUE(workspace_.update_settings(s));
  EXPECT_EQ(with_code(latest(k_main), "missing-semicolon").size(), 1U);
}

TEST_F(WorkspaceTest, ProblemCapOnlyRepublishes)
{
  workspace_.change_document(k_main, "BEGIN { a(); b(); c() }\n");
  ASSERT_EQ(latest(k_main).size(), 3U);
  const size_t before = sink_.count(k_main);

  Settings s = workspace_.settings();
  s.max_number_of_problems = 2;
  EXPECT_FALSE(workspace_.update_settings(s));
  EXPECT_EQ(sink_.count(k_main), before + 1);
  EXPECT_EQ(latest(k_main).size(), 2U);

  EXPECT_FALSE(workspace_.update_settings(s));
  EXPECT_EQ(sink_.count(k_main), before + 1);
}
