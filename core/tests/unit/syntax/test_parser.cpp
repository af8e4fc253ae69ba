// tests/unit/syntax/test_parser.cpp - Unit tests for the AWK parser event stream
//
#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

#include "awkls/syntax/frontend.hpp"

using namespace awkls;
using namespace awkls::syntax;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

ParseResult parse(const std::string & src, bool gawk = true)
{
  ParseOptions options;
  options.gawk = gawk;
  return parse_document(src, options);
}

template <typename Event>
std::vector<Event> collect(const ParseResult & r)
{
  std::vector<Event> out;
  for (const auto & ev : r.events) {
    if (const auto * e = std::get_if<Event>(&ev)) {
      out.push_back(*e);
    }
  }
  return out;
}

std::vector<MessageEvent> messages(const ParseResult & r, Severity severity)
{
  std::vector<MessageEvent> out;
  for (const auto & m : collect<MessageEvent>(r)) {
    if (m.severity == severity) {
      out.push_back(m);
    }
  }
  return out;
}

std::vector<MessageEvent> in_category(const ParseResult & r, MessageCategory category)
{
  std::vector<MessageEvent> out;
  for (const auto & m : collect<MessageEvent>(r)) {
    if (m.category == category) {
      out.push_back(m);
    }
  }
  return out;
}

const DefineEvent * find_define(const std::vector<DefineEvent> & defs, const std::string & name)
{
  for (const auto & d : defs) {
    if (d.name == name) {
      return &d;
    }
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Definitions
// ============================================================================

TEST(SyntaxParser, FunctionDefinitionWithParameters)
{
  const auto r = parse("## adds\nfunction add(a, b) { return a + b }\n");
  EXPECT_TRUE(messages(r, Severity::Error).empty());

  const auto defs = collect<DefineEvent>(r);
  const auto * f = find_define(defs, "add");
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->type, SymbolType::Func);
  EXPECT_EQ(f->position.line, 1U);
  EXPECT_EQ(f->position.character, 9U);
  EXPECT_NE(f->doc_comment.find("adds"), std::string::npos);

  const auto * a = find_define(defs, "a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->type, SymbolType::Parameter);
  EXPECT_EQ(a->scope, "add");

  const auto * b = find_define(defs, "b");
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->type, SymbolType::Parameter);
}

TEST(SyntaxParser, ExtraBlanksStartLocalVariables)
{
  const auto r = parse("function f(a, b,  tmp, i) { tmp = a }\n");
  const auto defs = collect<DefineEvent>(r);

  ASSERT_NE(find_define(defs, "b"), nullptr);
  EXPECT_EQ(find_define(defs, "b")->type, SymbolType::Parameter);
  ASSERT_NE(find_define(defs, "tmp"), nullptr);
  EXPECT_EQ(find_define(defs, "tmp")->type, SymbolType::LocalVariable);
  ASSERT_NE(find_define(defs, "i"), nullptr);
  EXPECT_EQ(find_define(defs, "i")->type, SymbolType::LocalVariable);

  // Uses inside the body resolve against the function scope
  bool saw_local_use = false;
  for (const auto & u : collect<UseEvent>(r)) {
    if (u.name == "tmp") {
      EXPECT_EQ(u.type, SymbolType::LocalVariable);
      EXPECT_EQ(u.scope, "f");
      saw_local_use = true;
    }
  }
  EXPECT_TRUE(saw_local_use);
}

TEST(SyntaxParser, LocalsSplitAppliesToFirstName)
{
  const auto r = parse("function g(  t) { t = 1 }\n");
  const auto * t = find_define(collect<DefineEvent>(r), "t");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->type, SymbolType::LocalVariable);
}

TEST(SyntaxParser, GlobalsAreDefinedImplicitlyOnce)
{
  const auto r = parse("BEGIN { x = 1; x = 2; print NR }\n");

  int implicit_defs = 0;
  for (const auto & d : collect<DefineEvent>(r)) {
    if (d.name == "x") {
      EXPECT_TRUE(d.implicit);
      EXPECT_EQ(d.type, SymbolType::GlobalVariable);
      ++implicit_defs;
    }
    EXPECT_NE(d.name, "NR");  // built-in variables are never defined
  }
  EXPECT_EQ(implicit_defs, 1);

  int uses = 0;
  for (const auto & u : collect<UseEvent>(r)) {
    if (u.name == "x") {
      ++uses;
    }
  }
  EXPECT_EQ(uses, 2);
}

TEST(SyntaxParser, DuplicateFunctionIsReported)
{
  const auto r = parse("function f() { }\nfunction f() { }\n");
  const auto errors = messages(r, Severity::Error);
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].category, MessageCategory::Structure);
  EXPECT_EQ(errors[0].position.line, 1U);
}

TEST(SyntaxParser, RedefiningPosixBuiltinIsAnError)
{
  const auto r = parse("function substr(s) { }\n");
  const auto errors = messages(r, Severity::Error);
  ASSERT_FALSE(errors.empty());
  EXPECT_EQ(errors[0].text, "cannot redefine built-in function substr");
}

// ============================================================================
// Calls
// ============================================================================

TEST(SyntaxParser, CallBoundariesBracketArguments)
{
  const auto r = parse("BEGIN { f(1, g(2)) }\n");

  std::vector<std::string> trace;
  for (const auto & ev : r.events) {
    if (const auto * c = std::get_if<CallBoundaryEvent>(&ev)) {
      trace.push_back((c->start ? "call " : "end ") + c->callee);
    } else if (const auto * p = std::get_if<ParameterBoundaryEvent>(&ev)) {
      trace.push_back((p->start ? "arg " : "/arg ") + std::to_string(p->index));
    }
  }

  const std::vector<std::string> expected{
    "call f", "arg 0", "/arg 0", "arg 1", "call g", "arg 0", "/arg 0", "end g", "/arg 1", "end f"};
  EXPECT_EQ(trace, expected);
}

TEST(SyntaxParser, CallOfUserFunctionIsAUse)
{
  const auto r = parse("BEGIN { helper() }\n");
  const auto uses = collect<UseEvent>(r);
  ASSERT_EQ(uses.size(), 1U);
  EXPECT_EQ(uses[0].type, SymbolType::Func);
  EXPECT_EQ(uses[0].name, "helper");
  EXPECT_EQ(uses[0].position.character, 8U);
}

// ============================================================================
// Includes and modes
// ============================================================================

TEST(SyntaxParser, IncludeDirective)
{
  const auto r = parse("@include \"lib/util.awk\"\n");
  const auto incs = collect<IncludeEvent>(r);
  ASSERT_EQ(incs.size(), 1U);
  EXPECT_EQ(incs[0].path, "lib/util.awk");
  EXPECT_TRUE(incs[0].relative);
  EXPECT_EQ(incs[0].position.character, 9U);
  EXPECT_EQ(incs[0].length, 14U);

  // gawk extension: a stylistic warning in gawk mode
  const auto warnings = messages(r, Severity::Warning);
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0].category, MessageCategory::Compatibility);
}

TEST(SyntaxParser, AbsoluteInclude)
{
  const auto incs = collect<IncludeEvent>(parse("@include \"/usr/share/awk/join.awk\"\n"));
  ASSERT_EQ(incs.size(), 1U);
  EXPECT_FALSE(incs[0].relative);
}

TEST(SyntaxParser, IncludeIsAnErrorInAwkMode)
{
  const auto r = parse("@include \"x.awk\"\n", false);
  const auto errors = messages(r, Severity::Error);
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].category, MessageCategory::Compatibility);
}

TEST(SyntaxParser, ShebangSelectsMode)
{
  EXPECT_FALSE(parse("#!/usr/bin/awk -f\nBEGIN { }\n", true).extended_mode);
  EXPECT_TRUE(parse("#!/usr/bin/gawk -f\nBEGIN { }\n", false).extended_mode);
  EXPECT_TRUE(parse("BEGIN { }\n", true).extended_mode);
}

// ============================================================================
// Messages
// ============================================================================

TEST(SyntaxParser, MissingSemicolonIsStylistic)
{
  const auto r = parse("BEGIN {\n  x = 1\n  y = 2\n}\n");
  EXPECT_TRUE(messages(r, Severity::Error).empty());

  int missing = 0;
  for (const auto & m : messages(r, Severity::Warning)) {
    if (m.category == MessageCategory::MissingSemicolon) {
      ++missing;
    }
  }
  EXPECT_EQ(missing, 2);
}

TEST(SyntaxParser, SyntaxErrorIsReported)
{
  const auto r = parse("BEGIN { x = }\n");
  const auto errors = messages(r, Severity::Error);
  ASSERT_FALSE(errors.empty());
  EXPECT_EQ(errors[0].category, MessageCategory::Syntax);
  EXPECT_FALSE(r.crashed);

  // Reported at the last consumed token, the '='
  EXPECT_EQ(errors[0].position, (Position{0, 10}));
  EXPECT_EQ(errors[0].length, 1U);
}

TEST(SyntaxParser, MissingTokenIsReportedAfterLastConsumed)
{
  const auto r = parse("BEGIN { if (x { y = 1 } }\n");
  const auto errors = in_category(r, MessageCategory::Syntax);
  ASSERT_FALSE(errors.empty());
  EXPECT_EQ(errors[0].text, "syntax error: expected ')', found '{'");
  EXPECT_EQ(errors[0].position, (Position{0, 12}));
}

TEST(SyntaxParser, ExcessiveNestingBecomesInternalError)
{
  const std::string src = "BEGIN { x = " + std::string(1000, '(') + "1" + std::string(1000, ')') + " }\n";
  const auto r = parse(src);
  ASSERT_TRUE(r.crashed);

  const auto errors = messages(r, Severity::Error);
  ASSERT_FALSE(errors.empty());
  EXPECT_EQ(errors.back().category, MessageCategory::Internal);
  EXPECT_EQ(errors.back().length, k_crash_diagnostic_length);

  // The crash points at the last '(' consumed before the limit was hit
  const auto at = errors.back().position;
  EXPECT_EQ(at.line, 0U);
  ASSERT_LT(at.character, src.size());
  EXPECT_EQ(src[at.character], '(');
}

// ============================================================================
// Statements
// ============================================================================

TEST(SyntaxParser, ForInClauseIsAccepted)
{
  const auto r = parse("BEGIN { for (k in seen) print k }\n");
  EXPECT_TRUE(messages(r, Severity::Error).empty());
  EXPECT_TRUE(in_category(r, MessageCategory::Structure).empty());
}

TEST(SyntaxParser, ForWithoutMembershipClauseIsAnError)
{
  const auto r = parse("BEGIN { for (k + 1) print k }\n");
  const auto errors = messages(r, Severity::Error);
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].category, MessageCategory::Syntax);
  EXPECT_EQ(errors[0].text, "syntax error: expected 'for (name in array)'");
}

TEST(SyntaxParser, MembershipAsLoopInitializationWarns)
{
  const auto r = parse("BEGIN { for (k in seen; k < 3; k++) n++ }\n");
  EXPECT_TRUE(messages(r, Severity::Error).empty());
  const auto structure = in_category(r, MessageCategory::Structure);
  ASSERT_EQ(structure.size(), 1U);
  EXPECT_EQ(structure[0].severity, Severity::Warning);
  EXPECT_EQ(structure[0].text, "membership test used as loop initialization");
}

TEST(SyntaxParser, ElseOnSameLineDependsOnMode)
{
  const std::string src = "BEGIN { if (x) y = 1 else y = 2 }\n";

  const auto gawk = in_category(parse(src, true), MessageCategory::MissingSemicolon);
  ASSERT_EQ(gawk.size(), 1U);
  EXPECT_EQ(gawk[0].severity, Severity::Warning);

  const auto awk = in_category(parse(src, false), MessageCategory::MissingSemicolon);
  ASSERT_EQ(awk.size(), 1U);
  EXPECT_EQ(awk[0].severity, Severity::Error);
  EXPECT_EQ(awk[0].text, "';' or newline required before else");
}

TEST(SyntaxParser, PrintfWithoutArgumentsIsAnError)
{
  for (const bool gawk : {true, false}) {
    const auto errors = messages(parse("BEGIN { printf }\n", gawk), Severity::Error);
    ASSERT_EQ(errors.size(), 1U) << (gawk ? "gawk" : "awk");
    EXPECT_EQ(errors[0].text, "syntax error: printf requires a format argument");
  }
  EXPECT_TRUE(messages(parse("BEGIN { printf \"%d\\n\", 1 }\n"), Severity::Error).empty());
}

TEST(SyntaxParser, ConcatenationIsAccepted)
{
  const auto r = parse("BEGIN { s = \"a\" x \"b\" y (1 + 2) $1; print s \"-\" NR }\n", false);
  EXPECT_TRUE(messages(r, Severity::Error).empty());

  int vars = 0;
  for (const auto & u : collect<UseEvent>(r)) {
    if (u.name == "x" || u.name == "y") {
      ++vars;
    }
  }
  EXPECT_EQ(vars, 2);
}

TEST(SyntaxParser, ArraysOfArraysAreAGawkExtension)
{
  const std::string src = "BEGIN { x[1][2] = 3; print x[1][2] }\n";

  const auto gawk = parse(src, true);
  EXPECT_TRUE(messages(gawk, Severity::Error).empty());
  const auto compat = in_category(gawk, MessageCategory::Compatibility);
  ASSERT_EQ(compat.size(), 2U);
  EXPECT_EQ(compat[0].text, "array of arrays is a gawk extension");
  EXPECT_EQ(compat[0].position, (Position{0, 12}));

  const auto awk = messages(parse(src, false), Severity::Error);
  ASSERT_EQ(awk.size(), 2U);
  EXPECT_EQ(awk[0].category, MessageCategory::Compatibility);
}

// ============================================================================
// Mode compatibility
// ============================================================================

TEST(SyntaxParser, IndirectCallIsAGawkExtension)
{
  const std::string src = "BEGIN { fn = \"f\"; @fn(1) }\n";

  const auto gawk = in_category(parse(src, true), MessageCategory::Compatibility);
  ASSERT_EQ(gawk.size(), 1U);
  EXPECT_EQ(gawk[0].severity, Severity::Warning);
  EXPECT_EQ(gawk[0].text, "indirect function call is a gawk extension");

  const auto awk = in_category(parse(src, false), MessageCategory::Compatibility);
  ASSERT_EQ(awk.size(), 1U);
  EXPECT_EQ(awk[0].severity, Severity::Error);
  EXPECT_EQ(awk[0].text, "indirect function call is not supported in awk mode");
}

TEST(SyntaxParser, GawkOnlyBuiltinCallDependsOnMode)
{
  const std::string src = "BEGIN { n = asort(a) }\n";

  const auto gawk = in_category(parse(src, true), MessageCategory::Compatibility);
  ASSERT_EQ(gawk.size(), 1U);
  EXPECT_EQ(gawk[0].severity, Severity::Warning);

  const auto awk = in_category(parse(src, false), MessageCategory::Compatibility);
  ASSERT_EQ(awk.size(), 1U);
  EXPECT_EQ(awk[0].severity, Severity::Error);
  EXPECT_EQ(awk[0].text, "built-in function asort is not supported in awk mode");
  EXPECT_EQ(awk[0].position, (Position{0, 12}));
}

TEST(SyntaxParser, UserFunctionMayReuseGawkOnlyNameInAwkMode)
{
  const auto r = parse("BEGIN { print and(6, 3) }\nfunction and(a, b) { return a && b }\n", false);
  EXPECT_TRUE(messages(r, Severity::Error).empty());

  // Only the shadowing is reported, as a toggleable warning
  const auto compat = in_category(r, MessageCategory::Compatibility);
  ASSERT_EQ(compat.size(), 1U);
  EXPECT_EQ(compat[0].severity, Severity::Warning);
  EXPECT_EQ(compat[0].text, "function and redefines a gawk built-in");
  EXPECT_NE(find_define(collect<DefineEvent>(r), "and"), nullptr);
}

// ============================================================================
// Paths
// ============================================================================

TEST(SyntaxParser, RuleBlocksOpenPaths)
{
  const auto r = parse("BEGIN { }\nfunction f() { }\n");
  std::vector<std::string> opened;
  for (const auto & p : collect<PathBeginEvent>(r)) {
    ASSERT_FALSE(p.path.empty());
    opened.push_back(p.path.back());
  }
  const std::vector<std::string> expected{"BEGIN", "function f"};
  EXPECT_EQ(opened, expected);
  EXPECT_EQ(collect<PathEndEvent>(r).size(), 2U);
}
