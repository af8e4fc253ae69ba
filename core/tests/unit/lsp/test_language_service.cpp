// test_language_service.cpp - Serverless editor query tests

#include <gtest/gtest.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "awkls/lsp/language_service.hpp"
#include "awkls/sema/workspace.hpp"
#include "awkls/test_support/workspace_fakes.hpp"

using json = nlohmann::json;
using awkls::Position;
using awkls::lsp::LanguageService;

namespace
{

const std::string k_uri = "file:///w/main.awk";

const std::string k_source =
  "## Pairs two values\n"
  "function pair(a, b) { return a b }\n"
  "BEGIN { pair(1, 2); x = length($0) }\n";

class LanguageServiceTest : public ::testing::Test
{
protected:
  LanguageServiceTest()
  : logger_(std::make_shared<spdlog::logger>(
      "service-test", std::make_shared<spdlog::sinks::null_sink_mt>())),
    workspace_(fs_, sink_, awkls::Settings{}, logger_),
    service_(workspace_)
  {
    workspace_.change_document(k_uri, k_source);
  }

  awkls::test_support::FakeFileSystem fs_;
  awkls::test_support::RecordingSink sink_;
  std::shared_ptr<spdlog::logger> logger_;
  awkls::Workspace workspace_;
  LanguageService service_;
};

bool has_label(const json & items, const std::string & label)
{
  for (const auto & item : items) {
    if (item.value("label", "") == label) {
      return true;
    }
  }
  return false;
}

}  // namespace

// ============================================================================
// Hover
// ============================================================================

TEST_F(LanguageServiceTest, HoverUserFunctionShowsSignatureAndDoc)
{
  const auto j = json::parse(service_.hover_json(k_uri, {2, 9}));
  ASSERT_EQ(j["contents"].size(), 1U);
  EXPECT_EQ(j["contents"][0].get<std::string>(), "function pair(a, b)\nPairs two values");
  EXPECT_EQ(j["range"]["start"]["line"], 2);
  EXPECT_EQ(j["range"]["start"]["character"], 8);
  EXPECT_EQ(j["range"]["end"]["character"], 12);
}

TEST_F(LanguageServiceTest, HoverBuiltinFunction)
{
  const auto j = json::parse(service_.hover_json(k_uri, {2, 25}));
  ASSERT_EQ(j["contents"].size(), 1U);
  EXPECT_EQ(j["contents"][0].get<std::string>().rfind("built-in function: length", 0), 0U);
}

TEST_F(LanguageServiceTest, HoverParameterAndGlobal)
{
  const auto param = json::parse(service_.hover_json(k_uri, {1, 29}));
  ASSERT_EQ(param["contents"].size(), 1U);
  EXPECT_EQ(param["contents"][0], "parameter");

  const auto global = json::parse(service_.hover_json(k_uri, {2, 20}));
  ASSERT_EQ(global["contents"].size(), 1U);
  EXPECT_EQ(global["contents"][0], "global variable");
}

TEST_F(LanguageServiceTest, HoverOutsideSymbolIsEmpty)
{
  const auto j = json::parse(service_.hover_json(k_uri, {2, 0}));
  EXPECT_TRUE(j["contents"].empty());
  EXPECT_TRUE(j["range"].is_null());

  const auto unknown = json::parse(service_.hover_json("file:///w/other.awk", {0, 0}));
  EXPECT_TRUE(unknown["contents"].empty());
}

// ============================================================================
// Definition / References
// ============================================================================

TEST_F(LanguageServiceTest, DefinitionOfCallSite)
{
  const auto j = json::parse(service_.definition_json(k_uri, {2, 10}));
  ASSERT_EQ(j["locations"].size(), 1U);
  const auto & loc = j["locations"][0];
  EXPECT_EQ(loc["uri"], k_uri);
  EXPECT_EQ(loc["range"]["start"]["line"], 1);
  EXPECT_EQ(loc["range"]["start"]["character"], 9);
  EXPECT_EQ(loc["range"]["end"]["character"], 13);
}

TEST_F(LanguageServiceTest, ImplicitGlobalsHaveNoDefinition)
{
  const auto j = json::parse(service_.definition_json(k_uri, {2, 20}));
  EXPECT_TRUE(j["locations"].empty());
}

TEST_F(LanguageServiceTest, ReferencesWithAndWithoutDeclaration)
{
  const auto uses = json::parse(service_.references_json(k_uri, {2, 9}, false));
  ASSERT_EQ(uses["locations"].size(), 1U);
  EXPECT_EQ(uses["locations"][0]["range"]["start"]["line"], 2);

  const auto all = json::parse(service_.references_json(k_uri, {2, 9}, true));
  EXPECT_EQ(all["locations"].size(), 2U);
}

// ============================================================================
// Completion / Symbols
// ============================================================================

TEST_F(LanguageServiceTest, CompletionListsUserSymbolsAndBuiltins)
{
  const auto j = json::parse(service_.completion_json(k_uri, {3, 0}));
  const auto & items = j["items"];
  EXPECT_TRUE(has_label(items, "pair"));
  EXPECT_TRUE(has_label(items, "x"));
  EXPECT_TRUE(has_label(items, "substr"));
  EXPECT_TRUE(has_label(items, "gensub"));

  for (const auto & item : items) {
    if (item["label"] == "pair") {
      EXPECT_EQ(item["kind"], "Function");
      EXPECT_EQ(item["documentation"], "Pairs two values");
    }
    if (item["label"] == "substr") {
      EXPECT_TRUE(item.contains("detail"));
    }
  }
}

TEST_F(LanguageServiceTest, CompletionInAwkModeSkipsGawkBuiltins)
{
  awkls::Settings s = workspace_.settings();
  s.gawk = false;
  workspace_.update_settings(s);

  const auto j = json::parse(service_.completion_json(k_uri, {3, 0}));
  EXPECT_FALSE(has_label(j["items"], "gensub"));
  EXPECT_TRUE(has_label(j["items"], "substr"));
}

TEST_F(LanguageServiceTest, DocumentAndWorkspaceSymbols)
{
  workspace_.change_document(
    "file:///w/util.awk", "function trim(s) { return s }\nfunction pad(s) { return s }\n");

  const auto doc = json::parse(service_.document_symbols_json("file:///w/util.awk"));
  ASSERT_EQ(doc["symbols"].size(), 2U);
  EXPECT_EQ(doc["symbols"][0]["name"], "trim");
  EXPECT_EQ(doc["symbols"][1]["name"], "pad");

  const auto all = json::parse(service_.workspace_symbols_json(""));
  EXPECT_EQ(all["symbols"].size(), 3U);

  const auto filtered = json::parse(service_.workspace_symbols_json("pa"));
  ASSERT_EQ(filtered["symbols"].size(), 2U);
  EXPECT_EQ(filtered["symbols"][0]["uri"], k_uri);
  EXPECT_EQ(filtered["symbols"][1]["name"], "pad");
}

// ============================================================================
// Signature / Context
// ============================================================================

TEST_F(LanguageServiceTest, SignatureTracksActiveArgument)
{
  const auto first = json::parse(service_.signature_json(k_uri, {2, 13}));
  ASSERT_TRUE(first["signature"].is_object());
  EXPECT_EQ(first["signature"]["label"], "pair(a, b)");
  EXPECT_EQ(first["signature"]["activeParameter"], 0);
  EXPECT_EQ(first["signature"]["parameters"].size(), 2U);

  const auto second = json::parse(service_.signature_json(k_uri, {2, 16}));
  EXPECT_EQ(second["signature"]["activeParameter"], 1);

  const auto outside = json::parse(service_.signature_json(k_uri, {2, 20}));
  EXPECT_TRUE(outside["signature"].is_null());
}

TEST_F(LanguageServiceTest, ContextPath)
{
  const auto j = json::parse(service_.context_json(k_uri, {2, 13}));
  ASSERT_EQ(j["path"].size(), 2U);
  EXPECT_EQ(j["path"][0], "BEGIN");
  EXPECT_EQ(j["path"][1], "pair");
}

// ============================================================================
// Doc comments
// ============================================================================

TEST(LspLeftAlign, StripsCommonMarker)
{
  EXPECT_EQ(awkls::lsp::left_align("## one\n##   two"), "one\n  two");
  EXPECT_EQ(awkls::lsp::left_align("##one"), "one");
  EXPECT_EQ(awkls::lsp::left_align("##"), "");
}
