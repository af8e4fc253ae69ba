// test_local_file_system.cpp - Include resolution against the local disk

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "awkls/basic/uri.hpp"
#include "awkls/lsp/local_file_system.hpp"

using awkls::lsp::LocalFileSystem;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

TEST(LspLocalFileSystem, RelativeCandidatesStartAtIncluder)
{
  const LocalFileSystem fs;
  const auto candidates =
    fs.resolve_include_path("file:///proj/src/main.awk", "util", true, {"/usr/share/awk"});

  const std::vector<std::string> expected{
    "/proj/src/util", "/proj/src/util.awk", "/usr/share/awk/util", "/usr/share/awk/util.awk"};
  EXPECT_EQ(candidates, expected);
}

TEST(LspLocalFileSystem, AwkSuffixIsNotDoubled)
{
  const LocalFileSystem fs;
  const auto candidates = fs.resolve_include_path("file:///proj/main.awk", "lib/x.awk", true, {});
  EXPECT_EQ(candidates, (std::vector<std::string>{"/proj/lib/x.awk"}));
}

TEST(LspLocalFileSystem, AbsolutePathIsUsedAsIs)
{
  const LocalFileSystem fs;
  const auto candidates =
    fs.resolve_include_path("file:///proj/main.awk", "/opt/awk/join.awk", false, {"/usr/share/awk"});
  EXPECT_EQ(candidates, (std::vector<std::string>{"/opt/awk/join.awk"}));
}

TEST(LspLocalFileSystem, DuplicateCandidatesAreRemoved)
{
  const LocalFileSystem fs;
  const auto candidates =
    fs.resolve_include_path("file:///proj/main.awk", "a.awk", true, {"/proj", "/proj/"});
  EXPECT_EQ(candidates, (std::vector<std::string>{"/proj/a.awk"}));
}

TEST(LspLocalFileSystem, ReadsCompleteOnPoll)
{
  const TempDir dir(std::filesystem::temp_directory_path() / "awkls_local_fs");
  const auto file = dir.path / "lib.awk";
  {
    std::ofstream f(file);
    f << "function f() { }\n";
  }

  LocalFileSystem fs;
  EXPECT_TRUE(fs.file_exists(file.string()));
  EXPECT_FALSE(fs.file_exists((dir.path / "nope.awk").string()));
  EXPECT_FALSE(fs.file_exists(dir.path.string()));

  std::optional<std::string> found;
  std::optional<std::string> missing = std::string("unset");
  fs.read_file(file.string(), [&](std::optional<std::string> text) { found = std::move(text); });
  fs.read_file(
    (dir.path / "nope.awk").string(), [&](std::optional<std::string> text) { missing = std::move(text); });

  EXPECT_TRUE(fs.has_pending());
  EXPECT_FALSE(found.has_value());

  EXPECT_EQ(fs.poll(), 2U);
  EXPECT_FALSE(fs.has_pending());
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, "function f() { }\n");
  EXPECT_FALSE(missing.has_value());
}
