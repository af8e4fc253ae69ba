// awkls/lsp/local_file_system.cpp - Local disk FileSystem implementation
#include "awkls/lsp/local_file_system.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include "awkls/basic/uri.hpp"

namespace awkls::lsp
{

namespace
{

namespace fs = std::filesystem;

std::optional<std::string> read_file_to_string(const std::string & path)
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

bool ends_with(const std::string & s, const std::string & suffix)
{
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

void LocalFileSystem::read_file(const std::string & path, ReadCallback callback)
{
  pending_.emplace_back(path, std::move(callback));
}

bool LocalFileSystem::file_exists(const std::string & path) const
{
  std::error_code ec;
  return fs::is_regular_file(path, ec) && !ec;
}

std::vector<std::string> LocalFileSystem::resolve_include_path(
  const std::string & source_uri, const std::string & raw_path, bool relative,
  const std::vector<std::string> & search_path) const
{
  std::vector<std::string> names{raw_path};
  if (!ends_with(raw_path, ".awk")) {
    names.push_back(raw_path + ".awk");
  }

  std::vector<std::string> out;
  auto add = [&out](const fs::path & p) {
    std::string s = p.lexically_normal().string();
    if (std::find(out.begin(), out.end(), s) == out.end()) {
      out.push_back(std::move(s));
    }
  };

  if (!relative) {
    for (const auto & name : names) {
      add(fs::path(name));
    }
    return out;
  }

  std::vector<fs::path> dirs;
  if (auto source = file_uri_to_path(source_uri)) {
    dirs.push_back(fs::path(*source).parent_path());
  }
  for (const auto & entry : search_path) {
    std::error_code ec;
    fs::path dir = fs::absolute(entry, ec);
    dirs.push_back(ec ? fs::path(entry) : dir);
  }

  for (const auto & dir : dirs) {
    for (const auto & name : names) {
      add(dir / name);
    }
  }
  return out;
}

size_t LocalFileSystem::poll()
{
  size_t completed = 0;
  while (!pending_.empty()) {
    auto [path, callback] = std::move(pending_.front());
    pending_.pop_front();
    callback(read_file_to_string(path));
    ++completed;
  }
  return completed;
}

}  // namespace awkls::lsp
