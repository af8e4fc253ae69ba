// awkls/basic/uri.hpp - file:// URI helpers
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace awkls
{

/// Decode %XX escapes. '+' is kept, it is a literal in file URI paths
[[nodiscard]] std::string url_decode(std::string_view s);

/// Percent-encode characters that are not allowed verbatim in a URI path
[[nodiscard]] std::string url_encode_path(std::string_view path);

/**
 * Convert a file URI to a local path.
 *
 * Accepts `file:///abs/path` and `file:/abs/path`. Returns nullopt for other
 * schemes and for `file://host/...`.
 */
[[nodiscard]] std::optional<std::string> file_uri_to_path(std::string_view uri);

/// Convert an absolute local path to a file URI
[[nodiscard]] std::string path_to_file_uri(std::string_view path);

/// Last path component of a URI (the part after the last '/')
[[nodiscard]] std::string_view uri_short_name(std::string_view uri) noexcept;

}  // namespace awkls
