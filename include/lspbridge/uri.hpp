// SPDX-License-Identifier: MIT
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lspbridge {

namespace fs = std::filesystem;

/// Build a @c file:// URI from an absolute path.  Every byte other than
/// letters, digits and @c -_.~/ is percent-encoded with uppercase hex.
/// Throws @c std::invalid_argument if @p path is not absolute.
std::string file_uri(const fs::path& path);

/// Extract a filesystem path from a @c file:// URI.  Falls back to the
/// undecoded text if the escapes are malformed or the result is not UTF-8.
std::string uri_to_path(std::string_view uri);

std::string percent_encode_path(std::string_view path);

/// Empty optional on a truncated or non-hex escape, or invalid UTF-8.
std::optional<std::string> percent_decode_path(std::string_view path);

}  // namespace lspbridge
