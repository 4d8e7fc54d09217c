// SPDX-License-Identifier: MIT
#pragma once

#include <filesystem>
#include <string_view>

namespace lspbridge {

/// LSP @c languageId for @p path, chosen by its extension
/// (case-insensitive).  Unrecognised extensions give "plaintext".
std::string_view detect_language_id(const std::filesystem::path& path);

}  // namespace lspbridge
