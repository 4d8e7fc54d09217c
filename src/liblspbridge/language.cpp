// SPDX-License-Identifier: MIT
#include "lspbridge/language.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

namespace lspbridge {

std::string_view detect_language_id(const std::filesystem::path& path) {
  // clang-format off
  static const std::unordered_map<std::string_view, std::string_view> by_ext{
    {"rs", "rust"},          {"toml", "toml"},
    {"json", "json"},        {"yaml", "yaml"},     {"yml", "yaml"},
    {"md", "markdown"},      {"markdown", "markdown"},
    {"py", "python"},        {"js", "javascript"}, {"ts", "typescript"},
    {"jsx", "javascriptreact"},                    {"tsx", "typescriptreact"},
    {"c", "c"},              {"cpp", "cpp"},       {"cc", "cpp"},
    {"cxx", "cpp"},          {"h", "cpp"},         {"hpp", "cpp"},
    {"go", "go"},            {"rb", "ruby"},
    {"sh", "shellscript"},   {"bash", "shellscript"}, {"zsh", "shellscript"},
    {"css", "css"},          {"html", "html"},     {"htm", "html"},
    {"xml", "xml"},          {"sql", "sql"},       {"nix", "nix"},
  };
  // clang-format on

  std::string ext{path.extension().string()};
  if (ext.empty()) return "plaintext";
  ext.erase(0, 1);  // leading '.'
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (auto it = by_ext.find(ext); it != by_ext.end()) return it->second;
  return "plaintext";
}

}  // namespace lspbridge
