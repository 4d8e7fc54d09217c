// SPDX-License-Identifier: MIT
#include "lspbridge/uri.hpp"

#include <cstdint>
#include <stdexcept>

#include "utf8.hpp"
#include "utils.hpp"

namespace lspbridge {

namespace {

constexpr std::string_view file_scheme{"file://"};

constexpr bool is_unreserved_path_byte(unsigned char b) {
  return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z') ||
         (b >= '0' && b <= '9') || b == '-' || b == '.' || b == '_' ||
         b == '~' || b == '/';
}

constexpr int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string percent_encode_path(std::string_view path) {
  static constexpr char hex_upper[] = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(path.size());
  for (char ch : path) {
    auto b = static_cast<unsigned char>(ch);
    if (is_unreserved_path_byte(b)) {
      encoded += ch;
    } else {
      encoded += '%';
      encoded += hex_upper[b >> 4];
      encoded += hex_upper[b & 0x0F];
    }
  }
  return encoded;
}

std::optional<std::string> percent_decode_path(std::string_view path) {
  std::string decoded;
  decoded.reserve(path.size());
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (path[i] != '%') {
      decoded += path[i];
      continue;
    }
    if (i + 2 >= path.size()) return std::nullopt;
    int hi = hex_value(path[i + 1]);
    int lo = hex_value(path[i + 2]);
    if (hi < 0 || lo < 0) return std::nullopt;
    decoded += static_cast<char>((hi << 4) | lo);
    i += 2;
  }
  if (!utils::is_valid_utf8(decoded)) return std::nullopt;
  return decoded;
}

std::string file_uri(const fs::path& path) {
  if (!path.is_absolute())
    utils::throwf<std::invalid_argument>(
        "invalid absolute file path for URI: {}", path.string());
  return std::string{file_scheme} + percent_encode_path(path.string());
}

std::string uri_to_path(std::string_view uri) {
  std::string_view path{uri};
  if (path.starts_with(file_scheme)) path.remove_prefix(file_scheme.size());
  if (auto decoded = percent_decode_path(path)) return *decoded;
  return std::string{path};
}

}  // namespace lspbridge
