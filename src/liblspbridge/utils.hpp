// SPDX-License-Identifier: MIT
#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace lspbridge::utils {

template <typename Exception = std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

// Runs a callable when the enclosing scope is left, however it is left.
template <typename Fn>
class at_scope_exit {
  Fn fn_;

 public:
  at_scope_exit(const at_scope_exit&) = delete;
  at_scope_exit(at_scope_exit&&) = delete;
  at_scope_exit& operator=(const at_scope_exit&) = delete;
  at_scope_exit& operator=(at_scope_exit&&) = delete;
  explicit at_scope_exit(Fn fn) : fn_{std::move(fn)} {}
  ~at_scope_exit() { fn_(); }
};

}  // namespace lspbridge::utils

// NOLINTBEGIN(*macro-usage*)
#define LSPBRIDGE_PASTE_(x, y) x##y
#define LSPBRIDGE_PASTE(x, y) LSPBRIDGE_PASTE_(x, y)

// AUTO(stmt...) runs stmt at scope exit.
#define AUTO(...)                                                  \
  lspbridge::utils::at_scope_exit LSPBRIDGE_PASTE(                 \
      auto_instance_, __COUNTER__) {                               \
    [&]() { __VA_ARGS__; }                                         \
  }
// NOLINTEND(*macro-usage*)
