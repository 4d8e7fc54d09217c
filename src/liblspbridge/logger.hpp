// SPDX-License-Identifier: MIT
#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/std.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <source_location>
#include <string>
#include <string_view>

// Log lines go to stderr: stdout belongs to whatever protocol the
// executable speaks.

namespace lspbridge::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

inline level global_level = level::warning;  // NOLINT
inline void set_level(level level) { global_level = level; }
inline bool enabled(level level) { return level <= global_level; }

inline std::string get_current_timestamp() {
  using namespace std::chrono;
  auto now = floor<milliseconds>(system_clock::now());
  return fmt::format("{:%F %T}", now);
}

template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    fmt::format_string<Args...> format_str, Args&&... args) {
  if (!enabled(level)) return;

  fmt::println(
      stderr, "{} {}:{} {}: {}", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().string(),
      location.line(), level_to_string(level),
      fmt::format(format_str, std::forward<Args>(args)...));
  std::fflush(stderr);
}

}  // namespace lspbridge::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                                 \
  lspbridge::logger::log(                                              \
      lspbridge::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                                 \
  lspbridge::logger::log(                                              \
      lspbridge::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...)                                                 \
  lspbridge::logger::log(                                             \
      lspbridge::logger::level::info, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_WARN(...)                                                    \
  lspbridge::logger::log(                                                \
      lspbridge::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                                 \
  lspbridge::logger::log(                                              \
      lspbridge::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                                 \
  lspbridge::logger::log(                                              \
      lspbridge::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
