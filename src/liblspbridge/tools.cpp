// SPDX-License-Identifier: MIT
#include "lspbridge/tools.hpp"

#include <fmt/format.h>

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <system_error>

#include "logger.hpp"
#include "lspbridge/client.hpp"
#include "lspbridge/uri.hpp"
#include "utils.hpp"

namespace lspbridge::tools {

namespace asio = boost::asio;
namespace json = boost::json;
namespace fs = std::filesystem;

using utils::throwf;

namespace {

enum class tool_kind : uint8_t { diagnostics, hover, definition, references };

struct tool_spec {
  std::string_view name;
  tool_kind kind;
  bool positional;
  std::string_view description;
};

// clang-format off
constexpr tool_spec tool_specs[] = {
  {"rust_diagnostics", tool_kind::diagnostics, false,
   "Get Rust compiler errors and warnings for a file. Returns diagnostics "
   "with line numbers, severity, and messages."},
  {"rust_hover", tool_kind::hover, true,
   "Get type signature and documentation for a symbol at a specific "
   "position in a Rust file."},
  {"rust_goto_definition", tool_kind::definition, true,
   "Find where a symbol is defined. Returns the file path and line number "
   "of the definition."},
  {"rust_find_references", tool_kind::references, true,
   "Find all references to a symbol at a specific position. Returns a list "
   "of file paths and line numbers."},
};
// clang-format on

const tool_spec* find_tool(std::string_view name) {
  for (const auto& spec : tool_specs)
    if (spec.name == name) return &spec;
  return nullptr;
}

const json::object& expect_object(const json::value& v, std::string_view what) {
  if (auto* obj = v.if_object()) return *obj;
  throwf("expected {} object, got: {}", what, json::serialize(v));
}

const json::value& expect_member(const json::object& obj, std::string_view key) {
  if (auto* v = obj.if_contains(key)) return *v;
  throwf("missing '{}' in: {}", key, json::serialize(obj));
}

std::string_view expect_string(const json::value& v, std::string_view what) {
  if (auto* s = v.if_string()) return *s;
  throwf("expected {} string, got: {}", what, json::serialize(v));
}

// Zero-based LSP position, as "L:C" one-based.
std::string format_position(const json::value& position) {
  const auto& pos = expect_object(position, "position");
  auto line = expect_member(pos, "line").to_number<int64_t>();
  auto character = expect_member(pos, "character").to_number<int64_t>();
  return fmt::format("{}:{}", line + 1, character + 1);
}

std::string_view severity_name(const json::value* severity) {
  if (!severity || !severity->is_number()) return "UNKNOWN";
  boost::system::error_code ec;
  auto n = severity->to_number<int64_t>(ec);
  if (ec) return "UNKNOWN";
  // clang-format off
  switch (n) {
  case 1: return "ERROR";
  case 2: return "WARNING";
  case 3: return "INFO";
  case 4: return "HINT";
  default: return "UNKNOWN";
  }
  // clang-format on
}

std::string render_marked_string(const json::value& v) {
  if (auto* s = v.if_string()) return std::string{*s};
  const auto& obj = expect_object(v, "MarkedString");
  return fmt::format(
      "```{}\n{}\n```",
      expect_string(expect_member(obj, "language"), "language"),
      expect_string(expect_member(obj, "value"), "value"));
}

std::string join_locations(const json::array& locations) {
  std::string text;
  for (const auto& loc : locations) {
    if (!text.empty()) text += '\n';
    text += format_location(loc);
  }
  return text;
}

uint32_t position_argument(const json::object& arguments, std::string_view key) {
  auto* v = arguments.if_contains(key);
  if (!v) throwf<invalid_params>("missing required argument '{}'", key);
  std::optional<uint32_t> n{};
  if (auto* i = v->if_int64()) {
    if (*i >= 0 && *i <= std::numeric_limits<uint32_t>::max())
      n = static_cast<uint32_t>(*i);
  } else if (auto* u = v->if_uint64()) {
    if (*u <= std::numeric_limits<uint32_t>::max())
      n = static_cast<uint32_t>(*u);
  }
  if (!n)
    throwf<invalid_params>(
        "'{}' must be a non-negative integer, got: {}", key,
        json::serialize(*v));
  return *n;
}

json::object input_schema(bool positional) {
  json::object file_path{
    {"type", "string"},
    {"description", "Absolute path to the Rust source file."}};

  json::object properties{};
  properties["file_path"] = std::move(file_path);
  json::array required{"file_path"};

  if (positional) {
    properties["line"] = {
      {"type", "integer"},
      {"format", "uint32"},
      {"minimum", 0},
      {"description", "Zero-based line number."}};
    properties["character"] = {
      {"type", "integer"},
      {"format", "uint32"},
      {"minimum", 0},
      {"description", "Zero-based character offset."}};
    required.emplace_back("line");
    required.emplace_back("character");
  }

  json::object schema{};
  schema["type"] = "object";
  schema["properties"] = std::move(properties);
  schema["required"] = std::move(required);
  return schema;
}

asio::awaitable<tool_result> run_request(
    client& lsp, tool_kind kind, const fs::path& file, uint32_t line,
    uint32_t character) {
  switch (kind) {
    case tool_kind::diagnostics:
      co_return format_diagnostics(co_await lsp.document_diagnostics(file));
    case tool_kind::hover:
      co_return format_hover(co_await lsp.hover(file, line, character));
    case tool_kind::definition:
      co_return format_definition(
          co_await lsp.goto_definition(file, line, character));
    case tool_kind::references:
      co_return format_references(
          co_await lsp.find_references(file, line, character));
  }
  throwf("unhandled tool kind {}", static_cast<int>(kind));
}

std::string failure_text(tool_kind kind, std::string_view why) {
  switch (kind) {
    case tool_kind::diagnostics:
      return fmt::format(
          "Diagnostics request failed: {}\n\n"
          "Note: rust-analyzer may still be loading. Try again in a few "
          "seconds.",
          why);
    case tool_kind::hover:
      return fmt::format("Hover request failed: {}", why);
    case tool_kind::definition:
      return fmt::format("Go to definition failed: {}", why);
    case tool_kind::references:
      return fmt::format("Find references failed: {}", why);
  }
  return std::string{why};
}

}  // namespace

json::object to_json(const tool_result& result) {
  json::object item{};
  item["type"] = "text";
  item["text"] = result.text;

  json::array content{};
  content.emplace_back(std::move(item));

  json::object res{};
  res["content"] = std::move(content);
  res["isError"] = result.is_error;
  return res;
}

void validate_file_path(std::string_view path) {
  fs::path p{path};
  if (!p.is_absolute())
    throwf<invalid_params>("file_path must be absolute, got: {}", path);
  std::error_code ec;
  if (!fs::exists(p, ec))
    throwf<invalid_params>("file not found: {}", path);
}

std::string format_location(const json::value& location) {
  const auto& loc = expect_object(location, "Location");
  // LocationLink carries its target under different names
  bool link{loc.contains("targetUri")};
  auto uri = expect_string(
      expect_member(loc, link ? "targetUri" : "uri"), "uri");
  const auto& range = expect_object(
      expect_member(loc, link ? "targetSelectionRange" : "range"), "Range");
  return fmt::format(
      "{}:{}", uri_to_path(uri), format_position(expect_member(range, "start")));
}

tool_result format_diagnostics(const json::value& report) {
  static constexpr std::string_view none{"No diagnostics found."};
  if (report.is_null()) return {std::string{none}};

  const auto& obj = expect_object(report, "DocumentDiagnosticReport");
  // "unchanged" reports and partial results carry no items of their own
  auto* kind = obj.if_contains("kind");
  if (!kind || !kind->is_string() || kind->as_string() != "full")
    return {std::string{none}};

  const auto* items = expect_member(obj, "items").if_array();
  if (!items) throwf("diagnostic report items is not an array");
  if (items->empty()) return {std::string{none}};

  std::string text;
  for (const auto& item : *items) {
    const auto& diag = expect_object(item, "Diagnostic");
    const auto& range = expect_object(expect_member(diag, "range"), "Range");
    if (!text.empty()) text += '\n';
    text += fmt::format(
        "{}: [{}] {}", format_position(expect_member(range, "start")),
        severity_name(diag.if_contains("severity")),
        expect_string(expect_member(diag, "message"), "message"));
  }
  return {std::move(text)};
}

tool_result format_hover(const json::value& hover) {
  if (hover.is_null())
    return {"No hover information available at this position."};

  const auto& contents =
      expect_member(expect_object(hover, "Hover"), "contents");

  if (auto* arr = contents.if_array()) {
    std::string text;
    bool first{true};
    for (const auto& item : *arr) {
      if (!first) text += "\n\n";
      first = false;
      text += render_marked_string(item);
    }
    return {std::move(text)};
  }

  if (auto* obj = contents.if_object(); obj && obj->contains("kind"))
    return {std::string{
      expect_string(expect_member(*obj, "value"), "MarkupContent value")}};

  return {render_marked_string(contents)};
}

tool_result format_definition(const json::value& definition) {
  if (definition.is_null()) return {"No definition found at this position."};

  if (auto* arr = definition.if_array()) {
    if (arr->empty()) return {"No definition found."};
    return {join_locations(*arr)};
  }
  return {format_location(definition)};
}

tool_result format_references(const json::value& references) {
  if (references.is_null()) return {"No references found at this position."};

  const auto* arr = references.if_array();
  if (!arr) throwf("expected Location array, got: {}", json::serialize(references));
  if (arr->empty()) return {"No references found."};
  return {fmt::format(
      "Found {} reference(s):\n{}", arr->size(), join_locations(*arr))};
}

json::array definitions() {
  json::array tools{};
  for (const auto& spec : tool_specs) {
    json::object tool{};
    tool["name"] = spec.name;
    tool["description"] = spec.description;
    tool["inputSchema"] = input_schema(spec.positional);
    tools.emplace_back(std::move(tool));
  }
  return tools;
}

asio::awaitable<tool_result> call(
    client& lsp, std::string_view name, const json::object& arguments) {
  const tool_spec* spec = find_tool(name);
  if (!spec) throwf<invalid_params>("unknown tool: {}", name);

  auto* file_arg = arguments.if_contains("file_path");
  if (!file_arg || !file_arg->is_string())
    throwf<invalid_params>("missing required string argument 'file_path'");
  std::string file_path{file_arg->as_string()};
  validate_file_path(file_path);

  uint32_t line{0};
  uint32_t character{0};
  if (spec->positional) {
    line = position_argument(arguments, "line");
    character = position_argument(arguments, "character");
  }

  LOG_DEBUG("{} {} {}:{}", spec->name, file_path, line, character);

  fs::path file{file_path};
  std::optional<std::string> failure{};
  try {
    co_await lsp.ensure_synced(file);
  } catch (const std::exception& e) {
    failure = e.what();
  }
  if (failure)
    co_return tool_result{fmt::format("Failed to open file: {}", *failure), true};

  try {
    co_return co_await run_request(lsp, spec->kind, file, line, character);
  } catch (const std::exception& e) {
    failure = e.what();
  }
  LOG_WARN("{} failed: {}", spec->name, *failure);
  co_return tool_result{failure_text(spec->kind, *failure), true};
}

}  // namespace lspbridge::tools
