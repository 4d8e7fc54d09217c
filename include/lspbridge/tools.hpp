// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file tools.hpp
 * @brief The four read-only rust-analyzer tools offered over MCP.
 *
 * Each tool validates its arguments, makes sure the file is synced with the
 * language server, issues one LSP request and renders the answer as plain
 * text with one-indexed positions.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lspbridge {

class client;

namespace tools {

/// Bad tool arguments or an unknown tool.  Reported as JSON-RPC -32602.
struct invalid_params : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Text outcome of a tool call.  @c is_error marks a tool-level failure,
/// which is still a successful JSON-RPC response.
struct tool_result {
  std::string text;
  bool is_error{false};
};

/// MCP @c CallToolResult: one text content item plus @c isError.
boost::json::object to_json(const tool_result& result);

/// Throws @c invalid_params unless @p path is absolute and exists.
void validate_file_path(std::string_view path);

/// @c path:line:col for an LSP Location or LocationLink, one-indexed.
std::string format_location(const boost::json::value& location);

// Renderers for the raw LSP results.  They throw std::runtime_error if the
// result does not have the expected shape.
tool_result format_diagnostics(const boost::json::value& report);
tool_result format_hover(const boost::json::value& hover);
tool_result format_definition(const boost::json::value& definition);
tool_result format_references(const boost::json::value& references);

/// Tool descriptors for @c tools/list, with JSON input schemas.
boost::json::array definitions();

/** @brief Run the tool called @p name against @p lsp.
 *
 * Throws @c invalid_params for an unknown tool or bad @p arguments.  LSP
 * and file errors come back as a @c tool_result with @c is_error set.
 */
boost::asio::awaitable<tool_result> call(
    client& lsp, std::string_view name, const boost::json::object& arguments);

}  // namespace tools
}  // namespace lspbridge
