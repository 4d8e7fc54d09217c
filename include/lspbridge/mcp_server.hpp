// SPDX-License-Identifier: MIT
#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/json.hpp>
#include <cstddef>
#include <memory>
#include <string_view>

#include "lspbridge/jsonrpc.hpp"

namespace lspbridge {

class client;
class async_mutex;

/// Fallback when the MCP client does not say which revision it speaks.
inline constexpr std::string_view default_mcp_protocol_version{"2024-11-05"};

/** @brief Model Context Protocol server over newline-delimited JSON-RPC.
 *
 * Answers @c initialize, @c ping, @c tools/list and @c tools/call, the
 * latter by way of @c tools::call on @p lsp.  Each tool call runs in its own
 * coroutine; responses are written whole, one per line, under a write lock.
 * Must run on the same single-threaded executor as @p lsp.
 */
class mcp_server {
 public:
  mcp_server(
      client& lsp, boost::asio::posix::stream_descriptor input,
      boost::asio::posix::stream_descriptor output,
      std::size_t max_line = default_max_message_size);

  mcp_server(const mcp_server&) = delete;
  mcp_server& operator=(const mcp_server&) = delete;
  ~mcp_server();

  /** @brief Serve until the input ends.
   *
   * Returns once the input is exhausted and every tool call in flight has
   * written its response.  Throws @c transport_error if a line exceeds the
   * limit and @c boost::system::system_error on I/O failure, in both cases
   * only after the tool calls in flight have finished.
   */
  boost::asio::awaitable<void> run();

  std::size_t in_flight() const { return in_flight_; }

 private:
  boost::asio::awaitable<void> read_requests();
  boost::asio::awaitable<void> handle_line(std::string_view line);
  boost::json::object dispatch(
      const boost::json::value& id, std::string_view method,
      const boost::json::object& params);
  boost::asio::awaitable<void> handle_tool_call(
      boost::json::value id, boost::json::object params);
  boost::asio::awaitable<void> send(const boost::json::object& msg);
  void tool_call_finished();

  client* lsp_;
  boost::asio::posix::stream_descriptor input_;
  boost::asio::posix::stream_descriptor output_;
  std::size_t max_line_;
  std::unique_ptr<async_mutex> write_mutex_;
  std::size_t in_flight_{0};
  boost::asio::steady_timer idle_;
};

}  // namespace lspbridge
