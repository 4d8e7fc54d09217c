// SPDX-License-Identifier: MIT
#include "lspbridge/mcp_server.hpp"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>
#include <exception>
#include <string>

#include "async_mutex.hpp"
#include "json_helpers.hpp"
#include "logger.hpp"
#include "lspbridge/client.hpp"
#include "lspbridge/errors.hpp"
#include "lspbridge/tools.hpp"
#include "utils.hpp"

namespace lspbridge {

namespace asio = boost::asio;
namespace sys = boost::system;

namespace {

constexpr std::string_view instructions{
  "Provides rust-analyzer intelligence via lspmux. Use rust_diagnostics to "
  "check for errors, rust_hover for type info, rust_goto_definition to find "
  "definitions, and rust_find_references to find all usages."};

json::object handle_initialize(const json::object& params) {
  json::value protocol_version{default_mcp_protocol_version};
  if (auto* v = params.if_contains("protocolVersion"); v && v->is_string())
    protocol_version = *v;

  json::object capabilities{};
  capabilities["tools"] = json::object{};

  json::object server_info{};
  server_info["name"] = "lspbridge";
  server_info["version"] = version;

  json::object result{};
  result["protocolVersion"] = std::move(protocol_version);
  result["capabilities"] = std::move(capabilities);
  result["serverInfo"] = std::move(server_info);
  result["instructions"] = instructions;
  return result;
}

}  // namespace

mcp_server::mcp_server(
    client& lsp, asio::posix::stream_descriptor input,
    asio::posix::stream_descriptor output, std::size_t max_line)
    : lsp_{&lsp},
      input_{std::move(input)},
      output_{std::move(output)},
      max_line_{max_line},
      write_mutex_{std::make_unique<async_mutex>(input_.get_executor())},
      idle_{input_.get_executor(), asio::steady_timer::time_point::max()} {}

mcp_server::~mcp_server() = default;

/// Server loop

asio::awaitable<void> mcp_server::run() {
  std::exception_ptr failure{};
  try {
    co_await read_requests();
  } catch (const std::exception&) {
    failure = std::current_exception();
  }

  // Tool calls in flight hold this server and the LSP client
  LOG_INFO("MCP input closed, {} tool call(s) in flight", in_flight_);
  while (in_flight_ > 0) {
    idle_.expires_at(asio::steady_timer::time_point::max());
    sys::error_code wait_ec;
    co_await idle_.async_wait(asio::redirect_error(asio::use_awaitable, wait_ec));
  }
  if (failure) std::rethrow_exception(failure);
}

asio::awaitable<void> mcp_server::read_requests() {
  asio::streambuf buf{max_line_};
  LOG_INFO("MCP server reading requests");

  for (;;) {
    sys::error_code ec;
    std::size_t n = co_await asio::async_read_until(
        input_, buf, '\n', asio::redirect_error(asio::use_awaitable, ec));

    if (ec == asio::error::eof) {
      // A last line may lack its newline
      if (buf.size() > 0) {
        std::string rest{
          asio::buffers_begin(buf.data()), asio::buffers_end(buf.data())};
        buf.consume(buf.size());
        co_await handle_line(rest);
      }
      co_return;
    }
    if (ec == asio::error::not_found)
      utils::throwf<transport_error>(
          "MCP input line exceeds {} bytes", max_line_);
    if (ec) throw sys::system_error{ec, "reading MCP input"};

    std::string line{
      asio::buffers_begin(buf.data()),
      asio::buffers_begin(buf.data()) + static_cast<std::ptrdiff_t>(n - 1)};
    buf.consume(n);
    co_await handle_line(line);
  }
}

/// Message handling

asio::awaitable<void> mcp_server::handle_line(std::string_view line) {
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  if (line.find_first_not_of(" \t") == std::string_view::npos) co_return;

  LOG_TRACE("mcp <- {}", line);

  json::value msg_val{};
  {
    sys::error_code jec{};
    msg_val = json::parse(line, jec);
    if (jec) {
      co_await send(make_jsonrpc_error(nullptr, PARSE_ERROR, "Parse error"));
      co_return;
    }
  }

  auto* msg = msg_val.if_object();
  if (!msg) {
    co_await send(make_jsonrpc_error(nullptr, INVALID_REQUEST, "Invalid Request"));
    co_return;
  }

  json::value id{nullptr};
  bool has_id{false};
  if (auto* v = msg->if_contains("id")) {
    id = *v;
    has_id = true;
  }

  auto* method_val = msg->if_contains("method");
  if (!method_val) {
    // A response to something we never ask
    LOG_DEBUG("ignoring MCP message without method");
    co_return;
  }
  if (!method_val->is_string()) {
    co_await send(make_jsonrpc_error(id, INVALID_REQUEST, "missing method"));
    co_return;
  }
  std::string method{method_val->as_string()};

  json::object params{};
  if (auto* p = msg->if_contains("params")) {
    if (auto* obj = p->if_object()) {
      params = *obj;
    } else if (!p->is_null()) {
      if (has_id)
        co_await send(make_jsonrpc_error(
            id, INVALID_PARAMS, "Params must be an object"));
      co_return;
    }
  }

  if (!has_id) {
    LOG_DEBUG("MCP notification: {}", method);
    co_return;
  }

  LOG_INFO("mcp rpc: {}", method);

  if (method == "tools/call") {
    ++in_flight_;
    asio::co_spawn(
        input_.get_executor(), handle_tool_call(std::move(id), std::move(params)),
        asio::detached);
    co_return;
  }

  co_await send(dispatch(id, method, params));
}

json::object mcp_server::dispatch(
    const json::value& id, std::string_view method,
    const json::object& params) {
  if (method == "initialize") {
    return make_result(id, handle_initialize(params));
  } else if (method == "ping") {
    return make_result(id, json::object{});
  } else if (method == "tools/list") {
    json::object result{};
    result["tools"] = tools::definitions();
    return make_result(id, std::move(result));
  }
  return make_jsonrpc_error(
      id, METHOD_NOT_FOUND, "Method not found", json::value{method});
}

asio::awaitable<void> mcp_server::handle_tool_call(
    json::value id, json::object params) {
  AUTO(tool_call_finished());

  json::object response{};
  try {
    auto* name = params.if_contains("name");
    if (!name || !name->is_string())
      throw tools::invalid_params{"missing tool name"};

    json::object arguments{};
    if (auto* a = params.if_contains("arguments"); a && !a->is_null()) {
      if (!a->is_object())
        throw tools::invalid_params{"tool arguments must be an object"};
      arguments = a->as_object();
    }

    auto result = co_await tools::call(*lsp_, name->as_string(), arguments);
    response = make_result(id, tools::to_json(result));
  } catch (const tools::invalid_params& e) {
    response = make_jsonrpc_error(id, INVALID_PARAMS, e.what());
  } catch (const std::exception& e) {
    LOG_ERROR("tools/call failed: {}", e.what());
    response = make_jsonrpc_error(id, INTERNAL_ERROR, e.what());
  }

  try {
    co_await send(response);
  } catch (const std::exception& e) {
    LOG_ERROR("failed to write MCP response: {}", e.what());
  }
}

void mcp_server::tool_call_finished() {
  if (--in_flight_ == 0) idle_.cancel();
}

asio::awaitable<void> mcp_server::send(const json::object& msg) {
  std::string text{json::serialize(msg)};
  LOG_TRACE("mcp -> {}", text);
  text += '\n';

  auto lock = co_await write_mutex_->scoped_lock();
  co_await asio::async_write(
      output_, asio::buffer(text), asio::use_awaitable);
}

}  // namespace lspbridge
