// SPDX-License-Identifier: MIT
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/this_coro.hpp>
#include <exception>
#include <span>

#include "logger.hpp"
#include "lspbridge/client.hpp"
#include "lspbridge/mcp_server.hpp"
#include "options.hpp"

namespace asio = boost::asio;

using lspbridge::client;
using lspbridge::client_options;
using lspbridge::mcp_server;

namespace {

asio::awaitable<void> serve(client_options copts) {
  auto ex = co_await asio::this_coro::executor;
  const std::size_t max_line{copts.max_message_size};

  auto lsp = co_await client::start(std::move(copts));

  // stdout carries MCP replies, stderr the log
  mcp_server server{
    *lsp, asio::posix::stream_descriptor{ex, ::dup(STDIN_FILENO)},
    asio::posix::stream_descriptor{ex, ::dup(STDOUT_FILENO)}, max_line};

  std::exception_ptr failure{};
  try {
    co_await server.run();
  } catch (const std::exception& e) {
    LOG_ERROR("MCP server failed: {}", e.what());
    failure = std::current_exception();
  }

  co_await lsp->shutdown();
  if (failure) std::rethrow_exception(failure);
}

}  // namespace

int main(int argc, char* argv[]) {
  lspbridge::cli_options opts{};
  int loglevel{static_cast<int>(lspbridge::logger::level::warning)};

  auto done = lspbridge::parse_options(std::span(argv, argc), loglevel, opts);
  if (done) return done.value();

  lspbridge::logger::set_level(
      static_cast<lspbridge::logger::level>(loglevel));
  LOG_DEBUG("loglevel={}", loglevel);

  int retval{0};
  try {
    asio::io_context ctx;
    asio::co_spawn(
        ctx, serve(lspbridge::make_client_options(opts)),
        [&retval](std::exception_ptr ep) {
          if (!ep) return;
          try {
            std::rethrow_exception(ep);
          } catch (const std::exception& e) {
            LOG_FATAL("{}", e.what());
            retval = 1;
          }
        });
    ctx.run();
  } catch (const std::exception& e) {
    LOG_FATAL("{}", e.what());
    return 1;
  }
  return retval;
}
