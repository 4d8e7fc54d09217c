// SPDX-License-Identifier: MIT
#include <doctest/doctest.h>
#include <unistd.h>

#include <array>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <map>
#include <string>
#include <system_error>

#include "lspbridge/client.hpp"
#include "lspbridge/errors.hpp"
#include "lspbridge/mcp_server.hpp"
#include "test_helpers.hpp"

namespace asio = boost::asio;
namespace json = boost::json;

using namespace std::chrono_literals;
using lspbridge::test::run_sync;
using lspbridge::test::scratch_dir;
using lspbridge::test::sidecar_options;

namespace {

std::array<int, 2> make_pipe() {
  std::array<int, 2> fds{};
  if (::pipe(fds.data()) != 0)
    throw std::system_error{errno, std::generic_category(), "pipe"};
  return fds;
}

void write_all(int fd, std::string_view bytes) {
  while (!bytes.empty()) {
    auto n = ::write(fd, bytes.data(), bytes.size());
    if (n < 0) throw std::system_error{errno, std::generic_category(), "write"};
    bytes.remove_prefix(static_cast<std::size_t>(n));
  }
}

std::string read_all(int fd) {
  std::string out;
  std::array<char, 4096> chunk{};
  for (;;) {
    auto n = ::read(fd, chunk.data(), chunk.size());
    if (n < 0) throw std::system_error{errno, std::generic_category(), "read"};
    if (n == 0) break;
    out.append(chunk.data(), static_cast<std::size_t>(n));
  }
  return out;
}

// Feed input to a server backed by the fake sidecar, run it to the end of
// input, and return its replies.  Replies with an id are keyed by it; those
// without one land under "null".  If run() fails, its message goes to
// *failure.
std::map<std::string, json::object> serve(
    std::string_view input,
    lspbridge::client_options opts = sidecar_options(),
    std::size_t max_line = lspbridge::default_max_message_size,
    std::string* failure = nullptr) {
  asio::io_context ctx;
  auto c = run_sync(ctx, lspbridge::client::start(std::move(opts)));

  auto in = make_pipe();
  auto out = make_pipe();
  write_all(in[1], input);
  ::close(in[1]);

  {
    lspbridge::mcp_server server{
      *c, asio::posix::stream_descriptor{ctx, in[0]},
      asio::posix::stream_descriptor{ctx, out[1]}, max_line};
    try {
      run_sync(ctx, server.run());
    } catch (const lspbridge::transport_error& e) {
      REQUIRE(failure);
      *failure = e.what();
    }
    CHECK(server.in_flight() == 0);
  }
  run_sync(ctx, c->shutdown());

  std::map<std::string, json::object> replies;
  std::string text{read_all(out[0])};
  ::close(out[0]);

  std::string_view rest{text};
  while (!rest.empty()) {
    auto nl = rest.find('\n');
    REQUIRE(nl != std::string_view::npos);
    auto msg = json::parse(rest.substr(0, nl)).as_object();
    rest.remove_prefix(nl + 1);
    replies[json::serialize(msg.at("id"))] = std::move(msg);
  }
  return replies;
}

}  // namespace

TEST_CASE("mcp-initialize-ping-list") {
  auto replies = serve(
      R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26","capabilities":{},"clientInfo":{"name":"t","version":"0"}}})"
      "\n"
      R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
      "\n"
      R"({"jsonrpc":"2.0","id":2,"method":"ping"})"
      "\n"
      R"({"jsonrpc":"2.0","id":3,"method":"tools/list","params":{}})"
      "\n");

  REQUIRE(replies.size() == 3);

  const auto& init = replies.at("1").at("result").as_object();
  CHECK(init.at("protocolVersion") == "2025-03-26");
  CHECK(init.at("capabilities").as_object().contains("tools"));
  CHECK(init.at("serverInfo").as_object().at("name") == "lspbridge");
  CHECK(init.contains("instructions"));

  CHECK(replies.at("2").at("result").as_object().empty());

  const auto& list = replies.at("3").at("result").as_object();
  CHECK(list.at("tools").as_array().size() == 4);
}

TEST_CASE("mcp-default-protocol-version") {
  auto replies = serve(R"({"jsonrpc":"2.0","id":"a","method":"initialize"})");
  REQUIRE(replies.size() == 1);
  CHECK(
      replies.at("\"a\"").at("result").as_object().at("protocolVersion") ==
      "2024-11-05");
}

TEST_CASE("mcp-protocol-errors") {
  auto replies = serve(
      "this is not json\n"
      R"({"jsonrpc":"2.0","id":5,"method":"resources/list"})"
      "\n"
      R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"rust_nothing","arguments":{}}})"
      "\n"
      R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"rust_hover","arguments":{"file_path":"rel.rs","line":0,"character":0}}})"
      "\n"
      "\n");

  REQUIRE(replies.size() == 4);
  auto code = [&](const std::string& id) {
    return replies.at(id).at("error").as_object().at("code");
  };
  CHECK(code("null") == -32700);
  CHECK(code("5") == -32601);
  CHECK(code("6") == -32602);
  CHECK(code("7") == -32602);
  CHECK(
      replies.at("7").at("error").as_object().at("message") ==
      "file_path must be absolute, got: rel.rs");
}

TEST_CASE("mcp-invalid-request") {
  auto replies = serve("[1,2,3]\n");
  REQUIRE(replies.size() == 1);
  CHECK(
      replies.at("null").at("error").as_object().at("code") == -32600);
}

TEST_CASE("mcp-tool-calls") {
  scratch_dir dir{"lspbridge-mcp-test"};
  auto file = dir.write("main.rs", "fn main() {}\n");
  json::object args{{"file_path", file.string()}, {"line", 0}, {"character", 3}};

  std::string input;
  int id{10};
  for (auto name : {"rust_hover", "rust_goto_definition", "rust_find_references",
                    "rust_diagnostics"}) {
    json::object params{};
    params["name"] = name;
    params["arguments"] = args;
    json::object req{};
    req["jsonrpc"] = "2.0";
    req["id"] = id++;
    req["method"] = "tools/call";
    req["params"] = std::move(params);
    input += json::serialize(req) + "\n";
  }

  auto replies = serve(input);
  REQUIRE(replies.size() == 4);
  for (const auto& [key, reply] : replies) {
    const auto& result = reply.at("result").as_object();
    CHECK(result.at("isError") == false);
    CHECK(result.at("content").as_array().size() == 1);
  }
  auto text = [&](const std::string& id) {
    return std::string{replies.at(id)
                           .at("result")
                           .as_object()
                           .at("content")
                           .as_array()[0]
                           .as_object()
                           .at("text")
                           .as_string()};
  };
  CHECK(text("10") == "```rust\nfn main()\n```");
  CHECK(text("11") == file.string() + ":1:4");
  CHECK(text("12").starts_with("Found 2 reference(s):\n"));
  CHECK(text("13") == "2:13: [ERROR] mismatched types");
}

TEST_CASE("mcp-overlong-line-waits-for-tool-calls") {
  scratch_dir dir{"lspbridge-mcp-overlong-test"};
  auto file = dir.write("main.rs", "fn main() {}\n");

  json::object args{{"file_path", file.string()}, {"line", 0}, {"character", 3}};
  json::object params{};
  params["name"] = "rust_hover";
  params["arguments"] = std::move(args);
  json::object req{};
  req["jsonrpc"] = "2.0";
  req["id"] = 1;
  req["method"] = "tools/call";
  req["params"] = std::move(params);

  // The sidecar parks the hover, so the call is still in flight when the
  // overlong line ends the input loop
  auto opts = sidecar_options({"--hold-hover"});
  opts.request_timeout = 300ms;
  std::string failure;
  auto replies = serve(
      json::serialize(req) + "\n" + std::string(4096, 'x') + "\n", opts, 1024,
      &failure);

  CHECK(failure == "MCP input line exceeds 1024 bytes");
  REQUIRE(replies.size() == 1);
  const auto& result = replies.at("1").at("result").as_object();
  CHECK(result.at("isError") == true);
  auto text = std::string_view{
    result.at("content").as_array()[0].as_object().at("text").as_string()};
  CHECK(text.starts_with("Hover request failed: "));
}
