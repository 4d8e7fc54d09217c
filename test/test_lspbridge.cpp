// SPDX-License-Identifier: MIT
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <boost/asio/connect_pipe.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/asio/write.hpp>
#include <boost/json.hpp>
#include <string>

#include "lspbridge/errors.hpp"
#include "lspbridge/jsonrpc.hpp"
#include "test_helpers.hpp"

namespace asio = boost::asio;
namespace json = boost::json;

using lspbridge::test::run_sync;

namespace {

// A pipe pair on ctx with the given bytes already written and the write
// end closed, so the reader sees them followed by EOF.
struct canned_pipe {
  asio::readable_pipe in;
  asio::writable_pipe out;

  canned_pipe(asio::io_context& ctx, std::string_view bytes)
      : in{ctx}, out{ctx} {
    asio::connect_pipe(in, out);
    asio::write(out, asio::buffer(bytes));
    out.close();
  }
};

}  // namespace

TEST_CASE("encode-frame") {
  json::object msg{{"a", 1}};
  CHECK(lspbridge::encode_frame(msg) == "Content-Length: 7\r\n\r\n{\"a\":1}");

  // Length counts bytes, not characters
  json::object utf8{{"s", "\xC3\xA9"}};
  auto frame = lspbridge::encode_frame(utf8);
  CHECK(frame.starts_with("Content-Length: 10\r\n\r\n"));
}

TEST_CASE("parse-content-length") {
  CHECK(lspbridge::parse_content_length("Content-Length: 42") == 42U);
  CHECK(lspbridge::parse_content_length("content-length:7\r") == 7U);
  CHECK(lspbridge::parse_content_length("CONTENT-LENGTH:   0  ") == 0U);
  CHECK_FALSE(lspbridge::parse_content_length(
      "Content-Type: application/vscode-jsonrpc; charset=utf-8"));
  CHECK_THROWS_AS(
      lspbridge::parse_content_length("Content-Length: abc"),
      lspbridge::transport_error);
  CHECK_THROWS_AS(
      lspbridge::parse_content_length("Content-Length: -1"),
      lspbridge::transport_error);
  CHECK_THROWS_AS(
      lspbridge::parse_content_length("Content-Length:"),
      lspbridge::transport_error);
}

TEST_CASE("make-request-and-notification") {
  auto req = lspbridge::make_request(3, "textDocument/hover", nullptr);
  CHECK(req.at("jsonrpc") == "2.0");
  CHECK(req.at("id") == 3);
  CHECK(req.at("method") == "textDocument/hover");
  CHECK_FALSE(req.contains("params"));

  auto note = lspbridge::make_notification("initialized", json::object{});
  CHECK_FALSE(note.contains("id"));
  REQUIRE(note.contains("params"));
  CHECK(note.at("params").as_object().empty());

  CHECK_FALSE(lspbridge::make_notification("exit").contains("params"));
}

TEST_CASE("frame-reader-consecutive-frames") {
  asio::io_context ctx;
  std::string bytes{
    "Content-Length: 16\r\nContent-Type: application/vscode-jsonrpc\r\n\r\n"
    "{\"id\":1,\"x\":[1]}"};
  bytes += lspbridge::encode_frame(json::object{{"id", 2}});
  canned_pipe pipe{ctx, bytes};

  lspbridge::frame_reader reader{pipe.in};
  auto first = run_sync(ctx, reader.read());
  REQUIRE(first);
  CHECK(first->at("id") == 1);
  auto second = run_sync(ctx, reader.read());
  REQUIRE(second);
  CHECK(second->at("id") == 2);
  CHECK_FALSE(run_sync(ctx, reader.read()));
}

TEST_CASE("frame-reader-write-read") {
  asio::io_context ctx;
  asio::readable_pipe in{ctx};
  asio::writable_pipe out{ctx};
  asio::connect_pipe(in, out);

  json::object msg{{"jsonrpc", "2.0"}, {"method", "m"}, {"params", "caf\xC3\xA9"}};
  run_sync(ctx, lspbridge::write_jsonrpc_message(out, msg));
  out.close();

  lspbridge::frame_reader reader{in};
  auto got = run_sync(ctx, reader.read());
  REQUIRE(got);
  CHECK(*got == msg);
}

TEST_CASE("frame-reader-errors") {
  asio::io_context ctx;

  SUBCASE("eof inside body") {
    canned_pipe pipe{ctx, "Content-Length: 20\r\n\r\n{\"a\":"};
    lspbridge::frame_reader reader{pipe.in};
    CHECK_THROWS_AS(run_sync(ctx, reader.read()), lspbridge::transport_error);
  }

  SUBCASE("missing content length") {
    canned_pipe pipe{ctx, "Content-Type: x\r\n\r\n{}"};
    lspbridge::frame_reader reader{pipe.in};
    CHECK_THROWS_AS(run_sync(ctx, reader.read()), lspbridge::transport_error);
  }

  SUBCASE("malformed json") {
    canned_pipe pipe{ctx, "Content-Length: 9\r\n\r\n{not json"};
    lspbridge::frame_reader reader{pipe.in};
    CHECK_THROWS_AS(run_sync(ctx, reader.read()), lspbridge::transport_error);
  }

  SUBCASE("eof between frames") {
    canned_pipe pipe{ctx, ""};
    lspbridge::frame_reader reader{pipe.in};
    CHECK_FALSE(run_sync(ctx, reader.read()));
  }
}

TEST_CASE("frame-reader-rejects-oversized-message") {
  asio::io_context ctx;
  // Declared length only; the body is never sent
  canned_pipe pipe{ctx, "Content-Length: 999999999\r\n\r\n"};
  lspbridge::frame_reader reader{pipe.in, 1024};

  try {
    run_sync(ctx, reader.read());
    FAIL("expected message_too_large");
  } catch (const lspbridge::message_too_large& e) {
    CHECK(e.declared == 999999999U);
    CHECK(e.limit == 1024U);
  }
}
