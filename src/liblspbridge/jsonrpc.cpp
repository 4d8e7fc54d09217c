// SPDX-License-Identifier: MIT
#include "lspbridge/jsonrpc.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <charconv>

#include "logger.hpp"
#include "lspbridge/errors.hpp"
#include "utils.hpp"

namespace lspbridge {

namespace asio = boost::asio;
namespace json = boost::json;
namespace sys = boost::system;

using utils::throwf;

namespace {

// A single header line longer than this is not a header.
constexpr std::size_t max_header_bytes{64 * 1024};

}  // namespace

std::string encode_frame(const json::value& msg) {
  std::string body{json::serialize(msg)};
  return fmt::format("Content-Length: {}\r\n\r\n{}", body.size(), body);
}

std::optional<std::size_t> parse_content_length(std::string_view line) {
  static const RE2 content_length_re{R"((?i)^\s*content-length\s*:\s*(.*?)\s*$)"};
  std::string value;
  if (!RE2::FullMatch(line, content_length_re, &value)) return std::nullopt;

  std::size_t length{};
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), length);
  if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size())
    throwf<transport_error>("invalid Content-Length header: '{}'", value);
  return length;
}

json::object make_request(
    int64_t id, std::string_view method, json::value params) {
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["method"] = method;
  if (!params.is_null()) msg["params"] = std::move(params);
  return msg;
}

json::object make_notification(std::string_view method, json::value params) {
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["method"] = method;
  if (!params.is_null()) msg["params"] = std::move(params);
  return msg;
}

frame_reader::frame_reader(
    asio::readable_pipe& pipe, std::size_t max_message_size)
    : pipe_{&pipe}, buf_{max_header_bytes}, max_message_size_{max_message_size} {}

asio::awaitable<std::optional<json::value>> frame_reader::read() {
  std::optional<std::size_t> content_length{};
  bool in_headers{false};

  // Headers, one CRLF-terminated line at a time, up to the blank line
  for (;;) {
    sys::error_code ec;
    std::size_t n = co_await asio::async_read_until(
        *pipe_, buf_, "\r\n", asio::redirect_error(asio::use_awaitable, ec));
    if (ec == asio::error::eof) {
      if (in_headers || buf_.size() > 0)
        LOG_WARN("stream ended inside a frame header");
      co_return std::nullopt;
    }
    if (ec == asio::error::not_found)
      throwf<transport_error>(
          "header line exceeds {} bytes", max_header_bytes);
    if (ec) throwf<transport_error>("read error: {}", ec.message());

    auto begin = asio::buffers_begin(buf_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(n - 2));
    buf_.consume(n);

    if (line.empty()) break;
    in_headers = true;
    if (auto length = parse_content_length(line)) content_length = length;
  }

  if (!content_length)
    throwf<transport_error>("missing Content-Length header");

  const std::size_t length{*content_length};
  if (length > max_message_size_) {
    throw message_too_large{
      fmt::format(
          "message size {} exceeds maximum of {}", length, max_message_size_),
      length, max_message_size_};
  }

  std::string body(length, '\0');

  // First, consume any already-buffered data
  std::size_t buffered{std::min(buf_.size(), length)};
  if (buffered > 0) {
    asio::buffer_copy(asio::buffer(body.data(), buffered), buf_.data());
    buf_.consume(buffered);
  }

  // Then read remaining bytes
  if (buffered < length) {
    sys::error_code ec;
    co_await asio::async_read(
        *pipe_, asio::buffer(body.data() + buffered, length - buffered),
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec == asio::error::eof)
      throwf<transport_error>("stream ended inside a message body");
    if (ec) throwf<transport_error>("read error: {}", ec.message());
  }

  sys::error_code jec;
  json::value msg{json::parse(body, jec)};
  if (jec) throwf<transport_error>("invalid JSON-RPC message: {}", jec.message());

  LOG_TRACE("<- {}", body);
  co_return msg;
}

asio::awaitable<void> write_jsonrpc_message(
    asio::writable_pipe& pipe, const json::value& msg) {
  std::string frame{encode_frame(msg)};
  LOG_TRACE("-> {}", frame);

  co_await asio::async_write(pipe, asio::buffer(frame), asio::use_awaitable);
}

}  // namespace lspbridge
