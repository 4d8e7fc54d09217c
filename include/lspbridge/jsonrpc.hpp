// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSONRPC 2.0 message framing over async pipes.
 *
 * Messages are framed using the Language Server Protocol convention: each
 * message is preceded by a header block of the form
 * @c "Content-Length: N\r\n\r\n" followed by exactly @c N bytes of UTF-8
 * JSON text.  Reading is done on a Boost.ASIO @c readable_pipe and writing on
 * any pipe-like stream, both designed to be used with @c co_await in a
 * coroutine context.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lspbridge {

/// Upper bound on a frame body unless configured otherwise (100 MiB).
inline constexpr std::size_t default_max_message_size{100 * 1024 * 1024};

/** @brief Serialise @p msg and prepend its @c Content-Length header.
 *
 * The returned string is a complete frame, ready to be written to a pipe in
 * one operation.
 */
std::string encode_frame(const boost::json::value& msg);

/** @brief Parse the value of a single header line.
 *
 * Returns the declared length if @p line is a @c Content-Length header
 * (name matched case-insensitively, surrounding whitespace and a trailing
 * @c '\r' ignored), an empty optional if it is some other header.  Throws
 * @c transport_error if the header is present but its value is not a
 * non-negative decimal number.
 */
std::optional<std::size_t> parse_content_length(std::string_view line);

/// Build an outgoing request.
boost::json::object make_request(
    int64_t id, std::string_view method, boost::json::value params);

/// Build an outgoing notification.  A null @p params is omitted.
boost::json::object make_notification(
    std::string_view method, boost::json::value params = nullptr);

/** @brief Incremental frame reader bound to one pipe.
 *
 * Keeps its own buffer between calls, so bytes of the next frame that
 * arrive together with the current one are not lost.
 */
class frame_reader {
 public:
  explicit frame_reader(
      boost::asio::readable_pipe& pipe,
      std::size_t max_message_size = default_max_message_size);

  frame_reader(const frame_reader&) = delete;
  frame_reader& operator=(const frame_reader&) = delete;

  /** @brief Read one framed message.
   *
   * Returns the parsed JSON value, or an empty optional when the stream ends
   * cleanly between frames.  Throws @c transport_error on a missing or bad
   * header, truncated body, I/O error or malformed JSON, and
   * @c message_too_large (before reading the body) when the declared length
   * exceeds the limit.
   */
  boost::asio::awaitable<std::optional<boost::json::value>> read();

  std::size_t max_message_size() const { return max_message_size_; }

 private:
  boost::asio::readable_pipe* pipe_;
  boost::asio::streambuf buf_;
  std::size_t max_message_size_;
};

/** @brief Write one framed JSONRPC message to @p pipe.
 *
 * Writes the complete frame as a single async operation.  Callers sharing
 * a pipe must serialise calls (see @c async_mutex).
 */
boost::asio::awaitable<void> write_jsonrpc_message(
    boost::asio::writable_pipe& pipe, const boost::json::value& msg);

}  // namespace lspbridge
