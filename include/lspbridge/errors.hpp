// SPDX-License-Identifier: MIT
#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace lspbridge {

/// Base of every error raised by the protocol client.
struct lsp_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// The sidecar process could not be started.
struct spawn_error : lsp_error {
  using lsp_error::lsp_error;
};

/// The initialize/initialized exchange failed.  The process has been killed.
struct handshake_error : lsp_error {
  using lsp_error::lsp_error;
};

/// Malformed frame, bad JSON, or pipe I/O failure.  Fatal for the session.
struct transport_error : lsp_error {
  using lsp_error::lsp_error;
};

/// A peer declared a frame body larger than the configured maximum.
struct message_too_large : transport_error {
  message_too_large(const std::string& desc, std::size_t declared,
                    std::size_t limit)
      : transport_error{desc}, declared{declared}, limit{limit} {}
  std::size_t declared;
  std::size_t limit;
};

/// No response arrived in time.  The session stays usable.
struct timeout_error : lsp_error {
  using lsp_error::lsp_error;
};

/// The sidecar is gone: either the send was refused because the session is
/// no longer alive, or the pending request was drained when the reader loop
/// exited.
struct connection_lost : lsp_error {
  using lsp_error::lsp_error;
};

/// The sidecar answered with a JSON-RPC error object.
struct response_error : lsp_error {
  response_error(const std::string& desc, int64_t code, std::string message,
                 boost::json::value error)
      : lsp_error{desc},
        code{code},
        message{std::move(message)},
        error{std::move(error)} {}
  int64_t code;
  std::string message;
  boost::json::value error;
};

}  // namespace lspbridge
