// SPDX-License-Identifier: MIT
#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/json.hpp>
#include <boost/process/v2/process.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lspbridge/correlator.hpp"
#include "lspbridge/document_tracker.hpp"
#include "lspbridge/jsonrpc.hpp"

namespace lspbridge {

namespace fs = std::filesystem;

inline constexpr std::string_view version{"0.1.0"};

struct client_options {
  fs::path program{};
  std::vector<std::string> args{};
  std::optional<fs::path> workspace_root{};
  std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
  std::chrono::milliseconds shutdown_grace{std::chrono::seconds{5}};
  std::size_t max_message_size{default_max_message_size};
};

enum class session_state : uint8_t {
  starting,
  handshaking,
  ready,
  shutting_down,
  terminated
};

std::string_view to_string(session_state state);

class async_mutex;

/** @brief A live LSP session with one sidecar process.
 *
 * Created only by @c start, which spawns the sidecar and completes the
 * initialize handshake.  All coroutines using a client must run on the
 * single-threaded executor it was started on.
 */
class client {
 public:
  /** @brief Spawn the sidecar and perform the LSP handshake.
   *
   * Throws @c spawn_error if the process cannot be started and
   * @c handshake_error if initialize/initialized fails, in which case the
   * process has been killed.
   */
  static boost::asio::awaitable<std::unique_ptr<client>> start(
      client_options options);

  client(const client&) = delete;
  client(client&&) = delete;
  client& operator=(const client&) = delete;
  client& operator=(client&&) = delete;
  ~client();

  /** @brief Send a request and await its result.
   *
   * Throws @c connection_lost if the session is dead or dies while waiting,
   * @c timeout_error after the configured timeout, @c response_error if the
   * server answered with an error, @c transport_error on a write failure.
   */
  boost::asio::awaitable<boost::json::value> request(
      std::string_view method, boost::json::value params = nullptr);

  /// Send a notification.  Same send-side errors as @c request.
  boost::asio::awaitable<void> notify(
      std::string_view method, boost::json::value params = nullptr);

  /** @brief Make sure the server has the current on-disk text of @p path.
   *
   * Sends didOpen on first sight, didChange when the content changed since
   * the last sync, and nothing otherwise.
   */
  boost::asio::awaitable<void> ensure_synced(const fs::path& path);

  boost::asio::awaitable<boost::json::value> hover(
      const fs::path& file, uint32_t line, uint32_t character);
  boost::asio::awaitable<boost::json::value> goto_definition(
      const fs::path& file, uint32_t line, uint32_t character);
  boost::asio::awaitable<boost::json::value> find_references(
      const fs::path& file, uint32_t line, uint32_t character);
  boost::asio::awaitable<boost::json::value> document_diagnostics(
      const fs::path& file);

  /** @brief Best-effort graceful shutdown.  Never throws.
   *
   * shutdown request, exit notification, then up to the grace period for
   * the process to exit on its own before it is killed.  Safe to call more
   * than once, and after the sidecar has died.
   */
  boost::asio::awaitable<void> shutdown();

  bool alive() const;
  session_state state() const;
  std::size_t pending_requests() const { return correlator_->size(); }
  const document_tracker& documents() const { return documents_; }
  const client_options& options() const { return options_; }

 private:
  // Shared with the reader loop, which may outlive the client.
  struct status {
    std::atomic<bool> alive{true};
    std::atomic<session_state> state{session_state::starting};
  };

  client(
      boost::asio::any_io_executor ex, client_options options,
      boost::process::v2::process process,
      boost::asio::writable_pipe stdin_pipe,
      std::shared_ptr<correlator> correlator, std::shared_ptr<status> status);

  boost::asio::awaitable<void> send(const boost::json::object& msg);
  boost::asio::awaitable<void> wait_or_kill();
  void kill_now();

  static boost::asio::awaitable<void> reader_loop(
      boost::asio::readable_pipe stdout_pipe, std::size_t max_message_size,
      std::shared_ptr<correlator> correlator, std::shared_ptr<status> status);

  boost::asio::any_io_executor ex_;
  client_options options_;
  boost::process::v2::process process_;
  boost::asio::writable_pipe stdin_;
  std::unique_ptr<async_mutex> write_mutex_;
  std::shared_ptr<correlator> correlator_;
  std::shared_ptr<status> status_;
  document_tracker documents_;
  bool shutdown_started_{false};
};

}  // namespace lspbridge
