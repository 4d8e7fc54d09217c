// SPDX-License-Identifier: MIT
#include "lspbridge/client.hpp"

#include <fmt/std.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/system_error.hpp>
#include <csignal>
#include <fstream>
#include <iterator>
#include <mutex>
#include <variant>

#include "async_mutex.hpp"
#include "logger.hpp"
#include "lspbridge/errors.hpp"
#include "lspbridge/language.hpp"
#include "lspbridge/uri.hpp"
#include "utf8.hpp"
#include "utils.hpp"

namespace lspbridge {

namespace asio = boost::asio;
namespace json = boost::json;
namespace p2 = boost::process::v2;
namespace sys = boost::system;

using utils::throwf;

namespace {

std::string slurp(const fs::path& path) {
  std::ifstream in{path, std::ios::binary};
  if (!in) throwf("failed to read {}", path);
  std::string content{
    std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
  if (in.bad()) throwf("failed to read {}", path);
  // Frame bodies must be UTF-8 JSON
  if (!utils::is_valid_utf8(content))
    throwf("failed to read {}: not valid UTF-8", path);
  return content;
}

json::object text_document_position(
    const fs::path& file, uint32_t line, uint32_t character) {
  return {
    {"textDocument", {{"uri", file_uri(file)}}},
    {"position", {{"line", line}, {"character", character}}}};
}

// A vanished sidecar must surface as EPIPE on write, not kill us.
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

fs::path resolve_program(const fs::path& program) {
  if (program.has_parent_path()) return program;
  auto found = p2::environment::find_executable(program.string());
  if (found.empty())
    throwf<spawn_error>("failed to spawn {}: not found in PATH", program);
  return found;
}

void dispatch_incoming(json::value& msg, correlator& corr) {
  auto* obj = msg.if_object();
  if (!obj) {
    LOG_WARN("ignoring non-object message: {}", json::serialize(msg));
    return;
  }

  // Server-initiated: a notification, or a request we don't serve
  if (auto* method = obj->if_contains("method")) {
    std::string_view name{"?"};
    if (auto* s = method->if_string()) name = *s;
    if (obj->contains("id"))
      LOG_DEBUG("LSP server request ignored: {}", name);
    else
      LOG_DEBUG("LSP notification: {}", name);
    return;
  }

  auto* id = obj->if_contains("id");
  if (!id || !id->is_int64()) {
    LOG_WARN(
        "ignoring response without a usable id: {}",
        id ? json::serialize(*id) : std::string{"<none>"});
    return;
  }
  corr.resolve(id->as_int64(), std::move(*obj));
}

}  // namespace

std::string_view to_string(session_state state) {
  // clang-format off
  switch (state) {
  case session_state::starting:      return "starting";
  case session_state::handshaking:   return "handshaking";
  case session_state::ready:         return "ready";
  case session_state::shutting_down: return "shutting_down";
  case session_state::terminated:    return "terminated";
  }
  // clang-format on
  return "unknown";
}

client::client(
    asio::any_io_executor ex, client_options options, p2::process process,
    asio::writable_pipe stdin_pipe, std::shared_ptr<correlator> correlator,
    std::shared_ptr<status> status)
    : ex_{std::move(ex)},
      options_{std::move(options)},
      process_{std::move(process)},
      stdin_{std::move(stdin_pipe)},
      write_mutex_{std::make_unique<async_mutex>(ex_)},
      correlator_{std::move(correlator)},
      status_{std::move(status)} {}

client::~client() = default;

bool client::alive() const { return status_->alive.load(std::memory_order_acquire); }

session_state client::state() const { return status_->state.load(); }

/// Handshake

asio::awaitable<std::unique_ptr<client>> client::start(client_options options) {
  auto ex = co_await asio::this_coro::executor;
  ignore_sigpipe();

  json::value root_uri{nullptr};
  if (options.workspace_root) {
    try {
      root_uri = file_uri(*options.workspace_root);
    } catch (const std::invalid_argument& e) {
      throwf<handshake_error>("invalid workspace root URI: {}", e.what());
    }
  }

  auto status_ptr = std::make_shared<status>();
  fs::path program{resolve_program(options.program)};

  asio::readable_pipe stdout_pipe{ex};
  asio::writable_pipe stdin_pipe{ex};
  std::optional<p2::process> proc{};
  try {
    // stderr is inherited: a piped but undrained stderr can fill up and
    // block a chatty sidecar.
    proc.emplace(
        ex, program, options.args,
        p2::process_stdio{.in = stdin_pipe, .out = stdout_pipe});
  } catch (const sys::system_error& e) {
    status_ptr->state = session_state::terminated;
    throwf<spawn_error>("failed to spawn {}: {}", program, e.what());
  }

  LOG_INFO("spawned {} (pid {})", program, proc->id());
  status_ptr->state = session_state::handshaking;

  auto corr = std::make_shared<correlator>(ex);
  const std::size_t max_message_size{options.max_message_size};
  std::unique_ptr<client> c{new client{
    ex, std::move(options), std::move(*proc), std::move(stdin_pipe), corr,
    status_ptr}};

  // The reader must be running before the first request goes out.
  asio::co_spawn(
      ex,
      reader_loop(std::move(stdout_pipe), max_message_size, corr, status_ptr),
      asio::detached);

  json::object client_info{};
  client_info["name"] = "lspbridge";
  client_info["version"] = version;

  json::object init_params{};
  init_params["processId"] = static_cast<int64_t>(::getpid());
  init_params["clientInfo"] = std::move(client_info);
  init_params["rootUri"] = std::move(root_uri);
  init_params["capabilities"] = json::object{};

  std::optional<std::string> failure{};
  try {
    json::value result = co_await c->request("initialize", std::move(init_params));
    co_await c->notify("initialized", json::object{});

    if (auto* obj = result.if_object()) {
      if (auto* info = obj->if_contains("serverInfo"); info && info->is_object()) {
        if (auto* name = info->as_object().if_contains("name"); name && name->is_string())
          LOG_INFO("LSP server: {}", std::string_view{name->as_string()});
      }
    }
  } catch (const std::exception& e) {
    failure = e.what();
  }

  if (failure) {
    c->kill_now();
    status_ptr->state = session_state::terminated;
    throwf<handshake_error>("LSP initialize failed: {}", *failure);
  }

  // The reader may already have seen the sidecar go away.
  auto expected{session_state::handshaking};
  status_ptr->state.compare_exchange_strong(expected, session_state::ready);
  LOG_INFO("LSP client initialized");
  co_return c;
}

/// Reader loop

asio::awaitable<void> client::reader_loop(
    asio::readable_pipe stdout_pipe, std::size_t max_message_size,
    std::shared_ptr<correlator> corr, std::shared_ptr<status> st) {
  frame_reader reader{stdout_pipe, max_message_size};
  try {
    for (;;) {
      auto msg = co_await reader.read();
      if (!msg) {
        LOG_INFO("LSP stdout closed");
        break;
      }
      dispatch_incoming(*msg, *corr);
    }
  } catch (const std::exception& e) {
    LOG_ERROR("LSP reader loop error: {}", e.what());
  }

  st->alive.store(false, std::memory_order_release);
  if (st->state.load() != session_state::shutting_down)
    st->state = session_state::terminated;

  if (auto count = corr->drain_all(); count > 0)
    LOG_WARN("Reader loop exited with {} pending request(s)", count);
}

/// Requests and notifications

asio::awaitable<void> client::send(const json::object& msg) {
  if (!alive())
    throw connection_lost{
      "LSP server is no longer running (child process exited)"};

  auto lock = co_await write_mutex_->scoped_lock();
  if (!alive())
    throw connection_lost{
      "LSP server is no longer running (child process exited)"};

  try {
    co_await write_jsonrpc_message(stdin_, msg);
  } catch (const sys::system_error& e) {
    throwf<transport_error>("failed to write to LSP server: {}", e.what());
  }
}

asio::awaitable<json::value> client::request(
    std::string_view method, json::value params) {
  auto registration = correlator_->register_request();
  const int64_t id{registration.first};
  // Whatever happens below, a late answer must find no entry.
  AUTO(correlator_->abandon(id));

  LOG_DEBUG("request {} {}", id, method);
  co_await send(make_request(id, method, std::move(params)));

  json::object response{};
  try {
    response = co_await registration.second.wait(options_.request_timeout);
  } catch (const timeout_error& e) {
    LOG_WARN("{} ({})", e.what(), method);
    throw;
  }

  if (auto* err = response.if_contains("error")) {
    int64_t code{0};
    std::string message{};
    if (auto* eobj = err->if_object()) {
      if (auto* c = eobj->if_contains("code"); c && c->is_int64())
        code = c->as_int64();
      if (auto* m = eobj->if_contains("message"); m && m->is_string())
        message = std::string{m->as_string()};
    }
    throw response_error{
      fmt::format("LSP error: {}", json::serialize(*err)), code,
      std::move(message), *err};
  }

  if (auto* result = response.if_contains("result"))
    co_return std::move(*result);
  co_return nullptr;
}

asio::awaitable<void> client::notify(
    std::string_view method, json::value params) {
  LOG_DEBUG("notify {}", method);
  co_await send(make_notification(method, std::move(params)));
}

/// Document sync

asio::awaitable<void> client::ensure_synced(const fs::path& path) {
  std::string uri{file_uri(path)};
  std::string content{slurp(path)};

  auto action = documents_.record(path.string(), content);
  if (!action) {
    LOG_TRACE("{} unchanged since last sync", path);
    co_return;
  }

  if (action->what == sync_action::kind::open) {
    json::object item{};
    item["uri"] = uri;
    item["languageId"] = detect_language_id(path);
    item["version"] = action->version;
    item["text"] = std::move(content);

    json::object params{};
    params["textDocument"] = std::move(item);
    co_await notify("textDocument/didOpen", std::move(params));
  } else {
    json::object change{};
    change["text"] = std::move(content);

    json::array changes{};
    changes.emplace_back(std::move(change));

    json::object params{};
    params["textDocument"] = {{"uri", uri}, {"version", action->version}};
    params["contentChanges"] = std::move(changes);
    co_await notify("textDocument/didChange", std::move(params));
  }
}

/// Typed requests

asio::awaitable<json::value> client::hover(
    const fs::path& file, uint32_t line, uint32_t character) {
  co_return co_await request(
      "textDocument/hover", text_document_position(file, line, character));
}

asio::awaitable<json::value> client::goto_definition(
    const fs::path& file, uint32_t line, uint32_t character) {
  co_return co_await request(
      "textDocument/definition",
      text_document_position(file, line, character));
}

asio::awaitable<json::value> client::find_references(
    const fs::path& file, uint32_t line, uint32_t character) {
  json::object params{text_document_position(file, line, character)};
  params["context"] = {{"includeDeclaration", true}};
  co_return co_await request("textDocument/references", std::move(params));
}

asio::awaitable<json::value> client::document_diagnostics(const fs::path& file) {
  json::object params{};
  params["textDocument"] = {{"uri", file_uri(file)}};
  co_return co_await request("textDocument/diagnostic", std::move(params));
}

/// Lifecycle

asio::awaitable<void> client::shutdown() {
  if (shutdown_started_) {
    LOG_DEBUG("shutdown already requested");
    co_return;
  }
  shutdown_started_ = true;

  for (auto s : {session_state::ready, session_state::handshaking}) {
    auto expected{s};
    if (status_->state.compare_exchange_strong(
            expected, session_state::shutting_down))
      break;
  }

  try {
    co_await request("shutdown");
  } catch (const std::exception& e) {
    LOG_WARN("LSP shutdown request failed: {}", e.what());
  }

  try {
    co_await notify("exit");
  } catch (const std::exception& e) {
    LOG_WARN("LSP exit notification failed: {}", e.what());
  }

  sys::error_code ec;
  stdin_.close(ec);

  co_await wait_or_kill();
  status_->state = session_state::terminated;
}

asio::awaitable<void> client::wait_or_kill() {
  using namespace asio::experimental::awaitable_operators;

  sys::error_code ec;
  if (!process_.running(ec)) {
    if (ec)
      LOG_WARN("Error waiting for LSP child: {}", ec.message());
    else
      LOG_INFO("LSP child exited with {}", process_.exit_code());
    co_return;
  }

  asio::steady_timer grace{ex_};
  grace.expires_after(options_.shutdown_grace);
  try {
    auto winner = co_await (
        process_.async_wait(asio::use_awaitable) ||
        grace.async_wait(asio::use_awaitable));
    if (winner.index() == 0) {
      LOG_INFO("LSP child exited with {}", std::get<0>(winner));
      co_return;
    }
    LOG_WARN(
        "LSP child did not exit in {}s, killing",
        std::chrono::duration<double>(options_.shutdown_grace).count());
  } catch (const std::exception& e) {
    LOG_WARN("Error waiting for LSP child: {}", e.what());
  }
  kill_now();
}

void client::kill_now() {
  sys::error_code ec;
  if (!process_.running(ec)) return;
  process_.terminate(ec);
  if (ec) LOG_ERROR("Failed to kill LSP child: {}", ec.message());
}

}  // namespace lspbridge
