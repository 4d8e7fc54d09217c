// SPDX-License-Identifier: MIT
#include "lspbridge/correlator.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include "logger.hpp"
#include "lspbridge/errors.hpp"
#include "utils.hpp"

namespace lspbridge {

namespace asio = boost::asio;
namespace json = boost::json;
namespace sys = boost::system;

asio::awaitable<json::object> correlator::waiter::wait(
    std::chrono::milliseconds timeout) {
  slot& s{*slot_};

  // The slot may have been settled before we got here.
  if (s.state == slot::status::pending) {
    s.timer.expires_after(timeout);
    sys::error_code ec;
    co_await s.timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
  }

  switch (s.state) {
    case slot::status::resolved:
      co_return std::move(s.response);
    case slot::status::lost:
      throw connection_lost{
        "LSP response channel closed (server may have crashed)"};
    case slot::status::pending:
      break;
  }
  utils::throwf<timeout_error>(
      "LSP request {} timed out after {}s", id_,
      std::chrono::duration<double>(timeout).count());
}

correlator::correlator(asio::any_io_executor ex) : ex_{std::move(ex)} {}

std::pair<int64_t, correlator::waiter> correlator::register_request() {
  int64_t id{next_id_.fetch_add(1, std::memory_order_relaxed)};
  auto s = std::make_shared<slot>(ex_);
  {
    std::lock_guard lock{mutex_};
    pending_.emplace(id, s);
  }
  return {id, waiter{id, std::move(s)}};
}

bool correlator::resolve(int64_t id, json::object response) {
  std::shared_ptr<slot> s;
  {
    std::lock_guard lock{mutex_};
    auto it = pending_.find(id);
    if (it == pending_.end()) {
      LOG_WARN("received response for unknown request id {}", id);
      return false;
    }
    s = std::move(it->second);
    pending_.erase(it);
  }
  s->response = std::move(response);
  s->state = slot::status::resolved;
  s->timer.cancel();
  return true;
}

bool correlator::abandon(int64_t id) {
  std::lock_guard lock{mutex_};
  return pending_.erase(id) > 0;
}

std::size_t correlator::drain_all() {
  std::unordered_map<int64_t, std::shared_ptr<slot>> drained;
  {
    std::lock_guard lock{mutex_};
    drained.swap(pending_);
  }
  for (auto& [id, s] : drained) {
    s->state = slot::status::lost;
    s->timer.cancel();
  }
  return drained.size();
}

std::size_t correlator::size() const {
  std::lock_guard lock{mutex_};
  return pending_.size();
}

}  // namespace lspbridge
