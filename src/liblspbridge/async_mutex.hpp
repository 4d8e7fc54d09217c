// SPDX-License-Identifier: MIT
#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <deque>
#include <memory>
#include <utility>

namespace lspbridge {

// Coroutine mutex for a single-threaded executor.  Waiters park on a timer
// that never expires; unlock() hands ownership to the oldest waiter by
// cancelling its timer.
class async_mutex {
 public:
  explicit async_mutex(boost::asio::any_io_executor ex) : ex_{std::move(ex)} {}

  async_mutex(const async_mutex&) = delete;
  async_mutex& operator=(const async_mutex&) = delete;

  boost::asio::awaitable<void> lock() {
    if (!locked_) {
      locked_ = true;
      co_return;
    }
    auto t = std::make_shared<boost::asio::steady_timer>(
        ex_, boost::asio::steady_timer::time_point::max());
    waiters_.push_back(t);
    boost::system::error_code ec;
    co_await t->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    // woken by unlock(), which left locked_ set on our behalf
  }

  void unlock() {
    if (waiters_.empty()) {
      locked_ = false;
      return;
    }
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->cancel();
  }

  // Scoped ownership, released on destruction.
  class guard {
   public:
    explicit guard(async_mutex& m) : m_{&m} {}
    guard(guard&& other) noexcept : m_{std::exchange(other.m_, nullptr)} {}
    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;
    guard& operator=(guard&&) = delete;
    ~guard() {
      if (m_) m_->unlock();
    }

   private:
    async_mutex* m_;
  };

  boost::asio::awaitable<guard> scoped_lock() {
    co_await lock();
    co_return guard{*this};
  }

 private:
  boost::asio::any_io_executor ex_;
  bool locked_{false};
  std::deque<std::shared_ptr<boost::asio::steady_timer>> waiters_;
};

}  // namespace lspbridge
