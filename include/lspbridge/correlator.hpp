// SPDX-License-Identifier: MIT
#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace lspbridge {

/** @brief Matches responses to the requests that caused them.
 *
 * Each registered request gets an id (1, 2, 3... never reused) and a
 * one-shot slot.  The slot is fulfilled by @c resolve, failed by
 * @c drain_all, or dropped by @c abandon, and is removed from the map by
 * whichever happens first.
 *
 * The map and the id counter may be used from any thread.  Waiting, and the
 * resolve/drain calls that wake waiters, must happen on the single thread
 * running the executor passed at construction.
 */
class correlator {
  struct slot {
    enum class status : uint8_t { pending, resolved, lost };

    explicit slot(const boost::asio::any_io_executor& ex)
        : timer{ex, boost::asio::steady_timer::time_point::max()} {}

    boost::asio::steady_timer timer;
    status state{status::pending};
    boost::json::object response{};
  };

 public:
  /// Handle the requesting coroutine awaits.
  class waiter {
   public:
    int64_t id() const { return id_; }

    /** @brief Suspend until the response arrives.
     *
     * Returns the whole response object.  Throws @c connection_lost if the
     * slot was drained, @c timeout_error if @p timeout elapsed first.
     */
    boost::asio::awaitable<boost::json::object> wait(
        std::chrono::milliseconds timeout);

   private:
    friend class correlator;
    waiter(int64_t id, std::shared_ptr<slot> s)
        : id_{id}, slot_{std::move(s)} {}

    int64_t id_;
    std::shared_ptr<slot> slot_;
  };

  explicit correlator(boost::asio::any_io_executor ex);

  correlator(const correlator&) = delete;
  correlator& operator=(const correlator&) = delete;

  /// Allocate the next id and insert a fresh slot for it.
  std::pair<int64_t, waiter> register_request();

  /// Fulfil and remove the slot for @p id.  Returns false (and logs) if no
  /// such entry exists, e.g. the caller already timed out.
  bool resolve(int64_t id, boost::json::object response);

  /// Remove the entry for @p id without fulfilling it.
  bool abandon(int64_t id);

  /// Fail every outstanding waiter with @c connection_lost.  Returns how many
  /// entries were removed.
  std::size_t drain_all();

  std::size_t size() const;

 private:
  boost::asio::any_io_executor ex_;
  std::atomic<int64_t> next_id_{1};
  mutable std::mutex mutex_;
  std::unordered_map<int64_t, std::shared_ptr<slot>> pending_;
};

}  // namespace lspbridge
