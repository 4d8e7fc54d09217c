// SPDX-License-Identifier: MIT
#include <doctest/doctest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "lspbridge/correlator.hpp"
#include "lspbridge/errors.hpp"
#include "test_helpers.hpp"

namespace asio = boost::asio;
namespace json = boost::json;

using namespace std::chrono_literals;
using lspbridge::test::run_sync;

namespace {

json::object response(int64_t id, std::string_view tag) {
  json::object res{};
  res["jsonrpc"] = "2.0";
  res["id"] = id;
  res["result"] = tag;
  return res;
}

}  // namespace

TEST_CASE("correlator-ids-start-at-one-and-increase") {
  asio::io_context ctx;
  lspbridge::correlator corr{ctx.get_executor()};

  auto a = corr.register_request();
  auto b = corr.register_request();
  auto c = corr.register_request();
  CHECK(a.first == 1);
  CHECK(b.first == 2);
  CHECK(c.first == 3);
  CHECK(c.second.id() == 3);
  CHECK(corr.size() == 3);

  // Abandoned ids are not reused
  CHECK(corr.abandon(3));
  CHECK_FALSE(corr.abandon(3));
  CHECK(corr.register_request().first == 4);
}

TEST_CASE("correlator-concurrent-registration") {
  asio::io_context ctx;
  lspbridge::correlator corr{ctx.get_executor()};

  constexpr int threads{8};
  constexpr int per_thread{200};
  std::vector<std::vector<int64_t>> ids(threads);
  {
    std::vector<std::jthread> workers;
    for (int t = 0; t < threads; ++t) {
      workers.emplace_back([&corr, &mine = ids[t]] {
        for (int i = 0; i < per_thread; ++i)
          mine.push_back(corr.register_request().first);
      });
    }
  }

  std::set<int64_t> all;
  for (const auto& v : ids) all.insert(v.begin(), v.end());
  CHECK(all.size() == threads * per_thread);
  CHECK(*all.begin() == 1);
  CHECK(*all.rbegin() == threads * per_thread);
  CHECK(corr.size() == threads * per_thread);
}

TEST_CASE("correlator-resolve-before-wait") {
  asio::io_context ctx;
  lspbridge::correlator corr{ctx.get_executor()};

  auto reg = corr.register_request();
  CHECK(corr.resolve(reg.first, response(reg.first, "early")));
  CHECK(corr.size() == 0);

  auto res = run_sync(ctx, reg.second.wait(1s));
  CHECK(res.at("result") == "early");
}

TEST_CASE("correlator-out-of-order-responses") {
  asio::io_context ctx;
  lspbridge::correlator corr{ctx.get_executor()};

  auto first = corr.register_request();
  auto second = corr.register_request();
  json::object got_first{};
  json::object got_second{};

  asio::co_spawn(
      ctx,
      [&]() -> asio::awaitable<void> {
        got_first = co_await first.second.wait(5s);
      },
      asio::detached);
  asio::co_spawn(
      ctx,
      [&]() -> asio::awaitable<void> {
        got_second = co_await second.second.wait(5s);
      },
      asio::detached);

  // Let both waiters park before answering, newest first
  ctx.poll();
  CHECK(corr.resolve(second.first, response(second.first, "two")));
  CHECK(corr.resolve(first.first, response(first.first, "one")));
  ctx.run();

  CHECK(got_first.at("result") == "one");
  CHECK(got_second.at("result") == "two");
  CHECK(corr.size() == 0);
}

TEST_CASE("correlator-timeout-then-late-response") {
  asio::io_context ctx;
  lspbridge::correlator corr{ctx.get_executor()};

  auto reg = corr.register_request();
  CHECK_THROWS_AS(
      run_sync(ctx, reg.second.wait(20ms)), lspbridge::timeout_error);

  // The caller abandons its entry; a late answer finds nothing
  CHECK(corr.abandon(reg.first));
  CHECK(corr.size() == 0);
  CHECK_FALSE(corr.resolve(reg.first, response(reg.first, "late")));
}

TEST_CASE("correlator-unknown-response") {
  asio::io_context ctx;
  lspbridge::correlator corr{ctx.get_executor()};
  CHECK_FALSE(corr.resolve(42, response(42, "stray")));
}

TEST_CASE("correlator-drain-fails-every-waiter") {
  asio::io_context ctx;
  lspbridge::correlator corr{ctx.get_executor()};

  auto a = corr.register_request();
  auto b = corr.register_request();
  int lost{0};
  for (auto* reg : {&a, &b}) {
    asio::co_spawn(
        ctx,
        [&lost, reg]() -> asio::awaitable<void> {
          try {
            co_await reg->second.wait(5s);
          } catch (const lspbridge::connection_lost&) {
            ++lost;
          }
        },
        asio::detached);
  }

  ctx.poll();
  CHECK(corr.drain_all() == 2);
  ctx.run();

  CHECK(lost == 2);
  CHECK(corr.size() == 0);
  CHECK(corr.drain_all() == 0);
}
