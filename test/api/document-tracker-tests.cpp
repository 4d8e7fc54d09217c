// SPDX-License-Identifier: MIT
#include <doctest/doctest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "lspbridge/document_tracker.hpp"

using lspbridge::document_tracker;
using lspbridge::sync_action;

TEST_CASE("tracker-open-change-noop") {
  document_tracker tracker;

  auto first = tracker.record("/tmp/a.rs", "fn main(){}");
  REQUIRE(first);
  CHECK(first->what == sync_action::kind::open);
  CHECK(first->version == 0);

  CHECK_FALSE(tracker.record("/tmp/a.rs", "fn main(){}"));

  auto changed = tracker.record("/tmp/a.rs", "fn main(){ }");
  REQUIRE(changed);
  CHECK(changed->what == sync_action::kind::change);
  CHECK(changed->version == 1);

  CHECK_FALSE(tracker.record("/tmp/a.rs", "fn main(){ }"));
  CHECK(tracker.version("/tmp/a.rs") == 1);

  // Going back to older content is still a change
  auto reverted = tracker.record("/tmp/a.rs", "fn main(){}");
  REQUIRE(reverted);
  CHECK(reverted->version == 2);
}

TEST_CASE("tracker-paths-are-independent") {
  document_tracker tracker;
  REQUIRE(tracker.record("/tmp/a.rs", "a"));
  REQUIRE(tracker.record("/tmp/a.rs", "a2"));

  auto b = tracker.record("/tmp/b.rs", "a");
  REQUIRE(b);
  CHECK(b->what == sync_action::kind::open);
  CHECK(b->version == 0);
  CHECK(tracker.version("/tmp/a.rs") == 1);
  CHECK(tracker.version("/tmp/b.rs") == 0);
  CHECK_FALSE(tracker.version("/tmp/c.rs"));
  CHECK(tracker.size() == 2);
}

TEST_CASE("tracker-single-open-under-contention") {
  document_tracker tracker;
  std::atomic<int> opens{0};
  std::atomic<int> others{0};
  {
    std::vector<std::jthread> workers;
    for (int t = 0; t < 8; ++t) {
      workers.emplace_back([&] {
        for (int i = 0; i < 100; ++i) {
          auto action = tracker.record("/tmp/shared.rs", "same text");
          if (action && action->what == sync_action::kind::open)
            ++opens;
          else if (action)
            ++others;
        }
      });
    }
  }
  CHECK(opens == 1);
  CHECK(others == 0);
  CHECK(tracker.version("/tmp/shared.rs") == 0);
}

TEST_CASE("tracker-fingerprint") {
  CHECK(
      document_tracker::fingerprint("fn main(){}") ==
      document_tracker::fingerprint("fn main(){}"));
  CHECK(
      document_tracker::fingerprint("fn main(){}") !=
      document_tracker::fingerprint("fn main(){ }"));
}
