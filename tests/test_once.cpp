#include "cachify/once.hpp"
#include "support/flaky_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace cachify;
using namespace std::chrono_literals;
using cachify::testing::FlakyStore;

namespace {

struct Fixture {
  std::shared_ptr<FlakyStore> store = std::make_shared<FlakyStore>();
  std::shared_ptr<StatsListener> stats = std::make_shared<StatsListener>();
  Context ctx;

  explicit Fixture(Config cfg = {}) : ctx(std::move(cfg)) {
    ctx.init(store);
    ctx.add_listener(stats);
  }
};

} // namespace

TEST_CASE("A concurrent call with the same key gets the fallback",
          "[once]") {
  Fixture f;
  std::promise<void> entered;
  std::promise<void> proceed;
  auto proceed_signal = proceed.get_future().share();

  auto update = once(
      f.ctx, "lock-{id}", {"id"},
      [&](int id) -> std::string {
        entered.set_value();
        proceed_signal.wait();
        return "updated-" + std::to_string(id);
      },
      return_on_contended(std::string("X")), OnceOptions{10s, std::nullopt});

  auto first = std::async(std::launch::async, [&] { return update(7); });
  entered.get_future().wait();

  CHECK(update.is_locked(7));
  CHECK(update(7) == "X");
  CHECK_FALSE(update.is_locked(8));

  proceed.set_value();
  CHECK(first.get() == "updated-7");
  CHECK_FALSE(update.is_locked(7));
  CHECK(f.stats->locks_acquired() == 1);
  CHECK(f.stats->locks_contended() == 1);
  CHECK(f.stats->locks_released() == 1);
}

TEST_CASE("Different keys do not contend", "[once]") {
  Fixture f;
  std::promise<void> entered;
  std::promise<void> proceed;
  auto proceed_signal = proceed.get_future().share();
  bool first_call = true;

  auto work = once(
      f.ctx, "job-{id}", {"id"},
      [&](int id) {
        if (id == 1 && first_call) {
          first_call = false;
          entered.set_value();
          proceed_signal.wait();
        }
        return id;
      },
      raise_on_contended());

  auto holder = std::async(std::launch::async, [&] { return work(1); });
  entered.get_future().wait();
  CHECK(work(2) == 2);
  CHECK_THROWS_AS(work(1), LockContentionError);
  proceed.set_value();
  CHECK(holder.get() == 1);
  CHECK(work(1) == 1);
}

TEST_CASE("The lock is released when the function throws", "[once]") {
  Fixture f;
  int calls = 0;
  auto fn = once(
      f.ctx, "t-{a}", {"a"},
      [&calls](int a) -> int {
        ++calls;
        if (calls == 1)
          throw std::runtime_error("failed midway");
        return a;
      },
      return_on_contended(-1));

  CHECK_THROWS_WITH(fn(1), "failed midway");
  CHECK_FALSE(fn.is_locked(1));
  CHECK(fn(1) == 1);
  CHECK(f.store->size() == 0);
}

TEST_CASE("raise_on_contended throws LockContentionError with the key",
          "[once]") {
  Fixture f;
  auto fn = once(f.ctx, "r-{a}", {"a"}, [](int a) { return a; },
                 raise_on_contended());
  REQUIRE(f.store->try_acquire("cachify:r-1", 10s).has_value());
  try {
    fn(1);
    FAIL("expected LockContentionError");
  } catch (const LockContentionError &e) {
    CHECK(e.key() == "cachify:r-1");
  }
  CHECK(fn(2) == 2);
}

TEST_CASE("A lock left behind by a crashed holder expires with its ttl",
          "[once]") {
  Fixture f;
  auto fn = once(f.ctx, "e-{a}", {"a"}, [](int a) { return a * 10; },
                 return_on_contended(0));
  REQUIRE(f.store->try_acquire("cachify:e-1", 50ms).has_value());
  CHECK(fn(1) == 0);
  std::this_thread::sleep_for(80ms);
  CHECK(fn(1) == 10);
}

TEST_CASE("Void functions run once or skip silently", "[once]") {
  Fixture f;
  int runs = 0;
  auto fn = once(f.ctx, "v-{a}", {"a"}, [&runs](int) { ++runs; },
                 return_on_contended());
  fn(1);
  CHECK(runs == 1);

  REQUIRE(f.store->try_acquire("cachify:v-1", 10s).has_value());
  fn(1);
  CHECK(runs == 1);

  auto strict = once(f.ctx, "v-{a}", {"a"}, [&runs](int) { ++runs; },
                     raise_on_contended());
  CHECK_THROWS_AS(strict(1), LockContentionError);
}

TEST_CASE("Store failures propagate by default", "[once][store-error]") {
  Fixture f;
  int runs = 0;
  auto fn = once(f.ctx, "s-{a}", {"a"},
                 [&runs](int a) {
                   ++runs;
                   return a;
                 },
                 return_on_contended(-1));
  f.store->fail_locks = true;
  CHECK_THROWS_AS(fn(1), StoreUnavailableError);
  CHECK(runs == 0);
  CHECK(f.stats->store_errors() == 1);
}

TEST_CASE("The contended policy turns store failures into contention",
          "[once][store-error]") {
  Config cfg;
  cfg.lock_on_store_error = LockStoreErrorPolicy::contended;
  Fixture f(cfg);
  int runs = 0;
  auto fallback = once(f.ctx, "c-{a}", {"a"},
                       [&runs](int a) {
                         ++runs;
                         return a;
                       },
                       return_on_contended(-1));
  auto strict = once(f.ctx, "c-{a}", {"a"},
                     [&runs](int a) {
                       ++runs;
                       return a;
                     },
                     raise_on_contended());

  f.store->fail_locks = true;
  CHECK(fallback(1) == -1);
  CHECK_THROWS_AS(strict(1), LockContentionError);
  CHECK(runs == 0);
  CHECK(f.stats->locks_contended() == 2);
}

TEST_CASE("A failed release is reported, not thrown", "[once][store-error]") {
  Fixture f;
  auto fn = once(
      f.ctx, "f-{a}", {"a"},
      [&f](int a) {
        f.store->fail_locks = true;
        return a;
      },
      return_on_contended(-1));
  CHECK(fn(4) == 4);
  CHECK(f.stats->store_errors() == 1);
  CHECK(f.stats->locks_released() == 0);
  f.store->fail_locks = false;
  // Still held until the ttl runs out.
  CHECK(fn.is_locked(4));
}

TEST_CASE("Lock keys use the context prefix and ttl", "[once]") {
  Config cfg;
  cfg.key_prefix = "svc:";
  cfg.default_lock_ttl = 2s;
  Fixture f(cfg);
  Duration seen{0};
  auto fn = once(
      f.ctx, "k-{name}", {"name"},
      [&f, &seen](std::string name) {
        seen = f.store->ttl("svc:k-" + name).value_or(Duration(0));
        return name;
      },
      raise_on_contended());
  CHECK(fn.key("a") == "svc:k-a");
  CHECK(fn("a") == "a");
  CHECK(seen > Duration(0));
  CHECK(seen <= Duration(2s));
}

TEST_CASE("Invalid decorations are rejected", "[once]") {
  Fixture f;
  auto fn = [](int a) { return a; };
  CHECK_THROWS_AS(once(f.ctx, "k-{b}", {"a"}, fn, raise_on_contended()),
                  KeyResolutionError);
  CHECK_THROWS_AS(once(f.ctx, "k-{a}", {"a", "b"}, fn, raise_on_contended()),
                  KeyResolutionError);
  CHECK_THROWS_AS(once(f.ctx, "k-{a}", {"a"}, fn, raise_on_contended(),
                       OnceOptions{0s, std::nullopt}),
                  std::invalid_argument);
}

TEST_CASE("Calling before init throws NotInitializedError", "[once]") {
  Context ctx;
  auto fn = once(ctx, "n-{a}", {"a"}, [](int a) { return a; },
                 return_on_contended(0));
  CHECK_THROWS_AS(fn(1), NotInitializedError);
}
