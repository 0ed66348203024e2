///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#include <tether/scope_driver.hpp>

#include <tether/job_handle.hpp>
#include <tether/manual_event.hpp>
#include <tether/scope.hpp>
#include <tether/scope_task.hpp>
#include <tether/usage_error.hpp>
#include <tether/waker.hpp>
#include <tether/yield.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <doctest/doctest.h>

namespace {

template <typename Driver>
typename Driver::result_type drive(Driver& driver, int max_advances = 100) {
  for (int i = 0; i < max_advances; ++i) {
    auto poll = driver.advance();
    if (poll.is_ready()) {
      return std::move(poll).result();
    }
  }
  throw std::runtime_error("scope did not complete");
}

struct live_counter {
  explicit live_counter(int& count) noexcept : count_(&count) { ++*count_; }

  live_counter(live_counter&& other) noexcept
    : count_(std::exchange(other.count_, nullptr)) {}

  ~live_counter() {
    if (count_ != nullptr) {
      --*count_;
    }
  }

private:
  int* count_;
};

struct counting_waker {
  void wake() noexcept { ++count; }
  int count = 0;
};

}  // namespace

TEST_CASE("scope_driver body with no jobs") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>&) -> tether::scope_task<int> { co_return 42; });

  CHECK(!driver.is_complete());
  auto poll = driver.advance();
  REQUIRE(poll.is_ready());
  CHECK(!poll.result().is_cancelled());
  CHECK(poll.result().value() == 42);
  CHECK(driver.is_complete());
  CHECK(driver.stats() == tether::job_stats{});
}

TEST_CASE("scope_driver void body") {
  bool ran = false;
  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>&) -> tether::scope_task<void> {
        ran = true;
        co_return;
      });

  auto result = drive(driver);
  CHECK(ran);
  CHECK(!result.is_cancelled());
  CHECK_NOTHROW(result.value());
}

TEST_CASE("scope_driver does not invoke the factory until the first advance") {
  bool invoked = false;
  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>&) -> tether::scope_task<int> {
        invoked = true;
        co_return 1;
      });

  CHECK(!invoked);
  auto result = drive(driver);
  CHECK(invoked);
  CHECK(result.value() == 1);
}

TEST_CASE("scope_driver nested spawns") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>& s) -> tether::scope_task<int> {
        CHECK(s.stats().spawned == 0);
        int v = 22;
        auto outer = s.spawn([&s, v]() -> tether::scope_task<int> {
          auto inner =
              s.spawn([v]() -> tether::scope_task<int> { co_return 2 * v; });
          co_return 2 * co_await inner;
        });
        CHECK(s.stats().outstanding == 1);
        co_return co_await outer;
      });

  auto result = drive(driver);
  CHECK(result.value() == 88);

  auto stats = driver.stats();
  CHECK(stats.spawned == 2);
  CHECK(stats.completed == 2);
  CHECK(stats.discarded == 0);
  CHECK(stats.outstanding == 0);
}

TEST_CASE("scope_driver nested scope awaited from a job") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>& s) -> tether::scope_task<int> {
        tether::manual_event ev;
        auto nested = s.spawn([&ev]() -> tether::scope_task<int> {
          auto inner = tether::create_scope<std::string>(
              [&ev](tether::scope<std::string>& is) -> tether::scope_task<int> {
                auto h = is.spawn([&ev]() -> tether::scope_task<int> {
                  co_await ev;
                  co_return 21;
                });
                co_return co_await h;
              });
          auto result = co_await inner;
          CHECK(inner.is_complete());
          co_return 2 * result.value();
        });
        s.spawn([&ev]() -> tether::scope_task<void> {
          co_await tether::yield_now();
          co_await tether::yield_now();
          ev.set();
        });
        co_return co_await nested;
      });

  auto result = drive(driver);
  CHECK(result.value() == 42);
  CHECK(driver.stats().completed == 2);
}

TEST_CASE("scope_driver nested scope sleeps until woken") {
  tether::manual_event ev;
  counting_waker w;

  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>&) -> tether::scope_task<int> {
        auto inner = tether::create_scope<int>(
            [&](tether::scope<int>&) -> tether::scope_task<int> {
              co_await ev;
              co_return 5;
            });
        co_return (co_await inner).value();
      });

  CHECK(driver.advance(tether::waker::bind<&counting_waker::wake>(w))
            .is_pending());
  CHECK(w.count == 0);

  ev.set();
  CHECK(w.count == 1);

  auto done = driver.advance();
  REQUIRE(done.is_ready());
  CHECK(done.result().value() == 5);
}

TEST_CASE("scope_driver nested scope fault is rethrown at the await") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>&) -> tether::scope_task<std::string> {
        auto inner = tether::create_scope<int>(
            [](tether::scope<int>& is) -> tether::scope_task<void> {
              is.spawn([]() -> tether::scope_task<void> {
                co_await tether::yield_now();
                throw std::domain_error("inner failure");
              });
              co_return;
            });
        try {
          co_await inner;
        } catch (const std::domain_error& e) {
          co_return e.what();
        }
        co_return "no error";
      });

  auto result = drive(driver);
  CHECK(result.value() == "inner failure");
}

TEST_CASE("scope_driver nested scope cancellation is a result") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>&) -> tether::scope_task<int> {
        auto inner = tether::create_scope<std::string>(
            [](tether::scope<std::string>& is) -> tether::scope_task<int> {
              co_await is.cancel("stop");
              co_return 0;
            });
        auto result = co_await inner;
        co_return result.is_cancelled() ? 1 : 0;
      });

  CHECK(drive(driver).value() == 1);
}

TEST_CASE("scope_driver dropping the outer scope destroys a nested scope") {
  int live = 0;
  tether::manual_event never;
  {
    auto driver = tether::create_scope<int>(
        [&](tether::scope<int>& s) -> tether::scope_task<void> {
          s.spawn([&]() -> tether::scope_task<void> {
            auto inner = tether::create_scope<int>(
                [&](tether::scope<int>& is) -> tether::scope_task<void> {
                  live_counter local{live};
                  is.spawn([&]() -> tether::scope_task<void> {
                    live_counter job_local{live};
                    co_await never;
                  });
                  co_await never;
                });
            co_await inner;
          });
          co_return;
        });

    CHECK(driver.advance().is_pending());
    CHECK(driver.advance().is_pending());
    CHECK(live == 2);
  }
  CHECK(live == 0);
}

TEST_CASE("scope_driver dropped driver stops yielding jobs") {
  int counter = 0;
  int seen = 0;
  {
    auto driver = tether::create_scope<int>(
        [&](tether::scope<int>& s) -> tether::scope_task<void> {
          for (int i = 0; i < 2; ++i) {
            s.spawn([&]() -> tether::scope_task<void> {
              for (;;) {
                ++counter;
                co_await tether::yield_now();
              }
            });
          }
          for (;;) {
            ++counter;
            co_await tether::yield_now();
          }
        });

    CHECK(driver.advance().is_pending());
    CHECK(driver.advance().is_pending());
    seen = counter;
    CHECK(seen == 6);
  }
  CHECK(counter == seen);
}

TEST_CASE("scope_driver waits for jobs after the body finishes") {
  tether::manual_event ev;
  bool job_finished = false;

  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>& s) -> tether::scope_task<int> {
        s.spawn([&]() -> tether::scope_task<void> {
          co_await ev;
          job_finished = true;
        });
        co_return 7;
      });

  CHECK(driver.advance().is_pending());
  CHECK(driver.advance().is_pending());
  CHECK(driver.stats().outstanding == 1);

  ev.set();
  auto poll = driver.advance();
  REQUIRE(poll.is_ready());
  CHECK(job_finished);
  CHECK(poll.result().value() == 7);
}

TEST_CASE("scope_driver dropped handle still runs to completion") {
  bool ran = false;
  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>& s) -> tether::scope_task<void> {
        {
          auto handle = s.spawn([&]() -> tether::scope_task<void> {
            co_await tether::yield_now();
            ran = true;
          });
        }
        co_return;
      });

  drive(driver);
  CHECK(ran);
  CHECK(driver.stats().completed == 1);
}

TEST_CASE("scope_driver job status transitions") {
  tether::manual_event ev;
  tether::job_handle<int> handle;

  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>& s) -> tether::scope_task<void> {
        handle = s.spawn([&]() -> tether::scope_task<int> {
          co_await ev;
          co_return 5;
        });
        CHECK(handle.status() == tether::job_status::spawned);
        CHECK(handle.id().valid());
        co_return;
      });

  CHECK(driver.advance().is_pending());
  CHECK(handle.status() == tether::job_status::running);

  ev.set();
  CHECK(driver.advance().is_ready());
  CHECK(handle.status() == tether::job_status::done);
}

TEST_CASE("scope_driver containment when the driver is dropped") {
  int live = 0;
  tether::manual_event never;
  std::vector<tether::job_handle<void>> handles;

  {
    auto driver = tether::create_scope<int>(
        [&](tether::scope<int>& s) -> tether::scope_task<void> {
          for (int i = 0; i < 3; ++i) {
            handles.push_back(s.spawn(
                [&, counter = live_counter{live}]() -> tether::scope_task<void> {
                  live_counter local{live};
                  co_await never;
                }));
          }
          co_await never;
        });

    CHECK(driver.advance().is_pending());
    CHECK(driver.advance().is_pending());
    CHECK(live == 6);

    auto stats = driver.stats();
    CHECK(stats.spawned == 3);
    CHECK(stats.outstanding == 3);
  }

  CHECK(live == 0);
  REQUIRE(handles.size() == 3);
  for (auto& h : handles) {
    CHECK(h.status() == tether::job_status::discarded);
  }
}

TEST_CASE("scope_driver discards jobs that never started when dropped") {
  tether::job_handle<int> handle;
  bool inner_ran = false;
  {
    auto driver = tether::create_scope<int>(
        [&](tether::scope<int>& s) -> tether::scope_task<void> {
          s.spawn([&]() -> tether::scope_task<void> {
            // Spawned during the job phase, so it first runs on the next
            // advance.
            handle = s.spawn([&]() -> tether::scope_task<int> {
              inner_ran = true;
              co_return 1;
            });
            co_return;
          });
          co_return;
        });

    CHECK(driver.advance().is_pending());
    REQUIRE(handle.valid());
    CHECK(handle.status() == tether::job_status::spawned);
    CHECK(driver.stats().outstanding == 1);
  }
  CHECK(!inner_ran);
  CHECK(handle.status() == tether::job_status::discarded);
}

TEST_CASE("scope_driver cancellation halts progress") {
  std::vector<int> processed;

  auto driver = tether::create_scope<std::string>(
      [&](tether::scope<std::string>& s) -> tether::scope_task<int> {
        for (int v : {1, 2, -3, 4}) {
          s.spawn([&processed, &s, v]() -> tether::scope_task<void> {
            co_await tether::yield_now();
            if (v < 0) {
              co_await s.cancel("negative value");
            }
            processed.push_back(v);
          });
        }
        co_return 0;
      });

  auto result = drive(driver);
  REQUIRE(result.is_cancelled());
  CHECK(result.cancellation() == "negative value");
  CHECK(processed == std::vector<int>{1, 2});
  CHECK_THROWS_AS(result.value(), tether::usage_error);

  auto stats = driver.stats();
  CHECK(stats.spawned == 4);
  CHECK(stats.completed == 2);
  CHECK(stats.discarded == 2);
  CHECK(stats.outstanding == 0);
}

TEST_CASE("scope_driver first cancellation payload wins") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>& s) -> tether::scope_task<int> {
        CHECK(!s.cancel_requested());
        s.cancel(1);
        CHECK(s.cancel_requested());
        s.cancel(2);
        co_await s.cancel(3);
        co_return 0;
      });

  auto result = drive(driver);
  REQUIRE(result.is_cancelled());
  CHECK(result.cancellation() == 1);
  CHECK(driver.cancel_requested());
}

TEST_CASE("scope_driver cancellation wins over a finished body") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>& s) -> tether::scope_task<int> {
        s.cancel(9);
        co_return 4;
      });

  auto result = drive(driver);
  REQUIRE(result.is_cancelled());
  CHECK(result.cancellation() == 9);
}

TEST_CASE("scope_driver spawn after cancellation is discarded") {
  bool ran = false;
  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>& s) -> tether::scope_task<void> {
        s.cancel(7);
        auto h = s.spawn([&]() -> tether::scope_task<void> {
          ran = true;
          co_return;
        });
        CHECK(h.status() == tether::job_status::discarded);
        CHECK(!h.id().valid());
        co_return;
      });

  auto result = drive(driver);
  CHECK(!ran);
  REQUIRE(result.is_cancelled());
  CHECK(result.cancellation() == 7);
  CHECK(driver.stats().spawned == 1);
  CHECK(driver.stats().discarded == 1);
}

TEST_CASE("scope_driver advance after completion is a usage error") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>& s) -> tether::scope_task<int> {
        s.spawn([]() -> tether::scope_task<void> { co_return; });
        co_return 3;
      });

  auto result = drive(driver);
  CHECK(result.value() == 3);

  auto stats = driver.stats();
  CHECK_THROWS_AS(driver.advance(), tether::usage_error);
  CHECK_THROWS_AS(driver.advance(), tether::usage_error);
  CHECK(driver.stats() == stats);
  CHECK(driver.is_complete());
}

TEST_CASE("scope_driver cancel after completion is a usage error") {
  tether::scope<int>* captured = nullptr;
  counting_waker w;

  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>& s) -> tether::scope_task<int> {
        captured = &s;
        co_return 3;
      });

  auto poll = driver.advance(tether::waker::bind<&counting_waker::wake>(w));
  REQUIRE(poll.is_ready());
  CHECK(poll.result().value() == 3);
  REQUIRE(captured != nullptr);

  CHECK_THROWS_AS(captured->cancel(7), tether::usage_error);
  CHECK(!driver.cancel_requested());
  CHECK(!captured->cancel_requested());
  CHECK(w.count == 0);
}

TEST_CASE("scope_driver re-entrant advance is a usage error") {
  tether::scope_driver<void, int>* self = nullptr;
  bool checked = false;

  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>& s) -> tether::scope_task<void> {
        s.spawn([&]() -> tether::scope_task<void> {
          CHECK_THROWS_AS(self->advance(), tether::usage_error);
          checked = true;
          co_return;
        });
        co_return;
      });
  self = &driver;

  drive(driver);
  CHECK(checked);
}

TEST_CASE("scope_driver job exception propagates out of advance") {
  int live = 0;
  tether::manual_event never;

  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>& s) -> tether::scope_task<int> {
        s.spawn([&]() -> tether::scope_task<void> {
          live_counter local{live};
          co_await never;
        });
        s.spawn([]() -> tether::scope_task<void> {
          co_await tether::yield_now();
          throw std::runtime_error("job failed");
        });
        co_await never;
        co_return 0;
      });

  CHECK(driver.advance().is_pending());
  CHECK(live == 1);
  CHECK_THROWS_AS(driver.advance(), std::runtime_error);
  CHECK(live == 0);
  CHECK(driver.is_complete());
  CHECK(driver.stats().outstanding == 0);
  CHECK_THROWS_AS(driver.advance(), tether::usage_error);
}

TEST_CASE("scope_driver body exception propagates out of advance") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>&) -> tether::scope_task<int> {
        throw std::logic_error("body failed");
        co_return 0;
      });

  CHECK_THROWS_AS(driver.advance(), std::logic_error);
  CHECK(driver.is_complete());
}

TEST_CASE("scope_driver awaiting a job handle twice is a usage error") {
  auto driver = tether::create_scope<int>(
      [](tether::scope<int>& s) -> tether::scope_task<int> {
        auto h = s.spawn([]() -> tether::scope_task<int> { co_return 1; });
        int first = co_await h;
        int second = co_await h;
        co_return first + second;
      });

  CHECK_THROWS_AS(drive(driver), tether::usage_error);
}

TEST_CASE("scope_driver result is independent of wake order") {
  auto run_with = [](bool a_first) {
    tether::manual_event a;
    tether::manual_event b;
    std::vector<char> order;

    auto driver = tether::create_scope<int>(
        [&](tether::scope<int>& s) -> tether::scope_task<int> {
          auto ha = s.spawn([&]() -> tether::scope_task<int> {
            co_await a;
            order.push_back('a');
            co_return 10;
          });
          auto hb = s.spawn([&]() -> tether::scope_task<int> {
            co_await b;
            order.push_back('b');
            co_return 32;
          });
          int x = co_await hb;
          int y = co_await ha;
          co_return x + y;
        });

    CHECK(driver.advance().is_pending());
    if (a_first) {
      a.set();
      CHECK(driver.advance().is_pending());
      b.set();
    } else {
      b.set();
      CHECK(driver.advance().is_pending());
      a.set();
    }
    auto result = drive(driver);
    CHECK(order == (a_first ? std::vector<char>{'a', 'b'}
                            : std::vector<char>{'b', 'a'}));
    return result.value();
  };

  CHECK(run_with(true) == 42);
  CHECK(run_with(false) == 42);
}

TEST_CASE("scope_driver notifies the waker when woken from outside") {
  tether::manual_event ev;
  counting_waker w;

  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>&) -> tether::scope_task<int> {
        co_await ev;
        co_return 1;
      });

  auto poll = driver.advance(tether::waker::bind<&counting_waker::wake>(w));
  CHECK(poll.is_pending());
  CHECK(w.count == 0);

  ev.set();
  CHECK(w.count == 1);

  // Setting again does not wake an already-ready body a second time.
  ev.set();
  CHECK(w.count == 1);

  auto done = driver.advance();
  REQUIRE(done.is_ready());
  CHECK(done.result().value() == 1);
  CHECK(w.count == 1);
}

TEST_CASE("scope_driver notifies the waker when work remains after advance") {
  counting_waker w;
  int steps = 0;

  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>&) -> tether::scope_task<int> {
        ++steps;
        co_await tether::yield_now();
        ++steps;
        co_return steps;
      });

  auto poll = driver.advance(tether::waker::bind<&counting_waker::wake>(w));
  CHECK(poll.is_pending());
  CHECK(steps == 1);
  CHECK(w.count == 1);

  auto done = driver.advance();
  REQUIRE(done.is_ready());
  CHECK(done.result().value() == 2);
  CHECK(w.count == 1);
}

TEST_CASE("scope_driver runs each ready job once per advance") {
  std::vector<int> trace;

  auto driver = tether::create_scope<int>(
      [&](tether::scope<int>& s) -> tether::scope_task<void> {
        for (int id = 0; id < 3; ++id) {
          s.spawn([&trace, id]() -> tether::scope_task<void> {
            trace.push_back(id);
            co_await tether::yield_now();
            trace.push_back(id + 10);
          });
        }
        co_return;
      });

  CHECK(driver.advance().is_pending());
  CHECK(trace == std::vector<int>{0, 1, 2});

  CHECK(driver.advance().is_ready());
  CHECK(trace == std::vector<int>{0, 1, 2, 10, 11, 12});
}
