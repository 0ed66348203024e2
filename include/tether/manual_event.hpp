///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <coroutine>

#include <tether/detail/intrusive_list.hpp>
#include <tether/detail/task_base.hpp>
#include <tether/scope_task.hpp>

namespace tether {

/// A manually-reset event that scope_tasks can await.
///
/// Awaiting the event while it is set completes immediately. Otherwise the
/// awaiting sub-computation is parked until set() is called, at which point
/// every waiter is woken and will resume the next time its scope is
/// advanced.
///
/// The event is not thread-safe. It may be set from inside a scope or from
/// the code that drives the scope, in which case the scope's waker is
/// notified.
class manual_event {
  struct waiter {
    detail::task_base* task = nullptr;
    waiter* next = nullptr;
    waiter* prev = nullptr;
    bool linked = false;
  };

public:
  class awaiter : waiter {
  public:
    explicit awaiter(manual_event& event) noexcept : event_(event) {}

    awaiter(awaiter&&) = delete;
    awaiter& operator=(awaiter&&) = delete;

    ~awaiter() {
      if (linked) {
        event_.waiters_.remove(this);
      }
    }

    bool await_ready() const noexcept { return event_.is_set(); }

    template <detail::scope_promise Promise>
    void await_suspend(std::coroutine_handle<Promise> h) noexcept {
      task = &detail::park_current(h);
      linked = true;
      event_.waiters_.push_back(this);
    }

    void await_resume() const noexcept {}

  private:
    friend manual_event;

    manual_event& event_;
  };

  explicit manual_event(bool initially_set = false) noexcept
    : set_(initially_set) {}

  manual_event(const manual_event&) = delete;
  manual_event& operator=(const manual_event&) = delete;

  /// \pre No sub-computation is waiting on the event.
  ~manual_event();

  bool is_set() const noexcept { return set_; }

  /// Set the event and wake every waiter.
  void set() noexcept;

  /// Clear the event. Has no effect on sub-computations already woken.
  void reset() noexcept { set_ = false; }

  awaiter operator co_await() noexcept { return awaiter{*this}; }

private:
  detail::intrusive_list<waiter, &waiter::next, &waiter::prev> waiters_;
  bool set_;
};

}  // namespace tether
