///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <coroutine>

#include <tether/detail/task_base.hpp>
#include <tether/scope_task.hpp>

namespace tether {

namespace detail {
struct yield_awaiter {
  bool await_ready() const noexcept { return false; }

  template <scope_promise Promise>
  void await_suspend(std::coroutine_handle<Promise> h) const noexcept {
    park_current(h).wake();
  }

  void await_resume() const noexcept {}
};
}  // namespace detail

/// Suspend the current sub-computation and make it immediately runnable
/// again, letting the rest of the scope make progress first.
///
/// The sub-computation resumes on the next call to advance().
inline detail::yield_awaiter yield_now() noexcept {
  return {};
}

}  // namespace tether
