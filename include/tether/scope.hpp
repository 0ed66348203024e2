///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <concepts>
#include <coroutine>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include <tether/cancellation_state.hpp>
#include <tether/concepts.hpp>
#include <tether/detail/job_result.hpp>
#include <tether/detail/scope_core.hpp>
#include <tether/job_handle.hpp>
#include <tether/scope_task.hpp>
#include <tether/usage_error.hpp>

namespace tether {

template <typename T, cancellation_payload C>
class scope_driver;

namespace detail {

template <typename T>
scope_task<void> run_job(scope_task<T> task, job_completion<T> completion) {
  completion.start();
  if constexpr (std::is_void_v<T>) {
    co_await std::move(task);
    completion.set_value();
  } else {
    completion.set_value(co_await std::move(task));
  }
}

// The callable lives in this frame so that anything it captures stays alive
// for as long as the job does.
template <typename T, typename Func>
scope_task<void> run_job_fn(Func func, job_completion<T> completion) {
  completion.start();
  if constexpr (std::is_void_v<T>) {
    co_await std::invoke(func);
    completion.set_value();
  } else {
    completion.set_value(co_await std::invoke(func));
  }
}

}  // namespace detail

/// Handle given to the body of a scope, through which it spawns jobs and
/// requests cancellation.
///
/// A scope is owned by its scope_driver and is only valid for as long as the
/// driver is. It is passed by reference to the body factory and may be
/// captured by reference in jobs.
template <cancellation_payload C>
class scope {
  class cancel_awaiter {
  public:
    bool await_ready() const noexcept { return false; }

    // The requesting sub-computation is parked without ever being woken. It
    // is destroyed along with the rest of the scope.
    template <detail::scope_promise Promise>
    void await_suspend(std::coroutine_handle<Promise> h) const noexcept {
      detail::park_current(h);
    }

    void await_resume() const noexcept {}
  };

public:
  using cancellation_type = C;

  scope(const scope&) = delete;
  scope& operator=(const scope&) = delete;

  /// Spawn \c task as a new job of this scope.
  ///
  /// The job does not start running until the next time the scope is
  /// advanced. If the scope has been cancelled the job is discarded without
  /// running.
  ///
  /// \throws usage_error
  /// If the scope has already completed.
  template <typename T>
  job_handle<T> spawn(scope_task<T> task) {
    auto result = std::make_shared<detail::job_result<T>>();
    const job_id id = core_->spawn(detail::run_job<T>(
        std::move(task), detail::job_completion<T>{result}));
    return job_handle<T>{std::move(result), id};
  }

  /// Spawn a job that runs the scope_task returned by invoking \c func.
  ///
  /// A decayed copy of \c func is kept alive until the job finishes, so a
  /// coroutine lambda may safely refer to its own captures.
  template <typename Func>
    requires decay_copyable<Func> && std::invocable<std::decay_t<Func>&> &&
      scope_task_type<std::invoke_result_t<std::decay_t<Func>&>>
  auto spawn(Func&& func)
      -> job_handle<task_result_t<std::invoke_result_t<std::decay_t<Func>&>>> {
    using T = task_result_t<std::invoke_result_t<std::decay_t<Func>&>>;
    auto result = std::make_shared<detail::job_result<T>>();
    const job_id id = core_->spawn(detail::run_job_fn<T, std::decay_t<Func>>(
        std::forward<Func>(func), detail::job_completion<T>{result}));
    return job_handle<T>{std::move(result), id};
  }

  /// Request that the whole scope be cancelled with \c payload.
  ///
  /// Every other job and the body are discarded and the driver reports the
  /// payload instead of a value. Only the first request is recorded; later
  /// requests are ignored.
  ///
  /// The returned object may be awaited to suspend the calling scope_task
  /// for good, since nothing after a cancellation request will run.
  ///
  /// \throws usage_error
  /// If the scope has already completed. The request is not recorded.
  cancel_awaiter cancel(C payload) {
    if (core_->closed()) {
      throw usage_error(
          "cancel() called on a scope that has already completed");
    }
    if (cancellation_->request(std::move(payload))) {
      core_->request_cancel();
    }
    return cancel_awaiter{};
  }

  bool cancel_requested() const noexcept { return cancellation_->requested(); }

  /// Counters for the jobs of this scope.
  job_stats stats() const noexcept { return core_->stats(); }

private:
  template <typename T, cancellation_payload C2>
  friend class scope_driver;

  scope(detail::scope_core& core, cancellation_state<C>& cancellation) noexcept
    : core_(&core)
    , cancellation_(&cancellation) {}

  detail::scope_core* core_;
  cancellation_state<C>* cancellation_;
};

}  // namespace tether
