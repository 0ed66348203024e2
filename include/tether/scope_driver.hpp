///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include <tether/cancellation_state.hpp>
#include <tether/concepts.hpp>
#include <tether/detail/scope_core.hpp>
#include <tether/scope.hpp>
#include <tether/scope_result.hpp>
#include <tether/scope_task.hpp>
#include <tether/usage_error.hpp>
#include <tether/waker.hpp>

namespace tether {

namespace detail {

template <typename T, typename Factory, typename Scope>
scope_task<T> run_body(Factory factory, Scope& s) {
  co_return co_await std::invoke(factory, s);
}

template <typename Factory, typename C>
concept scope_factory = decay_copyable<Factory> &&
    std::invocable<std::decay_t<Factory>&, scope<C>&> &&
    scope_task_type<std::invoke_result_t<std::decay_t<Factory>&, scope<C>&>>;

}  // namespace detail

/// The value type produced by the body that \c Factory creates.
template <typename Factory, typename C>
  requires detail::scope_factory<Factory, C>
using body_result_t =
    task_result_t<std::invoke_result_t<std::decay_t<Factory>&, scope<C>&>>;

/// Owns a scope and drives it forward.
///
/// The scope's body and jobs only make progress inside advance(). Each call
/// steps the body once if it is ready and then steps, once each, the jobs
/// that were ready when the job phase began. The scope is finished when the
/// body has produced its value and every job has completed, or as soon as a
/// cancellation request is observed.
///
/// Destroying a driver before it finishes destroys every outstanding job and
/// the body without running them any further.
///
/// \tparam T
/// The value type of the body.
///
/// \tparam C
/// The cancellation payload type.
template <typename T, cancellation_payload C>
class scope_driver {
public:
  using value_type = T;
  using cancellation_type = C;
  using result_type = scope_result<T, C>;
  using poll_type = scope_poll<T, C>;

  /// Construct a driver whose body is produced by invoking \c factory with
  /// the scope handle.
  ///
  /// The factory is not invoked until the first call to advance(). A decayed
  /// copy of it is kept alive until the scope finishes.
  template <typename Factory>
    requires detail::scope_factory<Factory, C> &&
      std::same_as<body_result_t<Factory, C>, T>
  explicit scope_driver(Factory&& factory)
    : scope_(core_, cancellation_)
    , body_(detail::run_body<T, std::decay_t<Factory>>(
          std::forward<Factory>(factory), scope_)) {
    auto h = detail::task_access::handle(body_);
    h.promise().set_owner(&core_.body());
    core_.start_body(h);
  }

  scope_driver(const scope_driver&) = delete;
  scope_driver(scope_driver&&) = delete;
  scope_driver& operator=(const scope_driver&) = delete;
  scope_driver& operator=(scope_driver&&) = delete;

  ~scope_driver() { teardown(); }

  /// Make as much progress as possible without blocking.
  ///
  /// \param w
  /// If non-null, replaces the waker that is notified when the scope needs
  /// to be advanced again. The waker is called at most once per wake-up and
  /// never after the scope has finished.
  ///
  /// \return
  /// A ready poll with the scope's result, or a pending poll.
  ///
  /// \throws usage_error
  /// If the scope has already finished or if called from inside the scope.
  ///
  /// \throws
  /// Rethrows the first exception that escaped the body or a job, after
  /// discarding the rest of the scope. The scope is finished afterwards.
  poll_type advance(const waker& w = {}) {
    if (finished_) {
      throw usage_error("advance() called on a scope that has already finished");
    }

    core_.begin_advance(w);

    {
      advance_guard guard{core_};

      if (core_.cancel_requested()) {
        return finish_cancelled();
      }

      if (!body_done_ && core_.body().is_ready()) {
        core_.step(core_.body());
        collect_body();
      }

      core_.run_jobs();
    }

    if (std::exception_ptr fault = core_.take_fault()) {
      finished_ = true;
      teardown();
      std::rethrow_exception(fault);
    }

    if (body_done_ && !core_.has_jobs() && !core_.cancel_requested()) {
      finished_ = true;
      teardown();
      return poll_type::ready(take_body_value());
    }

    core_.notify_if_ready();
    return poll_type::pending();
  }

  /// Drive this scope from inside another scope until it finishes.
  ///
  /// Each resumption of the awaiting sub-computation advances this scope
  /// once, passing a waker that wakes the awaiting sub-computation. The
  /// outer scope therefore sleeps while this one has nothing to do.
  ///
  /// \return
  /// An awaitable producing this scope's result. A fault of this scope is
  /// rethrown at the await point.
  auto operator co_await() & { return nested_awaiter{drive_nested(*this)}; }

  /// Whether advance() has returned a ready poll or rethrown a fault.
  bool is_complete() const noexcept { return finished_; }

  bool cancel_requested() const noexcept { return cancellation_.requested(); }

  job_stats stats() const noexcept { return core_.stats(); }

private:
  using value_storage =
      std::conditional_t<std::is_void_v<T>, std::monostate, T>;

  struct advance_guard {
    detail::scope_core& core;
    ~advance_guard() { core.end_advance(); }
  };

  class advance_awaiter {
  public:
    explicit advance_awaiter(scope_driver& driver) noexcept : driver_(driver) {}

    bool await_ready() const noexcept { return false; }

    template <detail::scope_promise Promise>
    bool await_suspend(std::coroutine_handle<Promise> h) {
      detail::task_base& task = detail::current_task(h);
      poll_.emplace(
          driver_.advance(waker::bind<&detail::task_base::wake>(task)));
      if (poll_->is_ready()) {
        return false;
      }
      task.park(h);
      return true;
    }

    poll_type await_resume() { return std::move(*poll_); }

  private:
    scope_driver& driver_;
    std::optional<poll_type> poll_;
  };

  class nested_awaiter {
  public:
    explicit nested_awaiter(scope_task<result_type> task) noexcept
      : task_(std::move(task))
      , inner_{detail::task_access::handle(task_)} {}

    bool await_ready() const { return inner_.await_ready(); }

    template <detail::scope_promise Promise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<Promise> h) noexcept {
      return inner_.await_suspend(h);
    }

    result_type await_resume() { return inner_.await_resume(); }

  private:
    scope_task<result_type> task_;
    detail::task_awaiter<result_type> inner_;
  };

  // The waker points into the awaiting sub-computation, which may be
  // destroyed while this driver lives on.
  struct waker_reset {
    detail::scope_core& core;
    ~waker_reset() { core.reset_waker(); }
  };

  static scope_task<result_type> drive_nested(scope_driver& driver) {
    waker_reset reset{driver.core_};
    for (;;) {
      poll_type poll = co_await advance_awaiter{driver};
      if (poll.is_ready()) {
        co_return std::move(poll).result();
      }
    }
  }

  void collect_body() {
    auto h = detail::task_access::handle(body_);
    if (!h.done()) {
      return;
    }
    body_done_ = true;
    if (const std::exception_ptr& e = h.promise().exception()) {
      core_.set_fault(e);
      return;
    }
    if constexpr (std::is_void_v<T>) {
      body_value_.emplace();
    } else {
      try {
        body_value_.emplace(h.promise().take_result());
      } catch (...) {
        core_.set_fault(std::current_exception());
      }
    }
  }

  result_type take_body_value() {
    if constexpr (std::is_void_v<T>) {
      return result_type::completed();
    } else {
      return result_type::completed(std::move(*body_value_));
    }
  }

  poll_type finish_cancelled() {
    finished_ = true;
    teardown();
    return poll_type::ready(result_type::cancelled(cancellation_.take()));
  }

  // Jobs are destroyed before the body so that the factory the body owns
  // outlives every job.
  void teardown() noexcept {
    core_.discard_all();
    body_ = scope_task<T>{};
    core_.close();
  }

  detail::scope_core core_;
  cancellation_state<C> cancellation_;
  scope<C> scope_;
  scope_task<T> body_;
  std::optional<value_storage> body_value_;
  bool body_done_ = false;
  bool finished_ = false;
};

/// Create a scope driver for the body produced by \c factory.
///
/// \tparam C
/// The cancellation payload type.
template <cancellation_payload C, typename Factory>
  requires detail::scope_factory<Factory, C>
scope_driver<body_result_t<Factory, C>, C> create_scope(Factory&& factory) {
  return scope_driver<body_result_t<Factory, C>, C>(
      std::forward<Factory>(factory));
}

}  // namespace tether
