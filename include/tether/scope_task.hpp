///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cassert>
#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include <tether/detail/task_base.hpp>
#include <tether/usage_error.hpp>

namespace tether {

template <typename T>
class scope_task;

namespace detail {

class task_promise_base {
  struct final_awaiter {
    bool await_ready() const noexcept { return false; }

    template <typename Promise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<Promise> h) const noexcept {
      task_promise_base& promise = h.promise();
      if (promise.continuation_) {
        return promise.continuation_;
      }
      return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
  };

public:
  std::suspend_always initial_suspend() const noexcept { return {}; }

  final_awaiter final_suspend() const noexcept { return {}; }

  void unhandled_exception() noexcept {
    exception_ = std::current_exception();
  }

  /// The sub-computation this coroutine is currently running as part of.
  task_base* owner() const noexcept { return owner_; }

  void set_owner(task_base* owner) noexcept { owner_ = owner; }

  void set_continuation(std::coroutine_handle<> h, task_base* owner) noexcept {
    continuation_ = h;
    owner_ = owner;
  }

  const std::exception_ptr& exception() const noexcept { return exception_; }

protected:
  void rethrow_if_exception() const {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
  }

private:
  task_base* owner_ = nullptr;
  std::coroutine_handle<> continuation_;
  std::exception_ptr exception_;
};

template <typename T>
class task_promise final : public task_promise_base {
public:
  scope_task<T> get_return_object() noexcept;

  template <typename U = T>
    requires std::constructible_from<T, U>
  void return_value(U&& value) {
    value_.emplace(std::forward<U>(value));
  }

  T take_result() {
    rethrow_if_exception();
    assert(value_.has_value());
    return std::move(*value_);
  }

private:
  std::optional<T> value_;
};

template <>
class task_promise<void> final : public task_promise_base {
public:
  scope_task<void> get_return_object() noexcept;

  void return_void() noexcept {}

  void take_result() { rethrow_if_exception(); }
};

template <typename Promise>
concept scope_promise = std::derived_from<Promise, task_promise_base>;

/// The sub-computation that \c h is running as part of.
template <scope_promise Promise>
task_base& current_task(std::coroutine_handle<Promise> h) noexcept {
  task_promise_base& promise = h.promise();
  task_base* owner = promise.owner();
  assert(owner != nullptr);
  return *owner;
}

/// Park the sub-computation that \c h is running as part of, so that \c h is
/// resumed the next time that sub-computation is woken and stepped.
template <scope_promise Promise>
task_base& park_current(std::coroutine_handle<Promise> h) noexcept {
  task_base& owner = current_task(h);
  owner.park(h);
  return owner;
}

// Runs the awaited task inline as part of the awaiting sub-computation.
template <typename T>
struct task_awaiter {
  std::coroutine_handle<task_promise<T>> coro;

  bool await_ready() const {
    if (!coro || coro.done()) {
      throw usage_error("scope_task awaited after it has already run");
    }
    return false;
  }

  template <scope_promise Promise>
  std::coroutine_handle<>
  await_suspend(std::coroutine_handle<Promise> parent) noexcept {
    task_promise_base& parent_promise = parent.promise();
    coro.promise().set_continuation(parent, parent_promise.owner());
    return coro;
  }

  T await_resume() { return coro.promise().take_result(); }
};

struct task_access;

}  // namespace detail

/// A lazily-started coroutine that runs as part of a scope.
///
/// The body of a scope and every job spawned into a scope are scope_tasks.
/// A scope_task does not start until it is either handed to a scope or
/// awaited from another scope_task, and it only ever makes progress inside
/// a call to scope_driver::advance().
///
/// Awaiting a scope_task from another scope_task runs it inline as part of
/// the awaiting sub-computation, producing its result or rethrowing its
/// exception.
template <typename T>
class [[nodiscard]] scope_task {
  static_assert(
      std::is_void_v<T> || (std::is_object_v<T> && !std::is_array_v<T>),
      "scope_task result type must be void or a non-array object type");

public:
  using promise_type = detail::task_promise<T>;
  using value_type = T;

  scope_task() noexcept = default;

  scope_task(scope_task&& other) noexcept
    : coro_(std::exchange(other.coro_, {})) {}

  scope_task& operator=(scope_task other) noexcept {
    std::swap(coro_, other.coro_);
    return *this;
  }

  ~scope_task() {
    if (coro_) {
      coro_.destroy();
    }
  }

  explicit operator bool() const noexcept { return static_cast<bool>(coro_); }

  detail::task_awaiter<T> operator co_await() && noexcept {
    return detail::task_awaiter<T>{coro_};
  }

private:
  friend promise_type;
  friend detail::task_access;

  explicit scope_task(std::coroutine_handle<promise_type> h) noexcept
    : coro_(h) {}

  std::coroutine_handle<promise_type> coro_;
};

namespace detail {

template <typename T>
scope_task<T> task_promise<T>::get_return_object() noexcept {
  return scope_task<T>{
      std::coroutine_handle<task_promise<T>>::from_promise(*this)};
}

inline scope_task<void> task_promise<void>::get_return_object() noexcept {
  return scope_task<void>{
      std::coroutine_handle<task_promise<void>>::from_promise(*this)};
}

struct task_access {
  template <typename T>
  static std::coroutine_handle<task_promise<T>>
  handle(const scope_task<T>& task) noexcept {
    return task.coro_;
  }
};

template <typename T>
inline constexpr bool is_scope_task_v = false;

template <typename T>
inline constexpr bool is_scope_task_v<scope_task<T>> = true;

}  // namespace detail

template <typename T>
concept scope_task_type = detail::is_scope_task_v<std::remove_cvref_t<T>>;

template <scope_task_type Task>
using task_result_t = typename std::remove_cvref_t<Task>::value_type;

}  // namespace tether
