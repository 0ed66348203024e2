///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <coroutine>
#include <memory>
#include <utility>

#include <tether/concepts.hpp>
#include <tether/detail/job_result.hpp>
#include <tether/job_id.hpp>
#include <tether/job_status.hpp>
#include <tether/scope_task.hpp>
#include <tether/usage_error.hpp>

namespace tether {

template <cancellation_payload C>
class scope;

/// Handle to a job spawned into a scope.
///
/// Awaiting the handle from a scope_task of the same scope suspends until the
/// job completes and then produces its value. The result can be awaited at
/// most once. Dropping the handle does not affect the job, which still runs
/// to completion as part of the scope.
///
/// If the job is discarded because the scope was cancelled, an awaiter never
/// resumes; it is destroyed along with the rest of the scope.
template <typename T>
class job_handle {
  class awaiter {
  public:
    explicit awaiter(std::shared_ptr<detail::job_result<T>> result) noexcept
      : result_(std::move(result)) {}

    awaiter(awaiter&&) = delete;
    awaiter& operator=(awaiter&&) = delete;

    ~awaiter() {
      if (waiting_ != nullptr) {
        result_->clear_waiter(waiting_);
      }
    }

    bool await_ready() {
      if (!result_) {
        throw usage_error("awaiting an empty job_handle");
      }
      result_->claim();
      return result_->status() == job_status::done;
    }

    template <detail::scope_promise Promise>
    void await_suspend(std::coroutine_handle<Promise> h) noexcept {
      detail::task_base& task = detail::park_current(h);
      if (result_->status() != job_status::discarded) {
        result_->set_waiter(&task);
        waiting_ = &task;
      }
    }

    T await_resume() {
      waiting_ = nullptr;
      return result_->take();
    }

  private:
    std::shared_ptr<detail::job_result<T>> result_;
    detail::task_base* waiting_ = nullptr;
  };

public:
  using value_type = T;

  /// Construct an empty handle that refers to no job.
  job_handle() noexcept = default;

  job_handle(job_handle&& other) noexcept
    : result_(std::move(other.result_))
    , id_(std::exchange(other.id_, job_id{})) {}

  job_handle& operator=(job_handle other) noexcept {
    std::swap(result_, other.result_);
    std::swap(id_, other.id_);
    return *this;
  }

  bool valid() const noexcept { return result_ != nullptr; }

  /// The id of the job in its scope's table. Invalid if the job was
  /// discarded at spawn time.
  job_id id() const noexcept { return id_; }

  /// \pre valid()
  job_status status() const noexcept { return result_->status(); }

  /// Await the job's value. Equivalent to \c co_await on the handle.
  awaiter await_result() const noexcept { return awaiter{result_}; }

  awaiter operator co_await() const noexcept { return awaiter{result_}; }

private:
  template <cancellation_payload C>
  friend class scope;

  job_handle(std::shared_ptr<detail::job_result<T>> result, job_id id) noexcept
    : result_(std::move(result))
    , id_(id) {}

  std::shared_ptr<detail::job_result<T>> result_;
  job_id id_;
};

}  // namespace tether
