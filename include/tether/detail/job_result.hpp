///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cassert>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include <tether/detail/task_base.hpp>
#include <tether/job_status.hpp>
#include <tether/usage_error.hpp>

namespace tether::detail {

/// Result slot of a job, shared between the job's frame and its job_handle.
template <typename T>
class job_result {
  using stored_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
  job_status status() const noexcept { return status_; }

  void mark_running() noexcept {
    if (status_ == job_status::spawned) {
      status_ = job_status::running;
    }
  }

  /// Store the job's value and wake the sub-computation awaiting it, if any.
  template <typename... Args>
  void set_value(Args&&... args) {
    assert(status_ == job_status::running);
    value_.emplace(std::forward<Args>(args)...);
    status_ = job_status::done;
    if (task_base* waiter = std::exchange(waiter_, nullptr)) {
      waiter->wake();
    }
  }

  /// Called when the job's frame is destroyed. Has no effect once the value
  /// has been stored.
  void mark_discarded() noexcept {
    if (status_ != job_status::done) {
      status_ = job_status::discarded;
    }
  }

  /// Claim the right to await the result.
  ///
  /// \throws usage_error
  /// If the result has already been claimed.
  void claim() {
    if (claimed_) {
      throw usage_error("job_handle awaited more than once");
    }
    claimed_ = true;
  }

  void set_waiter(task_base* waiter) noexcept {
    assert(waiter_ == nullptr);
    waiter_ = waiter;
  }

  void clear_waiter(task_base* waiter) noexcept {
    if (waiter_ == waiter) {
      waiter_ = nullptr;
    }
  }

  T take() {
    assert(status_ == job_status::done);
    if constexpr (!std::is_void_v<T>) {
      return std::move(*value_);
    }
  }

private:
  std::optional<stored_type> value_;
  task_base* waiter_ = nullptr;
  job_status status_ = job_status::spawned;
  bool claimed_ = false;
};

/// Held as a parameter of a job's root coroutine so that the result slot is
/// marked discarded whenever the frame is destroyed without completing.
template <typename T>
class job_completion {
public:
  explicit job_completion(std::shared_ptr<job_result<T>> result) noexcept
    : result_(std::move(result)) {}

  job_completion(job_completion&&) noexcept = default;

  ~job_completion() {
    if (result_) {
      result_->mark_discarded();
    }
  }

  void start() noexcept { result_->mark_running(); }

  template <typename... Args>
  void set_value(Args&&... args) {
    result_->set_value(std::forward<Args>(args)...);
  }

private:
  std::shared_ptr<job_result<T>> result_;
};

}  // namespace tether::detail
