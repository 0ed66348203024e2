///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstddef>
#include <exception>

#include <tether/detail/intrusive_list.hpp>
#include <tether/detail/job_table.hpp>
#include <tether/detail/task_base.hpp>
#include <tether/job_id.hpp>
#include <tether/scope_task.hpp>
#include <tether/waker.hpp>

namespace tether {

/// Counters describing the jobs of a scope.
///
/// Every spawned job is eventually counted exactly once as either completed
/// or discarded; until then it is outstanding.
struct job_stats {
  std::size_t spawned = 0;
  std::size_t completed = 0;
  std::size_t discarded = 0;
  std::size_t outstanding = 0;

  friend bool operator==(const job_stats&, const job_stats&) = default;
};

namespace detail {

/// The type-independent state of a scope, shared by the driver and every
/// scope handle.
///
/// Holds the job table, the queue of sub-computations that are ready to be
/// stepped and the waker of the current poller.
class scope_core {
public:
  scope_core() noexcept;

  scope_core(const scope_core&) = delete;
  scope_core& operator=(const scope_core&) = delete;

  ~scope_core();

  /// The task_base of the scope's body.
  task_base& body() noexcept { return body_; }

  /// Make the body runnable with \c root as its first resumption point.
  void start_body(std::coroutine_handle<> root) noexcept;

  /// Take ownership of a job's root coroutine and queue it to run.
  ///
  /// If the scope is cancelled or shutting down the job is counted and then
  /// discarded immediately without ever running.
  ///
  /// \return
  /// The id of the new job, or an invalid id if it was discarded.
  ///
  /// \throws usage_error
  /// If the scope has already produced its result.
  job_id spawn(scope_task<void> root);

  /// Record a cancellation request and make sure the poller notices it.
  void request_cancel() noexcept;

  bool cancel_requested() const noexcept { return cancel_requested_; }

  //
  // Interface used by scope_driver::advance().
  //

  /// Mark the start of an advance, replacing the waker of the poller when a
  /// non-null waker is given.
  ///
  /// \throws usage_error
  /// If called while an advance is already in progress.
  void begin_advance(const waker& w);

  void end_advance() noexcept { advancing_ = false; }

  /// Forget the waker of the poller, which is about to go away.
  void reset_waker() noexcept { waker_ = waker{}; }

  /// Resume a ready sub-computation from its parked resumption point.
  void step(task_base& task) noexcept;

  /// Step every job that was ready at the start of the call, once each, in
  /// the order in which they became ready.
  ///
  /// Stops early if cancellation is requested or a job exits with an
  /// exception. Finished jobs are removed from the table.
  void run_jobs() noexcept;

  /// Record a fault. Only the first fault is kept.
  void set_fault(std::exception_ptr e) noexcept;

  std::exception_ptr take_fault() noexcept;

  /// Notify the poller if there is work it needs to call advance() for.
  void notify_if_ready() noexcept;

  /// Stop accepting jobs and destroy every outstanding job without running
  /// it further.
  void discard_all() noexcept;

  /// Mark the scope as finished. Subsequent spawns are usage errors.
  void close() noexcept { phase_ = phase::closed; }

  bool closed() const noexcept { return phase_ == phase::closed; }

  bool has_jobs() const noexcept { return !jobs_.empty(); }

  job_stats stats() const noexcept;

private:
  friend class task_base;

  enum class phase : unsigned char { open, closing, closed };

  class body_task final : public task_base {
  public:
    using task_base::task_base;
  };

  void make_ready(task_base& task) noexcept;

  void notify_poller() noexcept { waker_.wake(); }

  using ready_list =
      intrusive_list<task_base, &task_base::next_, &task_base::prev_>;

  job_table jobs_;
  ready_list ready_;
  body_task body_;
  waker waker_;
  std::exception_ptr fault_;
  std::size_t spawned_ = 0;
  std::size_t completed_ = 0;
  std::size_t discarded_ = 0;
  phase phase_ = phase::open;
  bool advancing_ = false;
  bool cancel_requested_ = false;
};

}  // namespace detail
}  // namespace tether
