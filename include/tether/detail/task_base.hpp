///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <coroutine>

namespace tether::detail {

class scope_core;

/// Scheduling state for one sub-computation of a scope: either the body or a
/// single spawned job, including any scope_tasks it is currently awaiting.
///
/// Leaf awaitables call \c park() with the coroutine that must be resumed
/// next and later call \c wake() to make the sub-computation runnable again.
/// The sub-computation is only ever resumed from inside the owning scope's
/// advance().
class task_base {
public:
  explicit task_base(scope_core& core) noexcept : core_(&core) {}

  task_base(const task_base&) = delete;
  task_base& operator=(const task_base&) = delete;

  scope_core& core() const noexcept { return *core_; }

  /// Record the coroutine to resume when this sub-computation next runs.
  void park(std::coroutine_handle<> h) noexcept { resume_point_ = h; }

  /// Mark this sub-computation as runnable. It is resumed during the next
  /// call to advance() on the owning scope.
  ///
  /// Has no effect if already runnable or if the scope is shutting down.
  void wake() noexcept;

  bool is_ready() const noexcept { return ready_; }

protected:
  ~task_base() = default;

private:
  friend class scope_core;

  scope_core* core_;
  std::coroutine_handle<> resume_point_;
  task_base* next_ = nullptr;
  task_base* prev_ = nullptr;
  bool ready_ = false;
};

}  // namespace tether::detail
