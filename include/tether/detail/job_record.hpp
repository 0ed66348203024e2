///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <exception>

#include <tether/detail/task_base.hpp>
#include <tether/job_id.hpp>
#include <tether/scope_task.hpp>

namespace tether::detail {

/// A job owned by a scope's job table.
///
/// Owns the root coroutine frame of the job. Destroying the record destroys
/// the frame, and with it every nested frame and local the job was holding.
class job_record final : public task_base {
public:
  job_record(scope_core& core, scope_task<void> root) noexcept
    : task_base(core)
    , root_(std::move(root)) {
    auto h = task_access::handle(root_);
    h.promise().set_owner(this);
    park(h);
  }

  job_id id() const noexcept { return id_; }

  void set_id(job_id id) noexcept { id_ = id; }

  /// Whether the job has run to completion, either normally or by exiting
  /// with an exception.
  bool finished() const noexcept { return task_access::handle(root_).done(); }

  const std::exception_ptr& exception() const noexcept {
    return task_access::handle(root_).promise().exception();
  }

private:
  scope_task<void> root_;
  job_id id_;
};

}  // namespace tether::detail
