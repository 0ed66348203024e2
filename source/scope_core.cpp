///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#include <tether/detail/scope_core.hpp>

#include <tether/usage_error.hpp>

#include <cassert>
#include <memory>
#include <utility>

namespace tether::detail {

void task_base::wake() noexcept {
  core_->make_ready(*this);
}

scope_core::scope_core() noexcept : body_(*this) {}

scope_core::~scope_core() {
  discard_all();
}

void scope_core::start_body(std::coroutine_handle<> root) noexcept {
  body_.park(root);
  make_ready(body_);
}

job_id scope_core::spawn(scope_task<void> root) {
  if (phase_ == phase::closed) {
    throw usage_error("spawn() called on a scope that has already completed");
  }

  auto record = std::make_unique<job_record>(*this, std::move(root));

  if (phase_ != phase::open || cancel_requested_) {
    ++spawned_;
    ++discarded_;
    return job_id{};
  }

  job_record& r = *record;
  const job_id id = jobs_.insert(std::move(record));
  ++spawned_;
  make_ready(r);
  return id;
}

void scope_core::request_cancel() noexcept {
  if (cancel_requested_) {
    return;
  }
  cancel_requested_ = true;
  if (!advancing_ && phase_ == phase::open) {
    notify_poller();
  }
}

void scope_core::begin_advance(const waker& w) {
  if (advancing_) {
    throw usage_error("advance() called re-entrantly from inside the scope");
  }
  if (w) {
    waker_ = w;
  }
  advancing_ = true;
}

void scope_core::step(task_base& task) noexcept {
  assert(advancing_);
  assert(task.resume_point_);
  task.ready_ = false;
  std::exchange(task.resume_point_, {}).resume();
}

void scope_core::run_jobs() noexcept {
  // Only jobs that were ready when the phase started are stepped. Anything
  // woken while stepping them waits for the next advance.
  ready_list batch = std::move(ready_);

  while (!batch.empty()) {
    if (cancel_requested_ || fault_) {
      ready_.prepend(std::move(batch));
      return;
    }

    auto& record = static_cast<job_record&>(*batch.pop_front());
    step(record);

    if (record.finished()) {
      if (record.exception()) {
        set_fault(record.exception());
        ++discarded_;
      } else {
        ++completed_;
      }
      if (record.is_ready()) {
        ready_.remove(&record);
        record.ready_ = false;
      }
      [[maybe_unused]] const bool erased = jobs_.erase(record.id());
      assert(erased);
    }
  }
}

void scope_core::set_fault(std::exception_ptr e) noexcept {
  if (!fault_) {
    fault_ = std::move(e);
  }
}

std::exception_ptr scope_core::take_fault() noexcept {
  return std::exchange(fault_, nullptr);
}

void scope_core::notify_if_ready() noexcept {
  if (cancel_requested_ || body_.ready_ || !ready_.empty()) {
    notify_poller();
  }
}

void scope_core::discard_all() noexcept {
  if (phase_ == phase::open) {
    phase_ = phase::closing;
  }
  while (!ready_.empty()) {
    ready_.pop_front()->ready_ = false;
  }
  body_.ready_ = false;
  discarded_ += jobs_.size();
  jobs_.clear();
}

job_stats scope_core::stats() const noexcept {
  return job_stats{
      .spawned = spawned_,
      .completed = completed_,
      .discarded = discarded_,
      .outstanding = jobs_.size()};
}

void scope_core::make_ready(task_base& task) noexcept {
  if (phase_ != phase::open || task.ready_) {
    return;
  }
  task.ready_ = true;
  if (&task != &body_) {
    ready_.push_back(&task);
  }
  if (!advancing_) {
    notify_poller();
  }
}

}  // namespace tether::detail
