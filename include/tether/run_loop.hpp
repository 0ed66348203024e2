///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stop_token>

#include <tether/detail/intrusive_list.hpp>
#include <tether/waker.hpp>

namespace tether {

/// A loop that repeatedly polls the items scheduled on it, in the order in
/// which they were scheduled.
///
/// This is the poller that scope_sender uses to advance a scope driver each
/// time the driver's waker fires. Scheduling is thread-safe and idempotent:
/// an item that is already queued is not queued a second time, so any number
/// of wakes between two polls result in a single poll.
class run_loop {
public:
  /// Base class for objects that the loop polls.
  ///
  /// An item is unlinked from the queue before it is polled, so it may
  /// schedule itself again from inside its own poll function. Destroying an
  /// item removes it from the queue.
  class pollable {
  public:
    using poll_fn = void(pollable&) noexcept;

    pollable(run_loop& loop, poll_fn* poll) noexcept
      : loop_(&loop)
      , poll_(poll) {}

    pollable(const pollable&) = delete;
    pollable& operator=(const pollable&) = delete;

    run_loop& loop() const noexcept { return *loop_; }

    /// Queue this item to be polled. Has no effect if already queued.
    void schedule() noexcept { loop_->schedule(*this); }

    /// A waker that schedules this item. Valid for the item's lifetime.
    waker get_waker() noexcept {
      return waker::bind<&pollable::schedule>(*this);
    }

  protected:
    ~pollable() { loop_->unschedule(*this); }

  private:
    friend run_loop;

    run_loop* loop_;
    poll_fn* poll_;
    pollable* next_ = nullptr;
    pollable* prev_ = nullptr;
    bool queued_ = false;
  };

  run_loop() noexcept = default;

  run_loop(const run_loop&) = delete;
  run_loop& operator=(const run_loop&) = delete;

  /// \pre No items are queued.
  ~run_loop();

  /// Queue \c item at the back of the loop.
  ///
  /// \return
  /// \c true if the item was queued, \c false if it was already queued.
  bool schedule(pollable& item) noexcept;

  /// Remove \c item from the queue.
  ///
  /// \return
  /// \c true if the item was removed before being polled, \c false if it was
  /// not queued.
  bool unschedule(pollable& item) noexcept;

  /// Poll queued items until a stop is requested on \c st, blocking while
  /// the queue is empty.
  void run(std::stop_token st);

  /// Poll queued items until the queue is empty, without blocking. Items
  /// scheduled while draining are also polled.
  ///
  /// \return
  /// The number of polls performed.
  std::size_t run_until_idle();

private:
  /// \pre mut_ is held and the queue is not empty.
  pollable& take_next() noexcept;

  using queue_type = detail::
      intrusive_list<pollable, &pollable::next_, &pollable::prev_>;

  std::mutex mut_;
  std::condition_variable_any cv_;
  queue_type queue_;
};

}  // namespace tether
