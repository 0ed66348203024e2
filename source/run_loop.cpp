///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#include <tether/run_loop.hpp>

#include <cassert>

namespace tether {

run_loop::~run_loop() {
  assert(queue_.empty());
}

bool run_loop::schedule(pollable& item) noexcept {
  std::lock_guard lk{mut_};
  if (item.queued_) {
    return false;
  }
  item.queued_ = true;
  queue_.push_back(&item);
  cv_.notify_one();
  return true;
}

bool run_loop::unschedule(pollable& item) noexcept {
  std::lock_guard lk{mut_};
  if (!item.queued_) {
    return false;
  }
  queue_.remove(&item);
  item.queued_ = false;
  return true;
}

void run_loop::run(std::stop_token st) {
  std::unique_lock lk{mut_};
  while (!st.stop_requested()) {
    if (!cv_.wait(lk, st, [this] { return !queue_.empty(); })) {
      break;
    }
    pollable& item = take_next();
    lk.unlock();
    item.poll_(item);
    lk.lock();
  }
}

std::size_t run_loop::run_until_idle() {
  std::size_t count = 0;
  std::unique_lock lk{mut_};
  while (!queue_.empty()) {
    pollable& item = take_next();
    lk.unlock();
    item.poll_(item);
    ++count;
    lk.lock();
  }
  return count;
}

run_loop::pollable& run_loop::take_next() noexcept {
  pollable* item = queue_.pop_front();
  item->queued_ = false;
  return *item;
}

}  // namespace tether
