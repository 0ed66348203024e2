///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#include <tether/manual_event.hpp>

#include <cassert>

namespace tether {

manual_event::~manual_event() {
  assert(waiters_.empty());
}

void manual_event::set() noexcept {
  set_ = true;
  while (!waiters_.empty()) {
    waiter* w = waiters_.pop_front();
    w->linked = false;
    w->task->wake();
  }
}

}  // namespace tether
