///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstdint>
#include <string_view>

namespace tether {

/// Lifecycle of a spawned job.
///
/// A job moves from \c spawned to \c running the first time it is advanced,
/// and from there to either \c done or \c discarded. A job may also go
/// directly from \c spawned to \c discarded if its scope is torn down before
/// it ever runs.
enum class job_status : std::uint8_t { spawned, running, done, discarded };

constexpr std::string_view to_string(job_status s) noexcept {
  switch (s) {
    case job_status::spawned: return "spawned";
    case job_status::running: return "running";
    case job_status::done: return "done";
    case job_status::discarded: return "discarded";
  }
  return "unknown";
}

}  // namespace tether
