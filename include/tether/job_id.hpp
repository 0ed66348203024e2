///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstdint>

namespace tether {

/// Identifies a job within the table of the scope that spawned it.
///
/// Slots in the table are reused once a job finishes, so the id carries the
/// generation of the slot. An id from a previous occupant of a slot never
/// matches the current occupant.
struct job_id {
  static constexpr std::uint32_t invalid_index = 0xFFFF'FFFFu;

  std::uint32_t index = invalid_index;
  std::uint32_t generation = 0;

  constexpr bool valid() const noexcept { return index != invalid_index; }

  friend constexpr bool operator==(job_id, job_id) noexcept = default;
};

}  // namespace tether
