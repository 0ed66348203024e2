///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#include <tether/detail/job_table.hpp>

#include <cassert>
#include <utility>

namespace tether::detail {

job_table::~job_table() {
  clear();
}

job_id job_table::insert(std::unique_ptr<job_record> record) {
  assert(record != nullptr);

  std::uint32_t index;
  if (free_head_ != no_free_slot) {
    index = free_head_;
    free_head_ = slots_[index].next_free;
    slots_[index].next_free = no_free_slot;
  } else {
    assert(slots_.size() < no_free_slot);
    slots_.emplace_back();
    index = static_cast<std::uint32_t>(slots_.size() - 1);
  }

  slot& s = slots_[index];
  const job_id id{index, s.generation};
  record->set_id(id);
  s.record = std::move(record);
  ++size_;
  return id;
}

job_record* job_table::find(job_id id) const noexcept {
  if (id.index >= slots_.size()) {
    return nullptr;
  }
  const slot& s = slots_[id.index];
  if (s.generation != id.generation) {
    return nullptr;
  }
  return s.record.get();
}

bool job_table::erase(job_id id) noexcept {
  if (find(id) == nullptr) {
    return false;
  }

  slot& s = slots_[id.index];

  // Bump the generation before destroying the record so that anything the
  // frame's destructors do cannot observe the slot as still occupied.
  ++s.generation;
  auto record = std::move(s.record);
  s.next_free = free_head_;
  free_head_ = id.index;
  --size_;

  record.reset();
  return true;
}

void job_table::clear() noexcept {
  for (std::uint32_t index = 0; index < slots_.size(); ++index) {
    if (slots_[index].record != nullptr) {
      erase(job_id{index, slots_[index].generation});
    }
  }
  assert(size_ == 0);
}

}  // namespace tether::detail
