///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <tether/detail/job_record.hpp>
#include <tether/job_id.hpp>

namespace tether::detail {

/// Generation-indexed slot map that owns the outstanding jobs of a scope.
///
/// Insertion and removal are constant time and never move other records, so
/// raw pointers to records stay valid for as long as the record is in the
/// table. Lookups with an id whose slot has since been reused return null.
class job_table {
public:
  job_table() noexcept = default;

  job_table(const job_table&) = delete;
  job_table& operator=(const job_table&) = delete;

  ~job_table();

  /// Take ownership of \c record and assign it a fresh id.
  ///
  /// \return
  /// The id assigned to the record. The id is also stored on the record.
  job_id insert(std::unique_ptr<job_record> record);

  /// \return
  /// The record identified by \c id, or nullptr if it has been removed.
  job_record* find(job_id id) const noexcept;

  /// Remove and destroy the record identified by \c id.
  ///
  /// \return
  /// \c true if a record was removed, \c false if \c id was stale.
  bool erase(job_id id) noexcept;

  /// Destroy every record in the table.
  void clear() noexcept;

  std::size_t size() const noexcept { return size_; }

  bool empty() const noexcept { return size_ == 0; }

private:
  static constexpr std::uint32_t no_free_slot = job_id::invalid_index;

  struct slot {
    std::unique_ptr<job_record> record;
    std::uint32_t generation = 1;
    std::uint32_t next_free = no_free_slot;
  };

  std::vector<slot> slots_;
  std::uint32_t free_head_ = no_free_slot;
  std::size_t size_ = 0;
};

}  // namespace tether::detail
