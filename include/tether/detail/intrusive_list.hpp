///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cassert>
#include <utility>

namespace tether::detail {

/// An intrusive doubly-linked list that supports insertion at the back,
/// removal from the front and constant-time removal of arbitrary items.
///
/// Used for the ready-queue of a scope and the waiter list of a
/// manual_event.
template <typename Item, Item* Item::* Next, Item* Item::* Prev>
class intrusive_list {
public:
  intrusive_list() noexcept : head_(nullptr), tail_(nullptr) {}

  intrusive_list(intrusive_list&& other) noexcept
    : head_(std::exchange(other.head_, nullptr))
    , tail_(std::exchange(other.tail_, nullptr)) {}

  intrusive_list(const intrusive_list&) = delete;
  intrusive_list& operator=(const intrusive_list&) = delete;
  intrusive_list& operator=(intrusive_list&&) = delete;

  ~intrusive_list() { assert(empty()); }

  [[nodiscard]] bool empty() const noexcept { return head_ == nullptr; }

  void push_back(Item* item) noexcept {
    item->*Next = nullptr;
    item->*Prev = tail_;
    if (tail_ == nullptr) {
      head_ = item;
    } else {
      tail_->*Next = item;
    }
    tail_ = item;
  }

  [[nodiscard]] Item* pop_front() noexcept {
    assert(!empty());
    Item* item = head_;
    head_ = item->*Next;
    if (head_ == nullptr) {
      tail_ = nullptr;
    } else {
      head_->*Prev = nullptr;
    }
    item->*Next = nullptr;
    return item;
  }

  void remove(Item* item) noexcept {
    assert(!empty());
    Item* prev = item->*Prev;
    Item* next = item->*Next;
    if (prev != nullptr) {
      prev->*Next = next;
    } else {
      head_ = next;
    }
    if (next != nullptr) {
      next->*Prev = prev;
    } else {
      tail_ = prev;
    }
    item->*Next = nullptr;
    item->*Prev = nullptr;
  }

  /// Move all of the items of \c other to the front of this list, preserving
  /// their order.
  void prepend(intrusive_list other) noexcept {
    if (empty()) {
      head_ = std::exchange(other.head_, nullptr);
      tail_ = std::exchange(other.tail_, nullptr);
    } else if (!other.empty()) {
      other.tail_->*Next = head_;
      head_->*Prev = other.tail_;
      head_ = std::exchange(other.head_, nullptr);
      other.tail_ = nullptr;
    }
  }

private:
  Item* head_;
  Item* tail_;
};

}  // namespace tether::detail
