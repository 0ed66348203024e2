///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

namespace tether {

/// Non-owning callback used by a scope driver to tell its poller that
/// \c advance() should be called again.
///
/// The target must outlive every driver it has been registered with, or be
/// replaced by a subsequent call to \c advance().
class waker {
public:
  using wake_fn = void(void*) noexcept;

  constexpr waker() noexcept = default;

  constexpr waker(wake_fn* fn, void* data) noexcept : fn_(fn), data_(data) {}

  /// Construct a waker that calls \c (obj.*Member)().
  template <auto Member, typename T>
  static waker bind(T& obj) noexcept {
    return waker{
        [](void* data) noexcept { (static_cast<T*>(data)->*Member)(); },
        static_cast<void*>(&obj)};
  }

  explicit operator bool() const noexcept { return fn_ != nullptr; }

  void wake() const noexcept {
    if (fn_ != nullptr) {
      fn_(data_);
    }
  }

private:
  wake_fn* fn_ = nullptr;
  void* data_ = nullptr;
};

}  // namespace tether
