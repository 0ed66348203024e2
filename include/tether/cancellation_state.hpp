///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cassert>
#include <optional>
#include <utility>

#include <tether/concepts.hpp>

namespace tether {

/// Write-once record of a scope's cancellation request.
///
/// The first request wins. Later requests leave the stored payload alone.
/// Once requested the state never reverts, even after the payload has been
/// taken.
template <cancellation_payload C>
class cancellation_state {
public:
  cancellation_state() noexcept = default;

  cancellation_state(const cancellation_state&) = delete;
  cancellation_state& operator=(const cancellation_state&) = delete;

  bool requested() const noexcept { return requested_; }

  /// Store \c payload if no cancellation has been requested yet.
  ///
  /// \return
  /// \c true if this call made the request, \c false if an earlier request
  /// had already been recorded.
  bool request(C payload) {
    if (requested_) {
      return false;
    }
    payload_.emplace(std::move(payload));
    requested_ = true;
    return true;
  }

  /// \pre requested() and the payload has not been taken.
  const C& payload() const noexcept {
    assert(payload_.has_value());
    return *payload_;
  }

  /// Move the payload out. May only be called once.
  C take() {
    assert(payload_.has_value());
    C result = std::move(*payload_);
    payload_.reset();
    return result;
  }

private:
  std::optional<C> payload_;
  bool requested_ = false;
};

}  // namespace tether
