///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include <tether/concepts.hpp>
#include <tether/usage_error.hpp>

namespace tether {

/// Final outcome of a scope: either the value produced by its body or the
/// payload of the cancellation that ended it.
template <typename T, cancellation_payload C>
class scope_result {
  using value_storage =
      std::conditional_t<std::is_void_v<T>, std::monostate, T>;

  using const_value_reference = std::add_lvalue_reference_t<
      std::conditional_t<std::is_void_v<T>, void, const T>>;

  static constexpr std::size_t value_index = 0;
  static constexpr std::size_t cancelled_index = 1;

public:
  using value_type = T;
  using cancellation_type = C;

  template <typename... Args>
  static scope_result completed(Args&&... args) {
    return scope_result{
        std::in_place_index<value_index>, std::forward<Args>(args)...};
  }

  static scope_result cancelled(C payload) {
    return scope_result{std::in_place_index<cancelled_index>, std::move(payload)};
  }

  bool is_cancelled() const noexcept {
    return state_.index() == cancelled_index;
  }

  explicit operator bool() const noexcept { return !is_cancelled(); }

  /// \throws usage_error if the scope was cancelled.
  std::add_lvalue_reference_t<T> value() & {
    check_completed();
    if constexpr (!std::is_void_v<T>) {
      return std::get<value_index>(state_);
    }
  }

  const_value_reference value() const& {
    check_completed();
    if constexpr (!std::is_void_v<T>) {
      return std::get<value_index>(state_);
    }
  }

  std::add_rvalue_reference_t<T> value() && {
    check_completed();
    if constexpr (!std::is_void_v<T>) {
      return std::get<value_index>(std::move(state_));
    }
  }

  /// \throws usage_error if the scope was not cancelled.
  C& cancellation() & {
    check_cancelled();
    return std::get<cancelled_index>(state_);
  }

  const C& cancellation() const& {
    check_cancelled();
    return std::get<cancelled_index>(state_);
  }

  C&& cancellation() && {
    check_cancelled();
    return std::get<cancelled_index>(std::move(state_));
  }

private:
  template <std::size_t I, typename... Args>
  explicit scope_result(std::in_place_index_t<I> i, Args&&... args)
    : state_(i, std::forward<Args>(args)...) {}

  void check_completed() const {
    if (is_cancelled()) {
      throw usage_error("value() called on the result of a cancelled scope");
    }
  }

  void check_cancelled() const {
    if (!is_cancelled()) {
      throw usage_error("cancellation() called on a scope that completed");
    }
  }

  std::variant<value_storage, C> state_;
};

/// Outcome of a single scope_driver::advance() call.
template <typename T, cancellation_payload C>
class scope_poll {
public:
  using result_type = scope_result<T, C>;

  static scope_poll pending() noexcept { return scope_poll{}; }

  static scope_poll ready(result_type result) {
    return scope_poll{std::move(result)};
  }

  bool is_ready() const noexcept { return result_.has_value(); }

  bool is_pending() const noexcept { return !result_.has_value(); }

  /// \pre is_ready()
  result_type& result() & noexcept { return *result_; }

  const result_type& result() const& noexcept { return *result_; }

  result_type&& result() && noexcept { return std::move(*result_); }

private:
  scope_poll() noexcept = default;

  explicit scope_poll(result_type&& result) : result_(std::move(result)) {}

  std::optional<result_type> result_;
};

}  // namespace tether
