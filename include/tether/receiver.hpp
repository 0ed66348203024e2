///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <utility>

#include <tether/completion_signatures.hpp>
#include <tether/concepts.hpp>
#include <tether/parameter_type.hpp>

namespace tether {

template <typename T>
concept receiver = nothrow_move_constructible<T> && requires(const T& t) {
  { t.get_env() } noexcept;
};

template <typename... Vs>
struct set_value_t {
  template <typename Receiver>
  void operator()(Receiver&& r, parameter_type<Vs>... vs) const noexcept {
    using sig_t = value_t<Vs...>;
    static_assert(
        noexcept(r.set_result(sig_t{}, tether::forward_parameter<Vs>(vs)...)),
        "set_result() member-function invocation must be noexcept");
    r.set_result(sig_t{}, tether::forward_parameter<Vs>(vs)...);
  }
};

template <typename... Vs>
inline constexpr set_value_t<Vs...> set_value{};

template <typename E>
struct set_error_t {
  template <typename Receiver>
  void operator()(Receiver&& r, parameter_type<E> e) const noexcept {
    using sig_t = error_t<E>;
    static_assert(
        noexcept(r.set_result(sig_t{}, tether::forward_parameter<E>(e))),
        "set_result() member-function invocation must be noexcept");
    r.set_result(sig_t{}, tether::forward_parameter<E>(e));
  }
};

template <typename E>
inline constexpr set_error_t<E> set_error{};

}  // namespace tether
