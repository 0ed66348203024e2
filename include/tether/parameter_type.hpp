///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <type_traits>

namespace tether {

/// Trait that queries whether a prvalue of a particular type is best passed
/// to a completion function by value or by rvalue-reference.
///
/// Users may specialise this for their own result or payload types.
template <typename T>
inline constexpr bool enable_pass_by_value =
    std::is_trivially_copy_constructible_v<T> &&
    std::is_trivially_move_constructible_v<T> &&
    std::is_trivially_destructible_v<T> && (sizeof(T) <= (2 * sizeof(void*)));

/// Compute the parameter-type to use when passing a value of type \c T.
template <typename T>
using parameter_type = std::conditional_t<enable_pass_by_value<T>, T, T&&>;

/// Forwards an lvalue of type \c T as a \c parameter_type<T>.
template <typename T>
parameter_type<T> forward_parameter(T& x) noexcept {
  return static_cast<T&&>(x);
}

}  // namespace tether
