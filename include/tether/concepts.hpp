///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <concepts>
#include <type_traits>

namespace tether {

template <typename T, typename... Args>
concept nothrow_constructible_from = std::constructible_from<T, Args...> &&
    std::is_nothrow_constructible_v<T, Args...>;

template <typename T>
concept nothrow_move_constructible =
    std::move_constructible<T> && nothrow_constructible_from<T, T>;

template <typename T>
concept decay_copyable = std::constructible_from<std::decay_t<T>, T>;

namespace detail {
template <typename T, template <typename...> class Template>
inline constexpr bool is_instance_of_v = false;

template <template <typename...> class Template, typename... Ts>
inline constexpr bool is_instance_of_v<Template<Ts...>, Template> = true;
}  // namespace detail

template <typename T, template <typename...> class Template>
concept instance_of = detail::is_instance_of_v<T, Template>;

/// A type that can be used as the cancellation payload of a scope.
///
/// The payload is stored by value inside the scope and handed back to the
/// caller exactly once, so it only needs to be movable.
template <typename T>
concept cancellation_payload =
    std::is_object_v<T> && !std::is_array_v<T> && std::move_constructible<T>;

}  // namespace tether
