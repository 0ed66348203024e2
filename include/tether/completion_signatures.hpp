///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

namespace tether {

/// Tag types identifying which kind of completion a signature describes.
struct value_tag {};
struct error_tag {};

template <typename Tag, typename... Datums>
struct result_t;

template <typename... Vs>
struct result_t<value_tag, Vs...> {};
template <typename E>
struct result_t<error_tag, E> {};

template <typename... Vs>
using value_t = result_t<value_tag, Vs...>;
template <typename E>
using error_t = result_t<error_tag, E>;

/// The set of ways in which a sender may complete.
template <typename... Sigs>
struct completion_signatures {};

}  // namespace tether
