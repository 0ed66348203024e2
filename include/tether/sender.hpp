///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

#include <tether/completion_signatures.hpp>
#include <tether/concepts.hpp>

namespace tether {

/// Concept for types that are senders.
///
/// \note
/// There is nothing syntactic that distinguishes senders from other
/// move-constructible class types. Use sender_in when an environment is known.
template <typename T>
concept sender = std::is_class_v<T> && std::move_constructible<T>;

//
// completion_signatures_for
//

template <typename Sender, typename... Env>
struct completion_signatures_for;

template <typename Sender, typename Env>
  requires requires(Sender&& sender, Env env) {
    std::forward<Sender>(sender).get_completion_signatures(std::move(env));
  }
struct completion_signatures_for<Sender, Env> {
  using type = decltype(std::declval<Sender>().get_completion_signatures(
      std::declval<Env>()));
};

template <typename Sender>
  requires requires(Sender&& sender) {
    std::forward<Sender>(sender).get_completion_signatures();
  }
struct completion_signatures_for<Sender> {
  using type = decltype(std::declval<Sender>().get_completion_signatures());
};

template <typename Sender, typename Env>
  requires(!requires(Sender&& sender, Env env) {
    std::forward<Sender>(sender).get_completion_signatures(std::move(env));
  })
struct completion_signatures_for<Sender, Env>
  : completion_signatures_for<Sender> {};

template <typename Sender, typename... Envs>
using completion_signatures_for_t =
    typename completion_signatures_for<Sender, Envs...>::type;

template <typename T, typename... Env>
concept sender_in = sender<std::remove_cvref_t<T>> && requires {
  typename completion_signatures_for_t<T, Env...>;
  requires instance_of<
      completion_signatures_for_t<T, Env...>,
      completion_signatures>;
};

}  // namespace tether
