///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <exception>
#include <stop_token>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include <tether/completion_signatures.hpp>
#include <tether/empty_env.hpp>
#include <tether/parameter_type.hpp>
#include <tether/receiver.hpp>
#include <tether/run_loop.hpp>
#include <tether/sender.hpp>

namespace tether {

namespace sync_wait_detail {

template <typename Sig>
struct signature_to_tuple;

template <typename Tag, typename... Datums>
struct signature_to_tuple<result_t<Tag, Datums...>> {
  using type = std::tuple<Tag, Datums...>;
};

template <typename Sigs>
struct signatures_to_variant;

// One std::tuple<Tag, Datums...> alternative per completion signature, with
// std::monostate for "not yet completed".
template <typename... Sigs>
struct signatures_to_variant<completion_signatures<Sigs...>> {
  using type =
      std::variant<std::monostate, typename signature_to_tuple<Sigs>::type...>;
};

template <typename Src, typename Env>
using result_variant_t = typename signatures_to_variant<
    completion_signatures_for_t<Src, Env>>::type;

// If storing the datums throws, stores an error_t<std::exception_ptr> result
// instead. Senders whose datums may throw on move must list that signature.
template <typename Variant, typename Tag, typename... Datums>
void store_result(
    Variant& result, result_t<Tag, Datums...>, Datums&... datums) noexcept {
  constexpr bool is_nothrow =
      (std::is_nothrow_move_constructible_v<Datums> && ...);
  if constexpr (is_nothrow) {
    result.template emplace<std::tuple<Tag, Datums...>>(
        Tag{}, std::move(datums)...);
  } else {
    try {
      result.template emplace<std::tuple<Tag, Datums...>>(
          Tag{}, std::move(datums)...);
    } catch (...) {
      result.template emplace<std::tuple<error_tag, std::exception_ptr>>(
          error_tag{}, std::current_exception());
    }
  }
}

template <typename Result>
struct sync_wait_state {
private:
  struct receiver {
    sync_wait_state& state;

    template <typename Tag, typename... Datums>
    void set_result(
        result_t<Tag, Datums...> sig,
        parameter_type<Datums>... datums) noexcept {
      sync_wait_detail::store_result(state.result, sig, datums...);
      state.ss.request_stop();
    }

    empty_env get_env() const noexcept { return {}; }
  };

public:
  receiver get_receiver() noexcept { return receiver{*this}; }

  std::stop_source ss;
  Result result;
};

}  // namespace sync_wait_detail

/// Connect and start \c src, then drive \c loop until it completes.
///
/// \return
/// A std::variant holding a std::tuple<Tag, Datums...> for the completion
/// that occurred.
template <typename Src>
  requires sender_in<Src, empty_env>
auto sync_wait(Src&& src, run_loop& loop) {
  using result_type = sync_wait_detail::result_variant_t<Src, empty_env>;
  sync_wait_detail::sync_wait_state<result_type> state;
  auto op = std::forward<Src>(src).connect(state.get_receiver());
  op.start();

  loop.run(state.ss.get_token());
  return std::move(state.result);
}

}  // namespace tether
