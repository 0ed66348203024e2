///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <exception>
#include <type_traits>
#include <utility>

#include <tether/completion_signatures.hpp>
#include <tether/concepts.hpp>
#include <tether/receiver.hpp>
#include <tether/run_loop.hpp>
#include <tether/scope_driver.hpp>
#include <tether/scope_result.hpp>
#include <tether/waker.hpp>

namespace tether {

/// Operation state of a scope_sender.
///
/// The op is the loop item that polls its driver. The driver's waker
/// schedules the op, and the loop coalesces repeated wakes into one advance.
template <cancellation_payload C, typename Factory, typename Receiver>
class scope_op : private run_loop::pollable {
  using driver_type = scope_driver<body_result_t<Factory, C>, C>;
  using result_type = typename driver_type::result_type;

public:
  template <typename Factory2>
  scope_op(run_loop& loop, Factory2&& factory, Receiver r)
    : run_loop::pollable(loop, &scope_op::poll_impl)
    , receiver_(std::move(r))
    , driver_(std::forward<Factory2>(factory)) {}

  scope_op(scope_op&&) = delete;
  scope_op& operator=(scope_op&&) = delete;

  void start() noexcept { this->schedule(); }

private:
  static void poll_impl(run_loop::pollable& item) noexcept {
    static_cast<scope_op&>(item).step();
  }

  void step() noexcept {
    try {
      auto poll = driver_.advance(this->get_waker());
      if (poll.is_ready()) {
        tether::set_value<result_type>(receiver_, std::move(poll).result());
      }
    } catch (...) {
      tether::set_error<std::exception_ptr>(receiver_, std::current_exception());
    }
  }

  Receiver receiver_;
  driver_type driver_;
};

/// Sender that runs a scope on a run_loop.
///
/// Each time the scope's waker is notified the op is scheduled on the loop,
/// which advances the scope once per poll. Completes with \c value_t<scope_result<T, C>> when the scope
/// finishes, or with \c error_t<std::exception_ptr> if the body or one of its
/// jobs exits with an exception.
template <cancellation_payload C, typename Factory>
  requires detail::scope_factory<Factory, C>
class scope_sender {
  using result_type = scope_result<body_result_t<Factory, C>, C>;

public:
  template <typename Factory2>
    requires std::constructible_from<Factory, Factory2>
  scope_sender(run_loop& loop, Factory2&& factory) noexcept(
      nothrow_constructible_from<Factory, Factory2>)
    : loop_(&loop)
    , factory_(std::forward<Factory2>(factory)) {}

  static auto get_completion_signatures() -> completion_signatures<
      value_t<result_type>,
      error_t<std::exception_ptr>>;

  template <receiver Receiver>
  scope_op<C, Factory, Receiver> connect(Receiver r) && {
    return scope_op<C, Factory, Receiver>(
        *loop_, std::move(factory_), std::move(r));
  }

private:
  run_loop* loop_;
  Factory factory_;
};

template <cancellation_payload C, typename Factory>
scope_sender<C, std::decay_t<Factory>>
make_scope_sender(run_loop& loop, Factory&& factory) {
  return scope_sender<C, std::decay_t<Factory>>(
      loop, std::forward<Factory>(factory));
}

}  // namespace tether
