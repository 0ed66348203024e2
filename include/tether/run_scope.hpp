///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <exception>
#include <tuple>
#include <utility>
#include <variant>

#include <tether/completion_signatures.hpp>
#include <tether/run_loop.hpp>
#include <tether/scope_driver.hpp>
#include <tether/scope_result.hpp>
#include <tether/scope_sender.hpp>
#include <tether/sync_wait.hpp>
#include <tether/usage_error.hpp>

namespace tether {

/// Run a scope to completion on a private run_loop and return its result.
///
/// \throws
/// Rethrows any exception that escaped the body or one of its jobs.
template <cancellation_payload C, typename Factory>
  requires detail::scope_factory<Factory, C>
scope_result<body_result_t<Factory, C>, C> run_scope(Factory&& factory) {
  using result_type = scope_result<body_result_t<Factory, C>, C>;

  run_loop loop;
  auto result = tether::sync_wait(
      tether::make_scope_sender<C>(loop, std::forward<Factory>(factory)), loop);

  if (auto* error =
          std::get_if<std::tuple<error_tag, std::exception_ptr>>(&result)) {
    std::rethrow_exception(std::get<1>(*error));
  }
  return std::get<1>(
      std::get<std::tuple<value_tag, result_type>>(std::move(result)));
}

/// Run a scope that is never expected to be cancelled and return the value
/// of its body.
///
/// \throws usage_error
/// If the scope was cancelled after all.
template <typename Factory>
  requires detail::scope_factory<Factory, std::monostate>
body_result_t<Factory, std::monostate> run_scope_unwrap(Factory&& factory) {
  auto result =
      tether::run_scope<std::monostate>(std::forward<Factory>(factory));
  return std::move(result).value();
}

}  // namespace tether
