///////////////////////////////////////////////////////////////////////////////
// Tether
// Copyright 2026, The Tether Authors
// Licensed under Apache License 2.0 with LLVM Exceptions.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <stdexcept>

namespace tether {

/// Thrown when a scope, driver or job handle is used in a way that breaks its
/// contract, e.g. advancing a driver that has already reported completion or
/// awaiting the same job handle twice.
///
/// These indicate a bug in the calling code rather than a runtime condition
/// that the caller is expected to recover from.
class usage_error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

}  // namespace tether
