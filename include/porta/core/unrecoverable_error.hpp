// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <exception>
#include <stdexcept>

namespace porta
{
namespace core
{

/// \brief Marker base for faults that must never be masked by a generic
/// error handler. Code that catches std::exception to keep a loop alive calls
/// rethrowIfUnrecoverable() first.
class UnrecoverableError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// \brief Rethrow the exception being handled if it is an UnrecoverableError.
/// Must be called from inside a catch block that caught \p e.
inline void rethrowIfUnrecoverable(const std::exception &e)
{
  if (dynamic_cast<const UnrecoverableError *>(&e) != nullptr)
  {
    throw;
  }
}

} // namespace core
} // namespace porta
