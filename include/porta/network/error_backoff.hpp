// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <thread>

namespace porta
{
namespace network
{

/// \brief Delay policy for consecutive accept failures.
///
/// The first failure is retried at once; each further one waits twice as
/// long as the previous, capped at kMaxDelayMs. Callers reset their stored
/// delay to zero after a successful accept.
struct ErrorBackoff
{
  static constexpr int kInitialDelayMs = 50;
  static constexpr int kMaxDelayMs = 1600;

  static constexpr int next(int currentDelayMs)
  {
    if (currentDelayMs <= 0)
    {
      return kInitialDelayMs;
    }
    return currentDelayMs >= kMaxDelayMs / 2 ? kMaxDelayMs : currentDelayMs * 2;
  }

  /// Sleep for \p currentDelayMs (if positive) and return the delay to use
  /// for the next failure.
  static int handleWithDelay(int currentDelayMs)
  {
    if (currentDelayMs > 0)
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(currentDelayMs));
    }
    return next(currentDelayMs);
  }
};

} // namespace network
} // namespace porta
