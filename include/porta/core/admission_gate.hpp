// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include <porta/core/logger.hpp>

namespace porta
{
namespace core
{

/// \brief Counting gate with an adjustable upper bound.
///
/// Callers block in tryAcquireOrAwait() while the count has reached the
/// limit. A limit of -1 disables the gate: every waiter is released and
/// nothing is counted until a non-negative limit is set again. Count and
/// limit are guarded by one mutex so a limit change can never race a waiter
/// into a lost wakeup.
class AdmissionGate
{
public:
  static constexpr long kDisabled = -1;

  enum class AcquireResult
  {
    Acquired,   ///< A slot was counted; pair with release().
    Bypassed,   ///< Gate is disabled; nothing was counted.
    Interrupted ///< interruptWaiters() cancelled the wait; nothing was counted.
  };

  explicit AdmissionGate(long limit = kDisabled) : _limit(limit < 0 ? kDisabled : limit) {}

  AdmissionGate(const AdmissionGate &) = delete;
  AdmissionGate &operator=(const AdmissionGate &) = delete;

  /// \brief Block until a slot is free or the gate is disabled.
  AcquireResult tryAcquireOrAwait()
  {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_limit == kDisabled)
    {
      return AcquireResult::Bypassed;
    }

    const std::uint64_t generation = _interruptGeneration;
    ++_waiters;
    _cv.wait(lock, [&]()
             { return _limit == kDisabled || _count < _limit || generation != _interruptGeneration; });
    --_waiters;

    if (generation != _interruptGeneration)
    {
      return AcquireResult::Interrupted;
    }
    if (_limit == kDisabled)
    {
      return AcquireResult::Bypassed;
    }
    ++_count;
    return AcquireResult::Acquired;
  }

  /// \brief Give back one slot.
  /// \return the new count, or -1 when the gate is disabled or the release
  /// had nothing to give back
  long release()
  {
    bool anomaly = false;
    long result = kDisabled;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_limit == kDisabled)
      {
        return kDisabled;
      }
      if (_count == 0)
      {
        ++_anomalies;
        anomaly = true;
      }
      else
      {
        result = --_count;
      }
    }
    if (anomaly)
    {
      PORTA_LOG_WARN("AdmissionGate: release() without a matching acquire, count stays at 0");
      return kDisabled;
    }
    _cv.notify_one();
    return result;
  }

  /// \brief Change the bound. -1 disables the gate and releases all waiters;
  /// enabling a disabled gate starts counting from zero.
  void setLimit(long limit)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (limit < 0)
      {
        _limit = kDisabled;
        _count = 0;
      }
      else
      {
        if (_limit == kDisabled)
        {
          _count = 0;
        }
        _limit = limit;
      }
    }
    _cv.notify_all();
  }

  /// \brief Set a new limit and zero the count. Used when an endpoint starts.
  void reset(long limit)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _limit = limit < 0 ? kDisabled : limit;
      _count = 0;
    }
    _cv.notify_all();
  }

  /// \brief Wake every parked caller with AcquireResult::Interrupted.
  void interruptWaiters()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      ++_interruptGeneration;
    }
    _cv.notify_all();
  }

  /// \return -1 when disabled, otherwise the live count
  long currentCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _limit == kDisabled ? kDisabled : _count;
  }

  long limit() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _limit;
  }

  bool enabled() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _limit != kDisabled;
  }

  std::size_t waiters() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _waiters;
  }

  /// Number of releases that found nothing to release.
  std::uint64_t anomalies() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _anomalies;
  }

private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  long _limit;
  long _count{0};
  std::size_t _waiters{0};
  std::uint64_t _interruptGeneration{0};
  std::uint64_t _anomalies{0};
};

} // namespace core
} // namespace porta
