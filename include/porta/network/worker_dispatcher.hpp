// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <porta/core/logger.hpp>
#include <porta/core/thread_pool.hpp>

namespace porta
{
namespace network
{

/// \brief Owns or borrows the worker pool that runs connection processing.
///
/// An internal pool is created from the configured bounds and shut down by
/// shutdownExecutor(). An external executor set with setExecutor() is only
/// used, never resized or shut down. Thread counts of an external executor are
/// reported only when it is a core::ThreadPool.
class WorkerDispatcher
{
public:
  struct Settings
  {
    std::string name{"TP"};
    int minSpareThreads{10};
    int maxThreads{200};
    std::size_t maxQueueSize{10000};
    std::chrono::milliseconds threadIdleTimeout{std::chrono::seconds(60)};
    std::chrono::milliseconds terminationTimeout{std::chrono::milliseconds(5000)};
  };

  explicit WorkerDispatcher(Settings settings) : _settings(std::move(settings)) {}

  WorkerDispatcher(const WorkerDispatcher &) = delete;
  WorkerDispatcher &operator=(const WorkerDispatcher &) = delete;

  ~WorkerDispatcher()
  {
    std::shared_ptr<core::ThreadPool> pool;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      pool = std::move(_pool);
      _executor.reset();
    }
    if (pool)
    {
      pool->shutdownNow(_settings.terminationTimeout);
    }
    _retired.clear();
  }

  /// Create the internal worker pool. No-op when an executor is present.
  void createExecutor()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_executor)
    {
      return;
    }
    const auto maxThreads = static_cast<std::size_t>(std::max(1, _settings.maxThreads));
    const auto minThreads = std::min(static_cast<std::size_t>(std::max(0, _settings.minSpareThreads)),
                                     maxThreads);
    const std::string poolName = _settings.name + "-exec";
    // Task failures are logged by the pool under this name.
    _pool = std::make_shared<core::ThreadPool>(minThreads, maxThreads, _settings.threadIdleTimeout,
                                               _settings.maxQueueSize, nullptr, poolName);
    _executor = _pool;
    PORTA_LOG_DEBUG("WorkerDispatcher[" << _settings.name << "] created executor min=" << minThreads
                                        << " max=" << maxThreads
                                        << " queue=" << _settings.maxQueueSize);
  }

  /// Shut down and forget an internal pool. Queued tasks are discarded and
  /// running ones get the termination grace period.
  void shutdownExecutor()
  {
    std::shared_ptr<core::ThreadPool> pool;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (!_pool)
      {
        return;
      }
      pool = std::move(_pool);
      _pool.reset();
      _executor.reset();
    }

    if (!pool->shutdownNow(_settings.terminationTimeout))
    {
      PORTA_LOG_WARN("WorkerDispatcher[" << _settings.name << "] executor still has "
                                         << pool->getActiveThreadCount()
                                         << " busy worker(s) after "
                                         << _settings.terminationTimeout.count() << "ms");
      // Joined when the dispatcher is destroyed.
      std::lock_guard<std::mutex> lock(_mutex);
      _retired.push_back(std::move(pool));
    }
  }

  /// Use an executor owned elsewhere. A previously created internal pool is
  /// shut down first.
  void setExecutor(std::shared_ptr<core::IExecutor> executor)
  {
    shutdownExecutor();
    std::lock_guard<std::mutex> lock(_mutex);
    _executor = std::move(executor);
  }

  std::shared_ptr<core::IExecutor> executor() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _executor;
  }

  /// The executor as a ThreadPool, nullptr if there is none or it is some
  /// other kind of executor.
  std::shared_ptr<core::ThreadPool> pool() const
  {
    return std::dynamic_pointer_cast<core::ThreadPool>(executor());
  }

  bool hasExecutor() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<bool>(_executor);
  }

  bool isInternal() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<bool>(_pool);
  }

  /// Run \p task on the worker pool.
  /// \throws core::TaskRejectedError when saturated or shutting down, or
  /// whatever the executor throws when it cannot take the task (for a
  /// ThreadPool, std::system_error when a worker thread cannot be started)
  void execute(std::function<void()> task)
  {
    auto target = executor();
    if (!target)
    {
      throw core::TaskRejectedError("WorkerDispatcher " + _settings.name + " has no executor");
    }
    target->execute(std::move(task));
  }

  void setMinSpareThreads(int minSpareThreads)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _settings.minSpareThreads = minSpareThreads;
    if (_pool)
    {
      _pool->setMinThreads(static_cast<std::size_t>(
        std::max(0, std::min(minSpareThreads, _settings.maxThreads))));
    }
  }

  void setMaxThreads(int maxThreads)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _settings.maxThreads = maxThreads;
    if (_pool)
    {
      const auto max = static_cast<std::size_t>(std::max(1, maxThreads));
      if (_pool->getMinThreads() > max)
      {
        _pool->setMinThreads(max);
      }
      _pool->setMaxThreads(max);
    }
  }

  /// -1 when an external executor is in use.
  int getMinSpareThreads() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_executor && !_pool)
    {
      return -1;
    }
    return std::min(_settings.minSpareThreads, _settings.maxThreads);
  }

  /// -1 when an external executor is in use.
  int getMaxThreads() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_executor && !_pool)
    {
      return -1;
    }
    return _settings.maxThreads;
  }

  /// -2 when no executor exists, -1 when it is not a ThreadPool.
  int getCurrentThreadCount() const
  {
    if (!hasExecutor())
    {
      return -2;
    }
    auto threads = pool();
    return threads ? static_cast<int>(threads->getTotalThreadCount()) : -1;
  }

  /// -2 when no executor exists, -1 when it is not a ThreadPool.
  int getCurrentThreadsBusy() const
  {
    if (!hasExecutor())
    {
      return -2;
    }
    auto threads = pool();
    return threads ? static_cast<int>(threads->getActiveThreadCount()) : -1;
  }

private:
  mutable std::mutex _mutex;
  Settings _settings;
  std::shared_ptr<core::IExecutor> _executor;
  /// Set only while the internal pool is in use; same object as _executor.
  std::shared_ptr<core::ThreadPool> _pool;
  std::vector<std::shared_ptr<core::ThreadPool>> _retired;
};

} // namespace network
} // namespace porta
