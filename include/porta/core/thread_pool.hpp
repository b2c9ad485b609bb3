// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <porta/core/logger.hpp>

namespace porta
{
namespace core
{

/// \brief Thrown when a task is refused because the pool is shutting down or
/// its queue is full.
class TaskRejectedError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// \brief Runs fire-and-forget tasks on threads it manages.
class IExecutor
{
public:
  virtual ~IExecutor() = default;

  /// \throws TaskRejectedError when the task is refused
  virtual void execute(std::function<void()> task) = 0;
};

/// A dynamic thread pool that accepts void or result-returning lambdas with
/// arbitrary arguments. Threads grow up to the maximum while no idle worker
/// is available and shrink back to the minimum after the idle timeout.
/// Exceptions in tasks can be reported.
class ThreadPool : public IExecutor
{
public:
  /// Constructs the thread pool.
  ///
  /// @param minThreads   Number of threads always kept alive.
  /// @param maxThreads   Hard limit on concurrently alive threads.
  /// @param idleTimeout  Duration after which idle threads above the minimum
  /// exit.
  /// @param maxQueueSize Maximum number of queued tasks before submissions are
  /// rejected.
  /// @param onTaskError  Optional handler for uncaught exceptions in tasks.
  /// @param name         Name used in log output.
  ThreadPool(std::size_t minThreads = std::thread::hardware_concurrency(),
             std::size_t maxThreads = std::thread::hardware_concurrency() * 4,
             std::chrono::milliseconds idleTimeout = std::chrono::seconds(60),
             std::size_t maxQueueSize = 1024,
             std::function<void(std::exception_ptr)> onTaskError = nullptr,
             std::string name = "pool")
      : _minThreads(minThreads), _maxThreads(maxThreads), _idleTimeout(idleTimeout),
        _maxQueueSize(maxQueueSize), _onTaskError(std::move(onTaskError)), _name(std::move(name))
  {
    if (_maxThreads == 0)
    {
      throw std::invalid_argument("ThreadPool maxThreads must be at least 1");
    }
    if (_minThreads > _maxThreads)
    {
      throw std::invalid_argument("ThreadPool minThreads exceeds maxThreads");
    }
    for (std::size_t i = 0; i < _minThreads; ++i)
    {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_liveThreads;
      }
      spawnWorker();
    }
  }

  ~ThreadPool() override { shutdown(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /// Same as enqueue(task).
  void execute(std::function<void()> task) override { submit(std::move(task), true); }

  /// Enqueue a fire-and-forget task (void-returning) with arguments.
  /// @throws TaskRejectedError if the pool is shutting down or the queue is
  /// full; std::system_error if a needed worker thread cannot be created.
  template <typename F, typename... Args> void enqueue(F &&func, Args &&...args)
  {
    submit(std::bind(std::forward<F>(func), std::forward<Args>(args)...), true);
  }

  /// Try to enqueue a task, returning false if the pool refuses it instead of
  /// throwing. Thread creation failures still propagate.
  template <typename F, typename... Args> bool tryEnqueue(F &&func, Args &&...args)
  {
    return submit(std::bind(std::forward<F>(func), std::forward<Args>(args)...), false);
  }

  /// Enqueue a task that returns a value and get a future for it.
  template <typename F, typename... Args>
  auto enqueueWithResult(F &&func, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    submit([task]() { (*task)(); }, true);
    return future;
  }

  /// Get the number of pending tasks in the queue.
  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  /// Get the number of threads currently executing a task.
  std::size_t getActiveThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _activeThreads;
  }

  /// Get the number of live worker threads.
  std::size_t getTotalThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _liveThreads;
  }

  std::size_t getMinThreads() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _minThreads;
  }

  std::size_t getMaxThreads() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _maxThreads;
  }

  std::size_t getMaxQueueSize() const { return _maxQueueSize; }

  bool isShutdown() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _shutdown;
  }

  /// Change the number of threads kept alive. Missing threads are started
  /// immediately.
  void setMinThreads(std::size_t minThreads)
  {
    std::size_t toSpawn = 0;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (minThreads > _maxThreads)
      {
        throw std::invalid_argument("ThreadPool minThreads exceeds maxThreads");
      }
      _minThreads = minThreads;
      if (!_shutdown && _liveThreads < _minThreads)
      {
        toSpawn = _minThreads - _liveThreads;
        _liveThreads += toSpawn;
      }
    }
    _condition.notify_all();
    for (std::size_t i = 0; i < toSpawn; ++i)
    {
      spawnReserved();
    }
  }

  /// Change the thread limit. Idle threads above the new limit exit; busy
  /// ones exit after their current task.
  void setMaxThreads(std::size_t maxThreads)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (maxThreads == 0 || maxThreads < _minThreads)
      {
        throw std::invalid_argument("ThreadPool maxThreads must be >= minThreads and >= 1");
      }
      _maxThreads = maxThreads;
    }
    _condition.notify_all();
  }

  /// Graceful shutdown: refuse new tasks, run everything already queued and
  /// join all workers. Blocking; safe to call more than once.
  void shutdown()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _shutdown = true;
    }
    _condition.notify_all();
    joinAll();
  }

  /// Immediate shutdown: refuse new tasks, discard queued ones and wait up to
  /// \p grace for running tasks to finish. Workers are joined only when they
  /// all went idle in time; otherwise they are joined by the destructor.
  /// \return true if no task was running when the call returned
  bool shutdownNow(std::chrono::milliseconds grace)
  {
    std::queue<std::function<void()>> dropped;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _shutdown = true;
      std::swap(dropped, _tasks);
    }
    _condition.notify_all();

    if (!dropped.empty())
    {
      PORTA_LOG_DEBUG("ThreadPool[" << _name << "] discarded " << dropped.size()
                                    << " queued task(s)");
    }
    // Discarded tasks release their captures here, outside the lock.
    dropped = {};

    bool idle = false;
    {
      std::unique_lock<std::mutex> lock(_mutex);
      idle = _idleCondition.wait_for(lock, grace, [this]() { return _activeThreads == 0; });
    }
    if (idle)
    {
      joinAll();
    }
    return idle;
  }

private:
  bool submit(std::function<void()> task, bool throwOnReject)
  {
    bool spawn = false;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (!checkAccepting(throwOnReject))
      {
        return false;
      }
      if (_idleThreads <= _tasks.size() && _liveThreads < _maxThreads)
      {
        ++_liveThreads;
        spawn = true;
      }
    }

    // Start the worker before queueing so a creation failure leaves nothing
    // behind in the queue.
    if (spawn)
    {
      spawnReserved();
    }

    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (!checkAccepting(throwOnReject))
      {
        return false;
      }
      _tasks.emplace(std::move(task));
    }
    _condition.notify_one();
    return true;
  }

  // Requires _mutex.
  bool checkAccepting(bool throwOnReject) const
  {
    if (_shutdown)
    {
      if (throwOnReject)
      {
        throw TaskRejectedError("ThreadPool " + _name + " is shutting down");
      }
      return false;
    }
    if (_tasks.size() >= _maxQueueSize)
    {
      if (throwOnReject)
      {
        throw TaskRejectedError("ThreadPool " + _name + " task queue is full");
      }
      return false;
    }
    return true;
  }

  // Spawns a worker whose slot was already counted in _liveThreads.
  void spawnReserved()
  {
    try
    {
      spawnWorker();
    }
    catch (...)
    {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        --_liveThreads;
      }
      throw;
    }
  }

  void spawnWorker()
  {
    reapFinished();
    std::thread t([this]() { workerLoop(); });
    std::lock_guard<std::mutex> lock(_mutex);
    _threads.emplace(t.get_id(), std::move(t));
  }

  void workerLoop()
  {
    while (true)
    {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(_mutex);
        ++_idleThreads;
        bool woke = _condition.wait_for(lock, _idleTimeout, [this]()
                                        { return _shutdown || !_tasks.empty() || _liveThreads > _maxThreads; });
        --_idleThreads;

        if (!_tasks.empty() && _liveThreads <= _maxThreads)
        {
          task = std::move(_tasks.front());
          _tasks.pop();
          ++_activeThreads;
        }
        else if (_shutdown || _liveThreads > _maxThreads || (!woke && _liveThreads > _minThreads))
        {
          --_liveThreads;
          _finished.push_back(std::this_thread::get_id());
          return;
        }
        else
        {
          continue;
        }
      }

      runTask(task);
      // Destroy captures before reporting the thread idle.
      task = nullptr;

      {
        std::lock_guard<std::mutex> lock(_mutex);
        --_activeThreads;
      }
      _idleCondition.notify_all();
    }
  }

  void runTask(const std::function<void()> &task)
  {
    try
    {
      task();
    }
    catch (...)
    {
      if (_onTaskError)
      {
        _onTaskError(std::current_exception());
      }
      else
      {
        PORTA_LOG_ERROR("ThreadPool[" << _name << "] unhandled exception in task: "
                                      << describe(std::current_exception()));
      }
    }
  }

  static std::string describe(std::exception_ptr eptr)
  {
    try
    {
      std::rethrow_exception(eptr);
    }
    catch (const std::exception &e)
    {
      return e.what();
    }
    catch (...)
    {
      return "unknown exception";
    }
  }

  // Joins threads that left their loop on their own (idle shrink).
  void reapFinished()
  {
    std::vector<std::thread> done;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      for (auto it = _finished.begin(); it != _finished.end();)
      {
        auto found = _threads.find(*it);
        if (found != _threads.end())
        {
          done.push_back(std::move(found->second));
          _threads.erase(found);
          it = _finished.erase(it);
        }
        else
        {
          ++it;
        }
      }
    }
    for (auto &t : done)
    {
      if (t.joinable())
      {
        t.join();
      }
    }
  }

  void joinAll()
  {
    while (true)
    {
      std::vector<std::thread> batch;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_threads.empty())
        {
          _finished.clear();
          return;
        }
        for (auto &entry : _threads)
        {
          batch.push_back(std::move(entry.second));
        }
        _threads.clear();
      }
      for (auto &t : batch)
      {
        if (t.joinable() && t.get_id() != std::this_thread::get_id())
        {
          t.join();
        }
        else if (t.joinable())
        {
          t.detach();
        }
      }
    }
  }

private:
  std::unordered_map<std::thread::id, std::thread> _threads;
  std::vector<std::thread::id> _finished;
  std::queue<std::function<void()>> _tasks;
  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::condition_variable _idleCondition;

  std::size_t _minThreads;
  std::size_t _maxThreads;
  const std::chrono::milliseconds _idleTimeout;
  const std::size_t _maxQueueSize;

  bool _shutdown{false};
  std::size_t _liveThreads{0};
  std::size_t _idleThreads{0};
  std::size_t _activeThreads{0};

  std::function<void(std::exception_ptr)> _onTaskError;
  const std::string _name;
};

} // namespace core
} // namespace porta
