// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace porta
{
namespace network
{

/// \brief Bounded LIFO cache of reusable objects.
///
/// Unlike a factory-backed pool, acquire() hands out nullptr when the cache
/// is empty and the caller constructs a fresh object. Objects are expected to
/// be scrubbed before release(). A capacity of 0 disables caching.
template <typename T> class ProcessorPool
{
public:
  explicit ProcessorPool(std::size_t capacity = 500) : capacity_(capacity) {}

  ProcessorPool(const ProcessorPool &) = delete;
  ProcessorPool &operator=(const ProcessorPool &) = delete;

  std::unique_ptr<T> acquire()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_.empty())
    {
      misses_.fetch_add(1, std::memory_order_relaxed);
      return nullptr;
    }
    auto obj = std::move(available_.back());
    available_.pop_back();
    hits_.fetch_add(1, std::memory_order_relaxed);
    return obj;
  }

  /// \return false if the cache was full and \p obj was destroyed
  bool release(std::unique_ptr<T> obj)
  {
    if (!obj)
    {
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (available_.size() < capacity_)
      {
        available_.push_back(std::move(obj));
        released_.fetch_add(1, std::memory_order_relaxed);
        return true;
      }
    }
    // Destroy outside the lock.
    obj.reset();
    discarded_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  struct Stats
  {
    std::size_t available;
    std::size_t capacity;
    std::size_t hits;
    std::size_t misses;
    std::size_t released;
    std::size_t discarded;
  };

  Stats getStats() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return {available_.size(),
            capacity_,
            hits_.load(std::memory_order_relaxed),
            misses_.load(std::memory_order_relaxed),
            released_.load(std::memory_order_relaxed),
            discarded_.load(std::memory_order_relaxed)};
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_.size();
  }

  std::size_t capacity() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
  }

  void setCapacity(std::size_t capacity)
  {
    std::vector<std::unique_ptr<T>> trimmed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      capacity_ = capacity;
      while (available_.size() > capacity_)
      {
        trimmed.push_back(std::move(available_.back()));
        available_.pop_back();
      }
    }
    discarded_.fetch_add(trimmed.size(), std::memory_order_relaxed);
  }

  void clear()
  {
    std::vector<std::unique_ptr<T>> dropped;
    std::lock_guard<std::mutex> lock(mutex_);
    dropped.swap(available_);
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<T>> available_;
  std::size_t capacity_;

  std::atomic<std::size_t> hits_{0};
  std::atomic<std::size_t> misses_{0};
  std::atomic<std::size_t> released_{0};
  std::atomic<std::size_t> discarded_{0};
};

} // namespace network
} // namespace porta
