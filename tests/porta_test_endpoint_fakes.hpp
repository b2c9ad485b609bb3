// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.


// In-memory transport, connection and protocol handler for endpoint tests.

#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "porta/porta.hpp"

namespace porta::test
{

class FakeConnection : public network::IConnection
{
public:
  explicit FakeConnection(std::string peer = "fake:1") : _peer(std::move(peer)) {}

  void close() noexcept override
  {
    if (!_closed.exchange(true))
    {
      ++closeCount;
    }
  }
  bool isOpen() const override { return !_closed.load(); }
  int nativeHandle() const override { return -1; }
  std::string peerAddress() const override { return _peer; }

  std::atomic<int> closeCount{0};

private:
  std::string _peer;
  std::atomic<bool> _closed{false};
};

/// Connection that reports its closing through a flag owned by the test, so
/// the test can observe it after the endpoint destroyed the connection.
class ObservedConnection : public network::IConnection
{
public:
  explicit ObservedConnection(std::shared_ptr<std::atomic<bool>> closed)
      : _closed(std::move(closed))
  {
  }
  void close() noexcept override { _closed->store(true); }
  bool isOpen() const override { return !_closed->load(); }
  int nativeHandle() const override { return -1; }
  std::string peerAddress() const override { return "observed:1"; }

private:
  std::shared_ptr<std::atomic<bool>> _closed;
};

/// Transport whose acceptOne() hands out queued results and otherwise
/// reports Idle after a short wait.
class ScriptedTransport : public network::ITransport
{
public:
  void bind(const network::ListenOptions &options) override
  {
    if (failBind)
    {
      throw std::runtime_error("address already in use");
    }
    ++binds;
    lastOptions = options;
    _bound = true;
  }

  void unbind() override
  {
    if (_bound.exchange(false))
    {
      ++unbinds;
    }
  }

  network::AcceptResult acceptOne() override
  {
    ++acceptCalls;
    if (!_bound)
    {
      return network::AcceptResult::fatalFailure("listener closed");
    }
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (!_script.empty())
      {
        auto result = std::move(_script.front());
        _script.pop_front();
        return result;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return network::AcceptResult::idle();
  }

  void configureConnection(network::IConnection &, const network::SocketOptions &options) override
  {
    ++configured;
    lastSocketOptions = options;
  }

  int localPort() const override { return _bound ? 4242 : -1; }
  bool cancelPendingAccept() override { return true; }

  void push(network::AcceptResult result)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _script.push_back(std::move(result));
  }

  void pushConnection(std::unique_ptr<network::IConnection> connection)
  {
    push(network::AcceptResult::accepted(std::move(connection)));
  }

  std::size_t pending() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _script.size();
  }

  bool bound() const { return _bound.load(); }

  std::atomic<bool> failBind{false};
  std::atomic<int> binds{0};
  std::atomic<int> unbinds{0};
  std::atomic<int> acceptCalls{0};
  std::atomic<int> configured{0};
  network::ListenOptions lastOptions;
  network::SocketOptions lastSocketOptions;

private:
  mutable std::mutex _mutex;
  std::deque<network::AcceptResult> _script;
  std::atomic<bool> _bound{false};
};

/// Protocol handler that keeps every connection open until told otherwise.
class KeepOpenHandler : public network::IProtocolHandler
{
public:
  network::SocketState process(const network::SocketWrapperPtr &wrapper,
                               network::SocketEvent) override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    ++processed;
    _lastThread = std::this_thread::get_id();
    keepAliveLeft = wrapper->keepAliveLeft();
    keepAliveTimeoutMs = wrapper->keepAliveTimeout().count();
    if (failUnrecoverable)
    {
      throw core::UnrecoverableError("handler state corrupted");
    }
    if (result != network::SocketState::Closed)
    {
      _open[wrapper->id()] = wrapper;
    }
    return result;
  }

  std::vector<network::SocketWrapperPtr> getOpenConnections() override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<network::SocketWrapperPtr> open;
    for (const auto &entry : _open)
    {
      open.push_back(entry.second);
    }
    return open;
  }

  void release(const network::SocketWrapperPtr &wrapper) override
  {
    std::lock_guard<std::mutex> lock(_mutex);
    ++released;
    _open.erase(wrapper->id());
  }

  void pause() override { ++pauses; }
  void recycle() override { ++recycles; }

  /// Close one kept connection as a protocol would on end of stream.
  bool closeOne()
  {
    network::SocketWrapperPtr wrapper;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_open.empty())
      {
        return false;
      }
      wrapper = _open.begin()->second;
      _open.erase(_open.begin());
    }
    wrapper->close();
    return true;
  }

  std::size_t openCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _open.size();
  }

  std::thread::id processThread() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastThread;
  }

  network::SocketState result{network::SocketState::Open};
  std::atomic<int> processed{0};
  std::atomic<int> released{0};
  std::atomic<int> pauses{0};
  std::atomic<int> recycles{0};
  std::atomic<bool> failUnrecoverable{false};
  std::atomic<int> keepAliveLeft{0};
  std::atomic<long long> keepAliveTimeoutMs{0};

private:
  mutable std::mutex _mutex;
  std::map<std::uint64_t, network::SocketWrapperPtr> _open;
  std::thread::id _lastThread;
};

/// Executor that runs tasks on the calling thread, or throws failure instead
/// when one is set.
class ScriptedExecutor : public core::IExecutor
{
public:
  void execute(std::function<void()> task) override
  {
    ++submitted;
    std::exception_ptr error;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      error = _failure;
    }
    if (error)
    {
      std::rethrow_exception(error);
    }
    task();
  }

  void failWith(std::exception_ptr failure)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _failure = std::move(failure);
  }

  std::atomic<int> submitted{0};

private:
  std::mutex _mutex;
  std::exception_ptr _failure;
};

} // namespace porta::test
