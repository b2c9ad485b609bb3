// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#ifdef __linux__
#include <pthread.h>
#endif

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <porta/core/admission_gate.hpp>
#include <porta/core/logger.hpp>
#include <porta/core/unrecoverable_error.hpp>
#include <porta/network/endpoint_types.hpp>
#include <porta/network/error_backoff.hpp>
#include <porta/network/transport.hpp>

namespace porta
{
namespace network
{

/// \brief What an acceptor needs from the endpoint that owns it.
class IAcceptorHost
{
public:
  virtual ~IAcceptorHost() = default;

  virtual bool isRunning() const = 0;
  virtual bool isPaused() const = 0;

  virtual core::AdmissionGate::AcquireResult countUpOrAwaitConnection() = 0;
  virtual long countDownConnection() = 0;

  /// Wait for the next connection on the bound transport.
  virtual AcceptResult acceptConnection() = 0;

  /// Take ownership of an accepted connection and start processing it. When
  /// \p holdsSlot is true the admission slot moves with the connection.
  /// \return false if the connection was closed instead of processed
  virtual bool handOff(std::unique_ptr<IConnection> connection, bool holdsSlot) = 0;
};

/// \brief One accept thread.
///
/// The admission slot is taken before accept so that a full endpoint leaves
/// new connections waiting in the listen backlog. The acceptor moves itself
/// to Paused while the endpoint is paused and gives back any slot it holds.
class Acceptor
{
public:
  static constexpr std::chrono::milliseconds kPausePollInterval{50};

  Acceptor(IAcceptorHost &host, std::string threadName)
      : _host(host), _threadName(std::move(threadName))
  {
  }

  ~Acceptor() { join(); }

  Acceptor(const Acceptor &) = delete;
  Acceptor &operator=(const Acceptor &) = delete;

  void start()
  {
    _thread = std::thread([this]() { run(); });
#ifdef __linux__
    // Linux limits thread names to 15 characters.
    std::string shortName = _threadName.substr(0, 15);
    pthread_setname_np(_thread.native_handle(), shortName.c_str());
#endif
  }

  void join()
  {
    if (_thread.joinable())
    {
      _thread.join();
    }
  }

  AcceptorState state() const { return _state.load(); }
  const std::string &threadName() const { return _threadName; }

  /// The accept loop. Returns once the endpoint stops running or the
  /// transport reports a fatal failure.
  void run()
  {
    _state = AcceptorState::Running;
    PORTA_LOG_DEBUG(_threadName << ": accept loop started");

    int errorDelay = 0;
    bool holdingSlot = false;
    bool fatal = false;

    while (_host.isRunning() && !fatal)
    {
      while (_host.isPaused() && _host.isRunning())
      {
        if (holdingSlot)
        {
          _host.countDownConnection();
          holdingSlot = false;
        }
        _state = AcceptorState::Paused;
        std::this_thread::sleep_for(kPausePollInterval);
      }
      if (!_host.isRunning())
      {
        break;
      }
      _state = AcceptorState::Running;

      try
      {
        bool admitted = holdingSlot;
        if (!admitted)
        {
          auto acquired = _host.countUpOrAwaitConnection();
          if (acquired == core::AdmissionGate::AcquireResult::Interrupted)
          {
            continue;
          }
          holdingSlot = acquired == core::AdmissionGate::AcquireResult::Acquired;
        }

        AcceptResult result = _host.acceptConnection();
        switch (result.status)
        {
        case AcceptStatus::Accepted:
          errorDelay = 0;
          if (_host.isRunning() && !_host.isPaused() && result.connection)
          {
            const bool slot = holdingSlot;
            holdingSlot = false;
            _host.handOff(std::move(result.connection), slot);
          }
          else if (result.connection)
          {
            result.connection->close();
          }
          break;
        case AcceptStatus::Idle:
          break;
        case AcceptStatus::TransientFailure:
          if (_host.isRunning())
          {
            PORTA_LOG_WARN(_threadName << ": accept failed: " << result.message);
          }
          errorDelay = ErrorBackoff::handleWithDelay(errorDelay);
          break;
        case AcceptStatus::FatalFailure:
          if (_host.isRunning())
          {
            PORTA_LOG_ERROR(_threadName << ": accept failed, acceptor exiting: "
                                        << result.message);
          }
          fatal = true;
          break;
        }
      }
      catch (const std::exception &e)
      {
        core::rethrowIfUnrecoverable(e);
        PORTA_LOG_ERROR(_threadName << ": unexpected error in accept loop: " << e.what());
        errorDelay = ErrorBackoff::handleWithDelay(errorDelay);
      }
    }

    if (holdingSlot)
    {
      _host.countDownConnection();
    }
    _state = AcceptorState::Ended;
    PORTA_LOG_DEBUG(_threadName << ": accept loop ended");
  }

private:
  IAcceptorHost &_host;
  std::string _threadName;
  std::atomic<AcceptorState> _state{AcceptorState::New};
  std::thread _thread;
};

/// \brief The acceptor threads of one endpoint.
class AcceptorGroup
{
public:
  explicit AcceptorGroup(IAcceptorHost &host) : _host(host) {}

  ~AcceptorGroup() { join(); }

  AcceptorGroup(const AcceptorGroup &) = delete;
  AcceptorGroup &operator=(const AcceptorGroup &) = delete;

  /// Start \p count acceptors named `<name>-Acceptor-<i>`. Acceptors left
  /// from a previous run are joined and discarded first.
  void start(int count, const std::string &name)
  {
    join();
    _acceptors.clear();
    for (int i = 0; i < count; ++i)
    {
      _acceptors.push_back(
        std::make_unique<Acceptor>(_host, name + "-Acceptor-" + std::to_string(i)));
    }
    for (auto &acceptor : _acceptors)
    {
      acceptor->start();
    }
    PORTA_LOG_INFO(name << ": started " << count << " acceptor thread(s)");
  }

  void join()
  {
    for (auto &acceptor : _acceptors)
    {
      acceptor->join();
    }
  }

  std::vector<AcceptorState> states() const
  {
    std::vector<AcceptorState> result;
    result.reserve(_acceptors.size());
    for (const auto &acceptor : _acceptors)
    {
      result.push_back(acceptor->state());
    }
    return result;
  }

  bool anyRunning() const
  {
    for (const auto &acceptor : _acceptors)
    {
      if (acceptor->state() == AcceptorState::Running)
      {
        return true;
      }
    }
    return false;
  }

  bool allEnded() const
  {
    for (const auto &acceptor : _acceptors)
    {
      if (acceptor->state() != AcceptorState::Ended)
      {
        return false;
      }
    }
    return true;
  }

  std::size_t size() const { return _acceptors.size(); }

private:
  IAcceptorHost &_host;
  std::vector<std::unique_ptr<Acceptor>> _acceptors;
};

} // namespace network
} // namespace porta
