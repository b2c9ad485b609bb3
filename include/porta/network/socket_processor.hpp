// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <exception>
#include <utility>

#include <porta/core/logger.hpp>
#include <porta/core/unrecoverable_error.hpp>
#include <porta/network/transport.hpp>

namespace porta
{
namespace network
{

/// \brief Reusable unit of work: run the protocol handler for one connection
/// and one event.
///
/// Instances are cached in a ProcessorPool. Between uses they hold no
/// connection reference.
class SocketProcessor
{
public:
  explicit SocketProcessor(IProtocolHandler &handler) : _handler(handler) {}

  SocketProcessor(const SocketProcessor &) = delete;
  SocketProcessor &operator=(const SocketProcessor &) = delete;

  void reset(SocketWrapperPtr wrapper, SocketEvent event)
  {
    _wrapper = std::move(wrapper);
    _event = event;
  }

  /// Process the configured connection, then scrub this processor. Handler
  /// failures close the connection and are not propagated unless they are
  /// unrecoverable.
  void run()
  {
    if (!_wrapper)
    {
      return;
    }

    try
    {
      if (_wrapper->isClosed())
      {
        PORTA_LOG_DEBUG("SocketProcessor: connection " << _wrapper->id()
                                                       << " already closed, skipping "
                                                       << toString(_event));
      }
      else
      {
        SocketState state = _handler.process(_wrapper, _event);
        if (state == SocketState::Closed)
        {
          closeConnection();
        }
      }
    }
    catch (const std::exception &e)
    {
      core::rethrowIfUnrecoverable(e);
      PORTA_LOG_ERROR("SocketProcessor: handler failed on connection "
                      << _wrapper->id() << " (" << toString(_event) << "): " << e.what());
      closeConnection();
    }
    clear();
  }

  void clear()
  {
    _wrapper.reset();
    _event = SocketEvent::OpenRead;
  }

  bool hasConnection() const { return static_cast<bool>(_wrapper); }
  const SocketWrapperPtr &wrapper() const { return _wrapper; }
  SocketEvent event() const { return _event; }

private:
  void closeConnection()
  {
    try
    {
      _handler.release(_wrapper);
    }
    catch (const std::exception &e)
    {
      core::rethrowIfUnrecoverable(e);
      PORTA_LOG_WARN("SocketProcessor: release failed for connection " << _wrapper->id() << ": "
                                                                       << e.what());
    }
    _wrapper->close();
  }

  IProtocolHandler &_handler;
  SocketWrapperPtr _wrapper;
  SocketEvent _event{SocketEvent::OpenRead};
};

} // namespace network
} // namespace porta
