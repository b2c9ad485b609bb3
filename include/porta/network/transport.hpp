// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <porta/network/endpoint_types.hpp>

namespace porta
{
namespace network
{

/// \brief An accepted connection as produced by a transport.
class IConnection
{
public:
  virtual ~IConnection() = default;

  /// Close the connection. Must be safe to call more than once.
  virtual void close() noexcept = 0;
  virtual bool isOpen() const = 0;
  /// OS handle, or -1 for transports without one.
  virtual int nativeHandle() const = 0;
  virtual std::string peerAddress() const = 0;
};

/// \brief Outcome of a single ITransport::acceptOne() call.
struct AcceptResult
{
  AcceptStatus status{AcceptStatus::Idle};
  std::unique_ptr<IConnection> connection;
  std::string message;
  int sysErrno{0};

  static AcceptResult accepted(std::unique_ptr<IConnection> conn)
  {
    AcceptResult r;
    r.status = AcceptStatus::Accepted;
    r.connection = std::move(conn);
    return r;
  }

  static AcceptResult idle() { return AcceptResult{}; }

  static AcceptResult transientFailure(const std::string &msg, int se = 0)
  {
    AcceptResult r;
    r.status = AcceptStatus::TransientFailure;
    r.message = msg;
    r.sysErrno = se;
    return r;
  }

  static AcceptResult fatalFailure(const std::string &msg, int se = 0)
  {
    AcceptResult r;
    r.status = AcceptStatus::FatalFailure;
    r.message = msg;
    r.sysErrno = se;
    return r;
  }
};

/// \brief The listening side of an endpoint.
///
/// acceptOne() is called concurrently by every acceptor thread. unbind()
/// must make pending and future acceptOne() calls return FatalFailure.
class ITransport
{
public:
  virtual ~ITransport() = default;

  /// \throws std::system_error or std::runtime_error when the listener
  /// cannot be created
  virtual void bind(const ListenOptions &options) = 0;
  virtual void unbind() = 0;
  virtual AcceptResult acceptOne() = 0;
  /// Apply per-connection socket options. Failures are logged, not thrown.
  virtual void configureConnection(IConnection &connection, const SocketOptions &options) = 0;
  /// Bound port, or -1 when not bound.
  virtual int localPort() const = 0;
  /// True when the listener only completes accept once data arrives, so a
  /// wakeup connection has to send something.
  virtual bool deferAccept() const { return false; }
  /// True when a pending acceptOne() returns on its own within a bounded
  /// interval, so no loopback wakeup connection is required.
  virtual bool cancelPendingAccept() { return false; }
};

/// \brief Connection handle passed to protocol handlers.
///
/// Owns the transport connection. If the connection holds an admission slot,
/// the slot is given back exactly once, when the wrapper is closed or
/// destroyed.
class SocketWrapper
{
public:
  using SlotRelease = std::function<void()>;

  explicit SocketWrapper(std::unique_ptr<IConnection> connection, SlotRelease slotRelease = nullptr)
      : _connection(std::move(connection)), _slotRelease(std::move(slotRelease)),
        _holdsSlot(static_cast<bool>(_slotRelease))
  {
    static std::atomic<std::uint64_t> nextId{1};
    _id = nextId.fetch_add(1, std::memory_order_relaxed);
  }

  ~SocketWrapper() { close(); }

  SocketWrapper(const SocketWrapper &) = delete;
  SocketWrapper &operator=(const SocketWrapper &) = delete;

  void close() noexcept
  {
    if (_closed.exchange(true))
    {
      return;
    }
    if (_connection)
    {
      _connection->close();
    }
    if (_holdsSlot.exchange(false))
    {
      auto release = std::move(_slotRelease);
      _slotRelease = nullptr;
      release();
    }
  }

  bool isClosed() const { return _closed.load(); }
  bool holdsAdmissionSlot() const { return _holdsSlot.load(); }
  std::uint64_t id() const { return _id; }

  IConnection *connection() const { return _connection.get(); }
  int nativeHandle() const { return _connection ? _connection->nativeHandle() : -1; }
  std::string peerAddress() const { return _connection ? _connection->peerAddress() : ""; }

  /// Requests the handler may still serve on this connection; negative
  /// means unlimited. Seeded by the endpoint from maxKeepAliveRequests.
  int keepAliveLeft() const { return _keepAliveLeft; }
  void setKeepAliveLeft(int left) { _keepAliveLeft = left; }

  /// Count one served request against a limited allowance.
  /// \return false once the allowance is used up
  bool consumeKeepAlive()
  {
    if (_keepAliveLeft < 0)
    {
      return true;
    }
    if (_keepAliveLeft > 0)
    {
      --_keepAliveLeft;
    }
    return _keepAliveLeft > 0;
  }

  /// How long the handler waits for the next request between requests.
  std::chrono::milliseconds keepAliveTimeout() const { return _keepAliveTimeout; }
  void setKeepAliveTimeout(std::chrono::milliseconds timeout) { _keepAliveTimeout = timeout; }

private:
  std::unique_ptr<IConnection> _connection;
  SlotRelease _slotRelease;
  std::atomic<bool> _holdsSlot;
  std::atomic<bool> _closed{false};
  std::uint64_t _id{0};
  int _keepAliveLeft{-1};
  std::chrono::milliseconds _keepAliveTimeout{0};
};

using SocketWrapperPtr = std::shared_ptr<SocketWrapper>;

/// \brief Application protocol plugged into an endpoint.
class IProtocolHandler
{
public:
  virtual ~IProtocolHandler() = default;

  virtual SocketState process(const SocketWrapperPtr &wrapper, SocketEvent event) = 0;
  /// Connections the handler keeps open between events.
  virtual std::vector<SocketWrapperPtr> getOpenConnections() = 0;
  /// Forget any state held for \p wrapper; it is about to be closed.
  virtual void release(const SocketWrapperPtr &wrapper) = 0;
  /// The endpoint stopped accepting; stop advertising readiness.
  virtual void pause() {}
  /// The endpoint stopped; drop cached resources.
  virtual void recycle() {}
};

} // namespace network
} // namespace porta
