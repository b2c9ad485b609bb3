// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace porta
{
namespace network
{

/// Tracks when the listening transport was bound so the matching call
/// unbinds it.
enum class BindState
{
  Unbound,
  BoundOnInit,
  BoundOnStart
};

enum class AcceptorState
{
  New,
  Running,
  Paused,
  Ended
};

/// Reason a connection is handed to the protocol handler.
enum class SocketEvent
{
  OpenRead,
  OpenWrite,
  Stop,
  Timeout,
  Disconnect,
  Error,
  ConnectFail
};

/// What the protocol handler wants done with a connection after processing.
enum class SocketState
{
  Open,
  Closed,
  Long,
  AsyncEnd,
  Sendfile,
  Upgrading,
  Upgraded,
  Suspended
};

enum class AcceptStatus
{
  Accepted,
  Idle,
  TransientFailure,
  FatalFailure
};

/// Listener parameters handed to ITransport::bind().
struct ListenOptions
{
  std::string address;
  std::uint16_t port{0};
  int backlog{100};
  int rcvBufSize{0};
  int sndBufSize{0};
  /// Ask the kernel to complete accept only once the client sent data.
  bool deferAccept{false};
  /// How long a single acceptOne() may wait before reporting Idle. Zero
  /// blocks until a connection arrives.
  std::chrono::milliseconds acceptPollInterval{std::chrono::milliseconds(200)};
};

/// Per-connection options applied right after accept.
struct SocketOptions
{
  bool tcpNoDelay{true};
  bool soKeepAlive{false};
  int soLingerSeconds{-1}; ///< negative leaves SO_LINGER off
  std::chrono::milliseconds soTimeout{std::chrono::milliseconds(20000)};
  int rcvBufSize{0};
  int sndBufSize{0};
};

inline const char *toString(BindState state)
{
  switch (state)
  {
  case BindState::Unbound:
    return "Unbound";
  case BindState::BoundOnInit:
    return "BoundOnInit";
  case BindState::BoundOnStart:
    return "BoundOnStart";
  }
  return "Unknown";
}

inline const char *toString(AcceptorState state)
{
  switch (state)
  {
  case AcceptorState::New:
    return "New";
  case AcceptorState::Running:
    return "Running";
  case AcceptorState::Paused:
    return "Paused";
  case AcceptorState::Ended:
    return "Ended";
  }
  return "Unknown";
}

inline const char *toString(SocketEvent event)
{
  switch (event)
  {
  case SocketEvent::OpenRead:
    return "OpenRead";
  case SocketEvent::OpenWrite:
    return "OpenWrite";
  case SocketEvent::Stop:
    return "Stop";
  case SocketEvent::Timeout:
    return "Timeout";
  case SocketEvent::Disconnect:
    return "Disconnect";
  case SocketEvent::Error:
    return "Error";
  case SocketEvent::ConnectFail:
    return "ConnectFail";
  }
  return "Unknown";
}

} // namespace network
} // namespace porta
