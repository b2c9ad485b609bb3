// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

namespace porta
{
namespace network
{

/// Request line sent on a wakeup connection to a deferred-accept listener.
inline constexpr const char *kWakeupRequest =
  "OPTIONS * HTTP/1.0\r\nUser-Agent: porta wakeup connection\r\n\r\n";

/// \brief Where and how to open the wakeup connection that makes a blocked
/// accept return.
struct WakeupTarget
{
  std::string address;
  int port{-1};
  std::chrono::milliseconds connectTimeout{std::chrono::milliseconds(2000)};
  std::chrono::milliseconds receiveTimeout{std::chrono::milliseconds(2000)};
  int lingerSeconds{-1};
  bool sendRequest{false};
};

/// Loopback address to connect to for a listener bound to \p bindAddress.
/// Wildcard and empty addresses map to the loopback of the same family.
inline std::string wakeupAddressFor(const std::string &bindAddress)
{
  if (bindAddress.empty() || bindAddress == "0.0.0.0")
  {
    return "127.0.0.1";
  }
  if (bindAddress == "::" || bindAddress == "[::]")
  {
    return "::1";
  }
  return bindAddress;
}

namespace detail
{
  class ScopedFd
  {
  public:
    explicit ScopedFd(int fd) : _fd(fd) {}
    ~ScopedFd()
    {
      if (_fd >= 0)
        ::close(_fd);
    }
    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;
    int get() const { return _fd; }

  private:
    int _fd;
  };
} // namespace detail

/// \brief Connect to \p target, optionally send kWakeupRequest, and close.
/// \throws std::system_error or std::invalid_argument on failure
inline void openWakeupConnection(const WakeupTarget &target)
{
  sockaddr_storage ss{};
  socklen_t sl = 0;
  int family = AF_INET;

  in6_addr t6{};
  in_addr t4{};
  if (::inet_pton(AF_INET, target.address.c_str(), &t4) == 1)
  {
    sockaddr_in sa4{};
    sa4.sin_family = AF_INET;
    sa4.sin_port = htons(static_cast<uint16_t>(target.port));
    sa4.sin_addr = t4;
    std::memcpy(&ss, &sa4, sizeof(sa4));
    sl = sizeof(sa4);
  }
  else if (::inet_pton(AF_INET6, target.address.c_str(), &t6) == 1)
  {
    family = AF_INET6;
    sockaddr_in6 sa6{};
    sa6.sin6_family = AF_INET6;
    sa6.sin6_port = htons(static_cast<uint16_t>(target.port));
    sa6.sin6_addr = t6;
    std::memcpy(&ss, &sa6, sizeof(sa6));
    sl = sizeof(sa6);
  }
  else
  {
    throw std::invalid_argument("Invalid wakeup address [" + target.address + "]");
  }
  if (target.port <= 0)
  {
    throw std::invalid_argument("Invalid wakeup port " + std::to_string(target.port));
  }

  detail::ScopedFd sock(::socket(family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
  if (sock.get() < 0)
  {
    throw std::system_error(errno, std::system_category(), "wakeup socket");
  }

  timeval tv{};
  tv.tv_sec = static_cast<time_t>(target.receiveTimeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((target.receiveTimeout.count() % 1000) * 1000);
  ::setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  if (target.lingerSeconds >= 0)
  {
    linger lg{1, target.lingerSeconds};
    ::setsockopt(sock.get(), SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
  }

  if (::connect(sock.get(), reinterpret_cast<sockaddr *>(&ss), sl) < 0)
  {
    if (errno != EINPROGRESS)
    {
      throw std::system_error(errno, std::system_category(), "wakeup connect");
    }
    pollfd pfd{sock.get(), POLLOUT, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(target.connectTimeout.count()));
    if (rc == 0)
    {
      throw std::system_error(ETIMEDOUT, std::system_category(), "wakeup connect");
    }
    if (rc < 0)
    {
      throw std::system_error(errno, std::system_category(), "wakeup poll");
    }
    int soError = 0;
    socklen_t len = sizeof(soError);
    ::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len);
    if (soError != 0)
    {
      throw std::system_error(soError, std::system_category(), "wakeup connect");
    }
  }

  if (target.sendRequest)
  {
    const std::size_t total = std::strlen(kWakeupRequest);
    std::size_t sent = 0;
    while (sent < total)
    {
      ssize_t n = ::send(sock.get(), kWakeupRequest + sent, total - sent, MSG_NOSIGNAL);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
          pollfd pfd{sock.get(), POLLOUT, 0};
          if (::poll(&pfd, 1, static_cast<int>(target.connectTimeout.count())) <= 0)
          {
            throw std::system_error(ETIMEDOUT, std::system_category(), "wakeup send");
          }
          continue;
        }
        throw std::system_error(errno, std::system_category(), "wakeup send");
      }
      sent += static_cast<std::size_t>(n);
    }
  }
}

} // namespace network
} // namespace porta
