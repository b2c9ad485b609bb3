// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (accept4/TCP_DEFER_ACCEPT)"
#endif

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <porta/core/logger.hpp>
#include <porta/network/transport.hpp>

namespace porta
{
namespace network
{

/// \brief Plain TCP connection owned through a file descriptor.
class TcpConnection : public IConnection
{
public:
  TcpConnection(int fd, std::string peer) : _fd(fd), _peer(std::move(peer)) {}
  ~TcpConnection() override { close(); }

  TcpConnection(const TcpConnection &) = delete;
  TcpConnection &operator=(const TcpConnection &) = delete;

  void close() noexcept override
  {
    int fd = _fd.exchange(-1);
    if (fd >= 0)
    {
      ::close(fd);
    }
  }

  bool isOpen() const override { return _fd.load() >= 0; }
  int nativeHandle() const override { return _fd.load(); }
  std::string peerAddress() const override { return _peer; }

private:
  std::atomic<int> _fd;
  std::string _peer;
};

/// \brief Reference ITransport over a blocking POSIX listening socket.
///
/// With a non-zero accept poll interval the listener is non-blocking and
/// acceptOne() waits in poll(), so a pending accept always returns within
/// that interval. With an interval of zero acceptOne() blocks in accept4()
/// and the endpoint falls back to a loopback wakeup connection.
class BlockingTcpTransport : public ITransport
{
public:
  BlockingTcpTransport() = default;
  ~BlockingTcpTransport() override { unbind(); }

  BlockingTcpTransport(const BlockingTcpTransport &) = delete;
  BlockingTcpTransport &operator=(const BlockingTcpTransport &) = delete;

  void bind(const ListenOptions &options) override
  {
    std::lock_guard<std::mutex> lock(_bindMutex);
    if (_listenFd.load() >= 0)
    {
      throw std::runtime_error("BlockingTcpTransport already bound");
    }

    const std::string addr = options.address.empty() ? "0.0.0.0" : options.address;
    sockaddr_storage ss{};
    socklen_t sl = 0;
    int family = AF_INET;

    in6_addr t6{};
    in_addr t4{};
    if (::inet_pton(AF_INET6, addr.c_str(), &t6) == 1)
    {
      family = AF_INET6;
      sockaddr_in6 sa6{};
      sa6.sin6_family = AF_INET6;
      sa6.sin6_port = htons(options.port);
      sa6.sin6_addr = t6;
      std::memcpy(&ss, &sa6, sizeof(sa6));
      sl = sizeof(sa6);
    }
    else if (::inet_pton(AF_INET, addr.c_str(), &t4) == 1)
    {
      sockaddr_in sa4{};
      sa4.sin_family = AF_INET;
      sa4.sin_port = htons(options.port);
      sa4.sin_addr = t4;
      std::memcpy(&ss, &sa4, sizeof(sa4));
      sl = sizeof(sa4);
    }
    else
    {
      throw std::invalid_argument("Invalid listen address [" + addr + "]");
    }

    int sfd = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sfd < 0)
    {
      throw std::system_error(errno, std::system_category(), "socket");
    }

    int one = 1;
    ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (family == AF_INET6)
    {
      int v6only = 0;
      ::setsockopt(sfd, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
    }
    if (options.rcvBufSize > 0)
      ::setsockopt(sfd, SOL_SOCKET, SO_RCVBUF, &options.rcvBufSize, sizeof(int));
    if (options.sndBufSize > 0)
      ::setsockopt(sfd, SOL_SOCKET, SO_SNDBUF, &options.sndBufSize, sizeof(int));

    if (::bind(sfd, reinterpret_cast<sockaddr *>(&ss), sl) < 0)
    {
      int e = errno;
      ::close(sfd);
      throw std::system_error(e, std::system_category(),
                              "bind " + addr + ":" + std::to_string(options.port));
    }
    if (::listen(sfd, options.backlog > 0 ? options.backlog : SOMAXCONN) < 0)
    {
      int e = errno;
      ::close(sfd);
      throw std::system_error(e, std::system_category(), "listen");
    }

    if (options.deferAccept)
    {
      int seconds = 1;
      if (::setsockopt(sfd, IPPROTO_TCP, TCP_DEFER_ACCEPT, &seconds, sizeof(seconds)) == 0)
      {
        _deferAccept = true;
      }
      else
      {
        PORTA_LOG_WARN("BlockingTcpTransport: TCP_DEFER_ACCEPT not applied: "
                       << std::strerror(errno));
      }
    }

    _pollIntervalMs = static_cast<int>(options.acceptPollInterval.count());
    if (_pollIntervalMs > 0)
    {
      int flags = ::fcntl(sfd, F_GETFL, 0);
      ::fcntl(sfd, F_SETFL, flags | O_NONBLOCK);
    }

    socklen_t len = sizeof(ss);
    if (::getsockname(sfd, reinterpret_cast<sockaddr *>(&ss), &len) == 0)
    {
      _port = family == AF_INET6 ? ntohs(reinterpret_cast<sockaddr_in6 *>(&ss)->sin6_port)
                                 : ntohs(reinterpret_cast<sockaddr_in *>(&ss)->sin_port);
    }
    _listenFd.store(sfd);
    PORTA_LOG_INFO("BlockingTcpTransport: listening on " << addr << ":" << _port.load());
  }

  void unbind() override
  {
    std::lock_guard<std::mutex> lock(_bindMutex);
    int fd = _listenFd.exchange(-1);
    if (fd >= 0)
    {
      // Wakes threads blocked in accept4() or poll() on this socket.
      ::shutdown(fd, SHUT_RDWR);
      ::close(fd);
      PORTA_LOG_INFO("BlockingTcpTransport: listener on port " << _port.load() << " closed");
    }
    _port = -1;
    _deferAccept = false;
  }

  AcceptResult acceptOne() override
  {
    int fd = _listenFd.load();
    if (fd < 0)
    {
      return AcceptResult::fatalFailure("listener closed", EBADF);
    }

    if (_pollIntervalMs > 0)
    {
      pollfd pfd{fd, POLLIN, 0};
      int rc = ::poll(&pfd, 1, _pollIntervalMs);
      if (rc == 0 || (rc < 0 && errno == EINTR))
      {
        return AcceptResult::idle();
      }
      if (rc < 0)
      {
        return AcceptResult::transientFailure(std::string("poll: ") + std::strerror(errno), errno);
      }
      if (pfd.revents & POLLNVAL)
      {
        return AcceptResult::fatalFailure("listener closed", EBADF);
      }
    }

    sockaddr_storage peer{};
    socklen_t pl = sizeof(peer);
    int cfd = ::accept4(fd, reinterpret_cast<sockaddr *>(&peer), &pl, SOCK_CLOEXEC);
    if (cfd >= 0)
    {
      return AcceptResult::accepted(std::make_unique<TcpConnection>(cfd, formatPeer(peer)));
    }

    int e = errno;
    if (_listenFd.load() < 0)
    {
      return AcceptResult::fatalFailure("listener closed", e);
    }
    switch (e)
    {
    case EAGAIN:
#if EAGAIN != EWOULDBLOCK
    case EWOULDBLOCK:
#endif
    case EINTR:
      return AcceptResult::idle();
    case EBADF:
    case EINVAL:
    case ENOTSOCK:
    case EOPNOTSUPP:
      return AcceptResult::fatalFailure(std::string("accept4: ") + std::strerror(e), e);
    default:
      // ECONNABORTED, EMFILE, ENFILE, ENOBUFS, ENOMEM, EPROTO, EPERM
      return AcceptResult::transientFailure(std::string("accept4: ") + std::strerror(e), e);
    }
  }

  void configureConnection(IConnection &connection, const SocketOptions &options) override
  {
    const int fd = connection.nativeHandle();
    if (fd < 0)
    {
      return;
    }
    auto apply = [fd](int level, int name, const void *value, socklen_t len, const char *what)
    {
      if (::setsockopt(fd, level, name, value, len) != 0)
      {
        PORTA_LOG_DEBUG("BlockingTcpTransport: setsockopt(" << what
                                                            << ") failed: " << std::strerror(errno));
      }
    };

    int flag = options.tcpNoDelay ? 1 : 0;
    apply(IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag), "TCP_NODELAY");
    if (options.soKeepAlive)
    {
      int one = 1;
      apply(SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one), "SO_KEEPALIVE");
    }
    if (options.soLingerSeconds >= 0)
    {
      linger lg{1, options.soLingerSeconds};
      apply(SOL_SOCKET, SO_LINGER, &lg, sizeof(lg), "SO_LINGER");
    }
    if (options.soTimeout.count() > 0)
    {
      timeval tv{};
      tv.tv_sec = static_cast<time_t>(options.soTimeout.count() / 1000);
      tv.tv_usec = static_cast<suseconds_t>((options.soTimeout.count() % 1000) * 1000);
      apply(SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv), "SO_RCVTIMEO");
      apply(SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv), "SO_SNDTIMEO");
    }
    if (options.rcvBufSize > 0)
      apply(SOL_SOCKET, SO_RCVBUF, &options.rcvBufSize, sizeof(int), "SO_RCVBUF");
    if (options.sndBufSize > 0)
      apply(SOL_SOCKET, SO_SNDBUF, &options.sndBufSize, sizeof(int), "SO_SNDBUF");
  }

  int localPort() const override { return _listenFd.load() >= 0 ? _port.load() : -1; }

  bool deferAccept() const override { return _deferAccept.load(); }

  bool cancelPendingAccept() override { return _pollIntervalMs > 0; }

private:
  static std::string formatPeer(const sockaddr_storage &ss)
  {
    char host[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET6)
    {
      const auto *sa6 = reinterpret_cast<const sockaddr_in6 *>(&ss);
      ::inet_ntop(AF_INET6, &sa6->sin6_addr, host, sizeof(host));
      return std::string("[") + host + "]:" + std::to_string(ntohs(sa6->sin6_port));
    }
    const auto *sa4 = reinterpret_cast<const sockaddr_in *>(&ss);
    ::inet_ntop(AF_INET, &sa4->sin_addr, host, sizeof(host));
    return std::string(host) + ":" + std::to_string(ntohs(sa4->sin_port));
  }

  std::mutex _bindMutex;
  std::atomic<int> _listenFd{-1};
  std::atomic<int> _port{-1};
  std::atomic<bool> _deferAccept{false};
  std::atomic<int> _pollIntervalMs{200};
};

} // namespace network
} // namespace porta
