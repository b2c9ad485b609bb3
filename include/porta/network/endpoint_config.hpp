// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <porta/core/config_loader.hpp>
#include <porta/core/logger.hpp>
#include <porta/network/endpoint_types.hpp>
#include <porta/network/tls_config_registry.hpp>
#include <porta/network/worker_dispatcher.hpp>

namespace porta
{
namespace network
{

/// \brief Complete configuration of an Endpoint, fixed before init().
///
/// Pool sizing and the connection limit can still be changed on a running
/// endpoint through its live setters.
struct EndpointConfig
{
  /// Prefix for thread names and log lines.
  std::string name{"TP"};

  // Listener
  std::string address;
  std::uint16_t port{0};
  int acceptCount{100};
  int acceptorThreadCount{1};
  bool bindOnInit{true};
  bool deferAccept{false};
  std::chrono::milliseconds acceptPollInterval{std::chrono::milliseconds(200)};
  std::chrono::milliseconds unlockTimeout{std::chrono::milliseconds(250)};

  // Admission
  long maxConnections{10000}; ///< -1 for unlimited

  // Workers
  int minSpareThreads{10};
  int maxThreads{200};
  std::size_t maxQueueSize{10000};
  std::chrono::milliseconds threadIdleTimeout{std::chrono::seconds(60)};
  std::chrono::milliseconds executorTerminationTimeout{std::chrono::milliseconds(5000)};
  int processorCache{500}; ///< 0 disables processor reuse

  // Per-connection socket options, passed to the transport as is
  std::chrono::milliseconds connectionTimeout{std::chrono::milliseconds(20000)};
  std::optional<std::chrono::milliseconds> keepAliveTimeout;
  int connectionLinger{-1};
  bool tcpNoDelay{true};
  bool soKeepAlive{false};
  int rcvBufSize{0};
  int sndBufSize{0};

  // Keep-alive hints, seeded on every SocketWrapper
  int maxKeepAliveRequests{100}; ///< -1 for unlimited

  // TLS
  bool sslEnabled{false};
  std::string defaultTlsHostName{kDefaultTlsHostName};
  std::vector<std::string> negotiableProtocols;
  std::vector<TlsHostConfig> tlsHosts;

  /// Non-positive values are ignored.
  void setAcceptCount(int count)
  {
    if (count > 0)
    {
      acceptCount = count;
    }
  }

  std::chrono::milliseconds effectiveKeepAliveTimeout() const
  {
    return keepAliveTimeout ? *keepAliveTimeout : connectionTimeout;
  }

  /// \throws std::invalid_argument describing the first offending field
  void validate() const
  {
    if (name.empty())
      throw std::invalid_argument("endpoint name must not be empty");
    if (acceptorThreadCount < 1)
      throw std::invalid_argument("acceptorThreadCount must be >= 1");
    if (acceptCount < 1)
      throw std::invalid_argument("acceptCount must be >= 1");
    if (maxConnections < -1)
      throw std::invalid_argument("maxConnections must be -1 or >= 0");
    if (minSpareThreads < 0)
      throw std::invalid_argument("minSpareThreads must be >= 0");
    if (maxThreads < 1)
      throw std::invalid_argument("maxThreads must be >= 1");
    if (maxQueueSize < 1)
      throw std::invalid_argument("maxQueueSize must be >= 1");
    if (executorTerminationTimeout.count() < 0)
      throw std::invalid_argument("executorTerminationTimeout must be >= 0");
    if (acceptPollInterval.count() < 0)
      throw std::invalid_argument("acceptPollInterval must be >= 0");
    if (unlockTimeout.count() < 0)
      throw std::invalid_argument("unlockTimeout must be >= 0");
    if (processorCache < 0)
      throw std::invalid_argument("processorCache must be >= 0");
    if (maxKeepAliveRequests == 0 || maxKeepAliveRequests < -1)
      throw std::invalid_argument("maxKeepAliveRequests must be -1 or >= 1");
    if (keepAliveTimeout && keepAliveTimeout->count() < 0)
      throw std::invalid_argument("keepAliveTimeout must be >= 0");
    if (defaultTlsHostName.empty())
      throw std::invalid_argument("defaultTlsHostName must not be empty");
    for (const auto &host : tlsHosts)
    {
      if (host.hostName.empty())
        throw std::invalid_argument("TLS host entry with an empty host_name");
    }
  }

  ListenOptions listenOptions() const
  {
    ListenOptions opts;
    opts.address = address;
    opts.port = port;
    opts.backlog = acceptCount;
    opts.rcvBufSize = rcvBufSize;
    opts.sndBufSize = sndBufSize;
    opts.deferAccept = deferAccept;
    opts.acceptPollInterval = acceptPollInterval;
    return opts;
  }

  SocketOptions socketOptions() const
  {
    SocketOptions opts;
    opts.tcpNoDelay = tcpNoDelay;
    opts.soKeepAlive = soKeepAlive;
    opts.soLingerSeconds = connectionLinger;
    opts.soTimeout = connectionTimeout;
    opts.rcvBufSize = rcvBufSize;
    opts.sndBufSize = sndBufSize;
    return opts;
  }

  WorkerDispatcher::Settings dispatcherSettings() const
  {
    WorkerDispatcher::Settings s;
    s.name = name;
    s.minSpareThreads = minSpareThreads;
    s.maxThreads = maxThreads;
    s.maxQueueSize = maxQueueSize;
    s.threadIdleTimeout = threadIdleTimeout;
    s.terminationTimeout = executorTerminationTimeout;
    return s;
  }

  /// Read `[endpoint]` and its sub-tables. Missing keys keep their defaults;
  /// the result is validated.
  /// \throws std::invalid_argument on out-of-range or inconsistent values
  static EndpointConfig fromToml(const core::ConfigLoader &loader)
  {
    EndpointConfig cfg;
    auto ms = [](int64_t v) { return std::chrono::milliseconds(v); };

    if (auto v = loader.getString("endpoint.name"))
      cfg.name = *v;
    if (auto v = loader.getString("endpoint.address"))
      cfg.address = *v;
    if (auto v = loader.getInt("endpoint.port"))
    {
      if (*v < 0 || *v > 65535)
        throw std::invalid_argument("endpoint.port out of range: " + std::to_string(*v));
      cfg.port = static_cast<std::uint16_t>(*v);
    }
    if (auto v = loader.getInt("endpoint.accept_count"))
      cfg.setAcceptCount(static_cast<int>(*v));
    if (auto v = loader.getInt("endpoint.acceptor_thread_count"))
      cfg.acceptorThreadCount = static_cast<int>(*v);
    if (auto v = loader.getBool("endpoint.bind_on_init"))
      cfg.bindOnInit = *v;
    if (auto v = loader.getBool("endpoint.defer_accept"))
      cfg.deferAccept = *v;
    if (auto v = loader.getInt("endpoint.accept_poll_interval_ms"))
      cfg.acceptPollInterval = ms(*v);
    if (auto v = loader.getInt("endpoint.unlock_timeout_ms"))
      cfg.unlockTimeout = ms(*v);
    if (auto v = loader.getInt("endpoint.max_connections"))
      cfg.maxConnections = static_cast<long>(*v);
    if (auto v = loader.getInt("endpoint.processor_cache"))
      cfg.processorCache = static_cast<int>(*v);
    if (auto v = loader.getInt("endpoint.max_keep_alive_requests"))
      cfg.maxKeepAliveRequests = static_cast<int>(*v);

    if (auto v = loader.getInt("endpoint.executor.min_spare_threads"))
      cfg.minSpareThreads = static_cast<int>(*v);
    if (auto v = loader.getInt("endpoint.executor.max_threads"))
      cfg.maxThreads = static_cast<int>(*v);
    if (auto v = loader.getInt("endpoint.executor.max_queue_size"))
    {
      if (*v < 1)
        throw std::invalid_argument("endpoint.executor.max_queue_size must be >= 1");
      cfg.maxQueueSize = static_cast<std::size_t>(*v);
    }
    if (auto v = loader.getInt("endpoint.executor.thread_idle_timeout_ms"))
      cfg.threadIdleTimeout = ms(*v);
    if (auto v = loader.getInt("endpoint.executor.termination_timeout_ms"))
      cfg.executorTerminationTimeout = ms(*v);

    if (auto v = loader.getInt("endpoint.socket.connection_timeout_ms"))
      cfg.connectionTimeout = ms(*v);
    if (auto v = loader.getInt("endpoint.socket.keep_alive_timeout_ms"))
      cfg.keepAliveTimeout = ms(*v);
    if (auto v = loader.getInt("endpoint.socket.linger"))
      cfg.connectionLinger = static_cast<int>(*v);
    if (auto v = loader.getBool("endpoint.socket.tcp_no_delay"))
      cfg.tcpNoDelay = *v;
    if (auto v = loader.getBool("endpoint.socket.so_keep_alive"))
      cfg.soKeepAlive = *v;
    if (auto v = loader.getInt("endpoint.socket.rcv_buf"))
      cfg.rcvBufSize = static_cast<int>(*v);
    if (auto v = loader.getInt("endpoint.socket.snd_buf"))
      cfg.sndBufSize = static_cast<int>(*v);

    if (auto v = loader.getBool("endpoint.tls.enabled"))
      cfg.sslEnabled = *v;
    if (auto v = loader.getString("endpoint.tls.default_host_name"))
      cfg.defaultTlsHostName = *v;
    if (auto v = loader.getStringArray("endpoint.tls.negotiable_protocols"))
      cfg.negotiableProtocols = *v;

    for (const auto *tbl : loader.getTableArray("endpoint.tls.host"))
    {
      TlsHostConfig host;
      host.hostName = stringOr(*tbl, "host_name", kDefaultTlsHostName);
      host.certificateFile = stringOr(*tbl, "certificate_file", "");
      host.certificateKeyFile = stringOr(*tbl, "certificate_key_file", "");
      host.caCertificateFile = stringOr(*tbl, "ca_certificate_file", "");
      host.ciphers = stringOr(*tbl, "ciphers", "");
      if (const auto *protocols = tbl->at_path("protocols").as_array())
      {
        for (const auto &p : *protocols)
        {
          if (const auto *s = std::get_if<std::string>(&p))
            host.protocols.push_back(*s);
        }
      }
      if (auto v = tbl->at_path("verify_client").as<bool>())
        host.verifyClient = *v;
      cfg.tlsHosts.push_back(std::move(host));
    }

    cfg.validate();
    return cfg;
  }

private:
  static std::string stringOr(const parsers::toml::table &tbl, const std::string &key,
                              const std::string &fallback)
  {
    auto v = tbl.at_path(key).as<std::string>();
    return v ? *v : fallback;
  }
};

/// Apply `[log] level` and `[log] file` from \p loader to the Logger.
/// \throws std::invalid_argument on an unknown level name
inline void initLoggingFromConfig(const core::ConfigLoader &loader)
{
  auto level = core::Logger::Level::Info;
  if (auto v = loader.getString("log.level"))
  {
    level = core::Logger::levelFromString(*v);
  }
  core::Logger::init(level, loader.getString("log.file").value_or(""));
}

} // namespace network
} // namespace porta
