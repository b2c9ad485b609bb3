// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.


#include <porta/porta.hpp>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

#define PORTA_DEFAULT_CONFIG_FILE_PATH "/etc/porta.conf.d/porta.toml"

namespace
{
  std::atomic<bool> terminateRequested{false};

  /// Settings given on the command line. They win over the config file.
  struct CliOptions
  {
    std::optional<std::string> configFile;
    std::optional<std::string> address;
    std::optional<int> port;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    std::optional<long> maxConnections;
    std::optional<int> minSpareThreads;
    std::optional<int> maxThreads;
    std::optional<int> acceptors;
    std::optional<std::string> tlsCert;
    std::optional<std::string> tlsKey;
    std::optional<std::string> tlsCa;
  };

  /// \brief Print help message
  void printHelp()
  {
    std::cout
        << "Usage: porta [options]\n"
        << "Options:\n"
        << "  -h, --help                       Show this help message\n"
        << "  -c, --config <file>              Configuration file path\n"
        << "  -a, --address <addr>             Listen address (default: all)\n"
        << "  -p, --port <port>                Listen port\n"
        << "  -l, --log-level <level>          Log level (trace, debug, info, "
           "warn, error, fatal)\n"
        << "  -f, --log-file <file>            Log file path\n"
        << "      --max-connections <n>        Connection limit, -1 for none\n"
        << "      --min-spare-threads <n>      Worker threads kept alive\n"
        << "      --max-threads <n>            Worker thread limit\n"
        << "      --acceptors <n>              Acceptor thread count\n"
        << "      --tls-cert <file>            TLS certificate chain of the default host\n"
        << "      --tls-key <file>             TLS key of the default host\n"
        << "      --tls-ca <file>              Require client certificates from this CA\n";
  }

  template <typename T> T parseNumber(const std::string &option, const char *value)
  {
    try
    {
      return static_cast<T>(std::stol(value));
    }
    catch (const std::exception &)
    {
      throw std::runtime_error("Invalid value for " + option + ": " + std::string(value));
    }
  }

  void parseCliArgs(int argc, char **argv, CliOptions &options)
  {
    for (int i = 1; i < argc; ++i)
    {
      std::string arg = argv[i];
      const bool hasValue = i + 1 < argc;
      if ((arg == "-c" || arg == "--config") && hasValue)
      {
        options.configFile = argv[++i];
      }
      else if ((arg == "-a" || arg == "--address") && hasValue)
      {
        options.address = argv[++i];
      }
      else if ((arg == "-p" || arg == "--port") && hasValue)
      {
        options.port = parseNumber<int>(arg, argv[++i]);
      }
      else if ((arg == "-l" || arg == "--log-level") && hasValue)
      {
        options.logLevel = argv[++i];
      }
      else if ((arg == "-f" || arg == "--log-file") && hasValue)
      {
        options.logFile = argv[++i];
      }
      else if (arg == "--max-connections" && hasValue)
      {
        options.maxConnections = parseNumber<long>(arg, argv[++i]);
      }
      else if (arg == "--min-spare-threads" && hasValue)
      {
        options.minSpareThreads = parseNumber<int>(arg, argv[++i]);
      }
      else if (arg == "--max-threads" && hasValue)
      {
        options.maxThreads = parseNumber<int>(arg, argv[++i]);
      }
      else if (arg == "--acceptors" && hasValue)
      {
        options.acceptors = parseNumber<int>(arg, argv[++i]);
      }
      else if (arg == "--tls-cert" && hasValue)
      {
        options.tlsCert = argv[++i];
      }
      else if (arg == "--tls-key" && hasValue)
      {
        options.tlsKey = argv[++i];
      }
      else if (arg == "--tls-ca" && hasValue)
      {
        options.tlsCa = argv[++i];
      }
      else if (arg == "-h" || arg == "--help")
      {
        printHelp();
        std::exit(0);
      }
      else if (!arg.empty() && arg[0] == '-')
      {
        throw std::runtime_error("Unknown option: " + arg);
      }
    }
  }

  /// \brief Build the endpoint configuration from the config file, then
  /// apply command line overrides.
  porta::network::EndpointConfig loadConfig(const CliOptions &options)
  {
    using porta::core::Logger;

    porta::network::EndpointConfig config;
    config.name = "porta";
    config.port = 8080;

    std::string configFile = options.configFile.value_or(PORTA_DEFAULT_CONFIG_FILE_PATH);
    const bool explicitFile = options.configFile.has_value();
    if (explicitFile || std::ifstream(configFile).good())
    {
      porta::core::ConfigLoader loader(configFile);
      porta::network::initLoggingFromConfig(loader);
      config = porta::network::EndpointConfig::fromToml(loader);
      if (!loader.getString("endpoint.name"))
      {
        config.name = "porta";
      }
      PORTA_LOG_INFO("Using config file: " << configFile);
    }

    if (options.logLevel || options.logFile)
    {
      auto level = options.logLevel ? Logger::levelFromString(*options.logLevel) : Logger::getLevel();
      Logger::init(level, options.logFile.value_or(""));
    }

    if (options.address)
      config.address = *options.address;
    if (options.port)
    {
      if (*options.port < 0 || *options.port > 65535)
        throw std::runtime_error("Invalid port number: " + std::to_string(*options.port));
      config.port = static_cast<std::uint16_t>(*options.port);
    }
    if (options.maxConnections)
      config.maxConnections = *options.maxConnections;
    if (options.minSpareThreads)
      config.minSpareThreads = *options.minSpareThreads;
    if (options.maxThreads)
      config.maxThreads = *options.maxThreads;
    if (options.acceptors)
      config.acceptorThreadCount = *options.acceptors;

    if (options.tlsCert || options.tlsKey)
    {
      if (!options.tlsCert || !options.tlsKey)
        throw std::runtime_error("--tls-cert and --tls-key must be given together");
      porta::network::TlsHostConfig host;
      host.hostName = config.defaultTlsHostName;
      host.certificateFile = *options.tlsCert;
      host.certificateKeyFile = *options.tlsKey;
      if (options.tlsCa)
      {
        host.caCertificateFile = *options.tlsCa;
        host.verifyClient = true;
      }
      config.tlsHosts.erase(
        std::remove_if(config.tlsHosts.begin(), config.tlsHosts.end(),
                       [&](const porta::network::TlsHostConfig &h)
                       { return h.hostName == host.hostName; }),
        config.tlsHosts.end());
      config.tlsHosts.push_back(std::move(host));
      config.sslEnabled = true;
    }

    config.validate();
    return config;
  }

  /// \brief Line-agnostic echo protocol, in the clear or over TLS.
  ///
  /// Each connection occupies one worker until the peer closes it or stays
  /// silent for the connection timeout.
  class EchoProtocol : public porta::network::IProtocolHandler
  {
  public:
    using SocketState = porta::network::SocketState;
    using SocketEvent = porta::network::SocketEvent;
    using SocketWrapperPtr = porta::network::SocketWrapperPtr;

    /// Connections arriving before setTlsContext() are refused.
    void requireTls(bool required) { _tlsRequired = required; }

    /// Front context for TLS handshakes; SNI switches to the host context.
    void setTlsContext(SSL_CTX *ctx) { _tlsContext = ctx; }

    SocketState process(const SocketWrapperPtr &wrapper, SocketEvent event) override
    {
      if (event != SocketEvent::OpenRead)
      {
        return SocketState::Closed;
      }
      track(wrapper);
      const int fd = wrapper->nativeHandle();
      std::size_t bytes = 0;
      if (SSL_CTX *ctx = _tlsContext.load())
      {
        bytes = serveTls(ctx, fd, *wrapper);
      }
      else if (_tlsRequired)
      {
        PORTA_LOG_DEBUG("Echo: TLS not ready, refusing " << wrapper->peerAddress());
      }
      else
      {
        bytes = servePlain(fd, *wrapper);
      }
      PORTA_LOG_DEBUG("Echo: connection " << wrapper->id() << " from " << wrapper->peerAddress()
                                          << " done after " << bytes << " byte(s)");
      return SocketState::Closed;
    }

    std::vector<SocketWrapperPtr> getOpenConnections() override
    {
      std::lock_guard<std::mutex> lock(_mutex);
      std::vector<SocketWrapperPtr> open;
      open.reserve(_open.size());
      for (const auto &entry : _open)
      {
        open.push_back(entry.second);
      }
      return open;
    }

    /// Forget \p wrapper and wake a worker blocked reading from it.
    void release(const SocketWrapperPtr &wrapper) override
    {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        _open.erase(wrapper->id());
      }
      const int fd = wrapper->nativeHandle();
      if (fd >= 0)
      {
        ::shutdown(fd, SHUT_RDWR);
      }
    }

    void recycle() override { _tlsContext = nullptr; }

  private:
    void track(const SocketWrapperPtr &wrapper)
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _open[wrapper->id()] = wrapper;
    }

    /// Wait for the next message on a kept-alive connection.
    static bool awaitNextMessage(int fd, std::chrono::milliseconds timeout)
    {
      pollfd pfd{fd, POLLIN, 0};
      const int waitMs = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
      for (;;)
      {
        int rc = ::poll(&pfd, 1, waitMs);
        if (rc < 0 && errno == EINTR)
          continue;
        return rc > 0;
      }
    }

    static std::size_t servePlain(int fd, porta::network::SocketWrapper &wrapper)
    {
      std::size_t total = 0;
      char buf[4096];
      for (;;)
      {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR)
          continue;
        if (n <= 0)
          break;
        if (::send(fd, buf, static_cast<std::size_t>(n), MSG_NOSIGNAL) != n)
          break;
        total += static_cast<std::size_t>(n);
        if (!wrapper.consumeKeepAlive() || !awaitNextMessage(fd, wrapper.keepAliveTimeout()))
          break;
      }
      return total;
    }

    static std::size_t serveTls(SSL_CTX *ctx, int fd, porta::network::SocketWrapper &wrapper)
    {
      std::unique_ptr<SSL, decltype(&::SSL_free)> ssl(::SSL_new(ctx), &::SSL_free);
      if (!ssl || ::SSL_set_fd(ssl.get(), fd) != 1)
      {
        PORTA_LOG_ERROR("Echo: cannot create TLS session: "
                        << porta::network::detail::opensslErrors());
        return 0;
      }
      if (::SSL_accept(ssl.get()) != 1)
      {
        PORTA_LOG_DEBUG("Echo: TLS handshake with " << wrapper.peerAddress() << " failed: "
                                                    << porta::network::detail::opensslErrors());
        return 0;
      }
      const char *sni = ::SSL_get_servername(ssl.get(), TLSEXT_NAMETYPE_host_name);
      PORTA_LOG_DEBUG("Echo: TLS connection " << wrapper.id() << " for ["
                                              << (sni ? sni : "") << "] using "
                                              << ::SSL_get_version(ssl.get()));

      std::size_t total = 0;
      char buf[4096];
      for (;;)
      {
        int n = ::SSL_read(ssl.get(), buf, sizeof(buf));
        if (n <= 0 || ::SSL_write(ssl.get(), buf, n) != n)
          break;
        total += static_cast<std::size_t>(n);
        if (!wrapper.consumeKeepAlive())
          break;
        if (::SSL_pending(ssl.get()) == 0 && !awaitNextMessage(fd, wrapper.keepAliveTimeout()))
          break;
      }
      ::SSL_shutdown(ssl.get());
      return total;
    }

    std::atomic<bool> _tlsRequired{false};
    std::atomic<SSL_CTX *> _tlsContext{nullptr};
    std::mutex _mutex;
    std::map<std::uint64_t, SocketWrapperPtr> _open;
  };
} // namespace

int main(int argc, char **argv)
{
  try
  {
    CliOptions options;
    parseCliArgs(argc, argv, options);
    auto config = loadConfig(options);

    auto protocol = std::make_shared<EchoProtocol>();
    protocol->requireTls(config.sslEnabled);
    porta::network::Endpoint endpoint(config, std::make_shared<porta::network::BlockingTcpTransport>(),
                                      protocol);
    // Host contexts exist once the endpoint is bound.
    auto enableTls = [&]()
    {
      SSL_CTX *front = porta::network::OpenSslSniSelector::select(endpoint.tlsRegistry(), nullptr);
      if (front == nullptr)
      {
        throw std::runtime_error("Default TLS host has no context");
      }
      porta::network::OpenSslSniSelector::install(front, endpoint.tlsRegistry());
      protocol->setTlsContext(front);
    };

    endpoint.init();
    const bool boundOnInit = endpoint.getBindState() != porta::network::BindState::Unbound;
    if (config.sslEnabled && boundOnInit)
    {
      enableTls();
    }
    endpoint.start();
    if (config.sslEnabled && !boundOnInit)
    {
      enableTls();
    }
    PORTA_LOG_INFO("porta listening on port " << endpoint.getLocalPort()
                                              << (config.sslEnabled ? " (TLS)" : ""));

    std::signal(SIGINT, [](int) { terminateRequested = true; });
    std::signal(SIGTERM, [](int) { terminateRequested = true; });
    std::signal(SIGPIPE, SIG_IGN);

    while (!terminateRequested)
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    PORTA_LOG_INFO("porta shutting down, " << endpoint.getConnectionCount()
                                           << " connection(s) open");
    endpoint.stop();
    endpoint.destroy();
  }
  catch (const std::exception &ex)
  {
    std::cerr << "porta: " << ex.what() << std::endl;
    porta::core::Logger::flush();
    return EXIT_FAILURE;
  }

  porta::core::Logger::flush();
  return 0;
}
