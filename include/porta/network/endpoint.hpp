// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <porta/core/admission_gate.hpp>
#include <porta/core/logger.hpp>
#include <porta/core/thread_pool.hpp>
#include <porta/core/unrecoverable_error.hpp>
#include <porta/network/acceptor.hpp>
#include <porta/network/endpoint_config.hpp>
#include <porta/network/endpoint_types.hpp>
#include <porta/network/openssl_tls_context.hpp>
#include <porta/network/processor_pool.hpp>
#include <porta/network/socket_processor.hpp>
#include <porta/network/tls_config_registry.hpp>
#include <porta/network/transport.hpp>
#include <porta/network/unlock_accept.hpp>
#include <porta/network/worker_dispatcher.hpp>

namespace porta
{
namespace network
{

/// \brief Connection admission and lifecycle core of a network server.
///
/// An Endpoint binds an ITransport, runs acceptor threads that admit
/// connections through an AdmissionGate and hands each connection to an
/// IProtocolHandler, inline or on a worker pool.
///
/// Lifecycle: init() -> start() -> pause()/resume() -> stop() -> destroy().
/// Only the bind bookkeeping is tracked; the owner is responsible for
/// calling these in order.
class Endpoint : public IAcceptorHost
{
public:
  static constexpr std::chrono::milliseconds kUnlockWait{1000};
  static constexpr std::chrono::milliseconds kUnlockPoll{50};
  static constexpr std::chrono::milliseconds kMinWakeupTimeout{2000};

  /// @param tlsBuilder used when TLS is enabled; an OpenSslContextBuilder is
  /// created when none is given
  /// \throws std::invalid_argument on an invalid configuration or a missing
  /// transport or handler
  Endpoint(EndpointConfig config, std::shared_ptr<ITransport> transport,
           std::shared_ptr<IProtocolHandler> handler,
           std::shared_ptr<ITlsContextBuilder> tlsBuilder = nullptr)
      : _config(std::move(config)), _transport(std::move(transport)),
        _handler(std::move(handler)), _maxConnections(_config.maxConnections),
        _processorCache(static_cast<std::size_t>(std::max(0, _config.processorCache))),
        _acceptors(*this), _dispatcher(_config.dispatcherSettings())
  {
    _config.validate();
    if (!_transport)
    {
      throw std::invalid_argument("Endpoint " + _config.name + " requires a transport");
    }
    if (!_handler)
    {
      throw std::invalid_argument("Endpoint " + _config.name + " requires a protocol handler");
    }

    if (!tlsBuilder && _config.sslEnabled)
    {
      tlsBuilder = std::make_shared<OpenSslContextBuilder>(_config.negotiableProtocols);
    }
    _tlsRegistry.setBuilder(std::move(tlsBuilder));
    _tlsRegistry.setDefaultHostName(_config.defaultTlsHostName);
    for (const auto &host : _config.tlsHosts)
    {
      _tlsRegistry.add(std::make_shared<TlsHostConfig>(host), false);
    }
  }

  ~Endpoint() override
  {
    try
    {
      if (_running)
      {
        stopInternal();
      }
      if (_bindState != BindState::Unbound)
      {
        unbind();
        _bindState = BindState::Unbound;
      }
    }
    catch (const std::exception &e)
    {
      PORTA_LOG_ERROR("Endpoint " << _config.name << ": error during teardown: " << e.what());
    }
  }

  Endpoint(const Endpoint &) = delete;
  Endpoint &operator=(const Endpoint &) = delete;

  // Lifecycle

  void init()
  {
    assert(_bindState == BindState::Unbound && "init() called twice without destroy()");
    if (_config.bindOnInit)
    {
      bind();
      _bindState = BindState::BoundOnInit;
    }
  }

  void start()
  {
    if (_bindState == BindState::Unbound)
    {
      bind();
      _bindState = BindState::BoundOnStart;
    }
    startInternal();
  }

  /// Stop admitting connections. No-op unless running and not paused.
  void pause()
  {
    if (_running && !_paused)
    {
      _paused = true;
      PORTA_LOG_INFO("Endpoint " << _config.name << ": pausing");
      _gate.interruptWaiters();
      unlockAccept();
      _handler->pause();
    }
  }

  /// No-op unless running.
  void resume()
  {
    if (_running)
    {
      _paused = false;
      PORTA_LOG_INFO("Endpoint " << _config.name << ": resumed");
    }
  }

  void stop()
  {
    stopInternal();
    if (_bindState == BindState::BoundOnStart)
    {
      unbind();
      _bindState = BindState::Unbound;
    }
  }

  void destroy()
  {
    if (_bindState == BindState::BoundOnInit)
    {
      unbind();
      _bindState = BindState::Unbound;
    }
  }

  /// Bind the transport and, with TLS enabled, build every host context.
  /// The transport is unbound again if the TLS contexts cannot be built.
  void bind()
  {
    _transport->bind(_config.listenOptions());
    if (_config.sslEnabled)
    {
      try
      {
        _tlsRegistry.buildAll();
      }
      catch (const std::exception &)
      {
        _transport->unbind();
        throw;
      }
    }
    PORTA_LOG_INFO("Endpoint " << _config.name << ": bound to port " << _transport->localPort());
  }

  void unbind()
  {
    _transport->unbind();
    if (_config.sslEnabled)
    {
      _tlsRegistry.releaseAll();
    }
    PORTA_LOG_INFO("Endpoint " << _config.name << ": unbound");
  }

  /// Make acceptors blocked in accept return so they can observe a pause
  /// or stop. Best effort: failures are logged at debug level.
  void unlockAccept()
  {
    if (!_acceptors.anyRunning())
    {
      return;
    }

    if (!_transport->cancelPendingAccept())
    {
      const int port = _transport->localPort();
      if (port > 0)
      {
        WakeupTarget target;
        target.address = wakeupAddressFor(_config.address);
        target.port = port;
        target.connectTimeout = std::max(kMinWakeupTimeout, _config.unlockTimeout);
        target.receiveTimeout = std::max(kMinWakeupTimeout, _config.connectionTimeout);
        target.lingerSeconds = _config.connectionLinger;
        target.sendRequest = _transport->deferAccept();
        try
        {
          PORTA_LOG_DEBUG("Endpoint " << _config.name << ": opening wakeup connection to "
                                      << target.address << ":" << target.port);
          openWakeupConnection(target);
        }
        catch (const std::exception &e)
        {
          PORTA_LOG_DEBUG("Endpoint " << _config.name << ": wakeup connection to port " << port
                                      << " failed: " << e.what());
        }
      }
      else
      {
        PORTA_LOG_DEBUG("Endpoint " << _config.name << ": no local port, cannot unlock accept");
      }
    }

    auto deadline = std::chrono::steady_clock::now() + kUnlockWait;
    while (_acceptors.anyRunning() && std::chrono::steady_clock::now() < deadline)
    {
      std::this_thread::sleep_for(kUnlockPoll);
    }
    if (_acceptors.anyRunning())
    {
      PORTA_LOG_DEBUG("Endpoint " << _config.name << ": acceptors still running after unlock");
    }
  }

  // State

  BindState getBindState() const { return _bindState.load(); }
  bool isRunning() const override { return _running.load(); }
  bool isPaused() const override { return _paused.load(); }
  const EndpointConfig &config() const { return _config; }
  const std::string &name() const { return _config.name; }

  /// Port the transport is listening on, -1 when unbound.
  int getLocalPort() const { return _transport->localPort(); }

  std::vector<AcceptorState> getAcceptorStates() const { return _acceptors.states(); }

  // Admission

  void setMaxConnections(long maxConnections)
  {
    _maxConnections = maxConnections;
    if (_running)
    {
      _gate.setLimit(maxConnections);
    }
  }

  long getMaxConnections() const { return _maxConnections.load(); }

  /// Admitted connections, -1 when the limit is disabled or not running.
  long getConnectionCount() const { return _gate.currentCount(); }

  core::AdmissionGate::AcquireResult countUpOrAwaitConnection() override
  {
    return _gate.tryAcquireOrAwait();
  }

  long countDownConnection() override { return _gate.release(); }

  // Workers

  void setExecutor(std::shared_ptr<core::IExecutor> executor)
  {
    _dispatcher.setExecutor(std::move(executor));
  }

  std::shared_ptr<core::IExecutor> getExecutor() const { return _dispatcher.executor(); }
  bool isInternalExecutor() const { return _dispatcher.isInternal(); }

  void setMinSpareThreads(int minSpareThreads) { _dispatcher.setMinSpareThreads(minSpareThreads); }
  void setMaxThreads(int maxThreads) { _dispatcher.setMaxThreads(maxThreads); }
  int getMinSpareThreads() const { return _dispatcher.getMinSpareThreads(); }
  int getMaxThreads() const { return _dispatcher.getMaxThreads(); }
  int getCurrentThreadCount() const { return _dispatcher.getCurrentThreadCount(); }
  int getCurrentThreadsBusy() const { return _dispatcher.getCurrentThreadsBusy(); }

  ProcessorPool<SocketProcessor> &processorCache() { return _processorCache; }

  // TLS

  /// Register a virtual host. Its context is built at once when the endpoint
  /// is already bound with TLS enabled.
  /// \throws std::invalid_argument on an invalid, duplicate or unbuildable
  /// entry; the registry is left unchanged
  void addTlsHostConfig(TlsHostConfigPtr config)
  {
    const bool bound = _bindState != BindState::Unbound;
    _tlsRegistry.add(std::move(config), _config.sslEnabled && bound);
  }

  std::vector<TlsHostConfigPtr> findTlsHostConfigs() const { return _tlsRegistry.findAll(); }

  /// Entry serving \p sniHostName, falling back to a wildcard match and
  /// then the default host.
  TlsHostConfigPtr getTlsHostConfig(const char *sniHostName) const
  {
    return _tlsRegistry.resolve(sniHostName);
  }

  const TlsConfigRegistry &tlsRegistry() const { return _tlsRegistry; }

  // Connections

  AcceptResult acceptConnection() override { return _transport->acceptOne(); }

  bool handOff(std::unique_ptr<IConnection> connection, bool holdsSlot) override
  {
    SocketWrapperPtr wrapper;
    try
    {
      SocketWrapper::SlotRelease release;
      if (holdsSlot)
      {
        release = [this]() { countDownConnection(); };
      }
      wrapper = std::make_shared<SocketWrapper>(std::move(connection), std::move(release));
    }
    catch (const std::exception &)
    {
      if (holdsSlot)
      {
        countDownConnection();
      }
      throw;
    }

    if (!setSocketOptions(wrapper) || !processSocket(wrapper, SocketEvent::OpenRead, true))
    {
      wrapper->close();
      return false;
    }
    return true;
  }

  /// Apply the configured per-connection options through the transport and
  /// seed the wrapper's keep-alive hints for the handler.
  bool setSocketOptions(const SocketWrapperPtr &wrapper)
  {
    if (!wrapper || !wrapper->connection())
    {
      return false;
    }
    try
    {
      _transport->configureConnection(*wrapper->connection(), _config.socketOptions());
      wrapper->setKeepAliveLeft(_config.maxKeepAliveRequests);
      wrapper->setKeepAliveTimeout(_config.effectiveKeepAliveTimeout());
      return true;
    }
    catch (const std::exception &e)
    {
      core::rethrowIfUnrecoverable(e);
      PORTA_LOG_DEBUG("Endpoint " << _config.name << ": socket options failed for "
                                  << wrapper->peerAddress() << ": " << e.what());
      return false;
    }
  }

  /// \brief Process \p event for \p wrapper.
  ///
  /// Runs on the worker pool when \p dispatch is true and a pool exists,
  /// otherwise on the calling thread.
  /// \return false if the connection could not be handed over; the caller
  /// closes it
  bool processSocket(const SocketWrapperPtr &wrapper, SocketEvent event, bool dispatch)
  {
    if (!wrapper)
    {
      return false;
    }

    std::unique_ptr<SocketProcessor> processor = _processorCache.acquire();
    try
    {
      if (!processor)
      {
        processor = std::make_unique<SocketProcessor>(*_handler);
      }
      processor->reset(wrapper, event);

      if (dispatch && _dispatcher.hasExecutor())
      {
        auto holder = std::make_shared<std::unique_ptr<SocketProcessor>>(std::move(processor));
        try
        {
          _dispatcher.execute(
            [this, holder]()
            {
              (*holder)->run();
              recycle(std::move(*holder));
            });
        }
        catch (const std::exception &)
        {
          processor = std::move(*holder);
          throw;
        }
      }
      else
      {
        processor->run();
        recycle(std::move(processor));
      }
      return true;
    }
    catch (const core::TaskRejectedError &e)
    {
      PORTA_LOG_WARN("Endpoint " << _config.name << ": connection " << wrapper->id()
                                 << " not processed: " << e.what());
    }
    catch (const std::exception &e)
    {
      core::rethrowIfUnrecoverable(e);
      PORTA_LOG_ERROR("Endpoint " << _config.name << ": failed to process connection "
                                  << wrapper->id() << ": " << e.what());
    }

    if (processor)
    {
      processor->clear();
      _processorCache.release(std::move(processor));
    }
    return false;
  }

  /// Let the handler forget \p wrapper, then close it.
  void closeConnection(const SocketWrapperPtr &wrapper)
  {
    if (!wrapper)
    {
      return;
    }
    try
    {
      _handler->release(wrapper);
    }
    catch (const std::exception &e)
    {
      core::rethrowIfUnrecoverable(e);
      PORTA_LOG_WARN("Endpoint " << _config.name << ": release failed for connection "
                                 << wrapper->id() << ": " << e.what());
    }
    wrapper->close();
  }

private:
  void startInternal()
  {
    _running = true;
    _paused = false;

    if (!_dispatcher.hasExecutor())
    {
      _dispatcher.createExecutor();
    }
    _gate.reset(_maxConnections);
    _processorCache.setCapacity(static_cast<std::size_t>(std::max(0, _config.processorCache)));
    _acceptors.start(_config.acceptorThreadCount, _config.name);
    PORTA_LOG_INFO("Endpoint " << _config.name << ": started");
  }

  void stopInternal()
  {
    _gate.setLimit(core::AdmissionGate::kDisabled);
    if (!_paused)
    {
      pause();
    }
    _running = false;
    unlockAccept();
    _acceptors.join();

    for (const auto &wrapper : _handler->getOpenConnections())
    {
      closeConnection(wrapper);
    }
    _handler->recycle();

    _dispatcher.shutdownExecutor();
    _processorCache.clear();
    PORTA_LOG_INFO("Endpoint " << _config.name << ": stopped");
  }

  void recycle(std::unique_ptr<SocketProcessor> processor)
  {
    if (!processor)
    {
      return;
    }
    processor->clear();
    if (_running)
    {
      _processorCache.release(std::move(processor));
    }
  }

  EndpointConfig _config;
  std::shared_ptr<ITransport> _transport;
  std::shared_ptr<IProtocolHandler> _handler;

  std::atomic<BindState> _bindState{BindState::Unbound};
  std::atomic<bool> _running{false};
  std::atomic<bool> _paused{false};
  std::atomic<long> _maxConnections;

  core::AdmissionGate _gate;
  TlsConfigRegistry _tlsRegistry;
  ProcessorPool<SocketProcessor> _processorCache;
  AcceptorGroup _acceptors;
  // Destroyed first: queued and running tasks refer to the members above.
  WorkerDispatcher _dispatcher;
};

} // namespace network
} // namespace porta
