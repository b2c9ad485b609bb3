// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <porta/core/logger.hpp>

namespace porta
{
namespace network
{

/// Reserved name of the entry used when no SNI name matches.
inline constexpr const char *kDefaultTlsHostName = "_default_";

/// \brief Opaque protocol identity (certificate chain, key, session
/// settings) produced by an ITlsContextBuilder.
class TlsContext
{
public:
  virtual ~TlsContext() = default;
};

/// \brief TLS settings for one virtual host.
struct TlsHostConfig
{
  /// Exact host name, "*.suffix" wildcard, or kDefaultTlsHostName.
  std::string hostName{kDefaultTlsHostName};
  std::string certificateFile;
  std::string certificateKeyFile;
  std::string caCertificateFile;
  std::string ciphers;
  std::vector<std::string> protocols;
  bool verifyClient{false};

  /// Built at bind time, or on registration when the endpoint is bound.
  std::shared_ptr<TlsContext> context;
};

using TlsHostConfigPtr = std::shared_ptr<TlsHostConfig>;

/// \brief Creates and disposes of the TLS context for a host configuration.
class ITlsContextBuilder
{
public:
  virtual ~ITlsContextBuilder() = default;

  /// \throws std::exception when the configuration cannot be turned into a
  /// context
  virtual std::shared_ptr<TlsContext> build(const TlsHostConfig &config) = 0;
  /// Drop whatever build() produced for \p config.
  virtual void release(TlsHostConfig &config) { config.context.reset(); }
};

/// \brief Host-name keyed TLS configurations with SNI resolution.
///
/// Lookups run concurrently. Registration takes the exclusive lock only to
/// insert; buildAll() and releaseAll() hold it throughout.
class TlsConfigRegistry
{
public:
  explicit TlsConfigRegistry(std::shared_ptr<ITlsContextBuilder> builder = nullptr)
      : _builder(std::move(builder))
  {
  }

  TlsConfigRegistry(const TlsConfigRegistry &) = delete;
  TlsConfigRegistry &operator=(const TlsConfigRegistry &) = delete;

  void setBuilder(std::shared_ptr<ITlsContextBuilder> builder)
  {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    _builder = std::move(builder);
  }

  std::shared_ptr<ITlsContextBuilder> builder() const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _builder;
  }

  /// Register \p config. With \p buildContext the context is built first,
  /// outside the registry lock, and the entry is only added if that succeeds.
  /// \throws std::invalid_argument on a null config, an empty host name, a
  /// failed build or a duplicate host name; the registry and every registered
  /// entry are left unchanged
  void add(TlsHostConfigPtr config, bool buildContext)
  {
    if (!config)
    {
      throw std::invalid_argument("TLS host config must not be null");
    }
    if (config->hostName.empty())
    {
      throw std::invalid_argument("TLS host config has an empty host name");
    }

    std::shared_ptr<ITlsContextBuilder> builder;
    {
      std::shared_lock<std::shared_mutex> lock(_mutex);
      if (_configs.count(config->hostName) != 0)
      {
        throwDuplicate(*config);
      }
      builder = _builder;
    }

    std::shared_ptr<TlsContext> context;
    if (buildContext)
    {
      context = buildFor(builder.get(), *config);
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    if (_configs.count(config->hostName) != 0)
    {
      lock.unlock();
      if (context)
      {
        // Registered by someone else while this context was being built.
        TlsHostConfig scratch = *config;
        scratch.context = std::move(context);
        releaseWith(builder.get(), scratch);
      }
      throwDuplicate(*config);
    }
    if (context)
    {
      config->context = std::move(context);
    }
    _configs.emplace(config->hostName, std::move(config));
  }

  /// Resolve an SNI name: exact match, then "*" + suffix from the first dot,
  /// then the default entry. Null or empty names yield the default entry.
  /// \throws std::logic_error if no default entry is registered
  TlsHostConfigPtr resolve(const char *sniHostName) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    if (sniHostName != nullptr && *sniHostName != '\0')
    {
      const std::string name(sniHostName);
      auto it = _configs.find(name);
      if (it != _configs.end())
      {
        return it->second;
      }
      auto dot = name.find('.');
      if (dot != std::string::npos)
      {
        it = _configs.find("*" + name.substr(dot));
        if (it != _configs.end())
        {
          return it->second;
        }
      }
    }

    auto it = _configs.find(_defaultHostName);
    if (it == _configs.end())
    {
      throw std::logic_error("No TLS host config registered for the default host name [" +
                             _defaultHostName + "]");
    }
    return it->second;
  }

  TlsHostConfigPtr resolve(const std::string &sniHostName) const
  {
    return resolve(sniHostName.c_str());
  }

  /// Exact-name lookup without any fallback.
  TlsHostConfigPtr find(const std::string &hostName) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _configs.find(hostName);
    return it == _configs.end() ? nullptr : it->second;
  }

  std::vector<TlsHostConfigPtr> findAll() const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    std::vector<TlsHostConfigPtr> result;
    result.reserve(_configs.size());
    for (const auto &entry : _configs)
    {
      result.push_back(entry.second);
    }
    return result;
  }

  bool contains(const std::string &hostName) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _configs.count(hostName) != 0;
  }

  std::size_t size() const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _configs.size();
  }

  std::string defaultHostName() const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _defaultHostName;
  }

  void setDefaultHostName(std::string hostName)
  {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    _defaultHostName = std::move(hostName);
  }

  /// Build a context for every entry that lacks one. Entries built by this
  /// call are released again if a later one fails.
  /// \throws std::invalid_argument if the default entry is missing or any
  /// build fails
  void buildAll()
  {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    if (_configs.find(_defaultHostName) == _configs.end())
    {
      throw std::invalid_argument("No TLS host config registered for the default host name [" +
                                  _defaultHostName + "]");
    }

    std::vector<TlsHostConfig *> built;
    try
    {
      for (auto &entry : _configs)
      {
        if (!entry.second->context)
        {
          entry.second->context = buildFor(_builder.get(), *entry.second);
          built.push_back(entry.second.get());
        }
      }
    }
    catch (const std::invalid_argument &)
    {
      for (auto *config : built)
      {
        releaseOne(*config);
      }
      throw;
    }
  }

  /// Release every built context; the entries stay registered.
  void releaseAll()
  {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    for (auto &entry : _configs)
    {
      releaseOne(*entry.second);
    }
  }

private:
  [[noreturn]] static void throwDuplicate(const TlsHostConfig &config)
  {
    throw std::invalid_argument("Duplicate TLS host config for host name [" + config.hostName +
                                "]");
  }

  /// Build a context for \p config without storing it.
  static std::shared_ptr<TlsContext> buildFor(ITlsContextBuilder *builder,
                                              const TlsHostConfig &config)
  {
    if (builder == nullptr)
    {
      throw std::invalid_argument("No TLS context builder configured for host name [" +
                                  config.hostName + "]");
    }
    std::shared_ptr<TlsContext> context;
    try
    {
      context = builder->build(config);
    }
    catch (const std::exception &e)
    {
      throw std::invalid_argument("Failed to create TLS context for host name [" +
                                  config.hostName + "]: " + e.what());
    }
    if (!context)
    {
      throw std::invalid_argument("TLS context builder returned nothing for host name [" +
                                  config.hostName + "]");
    }
    return context;
  }

  // Requires the exclusive lock.
  void releaseOne(TlsHostConfig &config) noexcept { releaseWith(_builder.get(), config); }

  static void releaseWith(ITlsContextBuilder *builder, TlsHostConfig &config) noexcept
  {
    if (!config.context)
    {
      return;
    }
    try
    {
      if (builder != nullptr)
      {
        builder->release(config);
      }
    }
    catch (const std::exception &e)
    {
      PORTA_LOG_WARN("TlsConfigRegistry: releasing context for [" << config.hostName
                                                                   << "] failed: " << e.what());
    }
    config.context.reset();
  }

  mutable std::shared_mutex _mutex;
  std::shared_ptr<ITlsContextBuilder> _builder;
  std::unordered_map<std::string, TlsHostConfigPtr> _configs;
  std::string _defaultHostName{kDefaultTlsHostName};
};

} // namespace network
} // namespace porta
