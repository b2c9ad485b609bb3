// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <porta/core/logger.hpp>
#include <porta/network/tls_config_registry.hpp>

namespace porta
{
namespace network
{

namespace detail
{
  /// Drain the OpenSSL error queue into a readable string.
  inline std::string opensslErrors()
  {
    std::string result;
    char buf[256];
    for (unsigned long e = ::ERR_get_error(); e != 0; e = ::ERR_get_error())
    {
      ::ERR_error_string_n(e, buf, sizeof(buf));
      if (!result.empty())
      {
        result += "; ";
      }
      result += buf;
    }
    return result.empty() ? "unknown OpenSSL error" : result;
  }

  inline int tlsVersionFromName(const std::string &name)
  {
    if (name == "TLSv1")
      return TLS1_VERSION;
    if (name == "TLSv1.1")
      return TLS1_1_VERSION;
    if (name == "TLSv1.2")
      return TLS1_2_VERSION;
    if (name == "TLSv1.3")
      return TLS1_3_VERSION;
    return 0;
  }

  /// "h2", "http/1.1" -> ALPN wire format (length-prefixed).
  inline std::vector<unsigned char> alpnWire(const std::vector<std::string> &protocols)
  {
    std::vector<unsigned char> wire;
    for (const auto &p : protocols)
    {
      if (p.empty() || p.size() > 255)
      {
        throw std::invalid_argument("Invalid ALPN protocol name [" + p + "]");
      }
      wire.push_back(static_cast<unsigned char>(p.size()));
      wire.insert(wire.end(), p.begin(), p.end());
    }
    return wire;
  }

  inline void freeAlpnWire(void *, void *ptr, CRYPTO_EX_DATA *, int, long, void *)
  {
    delete static_cast<std::vector<unsigned char> *>(ptr);
  }

  /// SSL_CTX ex_data slot holding the context's ALPN list. The list is freed
  /// together with the SSL_CTX, so SSL objects that still reference the
  /// SSL_CTX keep a valid callback argument.
  inline int alpnExIndex()
  {
    static const int index =
      ::SSL_CTX_get_ex_new_index(0, nullptr, nullptr, nullptr, &detail::freeAlpnWire);
    return index;
  }
} // namespace detail

/// \brief TlsContext backed by an OpenSSL SSL_CTX.
class OpenSslTlsContext : public TlsContext
{
public:
  /// Takes ownership of \p ctx.
  explicit OpenSslTlsContext(SSL_CTX *ctx) : _ctx(ctx) {}

  ~OpenSslTlsContext() override
  {
    if (_ctx)
    {
      ::SSL_CTX_free(_ctx);
    }
  }

  OpenSslTlsContext(const OpenSslTlsContext &) = delete;
  OpenSslTlsContext &operator=(const OpenSslTlsContext &) = delete;

  SSL_CTX *native() const { return _ctx; }

  /// Server-preferred ALPN list in wire format, nullptr when ALPN is off.
  const std::vector<unsigned char> *alpn() const
  {
    const int index = detail::alpnExIndex();
    if (index < 0)
    {
      return nullptr;
    }
    return static_cast<const std::vector<unsigned char> *>(::SSL_CTX_get_ex_data(_ctx, index));
  }

private:
  SSL_CTX *_ctx;
};

/// \brief Builds server-side SSL_CTX objects from TlsHostConfig entries.
class OpenSslContextBuilder : public ITlsContextBuilder
{
public:
  /// @param negotiableProtocols ALPN names offered to clients, most
  /// preferred first. Empty disables ALPN selection.
  explicit OpenSslContextBuilder(std::vector<std::string> negotiableProtocols = {})
      : _negotiableProtocols(std::move(negotiableProtocols))
  {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
  }

  std::shared_ptr<TlsContext> build(const TlsHostConfig &config) override
  {
    ::ERR_clear_error();
    SSL_CTX *raw = ::SSL_CTX_new(TLS_server_method());
    if (!raw)
    {
      throw std::runtime_error("SSL_CTX_new(server) failed: " + detail::opensslErrors());
    }
    auto context = std::make_shared<OpenSslTlsContext>(raw);
    SSL_CTX *ctx = context->native();

    applyProtocols(ctx, config);

    if (!config.ciphers.empty() && ::SSL_CTX_set_cipher_list(ctx, config.ciphers.c_str()) != 1)
    {
      throw std::runtime_error("Invalid cipher list [" + config.ciphers +
                               "]: " + detail::opensslErrors());
    }

    if (config.certificateFile.empty() || config.certificateKeyFile.empty())
    {
      throw std::runtime_error("Certificate and key files are required");
    }
    if (::SSL_CTX_use_certificate_chain_file(ctx, config.certificateFile.c_str()) != 1)
    {
      throw std::runtime_error("Failed to load certificate " + config.certificateFile + ": " +
                               detail::opensslErrors());
    }
    if (::SSL_CTX_use_PrivateKey_file(ctx, config.certificateKeyFile.c_str(), SSL_FILETYPE_PEM) !=
        1)
    {
      throw std::runtime_error("Failed to load private key " + config.certificateKeyFile + ": " +
                               detail::opensslErrors());
    }
    if (::SSL_CTX_check_private_key(ctx) != 1)
    {
      throw std::runtime_error("Private key does not match certificate " + config.certificateFile);
    }

    if (config.verifyClient)
    {
      ::SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);
      if (!config.caCertificateFile.empty())
      {
        if (::SSL_CTX_load_verify_locations(ctx, config.caCertificateFile.c_str(), nullptr) != 1)
        {
          throw std::runtime_error("Failed to load CA file " + config.caCertificateFile + ": " +
                                   detail::opensslErrors());
        }
      }
      else
      {
        ::SSL_CTX_set_default_verify_paths(ctx);
      }
    }

    if (!_negotiableProtocols.empty())
    {
      auto wire = std::make_unique<std::vector<unsigned char>>(
        detail::alpnWire(_negotiableProtocols));
      const int index = detail::alpnExIndex();
      if (index < 0 || ::SSL_CTX_set_ex_data(ctx, index, wire.get()) != 1)
      {
        throw std::runtime_error("Failed to attach ALPN list: " + detail::opensslErrors());
      }
      ::SSL_CTX_set_alpn_select_cb(ctx, &OpenSslContextBuilder::selectAlpn, wire.release());
    }

    PORTA_LOG_DEBUG("OpenSslContextBuilder: built context for [" << config.hostName << "]");
    return context;
  }

private:
  static void applyProtocols(SSL_CTX *ctx, const TlsHostConfig &config)
  {
    if (config.protocols.empty())
    {
      return;
    }
    int lowest = 0;
    int highest = 0;
    for (const auto &name : config.protocols)
    {
      int v = detail::tlsVersionFromName(name);
      if (v == 0)
      {
        throw std::runtime_error("Unsupported TLS protocol [" + name + "]");
      }
      lowest = lowest == 0 ? v : std::min(lowest, v);
      highest = std::max(highest, v);
    }
    if (::SSL_CTX_set_min_proto_version(ctx, lowest) != 1 ||
        ::SSL_CTX_set_max_proto_version(ctx, highest) != 1)
    {
      throw std::runtime_error("Failed to set TLS protocol bounds: " + detail::opensslErrors());
    }
  }

  static int selectAlpn(SSL *, const unsigned char **out, unsigned char *outlen,
                        const unsigned char *in, unsigned int inlen, void *arg)
  {
    auto *pref = static_cast<std::vector<unsigned char> *>(arg);
    unsigned char *selected = nullptr;
    if (::SSL_select_next_proto(&selected, outlen, pref->data(),
                                static_cast<unsigned int>(pref->size()), in,
                                inlen) != OPENSSL_NPN_NEGOTIATED)
    {
      return SSL_TLSEXT_ERR_NOACK;
    }
    *out = selected;
    return SSL_TLSEXT_ERR_OK;
  }

  std::vector<std::string> _negotiableProtocols;
};

/// \brief Switches a handshake to the context of the TlsHostConfig that the
/// client's SNI name resolves to.
///
/// Install on the SSL_CTX used to create server SSL objects (normally the
/// default host's). The registry must outlive every context the selector is
/// installed on.
class OpenSslSniSelector
{
public:
  static void install(SSL_CTX *frontContext, const TlsConfigRegistry &registry)
  {
    ::SSL_CTX_set_tlsext_servername_arg(frontContext,
                                        const_cast<TlsConfigRegistry *>(&registry));
    ::SSL_CTX_set_tlsext_servername_callback(frontContext, &OpenSslSniSelector::onServerName);
  }

  /// The SSL_CTX registered for \p serverName, falling back as
  /// TlsConfigRegistry::resolve does. nullptr if that entry has no OpenSSL
  /// context.
  static SSL_CTX *select(const TlsConfigRegistry &registry, const char *serverName)
  {
    auto config = registry.resolve(serverName);
    auto context = std::dynamic_pointer_cast<OpenSslTlsContext>(config->context);
    return context ? context->native() : nullptr;
  }

private:
  static int onServerName(SSL *ssl, int *alert, void *arg)
  {
    const auto *registry = static_cast<const TlsConfigRegistry *>(arg);
    const char *serverName = ::SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name);
    try
    {
      SSL_CTX *next = select(*registry, serverName);
      if (next == nullptr)
      {
        PORTA_LOG_ERROR("OpenSslSniSelector: no TLS context built for SNI name ["
                        << (serverName ? serverName : "") << "]");
        *alert = SSL_AD_INTERNAL_ERROR;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
      }
      if (next != ::SSL_get_SSL_CTX(ssl) && ::SSL_set_SSL_CTX(ssl, next) == nullptr)
      {
        *alert = SSL_AD_INTERNAL_ERROR;
        return SSL_TLSEXT_ERR_ALERT_FATAL;
      }
      return SSL_TLSEXT_ERR_OK;
    }
    catch (const std::logic_error &e)
    {
      PORTA_LOG_ERROR("OpenSslSniSelector: " << e.what());
      *alert = SSL_AD_INTERNAL_ERROR;
      return SSL_TLSEXT_ERR_ALERT_FATAL;
    }
  }
};

} // namespace network
} // namespace porta
