// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Ephemeral certificates for the TLS tests

#pragma once

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace porta::test
{

namespace detail
{
using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;

inline PkeyPtr generateEcKey()
{
  EVP_PKEY *pkey = nullptr;
  PkeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), ::EVP_PKEY_CTX_free);
  if (kctx == nullptr || ::EVP_PKEY_keygen_init(kctx.get()) != 1 ||
      ::EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx.get(), NID_X9_62_prime256v1) != 1 ||
      ::EVP_PKEY_keygen(kctx.get(), &pkey) != 1)
  {
    return {nullptr, ::EVP_PKEY_free};
  }
  return {pkey, ::EVP_PKEY_free};
}

inline std::string drain(BIO *bio)
{
  char *data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  return std::string(data, static_cast<std::size_t>(len));
}
} // namespace detail

/// \brief Self-signed P-256 certificate and key as PEM strings. Both are
/// empty when generation fails.
inline std::pair<std::string, std::string> makeEphemeralCertKey(const char *commonName,
                                                                int validSeconds = 3600)
{
  auto pkey = detail::generateEcKey();
  if (!pkey)
  {
    return {"", ""};
  }

  std::unique_ptr<X509, decltype(&X509_free)> x509Ptr(X509_new(), &X509_free);
  X509 *x509 = x509Ptr.get();
  if (x509 == nullptr)
  {
    return {"", ""};
  }
  ASN1_INTEGER_set(X509_get_serialNumber(x509), 1);
  X509_gmtime_adj(X509_get_notBefore(x509), 0);
  X509_gmtime_adj(X509_get_notAfter(x509), validSeconds);
  X509_set_pubkey(x509, pkey.get());
  X509_NAME *name = X509_get_subject_name(x509);
  X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                             reinterpret_cast<const unsigned char *>("PortaTest"), -1, -1, 0);
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                             reinterpret_cast<const unsigned char *>(commonName), -1, -1, 0);
  X509_set_issuer_name(x509, name);
  if (X509_sign(x509, pkey.get(), EVP_sha256()) <= 0)
  {
    return {"", ""};
  }

  std::string certPem;
  std::string keyPem;
  {
    detail::BioPtr bio(BIO_new(BIO_s_mem()), ::BIO_free);
    if (bio && PEM_write_bio_X509(bio.get(), x509) == 1)
    {
      certPem = detail::drain(bio.get());
    }
  }
  {
    detail::BioPtr bio(BIO_new(BIO_s_mem()), ::BIO_free);
    if (bio &&
        PEM_write_bio_PrivateKey(bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) == 1)
    {
      keyPem = detail::drain(bio.get());
    }
  }
  return {certPem, keyPem};
}

} // namespace porta::test
