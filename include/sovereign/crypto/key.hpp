#pragma once

#include <sovereign/schema/primitives.hpp>

#include <openssl/evp.h>
#include <openssl/x509.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sovereign::crypto {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using x509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;

enum class key_type_t : uint8_t {
  unsupported = 0,
  rsa = 1,
  ed25519 = 2,
};

/// Parse a PEM `PUBLIC KEY` (PKIX) or `CERTIFICATE` into its public key.
std::optional<evp_pkey_ptr> parse_public_key(const std::string_view& pem,
                                             std::string& error);

/// Parse a PEM private key (PKCS#8 or traditional).
std::optional<evp_pkey_ptr> parse_private_key(const std::string_view& pem,
                                              std::string& error);

/// Parse a DER certificate and return its public key.
std::optional<evp_pkey_ptr> parse_certificate_der(
    const sovereign::schema::bytes_view_t& der,
    std::string& error);

key_type_t key_type(const EVP_PKEY& key);

/// PKIX PEM encoding of the public half of `key`.
std::string public_key_pem(const EVP_PKEY& key);

/// DER SubjectPublicKeyInfo of the public half of `key`.
sovereign::schema::bytes_t public_key_der(const EVP_PKEY& key);

/// Stable identifier of a public key: hex of sha256(SubjectPublicKeyInfo).
std::string public_key_id(const EVP_PKEY& key);

std::string last_openssl_error();

}  // namespace sovereign::crypto
