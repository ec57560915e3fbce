#pragma once

#include <sovereign/schema/hash_algorithm.hpp>
#include <sovereign/schema/primitives.hpp>
#include <sovereign/schema/signature_scheme.hpp>

#include <openssl/evp.h>

namespace sovereign::crypto {

/// True when the linked OpenSSL provides RSA-PSS and Ed25519.
bool available();

/// Verify `signature` over a precomputed `digest`.
///
/// RSA keys honour `scheme` (PKCS#1 v1.5 or PSS with `salt_length`).
/// Ed25519 keys sign the digest bytes as the message and ignore the RSA
/// parameters.
bool verify_digest(EVP_PKEY& key,
                   const sovereign::schema::bytes_view_t& digest,
                   const sovereign::schema::bytes_view_t& signature,
                   sovereign::schema::hash_algorithm_t hash_algorithm,
                   sovereign::schema::signature_scheme_t scheme,
                   int32_t salt_length = sovereign::schema::kPssSaltLengthEqualsHash);

}  // namespace sovereign::crypto
