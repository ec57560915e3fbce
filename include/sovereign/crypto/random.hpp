#pragma once

#include <sovereign/schema/primitives.hpp>

namespace sovereign::crypto {

/// Bytes from the OpenSSL CSPRNG. Terminates the process if the generator
/// cannot be seeded.
sovereign::schema::bytes_t random_bytes(size_t size);

sovereign::schema::nonce_t make_nonce();

}  // namespace sovereign::crypto
