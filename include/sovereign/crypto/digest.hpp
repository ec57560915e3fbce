#pragma once

#include <sovereign/schema/hash_algorithm.hpp>
#include <sovereign/schema/primitives.hpp>

#include <openssl/evp.h>

namespace sovereign::crypto {

const EVP_MD* message_digest(sovereign::schema::hash_algorithm_t algorithm);

sovereign::schema::bytes_t digest(
    sovereign::schema::hash_algorithm_t algorithm,
    const sovereign::schema::bytes_view_t& message);

sovereign::schema::hash32_t sha256(
    const sovereign::schema::bytes_view_t& message);
sovereign::schema::hash32_t sha256(const std::string_view& message);

}  // namespace sovereign::crypto
