#include <sovereign/common/critical.hpp>
#include <sovereign/crypto/digest.hpp>

#include <algorithm>

namespace sovereign::crypto {

const EVP_MD* message_digest(
    const sovereign::schema::hash_algorithm_t algorithm) {
  switch (algorithm) {
    case sovereign::schema::hash_algorithm_t::sha384:
      return EVP_sha384();
    case sovereign::schema::hash_algorithm_t::sha512:
      return EVP_sha512();
    case sovereign::schema::hash_algorithm_t::sha256:
    default:
      return EVP_sha256();
  }
}

sovereign::schema::bytes_t digest(
    const sovereign::schema::hash_algorithm_t algorithm,
    const sovereign::schema::bytes_view_t& message) {
  auto out = sovereign::schema::bytes_t(EVP_MAX_MD_SIZE);
  auto size = 0u;
  if (EVP_Digest(message.data(), message.size(), out.data(), &size,
                 message_digest(algorithm), nullptr) != 1) {
    sovereign::common::critical("EVP_Digest failed");
  }
  out.resize(size);
  return out;
}

sovereign::schema::hash32_t sha256(
    const sovereign::schema::bytes_view_t& message) {
  auto bytes = digest(sovereign::schema::hash_algorithm_t::sha256, message);
  auto out = sovereign::schema::hash32_t{};
  std::copy_n(bytes.begin(), out.size(), out.begin());
  return out;
}

sovereign::schema::hash32_t sha256(const std::string_view& message) {
  return sha256(sovereign::schema::make_bytes_view(message));
}

}  // namespace sovereign::crypto
