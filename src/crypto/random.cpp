#include <sovereign/common/critical.hpp>
#include <sovereign/crypto/random.hpp>

#include <openssl/rand.h>

namespace sovereign::crypto {

sovereign::schema::bytes_t random_bytes(const size_t size) {
  auto out = sovereign::schema::bytes_t(size);
  if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
    sovereign::common::critical("RAND_bytes failed");
  }
  return out;
}

sovereign::schema::nonce_t make_nonce() {
  auto nonce = sovereign::schema::nonce_t{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    sovereign::common::critical("RAND_bytes failed");
  }
  return nonce;
}

}  // namespace sovereign::crypto
