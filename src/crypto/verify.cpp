#include <sovereign/crypto/digest.hpp>
#include <sovereign/crypto/key.hpp>
#include <sovereign/crypto/verify.hpp>

#include <openssl/rsa.h>

namespace sovereign::crypto {

namespace {

bool openssl_has(const int id) {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(id, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool verify_rsa(EVP_PKEY& key,
                const sovereign::schema::bytes_view_t& digest,
                const sovereign::schema::bytes_view_t& signature,
                const sovereign::schema::hash_algorithm_t hash_algorithm,
                const sovereign::schema::signature_scheme_t scheme,
                const int32_t salt_length) {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new(&key, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_verify_init(ctx.get()) != 1) {
    return false;
  }
  auto padding = scheme == sovereign::schema::signature_scheme_t::rsapss
                     ? RSA_PKCS1_PSS_PADDING
                     : RSA_PKCS1_PADDING;
  if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), padding) != 1) {
    return false;
  }
  if (EVP_PKEY_CTX_set_signature_md(ctx.get(),
                                    message_digest(hash_algorithm)) != 1) {
    return false;
  }
  if (padding == RSA_PKCS1_PSS_PADDING &&
      EVP_PKEY_CTX_set_rsa_pss_saltlen(ctx.get(), salt_length) != 1) {
    return false;
  }
  return EVP_PKEY_verify(ctx.get(), signature.data(), signature.size(),
                         digest.data(), digest.size()) == 1;
}

bool verify_ed25519(EVP_PKEY& key,
                    const sovereign::schema::bytes_view_t& digest,
                    const sovereign::schema::bytes_view_t& signature) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, &key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          digest.data(), digest.size()) == 1;
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has(EVP_PKEY_ED25519) && openssl_has(EVP_PKEY_RSA_PSS);
  return available_now;
}

bool verify_digest(EVP_PKEY& key,
                   const sovereign::schema::bytes_view_t& digest,
                   const sovereign::schema::bytes_view_t& signature,
                   const sovereign::schema::hash_algorithm_t hash_algorithm,
                   const sovereign::schema::signature_scheme_t scheme,
                   const int32_t salt_length) {
  switch (key_type(key)) {
    case key_type_t::rsa:
      return verify_rsa(key, digest, signature, hash_algorithm, scheme,
                        salt_length);
    case key_type_t::ed25519:
      return verify_ed25519(key, digest, signature);
    case key_type_t::unsupported:
    default:
      return false;
  }
}

}  // namespace sovereign::crypto
