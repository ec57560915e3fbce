#include <sovereign/crypto/digest.hpp>
#include <sovereign/signing/software_gateway.hpp>

#include <openssl/rsa.h>

namespace sovereign::signing {

namespace {

using sovereign::schema::bytes_t;
using sovereign::schema::error_code;

sovereign::schema::result<bytes_t> sign_failed(const std::string& what) {
  return sovereign::schema::make_error<bytes_t>(
      error_code::signing_failed,
      what + ": " + sovereign::crypto::last_openssl_error(),
      std::string{kCodespace});
}

sovereign::schema::result<bytes_t> sign_rsa(EVP_PKEY& key,
                                            const sign_request& request) {
  auto ctx = sovereign::crypto::evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new(&key, nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1) {
    return sign_failed("EVP_PKEY_sign_init failed");
  }
  auto pss = request.scheme == sovereign::schema::signature_scheme_t::rsapss;
  if (EVP_PKEY_CTX_set_rsa_padding(
          ctx.get(), pss ? RSA_PKCS1_PSS_PADDING : RSA_PKCS1_PADDING) != 1) {
    return sign_failed("failed to select RSA padding");
  }
  if (EVP_PKEY_CTX_set_signature_md(
          ctx.get(),
          sovereign::crypto::message_digest(request.hash_algorithm)) != 1) {
    return sign_failed("failed to select signature digest");
  }
  if (pss &&
      EVP_PKEY_CTX_set_rsa_pss_saltlen(ctx.get(), request.salt_length) != 1) {
    return sign_failed("failed to set PSS salt length");
  }

  auto size = size_t{};
  if (EVP_PKEY_sign(ctx.get(), nullptr, &size, request.digest.data(),
                    request.digest.size()) != 1) {
    return sign_failed("EVP_PKEY_sign size query failed");
  }
  auto signature = bytes_t(size);
  if (EVP_PKEY_sign(ctx.get(), signature.data(), &size, request.digest.data(),
                    request.digest.size()) != 1) {
    return sign_failed("EVP_PKEY_sign failed");
  }
  signature.resize(size);
  return sovereign::schema::make_result(std::move(signature));
}

sovereign::schema::result<bytes_t> sign_ed25519(EVP_PKEY& key,
                                                const sign_request& request) {
  auto ctx = sovereign::crypto::evp_md_ctx_ptr{EVP_MD_CTX_new(),
                                               EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, &key) != 1) {
    return sign_failed("EVP_DigestSignInit failed");
  }
  auto size = size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &size, request.digest.data(),
                     request.digest.size()) != 1) {
    return sign_failed("EVP_DigestSign size query failed");
  }
  auto signature = bytes_t(size);
  if (EVP_DigestSign(ctx.get(), signature.data(), &size,
                     request.digest.data(), request.digest.size()) != 1) {
    return sign_failed("EVP_DigestSign failed");
  }
  signature.resize(size);
  return sovereign::schema::make_result(std::move(signature));
}

sovereign::crypto::evp_pkey_ptr generate(
    const char* algorithm,
    const int rsa_bits) {
  auto ctx = sovereign::crypto::evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, algorithm, nullptr),
      EVP_PKEY_CTX_free};
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return {nullptr, EVP_PKEY_free};
  }
  if (rsa_bits > 0 &&
      EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), rsa_bits) != 1) {
    return {nullptr, EVP_PKEY_free};
  }
  if (EVP_PKEY_generate(ctx.get(), &raw) != 1) {
    return {nullptr, EVP_PKEY_free};
  }
  return {raw, EVP_PKEY_free};
}

}  // namespace

software_gateway::software_gateway(passkey, sovereign::crypto::evp_pkey_ptr key)
    : key_{std::move(key)} {}

std::unique_ptr<software_gateway> software_gateway::from_pem(
    const std::string_view& private_key_pem,
    std::string& error) {
  auto key = sovereign::crypto::parse_private_key(private_key_pem, error);
  if (!key) {
    return nullptr;
  }
  if (sovereign::crypto::key_type(**key) ==
      sovereign::crypto::key_type_t::unsupported) {
    error = "unsupported private key type";
    return nullptr;
  }
  return std::make_unique<software_gateway>(passkey{}, std::move(*key));
}

std::unique_ptr<software_gateway> software_gateway::generate_rsa(
    const int bits,
    std::string& error) {
  auto key = generate("RSA", bits);
  if (!key) {
    error = "RSA key generation failed: " +
            sovereign::crypto::last_openssl_error();
    return nullptr;
  }
  return std::make_unique<software_gateway>(passkey{}, std::move(key));
}

std::unique_ptr<software_gateway> software_gateway::generate_ed25519(
    std::string& error) {
  auto key = generate("ED25519", 0);
  if (!key) {
    error = "Ed25519 key generation failed: " +
            sovereign::crypto::last_openssl_error();
    return nullptr;
  }
  return std::make_unique<software_gateway>(passkey{}, std::move(key));
}

sovereign::schema::result<bytes_t> software_gateway::sign(
    const sovereign::common::call_context& context,
    const sign_request& request) {
  auto status = sovereign::common::check_context(context, kCodespace);
  if (!status.ok()) {
    return sovereign::schema::make_error<bytes_t>(status);
  }
  switch (sovereign::crypto::key_type(*key_)) {
    case sovereign::crypto::key_type_t::rsa:
      return sign_rsa(*key_, request);
    case sovereign::crypto::key_type_t::ed25519:
      return sign_ed25519(*key_, request);
    case sovereign::crypto::key_type_t::unsupported:
    default:
      return sovereign::schema::make_error<bytes_t>(
          error_code::signing_failed, "unsupported key type",
          std::string{kCodespace});
  }
}

std::string software_gateway::public_key_pem() const {
  return sovereign::crypto::public_key_pem(*key_);
}

}  // namespace sovereign::signing
