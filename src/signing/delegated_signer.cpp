#include <sovereign/signing/delegated_signer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sovereign::signing {

namespace {

std::optional<sovereign::schema::hash_algorithm_t> parse_hash_name(
    std::string name) {
  std::erase_if(name, [](const char c) { return c == '-' || c == '_'; });
  return sovereign::schema::try_from_string<sovereign::schema::hash_algorithm_t>(
      name);
}

}  // namespace

delegated_signer::delegated_signer(signing_gateway& gateway,
                                   sovereign::crypto::evp_pkey_ptr public_key,
                                   std::string public_key_pem)
    : gateway_{&gateway},
      public_key_{public_key.release(), EVP_PKEY_free},
      public_key_pem_{std::move(public_key_pem)},
      public_key_id_{sovereign::crypto::public_key_id(*public_key_)} {}

std::optional<delegated_signer> delegated_signer::create(
    signing_gateway& gateway,
    const std::string_view& public_key_pem,
    std::string& error) {
  auto key = sovereign::crypto::parse_public_key(public_key_pem, error);
  if (!key) {
    return std::nullopt;
  }
  if (sovereign::crypto::key_type(**key) != sovereign::crypto::key_type_t::rsa) {
    error = "delegated signer requires an RSA public key";
    return std::nullopt;
  }
  auto pem = sovereign::crypto::public_key_pem(**key);
  return delegated_signer{gateway, std::move(*key), std::move(pem)};
}

sign_request delegated_signer::make_request(
    const sovereign::schema::bytes_view_t& digest,
    const signer_options& options) {
  auto request = sign_request{};
  request.digest = sovereign::schema::make_bytes(digest);

  auto hash = parse_hash_name(options.hash);
  if (!hash) {
    spdlog::warn("Unsupported signing hash '{}', falling back to sha256",
                 options.hash);
  }
  request.hash_algorithm =
      hash.value_or(sovereign::schema::hash_algorithm_t::sha256);

  if (options.pss_salt_length) {
    request.scheme = sovereign::schema::signature_scheme_t::rsapss;
    request.salt_length = *options.pss_salt_length;
  } else {
    request.scheme = sovereign::schema::signature_scheme_t::rsassa;
    request.salt_length = sovereign::schema::kPssSaltLengthEqualsHash;
  }
  return request;
}

sovereign::schema::result<sovereign::schema::bytes_t> delegated_signer::sign(
    const sovereign::common::call_context& context,
    const sovereign::schema::bytes_view_t& digest,
    const signer_options& options) const {
  auto request = make_request(digest, options);
  spdlog::debug("Delegating {} byte digest to signing gateway ({}, {})",
                request.digest.size(),
                sovereign::schema::to_string(request.hash_algorithm),
                sovereign::schema::to_string(request.scheme));
  auto signed_digest = gateway_->sign(context.with_budget(options.timeout),
                                      request);
  if (!signed_digest.ok()) {
    spdlog::warn("Signing gateway failed: {}", signed_digest.log);
  }
  return signed_digest;
}

}  // namespace sovereign::signing
