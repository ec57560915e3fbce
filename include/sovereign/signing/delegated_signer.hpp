#pragma once

#include <sovereign/crypto/key.hpp>
#include <sovereign/signing/gateway.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace sovereign::signing {

inline constexpr auto kDefaultSigningTimeout = std::chrono::milliseconds{10000};

/// Caller-facing signing parameters. `hash` is a free-form name
/// ("sha384", "SHA-512", ...); anything unrecognized signs with SHA-256.
struct signer_options final {
  std::string hash;
  // Engaged requests PSS with this salt length (kPssSaltLengthEqualsHash for
  // a digest-sized salt). Disengaged requests PKCS#1 v1.5.
  std::optional<int32_t> pss_salt_length;
  // Upper bound on a single gateway call, on top of the caller's deadline.
  std::chrono::milliseconds timeout{kDefaultSigningTimeout};
};

/// RSA signer whose private key never leaves the gateway.
///
/// The public key is parsed once at construction. Signatures returned by
/// `sign` are forwarded unverified; the relying party checks them.
class delegated_signer final {
 public:
  static std::optional<delegated_signer> create(
      signing_gateway& gateway,
      const std::string_view& public_key_pem,
      std::string& error);

  sovereign::schema::result<sovereign::schema::bytes_t> sign(
      const sovereign::common::call_context& context,
      const sovereign::schema::bytes_view_t& digest,
      const signer_options& options) const;

  /// Hash and scheme the gateway will be asked for, given `options`.
  static sign_request make_request(const sovereign::schema::bytes_view_t& digest,
                                   const signer_options& options);

  const EVP_PKEY& public_key() const { return *public_key_; }
  const std::string& public_key_pem() const { return public_key_pem_; }
  const std::string& public_key_id() const { return public_key_id_; }

 private:
  delegated_signer(signing_gateway& gateway,
                   sovereign::crypto::evp_pkey_ptr public_key,
                   std::string public_key_pem);

  signing_gateway* gateway_;
  std::shared_ptr<EVP_PKEY> public_key_;
  std::string public_key_pem_;
  std::string public_key_id_;
};

}  // namespace sovereign::signing
