#pragma once

#include <sovereign/crypto/key.hpp>
#include <sovereign/signing/gateway.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace sovereign::signing {

/// Signing gateway backed by an in-process OpenSSL key. Stands in for the
/// TPM plugin in development and tests.
class software_gateway final : public signing_gateway {
  struct passkey {
    explicit passkey() = default;
  };

 public:
  software_gateway(passkey, sovereign::crypto::evp_pkey_ptr key);

  static std::unique_ptr<software_gateway> from_pem(
      const std::string_view& private_key_pem,
      std::string& error);

  static std::unique_ptr<software_gateway> generate_rsa(int bits,
                                                        std::string& error);
  static std::unique_ptr<software_gateway> generate_ed25519(std::string& error);

  sovereign::schema::result<sovereign::schema::bytes_t> sign(
      const sovereign::common::call_context& context,
      const sign_request& request) override;

  std::string public_key_pem() const;

 private:
  sovereign::crypto::evp_pkey_ptr key_;
};

}  // namespace sovereign::signing
