#include <gtest/gtest.h>
#include <sovereign/crypto/digest.hpp>
#include <sovereign/crypto/key.hpp>
#include <sovereign/crypto/random.hpp>
#include <sovereign/crypto/verify.hpp>
#include <sovereign/testing/keys.hpp>

#include <string>

namespace {

sovereign::schema::bytes_t make_digest(const std::string_view message) {
  auto hash = sovereign::crypto::sha256(message);
  return sovereign::schema::bytes_t{std::begin(hash), std::end(hash)};
}

}  // namespace

TEST(crypto, sha256_matches_known_vector) {
  auto hash = sovereign::crypto::sha256(std::string_view{"abc"});
  EXPECT_EQ(sovereign::schema::to_hex(hash),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  auto long_hash = sovereign::crypto::digest(
      sovereign::schema::hash_algorithm_t::sha512,
      sovereign::schema::make_bytes_view(std::string_view{"abc"}));
  EXPECT_EQ(long_hash.size(), 64u);
}

TEST(crypto, nonces_are_distinct) {
  EXPECT_NE(sovereign::crypto::make_nonce(), sovereign::crypto::make_nonce());
  EXPECT_EQ(sovereign::crypto::random_bytes(16).size(), 16u);
}

TEST(crypto, rsa_pkcs1_and_pss_signatures_verify) {
  auto gateway = sovereign::testing::make_rsa_gateway();
  if (!gateway) {
    GTEST_SKIP() << "RSA unavailable";
  }
  auto error = std::string{};
  auto key = sovereign::crypto::parse_public_key(gateway->public_key_pem(), error);
  ASSERT_TRUE(key.has_value()) << error;
  EXPECT_EQ(sovereign::crypto::key_type(**key), sovereign::crypto::key_type_t::rsa);

  auto digest = make_digest("bundle");
  for (auto scheme : {sovereign::schema::signature_scheme_t::rsassa,
                      sovereign::schema::signature_scheme_t::rsapss}) {
    auto signature = gateway->sign(
        sovereign::common::call_context{},
        sovereign::signing::sign_request{.digest = digest, .scheme = scheme});
    ASSERT_TRUE(signature.ok()) << signature.log;
    EXPECT_TRUE(sovereign::crypto::verify_digest(
        **key, digest, *signature.value,
        sovereign::schema::hash_algorithm_t::sha256, scheme));

    auto tampered = digest;
    tampered[0] ^= 0xFF;
    EXPECT_FALSE(sovereign::crypto::verify_digest(
        **key, tampered, *signature.value,
        sovereign::schema::hash_algorithm_t::sha256, scheme));
  }
}

TEST(crypto, ed25519_signature_verifies) {
  auto gateway = sovereign::testing::make_ed25519_gateway();
  if (!gateway) {
    GTEST_SKIP() << "Ed25519 unavailable";
  }
  auto error = std::string{};
  auto key = sovereign::crypto::parse_public_key(gateway->public_key_pem(), error);
  ASSERT_TRUE(key.has_value()) << error;
  EXPECT_EQ(sovereign::crypto::key_type(**key),
            sovereign::crypto::key_type_t::ed25519);

  auto digest = make_digest("quote");
  auto signature = gateway->sign(sovereign::common::call_context{},
                                 sovereign::signing::sign_request{.digest = digest});
  ASSERT_TRUE(signature.ok()) << signature.log;
  EXPECT_TRUE(sovereign::crypto::verify_digest(
      **key, digest, *signature.value,
      sovereign::schema::hash_algorithm_t::sha256,
      sovereign::schema::signature_scheme_t::rsassa));
}

TEST(crypto, parse_public_key_rejects_garbage) {
  auto error = std::string{};
  EXPECT_FALSE(sovereign::crypto::parse_public_key("not a key", error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(crypto, public_key_id_is_stable) {
  auto gateway = sovereign::testing::make_rsa_gateway();
  if (!gateway) {
    GTEST_SKIP() << "RSA unavailable";
  }
  auto error = std::string{};
  auto first = sovereign::crypto::parse_public_key(gateway->public_key_pem(), error);
  auto second = sovereign::crypto::parse_public_key(gateway->public_key_pem(), error);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(sovereign::crypto::public_key_id(**first),
            sovereign::crypto::public_key_id(**second));
  EXPECT_EQ(sovereign::crypto::public_key_id(**first).size(), 64u);
}
