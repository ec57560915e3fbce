#include <gtest/gtest.h>
#include <sovereign/crypto/key.hpp>
#include <sovereign/crypto/verify.hpp>
#include <sovereign/signing/delegated_signer.hpp>
#include <sovereign/signing/plugin_gateway.hpp>
#include <sovereign/testing/fakes.hpp>
#include <sovereign/testing/keys.hpp>

#include <nlohmann/json.hpp>

#include <type_traits>

namespace {

const auto kDigest = sovereign::schema::bytes_t(32, 0x5A);

}  // namespace

TEST(delegated_signer, unknown_hash_falls_back_to_sha256_pkcs1) {
  auto request = sovereign::signing::delegated_signer::make_request(
      kDigest, sovereign::signing::signer_options{.hash = "md5"});
  EXPECT_EQ(request.hash_algorithm, sovereign::schema::hash_algorithm_t::sha256);
  EXPECT_EQ(request.scheme, sovereign::schema::signature_scheme_t::rsassa);
  EXPECT_EQ(request.digest, kDigest);

  auto unset = sovereign::signing::delegated_signer::make_request(
      kDigest, sovereign::signing::signer_options{});
  EXPECT_EQ(unset.hash_algorithm, sovereign::schema::hash_algorithm_t::sha256);
}

TEST(delegated_signer, hash_names_are_normalized) {
  auto request = sovereign::signing::delegated_signer::make_request(
      kDigest, sovereign::signing::signer_options{.hash = "SHA-384"});
  EXPECT_EQ(request.hash_algorithm, sovereign::schema::hash_algorithm_t::sha384);
}

TEST(delegated_signer, pss_salt_length_is_forwarded_verbatim) {
  auto gateway = sovereign::testing::make_rsa_gateway();
  if (!gateway) {
    GTEST_SKIP() << "RSA unavailable";
  }
  auto recording = sovereign::testing::recording_gateway{};
  auto error = std::string{};
  auto signer = sovereign::signing::delegated_signer::create(
      recording, gateway->public_key_pem(), error);
  ASSERT_TRUE(signer.has_value()) << error;

  auto signature = signer->sign(
      sovereign::common::call_context{}, kDigest,
      sovereign::signing::signer_options{.hash = "sha512",
                                         .pss_salt_length = 20});
  ASSERT_TRUE(signature.ok());
  EXPECT_EQ(*signature.value, recording.signature);
  ASSERT_EQ(recording.requests.size(), 1u);
  EXPECT_EQ(recording.requests[0].scheme,
            sovereign::schema::signature_scheme_t::rsapss);
  EXPECT_EQ(recording.requests[0].salt_length, 20);
  EXPECT_EQ(recording.requests[0].hash_algorithm,
            sovereign::schema::hash_algorithm_t::sha512);

  auto hash_length = signer->sign(
      sovereign::common::call_context{}, kDigest,
      sovereign::signing::signer_options{
          .pss_salt_length = sovereign::schema::kPssSaltLengthEqualsHash});
  ASSERT_TRUE(hash_length.ok());
  EXPECT_EQ(recording.requests[1].salt_length, -1);
}

TEST(delegated_signer, signs_through_gateway_with_real_key) {
  auto gateway = sovereign::testing::make_rsa_gateway();
  if (!gateway) {
    GTEST_SKIP() << "RSA unavailable";
  }
  auto error = std::string{};
  auto signer = sovereign::signing::delegated_signer::create(
      *gateway, gateway->public_key_pem(), error);
  ASSERT_TRUE(signer.has_value()) << error;
  EXPECT_EQ(signer->public_key_id().size(), 64u);

  auto signature = signer->sign(
      sovereign::common::call_context{}, kDigest,
      sovereign::signing::signer_options{.hash = "sha256",
                                         .pss_salt_length = -1});
  ASSERT_TRUE(signature.ok()) << signature.log;
  auto key = sovereign::crypto::parse_public_key(signer->public_key_pem(), error);
  ASSERT_TRUE(key.has_value());
  EXPECT_TRUE(sovereign::crypto::verify_digest(
      **key, kDigest, *signature.value,
      sovereign::schema::hash_algorithm_t::sha256,
      sovereign::schema::signature_scheme_t::rsapss));
}

TEST(delegated_signer, rejects_unparseable_or_non_rsa_keys) {
  auto recording = sovereign::testing::recording_gateway{};
  auto error = std::string{};
  EXPECT_FALSE(sovereign::signing::delegated_signer::create(
                   recording, "-----BEGIN PUBLIC KEY-----\nAAAA\n", error)
                   .has_value());
  EXPECT_FALSE(error.empty());

  auto ed25519 = sovereign::testing::make_ed25519_gateway();
  if (!ed25519) {
    GTEST_SKIP() << "Ed25519 unavailable";
  }
  error.clear();
  EXPECT_FALSE(sovereign::signing::delegated_signer::create(
                   recording, ed25519->public_key_pem(), error)
                   .has_value());
  EXPECT_FALSE(error.empty());
}

TEST(delegated_signer, gateway_failure_is_returned_unchanged) {
  auto gateway = sovereign::testing::make_rsa_gateway();
  if (!gateway) {
    GTEST_SKIP() << "RSA unavailable";
  }
  auto recording = sovereign::testing::recording_gateway{};
  recording.failure = sovereign::schema::make_status(
      sovereign::schema::error_code::timeout, "tpm busy", "sovereign.signing");
  auto error = std::string{};
  auto signer = sovereign::signing::delegated_signer::create(
      recording, gateway->public_key_pem(), error);
  ASSERT_TRUE(signer.has_value());
  auto signature = signer->sign(sovereign::common::call_context{}, kDigest, {});
  EXPECT_FALSE(signature.ok());
  EXPECT_EQ(signature.code, sovereign::schema::error_code::timeout);
  EXPECT_EQ(signature.log, "tpm busy");
}

TEST(delegated_signer, gateway_call_is_bounded_by_signing_timeout) {
  auto gateway = sovereign::testing::make_rsa_gateway();
  if (!gateway) {
    GTEST_SKIP() << "RSA unavailable";
  }
  auto recording = sovereign::testing::recording_gateway{};
  auto error = std::string{};
  auto signer = sovereign::signing::delegated_signer::create(
      recording, gateway->public_key_pem(), error);
  ASSERT_TRUE(signer.has_value()) << error;

  // An unbounded caller still gets the default budget.
  ASSERT_TRUE(signer->sign(sovereign::common::call_context{}, kDigest, {}).ok());
  ASSERT_EQ(recording.budgets.size(), 1u);
  ASSERT_TRUE(recording.budgets[0].has_value());
  EXPECT_GT(*recording.budgets[0], std::chrono::milliseconds{0});
  EXPECT_LE(*recording.budgets[0], sovereign::signing::kDefaultSigningTimeout);

  ASSERT_TRUE(signer
                  ->sign(sovereign::common::call_context{}, kDigest,
                         sovereign::signing::signer_options{
                             .timeout = std::chrono::milliseconds{250}})
                  .ok());
  ASSERT_TRUE(recording.budgets[1].has_value());
  EXPECT_LE(*recording.budgets[1], std::chrono::milliseconds{250});

  // A tighter caller deadline wins over the signing timeout.
  auto tight = sovereign::common::call_context::with_timeout(
      std::chrono::milliseconds{50});
  ASSERT_TRUE(signer->sign(tight, kDigest, {}).ok());
  ASSERT_TRUE(recording.budgets[2].has_value());
  EXPECT_LE(*recording.budgets[2], std::chrono::milliseconds{50});
}

TEST(software_gateway, only_factories_construct_gateways) {
  static_assert(!std::is_constructible_v<sovereign::signing::software_gateway,
                                         sovereign::crypto::evp_pkey_ptr>);
  auto gateway = sovereign::testing::make_rsa_gateway();
  if (!gateway) {
    GTEST_SKIP() << "RSA unavailable";
  }
  EXPECT_FALSE(gateway->public_key_pem().empty());
}

TEST(plugin_gateway, posts_sign_data_and_decodes_signature) {
  auto transport = sovereign::testing::scripted_transport{};
  transport.respond(200, R"({"status":"success","signature":"AQID"})");
  auto gateway = sovereign::signing::plugin_gateway{transport};

  auto signature = gateway.sign(
      sovereign::common::call_context{},
      sovereign::signing::sign_request{
          .digest = kDigest,
          .scheme = sovereign::schema::signature_scheme_t::rsapss,
          .salt_length = 32});
  ASSERT_TRUE(signature.ok()) << signature.log;
  EXPECT_EQ(*signature.value, (sovereign::schema::bytes_t{0x01, 0x02, 0x03}));

  ASSERT_EQ(transport.requests.size(), 1u);
  EXPECT_EQ(transport.requests[0].url, "http://localhost/sign-data");
  auto body = nlohmann::json::parse(transport.requests[0].body);
  EXPECT_EQ(body["hash_algorithm"], "sha256");
  EXPECT_EQ(body["scheme"], "rsapss");
  EXPECT_EQ(body["salt_length"], 32);
  EXPECT_EQ(body["digest"], sovereign::schema::to_base64(kDigest));
}

TEST(plugin_gateway, non_success_status_is_signing_failure) {
  auto transport = sovereign::testing::scripted_transport{};
  transport.respond(200, R"({"status":"error","error":"key not loaded"})");
  transport.respond(503, "busy");
  auto gateway = sovereign::signing::plugin_gateway{transport};

  auto first = gateway.sign(sovereign::common::call_context{},
                            sovereign::signing::sign_request{.digest = kDigest});
  EXPECT_EQ(first.code, sovereign::schema::error_code::signing_failed);
  EXPECT_NE(first.log.find("key not loaded"), std::string::npos);

  auto second = gateway.sign(sovereign::common::call_context{},
                             sovereign::signing::sign_request{.digest = kDigest});
  EXPECT_EQ(second.code, sovereign::schema::error_code::signing_failed);
  EXPECT_FALSE(second.value.has_value());
}

TEST(plugin_gateway, transport_failure_keeps_its_code) {
  auto transport = sovereign::testing::scripted_transport{};
  transport.fail(sovereign::schema::error_code::timeout, "deadline exceeded");
  auto gateway = sovereign::signing::plugin_gateway{transport};
  auto signature = gateway.sign(sovereign::common::call_context{},
                                sovereign::signing::sign_request{.digest = kDigest});
  EXPECT_EQ(signature.code, sovereign::schema::error_code::timeout);
  EXPECT_TRUE(sovereign::schema::retryable(signature.code));
}
