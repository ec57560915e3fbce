#include <gtest/gtest.h>
#include <sovereign/schema/error_code.hpp>
#include <sovereign/schema/integrity_status.hpp>
#include <sovereign/schema/primitives.hpp>
#include <sovereign/schema/ring.hpp>

TEST(primitives, hex_round_trips_and_accepts_prefix) {
  auto bytes = sovereign::schema::bytes_t{0x00, 0x1F, 0xAB, 0xFF};
  auto hex = sovereign::schema::to_hex(bytes);
  EXPECT_EQ(hex, "001fabff");
  EXPECT_EQ(sovereign::schema::try_from_hex("0x001FABFF"), bytes);
}

TEST(primitives, try_from_hex_rejects_odd_and_non_hex_input) {
  EXPECT_FALSE(sovereign::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(sovereign::schema::try_from_hex("zz").has_value());
}

TEST(primitives, try_make_hash32_requires_32_bytes) {
  auto hash = sovereign::schema::try_make_hash32(
      "0x0102030405060708090a0b0c0d0e0f10"
      "1112131415161718191a1b1c1d1e1f20");
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_FALSE(sovereign::schema::try_make_hash32("0102").has_value());
}

TEST(primitives, base64_matches_known_vectors) {
  EXPECT_EQ(sovereign::schema::to_base64(sovereign::schema::make_bytes(
                std::string_view{"foobar"})),
            "Zm9vYmFy");
  EXPECT_EQ(sovereign::schema::to_base64(
                sovereign::schema::make_bytes(std::string_view{"fo"})),
            "Zm8=");
  EXPECT_EQ(sovereign::schema::to_base64(sovereign::schema::bytes_t{}), "");
}

TEST(primitives, base64_decodes_padding_exactly) {
  auto decoded = sovereign::schema::try_from_base64("Zm8=");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(sovereign::schema::make_string(*decoded), "fo");
  EXPECT_FALSE(sovereign::schema::try_from_base64("Zm=8").has_value());
  EXPECT_FALSE(sovereign::schema::try_from_base64("not base64***").has_value());
}

TEST(primitives, integrity_status_parses_case_insensitively) {
  EXPECT_EQ(sovereign::schema::parse_integrity_status("passed_all_checks"),
            sovereign::schema::integrity_status_t::passed_all_checks);
  EXPECT_EQ(sovereign::schema::parse_integrity_status("FAILED"),
            sovereign::schema::integrity_status_t::failed);
  EXPECT_EQ(sovereign::schema::parse_integrity_status("degraded"),
            sovereign::schema::integrity_status_t::unknown);
}

TEST(primitives, ring_names_round_trip) {
  for (auto ring : {sovereign::schema::ring_t::host, sovereign::schema::ring_t::vm,
                    sovereign::schema::ring_t::workload}) {
    auto name = sovereign::schema::to_string(ring);
    EXPECT_EQ(sovereign::schema::try_from_string<sovereign::schema::ring_t>(name),
              ring);
  }
  EXPECT_FALSE(
      sovereign::schema::try_from_string<sovereign::schema::ring_t>("HOST"));
}

TEST(primitives, only_transport_errors_are_retryable) {
  using sovereign::schema::error_code;
  EXPECT_TRUE(sovereign::schema::retryable(error_code::timeout));
  EXPECT_TRUE(sovereign::schema::retryable(error_code::transport_failure));
  EXPECT_FALSE(sovereign::schema::retryable(error_code::session_consumed));
  EXPECT_FALSE(sovereign::schema::retryable(error_code::verifier_status));
  EXPECT_EQ(sovereign::schema::category(error_code::binding_mismatch),
            sovereign::schema::error_category_t::protocol);
  EXPECT_EQ(sovereign::schema::category(error_code::policy_denied),
            sovereign::schema::error_category_t::policy);
  EXPECT_EQ(sovereign::schema::category(error_code::unknown_feature_flag),
            sovereign::schema::error_category_t::configuration);
}
