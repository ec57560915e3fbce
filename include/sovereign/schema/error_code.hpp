#pragma once

#include <sovereign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace sovereign::schema {

enum class error_code : uint32_t {
  ok = 0,

  transport_failure = 1,
  timeout = 2,
  cancelled = 3,

  incomplete_bundle = 10,
  session_mismatch = 11,
  session_missing = 12,
  session_expired = 13,
  session_consumed = 14,
  binding_mismatch = 15,
  bundle_signature_invalid = 16,
  invalid_request = 17,

  verification_failed = 20,
  verifier_status = 21,
  malformed_response = 22,

  policy_denied = 30,

  invalid_key_material = 40,
  unknown_feature_flag = 41,
  feature_flags_already_loaded = 42,
  feature_flags_not_loaded = 43,
  feature_disabled = 44,
  invalid_configuration = 45,

  signing_failed = 50,
};

enum class error_category_t : uint8_t {
  none = 0,
  transport = 1,
  protocol = 2,
  verification = 3,
  policy = 4,
  configuration = 5,
  crypto = 6,
};

inline constexpr error_category_t category(const error_code code) {
  auto value = static_cast<uint32_t>(code);
  if (value == 0) {
    return error_category_t::none;
  }
  if (value < 10) {
    return error_category_t::transport;
  }
  if (value < 20) {
    return error_category_t::protocol;
  }
  if (value < 30) {
    return error_category_t::verification;
  }
  if (value < 40) {
    return error_category_t::policy;
  }
  if (value < 50) {
    return error_category_t::configuration;
  }
  return error_category_t::crypto;
}

/// Only transport faults may be retried, and only with a fresh challenge.
inline constexpr bool retryable(const error_code code) {
  return category(code) == error_category_t::transport;
}

inline constexpr auto kErrorCategoryMappings = std::array{
    std::pair<std::string_view, error_category_t>{"none",
                                                  error_category_t::none},
    std::pair<std::string_view, error_category_t>{"transport",
                                                  error_category_t::transport},
    std::pair<std::string_view, error_category_t>{"protocol",
                                                  error_category_t::protocol},
    std::pair<std::string_view, error_category_t>{
        "verification", error_category_t::verification},
    std::pair<std::string_view, error_category_t>{"policy",
                                                  error_category_t::policy},
    std::pair<std::string_view, error_category_t>{
        "configuration", error_category_t::configuration},
    std::pair<std::string_view, error_category_t>{"crypto",
                                                  error_category_t::crypto},
};

inline constexpr std::string_view to_string(const error_category_t value) {
  return to_string(value, kErrorCategoryMappings).value_or("unknown");
}

}  // namespace sovereign::schema
