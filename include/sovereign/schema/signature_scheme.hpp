#pragma once

#include <sovereign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sovereign::schema {

/// RSA padding requested from a signing gateway. `rsassa` is PKCS#1 v1.5.
enum class signature_scheme_t : uint8_t {
  rsassa = 0,
  rsapss = 1,
};

/// Salt length sentinel meaning "salt as long as the digest".
inline constexpr int32_t kPssSaltLengthEqualsHash = -1;

inline constexpr auto kSignatureSchemeMappings = std::array{
    std::pair<std::string_view, signature_scheme_t>{"rsassa",
                                                    signature_scheme_t::rsassa},
    std::pair<std::string_view, signature_scheme_t>{"rsapss",
                                                    signature_scheme_t::rsapss},
};

template <>
inline std::optional<signature_scheme_t> try_from_string<signature_scheme_t>(
    const std::string_view value) {
  return from_string(value, kSignatureSchemeMappings);
}

inline constexpr std::string_view to_string(const signature_scheme_t value) {
  return to_string(value, kSignatureSchemeMappings).value_or("unknown");
}

}  // namespace sovereign::schema
