#pragma once

#include <sovereign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sovereign::schema {

enum class hash_algorithm_t : uint8_t {
  sha256 = 0,
  sha384 = 1,
  sha512 = 2,
};

inline constexpr auto kHashAlgorithmMappings = std::array{
    std::pair<std::string_view, hash_algorithm_t>{"sha256",
                                                  hash_algorithm_t::sha256},
    std::pair<std::string_view, hash_algorithm_t>{"sha384",
                                                  hash_algorithm_t::sha384},
    std::pair<std::string_view, hash_algorithm_t>{"sha512",
                                                  hash_algorithm_t::sha512},
};

template <>
inline std::optional<hash_algorithm_t> try_from_string<hash_algorithm_t>(
    const std::string_view value) {
  return from_string_ignore_case(value, kHashAlgorithmMappings);
}

inline constexpr std::string_view to_string(const hash_algorithm_t value) {
  return to_string(value, kHashAlgorithmMappings).value_or("unknown");
}

inline constexpr size_t digest_size(const hash_algorithm_t value) {
  switch (value) {
    case hash_algorithm_t::sha384:
      return 48;
    case hash_algorithm_t::sha512:
      return 64;
    case hash_algorithm_t::sha256:
    default:
      return 32;
  }
}

}  // namespace sovereign::schema
