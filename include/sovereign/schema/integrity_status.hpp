#pragma once

#include <sovereign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sovereign::schema {

enum class integrity_status_t : uint8_t {
  unknown = 0,
  passed_all_checks = 1,
  failed = 2,
};

inline constexpr auto kIntegrityStatusMappings = std::array{
    std::pair<std::string_view, integrity_status_t>{
        "UNKNOWN", integrity_status_t::unknown},
    std::pair<std::string_view, integrity_status_t>{
        "PASSED_ALL_CHECKS", integrity_status_t::passed_all_checks},
    std::pair<std::string_view, integrity_status_t>{
        "FAILED", integrity_status_t::failed},
};

template <>
inline std::optional<integrity_status_t> try_from_string<integrity_status_t>(
    const std::string_view value) {
  return from_string_ignore_case(value, kIntegrityStatusMappings);
}

/// Verifier-reported strings; anything unrecognized is `unknown`.
inline integrity_status_t parse_integrity_status(const std::string_view value) {
  return try_from_string<integrity_status_t>(value).value_or(
      integrity_status_t::unknown);
}

inline constexpr std::string_view to_string(const integrity_status_t value) {
  return to_string(value, kIntegrityStatusMappings).value_or("UNKNOWN");
}

}  // namespace sovereign::schema
