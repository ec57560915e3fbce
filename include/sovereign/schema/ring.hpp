#pragma once

#include <sovereign/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sovereign::schema {

/// Nested trust boundary producing its own evidence.
enum class ring_t : uint8_t {
  host = 0,
  vm = 1,
  workload = 2,
};

inline constexpr auto kRingMappings = std::array{
    std::pair<std::string_view, ring_t>{"host", ring_t::host},
    std::pair<std::string_view, ring_t>{"vm", ring_t::vm},
    std::pair<std::string_view, ring_t>{"workload", ring_t::workload},
};

template <>
inline std::optional<ring_t> try_from_string<ring_t>(
    const std::string_view value) {
  return from_string(value, kRingMappings);
}

inline constexpr std::string_view to_string(const ring_t value) {
  return to_string(value, kRingMappings).value_or("unknown");
}

}  // namespace sovereign::schema
