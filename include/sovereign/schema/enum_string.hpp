#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string_view>
#include <utility>

namespace sovereign::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

/// ASCII case-insensitive lookup for values arriving from remote peers.
template <typename Enum, std::size_t N>
std::optional<Enum> from_string_ignore_case(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto equal = [](const char lhs, const char rhs) {
    return std::toupper(static_cast<unsigned char>(lhs)) ==
           std::toupper(static_cast<unsigned char>(rhs));
  };
  for (const auto& [name, enum_value] : mappings) {
    if (std::ranges::equal(name, value, equal)) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace sovereign::schema
