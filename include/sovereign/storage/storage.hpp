#pragma once
#include <sovereign/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace sovereign::storage {

using key_value_entry_t =
    std::pair<sovereign::schema::bytes_t, sovereign::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const sovereign::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const sovereign::schema::bytes_view_t& key,
           const T& value) const;

  /// Remove key; missing keys are not an error.
  void erase(const sovereign::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const sovereign::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace sovereign::storage
