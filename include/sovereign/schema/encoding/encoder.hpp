#pragma once
#include <sovereign/schema/primitives.hpp>
#include <optional>
#include <span>

namespace sovereign::schema::encoding {

/// Canonical binary encoder selected at build time by `Library` tag.
/// Everything that is hashed or signed goes through one of these so both
/// sides of the wire agree on the bytes.
template <typename Library>
struct encoder {
  template <typename T>
  sovereign::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, sovereign::schema::bytes_t& out);

  template <typename T>
  T decode(const sovereign::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const sovereign::schema::bytes_view_t& bytes);
};

}  // namespace sovereign::schema::encoding
