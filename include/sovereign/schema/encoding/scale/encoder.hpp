#pragma once
#include <sovereign/common/critical.hpp>
#include <sovereign/schema/encoding/encoder.hpp>
#include <sovereign/schema/encoding/scale/evidence.hpp>
#include <sovereign/schema/encoding/scale/evidence_bundle.hpp>
#include <sovereign/schema/encoding/scale/hash_algorithm.hpp>
#include <sovereign/schema/encoding/scale/ring.hpp>
#include <sovereign/schema/encoding/scale/session.hpp>
#include <sovereign/schema/encoding/scale/signature_scheme.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace sovereign::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  sovereign::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, sovereign::schema::bytes_t& out);

  template <typename T>
  T decode(const sovereign::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const sovereign::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
sovereign::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    sovereign::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        sovereign::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const sovereign::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    sovereign::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const sovereign::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace sovereign::schema::encoding
