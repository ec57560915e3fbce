#include <sovereign/blake3/hash.hpp>

#include <tuple>

namespace sovereign::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const sovereign::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

sovereign::schema::hash32_t hasher::finalize() const {
  auto output = sovereign::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<decltype(output)>);
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

sovereign::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

sovereign::schema::hash32_t hash(const sovereign::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace sovereign::blake3
