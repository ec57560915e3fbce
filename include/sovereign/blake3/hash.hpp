#pragma once
#include <blake3.h>
#include <sovereign/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace sovereign::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const sovereign::schema::bytes_view_t& bytes);
  sovereign::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

sovereign::schema::hash32_t hash(const std::string_view& str);
sovereign::schema::hash32_t hash(const sovereign::schema::bytes_view_t& bytes);

}  // namespace sovereign::blake3
