#pragma once
#include <sovereign/schema/primitives.hpp>
#include <sovereign/schema/ring.hpp>

#include <map>
#include <string>
#include <vector>

namespace sovereign::schema {

template <uint16_t Version>
struct evidence;

template <>
struct evidence<1> final {
  uint16_t version{1};
  ring_t ring{ring_t::host};
  session_id_t session_id;
  bytes_t quote;
  // blake3(scale(session_id, ring nonce, claims_digest)); the quote's
  // authenticated payload.
  hash32_t binding{};
  std::string signer_public_key_id;
  std::vector<bytes_t> platform_measurements;
  bytes_t event_log;
  hash32_t claims_digest{};
  std::map<std::string, std::string> extra_metadata;
};

using evidence_t = evidence<1>;

}  // namespace sovereign::schema
