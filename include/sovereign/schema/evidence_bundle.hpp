#pragma once
#include <sovereign/schema/evidence.hpp>
#include <sovereign/schema/hash_algorithm.hpp>
#include <sovereign/schema/signature_scheme.hpp>

#include <optional>
#include <string>
#include <vector>

namespace sovereign::schema {

template <uint16_t Version>
struct evidence_bundle;

template <>
struct evidence_bundle<1> final {
  uint16_t version{1};
  session_id_t session_id;
  // Host ring nonce, forwarded to the remote verifier.
  nonce_t challenge_nonce{};
  std::vector<evidence_t> entries;
  // Aggregator key that produced `signature`, PEM encoded.
  std::string app_key_public;
  std::optional<bytes_t> app_key_certificate;
  std::optional<std::string> agent_uuid;
  std::optional<hash32_t> workload_code_hash;
  hash_algorithm_t signature_hash{hash_algorithm_t::sha256};
  signature_scheme_t signature_scheme{signature_scheme_t::rsassa};
  // PSS salt length the signature was produced with.
  int32_t signature_salt_length{kPssSaltLengthEqualsHash};
  bytes_t signature;

  const evidence_t* find(const ring_t ring) const {
    for (const auto& entry : entries) {
      if (entry.ring == ring) {
        return &entry;
      }
    }
    return nullptr;
  }
};

using evidence_bundle_t = evidence_bundle<1>;

}  // namespace sovereign::schema
