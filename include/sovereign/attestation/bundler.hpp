#pragma once

#include <sovereign/attestation/collector.hpp>
#include <sovereign/schema/evidence_bundle.hpp>
#include <sovereign/signing/delegated_signer.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sovereign::attestation {

/// Aggregator identity and signing parameters attached to every bundle.
/// The app key itself comes from the bundler's signer.
struct bundle_identity final {
  std::optional<sovereign::schema::bytes_t> app_key_certificate;
  std::optional<std::string> agent_uuid;
  std::optional<sovereign::schema::hash32_t> workload_code_hash;
  sovereign::signing::signer_options signing;
};

/// Merges per-ring evidence into a bundle signed by the app key.
class bundler final {
 public:
  explicit bundler(const sovereign::signing::delegated_signer& signer,
                   std::set<sovereign::schema::ring_t> required_rings = {
                       sovereign::schema::ring_t::host});

  /// Fails with `incomplete_bundle` when a required ring is missing or
  /// duplicated, and with `session_mismatch` when an entry was collected
  /// for a different session. Identity fields are checked as by
  /// `check_identity`. Entries are ordered by ring.
  sovereign::schema::result<sovereign::schema::evidence_bundle_t> bundle(
      const sovereign::common::call_context& context,
      const sovereign::schema::session_t& session,
      std::vector<sovereign::schema::evidence_t> entries,
      const bundle_identity& identity) const;

  const std::set<sovereign::schema::ring_t>& required_rings() const {
    return required_rings_;
  }

 private:
  const sovereign::signing::delegated_signer& signer_;
  std::set<sovereign::schema::ring_t> required_rings_;
};

/// Bytes covered by the bundle signature: the SCALE encoding of the whole
/// bundle with an empty `signature`.
sovereign::schema::bytes_t signing_payload(
    const sovereign::schema::evidence_bundle_t& bundle);

/// Required rings present exactly once and every entry on `session_id`.
sovereign::schema::status check_completeness(
    const sovereign::schema::evidence_bundle_t& bundle,
    const std::set<sovereign::schema::ring_t>& required_rings);

/// `agent_uuid`, when present, must be a canonical 8-4-4-4-12 hex UUID
/// (`invalid_request`). `app_key_certificate`, when present, must parse and
/// certify `app_key_public` (`invalid_key_material`).
sovereign::schema::status check_identity(
    const sovereign::schema::evidence_bundle_t& bundle);

/// Check the challenge nonce and recompute each entry's binding from the
/// session's nonces.
sovereign::schema::status check_bindings(
    const sovereign::schema::evidence_bundle_t& bundle,
    const sovereign::schema::session_t& session);

/// Verify the aggregator signature against `bundle.app_key_public` with the
/// hash, scheme and salt length the bundle carries.
sovereign::schema::status check_signature(
    const sovereign::schema::evidence_bundle_t& bundle);

}  // namespace sovereign::attestation
