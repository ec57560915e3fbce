#pragma once

#include <sovereign/common/context.hpp>
#include <sovereign/schema/evidence.hpp>
#include <sovereign/schema/result.hpp>
#include <sovereign/schema/session.hpp>
#include <sovereign/signing/gateway.hpp>

#include <map>
#include <string>
#include <vector>

namespace sovereign::attestation {

inline constexpr auto kCodespace = std::string_view{"sovereign.bundle"};

/// What a ring reports about itself before quoting.
struct measured_state final {
  std::string image_id;
  std::string integrity_log_summary;
  std::map<std::string, std::string> metadata;
  std::vector<sovereign::schema::bytes_t> platform_measurements;
  sovereign::schema::bytes_t event_log;
};

struct quote final {
  sovereign::schema::bytes_t bytes;
  std::string signer_public_key_id;
};

/// Per-ring evidence producer (TPM, vTPM, workload sandbox).
class evidence_source {
 public:
  virtual ~evidence_source() = default;

  virtual sovereign::schema::ring_t ring() const = 0;

  virtual sovereign::schema::result<measured_state> measure(
      const sovereign::common::call_context& context) = 0;

  /// Produce a quote whose authenticated payload is `binding`.
  virtual sovereign::schema::result<quote> produce_quote(
      const sovereign::common::call_context& context,
      const sovereign::schema::hash32_t& binding) = 0;
};

/// Evidence source that quotes by asking a signing gateway to sign the
/// binding. Measured state is fixed at construction.
class gateway_evidence_source final : public evidence_source {
 public:
  gateway_evidence_source(sovereign::schema::ring_t ring,
                          measured_state state,
                          sovereign::signing::signing_gateway& gateway,
                          std::string signer_public_key_id);

  sovereign::schema::ring_t ring() const override { return ring_; }

  sovereign::schema::result<measured_state> measure(
      const sovereign::common::call_context& context) override;

  sovereign::schema::result<quote> produce_quote(
      const sovereign::common::call_context& context,
      const sovereign::schema::hash32_t& binding) override;

 private:
  sovereign::schema::ring_t ring_;
  measured_state state_;
  sovereign::signing::signing_gateway& gateway_;
  std::string signer_public_key_id_;
};

/// blake3(scale(ring, image_id, integrity_log_summary, metadata)).
sovereign::schema::hash32_t compute_claims_digest(
    sovereign::schema::ring_t ring,
    const measured_state& state);

/// blake3(scale(session_id, ring_nonce, claims_digest)).
sovereign::schema::hash32_t compute_binding(
    const sovereign::schema::session_id_t& session_id,
    const sovereign::schema::nonce_t& ring_nonce,
    const sovereign::schema::hash32_t& claims_digest);

/// Builds per-ring evidence bound to a session.
class collector final {
 public:
  void add_source(evidence_source& source);

  sovereign::schema::result<sovereign::schema::evidence_t> collect(
      const sovereign::common::call_context& context,
      const sovereign::schema::session_t& session,
      sovereign::schema::ring_t ring) const;

  /// Evidence from every registered source, in ring order. Fails on the
  /// first source that fails.
  sovereign::schema::result<std::vector<sovereign::schema::evidence_t>>
  collect_all(const sovereign::common::call_context& context,
              const sovereign::schema::session_t& session) const;

 private:
  std::map<sovereign::schema::ring_t, evidence_source*> sources_;
};

}  // namespace sovereign::attestation
