#pragma once
#include <sovereign/schema/gpu_metrics.hpp>
#include <sovereign/schema/integrity_status.hpp>

#include <optional>
#include <string>

namespace sovereign::schema {

template <uint16_t Version>
struct verification_details;

template <>
struct verification_details<1> final {
  uint16_t version{1};
  bool app_key_certificate_valid{};
  bool app_key_public_matches_cert{};
  bool quote_signature_valid{};
  bool nonce_valid{};
  int64_t timestamp{};
};

using verification_details_t = verification_details<1>;

template <uint16_t Version>
struct attested_claims;

/// Claims vouched for by the remote verifier. Input of the policy engine.
template <>
struct attested_claims<1> final {
  uint16_t version{1};
  std::string geolocation;
  integrity_status_t host_integrity_status{integrity_status_t::unknown};
  std::optional<gpu_metrics_t> gpu_metrics_health;
  std::string audit_id;
  std::optional<verification_details_t> details;
};

using attested_claims_t = attested_claims<1>;

}  // namespace sovereign::schema
