#include <sovereign/crypto/digest.hpp>
#include <sovereign/identity/issuer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sovereign::identity {

namespace {

using sovereign::schema::credential_t;
using sovereign::schema::error_code;

inline constexpr auto kAgentIdHexChars = size_t{16};

}  // namespace

std::string derive_agent_id(const sovereign::schema::evidence_bundle_t& bundle) {
  if (bundle.agent_uuid && !bundle.agent_uuid->empty()) {
    return *bundle.agent_uuid;
  }
  auto digest = sovereign::crypto::sha256(std::string_view{bundle.app_key_public});
  auto hex = sovereign::schema::to_hex(
      sovereign::schema::bytes_view_t{digest.data(), digest.size()});
  return "appkey-" + hex.substr(0, kAgentIdHexChars);
}

std::set<std::string> fuse_selectors(
    const sovereign::schema::attested_claims_t& claims,
    const sovereign::schema::evidence_bundle_t& bundle) {
  auto selectors = std::set<std::string>{};
  selectors.insert("sovereign:geolocation:" + claims.geolocation);
  selectors.insert(
      "sovereign:integrity:" +
      std::string{sovereign::schema::to_string(claims.host_integrity_status)});
  if (claims.gpu_metrics_health) {
    selectors.insert("sovereign:gpu-status:" +
                     claims.gpu_metrics_health->status);
  }
  for (const auto& entry : bundle.entries) {
    selectors.insert("sovereign:ring:" +
                     std::string{sovereign::schema::to_string(entry.ring)});
  }
  if (!claims.audit_id.empty()) {
    selectors.insert("sovereign:audit-id:" + claims.audit_id);
  }
  return selectors;
}

std::string make_claims_json(const sovereign::schema::attested_claims_t& claims,
                             const sovereign::schema::evidence_bundle_t& bundle) {
  auto tpm = nlohmann::json{
      {"app_key_id", derive_agent_id(bundle)},
      {"host_integrity_status",
       std::string{sovereign::schema::to_string(claims.host_integrity_status)}},
      {"audit_id", claims.audit_id},
  };
  if (claims.gpu_metrics_health) {
    tpm["gpu_metrics_health"] = {
        {"status", claims.gpu_metrics_health->status},
        {"utilization_pct", claims.gpu_metrics_health->utilization_pct},
        {"memory_mb", claims.gpu_metrics_health->memory_mb},
    };
  }

  auto workload = nlohmann::json::object();
  workload["session_id"] = bundle.session_id;
  if (bundle.workload_code_hash) {
    workload["code_hash"] = sovereign::schema::to_hex(*bundle.workload_code_hash);
  }

  auto document = nlohmann::json{
      {"grc.geolocation", claims.geolocation},
      {"grc.tpm-attestation", std::move(tpm)},
      {"grc.workload", std::move(workload)},
  };
  return document.dump();
}

issuer::issuer(issuer_options options, clock_fn_t clock)
    : options_{std::move(options)}, clock_{std::move(clock)} {}

std::string issuer::parent_id() const {
  return "spiffe://" + options_.trust_domain + "/spire/server";
}

sovereign::schema::result<credential_t> issuer::issue(
    const sovereign::schema::policy_result_t& verdict,
    const sovereign::schema::session_t& consumed_session,
    const sovereign::schema::attested_claims_t& claims,
    const sovereign::schema::evidence_bundle_t& bundle) const {
  if (!verdict.allowed) {
    return sovereign::schema::make_error<credential_t>(
        error_code::policy_denied, verdict.reason, std::string{kCodespace});
  }
  if (!consumed_session.consumed ||
      consumed_session.session_id != bundle.session_id) {
    return sovereign::schema::make_error<credential_t>(
        error_code::session_mismatch,
        "credential requires the consumed session of this bundle",
        std::string{kCodespace});
  }

  auto credential = credential_t{};
  credential.subject_id = "spiffe://" + options_.trust_domain +
                          "/agent/sovereign/" + derive_agent_id(bundle);
  credential.parent_id = parent_id();
  credential.ttl =
      static_cast<sovereign::schema::duration_milliseconds_t>(options_.ttl.count());
  credential.issued_at = clock_();
  credential.expires_at = credential.issued_at + credential.ttl;
  credential.selectors = fuse_selectors(claims, bundle);
  credential.claims_json = make_claims_json(claims, bundle);

  spdlog::info("Issued credential {} ({} selectors, ttl {}ms)",
               credential.subject_id, credential.selectors.size(),
               credential.ttl);
  return sovereign::schema::make_result(std::move(credential));
}

}  // namespace sovereign::identity
