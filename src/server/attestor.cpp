#include <sovereign/attestation/bundler.hpp>
#include <sovereign/server/attestor.hpp>

#include <spdlog/spdlog.h>

namespace sovereign::server {

namespace {

using sovereign::schema::credential_t;
using sovereign::schema::error_code;

sovereign::schema::result<credential_t> reject(
    const sovereign::schema::status& failed,
    const sovereign::schema::evidence_bundle_t& bundle) {
  spdlog::warn("Rejected bundle for session {}: {} ({})", bundle.session_id,
               failed.log, failed.codespace);
  return sovereign::schema::make_error<credential_t>(failed);
}

}  // namespace

attestor::attestor(const sovereign::config::feature_flags& flags,
                   sovereign::session::manager& sessions,
                   const sovereign::verifier::client& verifier,
                   const sovereign::identity::issuer& issuer,
                   attestor_options options)
    : flags_{flags},
      sessions_{sessions},
      verifier_{verifier},
      issuer_{issuer},
      options_{std::move(options)} {}

sovereign::schema::status attestor::check_enabled() const {
  if (!flags_.is_set(sovereign::config::kFlagUnifiedIdentity)) {
    return sovereign::schema::make_status(error_code::feature_disabled,
                                          "unified identity is disabled",
                                          std::string{kCodespace});
  }
  return {};
}

sovereign::schema::result<sovereign::schema::session_t>
attestor::issue_challenge() {
  if (auto enabled = check_enabled(); !enabled.ok()) {
    return sovereign::schema::make_error<sovereign::schema::session_t>(enabled);
  }
  return sovereign::schema::make_result(sessions_.issue_challenge());
}

sovereign::schema::result<credential_t> attestor::attest(
    const sovereign::common::call_context& context,
    const sovereign::schema::evidence_bundle_t& bundle) {
  if (auto enabled = check_enabled(); !enabled.ok()) {
    return sovereign::schema::make_error<credential_t>(enabled);
  }

  auto session = sessions_.validate(bundle.session_id);
  if (!session.ok()) {
    return reject(session.to_status(), bundle);
  }

  if (auto status = sovereign::attestation::check_completeness(
          bundle, options_.required_rings);
      !status.ok()) {
    return reject(status, bundle);
  }
  if (auto status = sovereign::attestation::check_identity(bundle);
      !status.ok()) {
    return reject(status, bundle);
  }
  if (auto status = sovereign::attestation::check_bindings(bundle, *session.value);
      !status.ok()) {
    return reject(status, bundle);
  }
  if (auto status = sovereign::attestation::check_signature(bundle);
      !status.ok()) {
    return reject(status, bundle);
  }

  if (auto status = sessions_.consume(bundle.session_id); !status.ok()) {
    return reject(status, bundle);
  }
  auto consumed = *session.value;
  consumed.consumed = true;

  auto claims = verifier_.verify_evidence(context, bundle);
  if (!claims.ok()) {
    return reject(claims.to_status(), bundle);
  }

  auto verdict = sovereign::policy::evaluate(*claims.value, options_.policy,
                                             options_.extra_rules);
  if (!verdict.allowed) {
    spdlog::info("Policy denied session {}: {}", bundle.session_id,
                 verdict.reason);
    return sovereign::schema::make_error<credential_t>(
        error_code::policy_denied, verdict.reason,
        std::string{sovereign::policy::kCodespace});
  }
  spdlog::info("Policy allowed session {} (audit_id: {})", bundle.session_id,
               claims.value->audit_id);

  return issuer_.issue(verdict, consumed, *claims.value, bundle);
}

}  // namespace sovereign::server
