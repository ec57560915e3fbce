#pragma once

#include <sovereign/common/context.hpp>
#include <sovereign/config/feature_flags.hpp>
#include <sovereign/identity/issuer.hpp>
#include <sovereign/policy/engine.hpp>
#include <sovereign/schema/credential.hpp>
#include <sovereign/schema/evidence_bundle.hpp>
#include <sovereign/schema/result.hpp>
#include <sovereign/session/manager.hpp>
#include <sovereign/verifier/client.hpp>

#include <set>
#include <string_view>
#include <vector>

namespace sovereign::server {

inline constexpr auto kCodespace = std::string_view{"sovereign.attestor"};

struct attestor_options final {
  sovereign::schema::policy_config_t policy;
  std::set<sovereign::schema::ring_t> required_rings{
      sovereign::schema::ring_t::host};
  std::vector<sovereign::policy::rule_t> extra_rules;
};

/// Server side of the evidence pipeline. Every failure is fail-closed: no
/// credential is produced unless every stage passed.
class attestor final {
 public:
  attestor(const sovereign::config::feature_flags& flags,
           sovereign::session::manager& sessions,
           const sovereign::verifier::client& verifier,
           const sovereign::identity::issuer& issuer,
           attestor_options options);

  sovereign::schema::result<sovereign::schema::session_t> issue_challenge();

  /// Gate, session lookup, completeness, bindings, bundle signature,
  /// consumption, remote verification, policy, issuance. The session is
  /// consumed before the verifier is contacted, so a bundle gets exactly one
  /// remote attempt.
  sovereign::schema::result<sovereign::schema::credential_t> attest(
      const sovereign::common::call_context& context,
      const sovereign::schema::evidence_bundle_t& bundle);

  const attestor_options& options() const { return options_; }

 private:
  sovereign::schema::status check_enabled() const;

  const sovereign::config::feature_flags& flags_;
  sovereign::session::manager& sessions_;
  const sovereign::verifier::client& verifier_;
  const sovereign::identity::issuer& issuer_;
  attestor_options options_;
};

}  // namespace sovereign::server
