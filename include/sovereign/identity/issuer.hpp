#pragma once

#include <sovereign/schema/attested_claims.hpp>
#include <sovereign/schema/credential.hpp>
#include <sovereign/schema/evidence_bundle.hpp>
#include <sovereign/schema/policy_result.hpp>
#include <sovereign/schema/result.hpp>
#include <sovereign/schema/session.hpp>

#include <chrono>
#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace sovereign::identity {

inline constexpr auto kCodespace = std::string_view{"sovereign.identity"};

struct issuer_options final {
  std::string trust_domain{"example.org"};
  std::chrono::milliseconds ttl{std::chrono::hours{1}};
};

/// `agent_uuid` when supplied, else `appkey-` + first 16 hex characters of
/// sha256(app_key_public).
std::string derive_agent_id(const sovereign::schema::evidence_bundle_t& bundle);

/// Selectors fused from verified claims and the rings that attested.
std::set<std::string> fuse_selectors(
    const sovereign::schema::attested_claims_t& claims,
    const sovereign::schema::evidence_bundle_t& bundle);

/// JSON document of grc.* claims embedded in issued credentials.
std::string make_claims_json(const sovereign::schema::attested_claims_t& claims,
                             const sovereign::schema::evidence_bundle_t& bundle);

/// Mints short-lived credentials. Refuses unless the policy allowed and the
/// originating session has been consumed.
class issuer final {
 public:
  using clock_fn_t = std::function<sovereign::schema::timestamp_milliseconds_t()>;

  explicit issuer(issuer_options options, clock_fn_t clock);

  sovereign::schema::result<sovereign::schema::credential_t> issue(
      const sovereign::schema::policy_result_t& verdict,
      const sovereign::schema::session_t& consumed_session,
      const sovereign::schema::attested_claims_t& claims,
      const sovereign::schema::evidence_bundle_t& bundle) const;

  std::string parent_id() const;

 private:
  issuer_options options_;
  clock_fn_t clock_;
};

}  // namespace sovereign::identity
