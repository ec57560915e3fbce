#pragma once

#include <sovereign/v1/attestation.pb.h>

#include <sovereign/schema/credential.hpp>
#include <sovereign/schema/evidence_bundle.hpp>
#include <sovereign/schema/result.hpp>
#include <sovereign/schema/session.hpp>

#include <string_view>

namespace sovereign::rpc {

inline constexpr auto kCodespace = std::string_view{"sovereign.rpc"};

void to_proto(const sovereign::schema::session_t& session,
              sovereign::v1::Challenge* destination);
void to_proto(const sovereign::schema::evidence_bundle_t& bundle,
              sovereign::v1::EvidenceBundle* destination);
void to_proto(const sovereign::schema::credential_t& credential,
              sovereign::v1::Credential* destination);
void to_proto(const sovereign::schema::status& failed,
              sovereign::v1::Denial* destination);

/// Fails with `incomplete_bundle` when a fixed-size field has the wrong
/// length.
sovereign::schema::result<sovereign::schema::evidence_bundle_t> from_proto(
    const sovereign::v1::EvidenceBundle& source);
sovereign::schema::result<sovereign::schema::session_t> from_proto(
    const sovereign::v1::Challenge& source);
sovereign::schema::credential_t from_proto(
    const sovereign::v1::Credential& source);

}  // namespace sovereign::rpc
