#include <sovereign/attestation/bundler.hpp>
#include <sovereign/crypto/digest.hpp>
#include <sovereign/crypto/key.hpp>
#include <sovereign/crypto/verify.hpp>
#include <sovereign/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <string_view>

namespace sovereign::attestation {

namespace {

using sovereign::schema::error_code;
using sovereign::schema::evidence_bundle_t;

sovereign::schema::status bundle_error(const error_code code, std::string log) {
  return sovereign::schema::make_status(code, std::move(log),
                                        std::string{kCodespace});
}

bool is_canonical_uuid(const std::string_view value) {
  if (value.size() != 36) {
    return false;
  }
  for (size_t i = 0; i < value.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (value[i] != '-') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

bundler::bundler(const sovereign::signing::delegated_signer& signer,
                 std::set<sovereign::schema::ring_t> required_rings)
    : signer_{signer}, required_rings_{std::move(required_rings)} {}

sovereign::schema::bytes_t signing_payload(const evidence_bundle_t& bundle) {
  auto unsigned_bundle = bundle;
  unsigned_bundle.signature.clear();
  auto encoder = sovereign::schema::encoding::scale_encoder_t{};
  return encoder.encode(unsigned_bundle);
}

sovereign::schema::status check_identity(const evidence_bundle_t& bundle) {
  if (bundle.agent_uuid && !is_canonical_uuid(*bundle.agent_uuid)) {
    return bundle_error(error_code::invalid_request,
                        "agent_uuid '" + *bundle.agent_uuid +
                            "' is not a canonical UUID");
  }
  if (!bundle.app_key_certificate) {
    return {};
  }

  auto error = std::string{};
  auto certified = sovereign::crypto::parse_certificate_der(
      sovereign::schema::bytes_view_t{bundle.app_key_certificate->data(),
                                      bundle.app_key_certificate->size()},
      error);
  if (!certified) {
    return bundle_error(error_code::invalid_key_material, error);
  }
  auto key = sovereign::crypto::parse_public_key(bundle.app_key_public, error);
  if (!key) {
    return bundle_error(error_code::invalid_key_material, error);
  }
  if (sovereign::crypto::public_key_id(**certified) !=
      sovereign::crypto::public_key_id(**key)) {
    return bundle_error(error_code::invalid_key_material,
                        "app_key_certificate does not certify app_key_public");
  }
  return {};
}

sovereign::schema::status check_completeness(
    const evidence_bundle_t& bundle,
    const std::set<sovereign::schema::ring_t>& required_rings) {
  if (bundle.entries.empty()) {
    return bundle_error(error_code::incomplete_bundle, "bundle has no evidence");
  }

  auto seen = std::map<sovereign::schema::ring_t, size_t>{};
  for (const auto& entry : bundle.entries) {
    if (entry.session_id != bundle.session_id) {
      return bundle_error(error_code::session_mismatch,
                          "ring " +
                              std::string{sovereign::schema::to_string(entry.ring)} +
                              " references session " + entry.session_id +
                              ", bundle references " + bundle.session_id);
    }
    ++seen[entry.ring];
  }

  for (const auto& [ring, count] : seen) {
    if (count > 1) {
      return bundle_error(error_code::incomplete_bundle,
                          "duplicate evidence for ring " +
                              std::string{sovereign::schema::to_string(ring)});
    }
  }
  for (const auto ring : required_rings) {
    if (!seen.contains(ring)) {
      return bundle_error(error_code::incomplete_bundle,
                          "missing evidence for required ring " +
                              std::string{sovereign::schema::to_string(ring)});
    }
  }
  return {};
}

sovereign::schema::status check_bindings(
    const evidence_bundle_t& bundle,
    const sovereign::schema::session_t& session) {
  if (bundle.session_id != session.session_id) {
    return bundle_error(error_code::session_mismatch,
                        "bundle session " + bundle.session_id +
                            " does not match challenge " + session.session_id);
  }
  if (bundle.challenge_nonce != session.nonce_host) {
    return bundle_error(error_code::binding_mismatch,
                        "challenge nonce does not match session " +
                            session.session_id);
  }
  for (const auto& entry : bundle.entries) {
    auto expected = compute_binding(session.session_id,
                                    session.nonce_for(entry.ring),
                                    entry.claims_digest);
    if (expected != entry.binding) {
      return bundle_error(error_code::binding_mismatch,
                          "binding for ring " +
                              std::string{sovereign::schema::to_string(entry.ring)} +
                              " does not match the session nonce");
    }
  }
  return {};
}

sovereign::schema::status check_signature(const evidence_bundle_t& bundle) {
  auto error = std::string{};
  auto key = sovereign::crypto::parse_public_key(bundle.app_key_public, error);
  if (!key) {
    return bundle_error(error_code::invalid_key_material, error);
  }
  auto payload = signing_payload(bundle);
  auto digest = sovereign::crypto::digest(
      bundle.signature_hash,
      sovereign::schema::bytes_view_t{payload.data(), payload.size()});
  auto verified = sovereign::crypto::verify_digest(
      **key, sovereign::schema::bytes_view_t{digest.data(), digest.size()},
      sovereign::schema::bytes_view_t{bundle.signature.data(),
                                      bundle.signature.size()},
      bundle.signature_hash, bundle.signature_scheme,
      bundle.signature_salt_length);
  if (!verified) {
    return bundle_error(error_code::bundle_signature_invalid,
                        "bundle signature does not verify against app key");
  }
  return {};
}

sovereign::schema::result<evidence_bundle_t> bundler::bundle(
    const sovereign::common::call_context& context,
    const sovereign::schema::session_t& session,
    std::vector<sovereign::schema::evidence_t> entries,
    const bundle_identity& identity) const {
  auto out = evidence_bundle_t{};
  out.session_id = session.session_id;
  out.challenge_nonce = session.nonce_host;
  out.entries = std::move(entries);
  std::ranges::stable_sort(out.entries, {}, &sovereign::schema::evidence_t::ring);

  auto complete = check_completeness(out, required_rings_);
  if (!complete.ok()) {
    spdlog::warn("Refusing to bundle evidence: {}", complete.log);
    return sovereign::schema::make_error<evidence_bundle_t>(complete);
  }

  out.app_key_public = signer_.public_key_pem();
  out.app_key_certificate = identity.app_key_certificate;
  out.agent_uuid = identity.agent_uuid;
  out.workload_code_hash = identity.workload_code_hash;

  auto valid = check_identity(out);
  if (!valid.ok()) {
    spdlog::warn("Refusing to bundle evidence: {}", valid.log);
    return sovereign::schema::make_error<evidence_bundle_t>(valid);
  }

  auto parameters =
      sovereign::signing::delegated_signer::make_request({}, identity.signing);
  out.signature_hash = parameters.hash_algorithm;
  out.signature_scheme = parameters.scheme;
  out.signature_salt_length = parameters.salt_length;

  auto options = identity.signing;
  options.hash = std::string{sovereign::schema::to_string(out.signature_hash)};
  auto payload = signing_payload(out);
  auto digest = sovereign::crypto::digest(
      out.signature_hash,
      sovereign::schema::bytes_view_t{payload.data(), payload.size()});
  auto signature = signer_.sign(
      context, sovereign::schema::bytes_view_t{digest.data(), digest.size()},
      options);
  if (!signature.ok()) {
    return sovereign::schema::make_error<evidence_bundle_t>(
        signature.to_status());
  }
  out.signature = std::move(*signature.value);
  spdlog::info("Bundled {} evidence entries for session {}", out.entries.size(),
               out.session_id);
  return sovereign::schema::make_result(std::move(out));
}

}  // namespace sovereign::attestation
