#include <sovereign/rpc/convert.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <optional>

using namespace sovereign::schema;

namespace sovereign::rpc {

namespace {

template <size_t N>
std::optional<std::array<uint8_t, N>> to_array(const std::string& value) {
  if (value.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy_n(std::begin(value), N, std::begin(out));
  return out;
}

template <size_t N>
std::string to_string(const std::array<uint8_t, N>& value) {
  return std::string{reinterpret_cast<const char*>(value.data()), N};
}

template <typename T>
result<T> wrong_size(const std::string_view field) {
  return make_error<T>(error_code::incomplete_bundle,
                       fmt::format("{} must be 32 bytes", field),
                       std::string{kCodespace});
}

sovereign::v1::Ring to_proto(const ring_t ring) {
  switch (ring) {
    case ring_t::vm:
      return sovereign::v1::RING_VM;
    case ring_t::workload:
      return sovereign::v1::RING_WORKLOAD;
    case ring_t::host:
    default:
      return sovereign::v1::RING_HOST;
  }
}

std::optional<ring_t> from_proto(const sovereign::v1::Ring ring) {
  switch (ring) {
    case sovereign::v1::RING_HOST:
      return ring_t::host;
    case sovereign::v1::RING_VM:
      return ring_t::vm;
    case sovereign::v1::RING_WORKLOAD:
      return ring_t::workload;
    default:
      return std::nullopt;
  }
}

sovereign::v1::HashAlgorithm to_proto(const hash_algorithm_t algorithm) {
  switch (algorithm) {
    case hash_algorithm_t::sha384:
      return sovereign::v1::HASH_ALGORITHM_SHA384;
    case hash_algorithm_t::sha512:
      return sovereign::v1::HASH_ALGORITHM_SHA512;
    case hash_algorithm_t::sha256:
    default:
      return sovereign::v1::HASH_ALGORITHM_SHA256;
  }
}

std::optional<hash_algorithm_t> from_proto(
    const sovereign::v1::HashAlgorithm algorithm) {
  switch (algorithm) {
    case sovereign::v1::HASH_ALGORITHM_SHA256:
      return hash_algorithm_t::sha256;
    case sovereign::v1::HASH_ALGORITHM_SHA384:
      return hash_algorithm_t::sha384;
    case sovereign::v1::HASH_ALGORITHM_SHA512:
      return hash_algorithm_t::sha512;
    default:
      return std::nullopt;
  }
}

std::optional<signature_scheme_t> from_proto(
    const sovereign::v1::SignatureScheme scheme) {
  switch (scheme) {
    case sovereign::v1::SIGNATURE_SCHEME_RSASSA:
      return signature_scheme_t::rsassa;
    case sovereign::v1::SIGNATURE_SCHEME_RSAPSS:
      return signature_scheme_t::rsapss;
    default:
      return std::nullopt;
  }
}

template <typename T>
result<T> unknown_enum(const std::string_view field, const int value) {
  return make_error<T>(error_code::invalid_request,
                       fmt::format("unknown {} value {}", field, value),
                       std::string{kCodespace});
}

}  // namespace

void to_proto(const session_t& session, sovereign::v1::Challenge* destination) {
  destination->set_session_id(session.session_id);
  destination->set_nonce_host(to_string(session.nonce_host));
  destination->set_nonce_vm(to_string(session.nonce_vm));
  destination->set_nonce_workload(to_string(session.nonce_workload));
  destination->set_issued_at(session.issued_at);
  destination->set_expires_at(session.expires_at);
}

void to_proto(const evidence_bundle_t& bundle,
              sovereign::v1::EvidenceBundle* destination) {
  destination->set_session_id(bundle.session_id);
  destination->set_challenge_nonce(to_string(bundle.challenge_nonce));
  for (const auto& entry : bundle.entries) {
    auto* evidence = destination->add_entries();
    evidence->set_ring(to_proto(entry.ring));
    evidence->set_session_id(entry.session_id);
    evidence->set_quote(make_string(entry.quote));
    evidence->set_binding(to_string(entry.binding));
    evidence->set_signer_public_key_id(entry.signer_public_key_id);
    for (const auto& measurement : entry.platform_measurements) {
      evidence->add_platform_measurements(make_string(measurement));
    }
    evidence->set_event_log(make_string(entry.event_log));
    evidence->set_claims_digest(to_string(entry.claims_digest));
    for (const auto& [key, value] : entry.extra_metadata) {
      (*evidence->mutable_extra_metadata())[key] = value;
    }
  }
  destination->set_app_key_public(bundle.app_key_public);
  if (bundle.app_key_certificate) {
    destination->set_app_key_certificate(make_string(*bundle.app_key_certificate));
  }
  if (bundle.agent_uuid) {
    destination->set_agent_uuid(*bundle.agent_uuid);
  }
  if (bundle.workload_code_hash) {
    destination->set_workload_code_hash(to_string(*bundle.workload_code_hash));
  }
  destination->set_signature_hash(to_proto(bundle.signature_hash));
  destination->set_signature_scheme(
      bundle.signature_scheme == signature_scheme_t::rsapss
          ? sovereign::v1::SIGNATURE_SCHEME_RSAPSS
          : sovereign::v1::SIGNATURE_SCHEME_RSASSA);
  destination->set_signature(make_string(bundle.signature));
  destination->set_signature_salt_length(bundle.signature_salt_length);
}

void to_proto(const credential_t& credential,
              sovereign::v1::Credential* destination) {
  destination->set_subject_id(credential.subject_id);
  destination->set_parent_id(credential.parent_id);
  destination->set_ttl_ms(credential.ttl);
  destination->set_issued_at(credential.issued_at);
  destination->set_expires_at(credential.expires_at);
  for (const auto& selector : credential.selectors) {
    destination->add_selectors(selector);
  }
  destination->set_claims_json(credential.claims_json);
}

void to_proto(const status& failed, sovereign::v1::Denial* destination) {
  destination->set_code(static_cast<uint32_t>(failed.code));
  destination->set_log(failed.log);
  destination->set_codespace(failed.codespace);
}

result<evidence_bundle_t> from_proto(const sovereign::v1::EvidenceBundle& source) {
  auto bundle = evidence_bundle_t{};
  bundle.session_id = source.session_id();
  auto challenge = to_array<32>(source.challenge_nonce());
  if (!challenge) {
    return wrong_size<evidence_bundle_t>("challenge_nonce");
  }
  bundle.challenge_nonce = *challenge;

  for (const auto& entry : source.entries()) {
    auto evidence = evidence_t{};
    auto ring = from_proto(entry.ring());
    if (!ring) {
      return unknown_enum<evidence_bundle_t>("ring", entry.ring());
    }
    evidence.ring = *ring;
    evidence.session_id = entry.session_id();
    evidence.quote = make_bytes(entry.quote());
    auto binding = to_array<32>(entry.binding());
    auto digest = to_array<32>(entry.claims_digest());
    if (!binding) {
      return wrong_size<evidence_bundle_t>("binding");
    }
    if (!digest) {
      return wrong_size<evidence_bundle_t>("claims_digest");
    }
    evidence.binding = *binding;
    evidence.claims_digest = *digest;
    evidence.signer_public_key_id = entry.signer_public_key_id();
    for (const auto& measurement : entry.platform_measurements()) {
      evidence.platform_measurements.push_back(make_bytes(measurement));
    }
    evidence.event_log = make_bytes(entry.event_log());
    for (const auto& [key, value] : entry.extra_metadata()) {
      evidence.extra_metadata.emplace(key, value);
    }
    bundle.entries.push_back(std::move(evidence));
  }

  bundle.app_key_public = source.app_key_public();
  if (source.has_app_key_certificate()) {
    bundle.app_key_certificate = make_bytes(source.app_key_certificate());
  }
  if (source.has_agent_uuid()) {
    bundle.agent_uuid = source.agent_uuid();
  }
  if (source.has_workload_code_hash()) {
    auto code_hash = to_array<32>(source.workload_code_hash());
    if (!code_hash) {
      return wrong_size<evidence_bundle_t>("workload_code_hash");
    }
    bundle.workload_code_hash = *code_hash;
  }
  auto hash = from_proto(source.signature_hash());
  if (!hash) {
    return unknown_enum<evidence_bundle_t>("signature_hash",
                                           source.signature_hash());
  }
  auto scheme = from_proto(source.signature_scheme());
  if (!scheme) {
    return unknown_enum<evidence_bundle_t>("signature_scheme",
                                           source.signature_scheme());
  }
  bundle.signature_hash = *hash;
  bundle.signature_scheme = *scheme;
  bundle.signature = make_bytes(source.signature());
  bundle.signature_salt_length = source.signature_salt_length();
  return make_result(std::move(bundle));
}

result<session_t> from_proto(const sovereign::v1::Challenge& source) {
  auto session = session_t{};
  session.session_id = source.session_id();
  auto host = to_array<32>(source.nonce_host());
  auto vm = to_array<32>(source.nonce_vm());
  auto workload = to_array<32>(source.nonce_workload());
  if (!host || !vm || !workload) {
    return wrong_size<session_t>("challenge nonce");
  }
  session.nonce_host = *host;
  session.nonce_vm = *vm;
  session.nonce_workload = *workload;
  session.issued_at = source.issued_at();
  session.expires_at = source.expires_at();
  return make_result(std::move(session));
}

credential_t from_proto(const sovereign::v1::Credential& source) {
  auto credential = credential_t{};
  credential.subject_id = source.subject_id();
  credential.parent_id = source.parent_id();
  credential.ttl = source.ttl_ms();
  credential.issued_at = source.issued_at();
  credential.expires_at = source.expires_at();
  credential.selectors.insert(std::begin(source.selectors()),
                              std::end(source.selectors()));
  credential.claims_json = source.claims_json();
  return credential;
}

}  // namespace sovereign::rpc
