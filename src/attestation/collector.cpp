#include <sovereign/attestation/collector.hpp>
#include <sovereign/blake3/hash.hpp>
#include <sovereign/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <tuple>

namespace sovereign::attestation {

namespace {

using sovereign::schema::error_code;
using sovereign::schema::evidence_t;

}  // namespace

gateway_evidence_source::gateway_evidence_source(
    const sovereign::schema::ring_t ring,
    measured_state state,
    sovereign::signing::signing_gateway& gateway,
    std::string signer_public_key_id)
    : ring_{ring},
      state_{std::move(state)},
      gateway_{gateway},
      signer_public_key_id_{std::move(signer_public_key_id)} {}

sovereign::schema::result<measured_state> gateway_evidence_source::measure(
    const sovereign::common::call_context& context) {
  auto status = sovereign::common::check_context(context, kCodespace);
  if (!status.ok()) {
    return sovereign::schema::make_error<measured_state>(status);
  }
  return sovereign::schema::make_result(state_);
}

sovereign::schema::result<quote> gateway_evidence_source::produce_quote(
    const sovereign::common::call_context& context,
    const sovereign::schema::hash32_t& binding) {
  auto request = sovereign::signing::sign_request{};
  request.digest = sovereign::schema::make_bytes(
      sovereign::schema::bytes_view_t{binding.data(), binding.size()});
  auto signature = gateway_.sign(context, request);
  if (!signature.ok()) {
    return sovereign::schema::make_error<quote>(signature.to_status());
  }
  return sovereign::schema::make_result(
      quote{.bytes = std::move(*signature.value),
            .signer_public_key_id = signer_public_key_id_});
}

sovereign::schema::hash32_t compute_claims_digest(
    const sovereign::schema::ring_t ring,
    const measured_state& state) {
  auto metadata = std::vector<std::tuple<std::string, std::string>>{};
  for (const auto& [key, value] : state.metadata) {
    metadata.emplace_back(key, value);
  }
  auto encoder = sovereign::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{
      ring, state.image_id, state.integrity_log_summary, metadata});
  return sovereign::blake3::hash(
      sovereign::schema::bytes_view_t{encoded.data(), encoded.size()});
}

sovereign::schema::hash32_t compute_binding(
    const sovereign::schema::session_id_t& session_id,
    const sovereign::schema::nonce_t& ring_nonce,
    const sovereign::schema::hash32_t& claims_digest) {
  auto encoder = sovereign::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{session_id, ring_nonce, claims_digest});
  return sovereign::blake3::hash(
      sovereign::schema::bytes_view_t{encoded.data(), encoded.size()});
}

void collector::add_source(evidence_source& source) {
  sources_.insert_or_assign(source.ring(), &source);
}

sovereign::schema::result<evidence_t> collector::collect(
    const sovereign::common::call_context& context,
    const sovereign::schema::session_t& session,
    const sovereign::schema::ring_t ring) const {
  auto it = sources_.find(ring);
  if (it == std::end(sources_)) {
    return sovereign::schema::make_error<evidence_t>(
        error_code::incomplete_bundle,
        "no evidence source for ring " +
            std::string{sovereign::schema::to_string(ring)},
        std::string{kCodespace});
  }
  auto& source = *it->second;

  auto state = source.measure(context);
  if (!state.ok()) {
    return sovereign::schema::make_error<evidence_t>(state.to_status());
  }

  auto evidence = evidence_t{};
  evidence.ring = ring;
  evidence.session_id = session.session_id;
  evidence.claims_digest = compute_claims_digest(ring, *state.value);
  evidence.binding = compute_binding(session.session_id,
                                     session.nonce_for(ring),
                                     evidence.claims_digest);

  auto produced = source.produce_quote(context, evidence.binding);
  if (!produced.ok()) {
    spdlog::warn("Quote for ring {} failed: {}",
                 sovereign::schema::to_string(ring), produced.log);
    return sovereign::schema::make_error<evidence_t>(produced.to_status());
  }

  evidence.quote = std::move(produced.value->bytes);
  evidence.signer_public_key_id = std::move(produced.value->signer_public_key_id);
  evidence.platform_measurements = std::move(state.value->platform_measurements);
  evidence.event_log = std::move(state.value->event_log);
  evidence.extra_metadata = std::move(state.value->metadata);
  evidence.extra_metadata.insert_or_assign("image_id", state.value->image_id);
  return sovereign::schema::make_result(std::move(evidence));
}

sovereign::schema::result<std::vector<evidence_t>> collector::collect_all(
    const sovereign::common::call_context& context,
    const sovereign::schema::session_t& session) const {
  auto entries = std::vector<evidence_t>{};
  for (const auto& [ring, source] : sources_) {
    auto evidence = collect(context, session, ring);
    if (!evidence.ok()) {
      return sovereign::schema::make_error<std::vector<evidence_t>>(
          evidence.to_status());
    }
    entries.push_back(std::move(*evidence.value));
  }
  return sovereign::schema::make_result(std::move(entries));
}

}  // namespace sovereign::attestation
