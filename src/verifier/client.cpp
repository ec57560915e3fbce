#include <sovereign/verifier/client.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace sovereign::verifier {

namespace {

using sovereign::schema::attested_claims_t;
using sovereign::schema::error_code;

sovereign::schema::result<attested_claims_t> verifier_error(
    const error_code code,
    std::string log) {
  return sovereign::schema::make_error<attested_claims_t>(
      code, std::move(log), std::string{kCodespace});
}

const sovereign::schema::evidence_t* primary_evidence(
    const sovereign::schema::evidence_bundle_t& bundle) {
  if (const auto* host = bundle.find(sovereign::schema::ring_t::host)) {
    return host;
  }
  return bundle.entries.empty() ? nullptr : &bundle.entries.front();
}

std::string hex(const sovereign::schema::bytes_view_t& bytes) {
  return sovereign::schema::to_hex(bytes);
}

std::optional<sovereign::schema::gpu_metrics_t> parse_gpu(
    const nlohmann::json& claims) {
  auto it = claims.find("gpu_metrics_health");
  if (it == claims.end() || it->is_null()) {
    return std::nullopt;
  }
  auto gpu = sovereign::schema::gpu_metrics_t{};
  gpu.status = it->value("status", std::string{});
  gpu.utilization_pct = it->value("utilization_pct", 0.0);
  gpu.memory_mb = it->value("memory_mb", int64_t{0});
  return gpu;
}

sovereign::schema::verification_details_t parse_details(
    const nlohmann::json& details) {
  auto out = sovereign::schema::verification_details_t{};
  out.app_key_certificate_valid =
      details.value("app_key_certificate_valid", false);
  out.app_key_public_matches_cert =
      details.value("app_key_public_matches_cert", false);
  out.quote_signature_valid = details.value("quote_signature_valid", false);
  out.nonce_valid = details.value("nonce_valid", false);
  out.timestamp = details.value("timestamp", int64_t{0});
  return out;
}

}  // namespace

sovereign::schema::status validate_request(
    const sovereign::schema::evidence_bundle_t& bundle) {
  auto invalid = [](std::string log) {
    return sovereign::schema::make_status(error_code::verification_failed,
                                          std::move(log),
                                          std::string{kCodespace});
  };
  const auto* primary = primary_evidence(bundle);
  if (primary == nullptr || primary->quote.empty()) {
    return invalid("quote is required");
  }
  if (primary->quote.size() > kMaxQuoteBytes) {
    return invalid("quote exceeds " + std::to_string(kMaxQuoteBytes) +
                   " bytes");
  }
  if (std::ranges::all_of(bundle.challenge_nonce,
                          [](const uint8_t b) { return b == 0; })) {
    return invalid("challenge nonce is required");
  }
  if (bundle.app_key_public.empty()) {
    return invalid("app_key_public is required");
  }
  return {};
}

client::client(sovereign::http::transport& transport, std::string base_url)
    : transport_{transport}, base_url_{std::move(base_url)} {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string client::make_request_body(
    const sovereign::schema::evidence_bundle_t& bundle) {
  auto rings = nlohmann::json::array();
  for (const auto& entry : bundle.entries) {
    rings.push_back({
        {"ring", std::string{sovereign::schema::to_string(entry.ring)}},
        {"quote", sovereign::schema::to_base64(entry.quote)},
        {"claims_digest", hex(entry.claims_digest)},
        {"binding", hex(entry.binding)},
        {"signer_public_key_id", entry.signer_public_key_id},
    });
  }

  auto data = nlohmann::json{
      {"session_id", bundle.session_id},
      {"challenge_nonce", hex(bundle.challenge_nonce)},
      {"app_key_public", bundle.app_key_public},
      {"hash_alg", "sha256"},
      {"rings", std::move(rings)},
      {"bundle_signature", sovereign::schema::to_base64(bundle.signature)},
  };
  if (const auto* primary = primary_evidence(bundle)) {
    data["tpm_signed_attestation"] = sovereign::schema::to_base64(primary->quote);
  }
  if (bundle.app_key_certificate) {
    data["app_key_certificate"] =
        sovereign::schema::to_base64(*bundle.app_key_certificate);
  }
  if (bundle.workload_code_hash) {
    data["workload_code_hash"] = hex(*bundle.workload_code_hash);
  }
  if (bundle.agent_uuid) {
    data["agent_uuid"] = *bundle.agent_uuid;
  }

  auto body = nlohmann::json{
      {"type", "tpm"},
      {"data", std::move(data)},
      {"metadata",
       {{"source", "sovereign"}, {"submission_type", "PoR/tpm-app-key"}}},
  };
  return body.dump();
}

sovereign::schema::result<attested_claims_t> client::parse_response(
    const std::string_view& body) {
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return verifier_error(error_code::malformed_response,
                          "verifier response is not a JSON object");
  }

  try {
    auto results = parsed.find("results");
    if (results == parsed.end() || !results->is_object()) {
      return verifier_error(error_code::verification_failed,
                            "verifier response missing results");
    }
    auto audit_id = results->value("audit_id", std::string{});
    if (!results->value("verified", false)) {
      return verifier_error(error_code::verification_failed,
                            "verification failed (audit_id: " + audit_id + ")");
    }

    auto claims = results->find("attested_claims");
    if (claims == results->end() || !claims->is_object()) {
      return verifier_error(error_code::verification_failed,
                            "verifier response missing attested_claims");
    }
    if (!claims->contains("geolocation") ||
        !claims->contains("host_integrity_status")) {
      return verifier_error(
          error_code::verification_failed,
          "attested_claims missing geolocation or host_integrity_status");
    }

    auto out = attested_claims_t{};
    out.geolocation = claims->at("geolocation").get<std::string>();
    out.host_integrity_status = sovereign::schema::parse_integrity_status(
        claims->at("host_integrity_status").get<std::string>());
    out.gpu_metrics_health = parse_gpu(*claims);
    out.audit_id = std::move(audit_id);
    if (auto details = results->find("verification_details");
        details != results->end() && details->is_object()) {
      out.details = parse_details(*details);
    }
    return sovereign::schema::make_result(std::move(out));
  } catch (const nlohmann::json::exception& e) {
    return verifier_error(error_code::malformed_response,
                          std::string{"malformed verifier response: "} +
                              e.what());
  }
}

sovereign::schema::result<attested_claims_t> client::verify_evidence(
    const sovereign::common::call_context& context,
    const sovereign::schema::evidence_bundle_t& bundle) const {
  auto valid = validate_request(bundle);
  if (!valid.ok()) {
    spdlog::warn("Rejecting evidence for session {} before submission: {}",
                 bundle.session_id, valid.log);
    return sovereign::schema::make_error<attested_claims_t>(valid);
  }

  auto request = sovereign::http::request{
      .method = "POST",
      .url = base_url_ + std::string{kEvidencePath},
      .headers = {{"Content-Type", "application/json"},
                  {"Accept", "application/json"}},
      .body = make_request_body(bundle)};

  auto sent = transport_.send(context, request);
  if (!sent.ok()) {
    spdlog::error("Verifier call for session {} failed: {}", bundle.session_id,
                  sent.log);
    return sovereign::schema::make_error<attested_claims_t>(sent.to_status());
  }

  if (!sent.value->success()) {
    spdlog::warn("Verifier rejected session {} with status {}",
                 bundle.session_id, sent.value->status);
    return verifier_error(error_code::verifier_status,
                          "keylime verifier returned status " +
                              std::to_string(sent.value->status) + ": " +
                              sent.value->body);
  }

  auto claims = parse_response(sent.value->body);
  if (!claims.ok()) {
    spdlog::warn("Verification of session {} failed: {}", bundle.session_id,
                 claims.log);
    return claims;
  }
  spdlog::info("Verifier accepted session {} (audit_id: {})",
               bundle.session_id, claims.value->audit_id);
  return claims;
}

}  // namespace sovereign::verifier
