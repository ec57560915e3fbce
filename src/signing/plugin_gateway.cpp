#include <sovereign/signing/plugin_gateway.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sovereign::signing {

namespace {

using sovereign::schema::bytes_t;
using sovereign::schema::error_code;

sovereign::schema::result<bytes_t> plugin_error(std::string log) {
  return sovereign::schema::make_error<bytes_t>(
      error_code::signing_failed, std::move(log), std::string{kCodespace});
}

}  // namespace

plugin_gateway::plugin_gateway(sovereign::http::transport& transport,
                               std::string base_url)
    : transport_{transport}, base_url_{std::move(base_url)} {}

sovereign::schema::result<bytes_t> plugin_gateway::sign(
    const sovereign::common::call_context& context,
    const sign_request& request) {
  auto payload = nlohmann::json{
      {"digest", sovereign::schema::to_base64(request.digest)},
      {"hash_algorithm",
       std::string{sovereign::schema::to_string(request.hash_algorithm)}},
      {"scheme", std::string{sovereign::schema::to_string(request.scheme)}},
      {"salt_length", request.salt_length},
  };

  auto http_request = sovereign::http::request{
      .method = "POST",
      .url = base_url_ + "/sign-data",
      .headers = {{"Content-Type", "application/json"}},
      .body = payload.dump()};
  auto sent = transport_.send(context, http_request);
  if (!sent.ok()) {
    return sovereign::schema::make_error<bytes_t>(sent.to_status());
  }
  if (!sent.value->success()) {
    spdlog::error("TPM plugin sign-data returned status {}",
                  sent.value->status);
    return plugin_error("TPM plugin returned status " +
                        std::to_string(sent.value->status) + ": " +
                        sent.value->body);
  }

  try {
    auto body = nlohmann::json::parse(sent.value->body);
    auto status = body.value("status", std::string{});
    if (status != "success") {
      return plugin_error("TPM plugin sign-data failed: " +
                          body.value("error", status));
    }
    auto signature =
        sovereign::schema::try_from_base64(body.at("signature").get<std::string>());
    if (!signature || signature->empty()) {
      return plugin_error("TPM plugin returned an invalid signature encoding");
    }
    return sovereign::schema::make_result(std::move(*signature));
  } catch (const nlohmann::json::exception& e) {
    return plugin_error(std::string{"malformed TPM plugin response: "} +
                        e.what());
  }
}

}  // namespace sovereign::signing
