#pragma once

#include <sovereign/http/transport.hpp>
#include <sovereign/signing/gateway.hpp>

#include <string>

namespace sovereign::signing {

inline constexpr auto kDefaultPluginEndpoint =
    std::string_view{"unix:///tmp/spire-data/tpm-plugin/tpm-plugin.sock"};

/// Forwards digests to the TPM plugin's `/sign-data` endpoint. The plugin
/// holds the App Key inside the TPM; this side only ever sees signatures.
class plugin_gateway final : public signing_gateway {
 public:
  /// `transport` must already be bound to the plugin socket.
  explicit plugin_gateway(sovereign::http::transport& transport,
                          std::string base_url = "http://localhost");

  sovereign::schema::result<sovereign::schema::bytes_t> sign(
      const sovereign::common::call_context& context,
      const sign_request& request) override;

 private:
  sovereign::http::transport& transport_;
  std::string base_url_;
};

}  // namespace sovereign::signing
