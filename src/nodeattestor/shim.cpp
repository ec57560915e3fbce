#include <sovereign/nodeattestor/shim.hpp>

#include <spdlog/spdlog.h>

namespace sovereign::nodeattestor {

shim::shim(const sovereign::config::feature_flags& flags) : flags_{flags} {}

std::string_view shim::name() const {
  return kMarkerPayload;
}

sovereign::schema::status shim::configure(const std::string_view text) {
  if (!text.empty()) {
    spdlog::debug("Ignoring {} bytes of node attestor configuration",
                  text.size());
  }
  return {};
}

sovereign::schema::status shim::attest(attestation_stream& stream) {
  if (!flags_.is_set(sovereign::config::kFlagUnifiedIdentity)) {
    return sovereign::schema::make_status(
        sovereign::schema::error_code::feature_disabled,
        "unified identity is disabled", std::string{kCodespace});
  }

  // Send errors belong to the caller as-is.
  auto status = stream.send(sovereign::schema::make_bytes_view(kMarkerPayload));
  if (status.ok()) {
    triggered_ = true;
  }
  return status;
}

}  // namespace sovereign::nodeattestor
