#pragma once

#include <sovereign/config/feature_flags.hpp>
#include <sovereign/schema/primitives.hpp>
#include <sovereign/schema/result.hpp>

#include <string_view>

namespace sovereign::nodeattestor {

inline constexpr auto kCodespace = std::string_view{"sovereign.nodeattestor"};
inline constexpr auto kMarkerPayload = std::string_view{"unified_identity"};

/// Client half of the bidirectional attestation channel.
class attestation_stream {
 public:
  virtual ~attestation_stream() = default;

  virtual sovereign::schema::status send(
      const sovereign::schema::bytes_view_t& payload) = 0;
};

class node_attestor {
 public:
  virtual ~node_attestor() = default;

  virtual std::string_view name() const = 0;
  virtual sovereign::schema::status configure(std::string_view text) = 0;
  virtual sovereign::schema::status attest(attestation_stream& stream) = 0;
};

/// Signals the server to take evidence from the side channel. Sends the
/// marker frame once and performs no local verification.
class shim final : public node_attestor {
 public:
  explicit shim(const sovereign::config::feature_flags& flags);

  std::string_view name() const override;
  sovereign::schema::status configure(std::string_view text) override;
  sovereign::schema::status attest(attestation_stream& stream) override;

  bool triggered() const { return triggered_; }

 private:
  const sovereign::config::feature_flags& flags_;
  bool triggered_{false};
};

}  // namespace sovereign::nodeattestor
