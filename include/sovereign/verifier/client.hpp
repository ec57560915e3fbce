#pragma once

#include <sovereign/common/context.hpp>
#include <sovereign/http/transport.hpp>
#include <sovereign/schema/attested_claims.hpp>
#include <sovereign/schema/evidence_bundle.hpp>
#include <sovereign/schema/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace sovereign::verifier {

inline constexpr auto kCodespace = std::string_view{"sovereign.verifier"};
inline constexpr auto kDefaultBaseUrl = std::string_view{"http://localhost:8881"};
inline constexpr auto kEvidencePath = std::string_view{"/v2.4/verify/evidence"};
inline constexpr auto kMaxQuoteBytes = size_t{64 * 1024};

/// Client of the remote verification service.
///
/// One call is one verification attempt for one nonce; the client never
/// retries. Non-2xx answers, `verified: false` and responses missing
/// required claims all fail closed without a claims value.
class client final {
 public:
  client(sovereign::http::transport& transport,
         std::string base_url = std::string{kDefaultBaseUrl});

  sovereign::schema::result<sovereign::schema::attested_claims_t>
  verify_evidence(const sovereign::common::call_context& context,
                  const sovereign::schema::evidence_bundle_t& bundle) const;

  /// Request body for `bundle`; exposed for diagnostics and tests.
  static std::string make_request_body(
      const sovereign::schema::evidence_bundle_t& bundle);

  /// Interpret a 2xx response body.
  static sovereign::schema::result<sovereign::schema::attested_claims_t>
  parse_response(const std::string_view& body);

 private:
  sovereign::http::transport& transport_;
  std::string base_url_;
};

/// Local precondition check run before any network traffic.
sovereign::schema::status validate_request(
    const sovereign::schema::evidence_bundle_t& bundle);

}  // namespace sovereign::verifier
