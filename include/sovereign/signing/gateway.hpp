#pragma once

#include <sovereign/common/context.hpp>
#include <sovereign/schema/hash_algorithm.hpp>
#include <sovereign/schema/primitives.hpp>
#include <sovereign/schema/result.hpp>
#include <sovereign/schema/signature_scheme.hpp>

namespace sovereign::signing {

inline constexpr auto kCodespace = std::string_view{"sovereign.signing"};

struct sign_request final {
  sovereign::schema::bytes_t digest;
  sovereign::schema::hash_algorithm_t hash_algorithm{
      sovereign::schema::hash_algorithm_t::sha256};
  sovereign::schema::signature_scheme_t scheme{
      sovereign::schema::signature_scheme_t::rsassa};
  int32_t salt_length{sovereign::schema::kPssSaltLengthEqualsHash};
};

/// Owner of private key material. Signs precomputed digests and nothing else.
///
/// Implementations may block on hardware; they must give up once `context`
/// is done and report `timeout` or `cancelled`.
class signing_gateway {
 public:
  virtual ~signing_gateway() = default;

  virtual sovereign::schema::result<sovereign::schema::bytes_t> sign(
      const sovereign::common::call_context& context,
      const sign_request& request) = 0;
};

}  // namespace sovereign::signing
