#pragma once
#include <sovereign/schema/primitives.hpp>
#include <sovereign/schema/ring.hpp>

namespace sovereign::schema {

template <uint16_t Version>
struct session;

/// Single-use freshness challenge. One nonce per ring.
template <>
struct session<1> final {
  uint16_t version{1};
  session_id_t session_id;
  nonce_t nonce_host{};
  nonce_t nonce_vm{};
  nonce_t nonce_workload{};
  timestamp_milliseconds_t issued_at{};
  timestamp_milliseconds_t expires_at{};
  bool consumed{};

  const nonce_t& nonce_for(const ring_t ring) const {
    switch (ring) {
      case ring_t::vm:
        return nonce_vm;
      case ring_t::workload:
        return nonce_workload;
      case ring_t::host:
      default:
        return nonce_host;
    }
  }

  bool expired_at(const timestamp_milliseconds_t now) const {
    return now >= expires_at;
  }
};

using session_t = session<1>;

}  // namespace sovereign::schema
