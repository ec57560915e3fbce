#pragma once

#include <sovereign/schema/encoding/scale/encoder.hpp>
#include <sovereign/schema/result.hpp>
#include <sovereign/schema/session.hpp>
#include <sovereign/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace sovereign::session {

inline constexpr auto kCodespace = std::string_view{"sovereign.session"};
inline constexpr auto kDefaultTtl = std::chrono::milliseconds{30000};

using clock_fn_t = std::function<sovereign::schema::timestamp_milliseconds_t()>;
using journal_t =
    sovereign::storage::storage<sovereign::storage::rocksdb_storage_tag>;

/// Wall clock in milliseconds since the epoch.
sovereign::schema::timestamp_milliseconds_t system_now();

/// Issues and consumes single-use challenges.
///
/// A session is usable until it is consumed or its `expires_at` passes,
/// whichever comes first. `consume` is serialized on the table lock, so of
/// any number of concurrent consumers of one session exactly one succeeds.
/// With a journal attached, issued sessions and consumption marks survive a
/// restart.
class manager final {
 public:
  explicit manager(std::chrono::milliseconds ttl = kDefaultTtl,
                   clock_fn_t clock = system_now,
                   journal_t* journal = nullptr);

  manager(const manager&) = delete;
  manager& operator=(const manager&) = delete;

  sovereign::schema::session_t issue_challenge();

  /// Transition an unconsumed, unexpired session to consumed.
  sovereign::schema::status consume(
      const sovereign::schema::session_id_t& session_id);

  /// Current state of a session that is usable for verification. Consumed or
  /// expired sessions are reported with their specific error.
  sovereign::schema::result<sovereign::schema::session_t> validate(
      const sovereign::schema::session_id_t& session_id) const;

  /// Any non-expired session, consumed or not. Expired ones read as missing.
  std::optional<sovereign::schema::session_t> lookup(
      const sovereign::schema::session_id_t& session_id) const;

  /// Drop expired sessions; returns how many were removed.
  size_t purge_expired();

  size_t size() const;

 private:
  void journal_put(const sovereign::schema::session_t& session);
  void journal_erase(const sovereign::schema::session_id_t& session_id);
  void load_journal();

  std::chrono::milliseconds ttl_;
  clock_fn_t clock_;
  journal_t* journal_;
  sovereign::schema::encoding::scale_encoder_t encoder_;
  mutable std::mutex mutex_;
  std::unordered_map<sovereign::schema::session_id_t,
                     sovereign::schema::session_t>
      sessions_;
};

}  // namespace sovereign::session
