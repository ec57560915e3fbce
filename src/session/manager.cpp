#include <sovereign/crypto/random.hpp>
#include <sovereign/session/manager.hpp>

#include <spdlog/spdlog.h>

namespace sovereign::session {

namespace {

inline constexpr auto kJournalPrefix = std::string_view{"SESSION|"};
inline constexpr auto kSessionIdBytes = size_t{16};

using sovereign::schema::error_code;

sovereign::schema::bytes_t make_journal_key(
    const sovereign::schema::session_id_t& session_id) {
  auto key = sovereign::schema::make_bytes(kJournalPrefix);
  key.insert(std::end(key), std::begin(session_id), std::end(session_id));
  return key;
}

sovereign::schema::status session_error(const error_code code,
                                        const std::string& session_id,
                                        const std::string_view what) {
  return sovereign::schema::make_status(
      code, "session " + session_id + " " + std::string{what},
      std::string{kCodespace});
}

}  // namespace

sovereign::schema::timestamp_milliseconds_t system_now() {
  return static_cast<sovereign::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

manager::manager(const std::chrono::milliseconds ttl,
                 clock_fn_t clock,
                 journal_t* journal)
    : ttl_{ttl}, clock_{std::move(clock)}, journal_{journal} {
  if (journal_ != nullptr) {
    load_journal();
  }
}

sovereign::schema::session_t manager::issue_challenge() {
  auto id_bytes = sovereign::crypto::random_bytes(kSessionIdBytes);
  auto session = sovereign::schema::session_t{};
  session.session_id = sovereign::schema::to_hex(
      sovereign::schema::bytes_view_t{id_bytes.data(), id_bytes.size()});
  session.nonce_host = sovereign::crypto::make_nonce();
  session.nonce_vm = sovereign::crypto::make_nonce();
  session.nonce_workload = sovereign::crypto::make_nonce();
  session.issued_at = clock_();
  session.expires_at =
      session.issued_at +
      static_cast<sovereign::schema::timestamp_milliseconds_t>(ttl_.count());
  session.consumed = false;

  {
    auto lock = std::scoped_lock{mutex_};
    sessions_.insert_or_assign(session.session_id, session);
    journal_put(session);
  }
  spdlog::debug("Issued challenge session {} expiring at {}",
                session.session_id, session.expires_at);
  return session;
}

sovereign::schema::status manager::consume(
    const sovereign::schema::session_id_t& session_id) {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_)) {
    return session_error(error_code::session_missing, session_id, "not found");
  }
  if (it->second.expired_at(now)) {
    return session_error(error_code::session_expired, session_id, "expired");
  }
  if (it->second.consumed) {
    spdlog::warn("Replay attempt on consumed session {}", session_id);
    return session_error(error_code::session_consumed, session_id,
                         "already consumed");
  }
  it->second.consumed = true;
  journal_put(it->second);
  spdlog::info("Consumed session {}", session_id);
  return {};
}

sovereign::schema::result<sovereign::schema::session_t> manager::validate(
    const sovereign::schema::session_id_t& session_id) const {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_)) {
    return sovereign::schema::make_error<sovereign::schema::session_t>(
        session_error(error_code::session_missing, session_id, "not found"));
  }
  if (it->second.expired_at(now)) {
    return sovereign::schema::make_error<sovereign::schema::session_t>(
        session_error(error_code::session_expired, session_id, "expired"));
  }
  if (it->second.consumed) {
    return sovereign::schema::make_error<sovereign::schema::session_t>(
        session_error(error_code::session_consumed, session_id,
                      "already consumed"));
  }
  return sovereign::schema::make_result(it->second);
}

std::optional<sovereign::schema::session_t> manager::lookup(
    const sovereign::schema::session_id_t& session_id) const {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_) || it->second.expired_at(now)) {
    return std::nullopt;
  }
  return it->second;
}

size_t manager::purge_expired() {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto removed = std::erase_if(sessions_, [&](const auto& entry) {
    if (!entry.second.expired_at(now)) {
      return false;
    }
    journal_erase(entry.first);
    return true;
  });
  if (removed > 0) {
    spdlog::debug("Purged {} expired sessions", removed);
  }
  return removed;
}

size_t manager::size() const {
  auto lock = std::scoped_lock{mutex_};
  return sessions_.size();
}

void manager::journal_put(const sovereign::schema::session_t& session) {
  if (journal_ == nullptr) {
    return;
  }
  auto key = make_journal_key(session.session_id);
  journal_->put(encoder_, sovereign::schema::bytes_view_t{key.data(), key.size()},
                session);
}

void manager::journal_erase(const sovereign::schema::session_id_t& session_id) {
  if (journal_ == nullptr) {
    return;
  }
  auto key = make_journal_key(session_id);
  journal_->erase(sovereign::schema::bytes_view_t{key.data(), key.size()});
}

void manager::load_journal() {
  auto prefix = sovereign::schema::make_bytes(kJournalPrefix);
  auto entries = journal_->list_by_prefix(
      sovereign::schema::bytes_view_t{prefix.data(), prefix.size()});
  for (const auto& [key, value] : entries) {
    auto session = encoder_.try_decode<sovereign::schema::session_t>(
        sovereign::schema::bytes_view_t{value.data(), value.size()});
    if (!session) {
      spdlog::warn("Skipping undecodable journal entry '{}'",
                   sovereign::schema::make_string(key));
      continue;
    }
    sessions_.insert_or_assign(session->session_id, std::move(*session));
  }
  spdlog::info("Loaded {} sessions from journal", sessions_.size());
}

}  // namespace sovereign::session
