#include <gtest/gtest.h>
#include <sovereign/session/manager.hpp>
#include <sovereign/testing/common.hpp>
#include <sovereign/testing/fakes.hpp>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

TEST(session_manager, issued_challenge_has_distinct_ring_nonces) {
  auto clock = sovereign::testing::manual_clock{};
  auto sessions = sovereign::session::manager{std::chrono::seconds{30}, clock};
  auto session = sessions.issue_challenge();
  EXPECT_EQ(session.session_id.size(), 32u);
  EXPECT_NE(session.nonce_host, session.nonce_vm);
  EXPECT_NE(session.nonce_vm, session.nonce_workload);
  EXPECT_EQ(session.expires_at, session.issued_at + 30000);
  EXPECT_FALSE(session.consumed);
  EXPECT_EQ(&session.nonce_for(sovereign::schema::ring_t::vm), &session.nonce_vm);

  auto ids = std::set<std::string>{};
  for (auto i = 0; i < 16; ++i) {
    ids.insert(sessions.issue_challenge().session_id);
  }
  EXPECT_EQ(ids.size(), 16u);
}

TEST(session_manager, consume_succeeds_once) {
  auto clock = sovereign::testing::manual_clock{};
  auto sessions = sovereign::session::manager{std::chrono::seconds{30}, clock};
  auto session = sessions.issue_challenge();

  EXPECT_TRUE(sessions.consume(session.session_id).ok());
  auto replay = sessions.consume(session.session_id);
  EXPECT_EQ(replay.code, sovereign::schema::error_code::session_consumed);
  EXPECT_EQ(replay.codespace, "sovereign.session");

  auto validated = sessions.validate(session.session_id);
  EXPECT_EQ(validated.code, sovereign::schema::error_code::session_consumed);
  auto looked_up = sessions.lookup(session.session_id);
  ASSERT_TRUE(looked_up.has_value());
  EXPECT_TRUE(looked_up->consumed);
}

TEST(session_manager, concurrent_consumers_have_exactly_one_winner) {
  auto clock = sovereign::testing::manual_clock{};
  auto sessions = sovereign::session::manager{std::chrono::seconds{30}, clock};
  auto session = sessions.issue_challenge();

  auto successes = std::atomic<int>{0};
  auto consumed_errors = std::atomic<int>{0};
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      auto status = sessions.consume(session.session_id);
      if (status.ok()) {
        ++successes;
      } else if (status.code == sovereign::schema::error_code::session_consumed) {
        ++consumed_errors;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(successes.load(), 1);
  EXPECT_EQ(consumed_errors.load(), 15);
}

TEST(session_manager, expired_session_cannot_be_consumed) {
  auto clock = sovereign::testing::manual_clock{};
  auto sessions = sovereign::session::manager{std::chrono::seconds{30}, clock};
  auto session = sessions.issue_challenge();

  clock.advance(29999);
  EXPECT_TRUE(sessions.validate(session.session_id).ok());
  clock.advance(1);
  EXPECT_EQ(sessions.validate(session.session_id).code,
            sovereign::schema::error_code::session_expired);
  EXPECT_EQ(sessions.consume(session.session_id).code,
            sovereign::schema::error_code::session_expired);
  EXPECT_FALSE(sessions.lookup(session.session_id).has_value());
}

TEST(session_manager, expiry_outranks_consumption) {
  auto clock = sovereign::testing::manual_clock{};
  auto sessions = sovereign::session::manager{std::chrono::seconds{30}, clock};
  auto session = sessions.issue_challenge();

  ASSERT_TRUE(sessions.consume(session.session_id).ok());
  clock.advance(30000);
  auto replay = sessions.consume(session.session_id);
  EXPECT_EQ(replay.code, sovereign::schema::error_code::session_expired);
  EXPECT_EQ(sessions.validate(session.session_id).code,
            sovereign::schema::error_code::session_expired);
}

TEST(session_manager, unknown_session_is_missing) {
  auto sessions = sovereign::session::manager{};
  auto status = sessions.consume("deadbeef");
  EXPECT_EQ(status.code, sovereign::schema::error_code::session_missing);
  EXPECT_EQ(status.log, "session deadbeef not found");
}

TEST(session_manager, purge_drops_only_expired_sessions) {
  auto clock = sovereign::testing::manual_clock{};
  auto sessions = sovereign::session::manager{std::chrono::seconds{30}, clock};
  static_cast<void>(sessions.issue_challenge());
  clock.advance(20000);
  auto fresh = sessions.issue_challenge();
  clock.advance(15000);

  EXPECT_EQ(sessions.purge_expired(), 1u);
  EXPECT_EQ(sessions.size(), 1u);
  EXPECT_TRUE(sessions.validate(fresh.session_id).ok());
}

TEST(session_manager, journal_keeps_consumed_sessions_closed_after_restart) {
  auto db = sovereign::testing::make_db_path("sovereign_session_journal");
  auto clock = sovereign::testing::manual_clock{};
  auto consumed_id = std::string{};
  auto open_id = std::string{};
  {
    auto journal = sovereign::storage::make_storage<
        sovereign::storage::rocksdb_storage_tag>(db);
    auto sessions =
        sovereign::session::manager{std::chrono::seconds{30}, clock, &journal};
    consumed_id = sessions.issue_challenge().session_id;
    open_id = sessions.issue_challenge().session_id;
    ASSERT_TRUE(sessions.consume(consumed_id).ok());
  }
  {
    auto journal = sovereign::storage::make_storage<
        sovereign::storage::rocksdb_storage_tag>(db);
    auto sessions =
        sovereign::session::manager{std::chrono::seconds{30}, clock, &journal};
    EXPECT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions.consume(consumed_id).code,
              sovereign::schema::error_code::session_consumed);
    EXPECT_TRUE(sessions.consume(open_id).ok());
  }
  sovereign::testing::remove_path(db);
}
