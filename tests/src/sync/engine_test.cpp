#include <cosign/schema/session_error_code.hpp>
#include <cosign/sync/engine.hpp>
#include <cosign/testing/common.hpp>
#include <cosign/testing/session_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using cosign::schema::session_status_t;
using cosign::schema::signing_mode_t;
using cosign::schema::sync_state_t;
using cosign::sync::record_outcome_t;
using cosign::sync::remote_status_t;

cosign::schema::sync_record_t make_record(
    std::string recipient_id,
    bool finished,
    std::string field_id = {},
    cosign::schema::timestamp_milliseconds_t consent_at =
        cosign::testing::kStartTime) {
  auto record = cosign::schema::sync_record_t{};
  record.session_id = "session-1";
  record.payload.consent = cosign::schema::consent_submission_t{
      .consent_text_hash = cosign::testing::make_hash(1),
      .user_agent = "test-agent/1.0",
      .consent_at = consent_at};
  if (field_id.empty()) {
    field_id = "sig-" + recipient_id;
  }
  record.payload.signatures.push_back(cosign::schema::field_signature_t{
      .field_id = std::move(field_id),
      .value = cosign::testing::make_typed_signature(),
      .completed_at = consent_at});
  if (finished) {
    record.payload.completed_at = consent_at;
  }
  record.recipient_id = std::move(recipient_id);
  return record;
}

cosign::sync::remote_response_t make_response(
    remote_status_t status,
    std::string error = {},
    std::optional<session_status_t> session_status = std::nullopt) {
  auto response = cosign::sync::remote_response_t{};
  response.status = status;
  response.error = std::move(error);
  response.session_status = session_status;
  return response;
}

cosign::schema::session_t make_snapshot(
    cosign::schema::timestamp_milliseconds_t updated_at,
    session_status_t status = session_status_t::active) {
  auto session = cosign::testing::make_session(signing_mode_t::parallel,
                                               {"alice", "bob"});
  session.updated_at = updated_at;
  session.status = status;
  return session;
}

}  // namespace

TEST(sync_engine, queue_keeps_one_record_per_recipient) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_queue"};
  auto& engine = fixture.engine();

  auto first = engine.queue_for_sync(make_record("alice", false, "first"));
  fixture.clock().advance(10);
  auto second = engine.queue_for_sync(make_record("alice", true, "second"));
  engine.queue_for_sync(make_record("bob", false));

  EXPECT_GT(second.generation, first.generation);
  auto pending = engine.pending();
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].recipient_id, "alice");
  EXPECT_EQ(pending[0].generation, second.generation);
  ASSERT_EQ(pending[0].payload.signatures.size(), 1u);
  EXPECT_EQ(pending[0].payload.signatures[0].field_id, "second");
  EXPECT_TRUE(pending[0].payload.completed_at.has_value());
  EXPECT_EQ(pending[0].enqueued_at, cosign::testing::kStartTime + 10);
  EXPECT_EQ(engine.status().pending_count, 2u);
}

TEST(sync_engine, generations_survive_a_restart) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_generation"};
  auto first = fixture.engine().queue_for_sync(make_record("alice", false));

  auto restarted = cosign::sync::engine{fixture.encoder(), fixture.storage(),
                                        fixture.remote(),
                                        fixture.clock().source()};
  auto second = restarted.queue_for_sync(make_record("bob", false));
  EXPECT_GT(second.generation, first.generation);
  ASSERT_EQ(restarted.pending().size(), 2u);
  EXPECT_EQ(restarted.pending().front().recipient_id, "alice");
}

TEST(sync_engine, offline_commits_sync_when_back_online) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_offline"};
  auto& engine = fixture.engine();
  engine.cache_session(make_snapshot(cosign::testing::kStartTime), "alice");

  engine.set_offline_mode(true);
  EXPECT_FALSE(engine.can_sync());
  engine.queue_for_sync(make_record("alice", true));
  auto skipped = engine.sync();
  EXPECT_FALSE(skipped.attempted);
  EXPECT_TRUE(fixture.remote().calls().empty());
  EXPECT_EQ(engine.load_session("session-1", "alice")->sync_state,
            sync_state_t::queued);
  EXPECT_TRUE(engine.status().offline_mode);

  engine.set_offline_mode(false);
  fixture.clock().advance(5000);
  auto report = engine.sync();
  ASSERT_TRUE(report.attempted);
  ASSERT_EQ(report.records.size(), 1u);
  EXPECT_EQ(report.records[0].outcome, record_outcome_t::synced);
  EXPECT_TRUE(engine.pending().empty());

  auto calls = fixture.remote().calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].kind, "consent");
  EXPECT_EQ(calls[1].kind, "signed");
  ASSERT_TRUE(calls[1].submission.has_value());
  EXPECT_EQ(calls[1].submission->signatures.size(), 1u);

  auto cached = engine.load_session("session-1", "alice");
  EXPECT_EQ(cached->sync_state, sync_state_t::synced);
  EXPECT_EQ(cached->last_synced_at, cosign::testing::kStartTime + 5000);
  auto status = engine.status();
  EXPECT_EQ(status.pending_count, 0u);
  EXPECT_EQ(status.last_success_at, cosign::testing::kStartTime + 5000);
  EXPECT_TRUE(status.errors.empty());
}

TEST(sync_engine, offline_mode_is_persisted) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_mode"};
  fixture.engine().set_offline_mode(true);

  auto restarted = cosign::sync::engine{fixture.encoder(), fixture.storage(),
                                        fixture.remote(),
                                        fixture.clock().source()};
  EXPECT_TRUE(restarted.status().offline_mode);
  EXPECT_FALSE(restarted.can_sync());

  fixture.engine().set_offline_mode(false);
  fixture.engine().set_online(false);
  EXPECT_FALSE(fixture.engine().can_sync());
  EXPECT_FALSE(fixture.engine().sync().attempted);
}

TEST(sync_engine, backoff_doubles_up_to_the_cap) {
  auto config = cosign::sync::sync_config_t{};
  config.min_backoff = 1000;
  config.max_backoff = 4000;
  auto fixture = cosign::testing::session_fixture{"cosign_sync_backoff", config};
  auto& engine = fixture.engine();

  EXPECT_EQ(engine.backoff_delay(0), 0u);
  EXPECT_EQ(engine.backoff_delay(1), 1000u);
  EXPECT_EQ(engine.backoff_delay(2), 2000u);
  EXPECT_EQ(engine.backoff_delay(3), 4000u);
  EXPECT_EQ(engine.backoff_delay(4), 4000u);
  EXPECT_EQ(engine.backoff_delay(40), 4000u);

  fixture.remote().set_offline(true);
  engine.queue_for_sync(make_record("alice", true));
  auto expected_delays = std::vector<uint64_t>{1000, 2000, 4000, 4000};
  for (std::size_t i = 0; i < expected_delays.size(); ++i) {
    auto report = engine.sync();
    ASSERT_EQ(report.records.size(), 1u);
    EXPECT_EQ(report.records[0].outcome, record_outcome_t::retry_scheduled);
    EXPECT_EQ(report.records[0].remote_status, remote_status_t::network_error);

    auto record = engine.pending().front();
    EXPECT_EQ(record.attempt_count, i + 1);
    EXPECT_EQ(record.next_attempt_at,
              fixture.clock().now() + expected_delays[i]);
    EXPECT_EQ(record.last_error, "consent: connection refused");

    auto early = engine.sync();
    ASSERT_EQ(early.records.size(), 1u);
    EXPECT_EQ(early.records[0].outcome, record_outcome_t::deferred);
    fixture.clock().advance(expected_delays[i]);
  }

  auto status = engine.status();
  ASSERT_EQ(status.errors.size(), 1u);
  EXPECT_EQ(status.errors[0].attempt_count, 4u);
  EXPECT_EQ(status.errors[0].error, "consent: connection refused");
}

TEST(sync_engine, exhausted_records_stall_but_stay_queued) {
  auto config = cosign::sync::sync_config_t{};
  config.max_retries = 2;
  config.min_backoff = 10;
  auto fixture = cosign::testing::session_fixture{"cosign_sync_stall", config};
  auto& engine = fixture.engine();
  fixture.remote().set_offline(true);
  engine.queue_for_sync(make_record("alice", true));

  for (int i = 0; i < 2; ++i) {
    EXPECT_EQ(engine.sync().records[0].outcome,
              record_outcome_t::retry_scheduled);
    fixture.clock().advance(1000);
  }
  auto calls = fixture.remote().calls().size();
  auto stalled = engine.sync();
  ASSERT_EQ(stalled.records.size(), 1u);
  EXPECT_EQ(stalled.records[0].outcome, record_outcome_t::stalled);
  EXPECT_EQ(fixture.remote().calls().size(), calls);
  EXPECT_EQ(engine.pending().size(), 1u);

  // A new local commit resets the retry budget.
  engine.queue_for_sync(make_record("alice", true));
  fixture.remote().set_offline(false);
  EXPECT_EQ(engine.sync().records[0].outcome, record_outcome_t::synced);
}

TEST(sync_engine, definitive_rejection_drops_the_record) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_conflict"};
  auto& engine = fixture.engine();
  engine.cache_session(make_snapshot(cosign::testing::kStartTime), "alice");
  engine.queue_for_sync(make_record("alice", true));
  fixture.remote().push(make_response(remote_status_t::ok));
  fixture.remote().push(
      make_response(remote_status_t::conflict, "recipient already declined"));

  auto report = engine.sync();
  ASSERT_EQ(report.records.size(), 1u);
  EXPECT_EQ(report.records[0].outcome, record_outcome_t::conflict);
  EXPECT_EQ(report.records[0].detail, "signed: recipient already declined");
  EXPECT_TRUE(engine.pending().empty());
  EXPECT_EQ(engine.load_session("session-1", "alice")->sync_state,
            sync_state_t::local);

  auto status = engine.status();
  ASSERT_EQ(status.errors.size(), 1u);
  EXPECT_EQ(status.errors[0].recipient_id, "alice");
  EXPECT_FALSE(status.last_success_at.has_value());
}

TEST(sync_engine, completed_remote_session_makes_record_redundant) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_redundant"};
  auto& engine = fixture.engine();
  engine.queue_for_sync(make_record("alice", true));
  fixture.remote().push(make_response(remote_status_t::ok));
  fixture.remote().push(make_response(remote_status_t::conflict,
                                      "session completed",
                                      session_status_t::completed));

  auto report = engine.sync();
  ASSERT_EQ(report.records.size(), 1u);
  EXPECT_EQ(report.records[0].outcome, record_outcome_t::redundant);
  EXPECT_TRUE(engine.pending().empty());
  EXPECT_TRUE(engine.status().errors.empty());
}

TEST(sync_engine, accepted_consent_is_not_resent) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_consent"};
  auto& engine = fixture.engine();
  engine.queue_for_sync(make_record("alice", true));
  fixture.remote().push(make_response(remote_status_t::ok));
  fixture.remote().push(
      make_response(remote_status_t::network_error, "timeout"));

  EXPECT_EQ(engine.sync().records[0].outcome,
            record_outcome_t::retry_scheduled);
  EXPECT_TRUE(engine.pending().front().consent_synced);

  fixture.clock().advance(engine.backoff_delay(1));
  EXPECT_EQ(engine.sync().records[0].outcome, record_outcome_t::synced);
  EXPECT_EQ(fixture.remote().count("consent"), 1u);
  EXPECT_EQ(fixture.remote().count("signed"), 2u);
}

TEST(sync_engine, consent_only_record_skips_submission) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_consent_only"};
  auto& engine = fixture.engine();
  engine.queue_for_sync(make_record("alice", false));

  EXPECT_EQ(engine.sync().records[0].outcome, record_outcome_t::synced);
  EXPECT_EQ(fixture.remote().count("consent"), 1u);
  EXPECT_EQ(fixture.remote().count("signed"), 0u);
}

TEST(sync_engine, decline_record_is_sent_as_decline) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_decline"};
  auto& engine = fixture.engine();
  auto record = make_record("bob", false);
  record.payload.consent.reset();
  record.payload.signatures.clear();
  record.payload.decline = cosign::schema::decline_submission_t{
      .reason = "wrong rent amount",
      .declined_at = cosign::testing::kStartTime};
  engine.queue_for_sync(record);

  EXPECT_EQ(engine.sync().records[0].outcome, record_outcome_t::synced);
  auto calls = fixture.remote().calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].kind, "decline");
  EXPECT_EQ(calls[0].recipient_id, "bob");
}

TEST(sync_engine, newer_commit_during_flight_supersedes_the_result) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_inflight"};
  auto& engine = fixture.engine();
  engine.queue_for_sync(make_record("alice", false, "older"));
  auto newer = cosign::schema::sync_record_t{};
  fixture.remote().on_next_mutation([&] {
    newer = engine.queue_for_sync(make_record("alice", true, "newer"));
  });

  auto report = engine.sync();
  ASSERT_EQ(report.records.size(), 1u);
  EXPECT_EQ(report.records[0].outcome, record_outcome_t::superseded);

  auto pending = engine.pending();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_EQ(pending[0].generation, newer.generation);
  EXPECT_EQ(pending[0].payload.signatures[0].field_id, "newer");
  EXPECT_EQ(pending[0].attempt_count, 0u);

  EXPECT_EQ(engine.sync().records[0].outcome, record_outcome_t::synced);
  EXPECT_TRUE(engine.pending().empty());
}

TEST(sync_engine, record_superseded_during_drain_is_never_sent) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_stale_drain"};
  auto& engine = fixture.engine();
  engine.queue_for_sync(make_record("alice", true));
  auto stale = engine.queue_for_sync(make_record("bob", true, "stale-bob"));
  auto fresh = cosign::schema::sync_record_t{};
  fixture.remote().on_next_mutation([&] {
    fresh = engine.queue_for_sync(make_record("bob", true, "fresh-bob"));
  });

  auto report = engine.sync();
  ASSERT_EQ(report.records.size(), 2u);
  EXPECT_EQ(report.records[0].recipient_id, "alice");
  EXPECT_EQ(report.records[0].outcome, record_outcome_t::synced);
  EXPECT_EQ(report.records[1].recipient_id, "bob");
  EXPECT_EQ(report.records[1].outcome, record_outcome_t::superseded);
  for (const auto& call : fixture.remote().calls()) {
    EXPECT_NE(call.recipient_id, "bob") << call.kind;
  }

  auto pending = engine.pending();
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_GT(pending[0].generation, stale.generation);
  EXPECT_EQ(pending[0].generation, fresh.generation);

  EXPECT_EQ(engine.sync().records[0].outcome, record_outcome_t::synced);
  auto bob_signed = 0u;
  for (const auto& call : fixture.remote().calls()) {
    if (call.recipient_id != "bob" || !call.submission.has_value()) {
      continue;
    }
    ++bob_signed;
    ASSERT_EQ(call.submission->signatures.size(), 1u);
    EXPECT_EQ(call.submission->signatures[0].field_id, "fresh-bob");
  }
  EXPECT_EQ(bob_signed, 1u);
  EXPECT_TRUE(engine.pending().empty());
}

TEST(sync_engine, transport_exception_is_retried) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_throw"};
  auto& engine = fixture.engine();
  engine.queue_for_sync(make_record("alice", true));
  fixture.remote().throw_next();

  auto report = engine.sync();
  ASSERT_EQ(report.records.size(), 1u);
  EXPECT_EQ(report.records[0].outcome, record_outcome_t::retry_scheduled);
  EXPECT_EQ(report.records[0].detail, "consent: socket closed");
  EXPECT_EQ(engine.pending().front().attempt_count, 1u);
}

TEST(sync_engine, sync_async_drains_in_background) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_async"};
  auto& engine = fixture.engine();
  engine.queue_for_sync(make_record("alice", true));
  engine.queue_for_sync(make_record("bob", true));

  auto report = engine.sync_async().get();
  EXPECT_TRUE(report.attempted);
  EXPECT_EQ(report.records.size(), 2u);
  EXPECT_TRUE(engine.pending().empty());
  EXPECT_FALSE(engine.status().syncing);
}

TEST(sync_engine, cache_is_last_write_wins) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_lww"};
  auto& engine = fixture.engine();

  EXPECT_EQ(engine.cache_session(make_snapshot(200), "alice"),
            cosign::sync::cache_outcome_t::stored);
  auto stale = make_snapshot(100);
  stale.document_name = "stale.pdf";
  EXPECT_EQ(engine.cache_session(stale, "alice"),
            cosign::sync::cache_outcome_t::kept_existing);
  EXPECT_EQ(engine.load_session("session-1", "alice")->session.document_name,
            "Lease Agreement.pdf");

  auto newer = make_snapshot(300);
  newer.document_name = "renamed.pdf";
  EXPECT_EQ(engine.cache_session(newer, "alice"),
            cosign::sync::cache_outcome_t::stored);
  auto cached = engine.load_session("session-1", "alice");
  EXPECT_EQ(cached->session.document_name, "renamed.pdf");
  EXPECT_EQ(cached->sync_state, sync_state_t::synced);
}

TEST(sync_engine, terminal_status_is_never_reverted) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_terminal"};
  auto& engine = fixture.engine();

  engine.cache_session(make_snapshot(1000), "alice");
  EXPECT_EQ(engine.cache_session(
                make_snapshot(10, session_status_t::declined), "alice"),
            cosign::sync::cache_outcome_t::stored);
  EXPECT_EQ(engine.cache_session(make_snapshot(5000), "alice"),
            cosign::sync::cache_outcome_t::kept_existing);
  EXPECT_EQ(engine.load_session("session-1", "alice")->session.status,
            session_status_t::declined);
}

TEST(sync_engine, queued_local_progress_survives_a_newer_snapshot) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_merge"};
  auto& engine = fixture.engine();
  engine.cache_session(make_snapshot(100), "alice");

  auto local = make_snapshot(100);
  local.recipients[0].consent_at = 150;
  local.fields[0].completed = true;
  local.fields[0].value = cosign::testing::make_typed_signature();
  local.fields[0].completed_at = 160;
  engine.store_session(local, "alice");
  engine.queue_for_sync(make_record("alice", false));

  auto remote = make_snapshot(200);
  remote.recipients[1].consent_at = 180;
  ASSERT_EQ(engine.cache_session(remote, "alice"),
            cosign::sync::cache_outcome_t::stored);

  auto cached = engine.load_session("session-1", "alice");
  EXPECT_EQ(cached->sync_state, sync_state_t::queued);
  EXPECT_EQ(cached->session.updated_at, 200u);
  EXPECT_EQ(cached->session.recipients[0].consent_at, 150u);
  EXPECT_EQ(cached->session.recipients[1].consent_at, 180u);
  EXPECT_TRUE(cached->session.fields[0].completed);
  EXPECT_FALSE(cached->session.fields[1].completed);
}

TEST(sync_engine, fetch_prefers_the_local_copy) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_fetch_local"};
  auto& engine = fixture.engine();
  auto credentials = cosign::schema::session_credentials_t{
      .session_id = "session-1", .recipient_id = "alice",
      .signing_key = "key-123"};

  fixture.remote().set_offline(true);
  auto offline = engine.fetch_session(credentials);
  EXPECT_EQ(offline.code, static_cast<uint32_t>(
                              cosign::schema::session_error_code::network_error));
  EXPECT_FALSE(offline.cached.has_value());

  fixture.remote().set_offline(false);
  fixture.remote().serve(make_snapshot(100));
  auto fetched = engine.fetch_session(credentials);
  ASSERT_EQ(fetched.code, 0u);
  EXPECT_EQ(fetched.cached->recipient_id, "alice");

  fixture.remote().set_offline(true);
  auto again = engine.fetch_session(credentials);
  EXPECT_EQ(again.code, 0u);
  EXPECT_EQ(fixture.remote().count("fetch"), 2u);
}

TEST(sync_engine, fetch_marks_remotely_expired_sessions) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_fetch_expired"};
  auto& engine = fixture.engine();
  fixture.remote().serve(make_snapshot(100));
  fixture.remote().set_fetch_status(remote_status_t::expired);

  auto fetched = engine.fetch_session(cosign::schema::session_credentials_t{
      .session_id = "session-1", .recipient_id = "alice",
      .signing_key = "key-123"});
  EXPECT_EQ(fetched.code, static_cast<uint32_t>(
                              cosign::schema::session_error_code::expired));
  ASSERT_TRUE(fetched.cached.has_value());
  EXPECT_EQ(fetched.cached->session.status, session_status_t::expired);
}

TEST(sync_engine, link_request_fails_while_offline) {
  auto fixture = cosign::testing::session_fixture{"cosign_sync_link"};
  auto& engine = fixture.engine();
  EXPECT_EQ(engine.request_new_link("session-1", "alice").status,
            remote_status_t::ok);

  engine.set_online(false);
  auto offline = engine.request_new_link("session-1", "alice");
  EXPECT_EQ(offline.status, remote_status_t::network_error);
  EXPECT_EQ(fixture.remote().count("request_link"), 1u);
}
