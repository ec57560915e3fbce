#include <gtest/gtest.h>
#include <sovereign/nodeattestor/shim.hpp>
#include <sovereign/rpc/convert.hpp>
#include <sovereign/rpc/server.hpp>
#include <sovereign/rpc/stream.hpp>
#include <sovereign/testing/pipeline.hpp>

#include <grpcpp/grpcpp.h>

#include <memory>

namespace {

const auto kSpain = std::string{"Spain: N40.4168, W3.7038"};

/// In-process server around a pipeline's attestor.
struct harness final {
  harness() : listener{pipeline.attestor} {
    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(&listener);
    server = builder.BuildAndStart();
    stub = sovereign::v1::Attestation::NewStub(
        server->InProcessChannel(grpc::ChannelArguments{}));
  }

  ~harness() {
    server->Shutdown();
    server->Wait();
  }

  sovereign::testing::pipeline pipeline;
  sovereign::rpc::listener listener;
  std::unique_ptr<grpc::Server> server;
  std::unique_ptr<sovereign::v1::Attestation::Stub> stub;
};

}  // namespace

TEST(rpc_server, issue_challenge_returns_fresh_nonces) {
  auto harness_ = harness{};
  auto context = grpc::ClientContext{};
  auto response = sovereign::v1::Challenge{};
  auto status = harness_.stub->IssueChallenge(
      &context, sovereign::v1::IssueChallengeRequest{}, &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_FALSE(response.session_id().empty());
  EXPECT_EQ(response.nonce_host().size(), 32u);
  EXPECT_EQ(response.nonce_vm().size(), 32u);
  EXPECT_EQ(response.nonce_workload().size(), 32u);
  EXPECT_EQ(response.expires_at() - response.issued_at(), 30000u);

  auto session = sovereign::rpc::from_proto(response);
  ASSERT_TRUE(session.ok());
  EXPECT_TRUE(harness_.pipeline.sessions.lookup(session.value->session_id));
}

TEST(rpc_server, issue_challenge_fails_when_disabled) {
  auto harness_ = harness{};
  ASSERT_TRUE(harness_.pipeline.flags.reset().ok());
  ASSERT_TRUE(harness_.pipeline.flags.load({"-Unified-Identity"}).ok());

  auto context = grpc::ClientContext{};
  auto response = sovereign::v1::Challenge{};
  auto status = harness_.stub->IssueChallenge(
      &context, sovereign::v1::IssueChallengeRequest{}, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(status.error_message(), "unified identity is disabled");
}

TEST(rpc_server, submit_evidence_returns_credential) {
  auto harness_ = harness{};
  if (!harness_.pipeline.gateway) {
    GTEST_SKIP() << "RSA key generation unavailable";
  }
  harness_.pipeline.transport.respond(
      200, sovereign::testing::make_verifier_body(kSpain));
  auto session = harness_.pipeline.attestor.issue_challenge();
  ASSERT_TRUE(session.ok());
  auto bundle = harness_.pipeline.make_bundle(*session.value);
  ASSERT_TRUE(bundle);

  auto request = sovereign::v1::SubmitEvidenceRequest{};
  sovereign::rpc::to_proto(*bundle, request.mutable_bundle());
  auto context = grpc::ClientContext{};
  auto response = sovereign::v1::SubmitEvidenceResponse{};
  auto status = harness_.stub->SubmitEvidence(&context, request, &response);
  ASSERT_TRUE(status.ok()) << status.error_message();
  ASSERT_TRUE(response.has_credential()) << response.denial().log();
  EXPECT_EQ(response.credential().parent_id(), "spiffe://example.org/spire/server");
  EXPECT_EQ(response.credential().ttl_ms(), 3600000u);
}

TEST(rpc_server, submit_evidence_reports_denial) {
  auto harness_ = harness{};
  auto request = sovereign::v1::SubmitEvidenceRequest{};
  request.mutable_bundle()->set_session_id("deadbeef");
  request.mutable_bundle()->set_challenge_nonce(std::string(32, '\0'));
  auto context = grpc::ClientContext{};
  auto response = sovereign::v1::SubmitEvidenceResponse{};
  auto status = harness_.stub->SubmitEvidence(&context, request, &response);
  ASSERT_TRUE(status.ok());
  ASSERT_TRUE(response.has_denial());
  EXPECT_EQ(response.denial().code(),
            static_cast<uint32_t>(sovereign::schema::error_code::session_missing));
  EXPECT_EQ(response.denial().codespace(), "sovereign.session");
}

TEST(rpc_server, short_nonce_is_denied_before_the_pipeline) {
  auto harness_ = harness{};
  auto request = sovereign::v1::SubmitEvidenceRequest{};
  request.mutable_bundle()->set_session_id("deadbeef");
  request.mutable_bundle()->set_challenge_nonce("short");
  auto context = grpc::ClientContext{};
  auto response = sovereign::v1::SubmitEvidenceResponse{};
  ASSERT_TRUE(harness_.stub->SubmitEvidence(&context, request, &response).ok());
  ASSERT_TRUE(response.has_denial());
  EXPECT_EQ(response.denial().code(),
            static_cast<uint32_t>(sovereign::schema::error_code::incomplete_bundle));
  EXPECT_EQ(response.denial().codespace(), sovereign::rpc::kCodespace);
}

TEST(rpc_server, attest_agent_stream_end_to_end) {
  auto harness_ = harness{};
  if (!harness_.pipeline.gateway) {
    GTEST_SKIP() << "RSA key generation unavailable";
  }
  harness_.pipeline.transport.respond(
      200, sovereign::testing::make_verifier_body(kSpain));

  auto stream =
      sovereign::rpc::client_stream{*harness_.stub, std::chrono::seconds{10}};
  auto shim = sovereign::nodeattestor::shim{harness_.pipeline.flags};
  ASSERT_TRUE(shim.attest(stream).ok());

  auto session = stream.receive_challenge();
  ASSERT_TRUE(session.ok()) << session.log;
  auto bundle = harness_.pipeline.make_bundle(*session.value);
  ASSERT_TRUE(bundle);

  auto credential = stream.submit(*bundle);
  ASSERT_TRUE(credential.ok()) << credential.log;
  EXPECT_TRUE(credential.value->selectors.contains("sovereign:ring:host"));
}

TEST(rpc_server, attest_agent_stream_denial) {
  auto harness_ = harness{};
  if (!harness_.pipeline.gateway) {
    GTEST_SKIP() << "RSA key generation unavailable";
  }
  harness_.pipeline.transport.respond(
      200, sovereign::testing::make_verifier_body("France: N48.8566, E2.3522"));

  auto stream =
      sovereign::rpc::client_stream{*harness_.stub, std::chrono::seconds{10}};
  auto shim = sovereign::nodeattestor::shim{harness_.pipeline.flags};
  ASSERT_TRUE(shim.attest(stream).ok());
  auto session = stream.receive_challenge();
  ASSERT_TRUE(session.ok()) << session.log;
  auto bundle = harness_.pipeline.make_bundle(*session.value);
  ASSERT_TRUE(bundle);

  auto credential = stream.submit(*bundle);
  EXPECT_FALSE(credential.ok());
  EXPECT_EQ(credential.code, sovereign::schema::error_code::policy_denied);
  EXPECT_NE(credential.log.find("not in allowed list"), std::string::npos);
}

TEST(rpc_convert, credential_survives_conversion) {
  auto credential = sovereign::schema::credential_t{};
  credential.subject_id = "spiffe://example.org/agent/sovereign/a";
  credential.parent_id = "spiffe://example.org/spire/server";
  credential.ttl = 1000;
  credential.issued_at = 5;
  credential.expires_at = 1005;
  credential.selectors = {"sovereign:ring:host", "sovereign:integrity:FAILED"};
  credential.claims_json = "{}";

  auto message = sovereign::v1::Credential{};
  sovereign::rpc::to_proto(credential, &message);
  auto back = sovereign::rpc::from_proto(message);
  EXPECT_EQ(back.subject_id, credential.subject_id);
  EXPECT_EQ(back.selectors, credential.selectors);
  EXPECT_EQ(back.expires_at, 1005u);
}

TEST(rpc_convert, wrong_sized_fields_are_rejected) {
  auto message = sovereign::v1::EvidenceBundle{};
  message.set_session_id("s");
  message.set_challenge_nonce(std::string(32, '\x01'));
  auto* entry = message.add_entries();
  entry->set_binding("too short");
  auto bundle = sovereign::rpc::from_proto(message);
  EXPECT_EQ(bundle.code, sovereign::schema::error_code::incomplete_bundle);
  EXPECT_EQ(bundle.log, "binding must be 32 bytes");
}

TEST(rpc_convert, unknown_ring_is_rejected) {
  auto message = sovereign::v1::EvidenceBundle{};
  message.set_session_id("s");
  message.set_challenge_nonce(std::string(32, '\x01'));
  auto* entry = message.add_entries();
  entry->set_ring(static_cast<sovereign::v1::Ring>(7));
  entry->set_binding(std::string(32, '\x02'));
  entry->set_claims_digest(std::string(32, '\x03'));
  auto bundle = sovereign::rpc::from_proto(message);
  EXPECT_EQ(bundle.code, sovereign::schema::error_code::invalid_request);
  EXPECT_EQ(bundle.log, "unknown ring value 7");
}

TEST(rpc_convert, unknown_signature_scheme_is_rejected) {
  auto message = sovereign::v1::EvidenceBundle{};
  message.set_session_id("s");
  message.set_challenge_nonce(std::string(32, '\x01'));
  message.set_signature_scheme(static_cast<sovereign::v1::SignatureScheme>(9));
  auto bundle = sovereign::rpc::from_proto(message);
  EXPECT_EQ(bundle.code, sovereign::schema::error_code::invalid_request);
  EXPECT_EQ(bundle.log, "unknown signature_scheme value 9");
}
