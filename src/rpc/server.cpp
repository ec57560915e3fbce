#include <sovereign/nodeattestor/shim.hpp>
#include <sovereign/rpc/convert.hpp>
#include <sovereign/rpc/server.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

}  // namespace

namespace sovereign::rpc {

sovereign::common::call_context make_call_context(
    const grpc::CallbackServerContext& context) {
  auto deadline = context.deadline();
  if (deadline == std::chrono::system_clock::time_point::max()) {
    return sovereign::common::call_context{};
  }
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::system_clock::now());
  return sovereign::common::call_context::with_timeout(
      std::max(remaining, std::chrono::milliseconds{0}));
}

attest_agent_reactor::attest_agent_reactor(
    sovereign::server::attestor& attestor,
    sovereign::common::call_context context)
    : attestor_{attestor}, context_{std::move(context)} {
  StartRead(&request_);
}

void attest_agent_reactor::OnReadDone(const bool ok) {
  if (!ok) {
    Finish(grpc::Status::OK);
    return;
  }
  switch (stage_) {
    case stage_t::awaiting_marker:
      on_marker();
      break;
    case stage_t::awaiting_bundle:
      on_bundle();
      break;
    case stage_t::closing:
    default:
      Finish(grpc::Status{grpc::StatusCode::FAILED_PRECONDITION,
                          "stream already answered"});
      break;
  }
}

void attest_agent_reactor::on_marker() {
  if (!request_.has_payload() ||
      request_.payload() != sovereign::nodeattestor::kMarkerPayload) {
    Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                        "expected unified_identity marker payload"});
    return;
  }

  auto challenge = attestor_.issue_challenge();
  if (!challenge.ok()) {
    write_denial(challenge.to_status());
    return;
  }
  spdlog::debug("AttestAgent issued challenge {}", challenge.value->session_id);
  stage_ = stage_t::awaiting_bundle;
  response_.Clear();
  to_proto(*challenge.value, response_.mutable_challenge());
  StartWrite(&response_);
}

void attest_agent_reactor::on_bundle() {
  if (!request_.has_bundle()) {
    Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                        "expected evidence bundle"});
    return;
  }
  auto bundle = from_proto(request_.bundle());
  if (!bundle.ok()) {
    write_denial(bundle.to_status());
    return;
  }

  auto credential = attestor_.attest(context_, *bundle.value);
  if (!credential.ok()) {
    write_denial(credential.to_status());
    return;
  }
  stage_ = stage_t::closing;
  response_.Clear();
  to_proto(*credential.value, response_.mutable_credential());
  StartWrite(&response_);
}

void attest_agent_reactor::write_denial(const sovereign::schema::status& failed) {
  stage_ = stage_t::closing;
  response_.Clear();
  to_proto(failed, response_.mutable_denial());
  StartWrite(&response_);
}

void attest_agent_reactor::OnWriteDone(const bool ok) {
  if (!ok) {
    Finish(grpc::Status{grpc::StatusCode::UNAVAILABLE, "write failed"});
    return;
  }
  if (stage_ == stage_t::closing) {
    Finish(grpc::Status::OK);
    return;
  }
  request_.Clear();
  StartRead(&request_);
}

void attest_agent_reactor::OnCancel() {
  context_.cancel();
}

void attest_agent_reactor::OnDone() {
  delete this;
}

listener::listener(sovereign::server::attestor& attestor)
    : attestor_{attestor} {}

grpc::ServerUnaryReactor* listener::IssueChallenge(
    grpc::CallbackServerContext* context,
    const sovereign::v1::IssueChallengeRequest* request,
    sovereign::v1::Challenge* response) {
  static_cast<void>(request);
  auto challenge = attestor_.issue_challenge();
  if (!challenge.ok()) {
    return finish(context, grpc::Status{grpc::StatusCode::FAILED_PRECONDITION,
                                        challenge.log});
  }
  to_proto(*challenge.value, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SubmitEvidence(
    grpc::CallbackServerContext* context,
    const sovereign::v1::SubmitEvidenceRequest* request,
    sovereign::v1::SubmitEvidenceResponse* response) {
  auto bundle = from_proto(request->bundle());
  if (!bundle.ok()) {
    to_proto(bundle.to_status(), response->mutable_denial());
    return finish_ok(context);
  }

  auto credential = attestor_.attest(make_call_context(*context), *bundle.value);
  if (!credential.ok()) {
    to_proto(credential.to_status(), response->mutable_denial());
    return finish_ok(context);
  }
  to_proto(*credential.value, response->mutable_credential());
  return finish_ok(context);
}

grpc::ServerBidiReactor<sovereign::v1::AttestAgentRequest,
                        sovereign::v1::AttestAgentResponse>*
listener::AttestAgent(grpc::CallbackServerContext* context) {
  return new attest_agent_reactor{attestor_, make_call_context(*context)};
}

}  // namespace sovereign::rpc
