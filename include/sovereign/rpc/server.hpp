#pragma once

#include <sovereign/v1/attestation.grpc.pb.h>

#include <sovereign/common/context.hpp>
#include <sovereign/server/attestor.hpp>

#include <grpcpp/grpcpp.h>

namespace sovereign::rpc {

/// Call context bounded by the client's gRPC deadline, if any.
sovereign::common::call_context make_call_context(
    const grpc::CallbackServerContext& context);

/// Drives one AttestAgent stream: marker payload, challenge, bundle, then a
/// credential or denial and close.
class attest_agent_reactor final
    : public grpc::ServerBidiReactor<sovereign::v1::AttestAgentRequest,
                                     sovereign::v1::AttestAgentResponse> {
 public:
  attest_agent_reactor(sovereign::server::attestor& attestor,
                       sovereign::common::call_context context);

  void OnReadDone(bool ok) override;
  void OnWriteDone(bool ok) override;
  void OnCancel() override;
  void OnDone() override;

 private:
  enum class stage_t { awaiting_marker, awaiting_bundle, closing };

  void on_marker();
  void on_bundle();
  void write_denial(const sovereign::schema::status& failed);

  sovereign::server::attestor& attestor_;
  sovereign::common::call_context context_;
  stage_t stage_{stage_t::awaiting_marker};
  sovereign::v1::AttestAgentRequest request_;
  sovereign::v1::AttestAgentResponse response_;
};

/// Callback listener for the `sovereign.v1.Attestation` service.
struct listener final : public sovereign::v1::Attestation::CallbackService {
  explicit listener(sovereign::server::attestor& attestor);

  /// Issue a fresh single-use challenge.
  virtual grpc::ServerUnaryReactor* IssueChallenge(
      grpc::CallbackServerContext* context,
      const sovereign::v1::IssueChallengeRequest* request,
      sovereign::v1::Challenge* response) override final;

  /// Run the attestation pipeline over a submitted bundle. Denials are
  /// returned in the response, not as gRPC errors.
  virtual grpc::ServerUnaryReactor* SubmitEvidence(
      grpc::CallbackServerContext* context,
      const sovereign::v1::SubmitEvidenceRequest* request,
      sovereign::v1::SubmitEvidenceResponse* response) override final;

  virtual grpc::ServerBidiReactor<sovereign::v1::AttestAgentRequest,
                                  sovereign::v1::AttestAgentResponse>*
  AttestAgent(grpc::CallbackServerContext* context) override final;

 private:
  sovereign::server::attestor& attestor_;
};

}  // namespace sovereign::rpc
