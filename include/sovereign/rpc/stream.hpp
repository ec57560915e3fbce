#pragma once

#include <sovereign/v1/attestation.grpc.pb.h>

#include <sovereign/nodeattestor/shim.hpp>
#include <sovereign/schema/credential.hpp>
#include <sovereign/schema/evidence_bundle.hpp>
#include <sovereign/schema/result.hpp>
#include <sovereign/schema/session.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <string_view>

namespace sovereign::rpc {

/// Agent side of AttestAgent over a synchronous gRPC stream.
class client_stream final : public sovereign::nodeattestor::attestation_stream {
 public:
  client_stream(sovereign::v1::Attestation::StubInterface& stub,
                std::chrono::milliseconds timeout);

  sovereign::schema::status send(
      const sovereign::schema::bytes_view_t& payload) override;

  /// Read the challenge answering the marker payload.
  sovereign::schema::result<sovereign::schema::session_t> receive_challenge();

  /// Submit the bundle and read the credential. A denial frame is returned
  /// as its error.
  sovereign::schema::result<sovereign::schema::credential_t> submit(
      const sovereign::schema::evidence_bundle_t& bundle);

 private:
  sovereign::schema::status finish();
  sovereign::schema::status close(std::string_view what);

  grpc::ClientContext context_;
  std::unique_ptr<grpc::ClientReaderWriterInterface<
      sovereign::v1::AttestAgentRequest,
      sovereign::v1::AttestAgentResponse>>
      stream_;
};

}  // namespace sovereign::rpc
