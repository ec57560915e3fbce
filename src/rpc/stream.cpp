#include <sovereign/rpc/convert.hpp>
#include <sovereign/rpc/stream.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace sovereign::rpc {

namespace {

using sovereign::schema::error_code;

sovereign::schema::status stream_closed(const std::string_view what) {
  return sovereign::schema::make_status(
      error_code::transport_failure,
      fmt::format("attestation stream closed while {}", what),
      std::string{kCodespace});
}

sovereign::schema::status from_denial(const sovereign::v1::Denial& denial) {
  return sovereign::schema::make_status(
      static_cast<error_code>(denial.code()), denial.log(), denial.codespace());
}

}  // namespace

client_stream::client_stream(sovereign::v1::Attestation::StubInterface& stub,
                             const std::chrono::milliseconds timeout) {
  context_.set_deadline(std::chrono::system_clock::now() + timeout);
  stream_ = stub.AttestAgent(&context_);
}

sovereign::schema::status client_stream::send(
    const sovereign::schema::bytes_view_t& payload) {
  auto request = sovereign::v1::AttestAgentRequest{};
  request.set_payload(sovereign::schema::make_string(payload));
  if (!stream_->Write(request)) {
    return close("sending");
  }
  return {};
}

sovereign::schema::result<sovereign::schema::session_t>
client_stream::receive_challenge() {
  auto response = sovereign::v1::AttestAgentResponse{};
  if (!stream_->Read(&response)) {
    return sovereign::schema::make_error<sovereign::schema::session_t>(
        close("awaiting a challenge"));
  }
  if (response.has_denial()) {
    static_cast<void>(finish());
    return sovereign::schema::make_error<sovereign::schema::session_t>(
        from_denial(response.denial()));
  }
  if (!response.has_challenge()) {
    return sovereign::schema::make_error<sovereign::schema::session_t>(
        error_code::malformed_response, "expected a challenge frame",
        std::string{kCodespace});
  }
  return from_proto(response.challenge());
}

sovereign::schema::result<sovereign::schema::credential_t>
client_stream::submit(const sovereign::schema::evidence_bundle_t& bundle) {
  auto request = sovereign::v1::AttestAgentRequest{};
  to_proto(bundle, request.mutable_bundle());
  if (!stream_->Write(request)) {
    return sovereign::schema::make_error<sovereign::schema::credential_t>(
        close("sending the bundle"));
  }
  static_cast<void>(stream_->WritesDone());

  auto response = sovereign::v1::AttestAgentResponse{};
  if (!stream_->Read(&response)) {
    return sovereign::schema::make_error<sovereign::schema::credential_t>(
        close("awaiting a credential"));
  }
  auto closed = finish();
  if (response.has_denial()) {
    return sovereign::schema::make_error<sovereign::schema::credential_t>(
        from_denial(response.denial()));
  }
  if (!response.has_credential()) {
    return sovereign::schema::make_error<sovereign::schema::credential_t>(
        error_code::malformed_response, "expected a credential frame",
        std::string{kCodespace});
  }
  if (!closed.ok()) {
    spdlog::warn("Stream finished with error after credential: {}", closed.log);
  }
  return sovereign::schema::make_result(from_proto(response.credential()));
}

sovereign::schema::status client_stream::close(const std::string_view what) {
  auto status = finish();
  return status.ok() ? stream_closed(what) : status;
}

sovereign::schema::status client_stream::finish() {
  auto status = stream_->Finish();
  if (status.ok()) {
    return {};
  }
  auto code = status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED
                  ? error_code::timeout
                  : status.error_code() == grpc::StatusCode::CANCELLED
                        ? error_code::cancelled
                        : error_code::transport_failure;
  return sovereign::schema::make_status(code, status.error_message(),
                                        std::string{kCodespace});
}

}  // namespace sovereign::rpc
