#pragma once

#include <sovereign/http/transport.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace sovereign::http {

struct curl_options final {
  std::chrono::milliseconds timeout{30000};
  // Route requests over a Unix domain socket instead of TCP.
  std::optional<std::string> unix_socket_path;
  std::optional<std::string> ca_file;
  std::optional<std::string> client_certificate_file;
  std::optional<std::string> client_key_file;
  bool verify_peer{true};
};

/// libcurl easy-handle transport. Every call creates its own handle, so one
/// instance may be shared across threads.
class curl_transport final : public transport {
 public:
  explicit curl_transport(curl_options options = {});

  sovereign::schema::result<response> send(
      const sovereign::common::call_context& context,
      const request& request) override;

  const curl_options& options() const { return options_; }

 private:
  curl_options options_;
};

/// Split `unix:///path/to.sock` into its socket path; std::nullopt when the
/// address is not a unix URL.
std::optional<std::string> unix_socket_path(const std::string_view& address);

}  // namespace sovereign::http
