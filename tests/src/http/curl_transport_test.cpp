#include <gtest/gtest.h>
#include <sovereign/http/curl_transport.hpp>

TEST(curl_transport, unix_socket_path_parses_unix_urls) {
  EXPECT_EQ(sovereign::http::unix_socket_path(
                "unix:///tmp/spire-data/tpm-plugin/tpm-plugin.sock"),
            "/tmp/spire-data/tpm-plugin/tpm-plugin.sock");
  EXPECT_FALSE(sovereign::http::unix_socket_path("http://localhost:8881"));
}

TEST(curl_transport, done_context_fails_without_connecting) {
  auto transport = sovereign::http::curl_transport{
      sovereign::http::curl_options{.timeout = std::chrono::milliseconds{200}}};
  auto context = sovereign::common::call_context{};
  context.cancel();
  auto response = transport.send(
      context, sovereign::http::request{.url = "http://127.0.0.1:9/"});
  EXPECT_FALSE(response.ok());
  EXPECT_EQ(response.code, sovereign::schema::error_code::cancelled);
}

TEST(curl_transport, refused_connection_is_transport_failure) {
  auto transport = sovereign::http::curl_transport{
      sovereign::http::curl_options{.timeout = std::chrono::milliseconds{2000}}};
  auto response = transport.send(
      sovereign::common::call_context{},
      sovereign::http::request{.url = "http://127.0.0.1:9/"});
  EXPECT_FALSE(response.ok());
  EXPECT_TRUE(sovereign::schema::retryable(response.code));
}
