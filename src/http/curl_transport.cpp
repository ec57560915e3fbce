#include <sovereign/http/curl_transport.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <mutex>

namespace sovereign::http {

namespace {

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_slist_ptr =
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents),
                                           size * nmemb);
  return size * nmemb;
}

int progress_callback(void* userp,
                      curl_off_t /*dltotal*/,
                      curl_off_t /*dlnow*/,
                      curl_off_t /*ultotal*/,
                      curl_off_t /*ulnow*/) {
  const auto* context =
      static_cast<const sovereign::common::call_context*>(userp);
  // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
  return context->done() ? 1 : 0;
}

void global_init() {
  static auto once = std::once_flag{};
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

sovereign::schema::result<response> fail(const sovereign::schema::error_code code,
                                         std::string log) {
  return sovereign::schema::make_error<response>(code, std::move(log),
                                                 std::string{kCodespace});
}

}  // namespace

std::optional<std::string> unix_socket_path(const std::string_view& address) {
  static constexpr auto kScheme = std::string_view{"unix://"};
  if (!address.starts_with(kScheme)) {
    return std::nullopt;
  }
  auto path = address.substr(kScheme.size());
  if (path.empty()) {
    return std::nullopt;
  }
  return std::string{path};
}

curl_transport::curl_transport(curl_options options)
    : options_{std::move(options)} {
  global_init();
}

sovereign::schema::result<response> curl_transport::send(
    const sovereign::common::call_context& context,
    const request& request) {
  auto status = sovereign::common::check_context(context, kCodespace);
  if (!status.ok()) {
    return sovereign::schema::make_error<response>(status);
  }

  auto curl = curl_ptr{curl_easy_init(), curl_easy_cleanup};
  if (!curl) {
    return fail(sovereign::schema::error_code::transport_failure,
                "failed to initialize curl");
  }

  auto headers = curl_slist_ptr{nullptr, curl_slist_free_all};
  for (const auto& [name, value] : request.headers) {
    auto line = name + ": " + value;
    auto* appended = curl_slist_append(headers.get(), line.c_str());
    if (appended == nullptr) {
      return fail(sovereign::schema::error_code::transport_failure,
                  "failed to build request headers");
    }
    static_cast<void>(headers.release());
    headers.reset(appended);
  }

  auto timeout = options_.timeout;
  if (auto remaining = context.remaining()) {
    timeout = std::min(timeout, *remaining);
  }
  // CURLOPT_TIMEOUT_MS of 0 means "no timeout".
  timeout = std::max(timeout, std::chrono::milliseconds{1});

  auto body = std::string{};
  auto* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
  if (!request.body.empty() || request.method == "POST") {
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
  }
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(timeout.count()));
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &context);
  if (options_.unix_socket_path) {
    curl_easy_setopt(handle, CURLOPT_UNIX_SOCKET_PATH,
                     options_.unix_socket_path->c_str());
  }
  if (options_.ca_file) {
    curl_easy_setopt(handle, CURLOPT_CAINFO, options_.ca_file->c_str());
  }
  if (options_.client_certificate_file) {
    curl_easy_setopt(handle, CURLOPT_SSLCERT,
                     options_.client_certificate_file->c_str());
  }
  if (options_.client_key_file) {
    curl_easy_setopt(handle, CURLOPT_SSLKEY,
                     options_.client_key_file->c_str());
  }
  curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER,
                   options_.verify_peer ? 1L : 0L);

  auto code = curl_easy_perform(handle);
  if (code == CURLE_ABORTED_BY_CALLBACK) {
    auto aborted = sovereign::common::check_context(context, kCodespace);
    if (aborted.ok()) {
      aborted = sovereign::schema::make_status(
          sovereign::schema::error_code::cancelled, "transfer aborted",
          std::string{kCodespace});
    }
    spdlog::warn("HTTP {} {} aborted: {}", request.method, request.url,
                 aborted.log);
    return sovereign::schema::make_error<response>(aborted);
  }
  if (code == CURLE_OPERATION_TIMEDOUT) {
    spdlog::warn("HTTP {} {} timed out after {}ms", request.method,
                 request.url, timeout.count());
    return fail(sovereign::schema::error_code::timeout,
                std::string{"request timed out: "} + curl_easy_strerror(code));
  }
  if (code != CURLE_OK) {
    spdlog::error("HTTP {} {} failed: {}", request.method, request.url,
                  curl_easy_strerror(code));
    return fail(sovereign::schema::error_code::transport_failure,
                std::string{"curl_easy_perform() failed: "} +
                    curl_easy_strerror(code));
  }

  auto out = response{};
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &out.status);
  out.body = std::move(body);
  return sovereign::schema::make_result(std::move(out));
}

}  // namespace sovereign::http
