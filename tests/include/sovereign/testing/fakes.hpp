#pragma once

#include <sovereign/http/transport.hpp>
#include <sovereign/nodeattestor/shim.hpp>
#include <sovereign/signing/gateway.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sovereign::testing {

/// Records every request; signs with `inner` when set, else answers with
/// `signature`.
class recording_gateway final : public sovereign::signing::signing_gateway {
 public:
  explicit recording_gateway(
      sovereign::signing::signing_gateway* inner = nullptr)
      : inner_{inner} {}

  sovereign::schema::result<sovereign::schema::bytes_t> sign(
      const sovereign::common::call_context& context,
      const sovereign::signing::sign_request& request) override {
    {
      auto lock = std::scoped_lock{mutex_};
      requests.push_back(request);
      budgets.push_back(context.remaining());
    }
    if (failure) {
      return sovereign::schema::make_error<sovereign::schema::bytes_t>(*failure);
    }
    if (inner_ != nullptr) {
      return inner_->sign(context, request);
    }
    return sovereign::schema::make_result(signature);
  }

  std::vector<sovereign::signing::sign_request> requests;
  std::vector<std::optional<std::chrono::milliseconds>> budgets;
  sovereign::schema::bytes_t signature{0x01, 0x02, 0x03};
  std::optional<sovereign::schema::status> failure;

 private:
  sovereign::signing::signing_gateway* inner_;
  std::mutex mutex_;
};

/// Replays queued results in order and records requests.
class scripted_transport final : public sovereign::http::transport {
 public:
  void respond(const long status, std::string body) {
    script_.push_back(sovereign::schema::make_result(
        sovereign::http::response{.status = status, .body = std::move(body)}));
  }

  void fail(const sovereign::schema::error_code code, std::string log) {
    script_.push_back(sovereign::schema::make_error<sovereign::http::response>(
        code, std::move(log), std::string{sovereign::http::kCodespace}));
  }

  sovereign::schema::result<sovereign::http::response> send(
      const sovereign::common::call_context& context,
      const sovereign::http::request& request) override {
    auto lock = std::scoped_lock{mutex_};
    requests.push_back(request);
    if (auto done = sovereign::common::check_context(
            context, sovereign::http::kCodespace);
        !done.ok()) {
      return sovereign::schema::make_error<sovereign::http::response>(done);
    }
    if (script_.empty()) {
      return sovereign::schema::make_error<sovereign::http::response>(
          sovereign::schema::error_code::transport_failure,
          "connection refused", std::string{sovereign::http::kCodespace});
    }
    auto next = std::move(script_.front());
    script_.pop_front();
    return next;
  }

  std::vector<sovereign::http::request> requests;

 private:
  std::mutex mutex_;
  std::deque<sovereign::schema::result<sovereign::http::response>> script_;
};

/// Clock advanced by hand.
struct manual_clock final {
  std::shared_ptr<std::atomic<uint64_t>> now =
      std::make_shared<std::atomic<uint64_t>>(1'700'000'000'000ull);

  uint64_t operator()() const { return now->load(); }
  void advance(const uint64_t milliseconds) { *now += milliseconds; }
};

class recording_stream final
    : public sovereign::nodeattestor::attestation_stream {
 public:
  sovereign::schema::status send(
      const sovereign::schema::bytes_view_t& payload) override {
    frames.push_back(sovereign::schema::make_bytes(payload));
    return next;
  }

  std::vector<sovereign::schema::bytes_t> frames;
  sovereign::schema::status next;
};

}  // namespace sovereign::testing
