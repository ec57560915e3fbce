#include <sovereign/common/context.hpp>

#include <algorithm>

namespace sovereign::common {

call_context::call_context()
    : deadline_{std::nullopt},
      cancelled_{std::make_shared<std::atomic<bool>>(false)} {}

call_context call_context::with_timeout(
    const std::chrono::milliseconds timeout) {
  auto context = call_context{};
  context.deadline_ = clock_t::now() + timeout;
  return context;
}

call_context call_context::with_budget(
    const std::chrono::milliseconds timeout) const {
  auto context = *this;
  auto candidate = clock_t::now() + timeout;
  if (!context.deadline_ || candidate < *context.deadline_) {
    context.deadline_ = candidate;
  }
  return context;
}

void call_context::cancel() const {
  cancelled_->store(true);
}

bool call_context::cancelled() const {
  return cancelled_->load();
}

bool call_context::expired() const {
  return deadline_.has_value() && clock_t::now() >= *deadline_;
}

bool call_context::done() const {
  return cancelled() || expired();
}

std::optional<std::chrono::milliseconds> call_context::remaining() const {
  if (!deadline_) {
    return std::nullopt;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *deadline_ - clock_t::now());
  return std::max(left, std::chrono::milliseconds{0});
}

sovereign::schema::status check_context(const call_context& context,
                                        const std::string_view codespace) {
  if (context.cancelled()) {
    return sovereign::schema::make_status(
        sovereign::schema::error_code::cancelled, "call cancelled",
        std::string{codespace});
  }
  if (context.expired()) {
    return sovereign::schema::make_status(
        sovereign::schema::error_code::timeout, "deadline exceeded",
        std::string{codespace});
  }
  return {};
}

}  // namespace sovereign::common
