#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

#include <sovereign/schema/result.hpp>

namespace sovereign::common {

/// Deadline and cancellation signal carried through blocking calls.
///
/// Copies share the cancellation flag, so cancelling any copy cancels the
/// whole call tree. A default constructed context never expires.
class call_context final {
 public:
  using clock_t = std::chrono::steady_clock;

  call_context();

  static call_context with_timeout(std::chrono::milliseconds timeout);

  /// Derive a context sharing cancellation whose deadline is the earlier of
  /// this context's deadline and `now + timeout`.
  call_context with_budget(std::chrono::milliseconds timeout) const;

  void cancel() const;
  bool cancelled() const;
  bool expired() const;
  bool done() const;

  /// Time left before the deadline; std::nullopt when there is none.
  std::optional<std::chrono::milliseconds> remaining() const;

 private:
  std::optional<clock_t::time_point> deadline_;
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

/// `cancelled` or `timeout` when `context` is done, ok otherwise.
sovereign::schema::status check_context(const call_context& context,
                                        std::string_view codespace);

}  // namespace sovereign::common
