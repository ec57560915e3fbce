#pragma once

#include <sovereign/common/context.hpp>
#include <sovereign/schema/result.hpp>

#include <string>
#include <utility>
#include <vector>

namespace sovereign::http {

inline constexpr auto kCodespace = std::string_view{"sovereign.http"};

struct request final {
  std::string method{"POST"};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

struct response final {
  long status{};
  std::string body;

  bool success() const { return status >= 200 && status < 300; }
};

/// One HTTP exchange. A non-2xx status is still a successful exchange;
/// only failures to complete it are errors (transport_failure, timeout,
/// cancelled).
class transport {
 public:
  virtual ~transport() = default;

  virtual sovereign::schema::result<response> send(
      const sovereign::common::call_context& context,
      const request& request) = 0;
};

}  // namespace sovereign::http
