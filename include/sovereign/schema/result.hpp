#pragma once

#include <sovereign/schema/error_code.hpp>

#include <optional>
#include <string>
#include <utility>

namespace sovereign::schema {

/// Outcome of an operation that produces no value.
struct status final {
  error_code code{error_code::ok};
  std::string log;
  std::string codespace;

  bool ok() const { return code == error_code::ok; }
};

/// Outcome of an operation producing `T`. `value` is engaged only when
/// `code == error_code::ok`.
template <typename T>
struct result final {
  error_code code{error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == error_code::ok && value.has_value(); }

  schema::status to_status() const {
    return schema::status{.code = code, .log = log, .codespace = codespace};
  }
};

inline status make_status(const error_code code,
                          std::string log,
                          std::string codespace) {
  return status{
      .code = code, .log = std::move(log), .codespace = std::move(codespace)};
}

template <typename T>
result<T> make_result(T value) {
  return result<T>{.code = error_code::ok,
                   .log = {},
                   .codespace = {},
                   .value = std::move(value)};
}

template <typename T>
result<T> make_error(const error_code code,
                     std::string log,
                     std::string codespace) {
  return result<T>{.code = code,
                   .log = std::move(log),
                   .codespace = std::move(codespace),
                   .value = std::nullopt};
}

template <typename T>
result<T> make_error(const status& failed) {
  return make_error<T>(failed.code, failed.log, failed.codespace);
}

}  // namespace sovereign::schema
