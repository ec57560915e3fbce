#pragma once
#include <sovereign/schema/primitives.hpp>

#include <set>
#include <string>

namespace sovereign::schema {

template <uint16_t Version>
struct credential;

template <>
struct credential<1> final {
  uint16_t version{1};
  std::string subject_id;
  std::string parent_id;
  duration_milliseconds_t ttl{};
  timestamp_milliseconds_t issued_at{};
  timestamp_milliseconds_t expires_at{};
  std::set<std::string> selectors;
  // JSON object with the grc.* claim documents.
  std::string claims_json;
};

using credential_t = credential<1>;

}  // namespace sovereign::schema
