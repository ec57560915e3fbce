#pragma once

#include <cstdint>
#include <string>

namespace sovereign::schema {

template <uint16_t Version>
struct policy_result;

template <>
struct policy_result<1> final {
  uint16_t version{1};
  bool allowed{};
  std::string reason;
};

using policy_result_t = policy_result<1>;

}  // namespace sovereign::schema
