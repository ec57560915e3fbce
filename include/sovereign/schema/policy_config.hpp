#pragma once
#include <sovereign/schema/integrity_status.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace sovereign::schema {

template <uint16_t Version>
struct policy_config;

/// Entries of `allowed_geolocations` are exact values or `<Prefix>: *`
/// wildcards. An empty set allows any location.
template <>
struct policy_config<1> final {
  uint16_t version{1};
  std::set<std::string> allowed_geolocations{"Spain: *"};
  bool require_healthy_gpu{true};
  integrity_status_t required_integrity_status{
      integrity_status_t::passed_all_checks};
  std::optional<double> min_gpu_utilization_pct;
  std::optional<double> max_gpu_utilization_pct;
  std::optional<int64_t> min_gpu_memory_mb;
};

using policy_config_t = policy_config<1>;

}  // namespace sovereign::schema
