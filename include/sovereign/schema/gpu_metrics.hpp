#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sovereign::schema {

template <uint16_t Version>
struct gpu_metrics;

template <>
struct gpu_metrics<1> final {
  uint16_t version{1};
  std::string status;
  double utilization_pct{};
  int64_t memory_mb{};
};

using gpu_metrics_t = gpu_metrics<1>;

inline constexpr auto kGpuStatusHealthy = std::string_view{"healthy"};

}  // namespace sovereign::schema
