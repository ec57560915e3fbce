#include <sovereign/policy/engine.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace sovereign::policy {

namespace {

using sovereign::schema::attested_claims_t;
using sovereign::schema::policy_config_t;
using sovereign::schema::policy_result_t;

std::string_view trim(std::string_view value) {
  auto is_space = [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!value.empty() && is_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_space(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

policy_result_t deny(std::string reason) {
  return policy_result_t{.allowed = false, .reason = std::move(reason)};
}

std::optional<policy_result_t> check_geolocation(const attested_claims_t& claims,
                                                 const policy_config_t& config) {
  if (config.allowed_geolocations.empty()) {
    return std::nullopt;
  }
  auto allowed = std::ranges::any_of(
      config.allowed_geolocations, [&](const std::string& pattern) {
        return matches_geolocation(pattern, claims.geolocation);
      });
  if (allowed) {
    return std::nullopt;
  }
  return deny(
      fmt::format("geolocation {} not in allowed list", claims.geolocation));
}

std::optional<policy_result_t> check_integrity(const attested_claims_t& claims,
                                               const policy_config_t& config) {
  if (claims.host_integrity_status == config.required_integrity_status) {
    return std::nullopt;
  }
  return deny(fmt::format(
      "host integrity status is {}, required {}",
      sovereign::schema::to_string(claims.host_integrity_status),
      sovereign::schema::to_string(config.required_integrity_status)));
}

std::optional<policy_result_t> check_gpu(const attested_claims_t& claims,
                                         const policy_config_t& config) {
  const auto& gpu = claims.gpu_metrics_health;
  if (config.require_healthy_gpu) {
    if (!gpu) {
      return deny("GPU metrics missing, required healthy");
    }
    if (gpu->status != sovereign::schema::kGpuStatusHealthy) {
      return deny(fmt::format("GPU status is {}, required healthy",
                              gpu->status.empty() ? "empty" : gpu->status));
    }
  }
  if (!gpu) {
    return std::nullopt;
  }
  if (config.min_gpu_utilization_pct &&
      gpu->utilization_pct < *config.min_gpu_utilization_pct) {
    return deny(fmt::format("GPU utilization {} below minimum {}",
                            gpu->utilization_pct,
                            *config.min_gpu_utilization_pct));
  }
  if (config.max_gpu_utilization_pct &&
      gpu->utilization_pct > *config.max_gpu_utilization_pct) {
    return deny(fmt::format("GPU utilization {} above maximum {}",
                            gpu->utilization_pct,
                            *config.max_gpu_utilization_pct));
  }
  if (config.min_gpu_memory_mb && gpu->memory_mb < *config.min_gpu_memory_mb) {
    return deny(fmt::format("GPU memory {}MB below minimum {}MB",
                            gpu->memory_mb, *config.min_gpu_memory_mb));
  }
  return std::nullopt;
}

}  // namespace

bool matches_geolocation(std::string_view pattern, const std::string_view value) {
  pattern = trim(pattern);
  if (pattern.empty()) {
    return false;
  }
  if (pattern == value) {
    return true;
  }
  for (const auto suffix : {std::string_view{": *"}, std::string_view{":*"}}) {
    if (pattern.ends_with(suffix)) {
      auto prefix = pattern.substr(0, pattern.size() - suffix.size() + 1);
      return value.starts_with(prefix);
    }
  }
  return false;
}

policy_result_t evaluate(const attested_claims_t& claims,
                         const policy_config_t& config,
                         const std::vector<rule_t>& extra_rules) {
  for (const auto& check : {check_geolocation, check_integrity, check_gpu}) {
    if (auto denied = check(claims, config)) {
      return *denied;
    }
  }
  for (const auto& rule : extra_rules) {
    if (!rule) {
      continue;
    }
    if (auto veto = rule(claims)) {
      return deny(std::move(*veto));
    }
  }
  return policy_result_t{.allowed = true, .reason = std::string{kAllowedReason}};
}

}  // namespace sovereign::policy
