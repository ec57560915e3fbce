#pragma once

#include <sovereign/schema/attested_claims.hpp>
#include <sovereign/schema/policy_config.hpp>
#include <sovereign/schema/policy_result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sovereign::policy {

inline constexpr auto kCodespace = std::string_view{"sovereign.policy"};
inline constexpr auto kAllowedReason =
    std::string_view{"all policy checks passed"};

/// Additional veto over verified claims. A returned string denies with that
/// reason.
using rule_t = std::function<std::optional<std::string>(
    const sovereign::schema::attested_claims_t&)>;

/// Exact match, or `<Prefix>: *` / `<Prefix>:*` matching any value that
/// starts with `<Prefix>:`. Surrounding whitespace in `pattern` is ignored.
bool matches_geolocation(std::string_view pattern, std::string_view value);

/// Decide whether verified claims satisfy `config`.
///
/// Pure and thread-safe. Checks run in a fixed order (geolocation,
/// integrity, GPU health, GPU bounds, extra rules) and the first failure
/// decides the result.
sovereign::schema::policy_result_t evaluate(
    const sovereign::schema::attested_claims_t& claims,
    const sovereign::schema::policy_config_t& config,
    const std::vector<rule_t>& extra_rules = {});

}  // namespace sovereign::policy
