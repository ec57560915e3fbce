#include <gtest/gtest.h>
#include <sovereign/policy/engine.hpp>

namespace {

sovereign::schema::attested_claims_t make_claims(
    const std::string& geolocation = "Spain: N40.4168, W3.7038") {
  auto claims = sovereign::schema::attested_claims_t{};
  claims.geolocation = geolocation;
  claims.host_integrity_status =
      sovereign::schema::integrity_status_t::passed_all_checks;
  claims.gpu_metrics_health = sovereign::schema::gpu_metrics_t{
      .status = "healthy", .utilization_pct = 15.0, .memory_mb = 10240};
  claims.audit_id = "audit-1";
  return claims;
}

}  // namespace

TEST(policy_engine, default_policy_allows_spain) {
  auto result = sovereign::policy::evaluate(make_claims(),
                                            sovereign::schema::policy_config_t{});
  EXPECT_TRUE(result.allowed);
  EXPECT_EQ(result.reason, "all policy checks passed");
}

TEST(policy_engine, location_outside_allow_list_is_denied) {
  auto result = sovereign::policy::evaluate(
      make_claims("France: N48.8566, E2.3522"),
      sovereign::schema::policy_config_t{});
  EXPECT_FALSE(result.allowed);
  EXPECT_NE(result.reason.find("not in allowed list"), std::string::npos);
  EXPECT_NE(result.reason.find("France: N48.8566, E2.3522"), std::string::npos);
}

TEST(policy_engine, evaluation_is_deterministic) {
  auto claims = make_claims("France: Paris");
  auto config = sovereign::schema::policy_config_t{};
  auto first = sovereign::policy::evaluate(claims, config);
  for (auto i = 0; i < 10; ++i) {
    auto again = sovereign::policy::evaluate(claims, config);
    EXPECT_EQ(again.allowed, first.allowed);
    EXPECT_EQ(again.reason, first.reason);
  }
}

TEST(policy_engine, geolocation_patterns) {
  EXPECT_TRUE(sovereign::policy::matches_geolocation("Spain: *", "Spain: Madrid"));
  EXPECT_TRUE(sovereign::policy::matches_geolocation(" Spain:* ", "Spain: Madrid"));
  EXPECT_TRUE(sovereign::policy::matches_geolocation("Spain: Madrid", "Spain: Madrid"));
  EXPECT_FALSE(sovereign::policy::matches_geolocation("Spain: Madrid", "Spain: Bilbao"));
  EXPECT_FALSE(sovereign::policy::matches_geolocation("Spain: *", "Spain"));
  EXPECT_FALSE(sovereign::policy::matches_geolocation("Spain: *", "Spainland: X"));
}

TEST(policy_engine, empty_allow_list_accepts_any_location) {
  auto config = sovereign::schema::policy_config_t{};
  config.allowed_geolocations.clear();
  EXPECT_TRUE(sovereign::policy::evaluate(make_claims("Chile: Santiago"), config)
                  .allowed);
}

TEST(policy_engine, integrity_must_match) {
  auto claims = make_claims();
  claims.host_integrity_status = sovereign::schema::integrity_status_t::failed;
  auto result = sovereign::policy::evaluate(claims,
                                            sovereign::schema::policy_config_t{});
  EXPECT_FALSE(result.allowed);
  EXPECT_EQ(result.reason,
            "host integrity status is FAILED, required PASSED_ALL_CHECKS");
}

TEST(policy_engine, missing_gpu_metrics_depend_on_requirement) {
  auto claims = make_claims();
  claims.gpu_metrics_health.reset();

  auto config = sovereign::schema::policy_config_t{};
  auto required = sovereign::policy::evaluate(claims, config);
  EXPECT_FALSE(required.allowed);
  EXPECT_EQ(required.reason, "GPU metrics missing, required healthy");

  config.require_healthy_gpu = false;
  EXPECT_TRUE(sovereign::policy::evaluate(claims, config).allowed);
}

TEST(policy_engine, unhealthy_gpu_is_denied) {
  auto claims = make_claims();
  claims.gpu_metrics_health->status = "degraded";
  auto result = sovereign::policy::evaluate(claims,
                                            sovereign::schema::policy_config_t{});
  EXPECT_FALSE(result.allowed);
  EXPECT_EQ(result.reason, "GPU status is degraded, required healthy");
}

TEST(policy_engine, gpu_bounds_apply_when_configured) {
  auto config = sovereign::schema::policy_config_t{};
  config.max_gpu_utilization_pct = 10.0;
  auto over = sovereign::policy::evaluate(make_claims(), config);
  EXPECT_FALSE(over.allowed);
  EXPECT_NE(over.reason.find("above maximum"), std::string::npos);

  config.max_gpu_utilization_pct.reset();
  config.min_gpu_memory_mb = 16384;
  auto small = sovereign::policy::evaluate(make_claims(), config);
  EXPECT_FALSE(small.allowed);
  EXPECT_NE(small.reason.find("below minimum"), std::string::npos);
}

TEST(policy_engine, first_failure_decides) {
  auto claims = make_claims("France: Paris");
  claims.host_integrity_status = sovereign::schema::integrity_status_t::failed;
  claims.gpu_metrics_health.reset();
  auto result = sovereign::policy::evaluate(claims,
                                            sovereign::schema::policy_config_t{});
  EXPECT_FALSE(result.allowed);
  EXPECT_NE(result.reason.find("not in allowed list"), std::string::npos);
}

TEST(policy_engine, extra_rules_can_veto) {
  auto rules = std::vector<sovereign::policy::rule_t>{
      [](const sovereign::schema::attested_claims_t& claims)
          -> std::optional<std::string> {
        if (claims.audit_id.empty()) {
          return "audit id required";
        }
        return std::nullopt;
      }};
  auto claims = make_claims();
  EXPECT_TRUE(sovereign::policy::evaluate(claims,
                                          sovereign::schema::policy_config_t{},
                                          rules)
                  .allowed);
  claims.audit_id.clear();
  auto vetoed = sovereign::policy::evaluate(
      claims, sovereign::schema::policy_config_t{}, rules);
  EXPECT_FALSE(vetoed.allowed);
  EXPECT_EQ(vetoed.reason, "audit id required");
}
