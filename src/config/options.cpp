#include <sovereign/config/feature_flags.hpp>
#include <sovereign/config/options.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>

namespace po = boost::program_options;

namespace sovereign::config {

namespace {

using sovereign::schema::error_code;

sovereign::schema::result<options> invalid(std::string log) {
  return sovereign::schema::make_error<options>(
      error_code::invalid_configuration, std::move(log),
      std::string{kCodespace});
}

}  // namespace

po::options_description make_description() {
  auto description = po::options_description{"Sovereign"};
  // clang-format off
  description.add_options()
      ("help,h", "Show the help message")
      ("config,c", po::value<std::string>(), "INI style configuration file")
      ("grpc-address,g", po::value<std::string>()->default_value("0.0.0.0:50051"),
       "IP:Port for the attestation service")
      ("verifier-url", po::value<std::string>()->default_value("http://localhost:8881"),
       "Base URL of the remote verifier")
      ("verifier-timeout-ms", po::value<int64_t>()->default_value(30000),
       "Verifier call timeout")
      ("session-ttl-seconds", po::value<int64_t>()->default_value(30),
       "Challenge lifetime")
      ("session-db", po::value<std::string>()->default_value(""),
       "RocksDB path for the session journal")
      ("allowed-geolocation", po::value<std::vector<std::string>>()->composing(),
       "Allowed geolocation, exact or '<Prefix>: *' (repeatable)")
      ("require-healthy-gpu", po::value<bool>()->default_value(true),
       "Deny when GPU metrics are missing or unhealthy")
      ("required-integrity", po::value<std::string>()->default_value("PASSED_ALL_CHECKS"),
       "Required host integrity status")
      ("gpu-min-utilization", po::value<double>(), "Minimum GPU utilization percent")
      ("gpu-max-utilization", po::value<double>(), "Maximum GPU utilization percent")
      ("gpu-min-memory-mb", po::value<int64_t>(), "Minimum GPU memory in MB")
      ("required-rings", po::value<std::vector<std::string>>()->composing(),
       "Rings every bundle must carry (repeatable, default host)")
      ("credential-ttl-seconds", po::value<int64_t>()->default_value(3600),
       "Issued credential lifetime")
      ("trust-domain", po::value<std::string>()->default_value("example.org"),
       "SPIFFE trust domain")
      ("feature-flag", po::value<std::vector<std::string>>()->composing(),
       "Feature flag to enable, or -Name to disable (repeatable)")
      ("log-file", po::value<std::string>()->default_value("sovereignd.log"),
       "Log file path")
      ("verbose,v", "Enable verbose output");
  // clang-format on
  return description;
}

sovereign::schema::result<options> parse(const int argc,
                                         const char* const argv[]) {
  auto description = make_description();
  auto variables = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), variables);
    if (variables.contains("config")) {
      auto path = variables["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        return invalid(fmt::format("cannot open configuration file {}", path));
      }
      po::store(po::parse_config_file(file, description), variables);
      spdlog::info("Loaded configuration from {}", path);
    }
    po::notify(variables);
  } catch (const po::error& e) {
    return invalid(e.what());
  }
  return from_variables(variables);
}

sovereign::schema::result<options> from_variables(
    const po::variables_map& variables) {
  auto out = options{};
  out.help = variables.contains("help");
  out.verbose = variables.contains("verbose");

  auto string_or = [&](const char* key, const std::string& fallback) {
    return variables.contains(key) ? variables[key].as<std::string>()
                                   : fallback;
  };
  auto int_or = [&](const char* key, const int64_t fallback) {
    return variables.contains(key) ? variables[key].as<int64_t>() : fallback;
  };

  out.grpc_address = string_or("grpc-address", out.grpc_address);
  out.verifier_url = string_or("verifier-url", out.verifier_url);
  out.session_db = string_or("session-db", out.session_db);
  out.trust_domain = string_or("trust-domain", out.trust_domain);
  out.log_file = string_or("log-file", out.log_file);

  if (out.grpc_address.empty()) {
    return invalid("grpc-address must not be empty");
  }
  if (!out.verifier_url.starts_with("http://") &&
      !out.verifier_url.starts_with("https://")) {
    return invalid(fmt::format("verifier-url {} is not an http(s) URL",
                               out.verifier_url));
  }
  if (out.trust_domain.empty() ||
      out.trust_domain.find('/') != std::string::npos) {
    return invalid(fmt::format("invalid trust-domain '{}'", out.trust_domain));
  }

  auto verifier_timeout = int_or("verifier-timeout-ms", 30000);
  auto session_ttl = int_or("session-ttl-seconds", 30);
  auto credential_ttl = int_or("credential-ttl-seconds", 3600);
  if (verifier_timeout <= 0 || session_ttl <= 0 || credential_ttl <= 0) {
    return invalid("timeouts and lifetimes must be positive");
  }
  out.verifier_timeout = std::chrono::milliseconds{verifier_timeout};
  out.session_ttl = std::chrono::seconds{session_ttl};
  out.credential_ttl = std::chrono::seconds{credential_ttl};

  if (variables.contains("allowed-geolocation")) {
    out.policy.allowed_geolocations.clear();
    for (const auto& entry :
         variables["allowed-geolocation"].as<std::vector<std::string>>()) {
      out.policy.allowed_geolocations.insert(entry);
    }
  }
  if (variables.contains("require-healthy-gpu")) {
    out.policy.require_healthy_gpu =
        variables["require-healthy-gpu"].as<bool>();
  }
  if (variables.contains("required-integrity")) {
    auto value = variables["required-integrity"].as<std::string>();
    auto parsed =
        sovereign::schema::try_from_string<sovereign::schema::integrity_status_t>(
            value);
    if (!parsed) {
      return invalid(fmt::format("unknown integrity status '{}'", value));
    }
    out.policy.required_integrity_status = *parsed;
  }
  if (variables.contains("gpu-min-utilization")) {
    out.policy.min_gpu_utilization_pct =
        variables["gpu-min-utilization"].as<double>();
  }
  if (variables.contains("gpu-max-utilization")) {
    out.policy.max_gpu_utilization_pct =
        variables["gpu-max-utilization"].as<double>();
  }
  if (out.policy.min_gpu_utilization_pct && out.policy.max_gpu_utilization_pct &&
      *out.policy.min_gpu_utilization_pct > *out.policy.max_gpu_utilization_pct) {
    return invalid("gpu-min-utilization exceeds gpu-max-utilization");
  }
  if (variables.contains("gpu-min-memory-mb")) {
    out.policy.min_gpu_memory_mb = variables["gpu-min-memory-mb"].as<int64_t>();
  }

  if (variables.contains("required-rings")) {
    out.required_rings.clear();
    for (const auto& name :
         variables["required-rings"].as<std::vector<std::string>>()) {
      auto ring = sovereign::schema::try_from_string<sovereign::schema::ring_t>(name);
      if (!ring) {
        return invalid(fmt::format("unknown ring '{}'", name));
      }
      out.required_rings.insert(*ring);
    }
  }

  if (variables.contains("feature-flag")) {
    out.feature_flags =
        variables["feature-flag"].as<std::vector<std::string>>();
  }

  return sovereign::schema::make_result(std::move(out));
}

}  // namespace sovereign::config
