#pragma once

#include <sovereign/schema/policy_config.hpp>
#include <sovereign/schema/result.hpp>
#include <sovereign/schema/ring.hpp>

#include <boost/program_options.hpp>

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace sovereign::config {

/// Validated `sovereignd` configuration.
struct options final {
  std::string grpc_address{"0.0.0.0:50051"};
  std::string verifier_url{"http://localhost:8881"};
  std::chrono::milliseconds verifier_timeout{30000};
  std::chrono::milliseconds session_ttl{std::chrono::seconds{30}};
  // Empty keeps sessions in memory only.
  std::string session_db;
  sovereign::schema::policy_config_t policy;
  std::set<sovereign::schema::ring_t> required_rings{
      sovereign::schema::ring_t::host};
  std::chrono::milliseconds credential_ttl{std::chrono::seconds{3600}};
  std::string trust_domain{"example.org"};
  std::vector<std::string> feature_flags;
  std::string log_file{"sovereignd.log"};
  bool verbose{false};
  bool help{false};
};

boost::program_options::options_description make_description();

/// Command line first, then the optional `--config` file for anything the
/// command line left unset.
sovereign::schema::result<options> parse(int argc, const char* const argv[]);

/// Build and validate options from parsed variables.
sovereign::schema::result<options> from_variables(
    const boost::program_options::variables_map& variables);

}  // namespace sovereign::config
