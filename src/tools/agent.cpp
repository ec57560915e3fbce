#include <boost/program_options.hpp>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <sovereign/attestation/bundler.hpp>
#include <sovereign/attestation/collector.hpp>
#include <sovereign/config/feature_flags.hpp>
#include <sovereign/http/curl_transport.hpp>
#include <sovereign/nodeattestor/registry.hpp>
#include <sovereign/rpc/stream.hpp>
#include <sovereign/signing/delegated_signer.hpp>
#include <sovereign/signing/plugin_gateway.hpp>
#include <sovereign/signing/software_gateway.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

std::optional<std::string> read_file(const std::string& path) {
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    return std::nullopt;
  }
  auto buffer = std::ostringstream{};
  buffer << file.rdbuf();
  return buffer.str();
}

std::map<std::string, std::string> parse_metadata(
    const std::vector<std::string>& entries) {
  auto out = std::map<std::string, std::string>{};
  for (const auto& entry : entries) {
    auto split = entry.find('=');
    if (split == std::string::npos) {
      spdlog::warn("Ignoring metadata '{}' without '='", entry);
      continue;
    }
    out.insert_or_assign(entry.substr(0, split), entry.substr(split + 1));
  }
  return out;
}

void print_credential(const sovereign::schema::credential_t& credential) {
  std::cout << "subject_id: " << credential.subject_id << "\n"
            << "parent_id: " << credential.parent_id << "\n"
            << "expires_at: " << credential.expires_at << "\n";
  for (const auto& selector : credential.selectors) {
    std::cout << "selector: " << selector << "\n";
  }
  std::cout << "claims: " << credential.claims_json << std::endl;
}

}  // namespace

int main(int argc, const char** argv) {
  auto options = po::options_description{"sovereign-agent options"};
  // clang-format off
  options.add_options()
      ("help,h", "show help")
      ("server,s", po::value<std::string>()->default_value("localhost:50051"),
       "sovereignd address")
      ("attestor", po::value<std::string>()->default_value("unified_identity"),
       "node attestor strategy")
      ("feature-flag", po::value<std::vector<std::string>>()->multitoken(),
       "feature flags")
      ("private-key", po::value<std::string>(),
       "PEM private key for in-process signing")
      ("plugin-endpoint", po::value<std::string>(),
       "TPM plugin address, e.g. unix:///tmp/spire-data/tpm-plugin/tpm-plugin.sock")
      ("app-key-public", po::value<std::string>(),
       "PEM public key or certificate of the App Key (required with --plugin-endpoint)")
      ("app-key-certificate", po::value<std::string>(),
       "DER App Key certificate forwarded to the verifier")
      ("agent-uuid", po::value<std::string>(), "agent UUID")
      ("workload-code-hash", po::value<std::string>(),
       "hex sha256 of the workload code")
      ("ring", po::value<std::vector<std::string>>()->multitoken(),
       "rings to attest (default host)")
      ("image-id", po::value<std::string>()->default_value(""),
       "image or sandbox identity")
      ("integrity-log-summary", po::value<std::string>()->default_value(""),
       "integrity log summary")
      ("metadata", po::value<std::vector<std::string>>()->multitoken(),
       "key=value metadata")
      ("signature-hash", po::value<std::string>()->default_value("sha256"),
       "sha256|sha384|sha512")
      ("pss-salt-length", po::value<int32_t>(),
       "sign with PSS using this salt length (-1 for digest length)")
      ("timeout-ms", po::value<int64_t>()->default_value(30000),
       "overall attestation timeout")
      ("verbose,v", "verbose output");
  // clang-format on

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  if (vm.contains("help")) {
    std::cout << options << std::endl;
    return 0;
  }
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto timeout = std::chrono::milliseconds{vm["timeout-ms"].as<int64_t>()};
  auto context = sovereign::common::call_context::with_timeout(timeout);

  auto flags = sovereign::config::feature_flags{};
  auto flag_entries = vm.contains("feature-flag")
                          ? vm["feature-flag"].as<std::vector<std::string>>()
                          : std::vector<std::string>{};
  if (auto loaded = flags.load(flag_entries); !loaded.ok()) {
    spdlog::error("{}", loaded.log);
    return 1;
  }

  auto error = std::string{};
  auto transport = std::unique_ptr<sovereign::http::curl_transport>{};
  auto gateway = std::unique_ptr<sovereign::signing::signing_gateway>{};
  auto app_key_public = std::string{};
  if (vm.contains("plugin-endpoint")) {
    auto endpoint = vm["plugin-endpoint"].as<std::string>();
    auto curl_options = sovereign::http::curl_options{.timeout = timeout};
    curl_options.unix_socket_path = sovereign::http::unix_socket_path(endpoint);
    transport = std::make_unique<sovereign::http::curl_transport>(curl_options);
    gateway = std::make_unique<sovereign::signing::plugin_gateway>(
        *transport, curl_options.unix_socket_path ? "http://localhost" : endpoint);
    if (!vm.contains("app-key-public")) {
      spdlog::error("--plugin-endpoint requires --app-key-public");
      return 1;
    }
  } else {
    auto software = std::unique_ptr<sovereign::signing::software_gateway>{};
    if (vm.contains("private-key")) {
      auto pem = read_file(vm["private-key"].as<std::string>());
      if (!pem) {
        spdlog::error("Cannot read {}", vm["private-key"].as<std::string>());
        return 1;
      }
      software = sovereign::signing::software_gateway::from_pem(*pem, error);
    } else {
      spdlog::warn("No key configured, signing with an ephemeral RSA key");
      software = sovereign::signing::software_gateway::generate_rsa(2048, error);
    }
    if (!software) {
      spdlog::error("Signing key unavailable: {}", error);
      return 1;
    }
    app_key_public = software->public_key_pem();
    gateway = std::move(software);
  }
  if (vm.contains("app-key-public")) {
    auto pem = read_file(vm["app-key-public"].as<std::string>());
    if (!pem) {
      spdlog::error("Cannot read {}", vm["app-key-public"].as<std::string>());
      return 1;
    }
    app_key_public = *pem;
  }

  auto signer =
      sovereign::signing::delegated_signer::create(*gateway, app_key_public, error);
  if (!signer) {
    spdlog::error("Invalid App Key: {}", error);
    return 1;
  }
  auto signer_options = sovereign::signing::signer_options{
      .hash = vm["signature-hash"].as<std::string>()};
  if (vm.contains("pss-salt-length")) {
    signer_options.pss_salt_length = vm["pss-salt-length"].as<int32_t>();
  }

  auto identity =
      sovereign::attestation::bundle_identity{.signing = signer_options};
  if (vm.contains("agent-uuid")) {
    identity.agent_uuid = vm["agent-uuid"].as<std::string>();
  }
  if (vm.contains("workload-code-hash")) {
    identity.workload_code_hash = sovereign::schema::try_make_hash32(
        vm["workload-code-hash"].as<std::string>());
    if (!identity.workload_code_hash) {
      spdlog::error("--workload-code-hash must be 32 hex-encoded bytes");
      return 1;
    }
  }
  if (vm.contains("app-key-certificate")) {
    auto der = read_file(vm["app-key-certificate"].as<std::string>());
    if (!der) {
      spdlog::error("Cannot read {}",
                    vm["app-key-certificate"].as<std::string>());
      return 1;
    }
    identity.app_key_certificate = sovereign::schema::make_bytes(*der);
  }

  auto rings = std::set<sovereign::schema::ring_t>{};
  auto ring_names = vm.contains("ring")
                        ? vm["ring"].as<std::vector<std::string>>()
                        : std::vector<std::string>{"host"};
  for (const auto& name : ring_names) {
    auto ring = sovereign::schema::try_from_string<sovereign::schema::ring_t>(name);
    if (!ring) {
      spdlog::error("Unknown ring '{}'", name);
      return 1;
    }
    rings.insert(*ring);
  }

  auto state = sovereign::attestation::measured_state{
      .image_id = vm["image-id"].as<std::string>(),
      .integrity_log_summary = vm["integrity-log-summary"].as<std::string>(),
      .metadata = parse_metadata(
          vm.contains("metadata")
              ? vm["metadata"].as<std::vector<std::string>>()
              : std::vector<std::string>{})};
  auto sources =
      std::vector<std::unique_ptr<sovereign::attestation::evidence_source>>{};
  auto collector = sovereign::attestation::collector{};
  for (const auto ring : rings) {
    sources.push_back(
        std::make_unique<sovereign::attestation::gateway_evidence_source>(
            ring, state, *gateway, signer->public_key_id()));
    collector.add_source(*sources.back());
  }

  auto registry = sovereign::nodeattestor::make_builtin_registry();
  auto attestor = registry.create(vm["attestor"].as<std::string>(), flags);
  if (!attestor) {
    return 1;
  }
  if (auto configured = attestor->configure(""); !configured.ok()) {
    spdlog::error("{}", configured.log);
    return 1;
  }

  auto server = vm["server"].as<std::string>();
  auto channel = grpc::CreateChannel(server, grpc::InsecureChannelCredentials());
  auto stub = sovereign::v1::Attestation::NewStub(channel);
  auto stream = sovereign::rpc::client_stream{*stub, timeout};

  if (auto triggered = attestor->attest(stream); !triggered.ok()) {
    spdlog::error("Node attestation failed: {}", triggered.log);
    return 1;
  }
  auto session = stream.receive_challenge();
  if (!session.ok()) {
    spdlog::error("No challenge from {}: {}", server, session.log);
    return 1;
  }
  spdlog::info("Received challenge {}", session.value->session_id);

  auto evidence = collector.collect_all(context, *session.value);
  if (!evidence.ok()) {
    spdlog::error("Evidence collection failed: {}", evidence.log);
    return 1;
  }
  auto bundler = sovereign::attestation::bundler{*signer, rings};
  auto bundle = bundler.bundle(context, *session.value,
                               std::move(*evidence.value), identity);
  if (!bundle.ok()) {
    spdlog::error("Bundling failed: {}", bundle.log);
    return 1;
  }

  auto credential = stream.submit(*bundle.value);
  if (!credential.ok()) {
    spdlog::error("Attestation denied: {} ({})", credential.log,
                  credential.codespace);
    return 2;
  }
  print_credential(*credential.value);
  return 0;
}
