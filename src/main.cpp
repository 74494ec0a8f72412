#include "cloud/address_classifier.hpp"
#include "cloud/config.hpp"
#include "cloud/csr_validator.hpp"
#include "cloud/identity_sync.hpp"
#include "node/node_json.hpp"
#include "node/node_registry.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // CLI output and errors before the logger is initialized
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace nodeguard;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_DENIED = 2;

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <command> [command options]\n"
      << "\n"
      << "Options:\n"
      << "  --config=<file>      Cloud config (JSON)\n"
      << "  --loglevel=<level>   Log level (trace,debug,info,warn,error,critical,off)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for component(s)\n"
      << "                       Components: address, identity, csr, registry, all\n"
      << "  --logfile=<path>     Log to a rotating file instead of stderr\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << "\n"
      << "Commands:\n"
      << "  classify --platform=<p> [--provided-ip=<ip>] [--prefer-ipv6] <ip/len[@link]>...\n"
      << "      Print the InternalIP / ExternalIP list for the observed addresses\n"
      << "  sync --nodes=<file> --node=<name> [--platform=<p>] [--hostname=<h>] [--spot]\n"
      << "      Apply identity labels to a node in a node file (rewritten in place)\n"
      << "  evaluate --nodes=<file> --dns=<name>[,...] [--ip=<ip>[,...]]\n"
      << "      Check a serving-certificate request against recorded node addresses\n"
      << "      Exit code: 0 approve, 2 deny, 1 error\n"
      << std::endl;
}

// "--key=value" -> value if arg starts with "--key="
bool ReadOption(const std::string &arg, const std::string &key, std::string &value) {
  const std::string prefix = "--" + key + "=";
  if (!util::HasPrefix(arg, prefix)) {
    return false;
  }
  value = arg.substr(prefix.size());
  return true;
}

int RunClassify(const cloud::CloudConfig &config, const std::vector<std::string> &args) {
  cloud::PlatformPolicy policy;
  policy.prefer_ipv6 = config.prefer_ipv6;
  std::vector<cloud::ObservedAddress> observed;

  for (const auto &arg : args) {
    std::string value;
    if (ReadOption(arg, "platform", value)) {
      policy.platform = value;
    } else if (ReadOption(arg, "provided-ip", value)) {
      policy.provided_ip = value;
    } else if (arg == "--prefer-ipv6") {
      policy.prefer_ipv6 = true;
    } else if (util::HasPrefix(arg, "--")) {
      std::cerr << "Unknown classify option: " << arg << std::endl;
      return EXIT_ERROR;
    } else {
      auto parsed = cloud::ParseObservedAddress(arg);
      if (!parsed) {
        std::cerr << "Error: Invalid address: " << arg << std::endl;
        return EXIT_ERROR;
      }
      observed.push_back(*parsed);
    }
  }

  if (policy.platform.empty()) {
    std::cerr << "Error: --platform is required" << std::endl;
    return EXIT_ERROR;
  }

  util::Status status;
  auto addresses = cloud::ClassifyNodeAddresses(policy, observed, status);
  if (!status.IsOk()) {
    std::cerr << "Error: " << status.message() << std::endl;
    return EXIT_ERROR;
  }

  json out = json::array();
  for (const auto &addr : addresses) {
    out.push_back({{"type", node::NodeAddressTypeName(addr.type)}, {"address", addr.address}});
  }
  std::cout << out.dump(2) << std::endl;
  return EXIT_OK;
}

int RunSync(const cloud::CloudConfig &config, const std::vector<std::string> &args) {
  std::string nodes_file;
  std::string node_name;
  cloud::PlatformMetadata metadata;

  for (const auto &arg : args) {
    std::string value;
    if (ReadOption(arg, "nodes", value)) {
      nodes_file = value;
    } else if (ReadOption(arg, "node", value)) {
      node_name = value;
    } else if (ReadOption(arg, "platform", value)) {
      metadata.platform = value;
    } else if (ReadOption(arg, "hostname", value)) {
      metadata.hostname = value;
    } else if (arg == "--spot") {
      metadata.spot = true;
    } else {
      std::cerr << "Unknown sync option: " << arg << std::endl;
      return EXIT_ERROR;
    }
  }

  if (nodes_file.empty() || node_name.empty()) {
    std::cerr << "Error: --nodes and --node are required" << std::endl;
    return EXIT_ERROR;
  }

  std::vector<node::Node> nodes;
  std::string error;
  if (!node::LoadNodesFile(nodes_file, nodes, error)) {
    std::cerr << "Error: " << error << std::endl;
    return EXIT_ERROR;
  }

  node::MemoryNodeRegistry registry(nodes);
  auto ctx = util::Context::WithTimeout(config.request_timeout);
  auto identity = cloud::MakeNodeIdentity(config, metadata);

  auto status = cloud::SyncIdentityWithRetry(ctx, registry, node_name, identity, config.retry);
  if (!status.IsOk()) {
    std::cerr << "Error: " << status.message() << std::endl;
    return EXIT_ERROR;
  }

  if (registry.GetPatchCount() == 0) {
    std::cout << "node " << node_name << " unchanged" << std::endl;
    return EXIT_OK;
  }

  status = registry.List(ctx, nodes);
  if (!status.IsOk()) {
    std::cerr << "Error: " << status.message() << std::endl;
    return EXIT_ERROR;
  }
  if (!node::SaveNodesFile(nodes_file, nodes)) {
    std::cerr << "Error: failed to write " << nodes_file << std::endl;
    return EXIT_ERROR;
  }
  std::cout << "node " << node_name << " updated" << std::endl;
  return EXIT_OK;
}

int RunEvaluate(const cloud::CloudConfig &config, const std::vector<std::string> &args) {
  std::string nodes_file;
  cloud::CertificateRequest request;

  for (const auto &arg : args) {
    std::string value;
    if (ReadOption(arg, "nodes", value)) {
      nodes_file = value;
    } else if (ReadOption(arg, "dns", value)) {
      for (const auto &name : util::SplitList(value)) {
        request.dns_names.push_back(name);
      }
    } else if (ReadOption(arg, "ip", value)) {
      for (const auto &item : util::SplitList(value)) {
        auto ip = util::ParseIPAddress(item);
        if (!ip) {
          std::cerr << "Error: Invalid IP address: " << item << std::endl;
          return EXIT_ERROR;
        }
        request.ip_addresses.push_back(*ip);
      }
    } else {
      std::cerr << "Unknown evaluate option: " << arg << std::endl;
      return EXIT_ERROR;
    }
  }

  if (nodes_file.empty()) {
    std::cerr << "Error: --nodes is required" << std::endl;
    return EXIT_ERROR;
  }

  std::vector<node::Node> nodes;
  std::string error;
  if (!node::LoadNodesFile(nodes_file, nodes, error)) {
    std::cerr << "Error: " << error << std::endl;
    return EXIT_ERROR;
  }

  node::MemoryNodeRegistry registry(nodes);
  auto ctx = util::Context::WithTimeout(config.request_timeout);

  util::Status status;
  bool approve = cloud::EvaluateNodeCSR(ctx, registry, request, status);
  auto decision = cloud::ToTrustDecision(approve, status);

  switch (decision) {
  case cloud::TrustDecision::APPROVE:
    std::cout << "approve" << std::endl;
    return EXIT_OK;
  case cloud::TrustDecision::DENY:
    std::cout << "deny" << std::endl;
    return EXIT_DENIED;
  case cloud::TrustDecision::ERROR:
    break;
  }
  std::cerr << "Error: " << status.message() << std::endl;
  return EXIT_ERROR;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string log_level = "warn";
  std::string log_file;
  std::vector<std::string> debug_components;
  std::string command;
  std::vector<std::string> command_args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (!command.empty()) {
      command_args.push_back(arg);
    } else if (arg == "--help") {
      print_usage(argv[0]);
      return EXIT_OK;
    } else if (arg == "--version") {
      std::cout << GetFullVersionString() << std::endl;
      std::cout << GetCopyrightString() << std::endl;
      return EXIT_OK;
    } else if (arg.find("--config=") == 0) {
      config_path = arg.substr(9);
    } else if (arg.find("--loglevel=") == 0) {
      log_level = arg.substr(11);
    } else if (arg.find("--logfile=") == 0) {
      log_file = arg.substr(10);
    } else if (arg.find("--debug=") == 0) {
      debug_components = util::SplitList(arg.substr(8));
    } else if (arg.find("--") == 0) {
      std::cerr << "Unknown option: " << arg << std::endl;
      print_usage(argv[0]);
      return EXIT_ERROR;
    } else {
      command = arg;
    }
  }

  if (command.empty()) {
    print_usage(argv[0]);
    return EXIT_ERROR;
  }

  util::LogManager::Initialize(log_level, !log_file.empty(), log_file);
  for (const auto &component : debug_components) {
    if (component == "all") {
      util::LogManager::SetLogLevel("trace");
    } else if (!util::LogManager::SetComponentLevel(component, "trace")) {
      std::cerr << "WARNING: unknown log component: " << component << std::endl;
    }
  }

  cloud::CloudConfig config;
  if (!config_path.empty()) {
    std::string error;
    if (!cloud::LoadCloudConfig(config_path, config, error)) {
      std::cerr << "Error: " << error << std::endl;
      util::LogManager::Shutdown();
      return EXIT_ERROR;
    }
  }

  int rc = EXIT_ERROR;
  if (command == "classify") {
    rc = RunClassify(config, command_args);
  } else if (command == "sync") {
    rc = RunSync(config, command_args);
  } else if (command == "evaluate") {
    rc = RunEvaluate(config, command_args);
  } else {
    std::cerr << "Unknown command: " << command << std::endl;
    print_usage(argv[0]);
  }

  util::LogManager::Shutdown();
  return rc;
}
