// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cloud/csr_validator.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

namespace nodeguard {
namespace cloud {

const char *TrustDecisionName(TrustDecision decision) {
  switch (decision) {
  case TrustDecision::APPROVE:
    return "approve";
  case TrustDecision::DENY:
    return "deny";
  case TrustDecision::ERROR:
    return "error";
  }
  return "unknown";
}

TrustDecision ToTrustDecision(bool approve, const util::Status &status) {
  if (!status.IsOk()) {
    return TrustDecision::ERROR;
  }
  return approve ? TrustDecision::APPROVE : TrustDecision::DENY;
}

std::set<boost::asio::ip::address> RecordedNodeIPs(const node::Node &node) {
  std::set<boost::asio::ip::address> ips;
  for (const auto &addr : node.addresses) {
    if (addr.type != node::NodeAddressType::INTERNAL_IP &&
        addr.type != node::NodeAddressType::EXTERNAL_IP) {
      continue;
    }
    auto ip = util::ParseIPAddress(addr.address);
    if (!ip) {
      LOG_CSR_WARN("Node {} has unparsable {} address '{}', ignoring", node.name,
                   node::NodeAddressTypeName(addr.type), addr.address);
      continue;
    }
    ips.insert(*ip);
  }

  // The node IP the kubelet registered with counts as recorded even before
  // status addresses are published
  auto it = node.annotations.find(node::kProvidedIPAnnotation);
  if (it != node.annotations.end() && !it->second.empty()) {
    if (auto ip = util::ParseIPAddress(it->second)) {
      ips.insert(*ip);
    }
  }
  return ips;
}

bool EvaluateNodeCSR(const util::Context &ctx, node::NodeRegistry &registry,
                     const CertificateRequest &request, util::Status &status) {
  if (request.dns_names.empty()) {
    status = util::Status::Validation("certificate request carries no DNS names");
    return false;
  }

  const std::string &node_name = request.dns_names.front();

  node::Node node;
  auto lookup = registry.Get(ctx, node_name, node);
  if (!lookup.IsOk()) {
    status = lookup.Wrap("failed to get node " + node_name);
    LOG_CSR_WARN("EvaluateNodeCSR: {}", status.message());
    return false;
  }
  status = util::Status::Ok();

  if (request.ip_addresses.empty()) {
    LOG_CSR_DEBUG("EvaluateNodeCSR: node {} request has no IP SANs, approving", node_name);
    return true;
  }

  const auto recorded = RecordedNodeIPs(node);
  for (const auto &requested : request.ip_addresses) {
    const auto ip = util::NormalizeIP(requested);
    if (recorded.count(ip) == 0) {
      LOG_CSR_WARN("EvaluateNodeCSR: node {} does not hold requested IP {}, denying",
                   node_name, ip.to_string());
      return false;
    }
  }

  LOG_CSR_DEBUG("EvaluateNodeCSR: all {} IP SANs of node {} match recorded addresses",
                request.ip_addresses.size(), node_name);
  return true;
}

} // namespace cloud
} // namespace nodeguard
