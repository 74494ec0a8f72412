// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 CertificateTrustValidator - cross-checks a node serving-certificate request
 against the addresses recorded for that node

 Decision:
 1. Node named by the first DNS SAN is looked up; any lookup failure is an
    error ("failed to get node <name>: <cause>"), never a denial
 2. No IP SANs -> approve
 3. Every IP SAN must be one of the node's InternalIP / ExternalIP addresses
    (compared as parsed addresses) or the node's provided-IP annotation
    -> approve, otherwise deny

 Recorded addresses come only from the address classifier via node status,
 so a requester cannot obtain a certificate for an address the node does not
 hold.
*/

#include "node/node.hpp"
#include "node/node_registry.hpp"
#include "util/context.hpp"
#include "util/status.hpp"
#include <boost/asio/ip/address.hpp>
#include <set>
#include <string>
#include <vector>

namespace nodeguard {
namespace cloud {

struct CertificateRequest {
  std::vector<std::string> dns_names;
  std::vector<boost::asio::ip::address> ip_addresses;
};

enum class TrustDecision {
  APPROVE,
  DENY,
  ERROR
};

const char *TrustDecisionName(TrustDecision decision);

// Map an (approve, status) pair onto the three-way decision
TrustDecision ToTrustDecision(bool approve, const util::Status &status);

/**
 * Canonical set of the node's InternalIP and ExternalIP addresses plus the
 * provided node IP annotation. Hostname entries and unparsable entries are
 * skipped.
 */
std::set<boost::asio::ip::address> RecordedNodeIPs(const node::Node &node);

/**
 * Evaluate a node serving-certificate request
 *
 * @param ctx Bounds the registry lookup; cancellation yields an error
 * @param registry Node store to read the node from
 * @param request DNS and IP SANs claimed by the requester
 * @param status Non-OK on lookup failure or a request without DNS names
 * @return true to approve; false to deny (status OK) or on error
 */
bool EvaluateNodeCSR(const util::Context &ctx, node::NodeRegistry &registry,
                     const CertificateRequest &request, util::Status &status);

} // namespace cloud
} // namespace nodeguard
