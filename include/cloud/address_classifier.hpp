// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 AddressClassifier - turns the addresses a node reports into the ordered
 InternalIP / ExternalIP list published in node status

 Rules:
 - The provided node IP, if any, is the single InternalIP
 - ExternalIP candidates never include the provided IP, loopback, link-local,
   unspecified or multicast addresses, or addresses on overlay / mesh links
   (kubespan, siderolink, lo, cilium_host, dummy*)
 - metal / nocloud: any remaining non-private routable address is a candidate
 - other platforms: only addresses on the "external" link are candidates
 - At most one ExternalIP per family, ordered IPv4-first unless preferIPv6

 Pure function: safe to call concurrently, no shared state.
*/

#include "node/node.hpp"
#include "util/netaddress.hpp"
#include "util/status.hpp"
#include <optional>
#include <string>
#include <vector>

namespace nodeguard {
namespace cloud {

// Platforms without a managed cloud network in front of the node
inline constexpr const char *kPlatformMetal = "metal";
inline constexpr const char *kPlatformNoCloud = "nocloud";

// Link on which managed-cloud platforms surface the public address
inline constexpr const char *kExternalLinkName = "external";

struct ObservedAddress {
  util::IPPrefix address;
  std::string link_name;  // empty if unknown
};

struct PlatformPolicy {
  std::string platform;
  bool prefer_ipv6 = false;
  std::string provided_ip;  // empty if the node has none
};

/**
 * Parse "ip/len" or "ip/len@link"
 * @return std::nullopt if the address part is invalid
 */
std::optional<ObservedAddress> ParseObservedAddress(const std::string &text);

// Overlay and mesh links that never carry externally reachable identity
bool IsExcludedLink(const std::string &link_name);

// metal and nocloud promote any eligible address; others need kExternalLinkName
bool PromotesUnlabeledAddresses(const std::string &platform);

/**
 * Classify a node's observed addresses
 *
 * @param policy Platform, IP-family preference and provided node IP
 * @param observed Addresses as reported by the address-discovery backend
 * @param status Set to VALIDATION if provided_ip does not parse
 * @return InternalIP (if any) followed by at most one ExternalIP per family;
 *         empty on error
 */
std::vector<node::NodeAddress>
ClassifyNodeAddresses(const PlatformPolicy &policy,
                      const std::vector<ObservedAddress> &observed,
                      util::Status &status);

} // namespace cloud
} // namespace nodeguard
