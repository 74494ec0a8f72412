// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cloud/address_classifier.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <array>

namespace nodeguard {
namespace cloud {

namespace {

const std::array<const char *, 4> kExcludedLinks = {"kubespan", "siderolink", "lo",
                                                    "cilium_host"};
constexpr const char *kDummyLinkPrefix = "dummy";

// First candidate in canonical text order. Selection must not depend on the
// order the backend listed addresses in.
std::optional<std::string> SelectCandidate(const std::vector<std::string> &candidates) {
  if (candidates.empty()) {
    return std::nullopt;
  }
  return *std::min_element(candidates.begin(), candidates.end());
}

} // namespace

std::optional<ObservedAddress> ParseObservedAddress(const std::string &text) {
  ObservedAddress observed;
  std::string prefix = text;

  const size_t at = text.rfind('@');
  if (at != std::string::npos) {
    prefix = text.substr(0, at);
    observed.link_name = text.substr(at + 1);
  }

  auto parsed = util::ParseIPPrefix(prefix);
  if (!parsed) {
    return std::nullopt;
  }
  observed.address = *parsed;
  return observed;
}

bool IsExcludedLink(const std::string &link_name) {
  if (link_name.empty()) {
    return false;
  }
  for (const char *excluded : kExcludedLinks) {
    if (link_name == excluded) {
      return true;
    }
  }
  return util::HasPrefix(link_name, kDummyLinkPrefix);
}

bool PromotesUnlabeledAddresses(const std::string &platform) {
  return platform == kPlatformMetal || platform == kPlatformNoCloud;
}

std::vector<node::NodeAddress>
ClassifyNodeAddresses(const PlatformPolicy &policy,
                      const std::vector<ObservedAddress> &observed,
                      util::Status &status) {
  status = util::Status::Ok();
  std::vector<node::NodeAddress> addresses;

  std::optional<boost::asio::ip::address> provided;
  if (!policy.provided_ip.empty()) {
    provided = util::ParseIPAddress(policy.provided_ip);
    if (!provided) {
      status = util::Status::Validation("invalid node IP \"" + policy.provided_ip + "\"");
      LOG_ADDR_WARN("ClassifyNodeAddresses: {}", status.message());
      return {};
    }
    addresses.push_back({node::NodeAddressType::INTERNAL_IP, provided->to_string()});
  }

  const bool promote_unlabeled = PromotesUnlabeledAddresses(policy.platform);

  std::vector<std::string> ipv4_candidates;
  std::vector<std::string> ipv6_candidates;

  for (const auto &entry : observed) {
    const auto ip = util::NormalizeIP(entry.address.address);

    if (provided && ip == *provided) {
      continue;
    }
    if (!util::IsGlobalUnicast(ip) || IsExcludedLink(entry.link_name)) {
      LOG_ADDR_TRACE("ClassifyNodeAddresses: skipping {} (link '{}')",
                     entry.address.ToString(), entry.link_name);
      continue;
    }
    if (promote_unlabeled) {
      if (util::IsPrivate(ip)) {
        continue;
      }
    } else if (entry.link_name != kExternalLinkName) {
      continue;
    }

    if (ip.is_v4()) {
      ipv4_candidates.push_back(ip.to_string());
    } else {
      ipv6_candidates.push_back(ip.to_string());
    }
  }

  auto ipv4 = SelectCandidate(ipv4_candidates);
  auto ipv6 = SelectCandidate(ipv6_candidates);

  const auto &first = policy.prefer_ipv6 ? ipv6 : ipv4;
  const auto &second = policy.prefer_ipv6 ? ipv4 : ipv6;
  if (first) {
    addresses.push_back({node::NodeAddressType::EXTERNAL_IP, *first});
  }
  if (second) {
    addresses.push_back({node::NodeAddressType::EXTERNAL_IP, *second});
  }

  if (ipv4_candidates.size() > 1 || ipv6_candidates.size() > 1) {
    LOG_ADDR_DEBUG("ClassifyNodeAddresses: {} IPv4 / {} IPv6 external candidates, keeping one per family",
                   ipv4_candidates.size(), ipv6_candidates.size());
  }

  return addresses;
}

} // namespace cloud
} // namespace nodeguard
