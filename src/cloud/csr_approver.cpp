// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cloud/csr_approver.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>

namespace nodeguard {
namespace cloud {

namespace {

bool Contains(const std::vector<std::string> &items, const std::string &item) {
  return std::find(items.begin(), items.end(), item) != items.end();
}

bool IsAllowedUsage(const std::string &usage) {
  return usage == kUsageDigitalSignature || usage == kUsageKeyEncipherment ||
         usage == kUsageServerAuth;
}

} // namespace

const char *ReviewOutcomeName(ReviewOutcome outcome) {
  switch (outcome) {
  case ReviewOutcome::APPROVED:
    return "Approved";
  case ReviewOutcome::DENIED:
    return "Denied";
  case ReviewOutcome::PENDING:
    return "Pending";
  }
  return "Unknown";
}

bool ValidateKubeletServingCSR(const CertificateSigningRequest &csr, std::string &reason) {
  if (!util::HasPrefix(csr.username, kNodeUserPrefix) ||
      csr.username.size() == std::string(kNodeUserPrefix).size()) {
    reason = "requester \"" + csr.username + "\" is not a node";
    return false;
  }
  if (!Contains(csr.groups, kNodesGroup)) {
    reason = "requester is not in group " + std::string(kNodesGroup);
    return false;
  }
  if (csr.subject.organizations.size() != 1 ||
      csr.subject.organizations.front() != kNodesGroup) {
    reason = "subject organization must be exactly " + std::string(kNodesGroup);
    return false;
  }
  if (csr.subject.common_name != csr.username) {
    reason = "subject common name \"" + csr.subject.common_name +
             "\" does not match requester \"" + csr.username + "\"";
    return false;
  }
  if (!Contains(csr.usages, kUsageServerAuth)) {
    reason = "usages do not include server auth";
    return false;
  }
  for (const auto &usage : csr.usages) {
    if (!IsAllowedUsage(usage)) {
      reason = "usage \"" + usage + "\" is not allowed for serving certificates";
      return false;
    }
  }
  if (csr.request.dns_names.empty()) {
    reason = "request carries no DNS names";
    return false;
  }

  const std::string node_name = csr.username.substr(std::string(kNodeUserPrefix).size());
  if (csr.request.dns_names.front() != node_name) {
    reason = "first DNS name \"" + csr.request.dns_names.front() +
             "\" does not name the requesting node \"" + node_name + "\"";
    return false;
  }
  return true;
}

CSRReview ReviewNodeServingCSR(const util::Context &ctx, node::NodeRegistry &registry,
                               const CertificateSigningRequest &csr,
                               const CloudConfig &config) {
  CSRReview review;

  if (!config.approve_node_csr) {
    review.reason = "node CSR approval is disabled";
    return review;
  }
  if (csr.signer_name != kKubeletServingSigner) {
    review.reason = "signer " + csr.signer_name + " is not handled";
    return review;
  }

  std::string reason;
  if (!ValidateKubeletServingCSR(csr, reason)) {
    review.outcome = ReviewOutcome::DENIED;
    review.reason = reason;
    LOG_CSR_WARN("CSR {} denied: {}", csr.name, reason);
    return review;
  }

  util::Status status;
  bool approve = EvaluateNodeCSR(ctx.WithTimeoutFrom(config.request_timeout), registry,
                                 csr.request, status);

  switch (ToTrustDecision(approve, status)) {
  case TrustDecision::APPROVE:
    review.outcome = ReviewOutcome::APPROVED;
    review.reason = "node serving certificate matches node addresses";
    LOG_CSR_INFO("CSR {} approved for node {}", csr.name, csr.request.dns_names.front());
    break;
  case TrustDecision::DENY:
    review.outcome = ReviewOutcome::DENIED;
    review.reason = "requested IP addresses do not match node addresses";
    LOG_CSR_WARN("CSR {} denied: {}", csr.name, review.reason);
    break;
  case TrustDecision::ERROR:
    review.outcome = ReviewOutcome::PENDING;
    review.reason = status.message();
    review.status = status;
    LOG_CSR_ERROR("CSR {} left pending: {}", csr.name, status.message());
    break;
  }
  return review;
}

} // namespace cloud
} // namespace nodeguard
