// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "cloud/config.hpp"
#include "cloud/csr_validator.hpp"
#include "node/node_registry.hpp"
#include "util/context.hpp"
#include "util/status.hpp"
#include <string>
#include <vector>

namespace nodeguard {
namespace cloud {

inline constexpr const char *kKubeletServingSigner = "kubernetes.io/kubelet-serving";
inline constexpr const char *kNodeUserPrefix = "system:node:";
inline constexpr const char *kNodesGroup = "system:nodes";

inline constexpr const char *kUsageDigitalSignature = "digital signature";
inline constexpr const char *kUsageKeyEncipherment = "key encipherment";
inline constexpr const char *kUsageServerAuth = "server auth";

struct CertificateSubject {
  std::string common_name;
  std::vector<std::string> organizations;
};

// Signing-request object as the controller sees it
struct CertificateSigningRequest {
  std::string name;
  std::string signer_name;
  std::string username;
  std::vector<std::string> groups;
  std::vector<std::string> usages;
  CertificateSubject subject;
  CertificateRequest request;
};

enum class ReviewOutcome {
  APPROVED,
  DENIED,
  PENDING  // left for a later reconcile or a human
};

const char *ReviewOutcomeName(ReviewOutcome outcome);

struct CSRReview {
  ReviewOutcome outcome{ReviewOutcome::PENDING};
  std::string reason;
  util::Status status;  // set when the outcome is PENDING because of an error
};

/**
 * Check that a request looks like a kubelet serving certificate from the
 * node it names: signer, requesting user and group, subject, usages, and
 * the first DNS SAN matching the requesting node.
 *
 * @param reason Why the request was rejected
 * @return true if the request has the expected shape
 */
bool ValidateKubeletServingCSR(const CertificateSigningRequest &csr, std::string &reason);

/**
 * Decide what to do with a node serving-certificate request
 *
 * - approval disabled in config, or a different signer -> PENDING
 * - malformed kubelet-serving request                   -> DENIED
 * - address cross-check error                           -> PENDING with status
 * - address cross-check deny / approve                  -> DENIED / APPROVED
 *
 * Never approves on error.
 */
CSRReview ReviewNodeServingCSR(const util::Context &ctx, node::NodeRegistry &registry,
                               const CertificateSigningRequest &csr,
                               const CloudConfig &config);

} // namespace cloud
} // namespace nodeguard
